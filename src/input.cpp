#include "input.h"

ElementKind element_kind(InputElement e) {
    switch (e) {
        case InputElement::Knob1:
        case InputElement::Knob2:
        case InputElement::Knob3:
        case InputElement::Knob4:
        case InputElement::Knob5:
        case InputElement::Knob6:
        case InputElement::Knob7:
        case InputElement::Knob8:
        case InputElement::MainEncoder:
            return ElementKind::Knob;
        case InputElement::MicGain:
        case InputElement::HeadphoneVolume:
        case InputElement::MasterVolume:
            return ElementKind::Audio;
        default:
            return ElementKind::Button;
    }
}

const std::array<InputElement, INPUT_ELEMENT_COUNT>& all_elements() {
    static const std::array<InputElement, INPUT_ELEMENT_COUNT> elements = [] {
        std::array<InputElement, INPUT_ELEMENT_COUNT> a{};
        for (size_t i = 0; i < INPUT_ELEMENT_COUNT; ++i)
            a[i] = static_cast<InputElement>(i);
        return a;
    }();
    return elements;
}

bool is_pressed(const ButtonState& b, InputElement e) {
    switch (e) {
        case InputElement::Play:           return b.play;
        case InputElement::Rec:            return b.rec;
        case InputElement::Stop:           return b.stop;
        case InputElement::Restart:        return b.restart;
        case InputElement::Erase:          return b.erase;
        case InputElement::Tap:            return b.tap;
        case InputElement::Follow:         return b.follow;

        case InputElement::GroupA:         return b.group_a;
        case InputElement::GroupB:         return b.group_b;
        case InputElement::GroupC:         return b.group_c;
        case InputElement::GroupD:         return b.group_d;
        case InputElement::GroupE:         return b.group_e;
        case InputElement::GroupF:         return b.group_f;
        case InputElement::GroupG:         return b.group_g;
        case InputElement::GroupH:         return b.group_h;

        case InputElement::Notes:          return b.notes;
        case InputElement::Volume:         return b.volume;
        case InputElement::Swing:          return b.swing;
        case InputElement::Tempo:          return b.tempo;
        case InputElement::NoteRepeat:     return b.note_repeat;
        case InputElement::Lock:           return b.lock;
        case InputElement::PadMode:        return b.pad_mode;
        case InputElement::Keyboard:       return b.keyboard;
        case InputElement::Chords:         return b.chords;
        case InputElement::Step:           return b.step;
        case InputElement::FixedVel:       return b.fixed_vel;
        case InputElement::Scene:          return b.scene;
        case InputElement::Pattern:        return b.pattern;
        case InputElement::Events:         return b.events;

        case InputElement::Variation:      return b.variation;
        case InputElement::Duplicate:      return b.duplicate;
        case InputElement::Select:         return b.select;
        case InputElement::Solo:           return b.solo;
        case InputElement::Mute:           return b.mute;
        case InputElement::Pitch:          return b.pitch;
        case InputElement::Mod:            return b.mod;
        case InputElement::Perform:        return b.perform;

        case InputElement::DisplayButton1: return b.display_button_1;
        case InputElement::DisplayButton2: return b.display_button_2;
        case InputElement::DisplayButton3: return b.display_button_3;
        case InputElement::DisplayButton4: return b.display_button_4;
        case InputElement::DisplayButton5: return b.display_button_5;
        case InputElement::DisplayButton6: return b.display_button_6;
        case InputElement::DisplayButton7: return b.display_button_7;
        case InputElement::DisplayButton8: return b.display_button_8;

        case InputElement::ChannelMidi:    return b.channel_midi;
        case InputElement::Arranger:       return b.arranger;
        case InputElement::BrowserPlugin:  return b.browser_plugin;
        case InputElement::ArrowLeft:      return b.arrow_left;
        case InputElement::ArrowRight:     return b.arrow_right;
        case InputElement::FileSave:       return b.file_save;
        case InputElement::Settings:       return b.settings;
        case InputElement::Macro:          return b.macro;
        case InputElement::Plugin:         return b.plugin;
        case InputElement::Mixer:          return b.mixer;
        case InputElement::Sampling:       return b.sampling;
        case InputElement::Auto:           return b.auto_;

        case InputElement::EncoderPush:    return b.encoder_push;
        case InputElement::EncoderUp:      return b.encoder_up;
        case InputElement::EncoderDown:    return b.encoder_down;
        case InputElement::EncoderLeft:    return b.encoder_left;
        case InputElement::EncoderRight:   return b.encoder_right;

        case InputElement::Shift:          return b.shift;

        default:
            return false;
    }
}

uint16_t element_value(const InputState& s, InputElement e) {
    switch (e) {
        case InputElement::Knob1:           return s.knobs.knobs[0];
        case InputElement::Knob2:           return s.knobs.knobs[1];
        case InputElement::Knob3:           return s.knobs.knobs[2];
        case InputElement::Knob4:           return s.knobs.knobs[3];
        case InputElement::Knob5:           return s.knobs.knobs[4];
        case InputElement::Knob6:           return s.knobs.knobs[5];
        case InputElement::Knob7:           return s.knobs.knobs[6];
        case InputElement::Knob8:           return s.knobs.knobs[7];
        case InputElement::MainEncoder:     return s.knobs.main_encoder;
        case InputElement::MicGain:         return s.audio.mic_gain;
        case InputElement::HeadphoneVolume: return s.audio.headphone_volume;
        case InputElement::MasterVolume:    return s.audio.master_volume;
        default:
            return 0;
    }
}

bool ButtonState::operator==(const ButtonState& o) const {
    // Every button field is reachable through is_pressed().
    for (InputElement e : all_elements()) {
        if (element_kind(e) == ElementKind::Button && is_pressed(*this, e) != is_pressed(o, e))
            return false;
    }
    return pedal_connected == o.pedal_connected &&
           microphone_connected == o.microphone_connected;
}

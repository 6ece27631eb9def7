#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

// -----------------------------------------------------------------------
// Every addressable control on the MK3.
//
// The numeric values are stable ids (also used by the CLI and in logs) and
// the declaration order is the order in which the tracker reports events.
// Elements with an RGB LED: GroupA..GroupH, BrowserPlugin, EncoderUp,
// EncoderDown, EncoderLeft, EncoderRight.
// -----------------------------------------------------------------------
enum class InputElement : uint8_t {
    // Transport
    Play = 0,
    Rec,
    Stop,
    Restart,
    Erase,
    Tap,
    Follow,

    // Groups
    GroupA,
    GroupB,
    GroupC,
    GroupD,
    GroupE,
    GroupF,
    GroupG,
    GroupH,

    // Knobs
    Knob1,
    Knob2,
    Knob3,
    Knob4,
    Knob5,
    Knob6,
    Knob7,
    Knob8,
    MainEncoder,

    // Audio section
    MicGain,
    HeadphoneVolume,
    MasterVolume,

    // Mode buttons
    Notes,
    Volume,
    Swing,
    Tempo,
    NoteRepeat,
    Lock,
    PadMode,
    Keyboard,
    Chords,
    Step,
    FixedVel,
    Scene,
    Pattern,
    Events,

    // Edit / performance
    Variation,
    Duplicate,
    Select,
    Solo,
    Mute,
    Pitch,
    Mod,
    Perform,

    // Buttons above the displays
    DisplayButton1,
    DisplayButton2,
    DisplayButton3,
    DisplayButton4,
    DisplayButton5,
    DisplayButton6,
    DisplayButton7,
    DisplayButton8,

    // System
    ChannelMidi,
    Arranger,
    BrowserPlugin,
    ArrowLeft,
    ArrowRight,
    FileSave,
    Settings,
    Macro,
    Plugin,
    Mixer,
    Sampling,
    Auto,

    // Four-way encoder
    EncoderPush,
    EncoderUp,
    EncoderDown,
    EncoderLeft,
    EncoderRight,

    Shift,
};

static constexpr size_t INPUT_ELEMENT_COUNT = static_cast<size_t>(InputElement::Shift) + 1;

enum class ElementKind : uint8_t {
    Button,
    Knob,     // Knob1..Knob8, MainEncoder
    Audio,    // MicGain, HeadphoneVolume, MasterVolume
};

ElementKind element_kind(InputElement e);

// All elements in declaration order.
const std::array<InputElement, INPUT_ELEMENT_COUNT>& all_elements();

// -----------------------------------------------------------------------
// Decoded state (one instance per 0x01 packet)
// -----------------------------------------------------------------------

struct ButtonState {
    // Transport
    bool play = false, rec = false, stop = false, restart = false;
    bool erase = false, tap = false, follow = false;

    // Groups A-H
    bool group_a = false, group_b = false, group_c = false, group_d = false;
    bool group_e = false, group_f = false, group_g = false, group_h = false;

    // Modes
    bool notes = false, volume = false, swing = false, tempo = false;
    bool note_repeat = false, lock = false, pad_mode = false, keyboard = false;
    bool chords = false, step = false, fixed_vel = false, scene = false;
    bool pattern = false, events = false;

    // Edit / performance
    bool variation = false, duplicate = false, select = false, solo = false;
    bool mute = false, pitch = false, mod = false, perform = false;

    // Encoder and modifiers
    bool shift = false;
    bool encoder_push = false, encoder_up = false, encoder_down = false;
    bool encoder_left = false, encoder_right = false;

    // Display buttons 1-8
    bool display_button_1 = false, display_button_2 = false;
    bool display_button_3 = false, display_button_4 = false;
    bool display_button_5 = false, display_button_6 = false;
    bool display_button_7 = false, display_button_8 = false;

    // System
    bool channel_midi = false, arranger = false, browser_plugin = false;
    bool arrow_left = false, arrow_right = false, file_save = false;
    bool settings = false, macro = false, plugin = false, mixer = false;
    bool sampling = false, auto_ = false;

    // Hardware presence flags (not buttons, never produce events)
    bool pedal_connected = false;
    bool microphone_connected = false;

    bool operator==(const ButtonState& o) const;
    bool operator!=(const ButtonState& o) const { return !(*this == o); }
};

struct KnobState {
    std::array<uint16_t, 8> knobs{};          // 10-bit, 0..1023
    std::array<bool, 8>     knob_touched{};
    uint8_t                 main_encoder = 0; // 4-bit, 0..15
    bool                    main_touched = false;

    bool operator==(const KnobState& o) const {
        return knobs == o.knobs && knob_touched == o.knob_touched &&
               main_encoder == o.main_encoder && main_touched == o.main_touched;
    }
};

// Raw touch strip bytes per finger; only partially reverse engineered.
struct TouchData {
    uint8_t data_a = 0, data_b = 0, data_c = 0, data_d = 0;

    bool operator==(const TouchData& o) const {
        return data_a == o.data_a && data_b == o.data_b &&
               data_c == o.data_c && data_d == o.data_d;
    }
};

struct TouchStripState {
    TouchData finger_1;
    TouchData finger_2;

    bool operator==(const TouchStripState& o) const {
        return finger_1 == o.finger_1 && finger_2 == o.finger_2;
    }
};

struct AudioState {
    uint16_t mic_gain         = 0;
    uint16_t headphone_volume = 0;
    uint16_t master_volume    = 0;

    bool operator==(const AudioState& o) const {
        return mic_gain == o.mic_gain && headphone_volume == o.headphone_volume &&
               master_volume == o.master_volume;
    }
};

struct InputState {
    ButtonState     buttons;
    KnobState       knobs;
    TouchStripState touch_strip;
    AudioState      audio;

    bool operator==(const InputState& o) const {
        return buttons == o.buttons && knobs == o.knobs &&
               touch_strip == o.touch_strip && audio == o.audio;
    }
    bool operator!=(const InputState& o) const { return !(*this == o); }
};

// Pads are numbered 0..15 from top-right to bottom-left.
struct PadHit {
    uint8_t pad_number = 0;
    uint8_t data_a     = 0;   // velocity-like
    uint8_t data_b     = 0;   // pressure-like
};

// One instance per 0x02 packet.
struct PadState {
    std::vector<PadHit> hits;
};

// Is `e` held down in `b`? Always false for knobs and audio elements.
bool is_pressed(const ButtonState& b, InputElement e);

// Current numeric value of a knob or audio element; 0 for buttons.
uint16_t element_value(const InputState& s, InputElement e);

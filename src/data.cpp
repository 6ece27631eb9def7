#include "data.h"

#include <cctype>
#include <iomanip>
#include <iostream>
#include <map>

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// -----------------------------------------------------------------------
// Element names, indexed by InputElement value
// -----------------------------------------------------------------------
static const char* const element_names[INPUT_ELEMENT_COUNT] = {
    "play", "rec", "stop", "restart", "erase", "tap", "follow",
    "group_a", "group_b", "group_c", "group_d", "group_e", "group_f", "group_g", "group_h",
    "knob_1", "knob_2", "knob_3", "knob_4", "knob_5", "knob_6", "knob_7", "knob_8",
    "main_encoder",
    "mic_gain", "headphone_volume", "master_volume",
    "notes", "volume", "swing", "tempo", "note_repeat", "lock",
    "pad_mode", "keyboard", "chords", "step", "fixed_vel", "scene", "pattern", "events",
    "variation", "duplicate", "select", "solo", "mute", "pitch", "mod", "perform",
    "display_button_1", "display_button_2", "display_button_3", "display_button_4",
    "display_button_5", "display_button_6", "display_button_7", "display_button_8",
    "channel_midi", "arranger", "browser_plugin", "arrow_left", "arrow_right",
    "file_save", "settings", "macro", "plugin", "mixer", "sampling", "auto",
    "encoder_push", "encoder_up", "encoder_down", "encoder_left", "encoder_right",
    "shift",
};

const char* element_name(InputElement e) {
    auto i = static_cast<size_t>(e);
    return i < INPUT_ELEMENT_COUNT ? element_names[i] : "unknown";
}

bool parse_element_name(const std::string& name, InputElement& out) {
    static const std::map<std::string, InputElement> table = [] {
        std::map<std::string, InputElement> t;
        for (InputElement e : all_elements())
            t[element_name(e)] = e;
        // Aliases
        t["record"]      = InputElement::Rec;
        t["browser"]     = InputElement::BrowserPlugin;
        t["channel"]     = InputElement::ChannelMidi;
        t["midi"]        = InputElement::ChannelMidi;
        t["save"]        = InputElement::FileSave;
        t["sampler"]     = InputElement::Sampling;
        t["fixed_velocity"] = InputElement::FixedVel;
        return t;
    }();

    auto it = table.find(to_lower(name));
    if (it == table.end()) return false;
    out = it->second;
    return true;
}

// -----------------------------------------------------------------------
// Element -> LED slot
// -----------------------------------------------------------------------

bool element_button_led(InputElement e, ButtonLed& out) {
    using E = InputElement;
    using L = ButtonLed;

    static const std::map<E, L> table = {
        {E::Play, L::Play}, {E::Rec, L::Rec}, {E::Stop, L::Stop},
        {E::Restart, L::Restart}, {E::Erase, L::Erase}, {E::Tap, L::Tap},
        {E::Follow, L::Follow},

        {E::GroupA, L::GroupA}, {E::GroupB, L::GroupB}, {E::GroupC, L::GroupC},
        {E::GroupD, L::GroupD}, {E::GroupE, L::GroupE}, {E::GroupF, L::GroupF},
        {E::GroupG, L::GroupG}, {E::GroupH, L::GroupH},

        {E::Notes, L::Notes}, {E::Volume, L::Volume}, {E::Swing, L::Swing},
        {E::Tempo, L::Tempo}, {E::NoteRepeat, L::NoteRepeat}, {E::Lock, L::Lock},
        {E::PadMode, L::PadMode}, {E::Keyboard, L::Keyboard}, {E::Chords, L::Chords},
        {E::Step, L::Step}, {E::FixedVel, L::FixedVel}, {E::Scene, L::Scene},
        {E::Pattern, L::Pattern}, {E::Events, L::Events},

        {E::Variation, L::Variation}, {E::Duplicate, L::Duplicate},
        {E::Select, L::Select}, {E::Solo, L::Solo}, {E::Mute, L::Mute},
        {E::Pitch, L::Pitch}, {E::Mod, L::Mod}, {E::Perform, L::Perform},

        {E::DisplayButton1, L::DisplayButton1}, {E::DisplayButton2, L::DisplayButton2},
        {E::DisplayButton3, L::DisplayButton3}, {E::DisplayButton4, L::DisplayButton4},
        {E::DisplayButton5, L::DisplayButton5}, {E::DisplayButton6, L::DisplayButton6},
        {E::DisplayButton7, L::DisplayButton7}, {E::DisplayButton8, L::DisplayButton8},

        {E::ChannelMidi, L::ChannelMidi}, {E::Arranger, L::Arranger},
        {E::BrowserPlugin, L::BrowserPlugin}, {E::ArrowLeft, L::ArrowLeft},
        {E::ArrowRight, L::ArrowRight}, {E::FileSave, L::FileSave},
        {E::Settings, L::Settings}, {E::Macro, L::MacroSet},
        {E::Plugin, L::PluginInstance}, {E::Mixer, L::Mixer},
        {E::Sampling, L::Sampler}, {E::Auto, L::Auto},

        {E::EncoderUp, L::NavUp}, {E::EncoderDown, L::NavDown},
        {E::EncoderLeft, L::NavLeft}, {E::EncoderRight, L::NavRight},

        {E::Shift, L::Shift},
    };

    auto it = table.find(e);
    if (it == table.end()) return false;
    out = it->second;
    return true;
}

void list_elements() {
    std::cout << "Elements (id, name, LED):\n";
    for (InputElement e : all_elements()) {
        ButtonLed led;
        const char* kind = "-";
        if (element_kind(e) != ElementKind::Button)
            kind = "value";
        else if (element_button_led(e, led))
            kind = button_led_has_color(led) ? "rgb" : "mono";

        std::cout << "  " << std::setw(2) << static_cast<int>(e) << "  "
                  << std::left << std::setw(18) << element_name(e) << std::right
                  << kind << "\n";
    }

    std::cout << "\nColours: #rrggbb, or red, orange, yellow, green, cyan, blue,\n"
              << "purple, magenta, pink, white, off\n";
}

// -----------------------------------------------------------------------
// Colour strings
// -----------------------------------------------------------------------

bool parse_color(const std::string& s, RgbColor& out) {
    static const std::map<std::string, RgbColor> named = {
        {"off",     {0, 0, 0}},
        {"black",   {0, 0, 0}},
        {"red",     LED_PALETTE[0]},
        {"orange",  LED_PALETTE[1]},
        {"yellow",  LED_PALETTE[3]},
        {"green",   LED_PALETTE[5]},
        {"cyan",    LED_PALETTE[7]},
        {"blue",    LED_PALETTE[9]},
        {"purple",  LED_PALETTE[10]},
        {"magenta", LED_PALETTE[11]},
        {"pink",    LED_PALETTE[12]},
        {"white",   LED_PALETTE[16]},
    };

    std::string lower = to_lower(s);
    auto it = named.find(lower);
    if (it != named.end()) {
        out = it->second;
        return true;
    }

    std::string hex = lower;
    if (!hex.empty() && hex[0] == '#') hex = hex.substr(1);
    if (hex.size() != 6) return false;
    for (char c : hex)
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;

    auto v = static_cast<uint32_t>(std::stoul(hex, nullptr, 16));
    out = {static_cast<uint8_t>(v >> 16), static_cast<uint8_t>(v >> 8), static_cast<uint8_t>(v)};
    return true;
}

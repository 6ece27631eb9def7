#include "protocol.h"

#include <iomanip>
#include <iostream>
#include <sstream>

// -----------------------------------------------------------------------
// Internal helpers
// -----------------------------------------------------------------------

static bool bit(uint8_t byte, uint8_t mask) {
    return (byte & mask) != 0;
}

// 10-bit knob value: low byte full, high bits from bits 0-1 of the next byte.
static uint16_t knob10(const Bytes& d, size_t lo) {
    return static_cast<uint16_t>(((d[lo + 1] & 0x03) << 8) | d[lo]);
}

static uint16_t le16(const Bytes& d, size_t lo) {
    return static_cast<uint16_t>((d[lo + 1] << 8) | d[lo]);
}

// -----------------------------------------------------------------------
// 0x01 button / knob report
//
//  Byte  | bit 0x01 .. 0x80
//  ------|----------------------------------------------------------------
//   1    | enc push, pedal, enc up, enc right, enc down, enc left, shift, disp 8
//   2    | group A .. group H
//   3    | notes, volume, swing, tempo, note repeat, lock
//   4    | pad mode, keyboard, chords, step, fixed vel, scene, pattern, events
//   5    | mic connected, variation, duplicate, select, solo, mute, pitch, mod
//   6    | perform, restart, erase, tap, follow, play, rec, stop
//   7    | macro, settings, arrow right, sampling, mixer, plugin
//   8    | channel/midi, arranger, browser/plugin, arrow left, file save, auto
//   9    | disp 1 .. disp 7, main encoder touched
//  10    | knob 8 touched .. knob 1 touched (reversed)
//  11    | main encoder position (low nibble)
//  12-27 | knob 1..8, 10-bit little-endian pairs
//  28-35 | touch strip finger 1 a-d, finger 2 a-d
//  36-41 | mic gain, headphone volume, master volume (u16 little-endian)
// -----------------------------------------------------------------------

InputState decode_button_packet(const Bytes& d) {
    if (d.size() < BUTTON_PACKET_MIN_SIZE)
        throw InvalidPacket("button report is " + std::to_string(d.size()) +
                            " bytes, expected at least " +
                            std::to_string(BUTTON_PACKET_MIN_SIZE));
    if (d[0] != PACKET_BUTTONS)
        throw InvalidPacket("button report has type 0x" + [&] {
            std::ostringstream s;
            s << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(d[0]);
            return s.str();
        }());

    InputState st;
    ButtonState& b = st.buttons;
    KnobState&   k = st.knobs;

    b.encoder_push     = bit(d[1], 0x01);
    b.pedal_connected  = bit(d[1], 0x02);
    b.encoder_up       = bit(d[1], 0x04);
    b.encoder_right    = bit(d[1], 0x08);
    b.encoder_down     = bit(d[1], 0x10);
    b.encoder_left     = bit(d[1], 0x20);
    b.shift            = bit(d[1], 0x40);
    b.display_button_8 = bit(d[1], 0x80);

    b.group_a = bit(d[2], 0x01);
    b.group_b = bit(d[2], 0x02);
    b.group_c = bit(d[2], 0x04);
    b.group_d = bit(d[2], 0x08);
    b.group_e = bit(d[2], 0x10);
    b.group_f = bit(d[2], 0x20);
    b.group_g = bit(d[2], 0x40);
    b.group_h = bit(d[2], 0x80);

    b.notes       = bit(d[3], 0x01);
    b.volume      = bit(d[3], 0x02);
    b.swing       = bit(d[3], 0x04);
    b.tempo       = bit(d[3], 0x08);
    b.note_repeat = bit(d[3], 0x10);
    b.lock        = bit(d[3], 0x20);

    b.pad_mode  = bit(d[4], 0x01);
    b.keyboard  = bit(d[4], 0x02);
    b.chords    = bit(d[4], 0x04);
    b.step      = bit(d[4], 0x08);
    b.fixed_vel = bit(d[4], 0x10);
    b.scene     = bit(d[4], 0x20);
    b.pattern   = bit(d[4], 0x40);
    b.events    = bit(d[4], 0x80);

    b.microphone_connected = bit(d[5], 0x01);
    b.variation            = bit(d[5], 0x02);
    b.duplicate            = bit(d[5], 0x04);
    b.select               = bit(d[5], 0x08);
    b.solo                 = bit(d[5], 0x10);
    b.mute                 = bit(d[5], 0x20);
    b.pitch                = bit(d[5], 0x40);
    b.mod                  = bit(d[5], 0x80);

    b.perform = bit(d[6], 0x01);
    b.restart = bit(d[6], 0x02);
    b.erase   = bit(d[6], 0x04);
    b.tap     = bit(d[6], 0x08);
    b.follow  = bit(d[6], 0x10);
    b.play    = bit(d[6], 0x20);
    b.rec     = bit(d[6], 0x40);
    b.stop    = bit(d[6], 0x80);

    b.macro       = bit(d[7], 0x01);
    b.settings    = bit(d[7], 0x02);
    b.arrow_right = bit(d[7], 0x04);
    b.sampling    = bit(d[7], 0x08);
    b.mixer       = bit(d[7], 0x10);
    b.plugin      = bit(d[7], 0x20);

    b.channel_midi   = bit(d[8], 0x01);
    b.arranger       = bit(d[8], 0x02);
    b.browser_plugin = bit(d[8], 0x04);
    b.arrow_left     = bit(d[8], 0x08);
    b.file_save      = bit(d[8], 0x10);
    b.auto_          = bit(d[8], 0x20);

    b.display_button_1 = bit(d[9], 0x01);
    b.display_button_2 = bit(d[9], 0x02);
    b.display_button_3 = bit(d[9], 0x04);
    b.display_button_4 = bit(d[9], 0x08);
    b.display_button_5 = bit(d[9], 0x10);
    b.display_button_6 = bit(d[9], 0x20);
    b.display_button_7 = bit(d[9], 0x40);
    k.main_touched     = bit(d[9], 0x80);

    // Touch bits run from knob 8 (0x01) up to knob 1 (0x80).
    for (int i = 0; i < 8; ++i)
        k.knob_touched[i] = bit(d[10], static_cast<uint8_t>(0x80 >> i));

    k.main_encoder = d[11] & 0x0F;

    for (size_t i = 0; i < 8; ++i)
        k.knobs[i] = knob10(d, 12 + i * 2);

    TouchStripState& t = st.touch_strip;
    t.finger_1 = {d[28], d[29], d[30], d[31]};
    t.finger_2 = {d[32], d[33], d[34], d[35]};

    st.audio.mic_gain         = le16(d, 36);
    st.audio.headphone_volume = le16(d, 38);
    st.audio.master_volume    = le16(d, 40);

    return st;
}

// -----------------------------------------------------------------------
// 0x02 pad report
// -----------------------------------------------------------------------

PadState decode_pad_packet(const Bytes& d) {
    if (d.empty())
        throw InvalidPacket("empty pad report");
    if (d[0] != PACKET_PADS)
        throw InvalidPacket("pad report has wrong type byte");

    // There is no length field: valid records simply stop. The first pad
    // number outside 0..15 is taken as the end of data.
    PadState st;
    for (size_t off = 1; off + 2 < d.size(); off += 3) {
        uint8_t pad = d[off];
        uint8_t a   = d[off + 1];
        uint8_t b   = d[off + 2];

        if (pad == 0 && a == 0 && b == 0)
            continue;  // padding
        if (pad >= PAD_COUNT)
            break;

        st.hits.push_back({pad, a, b});
    }
    return st;
}

bool decode_pad_event(const PadHit& hit, PadEvent& out) {
    PadEventType type;
    switch (hit.data_a >> 4) {
        case 0x1: type = PadEventType::Hit;          break;
        case 0x2: type = PadEventType::TouchRelease; break;
        case 0x3: type = PadEventType::HitRelease;   break;
        case 0x4: type = PadEventType::Aftertouch;   break;
        default:  return false;
    }
    out.pad_number = hit.pad_number;
    out.type       = type;
    out.value      = static_cast<uint16_t>(((hit.data_a & 0x0F) << 8) | hit.data_b);
    return true;
}

const char* pad_event_type_name(PadEventType t) {
    switch (t) {
        case PadEventType::Hit:          return "hit";
        case PadEventType::TouchRelease: return "touch-release";
        case PadEventType::HitRelease:   return "hit-release";
        case PadEventType::Aftertouch:   return "aftertouch";
    }
    return "?";
}

// -----------------------------------------------------------------------
// LED packets
// -----------------------------------------------------------------------

bool button_led_has_color(ButtonLed led) {
    switch (led) {
        case ButtonLed::BrowserPlugin:
        case ButtonLed::GroupA:
        case ButtonLed::GroupB:
        case ButtonLed::GroupC:
        case ButtonLed::GroupD:
        case ButtonLed::GroupE:
        case ButtonLed::GroupF:
        case ButtonLed::GroupG:
        case ButtonLed::GroupH:
        case ButtonLed::NavUp:
        case ButtonLed::NavLeft:
        case ButtonLed::NavRight:
        case ButtonLed::NavDown:
            return true;
        default:
            return false;
    }
}

Bytes encode_button_leds(const ButtonLedState& state) {
    Bytes p(BUTTON_LED_PACKET_SIZE, 0);
    p[0] = PACKET_BUTTON_LEDS;

    // Every byte after the tag is one LED slot.
    for (size_t off = 1; off < BUTTON_LED_PACKET_SIZE; ++off) {
        auto led = static_cast<ButtonLed>(off);
        p[off] = button_led_has_color(led) ? state.colors[off].to_led_value()
                                           : state.brightness[off];
    }
    return p;
}

Bytes encode_pad_leds(const PadLedState& state) {
    Bytes p(PAD_LED_PACKET_SIZE, 0);
    p[0] = PACKET_PAD_LEDS;

    for (size_t i = 0; i < TOUCH_STRIP_LED_COUNT; ++i)
        p[1 + i] = state.touch_strip[i].to_led_value();

    for (size_t i = 0; i < PAD_COUNT; ++i)
        p[26 + i] = state.pads[i].to_led_value();

    return p;
}

// -----------------------------------------------------------------------
// Diagnostics
// -----------------------------------------------------------------------

void hexdump_packet(const Bytes& p, const std::string& label, size_t max_bytes) {
    if (!label.empty())
        std::cout << label << "\n";

    size_t n = (max_bytes == 0 || max_bytes > p.size()) ? p.size() : max_bytes;

    std::cout << std::hex << std::setfill('0');
    for (size_t i = 0; i < n; ++i) {
        std::cout << std::setw(2) << static_cast<int>(p[i]);
        if (i + 1 < n) std::cout << " ";
    }
    std::cout << std::dec;
    if (n < p.size())
        std::cout << " ... (" << p.size() << " bytes)";
    std::cout << "\n";
}

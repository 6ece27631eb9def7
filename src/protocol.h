#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "color.h"
#include "input.h"
#include "transport.h"

// Native Instruments Maschine MK3 USB identifiers
static constexpr uint16_t MK3_VID = 0x17cc;
static constexpr uint16_t MK3_PID = 0x1600;

// -----------------------------------------------------------------------
// MK3 HID packet types (first byte of every report)
//
//  Tag  | Dir | Size      | Contents
//  -----|-----|-----------|----------------------------------------------
//  0x01 | in  | >= 42     | buttons, knobs, touch strip, audio levels
//  0x02 | in  | variable  | pad hits, 3 bytes per hit
//  0x80 | out | 63        | button LEDs
//  0x81 | out | 42        | touch strip + pad LEDs
//  0x84 | out | variable  | display region (bulk endpoint, see display.h)
// -----------------------------------------------------------------------
static constexpr uint8_t PACKET_BUTTONS     = 0x01;
static constexpr uint8_t PACKET_PADS        = 0x02;
static constexpr uint8_t PACKET_BUTTON_LEDS = 0x80;
static constexpr uint8_t PACKET_PAD_LEDS    = 0x81;
static constexpr uint8_t PACKET_DISPLAY     = 0x84;

static constexpr size_t BUTTON_PACKET_MIN_SIZE  = 42;
static constexpr size_t BUTTON_LED_PACKET_SIZE  = 63;
static constexpr size_t PAD_LED_PACKET_SIZE     = 42;

static constexpr uint8_t PAD_COUNT              = 16;
static constexpr uint8_t TOUCH_STRIP_LED_COUNT  = 25;

// -----------------------------------------------------------------------
// Button LED slots. The value of each enumerator is its byte offset in the
// 0x80 packet. RGB slots carry a palette value (LedColor::to_led_value),
// every other slot a plain brightness byte (0-127).
// -----------------------------------------------------------------------
enum class ButtonLed : uint8_t {
    ChannelMidi    = 1,
    PluginInstance = 2,
    Arranger       = 3,
    Mixer          = 4,
    BrowserPlugin  = 5,   // RGB
    Sampler        = 6,
    ArrowLeft      = 7,
    ArrowRight     = 8,
    FileSave       = 9,
    Settings       = 10,
    Auto           = 11,
    MacroSet       = 12,
    DisplayButton1 = 13,
    DisplayButton2 = 14,
    DisplayButton3 = 15,
    DisplayButton4 = 16,
    DisplayButton5 = 17,
    DisplayButton6 = 18,
    DisplayButton7 = 19,
    DisplayButton8 = 20,
    Volume         = 21,
    Swing          = 22,
    NoteRepeat     = 23,
    Tempo          = 24,
    Lock           = 25,
    Pitch          = 26,
    Mod            = 27,
    Perform        = 28,
    Notes          = 29,
    GroupA         = 30,  // RGB
    GroupB         = 31,  // RGB
    GroupC         = 32,  // RGB
    GroupD         = 33,  // RGB
    GroupE         = 34,  // RGB
    GroupF         = 35,  // RGB
    GroupG         = 36,  // RGB
    GroupH         = 37,  // RGB
    Restart        = 38,
    Erase          = 39,
    Tap            = 40,
    Follow         = 41,
    Play           = 42,
    Rec            = 43,
    Stop           = 44,
    Shift          = 45,
    FixedVel       = 46,
    PadMode        = 47,
    Keyboard       = 48,
    Chords         = 49,
    Step           = 50,
    Scene          = 51,
    Pattern        = 52,
    Events         = 53,
    Variation      = 54,
    Duplicate      = 55,
    Select         = 56,
    Solo           = 57,
    Mute           = 58,
    NavUp          = 59,  // RGB
    NavLeft        = 60,  // RGB
    NavRight       = 61,  // RGB
    NavDown        = 62,  // RGB
};

bool button_led_has_color(ButtonLed led);

using LedBrightness = uint8_t;

// Button LED state, indexed by ButtonLed offset. brightness[] is used by
// single-colour slots and colors[] by RGB slots; the other array entry for a
// slot is ignored.
struct ButtonLedState {
    std::array<LedBrightness, BUTTON_LED_PACKET_SIZE> brightness{};
    std::array<LedColor,      BUTTON_LED_PACKET_SIZE> colors{};

    void set(ButtonLed led, LedBrightness value) { brightness[static_cast<size_t>(led)] = value; }
    void set(ButtonLed led, LedColor color)      { colors[static_cast<size_t>(led)] = color; }

    LedBrightness brightness_of(ButtonLed led) const { return brightness[static_cast<size_t>(led)]; }
    LedColor      color_of(ButtonLed led) const      { return colors[static_cast<size_t>(led)]; }
};

struct PadLedState {
    std::array<LedColor, TOUCH_STRIP_LED_COUNT> touch_strip{};
    std::array<LedColor, PAD_COUNT>             pads{};
};

// -----------------------------------------------------------------------
// Input decoding
// -----------------------------------------------------------------------

// Decode a 0x01 report. Throws InvalidPacket if shorter than 42 bytes or
// not tagged 0x01. Bytes past offset 41 are ignored.
InputState decode_button_packet(const Bytes& data);

// Decode a 0x02 report: 3-byte (pad, data_a, data_b) records from offset 1.
// A pad number above 15 ends the list; all-zero records are padding and are
// skipped. Throws InvalidPacket if empty or not tagged 0x02.
PadState decode_pad_packet(const Bytes& data);

// Finer pad vocabulary read from the hit bytes themselves.
enum class PadEventType : uint8_t {
    Hit          = 0,
    TouchRelease = 1,
    HitRelease   = 2,
    Aftertouch   = 3,
};

struct PadEvent {
    uint8_t      pad_number = 0;
    PadEventType type       = PadEventType::Hit;
    uint16_t     value      = 0;   // 12-bit
};

// Classify a pad hit by the high nibble of data_a (1 hit, 2 touch release,
// 3 hit release, 4 aftertouch); value = (data_a & 0x0F) << 8 | data_b.
// Returns false for any other nibble.
bool decode_pad_event(const PadHit& hit, PadEvent& out);

const char* pad_event_type_name(PadEventType t);

// -----------------------------------------------------------------------
// LED encoding
// -----------------------------------------------------------------------

// 63-byte 0x80 packet.
Bytes encode_button_leds(const ButtonLedState& state);

// 42-byte 0x81 packet: touch strip at bytes 1-25, pads at 26-41.
Bytes encode_pad_leds(const PadLedState& state);

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

// Pretty-print bytes as a hex dump to stdout. max_bytes == 0 prints all.
void hexdump_packet(const Bytes& p, const std::string& label = "", size_t max_bytes = 0);

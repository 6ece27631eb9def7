#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

// Standard 8-bit-per-channel colour as supplied by callers.
struct RgbColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const RgbColor& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const RgbColor& o) const { return !(*this == o); }
};

// Number of entries in the controller's fixed LED palette.
static constexpr uint8_t LED_PALETTE_SIZE = 17;

// -----------------------------------------------------------------------
// LED palette (17 colours, indices taken from the vendor colour grid)
//
//   0 red          6 cyan-green   12 pink
//   1 orange       7 cyan         13 hot pink
//   2 orange-yel.  8 light blue   14 dark purple
//   3 yellow       9 blue         15 grey
//   4 yellow-grn  10 purple       16 white
//   5 green       11 magenta
// -----------------------------------------------------------------------
extern const std::array<RgbColor, LED_PALETTE_SIZE> LED_PALETTE;

// Colour of an RGB LED as the device understands it: a palette index plus a
// bright/dim flag. Index 0 with bright == false is the unique "off" value.
struct LedColor {
    uint8_t index  = 0;      // 0..16
    bool    bright = false;

    LedColor() = default;
    LedColor(uint8_t idx, bool is_bright);   // clamps idx to 0..16

    // Nearest palette entry by Euclidean distance (lowest index wins ties);
    // bright when max(r,g,b) > 127. Pure black maps to off.
    static LedColor from_rgb(uint8_t r, uint8_t g, uint8_t b);
    static LedColor from_rgb(const RgbColor& c) { return from_rgb(c.r, c.g, c.b); }

    // Grey-scale helper for RGB slots driven through a brightness setter:
    // 0 is off, anything else is white (bright above 127).
    static LedColor from_brightness(uint8_t brightness);

    // Byte written into the LED packets.
    uint8_t to_led_value() const;

    // Approximate display colour (dim entries at half intensity).
    RgbColor to_rgb() const;

    bool is_off() const { return index == 0 && !bright; }

    bool operator==(const LedColor& o) const { return index == o.index && bright == o.bright; }
    bool operator!=(const LedColor& o) const { return !(*this == o); }

    static LedColor off()                 { return LedColor(0, false); }
    static LedColor red(bool bright)      { return LedColor(0, bright); }
    static LedColor orange(bool bright)   { return LedColor(1, bright); }
    static LedColor yellow(bool bright)   { return LedColor(3, bright); }
    static LedColor green(bool bright)    { return LedColor(5, bright); }
    static LedColor cyan(bool bright)     { return LedColor(7, bright); }
    static LedColor blue(bool bright)     { return LedColor(9, bright); }
    static LedColor purple(bool bright)   { return LedColor(10, bright); }
    static LedColor magenta(bool bright)  { return LedColor(11, bright); }
    static LedColor pink(bool bright)     { return LedColor(12, bright); }
    static LedColor white(bool bright)    { return LedColor(16, bright); }
};

// Palette index + brightness -> LED byte.
//   base     = ((index % 17) + 1) * 2
//   adjusted = base - (bright ? 0 : 1)
//   result   = adjusted * 2 + 2, plus 4 more when result > 66
// Off (index 0, dim) is 0. Formula lifted from the vendor desktop software.
uint8_t palette_to_led_byte(uint8_t index, bool bright);

// -----------------------------------------------------------------------
// Display pixel format ("device-565")
//
// Channels are rotated before packing: the device's red field carries the
// caller's blue, green carries red and blue carries green. The rotated
// channels are then packed as
//
//   bit 15..13  green >> 5
//   bit 12..8   blue  >> 3
//   bit  7..3   red   >> 3
//   bit  2..0   (green >> 3) & 7
//
// and sent little-endian. This is NOT standard RGB565.
// -----------------------------------------------------------------------
uint16_t rgb_to_device565(uint8_t r, uint8_t g, uint8_t b);

// Convert width*height RGB888 pixels into little-endian device-565 bytes.
// out must hold width*height*2 bytes. With flip_y the source rows are read
// bottom-up (bottom-left-origin textures).
void rgb888_to_device565_buffer(const uint8_t* rgb888, uint8_t* out,
                                size_t width, size_t height, bool flip_y);

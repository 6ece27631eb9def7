#include "color.h"

#include <algorithm>
#include <limits>

const std::array<RgbColor, LED_PALETTE_SIZE> LED_PALETTE = {{
    {255,   0,   0},  //  0 red
    {255, 165,   0},  //  1 orange
    {255, 200,   0},  //  2 orange-yellow
    {255, 255,   0},  //  3 yellow
    {128, 255,   0},  //  4 yellow-green
    {  0, 255,   0},  //  5 green
    {  0, 255, 128},  //  6 cyan-green
    {  0, 255, 255},  //  7 cyan
    {  0, 128, 255},  //  8 light blue
    {  0,   0, 255},  //  9 blue
    {128,   0, 255},  // 10 purple
    {255,   0, 255},  // 11 magenta
    {255,   0, 128},  // 12 pink
    {255, 128, 255},  // 13 hot pink
    { 64,   0, 128},  // 14 dark purple
    {128, 128, 128},  // 15 grey
    {255, 255, 255},  // 16 white
}};

// -----------------------------------------------------------------------
// LED colours
// -----------------------------------------------------------------------

LedColor::LedColor(uint8_t idx, bool is_bright)
    : index(std::min<uint8_t>(idx, LED_PALETTE_SIZE - 1)), bright(is_bright) {}

LedColor LedColor::from_rgb(uint8_t r, uint8_t g, uint8_t b) {
    if (r == 0 && g == 0 && b == 0)
        return off();

    // Squared distance picks the same entry as the Euclidean one.
    uint32_t best_dist  = std::numeric_limits<uint32_t>::max();
    uint8_t  best_index = 0;
    for (uint8_t i = 0; i < LED_PALETTE_SIZE; ++i) {
        const RgbColor& p = LED_PALETTE[i];
        int dr = int(r) - p.r;
        int dg = int(g) - p.g;
        int db = int(b) - p.b;
        uint32_t dist = static_cast<uint32_t>(dr * dr + dg * dg + db * db);
        if (dist < best_dist) {
            best_dist  = dist;
            best_index = i;
        }
    }

    // Brightness follows the strongest channel, not luminance, so that pure
    // blue comes out bright.
    uint8_t max_component = std::max({r, g, b});
    return LedColor(best_index, max_component > 127);
}

LedColor LedColor::from_brightness(uint8_t brightness) {
    if (brightness == 0)
        return off();
    return white(brightness > 127);
}

uint8_t LedColor::to_led_value() const {
    return palette_to_led_byte(index, bright);
}

RgbColor LedColor::to_rgb() const {
    if (is_off())
        return {0, 0, 0};

    const RgbColor& p = LED_PALETTE[index % LED_PALETTE_SIZE];
    if (bright)
        return p;
    return {static_cast<uint8_t>(p.r / 2),
            static_cast<uint8_t>(p.g / 2),
            static_cast<uint8_t>(p.b / 2)};
}

uint8_t palette_to_led_byte(uint8_t index, bool bright) {
    if (index == 0 && !bright)
        return 0;

    int base     = ((index % LED_PALETTE_SIZE) + 1) * 2;
    int adjusted = base - (bright ? 0 : 1);
    int result   = adjusted * 2 + 2;

    // The vendor table skips four values above 66.
    if (result > 66)
        result += 4;

    return static_cast<uint8_t>(result);
}

// -----------------------------------------------------------------------
// Display pixels
// -----------------------------------------------------------------------

uint16_t rgb_to_device565(uint8_t r, uint8_t g, uint8_t b) {
    // Channel rotation: red field <- blue, green field <- red, blue field <- green
    uint8_t dev_r = b;
    uint8_t dev_g = r;
    uint8_t dev_b = g;

    uint16_t r4     = static_cast<uint16_t>(dev_r >> 4);
    uint16_t r1     = static_cast<uint16_t>((dev_r >> 3) & 0x1);
    uint16_t b5     = static_cast<uint16_t>(dev_b >> 3);
    uint16_t g_high = static_cast<uint16_t>(dev_g >> 5);
    uint16_t g_low  = static_cast<uint16_t>((dev_g >> 3) & 0x7);

    return static_cast<uint16_t>((g_high << 13) | (b5 << 8) | (r4 << 4) | (r1 << 3) | g_low);
}

void rgb888_to_device565_buffer(const uint8_t* rgb888, uint8_t* out,
                                size_t width, size_t height, bool flip_y) {
    for (size_t y = 0; y < height; ++y) {
        size_t src_y = flip_y ? height - 1 - y : y;
        const uint8_t* src = rgb888 + src_y * width * 3;
        uint8_t*       dst = out + y * width * 2;
        for (size_t x = 0; x < width; ++x) {
            uint16_t px = rgb_to_device565(src[0], src[1], src[2]);
            dst[0] = static_cast<uint8_t>(px & 0xFF);   // LSB first
            dst[1] = static_cast<uint8_t>(px >> 8);
            src += 3;
            dst += 2;
        }
    }
}

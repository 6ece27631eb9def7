#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "transport.h"

// -----------------------------------------------------------------------
// MK3 display protocol (packet type 0x84, bulk endpoint)
//
// Two 480x272 displays, (0,0) top-left. A region packet is
//
//  Offset | Contents
//  -------|------------------------------------------------------------
//   0-3   | 84 00 <display id> 60
//   4-7   | 00 00 00 00
//   8-15  | x, y, width, height (u16 big-endian each)
//   16..  | draw commands, 4-byte header each:
//         |   00 nn nn nn  transmit nn*2 pixels (count is in pixel PAIRS),
//         |                followed by the pixels, 2 bytes each (LE)
//         |   01 nn nn nn  repeat the following 2 pixels nn times
//         |   03 00 00 00  blit
//         |   40 00 00 00  end of transmission
// -----------------------------------------------------------------------
static constexpr uint16_t DISPLAY_WIDTH  = 480;
static constexpr uint16_t DISPLAY_HEIGHT = 272;
static constexpr uint8_t  DISPLAY_COUNT  = 2;

static constexpr size_t DISPLAY_HEADER_SIZE = 16;
static constexpr size_t DISPLAY_CMD_SIZE    = 4;

static constexpr uint8_t DISPLAY_CMD_TRANSMIT = 0x00;
static constexpr uint8_t DISPLAY_CMD_REPEAT   = 0x01;
static constexpr uint8_t DISPLAY_CMD_BLIT     = 0x03;
static constexpr uint8_t DISPLAY_CMD_END      = 0x40;

// Full RGB888 frame size for one display.
static constexpr size_t DISPLAY_FRAME_BYTES = size_t(DISPLAY_WIDTH) * DISPLAY_HEIGHT * 3;

// Dirty regions are grown to this grid to match the device's block addressing.
static constexpr uint16_t DIRTY_BLOCK_SIZE = 8;

// Command-level builder for 0x84 packets.
class DisplayPacket {
public:
    DisplayPacket(uint8_t display_id, uint16_t x, uint16_t y, uint16_t width, uint16_t height);

    // Raw device-565 pixels. An odd pixel count gets one black padding pixel
    // because the command counts pixel pairs.
    DisplayPacket& add_pixels(const std::vector<uint16_t>& pixels);
    DisplayPacket& add_pixel_bytes(const uint8_t* data, size_t size);
    DisplayPacket& add_repeat(uint16_t pixel1, uint16_t pixel2, uint32_t count);
    DisplayPacket& add_blit();
    DisplayPacket& finish();

    const Bytes& bytes() const { return _data; }

private:
    Bytes _data;

    void _command(uint8_t code, uint32_t arg);
};

// Validate and build a complete region packet (transmit, blit, end) for
// width*height device-565 pixels (2 bytes each, little-endian).
// Throws InvalidParameter if display_id > 1, the region leaves the screen
// or pixel_bytes is not width*height*2 long.
Bytes build_region_packet(uint8_t display_id, uint16_t x, uint16_t y,
                          uint16_t width, uint16_t height, const Bytes& pixel_bytes);

// Same as build_region_packet() but takes RGB888 input; flip_y reads the
// source rows bottom-up.
Bytes build_region_packet_rgb888(uint8_t display_id, uint16_t x, uint16_t y,
                                 uint16_t width, uint16_t height,
                                 const Bytes& rgb888, bool flip_y = false);

// Full-screen solid colour using the repeat command.
Bytes build_fill_packet(uint8_t display_id, uint16_t pixel);

// Flip an RGB888 frame vertically (bottom-left origin -> display space).
// Throws InvalidParameter unless rgb888 is exactly width*height*3 bytes.
Bytes flip_frame_rows(const Bytes& rgb888, size_t width, size_t height);

// Inclusive pixel bounds of a dirty region, in display space.
struct DirtyRect {
    uint16_t x      = 0;
    uint16_t y      = 0;
    uint16_t width  = 0;
    uint16_t height = 0;

    bool is_full_screen() const {
        return x == 0 && y == 0 && width == DISPLAY_WIDTH && height == DISPLAY_HEIGHT;
    }
};

// Compare two full frames (display space). Returns nothing when no pixel
// differs; otherwise the bounding box of changed pixels grown outwards to
// the 8-pixel grid and clamped to the screen. A result smaller than 8x8
// becomes the full screen.
//
// Scans every pixel: this is the dominant cost of a dirty update.
std::optional<DirtyRect> find_dirty_rect(const Bytes& previous, const Bytes& next);

// Last frame written to one display, kept in display space.
class DisplayFramebuffer {
public:
    bool has_frame() const { return _frame.has_value(); }
    const Bytes& frame() const { return *_frame; }
    void store(Bytes frame) { _frame = std::move(frame); }
    void clear() { _frame.reset(); }

private:
    std::optional<Bytes> _frame;
};

// Build the packet needed to bring `fb` up to `frame` (RGB888, bottom-left
// origin, DISPLAY_FRAME_BYTES long). Returns an empty buffer when nothing
// changed. The first call sends the whole screen. The retained frame is
// always replaced by the new, flipped content.
Bytes dirty_rectangle_update(DisplayFramebuffer& fb, uint8_t display_id, const Bytes& frame);

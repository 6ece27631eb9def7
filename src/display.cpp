#include "display.h"

#include <algorithm>
#include <cstring>
#include <string>

#include "color.h"
#include "protocol.h"

// -----------------------------------------------------------------------
// DisplayPacket
// -----------------------------------------------------------------------

static void put_be16(Bytes& p, uint16_t v) {
    p.push_back(static_cast<uint8_t>(v >> 8));
    p.push_back(static_cast<uint8_t>(v & 0xFF));
}

static void put_le16(Bytes& p, uint16_t v) {
    p.push_back(static_cast<uint8_t>(v & 0xFF));
    p.push_back(static_cast<uint8_t>(v >> 8));
}

DisplayPacket::DisplayPacket(uint8_t display_id, uint16_t x, uint16_t y,
                             uint16_t width, uint16_t height) {
    _data.reserve(DISPLAY_HEADER_SIZE + DISPLAY_CMD_SIZE * 3 + size_t(width) * height * 2 + 2);
    _data.insert(_data.end(), {PACKET_DISPLAY, 0x00, display_id, 0x60, 0x00, 0x00, 0x00, 0x00});
    put_be16(_data, x);
    put_be16(_data, y);
    put_be16(_data, width);
    put_be16(_data, height);
}

void DisplayPacket::_command(uint8_t code, uint32_t arg) {
    _data.push_back(code);
    _data.push_back(static_cast<uint8_t>((arg >> 16) & 0xFF));
    _data.push_back(static_cast<uint8_t>((arg >> 8) & 0xFF));
    _data.push_back(static_cast<uint8_t>(arg & 0xFF));
}

DisplayPacket& DisplayPacket::add_pixel_bytes(const uint8_t* data, size_t size) {
    size_t pixel_count = size / 2;
    bool   odd         = (pixel_count % 2) == 1;
    size_t padded      = odd ? pixel_count + 1 : pixel_count;

    _command(DISPLAY_CMD_TRANSMIT, static_cast<uint32_t>(padded / 2));
    _data.insert(_data.end(), data, data + pixel_count * 2);
    if (odd) {
        _data.push_back(0x00);
        _data.push_back(0x00);
    }
    return *this;
}

DisplayPacket& DisplayPacket::add_pixels(const std::vector<uint16_t>& pixels) {
    Bytes raw;
    raw.reserve(pixels.size() * 2);
    for (uint16_t px : pixels)
        put_le16(raw, px);
    return add_pixel_bytes(raw.data(), raw.size());
}

DisplayPacket& DisplayPacket::add_repeat(uint16_t pixel1, uint16_t pixel2, uint32_t count) {
    _command(DISPLAY_CMD_REPEAT, count);
    put_le16(_data, pixel1);
    put_le16(_data, pixel2);
    return *this;
}

DisplayPacket& DisplayPacket::add_blit() {
    _command(DISPLAY_CMD_BLIT, 0);
    return *this;
}

DisplayPacket& DisplayPacket::finish() {
    _command(DISPLAY_CMD_END, 0);
    return *this;
}

// -----------------------------------------------------------------------
// Region packets
// -----------------------------------------------------------------------

static void check_region(uint8_t display_id, uint16_t x, uint16_t y,
                         uint16_t width, uint16_t height) {
    if (display_id >= DISPLAY_COUNT)
        throw InvalidParameter("display_id must be 0 (left) or 1 (right), got " +
                               std::to_string(display_id));
    if (x >= DISPLAY_WIDTH || y >= DISPLAY_HEIGHT)
        throw InvalidParameter("region start (" + std::to_string(x) + ", " +
                               std::to_string(y) + ") is off screen");
    if (uint32_t(x) + width > DISPLAY_WIDTH || uint32_t(y) + height > DISPLAY_HEIGHT)
        throw InvalidParameter("region " + std::to_string(width) + "x" +
                               std::to_string(height) + " at " + std::to_string(x) +
                               "," + std::to_string(y) + " exceeds the 480x272 display");
    if (width == 0 || height == 0)
        throw InvalidParameter("region must be at least 1x1");
}

Bytes build_region_packet(uint8_t display_id, uint16_t x, uint16_t y,
                          uint16_t width, uint16_t height, const Bytes& pixel_bytes) {
    check_region(display_id, x, y, width, height);

    size_t expected = size_t(width) * height * 2;
    if (pixel_bytes.size() != expected)
        throw InvalidParameter("region data must be " + std::to_string(expected) +
                               " bytes (" + std::to_string(width) + "x" +
                               std::to_string(height) + " pixels), got " +
                               std::to_string(pixel_bytes.size()));

    DisplayPacket pkt(display_id, x, y, width, height);
    pkt.add_pixel_bytes(pixel_bytes.data(), pixel_bytes.size()).add_blit().finish();
    return pkt.bytes();
}

Bytes build_region_packet_rgb888(uint8_t display_id, uint16_t x, uint16_t y,
                                 uint16_t width, uint16_t height,
                                 const Bytes& rgb888, bool flip_y) {
    check_region(display_id, x, y, width, height);

    size_t pixel_count = size_t(width) * height;
    if (rgb888.size() != pixel_count * 3)
        throw InvalidParameter("RGB888 data must be " + std::to_string(pixel_count * 3) +
                               " bytes, got " + std::to_string(rgb888.size()));

    Bytes device565(pixel_count * 2);
    rgb888_to_device565_buffer(rgb888.data(), device565.data(), width, height, flip_y);
    return build_region_packet(display_id, x, y, width, height, device565);
}

Bytes build_fill_packet(uint8_t display_id, uint16_t pixel) {
    check_region(display_id, 0, 0, DISPLAY_WIDTH, DISPLAY_HEIGHT);

    uint32_t pairs = uint32_t(DISPLAY_WIDTH) * DISPLAY_HEIGHT / 2;
    DisplayPacket pkt(display_id, 0, 0, DISPLAY_WIDTH, DISPLAY_HEIGHT);
    pkt.add_repeat(pixel, pixel, pairs).add_blit().finish();
    return pkt.bytes();
}

// -----------------------------------------------------------------------
// Dirty rectangles
// -----------------------------------------------------------------------

Bytes flip_frame_rows(const Bytes& rgb888, size_t width, size_t height) {
    size_t row = width * 3;
    if (rgb888.size() != row * height)
        throw InvalidParameter("RGB888 frame must be " + std::to_string(row * height) +
                               " bytes (" + std::to_string(width) + "x" +
                               std::to_string(height) + "x3), got " +
                               std::to_string(rgb888.size()));
    Bytes out(rgb888.size());
    for (size_t y = 0; y < height; ++y)
        std::memcpy(out.data() + y * row, rgb888.data() + (height - 1 - y) * row, row);
    return out;
}

std::optional<DirtyRect> find_dirty_rect(const Bytes& prev, const Bytes& next) {
    if (prev.size() != DISPLAY_FRAME_BYTES || next.size() != DISPLAY_FRAME_BYTES)
        throw InvalidParameter("dirty comparison needs two full 480x272 RGB888 frames");

    size_t min_x = DISPLAY_WIDTH, min_y = DISPLAY_HEIGHT;
    size_t max_x = 0, max_y = 0;
    bool   changed = false;

    for (size_t y = 0; y < DISPLAY_HEIGHT; ++y) {
        for (size_t x = 0; x < DISPLAY_WIDTH; ++x) {
            size_t i = (y * DISPLAY_WIDTH + x) * 3;
            if (prev[i] != next[i] || prev[i + 1] != next[i + 1] || prev[i + 2] != next[i + 2]) {
                changed = true;
                min_x = std::min(min_x, x);
                min_y = std::min(min_y, y);
                max_x = std::max(max_x, x);
                max_y = std::max(max_y, y);
            }
        }
    }

    if (!changed)
        return std::nullopt;

    // Grow to the 8-pixel grid, clamped to the screen.
    const size_t B = DIRTY_BLOCK_SIZE;
    min_x = (min_x / B) * B;
    min_y = (min_y / B) * B;
    max_x = std::min(((max_x + B) / B) * B - 1, size_t(DISPLAY_WIDTH) - 1);
    max_y = std::min(((max_y + B) / B) * B - 1, size_t(DISPLAY_HEIGHT) - 1);

    DirtyRect r;
    r.x      = static_cast<uint16_t>(min_x);
    r.y      = static_cast<uint16_t>(min_y);
    r.width  = static_cast<uint16_t>(max_x - min_x + 1);
    r.height = static_cast<uint16_t>(max_y - min_y + 1);

    // The device mis-draws very small regions.
    if (r.width < DIRTY_BLOCK_SIZE || r.height < DIRTY_BLOCK_SIZE)
        r = DirtyRect{0, 0, DISPLAY_WIDTH, DISPLAY_HEIGHT};

    return r;
}

Bytes dirty_rectangle_update(DisplayFramebuffer& fb, uint8_t display_id, const Bytes& frame) {
    if (display_id >= DISPLAY_COUNT)
        throw InvalidParameter("display_id must be 0 (left) or 1 (right), got " +
                               std::to_string(display_id));
    if (frame.size() != DISPLAY_FRAME_BYTES)
        throw InvalidParameter("RGB888 frame must be " + std::to_string(DISPLAY_FRAME_BYTES) +
                               " bytes (480x272x3), got " + std::to_string(frame.size()));

    // Everything below is in display space.
    Bytes flipped = flip_frame_rows(frame, DISPLAY_WIDTH, DISPLAY_HEIGHT);

    if (!fb.has_frame()) {
        Bytes pkt = build_region_packet_rgb888(display_id, 0, 0, DISPLAY_WIDTH,
                                               DISPLAY_HEIGHT, flipped);
        fb.store(std::move(flipped));
        return pkt;
    }

    std::optional<DirtyRect> rect = find_dirty_rect(fb.frame(), flipped);
    if (!rect) {
        fb.store(std::move(flipped));
        return {};
    }

    Bytes region;
    region.reserve(size_t(rect->width) * rect->height * 3);
    for (size_t y = rect->y; y < size_t(rect->y) + rect->height; ++y) {
        auto row = flipped.begin() + (y * DISPLAY_WIDTH + rect->x) * 3;
        region.insert(region.end(), row, row + size_t(rect->width) * 3);
    }

    Bytes pkt = build_region_packet_rgb888(display_id, rect->x, rect->y,
                                           rect->width, rect->height, region);
    fb.store(std::move(flipped));
    return pkt;
}

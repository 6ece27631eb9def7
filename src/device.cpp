#include "device.h"
#include "data.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

// Bytes of each outbound packet shown in verbose mode
static constexpr size_t VERBOSE_DUMP_BYTES = 32;

Mk3Device::Mk3Device(std::unique_ptr<Transport> hid, std::unique_ptr<Transport> display,
                     const Config& cfg)
    : _hid(std::move(hid)),
      _display(std::move(display)),
      _poll_timeout_ms(cfg.device.poll_timeout_ms),
      _auto_flush(cfg.leds.auto_flush),
      _verbose(cfg.verbose),
      _tracker(cfg.input.hold_threshold) {
    if (!_hid)
        throw InvalidParameter("Mk3Device needs a HID transport");
    _tracker.set_rich_pad_events(cfg.input.rich_pad_events);
}

Mk3Device::~Mk3Device() {
    stop_input_monitoring();
}

// -----------------------------------------------------------------------
// Input
// -----------------------------------------------------------------------

std::vector<InputEvent> Mk3Device::poll_input_events() {
    return _poll(_poll_timeout_ms);
}

std::vector<InputEvent> Mk3Device::poll_input_events_fast() {
    return _poll(FAST_POLL_TIMEOUT_MS);
}

std::vector<InputEvent> Mk3Device::_poll(unsigned int timeout_ms) {
    std::lock_guard<std::mutex> lock(_input_mutex);
    Bytes packet = _hid->read(timeout_ms);
    if (packet.empty())
        return {};
    return _process_locked(packet);
}

std::vector<InputEvent> Mk3Device::process_input_packet(const Bytes& packet) {
    std::lock_guard<std::mutex> lock(_input_mutex);
    return _process_locked(packet);
}

std::vector<InputEvent> Mk3Device::_process_locked(const Bytes& packet) {
    if (packet.empty())
        return {};

    try {
        switch (packet[0]) {
            case PACKET_BUTTONS:
                return _tracker.update(decode_button_packet(packet));
            case PACKET_PADS:
                return _tracker.update_pads(decode_pad_packet(packet));
            default:
                return {};
        }
    } catch (const InvalidPacket& e) {
        std::cerr << "Warning: dropping packet: " << e.what() << "\n";
        return {};
    }
}

void Mk3Device::reset_input_state() {
    std::lock_guard<std::mutex> lock(_input_mutex);
    _tracker.reset();
}

// -----------------------------------------------------------------------
// Background monitor
// -----------------------------------------------------------------------

void Mk3Device::start_input_monitoring(EventCallback callback) {
    if (_monitor_running)
        throw std::logic_error("input monitoring is already running");
    if (_monitor.joinable())
        _monitor.join();   // worker ended on an error

    _callback = std::move(callback);
    _monitor_stop = false;
    _monitor_running = true;
    _monitor = std::thread(&Mk3Device::_monitor_loop, this);
}

void Mk3Device::stop_input_monitoring() {
    if (!_monitor.joinable()) return;

    _monitor_stop = true;
    _monitor.join();
    _monitor_running = false;
    _callback = nullptr;
}

void Mk3Device::_monitor_loop() {
    while (!_monitor_stop) {
        try {
            for (const InputEvent& ev : _poll(_poll_timeout_ms)) {
                if (_callback)
                    _callback(ev);
                std::lock_guard<std::mutex> lock(_queue_mutex);
                _queue.push_back(ev);
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: input monitor stopped: " << e.what() << "\n";
            break;
        }
    }
    _monitor_running = false;
}

std::vector<InputEvent> Mk3Device::drain_monitored_events() {
    std::lock_guard<std::mutex> lock(_queue_mutex);
    std::vector<InputEvent> out(_queue.begin(), _queue.end());
    _queue.clear();
    return out;
}

// -----------------------------------------------------------------------
// LEDs
// -----------------------------------------------------------------------

static ButtonLed led_for(InputElement element) {
    ButtonLed led;
    if (!element_button_led(element, led))
        throw InvalidParameter(std::string("element '") + element_name(element) +
                               "' has no LED");
    return led;
}

static void check_pad(uint8_t pad) {
    if (pad >= PAD_COUNT)
        throw InvalidParameter("pad index must be 0-15, got " + std::to_string(pad));
}

void Mk3Device::set_button_led(InputElement element, LedBrightness brightness) {
    ButtonLed led = led_for(element);
    if (button_led_has_color(led))
        _button_leds.set(led, LedColor::from_brightness(brightness));
    else
        _button_leds.set(led, brightness);
    _leds_changed();
}

void Mk3Device::set_button_led_color(InputElement element, const LedColor& color) {
    ButtonLed led = led_for(element);
    if (!button_led_has_color(led))
        throw InvalidParameter(std::string("element '") + element_name(element) +
                               "' has a single-colour LED");
    _button_leds.set(led, color);
    _leds_changed();
}

void Mk3Device::set_button_led_color(InputElement element, const RgbColor& color) {
    set_button_led_color(element, LedColor::from_rgb(color));
}

void Mk3Device::set_pad_led(uint8_t pad, const LedColor& color) {
    check_pad(pad);
    _pad_leds.pads[pad] = color;
    _leds_changed();
}

void Mk3Device::set_pad_led(uint8_t pad, const RgbColor& color) {
    set_pad_led(pad, LedColor::from_rgb(color));
}

void Mk3Device::set_all_pad_leds(const LedColor& color) {
    _pad_leds.pads.fill(color);
    _leds_changed();
}

void Mk3Device::set_all_pad_leds(const RgbColor& color) {
    set_all_pad_leds(LedColor::from_rgb(color));
}

void Mk3Device::set_touch_strip_led(uint8_t index, const LedColor& color) {
    if (index >= TOUCH_STRIP_LED_COUNT)
        throw InvalidParameter("touch strip LED must be 0-24, got " + std::to_string(index));
    _pad_leds.touch_strip[index] = color;
    _leds_changed();
}

void Mk3Device::set_touch_strip_led(uint8_t index, const RgbColor& color) {
    set_touch_strip_led(index, LedColor::from_rgb(color));
}

void Mk3Device::clear_all_leds() {
    _button_leds = ButtonLedState{};
    _pad_leds    = PadLedState{};
    _leds_dirty  = true;
    flush_leds();
}

void Mk3Device::flush_leds() {
    if (!_leds_dirty) return;

    Bytes buttons = encode_button_leds(_button_leds);
    Bytes pads    = encode_pad_leds(_pad_leds);
    _log_packet("-> button LEDs", buttons);
    _log_packet("-> pad LEDs", pads);

    _hid->write(buttons);
    _hid->write(pads);
    _leds_dirty = false;
}

void Mk3Device::apply_led_config(const Config& cfg) {
    // Batch regardless of auto_flush
    bool auto_flush = _auto_flush;
    _auto_flush = false;

    try {
        for (const LedSetting& s : cfg.leds.settings) {
            if (s.has_color)
                set_button_led_color(s.element, s.color);
            else
                set_button_led(s.element, s.brightness);
        }
        for (uint8_t i = 0; i < PAD_COUNT; ++i)
            if (cfg.pads[i])
                set_pad_led(i, *cfg.pads[i]);
    } catch (...) {
        _auto_flush = auto_flush;
        throw;
    }

    _auto_flush = auto_flush;
    flush_leds();
}

LedColor Mk3Device::pad_led_color(uint8_t pad) const {
    check_pad(pad);
    return _pad_leds.pads[pad];
}

void Mk3Device::_leds_changed() {
    _leds_dirty = true;
    if (_auto_flush)
        flush_leds();
}

// -----------------------------------------------------------------------
// Displays
// -----------------------------------------------------------------------

void Mk3Device::_send_display(uint8_t display_id, const Bytes& packet) {
    if (!_display)
        throw TransportError("Display interface not claimed");
    _log_packet("-> display", packet);
    try {
        _display->write(packet);
    } catch (const TransportError&) {
        // Screen contents are unknown now; next dirty update sends everything.
        _framebuffers[display_id].clear();
        throw;
    }
}

void Mk3Device::write_display_region(uint8_t display_id, uint16_t x, uint16_t y,
                                     uint16_t width, uint16_t height, const Bytes& device565) {
    Bytes packet = build_region_packet(display_id, x, y, width, height, device565);
    _send_display(display_id, packet);
    // Raw pixels cannot be folded back into the RGB888 copy.
    _framebuffers[display_id].clear();
}

void Mk3Device::write_display_region_rgb888(uint8_t display_id, uint16_t x, uint16_t y,
                                            uint16_t width, uint16_t height,
                                            const Bytes& rgb888) {
    Bytes packet = build_region_packet_rgb888(display_id, x, y, width, height, rgb888);
    _send_display(display_id, packet);

    DisplayFramebuffer& fb = _framebuffers[display_id];
    if (!fb.has_frame()) return;

    Bytes frame = fb.frame();
    for (size_t row = 0; row < height; ++row) {
        auto src = rgb888.begin() + row * width * 3;
        std::copy(src, src + size_t(width) * 3,
                  frame.begin() + ((y + row) * DISPLAY_WIDTH + x) * 3);
    }
    fb.store(std::move(frame));
}

void Mk3Device::write_display_framebuffer_rgb888(uint8_t display_id, const Bytes& frame) {
    if (frame.size() != DISPLAY_FRAME_BYTES)
        throw InvalidParameter("RGB888 frame must be " + std::to_string(DISPLAY_FRAME_BYTES) +
                               " bytes (480x272x3), got " + std::to_string(frame.size()));

    Bytes packet = build_region_packet_rgb888(display_id, 0, 0, DISPLAY_WIDTH,
                                              DISPLAY_HEIGHT, frame, true);
    _send_display(display_id, packet);
    _framebuffers[display_id].store(flip_frame_rows(frame, DISPLAY_WIDTH, DISPLAY_HEIGHT));
}

bool Mk3Device::write_display_framebuffer_rgb888_dirty(uint8_t display_id, const Bytes& frame) {
    if (display_id >= DISPLAY_COUNT)
        throw InvalidParameter("display_id must be 0 (left) or 1 (right), got " +
                               std::to_string(display_id));
    if (frame.size() != DISPLAY_FRAME_BYTES)
        throw InvalidParameter("RGB888 frame must be " + std::to_string(DISPLAY_FRAME_BYTES) +
                               " bytes (480x272x3), got " + std::to_string(frame.size()));
    if (!_display)
        throw TransportError("Display interface not claimed");

    DisplayFramebuffer& fb = _framebuffers[display_id];
    Bytes packet = dirty_rectangle_update(fb, display_id, frame);
    if (packet.empty())
        return false;

    _send_display(display_id, packet);
    return true;
}

void Mk3Device::clear_display(uint8_t display_id, const RgbColor& color) {
    Bytes packet = build_fill_packet(display_id, rgb_to_device565(color.r, color.g, color.b));
    _send_display(display_id, packet);

    Bytes frame(DISPLAY_FRAME_BYTES);
    for (size_t i = 0; i < frame.size(); i += 3) {
        frame[i]     = color.r;
        frame[i + 1] = color.g;
        frame[i + 2] = color.b;
    }
    _framebuffers[display_id].store(std::move(frame));
}

void Mk3Device::_log_packet(const char* label, const Bytes& packet) const {
    if (_verbose)
        hexdump_packet(packet, label, VERBOSE_DUMP_BYTES);
}

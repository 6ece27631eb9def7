#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "color.h"
#include "config.h"
#include "display.h"
#include "input.h"
#include "protocol.h"
#include "tracker.h"
#include "transport.h"

// One connected MK3.
//
// Owns the HID transport (input reports, LED packets), the optional display
// transport, the pending LED state, one retained framebuffer per display and
// the input tracker.
//
// LED setters only change the pending state; flush_leds() writes the button
// packet then the pad packet. With [leds] auto_flush every setter flushes.
//
// The polling path and the background monitor share one mutex around the
// tracker and HID reads. LED and display calls are meant for one thread.
class Mk3Device {
public:
    using EventCallback = std::function<void(const InputEvent&)>;

    // display may be null when the display interface was not claimed; display
    // writes then throw TransportError.
    Mk3Device(std::unique_ptr<Transport> hid, std::unique_ptr<Transport> display,
              const Config& cfg = Config{});
    ~Mk3Device();

    // Non-copyable
    Mk3Device(const Mk3Device&) = delete;
    Mk3Device& operator=(const Mk3Device&) = delete;

    // ---- input ----

    // One HID read with the configured timeout (default 100 ms). Empty on
    // timeout. Malformed packets are logged and dropped.
    std::vector<InputEvent> poll_input_events();

    // Same with a 1 ms timeout, for callers running their own frame loop.
    std::vector<InputEvent> poll_input_events_fast();

    // Decode and track one raw report: 0x01 -> tracker update, 0x02 -> pad
    // events, anything else -> nothing.
    std::vector<InputEvent> process_input_packet(const Bytes& packet);

    void reset_input_state();
    const InputTracker& tracker() const { return _tracker; }

    // ---- background monitor ----

    // Run the poll pipeline on a worker thread. Each event goes to callback
    // (if set) and to a queue read by drain_monitored_events().
    // Throws std::logic_error if already running.
    void start_input_monitoring(EventCallback callback = nullptr);
    void stop_input_monitoring();
    bool is_monitoring() const { return _monitor_running; }

    std::vector<InputEvent> drain_monitored_events();

    // ---- LEDs ----

    // Single-colour slots take brightness 0-127 as is; RGB slots get white
    // (bright above 127) or off. Throws InvalidParameter for elements
    // without an LED.
    void set_button_led(InputElement element, LedBrightness brightness);

    // RGB slots only (groups, browser, four-way encoder). Throws
    // InvalidParameter otherwise. The RgbColor forms go through
    // LedColor::from_rgb, which misses some dim entries (dim white, dim blue).
    void set_button_led_color(InputElement element, const LedColor& color);
    void set_button_led_color(InputElement element, const RgbColor& color);

    // pad 0..15, throws InvalidParameter otherwise.
    void set_pad_led(uint8_t pad, const LedColor& color);
    void set_pad_led(uint8_t pad, const RgbColor& color);
    void set_all_pad_leds(const LedColor& color);
    void set_all_pad_leds(const RgbColor& color);

    // index 0..24, throws InvalidParameter otherwise.
    void set_touch_strip_led(uint8_t index, const LedColor& color);
    void set_touch_strip_led(uint8_t index, const RgbColor& color);

    // Turn every LED off and flush.
    void clear_all_leds();

    // Write both LED packets if anything changed since the last flush.
    void flush_leds();

    // Apply the [leds] and [pads] startup assignments, then flush.
    void apply_led_config(const Config& cfg);

    LedColor pad_led_color(uint8_t pad) const;
    const ButtonLedState& button_led_state() const { return _button_leds; }
    const PadLedState&    pad_led_state() const { return _pad_leds; }
    bool leds_pending() const { return _leds_dirty; }

    // ---- displays ----

    bool has_display() const { return _display != nullptr; }

    // Raw device-565 little-endian pixels, no flip.
    void write_display_region(uint8_t display_id, uint16_t x, uint16_t y,
                              uint16_t width, uint16_t height, const Bytes& device565);

    // RGB888 pixels in display space (top-left origin), no flip.
    void write_display_region_rgb888(uint8_t display_id, uint16_t x, uint16_t y,
                                     uint16_t width, uint16_t height, const Bytes& rgb888);

    // Whole 480x272 RGB888 frame with bottom-left origin (flipped on send).
    void write_display_framebuffer_rgb888(uint8_t display_id, const Bytes& frame);

    // As above, but only the dirty rectangle against the last frame is sent.
    // Returns false when nothing changed and nothing was written.
    bool write_display_framebuffer_rgb888_dirty(uint8_t display_id, const Bytes& frame);

    // Fill a display with one colour.
    void clear_display(uint8_t display_id, const RgbColor& color = RgbColor{});

private:
    std::unique_ptr<Transport> _hid;
    std::unique_ptr<Transport> _display;

    unsigned int _poll_timeout_ms;
    bool         _auto_flush;
    bool         _verbose;

    // Input
    std::mutex   _input_mutex;   // guards _tracker and HID reads
    InputTracker _tracker;

    // Monitor
    std::thread             _monitor;
    std::atomic<bool>       _monitor_stop{false};
    std::atomic<bool>       _monitor_running{false};
    EventCallback           _callback;
    std::mutex              _queue_mutex;
    std::deque<InputEvent>  _queue;

    // LEDs
    ButtonLedState _button_leds;
    PadLedState    _pad_leds;
    bool           _leds_dirty = true;

    // Displays
    DisplayFramebuffer _framebuffers[DISPLAY_COUNT];

    std::vector<InputEvent> _poll(unsigned int timeout_ms);
    std::vector<InputEvent> _process_locked(const Bytes& packet);
    void _monitor_loop();
    void _leds_changed();
    // Forgets the retained frame of display_id if the write fails.
    void _send_display(uint8_t display_id, const Bytes& packet);
    void _log_packet(const char* label, const Bytes& packet) const;
};

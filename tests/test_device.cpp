#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

#include "device.h"

// In-memory transport: reads come from a queue, writes are recorded.
struct FakeWire {
    std::mutex         mutex;
    std::deque<Bytes>  reads;
    std::vector<Bytes> writes;
    bool               fail_writes = false;

    void push(const Bytes& packet) {
        std::lock_guard<std::mutex> lock(mutex);
        reads.push_back(packet);
    }

    size_t write_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return writes.size();
    }
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeWire> wire) : _wire(std::move(wire)) {}

    void write(const Bytes& data) override {
        std::lock_guard<std::mutex> lock(_wire->mutex);
        if (_wire->fail_writes)
            throw TransportError("write failed");
        _wire->writes.push_back(data);
    }

    Bytes read(unsigned int timeout_ms) override {
        {
            std::lock_guard<std::mutex> lock(_wire->mutex);
            if (!_wire->reads.empty()) {
                Bytes p = _wire->reads.front();
                _wire->reads.pop_front();
                return p;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(timeout_ms, 2u)));
        return {};
    }

private:
    std::shared_ptr<FakeWire> _wire;
};

static Bytes button_report(bool play) {
    Bytes p(BUTTON_PACKET_MIN_SIZE, 0);
    p[0] = PACKET_BUTTONS;
    if (play) p[6] = 0x20;
    return p;
}

static Bytes solid_frame(RgbColor c) {
    Bytes f(DISPLAY_FRAME_BYTES);
    for (size_t i = 0; i < f.size(); i += 3) {
        f[i] = c.r;
        f[i + 1] = c.g;
        f[i + 2] = c.b;
    }
    return f;
}

class DeviceTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeWire> hid     = std::make_shared<FakeWire>();
    std::shared_ptr<FakeWire> display = std::make_shared<FakeWire>();

    std::unique_ptr<Mk3Device> make(const Config& cfg = Config{}, bool with_display = true) {
        std::unique_ptr<Transport> disp;
        if (with_display)
            disp = std::make_unique<FakeTransport>(display);
        return std::make_unique<Mk3Device>(std::make_unique<FakeTransport>(hid),
                                           std::move(disp), cfg);
    }
};

// -----------------------------------------------------------------------
// Input
// -----------------------------------------------------------------------

TEST_F(DeviceTest, NeedsHidTransport) {
    EXPECT_THROW(Mk3Device(nullptr, nullptr), InvalidParameter);
}

TEST_F(DeviceTest, PollTimeoutIsEmpty) {
    auto dev = make();
    EXPECT_TRUE(dev->poll_input_events().empty());
    EXPECT_TRUE(dev->poll_input_events_fast().empty());
}

TEST_F(DeviceTest, PollDecodesButtonReports) {
    auto dev = make();
    hid->push(button_report(false));
    hid->push(button_report(true));
    hid->push(button_report(false));

    EXPECT_TRUE(dev->poll_input_events().empty());

    auto down = dev->poll_input_events();
    ASSERT_EQ(down.size(), 1u);
    EXPECT_EQ(down[0], InputEvent::button(InputEventType::ButtonPressed, InputElement::Play));

    auto up = dev->poll_input_events();
    ASSERT_EQ(up.size(), 1u);
    EXPECT_EQ(up[0], InputEvent::button(InputEventType::ButtonReleased, InputElement::Play));
}

TEST_F(DeviceTest, MalformedReportIsDropped) {
    auto dev = make();
    hid->push(Bytes{PACKET_BUTTONS, 0x00, 0x20});
    hid->push(button_report(true));

    EXPECT_TRUE(dev->poll_input_events().empty());
    EXPECT_TRUE(dev->tracker().is_first_update());

    auto ev = dev->poll_input_events();
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0].type, InputEventType::ButtonPressed);
}

TEST_F(DeviceTest, UnknownReportTagIsIgnored) {
    auto dev = make();
    EXPECT_TRUE(dev->process_input_packet(Bytes{0x07, 0x01, 0x02, 0x03}).empty());
    EXPECT_TRUE(dev->process_input_packet(Bytes{}).empty());
    EXPECT_TRUE(dev->tracker().is_first_update());
}

TEST_F(DeviceTest, PadReportGivesHits) {
    auto dev = make();
    auto ev = dev->process_input_packet(Bytes{0x02, 0x05, 0x40, 0x7F, 0x00, 0x00, 0x00});
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0].type, InputEventType::PadHit);
    EXPECT_EQ(ev[0].pad_number, 5);
    EXPECT_EQ(ev[0].velocity, 0x40);
    EXPECT_EQ(ev[0].pressure, 0x7F);
}

TEST_F(DeviceTest, RichPadEventsFromConfig) {
    Config cfg;
    cfg.input.rich_pad_events = true;
    auto dev = make(cfg);

    auto ev = dev->process_input_packet(Bytes{0x02, 0x01, 0x4A, 0xBC});
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0].type, InputEventType::PadEvent);
    EXPECT_EQ(ev[0].pad_event, PadEventType::Aftertouch);
    EXPECT_EQ(ev[0].value, 0xABC);
}

TEST_F(DeviceTest, ResetInputState) {
    auto dev = make();
    dev->process_input_packet(button_report(true));
    EXPECT_FALSE(dev->tracker().is_first_update());

    dev->reset_input_state();
    EXPECT_TRUE(dev->tracker().is_first_update());

    // Play is reported as pressed again after a reset
    auto ev = dev->process_input_packet(button_report(true));
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0].type, InputEventType::ButtonPressed);
}

// -----------------------------------------------------------------------
// Background monitor
// -----------------------------------------------------------------------

TEST_F(DeviceTest, MonitorQueuesAndCallsBack) {
    auto dev = make();
    std::atomic<int> calls{0};

    hid->push(button_report(true));
    hid->push(button_report(false));

    dev->start_input_monitoring([&calls](const InputEvent&) { ++calls; });
    EXPECT_TRUE(dev->is_monitoring());
    EXPECT_THROW(dev->start_input_monitoring(), std::logic_error);

    std::vector<InputEvent> got;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (got.size() < 2 && std::chrono::steady_clock::now() < deadline) {
        auto ev = dev->drain_monitored_events();
        got.insert(got.end(), ev.begin(), ev.end());
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    dev->stop_input_monitoring();
    EXPECT_FALSE(dev->is_monitoring());

    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0].type, InputEventType::ButtonPressed);
    EXPECT_EQ(got[1].type, InputEventType::ButtonReleased);
    EXPECT_EQ(calls.load(), 2);
    EXPECT_TRUE(dev->drain_monitored_events().empty());
}

TEST_F(DeviceTest, MonitorCanRestart) {
    auto dev = make();
    dev->start_input_monitoring();
    dev->stop_input_monitoring();
    dev->stop_input_monitoring();
    EXPECT_NO_THROW(dev->start_input_monitoring());
}

// -----------------------------------------------------------------------
// LEDs
// -----------------------------------------------------------------------

TEST_F(DeviceTest, LedSettersWaitForFlush) {
    auto dev = make();
    dev->set_pad_led(3, {255, 0, 0});
    dev->set_button_led(InputElement::Play, 100);
    dev->set_touch_strip_led(24, {0, 0, 255});

    EXPECT_EQ(hid->write_count(), 0u);
    EXPECT_TRUE(dev->leds_pending());

    dev->flush_leds();
    ASSERT_EQ(hid->write_count(), 2u);

    const Bytes& buttons = hid->writes[0];
    const Bytes& pads    = hid->writes[1];
    ASSERT_EQ(buttons.size(), BUTTON_LED_PACKET_SIZE);
    ASSERT_EQ(pads.size(), PAD_LED_PACKET_SIZE);
    EXPECT_EQ(buttons[0], PACKET_BUTTON_LEDS);
    EXPECT_EQ(pads[0], PACKET_PAD_LEDS);
    EXPECT_EQ(buttons[42], 100);
    EXPECT_EQ(pads[26 + 3], LedColor::red(true).to_led_value());
    EXPECT_EQ(pads[25], LedColor::blue(true).to_led_value());
    EXPECT_EQ(dev->pad_led_color(3), LedColor::red(true));

    EXPECT_FALSE(dev->leds_pending());
    dev->flush_leds();
    EXPECT_EQ(hid->write_count(), 2u);
}

TEST_F(DeviceTest, FirstFlushWritesEvenWithoutChanges) {
    auto dev = make();
    dev->flush_leds();
    EXPECT_EQ(hid->write_count(), 2u);
}

TEST_F(DeviceTest, AutoFlushWritesOnEverySetter) {
    Config cfg;
    cfg.leds.auto_flush = true;
    auto dev = make(cfg);

    dev->set_pad_led(0, {0, 255, 0});
    EXPECT_EQ(hid->write_count(), 2u);
    dev->set_all_pad_leds({0, 0, 0});
    EXPECT_EQ(hid->write_count(), 4u);
}

TEST_F(DeviceTest, RgbAndMonoButtonLeds) {
    auto dev = make();
    dev->set_button_led(InputElement::GroupA, 200);
    dev->set_button_led_color(InputElement::GroupB, {0, 0, 255});
    dev->set_button_led_color(InputElement::EncoderUp, {255, 0, 0});
    dev->set_button_led(InputElement::Macro, 64);
    dev->flush_leds();

    const ButtonLedState& st = dev->button_led_state();
    EXPECT_EQ(st.color_of(ButtonLed::GroupA), LedColor::white(true));
    EXPECT_EQ(st.color_of(ButtonLed::GroupB), LedColor::blue(true));
    EXPECT_EQ(st.color_of(ButtonLed::NavUp), LedColor::red(true));
    EXPECT_EQ(st.brightness_of(ButtonLed::MacroSet), 64);

    const Bytes& p = hid->writes[0];
    EXPECT_EQ(p[static_cast<size_t>(ButtonLed::GroupA)], LedColor::white(true).to_led_value());
    EXPECT_EQ(p[static_cast<size_t>(ButtonLed::MacroSet)], 64);
}

TEST_F(DeviceTest, DimPaletteColorsReachTheWire) {
    auto dev = make();
    dev->set_pad_led(5, LedColor::white(false));
    dev->set_pad_led(6, LedColor::blue(false));
    dev->set_touch_strip_led(0, LedColor::cyan(false));
    dev->set_button_led_color(InputElement::GroupB, LedColor::blue(false));
    dev->flush_leds();

    // Grey RGB input lands on a different palette entry
    EXPECT_NE(LedColor::from_rgb(127, 127, 127), LedColor::white(false));

    const Bytes& buttons = hid->writes[0];
    const Bytes& pads    = hid->writes[1];
    EXPECT_EQ(pads[26 + 5], 72);
    EXPECT_EQ(pads[26 + 6], 40);
    EXPECT_EQ(pads[1], 32);
    EXPECT_EQ(buttons[static_cast<size_t>(ButtonLed::GroupB)], 40);
    EXPECT_EQ(dev->pad_led_color(5), LedColor::white(false));

    dev->set_all_pad_leds(LedColor::white(false));
    dev->flush_leds();
    ASSERT_EQ(hid->write_count(), 4u);
    for (size_t pad = 0; pad < PAD_COUNT; ++pad)
        EXPECT_EQ(hid->writes[3][26 + pad], 72) << "pad " << pad;
}

TEST_F(DeviceTest, PaletteColorArgumentsAreChecked) {
    auto dev = make();
    EXPECT_THROW(dev->set_button_led_color(InputElement::Play, LedColor::red(true)),
                 InvalidParameter);
    EXPECT_THROW(dev->set_pad_led(16, LedColor::red(true)), InvalidParameter);
    EXPECT_THROW(dev->set_touch_strip_led(25, LedColor::red(true)), InvalidParameter);
    EXPECT_EQ(hid->write_count(), 0u);
}

TEST_F(DeviceTest, InvalidLedArgumentsWriteNothing) {
    auto dev = make();
    EXPECT_THROW(dev->set_pad_led(16, {1, 2, 3}), InvalidParameter);
    EXPECT_THROW(dev->set_touch_strip_led(25, {1, 2, 3}), InvalidParameter);
    EXPECT_THROW(dev->set_button_led(InputElement::Knob1, 10), InvalidParameter);
    EXPECT_THROW(dev->set_button_led(InputElement::EncoderPush, 10), InvalidParameter);
    EXPECT_THROW(dev->set_button_led_color(InputElement::Play, {255, 0, 0}), InvalidParameter);
    EXPECT_THROW(dev->pad_led_color(16), InvalidParameter);
    EXPECT_EQ(hid->write_count(), 0u);
}

TEST_F(DeviceTest, ClearAllLedsFlushesZeros) {
    auto dev = make();
    dev->set_all_pad_leds({255, 255, 255});
    dev->set_button_led(InputElement::Play, 127);
    dev->flush_leds();

    dev->clear_all_leds();
    ASSERT_EQ(hid->write_count(), 4u);
    for (size_t i = 2; i < 4; ++i) {
        const Bytes& p = hid->writes[i];
        for (size_t j = 1; j < p.size(); ++j)
            EXPECT_EQ(p[j], 0) << "packet " << i << " offset " << j;
    }
    EXPECT_TRUE(dev->pad_led_color(0).is_off());
}

TEST_F(DeviceTest, ApplyLedConfigFlushesOnce) {
    Config cfg;
    cfg.leds.auto_flush = true;
    auto dev = make(cfg);

    Config startup;
    LedSetting play;
    play.element    = InputElement::Play;
    play.brightness = 64;
    LedSetting group;
    group.element   = InputElement::GroupB;
    group.has_color = true;
    group.color     = {0, 0, 255};
    startup.leds.settings = {play, group};
    startup.pads[3] = RgbColor{0, 255, 0};

    dev->apply_led_config(startup);

    ASSERT_EQ(hid->write_count(), 2u);
    EXPECT_EQ(hid->writes[0][42], 64);
    EXPECT_EQ(dev->pad_led_color(3), LedColor::from_rgb(0, 255, 0));
    EXPECT_TRUE(dev->pad_led_color(2).is_off());
}

// -----------------------------------------------------------------------
// Displays
// -----------------------------------------------------------------------

TEST_F(DeviceTest, MissingDisplayInterface) {
    auto dev = make(Config{}, false);
    EXPECT_FALSE(dev->has_display());

    EXPECT_THROW(dev->write_display_region(0, 0, 0, 1, 1, Bytes(2)), TransportError);
    EXPECT_THROW(dev->write_display_framebuffer_rgb888_dirty(0, solid_frame({})), TransportError);
    EXPECT_THROW(dev->clear_display(1), TransportError);

    // Parameter errors still come first
    EXPECT_THROW(dev->write_display_framebuffer_rgb888_dirty(2, solid_frame({})),
                 InvalidParameter);
}

TEST_F(DeviceTest, BadRegionWritesNothing) {
    auto dev = make();
    EXPECT_THROW(dev->write_display_region(0, 470, 0, 20, 1, Bytes(40)), InvalidParameter);
    EXPECT_THROW(dev->write_display_region(2, 0, 0, 1, 1, Bytes(2)), InvalidParameter);
    EXPECT_THROW(dev->write_display_region(0, 0, 0, 2, 2, Bytes(5)), InvalidParameter);
    EXPECT_THROW(dev->write_display_framebuffer_rgb888(0, Bytes(10)), InvalidParameter);
    EXPECT_EQ(display->write_count(), 0u);
}

TEST_F(DeviceTest, RegionGoesToDisplayTransport) {
    auto dev = make();
    dev->write_display_region(1, 10, 20, 2, 1, Bytes{0x11, 0x22, 0x33, 0x44});

    ASSERT_EQ(display->write_count(), 1u);
    EXPECT_EQ(hid->write_count(), 0u);
    const Bytes& p = display->writes[0];
    EXPECT_EQ(p[0], PACKET_DISPLAY);
    EXPECT_EQ(p[2], 1);
    EXPECT_EQ(p[20], 0x11);
}

TEST_F(DeviceTest, DirtyWritesOnlyChanges) {
    auto dev = make();
    Bytes frame = solid_frame({0, 0, 0});

    EXPECT_TRUE(dev->write_display_framebuffer_rgb888_dirty(0, frame));
    EXPECT_FALSE(dev->write_display_framebuffer_rgb888_dirty(0, frame));
    ASSERT_EQ(display->write_count(), 1u);
    size_t full = display->writes[0].size();

    frame[0] = 0xFF;
    EXPECT_TRUE(dev->write_display_framebuffer_rgb888_dirty(0, frame));
    ASSERT_EQ(display->write_count(), 2u);
    EXPECT_LT(display->writes[1].size(), full);

    // The other display has its own history
    EXPECT_TRUE(dev->write_display_framebuffer_rgb888_dirty(1, frame));
    EXPECT_EQ(display->writes[2].size(), full);
}

TEST_F(DeviceTest, FailedDirtyWriteResendsFullFrame) {
    auto dev = make();
    Bytes frame = solid_frame({10, 20, 30});
    dev->write_display_framebuffer_rgb888_dirty(0, frame);
    size_t full = display->writes[0].size();

    frame[3] = 0x99;
    display->fail_writes = true;
    EXPECT_THROW(dev->write_display_framebuffer_rgb888_dirty(0, frame), TransportError);
    display->fail_writes = false;

    EXPECT_TRUE(dev->write_display_framebuffer_rgb888_dirty(0, frame));
    ASSERT_EQ(display->write_count(), 2u);
    EXPECT_EQ(display->writes[1].size(), full);
}

TEST_F(DeviceTest, FailedClearResendsFullFrame) {
    auto dev = make();
    Bytes frame = solid_frame({10, 20, 30});
    dev->write_display_framebuffer_rgb888_dirty(0, frame);
    size_t full = display->writes[0].size();

    display->fail_writes = true;
    EXPECT_THROW(dev->clear_display(0, {255, 255, 255}), TransportError);
    display->fail_writes = false;

    EXPECT_TRUE(dev->write_display_framebuffer_rgb888_dirty(0, frame));
    ASSERT_EQ(display->write_count(), 2u);
    EXPECT_EQ(display->writes[1].size(), full);
}

TEST_F(DeviceTest, FailedFullFrameWriteResendsFullFrame) {
    auto dev = make();
    Bytes frame = solid_frame({10, 20, 30});
    dev->write_display_framebuffer_rgb888_dirty(1, frame);
    size_t full = display->writes[0].size();

    display->fail_writes = true;
    EXPECT_THROW(dev->write_display_framebuffer_rgb888(1, solid_frame({0, 0, 0})),
                 TransportError);
    display->fail_writes = false;

    EXPECT_TRUE(dev->write_display_framebuffer_rgb888_dirty(1, frame));
    ASSERT_EQ(display->write_count(), 2u);
    EXPECT_EQ(display->writes[1].size(), full);
}

TEST_F(DeviceTest, FailedRgb888RegionResendsFullFrame) {
    auto dev = make();
    Bytes frame = solid_frame({10, 20, 30});
    dev->write_display_framebuffer_rgb888_dirty(0, frame);
    size_t full = display->writes[0].size();

    display->fail_writes = true;
    EXPECT_THROW(dev->write_display_region_rgb888(0, 4, 4, 1, 1, Bytes{1, 2, 3}),
                 TransportError);
    display->fail_writes = false;

    EXPECT_TRUE(dev->write_display_framebuffer_rgb888_dirty(0, frame));
    ASSERT_EQ(display->write_count(), 2u);
    EXPECT_EQ(display->writes[1].size(), full);
}

TEST_F(DeviceTest, ClearDisplayUpdatesRetainedFrame) {
    auto dev = make();
    dev->clear_display(0, {255, 0, 0});
    ASSERT_EQ(display->write_count(), 1u);
    EXPECT_EQ(display->writes[0][16], DISPLAY_CMD_REPEAT);

    EXPECT_FALSE(dev->write_display_framebuffer_rgb888_dirty(0, solid_frame({255, 0, 0})));
    EXPECT_EQ(display->write_count(), 1u);
}

TEST_F(DeviceTest, FullFrameWriteUpdatesRetainedFrame) {
    auto dev = make();
    Bytes frame = solid_frame({1, 2, 3});
    dev->write_display_framebuffer_rgb888(1, frame);
    EXPECT_FALSE(dev->write_display_framebuffer_rgb888_dirty(1, frame));
}

TEST_F(DeviceTest, RawRegionForgetsRetainedFrame) {
    auto dev = make();
    Bytes frame = solid_frame({0, 0, 0});
    dev->write_display_framebuffer_rgb888_dirty(0, frame);
    dev->write_display_region(0, 0, 0, 2, 1, Bytes(4, 0));

    EXPECT_TRUE(dev->write_display_framebuffer_rgb888_dirty(0, frame));
    EXPECT_EQ(display->writes[2].size(), display->writes[0].size());
}

TEST_F(DeviceTest, Rgb888RegionPatchesRetainedFrame) {
    auto dev = make();
    Bytes frame = solid_frame({0, 0, 0});
    dev->write_display_framebuffer_rgb888_dirty(0, frame);

    // Display-space (0, 271) is caller-space (0, 0).
    dev->write_display_region_rgb888(0, 0, 271, 1, 1, Bytes{5, 6, 7});
    frame[0] = 5;
    frame[1] = 6;
    frame[2] = 7;
    EXPECT_FALSE(dev->write_display_framebuffer_rgb888_dirty(0, frame));
}

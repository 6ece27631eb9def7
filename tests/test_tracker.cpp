#include <gtest/gtest.h>

#include "tracker.h"

static InputState with_play(bool down) {
    InputState s;
    s.buttons.play = down;
    return s;
}

static size_t count_type(const std::vector<InputEvent>& events, InputEventType t) {
    size_t n = 0;
    for (const InputEvent& e : events)
        if (e.type == t) ++n;
    return n;
}

TEST(InputTrackerTest, PlayPressThenRelease) {
    InputTracker tracker;

    InputState idle = with_play(false);
    idle.knobs.knobs[0] = 500;   // constant resting value
    InputState pressed = idle;
    pressed.buttons.play = true;

    std::vector<InputEvent> all;
    for (const InputState& s : {idle, pressed, idle}) {
        auto ev = tracker.update(s);
        all.insert(all.end(), ev.begin(), ev.end());
    }

    std::vector<InputEvent> expected = {
        InputEvent::button(InputEventType::ButtonPressed, InputElement::Play),
        InputEvent::button(InputEventType::ButtonReleased, InputElement::Play),
    };
    EXPECT_EQ(all, expected);
}

TEST(InputTrackerTest, FirstUpdateSuppressesValueEvents) {
    InputTracker tracker;

    InputState s;
    for (auto& k : s.knobs.knobs) k = 700;
    s.knobs.main_encoder = 9;
    s.audio.mic_gain = 1000;
    s.audio.master_volume = 42;

    auto ev = tracker.update(s);
    EXPECT_EQ(count_type(ev, InputEventType::KnobChanged), 0u);
    EXPECT_EQ(count_type(ev, InputEventType::AudioChanged), 0u);
    EXPECT_FALSE(tracker.is_first_update());
}

TEST(InputTrackerTest, FirstUpdateStillReportsButtonsAlreadyDown) {
    InputTracker tracker;

    InputState s;
    s.buttons.shift = true;
    s.knobs.knobs[2] = 300;

    auto ev = tracker.update(s);
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0], InputEvent::button(InputEventType::ButtonPressed, InputElement::Shift));
}

TEST(InputTrackerTest, KnobAndAudioDeltas) {
    InputTracker tracker;

    InputState a;
    a.knobs.knobs[0] = 100;
    a.audio.headphone_volume = 2000;
    tracker.update(a);

    InputState b = a;
    b.knobs.knobs[0] = 150;
    b.audio.headphone_volume = 1990;

    auto ev = tracker.update(b);
    ASSERT_EQ(ev.size(), 2u);
    EXPECT_EQ(ev[0], InputEvent::changed(InputEventType::KnobChanged, InputElement::Knob1, 150, 50));
    EXPECT_EQ(ev[1], InputEvent::changed(InputEventType::AudioChanged,
                                         InputElement::HeadphoneVolume, 1990, -10));

    // Unchanged values emit nothing
    EXPECT_TRUE(tracker.update(b).empty());
}

TEST(InputTrackerTest, MainEncoderWrapIsPlainDelta) {
    InputTracker tracker;
    InputState a;
    a.knobs.main_encoder = 15;
    tracker.update(a);

    InputState b;
    b.knobs.main_encoder = 0;
    auto ev = tracker.update(b);
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0].element, InputElement::MainEncoder);
    EXPECT_EQ(ev[0].value, 0);
    EXPECT_EQ(ev[0].delta, -15);
}

TEST(InputTrackerTest, ButtonsBeforeValuesInElementOrder) {
    InputTracker tracker;
    tracker.update(InputState{});

    InputState s;
    s.buttons.shift = true;          // last element
    s.buttons.group_b = true;
    s.buttons.play = true;           // first element
    s.audio.mic_gain = 5;
    s.knobs.knobs[7] = 3;
    s.knobs.knobs[1] = 4;

    auto ev = tracker.update(s);
    ASSERT_EQ(ev.size(), 6u);
    EXPECT_EQ(ev[0].element, InputElement::Play);
    EXPECT_EQ(ev[1].element, InputElement::GroupB);
    EXPECT_EQ(ev[2].element, InputElement::Shift);
    EXPECT_EQ(ev[3].element, InputElement::Knob2);
    EXPECT_EQ(ev[4].element, InputElement::Knob8);
    EXPECT_EQ(ev[5].element, InputElement::MicGain);
    EXPECT_EQ(ev[5].type, InputEventType::AudioChanged);
}

TEST(InputTrackerTest, HeldRepeatsPastThreshold) {
    InputTracker tracker(3);
    InputState down = with_play(true);

    auto e1 = tracker.update(down);      // frame 1: pressed
    ASSERT_EQ(e1.size(), 1u);
    EXPECT_EQ(e1[0].type, InputEventType::ButtonPressed);

    EXPECT_TRUE(tracker.update(down).empty());   // frame 2
    EXPECT_TRUE(tracker.update(down).empty());   // frame 3

    for (int i = 0; i < 3; ++i) {                // frames 4..6
        auto ev = tracker.update(down);
        ASSERT_EQ(ev.size(), 1u);
        EXPECT_EQ(ev[0], InputEvent::button(InputEventType::ButtonHeld, InputElement::Play));
    }

    auto up = tracker.update(with_play(false));
    ASSERT_EQ(up.size(), 1u);
    EXPECT_EQ(up[0].type, InputEventType::ButtonReleased);

    // A fresh press starts counting again
    tracker.update(down);
    EXPECT_TRUE(tracker.update(down).empty());
}

TEST(InputTrackerTest, DefaultThresholdIsThirty) {
    InputTracker tracker;
    EXPECT_EQ(tracker.hold_threshold(), 30u);

    InputState down = with_play(true);
    tracker.update(down);
    for (int i = 0; i < 29; ++i)
        EXPECT_TRUE(tracker.update(down).empty()) << "update " << i;
    EXPECT_EQ(count_type(tracker.update(down), InputEventType::ButtonHeld), 1u);
}

TEST(InputTrackerTest, PresenceFlagsAreNotButtons) {
    InputTracker tracker;
    tracker.update(InputState{});

    InputState s;
    s.buttons.pedal_connected = true;
    s.buttons.microphone_connected = true;
    s.knobs.knob_touched[0] = true;
    s.touch_strip.finger_1.data_a = 10;
    EXPECT_TRUE(tracker.update(s).empty());
}

TEST(InputTrackerTest, ResetRestoresFirstUpdate) {
    InputTracker tracker;
    InputState s;
    s.knobs.knobs[0] = 10;
    tracker.update(s);
    tracker.update(s);
    EXPECT_EQ(tracker.frame_count(), 2u);

    tracker.reset();
    EXPECT_TRUE(tracker.is_first_update());
    EXPECT_EQ(tracker.frame_count(), 0u);
    EXPECT_FALSE(tracker.previous_state().has_value());

    s.knobs.knobs[0] = 900;
    EXPECT_TRUE(tracker.update(s).empty());
}

TEST(InputTrackerTest, PadHitsPassThrough) {
    InputTracker tracker;
    PadState pads;
    pads.hits = {{5, 0x40, 0x7F}, {0, 0x11, 0x22}};

    auto ev = tracker.update_pads(pads);
    ASSERT_EQ(ev.size(), 2u);
    EXPECT_EQ(ev[0], InputEvent::pad_hit({5, 0x40, 0x7F}));
    EXPECT_EQ(ev[0].velocity, 0x40);
    EXPECT_EQ(ev[0].pressure, 0x7F);
    EXPECT_EQ(ev[1].pad_number, 0);

    // Same packet twice gives the same events; pads carry no history
    EXPECT_EQ(tracker.update_pads(pads), ev);
}

TEST(InputTrackerTest, RichPadEvents) {
    InputTracker tracker;
    tracker.set_rich_pad_events(true);

    PadState pads;
    pads.hits = {{2, 0x12, 0x34}, {2, 0x05, 0x00}, {2, 0x30, 0x00}};

    auto ev = tracker.update_pads(pads);
    ASSERT_EQ(ev.size(), 2u);
    EXPECT_EQ(ev[0].type, InputEventType::PadEvent);
    EXPECT_EQ(ev[0].pad_event, PadEventType::Hit);
    EXPECT_EQ(ev[0].value, 0x234);
    EXPECT_EQ(ev[1].pad_event, PadEventType::HitRelease);
}

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "input.h"
#include "protocol.h"

// Number of updates a button must stay down before Held events start.
// About half a second at 60 polls per second.
static constexpr uint32_t DEFAULT_HOLD_THRESHOLD = 30;

enum class InputEventType : uint8_t {
    ButtonPressed  = 0,
    ButtonReleased = 1,
    ButtonHeld     = 2,
    KnobChanged    = 3,
    AudioChanged   = 4,
    PadHit         = 5,
    PadEvent       = 6,
};

// One discrete input event. Which fields are meaningful depends on type:
//
//   ButtonPressed/Released/Held   element
//   KnobChanged/AudioChanged      element, value (new), delta (new - old)
//   PadHit                        pad_number, velocity, pressure
//   PadEvent                      pad_number, pad_event, value
struct InputEvent {
    InputEventType type       = InputEventType::ButtonPressed;
    InputElement   element    = InputElement::Play;
    uint16_t       value      = 0;
    int32_t        delta      = 0;
    uint8_t        pad_number = 0;
    uint8_t        velocity   = 0;
    uint8_t        pressure   = 0;
    PadEventType   pad_event  = PadEventType::Hit;

    static InputEvent button(InputEventType t, InputElement e);
    static InputEvent changed(InputEventType t, InputElement e, uint16_t value, int32_t delta);
    static InputEvent pad_hit(const PadHit& hit);
    static InputEvent pad(const ::PadEvent& ev);

    bool operator==(const InputEvent& o) const;
    bool operator!=(const InputEvent& o) const { return !(*this == o); }
};

const char* input_event_type_name(InputEventType t);

// Turns successive decoded states into events.
//
// Buttons go Released -> Pressed (ButtonPressed) -> Released (ButtonReleased);
// while a button stays down for hold_threshold updates or more, every
// further update emits ButtonHeld again. Knob and audio values emit one
// Changed event per update in which they differ.
//
// The first update after construction or reset() compares buttons against
// an all-released state but emits no Changed events, since the hardware
// reports arbitrary resting positions at power-on.
//
// Not thread-safe; the owner serialises access.
class InputTracker {
public:
    explicit InputTracker(uint32_t hold_threshold = DEFAULT_HOLD_THRESHOLD);

    // Button events first, then knob/audio events, each in InputElement order.
    std::vector<InputEvent> update(const InputState& state);

    // One PadHit per hit, or in rich mode one PadEvent per classifiable hit.
    std::vector<InputEvent> update_pads(const PadState& pads) const;

    void reset();

    void set_rich_pad_events(bool rich) { _rich_pads = rich; }
    bool rich_pad_events() const { return _rich_pads; }

    uint32_t frame_count() const { return _frame_count; }
    uint32_t hold_threshold() const { return _hold_threshold; }
    bool     is_first_update() const { return _first_update; }
    const std::optional<InputState>& previous_state() const { return _previous; }

private:
    std::optional<InputState>        _previous;
    std::map<InputElement, uint32_t> _held_since;   // element -> frame it went down
    uint32_t                         _frame_count    = 0;
    uint32_t                         _hold_threshold;
    bool                             _first_update   = true;
    bool                             _rich_pads      = false;
};

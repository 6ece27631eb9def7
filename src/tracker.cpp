#include "tracker.h"

// -----------------------------------------------------------------------
// InputEvent
// -----------------------------------------------------------------------

InputEvent InputEvent::button(InputEventType t, InputElement e) {
    InputEvent ev;
    ev.type    = t;
    ev.element = e;
    return ev;
}

InputEvent InputEvent::changed(InputEventType t, InputElement e, uint16_t value, int32_t delta) {
    InputEvent ev;
    ev.type    = t;
    ev.element = e;
    ev.value   = value;
    ev.delta   = delta;
    return ev;
}

InputEvent InputEvent::pad_hit(const PadHit& hit) {
    InputEvent ev;
    ev.type       = InputEventType::PadHit;
    ev.pad_number = hit.pad_number;
    ev.velocity   = hit.data_a;
    ev.pressure   = hit.data_b;
    return ev;
}

InputEvent InputEvent::pad(const ::PadEvent& p) {
    InputEvent ev;
    ev.type       = InputEventType::PadEvent;
    ev.pad_number = p.pad_number;
    ev.pad_event  = p.type;
    ev.value      = p.value;
    return ev;
}

bool InputEvent::operator==(const InputEvent& o) const {
    if (type != o.type)
        return false;
    switch (type) {
        case InputEventType::ButtonPressed:
        case InputEventType::ButtonReleased:
        case InputEventType::ButtonHeld:
            return element == o.element;
        case InputEventType::KnobChanged:
        case InputEventType::AudioChanged:
            return element == o.element && value == o.value && delta == o.delta;
        case InputEventType::PadHit:
            return pad_number == o.pad_number && velocity == o.velocity &&
                   pressure == o.pressure;
        case InputEventType::PadEvent:
            return pad_number == o.pad_number && pad_event == o.pad_event &&
                   value == o.value;
    }
    return false;
}

const char* input_event_type_name(InputEventType t) {
    switch (t) {
        case InputEventType::ButtonPressed:  return "pressed";
        case InputEventType::ButtonReleased: return "released";
        case InputEventType::ButtonHeld:     return "held";
        case InputEventType::KnobChanged:    return "knob";
        case InputEventType::AudioChanged:   return "audio";
        case InputEventType::PadHit:         return "pad";
        case InputEventType::PadEvent:       return "pad-event";
    }
    return "?";
}

// -----------------------------------------------------------------------
// InputTracker
// -----------------------------------------------------------------------

InputTracker::InputTracker(uint32_t hold_threshold)
    : _hold_threshold(hold_threshold) {}

void InputTracker::reset() {
    _previous.reset();
    _held_since.clear();
    _frame_count  = 0;
    _first_update = true;
}

std::vector<InputEvent> InputTracker::update(const InputState& state) {
    ++_frame_count;

    const InputState prev = _previous ? *_previous : InputState{};
    std::vector<InputEvent> events;

    // ---- buttons ----
    for (InputElement e : all_elements()) {
        if (element_kind(e) != ElementKind::Button)
            continue;

        bool was = is_pressed(prev.buttons, e);
        bool now = is_pressed(state.buttons, e);

        if (now && !was) {
            events.push_back(InputEvent::button(InputEventType::ButtonPressed, e));
            _held_since[e] = _frame_count;
        } else if (!now && was) {
            events.push_back(InputEvent::button(InputEventType::ButtonReleased, e));
            _held_since.erase(e);
        } else if (now && was) {
            auto it = _held_since.find(e);
            if (it == _held_since.end()) {
                _held_since[e] = _frame_count;
            } else if (_frame_count - it->second >= _hold_threshold) {
                // Repeats on every update past the threshold.
                events.push_back(InputEvent::button(InputEventType::ButtonHeld, e));
            }
        }
    }

    // ---- knobs and audio ----
    if (!_first_update) {
        for (InputElement e : all_elements()) {
            ElementKind kind = element_kind(e);
            if (kind == ElementKind::Button)
                continue;

            uint16_t old_v = element_value(prev, e);
            uint16_t new_v = element_value(state, e);
            if (old_v == new_v)
                continue;

            InputEventType t = (kind == ElementKind::Knob) ? InputEventType::KnobChanged
                                                           : InputEventType::AudioChanged;
            events.push_back(InputEvent::changed(t, e, new_v,
                                                 int32_t(new_v) - int32_t(old_v)));
        }
    }

    _previous     = state;
    _first_update = false;
    return events;
}

std::vector<InputEvent> InputTracker::update_pads(const PadState& pads) const {
    std::vector<InputEvent> events;
    events.reserve(pads.hits.size());

    for (const PadHit& hit : pads.hits) {
        if (!_rich_pads) {
            events.push_back(InputEvent::pad_hit(hit));
            continue;
        }
        PadEvent pe;
        if (decode_pad_event(hit, pe))
            events.push_back(InputEvent::pad(pe));
    }
    return events;
}

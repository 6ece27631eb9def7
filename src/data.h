#pragma once

#include <cstdint>
#include <string>

#include "color.h"
#include "input.h"
#include "protocol.h"

// Lower-case snake_case name of an element, e.g. "group_a", "knob_3",
// "encoder_push". Used by the CLI, the config file and event logs.
const char* element_name(InputElement e);

// Case-insensitive reverse of element_name(). Also accepts a few short
// aliases ("rec" / "record", "browser" / "browser_plugin").
// Returns false if the name is not recognized.
bool parse_element_name(const std::string& name, InputElement& out);

// Print all element names with their LED capability to stdout
// (for --list-elements)
void list_elements();

// LED slot driven by an element. Returns false for elements without an LED
// (knobs, audio, touch-only controls, encoder push).
//
//   plugin   -> PluginInstance    encoder_up/left/right/down -> Nav*
//   sampling -> Sampler           everything else -> same-named slot
//   macro    -> MacroSet
bool element_button_led(InputElement e, ButtonLed& out);

// Parse "#rrggbb", "rrggbb" or a colour name (red, orange, yellow, green,
// cyan, blue, purple, magenta, pink, white, black/off).
// Returns false if the string is not recognized.
bool parse_color(const std::string& s, RgbColor& out);

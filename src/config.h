#pragma once

#include <array>
#include <cstdint>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "color.h"
#include "input.h"
#include "protocol.h"
#include "tracker.h"

// Unreadable config file, syntax error or out-of-range value.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

static constexpr unsigned int DEFAULT_POLL_TIMEOUT_MS = 100;
static constexpr unsigned int FAST_POLL_TIMEOUT_MS    = 1;

// One startup LED assignment from the [leds] section: either a colour
// (#rrggbb or name) or a 0-127 brightness.
struct LedSetting {
    InputElement element    = InputElement::Play;
    bool         has_color  = false;
    RgbColor     color;
    uint8_t      brightness = 0;
};

// Parsed representation of an INI configuration file.
struct Config {
    // [device] section
    struct DeviceConfig {
        uint16_t     vid             = MK3_VID;
        uint16_t     pid             = MK3_PID;
        unsigned int poll_timeout_ms = DEFAULT_POLL_TIMEOUT_MS;
    } device;

    // [input] section
    struct InputConfig {
        uint32_t hold_threshold  = DEFAULT_HOLD_THRESHOLD;
        bool     rich_pad_events = false;   // pad_events = rich
    } input;

    // [leds] section
    struct LedConfig {
        bool                    auto_flush = false;
        std::vector<LedSetting> settings;   // in file order
    } leds;

    // [pads] section: pad1..pad16, unset pads stay off
    std::array<std::optional<RgbColor>, PAD_COUNT> pads;

    // [log] section
    bool verbose = false;
};

// Parse an INI config file from disk.
// Throws ConfigError if the file cannot be read or a value is malformed.
Config parse_config_file(const std::string& path);

// Same grammar, from any stream. source names the input in error messages.
Config parse_config_stream(std::istream& in, const std::string& source = "<config>");

// Throws ConfigError if any value is out of range.
void validate_config(const Config& cfg);

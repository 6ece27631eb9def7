#include "config.h"
#include "data.h"

#include <cctype>
#include <fstream>
#include <regex>
#include <string>

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static bool parse_uint(const std::string& s, unsigned long& out, int base = 10) {
    if (s.empty() || s[0] == '-' || s[0] == '+') return false;
    try {
        size_t used = 0;
        out = std::stoul(s, &used, base);
        return used == s.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

static bool parse_bool(const std::string& s, bool& out) {
    std::string sl = to_lower(s);
    if (sl == "1" || sl == "true" || sl == "yes" || sl == "on")  { out = true;  return true; }
    if (sl == "0" || sl == "false" || sl == "no" || sl == "off") { out = false; return true; }
    return false;
}

// "17cc", "0x17cc"
static bool parse_hex16(const std::string& s, uint16_t& out) {
    std::string hex = to_lower(s);
    if (hex.rfind("0x", 0) == 0) hex = hex.substr(2);
    unsigned long v = 0;
    if (!parse_uint(hex, v, 16) || v > 0xFFFF) return false;
    out = static_cast<uint16_t>(v);
    return true;
}

static ConfigError bad_value(const std::string& source, int lineno,
                             const std::string& what, const std::string& value) {
    return ConfigError(source + ":" + std::to_string(lineno) + ": invalid " + what +
                       " '" + value + "'");
}

// -----------------------------------------------------------------------
// INI parser
// -----------------------------------------------------------------------

Config parse_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw ConfigError("Cannot open config file: " + path);
    return parse_config_stream(f, path);
}

Config parse_config_stream(std::istream& in, const std::string& source) {
    Config cfg;
    std::string section;
    int lineno = 0;

    std::regex re_section(R"(^\[([^\]]+)\]$)");
    std::regex re_kv(R"(^([^=]+)=(.*)$)");
    std::regex re_pad(R"(^pad([0-9]{1,2})$)");

    std::string line;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);

        // Skip blank lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';')
            continue;

        std::smatch m;

        if (std::regex_match(line, m, re_section)) {
            section = to_lower(trim(m[1].str()));
            continue;
        }

        if (!std::regex_match(line, m, re_kv))
            throw ConfigError(source + ":" + std::to_string(lineno) +
                              ": expected 'key = value' or '[section]'");

        std::string key   = to_lower(trim(m[1].str()));
        std::string value = trim(m[2].str());

        if (section == "device") {
            if (key == "vid") {
                if (!parse_hex16(value, cfg.device.vid))
                    throw bad_value(source, lineno, "vid", value);
            } else if (key == "pid") {
                if (!parse_hex16(value, cfg.device.pid))
                    throw bad_value(source, lineno, "pid", value);
            } else if (key == "poll_timeout_ms") {
                unsigned long v = 0;
                if (!parse_uint(value, v) || v > 0xFFFFFFFFul)
                    throw bad_value(source, lineno, "poll_timeout_ms", value);
                cfg.device.poll_timeout_ms = static_cast<unsigned int>(v);
            }

        } else if (section == "input") {
            if (key == "hold_threshold") {
                unsigned long v = 0;
                if (!parse_uint(value, v) || v > 0xFFFFFFFFul)
                    throw bad_value(source, lineno, "hold_threshold", value);
                cfg.input.hold_threshold = static_cast<uint32_t>(v);
            } else if (key == "pad_events") {
                std::string v = to_lower(value);
                if (v == "hits")      cfg.input.rich_pad_events = false;
                else if (v == "rich") cfg.input.rich_pad_events = true;
                else throw bad_value(source, lineno, "pad_events (hits|rich)", value);
            }

        } else if (section == "leds") {
            if (key == "auto_flush") {
                if (!parse_bool(value, cfg.leds.auto_flush))
                    throw bad_value(source, lineno, "auto_flush", value);
                continue;
            }

            LedSetting s;
            if (!parse_element_name(key, s.element))
                throw ConfigError(source + ":" + std::to_string(lineno) +
                                  ": unknown element '" + key + "'");

            // Up to three digits is a brightness, anything else a colour.
            unsigned long b = 0;
            if (value.size() <= 3 && parse_uint(value, b)) {
                if (b > 127)
                    throw bad_value(source, lineno, "brightness (0-127)", value);
                s.brightness = static_cast<uint8_t>(b);
            } else if (parse_color(value, s.color)) {
                s.has_color = true;
            } else {
                throw bad_value(source, lineno, "LED value", value);
            }
            cfg.leds.settings.push_back(s);

        } else if (section == "pads") {
            std::smatch pm;
            if (!std::regex_match(key, pm, re_pad))
                continue;
            int n = std::stoi(pm[1].str());
            if (n < 1 || n > PAD_COUNT)
                throw ConfigError(source + ":" + std::to_string(lineno) +
                                  ": pad number must be 1-16, got " + pm[1].str());
            RgbColor c;
            if (!parse_color(value, c))
                throw bad_value(source, lineno, "colour", value);
            cfg.pads[n - 1] = c;

        } else if (section == "log") {
            if (key == "verbose" && !parse_bool(value, cfg.verbose))
                throw bad_value(source, lineno, "verbose", value);
        }
        // Unknown sections and keys are ignored
    }

    return cfg;
}

// -----------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------

void validate_config(const Config& cfg) {
    if (cfg.device.vid == 0 || cfg.device.pid == 0)
        throw ConfigError("vid and pid must be non-zero");

    unsigned int t = cfg.device.poll_timeout_ms;
    if (t < 1 || t > 1000)
        throw ConfigError("poll_timeout_ms must be 1-1000 (got " + std::to_string(t) + ")");

    if (cfg.input.hold_threshold < 1)
        throw ConfigError("hold_threshold must be at least 1");

    for (const LedSetting& s : cfg.leds.settings) {
        ButtonLed led;
        if (!element_button_led(s.element, led))
            throw ConfigError(std::string("element '") + element_name(s.element) +
                              "' has no LED");
        if (s.has_color && !button_led_has_color(led))
            throw ConfigError(std::string("element '") + element_name(s.element) +
                              "' has a single-colour LED; use a brightness 0-127");
        if (!s.has_color && s.brightness > 127)
            throw ConfigError(std::string("brightness for '") + element_name(s.element) +
                              "' must be 0-127");
    }
}

#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config.h"
#include "data.h"
#include "device.h"
#include "protocol.h"
#include "usb.h"

static volatile std::sig_atomic_t g_stop = 0;
static void handle_sigint(int) { g_stop = 1; }

// -----------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------
static constexpr const char* VERSION = "1.0.0";

// -----------------------------------------------------------------------
// Help text
// -----------------------------------------------------------------------
static void print_help(const char* prog) {
    std::cout <<
R"(Usage: )" << prog << R"( [OPTIONS]

Native Instruments Maschine MK3 control tool for Linux.

Options:
  -h, --help               Show this help and exit
  -V, --version            Show version and exit
  -v, --verbose            Hexdump every packet sent to the device

  --probe                  Show USB interfaces and endpoints for the device

  --listen                 Print raw HID reports and the events decoded
                           from them. Ctrl+C to stop.
  --monitor                Print decoded events from the background
                           monitor thread. Ctrl+C to stop.

  -c, --config FILE        Load settings and startup LEDs from an INI file

  --led NAME=VALUE         Set a button LED. VALUE is 0-127 or a colour
                           (#rrggbb or a name) for RGB buttons.
                           e.g. --led play=127 --led group_a=#ff0000
  --pad N=COLOR            Set pad N (1-16, or "all") to a colour
  --clear-leds             Turn every LED off
  --list-elements          Print all element names and exit

  --fill-display ID=COLOR  Fill display 0 (left) or 1 (right) with a colour

  --raw-send HEX           Send a raw HID report, e.g. --raw-send "80 00 7f"

Examples:
  mk3-ctl --probe
  mk3-ctl --listen
  mk3-ctl --config examples/example.ini --monitor
  mk3-ctl --led play=127 --led group_a=red --pad all=blue
  mk3-ctl --fill-display 0=#202040 --fill-display 1=black

Note: Run as root or install the udev rule for non-root access:
  sudo cp udev/99-maschine-mk3.rules /etc/udev/rules.d/
  sudo udevadm control --reload-rules && sudo udevadm trigger
)";
}

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static bool split_assignment(const std::string& arg, std::string& key, std::string& value) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size())
        return false;
    key   = arg.substr(0, eq);
    value = arg.substr(eq + 1);
    return true;
}

static bool parse_hex_bytes(const std::string& s, Bytes& out) {
    std::istringstream in(s);
    std::string tok;
    out.clear();
    while (in >> tok) {
        if (tok.rfind("0x", 0) == 0 || tok.rfind("0X", 0) == 0)
            tok = tok.substr(2);
        if (tok.empty() || tok.size() > 2) return false;
        for (char c : tok)
            if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        out.push_back(static_cast<uint8_t>(std::stoul(tok, nullptr, 16)));
    }
    return !out.empty();
}

static std::string format_event(const InputEvent& ev) {
    std::ostringstream s;
    s << std::left << std::setw(10) << input_event_type_name(ev.type) << std::right;
    switch (ev.type) {
        case InputEventType::ButtonPressed:
        case InputEventType::ButtonReleased:
        case InputEventType::ButtonHeld:
            s << element_name(ev.element);
            break;
        case InputEventType::KnobChanged:
        case InputEventType::AudioChanged:
            s << element_name(ev.element) << " = " << ev.value
              << " (" << (ev.delta > 0 ? "+" : "") << ev.delta << ")";
            break;
        case InputEventType::PadHit:
            s << "pad " << static_cast<int>(ev.pad_number) + 1
              << "  velocity " << static_cast<int>(ev.velocity)
              << "  pressure " << static_cast<int>(ev.pressure);
            break;
        case InputEventType::PadEvent:
            s << "pad " << static_cast<int>(ev.pad_number) + 1 << "  "
              << pad_event_type_name(ev.pad_event) << "  value " << ev.value;
            break;
    }
    return s.str();
}

// -----------------------------------------------------------------------
// Inline LED arguments
// -----------------------------------------------------------------------

struct LedArg { InputElement element; bool has_color; RgbColor color; uint8_t brightness; };
struct PadArg { int pad; RgbColor color; };   // pad -1 = all

static bool parse_led_arg(const std::string& arg, LedArg& out) {
    std::string name, value;
    if (!split_assignment(arg, name, value)) {
        std::cerr << "Error: --led expects NAME=VALUE (e.g. --led play=127)\n";
        return false;
    }
    if (!parse_element_name(name, out.element)) {
        std::cerr << "Error: unknown element '" << name << "' (see --list-elements)\n";
        return false;
    }

    out.has_color  = false;
    out.brightness = 0;
    try {
        size_t used = 0;
        unsigned long b = std::stoul(value, &used, 10);
        if (used == value.size() && value.size() <= 3) {
            if (b > 127) {
                std::cerr << "Error: LED brightness must be 0-127\n";
                return false;
            }
            out.brightness = static_cast<uint8_t>(b);
            return true;
        }
    } catch (const std::logic_error&) {
        // not a number, try a colour
    }

    if (!parse_color(value, out.color)) {
        std::cerr << "Error: invalid LED value '" << value << "'\n";
        return false;
    }
    out.has_color = true;
    return true;
}

static bool parse_pad_arg(const std::string& arg, PadArg& out) {
    std::string pad, value;
    if (!split_assignment(arg, pad, value)) {
        std::cerr << "Error: --pad expects N=COLOR (e.g. --pad 1=red)\n";
        return false;
    }
    if (pad == "all") {
        out.pad = -1;
    } else {
        try {
            out.pad = std::stoi(pad);
        } catch (const std::logic_error&) {
            out.pad = 0;
        }
        if (out.pad < 1 || out.pad > PAD_COUNT) {
            std::cerr << "Error: pad must be 1-16 or 'all'\n";
            return false;
        }
    }
    if (!parse_color(value, out.color)) {
        std::cerr << "Error: invalid colour '" << value << "'\n";
        return false;
    }
    return true;
}

// -----------------------------------------------------------------------
// Listen / monitor
// -----------------------------------------------------------------------

static void run_listen(UsbDevice& usb, Mk3Device& dev) {
    std::cout << "=== Listening on EP 0x83 (Ctrl+C to stop) ===\n";
    uint8_t buf[HID_REPORT_MAX_SIZE];
    while (!g_stop) {
        int got = usb.try_interrupt_read(HID_EP_IN, buf, sizeof(buf), 100);
        if (got <= 0) continue;

        Bytes packet(buf, buf + got);
        hexdump_packet(packet, "[" + std::to_string(got) + "B]");
        for (const InputEvent& ev : dev.process_input_packet(packet))
            std::cout << "  " << format_event(ev) << "\n";
    }
}

static void run_monitor(Mk3Device& dev) {
    std::cout << "=== Monitoring input (Ctrl+C to stop) ===\n";
    dev.start_input_monitoring([](const InputEvent& ev) {
        std::cout << format_event(ev) << "\n";
    });
    while (!g_stop && dev.is_monitoring())
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    dev.stop_input_monitoring();
    dev.drain_monitored_events();
}

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_help(argv[0]);
        return 0;
    }

    // ---- option definitions ----
    struct option long_opts[] = {
        {"help",          no_argument,       nullptr, 'h'},
        {"version",       no_argument,       nullptr, 'V'},
        {"verbose",       no_argument,       nullptr, 'v'},
        {"config",        required_argument, nullptr, 'c'},
        {"probe",         no_argument,       nullptr, 1001},
        {"listen",        no_argument,       nullptr, 1002},
        {"monitor",       no_argument,       nullptr, 1003},
        {"led",           required_argument, nullptr, 1004},
        {"pad",           required_argument, nullptr, 1005},
        {"clear-leds",    no_argument,       nullptr, 1006},
        {"list-elements", no_argument,       nullptr, 1007},
        {"fill-display",  required_argument, nullptr, 1008},
        {"raw-send",      required_argument, nullptr, 1009},
        {nullptr, 0, nullptr, 0}
    };

    // ---- collect requested operations ----
    bool        do_probe   = false;
    bool        do_listen  = false;
    bool        do_monitor = false;
    bool        do_clear   = false;
    bool        verbose    = false;
    std::string config_file;
    Bytes       raw_send;

    struct FillArg { uint8_t display; RgbColor color; };

    std::vector<LedArg>  led_args;
    std::vector<PadArg>  pad_args;
    std::vector<FillArg> fill_args;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVvc:", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h':
            print_help(argv[0]);
            return 0;

        case 'V':
            std::cout << "mk3-ctl " << VERSION << "\n";
            return 0;

        case 'v':
            verbose = true;
            break;

        case 'c':
            config_file = optarg;
            break;

        case 1001:
            do_probe = true;
            break;

        case 1002:
            do_listen = true;
            break;

        case 1003:
            do_monitor = true;
            break;

        case 1004: {  // --led NAME=VALUE
            LedArg a;
            if (!parse_led_arg(optarg, a)) return 1;
            led_args.push_back(a);
            break;
        }

        case 1005: {  // --pad N=COLOR
            PadArg a;
            if (!parse_pad_arg(optarg, a)) return 1;
            pad_args.push_back(a);
            break;
        }

        case 1006:
            do_clear = true;
            break;

        case 1007:  // --list-elements
            list_elements();
            return 0;

        case 1008: {  // --fill-display ID=COLOR
            std::string id, value;
            FillArg f;
            if (!split_assignment(optarg, id, value) || (id != "0" && id != "1")) {
                std::cerr << "Error: --fill-display expects ID=COLOR with ID 0 or 1\n";
                return 1;
            }
            if (!parse_color(value, f.color)) {
                std::cerr << "Error: invalid colour '" << value << "'\n";
                return 1;
            }
            f.display = static_cast<uint8_t>(id[0] - '0');
            fill_args.push_back(f);
            break;
        }

        case 1009:  // --raw-send HEX
            if (!parse_hex_bytes(optarg, raw_send)) {
                std::cerr << "Error: --raw-send expects space-separated hex bytes\n";
                return 1;
            }
            break;

        default:
            std::cerr << "Use --help for usage.\n";
            return 1;
        }
    }

    // ---- validate that there's something to do ----
    bool has_work = do_probe || do_listen || do_monitor || do_clear ||
                    !config_file.empty() || !led_args.empty() || !pad_args.empty() ||
                    !fill_args.empty() || !raw_send.empty();
    if (!has_work) {
        print_help(argv[0]);
        return 0;
    }

    // ---- config ----
    Config cfg;
    if (!config_file.empty()) {
        try {
            cfg = parse_config_file(config_file);
            validate_config(cfg);
        } catch (const ConfigError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }
    if (verbose) cfg.verbose = true;

    std::signal(SIGINT, handle_sigint);

    // ---- open controller ----
    auto usb = std::make_shared<UsbDevice>();
    std::unique_ptr<Mk3Device> dev;
    try {
        std::cout << "Opening Maschine MK3 (" << std::hex << std::setfill('0')
                  << std::setw(4) << cfg.device.vid << ":" << std::setw(4) << cfg.device.pid
                  << std::dec << ")...\n";
        usb->open(cfg.device.vid, cfg.device.pid);

        std::unique_ptr<Transport> display;
        if (usb->display_claimed())
            display = std::make_unique<UsbBulkTransport>(usb);
        dev = std::make_unique<Mk3Device>(std::make_unique<UsbInterruptTransport>(usb),
                                          std::move(display), cfg);
        std::cout << "Connected" << (dev->has_display() ? "." : " (no displays).") << "\n\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    int exit_code = 0;

    try {
        if (do_probe) {
            std::cout << "=== USB endpoint probe ===\n";
            usb->probe();
        }

        if (!config_file.empty()) {
            std::cout << "=== Applying LEDs from " << config_file << " ===\n";
            dev->apply_led_config(cfg);
        }

        if (do_clear) {
            std::cout << "Clearing LEDs\n";
            dev->clear_all_leds();
        }

        for (const LedArg& a : led_args) {
            if (a.has_color)
                dev->set_button_led_color(a.element, a.color);
            else
                dev->set_button_led(a.element, a.brightness);
        }
        for (const PadArg& a : pad_args) {
            if (a.pad < 0)
                dev->set_all_pad_leds(a.color);
            else
                dev->set_pad_led(static_cast<uint8_t>(a.pad - 1), a.color);
        }
        if (!led_args.empty() || !pad_args.empty()) {
            std::cout << "Updating LEDs\n";
            dev->flush_leds();
        }

        for (const FillArg& f : fill_args) {
            std::cout << "Filling display " << static_cast<int>(f.display) << "\n";
            dev->clear_display(f.display, f.color);
        }

        if (!raw_send.empty()) {
            hexdump_packet(raw_send, "-> raw");
            usb->interrupt_write(HID_EP_OUT, raw_send);
        }

        if (do_listen)
            run_listen(*usb, *dev);
        else if (do_monitor)
            run_monitor(*dev);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = 1;
    }

    dev.reset();
    usb->close();
    return exit_code;
}

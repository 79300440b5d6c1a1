#include "config.hpp"
#include "input_simulator.hpp"
#include "platform/platform.hpp"

#include <csignal>
#include <iostream>
#include <iterator>
#include <print>
#include <string>

static void usage(const char* prog) {
    std::println("Usage: {} [options] [TEXT...]", prog);
    std::println("Inserts TEXT (or all of stdin) into the focused application.");
    std::println("Options:");
    std::println("  -c, --config PATH   Config file path");
    std::println("  -m, --method NAME   keystroke|clipboard|streaming-process|external-process");
    std::println("  -q, --quiet         Suppress status lines");
    std::println("  -h, --help          Show this help");
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string method_override;
    bool quiet = false;
    std::string text;
    bool have_text = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--method" || arg == "-m") {
            if (i + 1 < argc) method_override = argv[++i];
        } else if (arg == "--quiet" || arg == "-q") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            if (have_text) text += ' ';
            text += arg;
            have_text = true;
        }
    }

    auto config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!config) {
        std::println(stderr, "{}", config.error());
        return 1;
    }

    if (!method_override.empty()) {
        auto method = parse_input_method(method_override);
        if (!method) {
            std::println(stderr, "Unknown input method: {}", method_override);
            return 1;
        }
        config->input.method = *method;
    }

    if (!have_text) {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    if (text.empty()) return 0;

    // A dead helper must surface as a write error rather than kill us.
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif

    auto platform = platform::make_platform();

    StatusCallback status;
    if (!quiet) {
        status = [](const std::string& line) {
            std::println(stderr, "[focus-insert] {}", line);
        };
    }

    InputSimulator simulator(config->input, *platform, status);
    if (auto res = simulator.init(); !res) {
        std::println(stderr, "Failed to initialize {} input: {}",
                     input_method_name(config->input.method), res.error());
        return 1;
    }

    auto res = simulator.typewrite(text);
    simulator.cleanup();

    if (!res) {
        std::println(stderr, "Error inserting text: {}", res.error());
        return 1;
    }
    return 0;
}

#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::optional<InputMethod> parse_input_method(std::string_view name) {
    if (name == "keystroke" || name == "pynput") return InputMethod::Keystroke;
    if (name == "clipboard") return InputMethod::Clipboard;
    if (name == "streaming-process" || name == "dotool") return InputMethod::StreamingProcess;
    if (name == "external-process" || name == "ydotool") return InputMethod::ExternalProcess;
    return std::nullopt;
}

std::string_view input_method_name(InputMethod method) {
    switch (method) {
        case InputMethod::Keystroke: return "keystroke";
        case InputMethod::Clipboard: return "clipboard";
        case InputMethod::StreamingProcess: return "streaming-process";
        case InputMethod::ExternalProcess: return "external-process";
    }
    return "unknown";
}

namespace {

// A null value keeps the default, like an absent key.
std::expected<void, std::string> read_delay(const json& section, const char* key, double& out) {
    if (!section.contains(key) || section[key].is_null()) return {};

    const auto& v = section[key];
    if (!v.is_number()) {
        return std::unexpected(std::format("config: {} must be a number of seconds", key));
    }
    double d = v.get<double>();
    if (!std::isfinite(d) || d < 0.0) {
        return std::unexpected(std::format("config: {} must be a non-negative number, got {}", key, d));
    }
    out = d;
    return {};
}

std::expected<void, std::string> read_input(const json& in, Config::Input& input) {
    if (in.contains("input_method") && !in["input_method"].is_null()) {
        if (!in["input_method"].is_string()) {
            return std::unexpected("config: input_method must be a string");
        }
        auto name = in["input_method"].get<std::string>();
        auto method = parse_input_method(name);
        if (!method) {
            return std::unexpected(std::format("config: unknown input_method '{}'", name));
        }
        input.method = *method;
    }

    if (auto r = read_delay(in, "writing_key_press_delay", input.key_press_delay); !r) return r;
    if (auto r = read_delay(in, "clipboard_paste_delay", input.clipboard_paste_delay); !r) return r;

    if (in.contains("restore_clipboard") && !in["restore_clipboard"].is_null()) {
        if (!in["restore_clipboard"].is_boolean()) {
            return std::unexpected("config: restore_clipboard must be true or false");
        }
        input.restore_clipboard = in["restore_clipboard"].get<bool>();
    }

    if (in.contains("external_tool") && !in["external_tool"].is_null()) {
        const auto& t = in["external_tool"];
        if (!t.is_string() || t.get<std::string>().empty()) {
            return std::unexpected("config: external_tool must be a non-empty string");
        }
        input.external_tool = t.get<std::string>();
    }

    if (in.contains("helper_command") && !in["helper_command"].is_null()) {
        const auto& h = in["helper_command"];
        std::vector<std::string> argv;
        if (h.is_string()) {
            argv.push_back(h.get<std::string>());
        } else if (h.is_array() && std::all_of(h.begin(), h.end(),
                                               [](const json& e) { return e.is_string(); })) {
            argv = h.get<std::vector<std::string>>();
        } else {
            return std::unexpected("config: helper_command must be a string or an array of strings");
        }
        if (argv.empty() || argv[0].empty()) {
            return std::unexpected("config: helper_command must name a program");
        }
        input.helper_command = std::move(argv);
    }

    return {};
}

} // namespace

std::expected<Config, std::string> Config::parse(const std::string& text) {
    Config cfg;
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            return std::unexpected("config: top level must be an object");
        }

        if (j.contains("input")) {
            if (!j["input"].is_object()) {
                return std::unexpected("config: input must be an object");
            }
            if (auto r = read_input(j["input"], cfg.input); !r) {
                return std::unexpected(r.error());
            }
        }
    } catch (const json::exception& e) {
        return std::unexpected(std::format("config: parse error: {}", e.what()));
    }

    return cfg;
}

std::expected<Config, std::string> Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return Config{};
    }

    std::stringstream ss;
    ss << f.rdbuf();
    return parse(ss.str());
}

std::expected<Config, std::string> Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

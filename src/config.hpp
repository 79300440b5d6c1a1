#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class InputMethod { Keystroke, Clipboard, StreamingProcess, ExternalProcess };

// Accepts the canonical names and the legacy tool names (pynput, dotool, ydotool).
std::optional<InputMethod> parse_input_method(std::string_view name);
std::string_view input_method_name(InputMethod method);

struct Config {
    // Fully resolved after load; consumers never apply their own defaults.
    struct Input {
        InputMethod method = InputMethod::Keystroke;
        double key_press_delay = 0.005;      // seconds
        double clipboard_paste_delay = 0.03; // seconds
        bool restore_clipboard = true;
        std::string external_tool = "ydotool";
        std::vector<std::string> helper_command = {"dotool"};
    } input;

    static std::expected<Config, std::string> parse(const std::string& text);
    static std::expected<Config, std::string> load(const std::string& path);
    static std::expected<Config, std::string> load_default();
};

#include "platform/linux/command_clipboard.hpp"

#include "platform/linux/posix_process.hpp"

#include <cstdlib>
#include <format>

CommandClipboard::CommandClipboard(std::vector<std::string> read_cmd,
                                   std::vector<std::string> write_cmd)
    : read_cmd_(std::move(read_cmd)), write_cmd_(std::move(write_cmd)) {}

std::unique_ptr<CommandClipboard> CommandClipboard::detect() {
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    if (wayland && *wayland) {
        return std::make_unique<CommandClipboard>(
            std::vector<std::string>{"wl-paste", "--no-newline"},
            std::vector<std::string>{"wl-copy"});
    }
    return std::make_unique<CommandClipboard>(
        std::vector<std::string>{"xclip", "-selection", "clipboard", "-o"},
        std::vector<std::string>{"xclip", "-selection", "clipboard"});
}

std::expected<std::string, std::string> CommandClipboard::read() {
    std::string out;
    auto status = posix::run_command(read_cmd_, nullptr, &out);
    if (!status) return std::unexpected(read_cmd_.front() + ": " + status.error());
    if (*status != 0) {
        return std::unexpected(std::format("{} exited with code {}", read_cmd_.front(), *status));
    }
    return out;
}

std::expected<void, std::string> CommandClipboard::write(const std::string& text) {
    auto status = posix::run_command(write_cmd_, &text);
    if (!status) return std::unexpected(write_cmd_.front() + ": " + status.error());
    if (*status != 0) {
        return std::unexpected(std::format("{} exited with code {}", write_cmd_.front(), *status));
    }
    return {};
}

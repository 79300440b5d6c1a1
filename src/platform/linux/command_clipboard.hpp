#pragma once

#include "platform/clipboard.hpp"

#include <memory>
#include <string>
#include <vector>

// Clipboard access through wl-paste/wl-copy or xclip child processes.
class CommandClipboard : public Clipboard {
public:
    CommandClipboard(std::vector<std::string> read_cmd, std::vector<std::string> write_cmd);

    // wl-clipboard under Wayland, xclip otherwise.
    static std::unique_ptr<CommandClipboard> detect();

    std::expected<std::string, std::string> read() override;
    std::expected<void, std::string> write(const std::string& text) override;

private:
    std::vector<std::string> read_cmd_;
    std::vector<std::string> write_cmd_;
};

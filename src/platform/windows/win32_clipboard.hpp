#pragma once

#include "platform/clipboard.hpp"

class Win32Clipboard : public Clipboard {
public:
    std::expected<std::string, std::string> read() override;
    std::expected<void, std::string> write(const std::string& text) override;
};

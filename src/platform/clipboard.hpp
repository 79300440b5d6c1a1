#pragma once

#include <expected>
#include <string>

class Clipboard {
public:
    virtual ~Clipboard() = default;
    virtual std::expected<std::string, std::string> read() = 0;
    virtual std::expected<void, std::string> write(const std::string& text) = 0;
};

#pragma once

#include <expected>
#include <functional>
#include <string>

// Receives short human-readable status lines.
using StatusCallback = std::function<void(const std::string&)>;

class InputBackend {
public:
    virtual ~InputBackend() = default;
    virtual std::expected<void, std::string> typewrite(const std::string& text) = 0;
    // Releases backend resources. Safe to call more than once.
    virtual void cleanup() {}
};

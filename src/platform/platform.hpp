#pragma once

#include "output/paste_capability.hpp"
#include "platform/clipboard.hpp"
#include "platform/key_synthesizer.hpp"
#include "platform/process.hpp"

#include <expected>
#include <memory>
#include <string>

class Platform {
public:
    virtual ~Platform() = default;
    virtual std::expected<std::unique_ptr<KeySynthesizer>, std::string> key_synthesizer() = 0;
    virtual std::expected<std::unique_ptr<Clipboard>, std::string> clipboard() = 0;
    // nullptr where the OS has no message-based paste.
    virtual std::unique_ptr<PasteCapability> native_paste() = 0;
    virtual ProcessLauncher& processes() = 0;
    virtual Modifier paste_modifier() const = 0;
};

namespace platform {

std::unique_ptr<Platform> make_platform();

constexpr Modifier default_paste_modifier() {
#ifdef __APPLE__
    return Modifier::Command;
#else
    return Modifier::Control;
#endif
}

} // namespace platform

#pragma once

#include "platform/key_synthesizer.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <unordered_map>

#include <X11/Xlib.h>

// XTest fake key events. Characters missing from the keymap are typed
// through a spare keycode that is remapped on demand.
class XTestKeySynthesizer : public KeySynthesizer {
    struct Passkey { explicit Passkey() = default; };

public:
    // Time given to clients to process MappingNotify after the spare keycode
    // is remapped.
    static constexpr std::chrono::milliseconds REMAP_SETTLE{25};

    static std::expected<std::unique_ptr<XTestKeySynthesizer>, std::string> open();

    XTestKeySynthesizer(Passkey, Display* display);
    ~XTestKeySynthesizer() override;

    XTestKeySynthesizer(const XTestKeySynthesizer&) = delete;
    XTestKeySynthesizer& operator=(const XTestKeySynthesizer&) = delete;

    void press(char32_t ch) override;
    void release(char32_t ch) override;
    void press_modifier(Modifier mod) override;
    void release_modifier(Modifier mod) override;

private:
    struct Key {
        KeyCode code = 0;
        bool shift = false;
    };

    Key resolve(char32_t ch);
    KeyCode find_spare_keycode() const;
    void send(KeyCode code, bool down);

    Display* display_;
    KeyCode spare_ = 0;
    KeySym spare_sym_ = NoSymbol;
    KeyCode shift_ = 0;
    std::unordered_map<char32_t, Key> pressed_;
};

#include "output/keystroke_typer.hpp"

#include "utf8.hpp"

#include <thread>

KeystrokeTyper::KeystrokeTyper(KeySynthesizer& keys, double interval_s)
    : keys_(keys), interval_(interval_s) {}

std::expected<void, std::string> KeystrokeTyper::typewrite(const std::string& text) {
    for (char32_t ch : utf8::decode(text)) {
        keys_.press(ch);
        keys_.release(ch);
        std::this_thread::sleep_for(interval_);
    }
    return {};
}

void KeystrokeTyper::press_chord(Modifier mod, char32_t key) {
    keys_.press_modifier(mod);
    keys_.press(key);
    keys_.release(key);
    keys_.release_modifier(mod);
}

#pragma once

#include "output/backend.hpp"
#include "platform/key_synthesizer.hpp"

#include <chrono>

class KeystrokeTyper : public InputBackend {
public:
    KeystrokeTyper(KeySynthesizer& keys, double interval_s);

    // One press/release pair per code point, each followed by the interval.
    std::expected<void, std::string> typewrite(const std::string& text) override;

    // Holds mod, taps key, releases mod.
    void press_chord(Modifier mod, char32_t key);

private:
    KeySynthesizer& keys_;
    std::chrono::duration<double> interval_;
};

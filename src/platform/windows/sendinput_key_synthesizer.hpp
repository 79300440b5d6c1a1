#pragma once

#include "platform/key_synthesizer.hpp"

// SendInput with KEYEVENTF_UNICODE, so no keyboard-layout lookup is needed.
class SendInputKeySynthesizer : public KeySynthesizer {
public:
    void press(char32_t ch) override;
    void release(char32_t ch) override;
    void press_modifier(Modifier mod) override;
    void release_modifier(Modifier mod) override;
};

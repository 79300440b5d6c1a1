#pragma once

enum class Modifier { Control, Command };

class KeySynthesizer {
public:
    virtual ~KeySynthesizer() = default;
    virtual void press(char32_t ch) = 0;
    virtual void release(char32_t ch) = 0;
    virtual void press_modifier(Modifier mod) = 0;
    virtual void release_modifier(Modifier mod) = 0;
};

#include "platform/windows/sendinput_key_synthesizer.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <Windows.h>

#include <vector>

namespace {

WORD virtual_key_for(char32_t ch) {
    switch (ch) {
        case U'\n':
        case U'\r': return VK_RETURN;
        case U'\t': return VK_TAB;
        case U'\b': return VK_BACK;
        case 0x1B: return VK_ESCAPE;
        default: return 0;
    }
}

void send_virtual_key(WORD vk, bool down) {
    INPUT input{};
    input.type = INPUT_KEYBOARD;
    input.ki.wVk = vk;
    input.ki.dwFlags = down ? 0 : KEYEVENTF_KEYUP;
    SendInput(1, &input, sizeof(INPUT));
}

void send_unicode(char32_t ch, bool down) {
    if (WORD vk = virtual_key_for(ch)) {
        send_virtual_key(vk, down);
        return;
    }

    std::vector<WORD> units;
    if (ch >= 0x10000) {
        char32_t v = ch - 0x10000;
        units.push_back(static_cast<WORD>(0xD800 + (v >> 10)));
        units.push_back(static_cast<WORD>(0xDC00 + (v & 0x3FF)));
    } else {
        units.push_back(static_cast<WORD>(ch));
    }

    std::vector<INPUT> inputs(units.size());
    for (size_t i = 0; i < units.size(); i++) {
        inputs[i].type = INPUT_KEYBOARD;
        inputs[i].ki.wScan = units[i];
        inputs[i].ki.dwFlags = KEYEVENTF_UNICODE | (down ? 0 : KEYEVENTF_KEYUP);
    }
    SendInput(static_cast<UINT>(inputs.size()), inputs.data(), sizeof(INPUT));
}

WORD modifier_key(Modifier mod) {
    return mod == Modifier::Command ? VK_LWIN : VK_CONTROL;
}

} // namespace

void SendInputKeySynthesizer::press(char32_t ch) {
    send_unicode(ch, true);
}

void SendInputKeySynthesizer::release(char32_t ch) {
    send_unicode(ch, false);
}

void SendInputKeySynthesizer::press_modifier(Modifier mod) {
    send_virtual_key(modifier_key(mod), true);
}

void SendInputKeySynthesizer::release_modifier(Modifier mod) {
    send_virtual_key(modifier_key(mod), false);
}

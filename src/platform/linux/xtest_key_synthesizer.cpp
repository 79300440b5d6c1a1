#include "platform/linux/xtest_key_synthesizer.hpp"

#include <X11/XKBlib.h>
#include <X11/extensions/XTest.h>
#include <X11/keysym.h>

#include <thread>

namespace {

KeySym keysym_for(char32_t ch) {
    switch (ch) {
        case U'\n':
        case U'\r': return XK_Return;
        case U'\t': return XK_Tab;
        case U'\b': return XK_BackSpace;
        case 0x1B: return XK_Escape;
        default: break;
    }
    // Latin-1 keysyms equal their code points; everything else uses the
    // Unicode keysym range.
    if ((ch >= 0x20 && ch <= 0x7E) || (ch >= 0xA0 && ch <= 0xFF)) return ch;
    return 0x01000000 | ch;
}

KeySym modifier_keysym(Modifier mod) {
    return mod == Modifier::Command ? XK_Super_L : XK_Control_L;
}

} // namespace

std::expected<std::unique_ptr<XTestKeySynthesizer>, std::string> XTestKeySynthesizer::open() {
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        return std::unexpected("cannot open X display (is DISPLAY set?)");
    }

    int event_base, error_base, major, minor;
    if (!XTestQueryExtension(display, &event_base, &error_base, &major, &minor)) {
        XCloseDisplay(display);
        return std::unexpected("X server lacks the XTEST extension");
    }

    return std::make_unique<XTestKeySynthesizer>(Passkey{}, display);
}

XTestKeySynthesizer::XTestKeySynthesizer(Passkey, Display* display)
    : display_(display) {
    shift_ = XKeysymToKeycode(display_, XK_Shift_L);
    spare_ = find_spare_keycode();
}

XTestKeySynthesizer::~XTestKeySynthesizer() {
    if (spare_) {
        KeySym none = NoSymbol;
        XChangeKeyboardMapping(display_, spare_, 1, &none, 1);
        XSync(display_, False);
    }
    XCloseDisplay(display_);
}

KeyCode XTestKeySynthesizer::find_spare_keycode() const {
    int min_code, max_code;
    XDisplayKeycodes(display_, &min_code, &max_code);

    int per_code = 0;
    KeySym* syms = XGetKeyboardMapping(display_, static_cast<KeyCode>(min_code),
                                       max_code - min_code + 1, &per_code);
    if (!syms) return 0;

    KeyCode spare = 0;
    for (int code = max_code; code >= min_code && !spare; code--) {
        bool empty = true;
        for (int i = 0; i < per_code; i++) {
            if (syms[(code - min_code) * per_code + i] != NoSymbol) {
                empty = false;
                break;
            }
        }
        if (empty) spare = static_cast<KeyCode>(code);
    }

    XFree(syms);
    return spare;
}

XTestKeySynthesizer::Key XTestKeySynthesizer::resolve(char32_t ch) {
    KeySym sym = keysym_for(ch);

    Key key;
    key.code = XKeysymToKeycode(display_, sym);
    if (key.code) {
        key.shift = XkbKeycodeToKeysym(display_, key.code, 0, 0) != sym &&
                    XkbKeycodeToKeysym(display_, key.code, 0, 1) == sym;
        return key;
    }

    if (!spare_) return key;

    if (spare_sym_ != sym) {
        KeySym mapping[2] = {sym, sym};
        XChangeKeyboardMapping(display_, spare_, 2, mapping, 1);
        XSync(display_, False);
        spare_sym_ = sym;
        std::this_thread::sleep_for(REMAP_SETTLE);
    }
    key.code = spare_;
    return key;
}

void XTestKeySynthesizer::send(KeyCode code, bool down) {
    XTestFakeKeyEvent(display_, code, down ? True : False, CurrentTime);
    XFlush(display_);
}

void XTestKeySynthesizer::press(char32_t ch) {
    Key key = resolve(ch);
    if (!key.code) return;

    if (key.shift && shift_) send(shift_, true);
    send(key.code, true);
    pressed_[ch] = key;
}

void XTestKeySynthesizer::release(char32_t ch) {
    auto it = pressed_.find(ch);
    Key key = it != pressed_.end() ? it->second : resolve(ch);
    if (it != pressed_.end()) pressed_.erase(it);
    if (!key.code) return;

    send(key.code, false);
    if (key.shift && shift_) send(shift_, false);
}

void XTestKeySynthesizer::press_modifier(Modifier mod) {
    KeyCode code = XKeysymToKeycode(display_, modifier_keysym(mod));
    if (code) send(code, true);
}

void XTestKeySynthesizer::release_modifier(Modifier mod) {
    KeyCode code = XKeysymToKeycode(display_, modifier_keysym(mod));
    if (code) send(code, false);
}

#pragma once

#include "output/backend.hpp"
#include "output/hotkey_paste.hpp"
#include "output/keystroke_typer.hpp"
#include "output/paste_capability.hpp"
#include "platform/clipboard.hpp"
#include "platform/key_synthesizer.hpp"

#include <memory>

class ClipboardPaster : public InputBackend {
public:
    struct Options {
        double key_press_delay = 0.0;  // used only when falling back to typing
        double paste_delay = 0.0;      // wait before restoring the clipboard
        bool restore_clipboard = false;
        Modifier paste_modifier = Modifier::Control;
    };

    // native_paste may be null; the hotkey chord is then always used.
    ClipboardPaster(Options opts, Clipboard& clipboard, KeySynthesizer& keys,
                    std::unique_ptr<PasteCapability> native_paste,
                    StatusCallback status = {});

    std::expected<void, std::string> typewrite(const std::string& text) override;

private:
    void paste();
    void report(const std::string& line);

    Options opts_;
    Clipboard& clipboard_;
    KeystrokeTyper typer_;
    HotkeyPaste hotkey_;
    std::unique_ptr<PasteCapability> native_paste_;
    StatusCallback status_;
};

#pragma once

#include "output/keystroke_typer.hpp"
#include "output/paste_capability.hpp"

// Paste chord: modifier held around a `v` tap. Always reports success,
// the chord cannot be confirmed by the sender.
class HotkeyPaste : public PasteCapability {
public:
    HotkeyPaste(KeystrokeTyper& typer, Modifier modifier);

    bool paste() override;
    std::string_view name() const override { return "hotkey"; }

private:
    KeystrokeTyper& typer_;
    Modifier modifier_;
};

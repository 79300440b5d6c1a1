#include "output/hotkey_paste.hpp"

HotkeyPaste::HotkeyPaste(KeystrokeTyper& typer, Modifier modifier)
    : typer_(typer), modifier_(modifier) {}

bool HotkeyPaste::paste() {
    typer_.press_chord(modifier_, U'v');
    return true;
}

#include "output/clipboard_paster.hpp"

#include <chrono>
#include <optional>
#include <thread>

ClipboardPaster::ClipboardPaster(Options opts, Clipboard& clipboard, KeySynthesizer& keys,
                                 std::unique_ptr<PasteCapability> native_paste,
                                 StatusCallback status)
    : opts_(opts), clipboard_(clipboard),
      typer_(keys, opts.key_press_delay),
      hotkey_(typer_, opts.paste_modifier),
      native_paste_(std::move(native_paste)),
      status_(std::move(status)) {}

std::expected<void, std::string> ClipboardPaster::typewrite(const std::string& text) {
    std::optional<std::string> snapshot;
    if (opts_.restore_clipboard) {
        auto previous = clipboard_.read();
        if (previous) {
            snapshot = std::move(*previous);
        } else {
            report("Unable to read clipboard (" + previous.error() + "). It will not be restored.");
        }
    }

    auto res = clipboard_.write(text);
    if (!res) {
        report("Unable to copy text to clipboard (" + res.error() + "). Falling back to typing.");
        return typer_.typewrite(text);
    }

    paste();

    if (snapshot) {
        std::this_thread::sleep_for(std::chrono::duration<double>(opts_.paste_delay));
        // Restore is best effort; the pasted text stays on the clipboard otherwise.
        (void)clipboard_.write(*snapshot);
    }

    return {};
}

void ClipboardPaster::paste() {
    if (native_paste_ && native_paste_->paste()) {
        report("Pasted via " + std::string(native_paste_->name()));
        return;
    }
    hotkey_.paste();
    report("Pasted via " + std::string(hotkey_.name()));
}

void ClipboardPaster::report(const std::string& line) {
    if (status_) status_(line);
}

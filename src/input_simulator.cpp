#include "input_simulator.hpp"

#include "output/clipboard_paster.hpp"
#include "output/external_process_typer.hpp"
#include "output/keystroke_typer.hpp"
#include "output/streaming_process_typer.hpp"
#include "utf8.hpp"

#include <format>

std::string make_preview(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '\n') {
            escaped += "\\n";
        } else {
            escaped += c;
        }
    }

    auto cps = utf8::decode(escaped);
    if (cps.size() <= InputSimulator::PREVIEW_LIMIT) return escaped;

    std::string preview;
    for (size_t i = 0; i < InputSimulator::PREVIEW_LIMIT; i++) {
        utf8::append(preview, cps[i]);
    }
    preview += "…";
    return preview;
}

InputSimulator::InputSimulator(Config::Input settings, Platform& platform, StatusCallback status)
    : settings_(std::move(settings)), platform_(platform), status_(std::move(status)) {}

InputSimulator::~InputSimulator() {
    cleanup();
}

std::expected<void, std::string> InputSimulator::init() {
    if (backend_) return {};

    auto backend = make_backend();
    if (!backend) return std::unexpected(backend.error());
    backend_ = std::move(*backend);
    return {};
}

std::expected<std::unique_ptr<InputBackend>, std::string> InputSimulator::make_backend() {
    switch (settings_.method) {
        case InputMethod::Keystroke: {
            auto keys = platform_.key_synthesizer();
            if (!keys) return std::unexpected(keys.error());
            keys_ = std::move(*keys);
            return std::make_unique<KeystrokeTyper>(*keys_, settings_.key_press_delay);
        }

        case InputMethod::Clipboard: {
            auto keys = platform_.key_synthesizer();
            if (!keys) return std::unexpected(keys.error());
            auto clipboard = platform_.clipboard();
            if (!clipboard) return std::unexpected(clipboard.error());
            keys_ = std::move(*keys);
            clipboard_ = std::move(*clipboard);

            ClipboardPaster::Options opts{
                .key_press_delay = settings_.key_press_delay,
                .paste_delay = settings_.clipboard_paste_delay,
                .restore_clipboard = settings_.restore_clipboard,
                .paste_modifier = platform_.paste_modifier(),
            };
            return std::make_unique<ClipboardPaster>(opts, *clipboard_, *keys_,
                                                     platform_.native_paste(), status_);
        }

        case InputMethod::StreamingProcess: {
            auto helper = platform_.processes().spawn(settings_.helper_command);
            if (!helper) {
                return std::unexpected(std::format("failed to start {}: {}",
                                                   settings_.helper_command.front(), helper.error()));
            }
            return std::make_unique<StreamingProcessTyper>(std::move(*helper),
                                                           settings_.key_press_delay);
        }

        case InputMethod::ExternalProcess:
            return std::make_unique<ExternalProcessTyper>(platform_.processes(),
                                                          settings_.external_tool,
                                                          settings_.key_press_delay);
    }
    return std::unexpected("unsupported input method");
}

std::expected<void, std::string> InputSimulator::typewrite(const std::string& text) {
    if (!backend_) {
        return std::unexpected("input simulator is not initialized");
    }

    report(std::format("Inserting via {}: {}", input_method_name(settings_.method), make_preview(text)));
    return backend_->typewrite(text);
}

void InputSimulator::cleanup() {
    if (backend_) backend_->cleanup();
}

void InputSimulator::report(const std::string& line) {
    if (status_) status_(line);
}

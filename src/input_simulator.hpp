#pragma once

#include "config.hpp"
#include "output/backend.hpp"
#include "platform/platform.hpp"

#include <expected>
#include <memory>
#include <string>

class InputSimulator {
public:
    static constexpr size_t PREVIEW_LIMIT = 120;

    // The method in settings is fixed for the lifetime of the instance.
    InputSimulator(Config::Input settings, Platform& platform, StatusCallback status = {});
    ~InputSimulator();

    InputSimulator(const InputSimulator&) = delete;
    InputSimulator& operator=(const InputSimulator&) = delete;

    // Creates the backend. Calling it again after success does nothing.
    std::expected<void, std::string> init();

    // Blocks until the text has been delivered. Calls must not overlap.
    std::expected<void, std::string> typewrite(const std::string& text);

    void cleanup();

    InputMethod method() const { return settings_.method; }

private:
    std::expected<std::unique_ptr<InputBackend>, std::string> make_backend();
    void report(const std::string& line);

    Config::Input settings_;
    Platform& platform_;
    StatusCallback status_;

    // Backends hold references into these; backend_ must be destroyed first.
    std::unique_ptr<KeySynthesizer> keys_;
    std::unique_ptr<Clipboard> clipboard_;
    std::unique_ptr<InputBackend> backend_;
};

// Newlines shown as "\n", cut to PREVIEW_LIMIT code points plus an ellipsis.
std::string make_preview(const std::string& text);

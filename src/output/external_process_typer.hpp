#pragma once

#include "output/backend.hpp"
#include "platform/process.hpp"

#include <string>

// Runs `<tool> type --key-delay <ms> -- <text>` once per call.
class ExternalProcessTyper : public InputBackend {
public:
    ExternalProcessTyper(ProcessLauncher& launcher, std::string tool, double interval_s);

    std::expected<void, std::string> typewrite(const std::string& text) override;

private:
    ProcessLauncher& launcher_;
    std::string tool_;
    double interval_s_;
};

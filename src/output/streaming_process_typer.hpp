#pragma once

#include "output/backend.hpp"
#include "platform/process.hpp"

#include <memory>

// Drives a long-lived helper over its stdin with `typedelay <ms>` and
// `type <text>` lines. Not reentrant: calls must be serialized.
class StreamingProcessTyper : public InputBackend {
public:
    StreamingProcessTyper(std::unique_ptr<ChildProcess> helper, double interval_s);
    ~StreamingProcessTyper() override;

    StreamingProcessTyper(const StreamingProcessTyper&) = delete;
    StreamingProcessTyper& operator=(const StreamingProcessTyper&) = delete;

    std::expected<void, std::string> typewrite(const std::string& text) override;

    // Interrupts the helper once; later calls are no-ops.
    void cleanup() override;

    bool is_open() const { return helper_ != nullptr; }

private:
    std::unique_ptr<ChildProcess> helper_;
    double interval_s_;
};

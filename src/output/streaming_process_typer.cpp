#include "output/streaming_process_typer.hpp"

#include "output/millis.hpp"

#include <format>

StreamingProcessTyper::StreamingProcessTyper(std::unique_ptr<ChildProcess> helper,
                                             double interval_s)
    : helper_(std::move(helper)), interval_s_(interval_s) {}

StreamingProcessTyper::~StreamingProcessTyper() {
    cleanup();
}

std::expected<void, std::string> StreamingProcessTyper::typewrite(const std::string& text) {
    if (!helper_) {
        return std::unexpected("helper process already shut down");
    }
    if (!helper_->running()) {
        return std::unexpected("helper process is no longer running");
    }

    auto res = helper_->write(std::format("typedelay {}\n", format_millis(interval_s_)));
    if (!res) return std::unexpected("helper write failed: " + res.error());

    res = helper_->write(std::format("type {}\n", text));
    if (!res) return std::unexpected("helper write failed: " + res.error());

    return {};
}

void StreamingProcessTyper::cleanup() {
    if (!helper_) return;
    helper_->interrupt();
    helper_.reset();
}

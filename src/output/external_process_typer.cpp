#include "output/external_process_typer.hpp"

#include "output/millis.hpp"

#include <format>

ExternalProcessTyper::ExternalProcessTyper(ProcessLauncher& launcher, std::string tool,
                                           double interval_s)
    : launcher_(launcher), tool_(std::move(tool)), interval_s_(interval_s) {}

std::expected<void, std::string> ExternalProcessTyper::typewrite(const std::string& text) {
    std::vector<std::string> argv = {
        tool_, "type", "--key-delay", format_millis(interval_s_), "--", text,
    };

    auto status = launcher_.run(argv);
    if (!status) {
        return std::unexpected(std::format("{}: {}", tool_, status.error()));
    }
    if (*status != 0) {
        return std::unexpected(std::format("{} exited with code {}", tool_, *status));
    }
    return {};
}

#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

class ChildProcess {
public:
    // Implementations interrupt a still-running child on destruction.
    virtual ~ChildProcess() = default;
    virtual std::expected<void, std::string> write(std::string_view data) = 0;
    virtual void interrupt() = 0;
    virtual bool running() = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;
    // Runs argv to completion and returns its exit status.
    virtual std::expected<int, std::string> run(const std::vector<std::string>& argv) = 0;
    virtual std::expected<std::unique_ptr<ChildProcess>, std::string>
    spawn(const std::vector<std::string>& argv) = 0;
};

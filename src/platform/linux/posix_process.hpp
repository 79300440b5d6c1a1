#pragma once

#include "platform/process.hpp"

#include <chrono>
#include <sys/types.h>

namespace posix {

// Runs argv to completion. input, when given, is written to the child's stdin;
// output, when given, receives its stdout. Returns the exit status.
std::expected<int, std::string> run_command(const std::vector<std::string>& argv,
                                            const std::string* input = nullptr,
                                            std::string* output = nullptr);

} // namespace posix

class PosixChildProcess : public ChildProcess {
    struct Passkey { explicit Passkey() = default; };

public:
    static constexpr std::chrono::milliseconds INTERRUPT_GRACE{2000};

    static std::expected<std::unique_ptr<PosixChildProcess>, std::string>
    spawn(const std::vector<std::string>& argv);

    PosixChildProcess(Passkey, pid_t pid, int stdin_fd);
    ~PosixChildProcess() override;

    PosixChildProcess(const PosixChildProcess&) = delete;
    PosixChildProcess& operator=(const PosixChildProcess&) = delete;

    std::expected<void, std::string> write(std::string_view data) override;

    // SIGINT, then SIGKILL if the child outlives INTERRUPT_GRACE.
    void interrupt() override;
    bool running() override;

    pid_t pid() const { return pid_; }

private:
    void close_stdin();

    pid_t pid_;
    int stdin_fd_;
    bool exited_ = false;
};

class PosixProcessLauncher : public ProcessLauncher {
public:
    std::expected<int, std::string> run(const std::vector<std::string>& argv) override;
    std::expected<std::unique_ptr<ChildProcess>, std::string>
    spawn(const std::vector<std::string>& argv) override;
};

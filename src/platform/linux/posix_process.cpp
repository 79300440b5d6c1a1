#include "platform/linux/posix_process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace {

std::string errno_message(const char* call) {
    return std::string(call) + " failed: " + std::strerror(errno);
}

std::vector<char*> make_argv(const std::vector<std::string>& argv) {
    std::vector<char*> out;
    out.reserve(argv.size() + 1);
    for (auto& a : argv) out.push_back(const_cast<char*>(a.c_str()));
    out.push_back(nullptr);
    return out;
}

std::expected<void, std::string> write_all(int fd, std::string_view data) {
    size_t total_written = 0;
    while (total_written < data.size()) {
        ssize_t n = ::write(fd, data.data() + total_written, data.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_message("write()"));
        }
        total_written += static_cast<size_t>(n);
    }
    return {};
}

std::expected<int, std::string> wait_exit(pid_t pid) {
    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) {
        return std::unexpected("terminated by signal " + std::to_string(WTERMSIG(status)));
    }
    return std::unexpected("exited abnormally");
}

} // namespace

namespace posix {

std::expected<int, std::string> run_command(const std::vector<std::string>& argv,
                                            const std::string* input,
                                            std::string* output) {
    if (argv.empty()) return std::unexpected("empty command");

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};

    if (input && ::pipe2(in_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe()"));
    }
    if (output && ::pipe2(out_pipe, O_CLOEXEC) < 0) {
        auto err = errno_message("pipe()");
        if (input) { ::close(in_pipe[0]); ::close(in_pipe[1]); }
        return std::unexpected(err);
    }

    auto args = make_argv(argv);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = errno_message("fork()");
        if (input) { ::close(in_pipe[0]); ::close(in_pipe[1]); }
        if (output) { ::close(out_pipe[0]); ::close(out_pipe[1]); }
        return std::unexpected(err);
    }

    if (pid == 0) {
        if (input) ::dup2(in_pipe[0], STDIN_FILENO);
        if (output) ::dup2(out_pipe[1], STDOUT_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    if (input) {
        ::close(in_pipe[0]);
        auto res = write_all(in_pipe[1], *input);
        ::close(in_pipe[1]);
        if (!res) {
            if (output) { ::close(out_pipe[0]); ::close(out_pipe[1]); }
            ::waitpid(pid, nullptr, 0);
            return std::unexpected(res.error());
        }
    }

    if (output) {
        ::close(out_pipe[1]);
        output->clear();
        std::array<char, 4096> buf;
        while (true) {
            ssize_t n = ::read(out_pipe[0], buf.data(), buf.size());
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            output->append(buf.data(), static_cast<size_t>(n));
        }
        ::close(out_pipe[0]);
    }

    return wait_exit(pid);
}

} // namespace posix

PosixChildProcess::PosixChildProcess(Passkey, pid_t pid, int stdin_fd)
    : pid_(pid), stdin_fd_(stdin_fd) {}

PosixChildProcess::~PosixChildProcess() {
    if (!exited_) interrupt();
    close_stdin();
}

std::expected<std::unique_ptr<PosixChildProcess>, std::string>
PosixChildProcess::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) return std::unexpected("empty command");

    int pipefd[2];
    // CLOEXEC keeps the write end out of unrelated children (clipboard tools).
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(errno_message("pipe()"));
    }

    // Closed by a successful exec; carries errno back when exec fails.
    int errpipe[2];
    if (::pipe2(errpipe, O_CLOEXEC) < 0) {
        auto err = errno_message("pipe()");
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(err);
    }

    auto args = make_argv(argv);

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = errno_message("fork()");
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        ::close(errpipe[0]);
        ::close(errpipe[1]);
        return std::unexpected(err);
    }

    if (pid == 0) {
        ::dup2(pipefd[0], STDIN_FILENO);
        ::execvp(args[0], args.data());
        int exec_errno = errno;
        ssize_t n = ::write(errpipe[1], &exec_errno, sizeof(exec_errno));
        (void)n;
        ::_exit(127);
    }

    ::close(pipefd[0]);
    ::close(errpipe[1]);

    int exec_errno = 0;
    ssize_t n;
    while ((n = ::read(errpipe[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR) {}
    ::close(errpipe[0]);

    if (n > 0) {
        ::close(pipefd[1]);
        while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
        return std::unexpected("exec " + argv[0] + " failed: " + std::strerror(exec_errno));
    }

    return std::make_unique<PosixChildProcess>(Passkey{}, pid, pipefd[1]);
}

std::expected<void, std::string> PosixChildProcess::write(std::string_view data) {
    if (stdin_fd_ < 0) return std::unexpected("stdin already closed");
    return write_all(stdin_fd_, data);
}

bool PosixChildProcess::running() {
    if (exited_) return false;

    int status;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_ || (r < 0 && errno == ECHILD)) {
        exited_ = true;
        return false;
    }
    return true;
}

void PosixChildProcess::interrupt() {
    if (exited_) {
        close_stdin();
        return;
    }

    ::kill(pid_, SIGINT);
    close_stdin();

    auto deadline = std::chrono::steady_clock::now() + INTERRUPT_GRACE;
    while (std::chrono::steady_clock::now() < deadline) {
        int status;
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_ || (r < 0 && errno != EINTR)) {
            exited_ = true;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    ::kill(pid_, SIGKILL);
    while (::waitpid(pid_, nullptr, 0) < 0 && errno == EINTR) {}
    exited_ = true;
}

void PosixChildProcess::close_stdin() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

std::expected<int, std::string> PosixProcessLauncher::run(const std::vector<std::string>& argv) {
    return posix::run_command(argv);
}

std::expected<std::unique_ptr<ChildProcess>, std::string>
PosixProcessLauncher::spawn(const std::vector<std::string>& argv) {
    auto child = PosixChildProcess::spawn(argv);
    if (!child) return std::unexpected(child.error());
    return std::unique_ptr<ChildProcess>(std::move(*child));
}

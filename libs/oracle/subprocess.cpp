/**
 * @file subprocess.cpp
 * @brief Run a child process and capture its standard output (POSIX)
 */

#include "subprocess.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace engwall::oracle {

namespace {

using Clock = std::chrono::steady_clock;

class FileDescriptor
{
public:
    explicit FileDescriptor(int fd = -1) noexcept
        : m_fd(fd)
    {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const noexcept { return m_fd; }

    void reset() noexcept
    {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

private:
    int m_fd;
};

[[nodiscard]] engwall::Error errno_error(std::string code, std::string_view what)
{
    return Error::make(std::move(code), std::format("{}: {}", what, std::strerror(errno)));
}

[[nodiscard]] int remaining_ms(Clock::time_point deadline)
{
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

[[nodiscard]] int exit_code_of(int status)
{
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

void kill_and_reap(pid_t pid)
{
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

// Wait for the child without blocking past the deadline.
[[nodiscard]] engwall::Result<int> wait_until(pid_t pid, Clock::time_point deadline)
{
    constexpr auto kPollInterval = std::chrono::milliseconds(5);
    for (;;) {
        int status = 0;
        const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            return exit_code_of(status);
        }
        if (reaped < 0 && errno != EINTR) {
            return std::unexpected(errno_error("WaitFailed", "waitpid failed"));
        }
        if (Clock::now() >= deadline) {
            kill_and_reap(pid);
            return std::unexpected(Error::make("Timeout", "command did not exit in time"));
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

[[noreturn]] void exec_child(int stdout_fd, const std::vector<char*>& args)
{
    const int null_fd = ::open("/dev/null", O_RDWR);
    if (null_fd >= 0) {
        ::dup2(null_fd, STDIN_FILENO);
        ::dup2(null_fd, STDERR_FILENO);
    }
    ::dup2(stdout_fd, STDOUT_FILENO);
    ::execvp(args.front(), args.data());
    ::_exit(127);
}

}  // namespace

engwall::Result<CommandOutput> run_command(const std::vector<std::string>& argv,
                                           std::chrono::milliseconds timeout)
{
    if (argv.empty()) {
        return std::unexpected(Error::make("SpawnFailed", "empty command"));
    }
    // argv must be fully built before fork(); the child may not allocate.
    std::vector<std::string> storage = argv;
    std::vector<char*> args;
    args.reserve(storage.size() + 1);
    for (auto& arg : storage) {
        args.push_back(arg.data());
    }
    args.push_back(nullptr);

    std::array<int, 2> fds{-1, -1};
    if (::pipe(fds.data()) != 0) {
        return std::unexpected(errno_error("SpawnFailed", "pipe failed"));
    }
    FileDescriptor read_end(fds[0]);
    FileDescriptor write_end(fds[1]);
    ::fcntl(read_end.get(), F_SETFD, FD_CLOEXEC);
    ::fcntl(write_end.get(), F_SETFD, FD_CLOEXEC);

    const auto deadline = Clock::now() + timeout;
    const pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(errno_error("SpawnFailed", "fork failed"));
    }
    if (pid == 0) {
        exec_child(write_end.get(), args);
    }
    write_end.reset();

    CommandOutput output;
    std::array<char, 4096> buffer{};
    for (;;) {
        pollfd pfd{.fd = read_end.get(), .events = POLLIN, .revents = 0};
        const int ready = ::poll(&pfd, 1, remaining_ms(deadline));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            kill_and_reap(pid);
            return std::unexpected(errno_error("WaitFailed", "poll failed"));
        }
        if (ready == 0) {
            kill_and_reap(pid);
            return std::unexpected(Error::make(
                "Timeout", std::format("{} exceeded {} ms", argv.front(), timeout.count())));
        }
        const ssize_t count = ::read(read_end.get(), buffer.data(), buffer.size());
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            kill_and_reap(pid);
            return std::unexpected(errno_error("WaitFailed", "read failed"));
        }
        if (count == 0) {
            break;
        }
        output.stdout_text.append(buffer.data(), static_cast<std::size_t>(count));
    }

    auto exit_code = wait_until(pid, deadline);
    if (!exit_code) {
        return std::unexpected(exit_code.error());
    }
    output.exit_code = *exit_code;
    return output;
}

}  // namespace engwall::oracle

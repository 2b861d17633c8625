/*
 * process_runner_unix.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef _WIN32

#include "process_runner.hpp"
#include "utf8.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace runway::exec {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kPollSliceMs = 10;
constexpr std::chrono::milliseconds kFinalDrainWindow{50};

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }

    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_{-1};
};

auto makePipe(UniqueFd& readEnd, UniqueFd& writeEnd) -> bool {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    readEnd.reset(fds[0]);
    writeEnd.reset(fds[1]);
    return true;
}

struct Capture {
    UniqueFd fd;
    std::string bytes;
    bool truncated{false};
};

void appendLimited(Capture& capture, const char* data, std::size_t n,
                   std::size_t limit) {
    if (limit == 0) {
        capture.bytes.append(data, n);
        return;
    }
    const std::size_t avail =
        capture.bytes.size() < limit ? limit - capture.bytes.size() : 0;
    const std::size_t take = std::min(n, avail);
    capture.bytes.append(data, take);
    if (take < n) {
        capture.truncated = true;
    }
}

// Read everything currently available. Closes the descriptor on EOF.
auto drain(Capture& capture, std::size_t limit) -> bool {
    char buffer[8192];
    while (capture.fd.valid()) {
        const ssize_t n = ::read(capture.fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            appendLimited(capture, buffer, static_cast<std::size_t>(n), limit);
            continue;
        }
        if (n == 0) {
            capture.fd.reset();
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            break;
        }
        return false;
    }
    return true;
}

// Wait for readable data on the still-open captures for at most `timeoutMs`.
void pollCaptures(Capture& out, Capture& err, int timeoutMs) {
    std::vector<pollfd> fds;
    for (Capture* c : {&out, &err}) {
        if (c->fd.valid()) {
            fds.push_back({c->fd.get(), POLLIN, 0});
        }
    }
    if (fds.empty()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(timeoutMs));
        return;
    }
    // EINTR simply ends this slice early.
    ::poll(fds.data(), fds.size(), timeoutMs);
}

// True once the child has terminated. The zombie is left in place so that
// its pid (and process group id) cannot be recycled before we signal the
// group.
auto hasExited(pid_t pid) -> bool {
    siginfo_t info{};
    if (::waitid(P_PID, static_cast<id_t>(pid), &info,
                 WEXITED | WNOHANG | WNOWAIT) != 0) {
        return errno == ECHILD;
    }
    return info.si_pid == pid;
}

void signalGroup(pid_t pid, int sig) {
    if (::kill(-pid, sig) != 0 && errno == ESRCH) {
        ::kill(pid, sig);
    }
}

auto reap(pid_t pid, int& status) -> bool {
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return false;
        }
    }
    return true;
}

auto exitCodeFromStatus(int status) -> int {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return kSyntheticExitCode;
}

auto finishStream(Capture& capture) -> std::string {
    auto text = utf8::decodeLossy(capture.bytes);
    if (capture.truncated) {
        text.append(kTruncationMarker);
    }
    return text;
}

// Only async-signal-safe calls from here on: the server is multithreaded.
[[noreturn]] void execChild(char* const* argv, const char* workdir,
                            int nullFd, int outFd, int errFd, int reportFd) {
    ::setpgid(0, 0);

    sigset_t empty;
    ::sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);
    ::signal(SIGPIPE, SIG_DFL);

    if (::dup2(nullFd, STDIN_FILENO) < 0 || ::dup2(outFd, STDOUT_FILENO) < 0 ||
        ::dup2(errFd, STDERR_FILENO) < 0) {
        int err = errno;
        (void)!::write(reportFd, &err, sizeof(err));
        ::_exit(127);
    }

    if (workdir != nullptr && ::chdir(workdir) != 0) {
        int err = errno;
        (void)!::write(reportFd, &err, sizeof(err));
        ::_exit(127);
    }

    ::execvp(argv[0], argv);
    int err = errno;
    (void)!::write(reportFd, &err, sizeof(err));
    ::_exit(127);
}

}  // namespace

auto ProcessRunner::run(const CommandLine& command, const RunLimits& limits)
    -> RunOutcome {
    if (command.argv.empty() || command.argv.front().empty()) {
        return std::unexpected(
            RunnerFailure{RunnerError::SpawnFailed, "empty command line"});
    }

    const auto& program = command.argv.front();
    const auto startTime = Clock::now();

    UniqueFd nullFd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    Capture out;
    Capture err;
    UniqueFd outWrite;
    UniqueFd errWrite;
    UniqueFd reportRead;
    UniqueFd reportWrite;
    if (!nullFd.valid() || !makePipe(out.fd, outWrite) ||
        !makePipe(err.fd, errWrite) || !makePipe(reportRead, reportWrite)) {
        auto reason = fmt::format("cannot create pipes: {}",
                                  std::strerror(errno));
        spdlog::error("ProcessRunner: {}", reason);
        return std::unexpected(
            RunnerFailure{RunnerError::SpawnFailed, std::move(reason)});
    }

    // Prepared before fork so the child does not allocate.
    std::vector<std::string> args = command.argv;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    const std::string workdir = command.workingDirectory.string();

    const pid_t pid = ::fork();
    if (pid < 0) {
        auto reason = fmt::format("fork failed: {}", std::strerror(errno));
        spdlog::error("ProcessRunner: {}", reason);
        return std::unexpected(
            RunnerFailure{RunnerError::SpawnFailed, std::move(reason)});
    }

    if (pid == 0) {
        execChild(argv.data(), workdir.empty() ? nullptr : workdir.c_str(),
                  nullFd.get(), outWrite.get(), errWrite.get(),
                  reportWrite.get());
    }

    // Both sides call setpgid; whichever runs first wins, the other may fail
    // harmlessly with EACCES.
    ::setpgid(pid, pid);

    outWrite.reset();
    errWrite.reset();
    reportWrite.reset();
    nullFd.reset();

    int childErrno = 0;
    ssize_t reported = 0;
    do {
        reported = ::read(reportRead.get(), &childErrno, sizeof(childErrno));
    } while (reported < 0 && errno == EINTR);
    reportRead.reset();

    if (reported == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        if (!reap(pid, status)) {
            spdlog::warn("ProcessRunner: could not reap failed child {}: {}",
                         pid, std::strerror(errno));
        }
        auto reason = fmt::format("{}: {}", program, std::strerror(childErrno));
        spdlog::error("ProcessRunner: spawn failed: {}", reason);
        return std::unexpected(
            RunnerFailure{RunnerError::SpawnFailed, std::move(reason)});
    }

    spdlog::debug("ProcessRunner: spawned '{}' as pid {}", program, pid);

    for (Capture* c : {&out, &err}) {
        ::fcntl(c->fd.get(), F_SETFL,
                ::fcntl(c->fd.get(), F_GETFL) | O_NONBLOCK);
    }

    const bool hasDeadline = limits.deadline.count() > 0;
    const auto deadlineSpan = std::min(
        limits.deadline,
        std::chrono::seconds(static_cast<std::int64_t>(kMaxDeadlineSeconds)));
    const auto killGrace = std::clamp(
        limits.killGrace, std::chrono::milliseconds(0),
        std::chrono::milliseconds(
            static_cast<std::int64_t>(kMaxKillGraceMillis)));
    const auto deadline = startTime + deadlineSpan;
    bool ioFailed = false;
    bool timedOut = false;

    while (true) {
        int sliceMs = kPollSliceMs;
        if (hasDeadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - Clock::now());
            sliceMs = static_cast<int>(std::clamp<long long>(
                remaining.count(), 0, kPollSliceMs));
        }
        pollCaptures(out, err, sliceMs);

        if (!drain(out, limits.maxOutputBytes) ||
            !drain(err, limits.maxOutputBytes)) {
            ioFailed = true;
        }

        if (hasExited(pid)) {
            break;
        }
        if (ioFailed) {
            signalGroup(pid, SIGKILL);
            break;
        }
        if (hasDeadline && Clock::now() >= deadline) {
            timedOut = true;
            spdlog::warn("ProcessRunner: pid {} exceeded {}s deadline, killing",
                         pid, deadlineSpan.count());
            signalGroup(pid, SIGTERM);
            const auto graceEnd = Clock::now() + killGrace;
            while (!hasExited(pid) && Clock::now() < graceEnd) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            break;
        }
    }

    // Take down anything the child left behind in its group.
    signalGroup(pid, SIGKILL);

    int status = 0;
    if (!reap(pid, status)) {
        auto reason = fmt::format("waitpid failed for {}: {}", program,
                                  std::strerror(errno));
        spdlog::error("ProcessRunner: {}", reason);
        return std::unexpected(
            RunnerFailure{RunnerError::WaitFailed, std::move(reason)});
    }

    if (timedOut) {
        return std::unexpected(RunnerFailure{
            RunnerError::Timeout,
            fmt::format("deadline of {}s expired", deadlineSpan.count())});
    }

    // Collect whatever is still buffered in the pipes.
    const auto drainEnd = Clock::now() + kFinalDrainWindow;
    while ((out.fd.valid() || err.fd.valid()) && Clock::now() < drainEnd) {
        pollCaptures(out, err, kPollSliceMs);
        if (!drain(out, limits.maxOutputBytes) ||
            !drain(err, limits.maxOutputBytes)) {
            ioFailed = true;
            break;
        }
    }

    if (ioFailed) {
        auto reason = fmt::format("reading output of {} failed: {}", program,
                                  std::strerror(errno));
        spdlog::error("ProcessRunner: {}", reason);
        return std::unexpected(
            RunnerFailure{RunnerError::IoError, std::move(reason)});
    }

    ProcessOutput output;
    output.exitCode = exitCodeFromStatus(status);
    output.stdoutTruncated = out.truncated;
    output.stderrTruncated = err.truncated;
    output.stdoutText = finishStream(out);
    output.stderrText = finishStream(err);
    output.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - startTime);

    spdlog::debug("ProcessRunner: pid {} exited with {} after {}ms", pid,
                  output.exitCode, output.elapsed.count());
    return output;
}

}  // namespace runway::exec

#endif  // !_WIN32

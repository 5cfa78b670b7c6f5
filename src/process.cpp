/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rwork/process.hpp"
#include "rwork/logger.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <system_error>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace rwork {

namespace {
constexpr std::chrono::milliseconds kPumpSlice{100};

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void setCloseOnExec(int fd) {
    int flags = ::fcntl(fd, F_GETFD, 0);
    if (flags != -1) {
        ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

void makePipe(std::array<int, 2>& fds) {
    if (::pipe(fds.data()) != 0) {
        throw SpawnError(std::string("pipe: ") + std::strerror(errno));
    }
    setCloseOnExec(fds[0]);
    setCloseOnExec(fds[1]);
}

std::vector<std::string> buildEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string value(*entry);
        std::string name = value.substr(0, value.find('='));
        bool overridden = std::any_of(overrides.begin(), overrides.end(),
            [&name](const auto& kv) { return kv.first == name; });
        if (!overridden) {
            env.push_back(std::move(value));
        }
    }
    for (const auto& [name, value] : overrides) {
        env.push_back(name + "=" + value);
    }
    return env;
}

std::vector<char*> toPointers(std::vector<std::string>& storage) {
    std::vector<char*> pointers;
    pointers.reserve(storage.size() + 1);
    for (auto& item : storage) {
        pointers.push_back(item.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

void appendCapped(std::string& buffer, const char* data, std::size_t size) {
    buffer.append(data, size);
    if (buffer.size() > Process::kMaxCapture) {
        buffer.erase(0, buffer.size() - Process::kMaxCapture);
    }
}
}

Process::Process(const ProcessSpec& spec) {
    auto executable = resolveExecutable(spec.executable);
    if (executable.empty()) {
        throw SpawnError("Executable not found: " + spec.executable.string());
    }

    // Everything the child touches is prepared before fork
    std::vector<std::string> argStorage;
    argStorage.reserve(spec.args.size() + 1);
    argStorage.push_back(executable.string());
    argStorage.insert(argStorage.end(), spec.args.begin(), spec.args.end());
    std::vector<std::string> envStorage = buildEnvironment(spec.env);
    std::vector<char*> argv = toPointers(argStorage);
    std::vector<char*> envp = toPointers(envStorage);

    std::array<int, 2> outPipe{-1, -1};
    std::array<int, 2> errPipe{-1, -1};
    std::array<int, 2> execPipe{-1, -1};
    int devNull = -1;
    auto closeAll = [&]() noexcept {
        for (auto* fds : {&outPipe, &errPipe, &execPipe}) {
            closeFd((*fds)[0]);
            closeFd((*fds)[1]);
        }
        closeFd(devNull);
    };

    try {
        makePipe(outPipe);
        makePipe(errPipe);
        makePipe(execPipe);
    } catch (const SpawnError&) {
        closeAll();
        throw;
    }
    devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        closeAll();
        throw SpawnError(std::string("fork: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child path: async-signal-safe calls only.
        // Own process group: a terminal Ctrl-C aimed at the worker must not
        // reach the render, and the whole engine tree can be killed at once.
        ::setpgid(0, 0);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execve(argv[0], argv.data(), envp.data());

        int err = errno;
        ssize_t written = ::write(execPipe[1], &err, sizeof(err));
        (void)written;
        _exit(127);
    }

    pid_ = pid;
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);
    closeFd(devNull);

    // The exec pipe closes on a successful exec; data on it is the child's errno
    int childErrno = 0;
    ssize_t got = 0;
    do {
        got = ::read(execPipe[0], &childErrno, sizeof(childErrno));
    } while (got < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (got == static_cast<ssize_t>(sizeof(childErrno))) {
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        throw SpawnError("Cannot execute " + executable.string() + ": " + std::strerror(childErrno));
    }

    outFd_ = outPipe[0];
    errFd_ = errPipe[0];
    LOG_DEBUG("Spawned " + executable.string() + " (pid " + std::to_string(pid_) + ")");
}

Process::~Process() {
    if (pid_ > 0 && !exited_) {
        LOG_WARN("Killing unfinished process " + std::to_string(pid_));
        if (::kill(-pid_, SIGKILL) < 0) {
            ::kill(pid_, SIGKILL);
        }
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }
    closePipes();
}

bool Process::waitFor(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (!reap()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        pump(std::min(left, kPumpSlice));
    }

    // Collect what is already buffered; descendants of the child may keep the
    // pipes open, so never block here
    while ((outFd_ >= 0 || errFd_ >= 0) && pump(std::chrono::milliseconds(0))) {
    }
    closePipes();
    return true;
}

void Process::wait() {
    while (!waitFor(std::chrono::minutes(1))) {
    }
}

bool Process::reap() {
    if (exited_) {
        return true;
    }

    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return false;
    }
    if (result < 0) {
        if (errno == EINTR) {
            return false;
        }
        throw std::system_error(errno, std::generic_category(), "waitpid");
    }

    exited_ = true;
    if (WIFEXITED(status)) {
        exitCode_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exitCode_ = 128 + WTERMSIG(status);
    }
    LOG_DEBUG("Process " + std::to_string(pid_) + " exited with code " + std::to_string(exitCode_));
    return true;
}

bool Process::pump(std::chrono::milliseconds timeout) {
    std::array<pollfd, 2> fds{};
    nfds_t count = 0;
    if (outFd_ >= 0) fds[count++] = {outFd_, POLLIN, 0};
    if (errFd_ >= 0) fds[count++] = {errFd_, POLLIN, 0};

    if (count == 0) {
        if (timeout.count() > 0) {
            std::this_thread::sleep_for(timeout);
        }
        return false;
    }

    int ready = ::poll(fds.data(), count, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) {
            return false;
        }
        throw std::system_error(errno, std::generic_category(), "poll");
    }

    bool activity = false;
    for (nfds_t i = 0; i < count; ++i) {
        if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
            continue;
        }
        const bool isOut = fds[i].fd == outFd_;
        char buffer[4096];
        ssize_t got = ::read(fds[i].fd, buffer, sizeof(buffer));
        if (got < 0 && errno == EINTR) {
            continue;
        }
        activity = true;
        if (got <= 0) {
            closeFd(isOut ? outFd_ : errFd_);
            continue;
        }
        appendCapped(isOut ? out_ : err_, buffer, static_cast<std::size_t>(got));
    }
    return activity;
}

void Process::closePipes() noexcept {
    closeFd(outFd_);
    closeFd(errFd_);
}

std::filesystem::path resolveExecutable(const std::filesystem::path& name) {
    if (name.empty()) {
        return {};
    }
    // Explicit paths go straight to execve so its errno describes the failure
    if (name.string().find('/') != std::string::npos) {
        return name;
    }

    const char* pathEnv = std::getenv("PATH");
    std::stringstream dirs(pathEnv && *pathEnv ? pathEnv : "/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        auto candidate = (dir.empty() ? std::filesystem::path(".") : std::filesystem::path(dir)) / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return {};
}

}

#pragma once

#include <hdlgrader/common/expected.hpp>
#include <hdlgrader/logging.hpp>

#include <libassert/assert.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <optional>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

/// Thin wrappers around the Linux syscalls used for process management.
///
/// None of these may be called in a forked child before `exec`: they log on failure,
/// and the logger's mutex may be held by a thread that does not exist in the child.
namespace hdlgrader::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// reads from a file descriptor. See read(2)
/// returns success/failure; logs failure at debug level
/// An empty string signals end-of-file
inline Expected<std::string> read(int fd, std::size_t count) { // NOLINT
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        // EAGAIN is expected on non-blocking pipes; not worth a log line
        if (err != std::errc::resource_unavailable_try_again) {
            LOG_DEBUG("read failed: '{}'", err.message());
        }
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err.message());
        return err;
    }

    return {};
}

/// Signal every process in the process group ``pgid``. See killpg(3)
/// returns success/failure; logs failure at debug level
inline Expected<> killpg(pid_t pgid, int sig) {
    int res = ::killpg(pgid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        // ESRCH just means that everyone in the group is already gone
        if (err != std::errc::no_such_process) {
            LOG_DEBUG("killpg failed: '{}'", err.message());
        }
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2) and ``Fork``
/// returns result from enum; logs failure at debug level
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err.message());
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see open(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> open(const std::string& pathname, int flags, mode_t mode = 0) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::open(pathname.c_str(), flags, mode);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("open failed: '{}'", err.message());
        return err;
    }

    return res;
}

/// see fcntl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err.message());

        return err;
    }

    return Expected<int>{res};
}

struct Pipe
{
    int read_fd = -1;
    int write_fd = -1;
};

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = 0) {
    int fds[2] = {-1, -1}; // NOLINT(*-avoid-c-arrays)

    int res = ::pipe2(fds, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err.message());

        return err;
    }

    return Pipe{.read_fd = fds[0], .write_fd = fds[1]};
}

/// see poll(2)
/// returns the number of ready descriptors (0 on timeout); logs failure at debug level
/// EINTR is reported as 0 ready descriptors so callers simply loop again
inline Expected<int> poll(pollfd* fds, nfds_t nfds, std::chrono::milliseconds timeout) {
    int res = ::poll(fds, nfds, static_cast<int>(timeout.count()));

    if (res == -1) {
        auto err = make_error_code(errno);

        if (err == std::errc::interrupted) {
            return 0;
        }

        LOG_DEBUG("poll failed: '{}'", err.message());

        return err;
    }

    return res;
}

struct WaitStatus
{
    pid_t pid;  // 0 if WNOHANG was given and the child has not changed state
    int status; // raw status; decode with WIFEXITED & co.
};

/// see waitpid(2)
/// returns success/failure; logs failure at debug level
inline Expected<WaitStatus> waitpid(pid_t pid, int options = 0) {
    int status = 0;
    pid_t res{};

    do {
        res = ::waitpid(pid, &status, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitpid failed: '{}'", err.message());

        return err;
    }

    return WaitStatus{.pid = res, .status = status};
}

/// see waitid(2)
/// returns success/failure; logs failure at debug level
/// ``si_pid`` is 0 if WNOHANG was given and no child has changed state
inline Expected<siginfo_t> waitid(idtype_t idtype, id_t id, int options) {
    siginfo_t info{};
    int res{};

    do {
        res = ::waitid(idtype, id, &info, options);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitid failed: '{}'", err.message());

        return err;
    }

    return info;
}

} // namespace hdlgrader::linux

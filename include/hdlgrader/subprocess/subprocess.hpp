#pragma once

#include <hdlgrader/common/class_traits.hpp>
#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/common/linux.hpp>
#include <hdlgrader/subprocess/execution_result.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/resource.h>
#include <sys/types.h>

namespace hdlgrader {

/// POSIX limits applied to the child right before exec. Unset fields are inherited.
struct ResourceLimits
{
    std::optional<rlim_t> cpu_seconds;
    std::optional<rlim_t> address_space_bytes;
    std::optional<rlim_t> file_size_bytes;
};

/// A child process with separately captured stdout and stderr.
///
/// The child is placed in its own process group, so that it and everything it spawns can be
/// killed together. stdin is connected to /dev/null.
class Subprocess : NonCopyable
{
public:
    static constexpr std::size_t DEFAULT_OUTPUT_LIMIT = 4 * 1024 * 1024;

    /// ``exec`` is either a path (anything containing a '/') or a name looked up on PATH
    Subprocess(std::string exec, std::vector<std::string> args);

    /// Kills and reaps the process group if the child is still running
    ~Subprocess();
    Subprocess(Subprocess&&) noexcept;
    Subprocess& operator=(Subprocess&&) noexcept;

    void set_working_directory(std::filesystem::path dir) { working_dir_ = std::move(dir); }

    void set_resource_limits(const ResourceLimits& limits) { limits_ = limits; }

    /// Maximum number of bytes retained per stream; the rest is read and discarded
    void set_output_limit(std::size_t num_bytes) { output_limit_ = num_bytes; }

    /// Forks and execs the child.
    /// Errors: SpawnFailed if the executable could not be found or exec'd; SyscallFailure otherwise
    Result<void> start();

    /// Reads stdout and stderr until both are closed and the child has exited, or ``timeout``
    /// elapses. On timeout, the entire process group is killed with SIGKILL and reaped; the
    /// output read up to that point is kept. Must be called at most once, after `start`.
    Result<ExecutionResult> communicate(std::chrono::milliseconds timeout);

    /// Whether the child has been started and not yet reaped
    bool is_running() const noexcept { return child_pid_ != 0; }

    pid_t get_pid() const noexcept { return child_pid_; }

    /// Locate ``exec`` the way execvp(3) would, without forking. Returns an absolute path.
    /// Errors: SpawnFailed
    static Result<std::filesystem::path> find_executable(const std::string& exec);

private:
    /// Runs in the forked child. Only async-signal-safe calls are allowed here; never returns
    [[noreturn]] void exec_child(const char* exec_path, char* const* argv, const char* working_dir, int devnull_fd,
                                 int error_fd) const noexcept;

    /// Reads everything currently available on ``fd``; sets ``eof`` once the write end is closed
    Result<void> drain(int fd, std::string& buffer, bool& truncated, bool& eof) const;

    void kill_group_and_reap(ExecutionResult* result);
    void record_status(int status, ExecutionResult& result) const;
    void close_pipes();

    std::string exec_;
    std::vector<std::string> args_;
    std::optional<std::filesystem::path> working_dir_;
    ResourceLimits limits_;
    std::size_t output_limit_ = DEFAULT_OUTPUT_LIMIT;

    pid_t child_pid_{};
    linux::Pipe stdout_pipe_{};
    linux::Pipe stderr_pipe_{};

    std::chrono::steady_clock::time_point start_time_;
};

} // namespace hdlgrader

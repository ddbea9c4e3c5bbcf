#include <hdlgrader/subprocess/subprocess.hpp>

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/common/expected.hpp>
#include <hdlgrader/common/linux.hpp>
#include <hdlgrader/logging.hpp>
#include <hdlgrader/subprocess/execution_result.hpp>

#include <fmt/ranges.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hdlgrader {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

// Upper bound on reads per `drain` call, so that a child flooding a pipe cannot starve the
// deadline check in `communicate`
constexpr int MAX_READS_PER_DRAIN = 16;

constexpr std::chrono::milliseconds REAP_POLL_INTERVAL{5};

/// Async-signal-safe: report ``err`` to the parent and exit
[[noreturn]] void child_fail(int error_fd, int err) noexcept {
    [[maybe_unused]] ssize_t written = ::write(error_fd, &err, sizeof(err));
    ::_exit(127);
}

bool is_executable_file(const std::filesystem::path& path) {
    std::error_code err;
    return std::filesystem::is_regular_file(path, err) && ::access(path.c_str(), X_OK) == 0;
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args)
    : exec_{std::move(exec)}
    , args_{std::move(args)} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then the child was never started, already reaped, or the object was moved from
    if (child_pid_ != 0) {
        kill_group_and_reap(nullptr);
    }

    close_pipes();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , working_dir_{std::move(other.working_dir_)}
    , limits_{other.limits_}
    , output_limit_{other.output_limit_}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , stdout_pipe_{std::exchange(other.stdout_pipe_, {})}
    , stderr_pipe_{std::exchange(other.stderr_pipe_, {})}
    , start_time_{other.start_time_} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    if (child_pid_ != 0) {
        kill_group_and_reap(nullptr);
    }
    close_pipes();

    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);
    working_dir_ = std::move(rhs.working_dir_);
    limits_ = rhs.limits_;
    output_limit_ = rhs.output_limit_;
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    stdout_pipe_ = std::exchange(rhs.stdout_pipe_, {});
    stderr_pipe_ = std::exchange(rhs.stderr_pipe_, {});
    start_time_ = rhs.start_time_;

    return *this;
}

Result<std::filesystem::path> Subprocess::find_executable(const std::string& exec) {
    namespace fs = std::filesystem;

    if (exec.empty()) {
        LOG_DEBUG("Empty executable name");
        return ErrorKind::SpawnFailed;
    }

    if (exec.find('/') != std::string::npos) {
        if (!is_executable_file(exec)) {
            LOG_DEBUG("{} is not an executable file", exec);
            return ErrorKind::SpawnFailed;
        }
        return fs::absolute(exec);
    }

    const char* path_env = std::getenv("PATH"); // NOLINT(concurrency-mt-unsafe)
    std::string_view search_path = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";

    while (true) {
        std::size_t sep = search_path.find(':');
        std::string_view dir = search_path.substr(0, sep);

        // An empty PATH entry means the current directory
        fs::path candidate = fs::path{dir.empty() ? "." : dir} / exec;

        if (is_executable_file(candidate)) {
            return fs::absolute(candidate);
        }

        if (sep == std::string_view::npos) {
            break;
        }
        search_path.remove_prefix(sep + 1);
    }

    LOG_DEBUG("{} was not found on PATH", exec);
    return ErrorKind::SpawnFailed;
}

Result<void> Subprocess::start() {
    DEBUG_ASSERT(child_pid_ == 0, "Subprocess started twice");

    auto exec_path = find_executable(exec_);
    if (!exec_path) {
        LOG_WARN("Could not start {}: no such executable", exec_);
        return ErrorKind::SpawnFailed;
    }

    // Everything the child needs is built now; after fork only async-signal-safe calls are allowed
    const std::string exec_path_str = exec_path->string();
    const std::string working_dir_str = working_dir_ ? working_dir_->string() : "";

    std::vector<std::string> arg_strs;
    arg_strs.reserve(args_.size() + 1);
    arg_strs.push_back(exec_);
    arg_strs.insert(arg_strs.end(), args_.begin(), args_.end());

    std::vector<char*> argv;
    argv.reserve(arg_strs.size() + 1);
    for (std::string& arg : arg_strs) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    // Every descriptor is close-on-exec, so that children forked concurrently by other threads
    // never inherit (and hold open) the pipes of this one
    stdout_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stderr_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    linux::Pipe error_pipe = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    int devnull_fd = -1;

    auto close_local_fds = gsl::finally([&] {
        for (int fd : {error_pipe.read_fd, error_pipe.write_fd, devnull_fd}) {
            if (fd != -1) {
                std::ignore = linux::close(fd);
            }
        }
    });

    devnull_fd = TRYE(linux::open("/dev/null", O_RDONLY | O_CLOEXEC), SyscallFailure);

    LOG_DEBUG("Starting {} {} in {}", exec_path_str, args_, working_dir_str.empty() ? "." : working_dir_str);

    start_time_ = std::chrono::steady_clock::now();

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    if (fork_res.which == linux::Fork::Child) {
        exec_child(exec_path_str.c_str(), argv.data(), working_dir_str.empty() ? nullptr : working_dir_str.c_str(),
                   devnull_fd, error_pipe.write_fd);
    }

    child_pid_ = fork_res.pid;

    // The child calls setpgid too; whichever runs first wins, and the other fails harmlessly.
    // Doing it on both sides guarantees the group exists before we could ever need to kill it.
    ::setpgid(child_pid_, child_pid_);

    std::ignore = linux::close(std::exchange(stdout_pipe_.write_fd, -1));
    std::ignore = linux::close(std::exchange(stderr_pipe_.write_fd, -1));
    std::ignore = linux::close(std::exchange(error_pipe.write_fd, -1));

    // Blocks until exec succeeds (the close-on-exec write end closes, giving EOF) or the
    // child reports its errno
    auto exec_status = linux::read(error_pipe.read_fd, sizeof(int));

    if (exec_status && exec_status->size() == sizeof(int)) {
        int child_errno = 0;
        std::memcpy(&child_errno, exec_status->data(), sizeof(int));

        LOG_WARN("Could not execute {}: {}", exec_path_str, get_err_msg(child_errno));

        std::ignore = linux::waitpid(child_pid_);
        child_pid_ = 0;
        close_pipes();

        return ErrorKind::SpawnFailed;
    }

    for (int fd : {stdout_pipe_.read_fd, stderr_pipe_.read_fd}) {
        int flags = TRYE(linux::fcntl(fd, F_GETFL), SyscallFailure);
        TRYE(linux::fcntl(fd, F_SETFL, flags | O_NONBLOCK), SyscallFailure);
    }

    return {};
}

void Subprocess::exec_child(const char* exec_path, char* const* argv, const char* working_dir, int devnull_fd,
                            int error_fd) const noexcept {
    ::setpgid(0, 0);

    if (::dup2(devnull_fd, STDIN_FILENO) == -1 || ::dup2(stdout_pipe_.write_fd, STDOUT_FILENO) == -1 ||
        ::dup2(stderr_pipe_.write_fd, STDERR_FILENO) == -1) {
        child_fail(error_fd, errno);
    }

    if (working_dir != nullptr && ::chdir(working_dir) == -1) {
        child_fail(error_fd, errno);
    }

    auto apply_limit = [error_fd](int resource, const std::optional<rlim_t>& value) {
        if (!value) {
            return;
        }

        const rlimit limit{.rlim_cur = *value, .rlim_max = *value};
        if (::setrlimit(resource, &limit) == -1) {
            child_fail(error_fd, errno);
        }
    };

    apply_limit(RLIMIT_CPU, limits_.cpu_seconds);
    apply_limit(RLIMIT_AS, limits_.address_space_bytes);
    apply_limit(RLIMIT_FSIZE, limits_.file_size_bytes);

    ::execve(exec_path, argv, environ);

    child_fail(error_fd, errno);
}

Result<ExecutionResult> Subprocess::communicate(std::chrono::milliseconds timeout) {
    using namespace std::chrono_literals;
    using std::chrono::steady_clock;

    ASSERT(child_pid_ != 0, "communicate() called on a process that is not running");

    ExecutionResult result;
    const auto deadline = start_time_ + timeout;

    bool stdout_eof = false;
    bool stderr_eof = false;

    while (!stdout_eof || !stderr_eof) {
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - steady_clock::now());
        if (remaining <= 0ms) {
            result.timed_out = true;
            break;
        }

        std::array<pollfd, 2> fds{};
        nfds_t num_fds = 0;

        if (!stdout_eof) {
            fds.at(num_fds++) = {.fd = stdout_pipe_.read_fd, .events = POLLIN, .revents = 0};
        }
        if (!stderr_eof) {
            fds.at(num_fds++) = {.fd = stderr_pipe_.read_fd, .events = POLLIN, .revents = 0};
        }

        int num_ready = TRYE(linux::poll(fds.data(), num_fds, remaining), SyscallFailure);
        if (num_ready == 0) {
            continue;
        }

        for (std::size_t i = 0; i < num_fds; ++i) {
            if (fds.at(i).revents == 0) {
                continue;
            }

            if (fds.at(i).fd == stdout_pipe_.read_fd) {
                TRY(drain(stdout_pipe_.read_fd, result.stdout_text, result.stdout_truncated, stdout_eof));
            } else {
                TRY(drain(stderr_pipe_.read_fd, result.stderr_text, result.stderr_truncated, stderr_eof));
            }
        }
    }

    // Both streams are closed; the child is exiting or has exited. It is left unreaped (a zombie) so that
    // its pid, and with it the process group id, cannot be reused before the group is killed below.
    while (!result.timed_out) {
        auto info = TRYE(linux::waitid(P_PID, static_cast<id_t>(child_pid_), WEXITED | WNOHANG | WNOWAIT),
                         SyscallFailure);

        if (info.si_pid == child_pid_) {
            break;
        }

        if (steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }

        std::this_thread::sleep_for(REAP_POLL_INTERVAL);
    }

    if (result.timed_out) {
        LOG_DEBUG("{} (pid {}) exceeded its {} timeout; killing process group", exec_, child_pid_, timeout);
    }

    // Also reaches leftovers of a child that exited on its own
    kill_group_and_reap(&result);

    if (result.timed_out) {
        // Keep whatever was written before the kill
        if (!stdout_eof) {
            std::ignore = drain(stdout_pipe_.read_fd, result.stdout_text, result.stdout_truncated, stdout_eof);
        }
        if (!stderr_eof) {
            std::ignore = drain(stderr_pipe_.read_fd, result.stderr_text, result.stderr_truncated, stderr_eof);
        }
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - start_time_);

    close_pipes();

    LOG_DEBUG("{} finished: exit={} signal={} timed_out={} elapsed={}", exec_, result.exit_code.value_or(-1),
              result.term_signal.value_or(0), result.timed_out, result.elapsed);

    return result;
}

Result<void> Subprocess::drain(int fd, std::string& buffer, bool& truncated, bool& eof) const {
    for (int i = 0; i < MAX_READS_PER_DRAIN; ++i) {
        auto res = linux::read(fd, READ_CHUNK_SIZE);

        if (!res) {
            if (res.error() == std::errc::resource_unavailable_try_again) {
                return {};
            }
            if (res.error() == std::errc::interrupted) {
                continue;
            }

            LOG_WARN("Error reading output of {}: {}", exec_, res.error().message());
            return ErrorKind::SyscallFailure;
        }

        if (res->empty()) {
            eof = true;
            return {};
        }

        const std::size_t room = output_limit_ - std::min(buffer.size(), output_limit_);

        if (res->size() > room) {
            buffer.append(res->data(), room);
            truncated = true;
        } else {
            buffer += *res;
        }
    }

    return {};
}

void Subprocess::kill_group_and_reap(ExecutionResult* result) {
    DEBUG_ASSERT(child_pid_ != 0);

    std::ignore = linux::killpg(child_pid_, SIGKILL);

    auto wait_res = linux::waitpid(child_pid_);

    if (!wait_res) {
        LOG_WARN("Could not reap {} (pid {}): {}", exec_, child_pid_, wait_res.error().message());
    } else if (result != nullptr) {
        record_status(wait_res->status, *result);
    }

    child_pid_ = 0;
}

void Subprocess::record_status(int status, ExecutionResult& result) const {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    } else {
        LOG_WARN("Unexpected wait status {:#x} for {}", status, exec_);
    }
}

void Subprocess::close_pipes() {
    for (int* fd : {&stdout_pipe_.read_fd, &stdout_pipe_.write_fd, &stderr_pipe_.read_fd, &stderr_pipe_.write_fd}) {
        if (*fd != -1) {
            std::ignore = linux::close(std::exchange(*fd, -1));
        }
    }
}

} // namespace hdlgrader

#pragma once

#include <hdlgrader/common/expected.hpp>

#include <boost/preprocessor/cat.hpp>

#include <string_view>

namespace hdlgrader {

// NOLINTNEXTLINE
enum class ErrorKind {
    NotReady,             ///< Testbench directory was just created; nothing to grade yet
    NoTestbench,          ///< Testbench directory exists, but holds no source file
    SandboxError,         ///< Filesystem failure while staging a submission
    CompileFailed,        ///< Compiler exited non-zero or emitted diagnostics
    TimedOut,             ///< Compile or run surpassed its wall-clock bound
    RunFailed,            ///< Simulator exited non-zero without any usable output
    ParseAmbiguous,       ///< A structured line carried the marker but could not be parsed
    UpstreamServiceError, ///< Roster or reporting collaborator failure
    SpawnFailed,          ///< The external tool could not be executed at all
    BadArgument,          ///< Invalid input to an operation (e.g., an unsafe file name)
    SyscallFailure,       ///< A Linux syscall failed
    UnknownError,         ///< As named; use this as little as possible

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

constexpr std::string_view format_as(ErrorKind error) {
    switch (error) {
    case ErrorKind::NotReady:
        return "NotReady";
    case ErrorKind::NoTestbench:
        return "NoTestbench";
    case ErrorKind::SandboxError:
        return "SandboxError";
    case ErrorKind::CompileFailed:
        return "CompileFailed";
    case ErrorKind::TimedOut:
        return "Timeout";
    case ErrorKind::RunFailed:
        return "RunFailed";
    case ErrorKind::ParseAmbiguous:
        return "ParseAmbiguous";
    case ErrorKind::UpstreamServiceError:
        return "UpstreamServiceError";
    case ErrorKind::SpawnFailed:
        return "SpawnFailed";
    case ErrorKind::BadArgument:
        return "BadArgument";
    case ErrorKind::SyscallFailure:
        return "SyscallFailure";
    case ErrorKind::UnknownError:
    case ErrorKind::MaxErrorNum:
        break;
    }
    return "UnknownError";
}

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace hdlgrader

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto ident = val;                                                                                              \
        if (!ident.has_value()) {                                                                                      \
            using enum ::hdlgrader::ErrorKind;                                                                         \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))

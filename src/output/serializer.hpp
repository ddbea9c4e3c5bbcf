#pragma once

#include <hdlgrader/common/class_traits.hpp>
#include <hdlgrader/grading_session.hpp>

#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <cstddef>
#include <string_view>

namespace hdlgrader {

/// Presents the progress and results of a grading run.
///
/// Callbacks may originate on worker threads; the runner never makes two calls at once.
class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_assignment_begin(const Testbench& testbench, std::size_t num_submissions) = 0;
    virtual void on_assignment_skipped(const AssignmentSkip& skip) = 0;
    virtual void on_submission_skipped(const SubmissionSkip& skip) = 0;
    virtual void on_submission_result(const SubmissionResult& result) = 0;
    virtual void on_run_summary(const RunSummary& summary) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace hdlgrader

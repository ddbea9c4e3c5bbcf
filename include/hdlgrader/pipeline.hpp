#pragma once

#include <hdlgrader/build_run_executor.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/result_parser.hpp>
#include <hdlgrader/sandbox_manager.hpp>
#include <hdlgrader/scorer.hpp>

#include <vector>

namespace hdlgrader {

/// Drives one submission through
///
///     Pending -> ResolvingTestbench -> Sandboxing -> Compiling -> Running -> Parsing -> Scored
///
/// with `Failed` reachable from every non-terminal stage. `grade` always returns exactly one
/// report, whatever happens along the way.
///
/// The pipeline keeps no state between calls; it may be used from many threads at once.
class SubmissionPipeline
{
public:
    SubmissionPipeline(const SandboxManager& sandboxes, const BuildRunExecutor& executor, const ResultParser& parser,
                       const Scorer& scorer);

    GradeReport grade(const SubmissionKey& key, const Testbench& testbench,
                      const std::vector<SubmissionFile>& files) const;

    const Scorer& get_scorer() const noexcept { return *scorer_; }

private:
    const SandboxManager* sandboxes_;
    const BuildRunExecutor* executor_;
    const ResultParser* parser_;
    const Scorer* scorer_;
};

} // namespace hdlgrader

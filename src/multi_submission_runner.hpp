#pragma once

#include <hdlgrader/grading_config.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/pipeline.hpp>
#include <hdlgrader/services/collaborators.hpp>
#include <hdlgrader/testbench_resolver.hpp>

#include "output/serializer.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hdlgrader {

/// Grades every submission of several assignments on a bounded worker pool.
///
/// Testbenches are resolved once per assignment, before any of its submissions start; an
/// assignment whose testbench is not ready is skipped as a whole. Each submission is then graded
/// independently: a failure in one never affects another.
class MultiSubmissionRunner
{
public:
    MultiSubmissionRunner(const TestbenchResolver& resolver, const SubmissionPipeline& pipeline, RosterService& roster,
                          ReportingService& reporter, std::shared_ptr<Serializer> serializer, RunnerConfig config);

    /// Results are ordered by assignment (in the order given), then by student id
    RunSummary run_all(const std::vector<std::string>& assignment_ids);

private:
    struct Job
    {
        SubmissionKey key;
        const Testbench* testbench;
    };

    /// Grades, posts and records one submission; an exception never costs it its report
    void run_job(const Job& job);

    /// Returns the posted (or unpostable) result; nullopt if the submission was skipped
    std::optional<SubmissionResult> grade_one(const Job& job);

    void record(SubmissionResult result);
    void record(SubmissionSkip skip);

    /// Posts with retries and linear backoff
    SubmissionResult post(GradeReport report);

    bool past_deadline() const;

    const TestbenchResolver* resolver_;
    const SubmissionPipeline* pipeline_;
    RosterService* roster_;
    ReportingService* reporter_;
    std::shared_ptr<Serializer> serializer_;
    RunnerConfig config_;

    /// Guards `summary_` and every call into `serializer_` made during a run
    std::mutex mutex_;
    RunSummary summary_;
};

} // namespace hdlgrader

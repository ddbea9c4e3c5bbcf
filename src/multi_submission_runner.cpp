#include "multi_submission_runner.hpp"

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_config.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/logging.hpp>
#include <hdlgrader/pipeline.hpp>
#include <hdlgrader/services/collaborators.hpp>
#include <hdlgrader/testbench_resolver.hpp>

#include "output/serializer.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <fmt/format.h>
#include <range/v3/algorithm/sort.hpp>

#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace hdlgrader {

namespace {

std::string describe_skip(ErrorKind reason, const TestbenchResolver& resolver, const std::string& assignment_id) {
    switch (reason) {
    case ErrorKind::NotReady:
        return fmt::format("testbench directory {} is empty; add a testbench to it",
                           resolver.directory_for(assignment_id).string());
    case ErrorKind::NoTestbench:
        return fmt::format("no *{} testbench in {}", resolver.get_extension(),
                           resolver.directory_for(assignment_id).string());
    case ErrorKind::BadArgument:
        return "the assignment id cannot be used as a directory name";
    case ErrorKind::UpstreamServiceError:
        return "the list of students could not be retrieved";
    default:
        return "the testbench could not be located";
    }
}

} // namespace

MultiSubmissionRunner::MultiSubmissionRunner(const TestbenchResolver& resolver, const SubmissionPipeline& pipeline,
                                             RosterService& roster, ReportingService& reporter,
                                             std::shared_ptr<Serializer> serializer, RunnerConfig config)
    : resolver_{&resolver}
    , pipeline_{&pipeline}
    , roster_{&roster}
    , reporter_{&reporter}
    , serializer_{std::move(serializer)}
    , config_{config} {
    if (config_.max_concurrency == 0) {
        config_.max_concurrency = 1;
    }
}

RunSummary MultiSubmissionRunner::run_all(const std::vector<std::string>& assignment_ids) {
    summary_ = {};

    // Each testbench is shared read-only by all of its assignment's jobs; unique_ptr keeps addresses stable
    std::vector<std::unique_ptr<Testbench>> testbenches;
    std::vector<Job> jobs;

    std::unordered_set<std::string> seen_ids;

    for (const std::string& assignment_id : assignment_ids) {
        // A repeated id would grade (and post) the same submissions twice, in the same sandboxes
        if (!seen_ids.insert(assignment_id).second) {
            LOG_WARN("Assignment {} is listed more than once; grading it once", assignment_id);
            continue;
        }

        ErrorKind skip_reason{};

        auto testbench = resolver_->resolve(assignment_id);
        auto students = testbench ? roster_->list_students(assignment_id) : Result<std::vector<std::string>>{};

        if (!testbench) {
            skip_reason = testbench.error();
        } else if (!students) {
            skip_reason = students.error();
        } else {
            testbenches.push_back(std::make_unique<Testbench>(std::move(testbench.value())));
            serializer_->on_assignment_begin(*testbenches.back(), students->size());

            for (std::string& student_id : students.value()) {
                jobs.push_back({.key = {.assignment_id = assignment_id, .student_id = std::move(student_id)},
                                .testbench = testbenches.back().get()});
            }

            LOG_INFO("Assignment {}: {} submission(s) to grade", assignment_id, students->size());
            continue;
        }

        AssignmentSkip skip{.assignment_id = assignment_id,
                            .reason = skip_reason,
                            .message = describe_skip(skip_reason, *resolver_, assignment_id)};

        LOG_WARN("Skipping assignment {} ({}): {}", assignment_id, skip.reason, skip.message);

        serializer_->on_assignment_skipped(skip);
        summary_.skipped_assignments.push_back(std::move(skip));
    }

    LOG_DEBUG("Grading {} submission(s) on {} worker(s)", jobs.size(), config_.max_concurrency);

    {
        boost::asio::thread_pool pool{config_.max_concurrency};

        for (const Job& job : jobs) {
            boost::asio::post(pool, [this, job] { run_job(job); });
        }

        pool.join();
    }

    // Workers finish in any order; present results deterministically
    std::unordered_map<std::string, std::size_t> assignment_order;
    for (std::size_t i = 0; i < assignment_ids.size(); ++i) {
        assignment_order.emplace(assignment_ids[i], i);
    }

    auto key_order = [&assignment_order](const SubmissionKey& key) {
        return std::make_tuple(assignment_order.at(key.assignment_id), key.student_id);
    };

    ranges::sort(summary_.results, {}, [&](const SubmissionResult& res) { return key_order(res.report.key); });
    ranges::sort(summary_.skipped_submissions, {}, [&](const SubmissionSkip& skip) { return key_order(skip.key); });

    serializer_->on_run_summary(summary_);
    serializer_->finalize();

    return std::move(summary_);
}

void MultiSubmissionRunner::run_job(const Job& job) {
    std::optional<SubmissionResult> result;
    bool recorded = false;

    try {
        result = grade_one(job);
        if (!result) {
            return;
        }

        if (result->posted) {
            if (auto marked = roster_->mark_graded(job.key); !marked) {
                LOG_WARN("{}: grade was posted, but the submission could not be marked as graded", job.key);
            }
        }

        recorded = true;
        record(std::move(*result));
    } catch (const std::exception& ex) {
        // Nothing below the runner is expected to throw; if something does, the
        // submission still gets its report and the other workers carry on
        LOG_ERROR("{}: unexpected exception while grading: {}", job.key, ex.what());

        // A grade that already went upstream must not be replaced by the failure report
        if (!result) {
            GradeReport report = pipeline_->get_scorer().score_failure(
                job.key, PipelineStage::Pending, ErrorKind::UnknownError,
                "An internal error occurred while grading this submission.");
            result = post(std::move(report));
        }

        if (!recorded) {
            record(std::move(*result));
        }
    }
}

std::optional<SubmissionResult> MultiSubmissionRunner::grade_one(const Job& job) {
    const SubmissionKey& key = job.key;

    if (past_deadline()) {
        LOG_WARN("{}: skipped; the grading deadline passed before it started", key);
        record(SubmissionSkip{.key = key, .reason = "grading deadline passed before this submission started"});
        return std::nullopt;
    }

    auto files = roster_->list_submission_files(key);

    if (!files) {
        LOG_WARN("{}: skipped; submission files could not be retrieved ({})", key, files.error());
        record(SubmissionSkip{.key = key, .reason = "submission files could not be retrieved"});
        return std::nullopt;
    }

    GradeReport report = DEBUG_TIME(pipeline_->grade(key, *job.testbench, files.value()));

    LOG_INFO("{}: {} {:.2f}/{:.2f}", key, report.status, report.score, report.points_possible);

    return post(std::move(report));
}

SubmissionResult MultiSubmissionRunner::post(GradeReport report) {
    SubmissionResult result{.report = std::move(report), .posted = false, .post_attempts = 0};

    const SubmissionKey& key = result.report.key;
    const int max_attempts = 1 + config_.post_retries;

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        if (attempt > 1) {
            std::this_thread::sleep_for(config_.post_backoff * (attempt - 1));
        }

        result.post_attempts = attempt;

        if (auto res = reporter_->post_grade(result.report)) {
            result.posted = true;
            return result;
        }

        LOG_WARN("{}: posting the grade failed (attempt {}/{})", key, attempt, max_attempts);
    }

    LOG_ERROR("{}: {}: grade could not be posted after {} attempt(s). Full report:\n{}", key,
              ErrorKind::UpstreamServiceError, max_attempts, result.report.text);

    return result;
}

void MultiSubmissionRunner::record(SubmissionResult result) {
    std::lock_guard lock{mutex_};

    // Kept in the summary even if the serializer throws
    summary_.results.push_back(std::move(result));
    serializer_->on_submission_result(summary_.results.back());
}

void MultiSubmissionRunner::record(SubmissionSkip skip) {
    std::lock_guard lock{mutex_};

    serializer_->on_submission_skipped(skip);
    summary_.skipped_submissions.push_back(std::move(skip));
}

bool MultiSubmissionRunner::past_deadline() const {
    return config_.deadline && std::chrono::steady_clock::now() >= *config_.deadline;
}

} // namespace hdlgrader

#include <hdlgrader/pipeline.hpp>

#include <hdlgrader/build_run_executor.hpp>
#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/common/overloaded.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/logging.hpp>
#include <hdlgrader/result_parser.hpp>
#include <hdlgrader/sandbox_manager.hpp>
#include <hdlgrader/scorer.hpp>
#include <hdlgrader/subprocess/execution_result.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace hdlgrader {

namespace {

/// Current stage of a single `grade` call. Stages only ever move forward.
class StageTracker
{
public:
    explicit StageTracker(const SubmissionKey& key)
        : key_{&key} {}

    void advance(PipelineStage next) {
        DEBUG_ASSERT(next > stage_, "pipeline stages must move forward", stage_, next);
        LOG_TRACE("{}: {} -> {}", *key_, stage_, next);
        stage_ = next;
    }

    PipelineStage get() const noexcept { return stage_; }

private:
    const SubmissionKey* key_;
    PipelineStage stage_ = PipelineStage::Pending;
};

} // namespace

SubmissionPipeline::SubmissionPipeline(const SandboxManager& sandboxes, const BuildRunExecutor& executor,
                                       const ResultParser& parser, const Scorer& scorer)
    : sandboxes_{&sandboxes}
    , executor_{&executor}
    , parser_{&parser}
    , scorer_{&scorer} {}

GradeReport SubmissionPipeline::grade(const SubmissionKey& key, const Testbench& testbench,
                                      const std::vector<SubmissionFile>& files) const {
    StageTracker stage{key};

    auto fail = [&](ErrorKind error, std::string_view detail) {
        LOG_WARN("{}: failed at stage {} ({}): {}", key, stage.get(), error, detail);
        return scorer_->score_failure(key, stage.get(), error, detail);
    };

    stage.advance(PipelineStage::ResolvingTestbench);

    // Resolved once per assignment; only make sure it has not vanished since
    std::error_code err;
    if (testbench.assignment_id != key.assignment_id || !std::filesystem::is_regular_file(testbench.path, err)) {
        return fail(ErrorKind::NoTestbench, "The testbench for this assignment is not available.");
    }

    stage.advance(PipelineStage::Sandboxing);

    auto sandbox = sandboxes_->create(key, files, testbench);
    if (!sandbox) {
        return fail(sandbox.error(), "The submission could not be staged for grading.");
    }

    // Every report below has a sandbox to release, whatever its outcome
    auto finish = [&](GradeReport report) {
        const bool clean = !report.failed_stage && report.status == GradeStatus::Graded &&
                           report.num_passed == report.num_total;
        sandboxes_->release(sandbox.value(), clean);
        return report;
    };

    if (sandbox->sources.empty()) {
        return finish(fail(ErrorKind::SandboxError, "No HDL source files found in submission."));
    }

    auto outcome = executor_->execute(sandbox.value(), [&stage](PipelineStage next) { stage.advance(next); });

    if (!outcome) {
        const std::string_view tool = stage.get() == PipelineStage::Compiling ? "compiler" : "simulator";
        const std::string detail = outcome.error() == ErrorKind::SpawnFailed
                                       ? fmt::format("The {} could not be started.", tool)
                                       : fmt::format("An internal error occurred while running the {}.", tool);
        return finish(fail(outcome.error(), detail));
    }

    auto parse_run = [&](const ExecutionResult& run) {
        stage.advance(PipelineStage::Parsing);
        ParseResult parsed = parser_->parse(run.stdout_text);

        if (!parsed.notes.empty()) {
            LOG_WARN("{}: {}: {} malformed result line(s)", key, ErrorKind::ParseAmbiguous, parsed.notes.size());
        }

        return parsed;
    };

    return finish(std::visit(
        Overloaded{
            [&](const CompileFailed& failure) {
                stage.advance(PipelineStage::Scored);
                return scorer_->score_compile_failure(key, failure);
            },
            [&](const RunTimedOut& timeout) {
                ParseResult parsed = parse_run(timeout.run);

                stage.advance(PipelineStage::Scored);
                return scorer_->score_run(key, parsed, timeout.run);
            },
            [&](const RunCompleted& completed) {
                ParseResult parsed = parse_run(completed.run);

                stage.advance(PipelineStage::Scored);
                return scorer_->score_run(key, parsed, completed.run);
            },
        },
        outcome.value()));
}

} // namespace hdlgrader

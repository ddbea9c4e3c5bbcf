#include "app/grader_app.hpp"

#include <hdlgrader/build_run_executor.hpp>
#include <hdlgrader/grading_config.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/logging.hpp>
#include <hdlgrader/pipeline.hpp>
#include <hdlgrader/result_parser.hpp>
#include <hdlgrader/sandbox_manager.hpp>
#include <hdlgrader/scorer.hpp>
#include <hdlgrader/testbench_resolver.hpp>
#include <hdlgrader/toolchain/icarus.hpp>

#include "multi_submission_runner.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/stdout_sink.hpp"
#include "output/verbosity.hpp"
#include "services/directory_roster.hpp"
#include "services/grade_ledger.hpp"
#include "user/program_options.hpp"

#include <gsl/util>

#include <cstdlib>
#include <memory>

namespace hdlgrader {

int GraderApp::run_impl() {
    const GradingConfig config = OPTS.to_grading_config();

    LOG_DEBUG("Grading assignments {} with {} worker(s)", config.assignment_ids, config.runner.max_concurrency);

    auto compiler = std::make_shared<const IcarusCompiler>(config.compiler, config.top_module);
    auto simulator = std::make_shared<const IcarusSimulator>(config.simulator);

    const TestbenchResolver resolver{config.testbench_root, config.source_extension};
    const SandboxManager sandboxes{config.build_root, config.source_extension, config.retention};
    const BuildRunExecutor executor{compiler, simulator, config.executor};
    const ResultParser parser{config.parser};
    const Scorer scorer{config.scoring};

    const SubmissionPipeline pipeline{sandboxes, executor, parser, scorer};

    DirectoryRoster roster{OPTS.submissions_dir, OPTS.regrade};
    GradeLedger ledger{OPTS.grades_dir};

    StdoutSink output_sink;
    std::shared_ptr output_serializer =
        std::make_shared<PlainTextSerializer>(output_sink, OPTS.colorize_option, OPTS.verbosity);

    MultiSubmissionRunner runner{resolver, pipeline, roster, ledger, output_serializer, config.runner};

    RunSummary summary = runner.run_all(config.assignment_ids);

    LOG_INFO("Run finished: {} graded, {} posted, {} post failure(s), {} skipped submission(s), {} skipped "
             "assignment(s)",
             summary.results.size(), summary.num_posted(), summary.num_post_failures(),
             summary.skipped_submissions.size(), summary.skipped_assignments.size());

    if (OPTS.verbosity == VerbosityLevel::Silent) {
        return gsl::narrow_cast<int>(summary.num_post_failures());
    }

    return EXIT_SUCCESS;
}

} // namespace hdlgrader

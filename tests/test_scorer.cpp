#include "catch2_custom.hpp"

#include <hdlgrader/build_run_executor.hpp>
#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/result_parser.hpp>
#include <hdlgrader/scorer.hpp>
#include <hdlgrader/subprocess/execution_result.hpp>

#include <string>

#include <csignal>

using namespace hdlgrader;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

const SubmissionKey KEY{.assignment_id = "101", .student_id = "42"};

ExecutionResult exited(int code, std::string out, std::string err = "") {
    ExecutionResult run;
    run.exit_code = code;
    run.stdout_text = std::move(out);
    run.stderr_text = std::move(err);
    return run;
}

GradeReport score_output(const std::string& out, const Scorer& scorer = Scorer{}) {
    ExecutionResult run = exited(0, out);
    return scorer.score_run(KEY, ResultParser{}.parse(run.stdout_text), run);
}

} // namespace

TEST_CASE("Score is the pass ratio of the points possible") {
    GradeReport report = score_output("RESULT: a PASS\nRESULT: b PASS\nRESULT: c FAIL\nRESULT: d PASS\n");

    CHECK(report.status == GradeStatus::Graded);
    CHECK(report.score == 75.0);
    CHECK(report.num_passed == 3);
    CHECK(report.num_total == 4);
    CHECK(report.percentage() == 75.0);
    CHECK(report.outcomes.size() == 4);
    CHECK_FALSE(report.failed_stage.has_value());

    CHECK_THAT(report.text, StartsWith("Autograded Verilog assignment. Tests passed: 3/4 (75.00%). Score: 75.00/100.00\n"));
    CHECK_THAT(report.text, ContainsSubstring("  FAIL  c\n"));
}

TEST_CASE("Points possible scales the score") {
    GradeReport report = score_output("RESULT: a PASS\nRESULT: b FAIL\nRESULT: c FAIL\n", Scorer{{.points_possible = 10.0}});

    CHECK_THAT(report.score, Catch::Matchers::WithinAbs(10.0 / 3.0, 1e-9));
    CHECK(report.points_possible == 10.0);
    CHECK_THAT(report.text, ContainsSubstring("Score: 3.33/10.00"));
}

TEST_CASE("No structured output is distinct from zero passed") {
    GradeReport none = score_output("$finish called\n");

    CHECK(none.status == GradeStatus::NoOutput);
    CHECK(none.score == 0.0);
    CHECK(none.num_total == 0);
    CHECK_THAT(none.text, ContainsSubstring("No grading output detected."));
    CHECK_THAT(none.text, ContainsSubstring("$finish called"));

    GradeReport all_failed = score_output("RESULT: a FAIL\n");

    CHECK(all_failed.status == GradeStatus::Graded);
    CHECK(all_failed.score == 0.0);
    CHECK(all_failed.num_total == 1);
}

TEST_CASE("Outcome details appear in the report") {
    GradeReport report = score_output("RESULT: sum FAIL expected=4 got=5 off by one\n");

    CHECK_THAT(report.text, ContainsSubstring("  FAIL  sum  expected=4  got=5  (off by one)\n"));
}

TEST_CASE("Malformed lines are listed and flagged") {
    GradeReport report = score_output("RESULT: a PASS\nRESULT: b MAYBE\n");

    CHECK(report.num_total == 2);
    CHECK(report.score == 50.0);
    CHECK_THAT(report.text, ContainsSubstring("  FAIL  b  [unparseable]\n"));
    CHECK_THAT(report.text, ContainsSubstring("Malformed result lines:\n  line 2: "));
}

TEST_CASE("A timed out run keeps its partial outcomes") {
    ExecutionResult run;
    run.term_signal = SIGKILL;
    run.timed_out = true;
    run.stdout_text = "RESULT: a PASS\nRESULT: b PASS\n";

    GradeReport report = Scorer{}.score_run(KEY, ResultParser{}.parse(run.stdout_text), run);

    CHECK(report.status == GradeStatus::TimedOut);
    CHECK(report.timed_out);
    CHECK(report.outcomes.size() == 2);
    CHECK(report.score == 100.0);
    CHECK_THAT(report.text, ContainsSubstring("Simulation timed out."));

    run.stdout_text.clear();
    GradeReport silent = Scorer{}.score_run(KEY, ResultParser{}.parse(run.stdout_text), run);
    CHECK(silent.status == GradeStatus::TimedOut);
    CHECK(silent.score == 0.0);
}

TEST_CASE("A crashing simulation without output is a run failure") {
    ExecutionResult run = exited(1, "", "ERROR: sim.out: unable to open\n");

    GradeReport report = Scorer{}.score_run(KEY, ResultParser{}.parse(run.stdout_text), run);

    CHECK(report.status == GradeStatus::RunFailed);
    CHECK(report.score == 0.0);
    CHECK_THAT(report.text, ContainsSubstring("Simulator errors:\nERROR: sim.out: unable to open\n"));
}

TEST_CASE("A non-zero exit after results is still graded, with a note") {
    ExecutionResult run = exited(2, "RESULT: a PASS\n");

    GradeReport report = Scorer{}.score_run(KEY, ResultParser{}.parse(run.stdout_text), run);

    CHECK(report.status == GradeStatus::Graded);
    CHECK(report.score == 100.0);
    CHECK_THAT(report.text, ContainsSubstring("Note: the simulation exited with status 2."));
}

TEST_CASE("Compile failures embed the diagnostic and score zero") {
    CompileFailed failure{.compile = exited(1, "", "tb.v:4: syntax error\n"),
                          .diagnostic = "iverilog exit status 1.\ntb.v:4: syntax error\n"};

    GradeReport report = Scorer{}.score_compile_failure(KEY, failure);

    CHECK(report.status == GradeStatus::CompileFailed);
    CHECK(report.score == 0.0);
    CHECK(report.outcomes.empty());
    CHECK_THAT(report.text, StartsWith("Autograded Verilog assignment. Compilation failed. Score: 0.00/100.00\n"));
    CHECK_THAT(report.text, ContainsSubstring("Compiler output:\niverilog exit status 1.\ntb.v:4: syntax error\n"));
}

TEST_CASE("Infrastructure failures name the stage") {
    GradeReport report =
        Scorer{}.score_failure(KEY, PipelineStage::Sandboxing, ErrorKind::SandboxError, "No HDL source files found in submission.");

    CHECK(report.status == GradeStatus::Failed);
    CHECK(report.failed_stage == PipelineStage::Sandboxing);
    CHECK(report.error == ErrorKind::SandboxError);
    CHECK(report.score == 0.0);
    CHECK_THAT(report.text, ContainsSubstring("Grading failed at stage Sandboxing (SandboxError)."));
    CHECK_THAT(report.text, ContainsSubstring("No HDL source files found in submission.\n"));
}

TEST_CASE("Identical inputs render identical reports") {
    const std::string out = "RESULT: a PASS\nRESULT: b FAIL expected=1 got=0\n";

    CHECK(score_output(out).text == score_output(out).text);
}

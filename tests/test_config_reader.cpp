#include "catch2_custom.hpp"

#include <hdlgrader/result_parser.hpp>
#include <hdlgrader/sandbox_manager.hpp>

#include "user/config_reader.hpp"
#include "user/program_options.hpp"

#include <string>
#include <vector>

using namespace hdlgrader;

TEST_CASE("Config file lines are parsed into entries") {
    TempDir dir{"config"};
    write_file(dir / "config.txt", "# Course settings\r\n"
                                   "\n"
                                   "HDL_ASSIGNMENT_IDS = 101, 102 ,,103\r\n"
                                   "   COMPILE_TIMEOUT_S=45   \n"
                                   "TOP_MODULE =\n");

    auto entries = ConfigReader{dir / "config.txt"}.read();
    REQUIRE(entries);
    REQUIRE(entries->size() == 3);

    CHECK(entries->at(0).key == "HDL_ASSIGNMENT_IDS");
    CHECK(entries->at(0).value == "101, 102 ,,103");
    CHECK(entries->at(0).line_number == 3);

    CHECK(entries->at(1).key == "COMPILE_TIMEOUT_S");
    CHECK(entries->at(1).value == "45");

    CHECK(entries->at(2).key == "TOP_MODULE");
    CHECK(entries->at(2).value.empty());
}

TEST_CASE("Malformed config lines are errors") {
    TempDir dir{"config"};

    write_file(dir / "no_eq.txt", "HDL_ASSIGNMENT_IDS 101\n");
    auto no_eq = ConfigReader{dir / "no_eq.txt"}.read();
    REQUIRE(!no_eq);
    CHECK_THAT(no_eq.error(), Catch::Matchers::ContainsSubstring(":1:"));

    write_file(dir / "no_key.txt", "\n = 5\n");
    auto no_key = ConfigReader{dir / "no_key.txt"}.read();
    REQUIRE(!no_key);
    CHECK_THAT(no_key.error(), Catch::Matchers::ContainsSubstring("missing key"));

    REQUIRE(!ConfigReader{dir / "does_not_exist.txt"}.read());
}

TEST_CASE("split_list trims and drops empty items") {
    CHECK(split_list("1,2,3") == std::vector<std::string>{"1", "2", "3"});
    CHECK(split_list(" 101 , , 102,") == std::vector<std::string>{"101", "102"});
    CHECK(split_list("").empty());
    CHECK(split_list(" , ").empty());
}

TEST_CASE("Recognised keys are applied to the program options") {
    std::vector<ConfigEntry> entries{
        {.key = "VERILOG_ASSIGNMENT_IDS", .value = "7,8", .line_number = 1},
        {.key = "TESTBENCH_DIR", .value = "benches", .line_number = 2},
        {.key = "COMPILE_TIMEOUT_S", .value = "12", .line_number = 3},
        {.key = "RUN_TIMEOUT_S", .value = "3", .line_number = 4},
        {.key = "POINTS_POSSIBLE", .value = "20.5", .line_number = 5},
        {.key = "SANDBOX_RETENTION", .value = "on-failure", .line_number = 6},
        {.key = "MALFORMED_LINES", .value = "skip", .line_number = 7},
        {.key = "STRICT_COMPILE_DIAGNOSTICS", .value = "false", .line_number = 8},
        {.key = "TOP_MODULE", .value = "tb_top", .line_number = 9},
        {.key = "DEADLINE_S", .value = "600", .line_number = 10},
        {.key = "SOME_FUTURE_KEY", .value = "whatever", .line_number = 11},
        {.key = "CPU_LIMIT_S", .value = "20", .line_number = 12},
        {.key = "MEMORY_LIMIT_MB", .value = "512", .line_number = 13},
        {.key = "FILE_SIZE_LIMIT_MB", .value = "", .line_number = 14},
    };

    ProgramOptions opts;
    REQUIRE(apply_config(entries, opts));

    CHECK(opts.assignment_ids == std::vector<std::string>{"7", "8"});
    CHECK(opts.testbench_dir == "benches");
    CHECK(opts.compile_timeout_s == 12);
    CHECK(opts.run_timeout_s == 3);
    CHECK(opts.points_possible == 20.5);
    CHECK(opts.retention == RetentionPolicy::OnFailure);
    CHECK(opts.malformed == MalformedLinePolicy::Skip);
    CHECK_FALSE(opts.strict_compile_diagnostics);
    CHECK(opts.top_module == "tb_top");
    CHECK(opts.deadline_s == 600);
    CHECK(opts.cpu_limit_s == 20);
    CHECK(opts.memory_limit_mb == 512);
    CHECK_FALSE(opts.file_size_limit_mb.has_value());
}

TEST_CASE("Unconvertible config values name the key and line") {
    ProgramOptions opts;

    auto res = apply_config({{.key = "RUN_TIMEOUT_S", .value = "ten", .line_number = 4}}, opts);
    REQUIRE(!res);
    CHECK_THAT(res.error(), Catch::Matchers::ContainsSubstring("RUN_TIMEOUT_S"));
    CHECK_THAT(res.error(), Catch::Matchers::ContainsSubstring("line 4"));

    REQUIRE(!apply_config({{.key = "SANDBOX_RETENTION", .value = "sometimes", .line_number = 1}}, opts));
    REQUIRE(!apply_config({{.key = "REGRADE", .value = "maybe", .line_number = 1}}, opts));
}

TEST_CASE("Program options validation") {
    TempDir dir{"options"};

    ProgramOptions opts;
    opts.submissions_dir = dir.path();

    // No assignments
    REQUIRE(!opts.validate());

    opts.assignment_ids = {"101"};
    REQUIRE(opts.validate());

    SECTION("Assignment ids must be usable as directory names") {
        opts.assignment_ids = {"101", "../etc"};
        REQUIRE(!opts.validate());
    }

    SECTION("Timeouts must be positive") {
        opts.run_timeout_s = 0;
        REQUIRE(!opts.validate());
    }

    SECTION("Submissions directory must exist") {
        opts.submissions_dir = dir / "missing";
        REQUIRE(!opts.validate());
    }

    SECTION("Resource limits must be positive") {
        opts.cpu_limit_s = 0;
        REQUIRE(!opts.validate());
    }

    SECTION("Source extension must start with a dot") {
        opts.source_extension = "v";
        REQUIRE(!opts.validate());
    }
}

TEST_CASE("Program options are translated into the grading configuration") {
    ProgramOptions opts;
    opts.assignment_ids = {"1", "2"};
    opts.compile_timeout_s = 5;
    opts.run_timeout_s = 2;
    opts.jobs = 3;
    opts.post_retries = 1;
    opts.malformed = MalformedLinePolicy::Skip;

    GradingConfig config = opts.to_grading_config();

    CHECK(config.assignment_ids == opts.assignment_ids);
    CHECK(config.executor.compile_timeout == std::chrono::seconds{5});
    CHECK(config.executor.run_timeout == std::chrono::seconds{2});
    CHECK(config.runner.max_concurrency == 3);
    CHECK(config.runner.post_retries == 1);
    CHECK(config.parser.malformed == MalformedLinePolicy::Skip);
    CHECK_FALSE(config.runner.deadline.has_value());

    // Unset limits are inherited from the grader
    CHECK_FALSE(config.executor.limits.cpu_seconds.has_value());
    CHECK_FALSE(config.executor.limits.address_space_bytes.has_value());
    CHECK_FALSE(config.executor.limits.file_size_bytes.has_value());
}

TEST_CASE("Resource limits reach the executor configuration") {
    ProgramOptions opts;
    opts.cpu_limit_s = 4;
    opts.memory_limit_mb = 256;
    opts.file_size_limit_mb = 8;

    GradingConfig config = opts.to_grading_config();

    CHECK(config.executor.limits.cpu_seconds == 4);
    CHECK(config.executor.limits.address_space_bytes == 256ULL * 1024 * 1024);
    CHECK(config.executor.limits.file_size_bytes == 8ULL * 1024 * 1024);
}

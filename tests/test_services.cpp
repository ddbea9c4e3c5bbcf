#include "catch2_custom.hpp"

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>

#include "services/directory_roster.hpp"
#include "services/grade_ledger.hpp"

#include <filesystem>
#include <string>
#include <vector>

using namespace hdlgrader;

TEST_CASE("Students are the sorted submission subdirectories") {
    TempDir dir{"roster"};
    write_file(dir / "101" / "bob" / "top.v", "");
    write_file(dir / "101" / "alice" / "top.v", "");
    write_file(dir / "101" / "stray_file.txt", "");
    std::filesystem::create_directories(dir / "101" / "Zed");

    DirectoryRoster roster{dir.path()};

    auto students = roster.list_students("101");
    REQUIRE(students);
    CHECK(students.value() == std::vector<std::string>{"Zed", "alice", "bob"});

    CHECK(roster.list_students("202") == ErrorKind::UpstreamServiceError);
    CHECK(roster.list_students("..") == ErrorKind::UpstreamServiceError);
}

TEST_CASE("Submission files are read byte-exact, in name order") {
    TempDir dir{"roster"};
    const std::string binary{"\x00\xfe\r\n\x7f", 5};
    write_file(dir / "1" / "s" / "b.v", "module b; endmodule\r\n");
    write_file(dir / "1" / "s" / "a.bin", binary);

    DirectoryRoster roster{dir.path()};

    auto files = roster.list_submission_files({.assignment_id = "1", .student_id = "s"});
    REQUIRE(files);
    REQUIRE(files->size() == 2);
    CHECK(files->at(0).name == "a.bin");
    CHECK(files->at(0).contents == binary);
    CHECK(files->at(1).name == "b.v");
    CHECK(files->at(1).contents == "module b; endmodule\r\n");
}

TEST_CASE("Graded submissions are skipped unless regrading") {
    TempDir dir{"roster"};
    write_file(dir / "1" / "done" / "a.v", "");
    write_file(dir / "1" / "todo" / "a.v", "");

    DirectoryRoster roster{dir.path()};
    REQUIRE(roster.mark_graded({.assignment_id = "1", .student_id = "done"}));
    REQUIRE(std::filesystem::exists(dir / "1" / "done" / DirectoryRoster::GRADED_MARKER));

    CHECK(roster.list_students("1").value() == std::vector<std::string>{"todo"});

    DirectoryRoster regrading{dir.path(), true};
    CHECK(regrading.list_students("1").value() == std::vector<std::string>{"done", "todo"});

    // The marker is never handed over as a submitted file
    auto files = regrading.list_submission_files({.assignment_id = "1", .student_id = "done"});
    REQUIRE(files);
    REQUIRE(files->size() == 1);
    CHECK(files->at(0).name == "a.v");
}

TEST_CASE("The ledger writes the report and appends a CSV row") {
    TempDir dir{"ledger"};
    GradeLedger ledger{dir / "grades"};

    GradeReport first;
    first.key = {.assignment_id = "101", .student_id = "42"};
    first.status = GradeStatus::Graded;
    first.score = 75.0;
    first.points_possible = 100.0;
    first.text = "Autograded Verilog assignment. Tests passed: 3/4 (75.00%). Score: 75.00/100.00\n";

    GradeReport second = first;
    second.key.student_id = "o'brien, jr";
    second.status = GradeStatus::CompileFailed;
    second.score = 0.0;

    REQUIRE(ledger.post_grade(first));
    REQUIRE(ledger.post_grade(second));

    CHECK(read_file(ledger.report_path(first.key)) == first.text);
    CHECK(ledger.report_path(first.key) == dir / "grades" / "101" / "42.txt");

    CHECK(read_file(ledger.csv_path()) == "assignment,student,score,points_possible,status\n"
                                          "101,42,75.00,100.00,graded\n"
                                          "101,\"o'brien, jr\",0.00,100.00,compile-failed\n");
}

TEST_CASE("The ledger refuses keys that are not plain names") {
    TempDir dir{"ledger"};
    GradeLedger ledger{dir.path()};

    GradeReport report;
    report.key = {.assignment_id = "101", .student_id = "../escape"};

    CHECK(ledger.post_grade(report) == ErrorKind::UpstreamServiceError);
    CHECK_FALSE(std::filesystem::exists(ledger.csv_path()));
}

TEST_CASE("CSV fields are quoted only when needed") {
    CHECK(csv_escape("plain") == "plain");
    CHECK(csv_escape("a,b") == "\"a,b\"");
    CHECK(csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
    CHECK(csv_escape("two\nlines") == "\"two\nlines\"");
}

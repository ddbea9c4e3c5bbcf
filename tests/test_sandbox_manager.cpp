#include "catch2_custom.hpp"

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/sandbox_manager.hpp>

#include <filesystem>
#include <string>
#include <vector>

using namespace hdlgrader;

namespace {

struct SandboxFixture
{
    TempDir dir{"sandbox"};
    Testbench testbench{.assignment_id = "101", .path = dir / "benches" / "101" / "tb_adder.v"};

    SandboxFixture() { write_file(testbench.path, "module tb_adder; endmodule\n"); }
};

} // namespace

TEST_CASE_METHOD(SandboxFixture, "Files are staged byte-exact next to the testbench") {
    SandboxManager manager{dir / "build", ".v"};

    const std::string binary{"\x00\x01\xff\r\n", 5};
    std::vector<SubmissionFile> files{
        {.name = "adder.v", .contents = "module adder; endmodule\n"},
        {.name = "notes.txt", .contents = binary},
        {.name = "Alu.V", .contents = "module alu; endmodule\n"},
    };

    auto sandbox = manager.create({.assignment_id = "101", .student_id = "42"}, files, testbench);
    REQUIRE(sandbox);

    CHECK(sandbox->root == manager.path_for({.assignment_id = "101", .student_id = "42"}));
    CHECK(sandbox->testbench == "tb_adder.v");
    CHECK(sandbox->staged_files == std::vector<std::string>{"adder.v", "notes.txt", "Alu.V"});
    CHECK(sandbox->sources == std::vector<std::string>{"Alu.V", "adder.v"});

    CHECK(read_file(sandbox->root / "notes.txt") == binary);
    CHECK(read_file(sandbox->root / "adder.v") == "module adder; endmodule\n");
    CHECK(read_file(sandbox->root / "tb_adder.v") == "module tb_adder; endmodule\n");
}

TEST_CASE_METHOD(SandboxFixture, "Stale sandbox contents are cleared before staging") {
    SandboxManager manager{dir / "build", ".v"};
    const SubmissionKey key{.assignment_id = "101", .student_id = "42"};

    write_file(manager.path_for(key) / "old_attempt.v", "module stale; endmodule\n");

    auto sandbox = manager.create(key, {{.name = "new.v", .contents = ""}}, testbench);
    REQUIRE(sandbox);

    CHECK_FALSE(std::filesystem::exists(sandbox->root / "old_attempt.v"));
    CHECK(sandbox->sources == std::vector<std::string>{"new.v"});
}

TEST_CASE("Sandbox directory names are unique per key") {
    auto name = [](std::string aid, std::string sid) {
        return SandboxManager::directory_name({.assignment_id = std::move(aid), .student_id = std::move(sid)});
    };

    CHECK(name("101", "42") == "a101_u42");
    CHECK(name("1", "01") != name("10", "1"));
    CHECK(name("1_u2", "3") != name("1", "2_u3"));
    CHECK(name("a/b", "..") == "aa_2fb_u_2e_2e");
}

TEST_CASE_METHOD(SandboxFixture, "Unusable submitted names fail the sandbox") {
    SandboxManager manager{dir / "build", ".v"};
    const SubmissionKey key{.assignment_id = "101", .student_id = "7"};

    SECTION("Shadowing the testbench") {
        auto res = manager.create(key, {{.name = "tb_adder.v", .contents = ""}}, testbench);
        CHECK(res == ErrorKind::SandboxError);
    }

    SECTION("Duplicate names") {
        auto res = manager.create(key, {{.name = "a.v", .contents = ""}, {.name = "sub/a.v", .contents = ""}},
                                  testbench);
        CHECK(res == ErrorKind::SandboxError);
    }

    SECTION("Parent directory") {
        auto res = manager.create(key, {{.name = "..", .contents = ""}}, testbench);
        CHECK(res == ErrorKind::SandboxError);
    }

    // Nothing partially staged is left behind, whatever the retention policy
    CHECK_FALSE(std::filesystem::exists(manager.path_for(key)));
}

TEST_CASE_METHOD(SandboxFixture, "A failure after some files were staged removes them") {
    SandboxManager manager{dir / "build", ".v", RetentionPolicy::Delete};
    const SubmissionKey key{.assignment_id = "101", .student_id = "8"};

    auto res = manager.create(key,
                              {{.name = "first.v", .contents = "module first; endmodule\n"},
                               {.name = "tb_adder.v", .contents = "module evil; endmodule\n"}},
                              testbench);

    CHECK(res == ErrorKind::SandboxError);
    CHECK_FALSE(std::filesystem::exists(manager.path_for(key) / "first.v"));
    CHECK_FALSE(std::filesystem::exists(manager.path_for(key)));
}

TEST_CASE_METHOD(SandboxFixture, "Path components of submitted names are dropped") {
    SandboxManager manager{dir / "build", ".v"};

    auto sandbox = manager.create({.assignment_id = "101", .student_id = "9"},
                                  {{.name = "../../escape.v", .contents = "x"}}, testbench);
    REQUIRE(sandbox);

    CHECK(std::filesystem::exists(sandbox->root / "escape.v"));
    CHECK_FALSE(std::filesystem::exists(dir / "escape.v"));
}

TEST_CASE_METHOD(SandboxFixture, "Retention policies") {
    const SubmissionKey key{.assignment_id = "101", .student_id = "1"};
    const std::vector<SubmissionFile> files{{.name = "a.v", .contents = ""}};

    auto exists_after_release = [&](RetentionPolicy policy, bool clean) {
        SandboxManager manager{dir / "build", ".v", policy};
        auto sandbox = manager.create(key, files, testbench);
        REQUIRE(sandbox);
        manager.release(sandbox.value(), clean);
        return std::filesystem::exists(sandbox->root);
    };

    CHECK(exists_after_release(RetentionPolicy::Keep, true));
    CHECK(exists_after_release(RetentionPolicy::Keep, false));
    CHECK_FALSE(exists_after_release(RetentionPolicy::Delete, true));
    CHECK_FALSE(exists_after_release(RetentionPolicy::Delete, false));
    CHECK_FALSE(exists_after_release(RetentionPolicy::OnFailure, true));
    CHECK(exists_after_release(RetentionPolicy::OnFailure, false));
}

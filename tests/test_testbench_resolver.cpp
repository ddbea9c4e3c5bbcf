#include "catch2_custom.hpp"

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/testbench_resolver.hpp>

#include <filesystem>

using namespace hdlgrader;

TEST_CASE("A missing testbench directory is created and reported as not ready") {
    TempDir dir{"resolver"};
    TestbenchResolver resolver{dir.path()};

    REQUIRE(resolver.resolve("101") == ErrorKind::NotReady);
    REQUIRE(std::filesystem::is_directory(dir / "101"));

    // Nothing was added, so the second attempt is still not ready and changes nothing
    REQUIRE(resolver.resolve("101") == ErrorKind::NotReady);
    REQUIRE(std::filesystem::is_empty(dir / "101"));

    write_file(dir / "101" / "tb.v", "module tb; endmodule\n");
    auto found = resolver.resolve("101");
    REQUIRE(found);
    CHECK(found->path.filename() == "tb.v");
}

TEST_CASE("Non-source files are not testbenches") {
    TempDir dir{"resolver"};
    write_file(dir / "5" / "README.md", "notes");
    write_file(dir / "5" / "tb.sv.bak", "module tb; endmodule\n");
    std::filesystem::create_directories(dir / "5" / "nested.v");

    TestbenchResolver resolver{dir.path()};

    REQUIRE(resolver.resolve("5") == ErrorKind::NoTestbench);
}

TEST_CASE("The lexicographically first source file is the testbench") {
    TempDir dir{"resolver"};
    write_file(dir / "7" / "c.v", "");
    write_file(dir / "7" / "a.v", "");
    write_file(dir / "7" / "b.v", "");

    TestbenchResolver resolver{dir.path()};

    auto first = resolver.resolve("7");
    REQUIRE(first);
    CHECK(first->assignment_id == "7");
    CHECK(first->path.filename() == "a.v");

    // Stable across calls
    for (int i = 0; i < 5; ++i) {
        auto again = resolver.resolve("7");
        REQUIRE(again);
        CHECK(again->path == first->path);
    }
}

TEST_CASE("Selection follows the directory contents") {
    TempDir dir{"resolver"};
    write_file(dir / "8" / "b.v", "");
    write_file(dir / "8" / "a.v", "");

    TestbenchResolver resolver{dir.path()};

    // A later-sorting file does not change the selection
    write_file(dir / "8" / "d.v", "");
    auto found = resolver.resolve("8");
    REQUIRE(found);
    CHECK(found->path.filename() == "a.v");

    std::filesystem::remove(dir / "8" / "a.v");
    found = resolver.resolve("8");
    REQUIRE(found);
    CHECK(found->path.filename() == "b.v");
}

TEST_CASE("The extension match ignores case, the ordering does not") {
    TempDir dir{"resolver"};
    write_file(dir / "9" / "tb_lower.v", "");
    write_file(dir / "9" / "Tb_upper.V", "");

    auto found = TestbenchResolver{dir.path()}.resolve("9");
    REQUIRE(found);

    // 'T' (0x54) sorts before 't' (0x74)
    CHECK(found->path.filename() == "Tb_upper.V");
}

TEST_CASE("Assignment ids that are not plain directory names are rejected") {
    TempDir dir{"resolver"};
    TestbenchResolver resolver{dir.path()};

    CHECK(resolver.resolve("") == ErrorKind::BadArgument);
    CHECK(resolver.resolve("..") == ErrorKind::BadArgument);
    CHECK(resolver.resolve("a/b") == ErrorKind::BadArgument);

    CHECK(std::filesystem::is_empty(dir.path()));
}

TEST_CASE("Source extension matching") {
    CHECK(has_source_extension("top.v", ".v"));
    CHECK(has_source_extension("dir/TOP.V", ".v"));
    CHECK(has_source_extension("alu.sv", ".sv"));
    CHECK_FALSE(has_source_extension("alu.sv", ".v"));
    CHECK_FALSE(has_source_extension(".v", ".v"));
    CHECK_FALSE(has_source_extension("notes.txt", ".v"));
    CHECK_FALSE(has_source_extension("top.v", ""));
}

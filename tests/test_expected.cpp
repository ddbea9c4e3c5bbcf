#include "catch2_custom.hpp"

#include <hdlgrader/common/error_types.hpp>
#include <hdlgrader/common/expected.hpp>

#include <fmt/format.h>

#include <string>

using namespace std::literals;
using hdlgrader::ErrorKind;
using hdlgrader::Expected;
using hdlgrader::Result;

// Simple types
using Et = Expected<int, std::string>;

namespace {

Result<int> half_of_even(int n) {
    if (n % 2 != 0) {
        return ErrorKind::BadArgument;
    }
    return n / 2;
}

Result<int> quarter_of(int n) {
    int half = TRY(half_of_even(n));
    return TRY(half_of_even(half));
}

Expected<int, std::string> quarter_or_message(int n) {
    int half = TRYE(half_of_even(n), fmt::format("{} is odd", n));
    return TRYE(half_of_even(half), fmt::format("{} is odd", half));
}

} // namespace

TEST_CASE("Simple construction and value checks") {
    // Default constructed "void-typed"
    REQUIRE(Expected{}.has_value());
    REQUIRE(!Expected{}.has_error());

    REQUIRE(Et{123}.has_value());
    REQUIRE(!Et{123}.has_error());

    REQUIRE(!Et{"Hello"}.has_value());
    REQUIRE(Et{"Hello"}.has_error());
    REQUIRE(Et{"Hello"}.error() == "Hello");
}

TEST_CASE("Equality operators") {
    REQUIRE(Expected{} == Expected{});

    REQUIRE(Et{123} == Et{123});
    REQUIRE(Et{123} != Et{456});
    REQUIRE(Et{123} != Et{"123"});

    REQUIRE(Et{"Unexpected!"} == "Unexpected!"s);
    REQUIRE(Et{"Unexpected!"} != "Exp!"s);
    REQUIRE(Et{123} != "123"s);

    REQUIRE(Result<int>{ErrorKind::NotReady} == ErrorKind::NotReady);
    REQUIRE(Result<int>{ErrorKind::NotReady} != ErrorKind::NoTestbench);
}

TEST_CASE("value_or and transform") {
    REQUIRE(Et{123}.value_or(456) == 123);
    REQUIRE(Et{"A"}.value_or(456) == 456);

    auto square = [](int n) { return n * n; };

    REQUIRE(Et{12}.transform(square) == Et{144});
    REQUIRE(Et{"no"}.transform(square) == "no"s);
}

TEST_CASE("TRY propagates the first error") {
    REQUIRE(quarter_of(8) == Result<int>{2});
    REQUIRE(quarter_of(7) == ErrorKind::BadArgument);
    REQUIRE(quarter_of(6) == ErrorKind::BadArgument);
}

TEST_CASE("TRYE replaces the error") {
    REQUIRE(quarter_or_message(12) == Et{3});
    REQUIRE(quarter_or_message(5) == "5 is odd"s);
    REQUIRE(quarter_or_message(10) == "5 is odd"s);
}

TEST_CASE("Expected and ErrorKind are formattable") {
    REQUIRE(fmt::format("{}", Result<int>{3}) == "Expected(3)");
    REQUIRE(fmt::format("{}", Result<int>{ErrorKind::UpstreamServiceError}) == "Error(UpstreamServiceError)");
    REQUIRE(fmt::format("{}", Result<void>{}) == "Expected(void)");
    REQUIRE(fmt::format("{}", ErrorKind::TimedOut) == "Timeout");
}

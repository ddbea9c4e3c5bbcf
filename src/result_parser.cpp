#include <hdlgrader/result_parser.hpp>

#include <hdlgrader/grading_session.hpp>
#include <hdlgrader/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hdlgrader {

namespace {

constexpr std::string_view WHITESPACE = " \t\v\f";

std::vector<std::string_view> split_tokens(std::string_view str) {
    std::vector<std::string_view> tokens;

    while (true) {
        std::size_t begin = str.find_first_not_of(WHITESPACE);
        if (begin == std::string_view::npos) {
            break;
        }

        str.remove_prefix(begin);

        std::size_t end = std::min(str.find_first_of(WHITESPACE), str.size());
        tokens.push_back(str.substr(0, end));
        str.remove_prefix(end);
    }

    return tokens;
}

std::optional<TestStatus> parse_status(std::string_view token) {
    if (token == "PASS") {
        return TestStatus::Pass;
    }
    if (token == "FAIL") {
        return TestStatus::Fail;
    }
    return std::nullopt;
}

} // namespace

ResultParser::ResultParser(ParserConfig config)
    : config_{std::move(config)} {
    ASSERT(!config_.marker.empty(), "The result marker must not be empty");
}

ParseResult ResultParser::parse(std::string_view output) const {
    ParseResult result;
    std::size_t line_number = 0;

    while (!output.empty()) {
        std::size_t eol = output.find('\n');
        std::string_view line = output.substr(0, eol);

        output.remove_prefix(eol == std::string_view::npos ? output.size() : eol + 1);
        ++line_number;

        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }

        if (line.starts_with(config_.marker)) {
            parse_line(line, line_number, result);
        }
    }

    LOG_DEBUG("Parsed {} structured line(s) into {} outcome(s), {} note(s)", result.structured_lines,
              result.outcomes.size(), result.notes.size());

    return result;
}

void ResultParser::parse_line(std::string_view line, std::size_t line_number, ParseResult& result) const {
    ++result.structured_lines;

    std::vector<std::string_view> tokens = split_tokens(line.substr(config_.marker.size()));

    std::optional<TestStatus> status;
    std::string reason;

    if (tokens.empty()) {
        reason = "missing test name and status";
    } else if (tokens.size() == 1) {
        reason = "missing status";
    } else if (status = parse_status(tokens[1]); !status) {
        reason = fmt::format("status must be PASS or FAIL, got {:?}", tokens[1]);
    }

    if (!status) {
        result.notes.push_back({.line_number = line_number, .line = std::string{line}, .reason = reason});

        if (config_.malformed == MalformedLinePolicy::RecordAsFail) {
            TestOutcome outcome;
            outcome.name = tokens.empty() ? std::string{UNPARSEABLE_NAME} : std::string{tokens[0]};
            outcome.status = TestStatus::Fail;
            outcome.unparseable = true;

            result.outcomes.push_back(std::move(outcome));
        }

        return;
    }

    TestOutcome outcome;
    outcome.name = tokens[0];
    outcome.status = *status;

    for (std::size_t i = 2; i < tokens.size(); ++i) {
        std::string_view token = tokens[i];
        std::size_t eq_pos = token.find('=');

        // "=x" has no key; treat it as free text like any other non-pair token
        if (eq_pos == std::string_view::npos || eq_pos == 0) {
            if (!outcome.note.empty()) {
                outcome.note += ' ';
            }
            outcome.note += token;
            continue;
        }

        std::string key{token.substr(0, eq_pos)};
        std::string value{token.substr(eq_pos + 1)};

        if (key == "expected") {
            outcome.expected = value;
        } else if (key == "got" || key == "actual") {
            outcome.actual = value;
        }

        outcome.details.emplace_back(std::move(key), std::move(value));
    }

    result.outcomes.push_back(std::move(outcome));
}

} // namespace hdlgrader

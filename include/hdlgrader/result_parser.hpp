#pragma once

#include <hdlgrader/grading_session.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace hdlgrader {

/// What to do with a line that carries the marker, but does not follow the convention
enum class MalformedLinePolicy {
    RecordAsFail, ///< Keep it as a failed outcome flagged `unparseable`
    Skip          ///< Leave it out of the outcomes
};

constexpr std::string_view format_as(MalformedLinePolicy policy) {
    return policy == MalformedLinePolicy::RecordAsFail ? "fail" : "skip";
}

struct ParserConfig
{
    static constexpr std::string_view DEFAULT_MARKER = "RESULT:";

    std::string marker = std::string{DEFAULT_MARKER};
    MalformedLinePolicy malformed = MalformedLinePolicy::RecordAsFail;
};

/// Extracts test outcomes from simulator output.
///
/// A structured line starts (at column 0) with the marker, followed by whitespace-separated tokens:
///
///     RESULT: <name> PASS|FAIL [key=value ...] [free text ...]
///
/// Every other line is ignored. Outcomes keep the order in which lines were emitted; repeated
/// names are kept as separate outcomes.
class ResultParser
{
public:
    static constexpr std::string_view UNPARSEABLE_NAME = "<unparseable>";

    explicit ResultParser(ParserConfig config = {});

    ParseResult parse(std::string_view output) const;

    const ParserConfig& get_config() const noexcept { return config_; }

private:
    void parse_line(std::string_view line, std::size_t line_number, ParseResult& result) const;

    ParserConfig config_;
};

} // namespace hdlgrader

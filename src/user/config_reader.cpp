#include "user/config_reader.hpp"

#include <hdlgrader/common/expected.hpp>
#include <hdlgrader/logging.hpp>
#include <hdlgrader/result_parser.hpp>
#include <hdlgrader/sandbox_manager.hpp>

#include "user/program_options.hpp"

#include <fmt/format.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>

#include <charconv>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hdlgrader {

namespace {

constexpr std::string_view WHITESPACE = " \t\v\f";

std::string_view trim(std::string_view str) {
    std::size_t begin = str.find_first_not_of(WHITESPACE);
    if (begin == std::string_view::npos) {
        return {};
    }

    std::size_t end = str.find_last_not_of(WHITESPACE);
    return str.substr(begin, end - begin + 1);
}

std::optional<int> parse_int(std::string_view str) {
    int value{};
    auto [ptr, err] = std::from_chars(str.data(), str.data() + str.size(), value);

    if (err != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
    }

    return value;
}

std::optional<double> parse_double(std::string_view str) {
    double value{};
    auto [ptr, err] = std::from_chars(str.data(), str.data() + str.size(), value);

    if (err != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
    }

    return value;
}

std::optional<bool> parse_bool(std::string_view str) {
    if (str == "1" || str == "true" || str == "yes" || str == "on") {
        return true;
    }
    if (str == "0" || str == "false" || str == "no" || str == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<RetentionPolicy> parse_retention(std::string_view str) {
    using enum RetentionPolicy;

    for (RetentionPolicy policy : {Keep, Delete, OnFailure}) {
        if (str == format_as(policy)) {
            return policy;
        }
    }
    return std::nullopt;
}

std::optional<MalformedLinePolicy> parse_malformed(std::string_view str) {
    using enum MalformedLinePolicy;

    for (MalformedLinePolicy policy : {RecordAsFail, Skip}) {
        if (str == format_as(policy)) {
            return policy;
        }
    }
    return std::nullopt;
}

/// Stores a raw value into the options; returns a description of the expected format on failure
using Setter = std::function<std::optional<std::string>(ProgramOptions&, std::string_view)>;

template <typename T, typename Parser>
Setter make_setter(T ProgramOptions::*field, Parser parser, std::string_view expected) {
    return [=](ProgramOptions& opts, std::string_view value) -> std::optional<std::string> {
        auto parsed = parser(value);
        if (!parsed) {
            return std::string{expected};
        }
        opts.*field = *parsed;
        return std::nullopt;
    };
}

/// An empty value clears the setting
Setter make_optional_int_setter(std::optional<int> ProgramOptions::*field, std::string_view expected) {
    return [=](ProgramOptions& opts, std::string_view value) -> std::optional<std::string> {
        if (value.empty()) {
            opts.*field = std::nullopt;
            return std::nullopt;
        }

        auto parsed = parse_int(value);
        if (!parsed) {
            return std::string{expected};
        }
        opts.*field = *parsed;
        return std::nullopt;
    };
}

template <typename T>
Setter make_string_setter(T ProgramOptions::*field) {
    return [=](ProgramOptions& opts, std::string_view value) -> std::optional<std::string> {
        opts.*field = T{std::string{value}};
        return std::nullopt;
    };
}

const std::unordered_map<std::string_view, Setter>& get_setters() {
    static const std::unordered_map<std::string_view, Setter> SETTERS = [] {
        std::unordered_map<std::string_view, Setter> setters;

        auto set_ids = [](ProgramOptions& opts, std::string_view value) -> std::optional<std::string> {
            opts.assignment_ids = split_list(value);
            return std::nullopt;
        };

        setters.emplace("HDL_ASSIGNMENT_IDS", set_ids);
        setters.emplace("VERILOG_ASSIGNMENT_IDS", set_ids);

        setters.emplace("TESTBENCH_DIR", make_string_setter(&ProgramOptions::testbench_dir));
        setters.emplace("BUILD_ROOT", make_string_setter(&ProgramOptions::build_root));
        setters.emplace("SUBMISSIONS_DIR", make_string_setter(&ProgramOptions::submissions_dir));
        setters.emplace("GRADES_DIR", make_string_setter(&ProgramOptions::grades_dir));
        setters.emplace("COMPILER", make_string_setter(&ProgramOptions::compiler));
        setters.emplace("SIMULATOR", make_string_setter(&ProgramOptions::simulator));
        setters.emplace("SOURCE_EXTENSION", make_string_setter(&ProgramOptions::source_extension));
        setters.emplace("RESULT_MARKER", make_string_setter(&ProgramOptions::result_marker));

        setters.emplace("TOP_MODULE", [](ProgramOptions& opts, std::string_view value) -> std::optional<std::string> {
            opts.top_module = value.empty() ? std::nullopt : std::optional<std::string>{value};
            return std::nullopt;
        });

        setters.emplace("COMPILE_TIMEOUT_S",
                        make_setter(&ProgramOptions::compile_timeout_s, parse_int, "a number of seconds"));
        setters.emplace("RUN_TIMEOUT_S", make_setter(&ProgramOptions::run_timeout_s, parse_int, "a number of seconds"));
        setters.emplace("MAX_CONCURRENCY", make_setter(&ProgramOptions::jobs, parse_int, "an integer"));
        setters.emplace("POST_RETRIES", make_setter(&ProgramOptions::post_retries, parse_int, "an integer"));
        setters.emplace("POINTS_POSSIBLE", make_setter(&ProgramOptions::points_possible, parse_double, "a number"));
        setters.emplace("STRICT_COMPILE_DIAGNOSTICS", make_setter(&ProgramOptions::strict_compile_diagnostics,
                                                                  parse_bool, "true or false"));
        setters.emplace("REGRADE", make_setter(&ProgramOptions::regrade, parse_bool, "true or false"));
        setters.emplace("SANDBOX_RETENTION",
                        make_setter(&ProgramOptions::retention, parse_retention, "one of keep, delete, on-failure"));
        setters.emplace("MALFORMED_LINES",
                        make_setter(&ProgramOptions::malformed, parse_malformed, "one of fail, skip"));

        setters.emplace("DEADLINE_S", make_optional_int_setter(&ProgramOptions::deadline_s, "a number of seconds"));
        setters.emplace("CPU_LIMIT_S", make_optional_int_setter(&ProgramOptions::cpu_limit_s, "a number of seconds"));
        setters.emplace("MEMORY_LIMIT_MB",
                        make_optional_int_setter(&ProgramOptions::memory_limit_mb, "a number of megabytes"));
        setters.emplace("FILE_SIZE_LIMIT_MB",
                        make_optional_int_setter(&ProgramOptions::file_size_limit_mb, "a number of megabytes"));

        return setters;
    }();

    return SETTERS;
}

} // namespace

ConfigReader::ConfigReader(std::filesystem::path path)
    : path_{std::move(path)} {}

Expected<std::vector<ConfigEntry>, std::string> ConfigReader::read() const {
    std::ifstream in_file{path_};

    if (!in_file.is_open()) {
        return fmt::format("Failed to open config file {:?}", path_.string());
    }

    std::vector<ConfigEntry> result;

    std::string raw_line;
    std::size_t line_number = 0;

    while (std::getline(in_file, raw_line)) {
        ++line_number;

        std::string_view line = raw_line;

        // Remove a CR character; windows linefeed
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }

        line = trim(line);

        if (line.empty() || line.starts_with('#')) {
            continue;
        }

        std::size_t eq_pos = line.find('=');

        if (eq_pos == std::string_view::npos) {
            return fmt::format("{}:{}: expected KEY = value, got {:?}", path_.string(), line_number, line);
        }

        std::string_view key = trim(line.substr(0, eq_pos));

        if (key.empty()) {
            return fmt::format("{}:{}: missing key before '='", path_.string(), line_number);
        }

        result.push_back(
            {.key = std::string{key}, .value = std::string{trim(line.substr(eq_pos + 1))}, .line_number = line_number});
    }

    if (in_file.bad()) {
        return fmt::format("IO error in reading {:?}", path_.string());
    }

    return result;
}

Expected<void, std::string> apply_config(const std::vector<ConfigEntry>& entries, ProgramOptions& opts) {
    const auto& setters = get_setters();

    for (const ConfigEntry& entry : entries) {
        auto iter = setters.find(entry.key);

        if (iter == setters.end()) {
            LOG_WARN("Ignoring unknown config key {:?} (line {})", entry.key, entry.line_number);
            continue;
        }

        if (auto expected = iter->second(opts, entry.value)) {
            return fmt::format("Invalid value {:?} for {} (line {}); expected {}", entry.value, entry.key,
                               entry.line_number, *expected);
        }

        LOG_DEBUG("Config: {} = {:?}", entry.key, entry.value);
    }

    return {};
}

std::vector<std::string> split_list(std::string_view list) {
    return list                                                                                               //
           | ranges::views::split(',')                                                                        //
           | ranges::views::transform([](auto&& item) { return std::string{trim(ranges::to<std::string>(item))}; }) //
           | ranges::views::filter([](const std::string& item) { return !item.empty(); })                     //
           | ranges::to<std::vector>();
}

} // namespace hdlgrader

#pragma once

#include <hdlgrader/common/expected.hpp>

#include "user/program_options.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace hdlgrader {

struct ConfigEntry
{
    std::string key;
    std::string value;
    std::size_t line_number;
};

/// Reader for the ``KEY = value`` config file.
///
/// Blank lines and lines starting with '#' are skipped, surrounding whitespace is trimmed,
/// and a trailing CR (windows linefeed) is ignored. Keys are case-sensitive.
class ConfigReader
{
public:
    explicit ConfigReader(std::filesystem::path path);

    Expected<std::vector<ConfigEntry>, std::string> read() const;

    const std::filesystem::path& get_path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/// Store every recognised entry into ``opts``. Unknown keys are logged and ignored.
/// Errors: a message naming the offending line, for values that cannot be converted
Expected<void, std::string> apply_config(const std::vector<ConfigEntry>& entries, ProgramOptions& opts);

/// Split a comma separated list, trimming whitespace and dropping empty items
std::vector<std::string> split_list(std::string_view list);

} // namespace hdlgrader

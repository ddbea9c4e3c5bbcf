#pragma once

#include <hdlgrader/common/expected.hpp>

#include "user/program_options.hpp"

#include <argparse/argparse.hpp>

#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace hdlgrader {

/// Wrapper around argparse that also folds in the config file.
///
/// Precedence, lowest first: built-in defaults, config file, command line.
class CommandLineArgs
{
public:
    explicit CommandLineArgs(std::span<const char*> args);

    /// Returns:
    ///   Success - Expected<ProgramOptions> with the merged, validated program options
    ///   Failure - Expected<std::string> with failure message
    Expected<ProgramOptions, std::string> parse();

    std::string usage_message() const;
    std::string help_message() const;

private:
    /// Set up the ArgumentParser for fields of ProgramOptions
    void setup_parser();

    /// Load the config file named by --config (or the default) into ``opts``
    Expected<void, std::string> load_config_file(ProgramOptions& opts) const;

    /// Copy every option given on the command line into ``opts``
    void apply_cli_overrides(ProgramOptions& opts) const;

    /// Obtain the basename of a full pathname
    /// Used for the program name with argparse
    static std::string get_basename(std::string_view full_name);

    argparse::ArgumentParser arg_parser_;
    std::vector<std::string> args_;

    /// -v and -q adjust this relative to the default before anything else is known
    VerbosityLevel verbosity_ = ProgramOptions::DEFAULT_VERBOSITY_LEVEL;
    ProgramOptions::ColorizeOpt colorize_option_ = ProgramOptions::ColorizeOpt::Auto;

    using VerbosityLevelUnderlyingT = std::underlying_type_t<VerbosityLevel>;
};

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code = 1) noexcept;

} // namespace hdlgrader

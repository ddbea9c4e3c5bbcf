#include "user/cl_args.hpp"

#include <hdlgrader/common/expected.hpp>
#include <hdlgrader/logging.hpp>
#include <hdlgrader/version.hpp>

#include "common/terminal_checks.hpp"
#include "user/config_reader.hpp"
#include "user/program_options.hpp"

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace hdlgrader {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), HDLGRADER_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout)) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(fmt::format("hdlgrader v{}: compiles, simulates and grades HDL submissions",
                                            HDLGRADER_VERSION_STRING));

    // clang-format off

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", HDLGRADER_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("--config")
        .default_value(std::string{ProgramOptions::DEFAULT_CONFIG_PATH})
        .nargs(1)
        .metavar("FILE")
        .help("Config file with KEY = value lines. A missing default config file is not an error.");

    arg_parser_.add_argument("--assignments")
        .nargs(1)
        .metavar("IDS")
        .help("Comma separated assignment ids to grade. Overrides HDL_ASSIGNMENT_IDS.");

    arg_parser_.add_argument("-j", "--jobs")
        .nargs(1)
        .metavar("N")
        .scan<'i', int>()
        .help("Number of submissions graded in parallel. Defaults to the number of hardware threads.");

    arg_parser_.add_argument("--compile-timeout")
        .nargs(1)
        .metavar("SECONDS")
        .scan<'i', int>()
        .help("Wall-clock limit for compiling one submission.");

    arg_parser_.add_argument("--run-timeout")
        .nargs(1)
        .metavar("SECONDS")
        .scan<'i', int>()
        .help("Wall-clock limit for simulating one submission.");

    arg_parser_.add_argument("--cpu-limit")
        .nargs(1)
        .metavar("SECONDS")
        .scan<'i', int>()
        .help("CPU time limit for the compiler and the simulator. Overrides CPU_LIMIT_S.");

    arg_parser_.add_argument("--memory-limit")
        .nargs(1)
        .metavar("MB")
        .scan<'i', int>()
        .help("Address space limit for the compiler and the simulator. Overrides MEMORY_LIMIT_MB.");

    arg_parser_.add_argument("--file-size-limit")
        .nargs(1)
        .metavar("MB")
        .scan<'i', int>()
        .help("Largest file the compiler or the simulator may write. Overrides FILE_SIZE_LIMIT_MB.");

    arg_parser_.add_argument("--keep-sandboxes")
        .choices("keep", "delete", "on-failure")
        .nargs(1)
        .metavar("WHEN")
        .help("What to do with build directories after grading: keep, delete, or keep only on-failure.");

    arg_parser_.add_argument("--malformed")
        .choices("fail", "skip")
        .nargs(1)
        .metavar("POLICY")
        .help("How to count result lines that do not follow the convention.");

    arg_parser_.add_argument("--regrade")
        .flag()
        .help("Grade submissions again, even those already marked as graded.");

    {
        // Block to reduce scope of `using enum`

        using enum VerbosityLevel;

        constexpr auto DEFAULT_VERBOSITY_VALUE =
            static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
        constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(All);
        constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

        constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE;
        constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

        arg_parser_.add_argument("-v", "--verbose")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto value = static_cast<VerbosityLevelUnderlyingT>(verbosity_) + 1;

                    if (value > MAX_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification exceeds maximum level");
                    }

                    verbosity_ = static_cast<VerbosityLevel>(value);
                })
            .append()
            .help(fmt::format("Increase verbosity level (up to {}x)", MAX_VERBOSITY_INCREASE));

        arg_parser_.add_argument("-q", "--quiet")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto value = static_cast<VerbosityLevelUnderlyingT>(verbosity_) - 1;

                    if (value < MIN_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification is lower than minimum level");
                    }

                    verbosity_ = static_cast<VerbosityLevel>(value);
                })
            .append()
            .help(fmt::format("Decrease verbosity level (up to {}x)", MAX_VERBOSITY_DECREASE));

        arg_parser_.add_argument("--silent")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    verbosity_ = Silent;
                })
            .help("Sets verbosity level to 'Silent', suppressing all output except for the return code. Useful for scripting.");
    }

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    colorize_option_ = Never;
                } else if (opt == "auto") {
                    colorize_option_ = Auto;
                } else if (opt == "always") {
                    colorize_option_ = Always;
                }
        });
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    ProgramOptions opts;
    opts.verbosity = verbosity_;
    opts.colorize_option = colorize_option_;

    TRY(load_config_file(opts));

    apply_cli_overrides(opts);

    TRY(opts.validate());

    LOG_DEBUG("Program options: {}", opts);

    return opts;
}

Expected<void, std::string> CommandLineArgs::load_config_file(ProgramOptions& opts) const {
    opts.config_path = arg_parser_.get<std::string>("--config");

    std::error_code err;
    if (!std::filesystem::exists(opts.config_path, err)) {
        if (arg_parser_.is_used("--config")) {
            return fmt::format("Config file {:?} does not exist", opts.config_path.string());
        }

        LOG_INFO("No {} found; using defaults and command line options only", opts.config_path.string());
        return {};
    }

    ConfigReader reader{opts.config_path};

    auto entries = TRY(reader.read());

    return apply_config(entries, opts);
}

void CommandLineArgs::apply_cli_overrides(ProgramOptions& opts) const {
    if (auto ids = arg_parser_.present<std::string>("--assignments")) {
        opts.assignment_ids = split_list(*ids);
    }

    if (auto jobs = arg_parser_.present<int>("--jobs")) {
        opts.jobs = *jobs;
    }

    if (auto timeout = arg_parser_.present<int>("--compile-timeout")) {
        opts.compile_timeout_s = *timeout;
    }

    if (auto timeout = arg_parser_.present<int>("--run-timeout")) {
        opts.run_timeout_s = *timeout;
    }

    if (auto limit = arg_parser_.present<int>("--cpu-limit")) {
        opts.cpu_limit_s = *limit;
    }

    if (auto limit = arg_parser_.present<int>("--memory-limit")) {
        opts.memory_limit_mb = *limit;
    }

    if (auto limit = arg_parser_.present<int>("--file-size-limit")) {
        opts.file_size_limit_mb = *limit;
    }

    if (auto retention = arg_parser_.present<std::string>("--keep-sandboxes")) {
        using enum RetentionPolicy;
        opts.retention = *retention == "delete" ? Delete : (*retention == "on-failure" ? OnFailure : Keep);
    }

    if (auto malformed = arg_parser_.present<std::string>("--malformed")) {
        using enum MalformedLinePolicy;
        opts.malformed = *malformed == "skip" ? Skip : RecordAsFail;
    }

    if (arg_parser_.get<bool>("--regrade")) {
        opts.regrade = true;
    }
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print("{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)), cl_args.help_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace hdlgrader

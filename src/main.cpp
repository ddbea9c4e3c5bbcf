#include <hdlgrader/logging.hpp>

#include "app/grader_app.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <cstddef>
#include <span>
#include <utility>

int main(int argc, const char* argv[]) {
    using namespace hdlgrader;

    init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    ProgramOptions options = parse_args_or_exit(args);

    LOG_DEBUG("Program options: {}", options);

    return GraderApp{std::move(options)}.run();
}

#include <hdlgrader/toolchain/icarus.hpp>

#include <hdlgrader/toolchain/toolchain.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hdlgrader {

IcarusCompiler::IcarusCompiler(std::string executable, std::optional<std::string> top_module)
    : executable_{std::move(executable)}
    , top_module_{std::move(top_module)} {}

CommandLine IcarusCompiler::compile_command(const std::vector<std::string>& sources,
                                            const std::string& artifact) const {
    CommandLine cmd{.executable = executable_, .args = {"-o", artifact}};

    if (top_module_) {
        cmd.args.emplace_back("-s");
        cmd.args.push_back(*top_module_);
    }

    // "./" keeps a submitted file named like an option (e.g. "-y.v") from being parsed as one
    for (const std::string& src : sources) {
        cmd.args.push_back(src.starts_with('-') ? "./" + src : src);
    }

    return cmd;
}

IcarusSimulator::IcarusSimulator(std::string executable)
    : executable_{std::move(executable)} {}

CommandLine IcarusSimulator::run_command(const std::string& artifact) const {
    return {.executable = executable_, .args = {artifact}};
}

} // namespace hdlgrader

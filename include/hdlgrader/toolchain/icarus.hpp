#pragma once

#include <hdlgrader/toolchain/toolchain.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hdlgrader {

/// Icarus Verilog compiler: ``iverilog -o <artifact> [-s <top>] <sources...>``
class IcarusCompiler : public Compiler
{
public:
    static constexpr std::string_view DEFAULT_EXECUTABLE = "iverilog";

    explicit IcarusCompiler(std::string executable = std::string{DEFAULT_EXECUTABLE},
                            std::optional<std::string> top_module = std::nullopt);

    CommandLine compile_command(const std::vector<std::string>& sources, const std::string& artifact) const override;

    std::string_view name() const override { return "iverilog"; }

private:
    std::string executable_;
    std::optional<std::string> top_module_;
};

/// Icarus Verilog runtime: ``vvp <artifact>``
class IcarusSimulator : public Simulator
{
public:
    static constexpr std::string_view DEFAULT_EXECUTABLE = "vvp";

    explicit IcarusSimulator(std::string executable = std::string{DEFAULT_EXECUTABLE});

    CommandLine run_command(const std::string& artifact) const override;

    std::string_view name() const override { return "vvp"; }

private:
    std::string executable_;
};

} // namespace hdlgrader

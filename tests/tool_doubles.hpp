#pragma once

#include <hdlgrader/toolchain/toolchain.hpp>

#include <string>
#include <string_view>
#include <vector>

/// Runs tests/resources/fake_iverilog.sh through /bin/sh, so no Icarus install is needed
class ScriptCompiler : public hdlgrader::Compiler
{
public:
    hdlgrader::CommandLine compile_command(const std::vector<std::string>& sources,
                                           const std::string& artifact) const override {
        hdlgrader::CommandLine cmd{.executable = "/bin/sh",
                                   .args = {RESOURCES_DIR "/fake_iverilog.sh", "-o", artifact}};
        cmd.args.insert(cmd.args.end(), sources.begin(), sources.end());
        return cmd;
    }

    std::string_view name() const override { return "fake-iverilog"; }
};

class ScriptSimulator : public hdlgrader::Simulator
{
public:
    hdlgrader::CommandLine run_command(const std::string& artifact) const override {
        return {.executable = "/bin/sh", .args = {RESOURCES_DIR "/fake_vvp.sh", artifact}};
    }

    std::string_view name() const override { return "fake-vvp"; }
};

/// A tool that cannot be started
class MissingCompiler : public hdlgrader::Compiler
{
public:
    hdlgrader::CommandLine compile_command(const std::vector<std::string>& /*sources*/,
                                           const std::string& /*artifact*/) const override {
        return {.executable = "definitely-not-iverilog", .args = {}};
    }

    std::string_view name() const override { return "missing"; }
};

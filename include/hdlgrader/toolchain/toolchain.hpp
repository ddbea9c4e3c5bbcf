#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace hdlgrader {

/// An executable plus its arguments. Never goes through a shell.
struct CommandLine
{
    std::string executable;
    std::vector<std::string> args;
};

/// Builds a simulation artifact from HDL sources.
///
/// Every path handed to or produced by an implementation is relative to the sandbox root,
/// which is the working directory of the resulting command.
class Compiler
{
public:
    virtual ~Compiler() = default;

    /// ``sources`` are the submission's sources followed by the testbench
    virtual CommandLine compile_command(const std::vector<std::string>& sources,
                                        const std::string& artifact) const = 0;

    /// Short human-readable name, used in logs and reports
    virtual std::string_view name() const = 0;
};

/// Executes an artifact produced by a `Compiler`
class Simulator
{
public:
    virtual ~Simulator() = default;

    virtual CommandLine run_command(const std::string& artifact) const = 0;

    virtual std::string_view name() const = 0;
};

} // namespace hdlgrader

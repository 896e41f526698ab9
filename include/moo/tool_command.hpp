#pragma once

#include <moo/command.hpp>
#include <string>
#include <vector>

namespace moo::commands {

// Base for commands that hand the work to an external program and relay its
// output. Lives outside the group directories, so it is never a unit itself.
class ToolCommand : public Command {
protected:
    // Run `args` in the start directory, streaming output to ctx.out/ctx.err.
    // Returns the exit code, or nullopt when the program could not be run
    // (the reason has already been printed).
    std::optional<int> run_tool(CommandContext& ctx, const std::vector<std::string>& args,
                                int default_timeout = 300) const;

    // Print "<label> passed" / "<label> failed" and map to kSuccess / kFailure
    static int report(CommandContext& ctx, const std::string& label, std::optional<int> exit_code);
};

// Runs vendor/bin/<binary> from the project's Composer install
class VendorToolCommand : public ToolCommand {
public:
    int execute(const std::vector<std::string>& args, CommandContext& ctx) override;

protected:
    virtual std::string binary() const = 0;
    virtual std::string label() const = 0;
    virtual std::vector<std::string> tool_args() const { return {}; }
    virtual int timeout() const { return 300; }
    // Map the tool's exit code; the default treats only 0 as success
    virtual int interpret(CommandContext& ctx, std::optional<int> exit_code) const;
};

// Directory holding the Node build scripts: `build.scripts_dir` from the
// project configuration, else the install location
std::filesystem::path scripts_dir(const CommandContext& ctx);

// Runs `node <scripts_dir>/<script> <start_dir>`
class NodeScriptCommand : public ToolCommand {
public:
    int execute(const std::vector<std::string>& args, CommandContext& ctx) override;

protected:
    // Path of the script relative to scripts_dir()
    virtual std::string script(const CommandContext& ctx) const = 0;
    virtual std::string label() const = 0;
};

} // namespace moo::commands

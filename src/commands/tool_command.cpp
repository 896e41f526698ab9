#include <moo/tool_command.hpp>
#include <moo/log.hpp>

#ifndef MOO_SCRIPTS_DIR
#define MOO_SCRIPTS_DIR "/usr/local/share/moo/scripts"
#endif

namespace moo::commands {

namespace fs = std::filesystem;

std::optional<int> ToolCommand::run_tool(CommandContext& ctx,
                                         const std::vector<std::string>& args,
                                         int default_timeout) const {
    int timeout = ctx.config.get<int>("tools.timeout", default_timeout);

    auto sink = [&ctx](OutputChannel channel, const std::string& chunk) {
        std::ostream& os = channel == OutputChannel::Stdout ? ctx.out : ctx.err;
        os << chunk;
        os.flush();
    };

    auto result = ctx.run_process(args, ctx.start_dir.string(), sink, timeout);
    if (result.is_err()) {
        ctx.err << result.error().format() << "\n";
        return std::nullopt;
    }

    int code = result.value().exit_code;
    if (code == kExecFailedExitCode) {
        log::warn("'%s' exited with %d; is it installed and on PATH?",
                  args.front().c_str(), code);
    }
    return code;
}

int ToolCommand::report(CommandContext& ctx, const std::string& label,
                        std::optional<int> exit_code) {
    if (exit_code && *exit_code == 0) {
        ctx.out << label << " passed!\n";
        return kSuccess;
    }
    ctx.err << label << " failed!\n";
    return kFailure;
}

int VendorToolCommand::execute(const std::vector<std::string>& args, CommandContext& ctx) {
    fs::path tool = ctx.start_dir / "vendor" / "bin" / binary();
    if (!ctx.files.is_file(tool)) {
        MooError e{MooError::NotFound,
            binary() + " binary not found in vendor/bin",
            "run `composer install`"};
        ctx.err << e.format() << "\n";
        return kFailure;
    }

    ctx.out << "Running " << label() << "...\n";

    std::vector<std::string> argv{tool.string()};
    for (const auto& a : tool_args()) argv.push_back(a);
    for (const auto& a : args) argv.push_back(a);

    return interpret(ctx, run_tool(ctx, argv, timeout()));
}

int VendorToolCommand::interpret(CommandContext& ctx, std::optional<int> exit_code) const {
    return report(ctx, label() + " checks", exit_code);
}

fs::path scripts_dir(const CommandContext& ctx) {
    std::string configured = ctx.config.get<std::string>("build.scripts_dir", "");
    if (configured.empty()) return fs::path(MOO_SCRIPTS_DIR);

    fs::path dir(configured);
    return dir.is_absolute() ? dir : ctx.config.project_root() / dir;
}

int NodeScriptCommand::execute(const std::vector<std::string>&, CommandContext& ctx) {
    fs::path path = scripts_dir(ctx) / script(ctx);
    if (!ctx.files.is_file(path)) {
        MooError e{MooError::NotFound,
            "build script not found at: " + path.string(),
            "set build.scripts_dir in wpmoo-config.yml"};
        ctx.err << e.format() << "\n";
        return kFailure;
    }

    ctx.out << "Target: " << ctx.start_dir.string() << "\n";
    ctx.out << "Script: " << path.string() << "\n";

    return report(ctx, label(), run_tool(ctx, {"node", path.string(), ctx.start_dir.string()}));
}

} // namespace moo::commands

#include <moo/tool_command.hpp>
#include <moo/log.hpp>

namespace moo::commands {

namespace fs = std::filesystem;

// Copy every file under `from` to the same relative path under `to`.
// Files already present in `to` are replaced; nothing is deleted.
static Result<size_t> mirror_tree(Filesystem& files, const fs::path& from, const fs::path& to) {
    MOO_TRY(files.create_directories(to));

    auto entries = files.list_directory(from);
    if (entries.is_err()) return entries.error();

    size_t copied = 0;
    for (const auto& entry : entries.value()) {
        fs::path target = to / entry.path.filename();
        if (entry.is_directory) {
            auto sub = mirror_tree(files, entry.path, target);
            if (sub.is_err()) return sub.error();
            copied += sub.value();
            continue;
        }
        auto content = files.read_file(entry.path);
        if (content.is_err()) return content.error();
        MOO_TRY(files.write_file(target, content.value()));
        ++copied;
    }
    return Result<size_t>::ok(copied);
}

// Pulls the newest framework through Composer, copies it into framework/
// and re-scopes it
class UpdateCommand : public ToolCommand {
public:
    std::string name() const override { return "update"; }
    std::string description() const override {
        return "Updates the WPMoo framework and re-scopes it for the project.";
    }
    std::string usage() const override {
        return "Runs `composer update wpmoo/wpmoo`, copies vendor/wpmoo/wpmoo/framework\n"
               "into framework/, then runs scope.\n";
    }

    int execute(const std::vector<std::string>&, CommandContext& ctx) override {
        if (ctx.project.label != ContextLabel::Plugin &&
            ctx.project.label != ContextLabel::Theme) {
            ctx.err << MooError{MooError::Command,
                "the update command can only be used inside a WPMoo-based plugin or theme"}
                .format() << "\n";
            return kFailure;
        }

        ctx.out << "Running composer update for " << kFrameworkPackage << "...\n";
        if (report(ctx, "Composer update",
                   run_tool(ctx, {"composer", "update", kFrameworkPackage})) != kSuccess) {
            return kFailure;
        }

        fs::path source = ctx.start_dir / "vendor" / "wpmoo" / "wpmoo" / "framework";
        fs::path dest = ctx.start_dir / "framework";
        if (!ctx.files.is_directory(source)) {
            ctx.err << MooError{MooError::NotFound,
                "framework sources not found in vendor/wpmoo/wpmoo/framework",
                "check that " + std::string(kFrameworkPackage) + " is in composer.json"}
                .format() << "\n";
            return kFailure;
        }

        auto copied = mirror_tree(ctx.files, source, dest);
        if (copied.is_err()) {
            ctx.err << copied.error().format() << "\n";
            return kFailure;
        }
        log::debug("copied %zu framework files into %s", copied.value(), dest.string().c_str());
        ctx.out << "Copied " << copied.value() << " framework files.\n";

        if (ctx.dispatch("scope", {}) != kSuccess) {
            ctx.err << "Scoping the updated framework failed.\n";
            return kFailure;
        }

        ctx.out << "Framework update and scoping complete!\n";
        return kSuccess;
    }
};

MOO_REGISTER_COMMAND(UpdateCommand);

} // namespace moo::commands

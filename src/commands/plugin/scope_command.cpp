#include <moo/command.hpp>
#include <moo/log.hpp>

namespace moo::commands {

namespace fs = std::filesystem;

static size_t replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t count = 0;
    for (size_t pos = text.find(from); pos != std::string::npos;
         pos = text.find(from, pos + to.size())) {
        text.replace(pos, from.size(), to);
        ++count;
    }
    return count;
}

static Status collect_php_files(const Filesystem& files, const fs::path& dir,
                                std::vector<fs::path>& out) {
    auto entries = files.list_directory(dir);
    if (entries.is_err()) return entries.error();

    for (const auto& entry : entries.value()) {
        if (entry.is_directory) {
            MOO_TRY(collect_php_files(files, entry.path, out));
        } else if (entry.path.extension() == ".php") {
            out.push_back(entry.path);
        }
    }
    return ok_status();
}

// Rewrites the bundled framework under framework/ so it lives in the
// project's namespace and text domain. Applying it twice is a no-op.
class ScopeCommand : public Command {
public:
    std::string name() const override { return "scope"; }
    std::string description() const override {
        return "Scopes the WPMoo framework within a project.";
    }
    std::string usage() const override {
        return "Reads project.namespace and project.text_domain from the configuration\n"
               "and rewrites every .php file under framework/.\n";
    }

    int execute(const std::vector<std::string>&, CommandContext& ctx) override {
        if (ctx.project.label != ContextLabel::Plugin &&
            ctx.project.label != ContextLabel::Theme) {
            return fail(ctx, MooError{MooError::Command,
                "the scope command can only be used inside a WPMoo-based plugin or theme"});
        }

        fs::path framework_dir = ctx.start_dir / "framework";
        if (!ctx.files.is_directory(framework_dir)) {
            return fail(ctx, MooError{MooError::NotFound,
                "no framework directory in " + ctx.start_dir.string() + "; nothing to scope",
                "run `moo update` to fetch it"});
        }

        std::string ns = ctx.config.get<std::string>("project.namespace", "");
        std::string text_domain = ctx.config.get<std::string>("project.text_domain", "");
        if (ns.empty() || text_domain.empty()) {
            return fail(ctx, MooError{MooError::Config,
                "project.namespace or project.text_domain is not set",
                "add them to wpmoo-config.yml, or run `moo init`"});
        }
        if (ns.find("WPMoo") != std::string::npos) {
            return fail(ctx, MooError{MooError::Config,
                "the project namespace cannot contain \"WPMoo\""});
        }

        ctx.out << "Scoping framework with namespace `" << ns
                << "` and text domain `" << text_domain << "`.\n";

        std::vector<fs::path> sources;
        auto listed = collect_php_files(ctx.files, framework_dir, sources);
        if (listed.is_err()) return fail(ctx, listed.error());

        size_t scoped = 0;
        for (const auto& path : sources) {
            auto content = ctx.files.read_file(path);
            if (content.is_err()) return fail(ctx, content.error());

            std::string text = content.value();
            size_t changes = 0;
            changes += replace_all(text, "namespace WPMoo", "namespace " + ns + "\\WPMoo");
            changes += replace_all(text, "use WPMoo", "use " + ns + "\\WPMoo");
            changes += replace_all(text, "@package WPMoo", "@package " + ns);
            changes += replace_all(text, ", 'wpmoo')", ", '" + text_domain + "')");
            if (changes == 0) continue;

            auto written = ctx.files.write_file(path, text);
            if (written.is_err()) return fail(ctx, written.error());
            log::debug("scoped %s (%zu replacements)", path.string().c_str(), changes);
            ++scoped;
        }

        ctx.out << "Scoping complete. " << scoped << " files modified.\n";
        return kSuccess;
    }

private:
    static int fail(CommandContext& ctx, const MooError& e) {
        ctx.err << e.format() << "\n";
        return kFailure;
    }
};

MOO_REGISTER_COMMAND(ScopeCommand);

} // namespace moo::commands

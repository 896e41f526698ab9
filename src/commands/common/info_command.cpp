#include <moo/command.hpp>

namespace moo::commands {

class InfoCommand : public Command {
public:
    std::string name() const override { return "info"; }
    std::string description() const override {
        return "Show the detected project context and configuration sources";
    }

    int execute(const std::vector<std::string>&, CommandContext& ctx) override {
        const ProjectContext& project = ctx.project;

        ctx.out << "Context:       " << context_label_name(project.label);
        if (project.signal != ContextSignal::None) {
            ctx.out << " (" << context_signal_name(project.signal) << ")";
        }
        ctx.out << "\n";

        ctx.out << "Manifest:      ";
        if (project.manifest_path) {
            ctx.out << project.manifest_path->string();
            if (project.manifest && !project.manifest->name.empty()) {
                ctx.out << " [" << project.manifest->name;
                if (!project.manifest->version.empty()) {
                    ctx.out << " " << project.manifest->version;
                }
                ctx.out << "]";
            } else if (!project.manifest) {
                ctx.out << " (unreadable)";
            }
        } else {
            ctx.out << "none";
        }
        ctx.out << "\n";

        if (project.marker_file) {
            ctx.out << "Header file:   " << project.marker_file->string() << "\n";
        }

        ctx.out << "Project root:  " << ctx.config.project_root().string();
        if (!ctx.config.found()) ctx.out << " (no configuration found)";
        ctx.out << "\n";

        ctx.out << "Config files:";
        if (ctx.config.sources().empty()) {
            ctx.out << "  none\n";
        } else {
            ctx.out << "\n";
            for (const auto& source : ctx.config.sources()) {
                ctx.out << "  " << source.string() << "\n";
            }
        }

        std::string project_name = ctx.config.get<std::string>("project.name", "");
        if (!project_name.empty()) {
            ctx.out << "Project name:  " << project_name << "\n";
        }
        return kSuccess;
    }
};

MOO_REGISTER_COMMAND(InfoCommand);

} // namespace moo::commands

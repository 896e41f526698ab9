#include <moo/command.hpp>

namespace moo::commands {

// Prints the merged configuration, or one dotted key of it, as YAML
class ConfigCommand : public Command {
public:
    std::string name() const override { return "config"; }
    std::string description() const override {
        return "Print the merged project configuration or one key of it";
    }
    std::string usage() const override {
        return "Arguments:\n  key  Dotted path into the configuration, e.g. project.name\n";
    }

    int execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        if (args.size() > 1) {
            ctx.err << MooError{MooError::InvalidArg, "config takes at most one key",
                                "usage: moo config [key]"}.format() << "\n";
            return kFailure;
        }

        YAML::Node node = args.empty() ? ctx.config.all() : ctx.config.get(args.front());
        if (!node.IsDefined()) {
            ctx.err << MooError{MooError::NotFound,
                "configuration key '" + args.front() + "' is not set"}.format() << "\n";
            return kFailure;
        }

        if (node.IsScalar()) {
            ctx.out << node.Scalar() << "\n";
            return kSuccess;
        }

        YAML::Emitter emitter;
        emitter << node;
        ctx.out << emitter.c_str() << "\n";
        return kSuccess;
    }
};

MOO_REGISTER_COMMAND(ConfigCommand);

} // namespace moo::commands

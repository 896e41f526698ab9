#include <moo/tool_command.hpp>

namespace moo::commands {

// The framework and the projects built on it ship different style entry points
class BuildStylesCommand : public NodeScriptCommand {
public:
    std::string name() const override { return "build:styles"; }
    std::string description() const override { return "Compile WPMoo styles (SCSS to CSS)"; }

protected:
    std::string script(const CommandContext& ctx) const override {
        return ctx.project.label == ContextLabel::Framework
            ? "framework/build-styles.js"
            : "plugin/build-styles.js";
    }
    std::string label() const override { return "Style build"; }
};

MOO_REGISTER_COMMAND(BuildStylesCommand);

} // namespace moo::commands

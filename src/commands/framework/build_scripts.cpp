#include <moo/tool_command.hpp>

namespace moo::commands {

class BuildScriptsCommand : public NodeScriptCommand {
public:
    std::string name() const override { return "build:scripts"; }
    std::string description() const override { return "Compile WPMoo scripts"; }

protected:
    std::string script(const CommandContext&) const override {
        return "common/build-scripts.js";
    }
    std::string label() const override { return "Script build"; }
};

MOO_REGISTER_COMMAND(BuildScriptsCommand);

} // namespace moo::commands

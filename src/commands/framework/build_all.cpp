#include <moo/command.hpp>

namespace moo::commands {

class BuildAllCommand : public Command {
public:
    std::string name() const override { return "build:all"; }
    std::string description() const override { return "Build all project assets"; }
    std::vector<std::string> aliases() const override { return {"build"}; }
    std::string usage() const override {
        return "Runs build:styles, then build:scripts; stops at the first failure.\n";
    }

    int execute(const std::vector<std::string>&, CommandContext& ctx) override {
        for (const char* step : {"build:styles", "build:scripts"}) {
            if (ctx.dispatch(step, {}) != kSuccess) {
                ctx.err << "Build stopped: " << step << " failed.\n";
                return kFailure;
            }
        }
        ctx.out << "All assets built.\n";
        return kSuccess;
    }
};

MOO_REGISTER_COMMAND(BuildAllCommand);

} // namespace moo::commands

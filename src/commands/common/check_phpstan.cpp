#include <moo/tool_command.hpp>

namespace moo::commands {

class CheckPhpstanCommand : public VendorToolCommand {
public:
    std::string name() const override { return "check:phpstan"; }
    std::string description() const override { return "Runs PHPStan static analysis."; }

protected:
    std::string binary() const override { return "phpstan"; }
    std::string label() const override { return "PHPStan"; }
    std::vector<std::string> tool_args() const override {
        return {"analyse", "--no-progress", "--memory-limit=512M"};
    }
    int timeout() const override { return 600; }
};

MOO_REGISTER_COMMAND(CheckPhpstanCommand);

} // namespace moo::commands

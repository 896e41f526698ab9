#include <moo/tool_command.hpp>

namespace moo::commands {

class CheckPhpcsCommand : public VendorToolCommand {
public:
    std::string name() const override { return "check:phpcs"; }
    std::string description() const override { return "Runs PHPCS checks."; }

protected:
    std::string binary() const override { return "phpcs"; }
    std::string label() const override { return "PHPCS"; }
    std::vector<std::string> tool_args() const override {
        return {"-n", "--ignore=dist/"};
    }
};

MOO_REGISTER_COMMAND(CheckPhpcsCommand);

} // namespace moo::commands

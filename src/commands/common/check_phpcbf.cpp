#include <moo/tool_command.hpp>

namespace moo::commands {

// phpcbf exits 1 when it fixed something and 2 when errors remain
class CheckPhpcbfCommand : public VendorToolCommand {
public:
    std::string name() const override { return "check:phpcbf"; }
    std::string description() const override { return "Runs PHPCBF to fix coding standards."; }

protected:
    std::string binary() const override { return "phpcbf"; }
    std::string label() const override { return "PHPCBF"; }

    int interpret(CommandContext& ctx, std::optional<int> exit_code) const override {
        if (!exit_code) {
            ctx.err << "PHPCBF failed to run!\n";
            return kFailure;
        }
        switch (*exit_code) {
            case 0:
                ctx.out << "No fixable errors found.\n";
                return kSuccess;
            case 1:
                ctx.out << "PHPCBF fixed some errors.\n";
                return kSuccess;
            case 2:
                ctx.err << "PHPCBF failed to fix all errors.\n";
                return kFailure;
            default:
                ctx.err << "PHPCBF failed to run!\n";
                return kFailure;
        }
    }
};

MOO_REGISTER_COMMAND(CheckPhpcbfCommand);

} // namespace moo::commands

#include <moo/command.hpp>
#include <moo/log.hpp>
#include <cctype>

namespace moo::commands {

namespace fs = std::filesystem;

// "my-cool_plugin" -> "MyCoolPlugin"
static std::string studly_case(const std::string& slug) {
    std::string out;
    bool upper = true;
    for (char c : slug) {
        if (c == '-' || c == '_' || c == ' ' || c == '.') {
            upper = true;
            continue;
        }
        if (!std::isalnum(static_cast<unsigned char>(c))) continue;
        out += upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
        upper = false;
    }
    return out;
}

static std::string slugify(const std::string& name) {
    std::string out;
    for (char c : name) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            out += static_cast<char>(std::tolower(uc));
        } else if (!out.empty() && out.back() != '-') {
            out += '-';
        }
    }
    while (!out.empty() && out.back() == '-') out.pop_back();
    return out;
}

// Writes a starter wpmoo-config.yml for the project in the current directory
class InitCommand : public Command {
public:
    std::string name() const override { return "init"; }
    std::string description() const override {
        return "Create a wpmoo-config.yml for this project";
    }
    std::string usage() const override {
        return "Options:\n  --force  Overwrite an existing wpmoo-config.yml\n";
    }

    int execute(const std::vector<std::string>& args, CommandContext& ctx) override {
        bool force = false;
        for (const auto& a : args) {
            if (a == "--force" || a == "-f") {
                force = true;
            } else {
                ctx.err << MooError{MooError::InvalidArg, "unknown argument '" + a + "'",
                                    "usage: moo init [--force]"}.format() << "\n";
                return kFailure;
            }
        }

        fs::path target = ctx.start_dir / kLegacyConfigFile;
        if (ctx.files.is_file(target) && !force) {
            ctx.err << MooError{MooError::Config, target.string() + " already exists",
                                "pass --force to overwrite it"}.format() << "\n";
            return kFailure;
        }

        // Package part of "vendor/package", else the directory name
        std::string base = ctx.start_dir.filename().string();
        if (ctx.project.manifest && !ctx.project.manifest->name.empty()) {
            const std::string& pkg = ctx.project.manifest->name;
            base = pkg.substr(pkg.find('/') == std::string::npos ? 0 : pkg.find('/') + 1);
        }
        std::string slug = slugify(base);
        if (slug.empty()) slug = "project";

        YAML::Node data(YAML::NodeType::Map);
        data["project"]["name"] = studly_case(slug);
        data["project"]["slug"] = slug;
        data["project"]["namespace"] = studly_case(slug);
        data["project"]["text_domain"] = slug;

        auto saved = ConfigStore::save(ctx.start_dir, data, ctx.files);
        if (saved.is_err()) {
            ctx.err << saved.error().format() << "\n";
            return kFailure;
        }

        log::info("wrote %s", target.string().c_str());
        ctx.out << "Created " << target.string() << "\n";
        return kSuccess;
    }
};

MOO_REGISTER_COMMAND(InitCommand);

} // namespace moo::commands

#pragma once

#include <moo/command.hpp>
#include <moo/config.hpp>
#include <moo/project.hpp>
#include <moo/registry.hpp>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace moo {

const char* moo_version();

struct GlobalOptions {
    bool help = false;
    bool quiet = false;
    bool verbose = false;
    bool version = false;
    std::optional<bool> ansi;                          // --ansi / --no-ansi
    std::optional<std::filesystem::path> working_dir;  // -d / --working-dir
    std::string command;                               // empty: list
    std::vector<std::string> args;                     // everything after the command
};

// Options are recognized up to the command name; after it only -h/--help
// is taken, everything else is passed to the command untouched.
Result<GlobalOptions> parse_global_options(const std::vector<std::string>& argv);

// Resolves the project context and configuration for one start directory,
// builds the matching command registry and dispatches commands against it.
class Application {
public:
    Application(const std::filesystem::path& start_dir, Filesystem& files,
                std::ostream& out, std::ostream& err,
                const CommandCatalog& catalog = CommandCatalog::global());

    int run(const GlobalOptions& opts);

    // Run one registered command; unknown names print an error and return kFailure
    int dispatch(const std::string& name, const std::vector<std::string>& args);

    void print_list() const;
    int print_help(const std::string& name) const;

    const std::filesystem::path& start_dir() const { return start_dir_; }
    const ProjectContext& project() const { return project_; }
    const ConfigStore& config() const { return config_; }
    const CommandRegistry& registry() const { return registry_; }

    // Replaces the default subprocess runner (tests)
    void set_process_runner(ProcessRunner runner) { runner_ = std::move(runner); }

private:
    std::filesystem::path start_dir_;
    Filesystem& files_;
    std::ostream& out_;
    std::ostream& err_;
    ProjectContext project_;
    ConfigStore config_;
    CommandRegistry registry_;
    ProcessRunner runner_;
};

// Full command-line entry point below main(): parses options, applies the
// logging flags, resolves `cwd` (or --working-dir) and runs the command.
int run_cli(const std::vector<std::string>& argv, const std::filesystem::path& cwd,
            Filesystem& files, std::ostream& out, std::ostream& err,
            const CommandCatalog& catalog = CommandCatalog::global());

} // namespace moo

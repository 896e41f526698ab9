#include <moo/app.hpp>
#include <moo/log.hpp>
#include <algorithm>

#ifndef MOO_VERSION
#define MOO_VERSION "dev-main"
#endif

namespace moo {

namespace fs = std::filesystem;

const char* moo_version() {
    return MOO_VERSION;
}

// ---------------------------------------------------------------------------
// Option parsing
// ---------------------------------------------------------------------------

Result<GlobalOptions> parse_global_options(const std::vector<std::string>& argv) {
    GlobalOptions opts;

    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];

        if (!opts.command.empty()) {
            if (arg == "-h" || arg == "--help") {
                opts.help = true;
            } else {
                opts.args.push_back(arg);
            }
            continue;
        }

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--ansi") {
            opts.ansi = true;
        } else if (arg == "--no-ansi") {
            opts.ansi = false;
        } else if (arg == "-V" || arg == "--version") {
            opts.version = true;
        } else if (arg == "-d" || arg == "--working-dir") {
            if (i + 1 >= argv.size()) {
                return MooError{MooError::InvalidArg,
                    "option " + arg + " requires a directory"};
            }
            opts.working_dir = fs::path(argv[++i]);
        } else if (arg.rfind("--working-dir=", 0) == 0) {
            opts.working_dir = fs::path(arg.substr(std::string("--working-dir=").size()));
        } else if (!arg.empty() && arg[0] == '-') {
            return MooError{MooError::InvalidArg,
                "unknown option '" + arg + "'",
                "run `moo list` to see the global options"};
        } else {
            opts.command = arg;
        }
    }

    return Result<GlobalOptions>::ok(std::move(opts));
}

// ---------------------------------------------------------------------------
// Application
// ---------------------------------------------------------------------------

Application::Application(const fs::path& start_dir, Filesystem& files,
                         std::ostream& out, std::ostream& err,
                         const CommandCatalog& catalog)
    : start_dir_(files.absolute(start_dir)),
      files_(files),
      out_(out),
      err_(err),
      project_(ProjectClassifier(files).identify(start_dir_)),
      config_(ConfigStore::load(start_dir_, files)),
      registry_(CommandRegistry::build(project_.label, catalog)),
      runner_(&run_process) {}

int Application::run(const GlobalOptions& opts) {
    if (opts.version) {
        out_ << "moo " << moo_version() << "\n";
        return kSuccess;
    }

    if (opts.command.empty() || opts.command == "list") {
        print_list();
        return kSuccess;
    }

    if (opts.command == "help") {
        if (opts.args.empty()) {
            print_list();
            return kSuccess;
        }
        return print_help(opts.args.front());
    }

    if (opts.help) {
        return print_help(opts.command);
    }

    return dispatch(opts.command, opts.args);
}

int Application::dispatch(const std::string& name, const std::vector<std::string>& args) {
    Command* command = registry_.find(name);
    if (!command) {
        MooError e{MooError::Command,
            "command '" + name + "' is not available here",
            std::string("this directory resolves to a '") +
                context_label_name(project_.label) +
                "' project; run `moo list` to see its commands"};
        err_ << e.format() << "\n";
        return kFailure;
    }

    CommandContext ctx{
        start_dir_,
        project_,
        config_,
        files_,
        out_,
        err_,
        [this](const std::string& n, const std::vector<std::string>& a) {
            return dispatch(n, a);
        },
        runner_,
    };

    log::debug("running '%s'", command->name().c_str());
    return command->execute(args, ctx);
}

static const char* kBuiltinHelp = "Display help for a command";
static const char* kBuiltinList = "List commands";

void Application::print_list() const {
    out_ << "moo " << moo_version() << "\n\n";
    out_ << "Usage:\n";
    out_ << "  moo [options] <command> [arguments]\n\n";

    out_ << "Options:\n";
    out_ << "  -h, --help               Display help for the given command\n";
    out_ << "  -q, --quiet              Silence log messages\n";
    out_ << "  -v, --verbose            Show debug log messages\n";
    out_ << "      --ansi|--no-ansi     Force or disable colored log output\n";
    out_ << "  -d, --working-dir <dir>  Run as if started in <dir>\n";
    out_ << "  -V, --version            Display the application version\n\n";

    out_ << "Project: " << context_label_name(project_.label);
    if (project_.signal != ContextSignal::None) {
        out_ << " (" << context_signal_name(project_.signal) << ")";
    }
    out_ << "\n\n";

    size_t width = std::string("help").size();
    for (const auto& desc : registry_.descriptors()) {
        width = std::max(width, desc.name.size());
    }

    auto row = [this, width](const std::string& name, const std::string& text) {
        out_ << "  " << name << std::string(width - name.size() + 2, ' ') << text << "\n";
    };

    out_ << "Available commands:\n";
    row("help", kBuiltinHelp);
    row("list", kBuiltinList);

    for (CommandGroup group : registry_.groups()) {
        bool header = false;
        for (const auto& desc : registry_.descriptors()) {
            if (desc.group != group) continue;
            if (!header) {
                out_ << " " << command_group_name(group) << "\n";
                header = true;
            }
            row(desc.name, desc.description);
        }
    }
}

int Application::print_help(const std::string& name) const {
    if (name == "help" || name == "list") {
        out_ << "Description:\n  " << (name == "help" ? kBuiltinHelp : kBuiltinList) << "\n\n";
        out_ << "Usage:\n  moo " << name << (name == "help" ? " <command>" : "") << "\n";
        return kSuccess;
    }

    const CommandDescriptor* desc = registry_.describe(name);
    if (!desc) {
        MooError e{MooError::Command,
            "command '" + name + "' is not available here",
            "run `moo list` to see the available commands"};
        err_ << e.format() << "\n";
        return kFailure;
    }

    out_ << "Description:\n  " << desc->description << "\n\n";
    out_ << "Usage:\n  moo " << desc->name << "\n";
    if (!desc->aliases.empty()) {
        out_ << "\nAliases:\n ";
        for (const auto& alias : desc->aliases) out_ << " " << alias;
        out_ << "\n";
    }

    std::string usage = registry_.find(name)->usage();
    if (!usage.empty()) {
        out_ << "\n" << usage;
        if (usage.back() != '\n') out_ << "\n";
    }

    out_ << "\nGroup: " << command_group_name(desc->group)
         << " (" << desc->identifier << ")\n";
    return kSuccess;
}

// ---------------------------------------------------------------------------
// Entry point
// ---------------------------------------------------------------------------

int run_cli(const std::vector<std::string>& argv, const fs::path& cwd,
            Filesystem& files, std::ostream& out, std::ostream& err,
            const CommandCatalog& catalog) {
    auto parsed = parse_global_options(argv);
    if (parsed.is_err()) {
        err << parsed.error().format() << "\n";
        return kFailure;
    }
    const GlobalOptions& opts = parsed.value();

    if (opts.quiet) {
        log::set_level(log::Off);
    } else if (opts.verbose) {
        log::set_level(log::Debug);
    }
    if (opts.ansi) {
        log::set_color_mode(*opts.ansi ? log::ColorMode::Always : log::ColorMode::Never);
    }

    fs::path start = cwd;
    if (opts.working_dir) {
        start = opts.working_dir->is_absolute() ? *opts.working_dir : cwd / *opts.working_dir;
        if (!files.is_directory(start)) {
            MooError e{MooError::InvalidArg,
                "working directory does not exist: " + opts.working_dir->string()};
            err << e.format() << "\n";
            return kFailure;
        }
    }

    Application app(start, files, out, err, catalog);
    return app.run(opts);
}

} // namespace moo

#include <catch2/catch.hpp>
#include <moo/app.hpp>
#include <moo/log.hpp>
#include <sstream>

using namespace moo;
namespace fs = std::filesystem;

namespace {

struct CliRun {
    int code = -1;
    std::string out;
    std::string err;
};

CliRun run(MemoryFilesystem& files, const std::vector<std::string>& argv,
           const fs::path& cwd = "/proj") {
    std::ostringstream out, err;
    CliRun r;
    r.code = run_cli(argv, cwd, files, out, err);
    r.out = out.str();
    r.err = err.str();
    log::set_level(log::Info);
    log::set_color_mode(log::ColorMode::Auto);
    return r;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

// ===== Option parsing =====

TEST_CASE("parse_global_options before the command", "[app]") {
    auto r = parse_global_options({"-v", "--no-ansi", "-d", "sub", "config", "project.name"});
    REQUIRE(r.is_ok());
    const auto& o = r.value();
    REQUIRE(o.verbose);
    REQUIRE(o.ansi == false);
    REQUIRE(o.working_dir == fs::path("sub"));
    REQUIRE(o.command == "config");
    REQUIRE(o.args == std::vector<std::string>{"project.name"});
}

TEST_CASE("parse_global_options passes command options through", "[app]") {
    auto r = parse_global_options({"init", "--force", "-q", "--help"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().command == "init");
    REQUIRE(r.value().args == std::vector<std::string>{"--force", "-q"});
    REQUIRE(r.value().help);
    REQUIRE_FALSE(r.value().quiet);
}

TEST_CASE("parse_global_options --working-dir=", "[app]") {
    auto r = parse_global_options({"--working-dir=/srv/site", "--ansi"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().working_dir == fs::path("/srv/site"));
    REQUIRE(r.value().ansi == true);
    REQUIRE(r.value().command.empty());
}

TEST_CASE("parse_global_options errors", "[app]") {
    auto unknown = parse_global_options({"--bogus"});
    REQUIRE(unknown.is_err());
    REQUIRE(unknown.error().code == MooError::InvalidArg);

    auto missing = parse_global_options({"-d"});
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == MooError::InvalidArg);
}

// ===== Listing =====

TEST_CASE("list in an unknown directory shows only common commands", "[app]") {
    MemoryFilesystem files;
    files.add_directory("/proj");

    auto r = run(files, {});
    REQUIRE(r.code == 0);
    REQUIRE(contains(r.out, "Project: unknown"));
    REQUIRE(contains(r.out, " common\n"));
    REQUIRE(contains(r.out, "  info "));
    REQUIRE(contains(r.out, "  check:all "));
    REQUIRE_FALSE(contains(r.out, " framework\n"));
    REQUIRE_FALSE(contains(r.out, "build:all"));
    REQUIRE_FALSE(contains(r.out, "scope"));
}

TEST_CASE("list in a plugin shows all three groups", "[app]") {
    MemoryFilesystem files;
    files.add_file("/proj/composer.json", R"({"type":"wordpress-plugin"})");

    auto r = run(files, {"list"});
    REQUIRE(r.code == 0);
    REQUIRE(contains(r.out, "Project: plugin (manifest type)"));
    auto common = r.out.find(" common\n");
    auto framework = r.out.find(" framework\n");
    auto plugin = r.out.find(" plugin\n");
    REQUIRE(common != std::string::npos);
    REQUIRE(framework != std::string::npos);
    REQUIRE(plugin != std::string::npos);
    REQUIRE(common < framework);
    REQUIRE(framework < plugin);
    REQUIRE(contains(r.out, "  build:all "));
    REQUIRE(contains(r.out, "  scope "));
    REQUIRE(contains(r.out, "  update "));
}

TEST_CASE("list in the framework omits plugin commands", "[app]") {
    MemoryFilesystem files;
    files.add_file("/proj/composer.json", R"({"name":"wpmoo/wpmoo"})");

    auto r = run(files, {"list"});
    REQUIRE(contains(r.out, "  build:styles "));
    REQUIRE_FALSE(contains(r.out, " plugin\n"));
}

TEST_CASE("list pads command names to a common width", "[app]") {
    MemoryFilesystem files;
    files.add_directory("/proj");

    auto r = run(files, {"list"});
    // "check:phpstan" is the longest common name
    REQUIRE(contains(r.out, "  help           Display help for a command\n"));
    REQUIRE(contains(r.out, "  check:phpstan  "));
}

// ===== Dispatch =====

TEST_CASE("--version prints the version", "[app]") {
    MemoryFilesystem files;
    files.add_directory("/proj");

    auto r = run(files, {"-V"});
    REQUIRE(r.code == 0);
    REQUIRE(r.out == std::string("moo ") + moo_version() + "\n");
}

TEST_CASE("unknown command exits 1 with a hint", "[app]") {
    MemoryFilesystem files;
    files.add_directory("/proj");

    auto r = run(files, {"frobnicate"});
    REQUIRE(r.code == 1);
    REQUIRE(contains(r.err, "error[Command]: command 'frobnicate' is not available here"));
    REQUIRE(contains(r.err, "hint:"));
}

TEST_CASE("plugin commands are unavailable outside a plugin", "[app]") {
    MemoryFilesystem files;
    files.add_file("/proj/composer.json", R"({"name":"wpmoo/wpmoo"})");

    auto r = run(files, {"scope"});
    REQUIRE(r.code == 1);
    REQUIRE(contains(r.err, "'framework' project"));
}

TEST_CASE("unknown global option exits 1", "[app]") {
    MemoryFilesystem files;
    files.add_directory("/proj");

    auto r = run(files, {"--bogus"});
    REQUIRE(r.code == 1);
    REQUIRE(contains(r.err, "error[InvalidArg]"));
}

TEST_CASE("--working-dir resolves relative to the current directory", "[app]") {
    MemoryFilesystem files;
    files.add_file("/srv/site/wpmoo-config.yml", "project:\n  name: Site\n");

    auto r = run(files, {"-d", "site", "config", "project.name"}, "/srv");
    REQUIRE(r.code == 0);
    REQUIRE(r.out == "Site\n");
}

TEST_CASE("--working-dir must exist", "[app]") {
    MemoryFilesystem files;
    files.add_directory("/proj");

    auto r = run(files, {"--working-dir", "/missing", "list"});
    REQUIRE(r.code == 1);
    REQUIRE(contains(r.err, "working directory does not exist"));
}

TEST_CASE("--quiet silences logging for the run", "[app]") {
    MemoryFilesystem files;
    files.add_directory("/proj");

    std::ostringstream out, err;
    run_cli({"-q", "list"}, "/proj", files, out, err);
    REQUIRE(log::get_level() == log::Off);
    log::set_level(log::Info);
}

// ===== Help =====

TEST_CASE("help describes a command by alias", "[app]") {
    MemoryFilesystem files;
    files.add_file("/proj/composer.json", R"({"type":"wordpress-theme"})");

    auto r = run(files, {"help", "build"});
    REQUIRE(r.code == 0);
    REQUIRE(contains(r.out, "Build all project assets"));
    REQUIRE(contains(r.out, "moo build:all"));
    REQUIRE(contains(r.out, "Aliases:\n  build"));
    REQUIRE(contains(r.out, "Group: framework (moo::commands::framework::build_all)"));
}

TEST_CASE("command --help shows help instead of running", "[app]") {
    MemoryFilesystem files;
    files.add_directory("/proj");

    auto r = run(files, {"init", "--help"});
    REQUIRE(r.code == 0);
    REQUIRE(contains(r.out, "--force"));
    REQUIRE_FALSE(files.is_file("/proj/wpmoo-config.yml"));
}

TEST_CASE("help for an unavailable command fails", "[app]") {
    MemoryFilesystem files;
    files.add_directory("/proj");

    auto r = run(files, {"help", "scope"});
    REQUIRE(r.code == 1);
}

// ===== Application =====

TEST_CASE("Application resolves context and config once", "[app]") {
    MemoryFilesystem files;
    files.add_file("/proj/composer.json", R"({"require":{"wpmoo/wpmoo":"^1"}})");
    files.add_file("/proj/wpmoo-config.yml", "project:\n  name: Foo\n");
    files.add_directory("/proj/src");

    std::ostringstream out, err;
    Application app("/proj/src/", files, out, err);
    REQUIRE(app.start_dir() == fs::path("/proj/src"));
    REQUIRE(app.project().label == ContextLabel::Plugin);
    REQUIRE(app.project().signal == ContextSignal::ManifestDependency);
    REQUIRE(app.config().project_root() == fs::path("/proj"));
    REQUIRE(app.registry().groups().size() == 3);
}

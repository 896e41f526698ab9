#include <catch2/catch.hpp>
#include <moo/registry.hpp>
#include <moo/log.hpp>

using namespace moo;

namespace {

class NamedCommand : public Command {
public:
    NamedCommand(std::string name, std::vector<std::string> aliases = {})
        : name_(std::move(name)), aliases_(std::move(aliases)) {}

    std::string name() const override { return name_; }
    std::string description() const override { return "does " + name_; }
    std::vector<std::string> aliases() const override { return aliases_; }
    int execute(const std::vector<std::string>&, CommandContext&) override { return kSuccess; }

private:
    std::string name_;
    std::vector<std::string> aliases_;
};

struct Info : NamedCommand { Info() : NamedCommand("info") {} };
struct Build : NamedCommand { Build() : NamedCommand("build:all", {"build"}) {} };
struct Scope : NamedCommand { Scope() : NamedCommand("scope") {} };
struct Shadow : NamedCommand { Shadow() : NamedCommand("info") {} };
struct AliasClash : NamedCommand { AliasClash() : NamedCommand("build:other", {"build"}) {} };

// Units that live in a command directory but are not commands
struct Helper {};
class AbstractBase : public Command {};

CommandUnit unit_with(const std::string& source, std::function<std::unique_ptr<Command>()> f) {
    CommandUnit unit;
    unit.source = source;
    unit.factory = std::move(f);
    return unit;
}

template<typename T>
CommandUnit unit_at(const std::string& source) {
    return make_command_unit<T>(("/build/src/commands/" + source).c_str());
}

std::vector<std::string> names(const CommandRegistry& registry) {
    std::vector<std::string> out;
    for (const auto& d : registry.descriptors()) out.push_back(d.name);
    return out;
}

struct QuietLog {
    QuietLog() { moo::log::set_level(moo::log::Off); }
    ~QuietLog() { moo::log::set_level(moo::log::Info); }
};

} // namespace

// ===== Eligibility =====

TEST_CASE("eligible groups per context", "[registry]") {
    using G = std::vector<CommandGroup>;
    REQUIRE(CommandRegistry::eligible_groups(ContextLabel::Unknown) == G{CommandGroup::Common});
    REQUIRE(CommandRegistry::eligible_groups(ContextLabel::CliTool) == G{CommandGroup::Common});
    REQUIRE(CommandRegistry::eligible_groups(ContextLabel::Framework) ==
            G{CommandGroup::Common, CommandGroup::Framework});
    REQUIRE(CommandRegistry::eligible_groups(ContextLabel::Plugin) ==
            G{CommandGroup::Common, CommandGroup::Framework, CommandGroup::Plugin});
    REQUIRE(CommandRegistry::eligible_groups(ContextLabel::Theme) ==
            G{CommandGroup::Common, CommandGroup::Framework, CommandGroup::Plugin});
}

// ===== Unit paths =====

TEST_CASE("unit_source_path strips everything up to the commands root", "[registry]") {
    REQUIRE(unit_source_path("/home/u/moo/src/commands/plugin/scope_command.cpp") ==
            "plugin/scope_command.cpp");
    REQUIRE(unit_source_path("C:\\work\\moo\\src\\commands\\common\\info.cpp") ==
            "common/info.cpp");
    REQUIRE(unit_source_path("commands/framework/build_all.cpp") == "framework/build_all.cpp");
    // Only the innermost commands/ directory counts
    REQUIRE(unit_source_path("/commands/src/commands/common/x.cpp") == "common/x.cpp");
}

TEST_CASE("unit_group and unit_identifier", "[registry]") {
    REQUIRE(unit_group("plugin/scope_command.cpp") == CommandGroup::Plugin);
    REQUIRE(unit_group("framework/build_all.cpp") == CommandGroup::Framework);
    REQUIRE_FALSE(unit_group("tool_command.cpp").has_value());
    REQUIRE_FALSE(unit_group("extras/x.cpp").has_value());

    REQUIRE(unit_identifier("plugin/scope_command.cpp") ==
            "moo::commands::plugin::scope_command");
    REQUIRE(unit_identifier("common/check_all.cpp") == "moo::commands::common::check_all");
}

TEST_CASE("is_command_v accepts only concrete default-constructible commands", "[registry]") {
    STATIC_REQUIRE(is_command_v<Info>);
    STATIC_REQUIRE_FALSE(is_command_v<Helper>);
    STATIC_REQUIRE_FALSE(is_command_v<AbstractBase>);
    STATIC_REQUIRE_FALSE(is_command_v<NamedCommand>);
}

TEST_CASE("make_command_unit leaves non-commands without a factory", "[registry]") {
    auto helper = unit_at<Helper>("common/helper.cpp");
    REQUIRE(helper.source == "common/helper.cpp");
    REQUIRE_FALSE(helper.factory);

    auto info = unit_at<Info>("common/info.cpp");
    REQUIRE(info.factory);
    REQUIRE(info.factory()->name() == "info");
}

// ===== Catalog =====

TEST_CASE("catalog returns a group's units sorted by source", "[registry]") {
    QuietLog quiet;
    CommandCatalog catalog;
    catalog.add(unit_at<Scope>("plugin/scope.cpp"));
    catalog.add(unit_at<Info>("common/zeta.cpp"));
    catalog.add(unit_at<Build>("framework/build.cpp"));
    catalog.add(unit_at<Info>("common/alpha.cpp"));
    catalog.add(unit_at<Info>("tool_command.cpp"));

    REQUIRE(catalog.size() == 5);
    auto common = catalog.units(CommandGroup::Common);
    REQUIRE(common.size() == 2);
    REQUIRE(common[0]->source == "common/alpha.cpp");
    REQUIRE(common[1]->source == "common/zeta.cpp");
    REQUIRE(catalog.units(CommandGroup::Plugin).size() == 1);
}

TEST_CASE("the global catalog holds the built-in commands", "[registry]") {
    auto common = CommandCatalog::global().units(CommandGroup::Common);
    REQUIRE_FALSE(common.empty());
    REQUIRE_FALSE(CommandCatalog::global().units(CommandGroup::Framework).empty());
    REQUIRE_FALSE(CommandCatalog::global().units(CommandGroup::Plugin).empty());
}

// ===== Registry =====

TEST_CASE("registry registers eligible groups in order", "[registry]") {
    CommandCatalog catalog;
    catalog.add(unit_at<Scope>("plugin/scope.cpp"));
    catalog.add(unit_at<Build>("framework/build.cpp"));
    catalog.add(unit_at<Info>("common/info.cpp"));

    auto plugin = CommandRegistry::build(ContextLabel::Plugin, catalog);
    REQUIRE(names(plugin) == std::vector<std::string>{"info", "build:all", "scope"});
    REQUIRE(plugin.descriptors()[2].group == CommandGroup::Plugin);
    REQUIRE(plugin.descriptors()[2].identifier == "moo::commands::plugin::scope");

    auto framework = CommandRegistry::build(ContextLabel::Framework, catalog);
    REQUIRE(names(framework) == std::vector<std::string>{"info", "build:all"});

    auto unknown = CommandRegistry::build(ContextLabel::Unknown, catalog);
    REQUIRE(names(unknown) == std::vector<std::string>{"info"});
    REQUIRE(unknown.find("scope") == nullptr);
}

TEST_CASE("registry skips non-command units", "[registry]") {
    CommandCatalog catalog;
    catalog.add(unit_at<Helper>("common/helper.cpp"));
    catalog.add(unit_at<AbstractBase>("common/base.cpp"));
    catalog.add(unit_at<Info>("common/info.cpp"));
    catalog.add(unit_with("common/empty.cpp", [] { return std::unique_ptr<Command>(); }));

    auto registry = CommandRegistry::build(ContextLabel::Unknown, catalog);
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.descriptors()[0].name == "info");
}

TEST_CASE("registry finds commands by name and alias", "[registry]") {
    CommandCatalog catalog;
    catalog.add(unit_at<Build>("framework/build.cpp"));

    auto registry = CommandRegistry::build(ContextLabel::Framework, catalog);
    REQUIRE(registry.find("build:all") != nullptr);
    REQUIRE(registry.find("build") == registry.find("build:all"));
    REQUIRE(registry.describe("build")->name == "build:all");
    REQUIRE(registry.describe("build:all")->aliases == std::vector<std::string>{"build"});
    REQUIRE(registry.find("missing") == nullptr);
}

TEST_CASE("first registration of a name or alias wins", "[registry]") {
    QuietLog quiet;
    CommandCatalog catalog;
    catalog.add(unit_at<Info>("common/a_info.cpp"));
    catalog.add(unit_at<Shadow>("common/b_shadow.cpp"));
    catalog.add(unit_at<Build>("framework/a_build.cpp"));
    catalog.add(unit_at<AliasClash>("framework/b_other.cpp"));

    auto registry = CommandRegistry::build(ContextLabel::Framework, catalog);
    REQUIRE(names(registry) == std::vector<std::string>{"info", "build:all", "build:other"});
    REQUIRE(registry.describe("info")->identifier == "moo::commands::common::a_info");
    REQUIRE(registry.describe("build")->name == "build:all");
}

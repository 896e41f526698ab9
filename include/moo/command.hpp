#pragma once

#include <moo/config.hpp>
#include <moo/filesystem.hpp>
#include <moo/process.hpp>
#include <moo/project.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace moo {

enum class CommandGroup { Common, Framework, Plugin };

// "common", "framework", "plugin"
const char* command_group_name(CommandGroup group);
std::optional<CommandGroup> parse_command_group(const std::string& name);

inline constexpr int kSuccess = 0;
inline constexpr int kFailure = 1;

using ProcessRunner = std::function<Result<ProcessResult>(
    const std::vector<std::string>& args, const std::string& working_dir,
    const OutputSink& sink, int timeout_seconds)>;

// Everything a command may look at while it runs. The project context and the
// merged configuration are resolved once, before any command is constructed.
struct CommandContext {
    std::filesystem::path start_dir;
    const ProjectContext& project;
    const ConfigStore& config;
    Filesystem& files;
    std::ostream& out;
    std::ostream& err;
    // Runs another registered command by name or alias
    std::function<int(const std::string& name, const std::vector<std::string>& args)> dispatch;
    ProcessRunner run_process;
};

class Command {
public:
    virtual ~Command() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual std::vector<std::string> aliases() const { return {}; }
    // Extra text for `moo help <name>`
    virtual std::string usage() const { return ""; }

    // Returns the process exit code
    virtual int execute(const std::vector<std::string>& args, CommandContext& ctx) = 0;
};

// The "is a command" capability: only concrete, default-constructible
// Command subclasses can be registered.
template<typename T>
inline constexpr bool is_command_v = std::is_base_of_v<Command, T> &&
                                     !std::is_abstract_v<T> &&
                                     std::is_default_constructible_v<T>;

// One source file under src/commands/<group>/
struct CommandUnit {
    std::string source;  // relative to the commands root: "plugin/scope_command.cpp"
    std::function<std::unique_ptr<Command>()> factory;  // empty unless the unit is a command
};

// "/abs/src/commands/plugin/scope_command.cpp" -> "plugin/scope_command.cpp"
std::string unit_source_path(const std::string& file);

// Group named by the first directory of a unit source path
std::optional<CommandGroup> unit_group(const std::string& source);

// "plugin/scope_command.cpp" -> "moo::commands::plugin::scope_command"
std::string unit_identifier(const std::string& source);

template<typename T>
CommandUnit make_command_unit(const char* file) {
    CommandUnit unit;
    unit.source = unit_source_path(file);
    if constexpr (is_command_v<T>) {
        unit.factory = [] { return std::unique_ptr<Command>(std::make_unique<T>()); };
    }
    return unit;
}

// Every unit compiled into the binary, filled at static-initialization time
// by MOO_REGISTER_COMMAND.
class CommandCatalog {
public:
    static CommandCatalog& global();

    void add(CommandUnit unit);

    // Units of `group`, sorted by source path
    std::vector<const CommandUnit*> units(CommandGroup group) const;

    size_t size() const { return units_.size(); }

private:
    std::vector<CommandUnit> units_;
};

struct CommandRegistrar {
    explicit CommandRegistrar(CommandUnit unit) {
        CommandCatalog::global().add(std::move(unit));
    }
};

#define MOO_CONCAT_INNER(a, b) a##b
#define MOO_CONCAT(a, b) MOO_CONCAT_INNER(a, b)

// Place once in a command's source file, after the class definition
#define MOO_REGISTER_COMMAND(Type) \
    static const ::moo::CommandRegistrar MOO_CONCAT(moo_command_registrar_, __LINE__)( \
        ::moo::make_command_unit<Type>(__FILE__))

} // namespace moo

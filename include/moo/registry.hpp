#pragma once

#include <moo/command.hpp>
#include <moo/project.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace moo {

struct CommandDescriptor {
    CommandGroup group;
    std::string identifier;   // derived from the unit's source path
    std::string name;
    std::string description;
    std::vector<std::string> aliases;
};

// The commands visible for one run. Fixed once build() returns.
class CommandRegistry {
public:
    // common always; framework for framework/plugin/theme; plugin for plugin/theme
    static std::vector<CommandGroup> eligible_groups(ContextLabel label);

    static CommandRegistry build(ContextLabel label,
                                 const CommandCatalog& catalog = CommandCatalog::global());

    CommandRegistry(CommandRegistry&&) = default;
    CommandRegistry& operator=(CommandRegistry&&) = default;

    const std::vector<CommandGroup>& groups() const { return groups_; }
    const std::vector<CommandDescriptor>& descriptors() const { return descriptors_; }
    size_t size() const { return descriptors_.size(); }

    // Lookup by name or alias; nullptr when not registered
    Command* find(const std::string& name) const;
    const CommandDescriptor* describe(const std::string& name) const;

private:
    CommandRegistry() = default;

    std::vector<CommandGroup> groups_;
    std::vector<CommandDescriptor> descriptors_;
    std::vector<std::unique_ptr<Command>> commands_;  // parallel to descriptors_
    std::map<std::string, size_t> index_;             // name or alias -> position

    void add(CommandGroup group, const CommandUnit& unit);
};

} // namespace moo

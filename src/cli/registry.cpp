#include <moo/registry.hpp>
#include <moo/log.hpp>

namespace moo {

std::vector<CommandGroup> CommandRegistry::eligible_groups(ContextLabel label) {
    std::vector<CommandGroup> groups{CommandGroup::Common};

    switch (label) {
        case ContextLabel::Framework:
            groups.push_back(CommandGroup::Framework);
            break;
        case ContextLabel::Plugin:
        case ContextLabel::Theme:
            groups.push_back(CommandGroup::Framework);
            groups.push_back(CommandGroup::Plugin);
            break;
        case ContextLabel::CliTool:
        case ContextLabel::Unknown:
            break;
    }
    return groups;
}

void CommandRegistry::add(CommandGroup group, const CommandUnit& unit) {
    if (!unit.factory) {
        log::debug("skipping %s: not a command", unit.source.c_str());
        return;
    }

    std::unique_ptr<Command> command = unit.factory();
    if (!command) {
        log::debug("skipping %s: factory produced nothing", unit.source.c_str());
        return;
    }

    CommandDescriptor desc;
    desc.group = group;
    desc.identifier = unit_identifier(unit.source);
    desc.name = command->name();
    desc.description = command->description();
    desc.aliases = command->aliases();

    if (index_.count(desc.name)) {
        log::warn("command '%s' from %s is already registered; skipping",
                  desc.name.c_str(), desc.identifier.c_str());
        return;
    }

    size_t position = descriptors_.size();
    index_[desc.name] = position;
    for (const auto& alias : desc.aliases) {
        if (index_.count(alias)) {
            log::warn("alias '%s' of '%s' is already taken; ignoring it",
                      alias.c_str(), desc.name.c_str());
            continue;
        }
        index_[alias] = position;
    }

    log::trace("registered %s as '%s'", desc.identifier.c_str(), desc.name.c_str());
    descriptors_.push_back(std::move(desc));
    commands_.push_back(std::move(command));
}

CommandRegistry CommandRegistry::build(ContextLabel label, const CommandCatalog& catalog) {
    CommandRegistry registry;
    registry.groups_ = eligible_groups(label);

    for (CommandGroup group : registry.groups_) {
        for (const CommandUnit* unit : catalog.units(group)) {
            registry.add(group, *unit);
        }
    }

    log::debug("%zu commands registered for context '%s'",
               registry.size(), context_label_name(label));
    return registry;
}

Command* CommandRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return commands_[it->second].get();
}

const CommandDescriptor* CommandRegistry::describe(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &descriptors_[it->second];
}

} // namespace moo

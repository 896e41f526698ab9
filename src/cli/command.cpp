#include <moo/command.hpp>
#include <moo/log.hpp>
#include <algorithm>

namespace moo {

const char* command_group_name(CommandGroup group) {
    switch (group) {
        case CommandGroup::Common:    return "common";
        case CommandGroup::Framework: return "framework";
        case CommandGroup::Plugin:    return "plugin";
    }
    return "common";
}

std::optional<CommandGroup> parse_command_group(const std::string& name) {
    if (name == "common") return CommandGroup::Common;
    if (name == "framework") return CommandGroup::Framework;
    if (name == "plugin") return CommandGroup::Plugin;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Unit paths
// ---------------------------------------------------------------------------

std::string unit_source_path(const std::string& file) {
    std::string path = file;
    std::replace(path.begin(), path.end(), '\\', '/');

    const std::string marker = "commands/";
    size_t pos = path.rfind("/" + marker);
    if (pos != std::string::npos) {
        return path.substr(pos + 1 + marker.size());
    }
    if (path.compare(0, marker.size(), marker) == 0) {
        return path.substr(marker.size());
    }
    return path;
}

std::optional<CommandGroup> unit_group(const std::string& source) {
    size_t slash = source.find('/');
    if (slash == std::string::npos) return std::nullopt;
    return parse_command_group(source.substr(0, slash));
}

std::string unit_identifier(const std::string& source) {
    std::string stem = source;
    size_t dot = stem.rfind('.');
    if (dot != std::string::npos && stem.find('/', dot) == std::string::npos) {
        stem.erase(dot);
    }

    std::string id = "moo::commands::";
    for (char c : stem) {
        if (c == '/') {
            id += "::";
        } else {
            id += c;
        }
    }
    return id;
}

// ---------------------------------------------------------------------------
// CommandCatalog
// ---------------------------------------------------------------------------

CommandCatalog& CommandCatalog::global() {
    static CommandCatalog catalog;
    return catalog;
}

void CommandCatalog::add(CommandUnit unit) {
    if (!unit_group(unit.source)) {
        log::debug("command unit %s is outside any command group", unit.source.c_str());
    }
    units_.push_back(std::move(unit));
}

std::vector<const CommandUnit*> CommandCatalog::units(CommandGroup group) const {
    std::vector<const CommandUnit*> result;
    for (const auto& unit : units_) {
        auto g = unit_group(unit.source);
        if (g && *g == group) result.push_back(&unit);
    }
    std::stable_sort(result.begin(), result.end(),
        [](const CommandUnit* a, const CommandUnit* b) {
            return a->source < b->source;
        });
    return result;
}

} // namespace moo

#pragma once

#include <moo/filesystem.hpp>
#include <moo/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <string>
#include <vector>

namespace moo {

inline constexpr const char* kLegacyConfigFile = "wpmoo-config.yml";
inline constexpr const char* kConfigDir = "wpmoo-config";
inline constexpr const char* kAltConfigDir = "config";
inline constexpr const char* kSettingsFile = "wpmoo-settings.yml";
inline constexpr const char* kDeployFile = "deploy.yml";

// Files read from each config directory, lowest priority first
const std::vector<std::string>& config_directory_files();

// Recursive override merge: where both sides hold a mapping the keys are
// merged recursively; anything else on the overlay side replaces the base
// value wholesale. Neither argument is modified.
YAML::Node merge_override(const YAML::Node& base, const YAML::Node& overlay);

// Project configuration merged from, lowest priority first:
//   wpmoo-config.yml
//   wpmoo-config/{wpmoo-settings,deploy}.yml
//   config/{wpmoo-settings,deploy}.yml
// rooted at the nearest ancestor holding wpmoo-config.yml or
// wpmoo-config/wpmoo-settings.yml.
class ConfigStore {
public:
    static ConfigStore load(const std::filesystem::path& start_dir,
                            const Filesystem& files = disk_filesystem());

    // Directory holding the config marker, or the start directory if none
    const std::filesystem::path& project_root() const { return root_; }
    bool found() const { return found_; }

    // Files that were merged, in merge order
    const std::vector<std::filesystem::path>& sources() const { return sources_; }

    // Dotted lookup ("project.name", "paths.0"). Returns an undefined node
    // when any segment is missing or the value is null.
    YAML::Node get(const std::string& key) const;

    template<typename T>
    T get(const std::string& key, const T& fallback) const {
        YAML::Node node = get(key);
        if (!node.IsDefined()) return fallback;
        try {
            return node.as<T>();
        } catch (const YAML::Exception&) {
            return fallback;
        }
    }

    bool has(const std::string& key) const { return get(key).IsDefined(); }

    // Copy of the whole merged tree
    YAML::Node all() const { return YAML::Clone(tree_); }
    bool empty() const { return tree_.size() == 0; }

    // Overwrite dir/wpmoo-config.yml with `data`. No merge with what is there.
    static Status save(const std::filesystem::path& dir, const YAML::Node& data,
                       Filesystem& files = disk_filesystem());

private:
    std::filesystem::path root_;
    bool found_ = false;
    YAML::Node tree_{YAML::NodeType::Map};
    std::vector<std::filesystem::path> sources_;

    void merge_file(const Filesystem& files, const std::filesystem::path& path);
};

// Parse one YAML config document. Empty input is an empty mapping; a
// document whose top level is not a mapping is a Config error.
Result<YAML::Node> parse_config_yaml(const std::string& yaml_str,
                                     const std::string& origin = "");

} // namespace moo

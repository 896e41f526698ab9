#pragma once

#include <moo/filesystem.hpp>
#include <moo/manifest.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace moo {

enum class ContextLabel { CliTool, Framework, Plugin, Theme, Unknown };

// "cli-tool", "framework", "plugin", "theme", "unknown"
const char* context_label_name(ContextLabel label);

// Which rule decided the label
enum class ContextSignal { ManifestName, ManifestType, ManifestDependency, HeaderScan, None };

const char* context_signal_name(ContextSignal signal);

inline constexpr const char* kCliPackage = "wpmoo/wpmoo-cli";
inline constexpr const char* kFrameworkPackage = "wpmoo/wpmoo";
inline constexpr const char* kPluginType = "wordpress-plugin";
inline constexpr const char* kThemeType = "wordpress-theme";

struct ProjectContext {
    ContextLabel label = ContextLabel::Unknown;
    ContextSignal signal = ContextSignal::None;
    std::optional<std::filesystem::path> manifest_path;  // nearest composer.json, if any
    std::optional<ComposerManifest> manifest;            // set when it parsed
    std::optional<std::filesystem::path> marker_file;    // source file that matched the header scan
};

// Decides what kind of project a directory belongs to. Never fails: anything
// it cannot read or parse is treated as absent and the result degrades to
// ContextLabel::Unknown.
class ProjectClassifier {
public:
    explicit ProjectClassifier(const Filesystem& files = disk_filesystem());

    ProjectContext identify(const std::filesystem::path& start_dir) const;

    ContextLabel classify(const std::filesystem::path& start_dir) const {
        return identify(start_dir).label;
    }

    // Nearest composer.json at or above start_dir
    std::optional<std::filesystem::path> find_manifest(
        const std::filesystem::path& start_dir) const;

    // Manifest rules only; nullopt when the manifest says nothing decisive
    static std::optional<ContextLabel> label_from_manifest(const ComposerManifest& manifest,
                                                           ContextSignal* signal = nullptr);

    // True when `content` mentions the framework and carries a
    // "Plugin Name:" / "Theme Name:" header line
    static bool is_framework_header_file(const std::string& content);

    static bool has_header_tag(const std::string& content);

private:
    const Filesystem& files_;

    // First matching *.php file in canonical (depth-first, name-sorted) order
    std::optional<std::filesystem::path> scan_sources(const std::filesystem::path& dir) const;
};

} // namespace moo

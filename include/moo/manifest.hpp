#pragma once

#include <moo/result.hpp>
#include <moo/filesystem.hpp>
#include <filesystem>
#include <map>
#include <string>

namespace moo {

inline constexpr const char* kManifestFile = "composer.json";

// The parts of composer.json that decide a project's context.
// Fields with an unexpected JSON type are left empty rather than rejected.
struct ComposerManifest {
    std::string name;          // "vendor/package"
    std::string type;          // "wordpress-plugin", "library", ...
    std::string version;
    std::string description;
    std::map<std::string, std::string> require;      // package -> constraint
    std::map<std::string, std::string> require_dev;

    // `origin` only labels error messages
    static Result<ComposerManifest> parse(const std::string& json_str,
                                          const std::string& origin = "");

    static Result<ComposerManifest> load(const Filesystem& files,
                                         const std::filesystem::path& path);

    bool requires_package(const std::string& package) const;
};

} // namespace moo

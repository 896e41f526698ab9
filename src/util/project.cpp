#include <moo/project.hpp>
#include <moo/log.hpp>
#include <moo/path_walker.hpp>
#include <cctype>

namespace moo {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Labels
// ---------------------------------------------------------------------------

const char* context_label_name(ContextLabel label) {
    switch (label) {
        case ContextLabel::CliTool:   return "cli-tool";
        case ContextLabel::Framework: return "framework";
        case ContextLabel::Plugin:    return "plugin";
        case ContextLabel::Theme:     return "theme";
        case ContextLabel::Unknown:   return "unknown";
    }
    return "unknown";
}

const char* context_signal_name(ContextSignal signal) {
    switch (signal) {
        case ContextSignal::ManifestName:       return "manifest name";
        case ContextSignal::ManifestType:       return "manifest type";
        case ContextSignal::ManifestDependency: return "manifest dependency";
        case ContextSignal::HeaderScan:         return "header scan";
        case ContextSignal::None:               return "none";
    }
    return "none";
}

// ---------------------------------------------------------------------------
// Header scan helpers
// ---------------------------------------------------------------------------

static bool istarts_with(const std::string& s, size_t pos, const char* prefix) {
    for (size_t i = 0; prefix[i] != '\0'; ++i) {
        if (pos + i >= s.size()) return false;
        if (std::tolower(static_cast<unsigned char>(s[pos + i])) != prefix[i]) return false;
    }
    return true;
}

static bool icontains(const std::string& haystack, const char* needle) {
    for (size_t pos = 0; pos < haystack.size(); ++pos) {
        if (istarts_with(haystack, pos, needle)) return true;
    }
    return false;
}

static bool is_comment_lead(char c) {
    return c == ' ' || c == '\t' || c == '/' || c == '*' || c == '#' || c == '@';
}

bool ProjectClassifier::has_header_tag(const std::string& content) {
    size_t line_start = 0;
    while (line_start <= content.size()) {
        size_t pos = line_start;
        while (pos < content.size() && is_comment_lead(content[pos])) ++pos;

        if (istarts_with(content, pos, "plugin name:") ||
            istarts_with(content, pos, "theme name:")) {
            return true;
        }

        size_t nl = content.find('\n', line_start);
        if (nl == std::string::npos) break;
        line_start = nl + 1;
    }
    return false;
}

bool ProjectClassifier::is_framework_header_file(const std::string& content) {
    return icontains(content, "wpmoo") && has_header_tag(content);
}

// Directories the scan never descends into
static bool is_skipped_dir(const std::string& name) {
    return name.empty() || name[0] == '.' || name == "node_modules";
}

// ---------------------------------------------------------------------------
// ProjectClassifier
// ---------------------------------------------------------------------------

ProjectClassifier::ProjectClassifier(const Filesystem& files)
    : files_(files) {}

std::optional<fs::path> ProjectClassifier::find_manifest(const fs::path& start_dir) const {
    auto dir = find_upward(files_.absolute(start_dir), [this](const fs::path& d) {
        return files_.is_file(d / kManifestFile);
    });
    if (!dir) return std::nullopt;
    return *dir / kManifestFile;
}

std::optional<ContextLabel> ProjectClassifier::label_from_manifest(
    const ComposerManifest& manifest, ContextSignal* signal)
{
    auto decided = [signal](ContextLabel label, ContextSignal why) {
        if (signal) *signal = why;
        return std::optional<ContextLabel>(label);
    };

    if (manifest.name == kCliPackage) {
        return decided(ContextLabel::CliTool, ContextSignal::ManifestName);
    }
    if (manifest.name == kFrameworkPackage) {
        return decided(ContextLabel::Framework, ContextSignal::ManifestName);
    }
    if (manifest.type == kPluginType) {
        return decided(ContextLabel::Plugin, ContextSignal::ManifestType);
    }
    if (manifest.type == kThemeType) {
        return decided(ContextLabel::Theme, ContextSignal::ManifestType);
    }
    if (manifest.requires_package(kFrameworkPackage)) {
        return decided(ContextLabel::Plugin, ContextSignal::ManifestDependency);
    }

    if (signal) *signal = ContextSignal::None;
    return std::nullopt;
}

std::optional<fs::path> ProjectClassifier::scan_sources(const fs::path& dir) const {
    auto entries = files_.list_directory(dir);
    if (entries.is_err()) {
        log::debug("header scan skipped %s: %s",
                   dir.string().c_str(), entries.error().message.c_str());
        return std::nullopt;
    }

    for (const auto& entry : entries.value()) {
        if (entry.is_directory) {
            if (is_skipped_dir(entry.path.filename().string())) continue;
            if (auto found = scan_sources(entry.path)) return found;
            continue;
        }

        if (entry.path.extension() != ".php") continue;

        auto content = files_.read_file(entry.path);
        if (content.is_err()) {
            log::debug("header scan skipped %s: %s",
                       entry.path.string().c_str(), content.error().message.c_str());
            continue;
        }
        if (is_framework_header_file(content.value())) {
            return entry.path;
        }
    }
    return std::nullopt;
}

ProjectContext ProjectClassifier::identify(const fs::path& start_dir) const {
    fs::path start = files_.absolute(start_dir);
    ProjectContext ctx;

    ctx.manifest_path = find_manifest(start);
    if (ctx.manifest_path) {
        auto manifest = ComposerManifest::load(files_, *ctx.manifest_path);
        if (manifest.is_ok()) {
            ContextSignal signal = ContextSignal::None;
            auto label = label_from_manifest(manifest.value(), &signal);
            ctx.manifest = std::move(manifest).value();
            if (label) {
                ctx.label = *label;
                ctx.signal = signal;
                log::debug("context %s from %s (%s)", context_label_name(ctx.label),
                           ctx.manifest_path->string().c_str(), context_signal_name(signal));
                return ctx;
            }
        } else {
            log::debug("ignoring manifest: %s", manifest.error().format().c_str());
        }
    }

    if (auto marker = scan_sources(start)) {
        ctx.label = ContextLabel::Plugin;
        ctx.signal = ContextSignal::HeaderScan;
        ctx.marker_file = marker;
        log::warn("no decisive composer.json; guessed '%s' from the header in %s",
                  context_label_name(ctx.label), marker->string().c_str());
        return ctx;
    }

    log::debug("no project context found from %s", start.string().c_str());
    return ctx;
}

} // namespace moo

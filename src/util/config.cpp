#include <moo/config.hpp>
#include <moo/log.hpp>
#include <moo/path_walker.hpp>
#include <cstdlib>

namespace moo {

namespace fs = std::filesystem;

const std::vector<std::string>& config_directory_files() {
    static const std::vector<std::string> files = {kSettingsFile, kDeployFile};
    return files;
}

YAML::Node merge_override(const YAML::Node& base, const YAML::Node& overlay) {
    if (!base.IsMap() || !overlay.IsMap()) {
        return YAML::Clone(overlay);
    }

    YAML::Node merged = YAML::Clone(base);
    for (const auto& kv : overlay) {
        if (!kv.first.IsScalar()) continue;
        const std::string key = kv.first.Scalar();

        const YAML::Node& existing = static_cast<const YAML::Node&>(merged)[key];
        if (existing.IsDefined() && existing.IsMap() && kv.second.IsMap()) {
            merged[key] = merge_override(existing, kv.second);
        } else {
            merged[key] = YAML::Clone(kv.second);
        }
    }
    return merged;
}

Result<YAML::Node> parse_config_yaml(const std::string& yaml_str, const std::string& origin) {
    YAML::Node doc;
    try {
        doc = YAML::Load(yaml_str);
    } catch (const YAML::ParserException& e) {
        return MooError{MooError::Parse,
            std::string("config YAML parse error: ") + e.msg,
            "", origin, e.mark.line >= 0 ? e.mark.line + 1 : 0};
    } catch (const YAML::Exception& e) {
        return MooError{MooError::Parse,
            std::string("config YAML error: ") + e.what(), "", origin, 0};
    }

    if (!doc.IsDefined() || doc.IsNull()) {
        return Result<YAML::Node>::ok(YAML::Node(YAML::NodeType::Map));
    }
    if (!doc.IsMap()) {
        return MooError{MooError::Config,
            "config file must contain a mapping at the top level", "", origin, 0};
    }
    return Result<YAML::Node>::ok(doc);
}

// ---------------------------------------------------------------------------
// ConfigStore
// ---------------------------------------------------------------------------

void ConfigStore::merge_file(const Filesystem& files, const fs::path& path) {
    if (!files.is_file(path)) return;

    auto contents = files.read_file(path);
    if (contents.is_err()) {
        log::warn("%s", contents.error().format().c_str());
        return;
    }

    auto doc = parse_config_yaml(contents.value(), path.string());
    if (doc.is_err()) {
        // A broken file contributes nothing; the other layers still load
        log::warn("%s", doc.error().format().c_str());
        return;
    }

    tree_.reset(merge_override(tree_, doc.value()));
    sources_.push_back(path);
    log::debug("merged config %s", path.string().c_str());
}

ConfigStore ConfigStore::load(const fs::path& start_dir, const Filesystem& files) {
    ConfigStore store;
    fs::path start = files.absolute(start_dir);

    auto root = find_upward(start, [&files](const fs::path& dir) {
        return files.is_file(dir / kLegacyConfigFile) ||
               files.is_file(dir / kConfigDir / kSettingsFile);
    });

    if (!root) {
        store.root_ = start;
        return store;
    }

    store.root_ = *root;
    store.found_ = true;

    store.merge_file(files, store.root_ / kLegacyConfigFile);

    for (const char* dir_name : {kConfigDir, kAltConfigDir}) {
        fs::path dir = store.root_ / dir_name;
        if (!files.is_directory(dir)) continue;
        for (const auto& name : config_directory_files()) {
            store.merge_file(files, dir / name);
        }
    }

    return store;
}

// Plain decimal digits only; no sign, no whitespace
static bool parse_index(const std::string& segment, size_t& index) {
    if (segment.empty()) return false;
    for (char c : segment) {
        if (c < '0' || c > '9') return false;
    }
    index = static_cast<size_t>(std::strtoull(segment.c_str(), nullptr, 10));
    return true;
}

YAML::Node ConfigStore::get(const std::string& key) const {
    // reset() rebinds without assigning through, so tree_ is never written
    YAML::Node current;
    current.reset(tree_);

    size_t start = 0;
    while (true) {
        size_t dot = key.find('.', start);
        std::string segment = key.substr(start,
            dot == std::string::npos ? std::string::npos : dot - start);

        const YAML::Node& view = current;
        size_t index = 0;
        if (!view.IsMap() &&
            !(view.IsSequence() && parse_index(segment, index) && index < view.size())) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        const YAML::Node next = view.IsMap() ? view[segment] : view[index];

        if (!next.IsDefined() || next.IsNull()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        current.reset(next);

        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return YAML::Clone(current);
}

Status ConfigStore::save(const fs::path& dir, const YAML::Node& data, Filesystem& files) {
    if (!files.is_directory(dir)) {
        return MooError{MooError::IO,
            "cannot save config: not a directory: " + dir.string()};
    }

    YAML::Emitter out;
    out << data;
    if (!out.good()) {
        return MooError{MooError::Config,
            "cannot serialize config: " + out.GetLastError()};
    }

    std::string text = out.c_str();
    text += "\n";
    MOO_TRY(files.write_file(dir / kLegacyConfigFile, text));
    log::debug("wrote %s", (dir / kLegacyConfigFile).string().c_str());
    return ok_status();
}

} // namespace moo

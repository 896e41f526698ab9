#include <moo/manifest.hpp>
#include <json/json.h>
#include <memory>

namespace moo {

static std::string string_field(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    return v.isString() ? v.asString() : std::string();
}

static std::map<std::string, std::string> package_links(const Json::Value& obj,
                                                        const char* key) {
    std::map<std::string, std::string> links;
    const Json::Value& section = obj[key];
    if (!section.isObject()) return links;

    for (const auto& package : section.getMemberNames()) {
        const Json::Value& constraint = section[package];
        links[package] = constraint.isString() ? constraint.asString() : std::string();
    }
    return links;
}

Result<ComposerManifest> ComposerManifest::parse(const std::string& json_str,
                                                 const std::string& origin) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    bool parsed = false;
    try {
        parsed = reader->parse(json_str.data(), json_str.data() + json_str.size(),
                               &root, &errs);
    } catch (const Json::Exception& e) {
        errs = e.what();
    }
    if (!parsed) {
        return MooError{MooError::Parse,
            "manifest JSON parse error: " + errs,
            "run `composer validate` to locate the problem", origin, 0};
    }
    if (!root.isObject()) {
        return MooError{MooError::Manifest,
            "manifest must be a JSON object", "", origin, 0};
    }

    ComposerManifest m;
    m.name = string_field(root, "name");
    m.type = string_field(root, "type");
    m.version = string_field(root, "version");
    m.description = string_field(root, "description");
    m.require = package_links(root, "require");
    m.require_dev = package_links(root, "require-dev");
    return Result<ComposerManifest>::ok(std::move(m));
}

Result<ComposerManifest> ComposerManifest::load(const Filesystem& files,
                                                const std::filesystem::path& path) {
    auto contents = files.read_file(path);
    if (contents.is_err()) return std::move(contents).error();
    return parse(contents.value(), path.string());
}

bool ComposerManifest::requires_package(const std::string& package) const {
    return require.count(package) > 0;
}

} // namespace moo

#include <flatlock/manifest.hpp>
#include <fstream>
#include <memory>
#include <sstream>

namespace flatlock {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static Result<SpecList> parse_section(const Json::Value& root, const char* key) {
    SpecList specs;
    const Json::Value& section = root[key];
    if (section.isNull()) return Result<SpecList>::ok(std::move(specs));
    if (!section.isObject()) {
        return FlatlockError{FlatlockError::Manifest,
            std::string("'") + key + "' must be an object of name to range"};
    }
    for (auto it = section.begin(); it != section.end(); ++it) {
        // Ranges are never evaluated; non-string values keep an empty range
        specs.emplace_back(it.name(), it->isString() ? it->asString() : "");
    }
    return Result<SpecList>::ok(std::move(specs));
}

static Status parse_workspaces(const Json::Value& root, std::vector<std::string>& out) {
    const Json::Value* list = &root["workspaces"];
    if (list->isNull()) return ok_status();
    if (list->isObject()) list = &(*list)["packages"];
    if (list->isNull()) return ok_status();
    if (!list->isArray()) {
        return FlatlockError{FlatlockError::Manifest,
            "'workspaces' must be an array or an object with a 'packages' array"};
    }
    for (const auto& elem : *list) {
        if (elem.isString()) out.push_back(elem.asString());
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// PackageManifest
// ---------------------------------------------------------------------------

Result<PackageManifest> PackageManifest::from_json(const Json::Value& root) {
    if (!root.isObject()) {
        return FlatlockError{FlatlockError::Manifest,
            "package manifest must be a JSON object"};
    }

    PackageManifest m;
    if (root["name"].isString()) m.name = root["name"].asString();
    if (root["version"].isString()) m.version = root["version"].asString();

    auto deps = parse_section(root, "dependencies");
    if (deps.is_err()) return std::move(deps).error();
    m.dependencies = std::move(deps).value();

    auto dev = parse_section(root, "devDependencies");
    if (dev.is_err()) return std::move(dev).error();
    m.dev_dependencies = std::move(dev).value();

    auto optional = parse_section(root, "optionalDependencies");
    if (optional.is_err()) return std::move(optional).error();
    m.optional_dependencies = std::move(optional).value();

    auto peer = parse_section(root, "peerDependencies");
    if (peer.is_err()) return std::move(peer).error();
    m.peer_dependencies = std::move(peer).value();

    FLATLOCK_TRY(parse_workspaces(root, m.workspaces));

    return Result<PackageManifest>::ok(std::move(m));
}

Result<PackageManifest> PackageManifest::parse(const std::string& json) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    try {
        if (!reader->parse(json.data(), json.data() + json.size(), &root, &errs)) {
            return FlatlockError{FlatlockError::Manifest,
                "invalid JSON in package manifest: " + errs};
        }
    } catch (const Json::Exception& e) {
        return FlatlockError{FlatlockError::Manifest,
            std::string("invalid JSON in package manifest: ") + e.what()};
    }
    return from_json(root);
}

Result<PackageManifest> PackageManifest::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return FlatlockError{FlatlockError::IO,
            "cannot open package manifest: " + path};
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    auto result = PackageManifest::parse(ss.str());
    if (result.is_err()) result.error().file = path;
    return result;
}

} // namespace flatlock

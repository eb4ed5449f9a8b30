#include <flatlock/parsers/npm.hpp>
#include <flatlock/log.hpp>
#include <json/json.h>
#include <memory>

namespace flatlock {

// ---------------------------------------------------------------------------
// Key grammar
// ---------------------------------------------------------------------------

std::string parse_npm_key(const std::string& path) {
    size_t last_slash = path.rfind('/');
    if (last_slash == std::string::npos) return path;

    std::string name = path.substr(last_slash + 1);
    size_t scope_start = last_slash == 0 ? std::string::npos
                                         : path.rfind('/', last_slash - 1);
    std::string maybe_scope = scope_start == std::string::npos
        ? path.substr(0, last_slash)
        : path.substr(scope_start + 1, last_slash - scope_start - 1);

    if (!maybe_scope.empty() && maybe_scope[0] == '@') {
        return maybe_scope + "/" + name;
    }
    return name;
}

bool is_installed_path(const std::string& path) {
    return path.find("node_modules/") != std::string::npos;
}

// ---------------------------------------------------------------------------
// Loader
// ---------------------------------------------------------------------------

static FlatlockError npm_error(const std::string& msg, const std::string& filename) {
    return FlatlockError{FlatlockError::Parse, msg,
                         "regenerate the lockfile with npm install", filename, 0};
}

// Callers guarantee obj is an object
static std::string string_field(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    return v.isString() ? v.asString() : "";
}

static SpecList spec_list(const Json::Value& obj, const char* key) {
    SpecList out;
    const Json::Value& v = obj[key];
    if (!v.isObject()) return out;
    for (auto it = v.begin(); it != v.end(); ++it) {
        out.emplace_back(it.name(), it->isString() ? it->asString() : "");
    }
    return out;
}

static Result<PackageEntry> read_entry(const std::string& path,
                                       const Json::Value& node,
                                       const std::string& filename) {
    if (!node.isObject()) {
        return npm_error("package entry '" + path + "' must be an object", filename);
    }

    PackageEntry entry;
    entry.name = string_field(node, "name");
    entry.version = string_field(node, "version");
    entry.resolved = string_field(node, "resolved");
    entry.integrity = string_field(node, "integrity");
    const Json::Value& link = node["link"];
    entry.link = link.isBool() && link.asBool();

    entry.dependencies = spec_list(node, "dependencies");
    entry.optional_dependencies = spec_list(node, "optionalDependencies");
    entry.peer_dependencies = spec_list(node, "peerDependencies");
    entry.dev_dependencies = spec_list(node, "devDependencies");
    return Result<PackageEntry>::ok(std::move(entry));
}

// Lockfile v1 nests installed packages under "dependencies"; rebuild the
// node_modules paths v2+ would record.
static Status flatten_v1(const Json::Value& deps, const std::string& prefix,
                         PackageTable& out, const std::string& filename) {
    for (auto it = deps.begin(); it != deps.end(); ++it) {
        const std::string name = it.name();
        const Json::Value& node = *it;
        std::string path = prefix.empty() ? "node_modules/" + name
                                          : prefix + "/node_modules/" + name;
        if (!node.isObject()) {
            return npm_error("dependency '" + path + "' must be an object", filename);
        }

        PackageEntry entry;
        entry.version = string_field(node, "version");
        entry.resolved = string_field(node, "resolved");
        entry.integrity = string_field(node, "integrity");
        entry.dependencies = spec_list(node, "requires");

        if (entry.version.rfind("file:", 0) == 0) {
            entry.link = true;
            entry.resolved = entry.version.substr(5);
            entry.version.clear();
        }

        out.add(path, std::move(entry));

        const Json::Value& nested = node["dependencies"];
        if (nested.isObject()) {
            FLATLOCK_TRY(flatten_v1(nested, path, out, filename));
        }
    }
    return ok_status();
}

Result<LockTables> load_npm_tables(const std::string& content,
                                   const std::string& filename) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    try {
        if (!reader->parse(content.data(), content.data() + content.size(),
                           &root, &errs)) {
            return npm_error("invalid JSON: " + errs, filename);
        }
    } catch (const Json::Exception& e) {
        return npm_error(std::string("invalid JSON: ") + e.what(), filename);
    }

    if (!root.isObject()) {
        return npm_error("lockfile root must be a JSON object", filename);
    }

    LockTables tables;
    tables.format = LockfileFormat::Npm;
    const Json::Value& version = root["lockfileVersion"];
    if (version.isNumeric()) tables.lockfile_version = version.asString();

    const Json::Value& packages = root["packages"];
    if (packages.isObject()) {
        for (auto it = packages.begin(); it != packages.end(); ++it) {
            auto entry = read_entry(it.name(), *it, filename);
            if (entry.is_err()) return std::move(entry).error();
            tables.packages.add(it.name(), std::move(entry).value());
        }
    } else if (!packages.isNull()) {
        return npm_error("'packages' must be an object", filename);
    } else {
        const Json::Value& deps = root["dependencies"];
        if (deps.isObject()) {
            FLATLOCK_TRY(flatten_v1(deps, "", tables.packages, filename));
        } else if (!deps.isNull()) {
            return npm_error("'dependencies' must be an object", filename);
        }
    }

    log::debug("npm lockfile v%s: %zu package entries",
               tables.lockfile_version.c_str(), tables.packages.size());
    return Result<LockTables>::ok(std::move(tables));
}

// ---------------------------------------------------------------------------
// Extraction
// ---------------------------------------------------------------------------

std::optional<Dependency> extract_npm_entry(const std::string& path,
                                            const PackageEntry& entry) {
    // Root project and workspace definitions are not installed packages
    if (path.empty() || !is_installed_path(path)) return std::nullopt;
    if (entry.link) return std::nullopt;

    std::string name = parse_npm_key(path);
    if (name.empty() || entry.version.empty()) return std::nullopt;

    Dependency dep;
    dep.name = std::move(name);
    dep.version = entry.version;
    dep.integrity = entry.integrity;
    dep.resolved = entry.resolved;
    return dep;
}

} // namespace flatlock

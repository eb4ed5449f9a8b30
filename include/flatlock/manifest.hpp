#pragma once

#include <flatlock/dependency.hpp>
#include <flatlock/result.hpp>
#include <json/json.h>
#include <string>
#include <vector>

namespace flatlock {

// The parts of a package.json that resolution reads
struct PackageManifest {
    std::string name;
    std::string version;
    SpecList dependencies;
    SpecList dev_dependencies;
    SpecList optional_dependencies;
    SpecList peer_dependencies;
    std::vector<std::string> workspaces;  // "workspaces" array or {packages: [...]}

    // Parse from a JSON string
    static Result<PackageManifest> parse(const std::string& json);

    // Read from an already parsed document; the root must be an object
    static Result<PackageManifest> from_json(const Json::Value& root);

    // Parse from file path
    static Result<PackageManifest> load(const std::string& path);
};

} // namespace flatlock

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace flatlock {

enum class LockfileFormat {
    Npm,
    Pnpm,
    YarnClassic,
    YarnBerry
};

// "npm", "pnpm", "yarn-classic", "yarn-berry"
const char* format_name(LockfileFormat format);
std::optional<LockfileFormat> parse_format_name(const std::string& name);

// One external package as recorded by a lockfile.
struct Dependency {
    std::string name;       // may be scope-qualified: "@scope/name"
    std::string version;
    std::string integrity;  // empty when the lockfile records none
    std::string resolved;   // tarball URL or locator, empty when absent
    bool link = false;

    // "name@version", the identity used by DependencySet
    std::string key() const;

    bool operator==(const Dependency& o) const;
    bool operator!=(const Dependency& o) const;
};

std::string dependency_key(const std::string& name, const std::string& version);

// Name and version decoded from a lockfile key or spec
struct PackageId {
    std::string name;
    std::string version;
};

// Ordered (name, range-or-version) pairs, as they appear in a manifest or
// in a lockfile entry's dependency maps
using SpecList = std::vector<std::pair<std::string, std::string>>;

// Returns nullptr when name is not listed
const std::string* find_spec(const SpecList& specs, const std::string& name);

} // namespace flatlock

#include <flatlock/dependency.hpp>

namespace flatlock {

const char* format_name(LockfileFormat format) {
    switch (format) {
        case LockfileFormat::Npm:         return "npm";
        case LockfileFormat::Pnpm:        return "pnpm";
        case LockfileFormat::YarnClassic: return "yarn-classic";
        case LockfileFormat::YarnBerry:   return "yarn-berry";
    }
    return "unknown";
}

std::optional<LockfileFormat> parse_format_name(const std::string& name) {
    if (name == "npm") return LockfileFormat::Npm;
    if (name == "pnpm") return LockfileFormat::Pnpm;
    if (name == "yarn-classic") return LockfileFormat::YarnClassic;
    if (name == "yarn-berry") return LockfileFormat::YarnBerry;
    return std::nullopt;
}

std::string dependency_key(const std::string& name, const std::string& version) {
    std::string key;
    key.reserve(name.size() + version.size() + 1);
    key += name;
    key += '@';
    key += version;
    return key;
}

std::string Dependency::key() const {
    return dependency_key(name, version);
}

bool Dependency::operator==(const Dependency& o) const {
    return name == o.name && version == o.version &&
           integrity == o.integrity && resolved == o.resolved &&
           link == o.link;
}

bool Dependency::operator!=(const Dependency& o) const {
    return !(*this == o);
}

const std::string* find_spec(const SpecList& specs, const std::string& name) {
    for (const auto& [n, spec] : specs) {
        if (n == name) return &spec;
    }
    return nullptr;
}

} // namespace flatlock

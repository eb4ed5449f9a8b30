#include <flatlock/lockfile.hpp>
#include <flatlock/parsers/npm.hpp>
#include <flatlock/parsers/pnpm.hpp>
#include <flatlock/parsers/yarn_berry.hpp>
#include <flatlock/parsers/yarn_classic.hpp>

namespace flatlock {

void PackageTable::add(std::string key, PackageEntry entry) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(entry);
        return;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(std::move(key), std::move(entry));
}

const PackageEntry* PackageTable::find(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

Result<LockTables> load_tables(const std::string& content, LockfileFormat format,
                               const std::string& filename) {
    switch (format) {
        case LockfileFormat::Npm:         return load_npm_tables(content, filename);
        case LockfileFormat::Pnpm:        return load_pnpm_tables(content, filename);
        case LockfileFormat::YarnClassic: return load_yarn_classic_tables(content, filename);
        case LockfileFormat::YarnBerry:   return load_yarn_berry_tables(content, filename);
    }
    return FlatlockError{FlatlockError::InvalidArg, "unknown lockfile format"};
}

} // namespace flatlock

#pragma once

#include <flatlock/lockfile.hpp>
#include <optional>
#include <string>

namespace flatlock {

// Package name from a package-lock path: the last segment, or the last two
// when the second-to-last is a scope. "node_modules/@babel/core" -> "@babel/core"
std::string parse_npm_key(const std::string& path);

// True for installed paths, i.e. those containing "node_modules/"
bool is_installed_path(const std::string& path);

// package-lock.json / npm-shrinkwrap.json, lockfile v1 to v3.
// v1 dependency trees are flattened into node_modules paths.
Result<LockTables> load_npm_tables(const std::string& content,
                                   const std::string& filename = "<input>");

// The record for one packages entry, or nullopt when the entry is filtered
std::optional<Dependency> extract_npm_entry(const std::string& path,
                                            const PackageEntry& entry);

} // namespace flatlock

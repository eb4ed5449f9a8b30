#pragma once

#include <flatlock/lockfile.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flatlock {

// "a@^1, a@^2" -> ["a@^1", "a@^2"], entries trimmed
std::vector<std::string> split_yarn_descriptors(const std::string& key);

// Package name of a yarn v1 key, from its first descriptor.
// "lodash@^4.17.21, lodash@^4.0.0" -> "lodash"
// Aliases ("alias@npm:real@^1") yield the alias.
std::string parse_yarn_classic_key(const std::string& key);

// yarn.lock v1 through the lang/ parser
Result<LockTables> load_yarn_classic_tables(const std::string& content,
                                            const std::string& filename = "<input>");

std::optional<Dependency> extract_yarn_classic_entry(const std::string& key,
                                                     const PackageEntry& entry);

} // namespace flatlock

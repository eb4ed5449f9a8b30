#pragma once

#include <flatlock/lockfile.hpp>
#include <optional>
#include <string>

namespace flatlock {

// Package name of a berry key: the text before the earliest protocol marker
// (@npm: @workspace: @portal: @link: @patch: @file:) of the first descriptor.
std::string parse_yarn_berry_key(const std::string& key);

// Real package name of a resolution locator.
// "string-width@npm:4.2.3" -> "string-width"
std::optional<std::string> parse_yarn_berry_resolution(const std::string& resolution);

// "npm", "workspace", "patch", ... or empty when the locator has none
std::string yarn_berry_protocol(const std::string& locator);

// workspace:, portal: and link: locators point into the repository
bool is_local_protocol(const std::string& protocol);

// yarn.lock v2+ (YAML with a __metadata header)
Result<LockTables> load_yarn_berry_tables(const std::string& content,
                                          const std::string& filename = "<input>");

std::optional<Dependency> extract_yarn_berry_entry(const std::string& key,
                                                   const PackageEntry& entry);

} // namespace flatlock

#pragma once

#include <flatlock/lockfile.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flatlock {

// ---------------------------------------------------------------------------
// Spec grammar
// ---------------------------------------------------------------------------

// "link:" and "file:" specs name local directories, not packages
bool is_local_spec(const std::string& spec);

// Auto-detecting parse for a spec of any era:
//   "(" present                             -> v6+
//   last '@' past position 0, no '/' after  -> v6+ (after dropping '/' and '_peer')
//   otherwise                               -> v5
// "/@babel/core@7.23.0" -> {"@babel/core", "7.23.0"}
std::optional<PackageId> parse_pnpm_spec(const std::string& spec);

// "/name/version[/peer]" and "/@scope/name/version[/peer]"
std::optional<PackageId> parse_spec_shrinkwrap(const std::string& spec);
// "/name/version[_peer]"
std::optional<PackageId> parse_spec_v5(const std::string& spec);
// "[/]name@version[(peer)...]"
std::optional<PackageId> parse_spec_v6plus(const std::string& spec);

// Parser used for package keys of the given era. Unknown eras auto-detect.
std::optional<PackageId> parse_pnpm_spec_for_era(const std::string& spec, PnpmEra era);

// Package name of a spec, nullopt for local or malformed specs
std::optional<std::string> parse_pnpm_key(const std::string& spec);

// ---------------------------------------------------------------------------
// Peer suffixes
// ---------------------------------------------------------------------------

bool has_peer_suffix(const std::string& spec);         // shrinkwrap: extra '/' segment
bool has_peer_suffix_v5(const std::string& spec);      // '_'
bool has_peer_suffix_v6plus(const std::string& spec);  // "(...)"

std::optional<std::string> extract_peer_suffix(const std::string& spec);
std::optional<std::string> extract_peer_suffix_v5(const std::string& spec);
std::optional<std::string> extract_peer_suffix_v6plus(const std::string& spec);

// "(a@1.0.0)(@b/c@2.0.0)" -> [{a, 1.0.0}, {@b/c, 2.0.0}]
std::vector<PackageId> parse_peer_dependencies(const std::string& suffix);

// ---------------------------------------------------------------------------
// Loader and extraction
// ---------------------------------------------------------------------------

// pnpm-lock.yaml / shrinkwrap.yaml, every era. Loads packages, v9 snapshots
// and importers; a single-project lockfile gets a synthesized "." importer.
Result<LockTables> load_pnpm_tables(const std::string& content,
                                    const std::string& filename = "<input>");

// The record for one packages entry, or nullopt when the entry is filtered
std::optional<Dependency> extract_pnpm_entry(const std::string& spec,
                                             const PackageEntry& entry,
                                             PnpmEra era);

} // namespace flatlock

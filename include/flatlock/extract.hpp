#pragma once

#include <flatlock/dependency.hpp>
#include <flatlock/lockfile.hpp>
#include <flatlock/result.hpp>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace flatlock {

struct ParseOptions {
    std::optional<LockfileFormat> format;  // skips detection when set
    std::string path;                      // detection hint and error location
};

// Detect (unless options name a format) and load the raw tables
Result<LockTables> parse_lockfile(const std::string& content,
                                  const ParseOptions& options = {});

// The record for one packages entry of the given tables, or nullopt when the
// format's extractor filters it (links, workspaces, local specs)
std::optional<Dependency> extract_entry(const LockTables& tables,
                                        const std::string& key,
                                        const PackageEntry& entry);

// Lazy, finite, single-pass sequence of the external packages in a lockfile.
// Link and workspace entries are never yielded. Iterating again needs a new
// stream over the same tables.
class DependencyStream {
public:
    explicit DependencyStream(std::shared_ptr<const LockTables> tables);

    // nullopt once exhausted
    std::optional<Dependency> next();

    LockfileFormat format() const { return tables_->format; }
    const std::shared_ptr<const LockTables>& tables() const { return tables_; }

private:
    std::shared_ptr<const LockTables> tables_;
    PackageTable::const_iterator it_;
    bool done_ = false;
    std::unordered_set<std::string> seen_;  // pnpm: one record per name@version
    size_t yielded_ = 0;
};

// Format detection happens here, before iteration starts
Result<DependencyStream> stream_dependencies(const std::string& content,
                                             const ParseOptions& options = {});

// Drain a whole stream
Result<std::vector<Dependency>> collect(const std::string& content,
                                        const ParseOptions& options = {});

} // namespace flatlock

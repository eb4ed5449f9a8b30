#include <flatlock/extract.hpp>
#include <flatlock/detect.hpp>
#include <flatlock/log.hpp>
#include <flatlock/parsers/npm.hpp>
#include <flatlock/parsers/pnpm.hpp>
#include <flatlock/parsers/yarn_berry.hpp>
#include <flatlock/parsers/yarn_classic.hpp>

namespace flatlock {

Result<LockTables> parse_lockfile(const std::string& content,
                                  const ParseOptions& options) {
    LockfileFormat format;
    if (options.format) {
        format = *options.format;
    } else {
        auto detected = detect_format(content, options.path);
        if (detected.is_err()) return std::move(detected).error();
        format = detected.value();
    }

    std::string filename = options.path.empty() ? "<input>" : options.path;
    return load_tables(content, format, filename);
}

std::optional<Dependency> extract_entry(const LockTables& tables,
                                        const std::string& key,
                                        const PackageEntry& entry) {
    switch (tables.format) {
        case LockfileFormat::Npm:
            return extract_npm_entry(key, entry);
        case LockfileFormat::Pnpm:
            return extract_pnpm_entry(key, entry, tables.pnpm.era);
        case LockfileFormat::YarnClassic:
            return extract_yarn_classic_entry(key, entry);
        case LockfileFormat::YarnBerry:
            return extract_yarn_berry_entry(key, entry);
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// DependencyStream
// ---------------------------------------------------------------------------

DependencyStream::DependencyStream(std::shared_ptr<const LockTables> tables)
    : tables_(std::move(tables)), it_(tables_->packages.begin()) {}

// pnpm v9 snapshots are peer variants of packages entries; they add edges
// for resolution but never records of their own
std::optional<Dependency> DependencyStream::next() {
    while (!done_) {
        if (it_ == tables_->packages.end()) {
            done_ = true;
            log::debug("%s lockfile: %zu dependencies",
                       format_name(tables_->format), yielded_);
            break;
        }

        const auto& [key, entry] = *it_;
        ++it_;

        auto dep = extract_entry(*tables_, key, entry);
        if (!dep) continue;
        if (tables_->format == LockfileFormat::Pnpm &&
            !seen_.insert(dep->key()).second) {
            continue;
        }
        ++yielded_;
        return dep;
    }
    return std::nullopt;
}

Result<DependencyStream> stream_dependencies(const std::string& content,
                                             const ParseOptions& options) {
    auto tables = parse_lockfile(content, options);
    if (tables.is_err()) return std::move(tables).error();
    return Result<DependencyStream>::ok(DependencyStream(
        std::make_shared<const LockTables>(std::move(tables).value())));
}

Result<std::vector<Dependency>> collect(const std::string& content,
                                        const ParseOptions& options) {
    auto stream = stream_dependencies(content, options);
    if (stream.is_err()) return std::move(stream).error();

    std::vector<Dependency> deps;
    while (auto dep = stream.value().next()) {
        deps.push_back(std::move(*dep));
    }
    return Result<std::vector<Dependency>>::ok(std::move(deps));
}

} // namespace flatlock

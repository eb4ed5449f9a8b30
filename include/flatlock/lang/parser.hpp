#pragma once

#include <flatlock/lang/lexer.hpp>
#include <flatlock/result.hpp>
#include <string>
#include <vector>

namespace flatlock {

// One "key value" line or "key:" block of a yarn v1 lockfile
struct YarnNode {
    std::string key;        // multi-key headers joined with ", "
    std::string value;      // empty for blocks
    std::vector<YarnNode> children;
    bool is_block = false;
    int line = 0;

    // Child lookup by key, nullptr when absent
    const YarnNode* find(const std::string& child_key) const;
    // Scalar child value, empty when absent or a block
    std::string get(const std::string& child_key) const;
};

struct YarnLockDocument {
    std::string lockfile_version;  // from "# yarn lockfile v1", empty if missing
    std::vector<YarnNode> entries;
};

Result<YarnLockDocument> parse_yarn_tokens(const std::vector<YarnToken>& tokens,
                                           const std::string& filename = "<input>");

// Lex and parse in one step
Result<YarnLockDocument> parse_yarn_lock(const std::string& source,
                                         const std::string& filename = "<input>");

} // namespace flatlock

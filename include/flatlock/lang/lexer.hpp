#pragma once

#include <flatlock/lang/yarn_token.hpp>
#include <flatlock/result.hpp>
#include <string>
#include <vector>

namespace flatlock {

// Lex a yarn v1 lockfile. Fails with a Parse error on odd indentation,
// unterminated strings and merge-conflict markers.
Result<std::vector<YarnToken>> lex_yarn_lock(const std::string& source,
                                             const std::string& filename = "<input>");

} // namespace flatlock

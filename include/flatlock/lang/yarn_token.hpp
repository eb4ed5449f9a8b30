#pragma once

#include <string>

namespace flatlock {

// Where a token starts, for error reporting
struct SourcePos {
    std::string file;
    int line = 1;
    int col = 1;
};

// Tokens of the yarn v1 lockfile syntax
enum class YarnTokenType {
    Newline,
    Indent,     // start of a non-blank line; value is depth in 2-space steps
    String,     // quoted or bare word
    Number,
    Boolean,
    Colon,
    Comma,
    Comment,    // text after '#'
    Eof
};

struct YarnToken {
    YarnTokenType type;
    std::string text;   // unescaped for quoted strings
    SourcePos pos;
    int value = 0;      // indent depth
};

const char* yarn_token_name(YarnTokenType t);

} // namespace flatlock

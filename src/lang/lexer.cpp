#include <flatlock/lang/lexer.hpp>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>

namespace flatlock {

const char* yarn_token_name(YarnTokenType t) {
    switch (t) {
    case YarnTokenType::Newline: return "Newline";
    case YarnTokenType::Indent:  return "Indent";
    case YarnTokenType::String:  return "String";
    case YarnTokenType::Number:  return "Number";
    case YarnTokenType::Boolean: return "Boolean";
    case YarnTokenType::Colon:   return "Colon";
    case YarnTokenType::Comma:   return "Comma";
    case YarnTokenType::Comment: return "Comment";
    case YarnTokenType::Eof:     return "Eof";
    }
    return "Unknown";
}

namespace {

bool is_number_word(const std::string& s) {
    if (s.empty()) return false;
    bool seen_dot = false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '.') {
            if (seen_dot || i == 0 || i + 1 == s.size()) return false;
            seen_dot = true;
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// ---------------------------------------------------------------------------
// Lexer state machine
// ---------------------------------------------------------------------------

struct Lexer {
    const std::string& source;
    const std::string& filename;
    size_t pos;
    int line;
    int col;
    bool at_line_start;

    std::vector<YarnToken> tokens;

    Lexer(const std::string& src, const std::string& fname)
        : source(src), filename(fname), pos(0), line(1), col(1),
          at_line_start(true) {}

    bool at_end() const { return pos >= source.size(); }

    char peek() const { return source[pos]; }

    char peek_at(size_t offset) const {
        return (pos + offset < source.size()) ? source[pos + offset] : '\0';
    }

    char advance() {
        char c = source[pos++];
        if (c == '\n') {
            ++line;
            col = 1;
        } else {
            ++col;
        }
        return c;
    }

    SourcePos current_pos() const {
        return {filename, line, col};
    }

    void emit(YarnTokenType type, const std::string& text, SourcePos p, int value = 0) {
        tokens.push_back({type, text, p, value});
    }

    FlatlockError error(const std::string& msg, const std::string& hint = "") const {
        return FlatlockError{FlatlockError::Parse, msg, hint, filename, line};
    }

    bool at_conflict_marker() const {
        return source.compare(pos, 7, "<<<<<<<") == 0 ||
               source.compare(pos, 7, "=======") == 0 ||
               source.compare(pos, 7, ">>>>>>>") == 0;
    }

    Result<std::vector<YarnToken>> run() {
        while (!at_end()) {
            if (at_line_start) {
                auto r = lex_indent();
                if (r.is_err()) return std::move(r).error();
                continue;
            }

            auto p = current_pos();
            char c = peek();

            if (c == '\r' && peek_at(1) == '\n') {
                advance();
                continue;
            }
            if (c == '\n') {
                advance();
                emit(YarnTokenType::Newline, "", p);
                at_line_start = true;
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\r') {
                advance();
                continue;
            }
            if (c == '#') {
                lex_comment(p);
                continue;
            }
            if (c == '"') {
                auto r = lex_string(p);
                if (r.is_err()) return std::move(r).error();
                continue;
            }
            if (c == ':') {
                advance();
                emit(YarnTokenType::Colon, ":", p);
                continue;
            }
            if (c == ',') {
                advance();
                emit(YarnTokenType::Comma, ",", p);
                continue;
            }
            lex_word(p);
        }

        emit(YarnTokenType::Eof, "", current_pos());
        return Result<std::vector<YarnToken>>::ok(std::move(tokens));
    }

    // Blank and comment-only lines produce no Indent token
    Status lex_indent() {
        at_line_start = false;

        size_t spaces = 0;
        while (peek_at(spaces) == ' ') ++spaces;
        char first = peek_at(spaces);
        if (first == '\0' || first == '\n' || first == '\r' || first == '#') {
            for (size_t i = 0; i < spaces; ++i) advance();
            return ok_status();
        }

        if (spaces == 0 && at_conflict_marker()) {
            return error("merge conflict marker in lockfile",
                         "resolve the conflict and regenerate the lockfile");
        }
        if (first == '\t') {
            return error("tab in indentation", "yarn lockfiles indent with spaces");
        }
        if (spaces % 2 != 0) {
            return error("invalid indentation: " + std::to_string(spaces) + " spaces",
                         "indentation must be a multiple of two spaces");
        }

        auto p = current_pos();
        for (size_t i = 0; i < spaces; ++i) advance();
        emit(YarnTokenType::Indent, "", p, static_cast<int>(spaces / 2));
        return ok_status();
    }

    void lex_comment(SourcePos p) {
        advance(); // #
        std::string text;
        while (!at_end() && peek() != '\n' && peek() != '\r') {
            text += advance();
        }
        size_t first = text.find_first_not_of(' ');
        text = first == std::string::npos ? "" : text.substr(first);
        emit(YarnTokenType::Comment, text, p);
    }

    Status lex_string(SourcePos p) {
        advance(); // opening "
        std::string text;
        while (!at_end()) {
            char c = peek();
            if (c == '"') {
                advance();
                emit(YarnTokenType::String, text, p);
                return ok_status();
            }
            if (c == '\n') break;
            if (c == '\\') {
                advance();
                if (at_end()) break;
                auto r = lex_escape(text);
                if (r.is_err()) return r;
                continue;
            }
            text += advance();
        }
        return FlatlockError{FlatlockError::Parse, "unterminated string",
                             "close the string with '\"' on the same line",
                             filename, p.line};
    }

    Status lex_escape(std::string& out) {
        char e = advance();
        switch (e) {
        case 'n':  out += '\n'; break;
        case 't':  out += '\t'; break;
        case 'r':  out += '\r'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case '"':  out += '"';  break;
        case '\\': out += '\\'; break;
        case '/':  out += '/';  break;
        case 'u': {
            auto cp = read_hex4();
            if (!cp) return error("invalid \\u escape");
            uint32_t code = *cp;
            // Surrogate pair
            if (code >= 0xD800 && code <= 0xDBFF && peek_at(0) == '\\' && peek_at(1) == 'u') {
                advance();
                advance();
                auto low = read_hex4();
                if (!low) return error("invalid \\u escape");
                if (*low >= 0xDC00 && *low <= 0xDFFF) {
                    code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                } else {
                    append_utf8(out, code);
                    code = *low;
                }
            }
            append_utf8(out, code);
            break;
        }
        default:
            out += e;
            break;
        }
        return ok_status();
    }

    std::optional<uint32_t> read_hex4() {
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            if (at_end()) return std::nullopt;
            char c = peek();
            uint32_t digit;
            if (c >= '0' && c <= '9') digit = static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') digit = static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') digit = static_cast<uint32_t>(c - 'A' + 10);
            else return std::nullopt;
            value = value * 16 + digit;
            advance();
        }
        return value;
    }

    void lex_word(SourcePos p) {
        std::string text;
        while (!at_end()) {
            char c = peek();
            if (c == ':' || c == ',' || c == ' ' || c == '\t' ||
                c == '\n' || c == '\r') {
                break;
            }
            text += advance();
        }
        if (text == "true" || text == "false") {
            emit(YarnTokenType::Boolean, text, p);
        } else if (is_number_word(text)) {
            emit(YarnTokenType::Number, text, p);
        } else {
            emit(YarnTokenType::String, text, p);
        }
    }
};

} // namespace

Result<std::vector<YarnToken>> lex_yarn_lock(const std::string& source,
                                             const std::string& filename) {
    Lexer lexer(source, filename);
    return lexer.run();
}

} // namespace flatlock

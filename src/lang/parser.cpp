#include <flatlock/lang/parser.hpp>

namespace flatlock {

const YarnNode* YarnNode::find(const std::string& child_key) const {
    for (const auto& child : children) {
        if (child.key == child_key) return &child;
    }
    return nullptr;
}

std::string YarnNode::get(const std::string& child_key) const {
    const YarnNode* child = find(child_key);
    if (!child || child->is_block) return "";
    return child->value;
}

namespace {

using TT = YarnTokenType;

// ---------------------------------------------------------------------------
// Parser state machine
// ---------------------------------------------------------------------------

struct Parser {
    const std::vector<YarnToken>& tokens;
    const std::string& filename;
    size_t pos;

    YarnLockDocument doc;

    Parser(const std::vector<YarnToken>& toks, const std::string& fname)
        : tokens(toks), filename(fname), pos(0) {}

    // -- Navigation ---------------------------------------------------------

    bool at_end() const {
        return pos >= tokens.size() || tokens[pos].type == TT::Eof;
    }

    const YarnToken& peek() const {
        return pos < tokens.size() ? tokens[pos] : tokens.back();
    }

    const YarnToken& advance() {
        const auto& tok = peek();
        if (!at_end()) ++pos;
        return tok;
    }

    bool check(TT type) const {
        return !at_end() && peek().type == type;
    }

    bool match(TT type) {
        if (check(type)) {
            advance();
            return true;
        }
        return false;
    }

    bool check_scalar() const {
        return check(TT::String) || check(TT::Number) || check(TT::Boolean);
    }

    bool at_line_end() const {
        return at_end() || check(TT::Newline) || check(TT::Comment);
    }

    // -- Diagnostics --------------------------------------------------------

    FlatlockError error(const std::string& msg, const std::string& hint = "") const {
        int line = tokens.empty() ? 0 : peek().pos.line;
        return FlatlockError{FlatlockError::Parse, msg, hint, filename, line};
    }

    // Newlines and comments between entries; picks up the version header
    void skip_trivia() {
        while (check(TT::Newline) || check(TT::Comment)) {
            const auto& tok = advance();
            if (tok.type != TT::Comment) continue;
            const std::string marker = "yarn lockfile v";
            if (doc.lockfile_version.empty() && tok.text.rfind(marker, 0) == 0) {
                doc.lockfile_version = tok.text.substr(marker.size());
            }
        }
    }

    // -- Grammar ------------------------------------------------------------

    Result<std::vector<YarnNode>> parse_block(int depth) {
        std::vector<YarnNode> nodes;
        while (true) {
            skip_trivia();
            if (at_end()) break;
            if (!check(TT::Indent)) {
                return error(std::string("expected start of line, got ") +
                             yarn_token_name(peek().type));
            }
            int d = peek().value;
            if (d < depth) break;
            if (d > depth) {
                return error("unexpected indentation",
                             "nested entries must follow a 'key:' line");
            }
            advance();

            auto node = parse_entry(depth);
            if (node.is_err()) return std::move(node).error();
            nodes.push_back(std::move(node).value());
        }
        return Result<std::vector<YarnNode>>::ok(std::move(nodes));
    }

    Result<YarnNode> parse_entry(int depth) {
        YarnNode node;
        node.line = peek().pos.line;

        if (!check_scalar()) {
            return error(std::string("expected key, got ") + yarn_token_name(peek().type));
        }
        node.key = advance().text;
        size_t key_count = 1;
        while (match(TT::Comma)) {
            if (!check_scalar()) return error("expected key after ','");
            node.key += ", ";
            node.key += advance().text;
            ++key_count;
        }

        if (match(TT::Colon)) {
            if (!at_line_end()) {
                return error("unexpected value after '" + node.key + ":'",
                             "nested values must start on the next line");
            }
            auto children = parse_block(depth + 1);
            if (children.is_err()) return std::move(children).error();
            node.children = std::move(children).value();
            node.is_block = true;
            return Result<YarnNode>::ok(std::move(node));
        }

        if (key_count > 1) return error("expected ':' after key list");
        if (!check_scalar()) {
            return error("expected value for '" + node.key + "'");
        }
        node.value = advance().text;
        if (!at_line_end()) {
            return error(std::string("unexpected ") + yarn_token_name(peek().type) +
                         " after value of '" + node.key + "'");
        }
        return Result<YarnNode>::ok(std::move(node));
    }

    Result<YarnLockDocument> run() {
        auto entries = parse_block(0);
        if (entries.is_err()) return std::move(entries).error();
        doc.entries = std::move(entries).value();
        return Result<YarnLockDocument>::ok(std::move(doc));
    }
};

} // namespace

Result<YarnLockDocument> parse_yarn_tokens(const std::vector<YarnToken>& tokens,
                                           const std::string& filename) {
    if (tokens.empty()) {
        return Result<YarnLockDocument>::ok(YarnLockDocument{});
    }
    Parser parser(tokens, filename);
    return parser.run();
}

Result<YarnLockDocument> parse_yarn_lock(const std::string& source,
                                         const std::string& filename) {
    auto tokens = lex_yarn_lock(source, filename);
    if (tokens.is_err()) return std::move(tokens).error();
    return parse_yarn_tokens(tokens.value(), filename);
}

} // namespace flatlock

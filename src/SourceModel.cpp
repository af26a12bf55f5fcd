/**
 * @file SourceModel.cpp
 * @brief Declaration extraction from C-family sources
 *
 * The parser is deliberately shallow: it balances brackets, finds top-level
 * statement boundaries and classifies each statement by its head. Bodies are
 * kept as opaque text.
 */

#include "autodeploy/SourceModel.hpp"
#include "autodeploy/Errors.hpp"
#include "autodeploy/Fingerprint.hpp"
#include "autodeploy/Lexer.hpp"

#include <cstdio>
#include <unordered_set>

namespace autodeploy {

const char* to_string(DeclarationKind kind) {
    switch (kind) {
        case DeclarationKind::Function: return "function";
        case DeclarationKind::Type: return "type";
        case DeclarationKind::Constant: return "constant";
    }
    return "unknown";
}

std::string Fingerprint::hex() const {
    return to_hex(digest);
}

namespace {

/**
 * @brief Token index range of one top-level statement
 */
struct Statement {
    std::size_t begin = 0;               ///< first significant token
    std::size_t end = 0;                 ///< last token (terminator)
    std::size_t body_open = kNoId;       ///< first depth-0 '{'
    std::size_t body_close = kNoId;      ///< its matching '}'
    std::size_t first_paren = kNoId;     ///< first depth-0 '(' before the body
    std::size_t first_eq = kNoId;        ///< first depth-0 '=' before the body
};

class Parser {
public:
    Parser(const Repository& repo, const std::string& path, const std::string& content)
        : repo_(repo), path_(path), content_(content), toks_(tokenize(content, path)) {}

    SourceUnit run() {
        SourceUnit unit;
        unit.path = path_;
        unit.repository = repo_.index;

        std::size_t i = 0;
        std::size_t transparent_depth = 0;
        std::size_t comment_start = kNoId;
        std::size_t last_end_line = 0;

        while (i < toks_.size()) {
            const Token& t = toks_[i];

            if (t.kind == TokenKind::Preprocessor) {
                record_include(t, unit);
                comment_start = kNoId;
                ++i;
                continue;
            }
            if (t.kind == TokenKind::Comment) {
                if (comment_start == kNoId && t.line > last_end_line) {
                    comment_start = i;
                }
                ++i;
                continue;
            }
            if (t.is_punct(";")) {
                comment_start = kNoId;
                ++i;
                continue;
            }
            if (t.is_punct("}")) {
                if (transparent_depth == 0) {
                    fail(t, "unbalanced '}'");
                }
                --transparent_depth;
                last_end_line = t.line;
                comment_start = kNoId;
                ++i;
                continue;
            }

            std::size_t block = transparent_block_end(i);
            if (block != kNoId) {
                ++transparent_depth;
                last_end_line = toks_[block].line;
                comment_start = kNoId;
                i = block + 1;
                continue;
            }

            Statement st = scan_statement(i);
            emit(st, comment_start, unit);
            last_end_line = toks_[st.end].line;
            comment_start = kNoId;
            i = st.end + 1;
        }

        if (transparent_depth > 0) {
            fail_at_end("unterminated namespace or linkage block");
        }

        for (std::size_t k = 0; k < unit.declarations.size(); ++k) {
            unit.declarations[k].ordinal = k;
        }
        return unit;
    }

private:
    const Repository& repo_;
    const std::string& path_;
    const std::string& content_;
    std::vector<Token> toks_;

    [[noreturn]] void fail(const Token& t, const std::string& details) const {
        throw ParseError(path_, t.line, t.column, details);
    }

    [[noreturn]] void fail_at_end(const std::string& details) const {
        if (toks_.empty()) {
            throw ParseError(path_, 1, 1, details);
        }
        const Token& last = toks_.back();
        throw ParseError(path_, last.line, last.column + last.text.size(), details);
    }

    std::size_t next_significant(std::size_t i) const {
        while (i < toks_.size() && !is_significant(toks_[i])) ++i;
        return i;
    }

    void record_include(const Token& t, SourceUnit& unit) const {
        std::size_t p = 1;
        while (p < t.text.size() && (t.text[p] == ' ' || t.text[p] == '\t')) ++p;
        if (t.text.compare(p, 7, "include") != 0) return;
        p += 7;
        while (p < t.text.size() && (t.text[p] == ' ' || t.text[p] == '\t')) ++p;
        std::string header = t.text.substr(p);
        std::size_t q = header.find_first_of(">\"", 1);
        if (!header.empty() && q != std::string::npos) {
            header = header.substr(0, q + 1);
        }
        if (!header.empty()) {
            unit.includes.push_back(header);
        }
    }

    /**
     * @brief If a `namespace N {` or `extern "C" {` header starts at i,
     *        return the index of its '{'
     */
    std::size_t transparent_block_end(std::size_t i) const {
        const Token& t = toks_[i];
        if (t.is_keyword("namespace") || t.is_keyword("inline")) {
            std::size_t j = i;
            if (t.is_keyword("inline")) {
                j = next_significant(j + 1);
                if (j >= toks_.size() || !toks_[j].is_keyword("namespace")) return kNoId;
            }
            j = next_significant(j + 1);
            while (j < toks_.size() &&
                   (toks_[j].kind == TokenKind::Identifier || toks_[j].is_punct("::") ||
                    toks_[j].is_keyword("inline"))) {
                j = next_significant(j + 1);
            }
            if (j < toks_.size() && toks_[j].is_punct("{")) return j;
            return kNoId;
        }
        if (t.is_keyword("extern")) {
            std::size_t j = next_significant(i + 1);
            if (j < toks_.size() && toks_[j].kind == TokenKind::String) {
                j = next_significant(j + 1);
                if (j < toks_.size() && toks_[j].is_punct("{")) return j;
            }
        }
        return kNoId;
    }

    /**
     * @brief Find the extent of the statement starting at i
     */
    Statement scan_statement(std::size_t i) const {
        Statement st;
        st.begin = i;

        std::vector<const Token*> stack;
        bool function_body = false;

        for (std::size_t j = i; j < toks_.size(); ++j) {
            const Token& t = toks_[j];
            if (!is_significant(t) || t.kind != TokenKind::Punct) continue;

            if (t.text == "(" || t.text == "[") {
                if (stack.empty() && t.text == "(" && st.body_open == kNoId &&
                    st.first_paren == kNoId) {
                    st.first_paren = j;
                }
                stack.push_back(&t);
            } else if (t.text == "{") {
                if (stack.empty() && st.body_open == kNoId) {
                    st.body_open = j;
                    function_body = st.first_eq == kNoId && st.first_paren != kNoId;
                }
                stack.push_back(&t);
            } else if (t.text == ")" || t.text == "]" || t.text == "}") {
                const char* open = t.text == ")" ? "(" : (t.text == "]" ? "[" : "{");
                if (stack.empty() || stack.back()->text != open) {
                    fail(t, "unbalanced '" + t.text + "'");
                }
                stack.pop_back();
                if (stack.empty() && t.text == "}" && st.body_close == kNoId &&
                    st.body_open != kNoId) {
                    st.body_close = j;
                    if (function_body) {
                        st.end = j;
                        return st;
                    }
                }
            } else if (stack.empty()) {
                if (t.text == "=" && st.body_open == kNoId && st.first_eq == kNoId) {
                    st.first_eq = j;
                } else if (t.text == ";") {
                    st.end = j;
                    return st;
                }
            }
        }

        if (!stack.empty()) {
            fail(*stack.back(), "unbalanced '" + stack.back()->text + "'");
        }
        fail_at_end("declaration is missing its terminator");
    }

    /// Skip a leading `template <...>` parameter list.
    std::size_t skip_template_header(std::size_t i, std::size_t limit) const {
        if (!toks_[i].is_keyword("template")) return i;
        std::size_t j = next_significant(i + 1);
        if (j >= limit || !toks_[j].is_punct("<")) return i;
        int depth = 0;
        for (; j < limit; ++j) {
            const Token& t = toks_[j];
            if (t.is_punct("<")) ++depth;
            else if (t.is_punct(">")) --depth;
            else if (t.is_punct(">>")) depth -= 2;
            if (depth <= 0) return next_significant(j + 1);
        }
        return i;
    }

    bool head_has_keyword(std::size_t from, std::size_t to, const char* kw) const {
        for (std::size_t j = from; j < to; ++j) {
            if (toks_[j].is_keyword(kw)) return true;
        }
        return false;
    }

    /// Last identifier in [from, to) that is outside any ( ) or [ ] group.
    std::size_t last_identifier_outside_groups(std::size_t from, std::size_t to) const {
        std::size_t found = kNoId;
        int depth = 0;
        for (std::size_t j = from; j < to; ++j) {
            const Token& t = toks_[j];
            if (t.is_punct("(") || t.is_punct("[")) ++depth;
            else if (t.is_punct(")") || t.is_punct("]")) --depth;
            else if (depth == 0 && t.kind == TokenKind::Identifier) found = j;
        }
        return found;
    }

    std::size_t function_name(const Statement& st, std::size_t head) const {
        std::size_t found = kNoId;
        int depth = 0;
        for (std::size_t j = head; j < st.first_paren; ++j) {
            const Token& t = toks_[j];
            if (t.is_punct("[")) ++depth;
            else if (t.is_punct("]")) --depth;
            else if (depth == 0 && t.kind == TokenKind::Identifier) found = j;
        }
        return found;
    }

    std::size_t type_name(const Statement& st, std::size_t head) const {
        std::size_t limit = st.body_open != kNoId ? st.body_open : st.end;
        for (std::size_t j = head; j < limit; ++j) {
            const Token& t = toks_[j];
            if (t.is_keyword("struct") || t.is_keyword("class") || t.is_keyword("union") ||
                t.is_keyword("enum")) {
                for (std::size_t k = j + 1; k < limit; ++k) {
                    const Token& n = toks_[k];
                    if (n.kind == TokenKind::Identifier) {
                        // Skip a trailing `final` style marker or base clause.
                        return k;
                    }
                    if (n.is_punct(":") || n.is_punct("{")) break;
                }
                break;
            }
        }
        if (st.body_close != kNoId) {
            // typedef struct { ... } name;  /  anonymous aggregate declarator
            for (std::size_t k = st.body_close + 1; k < st.end; ++k) {
                if (toks_[k].kind == TokenKind::Identifier) return k;
            }
            // anonymous enum: named after its first enumerator
            if (head_has_keyword(head, st.body_open, "enum")) {
                for (std::size_t k = st.body_open + 1; k < st.body_close; ++k) {
                    if (toks_[k].kind == TokenKind::Identifier) return k;
                }
            }
        }
        return kNoId;
    }

    std::size_t typedef_name(const Statement& st, std::size_t head) const {
        // typedef int (*callback)(int);
        for (std::size_t j = head; j + 2 < st.end; ++j) {
            if (toks_[j].is_punct("(") && toks_[j + 1].is_punct("*") &&
                toks_[j + 2].kind == TokenKind::Identifier) {
                return j + 2;
            }
        }
        return last_identifier_outside_groups(head, st.end);
    }

    void emit(const Statement& st, std::size_t comment_start, SourceUnit& unit) const {
        std::size_t head = skip_template_header(st.begin, st.end);

        DeclarationKind kind = DeclarationKind::Constant;
        std::size_t name_tok = kNoId;
        const bool has_body = st.body_open != kNoId;
        const bool is_typedef = head_has_keyword(head, has_body ? st.body_open : st.end, "typedef");

        if (toks_[head].is_keyword("using")) {
            // using Alias = ...;  (using-directives and using-declarations are not merge units)
            std::size_t n = next_significant(head + 1);
            if (st.first_eq == kNoId || n >= st.end || toks_[n].kind != TokenKind::Identifier) {
                return;
            }
            kind = DeclarationKind::Type;
            name_tok = n;
        } else if (is_typedef) {
            kind = DeclarationKind::Type;
            name_tok = has_body ? type_name(st, head) : typedef_name(st, head);
        } else if (st.first_eq != kNoId) {
            kind = DeclarationKind::Constant;
            name_tok = last_identifier_outside_groups(head, st.first_eq);
        } else if (has_body && st.first_paren != kNoId) {
            kind = DeclarationKind::Function;
            name_tok = function_name(st, head);
        } else if (has_body) {
            kind = DeclarationKind::Type;
            name_tok = type_name(st, head);
        } else {
            // Prototypes, forward declarations and extern declarations carry no code.
            if (st.first_paren != kNoId || head_has_keyword(head, st.end, "extern") ||
                head_has_keyword(head, st.end, "struct") || head_has_keyword(head, st.end, "class") ||
                head_has_keyword(head, st.end, "union") || head_has_keyword(head, st.end, "enum")) {
                return;
            }
            kind = DeclarationKind::Constant;
            name_tok = last_identifier_outside_groups(head, st.end);
        }

        if (name_tok == kNoId) {
            if (has_body) {
                fail(toks_[st.begin], "cannot determine declaration name");
            }
            return;
        }

        Declaration decl;
        decl.kind = kind;
        decl.name = toks_[name_tok].text;

        std::size_t span_begin = toks_[st.begin].offset;
        if (comment_start != kNoId) {
            span_begin = toks_[comment_start].offset;
            for (std::size_t c = comment_start; c < st.begin; ++c) {
                if (toks_[c].kind == TokenKind::Comment &&
                    toks_[c].text.find("@export") != std::string::npos) {
                    decl.exported = true;
                }
            }
        }
        decl.text = content_.substr(span_begin, toks_[st.end].end() - span_begin);
        decl.name_offset = toks_[name_tok].offset - span_begin;
        decl.line = comment_start != kNoId ? toks_[comment_start].line : toks_[st.begin].line;
        decl.references = collect_references(st, decl.name);
        decl.fingerprint = fingerprint(decl);

        unit.declarations.push_back(std::move(decl));
    }

    std::vector<std::string> collect_references(const Statement& st, const std::string& self) const {
        std::vector<std::string> refs;
        std::unordered_set<std::string> seen;
        const Token* prev = nullptr;
        const Token* prev2 = nullptr;

        for (std::size_t j = st.begin; j <= st.end; ++j) {
            const Token& t = toks_[j];
            if (!is_significant(t)) continue;

            if (t.kind == TokenKind::Identifier && t.text != self) {
                bool member = prev && (prev->is_punct(".") || prev->is_punct("->"));
                bool qualified = prev && prev->is_punct("::") && prev2 &&
                                 (prev2->kind == TokenKind::Identifier || prev2->is_punct(">"));
                std::size_t n = next_significant(j + 1);
                bool scope = n < toks_.size() && toks_[n].is_punct("::");
                if (!member && !qualified && !scope && seen.insert(t.text).second) {
                    refs.push_back(t.text);
                }
            }
            prev2 = prev;
            prev = &t;
        }
        return refs;
    }
};

} // anonymous namespace

SourceUnit parse(const Repository& repository, const std::string& path, const std::string& content) {
    return Parser(repository, path, content).run();
}

} // namespace autodeploy

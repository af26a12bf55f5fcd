/**
 * @file Lexer.cpp
 * @brief C-family tokenizer implementation
 */

#include "autodeploy/Lexer.hpp"
#include "autodeploy/Errors.hpp"

#include <array>
#include <cctype>
#include <unordered_set>

namespace autodeploy {

namespace {

const std::unordered_set<std::string>& keywords() {
    static const std::unordered_set<std::string> words = {
        // C
        "auto", "break", "case", "char", "const", "continue", "default", "do",
        "double", "else", "enum", "extern", "float", "for", "goto", "if",
        "inline", "int", "long", "register", "restrict", "return", "short",
        "signed", "sizeof", "static", "struct", "switch", "typedef", "union",
        "unsigned", "void", "volatile", "while", "_Bool", "_Static_assert",
        // C++
        "alignas", "alignof", "bool", "catch", "char8_t", "char16_t", "char32_t",
        "class", "concept", "const_cast", "consteval", "constexpr", "constinit",
        "co_await", "co_return", "co_yield", "decltype", "delete", "dynamic_cast",
        "explicit", "export", "false", "friend", "mutable", "namespace", "new",
        "noexcept", "nullptr", "operator", "private", "protected", "public",
        "reinterpret_cast", "requires", "static_assert", "static_cast", "template",
        "this", "thread_local", "throw", "true", "try", "typeid", "typename",
        "using", "virtual", "wchar_t", "override", "final"
    };
    return words;
}

// Longest match first within each length class.
constexpr std::array<const char*, 4> kPunct3 = {">>=", "<<=", "...", "<=>"};
constexpr std::array<const char*, 22> kPunct2 = {
    "::", "->", "++", "--", "<<", ">>", "<=", ">=", "==", "!=", "&&",
    "||", "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "##", ".*"
};

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_string_prefix(const std::string& word) {
    return word == "L" || word == "u" || word == "U" || word == "u8";
}

bool is_raw_prefix(const std::string& word) {
    return word == "R" || word == "LR" || word == "uR" || word == "UR" || word == "u8R";
}

class Scanner {
public:
    Scanner(const std::string& src, const std::string& path)
        : src_(src), path_(path) {}

    std::vector<Token> run() {
        std::vector<Token> out;
        bool line_start = true;

        while (pos_ < src_.size()) {
            char c = src_[pos_];

            if (c == '\n') {
                advance();
                line_start = true;
                continue;
            }
            if (std::isspace(static_cast<unsigned char>(c))) {
                advance();
                continue;
            }

            begin_token();

            if (c == '#' && line_start) {
                out.push_back(preprocessor());
                line_start = true;
                continue;
            }
            line_start = false;

            if (c == '/' && peek(1) == '/') {
                out.push_back(line_comment());
            } else if (c == '/' && peek(1) == '*') {
                out.push_back(block_comment());
            } else if (is_ident_start(c)) {
                out.push_back(word());
            } else if (std::isdigit(static_cast<unsigned char>(c)) ||
                       (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
                out.push_back(number());
            } else if (c == '"') {
                out.push_back(quoted('"', TokenKind::String));
            } else if (c == '\'') {
                out.push_back(quoted('\'', TokenKind::Char));
            } else {
                out.push_back(punct());
            }
        }
        return out;
    }

private:
    const std::string& src_;
    const std::string& path_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    std::size_t col_ = 1;

    std::size_t tok_offset_ = 0;
    std::size_t tok_line_ = 1;
    std::size_t tok_col_ = 1;

    char peek(std::size_t ahead) const {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }

    void advance() {
        if (src_[pos_] == '\n') {
            ++line_;
            col_ = 1;
        } else {
            ++col_;
        }
        ++pos_;
    }

    void begin_token() {
        tok_offset_ = pos_;
        tok_line_ = line_;
        tok_col_ = col_;
    }

    Token make(TokenKind kind) const {
        Token t;
        t.kind = kind;
        t.text = src_.substr(tok_offset_, pos_ - tok_offset_);
        t.offset = tok_offset_;
        t.line = tok_line_;
        t.column = tok_col_;
        return t;
    }

    [[noreturn]] void fail(const std::string& details) const {
        throw ParseError(path_, tok_line_, tok_col_, details);
    }

    Token preprocessor() {
        while (pos_ < src_.size() && src_[pos_] != '\n') {
            if (src_[pos_] == '\\' && peek(1) == '\n') {
                advance();
            }
            advance();
        }
        Token t = make(TokenKind::Preprocessor);
        while (!t.text.empty() && std::isspace(static_cast<unsigned char>(t.text.back()))) {
            t.text.pop_back();
        }
        return t;
    }

    Token line_comment() {
        while (pos_ < src_.size() && src_[pos_] != '\n') {
            advance();
        }
        return make(TokenKind::Comment);
    }

    Token block_comment() {
        advance();
        advance();
        while (true) {
            if (pos_ >= src_.size()) {
                fail("unterminated block comment");
            }
            if (src_[pos_] == '*' && peek(1) == '/') {
                advance();
                advance();
                break;
            }
            advance();
        }
        return make(TokenKind::Comment);
    }

    Token word() {
        while (pos_ < src_.size() && is_ident_char(src_[pos_])) {
            advance();
        }
        std::string text = src_.substr(tok_offset_, pos_ - tok_offset_);

        if (pos_ < src_.size()) {
            if (src_[pos_] == '"' && is_raw_prefix(text)) {
                return raw_string();
            }
            if (src_[pos_] == '"' && is_string_prefix(text)) {
                return quoted('"', TokenKind::String);
            }
            if (src_[pos_] == '\'' && is_string_prefix(text)) {
                return quoted('\'', TokenKind::Char);
            }
        }
        return make(keywords().count(text) > 0 ? TokenKind::Keyword : TokenKind::Identifier);
    }

    Token number() {
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if ((c == '+' || c == '-') && pos_ > tok_offset_) {
                char prev = src_[pos_ - 1];
                if (prev == 'e' || prev == 'E' || prev == 'p' || prev == 'P') {
                    advance();
                    continue;
                }
                break;
            }
            if (is_ident_char(c) || c == '.' || c == '\'') {
                advance();
                continue;
            }
            break;
        }
        return make(TokenKind::Number);
    }

    // Opening quote is at pos_ (any encoding prefix already consumed).
    Token quoted(char quote, TokenKind kind) {
        advance();
        while (true) {
            if (pos_ >= src_.size() || src_[pos_] == '\n') {
                fail(kind == TokenKind::String ? "unterminated string literal"
                                               : "unterminated character literal");
            }
            char c = src_[pos_];
            if (c == '\\') {
                advance();
                if (pos_ < src_.size()) advance();
                continue;
            }
            advance();
            if (c == quote) break;
        }
        return make(kind);
    }

    Token raw_string() {
        advance(); // opening quote
        std::string delim;
        while (pos_ < src_.size() && src_[pos_] != '(') {
            if (src_[pos_] == '\n' || delim.size() > 16) {
                fail("malformed raw string delimiter");
            }
            delim += src_[pos_];
            advance();
        }
        if (pos_ >= src_.size()) {
            fail("unterminated raw string literal");
        }
        const std::string closing = ")" + delim + "\"";
        std::size_t end = src_.find(closing, pos_);
        if (end == std::string::npos) {
            fail("unterminated raw string literal");
        }
        while (pos_ < end + closing.size()) {
            advance();
        }
        return make(TokenKind::String);
    }

    Token punct() {
        for (const char* p : kPunct3) {
            if (src_.compare(pos_, 3, p) == 0) {
                advance(); advance(); advance();
                return make(TokenKind::Punct);
            }
        }
        for (const char* p : kPunct2) {
            if (src_.compare(pos_, 2, p) == 0) {
                advance(); advance();
                return make(TokenKind::Punct);
            }
        }
        advance();
        return make(TokenKind::Punct);
    }
};

} // anonymous namespace

std::vector<Token> tokenize(const std::string& source, const std::string& path) {
    return Scanner(source, path).run();
}

bool is_keyword(const std::string& word) {
    return keywords().count(word) > 0;
}

} // namespace autodeploy

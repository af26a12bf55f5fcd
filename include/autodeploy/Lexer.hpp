/**
 * @file Lexer.hpp
 * @brief Tokenizer for brace-structured C-family sources
 *
 * Produces a flat token stream with byte offsets so later stages can
 * rewrite identifiers in place without disturbing formatting or comments.
 */

#ifndef AUTODEPLOY_LEXER_HPP
#define AUTODEPLOY_LEXER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace autodeploy {

enum class TokenKind {
    Identifier,
    Keyword,
    Number,
    String,
    Char,
    Punct,
    Comment,
    Preprocessor
};

struct Token {
    TokenKind kind = TokenKind::Punct;
    std::string text;
    std::size_t offset = 0;  ///< byte offset of the first character
    std::size_t line = 1;    ///< 1-based
    std::size_t column = 1;  ///< 1-based, in bytes

    bool is_punct(const char* p) const { return kind == TokenKind::Punct && text == p; }
    bool is_keyword(const char* k) const { return kind == TokenKind::Keyword && text == k; }
    std::size_t end() const { return offset + text.size(); }
};

/**
 * @brief Tokenize a source file
 *
 * Comments and preprocessor lines are kept as tokens; whitespace is not.
 *
 * @param source File content
 * @param path Path used in error messages
 * @return Token stream in source order
 * @throws ParseError on an unterminated string, character literal or
 *         block comment
 */
std::vector<Token> tokenize(const std::string& source, const std::string& path = "<memory>");

/**
 * @brief Check whether a word is a reserved C/C++ keyword or fundamental type
 */
bool is_keyword(const std::string& word);

/**
 * @brief True for tokens that carry program structure (not comments or
 *        preprocessor lines)
 */
inline bool is_significant(const Token& t) {
    return t.kind != TokenKind::Comment && t.kind != TokenKind::Preprocessor;
}

} // namespace autodeploy

#endif // AUTODEPLOY_LEXER_HPP

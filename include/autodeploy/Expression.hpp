/**
 * @file Expression.hpp
 * @brief Integer expression evaluation with 32-bit signed semantics
 *
 * Used by expression simplification to fold constant spans, and usable on
 * its own to check that a simplified expression still computes the same
 * values as the original.
 *
 * Supported: integer literals (decimal, hex, octal, binary, `'` digit
 * separators, no suffixes), bound identifiers, parentheses, unary `+ - ~ !`,
 * binary `* / % + - << >> < <= > >= == != & ^ | && ||`, with C precedence.
 * Evaluation gives up (nullopt) on anything it cannot compute exactly as a
 * 32-bit `int` would: overflow, division by zero, negative or oversized
 * shifts, unknown identifiers, unsupported tokens.
 */

#ifndef AUTODEPLOY_EXPRESSION_HPP
#define AUTODEPLOY_EXPRESSION_HPP

#include "autodeploy/Lexer.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace autodeploy {

using Bindings = std::map<std::string, std::int64_t>;

/**
 * @brief Evaluate an expression string
 *
 * ```cpp
 * evaluate("(2 + 3) * x", {{"x", 4}});   // 20
 * evaluate("1 << 31");                   // nullopt (overflow)
 * ```
 */
std::optional<std::int64_t> evaluate(const std::string& expression, const Bindings& bindings = {});

/**
 * @brief Evaluate significant tokens [begin, end) of a token stream
 */
std::optional<std::int64_t> evaluate_tokens(const std::vector<Token>& tokens, std::size_t begin,
                                             std::size_t end, const Bindings& bindings = {});

/**
 * @brief Value of an integer literal token if it fits a 32-bit `int`
 */
std::optional<std::int64_t> parse_int_literal(const std::string& text);

} // namespace autodeploy

#endif // AUTODEPLOY_EXPRESSION_HPP

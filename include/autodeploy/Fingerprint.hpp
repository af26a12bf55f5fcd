/**
 * @file Fingerprint.hpp
 * @brief Structural fingerprints of declarations
 *
 * The normalized form drops comments and whitespace and replaces every
 * non-keyword identifier by a positional placeholder (`$0`, `$1`, ... in
 * order of first appearance). Two declarations that differ only in
 * formatting, comments or a consistent renaming share a normalized form
 * and therefore a digest.
 */

#ifndef AUTODEPLOY_FINGERPRINT_HPP
#define AUTODEPLOY_FINGERPRINT_HPP

#include "autodeploy/Lexer.hpp"
#include "autodeploy/SourceModel.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace autodeploy {

/**
 * @brief Normalized token sequence of a token stream
 */
std::vector<std::string> normalize(const std::vector<Token>& tokens);

/**
 * @brief Fingerprint from an already normalized sequence
 */
Fingerprint fingerprint_tokens(std::vector<std::string> normalized);

/**
 * @brief Fingerprint of a declaration's text
 * @throws ParseError if the text does not tokenize
 */
Fingerprint fingerprint(const Declaration& declaration);

/// FNV-1a 64-bit hash
std::uint64_t fnv1a64(const std::string& data);

/**
 * @brief 64-bit SimHash over token 3-shingles
 *
 * Sequences shorter than three tokens hash as a single shingle; an empty
 * sequence yields 0.
 */
std::uint64_t simhash64(const std::vector<std::string>& normalized);

/// Levenshtein distance over tokens
std::size_t token_edit_distance(const std::vector<std::string>& a, const std::vector<std::string>& b);

/**
 * @brief Edit distance divided by the longer length, in [0, 1]
 *
 * Two empty sequences are at distance 0.
 */
double normalized_distance(const std::vector<std::string>& a, const std::vector<std::string>& b);

/// 16 lowercase hex digits
std::string to_hex(std::uint64_t value);

} // namespace autodeploy

#endif // AUTODEPLOY_FINGERPRINT_HPP

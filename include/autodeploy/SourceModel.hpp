/**
 * @file SourceModel.hpp
 * @brief Normalized representation of parsed repositories and files
 *
 * Repositories, Source Units and Declarations live in flat tables owned by
 * the Corpus and refer to each other by index (RepoId, UnitId, DeclId).
 * Nothing here is mutated once ingestion has finished.
 */

#ifndef AUTODEPLOY_SOURCE_MODEL_HPP
#define AUTODEPLOY_SOURCE_MODEL_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace autodeploy {

using RepoId = std::size_t;
using UnitId = std::size_t;
using DeclId = std::size_t;

/// Dependency graph node, one per Canonical Declaration
using NodeId = std::size_t;

constexpr std::size_t kNoId = static_cast<std::size_t>(-1);

/**
 * @brief License identifier plus boilerplate text, as returned by the
 *        license lookup collaborator
 */
struct LicenseInfo {
    std::string identifier;
    std::string text;
};

enum class DeclarationKind {
    Function,
    Type,
    Constant
};

const char* to_string(DeclarationKind kind);

/**
 * @brief Structural fingerprint of a declaration
 *
 * `normalized` is the token sequence with identifiers replaced by positional
 * placeholders; `digest` hashes it exactly, `simhash` is only used to bucket
 * near-duplicate candidates.
 */
struct Fingerprint {
    std::uint64_t digest = 0;
    std::uint64_t simhash = 0;
    std::vector<std::string> normalized;

    /// Digest as 16 lowercase hex digits
    std::string hex() const;
};

/**
 * @brief One named top-level construct (function, type, constant)
 */
struct Declaration {
    std::string name;
    DeclarationKind kind = DeclarationKind::Function;

    /// Raw text span, including an immediately preceding doc comment
    std::string text;

    /// Byte offset of the defining name inside `text`
    std::size_t name_offset = 0;

    /// 1-based line of the span's first character in the source file
    std::size_t line = 1;

    /// Position among the declarations of its Source Unit
    std::size_t ordinal = 0;

    /// Distinct identifiers referenced, in first-use order
    std::vector<std::string> references;

    /// Marked `@export` in its leading comment
    bool exported = false;

    Fingerprint fingerprint;

    /// Owning Source Unit (back-reference); set when added to the Corpus
    UnitId unit = kNoId;
};

/**
 * @brief One parsed file
 */
struct SourceUnit {
    std::string path;
    RepoId repository = kNoId;
    std::vector<std::string> includes;
    std::vector<Declaration> declarations;
};

/**
 * @brief One input codebase
 */
struct Repository {
    std::string id;
    int trust_rank = 0;
    LicenseInfo license;
    std::vector<UnitId> units;
    RepoId index = kNoId;
};

/**
 * @brief Parse one file of a repository into a Source Unit
 *
 * Declarations are extracted independently of formatting: two files that
 * differ only in whitespace or comments yield identical fingerprints for
 * equivalent declarations.
 *
 * @param repository Originating repository
 * @param path Repository-relative path (used in diagnostics)
 * @param content File content
 * @return Parsed unit with fingerprinted declarations
 * @throws ParseError if the content cannot be tokenized into declarations
 */
SourceUnit parse(const Repository& repository, const std::string& path, const std::string& content);

} // namespace autodeploy

#endif // AUTODEPLOY_SOURCE_MODEL_HPP

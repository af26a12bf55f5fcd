/**
 * @file MergedUnit.hpp
 * @brief Final projection of a merge run
 *
 * The Merged Unit owns copies of the canonical texts; rewriting and
 * optimization never touch the Corpus.
 */

#ifndef AUTODEPLOY_MERGED_UNIT_HPP
#define AUTODEPLOY_MERGED_UNIT_HPP

#include "autodeploy/ConflictReport.hpp"
#include "autodeploy/SourceModel.hpp"
#include "autodeploy/Value.hpp"

#include <map>
#include <string>
#include <vector>

namespace autodeploy {

struct RejectedOrigin {
    Origin origin;
    double confidence = 0.0;
};

/**
 * @brief One emitted declaration
 */
struct MergedDeclaration {
    NodeId node = kNoId;              ///< dependency graph node
    std::string name;                 ///< emitted name
    std::string original_name;
    DeclarationKind kind = DeclarationKind::Function;
    std::string text;                 ///< code, without attribution

    std::string repository;           ///< canonical's repository
    std::string source_path;          ///< canonical's unit path
    std::vector<std::string> includes;///< includes of the canonical's unit

    bool exported = false;
    std::size_t priority = 0;         ///< canonical rank, 0 is best

    double confidence = 1.0;
    bool exact = true;
    std::vector<Origin> subsumed;
    std::vector<RejectedOrigin> rejected_near_matches;

    /// Identifier as written in `text` -> referenced node (self included)
    std::map<std::string, NodeId> references;

    /// Comment block emitted above `text`
    std::string attribution;
};

struct MergedUnit {
    std::vector<std::string> includes;
    std::vector<MergedDeclaration> declarations;   ///< emission order

    /// Includes that rewritten code needs regardless of origin (e.g. <set>)
    std::vector<std::string> required_includes;

    /// Repository-relative paths of every ingested source unit
    std::vector<std::string> merged_files;

    /// Index of the declaration for a node, or kNoId
    std::size_t find(NodeId node) const;

    /// Index of the declaration with this emitted name, or kNoId
    std::size_t find(const std::string& name) const;

    /**
     * @brief Output text: header, include lines, then each attribution
     *        block and declaration separated by a blank line
     */
    std::string serialize() const;

    Value to_json() const;
};

} // namespace autodeploy

#endif // AUTODEPLOY_MERGED_UNIT_HPP

/**
 * @file OverlapResolver.hpp
 * @brief Choice of one Canonical Declaration per Duplicate Group
 */

#ifndef AUTODEPLOY_OVERLAP_RESOLVER_HPP
#define AUTODEPLOY_OVERLAP_RESOLVER_HPP

#include "autodeploy/ConflictReport.hpp"
#include "autodeploy/Corpus.hpp"
#include "autodeploy/LicensePolicy.hpp"
#include "autodeploy/SimilarityIndex.hpp"

#include <vector>

namespace autodeploy {

/**
 * @brief Deterministic total order over declarations
 *
 * Canonical order, best first:
 * 1. repository trust rank, descending
 * 2. license permissiveness, descending
 * 3. text length, descending
 * 4. repository identifier, ascending
 * 5. unit path, ascending
 * 6. declaration ordinal, ascending
 *
 * Source order drops rules 2 and 3 and is used for emission tie-breaks
 * and for ordering attribution.
 */
class CanonicalRanking {
public:
    CanonicalRanking(const Corpus& corpus, const LicensePolicy& policy)
        : corpus_(corpus), policy_(policy) {}

    /// True if `a` is preferred over `b` as a canonical
    bool better(DeclId a, DeclId b) const;

    /// True if `a` precedes `b` in source order
    bool source_before(DeclId a, DeclId b) const;

private:
    const Corpus& corpus_;
    const LicensePolicy& policy_;
};

struct NearMatch {
    DeclId declaration = kNoId;
    double confidence = 0.0;
};

/**
 * @brief Representative of one Duplicate Group
 */
struct CanonicalDeclaration {
    DeclId declaration = kNoId;
    std::size_t group = kNoId;

    /// All group members including the canonical itself, best first
    std::vector<DeclId> subsumed;

    double confidence = 1.0;
    bool exact = true;

    /// Low-confidence matches left unmerged, for manual review
    std::vector<NearMatch> rejected_near_matches;
};

struct Resolution {
    std::vector<CanonicalDeclaration> canonicals;   ///< one per group, group order
    std::vector<std::size_t> canonical_of_decl;     ///< DeclId -> index into canonicals
};

class OverlapResolver {
public:
    OverlapResolver(const Corpus& corpus, const LicensePolicy& policy)
        : corpus_(corpus), ranking_(corpus, policy) {}

    /// Best member of a group under CanonicalRanking
    DeclId choose(const DuplicateGroup& group) const;

    /**
     * @brief Choose canonicals for all groups
     *
     * Each rejected near link is recorded on the canonicals of both groups
     * and added to `report`.
     */
    Resolution resolve(const Grouping& grouping, ConflictReport& report) const;

    const CanonicalRanking& ranking() const noexcept { return ranking_; }

private:
    const Corpus& corpus_;
    CanonicalRanking ranking_;
};

} // namespace autodeploy

#endif // AUTODEPLOY_OVERLAP_RESOLVER_HPP

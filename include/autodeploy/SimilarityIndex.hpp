/**
 * @file SimilarityIndex.hpp
 * @brief Exact and near-duplicate lookup over declaration fingerprints
 *
 * Exact matches share a digest and are found through a hash map. Near
 * candidates share at least one 16-bit band of their SimHash; only those
 * are compared by normalized token edit distance, so a pair that shares no
 * band is never reported (accepted false negative).
 *
 * The index is written by a single thread and sealed before any lookup.
 */

#ifndef AUTODEPLOY_SIMILARITY_INDEX_HPP
#define AUTODEPLOY_SIMILARITY_INDEX_HPP

#include "autodeploy/Corpus.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace autodeploy {

struct Match {
    DeclId declaration = kNoId;
    double confidence = 1.0;   ///< 1 - normalized distance
    bool exact = false;        ///< same digest
};

class SimilarityIndex {
public:
    explicit SimilarityIndex(const Corpus& corpus);

    /**
     * @brief Index one declaration
     * @throws EngineError if the index is already sealed
     */
    void add(DeclId id);

    /// Index every declaration of the corpus
    void add_all();

    /// Freeze the index; required before any lookup
    void seal();

    bool sealed() const noexcept { return sealed_; }
    std::size_t size() const noexcept { return size_; }

    /**
     * @brief Declarations with exactly this digest, in DeclId order
     * @throws IndexNotSealed
     */
    std::vector<DeclId> exact(std::uint64_t digest) const;

    /**
     * @brief All declarations matching a fingerprint
     *
     * Exact matches come with confidence 1. Near matches are those whose
     * normalized token edit distance `d` is strictly below `near_threshold`;
     * their confidence is `1 - d`. Sorted by DeclId.
     *
     * @throws IndexNotSealed
     */
    std::vector<Match> query(const Fingerprint& fp, double near_threshold) const;

    /**
     * @brief Matches of an indexed declaration, excluding itself and
     *        declarations of another kind
     * @throws IndexNotSealed
     */
    std::vector<Match> query(DeclId id, double near_threshold) const;

private:
    const Corpus& corpus_;
    bool sealed_ = false;
    std::size_t size_ = 0;
    std::unordered_map<std::uint64_t, std::vector<DeclId>> exact_;
    std::unordered_map<std::uint32_t, std::vector<DeclId>> bands_;

    void require_sealed() const;
};

/**
 * @brief A set of declarations judged equivalent or near-equivalent
 */
struct DuplicateGroup {
    std::vector<DeclId> members;   ///< sorted
    double confidence = 1.0;       ///< lowest accepted near link, 1 for exact groups
    bool exact = true;             ///< formed by digest equality only
};

/**
 * @brief A near match below the auto-merge floor; both sides stay separate
 */
struct RejectedLink {
    DeclId first = kNoId;
    DeclId second = kNoId;
    double confidence = 0.0;
};

struct Grouping {
    std::vector<DuplicateGroup> groups;      ///< ordered by smallest member
    std::vector<RejectedLink> rejected;      ///< between different groups only
    std::vector<std::size_t> group_of;       ///< DeclId -> group index
};

/**
 * @brief Partition all indexed declarations into duplicate groups
 *
 * Exact matches always share a group. A near link joins two groups only if
 * its confidence is at least `auto_merge_floor`; otherwise it is returned
 * as a rejected link. Every declaration ends up in exactly one group,
 * possibly alone.
 *
 * @throws IndexNotSealed
 */
Grouping build_duplicate_groups(const Corpus& corpus, const SimilarityIndex& index,
                                double near_threshold, double auto_merge_floor);

} // namespace autodeploy

#endif // AUTODEPLOY_SIMILARITY_INDEX_HPP

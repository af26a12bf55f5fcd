/**
 * @file ConflictReport.hpp
 * @brief Side-channel report of conditions the caller must review
 *
 * A run that records a low-confidence near-duplicate or a
 * license-incompatible cycle is not a clean success, even when it produces
 * a Merged Unit. Dropped inputs (unparsable files) are listed as well so a
 * caller can see exactly what was left out.
 */

#ifndef AUTODEPLOY_CONFLICT_REPORT_HPP
#define AUTODEPLOY_CONFLICT_REPORT_HPP

#include "autodeploy/Value.hpp"

#include <string>
#include <vector>

namespace autodeploy {

/**
 * @brief Location of one declaration in the input set
 */
struct Origin {
    std::string repository;
    std::string path;
    std::string name;

    /// "repository:path:name"
    std::string label() const;
};

bool operator==(const Origin& a, const Origin& b);
bool operator<(const Origin& a, const Origin& b);

/**
 * @brief A source file that could not be parsed and was left out of the merge
 */
struct DroppedInput {
    std::string repository;
    std::string path;
    std::string reason;
};

/**
 * @brief A near-duplicate below the auto-merge confidence floor
 *
 * Both declarations survive; the pair needs manual review.
 */
struct NearDuplicateConflict {
    Origin canonical;
    Origin candidate;
    double confidence = 0.0;
};

/**
 * @brief A dependency cycle spanning repositories whose licenses do not combine
 */
struct CycleConflict {
    std::vector<Origin> members;
    std::vector<std::string> repositories;
    std::vector<std::string> licenses;
    bool fatal = true;
};

class ConflictReport {
public:
    void add_dropped_input(DroppedInput input);
    void add_near_duplicate(NearDuplicateConflict conflict);
    void add_cycle(CycleConflict conflict);

    const std::vector<DroppedInput>& dropped_inputs() const noexcept { return dropped_; }
    const std::vector<NearDuplicateConflict>& near_duplicates() const noexcept { return near_; }
    const std::vector<CycleConflict>& cycles() const noexcept { return cycles_; }

    /// True when a near-duplicate or a license-incompatible cycle was recorded.
    bool has_conflicts() const noexcept { return !near_.empty() || !cycles_.empty(); }

    /// True when nothing at all was recorded.
    bool empty() const noexcept { return dropped_.empty() && !has_conflicts(); }

    Value to_json() const;
    std::string summary() const;

private:
    std::vector<DroppedInput> dropped_;
    std::vector<NearDuplicateConflict> near_;
    std::vector<CycleConflict> cycles_;
};

} // namespace autodeploy

#endif // AUTODEPLOY_CONFLICT_REPORT_HPP

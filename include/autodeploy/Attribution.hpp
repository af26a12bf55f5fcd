/**
 * @file Attribution.hpp
 * @brief License attribution blocks for emitted declarations
 */

#ifndef AUTODEPLOY_ATTRIBUTION_HPP
#define AUTODEPLOY_ATTRIBUTION_HPP

#include "autodeploy/Corpus.hpp"
#include "autodeploy/LicensePolicy.hpp"
#include "autodeploy/MergedUnit.hpp"
#include "autodeploy/OverlapResolver.hpp"

#include <string>
#include <vector>

namespace autodeploy {

/**
 * @brief One repository's contribution to a canonical
 */
struct Contribution {
    std::string repository;
    int trust_rank = 0;
    std::string license;
    std::vector<std::string> paths;   ///< sorted, unique
};

class AttributionAnnotator {
public:
    AttributionAnnotator(const Corpus& corpus, const LicensePolicy& policy,
                         bool include_license_text = false)
        : corpus_(corpus), policy_(policy), include_license_text_(include_license_text) {}

    /**
     * @brief Contributing repositories of a canonical
     *
     * One entry per repository, however many members it contributed.
     * Ordered by trust rank descending, then repository identifier.
     */
    std::vector<Contribution> contributions(const CanonicalDeclaration& canonical) const;

    /**
     * @brief Comment block for a canonical emitted under `emitted_name`
     */
    std::string block(const CanonicalDeclaration& canonical, const std::string& emitted_name) const;

    /// Attribution block followed by the declaration text
    std::string annotate(const CanonicalDeclaration& canonical) const;

    /**
     * @brief Fill the attribution fields of a merged declaration
     *
     * Sets `subsumed`, `rejected_near_matches` and `attribution`.
     */
    void attach(MergedDeclaration& merged, const CanonicalDeclaration& canonical) const;

private:
    const Corpus& corpus_;
    const LicensePolicy& policy_;
    bool include_license_text_;
};

} // namespace autodeploy

#endif // AUTODEPLOY_ATTRIBUTION_HPP

/**
 * @file LicensePolicy.hpp
 * @brief Injected license policy table and license lookup collaborators
 *
 * License semantics are data: permissiveness ranks and combination rules
 * come from the `licenses` settings table, never from code.
 */

#ifndef AUTODEPLOY_LICENSE_POLICY_HPP
#define AUTODEPLOY_LICENSE_POLICY_HPP

#include "autodeploy/SourceModel.hpp"
#include "autodeploy/Value.hpp"

#include <climits>
#include <map>
#include <set>
#include <string>

namespace autodeploy {

struct LicenseTerms {
    int permissiveness = 0;                ///< higher is more permissive
    std::set<std::string> combinable_with;
    std::string text;                      ///< boilerplate for attribution
};

class LicensePolicy {
public:
    /// Rank given to identifiers missing from the table
    static constexpr int kUnknownPermissiveness = INT_MIN;

    void set(const std::string& id, LicenseTerms terms);

    bool known(const std::string& id) const;
    const LicenseTerms* find(const std::string& id) const;

    /// Permissiveness rank, kUnknownPermissiveness for unknown licenses
    int permissiveness(const std::string& id) const;

    /**
     * @brief Whether code under both licenses may be combined
     *
     * True when the identifiers are equal or either one lists the other.
     * An unknown license combines only with itself.
     */
    bool combinable(const std::string& a, const std::string& b) const;

    /// Boilerplate text, empty if none
    std::string text(const std::string& id) const;

    const std::map<std::string, LicenseTerms>& entries() const noexcept { return table_; }

    /**
     * @brief Build from the `licenses` settings object
     *
     * ```json
     * {"MIT": {"permissiveness": 3, "combinable_with": ["Apache-2.0"], "text": "..."}}
     * ```
     *
     * @throws TypeError if an entry or field has the wrong type
     */
    static LicensePolicy from_json(const Value& licenses);

private:
    std::map<std::string, LicenseTerms> table_;
};

/**
 * @brief Acquisition tuple for one repository
 */
struct RepositoryDescriptor {
    std::string path;
    std::string id;
    int trust_rank = 0;
    std::string license;   ///< declared identifier, may be empty
};

/**
 * @brief License lookup collaborator
 */
class LicenseResolver {
public:
    virtual ~LicenseResolver() = default;

    /// License identifier and boilerplate for a repository
    virtual LicenseInfo resolve(const RepositoryDescriptor& repo) const = 0;
};

/**
 * @brief Answers from the descriptor's declared license and the policy text
 *
 * An undeclared license resolves to "UNKNOWN".
 */
class PolicyLicenseResolver : public LicenseResolver {
public:
    explicit PolicyLicenseResolver(const LicensePolicy& policy) : policy_(policy) {}

    LicenseInfo resolve(const RepositoryDescriptor& repo) const override;

private:
    const LicensePolicy& policy_;
};

/**
 * @brief Sniffs LICENSE / COPYING files in the repository root
 *
 * Recognises a `SPDX-License-Identifier:` line or, failing that, a policy
 * identifier appearing in the first lines of the file. Falls back to the
 * declared license when nothing is recognised.
 */
class LicenseFileResolver : public LicenseResolver {
public:
    explicit LicenseFileResolver(const LicensePolicy& policy) : policy_(policy) {}

    LicenseInfo resolve(const RepositoryDescriptor& repo) const override;

    /// Identify a license from file content; empty if not recognised
    std::string identify(const std::string& content) const;

private:
    const LicensePolicy& policy_;
};

} // namespace autodeploy

#endif // AUTODEPLOY_LICENSE_POLICY_HPP

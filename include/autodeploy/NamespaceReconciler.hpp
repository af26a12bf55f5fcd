/**
 * @file NamespaceReconciler.hpp
 * @brief Collision renaming and reference rewriting in the Merged Unit
 */

#ifndef AUTODEPLOY_NAMESPACE_RECONCILER_HPP
#define AUTODEPLOY_NAMESPACE_RECONCILER_HPP

#include "autodeploy/MergedUnit.hpp"

#include <map>
#include <string>
#include <vector>

namespace autodeploy {

struct Rename {
    NodeId node = kNoId;
    std::string repository;
    std::string from;
    std::string to;
};

/**
 * @brief Map every non-alphanumeric character to '_'
 */
std::string sanitize_identifier(const std::string& text);

/**
 * @brief Replace identifier tokens by their mapped names
 *
 * Member names (after `.` or `->`) and scope-qualified names (`A::x`) are
 * left alone, as are comments and literals.
 */
std::string rewrite_identifiers(const std::string& text,
                                const std::map<std::string, std::string>& renames);

class NamespaceReconciler {
public:
    /**
     * @brief Make emitted names unique and rewrite references to match
     *
     * Among declarations sharing a name the best-ranked keeps it; each other
     * one becomes `name_<repository>` (then `_2`, `_3`, ... if still taken).
     * Afterwards every reference, including references to duplicate losers
     * that now point at their canonical, is rewritten to the target's
     * emitted name.
     *
     * @return Renames applied, in name order
     */
    std::vector<Rename> reconcile(MergedUnit& unit) const;

    /**
     * @brief Check namespace uniqueness and reference totality
     * @throws UnresolvedReference on a duplicate name or a reference that
     *         does not name exactly one surviving declaration
     */
    void verify(const MergedUnit& unit) const;
};

} // namespace autodeploy

#endif // AUTODEPLOY_NAMESPACE_RECONCILER_HPP

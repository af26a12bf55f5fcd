/**
 * @file Corpus.hpp
 * @brief Flat arena of all repositories, units and declarations of a run
 *
 * Later stages refer to declarations by DeclId only; cross-repository
 * references, duplicate groups and graph edges are all index relations
 * into this table.
 */

#ifndef AUTODEPLOY_CORPUS_HPP
#define AUTODEPLOY_CORPUS_HPP

#include "autodeploy/ConflictReport.hpp"
#include "autodeploy/SourceModel.hpp"

#include <string>
#include <utility>
#include <vector>

namespace autodeploy {

class Corpus {
public:
    /**
     * @brief Register a repository
     * @return Its RepoId
     * @throws ConfigError if the identifier is already registered
     */
    RepoId add_repository(std::string id, int trust_rank, LicenseInfo license);

    /**
     * @brief Take ownership of a parsed unit
     *
     * Sets the declarations' unit back-references and assigns DeclIds in
     * order.
     */
    UnitId add_unit(SourceUnit unit);

    std::size_t repository_count() const noexcept { return repositories_.size(); }
    std::size_t unit_count() const noexcept { return units_.size(); }
    std::size_t declaration_count() const noexcept { return declarations_.size(); }

    const Repository& repository(RepoId id) const { return repositories_.at(id); }
    const SourceUnit& unit(UnitId id) const { return units_.at(id); }
    const Declaration& declaration(DeclId id) const;

    const SourceUnit& unit_of(DeclId id) const;
    const Repository& repository_of(DeclId id) const;

    /// DeclIds of a unit's declarations, in ordinal order
    std::vector<DeclId> declarations_of(UnitId id) const;

    /// RepoId for an identifier, kNoId if unknown
    RepoId find_repository(const std::string& id) const;

    /// Location of a declaration for reports
    Origin origin(DeclId id) const;

    /// "repository:path:name"
    std::string describe(DeclId id) const { return origin(id).label(); }

private:
    std::vector<Repository> repositories_;
    std::vector<SourceUnit> units_;
    std::vector<std::pair<UnitId, std::size_t>> declarations_;
    std::vector<DeclId> first_decl_of_unit_;
};

} // namespace autodeploy

#endif // AUTODEPLOY_CORPUS_HPP

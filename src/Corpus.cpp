/**
 * @file Corpus.cpp
 * @brief Declaration arena
 */

#include "autodeploy/Corpus.hpp"
#include "autodeploy/Errors.hpp"

namespace autodeploy {

RepoId Corpus::add_repository(std::string id, int trust_rank, LicenseInfo license) {
    if (find_repository(id) != kNoId) {
        throw ConfigError("Duplicate repository identifier: " + id);
    }
    Repository repo;
    repo.id = std::move(id);
    repo.trust_rank = trust_rank;
    repo.license = std::move(license);
    repo.index = repositories_.size();
    repositories_.push_back(std::move(repo));
    return repositories_.back().index;
}

UnitId Corpus::add_unit(SourceUnit unit) {
    const UnitId uid = units_.size();
    Repository& repo = repositories_.at(unit.repository);
    repo.units.push_back(uid);

    first_decl_of_unit_.push_back(declarations_.size());
    for (std::size_t i = 0; i < unit.declarations.size(); ++i) {
        unit.declarations[i].unit = uid;
        declarations_.emplace_back(uid, i);
    }
    units_.push_back(std::move(unit));
    return uid;
}

const Declaration& Corpus::declaration(DeclId id) const {
    const auto& [unit, index] = declarations_.at(id);
    return units_[unit].declarations[index];
}

const SourceUnit& Corpus::unit_of(DeclId id) const {
    return units_[declarations_.at(id).first];
}

const Repository& Corpus::repository_of(DeclId id) const {
    return repositories_[unit_of(id).repository];
}

std::vector<DeclId> Corpus::declarations_of(UnitId id) const {
    std::vector<DeclId> out;
    const std::size_t first = first_decl_of_unit_.at(id);
    for (std::size_t i = 0; i < units_[id].declarations.size(); ++i) {
        out.push_back(first + i);
    }
    return out;
}

RepoId Corpus::find_repository(const std::string& id) const {
    for (const auto& repo : repositories_) {
        if (repo.id == id) return repo.index;
    }
    return kNoId;
}

Origin Corpus::origin(DeclId id) const {
    const auto& unit = unit_of(id);
    return Origin{repositories_[unit.repository].id, unit.path, declaration(id).name};
}

} // namespace autodeploy

/**
 * @file ConflictReport.cpp
 * @brief Conflict Report accumulation and JSON form
 */

#include "autodeploy/ConflictReport.hpp"

#include <sstream>
#include <tuple>

namespace autodeploy {

std::string Origin::label() const {
    return repository + ":" + path + ":" + name;
}

bool operator==(const Origin& a, const Origin& b) {
    return std::tie(a.repository, a.path, a.name) == std::tie(b.repository, b.path, b.name);
}

bool operator<(const Origin& a, const Origin& b) {
    return std::tie(a.repository, a.path, a.name) < std::tie(b.repository, b.path, b.name);
}

void ConflictReport::add_dropped_input(DroppedInput input) {
    dropped_.push_back(std::move(input));
}

void ConflictReport::add_near_duplicate(NearDuplicateConflict conflict) {
    near_.push_back(std::move(conflict));
}

void ConflictReport::add_cycle(CycleConflict conflict) {
    cycles_.push_back(std::move(conflict));
}

namespace {

Value origin_to_json(const Origin& origin) {
    return Value{
        {"repository", origin.repository},
        {"path", origin.path},
        {"name", origin.name}
    };
}

} // anonymous namespace

Value ConflictReport::to_json() const {
    Value dropped = Value::array();
    for (const auto& d : dropped_) {
        dropped.push_back({{"repository", d.repository}, {"path", d.path}, {"reason", d.reason}});
    }

    Value near = Value::array();
    for (const auto& n : near_) {
        near.push_back({
            {"canonical", origin_to_json(n.canonical)},
            {"candidate", origin_to_json(n.candidate)},
            {"confidence", n.confidence}
        });
    }

    Value cycles = Value::array();
    for (const auto& c : cycles_) {
        Value members = Value::array();
        for (const auto& m : c.members) {
            members.push_back(origin_to_json(m));
        }
        cycles.push_back({
            {"members", members},
            {"repositories", c.repositories},
            {"licenses", c.licenses},
            {"fatal", c.fatal}
        });
    }

    return Value{
        {"has_conflicts", has_conflicts()},
        {"dropped_inputs", dropped},
        {"near_duplicates", near},
        {"license_incompatible_cycles", cycles}
    };
}

std::string ConflictReport::summary() const {
    std::ostringstream oss;
    oss << dropped_.size() << " dropped input(s), "
        << near_.size() << " near-duplicate conflict(s), "
        << cycles_.size() << " license-incompatible cycle(s)";
    return oss.str();
}

} // namespace autodeploy

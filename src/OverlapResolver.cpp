/**
 * @file OverlapResolver.cpp
 * @brief Canonical ranking and group resolution
 */

#include "autodeploy/OverlapResolver.hpp"
#include "autodeploy/Logging.hpp"

#include <algorithm>

namespace autodeploy {

bool CanonicalRanking::source_before(DeclId a, DeclId b) const {
    if (a == b) return false;
    const Repository& ra = corpus_.repository_of(a);
    const Repository& rb = corpus_.repository_of(b);
    if (ra.trust_rank != rb.trust_rank) return ra.trust_rank > rb.trust_rank;
    if (ra.id != rb.id) return ra.id < rb.id;

    const SourceUnit& ua = corpus_.unit_of(a);
    const SourceUnit& ub = corpus_.unit_of(b);
    if (ua.path != ub.path) return ua.path < ub.path;
    return corpus_.declaration(a).ordinal < corpus_.declaration(b).ordinal;
}

bool CanonicalRanking::better(DeclId a, DeclId b) const {
    if (a == b) return false;
    const Repository& ra = corpus_.repository_of(a);
    const Repository& rb = corpus_.repository_of(b);
    if (ra.trust_rank != rb.trust_rank) return ra.trust_rank > rb.trust_rank;

    const int pa = policy_.permissiveness(ra.license.identifier);
    const int pb = policy_.permissiveness(rb.license.identifier);
    if (pa != pb) return pa > pb;

    const std::size_t la = corpus_.declaration(a).text.size();
    const std::size_t lb = corpus_.declaration(b).text.size();
    if (la != lb) return la > lb;

    return source_before(a, b);
}

DeclId OverlapResolver::choose(const DuplicateGroup& group) const {
    return *std::min_element(group.members.begin(), group.members.end(),
                             [this](DeclId a, DeclId b) { return ranking_.better(a, b); });
}

Resolution OverlapResolver::resolve(const Grouping& grouping, ConflictReport& report) const {
    Resolution out;
    out.canonical_of_decl.assign(corpus_.declaration_count(), kNoId);

    for (std::size_t g = 0; g < grouping.groups.size(); ++g) {
        const DuplicateGroup& group = grouping.groups[g];

        CanonicalDeclaration canonical;
        canonical.group = g;
        canonical.declaration = choose(group);
        canonical.subsumed = group.members;
        std::sort(canonical.subsumed.begin(), canonical.subsumed.end(),
                  [this](DeclId a, DeclId b) { return ranking_.better(a, b); });
        canonical.confidence = group.confidence;
        canonical.exact = group.exact;

        for (DeclId member : group.members) {
            out.canonical_of_decl[member] = out.canonicals.size();
        }
        out.canonicals.push_back(std::move(canonical));
    }

    for (const RejectedLink& link : grouping.rejected) {
        auto& first = out.canonicals[out.canonical_of_decl[link.first]];
        auto& second = out.canonicals[out.canonical_of_decl[link.second]];
        first.rejected_near_matches.push_back(NearMatch{link.second, link.confidence});
        second.rejected_near_matches.push_back(NearMatch{link.first, link.confidence});

        const bool first_wins = ranking_.better(link.first, link.second);
        NearDuplicateConflict conflict;
        conflict.canonical = corpus_.origin(first_wins ? link.first : link.second);
        conflict.candidate = corpus_.origin(first_wins ? link.second : link.first);
        conflict.confidence = link.confidence;

        AUTODEPLOY_LOG_WARN("near duplicate below auto-merge floor",
                            {string_field("canonical", conflict.canonical.label()),
                             string_field("candidate", conflict.candidate.label()),
                             string_field("confidence", std::to_string(conflict.confidence))});
        report.add_near_duplicate(std::move(conflict));
    }

    for (auto& canonical : out.canonicals) {
        std::sort(canonical.rejected_near_matches.begin(), canonical.rejected_near_matches.end(),
                  [this](const NearMatch& a, const NearMatch& b) {
                      return ranking_.source_before(a.declaration, b.declaration);
                  });
    }
    return out;
}

} // namespace autodeploy

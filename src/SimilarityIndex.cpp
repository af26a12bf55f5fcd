/**
 * @file SimilarityIndex.cpp
 * @brief Fingerprint index and duplicate grouping
 */

#include "autodeploy/SimilarityIndex.hpp"
#include "autodeploy/Errors.hpp"
#include "autodeploy/Fingerprint.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <set>

namespace autodeploy {

namespace {

constexpr int kBands = 4;

std::uint32_t band_key(std::uint64_t simhash, int band) {
    auto value = static_cast<std::uint32_t>((simhash >> (16 * band)) & 0xFFFFU);
    return (static_cast<std::uint32_t>(band) << 16) | value;
}

class UnionFind {
public:
    explicit UnionFind(std::size_t n) : parent_(n) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }

    std::size_t find(std::size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    // Smaller root wins so the representative is stable.
    void unite(std::size_t a, std::size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        if (b < a) std::swap(a, b);
        parent_[b] = a;
    }

private:
    std::vector<std::size_t> parent_;
};

} // anonymous namespace

SimilarityIndex::SimilarityIndex(const Corpus& corpus) : corpus_(corpus) {}

void SimilarityIndex::add(DeclId id) {
    if (sealed_) {
        throw EngineError("Similarity index is sealed; cannot add " + corpus_.describe(id));
    }
    const Fingerprint& fp = corpus_.declaration(id).fingerprint;
    exact_[fp.digest].push_back(id);
    for (int band = 0; band < kBands; ++band) {
        bands_[band_key(fp.simhash, band)].push_back(id);
    }
    ++size_;
}

void SimilarityIndex::add_all() {
    for (DeclId id = 0; id < corpus_.declaration_count(); ++id) {
        add(id);
    }
}

void SimilarityIndex::seal() {
    for (auto& [digest, ids] : exact_) {
        std::sort(ids.begin(), ids.end());
    }
    for (auto& [key, ids] : bands_) {
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    }
    sealed_ = true;
}

void SimilarityIndex::require_sealed() const {
    if (!sealed_) {
        throw IndexNotSealed();
    }
}

std::vector<DeclId> SimilarityIndex::exact(std::uint64_t digest) const {
    require_sealed();
    auto it = exact_.find(digest);
    if (it == exact_.end()) {
        return {};
    }
    return it->second;
}

std::vector<Match> SimilarityIndex::query(const Fingerprint& fp, double near_threshold) const {
    require_sealed();

    std::vector<Match> out;
    for (DeclId id : exact(fp.digest)) {
        out.push_back(Match{id, 1.0, true});
    }

    std::set<DeclId> candidates;
    for (int band = 0; band < kBands; ++band) {
        auto it = bands_.find(band_key(fp.simhash, band));
        if (it == bands_.end()) continue;
        candidates.insert(it->second.begin(), it->second.end());
    }

    const std::size_t len = fp.normalized.size();
    for (DeclId id : candidates) {
        const Fingerprint& other = corpus_.declaration(id).fingerprint;
        if (other.digest == fp.digest) continue;

        // Length difference is a lower bound on the edit distance.
        const std::size_t longest = std::max(len, other.normalized.size());
        const std::size_t diff = len > other.normalized.size() ? len - other.normalized.size()
                                                               : other.normalized.size() - len;
        if (longest == 0 || static_cast<double>(diff) / static_cast<double>(longest) >= near_threshold) {
            continue;
        }

        double d = normalized_distance(fp.normalized, other.normalized);
        if (d < near_threshold) {
            out.push_back(Match{id, 1.0 - d, false});
        }
    }

    std::sort(out.begin(), out.end(),
              [](const Match& a, const Match& b) { return a.declaration < b.declaration; });
    return out;
}

std::vector<Match> SimilarityIndex::query(DeclId id, double near_threshold) const {
    const Declaration& self = corpus_.declaration(id);
    std::vector<Match> all = query(self.fingerprint, near_threshold);

    std::vector<Match> out;
    for (const auto& m : all) {
        if (m.declaration == id) continue;
        if (corpus_.declaration(m.declaration).kind != self.kind) continue;
        out.push_back(m);
    }
    return out;
}

Grouping build_duplicate_groups(const Corpus& corpus, const SimilarityIndex& index,
                                double near_threshold, double auto_merge_floor) {
    const std::size_t n = corpus.declaration_count();
    UnionFind uf(n);

    struct Link {
        DeclId a;
        DeclId b;
        double confidence;
    };
    std::vector<Link> accepted;
    std::vector<Link> rejected;

    for (DeclId id = 0; id < n; ++id) {
        for (const auto& m : index.query(id, near_threshold)) {
            if (m.declaration < id) continue; // each pair once
            if (m.exact) {
                uf.unite(id, m.declaration);
            } else if (m.confidence >= auto_merge_floor) {
                uf.unite(id, m.declaration);
                accepted.push_back({id, m.declaration, m.confidence});
            } else {
                rejected.push_back({id, m.declaration, m.confidence});
            }
        }
    }

    Grouping grouping;
    grouping.group_of.assign(n, kNoId);

    std::map<std::size_t, std::size_t> root_to_group;
    for (DeclId id = 0; id < n; ++id) {
        std::size_t root = uf.find(id);
        auto [it, inserted] = root_to_group.emplace(root, grouping.groups.size());
        if (inserted) {
            grouping.groups.emplace_back();
        }
        grouping.groups[it->second].members.push_back(id);
        grouping.group_of[id] = it->second;
    }

    for (const auto& link : accepted) {
        DuplicateGroup& g = grouping.groups[grouping.group_of[link.a]];
        g.exact = false;
        g.confidence = std::min(g.confidence, link.confidence);
    }

    for (const auto& link : rejected) {
        if (grouping.group_of[link.a] == grouping.group_of[link.b]) continue;
        grouping.rejected.push_back(RejectedLink{link.a, link.b, link.confidence});
    }
    return grouping;
}

} // namespace autodeploy

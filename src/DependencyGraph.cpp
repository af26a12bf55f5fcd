/**
 * @file DependencyGraph.cpp
 * @brief Reference resolution, cycle detection and emission order
 */

#include "autodeploy/DependencyGraph.hpp"

#include <algorithm>
#include <numeric>
#include <queue>
#include <set>
#include <unordered_map>

namespace autodeploy {

namespace {

constexpr std::size_t kUnvisited = static_cast<std::size_t>(-1);

} // anonymous namespace

void DependencyGraph::add_edge(NodeId from, NodeId to) {
    if (from == to) return;
    successors_[from].push_back(to);
}

void DependencyGraph::finalize() {
    edge_count_ = 0;
    for (auto& s : predecessors_) s.clear();
    for (NodeId n = 0; n < successors_.size(); ++n) {
        auto& succ = successors_[n];
        std::sort(succ.begin(), succ.end());
        succ.erase(std::unique(succ.begin(), succ.end()), succ.end());
        for (NodeId m : succ) {
            predecessors_[m].push_back(n);
        }
        edge_count_ += succ.size();
    }
}

DependencyGraph DependencyGraph::from_edges(std::size_t nodes,
                                            const std::vector<std::pair<NodeId, NodeId>>& edges) {
    DependencyGraph g;
    g.successors_.assign(nodes, {});
    g.predecessors_.assign(nodes, {});
    g.references_.assign(nodes, {});
    g.source_position_.resize(nodes);
    std::iota(g.source_position_.begin(), g.source_position_.end(), 0);
    for (const auto& [from, to] : edges) {
        g.add_edge(from, to);
    }
    g.finalize();
    return g;
}

DependencyGraph DependencyGraph::build(const Corpus& corpus, const Resolution& resolution,
                                       const CanonicalRanking& ranking) {
    const std::size_t n = resolution.canonicals.size();
    DependencyGraph g;
    g.successors_.assign(n, {});
    g.predecessors_.assign(n, {});
    g.references_.assign(n, {});

    std::vector<NodeId> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](NodeId a, NodeId b) {
        return ranking.source_before(resolution.canonicals[a].declaration,
                                     resolution.canonicals[b].declaration);
    });
    g.source_position_.resize(n);
    for (std::size_t pos = 0; pos < n; ++pos) {
        g.source_position_[order[pos]] = pos;
    }

    // name -> declarations, in DeclId order
    std::unordered_map<std::string, std::vector<DeclId>> by_name;
    for (DeclId id = 0; id < corpus.declaration_count(); ++id) {
        by_name[corpus.declaration(id).name].push_back(id);
    }

    auto resolve = [&](DeclId from, const std::string& identifier) -> DeclId {
        auto it = by_name.find(identifier);
        if (it == by_name.end()) return kNoId;
        const auto& candidates = it->second;

        const UnitId unit = corpus.declaration(from).unit;
        for (DeclId c : candidates) {
            if (corpus.declaration(c).unit == unit) return c;
        }

        const RepoId repo = corpus.unit_of(from).repository;
        DeclId best = kNoId;
        for (DeclId c : candidates) {
            if (corpus.unit_of(c).repository != repo) continue;
            if (best == kNoId || ranking.source_before(c, best)) best = c;
        }
        if (best != kNoId) return best;

        for (DeclId c : candidates) {
            if (resolution.canonicals[resolution.canonical_of_decl[c]].declaration != c) continue;
            if (best == kNoId || ranking.better(c, best)) best = c;
        }
        if (best != kNoId) return best;

        for (DeclId c : candidates) {
            if (best == kNoId || ranking.better(c, best)) best = c;
        }
        return best;
    };

    for (NodeId node = 0; node < n; ++node) {
        const DeclId decl = resolution.canonicals[node].declaration;
        const Declaration& d = corpus.declaration(decl);

        g.references_[node][d.name] = node;
        for (const auto& identifier : d.references) {
            DeclId target = resolve(decl, identifier);
            if (target == kNoId) continue;
            NodeId to = resolution.canonical_of_decl[target];
            g.references_[node][identifier] = to;
            g.add_edge(node, to);
        }
    }

    g.finalize();
    return g;
}

bool DependencyGraph::has_cycle() const {
    enum class Mark { White, OnStack, Done };
    std::vector<Mark> mark(node_count(), Mark::White);

    for (NodeId start = 0; start < node_count(); ++start) {
        if (mark[start] != Mark::White) continue;

        std::vector<std::pair<NodeId, std::size_t>> stack{{start, 0}};
        mark[start] = Mark::OnStack;
        while (!stack.empty()) {
            auto& [v, next] = stack.back();
            if (next < successors_[v].size()) {
                NodeId w = successors_[v][next++];
                if (mark[w] == Mark::OnStack) return true;
                if (mark[w] == Mark::White) {
                    mark[w] = Mark::OnStack;
                    stack.emplace_back(w, 0);
                }
            } else {
                mark[v] = Mark::Done;
                stack.pop_back();
            }
        }
    }
    return false;
}

std::vector<std::vector<NodeId>> DependencyGraph::strongly_connected_components() const {
    const std::size_t n = node_count();
    std::vector<std::size_t> index(n, kUnvisited);
    std::vector<std::size_t> low(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<NodeId> stack;
    std::vector<std::vector<NodeId>> components;
    std::size_t counter = 0;

    for (NodeId start = 0; start < n; ++start) {
        if (index[start] != kUnvisited) continue;

        std::vector<std::pair<NodeId, std::size_t>> work;
        auto visit = [&](NodeId v) {
            index[v] = low[v] = counter++;
            stack.push_back(v);
            on_stack[v] = true;
            work.emplace_back(v, 0);
        };
        visit(start);

        while (!work.empty()) {
            const NodeId v = work.back().first;
            const std::size_t next = work.back().second;
            if (next < successors_[v].size()) {
                ++work.back().second;
                const NodeId w = successors_[v][next];
                if (index[w] == kUnvisited) {
                    visit(w);
                } else if (on_stack[w]) {
                    low[v] = std::min(low[v], index[w]);
                }
                continue;
            }

            work.pop_back();
            if (!work.empty()) {
                const NodeId parent = work.back().first;
                low[parent] = std::min(low[parent], low[v]);
            }
            if (low[v] == index[v]) {
                std::vector<NodeId> component;
                NodeId w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    component.push_back(w);
                } while (w != v);
                std::sort(component.begin(), component.end(), [this](NodeId a, NodeId b) {
                    return source_position_[a] < source_position_[b];
                });
                components.push_back(std::move(component));
            }
        }
    }
    return components;
}

std::vector<NodeId> DependencyGraph::emission_order() const {
    const auto components = strongly_connected_components();
    const std::size_t c = components.size();

    std::vector<std::size_t> component_of(node_count());
    std::vector<std::size_t> first_position(c);
    for (std::size_t i = 0; i < c; ++i) {
        for (NodeId v : components[i]) component_of[v] = i;
        first_position[i] = source_position_[components[i].front()];
    }

    // pending[i]: dependency components of i not yet emitted
    std::vector<std::set<std::size_t>> dependents(c);
    std::vector<std::size_t> pending(c, 0);
    for (std::size_t i = 0; i < c; ++i) {
        std::set<std::size_t> deps;
        for (NodeId v : components[i]) {
            for (NodeId w : successors_[v]) {
                if (component_of[w] != i) deps.insert(component_of[w]);
            }
        }
        pending[i] = deps.size();
        for (std::size_t d : deps) dependents[d].insert(i);
    }

    using Entry = std::pair<std::size_t, std::size_t>; // (first position, component)
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> ready;
    for (std::size_t i = 0; i < c; ++i) {
        if (pending[i] == 0) ready.emplace(first_position[i], i);
    }

    std::vector<NodeId> order;
    order.reserve(node_count());
    while (!ready.empty()) {
        const std::size_t i = ready.top().second;
        ready.pop();
        order.insert(order.end(), components[i].begin(), components[i].end());
        for (std::size_t d : dependents[i]) {
            if (--pending[d] == 0) ready.emplace(first_position[d], d);
        }
    }
    return order;
}

std::vector<CycleConflict> license_incompatible_cycles(const DependencyGraph& graph,
                                                       const Corpus& corpus,
                                                       const Resolution& resolution,
                                                       const LicensePolicy& policy) {
    std::vector<CycleConflict> out;
    for (const auto& component : graph.strongly_connected_components()) {
        if (component.size() < 2) continue;

        std::set<std::string> repositories;
        std::set<std::string> licenses;
        for (NodeId v : component) {
            const Repository& repo = corpus.repository_of(resolution.canonicals[v].declaration);
            repositories.insert(repo.id);
            licenses.insert(repo.license.identifier);
        }
        if (repositories.size() < 2) continue;

        bool compatible = true;
        for (auto a = licenses.begin(); a != licenses.end() && compatible; ++a) {
            for (auto b = std::next(a); b != licenses.end(); ++b) {
                if (!policy.combinable(*a, *b)) {
                    compatible = false;
                    break;
                }
            }
        }
        if (compatible) continue;

        CycleConflict conflict;
        for (NodeId v : component) {
            conflict.members.push_back(corpus.origin(resolution.canonicals[v].declaration));
        }
        conflict.repositories.assign(repositories.begin(), repositories.end());
        conflict.licenses.assign(licenses.begin(), licenses.end());
        conflict.fatal = true;
        out.push_back(std::move(conflict));
    }

    std::sort(out.begin(), out.end(), [](const CycleConflict& a, const CycleConflict& b) {
        return a.members.front() < b.members.front();
    });
    return out;
}

} // namespace autodeploy

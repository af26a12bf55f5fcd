/**
 * @file DependencyGraph.hpp
 * @brief Reference graph over Canonical Declarations
 *
 * Node `n` is `Resolution::canonicals[n]`. An edge `u -> v` means the
 * canonical of `u` references the canonical of `v`; references into a
 * duplicate loser are redirected to its group's canonical. Self references
 * are recorded for renaming but are not edges.
 */

#ifndef AUTODEPLOY_DEPENDENCY_GRAPH_HPP
#define AUTODEPLOY_DEPENDENCY_GRAPH_HPP

#include "autodeploy/ConflictReport.hpp"
#include "autodeploy/Corpus.hpp"
#include "autodeploy/LicensePolicy.hpp"
#include "autodeploy/OverlapResolver.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace autodeploy {

class DependencyGraph {
public:
    /**
     * @brief Resolve every canonical's references and build the edges
     *
     * An identifier resolves, in order, to a declaration of that name in the
     * same unit, then in the same repository, then to the best-ranked
     * canonical of that name, then to the best-ranked declaration of that
     * name anywhere. Identifiers that resolve nowhere are external.
     */
    static DependencyGraph build(const Corpus& corpus, const Resolution& resolution,
                                 const CanonicalRanking& ranking);

    /// Graph from explicit edges; node i has source position i
    static DependencyGraph from_edges(std::size_t nodes,
                                      const std::vector<std::pair<NodeId, NodeId>>& edges);

    std::size_t node_count() const noexcept { return successors_.size(); }
    std::size_t edge_count() const noexcept { return edge_count_; }

    const std::vector<NodeId>& successors(NodeId n) const { return successors_.at(n); }
    const std::vector<NodeId>& predecessors(NodeId n) const { return predecessors_.at(n); }
    std::size_t inbound_count(NodeId n) const { return predecessors_.at(n).size(); }

    /// Identifier -> node for every resolved reference of `n` (self included)
    const std::map<std::string, NodeId>& references(NodeId n) const { return references_.at(n); }

    /// Position of `n` in canonical source order
    std::size_t source_position(NodeId n) const { return source_position_.at(n); }

    /// Depth-first search tracking the recursion stack
    bool has_cycle() const;

    /// Tarjan's algorithm; members of each component in source order
    std::vector<std::vector<NodeId>> strongly_connected_components() const;

    /**
     * @brief Dependencies before dependents, cycles kept contiguous
     *
     * Among components that are ready at the same time, the one holding the
     * earliest node in source order goes first.
     */
    std::vector<NodeId> emission_order() const;

private:
    std::vector<std::vector<NodeId>> successors_;
    std::vector<std::vector<NodeId>> predecessors_;
    std::vector<std::map<std::string, NodeId>> references_;
    std::vector<std::size_t> source_position_;
    std::size_t edge_count_ = 0;

    void add_edge(NodeId from, NodeId to);
    void finalize();
};

/**
 * @brief Cycles whose members come from repositories with licenses that
 *        the policy does not allow to combine
 *
 * Returned conflicts are marked fatal; the caller may clear the flag.
 */
std::vector<CycleConflict> license_incompatible_cycles(const DependencyGraph& graph,
                                                       const Corpus& corpus,
                                                       const Resolution& resolution,
                                                       const LicensePolicy& policy);

} // namespace autodeploy

#endif // AUTODEPLOY_DEPENDENCY_GRAPH_HPP

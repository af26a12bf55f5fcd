/**
 * @file Engine.cpp
 * @brief Stage orchestration of a merge run
 */

#include "autodeploy/Engine.hpp"
#include "autodeploy/Attribution.hpp"
#include "autodeploy/Corpus.hpp"
#include "autodeploy/DependencyGraph.hpp"
#include "autodeploy/Errors.hpp"
#include "autodeploy/Logging.hpp"
#include "autodeploy/NamespaceReconciler.hpp"
#include "autodeploy/OverlapResolver.hpp"
#include "autodeploy/SimilarityIndex.hpp"
#include "autodeploy/WorkerPool.hpp"

#include <algorithm>
#include <optional>
#include <set>

namespace autodeploy {

void EngineConfig::validate() const {
    if (!(near_duplicate_threshold >= 0.0 && near_duplicate_threshold <= 1.0)) {
        throw ConfigError("engine.near_duplicate_threshold must be within [0, 1]");
    }
    if (!(auto_merge_confidence_floor >= 0.0 && auto_merge_confidence_floor <= 1.0)) {
        throw ConfigError("engine.auto_merge_confidence_floor must be within [0, 1]");
    }
    if (pass_timeout_seconds <= 0) {
        throw ConfigError("engine.pass_timeout_seconds must be positive");
    }
    if (worker_threads < 0) {
        throw ConfigError("engine.worker_threads must not be negative");
    }
    if (membership_min_terms < 2) {
        throw ConfigError("engine.membership_min_terms must be at least 2");
    }
    std::set<PassId> seen;
    for (PassId id : enabled_passes) {
        if (!seen.insert(id).second) {
            throw ConfigError(std::string("engine.enabled_optimization_passes lists '") +
                              pass_name(id) + "' twice");
        }
    }
}

namespace {

struct ParseJob {
    RepoId repository = kNoId;
    const SourceFile* file = nullptr;
    std::optional<SourceUnit> unit;
    std::string error;
};

bool is_export_root(const std::vector<std::string>& roots, const std::string& repository,
                    const std::string& name) {
    for (const auto& root : roots) {
        if (root == name || root == repository + ":" + name) return true;
    }
    return false;
}

} // anonymous namespace

Engine::Engine(EngineConfig config)
    : config_(std::move(config)) {
    config_.validate();
}

MergeResult Engine::merge(std::vector<RepositoryInput> inputs) const {
    ConflictReport report;

    try {
        std::sort(inputs.begin(), inputs.end(),
                  [](const RepositoryInput& a, const RepositoryInput& b) { return a.id < b.id; });

        Corpus corpus;
        std::vector<ParseJob> jobs;
        for (auto& input : inputs) {
            std::sort(input.files.begin(), input.files.end(),
                      [](const SourceFile& a, const SourceFile& b) { return a.path < b.path; });
            const RepoId repo = corpus.add_repository(input.id, input.trust_rank, input.license);
            for (const auto& file : input.files) {
                ParseJob job;
                job.repository = repo;
                job.file = &file;
                jobs.push_back(std::move(job));
            }
        }

        // Parsing and fingerprinting
        const std::size_t workers = resolve_worker_count(config_.worker_threads);
        parallel_for(jobs.size(), workers, [&](std::size_t i) {
            ParseJob& job = jobs[i];
            try {
                job.unit = parse(corpus.repository(job.repository), job.file->path, job.file->content);
            } catch (const ParseError& e) {
                job.error = e.what();
            }
        });

        for (auto& job : jobs) {
            const Repository& repo = corpus.repository(job.repository);
            if (!job.unit) {
                AUTODEPLOY_LOG_WARN("source unit dropped", {string_field("repository", repo.id),
                                                            string_field("path", job.file->path),
                                                            string_field("reason", job.error)});
                report.add_dropped_input(DroppedInput{repo.id, job.file->path, job.error});
                continue;
            }
            for (auto& decl : job.unit->declarations) {
                if (is_export_root(config_.export_roots, repo.id, decl.name)) {
                    decl.exported = true;
                }
            }
            corpus.add_unit(std::move(*job.unit));
        }

        AUTODEPLOY_LOG_INFO("inputs parsed",
                            {int_field("repositories", static_cast<std::int64_t>(corpus.repository_count())),
                             int_field("units", static_cast<std::int64_t>(corpus.unit_count())),
                             int_field("declarations", static_cast<std::int64_t>(corpus.declaration_count())),
                             int_field("dropped", static_cast<std::int64_t>(report.dropped_inputs().size()))});

        // Similarity index and grouping
        SimilarityIndex index(corpus);
        index.add_all();
        index.seal();

        const Grouping grouping = build_duplicate_groups(corpus, index, config_.near_duplicate_threshold,
                                                         config_.auto_merge_confidence_floor);

        OverlapResolver resolver(corpus, config_.policy);
        const Resolution resolution = resolver.resolve(grouping, report);

        AUTODEPLOY_LOG_INFO("duplicates resolved",
                            {int_field("groups", static_cast<std::int64_t>(grouping.groups.size())),
                             int_field("rejected_links", static_cast<std::int64_t>(grouping.rejected.size()))});

        // Dependency graph
        const DependencyGraph graph = DependencyGraph::build(corpus, resolution, resolver.ranking());
        if (graph.has_cycle()) {
            auto cycles = license_incompatible_cycles(graph, corpus, resolution, config_.policy);
            for (auto& cycle : cycles) {
                cycle.fatal = !config_.allow_incompatible_cycles;
                std::vector<std::string> members;
                for (const auto& m : cycle.members) members.push_back(m.label());

                AUTODEPLOY_LOG_WARN("license-incompatible cycle",
                                    {int_field("members", static_cast<std::int64_t>(members.size())),
                                     string_field("first", members.front()),
                                     bool_field("fatal", cycle.fatal)});
                report.add_cycle(cycle);

                if (cycle.fatal) {
                    throw LicenseIncompatibleCycle(members, cycle.licenses);
                }
            }
        }

        AUTODEPLOY_LOG_INFO("dependency graph built",
                            {int_field("nodes", static_cast<std::int64_t>(graph.node_count())),
                             int_field("edges", static_cast<std::int64_t>(graph.edge_count()))});

        // Projection into the merged unit
        std::vector<NodeId> by_rank(resolution.canonicals.size());
        for (NodeId n = 0; n < by_rank.size(); ++n) by_rank[n] = n;
        std::sort(by_rank.begin(), by_rank.end(), [&](NodeId a, NodeId b) {
            return resolver.ranking().better(resolution.canonicals[a].declaration,
                                             resolution.canonicals[b].declaration);
        });
        std::vector<std::size_t> priority(by_rank.size());
        for (std::size_t r = 0; r < by_rank.size(); ++r) priority[by_rank[r]] = r;

        MergedUnit unit;
        std::set<std::string> includes;
        for (NodeId n : graph.emission_order()) {
            const CanonicalDeclaration& canonical = resolution.canonicals[n];
            const Declaration& decl = corpus.declaration(canonical.declaration);
            const SourceUnit& source = corpus.unit_of(canonical.declaration);

            MergedDeclaration merged;
            merged.node = n;
            merged.name = decl.name;
            merged.original_name = decl.name;
            merged.kind = decl.kind;
            merged.text = decl.text;
            merged.repository = corpus.repository_of(canonical.declaration).id;
            merged.source_path = source.path;
            merged.includes = source.includes;
            merged.priority = priority[n];
            merged.confidence = canonical.confidence;
            merged.exact = canonical.exact;
            merged.references = graph.references(n);
            for (DeclId member : canonical.subsumed) {
                if (corpus.declaration(member).exported) merged.exported = true;
            }
            includes.insert(source.includes.begin(), source.includes.end());
            unit.declarations.push_back(std::move(merged));
        }
        unit.includes.assign(includes.begin(), includes.end());
        for (UnitId u = 0; u < corpus.unit_count(); ++u) {
            unit.merged_files.push_back(corpus.unit(u).path);
        }

        // Namespaces and attribution
        NamespaceReconciler reconciler;
        const auto renames = reconciler.reconcile(unit);
        for (const auto& rename : renames) {
            AUTODEPLOY_LOG_INFO("declaration renamed", {string_field("repository", rename.repository),
                                                        string_field("from", rename.from),
                                                        string_field("to", rename.to)});
        }
        reconciler.verify(unit);

        AttributionAnnotator annotator(corpus, config_.policy, config_.include_license_text);
        for (auto& merged : unit.declarations) {
            annotator.attach(merged, resolution.canonicals[merged.node]);
        }

        // Optimization
        PipelineOptions options;
        options.enabled = config_.enabled_passes;
        options.budget = std::chrono::seconds(config_.pass_timeout_seconds);
        options.workers = workers;
        options.membership_min_terms = config_.membership_min_terms;
        unit = OptimizationPipeline(std::move(options)).run(std::move(unit));
        reconciler.verify(unit);

        AUTODEPLOY_LOG_INFO("merge finished",
                            {int_field("declarations", static_cast<std::int64_t>(unit.declarations.size())),
                             int_field("renames", static_cast<std::int64_t>(renames.size())),
                             bool_field("conflicts", report.has_conflicts())});

        MergeResult result;
        result.unit = std::move(unit);
        result.report = std::move(report);
        return result;
    } catch (EngineError& e) {
        AUTODEPLOY_LOG_ERROR("merge aborted", {string_field("error", e.what())});
        e.attach_report(report);
        throw;
    }
}

MergeResult merge(std::vector<RepositoryInput> inputs, const EngineConfig& config) {
    return Engine(config).merge(std::move(inputs));
}

} // namespace autodeploy

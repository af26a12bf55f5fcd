/**
 * @file Engine.hpp
 * @brief Entry point of a merge run
 *
 * A run is a fixed sequence of stages over one immutable snapshot of the
 * inputs:
 * 1. parse every source unit (in parallel), dropping unparsable ones
 * 2. fingerprint and index all declarations, then seal the index
 * 3. group duplicates and choose canonicals
 * 4. build the dependency graph and check cycles against the license policy
 * 5. project canonicals into a Merged Unit in emission order
 * 6. reconcile names, attach attribution
 * 7. run the optimization pipeline
 *
 * Every fatal error leaves the engine with the Conflict Report gathered so
 * far attached to the exception.
 */

#ifndef AUTODEPLOY_ENGINE_HPP
#define AUTODEPLOY_ENGINE_HPP

#include "autodeploy/ConflictReport.hpp"
#include "autodeploy/LicensePolicy.hpp"
#include "autodeploy/MergedUnit.hpp"
#include "autodeploy/Optimization.hpp"

#include <string>
#include <vector>

namespace autodeploy {

/**
 * @brief `engine.*` settings plus the license policy
 */
struct EngineConfig {
    double near_duplicate_threshold = 0.10;
    double auto_merge_confidence_floor = 0.95;
    std::vector<PassId> enabled_passes = all_passes();
    int pass_timeout_seconds = 30;
    int worker_threads = 0;
    bool allow_incompatible_cycles = false;

    /// Export roots by `name` or `repository:name`
    std::vector<std::string> export_roots;

    std::size_t membership_min_terms = 3;
    bool include_license_text = false;
    std::vector<std::string> source_extensions = {".c", ".cc", ".cpp", ".cxx", ".h", ".hh", ".hpp"};

    LicensePolicy policy;

    /**
     * @brief Check ranges
     * @throws ConfigError naming the offending key
     */
    void validate() const;
};

struct SourceFile {
    std::string path;      ///< repository-relative, '/' separated
    std::string content;
};

/**
 * @brief One acquired repository, already read into memory
 */
struct RepositoryInput {
    std::string id;
    int trust_rank = 0;
    LicenseInfo license;
    std::vector<SourceFile> files;
};

struct MergeResult {
    MergedUnit unit;
    ConflictReport report;

    /// The run produced output but left something for the caller to review
    bool has_conflicts() const noexcept { return report.has_conflicts(); }
};

class Engine {
public:
    /// @throws ConfigError if the configuration is invalid
    explicit Engine(EngineConfig config);

    /**
     * @brief Merge a set of repositories into one unit
     *
     * The result does not depend on the order of `inputs` or of their files.
     *
     * @throws ConfigError on duplicate repository identifiers
     * @throws LicenseIncompatibleCycle unless incompatible cycles are allowed
     * @throws PassTimeout if an optimization pass exceeds its budget
     * @throws UnresolvedReference on an internal-consistency violation
     */
    MergeResult merge(std::vector<RepositoryInput> inputs) const;

    const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
};

/// Shorthand for `Engine(config).merge(inputs)`
MergeResult merge(std::vector<RepositoryInput> inputs, const EngineConfig& config);

} // namespace autodeploy

#endif // AUTODEPLOY_ENGINE_HPP

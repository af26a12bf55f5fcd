/**
 * @file Optimization.hpp
 * @brief Optimization passes over the Merged Unit
 *
 * Passes run in a fixed order, each one optional:
 * 1. dead_code_elimination
 * 2. expression_simplification
 * 3. data_structure_substitution
 * 4. include_consolidation
 *
 * Later passes only rely on earlier ones for efficiency, never for
 * correctness: skipping a pass may leave dead code or unfolded constants
 * behind, nothing else.
 */

#ifndef AUTODEPLOY_OPTIMIZATION_HPP
#define AUTODEPLOY_OPTIMIZATION_HPP

#include "autodeploy/MergedUnit.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace autodeploy {

enum class PassId {
    DeadCodeElimination,
    ExpressionSimplification,
    DataStructureSubstitution,
    IncludeConsolidation
};

const char* pass_name(PassId id);
std::optional<PassId> pass_from_name(const std::string& name);

/// Every pass, in pipeline order
const std::vector<PassId>& all_passes();

/**
 * @brief Cooperative time budget of one pass
 */
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    Deadline(std::string pass, std::chrono::milliseconds budget);

    bool expired() const;

    /// @throws PassTimeout once the budget is spent
    void check() const;

private:
    std::string pass_;
    std::chrono::milliseconds budget_;
    Clock::time_point end_;
};

struct PassContext {
    const Deadline& deadline;
    std::size_t workers = 1;
    std::size_t membership_min_terms = 3;
};

/**
 * @brief One optimization capability
 *
 * A pass may split per-declaration work across `ctx.workers` threads but
 * must not share mutable state between declarations while doing so.
 */
class Pass {
public:
    virtual ~Pass() = default;

    virtual PassId id() const = 0;
    virtual MergedUnit transform(MergedUnit unit, const PassContext& ctx) const = 0;
};

/**
 * @brief Remove declarations nothing references, unless exported
 *
 * Repeats until no more declarations can be removed, so helpers only used
 * by removed code go too.
 */
class DeadCodeElimination : public Pass {
public:
    PassId id() const override { return PassId::DeadCodeElimination; }
    MergedUnit transform(MergedUnit unit, const PassContext& ctx) const override;
};

/**
 * @brief Fold constant integer spans and drop the parentheses around them
 *
 * A span is a maximal run of integer literals, parentheses and the
 * operators `+ - * / % << >> & | ^ ~`, preceded by one of
 * `= ( , return [ ? :` and followed by one of `; ) , ] :`. It is folded
 * only if 32-bit evaluation succeeds without overflow, division by zero
 * or an invalid shift.
 */
class ExpressionSimplification : public Pass {
public:
    PassId id() const override { return PassId::ExpressionSimplification; }
    MergedUnit transform(MergedUnit unit, const PassContext& ctx) const override;

    /// Simplify one declaration's text
    static std::string simplify(const std::string& text);
};

/**
 * @brief Replace literal membership chains by a set lookup
 *
 * `x == 1 || x == 2 || x == 3` becomes
 * `(std::set<std::common_type_t<decltype(x), decltype(1)>>{1, 2, 3}.count(x) != 0)`
 * when the chain compares one plain identifier against at least
 * `membership_min_terms` literals of one type: unsuffixed integers up to
 * 2^24, or unprefixed single characters. The key type is the one `==`
 * compares in. Nothing else is rewritten. Requires `<set>` and `<type_traits>`.
 */
class DataStructureSubstitution : public Pass {
public:
    PassId id() const override { return PassId::DataStructureSubstitution; }
    MergedUnit transform(MergedUnit unit, const PassContext& ctx) const override;

    /// Rewrite one declaration's text; `changed` reports whether anything fired
    static std::string substitute(const std::string& text, std::size_t min_terms, bool& changed);
};

/**
 * @brief Recompute the include list from surviving declarations
 *
 * Sorted and deduplicated, system includes before quoted ones. Quoted
 * includes of merged source units are dropped; includes that earlier
 * passes required are kept.
 */
class IncludeConsolidation : public Pass {
public:
    PassId id() const override { return PassId::IncludeConsolidation; }
    MergedUnit transform(MergedUnit unit, const PassContext& ctx) const override;
};

struct PipelineOptions {
    std::vector<PassId> enabled = all_passes();
    std::chrono::milliseconds budget{std::chrono::seconds(30)};
    std::size_t workers = 1;
    std::size_t membership_min_terms = 3;
};

/**
 * @brief Runs the enabled passes in pipeline order
 */
class OptimizationPipeline {
public:
    explicit OptimizationPipeline(PipelineOptions options);

    /// Pipeline over a custom pass list (kept in the given order)
    OptimizationPipeline(PipelineOptions options, std::vector<std::unique_ptr<Pass>> passes);

    /**
     * @throws PassTimeout if a pass runs past its budget
     */
    MergedUnit run(MergedUnit unit) const;

    bool enabled(PassId id) const;

private:
    PipelineOptions options_;
    std::vector<std::unique_ptr<Pass>> passes_;
};

} // namespace autodeploy

#endif // AUTODEPLOY_OPTIMIZATION_HPP

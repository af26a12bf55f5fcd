/**
 * @file test_engine.cpp
 * @brief End-to-end merge runs
 *
 * Tests cover:
 * - Deduplication across repositories with full attribution
 * - Collision renaming and call-site rewriting
 * - Dead-code elimination against export roots
 * - Dropped inputs, near-duplicate conflicts and license-incompatible cycles
 * - Determinism under input reordering
 */

#include <gtest/gtest.h>
#include "autodeploy/Engine.hpp"
#include "autodeploy/Errors.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <set>

using namespace autodeploy;
using autodeploy::fixtures::repeated_function;
using autodeploy::fixtures::sample_policy;

namespace {

RepositoryInput repo(const std::string& id, int trust, const std::string& license,
                     std::vector<SourceFile> files) {
    RepositoryInput input;
    input.id = id;
    input.trust_rank = trust;
    input.license = LicenseInfo{license, ""};
    input.files = std::move(files);
    return input;
}

EngineConfig config_with(std::vector<std::string> export_roots) {
    EngineConfig config;
    config.policy = sample_policy();
    config.worker_threads = 2;
    config.export_roots = std::move(export_roots);
    return config;
}

const MergedDeclaration& find_decl(const MergedUnit& unit, const std::string& name) {
    const std::size_t i = unit.find(name);
    if (i == kNoId) {
        throw std::runtime_error("no declaration named " + name);
    }
    return unit.declarations[i];
}

std::vector<RepositoryInput> util_collision_inputs() {
    return {
        repo("A", 2, "MIT", {{"a.c", "int util(int x) { return x + 1; }\n"
                                     "int run_a(int v) { return util(v); }\n"}}),
        repo("B", 1, "GPL-3.0", {{"b.c", "int util(int x) { return x * 2 - 7; }\n"
                                         "int run_b(int v) { return util(v) + util(1); }\n"}}),
    };
}

} // anonymous namespace

// ============================================================================
// Deduplication and attribution
// ============================================================================

TEST(EngineTest, IdenticalFunctionsAreMergedWithBothOrigins) {
    auto result = merge({repo("A", 2, "MIT", {{"src/math.c", "int add(int a, int b) { return a + b; }\n"}}),
                         repo("B", 1, "Apache-2.0", {{"lib/ops.c", "int add(int x, int y)\n{\n    return x + y;\n}\n"}})},
                        config_with({"add"}));

    ASSERT_EQ(result.unit.declarations.size(), 1u);
    const auto& add = result.unit.declarations[0];
    EXPECT_EQ(add.name, "add");
    EXPECT_EQ(add.repository, "A");
    EXPECT_EQ(add.text, "int add(int a, int b) { return a + b; }");
    EXPECT_TRUE(add.exact);
    ASSERT_EQ(add.subsumed.size(), 2u);
    EXPECT_EQ(add.subsumed[0].label(), "A:src/math.c:add");
    EXPECT_EQ(add.subsumed[1].label(), "B:lib/ops.c:add");
    EXPECT_NE(add.attribution.find("A (MIT): src/math.c"), std::string::npos);
    EXPECT_NE(add.attribution.find("B (Apache-2.0): lib/ops.c"), std::string::npos);

    EXPECT_FALSE(result.has_conflicts());
    EXPECT_TRUE(result.report.empty());
    EXPECT_EQ(result.unit.merged_files, (std::vector<std::string>{"src/math.c", "lib/ops.c"}));
}

TEST(EngineTest, EverySurvivorCarriesAttributionForEachOrigin) {
    auto result = merge(util_collision_inputs(), config_with({"run_a", "run_b"}));
    for (const auto& d : result.unit.declarations) {
        ASSERT_FALSE(d.subsumed.empty()) << d.name;
        for (const auto& origin : d.subsumed) {
            EXPECT_NE(d.attribution.find(" - " + origin.repository + " ("), std::string::npos) << d.name;
        }
        EXPECT_NE(result.unit.serialize().find(d.attribution + "\n" + d.text), std::string::npos);
    }
}

// ============================================================================
// Namespace reconciliation
// ============================================================================

TEST(EngineTest, CollidingNamesAreRenamedAndCallSitesRewritten) {
    auto result = merge(util_collision_inputs(), config_with({"run_a", "run_b"}));
    const auto& unit = result.unit;

    ASSERT_EQ(unit.declarations.size(), 4u);
    EXPECT_EQ(find_decl(unit, "util").repository, "A");
    EXPECT_EQ(find_decl(unit, "util").text, "int util(int x) { return x + 1; }");

    const auto& renamed = find_decl(unit, "util_B");
    EXPECT_EQ(renamed.repository, "B");
    EXPECT_EQ(renamed.original_name, "util");
    EXPECT_EQ(renamed.text, "int util_B(int x) { return x * 2 - 7; }");
    EXPECT_NE(renamed.attribution.find("util_B (originally util)"), std::string::npos);

    EXPECT_EQ(find_decl(unit, "run_a").text, "int run_a(int v) { return util(v); }");
    EXPECT_EQ(find_decl(unit, "run_b").text, "int run_b(int v) { return util_B(v) + util_B(1); }");
}

TEST(EngineTest, NamesAreUniqueAndEveryReferenceResolves) {
    auto result = merge(util_collision_inputs(), config_with({"run_a", "run_b"}));
    const auto& unit = result.unit;

    std::set<std::string> names;
    for (const auto& d : unit.declarations) {
        EXPECT_TRUE(names.insert(d.name).second) << d.name;
    }
    for (const auto& d : unit.declarations) {
        for (const auto& [identifier, node] : d.references) {
            const std::size_t target = unit.find(node);
            ASSERT_NE(target, kNoId) << d.name << " -> " << identifier;
            EXPECT_EQ(unit.declarations[target].name, identifier);
        }
    }
}

TEST(EngineTest, DependenciesAreEmittedBeforeUse) {
    auto result = merge(util_collision_inputs(), config_with({"run_a", "run_b"}));
    const auto& unit = result.unit;
    EXPECT_LT(unit.find("util"), unit.find("run_a"));
    EXPECT_LT(unit.find("util_B"), unit.find("run_b"));
}

// ============================================================================
// Dead-code elimination
// ============================================================================

TEST(EngineTest, UnreferencedUnexportedDeclarationsAreRemoved) {
    auto result = merge({repo("A", 1, "MIT", {{"a.c", "static int helper(int v) { return v * 3; }\n"
                                                     "int api(int y) { return helper(y); }\n"
                                                     "int orphan(int q) { return q * 42; }\n"
                                                     "/* @export */\n"
                                                     "int visible(void) { return 7; }\n"}})},
                        config_with({"api"}));

    const auto& unit = result.unit;
    EXPECT_NE(unit.find("helper"), kNoId);
    EXPECT_NE(unit.find("api"), kNoId);
    EXPECT_NE(unit.find("visible"), kNoId);
    EXPECT_EQ(unit.find("orphan"), kNoId);
}

TEST(EngineTest, DisabledDeadCodeEliminationKeepsEverything) {
    EngineConfig config = config_with({});
    config.enabled_passes = {PassId::ExpressionSimplification, PassId::IncludeConsolidation};

    auto result = merge({repo("A", 1, "MIT", {{"a.c", "int orphan(void) { return 40 + 2; }\n"}})}, config);
    ASSERT_EQ(result.unit.declarations.size(), 1u);
    EXPECT_EQ(result.unit.declarations[0].text, "int orphan(int q) { return q * 42; }");
}

// ============================================================================
// Optimization end to end
// ============================================================================

TEST(EngineTest, MembershipChainsAndIncludesAreRewritten) {
    auto result = merge({repo("A", 1, "MIT",
                              {{"src/text.c", "#include <stdio.h>\n#include \"text.h\"\n"
                                              "int vowel(char c) { return c == 'a' || c == 'e' || c == 'i'; }\n"},
                               {"src/text.h", "#include <stddef.h>\n"}})},
                        config_with({"vowel"}));

    const auto& unit = result.unit;
    EXPECT_EQ(find_decl(unit, "vowel").text,
              "int vowel(char c) { return (std::set<std::common_type_t<decltype(c), decltype('a')>>"
              "{'a', 'e', 'i'}.count(c) != 0); }");
    EXPECT_EQ(unit.includes, (std::vector<std::string>{"<set>", "<stdio.h>", "<type_traits>"}));
}

// ============================================================================
// Failure isolation and conflicts
// ============================================================================

TEST(EngineTest, MalformedUnitIsDroppedAndRunContinues) {
    auto result = merge({repo("A", 1, "MIT", {{"good.c", "int fine(void) { return 1; }\n"},
                                             {"broken.c", "int broken(void) { return \"oops; }\n"}})},
                        config_with({"fine"}));

    ASSERT_EQ(result.report.dropped_inputs().size(), 1u);
    EXPECT_EQ(result.report.dropped_inputs()[0].repository, "A");
    EXPECT_EQ(result.report.dropped_inputs()[0].path, "broken.c");
    EXPECT_FALSE(result.report.dropped_inputs()[0].reason.empty());
    EXPECT_FALSE(result.has_conflicts());
    EXPECT_NE(result.unit.find("fine"), kNoId);
    EXPECT_EQ(result.unit.merged_files, (std::vector<std::string>{"good.c"}));
}

TEST(EngineTest, LowConfidenceNearDuplicateIsReported) {
    EngineConfig config = config_with({"step"});
    config.auto_merge_confidence_floor = 0.999;

    auto result = merge({repo("A", 2, "MIT", {{"a.c", repeated_function("step")}}),
                         repo("B", 1, "MIT", {{"b.c", repeated_function("step", "x", 12)}})},
                        config);

    EXPECT_TRUE(result.has_conflicts());
    ASSERT_EQ(result.report.near_duplicates().size(), 1u);
    EXPECT_EQ(result.report.near_duplicates()[0].canonical.label(), "A:a.c:step");
    EXPECT_EQ(result.report.near_duplicates()[0].candidate.label(), "B:b.c:step");

    ASSERT_EQ(result.unit.declarations.size(), 2u);
    const auto& kept = find_decl(result.unit, "step");
    ASSERT_EQ(kept.rejected_near_matches.size(), 1u);
    EXPECT_EQ(kept.rejected_near_matches[0].origin.label(), "B:b.c:step");
    EXPECT_NE(result.unit.find("step_B"), kNoId);
}

TEST(EngineTest, HighConfidenceNearDuplicateIsMerged) {
    auto result = merge({repo("A", 2, "MIT", {{"a.c", repeated_function("step")}}),
                         repo("B", 1, "MIT", {{"b.c", repeated_function("step", "x", 12)}})},
                        config_with({"step"}));

    EXPECT_FALSE(result.has_conflicts());
    ASSERT_EQ(result.unit.declarations.size(), 1u);
    EXPECT_FALSE(result.unit.declarations[0].exact);
    EXPECT_NE(result.unit.declarations[0].attribution.find("Merged from near duplicates"), std::string::npos);
}

TEST(EngineTest, IncompatibleCycleIsFatalWithReport) {
    auto inputs = std::vector<RepositoryInput>{
        repo("A", 1, "MIT", {{"a.c", "int ping(int n) { return n > 0 ? pong(n - 1) : 0; }\n"}}),
        repo("B", 1, "GPL-3.0", {{"b.c", "int pong(int n) { if (n <= 0) { return 1; } return ping(n / 2); }\n"}}),
    };

    try {
        merge(inputs, config_with({}));
        FAIL() << "expected LicenseIncompatibleCycle";
    } catch (const LicenseIncompatibleCycle& e) {
        EXPECT_EQ(e.members(), (std::vector<std::string>{"A:a.c:ping", "B:b.c:pong"}));
        EXPECT_EQ(e.licenses(), (std::vector<std::string>{"GPL-3.0", "MIT"}));
        ASSERT_EQ(e.report().cycles().size(), 1u);
        EXPECT_TRUE(e.report().cycles()[0].fatal);
    }

    EngineConfig allow = config_with({});
    allow.allow_incompatible_cycles = true;
    auto result = merge(inputs, allow);
    EXPECT_TRUE(result.has_conflicts());
    ASSERT_EQ(result.report.cycles().size(), 1u);
    EXPECT_FALSE(result.report.cycles()[0].fatal);
    EXPECT_EQ(result.unit.declarations.size(), 2u);
}

TEST(EngineTest, CompatibleCycleIsEmittedContiguously) {
    auto result = merge({repo("A", 1, "MIT", {{"a.c", "int ping(int n) { return n > 0 ? pong(n - 1) : 0; }\n"
                                                     "int lone(void) { return 3; }\n"}}),
                         repo("B", 1, "Apache-2.0",
                              {{"b.c", "int pong(int n) { if (n <= 0) { return 1; } return ping(n / 2); }\n"}})},
                        config_with({"lone"}));

    EXPECT_FALSE(result.has_conflicts());
    const auto& unit = result.unit;
    ASSERT_EQ(unit.declarations.size(), 3u);
    const std::size_t ping = unit.find("ping");
    const std::size_t pong = unit.find("pong");
    EXPECT_EQ(std::max(ping, pong) - std::min(ping, pong), 1u);
}

// ============================================================================
// Determinism and configuration
// ============================================================================

TEST(EngineTest, OutputIsIndependentOfInputOrder) {
    auto forward = util_collision_inputs();
    forward[0].files.push_back({"z.c", "int add(int a, int b) { return a + b; }\n"});
    forward[1].files.push_back({"m.c", "int add(int p, int q) { return p + q; }\n"});

    auto reversed = forward;
    std::reverse(reversed.begin(), reversed.end());
    for (auto& input : reversed) std::reverse(input.files.begin(), input.files.end());

    EngineConfig config = config_with({"run_a", "run_b", "add"});
    auto first = merge(forward, config);
    auto second = merge(reversed, config);

    EXPECT_EQ(first.unit.serialize(), second.unit.serialize());
    EXPECT_EQ(first.unit.to_json(), second.unit.to_json());
    EXPECT_EQ(first.report.to_json(), second.report.to_json());
}

TEST(EngineTest, InvalidConfigurationIsRejected) {
    EngineConfig bad_threshold = config_with({});
    bad_threshold.near_duplicate_threshold = 1.5;
    EXPECT_THROW(Engine{bad_threshold}, ConfigError);

    EngineConfig bad_timeout = config_with({});
    bad_timeout.pass_timeout_seconds = 0;
    EXPECT_THROW(Engine{bad_timeout}, ConfigError);

    EngineConfig repeated = config_with({});
    repeated.enabled_passes = {PassId::DeadCodeElimination, PassId::DeadCodeElimination};
    EXPECT_THROW(Engine{repeated}, ConfigError);

    EXPECT_NO_THROW(Engine{config_with({})});
}

TEST(EngineTest, EmptyInputProducesEmptyUnit) {
    auto result = merge({}, config_with({}));
    EXPECT_TRUE(result.unit.declarations.empty());
    EXPECT_TRUE(result.report.empty());
}

/**
 * @file test_optimization.cpp
 * @brief Tests for the optimization passes and pipeline
 */

#include <gtest/gtest.h>
#include "autodeploy/Errors.hpp"
#include "autodeploy/Expression.hpp"
#include "autodeploy/Optimization.hpp"
#include "autodeploy/WorkerPool.hpp"

#include <set>
#include <thread>
#include <type_traits>

using namespace autodeploy;
using namespace std::chrono_literals;

namespace {

MergedDeclaration decl(NodeId node, const std::string& name, std::map<std::string, NodeId> refs = {},
                       bool exported = false) {
    MergedDeclaration d;
    d.node = node;
    d.name = name;
    d.original_name = name;
    d.text = "int " + name + ";";
    d.exported = exported;
    d.references = std::move(refs);
    d.references[name] = node;
    return d;
}

std::vector<std::string> names(const MergedUnit& unit) {
    std::vector<std::string> out;
    for (const auto& d : unit.declarations) out.push_back(d.name);
    return out;
}

MergedUnit run_pass(const Pass& pass, MergedUnit unit, std::size_t min_terms = 3) {
    Deadline deadline(pass_name(pass.id()), 10s);
    PassContext ctx{deadline, 2, min_terms};
    return pass.transform(std::move(unit), ctx);
}

class SlowPass : public Pass {
public:
    PassId id() const override { return PassId::ExpressionSimplification; }
    MergedUnit transform(MergedUnit unit, const PassContext&) const override {
        std::this_thread::sleep_for(30ms);
        return unit;
    }
};

} // anonymous namespace

// ============================================================================
// Pass names
// ============================================================================

TEST(PassNameTest, RoundTripsEveryPass) {
    for (PassId id : all_passes()) {
        EXPECT_EQ(pass_from_name(pass_name(id)), id);
    }
    EXPECT_FALSE(pass_from_name("loop_unrolling").has_value());
    EXPECT_STREQ(pass_name(PassId::DeadCodeElimination), "dead_code_elimination");
}

// ============================================================================
// Dead-code elimination
// ============================================================================

TEST(DeadCodeEliminationTest, KeepsExportedAndTheirDependencies) {
    MergedUnit unit;
    unit.declarations.push_back(decl(0, "helper"));
    unit.declarations.push_back(decl(1, "api", {{"helper", 0}}, true));
    unit.declarations.push_back(decl(2, "unused"));

    auto out = run_pass(DeadCodeElimination(), unit);
    EXPECT_EQ(names(out), (std::vector<std::string>{"helper", "api"}));
}

TEST(DeadCodeEliminationTest, RemovesChainsToFixpoint) {
    MergedUnit unit;
    unit.declarations.push_back(decl(0, "leaf"));
    unit.declarations.push_back(decl(1, "middle", {{"leaf", 0}}));
    unit.declarations.push_back(decl(2, "top", {{"middle", 1}}));
    unit.declarations.push_back(decl(3, "root", {}, true));

    auto out = run_pass(DeadCodeElimination(), unit);
    EXPECT_EQ(names(out), (std::vector<std::string>{"root"}));
}

TEST(DeadCodeEliminationTest, SelfReferenceDoesNotKeepAlive) {
    MergedUnit unit;
    unit.declarations.push_back(decl(0, "recurse"));
    unit.declarations.push_back(decl(1, "main", {}, true));

    auto out = run_pass(DeadCodeElimination(), unit);
    EXPECT_EQ(names(out), (std::vector<std::string>{"main"}));
}

TEST(DeadCodeEliminationTest, MutuallyReferencingDeclarationsSurvive) {
    MergedUnit unit;
    unit.declarations.push_back(decl(0, "ping", {{"pong", 1}}));
    unit.declarations.push_back(decl(1, "pong", {{"ping", 0}}));
    unit.declarations.push_back(decl(2, "main", {}, true));

    // Mutually referencing declarations keep each other alive.
    auto out = run_pass(DeadCodeElimination(), unit);
    EXPECT_EQ(names(out), (std::vector<std::string>{"ping", "pong", "main"}));
}

// ============================================================================
// Expression simplification
// ============================================================================

TEST(ExpressionSimplificationTest, FoldsFullyConstantExpressions) {
    EXPECT_EQ(ExpressionSimplification::simplify("int f(void) { return 2 * 3 + 4; }"),
              "int f(void) { return 10; }");
    EXPECT_EQ(ExpressionSimplification::simplify("static const int kSize = 1 << 4;"),
              "static const int kSize = 16;");
    EXPECT_EQ(ExpressionSimplification::simplify("int g(void) { return f(1 + 2, 3 * 4); }"),
              "int g(void) { return f(3, 12); }");
}

TEST(ExpressionSimplificationTest, DropsGroupingParentheses) {
    EXPECT_EQ(ExpressionSimplification::simplify("int g(int x) { return x * (60 * 60); }"),
              "int g(int x) { return x * 3600; }");
    EXPECT_EQ(ExpressionSimplification::simplify("int g(int x) { return (1 + 2) * x; }"),
              "int g(int x) { return 3 * x; }");
}

TEST(ExpressionSimplificationTest, KeepsParenthesesAroundNegativeResults) {
    EXPECT_EQ(ExpressionSimplification::simplify("int h(int y) { return y - (2 - 5); }"),
              "int h(int y) { return y - (-3); }");
}

TEST(ExpressionSimplificationTest, LeavesPartialAndUnsafeExpressions) {
    const char* unchanged[] = {
        "int f(int x) { return 2 * 3 + x; }",
        "int f(int x) { return x * 2 + 3; }",
        "int f(void) { return -1; }",
        "int f(void) { return (5); }",
        "int f(void) { return 1 / 0; }",
        "int f(void) { return 1 << 31; }",
        "int f(void) { return 1 /* one */ + 2; }",
        "double f(void) { return 1.5 * 2; }",
    };
    for (const char* text : unchanged) {
        EXPECT_EQ(ExpressionSimplification::simplify(text), text) << text;
    }
}

TEST(ExpressionSimplificationTest, PreservesValue) {
    const std::string folded = ExpressionSimplification::simplify("int k = (7 - 2) * 3 % 4 + (8 >> 1);");
    EXPECT_EQ(folded, "int k = 7;");
    EXPECT_EQ(evaluate("(7 - 2) * 3 % 4 + (8 >> 1)"), 7);
}

TEST(ExpressionSimplificationTest, KeepsLiteralApartFromPrecedingKeyword) {
    EXPECT_EQ(ExpressionSimplification::simplify("int three() { return(1 + 2); }"),
              "int three() { return 3; }");
    EXPECT_EQ(ExpressionSimplification::simplify("int one() { return(-(1 - 2)); }"),
              "int one() { return 1; }");
    EXPECT_EQ(ExpressionSimplification::simplify("int minus() { return(-(2 - 1)); }"),
              "int minus() { return -1; }");
    EXPECT_EQ(ExpressionSimplification::simplify("int six() { return((2 * 3)); }"),
              "int six() { return 6; }");
}

TEST(ExpressionSimplificationTest, TransformRewritesEveryDeclaration) {
    MergedUnit unit;
    unit.declarations.push_back(decl(0, "a"));
    unit.declarations.push_back(decl(1, "b"));
    unit.declarations[0].text = "int a = 2 + 2;";
    unit.declarations[1].text = "int b = 3 * 3;";

    auto out = run_pass(ExpressionSimplification(), unit);
    EXPECT_EQ(out.declarations[0].text, "int a = 4;");
    EXPECT_EQ(out.declarations[1].text, "int b = 9;");
}

// ============================================================================
// Data-structure substitution
// ============================================================================

TEST(DataStructureSubstitutionTest, RewritesMembershipChains) {
    bool changed = false;
    EXPECT_EQ(DataStructureSubstitution::substitute(
                  "int vowel(char c) { return c == 'a' || c == 'e' || c == 'i'; }", 3, changed),
              "int vowel(char c) { return (std::set<std::common_type_t<decltype(c), decltype('a')>>{'a', 'e', 'i'}"
              ".count(c) != 0); }");
    EXPECT_TRUE(changed);

    EXPECT_EQ(DataStructureSubstitution::substitute(
                  "int f(int x) { if (x == 1 || x == 2 || x == 3) return 1; return 0; }", 3, changed),
              "int f(int x) { if ((std::set<std::common_type_t<decltype(x), decltype(1)>>{1, 2, 3}.count(x) != 0)) "
              "return 1; return 0; }");
    EXPECT_TRUE(changed);
}

TEST(DataStructureSubstitutionTest, LeavesShortOrMixedChains) {
    const char* unchanged[] = {
        "int f(int x) { return x == 1 || x == 2; }",
        "int f(int x, int y) { return x == 1 || y == 2 || x == 3; }",
        "int f(int x) { return x == 1 || x == 'a' || x == 3; }",
        "int f(int x) { return x == 1 || x == 2 || x == 3 || x > 9; }",
        "int f(int x) { return x == 1.0 || x == 2 || x == 3; }",
    };
    for (const char* text : unchanged) {
        bool changed = true;
        EXPECT_EQ(DataStructureSubstitution::substitute(text, 3, changed), text) << text;
        EXPECT_FALSE(changed);
    }
}

TEST(DataStructureSubstitutionTest, KeysFollowTheComparisonType) {
    bool changed = false;
    // A double subject keeps its fraction: 1.5 is not found among {1, 2, 3}.
    EXPECT_EQ(DataStructureSubstitution::substitute(
                  "bool in(double x) { return x == 1 || x == 2 || x == 3; }", 3, changed),
              "bool in(double x) { return (std::set<std::common_type_t<decltype(x), decltype(1)>>"
              "{1, 2, 3}.count(x) != 0); }");
    EXPECT_TRUE(changed);
    EXPECT_EQ((std::set<std::common_type_t<double, int>>{1, 2, 3}.count(1.5)), 0u);
    EXPECT_EQ((std::set<std::common_type_t<double, int>>{1, 2, 3}.count(2.0)), 1u);

    // An int subject against char literals compares as int: 'a' + 256 is not 'a'.
    EXPECT_EQ(DataStructureSubstitution::substitute(
                  "bool vowel(int c) { return c == 'a' || c == 'e' || c == 'i'; }", 3, changed),
              "bool vowel(int c) { return (std::set<std::common_type_t<decltype(c), decltype('a')>>"
              "{'a', 'e', 'i'}.count(c) != 0); }");
    EXPECT_TRUE(changed);
    EXPECT_EQ((std::set<std::common_type_t<int, char>>{'a', 'e', 'i'}.count('a' + 256)), 0u);
    EXPECT_EQ((std::set<std::common_type_t<int, char>>{'a', 'e', 'i'}.count('e')), 1u);
}

TEST(DataStructureSubstitutionTest, LeavesLiteralsOfUncertainType) {
    const char* unchanged[] = {
        "int f(long x) { return x == 1L || x == 2L || x == 3L; }",
        "int f(unsigned x) { return x == 1u || x == 2u || x == 3u; }",
        "int f(int x) { return x == 1 || x == 2 || x == 4294967296; }",
        "int f(float x) { return x == 1 || x == 2 || x == 16777217; }",
        "int f(int c) { return c == L'a' || c == L'b' || c == L'c'; }",
        "int f(int c) { return c == 'ab' || c == 'cd' || c == 'ef'; }",
    };
    for (const char* text : unchanged) {
        bool changed = true;
        EXPECT_EQ(DataStructureSubstitution::substitute(text, 3, changed), text) << text;
        EXPECT_FALSE(changed);
    }
}

TEST(DataStructureSubstitutionTest, MinimumTermsIsConfigurable) {
    bool changed = false;
    EXPECT_EQ(DataStructureSubstitution::substitute("int f(int x) { return x == 1 || x == 2; }", 2, changed),
              "int f(int x) { return (std::set<std::common_type_t<decltype(x), decltype(1)>>{1, 2}.count(x) != 0); }");
    EXPECT_TRUE(changed);
}

TEST(DataStructureSubstitutionTest, TransformRequiresSetHeaders) {
    MergedUnit unit;
    unit.declarations.push_back(decl(0, "f"));
    unit.declarations[0].text = "int f(int x) { return x == 1 || x == 2 || x == 3; }";

    auto out = run_pass(DataStructureSubstitution(), unit);
    EXPECT_EQ(out.required_includes, (std::vector<std::string>{"<set>", "<type_traits>"}));
    EXPECT_EQ(out.includes, (std::vector<std::string>{"<set>", "<type_traits>"}));

    MergedUnit plain;
    plain.declarations.push_back(decl(0, "g"));
    EXPECT_TRUE(run_pass(DataStructureSubstitution(), plain).required_includes.empty());
}

// ============================================================================
// Include consolidation
// ============================================================================

TEST(IncludeConsolidationTest, DeduplicatesSortsAndDropsMergedFiles) {
    MergedUnit unit;
    unit.merged_files = {"src/util.h", "src/math.c"};
    unit.declarations.push_back(decl(0, "a"));
    unit.declarations.push_back(decl(1, "b"));
    unit.declarations[0].includes = {"<stdlib.h>", "\"util.h\"", "\"other.h\""};
    unit.declarations[1].includes = {"<stdio.h>", "<stdlib.h>", "\"src/util.h\"", "\"myutil.h\""};
    unit.required_includes = {"<set>"};

    auto out = run_pass(IncludeConsolidation(), unit);
    EXPECT_EQ(out.includes, (std::vector<std::string>{"<set>", "<stdio.h>", "<stdlib.h>",
                                                      "\"myutil.h\"", "\"other.h\""}));
}

// ============================================================================
// Pipeline
// ============================================================================

TEST(OptimizationPipelineTest, RunsEnabledPassesOnly) {
    MergedUnit unit;
    unit.declarations.push_back(decl(0, "unused"));
    unit.declarations.push_back(decl(1, "main", {}, true));
    unit.declarations[1].text = "int main(void) { return 6 * 7; }";

    PipelineOptions options;
    options.enabled = {PassId::ExpressionSimplification};
    auto out = OptimizationPipeline(options).run(unit);

    EXPECT_EQ(names(out), (std::vector<std::string>{"unused", "main"}));
    EXPECT_EQ(out.declarations[1].text, "int main(void) { return 42; }");
    EXPECT_TRUE(OptimizationPipeline(options).enabled(PassId::ExpressionSimplification));
    EXPECT_FALSE(OptimizationPipeline(options).enabled(PassId::DeadCodeElimination));
}

TEST(OptimizationPipelineTest, NoPassesLeavesUnitUntouched) {
    MergedUnit unit;
    unit.declarations.push_back(decl(0, "unused"));
    unit.declarations[0].text = "int unused = 1 + 1;";

    PipelineOptions options;
    options.enabled.clear();
    auto out = OptimizationPipeline(options).run(unit);
    ASSERT_EQ(out.declarations.size(), 1u);
    EXPECT_EQ(out.declarations[0].text, "int unused = 1 + 1;");
}

TEST(OptimizationPipelineTest, PassOverBudgetRaisesPassTimeout) {
    std::vector<std::unique_ptr<Pass>> passes;
    passes.push_back(std::make_unique<SlowPass>());

    PipelineOptions options;
    options.budget = 1ms;
    OptimizationPipeline pipeline(options, std::move(passes));

    try {
        pipeline.run(MergedUnit{});
        FAIL() << "expected PassTimeout";
    } catch (const PassTimeout& e) {
        EXPECT_EQ(e.pass(), "expression_simplification");
        EXPECT_EQ(e.budget_ms(), 1);
    }
}

// ============================================================================
// Worker pool
// ============================================================================

TEST(WorkerPoolTest, VisitsEveryIndexOnce) {
    std::vector<int> hits(100, 0);
    parallel_for(hits.size(), 4, [&](std::size_t i) { ++hits[i]; });
    for (int h : hits) EXPECT_EQ(h, 1);
}

TEST(WorkerPoolTest, RethrowsLowestFailingIndex) {
    try {
        parallel_for(10, 3, [](std::size_t i) {
            if (i == 4 || i == 7) throw std::runtime_error("fail " + std::to_string(i));
        });
        FAIL() << "expected exception";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "fail 4");
    }
}

TEST(WorkerPoolTest, ResolvesWorkerCount) {
    EXPECT_EQ(resolve_worker_count(3), 3u);
    EXPECT_GE(resolve_worker_count(0), 1u);
}

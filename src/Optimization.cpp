/**
 * @file Optimization.cpp
 * @brief Optimization passes and their orchestration
 */

#include "autodeploy/Optimization.hpp"
#include "autodeploy/Errors.hpp"
#include "autodeploy/Expression.hpp"
#include "autodeploy/Lexer.hpp"
#include "autodeploy/Logging.hpp"
#include "autodeploy/WorkerPool.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace autodeploy {

// ============================================================================
// Pass identity
// ============================================================================

const char* pass_name(PassId id) {
    switch (id) {
        case PassId::DeadCodeElimination: return "dead_code_elimination";
        case PassId::ExpressionSimplification: return "expression_simplification";
        case PassId::DataStructureSubstitution: return "data_structure_substitution";
        case PassId::IncludeConsolidation: return "include_consolidation";
    }
    return "unknown";
}

std::optional<PassId> pass_from_name(const std::string& name) {
    for (PassId id : all_passes()) {
        if (name == pass_name(id)) return id;
    }
    return std::nullopt;
}

const std::vector<PassId>& all_passes() {
    static const std::vector<PassId> passes = {
        PassId::DeadCodeElimination,
        PassId::ExpressionSimplification,
        PassId::DataStructureSubstitution,
        PassId::IncludeConsolidation
    };
    return passes;
}

Deadline::Deadline(std::string pass, std::chrono::milliseconds budget)
    : pass_(std::move(pass)), budget_(budget), end_(Clock::now() + budget) {}

bool Deadline::expired() const {
    return Clock::now() > end_;
}

void Deadline::check() const {
    if (expired()) {
        throw PassTimeout(pass_, static_cast<long long>(budget_.count()));
    }
}

namespace {

struct Edit {
    std::size_t begin;
    std::size_t end;
    std::string replacement;
};

std::string apply_edits(const std::string& text, const std::vector<Edit>& edits) {
    std::string out;
    std::size_t copied = 0;
    for (const auto& e : edits) {
        out.append(text, copied, e.begin - copied);
        out += e.replacement;
        copied = e.end;
    }
    out.append(text, copied, std::string::npos);
    return out;
}

/// Indices of significant tokens
std::vector<std::size_t> significant(const std::vector<Token>& tokens) {
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (is_significant(tokens[i])) out.push_back(i);
    }
    return out;
}

bool is_one_of(const Token& t, std::initializer_list<const char*> puncts) {
    for (const char* p : puncts) {
        if (t.is_punct(p)) return true;
    }
    return false;
}

bool folds_before(const Token& t) {
    return t.is_keyword("return") || is_one_of(t, {"=", "(", ",", "[", "?", ":"});
}

bool folds_after(const Token& t) {
    return is_one_of(t, {";", ")", ",", "]", ":"});
}

bool is_fold_operator(const Token& t) {
    return is_one_of(t, {"+", "-", "*", "/", "%", "<<", ">>", "&", "|", "^", "~"});
}

// Parentheses that only group: the '(' follows an operator or a boundary.
bool is_grouping_open(const Token* before) {
    if (before == nullptr) return false;
    if (before->is_keyword("return")) return true;
    return is_one_of(*before, {"=", "(", ",", "[", "?", ":", "+", "-", "*", "/", "%",
                               "<<", ">>", "&", "|", "^", "~", "!", "<", ">", "<=", ">=",
                               "==", "!=", "&&", "||", "+=", "-=", "*=", "/=", "%=",
                               "&=", "|=", "^=", "<<=", ">>="});
}

// A literal placed at `offset` must not fuse with a preceding word: return(3) -> return 3
std::string separated(const std::string& text, std::size_t offset, std::string literal) {
    if (offset > 0) {
        const auto c = static_cast<unsigned char>(text[offset - 1]);
        if (std::isalnum(c) || c == '_') return " " + literal;
    }
    return literal;
}

// Unsuffixed int literal, exactly representable as float (|v| <= 2^24) so a
// float-typed key set accepts it in braces.
bool is_plain_int_literal(const std::string& text) {
    const auto value = parse_int_literal(text);
    return value && *value <= (std::int64_t{1} << 24);
}

// Unprefixed single-character literal: 'a', '\n', '\x41', '\0'
bool is_plain_char_literal(const std::string& text) {
    if (text.size() < 3 || text.front() != '\'' || text.back() != '\'') return false;
    const std::string body = text.substr(1, text.size() - 2);
    if (body[0] != '\\') return body.size() == 1;
    if (body.size() == 2) return true;
    return std::string("x01234567").find(body[1]) != std::string::npos &&
           body.find('\\', 1) == std::string::npos;
}

bool ends_operand(const Token* after) {
    if (after == nullptr) return false;
    return !is_one_of(*after, {"(", "[", ".", "->", "++", "--"}) &&
           after->kind != TokenKind::Identifier && after->kind != TokenKind::Number;
}

} // anonymous namespace

// ============================================================================
// Dead-code elimination
// ============================================================================

MergedUnit DeadCodeElimination::transform(MergedUnit unit, const PassContext& ctx) const {
    auto& decls = unit.declarations;
    std::vector<bool> alive(decls.size(), true);

    bool removed = true;
    while (removed) {
        ctx.deadline.check();
        removed = false;

        std::set<NodeId> referenced;
        for (std::size_t i = 0; i < decls.size(); ++i) {
            if (!alive[i]) continue;
            for (const auto& [identifier, node] : decls[i].references) {
                if (node != decls[i].node) referenced.insert(node);
            }
        }

        for (std::size_t i = 0; i < decls.size(); ++i) {
            if (alive[i] && !decls[i].exported && referenced.count(decls[i].node) == 0) {
                alive[i] = false;
                removed = true;
            }
        }
    }

    std::vector<MergedDeclaration> kept;
    for (std::size_t i = 0; i < decls.size(); ++i) {
        if (alive[i]) {
            kept.push_back(std::move(decls[i]));
        } else {
            AUTODEPLOY_LOG_INFO("dead declaration removed", {string_field("name", decls[i].name),
                                                            string_field("repository", decls[i].repository)});
        }
    }
    decls = std::move(kept);
    return unit;
}

// ============================================================================
// Expression simplification
// ============================================================================

std::string ExpressionSimplification::simplify(const std::string& text) {
    const auto tokens = tokenize(text);
    const auto sig = significant(tokens);
    std::vector<Edit> edits;

    std::size_t k = 1;
    while (k < sig.size()) {
        const Token& before = tokens[sig[k - 1]];
        if (!folds_before(before)) {
            ++k;
            continue;
        }

        // Extend over literals, operators and balanced parentheses.
        std::size_t j = k;
        int depth = 0;
        bool has_operator = false;
        std::size_t literals = 0;
        for (; j < sig.size(); ++j) {
            const Token& t = tokens[sig[j]];
            if (t.kind == TokenKind::Number) {
                ++literals;
            } else if (t.is_punct("(")) {
                ++depth;
            } else if (t.is_punct(")")) {
                if (depth == 0) break;
                --depth;
            } else if (is_fold_operator(t)) {
                has_operator = true;
            } else {
                break;
            }
        }

        // Comments or directives inside the span disqualify it.
        bool contiguous = j > k;
        for (std::size_t s = k; contiguous && s + 1 < j; ++s) {
            if (sig[s + 1] != sig[s] + 1) contiguous = false;
        }

        const bool bounded = j < sig.size() && depth == 0 && folds_after(tokens[sig[j]]);
        const bool single_literal = literals == 1 && j - k <= 2 &&
                                    (j - k == 1 || tokens[sig[k]].is_punct("-"));
        if (!contiguous || !bounded || !has_operator || single_literal) {
            ++k;
            continue;
        }

        auto value = evaluate_tokens(tokens, sig[k], sig[j - 1] + 1);
        if (!value) {
            ++k;
            continue;
        }

        Edit edit{tokens[sig[k]].offset, tokens[sig[j - 1]].end(), std::to_string(*value)};

        // (span) -> literal, when the parentheses only group
        const Token* open = &before;
        const Token* close = &tokens[sig[j]];
        const Token* outer_before = k >= 2 ? &tokens[sig[k - 2]] : nullptr;
        const Token* outer_after = j + 1 < sig.size() ? &tokens[sig[j + 1]] : nullptr;
        if (*value >= 0 && open->is_punct("(") && close->is_punct(")") &&
            is_grouping_open(outer_before) && ends_operand(outer_after) &&
            sig[k - 1] + 1 == sig[k] && sig[j - 1] + 1 == sig[j]) {
            edit.begin = open->offset;
            edit.end = close->end();
            if (!edits.empty() && edits.back().end > edit.begin) {
                ++k;
                continue;
            }
            edit.replacement = separated(text, edit.begin, std::move(edit.replacement));
            edits.push_back(edit);
            k = j + 1;
            continue;
        }

        edit.replacement = separated(text, edit.begin, std::move(edit.replacement));
        edits.push_back(edit);
        k = j;
    }

    return apply_edits(text, edits);
}

MergedUnit ExpressionSimplification::transform(MergedUnit unit, const PassContext& ctx) const {
    auto& decls = unit.declarations;
    parallel_for(decls.size(), ctx.workers, [&](std::size_t i) {
        ctx.deadline.check();
        decls[i].text = simplify(decls[i].text);
    });
    return unit;
}

// ============================================================================
// Data-structure substitution
// ============================================================================

std::string DataStructureSubstitution::substitute(const std::string& text, std::size_t min_terms,
                                                  bool& changed) {
    const auto tokens = tokenize(text);
    const auto sig = significant(tokens);
    std::vector<Edit> edits;
    changed = false;

    auto tok = [&](std::size_t k) -> const Token& { return tokens[sig[k]]; };

    std::size_t k = 1;
    while (k < sig.size()) {
        const Token& before = tok(k - 1);
        if (!(before.is_keyword("return") || is_one_of(before, {"(", "=", ","})) ||
            tok(k).kind != TokenKind::Identifier) {
            ++k;
            continue;
        }

        const std::string subject = tok(k).text;
        std::vector<std::string> literals;
        TokenKind literal_kind = TokenKind::Number;
        std::size_t j = k;
        bool valid = true;

        while (true) {
            if (j + 2 >= sig.size() || tok(j).kind != TokenKind::Identifier || tok(j).text != subject ||
                !tok(j + 1).is_punct("==")) {
                valid = false;
                break;
            }
            const Token& lit = tok(j + 2);
            const bool integer = lit.kind == TokenKind::Number && is_plain_int_literal(lit.text);
            const bool character = lit.kind == TokenKind::Char && is_plain_char_literal(lit.text);
            if (!integer && !character) {
                valid = false;
                break;
            }
            if (literals.empty()) {
                literal_kind = lit.kind;
            } else if (lit.kind != literal_kind) {
                valid = false;
                break;
            }
            literals.push_back(lit.text);
            j += 3;
            if (j < sig.size() && tok(j).is_punct("||")) {
                ++j;
                continue;
            }
            break;
        }

        const bool bounded = j < sig.size() && is_one_of(tok(j), {")", ";", ","});
        if (!valid || !bounded || literals.size() < min_terms) {
            ++k;
            continue;
        }

        // Keys use the type `==` compares in, so no subject value is narrowed.
        std::string replacement = "(std::set<std::common_type_t<decltype(" + subject + "), decltype(" +
                                  literals.front() + ")>>{";
        for (std::size_t i = 0; i < literals.size(); ++i) {
            if (i > 0) replacement += ", ";
            replacement += literals[i];
        }
        replacement += "}.count(" + subject + ") != 0)";

        edits.push_back(Edit{tok(k).offset, tok(j - 1).end(), replacement});
        changed = true;
        k = j;
    }

    return apply_edits(text, edits);
}

MergedUnit DataStructureSubstitution::transform(MergedUnit unit, const PassContext& ctx) const {
    auto& decls = unit.declarations;
    std::vector<char> changed(decls.size(), 0);

    parallel_for(decls.size(), ctx.workers, [&](std::size_t i) {
        ctx.deadline.check();
        bool fired = false;
        decls[i].text = substitute(decls[i].text, ctx.membership_min_terms, fired);
        changed[i] = fired ? 1 : 0;
    });

    if (std::any_of(changed.begin(), changed.end(), [](char c) { return c != 0; })) {
        for (const std::string header : {"<set>", "<type_traits>"}) {
            if (std::find(unit.required_includes.begin(), unit.required_includes.end(), header) ==
                unit.required_includes.end()) {
                unit.required_includes.push_back(header);
            }
            if (std::find(unit.includes.begin(), unit.includes.end(), header) == unit.includes.end()) {
                unit.includes.push_back(header);
            }
        }
    }
    return unit;
}

// ============================================================================
// Include consolidation
// ============================================================================

namespace {

bool names_merged_file(const std::string& include, const std::vector<std::string>& merged_files) {
    if (include.size() < 2 || include.front() != '"') return false;
    const std::string name = include.substr(1, include.size() - 2);
    for (const auto& path : merged_files) {
        if (path == name) return true;
        if (path.size() > name.size() && path.compare(path.size() - name.size(), name.size(), name) == 0 &&
            path[path.size() - name.size() - 1] == '/') {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

MergedUnit IncludeConsolidation::transform(MergedUnit unit, const PassContext& ctx) const {
    ctx.deadline.check();

    std::set<std::string> system;
    std::set<std::string> quoted;
    auto add = [&](const std::string& inc) {
        if (inc.empty()) return;
        if (inc.front() == '<') {
            system.insert(inc);
        } else if (!names_merged_file(inc, unit.merged_files)) {
            quoted.insert(inc);
        }
    };

    for (const auto& d : unit.declarations) {
        for (const auto& inc : d.includes) add(inc);
    }
    for (const auto& inc : unit.required_includes) add(inc);

    unit.includes.assign(system.begin(), system.end());
    unit.includes.insert(unit.includes.end(), quoted.begin(), quoted.end());
    return unit;
}

// ============================================================================
// Pipeline
// ============================================================================

namespace {

std::vector<std::unique_ptr<Pass>> standard_passes() {
    std::vector<std::unique_ptr<Pass>> passes;
    passes.push_back(std::make_unique<DeadCodeElimination>());
    passes.push_back(std::make_unique<ExpressionSimplification>());
    passes.push_back(std::make_unique<DataStructureSubstitution>());
    passes.push_back(std::make_unique<IncludeConsolidation>());
    return passes;
}

} // anonymous namespace

OptimizationPipeline::OptimizationPipeline(PipelineOptions options)
    : OptimizationPipeline(std::move(options), standard_passes()) {}

OptimizationPipeline::OptimizationPipeline(PipelineOptions options,
                                           std::vector<std::unique_ptr<Pass>> passes)
    : options_(std::move(options)), passes_(std::move(passes)) {}

bool OptimizationPipeline::enabled(PassId id) const {
    return std::find(options_.enabled.begin(), options_.enabled.end(), id) != options_.enabled.end();
}

MergedUnit OptimizationPipeline::run(MergedUnit unit) const {
    for (const auto& pass : passes_) {
        const char* name = pass_name(pass->id());
        if (!enabled(pass->id())) {
            AUTODEPLOY_LOG_INFO("optimization pass skipped", {string_field("pass", name)});
            continue;
        }

        Deadline deadline(name, options_.budget);
        PassContext ctx{deadline, options_.workers, options_.membership_min_terms};

        const std::size_t before = unit.declarations.size();
        unit = pass->transform(std::move(unit), ctx);
        deadline.check();

        AUTODEPLOY_LOG_INFO("optimization pass finished",
                            {string_field("pass", name),
                             int_field("declarations_before", static_cast<std::int64_t>(before)),
                             int_field("declarations_after",
                                       static_cast<std::int64_t>(unit.declarations.size()))});
    }
    return unit;
}

} // namespace autodeploy

/**
 * @file Expression.cpp
 * @brief Recursive-descent evaluator over lexer tokens
 */

#include "autodeploy/Expression.hpp"
#include "autodeploy/Errors.hpp"

#include <cctype>
#include <limits>

namespace autodeploy {

namespace {

constexpr std::int64_t kMin = std::numeric_limits<std::int32_t>::min();
constexpr std::int64_t kMax = std::numeric_limits<std::int32_t>::max();

using Result = std::optional<std::int64_t>;

Result checked(std::int64_t v) {
    if (v < kMin || v > kMax) return std::nullopt;
    return v;
}

class Evaluator {
public:
    Evaluator(const std::vector<Token>& tokens, std::size_t begin, std::size_t end,
              const Bindings& bindings)
        : bindings_(bindings) {
        for (std::size_t i = begin; i < end && i < tokens.size(); ++i) {
            if (is_significant(tokens[i])) toks_.push_back(&tokens[i]);
        }
    }

    Result run() {
        if (toks_.empty()) return std::nullopt;
        Result r = logical_or();
        if (!r || pos_ != toks_.size()) return std::nullopt;
        return r;
    }

private:
    std::vector<const Token*> toks_;
    std::size_t pos_ = 0;
    const Bindings& bindings_;

    bool accept(const char* op) {
        if (pos_ < toks_.size() && toks_[pos_]->is_punct(op)) {
            ++pos_;
            return true;
        }
        return false;
    }

    Result logical_or() {
        Result l = logical_and();
        while (l && accept("||")) {
            Result r = logical_and();
            if (!r) return std::nullopt;
            l = (*l != 0 || *r != 0) ? 1 : 0;
        }
        return l;
    }

    Result logical_and() {
        Result l = bit_or();
        while (l && accept("&&")) {
            Result r = bit_or();
            if (!r) return std::nullopt;
            l = (*l != 0 && *r != 0) ? 1 : 0;
        }
        return l;
    }

    Result bit_or() {
        Result l = bit_xor();
        while (l && accept("|")) {
            Result r = bit_xor();
            if (!r) return std::nullopt;
            l = *l | *r;
        }
        return l;
    }

    Result bit_xor() {
        Result l = bit_and();
        while (l && accept("^")) {
            Result r = bit_and();
            if (!r) return std::nullopt;
            l = *l ^ *r;
        }
        return l;
    }

    Result bit_and() {
        Result l = equality();
        while (l && accept("&")) {
            Result r = equality();
            if (!r) return std::nullopt;
            l = *l & *r;
        }
        return l;
    }

    Result equality() {
        Result l = relational();
        while (l) {
            if (accept("==")) {
                Result r = relational();
                if (!r) return std::nullopt;
                l = *l == *r ? 1 : 0;
            } else if (accept("!=")) {
                Result r = relational();
                if (!r) return std::nullopt;
                l = *l != *r ? 1 : 0;
            } else {
                break;
            }
        }
        return l;
    }

    Result relational() {
        Result l = shift();
        while (l) {
            const char* op = nullptr;
            for (const char* candidate : {"<=", ">=", "<", ">"}) {
                if (accept(candidate)) {
                    op = candidate;
                    break;
                }
            }
            if (op == nullptr) break;
            Result r = shift();
            if (!r) return std::nullopt;
            const std::string o(op);
            bool v = o == "<=" ? *l <= *r : o == ">=" ? *l >= *r : o == "<" ? *l < *r : *l > *r;
            l = v ? 1 : 0;
        }
        return l;
    }

    Result shift() {
        Result l = additive();
        while (l) {
            bool left = accept("<<");
            if (!left && !accept(">>")) break;
            Result r = additive();
            if (!r || *r < 0 || *r > 31 || *l < 0) return std::nullopt;
            l = checked(left ? (*l << *r) : (*l >> *r));
        }
        return l;
    }

    Result additive() {
        Result l = multiplicative();
        while (l) {
            bool plus = accept("+");
            if (!plus && !accept("-")) break;
            Result r = multiplicative();
            if (!r) return std::nullopt;
            l = checked(plus ? *l + *r : *l - *r);
        }
        return l;
    }

    Result multiplicative() {
        Result l = unary();
        while (l) {
            if (accept("*")) {
                Result r = unary();
                if (!r) return std::nullopt;
                l = checked(*l * *r);
            } else if (accept("/") || accept("%")) {
                const bool div = toks_[pos_ - 1]->text == "/";
                Result r = unary();
                if (!r || *r == 0) return std::nullopt;
                l = checked(div ? *l / *r : *l % *r);
            } else {
                break;
            }
        }
        return l;
    }

    Result unary() {
        if (accept("-")) {
            Result v = unary();
            return v ? checked(-*v) : std::nullopt;
        }
        if (accept("+")) {
            return unary();
        }
        if (accept("~")) {
            Result v = unary();
            return v ? checked(~*v) : std::nullopt;
        }
        if (accept("!")) {
            Result v = unary();
            return v ? Result(*v == 0 ? 1 : 0) : std::nullopt;
        }
        return primary();
    }

    Result primary() {
        if (pos_ >= toks_.size()) return std::nullopt;
        const Token& t = *toks_[pos_];

        if (t.is_punct("(")) {
            ++pos_;
            Result v = logical_or();
            if (!v || !accept(")")) return std::nullopt;
            return v;
        }
        if (t.kind == TokenKind::Number) {
            ++pos_;
            return parse_int_literal(t.text);
        }
        if (t.kind == TokenKind::Identifier) {
            ++pos_;
            auto it = bindings_.find(t.text);
            if (it == bindings_.end()) return std::nullopt;
            return checked(it->second);
        }
        return std::nullopt;
    }
};

} // anonymous namespace

std::optional<std::int64_t> parse_int_literal(const std::string& text) {
    std::string digits;
    for (char c : text) {
        if (c != '\'') digits += c;
    }
    if (digits.empty()) return std::nullopt;

    int base = 10;
    std::size_t i = 0;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        base = 16;
        i = 2;
    } else if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'b' || digits[1] == 'B')) {
        base = 2;
        i = 2;
    } else if (digits.size() > 1 && digits[0] == '0') {
        base = 8;
        i = 1;
    }

    std::int64_t value = 0;
    for (; i < digits.size(); ++i) {
        const char c = digits[i];
        int d;
        if (std::isdigit(static_cast<unsigned char>(c))) {
            d = c - '0';
        } else if (base == 16 && std::isxdigit(static_cast<unsigned char>(c))) {
            d = std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        } else {
            return std::nullopt; // suffix, exponent or fraction
        }
        if (d >= base) return std::nullopt;
        value = value * base + d;
        if (value > kMax) return std::nullopt;
    }
    return value;
}

std::optional<std::int64_t> evaluate_tokens(const std::vector<Token>& tokens, std::size_t begin,
                                            std::size_t end, const Bindings& bindings) {
    return Evaluator(tokens, begin, end, bindings).run();
}

std::optional<std::int64_t> evaluate(const std::string& expression, const Bindings& bindings) {
    try {
        const auto tokens = tokenize(expression);
        return evaluate_tokens(tokens, 0, tokens.size(), bindings);
    } catch (const ParseError&) {
        return std::nullopt;
    }
}

} // namespace autodeploy

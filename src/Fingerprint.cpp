/**
 * @file Fingerprint.cpp
 * @brief Normalization, digests and token edit distance
 */

#include "autodeploy/Fingerprint.hpp"

#include <algorithm>
#include <array>
#include <unordered_map>

namespace autodeploy {

namespace {

constexpr std::uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;
constexpr std::size_t kShingle = 3;

std::string join(const std::vector<std::string>& tokens, std::size_t from, std::size_t to) {
    std::string out;
    for (std::size_t i = from; i < to; ++i) {
        if (i > from) out += ' ';
        out += tokens[i];
    }
    return out;
}

} // anonymous namespace

std::uint64_t fnv1a64(const std::string& data) {
    std::uint64_t hash = kFnvOffset;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    return hash;
}

std::string to_hex(std::uint64_t value) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = kHex[value & 0xF];
        value >>= 4;
    }
    return out;
}

std::vector<std::string> normalize(const std::vector<Token>& tokens) {
    std::vector<std::string> out;
    std::unordered_map<std::string, std::size_t> placeholders;

    for (const auto& t : tokens) {
        if (!is_significant(t)) continue;
        if (t.kind == TokenKind::Identifier) {
            auto it = placeholders.emplace(t.text, placeholders.size()).first;
            out.push_back("$" + std::to_string(it->second));
        } else {
            out.push_back(t.text);
        }
    }
    return out;
}

std::uint64_t simhash64(const std::vector<std::string>& normalized) {
    if (normalized.empty()) {
        return 0;
    }

    std::array<long, 64> weights{};
    auto accumulate = [&](std::uint64_t h) {
        for (std::size_t bit = 0; bit < 64; ++bit) {
            weights[bit] += ((h >> bit) & 1U) ? 1 : -1;
        }
    };

    if (normalized.size() < kShingle) {
        accumulate(fnv1a64(join(normalized, 0, normalized.size())));
    } else {
        for (std::size_t i = 0; i + kShingle <= normalized.size(); ++i) {
            accumulate(fnv1a64(join(normalized, i, i + kShingle)));
        }
    }

    std::uint64_t result = 0;
    for (std::size_t bit = 0; bit < 64; ++bit) {
        if (weights[bit] > 0) {
            result |= (std::uint64_t{1} << bit);
        }
    }
    return result;
}

Fingerprint fingerprint_tokens(std::vector<std::string> normalized) {
    Fingerprint fp;
    fp.digest = fnv1a64(join(normalized, 0, normalized.size()));
    fp.simhash = simhash64(normalized);
    fp.normalized = std::move(normalized);
    return fp;
}

Fingerprint fingerprint(const Declaration& declaration) {
    return fingerprint_tokens(normalize(tokenize(declaration.text)));
}

std::size_t token_edit_distance(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    if (a.empty()) return b.size();
    if (b.empty()) return a.size();

    std::vector<std::size_t> prev(b.size() + 1);
    std::vector<std::size_t> curr(b.size() + 1);
    for (std::size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (std::size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

double normalized_distance(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    const std::size_t longest = std::max(a.size(), b.size());
    if (longest == 0) {
        return 0.0;
    }
    return static_cast<double>(token_edit_distance(a, b)) / static_cast<double>(longest);
}

} // namespace autodeploy

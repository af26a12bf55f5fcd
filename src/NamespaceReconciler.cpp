/**
 * @file NamespaceReconciler.cpp
 * @brief Collision renaming and reference rewriting
 */

#include "autodeploy/NamespaceReconciler.hpp"
#include "autodeploy/Errors.hpp"
#include "autodeploy/Lexer.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace autodeploy {

std::string sanitize_identifier(const std::string& text) {
    std::string out = text;
    for (char& c : out) {
        if (!std::isalnum(static_cast<unsigned char>(c))) c = '_';
    }
    return out;
}

std::string rewrite_identifiers(const std::string& text,
                                const std::map<std::string, std::string>& renames) {
    if (renames.empty()) {
        return text;
    }

    const auto tokens = tokenize(text);
    std::string out;
    out.reserve(text.size());
    std::size_t copied = 0;
    const Token* prev = nullptr;
    const Token* prev2 = nullptr;

    for (const auto& t : tokens) {
        if (!is_significant(t)) continue;

        if (t.kind == TokenKind::Identifier) {
            auto it = renames.find(t.text);
            bool member = prev && (prev->is_punct(".") || prev->is_punct("->"));
            bool qualified = prev && prev->is_punct("::") && prev2 &&
                             (prev2->kind == TokenKind::Identifier || prev2->is_punct(">"));
            if (it != renames.end() && !member && !qualified) {
                out.append(text, copied, t.offset - copied);
                out += it->second;
                copied = t.end();
            }
        }
        prev2 = prev;
        prev = &t;
    }
    out.append(text, copied, std::string::npos);
    return out;
}

std::vector<Rename> NamespaceReconciler::reconcile(MergedUnit& unit) const {
    auto& decls = unit.declarations;

    std::map<std::string, std::vector<std::size_t>> by_name;
    std::set<std::string> taken;
    for (std::size_t i = 0; i < decls.size(); ++i) {
        by_name[decls[i].name].push_back(i);
        taken.insert(decls[i].name);
    }

    std::vector<Rename> renames;
    for (auto& [name, members] : by_name) {
        if (members.size() < 2) continue;
        std::sort(members.begin(), members.end(), [&](std::size_t a, std::size_t b) {
            return decls[a].priority < decls[b].priority;
        });

        for (std::size_t k = 1; k < members.size(); ++k) {
            MergedDeclaration& d = decls[members[k]];
            const std::string base = name + "_" + sanitize_identifier(d.repository);
            std::string candidate = base;
            for (int suffix = 2; taken.count(candidate) > 0; ++suffix) {
                candidate = base + "_" + std::to_string(suffix);
            }
            taken.insert(candidate);
            renames.push_back(Rename{d.node, d.repository, d.name, candidate});
            d.name = candidate;
        }
    }

    std::map<NodeId, std::string> final_name;
    for (const auto& d : decls) {
        final_name[d.node] = d.name;
    }

    for (auto& d : decls) {
        std::map<std::string, std::string> rewrite;
        std::map<std::string, NodeId> updated;
        for (const auto& [identifier, node] : d.references) {
            auto it = final_name.find(node);
            if (it == final_name.end()) {
                updated[identifier] = node;
                continue;
            }
            if (it->second != identifier) {
                rewrite[identifier] = it->second;
            }
            updated[it->second] = node;
        }
        d.text = rewrite_identifiers(d.text, rewrite);
        d.references = std::move(updated);
    }
    return renames;
}

void NamespaceReconciler::verify(const MergedUnit& unit) const {
    std::map<std::string, std::size_t> names;
    std::map<NodeId, std::size_t> nodes;
    for (std::size_t i = 0; i < unit.declarations.size(); ++i) {
        const auto& d = unit.declarations[i];
        if (!names.emplace(d.name, i).second) {
            throw UnresolvedReference(d.name, d.name, "name is declared more than once");
        }
        nodes.emplace(d.node, i);
    }

    for (const auto& d : unit.declarations) {
        for (const auto& [identifier, node] : d.references) {
            auto target = nodes.find(node);
            if (target == nodes.end()) {
                throw UnresolvedReference(d.name, identifier, "target declaration is not in the merged unit");
            }
            if (unit.declarations[target->second].name != identifier) {
                throw UnresolvedReference(d.name, identifier,
                                          "target is emitted as '" +
                                              unit.declarations[target->second].name + "'");
            }
        }
    }
}

} // namespace autodeploy

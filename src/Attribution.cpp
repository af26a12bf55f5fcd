/**
 * @file Attribution.cpp
 * @brief Attribution block rendering
 */

#include "autodeploy/Attribution.hpp"

#include <algorithm>
#include <cstdio>
#include <map>
#include <set>
#include <sstream>

namespace autodeploy {

namespace {

// Keep arbitrary license text from closing the comment early.
std::string comment_safe(std::string text) {
    std::size_t pos = 0;
    while ((pos = text.find("*/", pos)) != std::string::npos) {
        text.replace(pos, 2, "* /");
        pos += 3;
    }
    return text;
}

std::string format_confidence(double confidence) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", confidence);
    return buf;
}

} // anonymous namespace

std::vector<Contribution> AttributionAnnotator::contributions(const CanonicalDeclaration& canonical) const {
    std::map<RepoId, std::set<std::string>> paths;
    for (DeclId member : canonical.subsumed) {
        const SourceUnit& unit = corpus_.unit_of(member);
        paths[unit.repository].insert(unit.path);
    }

    std::vector<Contribution> out;
    for (const auto& [repo_id, repo_paths] : paths) {
        const Repository& repo = corpus_.repository(repo_id);
        out.push_back(Contribution{repo.id, repo.trust_rank, repo.license.identifier,
                                   {repo_paths.begin(), repo_paths.end()}});
    }
    std::sort(out.begin(), out.end(), [](const Contribution& a, const Contribution& b) {
        if (a.trust_rank != b.trust_rank) return a.trust_rank > b.trust_rank;
        return a.repository < b.repository;
    });
    return out;
}

std::string AttributionAnnotator::block(const CanonicalDeclaration& canonical,
                                        const std::string& emitted_name) const {
    const Declaration& decl = corpus_.declaration(canonical.declaration);
    const auto contribs = contributions(canonical);

    std::ostringstream out;
    out << "/*\n";
    out << " * " << emitted_name;
    if (emitted_name != decl.name) {
        out << " (originally " << decl.name << ")";
    }
    out << "\n";
    if (!canonical.exact) {
        out << " * Merged from near duplicates, confidence " << format_confidence(canonical.confidence) << "\n";
    }

    out << " * Origins:\n";
    for (const auto& c : contribs) {
        out << " *  - " << c.repository << " (" << c.license << "):";
        for (std::size_t i = 0; i < c.paths.size(); ++i) {
            out << (i == 0 ? " " : ", ") << c.paths[i];
        }
        out << "\n";
    }

    if (!canonical.rejected_near_matches.empty()) {
        out << " * Unmerged near matches (review manually):\n";
        for (const auto& near : canonical.rejected_near_matches) {
            out << " *  - " << corpus_.describe(near.declaration)
                << " (confidence " << format_confidence(near.confidence) << ")\n";
        }
    }

    if (include_license_text_) {
        std::set<std::string> seen;
        for (const auto& c : contribs) {
            if (!seen.insert(c.license).second) continue;
            const std::string text = policy_.text(c.license);
            if (text.empty()) continue;
            out << " *\n * " << c.license << ":\n";
            std::istringstream lines(comment_safe(text));
            std::string line;
            while (std::getline(lines, line)) {
                out << " *   " << line << "\n";
            }
        }
    }

    out << " */";
    return out.str();
}

std::string AttributionAnnotator::annotate(const CanonicalDeclaration& canonical) const {
    const Declaration& decl = corpus_.declaration(canonical.declaration);
    return block(canonical, decl.name) + "\n" + decl.text;
}

void AttributionAnnotator::attach(MergedDeclaration& merged, const CanonicalDeclaration& canonical) const {
    merged.subsumed.clear();
    for (DeclId member : canonical.subsumed) {
        merged.subsumed.push_back(corpus_.origin(member));
    }
    merged.rejected_near_matches.clear();
    for (const auto& near : canonical.rejected_near_matches) {
        merged.rejected_near_matches.push_back(RejectedOrigin{corpus_.origin(near.declaration), near.confidence});
    }
    merged.attribution = block(canonical, merged.name);
}

} // namespace autodeploy

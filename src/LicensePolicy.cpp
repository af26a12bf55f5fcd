/**
 * @file LicensePolicy.cpp
 * @brief License table lookups and license resolvers
 */

#include "autodeploy/LicensePolicy.hpp"
#include "autodeploy/Errors.hpp"
#include "autodeploy/Loader.hpp"

#include <filesystem>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace autodeploy {

namespace {

constexpr const char* kUnknownLicense = "UNKNOWN";
constexpr std::size_t kSniffLines = 20;

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n*/#");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n*/");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

void LicensePolicy::set(const std::string& id, LicenseTerms terms) {
    table_[id] = std::move(terms);
}

bool LicensePolicy::known(const std::string& id) const {
    return table_.count(id) > 0;
}

const LicenseTerms* LicensePolicy::find(const std::string& id) const {
    auto it = table_.find(id);
    return it == table_.end() ? nullptr : &it->second;
}

int LicensePolicy::permissiveness(const std::string& id) const {
    const LicenseTerms* terms = find(id);
    return terms ? terms->permissiveness : kUnknownPermissiveness;
}

bool LicensePolicy::combinable(const std::string& a, const std::string& b) const {
    if (a == b) {
        return true;
    }
    const LicenseTerms* ta = find(a);
    const LicenseTerms* tb = find(b);
    if (ta == nullptr || tb == nullptr) {
        return false;
    }
    return ta->combinable_with.count(b) > 0 || tb->combinable_with.count(a) > 0;
}

std::string LicensePolicy::text(const std::string& id) const {
    const LicenseTerms* terms = find(id);
    return terms ? terms->text : std::string();
}

LicensePolicy LicensePolicy::from_json(const Value& licenses) {
    LicensePolicy policy;
    if (licenses.is_null()) {
        return policy;
    }
    if (!licenses.is_object()) {
        throw TypeError("licenses", "object", type_name(licenses));
    }

    for (auto it = licenses.begin(); it != licenses.end(); ++it) {
        const std::string base = "licenses." + it.key();
        const Value& entry = it.value();
        if (!entry.is_object()) {
            throw TypeError(base, "object", type_name(entry));
        }

        LicenseTerms terms;
        if (auto p = entry.find("permissiveness"); p != entry.end()) {
            if (!p->is_number_integer()) {
                throw TypeError(base + ".permissiveness", "integer", type_name(*p));
            }
            terms.permissiveness = p->get<int>();
        }
        if (auto c = entry.find("combinable_with"); c != entry.end()) {
            if (!c->is_array()) {
                throw TypeError(base + ".combinable_with", "array", type_name(*c));
            }
            for (const auto& other : *c) {
                if (!other.is_string()) {
                    throw TypeError(base + ".combinable_with", "array of strings", type_name(other));
                }
                terms.combinable_with.insert(other.get<std::string>());
            }
        }
        if (auto t = entry.find("text"); t != entry.end()) {
            if (!t->is_string()) {
                throw TypeError(base + ".text", "string", type_name(*t));
            }
            terms.text = t->get<std::string>();
        }
        policy.set(it.key(), std::move(terms));
    }
    return policy;
}

LicenseInfo PolicyLicenseResolver::resolve(const RepositoryDescriptor& repo) const {
    LicenseInfo info;
    info.identifier = repo.license.empty() ? kUnknownLicense : repo.license;
    info.text = policy_.text(info.identifier);
    return info;
}

std::string LicenseFileResolver::identify(const std::string& content) const {
    std::istringstream in(content);
    std::string line;
    std::vector<std::string> head;
    while (head.size() < kSniffLines && std::getline(in, line)) {
        head.push_back(line);
    }

    static const std::string kSpdx = "SPDX-License-Identifier:";
    for (const auto& l : head) {
        auto pos = l.find(kSpdx);
        if (pos != std::string::npos) {
            return trim(l.substr(pos + kSpdx.size()));
        }
    }

    // Longest identifier first so "GPL-3.0-or-later" wins over "GPL-3.0".
    std::string best;
    for (const auto& l : head) {
        for (const auto& [id, terms] : policy_.entries()) {
            if (id.size() > best.size() && l.find(id) != std::string::npos) {
                best = id;
            }
        }
    }
    return best;
}

LicenseInfo LicenseFileResolver::resolve(const RepositoryDescriptor& repo) const {
    static const char* const kCandidates[] = {"LICENSE", "LICENSE.txt", "LICENSE.md", "COPYING"};

    for (const char* name : kCandidates) {
        const fs::path file = fs::path(repo.path) / name;
        std::error_code ec;
        if (!fs::is_regular_file(file, ec)) continue;

        std::string id = identify(read_text_file(file.string()));
        if (!id.empty()) {
            return LicenseInfo{id, policy_.text(id)};
        }
    }
    return PolicyLicenseResolver(policy_).resolve(repo);
}

} // namespace autodeploy

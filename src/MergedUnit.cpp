/**
 * @file MergedUnit.cpp
 * @brief Merged Unit lookup and serialization
 */

#include "autodeploy/MergedUnit.hpp"

#include <sstream>

namespace autodeploy {

namespace {

constexpr const char* kHeader =
    "// Generated by autodeploy. Do not edit.\n"
    "// Each declaration below carries the attribution of every repository it was merged from.\n";

Value origin_json(const Origin& o) {
    return Value{{"repository", o.repository}, {"path", o.path}, {"name", o.name}};
}

} // anonymous namespace

std::size_t MergedUnit::find(NodeId node) const {
    for (std::size_t i = 0; i < declarations.size(); ++i) {
        if (declarations[i].node == node) return i;
    }
    return kNoId;
}

std::size_t MergedUnit::find(const std::string& name) const {
    for (std::size_t i = 0; i < declarations.size(); ++i) {
        if (declarations[i].name == name) return i;
    }
    return kNoId;
}

std::string MergedUnit::serialize() const {
    std::ostringstream out;
    out << kHeader;

    if (!includes.empty()) {
        out << '\n';
        for (const auto& inc : includes) {
            out << "#include " << inc << '\n';
        }
    }

    for (const auto& decl : declarations) {
        out << '\n';
        if (!decl.attribution.empty()) {
            out << decl.attribution << '\n';
        }
        out << decl.text << '\n';
    }
    return out.str();
}

Value MergedUnit::to_json() const {
    Value decls = Value::array();
    for (const auto& d : declarations) {
        Value subsumed = Value::array();
        for (const auto& o : d.subsumed) {
            subsumed.push_back(origin_json(o));
        }
        Value rejected = Value::array();
        for (const auto& r : d.rejected_near_matches) {
            rejected.push_back({{"origin", origin_json(r.origin)}, {"confidence", r.confidence}});
        }
        decls.push_back({
            {"name", d.name},
            {"original_name", d.original_name},
            {"kind", to_string(d.kind)},
            {"repository", d.repository},
            {"path", d.source_path},
            {"exported", d.exported},
            {"confidence", d.confidence},
            {"exact", d.exact},
            {"subsumed", subsumed},
            {"rejected_near_matches", rejected},
            {"attribution", d.attribution},
            {"text", d.text}
        });
    }
    return Value{{"includes", includes}, {"declarations", decls}};
}

} // namespace autodeploy

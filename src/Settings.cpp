/**
 * @file Settings.cpp
 * @brief Settings layering and typed views
 */

#include "autodeploy/Settings.hpp"
#include "autodeploy/DotPath.hpp"
#include "autodeploy/Environment.hpp"
#include "autodeploy/Loader.hpp"
#include "autodeploy/Merge.hpp"

#include <set>

namespace autodeploy {

Value default_settings() {
    Value passes = Value::array();
    for (PassId id : all_passes()) {
        passes.push_back(pass_name(id));
    }

    const EngineConfig defaults;
    const LoggingSettings log_defaults;
    return Value{
        {"engine", {
            {"near_duplicate_threshold", defaults.near_duplicate_threshold},
            {"auto_merge_confidence_floor", defaults.auto_merge_confidence_floor},
            {"enabled_optimization_passes", passes},
            {"pass_timeout_seconds", defaults.pass_timeout_seconds},
            {"worker_threads", defaults.worker_threads},
            {"allow_incompatible_cycles", defaults.allow_incompatible_cycles},
            {"export_roots", Value::array()},
            {"membership_min_terms", defaults.membership_min_terms},
            {"include_license_text", defaults.include_license_text},
            {"source_extensions", defaults.source_extensions}
        }},
        {"licenses", Value::object()},
        {"repositories", Value::array()},
        {"logging", {
            {"level", log_defaults.level},
            {"pattern", log_defaults.pattern}
        }}
    };
}

Settings Settings::load(const LoadOptions& opts) {
    const Value defaults = default_settings();
    std::vector<Value> layers = {defaults};

    if (opts.file_path.has_value()) {
        layers.push_back(load_config_file(*opts.file_path));
    }

    if (opts.env_prefix.has_value() && !opts.env_prefix->empty()) {
        layers.push_back(env_overrides(collect_env_vars(*opts.env_prefix), *opts.env_prefix,
                                       flatten_keys(defaults)));
    }

    Settings settings(deep_merge_all(layers));
    for (const auto& [key, value] : opts.overrides) {
        settings.set(key, value);
    }
    return settings;
}

const Value& Settings::at(const std::string& path) const {
    return *get_by_dot(data_, path);
}

bool Settings::contains(const std::string& path) const {
    return contains_dot(data_, path);
}

void Settings::set(const std::string& path, const Value& value) {
    set_by_dot(data_, path, value);
}

std::string Settings::to_json_string(int indent) const {
    return data_.dump(indent);
}

namespace {

double number_at(const Settings& s, const std::string& path, double fallback) {
    if (!s.contains(path)) return fallback;
    const Value& v = s.at(path);
    if (!v.is_number()) throw TypeError(path, "number", type_name(v));
    return v.get<double>();
}

long long integer_at(const Settings& s, const std::string& path, long long fallback) {
    if (!s.contains(path)) return fallback;
    const Value& v = s.at(path);
    if (!v.is_number_integer()) throw TypeError(path, "integer", type_name(v));
    return v.get<long long>();
}

bool boolean_at(const Settings& s, const std::string& path, bool fallback) {
    if (!s.contains(path)) return fallback;
    const Value& v = s.at(path);
    if (!v.is_boolean()) throw TypeError(path, "boolean", type_name(v));
    return v.get<bool>();
}

std::vector<std::string> strings_at(const Settings& s, const std::string& path,
                                    const std::vector<std::string>& fallback) {
    if (!s.contains(path)) return fallback;
    const Value& v = s.at(path);
    if (!v.is_array()) throw TypeError(path, "array", type_name(v));
    std::vector<std::string> out;
    for (const auto& item : v) {
        if (!item.is_string()) throw TypeError(path, "array of strings", type_name(item));
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::string string_at(const Settings& s, const std::string& path, const std::string& fallback) {
    if (!s.contains(path)) return fallback;
    const Value& v = s.at(path);
    if (!v.is_string()) throw TypeError(path, "string", type_name(v));
    return v.get<std::string>();
}

} // anonymous namespace

EngineConfig Settings::engine_config() const {
    EngineConfig config;
    config.near_duplicate_threshold =
        number_at(*this, "engine.near_duplicate_threshold", config.near_duplicate_threshold);
    config.auto_merge_confidence_floor =
        number_at(*this, "engine.auto_merge_confidence_floor", config.auto_merge_confidence_floor);

    if (contains("engine.enabled_optimization_passes")) {
        config.enabled_passes.clear();
        for (const auto& name : strings_at(*this, "engine.enabled_optimization_passes", {})) {
            auto id = pass_from_name(name);
            if (!id) {
                throw ConfigError("engine.enabled_optimization_passes: unknown pass '" + name + "'");
            }
            config.enabled_passes.push_back(*id);
        }
    }

    const long long timeout = integer_at(*this, "engine.pass_timeout_seconds", config.pass_timeout_seconds);
    if (timeout <= 0 || timeout > 86400) {
        throw ConfigError("engine.pass_timeout_seconds must be within 1..86400");
    }
    config.pass_timeout_seconds = static_cast<int>(timeout);

    const long long workers = integer_at(*this, "engine.worker_threads", config.worker_threads);
    if (workers < 0 || workers > 1024) {
        throw ConfigError("engine.worker_threads must be within 0..1024");
    }
    config.worker_threads = static_cast<int>(workers);

    config.allow_incompatible_cycles =
        boolean_at(*this, "engine.allow_incompatible_cycles", config.allow_incompatible_cycles);
    config.export_roots = strings_at(*this, "engine.export_roots", config.export_roots);

    const long long terms = integer_at(*this, "engine.membership_min_terms",
                                       static_cast<long long>(config.membership_min_terms));
    if (terms < 2) {
        throw ConfigError("engine.membership_min_terms must be at least 2");
    }
    config.membership_min_terms = static_cast<std::size_t>(terms);

    config.include_license_text =
        boolean_at(*this, "engine.include_license_text", config.include_license_text);
    config.source_extensions = strings_at(*this, "engine.source_extensions", config.source_extensions);
    config.policy = license_policy();

    config.validate();
    return config;
}

std::vector<RepositoryDescriptor> Settings::repositories() const {
    std::vector<RepositoryDescriptor> out;
    if (!contains("repositories")) return out;

    const Value& list = at("repositories");
    if (!list.is_array()) throw TypeError("repositories", "array", type_name(list));

    std::set<std::string> ids;
    for (std::size_t i = 0; i < list.size(); ++i) {
        const std::string base = "repositories." + std::to_string(i);
        const Value& entry = list[i];
        if (!entry.is_object()) throw TypeError(base, "object", type_name(entry));

        RepositoryDescriptor d;
        d.path = string_at(*this, base + ".path", "");
        d.id = string_at(*this, base + ".id", "");
        d.trust_rank = static_cast<int>(integer_at(*this, base + ".trust_rank", 0));
        d.license = string_at(*this, base + ".license", "");

        if (d.path.empty()) throw ConfigError(base + ".path is required");
        if (d.id.empty()) throw ConfigError(base + ".id is required");
        if (!ids.insert(d.id).second) {
            throw ConfigError(base + ".id: duplicate repository identifier '" + d.id + "'");
        }
        out.push_back(std::move(d));
    }
    return out;
}

LicensePolicy Settings::license_policy() const {
    if (!contains("licenses")) return LicensePolicy();
    return LicensePolicy::from_json(at("licenses"));
}

LoggingSettings Settings::logging() const {
    LoggingSettings out;
    out.level = string_at(*this, "logging.level", out.level);
    out.pattern = string_at(*this, "logging.pattern", out.pattern);
    return out;
}

} // namespace autodeploy

/**
 * @file Settings.hpp
 * @brief Layered engine settings
 *
 * Precedence, lowest to highest:
 * 1. built-in defaults (default_settings())
 * 2. settings file (.json or .toml)
 * 3. AUTODEPLOY_* environment variables, restricted to known keys
 * 4. explicit `key:value` overrides
 *
 * Typed views (engine_config(), repositories(), license_policy(),
 * logging()) validate on access and name the offending key on error.
 */

#ifndef AUTODEPLOY_SETTINGS_HPP
#define AUTODEPLOY_SETTINGS_HPP

#include "autodeploy/Engine.hpp"
#include "autodeploy/Errors.hpp"
#include "autodeploy/LicensePolicy.hpp"
#include "autodeploy/Logging.hpp"
#include "autodeploy/Value.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace autodeploy {

/**
 * @brief Sources to layer over the defaults
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> env_prefix;           ///< usually kEnvPrefix; unset skips the layer
    std::map<std::string, Value> overrides;          ///< final precedence
};

/// The full default settings tree
Value default_settings();

class Settings {
public:
    Settings() : data_(default_settings()) {}
    explicit Settings(Value data) : data_(std::move(data)) {}

    /**
     * @brief Load using defaults -> file -> environment -> overrides
     * @throws FileNotFoundError, ConfigParseError, ConfigError
     */
    static Settings load(const LoadOptions& opts);

    const Value& data() const noexcept { return data_; }

    /// @throws KeyError, TypeError
    const Value& at(const std::string& path) const;
    bool contains(const std::string& path) const;
    void set(const std::string& path, const Value& value);

    /**
     * @brief Typed value at a dot-path, `fallback` if missing
     * @throws TypeError if the value has a different type
     */
    template <typename T>
    T get(const std::string& path, const T& fallback) const {
        if (!contains(path)) return fallback;
        const Value& v = at(path);
        try {
            return v.get<T>();
        } catch (const nlohmann::json::type_error&) {
            throw TypeError(path, "requested type", type_name(v));
        }
    }

    std::string to_json_string(int indent = 2) const;

    /// @throws ConfigError naming the offending `engine.*` or `licenses.*` key
    EngineConfig engine_config() const;

    /// @throws ConfigError on a malformed entry or a duplicate identifier
    std::vector<RepositoryDescriptor> repositories() const;

    /// @throws TypeError on a malformed `licenses` table
    LicensePolicy license_policy() const;

    LoggingSettings logging() const;

private:
    Value data_;
};

} // namespace autodeploy

#endif // AUTODEPLOY_SETTINGS_HPP

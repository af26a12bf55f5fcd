/**
 * @file Loader.hpp
 * @brief Settings and source file loading
 *
 * - JSON settings files (nlohmann::json)
 * - TOML settings files (toml++), tables mapped to nested objects
 * - Raw text files for repository ingestion
 */

#ifndef AUTODEPLOY_LOADER_HPP
#define AUTODEPLOY_LOADER_HPP

#include "autodeploy/Value.hpp"

#include <string>

namespace autodeploy {

/**
 * @brief Load a JSON settings file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError with line and column on a syntax error
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML settings file
 *
 * Dates and times are converted to their TOML string form.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError with line and column on a syntax error
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a settings file, choosing the format by extension
 *
 * An empty path loads nothing and yields an empty object.
 *
 * @throws FileNotFoundError if path is non-empty and the file doesn't exist
 * @throws ConfigParseError on a syntax error
 * @throws ConfigError if the extension is neither .json nor .toml
 */
Value load_config_file(const std::string& path);

/**
 * @brief Lowercase extension including the dot (".toml"), empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Read a whole file as bytes
 * @throws FileNotFoundError if the file cannot be opened
 */
std::string read_text_file(const std::string& path);

} // namespace autodeploy

#endif // AUTODEPLOY_LOADER_HPP

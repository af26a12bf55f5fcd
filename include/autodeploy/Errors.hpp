/**
 * @file Errors.hpp
 * @brief Exception types for the integration and deduplication engine
 *
 * Error taxonomy:
 * - EngineError: Base class; carries the Conflict Report accumulated
 *   before a fatal failure
 * - ConfigError: Invalid settings value
 *   - FileNotFoundError: Settings file or repository root not found
 *   - ConfigParseError: JSON/TOML syntax errors
 *   - KeyError: Dot-path segment not found
 *   - TypeError: Wrong value type in the settings tree
 * - ParseError: Malformed source unit (dropped, the run continues)
 * - LicenseIncompatibleCycle: Cycle across incompatibly licensed repositories
 * - PassTimeout: Optimization pass exceeded its time budget
 * - UnresolvedReference: Internal-consistency violation after reconciliation
 * - IndexNotSealed: Similarity index queried before it was fully built
 */

#ifndef AUTODEPLOY_ERRORS_HPP
#define AUTODEPLOY_ERRORS_HPP

#include "autodeploy/ConflictReport.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace autodeploy {

/**
 * @brief Base class for all autodeploy exceptions
 */
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /**
     * @brief Conflict Report accumulated up to the failure
     *
     * Empty unless the error escaped a merge run.
     */
    const ConflictReport& report() const noexcept {
        return report_;
    }

    void attach_report(ConflictReport report) {
        report_ = std::move(report);
    }

private:
    ConflictReport report_;
};

/**
 * @brief Invalid configuration value
 */
class ConfigError : public EngineError {
public:
    using EngineError::EngineError;
};

/**
 * @brief Settings file or repository root not found
 */
class FileNotFoundError : public ConfigError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ConfigError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Settings file parse error (JSON/TOML syntax)
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error
     * @param line 1-based line, 0 if unknown
     * @param column 1-based column, 0 if unknown
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, int line, int column, std::string details)
        : ConfigError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) {
            oss << " at line " << line << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Key not found during dot-path traversal of the settings tree
 */
class KeyError : public ConfigError {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full dot-path being accessed (e.g., "engine.pass_timeout_seconds")
     * @param segment The specific segment that doesn't exist
     */
    KeyError(std::string path, std::string segment)
        : ConfigError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& segment() const noexcept { return segment_; }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch in the settings tree
 *
 * Raised when traversing into a scalar or when a key holds a value of the
 * wrong type for its engine option.
 */
class TypeError : public ConfigError {
public:
    /**
     * @brief Construct with path, expected type, and actual type
     * @param path Full dot-path being accessed
     * @param expected Expected type (e.g., "object")
     * @param actual Actual type encountered (e.g., "integer")
     */
    TypeError(std::string path, std::string expected, std::string actual)
        : ConfigError("Expected " + expected + " but found " + actual +
                      " at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief A source unit could not be tokenized into declarations
 *
 * Fatal for that unit only; the engine drops it and continues.
 */
class ParseError : public EngineError {
public:
    ParseError(std::string path, std::size_t line, std::size_t column, std::string details)
        : EngineError(path + ":" + std::to_string(line) + ":" + std::to_string(column) +
                      ": " + details)
        , path_(std::move(path))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& path() const noexcept { return path_; }
    std::size_t line() const noexcept { return line_; }
    std::size_t column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string path_;
    std::size_t line_;
    std::size_t column_;
    std::string details_;
};

/**
 * @brief A dependency cycle spans repositories whose licenses forbid combination
 */
class LicenseIncompatibleCycle : public EngineError {
public:
    LicenseIncompatibleCycle(std::vector<std::string> members, std::vector<std::string> licenses)
        : EngineError(format_message(members, licenses))
        , members_(std::move(members))
        , licenses_(std::move(licenses))
    {}

    /// Labels of the declarations forming the cycle
    const std::vector<std::string>& members() const noexcept { return members_; }

    /// Distinct license identifiers involved
    const std::vector<std::string>& licenses() const noexcept { return licenses_; }

private:
    std::vector<std::string> members_;
    std::vector<std::string> licenses_;

    static std::string format_message(const std::vector<std::string>& members,
                                      const std::vector<std::string>& licenses) {
        std::ostringstream oss;
        oss << "License-incompatible dependency cycle across [";
        for (std::size_t i = 0; i < members.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << members[i] << "'";
        }
        oss << "] with licenses [";
        for (std::size_t i = 0; i < licenses.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << licenses[i];
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief An optimization pass exceeded the configured time budget
 */
class PassTimeout : public EngineError {
public:
    PassTimeout(std::string pass, long long budget_ms)
        : EngineError("Optimization pass '" + pass + "' exceeded its budget of " +
                      std::to_string(budget_ms) + " ms")
        , pass_(std::move(pass))
        , budget_ms_(budget_ms)
    {}

    const std::string& pass() const noexcept { return pass_; }
    long long budget_ms() const noexcept { return budget_ms_; }

private:
    std::string pass_;
    long long budget_ms_;
};

/**
 * @brief A reference does not map to exactly one surviving declaration
 *
 * Never raised by a correct run: it signals a broken invariant in overlap
 * resolution or namespace reconciliation.
 */
class UnresolvedReference : public EngineError {
public:
    UnresolvedReference(std::string declaration, std::string identifier, std::string details)
        : EngineError("Unresolved reference '" + identifier + "' in '" + declaration +
                      "': " + details)
        , declaration_(std::move(declaration))
        , identifier_(std::move(identifier))
    {}

    const std::string& declaration() const noexcept { return declaration_; }
    const std::string& identifier() const noexcept { return identifier_; }

private:
    std::string declaration_;
    std::string identifier_;
};

/**
 * @brief The similarity index was queried before being sealed
 */
class IndexNotSealed : public EngineError {
public:
    IndexNotSealed()
        : EngineError("Similarity index queried before all declarations were indexed")
    {}
};

} // namespace autodeploy

#endif // AUTODEPLOY_ERRORS_HPP

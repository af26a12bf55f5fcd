/**
 * @file Cli.hpp
 * @brief Command-line front end of the autodeploy tool
 *
 * Subcommands:
 * - merge: merge the configured repositories, write source and report
 * - fingerprint FILE...: print kind, name and digest of each declaration
 * - dump-config: print the effective layered settings
 */

#ifndef AUTODEPLOY_CLI_HPP
#define AUTODEPLOY_CLI_HPP

#include <ostream>

namespace autodeploy {

constexpr int kExitClean = 0;
constexpr int kExitFatal = 1;
constexpr int kExitConflicts = 2;

/**
 * @brief Parse arguments and run one subcommand
 *
 * Merged source and dumps go to `out`, diagnostics to `err`. Nothing
 * escapes as an exception; failures become kExitFatal.
 *
 * @return kExitClean, kExitConflicts when the Conflict Report is not
 *         empty, or kExitFatal
 */
int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace autodeploy

#endif // AUTODEPLOY_CLI_HPP

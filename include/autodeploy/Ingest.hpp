/**
 * @file Ingest.hpp
 * @brief Reading acquired repositories from disk
 */

#ifndef AUTODEPLOY_INGEST_HPP
#define AUTODEPLOY_INGEST_HPP

#include "autodeploy/Engine.hpp"
#include "autodeploy/LicensePolicy.hpp"

#include <string>
#include <vector>

namespace autodeploy {

/**
 * @brief Whether a path ends with one of the extensions (case-insensitive)
 */
bool has_source_extension(const std::string& path, const std::vector<std::string>& extensions);

/**
 * @brief Read every source file of a repository checkout
 *
 * Walks `descriptor.path` recursively, keeping files whose extension is
 * listed. Paths in the result are relative to the root, use '/' and are
 * sorted. The license comes from `resolver`.
 *
 * @throws FileNotFoundError if the root is not a directory
 */
RepositoryInput load_repository(const RepositoryDescriptor& descriptor, const LicenseResolver& resolver,
                                const std::vector<std::string>& extensions);

} // namespace autodeploy

#endif // AUTODEPLOY_INGEST_HPP

/**
 * @file Ingest.cpp
 * @brief Repository directory walking
 */

#include "autodeploy/Ingest.hpp"
#include "autodeploy/Errors.hpp"
#include "autodeploy/Loader.hpp"
#include "autodeploy/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace autodeploy {

bool has_source_extension(const std::string& path, const std::vector<std::string>& extensions) {
    const std::string ext = get_file_extension(path);
    if (ext.empty()) return false;
    for (std::string candidate : extensions) {
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (candidate == ext) return true;
    }
    return false;
}

RepositoryInput load_repository(const RepositoryDescriptor& descriptor, const LicenseResolver& resolver,
                                const std::vector<std::string>& extensions) {
    std::error_code ec;
    if (!fs::is_directory(descriptor.path, ec)) {
        throw FileNotFoundError(descriptor.path);
    }

    RepositoryInput input;
    input.id = descriptor.id;
    input.trust_rank = descriptor.trust_rank;
    input.license = resolver.resolve(descriptor);

    const fs::path root(descriptor.path);
    std::vector<std::string> paths;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const std::string relative = it->path().lexically_relative(root).generic_string();
        if (has_source_extension(relative, extensions)) {
            paths.push_back(relative);
        }
    }
    if (ec) {
        throw ConfigError("Cannot read repository '" + descriptor.id + "' at " + descriptor.path + ": " +
                          ec.message());
    }
    std::sort(paths.begin(), paths.end());

    for (const auto& relative : paths) {
        input.files.push_back(SourceFile{relative, read_text_file((root / relative).string())});
    }

    AUTODEPLOY_LOG_INFO("repository loaded", {string_field("repository", input.id),
                                              string_field("license", input.license.identifier),
                                              int_field("files", static_cast<std::int64_t>(input.files.size()))});
    return input;
}

} // namespace autodeploy

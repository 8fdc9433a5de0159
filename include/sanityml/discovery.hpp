#pragma once

#include "sanityml/options.hpp"
#include "sanityml/scan_pool.hpp"
#include "sanityml/types.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace sanityml {

/// Files found under a project root, each list sorted by path
struct Discovery {
    std::vector<std::filesystem::path> python_files;
    std::vector<std::filesystem::path> notebooks;
    std::vector<std::filesystem::path> requirements;
    std::vector<std::filesystem::path> models;

    size_t total() const {
        return python_files.size() + notebooks.size() + requirements.size() + models.size();
    }

    /// All files as pool targets, grouped by class
    std::vector<ScanTarget> targets() const;
};

/// Classify a file name; std::nullopt when it is not scanned
std::optional<ArtifactClass> classify_path(const std::filesystem::path& path);

/// Model file extensions recognized by discovery
const std::vector<std::string>& model_extensions();

/// Walk `root` recursively. Symlinked directories are not followed and
/// VCS, cache and virtualenv directories are pruned. A regular file given
/// as `root` is classified on its own.
/// Throws SanityMLError if `root` does not exist.
Discovery discover_targets(const std::filesystem::path& root, const DiscoveryOptions& options = {});

} // namespace sanityml

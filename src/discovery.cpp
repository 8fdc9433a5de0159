#include "sanityml/discovery.hpp"
#include "sanityml/errors.hpp"

#include <algorithm>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

namespace sanityml {

namespace {

bool pruned_directory(const fs::path& dir) {
    static const std::unordered_set<std::string> names = {
        ".git", ".hg", ".svn", "__pycache__", "node_modules", ".tox", ".nox",
        ".mypy_cache", ".pytest_cache", ".ipynb_checkpoints", "site-packages",
    };
    const std::string name = dir.filename().string();
    if (names.count(name)) {
        return true;
    }
    // Virtualenvs are recognized by their marker file, whatever they are called
    std::error_code ec;
    return fs::exists(dir / "pyvenv.cfg", ec);
}

bool is_requirements_name(const std::string& name) {
    // requirements.txt, requirements-dev.txt, dev-requirements.txt
    return name.size() > 4 && name.compare(name.size() - 4, 4, ".txt") == 0 &&
           name.find("requirements") != std::string::npos;
}

} // anonymous namespace

const std::vector<std::string>& model_extensions() {
    static const std::vector<std::string> exts = {
        ".pt", ".pth", ".pkl", ".pickle", ".joblib", ".bin", ".ckpt",
        ".npy", ".npz", ".h5", ".hdf5", ".keras", ".safetensors",
    };
    return exts;
}

std::optional<ArtifactClass> classify_path(const fs::path& path) {
    const std::string ext = extension_of(path);
    if (ext == ".py") {
        return ArtifactClass::Source;
    }
    if (ext == ".ipynb") {
        return ArtifactClass::Notebook;
    }
    if (is_requirements_name(path.filename().string())) {
        return ArtifactClass::Requirements;
    }
    const auto& models = model_extensions();
    if (std::find(models.begin(), models.end(), ext) != models.end()) {
        return ArtifactClass::Model;
    }
    return std::nullopt;
}

std::vector<ScanTarget> Discovery::targets() const {
    std::vector<ScanTarget> out;
    out.reserve(total());
    for (const auto& p : python_files) out.push_back({p, ArtifactClass::Source});
    for (const auto& p : notebooks) out.push_back({p, ArtifactClass::Notebook});
    for (const auto& p : requirements) out.push_back({p, ArtifactClass::Requirements});
    for (const auto& p : models) out.push_back({p, ArtifactClass::Model});
    return out;
}

Discovery discover_targets(const fs::path& root, const DiscoveryOptions& options) {
    std::error_code ec;
    fs::file_status status = fs::status(root, ec);
    if (ec || !fs::exists(status)) {
        throw SanityMLError("Scan target does not exist: " + sanitize_path_for_error(root.string()));
    }

    Discovery found;
    auto consider = [&](const fs::path& path) {
        if (options.max_file_bytes > 0) {
            std::error_code size_ec;
            uint64_t size = fs::file_size(path, size_ec);
            if (size_ec || size > options.max_file_bytes) {
                return;
            }
        }
        auto kind = classify_path(path);
        if (!kind) {
            return;
        }
        switch (*kind) {
            case ArtifactClass::Source:
                if (options.python) found.python_files.push_back(path);
                break;
            case ArtifactClass::Notebook:
                if (options.notebooks) found.notebooks.push_back(path);
                break;
            case ArtifactClass::Requirements:
                if (options.dependencies) found.requirements.push_back(path);
                break;
            case ArtifactClass::Model:
                if (options.models) found.models.push_back(path);
                break;
        }
    };

    if (fs::is_regular_file(status)) {
        consider(root);
        return found;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw SanityMLError("Cannot read directory " + sanitize_path_for_error(root.string()) +
                            ": " + ec.message());
    }
    const fs::recursive_directory_iterator end;
    while (it != end) {
        const fs::directory_entry& entry = *it;
        std::error_code entry_ec;
        if (entry.is_symlink(entry_ec) && entry.is_directory(entry_ec)) {
            it.disable_recursion_pending();
        } else if (entry.is_directory(entry_ec)) {
            if (pruned_directory(entry.path())) {
                it.disable_recursion_pending();
            }
        } else if (entry.is_regular_file(entry_ec)) {
            consider(entry.path());
        }

        it.increment(ec);
        if (ec) {
            throw SanityMLError("Directory walk failed under " +
                                sanitize_path_for_error(root.string()) + ": " + ec.message());
        }
    }

    std::sort(found.python_files.begin(), found.python_files.end());
    std::sort(found.notebooks.begin(), found.notebooks.end());
    std::sort(found.requirements.begin(), found.requirements.end());
    std::sort(found.models.begin(), found.models.end());
    return found;
}

} // namespace sanityml

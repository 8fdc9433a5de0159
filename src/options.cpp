#include "sanityml/options.hpp"
#include <unordered_set>

namespace sanityml {

static constexpr int MAX_WORKERS = 256;
static constexpr size_t MIN_LITERAL_PREVIEW = 16;

std::vector<std::string> ScanOptions::validate() const {
    std::vector<std::string> errors;

    static const std::unordered_set<std::string> valid_levels = {
        "debug", "info", "warning", "error"
    };
    if (valid_levels.find(log_level) == valid_levels.end()) {
        errors.push_back("Invalid log_level: " + log_level);
    }

    if (num_workers < 0) {
        errors.push_back("num_workers must be >= 0");
    } else if (num_workers > MAX_WORKERS) {
        errors.push_back("num_workers must be <= " + std::to_string(MAX_WORKERS) +
                         " (got " + std::to_string(num_workers) + ")");
    }

    if (artifact_timeout_ms < 0) {
        errors.push_back("artifact_timeout_ms must be >= 0");
    }

    if (max_stream_bytes == 0) {
        errors.push_back("max_stream_bytes must be > 0");
    }
    if (max_artifact_bytes == 0) {
        errors.push_back("max_artifact_bytes must be > 0");
    }
    if (max_entry_bytes == 0) {
        errors.push_back("max_entry_bytes must be > 0");
    }
    if (max_inflated_bytes == 0) {
        errors.push_back("max_inflated_bytes must be > 0");
    }
    if (max_streams_per_artifact == 0) {
        errors.push_back("max_streams_per_artifact must be > 0");
    }
    if (max_stack_depth == 0 || max_memo_entries == 0 || max_graph_nodes == 0) {
        errors.push_back("stack, memo and graph limits must be > 0");
    }
    if (max_traversal_depth == 0) {
        errors.push_back("max_traversal_depth must be > 0");
    }
    if (max_literal_preview < MIN_LITERAL_PREVIEW) {
        errors.push_back("max_literal_preview must be >= " +
                         std::to_string(MIN_LITERAL_PREVIEW));
    }
    if (max_source_line == 0) {
        errors.push_back("max_source_line must be > 0");
    }

    return errors;
}

} // namespace sanityml

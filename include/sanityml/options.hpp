#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sanityml {

/// Configuration options for a scan run.
///
/// All limits are per stream or per artifact. They bound the work and the
/// memory a hostile artifact can cause, no matter what sizes it declares.
struct ScanOptions {
    // Opcode reader
    uint64_t max_stream_bytes = 2ULL * 1024 * 1024 * 1024;    // 2 GiB consumed per stream
    size_t max_streams_per_artifact = 16;                     // concatenated pickles

    // Graph builder
    size_t max_stack_depth = 1000000;
    size_t max_memo_entries = 1000000;
    size_t max_graph_nodes = 4000000;
    size_t max_traversal_depth = 10000;
    size_t max_literal_preview = 200;                         // chars kept per literal

    // Containers and files
    uint64_t max_artifact_bytes = 8ULL * 1024 * 1024 * 1024;  // 8 GiB
    uint64_t max_entry_bytes = 2ULL * 1024 * 1024 * 1024;     // inflated archive member
    uint64_t max_inflated_bytes = 4ULL * 1024 * 1024 * 1024;  // all members of one archive

    // Source scanner
    size_t max_source_line = 4096;                            // chars handed to the regex engine

    // Concurrency
    int num_workers = 0;          // 0 = auto-detect
    int artifact_timeout_ms = 0;  // 0 = no deadline

    // Logging
    std::string log_level = "warning";  // "debug", "info", "warning", "error"

    /// Validate options, returns list of errors
    std::vector<std::string> validate() const;
};

/// Which artifact classes discovery should collect
struct DiscoveryOptions {
    bool python = true;
    bool notebooks = true;
    bool dependencies = true;
    bool models = true;

    /// Skip files larger than this during discovery (0 = no limit)
    uint64_t max_file_bytes = 0;
};

} // namespace sanityml

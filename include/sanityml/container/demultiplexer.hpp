#pragma once

// Container Demultiplexer
//
// Finds the pickle streams (and Keras model configurations) inside a model
// file. Bare pickles, zip archives (PyTorch, NumPy .npz, Keras v3), NumPy
// .npy object arrays, safetensors and HDF5 files are recognized.

#include "sanityml/errors.hpp"
#include "sanityml/options.hpp"
#include "sanityml/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sanityml {
namespace container {

enum class ContainerFormat : uint8_t {
    Pickle,
    Zip,
    Numpy,
    Safetensors,
    Hdf5,
};

const char* container_format_name(ContainerFormat format);

/// Detect by magic bytes first, then by extension (".pt", lower case)
ContainerFormat detect_format(ByteView bytes, const std::string& extension);

/// One pickle stream to hand to the opcode reader
struct EmbeddedStream {
    std::string name;         // archive member, "" for the artifact itself
    size_t base_offset = 0;   // offset of `bytes` within the artifact (stored members)
    size_t start = 0;         // first opcode within `bytes`
    ByteView bytes;           // view into the artifact or into `owned`
    std::shared_ptr<std::vector<uint8_t>> owned;  // inflated data, if any
};

/// Model configuration text for layer rules
struct EmbeddedConfig {
    std::string name;
    ByteView text;
    std::shared_ptr<std::vector<uint8_t>> owned;
};

/// Member-level error that does not invalidate the rest of the archive
struct EntryFailure {
    std::string entry;
    ScanFailure failure;
};

struct DemuxResult {
    ContainerFormat format = ContainerFormat::Pickle;
    std::vector<EmbeddedStream> streams;
    std::vector<EmbeddedConfig> configs;
    std::vector<EntryFailure> failures;
};

class Demultiplexer {
public:
    explicit Demultiplexer(const ScanOptions& options);

    /// Split an artifact into inspectable parts.
    ///
    /// Throws ContainerCorruptError for malformed framing,
    /// NoPickleStreamError when nothing inspectable was found and
    /// ScanTimeoutError when the deadline passes between members.
    ///
    /// Deflated members are inflated whole only when their name or an
    /// inflated prefix marks them as pickle, npy object array or config;
    /// all members of one archive share max_inflated_bytes.
    DemuxResult split(ByteView bytes,
                      const std::string& extension,
                      std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt) const;

private:
    uint64_t max_entry_bytes_;
    uint64_t max_inflated_bytes_;

    void split_zip(ByteView bytes, DemuxResult& result,
                   const std::optional<std::chrono::steady_clock::time_point>& deadline) const;
};

// ============================================================================
// Format helpers
// ============================================================================

/// Protocol 2-5 pickle signature: PROTO n ... STOP
bool looks_like_pickle(ByteView bytes);

/// Member names that hold pickles by convention
bool is_pickle_name(const std::string& name);

/// Numeric tensor storage members of PyTorch archives ("archive/data/12")
bool is_tensor_storage_name(const std::string& name);

/// Parsed NumPy .npy header
struct NpyHeader {
    int major = 0;
    int minor = 0;
    std::string descr;
    size_t data_offset = 0;

    bool object_dtype() const { return descr.find('O') != std::string::npos; }
};

/// Parse a .npy header; throws ContainerCorruptError if malformed
NpyHeader parse_npy_header(ByteView bytes);

/// Validate a safetensors header; throws ContainerCorruptError if impossible
void validate_safetensors(ByteView bytes);

} // namespace container
} // namespace sanityml

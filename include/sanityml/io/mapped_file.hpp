#pragma once

#include "sanityml/types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace sanityml {
namespace io {

/// Read-only memory-mapped file with RAII semantics
class MappedFile {
public:
    MappedFile() = default;
    ~MappedFile();

    // Move-only semantics
    MappedFile(MappedFile&& other) noexcept;
    MappedFile& operator=(MappedFile&& other) noexcept;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    /// Map a file read-only
    /// @return Mapped file, or nullptr when the file cannot be mapped
    ///         (missing, empty, special file or mmap failure)
    static std::unique_ptr<MappedFile> open(const std::filesystem::path& path);

    const uint8_t* data() const { return static_cast<const uint8_t*>(data_); }
    size_t size() const { return size_; }
    bool is_valid() const { return data_ != nullptr; }

    /// Tell the kernel the mapping is read front to back
    void advise_sequential();

private:
    void* data_ = nullptr;
    size_t size_ = 0;
    int fd_ = -1;

    void close_handles();
};

/// Artifact bytes, either mapped or read into memory
class FileBuffer {
public:
    /// Load a file no larger than `max_bytes`.
    /// Throws StreamTooLargeError above the limit and ArtifactReadError when
    /// the file cannot be read. Mapping is tried first, then a buffered read.
    static FileBuffer load(const std::filesystem::path& path, uint64_t max_bytes);

    ByteView view() const;
    size_t size() const { return view().size; }
    bool is_mapped() const { return mapped_ != nullptr; }

private:
    std::unique_ptr<MappedFile> mapped_;
    std::vector<uint8_t> owned_;
};

} // namespace io
} // namespace sanityml

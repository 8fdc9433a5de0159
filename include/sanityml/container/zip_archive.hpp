#pragma once

#include "sanityml/errors.hpp"
#include "sanityml/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sanityml {
namespace container {

/// Compression methods understood by ZipArchive
constexpr uint16_t ZIP_STORED = 0;
constexpr uint16_t ZIP_DEFLATED = 8;

/// One member from the central directory
struct ZipEntry {
    std::string name;
    uint16_t method = ZIP_STORED;
    uint16_t flags = 0;
    uint32_t crc32 = 0;
    uint64_t compressed_size = 0;
    uint64_t uncompressed_size = 0;
    uint64_t local_header_offset = 0;
    uint64_t data_offset = 0;   // start of member data, after the local header

    bool encrypted() const { return (flags & 0x1) != 0; }
    bool is_directory() const { return !name.empty() && name.back() == '/'; }
};

/// Read-only view of a zip archive held in memory.
///
/// The constructor walks the central directory (ZIP64 aware) and validates
/// every local header; member data is never copied unless inflated.
/// All framing errors raise ContainerCorruptError.
class ZipArchive {
public:
    explicit ZipArchive(ByteView bytes);

    const std::vector<ZipEntry>& entries() const { return entries_; }

    /// Compressed bytes of a member (the member data itself when stored)
    ByteView raw_data(const ZipEntry& entry) const;

    /// Inflate a deflated member. Output beyond `max_bytes` raises
    /// StreamTooLargeError; malformed deflate data raises ContainerCorruptError.
    std::vector<uint8_t> inflate(const ZipEntry& entry, uint64_t max_bytes) const;

    /// Inflate at most the first `max_bytes` of a deflated member; output
    /// past that point is never produced. Used to sniff member content.
    std::vector<uint8_t> inflate_prefix(const ZipEntry& entry, size_t max_bytes) const;

    /// Archive signature check (local header or empty-archive EOCD)
    static bool looks_like_zip(ByteView bytes);

private:
    ByteView bytes_;
    std::vector<ZipEntry> entries_;

    void read_central_directory();
    size_t find_eocd() const;
    void resolve_local_header(ZipEntry& entry) const;
    std::vector<uint8_t> inflate_bounded(const ZipEntry& entry, uint64_t max_bytes,
                                         bool truncate) const;
};

} // namespace container
} // namespace sanityml

#include "sanityml/container/zip_archive.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstring>
#include <limits>

namespace sanityml {
namespace container {

namespace {

constexpr uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
constexpr uint32_t EOCD_SIG = 0x06054b50;
constexpr uint32_t ZIP64_EOCD_SIG = 0x06064b50;
constexpr uint32_t ZIP64_LOCATOR_SIG = 0x07064b50;

constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t EOCD_SIZE = 22;
constexpr size_t ZIP64_EOCD_SIZE = 56;
constexpr size_t ZIP64_LOCATOR_SIZE = 20;
constexpr size_t MAX_COMMENT = 0xFFFF;
constexpr uint16_t ZIP64_EXTRA_ID = 0x0001;

// Security: an archive cannot describe more members than bytes it has
constexpr size_t MIN_ENTRY_FOOTPRINT = CENTRAL_HEADER_SIZE;

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

uint64_t read_u64(const uint8_t* p) {
    return static_cast<uint64_t>(read_u32(p)) | (static_cast<uint64_t>(read_u32(p + 4)) << 32);
}

size_t to_size(uint64_t v, const char* what, size_t offset) {
    if (v > std::numeric_limits<size_t>::max()) {
        throw ContainerCorruptError(std::string("Invalid ZIP: ") + what + " out of range", offset);
    }
    return static_cast<size_t>(v);
}

size_t add_or_corrupt(size_t a, size_t b, const char* what, size_t offset) {
    try {
        return checked_add(a, b);
    } catch (const std::overflow_error&) {
        throw ContainerCorruptError(std::string("Invalid ZIP: ") + what + " overflow", offset);
    }
}

} // anonymous namespace

ZipArchive::ZipArchive(ByteView bytes)
    : bytes_(bytes) {
    read_central_directory();
}

bool ZipArchive::looks_like_zip(ByteView bytes) {
    return bytes.matches(0, std::string_view("PK\x03\x04", 4)) ||
           bytes.matches(0, std::string_view("PK\x05\x06", 4));
}

size_t ZipArchive::find_eocd() const {
    if (bytes_.size < EOCD_SIZE) {
        throw ContainerCorruptError("Invalid ZIP: archive shorter than end record", 0);
    }
    // The end record sits in the last 22 + 65535 bytes; scan backwards
    size_t last = bytes_.size - EOCD_SIZE;
    size_t first = last > MAX_COMMENT ? last - MAX_COMMENT : 0;
    for (size_t pos = last + 1; pos-- > first;) {
        if (read_u32(bytes_.data + pos) == EOCD_SIG) {
            uint16_t comment_len = read_u16(bytes_.data + pos + 20);
            if (pos + EOCD_SIZE + comment_len <= bytes_.size) {
                return pos;
            }
        }
    }
    throw ContainerCorruptError("Invalid ZIP: end of central directory not found", 0);
}

void ZipArchive::read_central_directory() {
    const size_t eocd = find_eocd();
    const uint8_t* e = bytes_.data + eocd;

    uint64_t total_entries = read_u16(e + 10);
    uint64_t cd_size = read_u32(e + 12);
    uint64_t cd_offset = read_u32(e + 16);

    // ZIP64: locator immediately precedes the classic end record
    bool zip64 = total_entries == 0xFFFF || cd_size == 0xFFFFFFFFu || cd_offset == 0xFFFFFFFFu;
    if (eocd >= ZIP64_LOCATOR_SIZE &&
        read_u32(bytes_.data + eocd - ZIP64_LOCATOR_SIZE) == ZIP64_LOCATOR_SIG) {
        uint64_t z64_offset = read_u64(bytes_.data + eocd - ZIP64_LOCATOR_SIZE + 8);
        size_t z64 = to_size(z64_offset, "ZIP64 end record offset", eocd);
        if (z64 > bytes_.size || bytes_.size - z64 < ZIP64_EOCD_SIZE ||
            read_u32(bytes_.data + z64) != ZIP64_EOCD_SIG) {
            throw ContainerCorruptError("Invalid ZIP: bad ZIP64 end record", z64);
        }
        const uint8_t* z = bytes_.data + z64;
        total_entries = read_u64(z + 32);
        cd_size = read_u64(z + 40);
        cd_offset = read_u64(z + 48);
    } else if (zip64) {
        throw ContainerCorruptError("Invalid ZIP: ZIP64 locator missing", eocd);
    }

    size_t cd_start = to_size(cd_offset, "central directory offset", eocd);
    size_t cd_len = to_size(cd_size, "central directory size", eocd);
    size_t cd_end = add_or_corrupt(cd_start, cd_len, "central directory", eocd);
    if (cd_end > bytes_.size) {
        throw ContainerCorruptError("Invalid ZIP: central directory extends past end", cd_start);
    }
    if (total_entries > cd_len / MIN_ENTRY_FOOTPRINT + 1) {
        throw ContainerCorruptError("Invalid ZIP: entry count exceeds directory size", eocd);
    }

    entries_.reserve(static_cast<size_t>(total_entries));
    size_t pos = cd_start;
    for (uint64_t i = 0; i < total_entries; ++i) {
        if (cd_end - pos < CENTRAL_HEADER_SIZE || read_u32(bytes_.data + pos) != CENTRAL_HEADER_SIG) {
            throw ContainerCorruptError("Invalid ZIP: bad central directory header", pos);
        }
        const uint8_t* h = bytes_.data + pos;

        ZipEntry entry;
        entry.flags = read_u16(h + 8);
        entry.method = read_u16(h + 10);
        entry.crc32 = read_u32(h + 16);
        entry.compressed_size = read_u32(h + 20);
        entry.uncompressed_size = read_u32(h + 24);
        uint16_t name_len = read_u16(h + 28);
        uint16_t extra_len = read_u16(h + 30);
        uint16_t comment_len = read_u16(h + 32);
        entry.local_header_offset = read_u32(h + 42);

        size_t name_start = pos + CENTRAL_HEADER_SIZE;
        size_t extra_start = add_or_corrupt(name_start, name_len, "file name", pos);
        size_t extra_end = add_or_corrupt(extra_start, extra_len, "extra field", pos);
        size_t next = add_or_corrupt(extra_end, comment_len, "file comment", pos);
        if (next > cd_end) {
            throw ContainerCorruptError("Invalid ZIP: central header extends past directory", pos);
        }
        entry.name.assign(reinterpret_cast<const char*>(bytes_.data + name_start), name_len);

        // ZIP64 extended information replaces saturated 32-bit fields in order
        size_t x = extra_start;
        while (x + 4 <= extra_end) {
            uint16_t id = read_u16(bytes_.data + x);
            uint16_t len = read_u16(bytes_.data + x + 2);
            size_t body = x + 4;
            if (body + len > extra_end) {
                throw ContainerCorruptError("Invalid ZIP: extra field overruns header", x);
            }
            if (id == ZIP64_EXTRA_ID) {
                size_t p = body;
                size_t body_end = body + len;
                auto take = [&](uint64_t& field) {
                    if (p + 8 > body_end) {
                        throw ContainerCorruptError("Invalid ZIP: short ZIP64 extra field", x);
                    }
                    field = read_u64(bytes_.data + p);
                    p += 8;
                };
                if (entry.uncompressed_size == 0xFFFFFFFFu) take(entry.uncompressed_size);
                if (entry.compressed_size == 0xFFFFFFFFu) take(entry.compressed_size);
                if (entry.local_header_offset == 0xFFFFFFFFu) take(entry.local_header_offset);
            }
            x = body + len;
        }

        resolve_local_header(entry);
        entries_.push_back(std::move(entry));
        pos = next;
    }
}

void ZipArchive::resolve_local_header(ZipEntry& entry) const {
    size_t pos = to_size(entry.local_header_offset, "local header offset", 0);
    if (pos > bytes_.size || bytes_.size - pos < LOCAL_HEADER_SIZE ||
        read_u32(bytes_.data + pos) != LOCAL_HEADER_SIG) {
        throw ContainerCorruptError("Invalid ZIP: bad local header for " + entry.name, pos);
    }
    uint16_t name_len = read_u16(bytes_.data + pos + 26);
    uint16_t extra_len = read_u16(bytes_.data + pos + 28);

    size_t header_end = add_or_corrupt(add_or_corrupt(pos, LOCAL_HEADER_SIZE, "header offset", pos),
                                       name_len, "header offset", pos);
    size_t data_start = add_or_corrupt(header_end, extra_len, "data offset", pos);
    size_t data_len = to_size(entry.compressed_size, "member size", pos);
    size_t data_end = add_or_corrupt(data_start, data_len, "data size", pos);
    if (data_end > bytes_.size) {
        throw ContainerCorruptError("Invalid ZIP: data of " + entry.name + " extends past end", pos);
    }
    entry.data_offset = data_start;
}

ByteView ZipArchive::raw_data(const ZipEntry& entry) const {
    return bytes_.subview(static_cast<size_t>(entry.data_offset),
                          static_cast<size_t>(entry.compressed_size));
}

std::vector<uint8_t> ZipArchive::inflate(const ZipEntry& entry, uint64_t max_bytes) const {
    return inflate_bounded(entry, max_bytes, false);
}

std::vector<uint8_t> ZipArchive::inflate_prefix(const ZipEntry& entry, size_t max_bytes) const {
    return inflate_bounded(entry, max_bytes, true);
}

std::vector<uint8_t> ZipArchive::inflate_bounded(const ZipEntry& entry,
                                                 uint64_t max_bytes,
                                                 bool truncate) const {
    if (entry.method != ZIP_DEFLATED) {
        throw ContainerCorruptError("Unsupported compression method " +
                                    std::to_string(entry.method) + " for " + entry.name,
                                    static_cast<size_t>(entry.local_header_offset));
    }
    ByteView input = raw_data(entry);

    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    // Negative window bits: raw deflate, no zlib header
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
        throw ContainerCorruptError("Failed to initialize inflater", 0);
    }

    struct InflateGuard {
        z_stream* zs;
        ~InflateGuard() { inflateEnd(zs); }
    } guard{&zs};

    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(std::min<uint64_t>(
        std::min<uint64_t>(entry.uncompressed_size, max_bytes), 64ULL * 1024 * 1024)));

    const uint8_t* in_ptr = input.data;
    size_t in_left = input.size;
    uint8_t chunk[64 * 1024];
    int ret = Z_OK;

    while (ret != Z_STREAM_END) {
        if (zs.avail_in == 0 && in_left > 0) {
            uInt take = static_cast<uInt>(std::min<size_t>(in_left, 1u << 30));
            zs.next_in = const_cast<Bytef*>(in_ptr);
            zs.avail_in = take;
            in_ptr += take;
            in_left -= take;
        }
        zs.next_out = chunk;
        zs.avail_out = static_cast<uInt>(
            truncate ? std::min<uint64_t>(sizeof(chunk), max_bytes - out.size()) : sizeof(chunk));

        ret = ::inflate(&zs, Z_NO_FLUSH);
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR) {
            throw ContainerCorruptError("Invalid deflate data in " + entry.name,
                                        static_cast<size_t>(entry.data_offset));
        }

        size_t produced = static_cast<size_t>(zs.next_out - chunk);
        if (out.size() + produced > max_bytes) {
            throw StreamTooLargeError("Inflated size of " + entry.name + " exceeds " +
                                      std::to_string(max_bytes) + " bytes",
                                      static_cast<size_t>(entry.data_offset));
        }
        out.insert(out.end(), chunk, chunk + produced);
        if (truncate && out.size() == max_bytes) {
            break;
        }

        if (ret == Z_BUF_ERROR && zs.avail_in == 0 && in_left == 0) {
            throw ContainerCorruptError("Truncated deflate data in " + entry.name,
                                        static_cast<size_t>(entry.data_offset));
        }
    }
    return out;
}

} // namespace container
} // namespace sanityml

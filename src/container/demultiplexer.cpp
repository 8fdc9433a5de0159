#include "sanityml/container/demultiplexer.hpp"
#include "sanityml/container/zip_archive.hpp"

#include <algorithm>
#include <cctype>

namespace sanityml {
namespace container {

namespace {

const std::string_view NPY_MAGIC("\x93NUMPY", 6);
const std::string_view HDF5_MAGIC("\x89HDF\r\n\x1a\n", 8);

// Inflated prefix used to sniff members that are not pickle-named
constexpr size_t SNIFF_BYTES = 64 * 1024;

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string basename_of(const std::string& name) {
    size_t slash = name.find_last_of('/');
    return slash == std::string::npos ? name : name.substr(slash + 1);
}

bool has_proto_signature(ByteView bytes) {
    return bytes.size >= 2 && bytes[0] == 0x80 && bytes[1] >= 2 && bytes[1] <= 5;
}

/// Decide from an inflated prefix whether a member is worth inflating whole
bool worth_inflating(ByteView prefix, bool npy_name) {
    if (npy_name && prefix.matches(0, NPY_MAGIC)) {
        try {
            return parse_npy_header(prefix).object_dtype();
        } catch (const StreamError&) {
            // Headers past the sniff window, and broken ones, are parsed again in full
            return true;
        }
    }
    return has_proto_signature(prefix);
}

void check_deadline(const std::optional<std::chrono::steady_clock::time_point>& deadline) {
    if (deadline && std::chrono::steady_clock::now() > *deadline) {
        throw ScanTimeoutError();
    }
}

} // anonymous namespace

const char* container_format_name(ContainerFormat format) {
    switch (format) {
        case ContainerFormat::Pickle: return "pickle";
        case ContainerFormat::Zip: return "zip";
        case ContainerFormat::Numpy: return "npy";
        case ContainerFormat::Safetensors: return "safetensors";
        case ContainerFormat::Hdf5: return "hdf5";
    }
    return "?";
}

ContainerFormat detect_format(ByteView bytes, const std::string& extension) {
    if (ZipArchive::looks_like_zip(bytes)) {
        return ContainerFormat::Zip;
    }
    if (bytes.matches(0, NPY_MAGIC)) {
        return ContainerFormat::Numpy;
    }
    if (bytes.matches(0, HDF5_MAGIC)) {
        return ContainerFormat::Hdf5;
    }
    std::string ext = lower(extension);
    if (ext == ".safetensors") {
        return ContainerFormat::Safetensors;
    }
    if (ext == ".h5" || ext == ".hdf5") {
        return ContainerFormat::Hdf5;
    }
    return ContainerFormat::Pickle;
}

bool looks_like_pickle(ByteView bytes) {
    return bytes.size >= 3 && bytes[0] == 0x80 && bytes[1] >= 2 && bytes[1] <= 5 &&
           bytes[bytes.size - 1] == '.';
}

bool is_pickle_name(const std::string& name) {
    std::string n = lower(name);
    return ends_with(n, ".pkl") || ends_with(n, ".pickle") || ends_with(n, ".joblib");
}

bool is_tensor_storage_name(const std::string& name) {
    std::string base = basename_of(name);
    if (base.empty() || !std::all_of(base.begin(), base.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    std::string dir = name.substr(0, name.size() - base.size());
    return ends_with(dir, "data/");
}

NpyHeader parse_npy_header(ByteView bytes) {
    if (!bytes.matches(0, NPY_MAGIC) || bytes.size < 10) {
        throw ContainerCorruptError("Invalid NPY: bad magic", 0);
    }
    NpyHeader h;
    h.major = bytes[6];
    h.minor = bytes[7];

    size_t header_len;
    size_t prefix;
    if (h.major == 1) {
        header_len = static_cast<size_t>(bytes[8] | (bytes[9] << 8));
        prefix = 10;
    } else if (h.major == 2 || h.major == 3) {
        if (bytes.size < 12) {
            throw ContainerCorruptError("Invalid NPY: truncated header", 0);
        }
        header_len = static_cast<size_t>(bytes[8]) | (static_cast<size_t>(bytes[9]) << 8) |
                     (static_cast<size_t>(bytes[10]) << 16) | (static_cast<size_t>(bytes[11]) << 24);
        prefix = 12;
    } else {
        throw ContainerCorruptError("Invalid NPY: unsupported version " + std::to_string(h.major), 6);
    }

    size_t end;
    try {
        end = checked_add(prefix, header_len);
    } catch (const std::overflow_error&) {
        throw ContainerCorruptError("Invalid NPY: header length overflow", 8);
    }
    if (end > bytes.size) {
        throw ContainerCorruptError("Invalid NPY: header extends past end", 8);
    }
    std::string_view header(reinterpret_cast<const char*>(bytes.data + prefix), header_len);

    size_t key = header.find("'descr'");
    if (key == std::string_view::npos) {
        key = header.find("\"descr\"");
    }
    if (key == std::string_view::npos) {
        throw ContainerCorruptError("Invalid NPY: header has no descr", prefix);
    }
    size_t colon = header.find(':', key);
    size_t open = colon == std::string_view::npos ? colon : header.find_first_of("'\"", colon);
    if (open == std::string_view::npos) {
        throw ContainerCorruptError("Invalid NPY: malformed descr", prefix + key);
    }
    size_t close = header.find(header[open], open + 1);
    if (close == std::string_view::npos) {
        throw ContainerCorruptError("Invalid NPY: malformed descr", prefix + key);
    }
    h.descr = std::string(header.substr(open + 1, close - open - 1));
    h.data_offset = end;
    return h;
}

void validate_safetensors(ByteView bytes) {
    if (bytes.size < 8) {
        throw ContainerCorruptError("Invalid safetensors: file shorter than header length", 0);
    }
    uint64_t header_len = 0;
    for (int i = 7; i >= 0; --i) {
        header_len = (header_len << 8) | bytes[static_cast<size_t>(i)];
    }
    if (header_len == 0 || header_len > bytes.size - 8) {
        throw ContainerCorruptError("Invalid safetensors: header length " +
                                    std::to_string(header_len) + " exceeds file size", 0);
    }
    if (bytes[8] != '{') {
        throw ContainerCorruptError("Invalid safetensors: header is not a JSON object", 8);
    }
}

// ============================================================================
// Demultiplexer
// ============================================================================

Demultiplexer::Demultiplexer(const ScanOptions& options)
    : max_entry_bytes_(options.max_entry_bytes)
    , max_inflated_bytes_(options.max_inflated_bytes) {}

DemuxResult Demultiplexer::split(ByteView bytes,
                                 const std::string& extension,
                                 std::optional<std::chrono::steady_clock::time_point> deadline) const {
    DemuxResult result;
    result.format = detect_format(bytes, extension);

    switch (result.format) {
        case ContainerFormat::Zip:
            split_zip(bytes, result, deadline);
            break;

        case ContainerFormat::Numpy: {
            NpyHeader header = parse_npy_header(bytes);
            if (header.object_dtype() && header.data_offset < bytes.size) {
                EmbeddedStream s;
                s.bytes = bytes;
                s.start = header.data_offset;
                result.streams.push_back(std::move(s));
            }
            break;
        }

        case ContainerFormat::Safetensors:
            validate_safetensors(bytes);
            break;

        case ContainerFormat::Hdf5:
            // Keras stores the model configuration as a JSON attribute
            result.configs.push_back(EmbeddedConfig{"", bytes, nullptr});
            break;

        case ContainerFormat::Pickle: {
            EmbeddedStream s;
            s.bytes = bytes;
            result.streams.push_back(std::move(s));
            break;
        }
    }

    if (result.streams.empty() && result.configs.empty() && result.failures.empty()) {
        throw NoPickleStreamError(std::string("No pickle stream in ") +
                                  container_format_name(result.format) + " container");
    }
    return result;
}

void Demultiplexer::split_zip(ByteView bytes, DemuxResult& result,
                              const std::optional<std::chrono::steady_clock::time_point>& deadline) const {
    ZipArchive archive(bytes);
    uint64_t inflated = 0;

    for (const ZipEntry& entry : archive.entries()) {
        check_deadline(deadline);
        if (entry.is_directory() || is_tensor_storage_name(entry.name)) {
            continue;
        }

        const bool pickle_name = is_pickle_name(entry.name);
        const bool npy_name = ends_with(lower(entry.name), ".npy");
        const bool config_name = basename_of(entry.name) == "config.json";

        ByteView data;
        std::shared_ptr<std::vector<uint8_t>> owned;
        try {
            if (entry.encrypted()) {
                if (pickle_name) {
                    throw ContainerCorruptError("Encrypted pickle member " + entry.name,
                                                static_cast<size_t>(entry.local_header_offset));
                }
                continue;
            }
            if (entry.method == ZIP_STORED) {
                data = archive.raw_data(entry);
            } else if (entry.method == ZIP_DEFLATED) {
                if (!pickle_name && !config_name) {
                    std::vector<uint8_t> prefix = archive.inflate_prefix(entry, SNIFF_BYTES);
                    if (!worth_inflating(ByteView(prefix.data(), prefix.size()), npy_name)) {
                        continue;
                    }
                }
                if (inflated >= max_inflated_bytes_) {
                    throw StreamTooLargeError("Archive inflation budget of " +
                                              std::to_string(max_inflated_bytes_) +
                                              " bytes exhausted before " + entry.name,
                                              static_cast<size_t>(entry.local_header_offset));
                }
                uint64_t limit = std::min(max_entry_bytes_, max_inflated_bytes_ - inflated);
                owned = std::make_shared<std::vector<uint8_t>>(archive.inflate(entry, limit));
                inflated += owned->size();
                data = ByteView(owned->data(), owned->size());
            } else if (pickle_name) {
                throw ContainerCorruptError("Unsupported compression method " +
                                            std::to_string(entry.method) + " for " + entry.name,
                                            static_cast<size_t>(entry.local_header_offset));
            } else {
                continue;
            }
        } catch (const StreamError& e) {
            result.failures.push_back(EntryFailure{entry.name, ScanFailure::from(e)});
            continue;
        }

        if (config_name) {
            result.configs.push_back(EmbeddedConfig{entry.name, data, owned});
            continue;
        }

        if (npy_name && data.matches(0, NPY_MAGIC)) {
            try {
                NpyHeader header = parse_npy_header(data);
                if (header.object_dtype() && header.data_offset < data.size) {
                    EmbeddedStream s;
                    s.name = entry.name;
                    s.base_offset = owned ? 0 : static_cast<size_t>(entry.data_offset);
                    s.start = header.data_offset;
                    s.bytes = data;
                    s.owned = owned;
                    result.streams.push_back(std::move(s));
                }
            } catch (const StreamError& e) {
                result.failures.push_back(EntryFailure{entry.name, ScanFailure::from(e)});
            }
            continue;
        }

        if (pickle_name || looks_like_pickle(data)) {
            EmbeddedStream s;
            s.name = entry.name;
            s.base_offset = owned ? 0 : static_cast<size_t>(entry.data_offset);
            s.bytes = data;
            s.owned = owned;
            result.streams.push_back(std::move(s));
        }
    }
}

} // namespace container
} // namespace sanityml

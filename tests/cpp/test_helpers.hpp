#pragma once

// Byte builders shared by the test files

#include "sanityml/types.hpp"

#include <zlib.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace sanityml {
namespace test_util {

/// Assembles pickle opcode streams by hand
class PickleWriter {
public:
    PickleWriter& proto(uint8_t version) { return byte(0x80).byte(version); }
    PickleWriter& frame(uint64_t length) { byte(0x95); return le(length, 8); }
    PickleWriter& stop() { return byte('.'); }
    PickleWriter& mark() { return byte('('); }
    PickleWriter& pop() { return byte('0'); }
    PickleWriter& dup() { return byte('2'); }
    PickleWriter& none() { return byte('N'); }
    PickleWriter& newtrue() { return byte(0x88); }

    PickleWriter& global(const std::string& module, const std::string& name) {
        byte('c');
        text(module + "\n");
        return text(name + "\n");
    }

    PickleWriter& inst(const std::string& module, const std::string& name) {
        byte('i');
        text(module + "\n");
        return text(name + "\n");
    }

    PickleWriter& stack_global() { return byte(0x93); }
    PickleWriter& reduce() { return byte('R'); }
    PickleWriter& build() { return byte('b'); }
    PickleWriter& newobj() { return byte(0x81); }
    PickleWriter& obj() { return byte('o'); }

    PickleWriter& binint1(uint8_t v) { return byte('K').byte(v); }
    PickleWriter& binint(int32_t v) { byte('J'); return le(static_cast<uint32_t>(v), 4); }
    PickleWriter& int_line(const std::string& digits) { byte('I'); return text(digits + "\n"); }

    PickleWriter& short_binunicode(const std::string& s) {
        byte(0x8c).byte(static_cast<uint8_t>(s.size()));
        return text(s);
    }

    PickleWriter& binunicode(const std::string& s) {
        byte('X');
        le(s.size(), 4);
        return text(s);
    }

    PickleWriter& short_binbytes(const std::string& s) {
        byte('C').byte(static_cast<uint8_t>(s.size()));
        return text(s);
    }

    PickleWriter& string_line(const std::string& s) {
        byte('S');
        return text("'" + s + "'\n");
    }

    PickleWriter& empty_tuple() { return byte(')'); }
    PickleWriter& tuple() { return byte('t'); }
    PickleWriter& tuple1() { return byte(0x85); }
    PickleWriter& tuple2() { return byte(0x86); }
    PickleWriter& tuple3() { return byte(0x87); }
    PickleWriter& empty_list() { return byte(']'); }
    PickleWriter& append() { return byte('a'); }
    PickleWriter& appends() { return byte('e'); }
    PickleWriter& empty_dict() { return byte('}'); }
    PickleWriter& setitem() { return byte('s'); }
    PickleWriter& setitems() { return byte('u'); }

    PickleWriter& memoize() { return byte(0x94); }
    PickleWriter& binput(uint8_t key) { return byte('q').byte(key); }
    PickleWriter& binget(uint8_t key) { return byte('h').byte(key); }
    PickleWriter& binpersid() { return byte('Q'); }
    PickleWriter& next_buffer() { return byte(0x97); }

    PickleWriter& byte(uint8_t b) {
        bytes_.push_back(b);
        return *this;
    }

    PickleWriter& text(const std::string& s) {
        bytes_.insert(bytes_.end(), s.begin(), s.end());
        return *this;
    }

    PickleWriter& le(uint64_t v, size_t width) {
        for (size_t i = 0; i < width; ++i) {
            bytes_.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
        return *this;
    }

    PickleWriter& append_bytes(const std::vector<uint8_t>& more) {
        bytes_.insert(bytes_.end(), more.begin(), more.end());
        return *this;
    }

    const std::vector<uint8_t>& bytes() const { return bytes_; }
    std::string str() const { return std::string(bytes_.begin(), bytes_.end()); }
    size_t size() const { return bytes_.size(); }

private:
    std::vector<uint8_t> bytes_;
};

/// The classic payload: os.system(command) at protocol `proto`
inline std::vector<uint8_t> os_system_pickle(const std::string& command, uint8_t proto = 2) {
    PickleWriter w;
    w.proto(proto)
     .global("os", "system")
     .binunicode(command)
     .tuple1()
     .reduce()
     .stop();
    return w.bytes();
}

/// STACK_GLOBAL form with a module alias, as protocol 4 writes it
inline std::vector<uint8_t> posix_system_pickle(const std::string& command) {
    PickleWriter w;
    w.proto(4)
     .short_binunicode("posix").memoize()
     .short_binunicode("system").memoize()
     .stack_global().memoize()
     .short_binunicode(command).memoize()
     .tuple1().memoize()
     .reduce().memoize()
     .stop();
    return w.bytes();
}

/// A harmless state dict: {'weight': [1, 2, 3]}
inline std::vector<uint8_t> literal_pickle() {
    PickleWriter w;
    w.proto(2)
     .empty_dict().binput(0)
     .binunicode("weight")
     .empty_list().binput(1)
     .mark().binint1(1).binint1(2).binint1(3).appends()
     .setitem()
     .stop();
    return w.bytes();
}

inline ByteView view_of(const std::vector<uint8_t>& bytes) {
    return ByteView(bytes.data(), bytes.size());
}

inline ByteView view_of(const std::string& text) {
    return ByteView(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

/// Builds zip archives with stored and deflated members
class ZipWriter {
public:
    void add_stored(const std::string& name, const std::vector<uint8_t>& data) {
        add(name, data, data, 0);
    }

    void add_stored(const std::string& name, const std::string& data) {
        add_stored(name, std::vector<uint8_t>(data.begin(), data.end()));
    }

    void add_deflated(const std::string& name, const std::vector<uint8_t>& data) {
        add(name, data, raw_deflate(data), 8);
    }

    /// Finish the archive: central directory and end record
    std::vector<uint8_t> finish() const {
        std::vector<uint8_t> out = body_;
        const size_t cd_offset = out.size();
        for (const auto& e : entries_) {
            put32(out, 0x02014b50);
            put16(out, 20);          // version made by
            put16(out, 20);          // version needed
            put16(out, 0);           // flags
            put16(out, e.method);
            put16(out, 0);           // time
            put16(out, 0);           // date
            put32(out, e.crc);
            put32(out, e.compressed);
            put32(out, e.uncompressed);
            put16(out, static_cast<uint16_t>(e.name.size()));
            put16(out, 0);           // extra
            put16(out, 0);           // comment
            put16(out, 0);           // disk
            put16(out, 0);           // internal attributes
            put32(out, 0);           // external attributes
            put32(out, e.offset);
            out.insert(out.end(), e.name.begin(), e.name.end());
        }
        const size_t cd_size = out.size() - cd_offset;
        put32(out, 0x06054b50);
        put16(out, 0);
        put16(out, 0);
        put16(out, static_cast<uint16_t>(entries_.size()));
        put16(out, static_cast<uint16_t>(entries_.size()));
        put32(out, static_cast<uint32_t>(cd_size));
        put32(out, static_cast<uint32_t>(cd_offset));
        put16(out, 0);
        return out;
    }

private:
    struct Entry {
        std::string name;
        uint16_t method;
        uint32_t crc;
        uint32_t compressed;
        uint32_t uncompressed;
        uint32_t offset;
    };

    std::vector<uint8_t> body_;
    std::vector<Entry> entries_;

    static void put16(std::vector<uint8_t>& out, uint16_t v) {
        out.push_back(static_cast<uint8_t>(v));
        out.push_back(static_cast<uint8_t>(v >> 8));
    }

    static void put32(std::vector<uint8_t>& out, uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            out.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    }

    static std::vector<uint8_t> raw_deflate(const std::vector<uint8_t>& data) {
        z_stream zs{};
        if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                         Z_DEFAULT_STRATEGY) != Z_OK) {
            throw std::runtime_error("deflateInit2 failed");
        }
        std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(data.size())));
        zs.next_in = const_cast<Bytef*>(data.data());
        zs.avail_in = static_cast<uInt>(data.size());
        zs.next_out = out.data();
        zs.avail_out = static_cast<uInt>(out.size());
        int rc = deflate(&zs, Z_FINISH);
        deflateEnd(&zs);
        if (rc != Z_STREAM_END) {
            throw std::runtime_error("deflate failed");
        }
        out.resize(zs.total_out);
        return out;
    }

    void add(const std::string& name,
             const std::vector<uint8_t>& plain,
             const std::vector<uint8_t>& stored,
             uint16_t method) {
        Entry e;
        e.name = name;
        e.method = method;
        e.crc = static_cast<uint32_t>(
            crc32(0L, plain.empty() ? Z_NULL : plain.data(), static_cast<uInt>(plain.size())));
        e.compressed = static_cast<uint32_t>(stored.size());
        e.uncompressed = static_cast<uint32_t>(plain.size());
        e.offset = static_cast<uint32_t>(body_.size());

        put32(body_, 0x04034b50);
        put16(body_, 20);
        put16(body_, 0);
        put16(body_, method);
        put16(body_, 0);
        put16(body_, 0);
        put32(body_, e.crc);
        put32(body_, e.compressed);
        put32(body_, e.uncompressed);
        put16(body_, static_cast<uint16_t>(name.size()));
        put16(body_, 0);
        body_.insert(body_.end(), name.begin(), name.end());
        body_.insert(body_.end(), stored.begin(), stored.end());
        entries_.push_back(e);
    }
};

} // namespace test_util
} // namespace sanityml

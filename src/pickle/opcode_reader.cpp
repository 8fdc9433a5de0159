#include "sanityml/pickle/opcode_reader.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <sstream>

namespace sanityml {
namespace pickle {

OpcodeReader::OpcodeReader(ByteView buffer, ReaderLimits limits, size_t start)
    : buf_(buffer)
    , limits_(std::move(limits))
    , start_(start)
    , pos_(start) {}

void OpcodeReader::require(size_t n, const char* what) {
    if (n > remaining()) {
        throw TruncatedStreamError(
            std::string("Stream ends inside ") + what + " argument", op_start_);
    }
}

uint8_t OpcodeReader::read_u8() {
    require(1, "one-byte");
    return buf_[pos_++];
}

uint64_t OpcodeReader::read_le(size_t width, const char* what) {
    require(width, what);
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value |= static_cast<uint64_t>(buf_[pos_ + i]) << (8 * i);
    }
    pos_ += width;
    return value;
}

std::string_view OpcodeReader::read_view(uint64_t len, const char* what) {
    // Security: compare against remaining bytes before any arithmetic on len
    if (len > remaining()) {
        throw TruncatedStreamError(
            std::string(what) + " length " + std::to_string(len) +
            " exceeds remaining " + std::to_string(remaining()) + " bytes",
            op_start_);
    }
    std::string_view view(reinterpret_cast<const char*>(buf_.data + pos_),
                          static_cast<size_t>(len));
    pos_ += static_cast<size_t>(len);
    return view;
}

std::string_view OpcodeReader::read_line(const char* what) {
    const char* begin = reinterpret_cast<const char*>(buf_.data + pos_);
    const void* nl = std::memchr(begin, '\n', remaining());
    if (!nl) {
        throw TruncatedStreamError(
            std::string("Unterminated ") + what + " line", op_start_);
    }
    size_t len = static_cast<const char*>(nl) - begin;
    pos_ += len + 1;
    std::string_view line(begin, len);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

OperationArg OpcodeReader::decode_arg(const OpcodeInfo& info) {
    switch (info.arg) {
        case ArgKind::None:
            return std::monostate{};

        case ArgKind::UInt1:
            return static_cast<int64_t>(read_u8());

        case ArgKind::UInt2:
            return static_cast<int64_t>(read_le(2, "two-byte"));

        case ArgKind::Int4:
            return static_cast<int64_t>(
                static_cast<int32_t>(static_cast<uint32_t>(read_le(4, "four-byte"))));

        case ArgKind::UInt4:
            return static_cast<int64_t>(read_le(4, "four-byte"));

        case ArgKind::UInt8: {
            uint64_t v = read_le(8, "eight-byte");
            if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                // FRAME lengths this large can never be satisfied
                throw TruncatedStreamError("Frame length out of range", op_start_);
            }
            return static_cast<int64_t>(v);
        }

        case ArgKind::Float8: {
            require(8, "float");
            uint64_t bits = 0;
            for (size_t i = 0; i < 8; ++i) {
                bits = (bits << 8) | buf_[pos_ + i];
            }
            pos_ += 8;
            double d;
            std::memcpy(&d, &bits, sizeof(d));
            return d;
        }

        case ArgKind::DecimalLine:
        case ArgKind::LongLine: {
            std::string_view text = read_line("integer");
            std::string_view digits = text;
            if (info.arg == ArgKind::LongLine && !digits.empty() && digits.back() == 'L') {
                digits.remove_suffix(1);
            }
            // INT encodes booleans as "00" / "01"
            if (auto v = parse_decimal(digits)) {
                return *v;
            }
            return text;
        }

        case ArgKind::FloatLine: {
            std::string_view text = read_line("float");
            std::string tmp(text);
            char* end = nullptr;
            double d = std::strtod(tmp.c_str(), &end);
            if (end && *end == '\0' && !tmp.empty()) {
                return d;
            }
            return text;
        }

        case ArgKind::StringLine:
            return unquote_string_arg(read_line("string"));

        case ArgKind::NoEscapeLine:
        case ArgKind::UnicodeLine:
            return read_line("text");

        case ArgKind::NoEscapeLinePair: {
            GlobalName g;
            g.module = read_line("module");
            g.name = read_line("name");
            return g;
        }

        case ArgKind::Bytes1:
        case ArgKind::String1:
        case ArgKind::Unicode1:
            return read_view(read_u8(), info.name);

        case ArgKind::Bytes4:
        case ArgKind::Unicode4:
            return read_view(read_le(4, "length"), info.name);

        case ArgKind::String4: {
            int32_t len = static_cast<int32_t>(static_cast<uint32_t>(read_le(4, "length")));
            if (len < 0) {
                throw TruncatedStreamError(
                    std::string(info.name) + " has negative length", op_start_);
            }
            return read_view(static_cast<uint64_t>(len), info.name);
        }

        case ArgKind::Bytes8:
        case ArgKind::Unicode8:
            return read_view(read_le(8, "length"), info.name);

        case ArgKind::Long1: {
            std::string_view raw = read_view(read_u8(), info.name);
            if (auto v = decode_long_bytes(raw)) {
                return *v;
            }
            return raw;
        }

        case ArgKind::Long4: {
            int32_t len = static_cast<int32_t>(static_cast<uint32_t>(read_le(4, "length")));
            if (len < 0) {
                throw TruncatedStreamError("LONG4 has negative length", op_start_);
            }
            std::string_view raw = read_view(static_cast<uint64_t>(len), info.name);
            if (auto v = decode_long_bytes(raw)) {
                return *v;
            }
            return raw;
        }
    }
    return std::monostate{};
}

void OpcodeReader::check_limits() {
    if (consumed() > limits_.max_stream_bytes) {
        throw StreamTooLargeError(
            "Stream exceeds " + std::to_string(limits_.max_stream_bytes) + " bytes",
            op_start_);
    }
    if (limits_.deadline && std::chrono::steady_clock::now() > *limits_.deadline) {
        throw ScanTimeoutError(op_start_);
    }
}

std::optional<Operation> OpcodeReader::next() {
    if (finished_) {
        return std::nullopt;
    }

    op_start_ = pos_;
    if (pos_ >= buf_.size) {
        throw TruncatedStreamError("Stream ends without STOP", pos_);
    }

    uint8_t byte = buf_[pos_++];
    const OpcodeInfo* info = lookup_opcode(byte);
    if (!info) {
        throw UnknownOpcodeError(byte, protocol_, op_start_);
    }
    // Newer opcodes still decode; only the first is recorded
    if (declared_ && info->code != Opcode::PROTO && info->protocol > protocol_ &&
        !newer_opcode_) {
        newer_opcode_ = ScanFailure::from(UnknownOpcodeError(byte, protocol_, op_start_));
    }

    Operation op;
    op.opcode = info->code;
    op.offset = op_start_;
    op.arg = decode_arg(*info);

    switch (op.opcode) {
        case Opcode::PROTO: {
            if (op_count_ != 0) {
                throw ProtocolMismatchError("PROTO marker not at stream start", op_start_);
            }
            int64_t proto = op.int_arg();
            if (proto > HIGHEST_PROTOCOL) {
                throw ProtocolMismatchError(
                    "Unsupported protocol " + std::to_string(proto), op_start_);
            }
            // Protocols 0 and 1 share one opcode set as far as the reader is concerned
            protocol_ = std::max(static_cast<int>(proto), DEFAULT_PROTOCOL);
            declared_ = true;
            break;
        }
        case Opcode::FRAME:
            // Frames are advisory; only validate that the frame fits
            if (static_cast<uint64_t>(op.int_arg()) > remaining()) {
                throw TruncatedStreamError("Frame extends past end of stream", op_start_);
            }
            break;
        case Opcode::STOP:
            finished_ = true;
            break;
        default:
            break;
    }

    ++op_count_;
    check_limits();
    return op;
}

// ============================================================================
// Argument decoding helpers
// ============================================================================

std::optional<int64_t> decode_long_bytes(std::string_view bytes) {
    if (bytes.empty()) {
        return 0;
    }
    // Strip redundant sign-extension bytes before checking width
    size_t n = bytes.size();
    bool negative = (static_cast<uint8_t>(bytes[n - 1]) & 0x80) != 0;
    uint8_t pad = negative ? 0xff : 0x00;
    while (n > 1 && static_cast<uint8_t>(bytes[n - 1]) == pad &&
           (static_cast<uint8_t>(bytes[n - 2]) & 0x80) == (pad & 0x80)) {
        --n;
    }
    if (n > 8) {
        return std::nullopt;
    }
    uint64_t value = negative ? ~uint64_t(0) : 0;
    for (size_t i = 0; i < n; ++i) {
        value &= ~(uint64_t(0xff) << (8 * i));
        value |= static_cast<uint64_t>(static_cast<uint8_t>(bytes[i])) << (8 * i);
    }
    return static_cast<int64_t>(value);
}

std::optional<int64_t> parse_decimal(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    size_t i = 0;
    bool negative = false;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        i = 1;
    }
    if (i == text.size()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    const uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1;
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > limit) {
            return std::nullopt;
        }
    }
    if (!negative && value == limit) {
        return std::nullopt;
    }
    return negative ? static_cast<int64_t>(0 - value) : static_cast<int64_t>(value);
}

std::string_view unquote_string_arg(std::string_view text) {
    if (text.size() >= 2) {
        char q = text.front();
        if ((q == '\'' || q == '"') && text.back() == q) {
            return text.substr(1, text.size() - 2);
        }
    }
    return text;
}

namespace {

std::string quote_preview(std::string_view text, size_t max_chars) {
    std::string out = "'";
    size_t n = std::min(text.size(), max_chars);
    for (size_t i = 0; i < n; ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '\\' || c == '\'') {
            out += '\\';
            out += static_cast<char>(c);
        } else if (c >= 0x20 && c < 0x7f) {
            out += static_cast<char>(c);
        } else {
            char hex[5];
            std::snprintf(hex, sizeof(hex), "\\x%02x", c);
            out += hex;
        }
    }
    out += '\'';
    if (text.size() > max_chars) {
        out += "...";
    }
    return out;
}

} // anonymous namespace

std::string format_operation(const Operation& op, size_t max_arg_chars) {
    std::ostringstream out;
    char head[32];
    uint8_t code = static_cast<uint8_t>(op.opcode);
    if (code >= 0x20 && code < 0x7f) {
        std::snprintf(head, sizeof(head), "%5zu: %c    ", op.offset, static_cast<char>(code));
    } else {
        std::snprintf(head, sizeof(head), "%5zu: \\x%02x ", op.offset, code);
    }
    out << head << opcode_name(op.opcode);

    if (auto v = std::get_if<int64_t>(&op.arg)) {
        out << " " << *v;
    } else if (auto d = std::get_if<double>(&op.arg)) {
        out << " " << *d;
    } else if (auto s = std::get_if<std::string_view>(&op.arg)) {
        out << " " << quote_preview(*s, max_arg_chars);
    } else if (auto g = std::get_if<GlobalName>(&op.arg)) {
        out << " '" << g->module << " " << g->name << "'";
    }
    return out.str();
}

} // namespace pickle
} // namespace sanityml

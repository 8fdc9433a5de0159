#pragma once

// Opcode Stream Reader
//
// Decodes a pickle byte stream into a sequence of Operation records in a
// single forward pass. Nothing is evaluated: text and byte arguments are
// views into the caller's buffer, so no opcode can make the reader
// allocate memory proportional to a size declared inside the stream.

#include "sanityml/errors.hpp"
#include "sanityml/pickle/opcodes.hpp"
#include "sanityml/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace sanityml {
namespace pickle {

/// Module and symbol named by GLOBAL / INST
struct GlobalName {
    std::string_view module;
    std::string_view name;
};

/// Inline argument of an operation.
/// Integers that do not fit in int64_t keep their raw encoding as a view.
using OperationArg = std::variant<std::monostate, int64_t, double, std::string_view, GlobalName>;

/// One decoded instruction
struct Operation {
    Opcode opcode = Opcode::STOP;
    size_t offset = 0;    // absolute offset of the opcode byte in the stream buffer
    OperationArg arg;

    const OpcodeInfo& info() const { return opcode_info(opcode); }

    bool has_int() const { return std::holds_alternative<int64_t>(arg); }
    bool has_text() const { return std::holds_alternative<std::string_view>(arg); }

    int64_t int_arg() const { return std::get<int64_t>(arg); }
    std::string_view text_arg() const { return std::get<std::string_view>(arg); }
    const GlobalName& global_arg() const { return std::get<GlobalName>(arg); }
};

/// Limits applied while reading one stream
struct ReaderLimits {
    /// Hard cap on bytes consumed by one stream
    uint64_t max_stream_bytes = 2ULL * 1024 * 1024 * 1024;

    /// Cooperative deadline, checked after every operation
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

/// Single-pass pickle opcode decoder.
///
/// Usage:
///     OpcodeReader reader(bytes, limits);
///     while (auto op = reader.next()) { ... }
///
/// next() throws TruncatedStreamError, UnknownOpcodeError (byte not in the
/// table), ProtocolMismatchError, StreamTooLargeError or ScanTimeoutError.
/// After a throw the reader must not be used again.
///
/// A stream without PROTO accepts every opcode. In a declared stream an
/// opcode introduced after the declared protocol is decoded normally and
/// the first one is kept in newer_opcode().
class OpcodeReader {
public:
    /// @param buffer Stream bytes; must outlive the reader and its operations
    /// @param limits Size cap and deadline
    /// @param start  Offset of the first opcode within buffer
    OpcodeReader(ByteView buffer, ReaderLimits limits = {}, size_t start = 0);

    /// Decode the next operation; empty once STOP has been returned
    std::optional<Operation> next();

    /// True after STOP was decoded
    bool finished() const { return finished_; }

    /// Protocol in effect (DEFAULT_PROTOCOL until a PROTO marker is seen)
    int protocol() const { return protocol_; }

    /// True once a PROTO marker was decoded
    bool protocol_declared() const { return declared_; }

    /// First opcode newer than the declared protocol, as an UnknownOpcode failure
    const std::optional<ScanFailure>& newer_opcode() const { return newer_opcode_; }

    /// Current absolute read position
    size_t position() const { return pos_; }

    /// Bytes consumed since the stream start
    size_t consumed() const { return pos_ - start_; }

    /// Number of operations decoded so far
    size_t operation_count() const { return op_count_; }

private:
    ByteView buf_;
    ReaderLimits limits_;
    size_t start_;
    size_t pos_;
    size_t op_start_ = 0;
    size_t op_count_ = 0;
    int protocol_ = DEFAULT_PROTOCOL;
    bool declared_ = false;
    bool finished_ = false;
    std::optional<ScanFailure> newer_opcode_;

    size_t remaining() const { return pos_ < buf_.size ? buf_.size - pos_ : 0; }

    void require(size_t n, const char* what);
    uint8_t read_u8();
    uint64_t read_le(size_t width, const char* what);
    std::string_view read_view(uint64_t len, const char* what);
    std::string_view read_line(const char* what);

    OperationArg decode_arg(const OpcodeInfo& info);
    void check_limits();
};

// ============================================================================
// Argument decoding helpers
// ============================================================================

/// Decode a little-endian two's complement integer (LONG1/LONG4 payload).
/// Returns std::nullopt when the value does not fit in int64_t.
std::optional<int64_t> decode_long_bytes(std::string_view bytes);

/// Parse a decimal text argument (INT / LONG / GET / PUT); std::nullopt if invalid
std::optional<int64_t> parse_decimal(std::string_view text);

/// Strip the quotes of a protocol-0 STRING argument
std::string_view unquote_string_arg(std::string_view text);

/// Render an operation on one line, pickletools style:
///     "   12: \x93 STACK_GLOBAL"
///     "    2: \x8c SHORT_BINUNICODE 'posix'"
std::string format_operation(const Operation& op, size_t max_arg_chars = 60);

} // namespace pickle
} // namespace sanityml

#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace sanityml {

// ============================================================================
// Path Sanitization for Error Messages
// ============================================================================

/// When true (default for release builds), full paths are stripped to
/// basename only in exception messages.
#ifndef SANITYML_SANITIZE_ERROR_PATHS
#ifdef NDEBUG
#define SANITYML_SANITIZE_ERROR_PATHS 1
#else
#define SANITYML_SANITIZE_ERROR_PATHS 0
#endif
#endif

/// Extract filename from a path for error messages
inline std::string sanitize_path_for_error(const std::string& path) {
#if SANITYML_SANITIZE_ERROR_PATHS
    size_t last_sep = path.find_last_of("/\\");
    if (last_sep != std::string::npos) {
        return path.substr(last_sep + 1);
    }
#endif
    return path;
}

/// Base exception for all sanityml errors
class SanityMLError : public std::exception {
public:
    explicit SanityMLError(std::string message)
        : message_(std::move(message)) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

protected:
    std::string message_;
};

/// Raised when the rule table cannot be loaded.
/// This is the only fatal error class: it is raised before any artifact
/// is scanned and aborts the run.
class RuleLoadError : public SanityMLError {
public:
    RuleLoadError(const std::string& message,
                  int line = -1,
                  std::optional<std::string> source = std::nullopt)
        : SanityMLError(build_message(message, line, source))
        , line_(line) {}

    /// 1-based line of the offending rule, or -1
    int line() const { return line_; }

private:
    static std::string build_message(const std::string& message,
                                     int line,
                                     const std::optional<std::string>& source) {
        std::string msg = "Rule table error";
        if (source.has_value()) {
            msg += " in " + sanitize_path_for_error(source.value());
        }
        if (line > 0) {
            msg += " at line " + std::to_string(line);
        }
        return msg + ": " + message;
    }

    int line_;
};

/// Raised for invalid scan options
class OptionsError : public SanityMLError {
public:
    explicit OptionsError(const std::vector<std::string>& errors)
        : SanityMLError(build_message(errors))
        , errors_(errors) {}

    const std::vector<std::string>& errors() const { return errors_; }

private:
    static std::string build_message(const std::vector<std::string>& errors) {
        std::string msg = "Invalid scan options:\n";
        for (const auto& e : errors) {
            msg += "  - " + e + "\n";
        }
        return msg;
    }

    std::vector<std::string> errors_;
};

// ============================================================================
// Artifact-local errors
// ============================================================================

/// Failure kinds that end the processing of a single artifact.
/// None of them aborts the overall run.
enum class ScanErrorKind {
    TruncatedStream,
    UnknownOpcode,
    ProtocolMismatch,
    StreamTooLarge,
    StackUnderflow,
    NoPickleStreamFound,
    ContainerCorrupt,
    ScanTimeout,
    ReadError,
};

/// Name of an error kind as shown in evidence text
const char* scan_error_kind_name(ScanErrorKind kind);

/// Base class of all artifact-local errors
class StreamError : public SanityMLError {
public:
    StreamError(ScanErrorKind kind, const std::string& message, size_t offset = 0)
        : SanityMLError(message)
        , kind_(kind)
        , offset_(offset) {}

    ScanErrorKind kind() const { return kind_; }

    /// Byte offset at which the failure was detected
    size_t offset() const { return offset_; }

private:
    ScanErrorKind kind_;
    size_t offset_;
};

/// An argument's declared length runs past the end of the buffer
class TruncatedStreamError : public StreamError {
public:
    TruncatedStreamError(const std::string& message, size_t offset)
        : StreamError(ScanErrorKind::TruncatedStream, message, offset) {}
};

/// Opcode byte unknown for the declared protocol
class UnknownOpcodeError : public StreamError {
public:
    UnknownOpcodeError(uint8_t opcode, int protocol, size_t offset)
        : StreamError(ScanErrorKind::UnknownOpcode,
                      "Unknown opcode 0x" + hex_byte(opcode) +
                      " for protocol " + std::to_string(protocol), offset)
        , opcode_(opcode) {}

    uint8_t opcode() const { return opcode_; }

private:
    static std::string hex_byte(uint8_t b) {
        static const char digits[] = "0123456789abcdef";
        return {digits[b >> 4], digits[b & 0x0f]};
    }

    uint8_t opcode_;
};

/// Protocol marker in the wrong place, or an unsupported protocol number
class ProtocolMismatchError : public StreamError {
public:
    ProtocolMismatchError(const std::string& message, size_t offset)
        : StreamError(ScanErrorKind::ProtocolMismatch, message, offset) {}
};

/// A configured size or count limit was exceeded
class StreamTooLargeError : public StreamError {
public:
    StreamTooLargeError(const std::string& message, size_t offset)
        : StreamError(ScanErrorKind::StreamTooLarge, message, offset) {}
};

/// Pop from an empty stack frame
class StackUnderflowError : public StreamError {
public:
    StackUnderflowError(const std::string& message, size_t offset)
        : StreamError(ScanErrorKind::StackUnderflow, message, offset) {}
};

/// Malformed archive framing
class ContainerCorruptError : public StreamError {
public:
    ContainerCorruptError(const std::string& message, size_t offset = 0)
        : StreamError(ScanErrorKind::ContainerCorrupt, message, offset) {}
};

/// Container holds nothing that can be inspected
class NoPickleStreamError : public StreamError {
public:
    explicit NoPickleStreamError(const std::string& message)
        : StreamError(ScanErrorKind::NoPickleStreamFound, message, 0) {}
};

/// Artifact could not be opened or read
class ArtifactReadError : public StreamError {
public:
    explicit ArtifactReadError(const std::string& message)
        : StreamError(ScanErrorKind::ReadError, message, 0) {}
};

/// Per-artifact deadline expired
class ScanTimeoutError : public StreamError {
public:
    explicit ScanTimeoutError(size_t offset = 0)
        : StreamError(ScanErrorKind::ScanTimeout,
                      "Scan deadline expired", offset) {}
};

/// Artifact-local error detached from the exception object, so it can be
/// stored next to a partial result
struct ScanFailure {
    ScanErrorKind kind = ScanErrorKind::ReadError;
    std::string message;
    size_t offset = 0;

    static ScanFailure from(const StreamError& e) {
        return ScanFailure{e.kind(), e.what(), e.offset()};
    }
};

} // namespace sanityml

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sanityml {

// ============================================================================
// Security Helper Functions
// ============================================================================

/// Check if adding two size_t values would overflow
inline size_t checked_add(size_t a, size_t b) {
    if (a > std::numeric_limits<size_t>::max() - b) {
        throw std::overflow_error("Integer overflow in addition");
    }
    return a + b;
}

/// Finding severity, ordered from least to most severe
enum class Severity : uint8_t {
    Info = 0,
    Warn = 1,
    Critical = 2
};

/// Convert severity to string name
inline std::string severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warn: return "warn";
        case Severity::Critical: return "critical";
        default: throw std::invalid_argument("Unknown severity");
    }
}

/// Parse severity from string name
inline Severity severity_from_name(const std::string& name) {
    if (name == "info") return Severity::Info;
    if (name == "warn" || name == "warning") return Severity::Warn;
    if (name == "critical") return Severity::Critical;
    throw std::invalid_argument("Unknown severity name: " + name);
}

/// Non-owning read-only window over artifact bytes.
/// The owner of the underlying buffer must outlive every view.
struct ByteView {
    const uint8_t* data = nullptr;
    size_t size = 0;

    ByteView() = default;
    ByteView(const uint8_t* d, size_t n) : data(d), size(n) {}

    bool empty() const { return size == 0; }

    uint8_t operator[](size_t i) const { return data[i]; }

    /// Sub-range [offset, offset + length); throws std::out_of_range
    ByteView subview(size_t offset, size_t length) const {
        if (offset > size || length > size - offset) {
            throw std::out_of_range("ByteView::subview out of range");
        }
        return ByteView(data + offset, length);
    }

    /// Check that `prefix` occurs at `offset`
    bool matches(size_t offset, std::string_view prefix) const {
        if (offset > size || prefix.size() > size - offset) {
            return false;
        }
        for (size_t i = 0; i < prefix.size(); ++i) {
            if (data[offset + i] != static_cast<uint8_t>(prefix[i])) {
                return false;
            }
        }
        return true;
    }

    std::string_view as_string_view() const {
        return std::string_view(reinterpret_cast<const char*>(data), size);
    }
};

/// Artifact categories produced by discovery
enum class ArtifactClass : uint8_t {
    Source = 0,
    Notebook = 1,
    Requirements = 2,
    Model = 3
};

/// Convert artifact class to string name
inline std::string artifact_class_name(ArtifactClass kind) {
    switch (kind) {
        case ArtifactClass::Source: return "source";
        case ArtifactClass::Notebook: return "notebook";
        case ArtifactClass::Requirements: return "requirements";
        case ArtifactClass::Model: return "model";
        default: throw std::invalid_argument("Unknown artifact class");
    }
}

} // namespace sanityml

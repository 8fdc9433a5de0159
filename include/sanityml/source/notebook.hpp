#pragma once

// Notebook extraction
//
// Turns a Jupyter notebook into plain Python text for the source scanner,
// keeping a map from each output line back to its cell.

#include "sanityml/errors.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sanityml {
namespace source {

/// Raised for notebooks that are not valid JSON or lack a cell list
class NotebookFormatError : public SanityMLError {
public:
    NotebookFormatError(const std::string& message, size_t offset)
        : SanityMLError(message)
        , offset_(offset) {}

    size_t offset() const { return offset_; }

private:
    size_t offset_;
};

/// Origin of one extracted line
struct CellLine {
    uint32_t cell = 0;  // 1-based cell index in the notebook
    uint32_t line = 0;  // 1-based line within the cell
};

struct NotebookSource {
    std::string code;                 // concatenated code cells
    std::vector<CellLine> line_map;   // entry i describes line i + 1 of `code`
    size_t cells = 0;
    size_t code_cells = 0;            // non-empty code cells that were extracted

    /// Map a 1-based line of `code` back to its cell; {0, line} if out of range
    CellLine origin(uint32_t line) const;
};

/// Extract code cells. Empty and comment-only cells are skipped.
/// Throws NotebookFormatError on malformed JSON.
NotebookSource extract_notebook(std::string_view json_text);

// ============================================================================
// Minimal JSON document model
// ============================================================================

struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };

    Type type = Type::Null;
    bool boolean = false;
    double number = 0.0;
    std::string string;
    std::vector<JsonValue> array;
    std::vector<std::pair<std::string, JsonValue>> object;

    bool is_string() const { return type == Type::String; }
    bool is_array() const { return type == Type::Array; }
    bool is_object() const { return type == Type::Object; }

    /// Object member lookup; nullptr when absent or not an object
    const JsonValue* get(const std::string& key) const;
};

/// Parse a JSON document; throws NotebookFormatError with the byte offset.
/// Nesting is limited to keep recursion bounded on hostile input.
JsonValue parse_json(std::string_view text);

} // namespace source
} // namespace sanityml

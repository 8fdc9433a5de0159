#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sanityml {
namespace pickle {

/// Index of a Value in a graph arena
using ValueId = uint32_t;

constexpr ValueId NO_VALUE = 0xffffffffu;

/// Abstract token kinds on the virtual stack
enum class ValueKind : uint8_t {
    Literal,      // inert data: numbers, strings, containers
    GlobalRef,    // symbol import (module, name)
    Constructed,  // a call the real unpickler would perform
    Mark,         // frame boundary
    Memoized,     // memo reference that could not be resolved
    Unknown       // out-of-band data (NEXT_BUFFER)
};

enum class LiteralKind : uint8_t {
    None,
    Bool,
    Int,
    Float,
    String,
    Bytes,
    ByteArray,
    Tuple,
    List,
    Dict,
    Set,
    FrozenSet,
};

/// Opcode family that produced a Constructed value
enum class CallKind : uint8_t {
    Reduce,          // REDUCE: callee(*args)
    NewObj,          // NEWOBJ: cls.__new__(cls, *args)
    NewObjEx,        // NEWOBJ_EX: cls.__new__(cls, *args, **kwargs)
    Inst,            // INST: module.name(*args)
    Obj,             // OBJ: cls(*args)
    Build,           // BUILD: obj.__setstate__(state)
    Extension,       // EXT1/EXT2/EXT4 registry lookup
    PersistentLoad,  // PERSID/BINPERSID: persistent_load(pid)
};

/// One node of the capability graph.
///
/// Values live in an arena owned by the graph and refer to each other by
/// ValueId, so self-referencing containers and shared memo entries never
/// create ownership cycles.
struct Value {
    ValueKind kind = ValueKind::Unknown;
    LiteralKind literal = LiteralKind::None;
    CallKind call = CallKind::Reduce;

    /// Literal preview, or module for GlobalRef
    std::string text;

    /// Symbol name for GlobalRef
    std::string name;

    /// Callable of a Constructed value
    ValueId callee = NO_VALUE;

    /// Container elements, or call arguments of a Constructed value
    std::vector<ValueId> items;

    /// Items appended to something that is not a literal container
    std::vector<ValueId> attached;

    /// Memo key for Memoized, extension code for Extension callees
    uint64_t memo_id = 0;

    /// Offset of the opcode that produced this value
    size_t offset = 0;

    /// GlobalRef operands were not literal strings
    bool dynamic = false;

    /// Literal preview was cut at the configured length
    bool truncated = false;

    bool is_capability() const {
        return kind == ValueKind::GlobalRef || kind == ValueKind::Constructed;
    }
};

const char* value_kind_name(ValueKind kind);
const char* literal_kind_name(LiteralKind kind);
const char* call_kind_name(CallKind kind);

} // namespace pickle
} // namespace sanityml

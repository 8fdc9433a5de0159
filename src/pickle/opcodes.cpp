#include "sanityml/pickle/opcodes.hpp"

#include <array>
#include <stdexcept>

namespace sanityml {
namespace pickle {

namespace {

constexpr StackEffect fixed(int8_t pops, int8_t pushes) {
    return StackEffect{pops, pushes, false};
}

constexpr StackEffect marked(int8_t pushes) {
    return StackEffect{0, pushes, true};
}

const OpcodeInfo OPCODE_TABLE[] = {
    // Protocol 0
    {Opcode::MARK,            "MARK",            ArgKind::None,             0, fixed(0, 1)},
    {Opcode::STOP,            "STOP",            ArgKind::None,             0, fixed(1, 0)},
    {Opcode::POP,             "POP",             ArgKind::None,             0, fixed(1, 0)},
    {Opcode::DUP,             "DUP",             ArgKind::None,             0, fixed(1, 2)},
    {Opcode::FLOAT,           "FLOAT",           ArgKind::FloatLine,        0, fixed(0, 1)},
    {Opcode::INT,             "INT",             ArgKind::DecimalLine,      0, fixed(0, 1)},
    {Opcode::LONG,            "LONG",            ArgKind::LongLine,         0, fixed(0, 1)},
    {Opcode::NONE,            "NONE",            ArgKind::None,             0, fixed(0, 1)},
    {Opcode::PERSID,          "PERSID",          ArgKind::NoEscapeLine,     0, fixed(0, 1)},
    {Opcode::REDUCE,          "REDUCE",          ArgKind::None,             0, fixed(2, 1)},
    {Opcode::STRING,          "STRING",          ArgKind::StringLine,       0, fixed(0, 1)},
    {Opcode::UNICODE,         "UNICODE",         ArgKind::UnicodeLine,      0, fixed(0, 1)},
    {Opcode::APPEND,          "APPEND",          ArgKind::None,             0, fixed(2, 1)},
    {Opcode::BUILD,           "BUILD",           ArgKind::None,             0, fixed(2, 1)},
    {Opcode::GLOBAL,          "GLOBAL",          ArgKind::NoEscapeLinePair, 0, fixed(0, 1)},
    {Opcode::DICT,            "DICT",            ArgKind::None,             0, marked(1)},
    {Opcode::GET,             "GET",             ArgKind::DecimalLine,      0, fixed(0, 1)},
    {Opcode::INST,            "INST",            ArgKind::NoEscapeLinePair, 0, marked(1)},
    {Opcode::LIST,            "LIST",            ArgKind::None,             0, marked(1)},
    {Opcode::PUT,             "PUT",             ArgKind::DecimalLine,      0, fixed(0, 0)},
    {Opcode::SETITEM,         "SETITEM",         ArgKind::None,             0, fixed(3, 1)},
    {Opcode::TUPLE,           "TUPLE",           ArgKind::None,             0, marked(1)},

    // Protocol 1
    {Opcode::POP_MARK,        "POP_MARK",        ArgKind::None,             1, marked(0)},
    {Opcode::BININT,          "BININT",          ArgKind::Int4,             1, fixed(0, 1)},
    {Opcode::BININT1,         "BININT1",         ArgKind::UInt1,            1, fixed(0, 1)},
    {Opcode::BININT2,         "BININT2",         ArgKind::UInt2,            1, fixed(0, 1)},
    {Opcode::BINPERSID,       "BINPERSID",       ArgKind::None,             1, fixed(1, 1)},
    {Opcode::BINSTRING,       "BINSTRING",       ArgKind::String4,          1, fixed(0, 1)},
    {Opcode::SHORT_BINSTRING, "SHORT_BINSTRING", ArgKind::String1,          1, fixed(0, 1)},
    {Opcode::BINUNICODE,      "BINUNICODE",      ArgKind::Unicode4,         1, fixed(0, 1)},
    {Opcode::EMPTY_DICT,      "EMPTY_DICT",      ArgKind::None,             1, fixed(0, 1)},
    {Opcode::APPENDS,         "APPENDS",         ArgKind::None,             1, marked(0)},
    {Opcode::BINGET,          "BINGET",          ArgKind::UInt1,            1, fixed(0, 1)},
    {Opcode::LONG_BINGET,     "LONG_BINGET",     ArgKind::UInt4,            1, fixed(0, 1)},
    {Opcode::EMPTY_LIST,      "EMPTY_LIST",      ArgKind::None,             1, fixed(0, 1)},
    {Opcode::OBJ,             "OBJ",             ArgKind::None,             1, marked(1)},
    {Opcode::BINPUT,          "BINPUT",          ArgKind::UInt1,            1, fixed(0, 0)},
    {Opcode::LONG_BINPUT,     "LONG_BINPUT",     ArgKind::UInt4,            1, fixed(0, 0)},
    {Opcode::EMPTY_TUPLE,     "EMPTY_TUPLE",     ArgKind::None,             1, fixed(0, 1)},
    {Opcode::SETITEMS,        "SETITEMS",        ArgKind::None,             1, marked(0)},
    {Opcode::BINFLOAT,        "BINFLOAT",        ArgKind::Float8,           1, fixed(0, 1)},

    // Protocol 2
    {Opcode::PROTO,           "PROTO",           ArgKind::UInt1,            2, fixed(0, 0)},
    {Opcode::NEWOBJ,          "NEWOBJ",          ArgKind::None,             2, fixed(2, 1)},
    {Opcode::EXT1,            "EXT1",            ArgKind::UInt1,            2, fixed(0, 1)},
    {Opcode::EXT2,            "EXT2",            ArgKind::UInt2,            2, fixed(0, 1)},
    {Opcode::EXT4,            "EXT4",            ArgKind::Int4,             2, fixed(0, 1)},
    {Opcode::TUPLE1,          "TUPLE1",          ArgKind::None,             2, fixed(1, 1)},
    {Opcode::TUPLE2,          "TUPLE2",          ArgKind::None,             2, fixed(2, 1)},
    {Opcode::TUPLE3,          "TUPLE3",          ArgKind::None,             2, fixed(3, 1)},
    {Opcode::NEWTRUE,         "NEWTRUE",         ArgKind::None,             2, fixed(0, 1)},
    {Opcode::NEWFALSE,        "NEWFALSE",        ArgKind::None,             2, fixed(0, 1)},
    {Opcode::LONG1,           "LONG1",           ArgKind::Long1,            2, fixed(0, 1)},
    {Opcode::LONG4,           "LONG4",           ArgKind::Long4,            2, fixed(0, 1)},

    // Protocol 3
    {Opcode::BINBYTES,        "BINBYTES",        ArgKind::Bytes4,           3, fixed(0, 1)},
    {Opcode::SHORT_BINBYTES,  "SHORT_BINBYTES",  ArgKind::Bytes1,           3, fixed(0, 1)},

    // Protocol 4
    {Opcode::SHORT_BINUNICODE, "SHORT_BINUNICODE", ArgKind::Unicode1,       4, fixed(0, 1)},
    {Opcode::BINUNICODE8,     "BINUNICODE8",     ArgKind::Unicode8,         4, fixed(0, 1)},
    {Opcode::BINBYTES8,       "BINBYTES8",       ArgKind::Bytes8,           4, fixed(0, 1)},
    {Opcode::EMPTY_SET,       "EMPTY_SET",       ArgKind::None,             4, fixed(0, 1)},
    {Opcode::ADDITEMS,        "ADDITEMS",        ArgKind::None,             4, marked(0)},
    {Opcode::FROZENSET,       "FROZENSET",       ArgKind::None,             4, marked(1)},
    {Opcode::NEWOBJ_EX,       "NEWOBJ_EX",       ArgKind::None,             4, fixed(3, 1)},
    {Opcode::STACK_GLOBAL,    "STACK_GLOBAL",    ArgKind::None,             4, fixed(2, 1)},
    {Opcode::MEMOIZE,         "MEMOIZE",         ArgKind::None,             4, fixed(0, 0)},
    {Opcode::FRAME,           "FRAME",           ArgKind::UInt8,            4, fixed(0, 0)},

    // Protocol 5
    {Opcode::BYTEARRAY8,      "BYTEARRAY8",      ArgKind::Bytes8,           5, fixed(0, 1)},
    {Opcode::NEXT_BUFFER,     "NEXT_BUFFER",     ArgKind::None,             5, fixed(0, 1)},
    {Opcode::READONLY_BUFFER, "READONLY_BUFFER", ArgKind::None,             5, fixed(1, 1)},
};

const std::array<const OpcodeInfo*, 256>& byte_index() {
    static const std::array<const OpcodeInfo*, 256> index = [] {
        std::array<const OpcodeInfo*, 256> table{};
        for (const auto& info : OPCODE_TABLE) {
            table[static_cast<uint8_t>(info.code)] = &info;
        }
        return table;
    }();
    return index;
}

} // anonymous namespace

const OpcodeInfo* lookup_opcode(uint8_t byte) {
    return byte_index()[byte];
}

const OpcodeInfo& opcode_info(Opcode code) {
    const OpcodeInfo* info = lookup_opcode(static_cast<uint8_t>(code));
    if (!info) {
        throw std::invalid_argument("Opcode missing from table");
    }
    return *info;
}

const char* opcode_name(Opcode code) {
    const OpcodeInfo* info = lookup_opcode(static_cast<uint8_t>(code));
    return info ? info->name : "?";
}

bool arg_is_text(ArgKind kind) {
    switch (kind) {
        case ArgKind::StringLine:
        case ArgKind::String1:
        case ArgKind::String4:
        case ArgKind::NoEscapeLine:
        case ArgKind::NoEscapeLinePair:
        case ArgKind::UnicodeLine:
        case ArgKind::Unicode1:
        case ArgKind::Unicode4:
        case ArgKind::Unicode8:
            return true;
        default:
            return false;
    }
}

} // namespace pickle
} // namespace sanityml

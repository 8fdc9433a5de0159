#pragma once

// Pickle protocol opcode table
//
// Every instruction of protocols 0 through 5, with the encoding of its
// inline argument, the protocol that introduced it and its effect on the
// unpickler stack. The table is static data; lookups never allocate.

#include <cstdint>

namespace sanityml {
namespace pickle {

/// Highest protocol understood by the reader
constexpr int HIGHEST_PROTOCOL = 5;

/// Protocol assumed when a stream carries no PROTO marker
constexpr int DEFAULT_PROTOCOL = 1;

enum class Opcode : uint8_t {
    MARK = '(',
    STOP = '.',
    POP = '0',
    POP_MARK = '1',
    DUP = '2',
    FLOAT = 'F',
    INT = 'I',
    BININT = 'J',
    BININT1 = 'K',
    LONG = 'L',
    BININT2 = 'M',
    NONE = 'N',
    PERSID = 'P',
    BINPERSID = 'Q',
    REDUCE = 'R',
    STRING = 'S',
    BINSTRING = 'T',
    SHORT_BINSTRING = 'U',
    UNICODE = 'V',
    BINUNICODE = 'X',
    APPEND = 'a',
    BUILD = 'b',
    GLOBAL = 'c',
    DICT = 'd',
    EMPTY_DICT = '}',
    APPENDS = 'e',
    GET = 'g',
    BINGET = 'h',
    INST = 'i',
    LONG_BINGET = 'j',
    LIST = 'l',
    EMPTY_LIST = ']',
    OBJ = 'o',
    PUT = 'p',
    BINPUT = 'q',
    LONG_BINPUT = 'r',
    SETITEM = 's',
    TUPLE = 't',
    EMPTY_TUPLE = ')',
    SETITEMS = 'u',
    BINFLOAT = 'G',

    // Protocol 2
    PROTO = 0x80,
    NEWOBJ = 0x81,
    EXT1 = 0x82,
    EXT2 = 0x83,
    EXT4 = 0x84,
    TUPLE1 = 0x85,
    TUPLE2 = 0x86,
    TUPLE3 = 0x87,
    NEWTRUE = 0x88,
    NEWFALSE = 0x89,
    LONG1 = 0x8a,
    LONG4 = 0x8b,

    // Protocol 3
    BINBYTES = 'B',
    SHORT_BINBYTES = 'C',

    // Protocol 4
    SHORT_BINUNICODE = 0x8c,
    BINUNICODE8 = 0x8d,
    BINBYTES8 = 0x8e,
    EMPTY_SET = 0x8f,
    ADDITEMS = 0x90,
    FROZENSET = 0x91,
    NEWOBJ_EX = 0x92,
    STACK_GLOBAL = 0x93,
    MEMOIZE = 0x94,
    FRAME = 0x95,

    // Protocol 5
    BYTEARRAY8 = 0x96,
    NEXT_BUFFER = 0x97,
    READONLY_BUFFER = 0x98,
};

/// Encoding of an opcode's inline argument
enum class ArgKind : uint8_t {
    None,
    UInt1,            // 1-byte unsigned
    UInt2,            // 2-byte little-endian unsigned
    Int4,             // 4-byte little-endian signed
    UInt4,            // 4-byte little-endian unsigned
    UInt8,            // 8-byte little-endian unsigned
    Float8,           // 8-byte big-endian IEEE 754
    DecimalLine,      // decimal integer terminated by newline
    LongLine,         // decimal integer with optional trailing 'L'
    FloatLine,        // repr of a float terminated by newline
    StringLine,       // quoted repr string terminated by newline
    NoEscapeLine,     // raw text terminated by newline
    NoEscapeLinePair, // two newline-terminated raw texts (module, name)
    UnicodeLine,      // raw-unicode-escape text terminated by newline
    Bytes1,           // 1-byte length + bytes
    Bytes4,           // 4-byte unsigned length + bytes
    Bytes8,           // 8-byte unsigned length + bytes
    String1,          // 1-byte length + bytes (protocol 0/1 str)
    String4,          // 4-byte signed length + bytes
    Unicode1,         // 1-byte length + UTF-8
    Unicode4,         // 4-byte length + UTF-8
    Unicode8,         // 8-byte length + UTF-8
    Long1,            // 1-byte length + little-endian two's complement
    Long4,            // 4-byte signed length + little-endian two's complement
};

/// Abstract stack effect of one instruction
struct StackEffect {
    int8_t pops;       // values popped above the mark (or fixed count)
    int8_t pushes;     // values pushed
    bool to_mark;      // pops everything down to and including the topmost mark
};

/// Static description of one opcode
struct OpcodeInfo {
    Opcode code;
    const char* name;
    ArgKind arg;
    int8_t protocol;  // protocol that introduced the opcode
    StackEffect effect;
};

/// Look up an opcode byte; returns nullptr when the byte is not an opcode
const OpcodeInfo* lookup_opcode(uint8_t byte);

/// Info for a known opcode
const OpcodeInfo& opcode_info(Opcode code);

/// Opcode name, e.g. "STACK_GLOBAL"
const char* opcode_name(Opcode code);

/// True when the argument is text (as opposed to raw bytes or numbers)
bool arg_is_text(ArgKind kind);

} // namespace pickle
} // namespace sanityml

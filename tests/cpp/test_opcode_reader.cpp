#include <gtest/gtest.h>
#include "sanityml/pickle/opcode_reader.hpp"
#include "test_helpers.hpp"

#include <vector>

using namespace sanityml;
using namespace sanityml::pickle;
using sanityml::test_util::PickleWriter;
using sanityml::test_util::view_of;

namespace {

std::vector<Operation> read_all(const std::vector<uint8_t>& bytes, ReaderLimits limits = {}) {
    OpcodeReader reader(view_of(bytes), limits);
    std::vector<Operation> ops;
    while (auto op = reader.next()) {
        ops.push_back(*op);
    }
    return ops;
}

} // anonymous namespace

TEST(OpcodeTableTest, Lookup) {
    ASSERT_NE(lookup_opcode(0x80), nullptr);
    EXPECT_EQ(lookup_opcode(0x80)->code, Opcode::PROTO);
    EXPECT_EQ(lookup_opcode('c')->code, Opcode::GLOBAL);
    EXPECT_EQ(lookup_opcode(0xff), nullptr);
    EXPECT_STREQ(opcode_name(Opcode::STACK_GLOBAL), "STACK_GLOBAL");
}

TEST(OpcodeReaderTest, GlobalReduce) {
    PickleWriter w;
    w.proto(2).global("os", "system").binunicode("ls").tuple1().reduce().stop();

    OpcodeReader reader(view_of(w.bytes()));
    std::vector<Operation> ops;
    while (auto op = reader.next()) {
        ops.push_back(*op);
    }

    ASSERT_EQ(ops.size(), 6u);
    EXPECT_EQ(ops[0].opcode, Opcode::PROTO);
    EXPECT_EQ(ops[0].int_arg(), 2);
    EXPECT_EQ(ops[1].opcode, Opcode::GLOBAL);
    EXPECT_EQ(ops[1].offset, 2u);
    EXPECT_EQ(ops[1].global_arg().module, "os");
    EXPECT_EQ(ops[1].global_arg().name, "system");
    EXPECT_EQ(ops[2].opcode, Opcode::BINUNICODE);
    EXPECT_EQ(ops[2].text_arg(), "ls");
    EXPECT_EQ(ops[3].opcode, Opcode::TUPLE1);
    EXPECT_EQ(ops[4].opcode, Opcode::REDUCE);
    EXPECT_EQ(ops[5].opcode, Opcode::STOP);

    EXPECT_TRUE(reader.finished());
    EXPECT_EQ(reader.protocol(), 2);
    EXPECT_EQ(reader.position(), w.size());
    EXPECT_EQ(reader.operation_count(), 6u);
    EXPECT_FALSE(reader.next().has_value());
}

TEST(OpcodeReaderTest, IntegerArguments) {
    PickleWriter w;
    w.proto(2).binint1(200).binint(-7).int_line("01").int_line("12345678901234567890").stop();

    auto ops = read_all(w.bytes());
    ASSERT_EQ(ops.size(), 6u);
    EXPECT_EQ(ops[1].int_arg(), 200);
    EXPECT_EQ(ops[2].int_arg(), -7);
    EXPECT_EQ(ops[3].int_arg(), 1);
    // Too wide for int64_t: the raw text is kept
    ASSERT_TRUE(ops[4].has_text());
    EXPECT_EQ(ops[4].text_arg(), "12345678901234567890");
}

TEST(OpcodeReaderTest, ProtocolZeroStringIsUnquoted) {
    PickleWriter w;
    w.string_line("hello").stop();

    auto ops = read_all(w.bytes());
    ASSERT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops[0].text_arg(), "hello");
}

TEST(OpcodeReaderTest, UndeclaredStreamAcceptsAllOpcodes) {
    // SHORT_BINUNICODE and STACK_GLOBAL are protocol 4 opcodes
    PickleWriter w;
    w.short_binunicode("os").short_binunicode("system").stack_global().stop();

    OpcodeReader reader(view_of(w.bytes()));
    std::vector<Operation> ops;
    while (auto op = reader.next()) {
        ops.push_back(*op);
    }

    ASSERT_EQ(ops.size(), 4u);
    EXPECT_EQ(ops[0].text_arg(), "os");
    EXPECT_EQ(ops[2].opcode, Opcode::STACK_GLOBAL);
    EXPECT_FALSE(reader.protocol_declared());
    EXPECT_FALSE(reader.newer_opcode().has_value());
}

TEST(OpcodeReaderTest, DeclaredStreamRecordsNewerOpcode) {
    PickleWriter w;
    w.proto(2).short_binunicode("a").short_binunicode("b").stop();

    OpcodeReader reader(view_of(w.bytes()));
    size_t count = 0;
    while (reader.next()) {
        ++count;
    }

    EXPECT_EQ(count, 4u);
    EXPECT_TRUE(reader.protocol_declared());
    ASSERT_TRUE(reader.newer_opcode().has_value());
    EXPECT_EQ(reader.newer_opcode()->kind, ScanErrorKind::UnknownOpcode);
    EXPECT_EQ(reader.newer_opcode()->offset, 2u);
    EXPECT_EQ(reader.newer_opcode()->message, "Unknown opcode 0x8c for protocol 2");
}

TEST(OpcodeReaderTest, ProtocolFourOpcodes) {
    PickleWriter w;
    w.proto(4).frame(3).short_binunicode("a").stop();

    auto ops = read_all(w.bytes());
    ASSERT_EQ(ops.size(), 4u);
    EXPECT_EQ(ops[1].opcode, Opcode::FRAME);
    EXPECT_EQ(ops[1].int_arg(), 3);
    EXPECT_EQ(ops[2].text_arg(), "a");
}

TEST(OpcodeReaderTest, UnknownOpcode) {
    PickleWriter w;
    w.proto(2).byte(0xff).stop();

    EXPECT_THROW(read_all(w.bytes()), UnknownOpcodeError);
}

TEST(OpcodeReaderTest, ProtoNotFirst) {
    PickleWriter w;
    w.none().proto(2).stop();

    EXPECT_THROW(read_all(w.bytes()), ProtocolMismatchError);
}

TEST(OpcodeReaderTest, UnsupportedProtocol) {
    PickleWriter w;
    w.proto(6).stop();

    EXPECT_THROW(read_all(w.bytes()), ProtocolMismatchError);
}

TEST(OpcodeReaderTest, MissingStop) {
    PickleWriter w;
    w.proto(2).none();

    try {
        read_all(w.bytes());
        FAIL() << "expected TruncatedStreamError";
    } catch (const TruncatedStreamError& e) {
        EXPECT_EQ(e.offset(), 3u);
    }
}

TEST(OpcodeReaderTest, DeclaredLengthPastEnd) {
    // BINUNICODE claims 4 GiB; the reader must fail without allocating it
    PickleWriter w;
    w.proto(2).byte('X').le(0xFFFFFFFFu, 4).text("abc");

    try {
        read_all(w.bytes());
        FAIL() << "expected TruncatedStreamError";
    } catch (const TruncatedStreamError& e) {
        EXPECT_EQ(e.offset(), 2u);
    }
}

TEST(OpcodeReaderTest, FramePastEnd) {
    PickleWriter w;
    w.proto(4).frame(1000).stop();

    EXPECT_THROW(read_all(w.bytes()), TruncatedStreamError);
}

TEST(OpcodeReaderTest, UnterminatedLine) {
    PickleWriter w;
    w.byte('c').text("os\nsys");

    EXPECT_THROW(read_all(w.bytes()), TruncatedStreamError);
}

TEST(OpcodeReaderTest, TruncationAtEveryOffset) {
    auto bytes = test_util::os_system_pickle("echo hi");
    for (size_t cut = 0; cut < bytes.size(); ++cut) {
        std::vector<uint8_t> prefix(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(cut));
        EXPECT_THROW(read_all(prefix), StreamError) << "cut at " << cut;
    }
    EXPECT_NO_THROW(read_all(bytes));
}

TEST(OpcodeReaderTest, StreamByteLimit) {
    ReaderLimits limits;
    limits.max_stream_bytes = 8;

    PickleWriter w;
    w.proto(2).binunicode("a long string argument").stop();

    EXPECT_THROW(read_all(w.bytes(), limits), StreamTooLargeError);
}

TEST(OpcodeReaderTest, ExpiredDeadline) {
    ReaderLimits limits;
    limits.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);

    EXPECT_THROW(read_all(test_util::literal_pickle(), limits), ScanTimeoutError);
}

TEST(OpcodeReaderTest, StartOffset) {
    auto first = test_util::literal_pickle();
    auto second = test_util::os_system_pickle("id");
    std::vector<uint8_t> both = first;
    both.insert(both.end(), second.begin(), second.end());

    OpcodeReader reader(view_of(both), {}, first.size());
    auto op = reader.next();
    ASSERT_TRUE(op.has_value());
    EXPECT_EQ(op->opcode, Opcode::PROTO);
    EXPECT_EQ(op->offset, first.size());
    while (reader.next()) {
    }
    EXPECT_EQ(reader.consumed(), second.size());
}

// ============================================================================
// Argument helpers
// ============================================================================

TEST(DecodeLongTest, Values) {
    EXPECT_EQ(decode_long_bytes(""), 0);
    EXPECT_EQ(decode_long_bytes(std::string_view("\x01", 1)), 1);
    EXPECT_EQ(decode_long_bytes(std::string_view("\xff", 1)), -1);
    EXPECT_EQ(decode_long_bytes(std::string_view("\x00\x01", 2)), 256);
    EXPECT_EQ(decode_long_bytes(std::string_view("\xff\x00", 2)), 255);
    EXPECT_EQ(decode_long_bytes(std::string_view("\x00\xff", 2)), -256);
    // Redundant sign extension does not count towards the width
    EXPECT_EQ(decode_long_bytes(std::string_view("\x05\x00\x00\x00\x00\x00\x00\x00\x00\x00", 10)), 5);
    EXPECT_FALSE(decode_long_bytes(std::string_view("\x00\x00\x00\x00\x00\x00\x00\x00\x01", 9)).has_value());
}

TEST(ParseDecimalTest, Values) {
    EXPECT_EQ(parse_decimal("0"), 0);
    EXPECT_EQ(parse_decimal("-42"), -42);
    EXPECT_EQ(parse_decimal("+7"), 7);
    EXPECT_EQ(parse_decimal("9223372036854775807"), std::numeric_limits<int64_t>::max());
    EXPECT_EQ(parse_decimal("-9223372036854775808"), std::numeric_limits<int64_t>::min());
    EXPECT_FALSE(parse_decimal("9223372036854775808").has_value());
    EXPECT_FALSE(parse_decimal("").has_value());
    EXPECT_FALSE(parse_decimal("-").has_value());
    EXPECT_FALSE(parse_decimal("12a").has_value());
}

TEST(FormatOperationTest, Layout) {
    PickleWriter w;
    w.proto(4).short_binunicode("posix").stop();
    auto ops = read_all(w.bytes());

    EXPECT_EQ(format_operation(ops[0]), "    0: \\x80 PROTO 4");
    EXPECT_EQ(format_operation(ops[1]), "    2: \\x8c SHORT_BINUNICODE 'posix'");
    EXPECT_EQ(format_operation(ops[2]), "    9: .    STOP");
}

TEST(FormatOperationTest, GlobalArgument) {
    PickleWriter w;
    w.global("os", "system").stop();
    auto ops = read_all(w.bytes());

    EXPECT_EQ(format_operation(ops[0]), "    0: c    GLOBAL 'os system'");
}

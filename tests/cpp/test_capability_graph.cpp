#include <gtest/gtest.h>
#include "sanityml/pickle/capability_graph.hpp"
#include "test_helpers.hpp"

using namespace sanityml;
using namespace sanityml::pickle;
using sanityml::test_util::PickleWriter;
using sanityml::test_util::view_of;

namespace {

StreamScan build(const std::vector<uint8_t>& bytes, BuilderLimits limits = {}) {
    return build_capability_graph(view_of(bytes), 0, ReaderLimits{}, limits);
}

/// Reachable nodes of one kind
std::vector<ValueId> of_kind(const CapabilityGraph& graph, ValueKind kind) {
    std::vector<ValueId> out;
    for (ValueId id : graph.reachable()) {
        if (graph.value(id).kind == kind) {
            out.push_back(id);
        }
    }
    return out;
}

} // anonymous namespace

TEST(CapabilityGraphTest, LiteralOnlyStreamIsEmpty) {
    auto scan = build(test_util::literal_pickle());

    EXPECT_TRUE(scan.graph.empty());
    EXPECT_FALSE(scan.graph.partial());
    EXPECT_EQ(scan.protocol, 2);
    EXPECT_EQ(scan.end_offset, test_util::literal_pickle().size());
}

TEST(CapabilityGraphTest, GlobalReduce) {
    auto scan = build(test_util::os_system_pickle("rm -rf /"));
    const auto& graph = scan.graph;

    auto globals = of_kind(graph, ValueKind::GlobalRef);
    auto calls = of_kind(graph, ValueKind::Constructed);
    ASSERT_EQ(globals.size(), 1u);
    ASSERT_EQ(calls.size(), 1u);

    EXPECT_EQ(graph.qualified_name(globals[0]), "os.system");
    EXPECT_EQ(graph.value(globals[0]).offset, 2u);

    const Value& call = graph.value(calls[0]);
    EXPECT_EQ(call.call, CallKind::Reduce);
    EXPECT_EQ(call.callee, globals[0]);
    EXPECT_EQ(graph.describe(calls[0]), "os.system('rm -rf /')");
}

TEST(CapabilityGraphTest, StackGlobalWithLiteralOperands) {
    auto scan = build(test_util::posix_system_pickle("id"));
    const auto& graph = scan.graph;

    auto globals = of_kind(graph, ValueKind::GlobalRef);
    ASSERT_EQ(globals.size(), 1u);
    EXPECT_FALSE(graph.value(globals[0]).dynamic);
    EXPECT_EQ(graph.qualified_name(globals[0]), "posix.system");
    EXPECT_EQ(scan.protocol, 4);
}

TEST(CapabilityGraphTest, StackGlobalWithComputedOperands) {
    // Module name is itself the result of a call
    PickleWriter w;
    w.proto(4)
     .global("builtins", "str").short_binunicode("os").tuple1().reduce()
     .short_binunicode("system")
     .stack_global()
     .stop();

    auto scan = build(w.bytes());
    const auto& graph = scan.graph;

    bool found_dynamic = false;
    for (ValueId id : of_kind(graph, ValueKind::GlobalRef)) {
        if (graph.value(id).dynamic) {
            found_dynamic = true;
            EXPECT_EQ(graph.value(id).items.size(), 2u);
        }
    }
    EXPECT_TRUE(found_dynamic);
}

TEST(CapabilityGraphTest, MemoReuse) {
    // The same global is fetched twice from the memo
    PickleWriter w;
    w.proto(2)
     .global("os", "system").binput(0)
     .binunicode("a").tuple1().reduce()
     .pop()
     .binget(0).binunicode("b").tuple1().reduce()
     .stop();

    auto scan = build(w.bytes());
    EXPECT_EQ(of_kind(scan.graph, ValueKind::GlobalRef).size(), 1u);
    EXPECT_EQ(of_kind(scan.graph, ValueKind::Constructed).size(), 2u);
}

TEST(CapabilityGraphTest, PoppedCallStaysReachable) {
    // A call whose result is discarded still runs during load
    PickleWriter w;
    w.proto(2)
     .global("os", "system").binunicode("id").tuple1().reduce()
     .pop()
     .none()
     .stop();

    auto scan = build(w.bytes());
    EXPECT_EQ(of_kind(scan.graph, ValueKind::Constructed).size(), 1u);
}

TEST(CapabilityGraphTest, UnresolvedMemoEntry) {
    PickleWriter w;
    w.proto(2).binget(7).empty_tuple().reduce().stop();

    auto scan = build(w.bytes());
    const auto& graph = scan.graph;
    auto calls = of_kind(graph, ValueKind::Constructed);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(graph.value(graph.value(calls[0]).callee).kind, ValueKind::Memoized);
    EXPECT_EQ(graph.describe(calls[0]), "<memo 7>()");
}

TEST(CapabilityGraphTest, BuildIsRecorded) {
    PickleWriter w;
    w.proto(2)
     .global("collections", "OrderedDict").empty_tuple().reduce()
     .empty_dict()
     .build()
     .stop();

    auto scan = build(w.bytes());
    const auto& graph = scan.graph;
    auto calls = of_kind(graph, ValueKind::Constructed);
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(graph.value(calls[1]).call, CallKind::Build);
    EXPECT_EQ(graph.describe(calls[1]), "collections.OrderedDict().__setstate__({})");
}

TEST(CapabilityGraphTest, InstOpcode) {
    PickleWriter w;
    w.mark().string_line("ls").inst("os", "system").stop();

    auto scan = build(w.bytes());
    const auto& graph = scan.graph;
    auto calls = of_kind(graph, ValueKind::Constructed);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(graph.value(calls[0]).call, CallKind::Inst);
    EXPECT_EQ(graph.describe(calls[0]), "os.system('ls')");
}

TEST(CapabilityGraphTest, StackUnderflowKeepsPartialGraph) {
    PickleWriter w;
    w.proto(2).global("os", "system").reduce().stop();

    auto scan = build(w.bytes());
    const auto& graph = scan.graph;
    ASSERT_TRUE(graph.failure().has_value());
    EXPECT_EQ(graph.failure()->kind, ScanErrorKind::StackUnderflow);
    EXPECT_TRUE(graph.partial());
    // The global pushed before the failure is still reported
    EXPECT_EQ(of_kind(graph, ValueKind::GlobalRef).size(), 1u);
}

TEST(CapabilityGraphTest, PopThroughMarkIsUnderflow) {
    PickleWriter w;
    w.proto(2).none().mark().tuple1().stop();

    auto scan = build(w.bytes());
    ASSERT_TRUE(scan.graph.failure().has_value());
    EXPECT_EQ(scan.graph.failure()->kind, ScanErrorKind::StackUnderflow);
}

TEST(CapabilityGraphTest, StackDepthLimit) {
    BuilderLimits limits;
    limits.max_stack_depth = 4;

    PickleWriter w;
    w.proto(2);
    for (int i = 0; i < 10; ++i) {
        w.none();
    }
    w.stop();

    auto scan = build(w.bytes(), limits);
    ASSERT_TRUE(scan.graph.failure().has_value());
    EXPECT_EQ(scan.graph.failure()->kind, ScanErrorKind::StreamTooLarge);
}

TEST(CapabilityGraphTest, SharedNodeExpandsAtShallowestDepth) {
    BuilderLimits limits;
    limits.max_traversal_depth = 3;

    // (M, ((M,),)) with M = (os.system,): M sits at depth 1 and at depth 3
    PickleWriter w;
    w.proto(2)
     .global("os", "system").tuple1()
     .dup().tuple1().tuple1()
     .tuple2()
     .stop();

    auto scan = build(w.bytes(), limits);
    ASSERT_FALSE(scan.graph.partial());
    EXPECT_FALSE(scan.graph.depth_limited());
    ASSERT_EQ(of_kind(scan.graph, ValueKind::GlobalRef).size(), 1u);
}

TEST(CapabilityGraphTest, TraversalDepthLimit) {
    BuilderLimits limits;
    limits.max_traversal_depth = 2;

    PickleWriter w;
    w.proto(2).global("os", "system").tuple1().tuple1().tuple1().stop();

    auto scan = build(w.bytes(), limits);
    EXPECT_TRUE(scan.graph.depth_limited());
    EXPECT_TRUE(of_kind(scan.graph, ValueKind::GlobalRef).empty());
}

TEST(CapabilityGraphTest, MemoLimit) {
    BuilderLimits limits;
    limits.max_memo_entries = 2;

    PickleWriter w;
    w.proto(2).none().binput(0).binput(1).binput(2).stop();

    auto scan = build(w.bytes(), limits);
    ASSERT_TRUE(scan.graph.failure().has_value());
    EXPECT_EQ(scan.graph.failure()->kind, ScanErrorKind::StreamTooLarge);
}

TEST(CapabilityGraphTest, SelfReferencingListTerminates) {
    // l = []; l.append(l)
    PickleWriter w;
    w.proto(2).empty_list().binput(0).binget(0).append().stop();

    auto scan = build(w.bytes());
    EXPECT_FALSE(scan.graph.failure().has_value());
    EXPECT_TRUE(scan.graph.empty());
}

TEST(CapabilityGraphTest, LiteralPreviewIsTruncated) {
    BuilderLimits limits;
    limits.max_literal_preview = 16;

    PickleWriter w;
    w.proto(2).global("os", "system").binunicode(std::string(100, 'x')).tuple1().reduce().stop();

    auto scan = build(w.bytes(), limits);
    auto calls = of_kind(scan.graph, ValueKind::Constructed);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(scan.graph.describe(calls[0]), "os.system('" + std::string(16, 'x') + "...')");
}

TEST(CapabilityGraphTest, DescribeContainers) {
    PickleWriter w;
    w.proto(2)
     .global("builtins", "print")
     .mark().binint1(1).short_binbytes("\x01z").newtrue().none().tuple()
     .reduce()
     .stop();

    // SHORT_BINBYTES is protocol 3
    std::vector<uint8_t> bytes = w.bytes();
    bytes[1] = 3;

    auto scan = build(bytes);
    auto calls = of_kind(scan.graph, ValueKind::Constructed);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(scan.graph.describe(calls[0]), "builtins.print(1, b'\\x01z', True, None)");
}

TEST(CapabilityGraphTest, EndOffsetAfterStop) {
    auto first = test_util::literal_pickle();
    std::vector<uint8_t> both = first;
    auto second = test_util::os_system_pickle("id");
    both.insert(both.end(), second.begin(), second.end());

    auto scan = build_capability_graph(view_of(both), 0, ReaderLimits{}, BuilderLimits{});
    EXPECT_EQ(scan.end_offset, first.size());
    EXPECT_TRUE(scan.graph.empty());

    auto next = build_capability_graph(view_of(both), scan.end_offset, ReaderLimits{}, BuilderLimits{});
    EXPECT_FALSE(next.graph.empty());
}

TEST(CapabilityGraphTest, NamesOfKinds) {
    EXPECT_STREQ(value_kind_name(ValueKind::GlobalRef), "GlobalRef");
    EXPECT_STREQ(literal_kind_name(LiteralKind::Dict), "dict");
    EXPECT_STREQ(call_kind_name(CallKind::NewObjEx), "newobj_ex");
}

#pragma once

// Capability Graph Builder
//
// Abstract interpretation of a pickle opcode sequence. The builder keeps a
// virtual stack and memo table of Value tokens and applies each opcode's
// stack effect, but never imports or calls anything: opcodes that would
// invoke a callable produce a Constructed value instead.

#include "sanityml/errors.hpp"
#include "sanityml/options.hpp"
#include "sanityml/pickle/opcode_reader.hpp"
#include "sanityml/pickle/value.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sanityml {
namespace pickle {

/// Resource limits for one graph
struct BuilderLimits {
    size_t max_stack_depth = 1000000;
    size_t max_memo_entries = 1000000;
    size_t max_graph_nodes = 4000000;
    size_t max_traversal_depth = 10000;
    size_t max_literal_preview = 200;

    static BuilderLimits from_options(const ScanOptions& options);
};

/// Every GlobalRef and Constructed value reachable from the final stack,
/// plus the arena they live in.
class CapabilityGraph {
public:
    CapabilityGraph() = default;

    /// Capability nodes (GlobalRef / Constructed) in creation order
    const std::vector<ValueId>& reachable() const { return reachable_; }

    bool empty() const { return reachable_.empty(); }

    const Value& value(ValueId id) const { return values_.at(id); }

    /// Total number of arena nodes, capabilities or not
    size_t node_count() const { return values_.size(); }

    /// Set when the stream ended in an error (the graph holds what was built
    /// before it) or used an opcode newer than its declared protocol
    const std::optional<ScanFailure>& failure() const { return failure_; }

    bool partial() const { return failure_.has_value() || depth_limited_; }

    /// Reachability stopped at max_traversal_depth somewhere
    bool depth_limited() const { return depth_limited_; }

    /// Dotted name of a GlobalRef ("os.system"); empty for other kinds
    std::string qualified_name(ValueId id) const;

    /// Python-like rendering used as finding evidence, e.g. os.system('ls')
    std::string describe(ValueId id, size_t max_chars = 200) const;

private:
    friend class GraphBuilder;

    std::vector<Value> values_;
    std::vector<ValueId> reachable_;
    std::optional<ScanFailure> failure_;
    bool depth_limited_ = false;

    void describe_into(ValueId id, std::string& out, size_t max_chars, int depth) const;
};

/// Applies operations to a virtual stack.
///
/// apply() throws StackUnderflowError, StreamTooLargeError or
/// ProtocolMismatchError; finish() may be called afterwards to obtain the
/// partial graph.
class GraphBuilder {
public:
    explicit GraphBuilder(BuilderLimits limits = {});

    void apply(const Operation& op);

    /// True once STOP was applied
    bool stopped() const { return stopped_; }

    /// Compute reachability and hand over the graph; the builder is spent
    CapabilityGraph finish(std::optional<ScanFailure> failure = std::nullopt);

private:
    BuilderLimits limits_;
    CapabilityGraph graph_;
    std::vector<ValueId> stack_;
    std::vector<size_t> marks_;     // stack_ positions of Mark tokens
    std::unordered_map<uint64_t, ValueId> memo_;
    std::vector<ValueId> discarded_; // popped without being consumed
    ValueId mark_value_ = NO_VALUE;
    bool stopped_ = false;

    ValueId add(Value v);
    ValueId add_literal(LiteralKind kind, std::string text, size_t offset);
    ValueId add_global(std::string module, std::string name, size_t offset, bool dynamic);
    ValueId add_call(CallKind call, ValueId callee, std::vector<ValueId> args, size_t offset);

    void push(ValueId id, size_t offset);
    ValueId pop(size_t offset);
    ValueId top(size_t offset) const;
    std::vector<ValueId> pop_mark(size_t offset);
    size_t frame_base() const;

    std::string preview(std::string_view text, bool& truncated) const;
    void memo_put(uint64_t key, size_t offset);
    void append_to(ValueId target, const std::vector<ValueId>& items);
};

/// Outcome of reading and interpreting one embedded stream
struct StreamScan {
    CapabilityGraph graph;
    size_t end_offset = 0;  // position after STOP (or where reading failed)
    int protocol = DEFAULT_PROTOCOL;
    size_t operations = 0;
};

/// Read a stream starting at `start` and build its capability graph.
/// Artifact-local errors are recorded in graph.failure() instead of thrown.
StreamScan build_capability_graph(ByteView buffer,
                                  size_t start,
                                  const ReaderLimits& reader_limits,
                                  const BuilderLimits& builder_limits);

} // namespace pickle
} // namespace sanityml

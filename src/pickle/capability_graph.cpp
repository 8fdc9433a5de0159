#include "sanityml/pickle/capability_graph.hpp"

#include <cstdio>
#include <deque>
#include <utility>

namespace sanityml {
namespace pickle {

const char* value_kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Literal: return "Literal";
        case ValueKind::GlobalRef: return "GlobalRef";
        case ValueKind::Constructed: return "Constructed";
        case ValueKind::Mark: return "Mark";
        case ValueKind::Memoized: return "Memoized";
        case ValueKind::Unknown: return "Unknown";
    }
    return "?";
}

const char* literal_kind_name(LiteralKind kind) {
    switch (kind) {
        case LiteralKind::None: return "none";
        case LiteralKind::Bool: return "bool";
        case LiteralKind::Int: return "int";
        case LiteralKind::Float: return "float";
        case LiteralKind::String: return "str";
        case LiteralKind::Bytes: return "bytes";
        case LiteralKind::ByteArray: return "bytearray";
        case LiteralKind::Tuple: return "tuple";
        case LiteralKind::List: return "list";
        case LiteralKind::Dict: return "dict";
        case LiteralKind::Set: return "set";
        case LiteralKind::FrozenSet: return "frozenset";
    }
    return "?";
}

const char* call_kind_name(CallKind kind) {
    switch (kind) {
        case CallKind::Reduce: return "reduce";
        case CallKind::NewObj: return "newobj";
        case CallKind::NewObjEx: return "newobj_ex";
        case CallKind::Inst: return "inst";
        case CallKind::Obj: return "obj";
        case CallKind::Build: return "build";
        case CallKind::Extension: return "extension";
        case CallKind::PersistentLoad: return "persistent_load";
    }
    return "?";
}

BuilderLimits BuilderLimits::from_options(const ScanOptions& options) {
    BuilderLimits limits;
    limits.max_stack_depth = options.max_stack_depth;
    limits.max_memo_entries = options.max_memo_entries;
    limits.max_graph_nodes = options.max_graph_nodes;
    limits.max_traversal_depth = options.max_traversal_depth;
    limits.max_literal_preview = options.max_literal_preview;
    return limits;
}

// ============================================================================
// CapabilityGraph
// ============================================================================

std::string CapabilityGraph::qualified_name(ValueId id) const {
    const Value& v = value(id);
    if (v.kind != ValueKind::GlobalRef) {
        return "";
    }
    return v.text + "." + v.name;
}

std::string CapabilityGraph::describe(ValueId id, size_t max_chars) const {
    std::string out;
    describe_into(id, out, max_chars, 0);
    if (out.size() > max_chars) {
        out.resize(max_chars);
        out += "...";
    }
    return out;
}

namespace {

constexpr int MAX_DESCRIBE_DEPTH = 6;

void append_quoted(std::string& out, const std::string& text, bool truncated, bool bytes) {
    if (bytes) {
        out += 'b';
    }
    out += '\'';
    for (unsigned char c : text) {
        if (c == '\\' || c == '\'') {
            out += '\\';
            out += static_cast<char>(c);
        } else if (c == '\n') {
            out += "\\n";
        } else if (c < 0x20 || c == 0x7f || (bytes && c >= 0x80)) {
            char hex[5];
            std::snprintf(hex, sizeof(hex), "\\x%02x", c);
            out += hex;
        } else {
            out += static_cast<char>(c);
        }
    }
    if (truncated) {
        out += "...";
    }
    out += '\'';
}

} // anonymous namespace

void CapabilityGraph::describe_into(ValueId id, std::string& out, size_t max_chars, int depth) const {
    if (out.size() > max_chars) {
        return;
    }
    if (id == NO_VALUE || id >= values_.size()) {
        out += "<?>";
        return;
    }
    if (depth > MAX_DESCRIBE_DEPTH) {
        out += "...";
        return;
    }

    const Value& v = values_[id];
    auto join = [&](const std::vector<ValueId>& ids, const char* sep) {
        for (size_t i = 0; i < ids.size(); ++i) {
            if (i > 0) out += sep;
            if (out.size() > max_chars) return;
            describe_into(ids[i], out, max_chars, depth + 1);
        }
    };

    switch (v.kind) {
        case ValueKind::Literal:
            switch (v.literal) {
                case LiteralKind::String:
                    append_quoted(out, v.text, v.truncated, false);
                    break;
                case LiteralKind::Bytes:
                    append_quoted(out, v.text, v.truncated, true);
                    break;
                case LiteralKind::ByteArray:
                    out += "bytearray(";
                    append_quoted(out, v.text, v.truncated, true);
                    out += ")";
                    break;
                case LiteralKind::Tuple:
                    out += "(";
                    join(v.items, ", ");
                    if (v.items.size() == 1) out += ",";
                    out += ")";
                    break;
                case LiteralKind::List:
                    out += "[";
                    join(v.items, ", ");
                    out += "]";
                    break;
                case LiteralKind::Dict:
                    out += "{";
                    for (size_t i = 0; i + 1 < v.items.size(); i += 2) {
                        if (i > 0) out += ", ";
                        describe_into(v.items[i], out, max_chars, depth + 1);
                        out += ": ";
                        describe_into(v.items[i + 1], out, max_chars, depth + 1);
                    }
                    out += "}";
                    break;
                case LiteralKind::Set:
                case LiteralKind::FrozenSet:
                    out += v.literal == LiteralKind::Set ? "{" : "frozenset({";
                    join(v.items, ", ");
                    out += v.literal == LiteralKind::Set ? "}" : "})";
                    break;
                default:
                    out += v.text;
                    break;
            }
            break;

        case ValueKind::GlobalRef:
            out += v.text;
            out += ".";
            out += v.name;
            break;

        case ValueKind::Constructed: {
            if (v.call == CallKind::Build) {
                describe_into(v.callee, out, max_chars, depth + 1);
                out += ".__setstate__(";
                join(v.items, ", ");
                out += ")";
                break;
            }
            if (v.call == CallKind::PersistentLoad) {
                out += "persistent_load(";
                join(v.items, ", ");
                out += ")";
                break;
            }
            describe_into(v.callee, out, max_chars, depth + 1);
            if (v.call == CallKind::Extension) {
                break;
            }
            out += "(";
            // REDUCE / NEWOBJ carry one argument tuple; spread it like a call
            if ((v.call == CallKind::Reduce || v.call == CallKind::NewObj ||
                 v.call == CallKind::NewObjEx) && !v.items.empty()) {
                const Value& args = values_[v.items[0]];
                if (args.kind == ValueKind::Literal && args.literal == LiteralKind::Tuple) {
                    join(args.items, ", ");
                } else {
                    out += "*";
                    describe_into(v.items[0], out, max_chars, depth + 1);
                }
                if (v.items.size() > 1) {
                    out += ", **";
                    describe_into(v.items[1], out, max_chars, depth + 1);
                }
            } else {
                join(v.items, ", ");
            }
            out += ")";
            break;
        }

        case ValueKind::Mark:
            out += "<mark>";
            break;

        case ValueKind::Memoized:
            out += "<memo " + std::to_string(v.memo_id) + ">";
            break;

        case ValueKind::Unknown:
            out += "<unknown>";
            break;
    }
}

// ============================================================================
// GraphBuilder
// ============================================================================

GraphBuilder::GraphBuilder(BuilderLimits limits)
    : limits_(limits) {}

ValueId GraphBuilder::add(Value v) {
    if (graph_.values_.size() >= limits_.max_graph_nodes) {
        throw StreamTooLargeError(
            "Graph exceeds " + std::to_string(limits_.max_graph_nodes) + " nodes",
            v.offset);
    }
    graph_.values_.push_back(std::move(v));
    return static_cast<ValueId>(graph_.values_.size() - 1);
}

std::string GraphBuilder::preview(std::string_view text, bool& truncated) const {
    truncated = text.size() > limits_.max_literal_preview;
    return std::string(text.substr(0, limits_.max_literal_preview));
}

ValueId GraphBuilder::add_literal(LiteralKind kind, std::string text, size_t offset) {
    Value v;
    v.kind = ValueKind::Literal;
    v.literal = kind;
    v.text = std::move(text);
    v.offset = offset;
    return add(std::move(v));
}

ValueId GraphBuilder::add_global(std::string module, std::string name, size_t offset, bool dynamic) {
    Value v;
    v.kind = ValueKind::GlobalRef;
    v.text = std::move(module);
    v.name = std::move(name);
    v.offset = offset;
    v.dynamic = dynamic;
    return add(std::move(v));
}

ValueId GraphBuilder::add_call(CallKind call, ValueId callee, std::vector<ValueId> args, size_t offset) {
    Value v;
    v.kind = ValueKind::Constructed;
    v.call = call;
    v.callee = callee;
    v.items = std::move(args);
    v.offset = offset;
    return add(std::move(v));
}

size_t GraphBuilder::frame_base() const {
    return marks_.empty() ? 0 : marks_.back() + 1;
}

void GraphBuilder::push(ValueId id, size_t offset) {
    if (stack_.size() >= limits_.max_stack_depth) {
        throw StreamTooLargeError(
            "Stack exceeds " + std::to_string(limits_.max_stack_depth) + " entries", offset);
    }
    stack_.push_back(id);
}

ValueId GraphBuilder::pop(size_t offset) {
    if (stack_.size() <= frame_base()) {
        throw StackUnderflowError(
            marks_.empty() ? "Pop from empty stack" : "Pop through mark", offset);
    }
    ValueId id = stack_.back();
    stack_.pop_back();
    return id;
}

ValueId GraphBuilder::top(size_t offset) const {
    if (stack_.size() <= frame_base()) {
        throw StackUnderflowError(
            marks_.empty() ? "Access to empty stack" : "Access through mark", offset);
    }
    return stack_.back();
}

std::vector<ValueId> GraphBuilder::pop_mark(size_t offset) {
    if (marks_.empty()) {
        throw StackUnderflowError("No mark on stack", offset);
    }
    size_t mark_pos = marks_.back();
    marks_.pop_back();
    std::vector<ValueId> items(stack_.begin() + static_cast<std::ptrdiff_t>(mark_pos) + 1,
                               stack_.end());
    stack_.resize(mark_pos);
    return items;
}

void GraphBuilder::memo_put(uint64_t key, size_t offset) {
    ValueId id = top(offset);
    auto it = memo_.find(key);
    if (it == memo_.end() && memo_.size() >= limits_.max_memo_entries) {
        throw StreamTooLargeError(
            "Memo exceeds " + std::to_string(limits_.max_memo_entries) + " entries", offset);
    }
    memo_[key] = id;
}

void GraphBuilder::append_to(ValueId target, const std::vector<ValueId>& items) {
    Value& t = graph_.values_[target];
    bool container = t.kind == ValueKind::Literal &&
        (t.literal == LiteralKind::List || t.literal == LiteralKind::Dict ||
         t.literal == LiteralKind::Set);
    auto& dest = container ? t.items : t.attached;
    dest.insert(dest.end(), items.begin(), items.end());
}

void GraphBuilder::apply(const Operation& op) {
    const size_t at = op.offset;
    bool truncated = false;

    switch (op.opcode) {
        case Opcode::PROTO:
        case Opcode::FRAME:
            break;

        case Opcode::STOP:
            discarded_.push_back(pop(at));
            stopped_ = true;
            break;

        case Opcode::MARK:
            if (mark_value_ == NO_VALUE) {
                Value m;
                m.kind = ValueKind::Mark;
                m.offset = at;
                mark_value_ = add(std::move(m));
            }
            push(mark_value_, at);
            marks_.push_back(stack_.size() - 1);
            break;

        case Opcode::POP:
            if (stack_.size() == frame_base() && !marks_.empty()) {
                pop_mark(at);
            } else {
                discarded_.push_back(pop(at));
            }
            break;

        case Opcode::POP_MARK: {
            auto items = pop_mark(at);
            discarded_.insert(discarded_.end(), items.begin(), items.end());
            break;
        }

        case Opcode::DUP:
            push(top(at), at);
            break;

        // ---- literals -------------------------------------------------------

        case Opcode::NONE:
            push(add_literal(LiteralKind::None, "None", at), at);
            break;

        case Opcode::NEWTRUE:
            push(add_literal(LiteralKind::Bool, "True", at), at);
            break;

        case Opcode::NEWFALSE:
            push(add_literal(LiteralKind::Bool, "False", at), at);
            break;

        case Opcode::INT:
            if (op.has_text()) {
                push(add_literal(LiteralKind::Int, preview(op.text_arg(), truncated), at), at);
            } else {
                push(add_literal(LiteralKind::Int, std::to_string(op.int_arg()), at), at);
            }
            break;

        case Opcode::BININT:
        case Opcode::BININT1:
        case Opcode::BININT2:
        case Opcode::LONG:
        case Opcode::LONG1:
        case Opcode::LONG4:
            if (op.has_int()) {
                push(add_literal(LiteralKind::Int, std::to_string(op.int_arg()), at), at);
            } else {
                push(add_literal(LiteralKind::Int, "<long>", at), at);
            }
            break;

        case Opcode::FLOAT:
        case Opcode::BINFLOAT:
            if (auto d = std::get_if<double>(&op.arg)) {
                char buf[32];
                std::snprintf(buf, sizeof(buf), "%g", *d);
                push(add_literal(LiteralKind::Float, buf, at), at);
            } else {
                push(add_literal(LiteralKind::Float, preview(op.text_arg(), truncated), at), at);
            }
            break;

        case Opcode::STRING:
        case Opcode::BINSTRING:
        case Opcode::SHORT_BINSTRING:
        case Opcode::UNICODE:
        case Opcode::BINUNICODE:
        case Opcode::SHORT_BINUNICODE:
        case Opcode::BINUNICODE8: {
            ValueId id = add_literal(LiteralKind::String, preview(op.text_arg(), truncated), at);
            graph_.values_[id].truncated = truncated;
            push(id, at);
            break;
        }

        case Opcode::BINBYTES:
        case Opcode::SHORT_BINBYTES:
        case Opcode::BINBYTES8:
        case Opcode::BYTEARRAY8: {
            LiteralKind kind = op.opcode == Opcode::BYTEARRAY8 ? LiteralKind::ByteArray
                                                               : LiteralKind::Bytes;
            ValueId id = add_literal(kind, preview(op.text_arg(), truncated), at);
            graph_.values_[id].truncated = truncated;
            push(id, at);
            break;
        }

        // ---- containers -----------------------------------------------------

        case Opcode::EMPTY_TUPLE:
            push(add_literal(LiteralKind::Tuple, "", at), at);
            break;

        case Opcode::EMPTY_LIST:
            push(add_literal(LiteralKind::List, "", at), at);
            break;

        case Opcode::EMPTY_DICT:
            push(add_literal(LiteralKind::Dict, "", at), at);
            break;

        case Opcode::EMPTY_SET:
            push(add_literal(LiteralKind::Set, "", at), at);
            break;

        case Opcode::TUPLE1:
        case Opcode::TUPLE2:
        case Opcode::TUPLE3: {
            size_t n = op.opcode == Opcode::TUPLE1 ? 1 : op.opcode == Opcode::TUPLE2 ? 2 : 3;
            std::vector<ValueId> items(n);
            for (size_t i = n; i > 0; --i) {
                items[i - 1] = pop(at);
            }
            ValueId id = add_literal(LiteralKind::Tuple, "", at);
            graph_.values_[id].items = std::move(items);
            push(id, at);
            break;
        }

        case Opcode::TUPLE:
        case Opcode::LIST:
        case Opcode::DICT:
        case Opcode::FROZENSET: {
            auto items = pop_mark(at);
            LiteralKind kind = op.opcode == Opcode::TUPLE ? LiteralKind::Tuple
                             : op.opcode == Opcode::LIST ? LiteralKind::List
                             : op.opcode == Opcode::DICT ? LiteralKind::Dict
                             : LiteralKind::FrozenSet;
            ValueId id = add_literal(kind, "", at);
            graph_.values_[id].items = std::move(items);
            push(id, at);
            break;
        }

        case Opcode::APPEND: {
            ValueId item = pop(at);
            append_to(top(at), {item});
            break;
        }

        case Opcode::SETITEM: {
            ValueId val = pop(at);
            ValueId key = pop(at);
            append_to(top(at), {key, val});
            break;
        }

        case Opcode::APPENDS:
        case Opcode::SETITEMS:
        case Opcode::ADDITEMS: {
            auto items = pop_mark(at);
            append_to(top(at), items);
            break;
        }

        // ---- memo -----------------------------------------------------------

        case Opcode::GET:
        case Opcode::BINGET:
        case Opcode::LONG_BINGET: {
            if (!op.has_int() || op.int_arg() < 0) {
                throw ProtocolMismatchError("Invalid memo key", at);
            }
            uint64_t key = static_cast<uint64_t>(op.int_arg());
            auto it = memo_.find(key);
            if (it != memo_.end()) {
                push(it->second, at);
            } else {
                Value m;
                m.kind = ValueKind::Memoized;
                m.memo_id = key;
                m.offset = at;
                push(add(std::move(m)), at);
            }
            break;
        }

        case Opcode::PUT:
        case Opcode::BINPUT:
        case Opcode::LONG_BINPUT:
            if (!op.has_int() || op.int_arg() < 0) {
                throw ProtocolMismatchError("Invalid memo key", at);
            }
            memo_put(static_cast<uint64_t>(op.int_arg()), at);
            break;

        case Opcode::MEMOIZE:
            memo_put(memo_.size(), at);
            break;

        // ---- imports and calls ----------------------------------------------

        case Opcode::GLOBAL: {
            const GlobalName& g = op.global_arg();
            push(add_global(std::string(g.module), std::string(g.name), at, false), at);
            break;
        }

        case Opcode::STACK_GLOBAL: {
            ValueId name = pop(at);
            ValueId module = pop(at);
            const Value& mv = graph_.values_[module];
            const Value& nv = graph_.values_[name];
            bool literal = mv.kind == ValueKind::Literal && mv.literal == LiteralKind::String &&
                           nv.kind == ValueKind::Literal && nv.literal == LiteralKind::String &&
                           !mv.truncated && !nv.truncated;
            ValueId id;
            if (literal) {
                std::string m = mv.text;
                std::string n = nv.text;
                id = add_global(std::move(m), std::move(n), at, false);
            } else {
                id = add_global("<dynamic>", "<dynamic>", at, true);
                graph_.values_[id].items = {module, name};
            }
            push(id, at);
            break;
        }

        case Opcode::INST: {
            const GlobalName& g = op.global_arg();
            auto args = pop_mark(at);
            ValueId callee = add_global(std::string(g.module), std::string(g.name), at, false);
            push(add_call(CallKind::Inst, callee, std::move(args), at), at);
            break;
        }

        case Opcode::OBJ: {
            auto items = pop_mark(at);
            if (items.empty()) {
                throw StackUnderflowError("OBJ without class", at);
            }
            ValueId cls = items.front();
            items.erase(items.begin());
            push(add_call(CallKind::Obj, cls, std::move(items), at), at);
            break;
        }

        case Opcode::REDUCE: {
            ValueId args = pop(at);
            ValueId callee = pop(at);
            push(add_call(CallKind::Reduce, callee, {args}, at), at);
            break;
        }

        case Opcode::NEWOBJ: {
            ValueId args = pop(at);
            ValueId cls = pop(at);
            push(add_call(CallKind::NewObj, cls, {args}, at), at);
            break;
        }

        case Opcode::NEWOBJ_EX: {
            ValueId kwargs = pop(at);
            ValueId args = pop(at);
            ValueId cls = pop(at);
            push(add_call(CallKind::NewObjEx, cls, {args, kwargs}, at), at);
            break;
        }

        case Opcode::BUILD: {
            ValueId state = pop(at);
            ValueId obj = pop(at);
            push(add_call(CallKind::Build, obj, {state}, at), at);
            break;
        }

        case Opcode::EXT1:
        case Opcode::EXT2:
        case Opcode::EXT4: {
            int64_t code = op.int_arg();
            ValueId callee = add_global("<extension>", std::to_string(code), at, false);
            graph_.values_[callee].memo_id = static_cast<uint64_t>(code);
            push(add_call(CallKind::Extension, callee, {}, at), at);
            break;
        }

        case Opcode::PERSID: {
            ValueId pid = add_literal(LiteralKind::String, preview(op.text_arg(), truncated), at);
            graph_.values_[pid].truncated = truncated;
            push(add_call(CallKind::PersistentLoad, NO_VALUE, {pid}, at), at);
            break;
        }

        case Opcode::BINPERSID: {
            ValueId pid = pop(at);
            push(add_call(CallKind::PersistentLoad, NO_VALUE, {pid}, at), at);
            break;
        }

        // ---- out-of-band buffers --------------------------------------------

        case Opcode::NEXT_BUFFER: {
            Value u;
            u.kind = ValueKind::Unknown;
            u.offset = at;
            push(add(std::move(u)), at);
            break;
        }

        case Opcode::READONLY_BUFFER:
            top(at);
            break;
    }
}

CapabilityGraph GraphBuilder::finish(std::optional<ScanFailure> failure) {
    // Roots: whatever is left on the stack, everything popped without being
    // consumed, and every memo entry. Breadth-first, so a node is expanded
    // at the shallowest depth any root reaches it
    std::deque<std::pair<ValueId, size_t>> work;
    for (ValueId id : stack_) work.emplace_back(id, 0);
    for (ValueId id : discarded_) work.emplace_back(id, 0);
    for (const auto& entry : memo_) work.emplace_back(entry.second, 0);

    const size_t n = graph_.values_.size();

    // After a failure, operands held by the interrupted opcode are on no
    // stack; every node built so far counts as a root
    if (failure) {
        for (size_t id = 0; id < n; ++id) {
            work.emplace_back(static_cast<ValueId>(id), 0);
        }
    }
    std::vector<bool> visited(n, false);
    std::vector<bool> capability(n, false);

    while (!work.empty()) {
        auto [id, depth] = work.front();
        work.pop_front();
        if (id == NO_VALUE || id >= n || visited[id]) {
            continue;
        }
        if (depth > limits_.max_traversal_depth) {
            graph_.depth_limited_ = true;
            continue;
        }
        visited[id] = true;

        const Value& v = graph_.values_[id];
        if (v.is_capability()) {
            capability[id] = true;
        }
        if (v.callee != NO_VALUE) work.emplace_back(v.callee, depth + 1);
        for (ValueId c : v.items) work.emplace_back(c, depth + 1);
        for (ValueId c : v.attached) work.emplace_back(c, depth + 1);
    }

    for (size_t id = 0; id < n; ++id) {
        if (capability[id]) {
            graph_.reachable_.push_back(static_cast<ValueId>(id));
        }
    }

    graph_.failure_ = std::move(failure);
    stack_.clear();
    marks_.clear();
    memo_.clear();
    discarded_.clear();
    return std::move(graph_);
}

// ============================================================================
// Stream driver
// ============================================================================

StreamScan build_capability_graph(ByteView buffer,
                                  size_t start,
                                  const ReaderLimits& reader_limits,
                                  const BuilderLimits& builder_limits) {
    OpcodeReader reader(buffer, reader_limits, start);
    GraphBuilder builder(builder_limits);
    std::optional<ScanFailure> failure;

    try {
        while (auto op = reader.next()) {
            builder.apply(*op);
        }
    } catch (const StreamError& e) {
        failure = ScanFailure::from(e);
    }
    if (!failure && reader.newer_opcode()) {
        failure = reader.newer_opcode();
    }

    StreamScan result;
    result.end_offset = reader.position();
    result.protocol = reader.protocol();
    result.operations = reader.operation_count();
    result.graph = builder.finish(std::move(failure));
    return result;
}

} // namespace pickle
} // namespace sanityml

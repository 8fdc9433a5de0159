#include "sanityml/source/notebook.hpp"

#include <cstdlib>

namespace sanityml {
namespace source {

namespace {

constexpr int MAX_JSON_DEPTH = 128;

class JsonParser {
public:
    explicit JsonParser(std::string_view text) : text_(text) {}

    JsonValue parse_document() {
        JsonValue v = parse_value(0);
        skip_ws();
        if (pos_ != text_.size()) {
            fail("trailing data after JSON document");
        }
        return v;
    }

private:
    std::string_view text_;
    size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& message) const {
        throw NotebookFormatError("Invalid notebook JSON: " + message, pos_);
    }

    void skip_ws() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' ||
                text_[pos_] == '\n' || text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

    void expect(char c) {
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    bool consume_literal(std::string_view lit) {
        if (text_.compare(pos_, lit.size(), lit) == 0) {
            pos_ += lit.size();
            return true;
        }
        return false;
    }

    JsonValue parse_value(int depth) {
        if (depth > MAX_JSON_DEPTH) {
            fail("nesting too deep");
        }
        skip_ws();
        JsonValue v;
        char c = peek();
        if (c == '{') {
            v.type = JsonValue::Type::Object;
            ++pos_;
            skip_ws();
            if (peek() == '}') {
                ++pos_;
                return v;
            }
            while (true) {
                skip_ws();
                std::string key = parse_string();
                skip_ws();
                expect(':');
                v.object.emplace_back(std::move(key), parse_value(depth + 1));
                skip_ws();
                if (peek() == ',') {
                    ++pos_;
                    continue;
                }
                expect('}');
                return v;
            }
        }
        if (c == '[') {
            v.type = JsonValue::Type::Array;
            ++pos_;
            skip_ws();
            if (peek() == ']') {
                ++pos_;
                return v;
            }
            while (true) {
                v.array.push_back(parse_value(depth + 1));
                skip_ws();
                if (peek() == ',') {
                    ++pos_;
                    continue;
                }
                expect(']');
                return v;
            }
        }
        if (c == '"') {
            v.type = JsonValue::Type::String;
            v.string = parse_string();
            return v;
        }
        if (consume_literal("true")) {
            v.type = JsonValue::Type::Bool;
            v.boolean = true;
            return v;
        }
        if (consume_literal("false")) {
            v.type = JsonValue::Type::Bool;
            return v;
        }
        if (consume_literal("null")) {
            return v;
        }
        if (c == '-' || (c >= '0' && c <= '9')) {
            size_t start = pos_;
            while (pos_ < text_.size() &&
                   std::string_view("+-0123456789.eE").find(text_[pos_]) != std::string_view::npos) {
                ++pos_;
            }
            std::string num(text_.substr(start, pos_ - start));
            char* end = nullptr;
            v.type = JsonValue::Type::Number;
            v.number = std::strtod(num.c_str(), &end);
            if (!end || *end != '\0') {
                fail("malformed number");
            }
            return v;
        }
        fail("unexpected character");
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    uint32_t parse_hex4() {
        if (pos_ + 4 > text_.size()) {
            fail("truncated unicode escape");
        }
        uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            char h = text_[pos_++];
            cp <<= 4;
            if (h >= '0' && h <= '9') cp |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
            else fail("bad unicode escape");
        }
        return cp;
    }

    std::string parse_string() {
        expect('"');
        std::string out;
        while (true) {
            if (pos_ >= text_.size()) {
                fail("unterminated string");
            }
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) {
                fail("unterminated escape");
            }
            char e = text_[pos_++];
            switch (e) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    uint32_t cp = parse_hex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF &&
                        text_.compare(pos_, 2, "\\u") == 0) {
                        pos_ += 2;
                        uint32_t lo = parse_hex4();
                        if (lo >= 0xDC00 && lo <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        }
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    fail("bad escape");
            }
        }
    }
};

bool has_code(const std::string& cell_text) {
    size_t pos = 0;
    while (pos < cell_text.size()) {
        size_t nl = cell_text.find('\n', pos);
        size_t end = nl == std::string::npos ? cell_text.size() : nl;
        size_t first = cell_text.find_first_not_of(" \t\r", pos);
        if (first != std::string::npos && first < end && cell_text[first] != '#') {
            return true;
        }
        pos = end + 1;
    }
    return false;
}

} // anonymous namespace

const JsonValue* JsonValue::get(const std::string& key) const {
    if (type != Type::Object) {
        return nullptr;
    }
    for (const auto& member : object) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

JsonValue parse_json(std::string_view text) {
    return JsonParser(text).parse_document();
}

CellLine NotebookSource::origin(uint32_t line) const {
    if (line == 0 || line > line_map.size()) {
        return CellLine{0, line};
    }
    return line_map[line - 1];
}

NotebookSource extract_notebook(std::string_view json_text) {
    JsonValue doc = parse_json(json_text);
    const JsonValue* cells = doc.get("cells");
    if (!cells || !cells->is_array()) {
        throw NotebookFormatError("Notebook has no cell list", 0);
    }

    NotebookSource out;
    out.cells = cells->array.size();

    for (size_t i = 0; i < cells->array.size(); ++i) {
        const JsonValue& cell = cells->array[i];
        const JsonValue* type = cell.get("cell_type");
        if (!type || !type->is_string() || type->string != "code") {
            continue;
        }

        std::string text;
        const JsonValue* src = cell.get("source");
        if (!src) {
            continue;
        }
        if (src->is_string()) {
            text = src->string;
        } else if (src->is_array()) {
            for (const auto& part : src->array) {
                if (part.is_string()) {
                    text += part.string;
                }
            }
        } else {
            continue;
        }

        if (!has_code(text)) {
            continue;
        }
        ++out.code_cells;

        if (!text.empty() && text.back() != '\n') {
            text += '\n';
        }
        uint32_t cell_line = 0;
        for (char c : text) {
            if (c == '\n') {
                out.line_map.push_back(CellLine{static_cast<uint32_t>(i + 1), ++cell_line});
            }
        }
        out.code += text;
    }
    return out;
}

} // namespace source
} // namespace sanityml

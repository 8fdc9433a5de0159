#include <gtest/gtest.h>
#include "sanityml/source/notebook.hpp"

using namespace sanityml;
using namespace sanityml::source;

namespace {

const char* const NOTEBOOK = R"json({
  "cells": [
    {"cell_type": "markdown", "source": ["# Title\n", "eval(x) in prose\n"]},
    {"cell_type": "code", "source": ["import os\n", "os.system('ls')"]},
    {"cell_type": "code", "source": "# only a comment\n"},
    {"cell_type": "code", "source": []},
    {"cell_type": "code", "source": "!pip install torch\nx = 1\n"}
  ],
  "metadata": {"kernelspec": {"name": "python3"}},
  "nbformat": 4,
  "nbformat_minor": 5
})json";

} // anonymous namespace

TEST(NotebookTest, ExtractCodeCells) {
    NotebookSource nb = extract_notebook(NOTEBOOK);

    EXPECT_EQ(nb.cells, 5u);
    EXPECT_EQ(nb.code_cells, 2u);
    EXPECT_EQ(nb.code, "import os\nos.system('ls')\n!pip install torch\nx = 1\n");
    ASSERT_EQ(nb.line_map.size(), 4u);
}

TEST(NotebookTest, LineOrigins) {
    NotebookSource nb = extract_notebook(NOTEBOOK);

    CellLine first = nb.origin(1);
    EXPECT_EQ(first.cell, 2u);
    EXPECT_EQ(first.line, 1u);

    CellLine second = nb.origin(2);
    EXPECT_EQ(second.cell, 2u);
    EXPECT_EQ(second.line, 2u);

    CellLine shell = nb.origin(3);
    EXPECT_EQ(shell.cell, 5u);
    EXPECT_EQ(shell.line, 1u);

    CellLine outside = nb.origin(99);
    EXPECT_EQ(outside.cell, 0u);
    EXPECT_EQ(outside.line, 99u);
}

TEST(NotebookTest, MissingCellList) {
    EXPECT_THROW(extract_notebook(R"({"nbformat": 4})"), NotebookFormatError);
    EXPECT_THROW(extract_notebook(R"({"cells": {}})"), NotebookFormatError);
}

TEST(NotebookTest, InvalidJsonReportsOffset) {
    try {
        extract_notebook(R"({"cells": [ )");
        FAIL() << "expected NotebookFormatError";
    } catch (const NotebookFormatError& e) {
        EXPECT_GT(e.offset(), 0u);
        EXPECT_NE(std::string(e.what()).find("Invalid notebook JSON"), std::string::npos);
    }
}

TEST(NotebookTest, EmptyNotebook) {
    NotebookSource nb = extract_notebook(R"({"cells": []})");
    EXPECT_EQ(nb.cells, 0u);
    EXPECT_TRUE(nb.code.empty());
}

// ============================================================================
// JSON parser
// ============================================================================

TEST(JsonTest, Scalars) {
    JsonValue v = parse_json(R"({"a": true, "b": null, "c": -1.5e2, "d": "x"})");

    ASSERT_TRUE(v.is_object());
    ASSERT_NE(v.get("a"), nullptr);
    EXPECT_EQ(v.get("a")->type, JsonValue::Type::Bool);
    EXPECT_TRUE(v.get("a")->boolean);
    EXPECT_EQ(v.get("b")->type, JsonValue::Type::Null);
    EXPECT_DOUBLE_EQ(v.get("c")->number, -150.0);
    EXPECT_EQ(v.get("d")->string, "x");
    EXPECT_EQ(v.get("missing"), nullptr);
}

TEST(JsonTest, StringEscapes) {
    JsonValue v = parse_json(R"(["a\"b\\c\n", "é", "😀"])");

    ASSERT_TRUE(v.is_array());
    ASSERT_EQ(v.array.size(), 3u);
    EXPECT_EQ(v.array[0].string, "a\"b\\c\n");
    EXPECT_EQ(v.array[1].string, "\xc3\xa9");
    EXPECT_EQ(v.array[2].string, "\xf0\x9f\x98\x80");
}

TEST(JsonTest, Malformed) {
    EXPECT_THROW(parse_json(""), NotebookFormatError);
    EXPECT_THROW(parse_json("{"), NotebookFormatError);
    EXPECT_THROW(parse_json(R"({"a" 1})"), NotebookFormatError);
    EXPECT_THROW(parse_json("[1, 2,]"), NotebookFormatError);
    EXPECT_THROW(parse_json(R"("bad \q escape")"), NotebookFormatError);
    EXPECT_THROW(parse_json("[1] trailing"), NotebookFormatError);
}

TEST(JsonTest, NestingIsBounded) {
    std::string deep(10000, '[');
    deep += std::string(10000, ']');
    EXPECT_THROW(parse_json(deep), NotebookFormatError);
}

#include <gtest/gtest.h>
#include "../src/parser.hpp"
#include "../src/errors.hpp"
#include <vector>
#include <functional>
#include <string>

using namespace bitwise;

namespace {

void expect_primitive(const Node* node, const std::string& name, PrimitiveKind kind) {
    const auto* primitive = dynamic_cast<const PrimitiveNode*>(node);
    ASSERT_NE(primitive, nullptr) << "Expected PrimitiveNode";
    EXPECT_EQ(primitive->name, name);
    EXPECT_EQ(primitive->kind, kind);
}

void expect_array(const Node* node, const std::string& name, size_t count) {
    const auto* array = dynamic_cast<const ArrayNode*>(node);
    ASSERT_NE(array, nullptr) << "Expected ArrayNode";
    EXPECT_EQ(array->name, name);
    EXPECT_EQ(array->count, count);
    ASSERT_NE(array->element, nullptr);
}

void expect_record(const Node* node, const std::string& name, bool isUnion, size_t memberCount) {
    const auto* record = dynamic_cast<const RecordNode*>(node);
    ASSERT_NE(record, nullptr) << "Expected RecordNode";
    EXPECT_EQ(record->name, name);
    EXPECT_EQ(record->isUnion, isUnion);
    EXPECT_EQ(record->members.size(), memberCount);
}

void expect_schema(std::string_view source, const std::vector<std::function<void(const Node*)>>& validators) {
    const CompiledSchema schema = compile(source);
    const auto& root = schema.root();

    ASSERT_EQ(root.members.size(), validators.size())
        << "Item count mismatch";

    for (size_t i = 0; i < validators.size(); ++i) {
        validators[i](root.members[i].get());
    }
}

int syntax_error_line(std::string_view source) {
    try {
        compile(source);
    } catch (const SyntaxError& e) {
        return e.line();
    }
    ADD_FAILURE() << "Expected SyntaxError for: " << source;
    return -1;
}

} // namespace

TEST(ParserTests, SimplePrimitiveDeclaration) {
    expect_schema("u8 a; il32 b;", {
        [](const Node* n) { expect_primitive(n, "a", PrimitiveKind::UNSIGNED_8); },
        [](const Node* n) { expect_primitive(n, "b", PrimitiveKind::SIGNED_32_LE); },
    });
}

TEST(ParserTests, ArrayDeclaration) {
    expect_schema("char name[6]; u8 single[1];", {
        [](const Node* n) {
            expect_array(n, "name", 6);
            const auto* array = dynamic_cast<const ArrayNode*>(n);
            expect_primitive(array->element.get(), "name", PrimitiveKind::CHAR);
        },
        // a count of one is still an array
        [](const Node* n) { expect_array(n, "single", 1); },
    });
}

TEST(ParserTests, HexArrayCount) {
    expect_schema("u8 table[0x10];", {
        [](const Node* n) { expect_array(n, "table", 16); },
    });
}

TEST(ParserTests, BitfieldGroup) {
    expect_schema("u16 mode:3, power:1, step:12;", {
        [](const Node* n) {
            const auto* group = dynamic_cast<const BitfieldGroupNode*>(n);
            ASSERT_NE(group, nullptr) << "Expected BitfieldGroupNode";
            EXPECT_EQ(group->base, PrimitiveKind::UNSIGNED_16);
            ASSERT_EQ(group->members.size(), 3u);
            EXPECT_EQ(group->members[0].name, "mode");
            EXPECT_EQ(group->members[0].width, 3u);
            EXPECT_EQ(group->members[2].name, "step");
            EXPECT_EQ(group->members[2].width, 12u);
        },
    });
}

TEST(ParserTests, AnonymousStructDeclaration) {
    expect_schema("struct { u8 a; u8 b; } settings;", {
        [](const Node* n) { expect_record(n, "settings", false, 2); },
    });
}

TEST(ParserTests, StructArrayDeclaration) {
    expect_schema("struct { u32 freq; char name[8]; } memory[100];", {
        [](const Node* n) {
            expect_array(n, "memory", 100);
            const auto* array = dynamic_cast<const ArrayNode*>(n);
            expect_record(array->element.get(), "memory", false, 2);
        },
    });
}

TEST(ParserTests, NamedStructDefinitionDeclaresNothing) {
    expect_schema("struct chan { u8 a; u8 b; };\nstruct chan first;\nstruct chan rest[3];", {
        [](const Node* n) { expect_record(n, "first", false, 2); },
        [](const Node* n) {
            expect_array(n, "rest", 3);
            const auto* array = dynamic_cast<const ArrayNode*>(n);
            expect_record(array->element.get(), "rest", false, 2);
        },
    });
}

TEST(ParserTests, UnionDeclaration) {
    expect_schema("union { u16 word; u8 bytes[2]; } value;", {
        [](const Node* n) { expect_record(n, "value", true, 2); },
    });
}

TEST(ParserTests, Directives) {
    expect_schema("#seekto 0x100;\n#seek 4;\n#printoffset \"here\";", {
        [](const Node* n) {
            const auto* d = dynamic_cast<const DirectiveNode*>(n);
            ASSERT_NE(d, nullptr);
            EXPECT_EQ(d->kind, DirectiveKind::SEEK_TO);
            EXPECT_EQ(d->value, 0x100u);
            EXPECT_EQ(d->line, 1);
        },
        [](const Node* n) {
            const auto* d = dynamic_cast<const DirectiveNode*>(n);
            ASSERT_NE(d, nullptr);
            EXPECT_EQ(d->kind, DirectiveKind::SEEK);
            EXPECT_EQ(d->value, 4u);
        },
        [](const Node* n) {
            const auto* d = dynamic_cast<const DirectiveNode*>(n);
            ASSERT_NE(d, nullptr);
            EXPECT_EQ(d->kind, DirectiveKind::PRINT_OFFSET);
            EXPECT_EQ(d->label, "here");
            EXPECT_EQ(d->line, 3);
        },
    });
}

TEST(ParserTests, NestedRecords) {
    expect_schema("struct {\n  struct { u8 x; } inner;\n  union { u8 a; char b; } u;\n} outer;", {
        [](const Node* n) {
            expect_record(n, "outer", false, 2);
            const auto* outer = dynamic_cast<const RecordNode*>(n);
            expect_record(outer->members[0].get(), "inner", false, 1);
            expect_record(outer->members[1].get(), "u", true, 2);
        },
    });
}

TEST(ParserTests, CompiledSchemaKeepsSource) {
    const std::string text = "u8 a;";
    const CompiledSchema schema = compile(text);
    EXPECT_EQ(schema.source(), text);
}

// ============================================================================
// Syntax errors
// ============================================================================

TEST(ParserTests, UnknownTypeThrows) {
    EXPECT_EQ(syntax_error_line("u8 a;\nfloat b;"), 2);
}

TEST(ParserTests, UnknownStructTypeThrows) {
    EXPECT_EQ(syntax_error_line("struct nope x;"), 1);
}

TEST(ParserTests, MissingSemicolonThrows) {
    EXPECT_EQ(syntax_error_line("u8 a\nu8 b;"), 2);
}

TEST(ParserTests, UnterminatedBlockThrows) {
    EXPECT_EQ(syntax_error_line("struct {\n  u8 a;\n"), 1);
}

TEST(ParserTests, BitfieldWidthsMustFillBase) {
    // not a whole number of bytes
    EXPECT_EQ(syntax_error_line("u8 a:3, b:4;"), 1);
    // whole bytes but not the base width
    EXPECT_EQ(syntax_error_line("u16 a:4, b:4;"), 1);
}

TEST(ParserTests, BitfieldOnSignedTypeThrows) {
    EXPECT_THROW(compile("i8 a:4, b:4;"), SyntaxError);
    EXPECT_THROW(compile("char a:4, b:4;"), SyntaxError);
    EXPECT_THROW(compile("bbcd a:4, b:4;"), SyntaxError);
}

TEST(ParserTests, ZeroWidthBitfieldThrows) {
    EXPECT_THROW(compile("u8 a:0, b:8;"), SyntaxError);
}

TEST(ParserTests, ArrayCountMustBePositiveInteger) {
    EXPECT_THROW(compile("u8 a[0];"), SyntaxError);
    EXPECT_THROW(compile("u8 a[n];"), SyntaxError);
    EXPECT_THROW(compile("u8 a[];"), SyntaxError);
}

TEST(ParserTests, BareBitThrows) {
    EXPECT_THROW(compile("bit flag;"), SyntaxError);
    EXPECT_THROW(compile("lbit flag;"), SyntaxError);
    EXPECT_NO_THROW(compile("bit flags[8];"));
}

TEST(ParserTests, BitArrayMustFillWholeBytes) {
    EXPECT_THROW(compile("bit foo[23];"), SyntaxError);
    EXPECT_THROW(compile("bit a[3]; bit b[5];"), SyntaxError);
    EXPECT_THROW(compile("struct { lbit foo[4]; } s;"), SyntaxError);
    EXPECT_NO_THROW(compile("lbit foo[16];"));
}

TEST(ParserTests, EmptyUnionThrows) {
    EXPECT_THROW(compile("union { } u;"), SyntaxError);
}

TEST(ParserTests, StructRedefinitionThrows) {
    EXPECT_THROW(compile("struct s { u8 a; };\nstruct s { u8 b; };"), SyntaxError);
}

TEST(ParserTests, ErrorMessageNamesLine) {
    try {
        compile("u8 a;\nu8 b;\nu8 c[0];");
        FAIL() << "Expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_EQ(e.line(), 3);
        EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos);
    }
}

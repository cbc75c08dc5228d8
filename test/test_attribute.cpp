#include <gtest/gtest.h>
#include "attribute.hpp"
#include "constantPool.hpp"
#include "errors.hpp"
#include "reader.hpp"
#include "test_helpers.hpp"

using namespace classdec;
using namespace classdec::test;

class AttributeTest : public ::testing::Test {
protected:
    // Adds the name to the pool, then decodes one attribute with that name
    // and the given body. The declared length is the size of the body.
    Attribute decode(const std::string& name, const ByteBuilder& body) {
        const u16 name_index = pool_.utf8(name);
        auto constants = pool_.parse();
        auto bytes = attribute(name_index, body);
        Reader reader(bytes.slice(), "Test.class");
        auto result = parse_attribute(reader, constants);
        EXPECT_EQ(reader.remaining(), 0u);
        EXPECT_EQ(result.attribute_name_index_, name_index);
        EXPECT_EQ(result.attribute_length_, body.size());
        EXPECT_EQ(std::string(result.name()), name);
        return result;
    }

    MalformedClassFile decode_error(const ByteBuilder& bytes) {
        auto constants = pool_.parse();
        Reader reader(bytes.slice(), "Test.class");
        try {
            parse_attribute(reader, constants);
        } catch (const MalformedClassFile& err) {
            return err;
        }
        ADD_FAILURE() << "expected MalformedClassFile";
        return MalformedClassFile("", "", "");
    }

    PoolBuilder pool_;
};

// ============================================================================
// Simple attributes
// ============================================================================

TEST_F(AttributeTest, ConstantValue) {
    ByteBuilder body;
    body.put_u16(7);
    auto attr = decode("ConstantValue", body);
    ASSERT_NE(attr.get<AttributeConstantValue>(), nullptr);
    EXPECT_EQ(attr.get<AttributeConstantValue>()->constantvalue_index_, 7);
}

TEST_F(AttributeTest, CodeWithoutExtras) {
    ByteBuilder body;
    body.put_u16(4).put_u16(2);
    body.put_u32(3).put_bytes({0x2a, 0xb7, 0xb1});
    body.put_u16(0);
    body.put_u16(0);
    auto attr = decode("Code", body);
    auto code = attr.get<AttributeCode>();
    ASSERT_NE(code, nullptr);
    EXPECT_EQ(code->max_stack_, 4);
    EXPECT_EQ(code->max_locals_, 2);
    EXPECT_EQ(code->code_, std::vector<u8>({0x2a, 0xb7, 0xb1}));
    EXPECT_TRUE(code->exception_table_.empty());
    EXPECT_TRUE(code->attributes_.empty());
}

TEST_F(AttributeTest, CodeWithExceptionTableAndNestedAttributes) {
    const u16 line_numbers = pool_.utf8("LineNumberTable");
    const u16 stack_map = pool_.utf8("StackMapTable");

    ByteBuilder lines;
    lines.put_u16(1).put_u16(0).put_u16(10);

    ByteBuilder frames;
    frames.put_u16(1).put_u8(3);

    ByteBuilder body;
    body.put_u16(1).put_u16(1);
    body.put_u32(1).put_u8(0xb1);
    body.put_u16(1).put_u16(0).put_u16(1).put_u16(1).put_u16(0);
    body.put_u16(2);
    body.append(attribute(line_numbers, lines));
    body.append(attribute(stack_map, frames));

    auto attr = decode("Code", body);
    auto& code = std::get<AttributeCode>(attr.info_);
    ASSERT_EQ(code.exception_table_.size(), 1u);
    EXPECT_EQ(code.exception_table_[0].handler_pc_, 1);
    EXPECT_EQ(code.exception_table_[0].catch_type_, 0);

    ASSERT_EQ(code.attributes_.size(), 2u);
    auto table = find_attribute<AttributeLineNumberTable>(code.attributes_);
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(table->line_number_table_[0].line_number_, 10);
    auto map = find_attribute<AttributeStackMapTable>(code.attributes_);
    ASSERT_NE(map, nullptr);
    ASSERT_EQ(map->entries_.size(), 1u);
    EXPECT_EQ(offset_delta(map->entries_[0]), 3);
    EXPECT_EQ(find_attribute<AttributeSignature>(code.attributes_), nullptr);
}

TEST_F(AttributeTest, StackMapTable) {
    ByteBuilder body;
    body.put_u16(2).put_u8(0).put_u8(251).put_u16(5);
    auto attr = decode("StackMapTable", body);
    auto& map = std::get<AttributeStackMapTable>(attr.info_);
    ASSERT_EQ(map.entries_.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<SameFrameExtended>(map.entries_[1]));
}

TEST_F(AttributeTest, Exceptions) {
    ByteBuilder body;
    body.put_u16(2).put_u16(3).put_u16(4);
    auto attr = decode("Exceptions", body);
    EXPECT_EQ(std::get<AttributeExceptions>(attr.info_).exception_index_table_,
              std::vector<u16>({3, 4}));
}

TEST_F(AttributeTest, InnerClasses) {
    ByteBuilder body;
    body.put_u16(1).put_u16(2).put_u16(3).put_u16(4).put_u16(0x0008);
    auto attr = decode("InnerClasses", body);
    auto& inner = std::get<AttributeInnerClasses>(attr.info_);
    ASSERT_EQ(inner.classes_.size(), 1u);
    EXPECT_EQ(inner.classes_[0].inner_class_info_index_, 2);
    EXPECT_EQ(inner.classes_[0].outer_class_info_index_, 3);
    EXPECT_EQ(inner.classes_[0].inner_name_index_, 4);
    EXPECT_EQ(inner.classes_[0].inner_class_access_flags_, 0x0008);
}

TEST_F(AttributeTest, EnclosingMethod) {
    ByteBuilder body;
    body.put_u16(5).put_u16(0);
    auto attr = decode("EnclosingMethod", body);
    auto& enclosing = std::get<AttributeEnclosingMethod>(attr.info_);
    EXPECT_EQ(enclosing.class_index_, 5);
    EXPECT_EQ(enclosing.method_index_, 0);
}

TEST_F(AttributeTest, Synthetic) {
    auto attr = decode("Synthetic", ByteBuilder());
    EXPECT_NE(attr.get<AttributeSynthetic>(), nullptr);
}

TEST_F(AttributeTest, Signature) {
    ByteBuilder body;
    body.put_u16(9);
    auto attr = decode("Signature", body);
    EXPECT_EQ(std::get<AttributeSignature>(attr.info_).signature_index_, 9);
}

TEST_F(AttributeTest, SourceFile) {
    ByteBuilder body;
    body.put_u16(10);
    auto attr = decode("SourceFile", body);
    EXPECT_EQ(std::get<AttributeSourceFile>(attr.info_).sourcefile_index_, 10);
}

TEST_F(AttributeTest, SourceDebugExtension) {
    ByteBuilder body;
    body.put_bytes({'S', 'M', 'A', 'P', '\n'});
    auto attr = decode("SourceDebugExtension", body);
    EXPECT_EQ(std::get<AttributeSourceDebugExtension>(attr.info_).debug_extension_,
              std::vector<u8>({'S', 'M', 'A', 'P', '\n'}));
}

TEST_F(AttributeTest, LineNumberTable) {
    ByteBuilder body;
    body.put_u16(2).put_u16(0).put_u16(3).put_u16(4).put_u16(5);
    auto attr = decode("LineNumberTable", body);
    auto& table = std::get<AttributeLineNumberTable>(attr.info_);
    ASSERT_EQ(table.line_number_table_.size(), 2u);
    EXPECT_EQ(table.line_number_table_[1].start_pc_, 4);
    EXPECT_EQ(table.line_number_table_[1].line_number_, 5);
}

TEST_F(AttributeTest, LocalVariableTable) {
    ByteBuilder body;
    body.put_u16(1).put_u16(0).put_u16(5).put_u16(6).put_u16(7).put_u16(1);
    auto attr = decode("LocalVariableTable", body);
    auto& entry = std::get<AttributeLocalVariableTable>(attr.info_)
                      .local_variable_table_.at(0);
    EXPECT_EQ(entry.length_, 5);
    EXPECT_EQ(entry.name_index_, 6);
    EXPECT_EQ(entry.descriptor_index_, 7);
    EXPECT_EQ(entry.index_, 1);
}

TEST_F(AttributeTest, LocalVariableTypeTable) {
    ByteBuilder body;
    body.put_u16(1).put_u16(2).put_u16(5).put_u16(6).put_u16(8).put_u16(3);
    auto attr = decode("LocalVariableTypeTable", body);
    auto& entry = std::get<AttributeLocalVariableTypeTable>(attr.info_)
                      .local_variable_type_table_.at(0);
    EXPECT_EQ(entry.start_pc_, 2);
    EXPECT_EQ(entry.signature_index_, 8);
    EXPECT_EQ(entry.index_, 3);
}

TEST_F(AttributeTest, Deprecated) {
    auto attr = decode("Deprecated", ByteBuilder());
    EXPECT_NE(attr.get<AttributeDeprecated>(), nullptr);
}

// ============================================================================
// Annotation attributes
// ============================================================================

TEST_F(AttributeTest, RuntimeVisibleAnnotations) {
    ByteBuilder body;
    body.put_u16(1).put_u16(4).put_u16(1).put_u16(5).put_u8('s').put_u16(6);
    auto attr = decode("RuntimeVisibleAnnotations", body);
    auto& annotations =
        std::get<AttributeRuntimeVisibleAnnotations>(attr.info_).annotations_;
    ASSERT_EQ(annotations.size(), 1u);
    EXPECT_EQ(annotations[0].type_index_, 4);
}

TEST_F(AttributeTest, RuntimeInvisibleAnnotations) {
    ByteBuilder body;
    body.put_u16(1).put_u16(4).put_u16(0);
    auto attr = decode("RuntimeInvisibleAnnotations", body);
    EXPECT_EQ(attr.get<AttributeRuntimeVisibleAnnotations>(), nullptr);
    ASSERT_NE(attr.get<AttributeRuntimeInvisibleAnnotations>(), nullptr);
    EXPECT_EQ(attr.get<AttributeRuntimeInvisibleAnnotations>()->annotations_.size(),
              1u);
}

TEST_F(AttributeTest, RuntimeVisibleParameterAnnotations) {
    ByteBuilder body;
    body.put_u8(2).put_u16(0).put_u16(1).put_u16(4).put_u16(0);
    auto attr = decode("RuntimeVisibleParameterAnnotations", body);
    auto& parameters = std::get<AttributeRuntimeVisibleParameterAnnotations>(
                           attr.info_)
                           .parameter_annotations_;
    ASSERT_EQ(parameters.size(), 2u);
    EXPECT_TRUE(parameters[0].empty());
    EXPECT_EQ(parameters[1].size(), 1u);
}

TEST_F(AttributeTest, RuntimeInvisibleParameterAnnotations) {
    ByteBuilder body;
    body.put_u8(1).put_u16(0);
    auto attr = decode("RuntimeInvisibleParameterAnnotations", body);
    EXPECT_EQ(std::get<AttributeRuntimeInvisibleParameterAnnotations>(attr.info_)
                  .parameter_annotations_.size(),
              1u);
}

TEST_F(AttributeTest, RuntimeVisibleTypeAnnotations) {
    ByteBuilder body;
    body.put_u16(1).put_u8(0x10).put_u16(0xffff).put_u8(0).put_u16(4).put_u16(0);
    auto attr = decode("RuntimeVisibleTypeAnnotations", body);
    auto& annotations =
        std::get<AttributeRuntimeVisibleTypeAnnotations>(attr.info_).annotations_;
    ASSERT_EQ(annotations.size(), 1u);
    EXPECT_EQ(annotations[0].target_type_, 0x10);
    EXPECT_TRUE(std::holds_alternative<SupertypeTarget>(annotations[0].target_info_));
}

TEST_F(AttributeTest, RuntimeInvisibleTypeAnnotations) {
    ByteBuilder body;
    body.put_u16(1).put_u8(0x47).put_u16(3).put_u8(0).put_u8(0).put_u16(4).put_u16(0);
    auto attr = decode("RuntimeInvisibleTypeAnnotations", body);
    auto& annotations =
        std::get<AttributeRuntimeInvisibleTypeAnnotations>(attr.info_).annotations_;
    ASSERT_EQ(annotations.size(), 1u);
    EXPECT_TRUE(
        std::holds_alternative<TypeArgumentTarget>(annotations[0].target_info_));
}

TEST_F(AttributeTest, AnnotationDefault) {
    ByteBuilder body;
    body.put_u8('[').put_u16(1).put_u8('I').put_u16(2);
    auto attr = decode("AnnotationDefault", body);
    auto& value = std::get<AttributeAnnotationDefault>(attr.info_).default_value_;
    EXPECT_EQ(value.tag_, '[');
}

// ============================================================================
// Methods, modules, nests and records
// ============================================================================

TEST_F(AttributeTest, BootstrapMethods) {
    ByteBuilder body;
    body.put_u16(2);
    body.put_u16(5).put_u16(2).put_u16(6).put_u16(7);
    body.put_u16(8).put_u16(0);
    auto attr = decode("BootstrapMethods", body);
    auto& methods = std::get<AttributeBootstrapMethods>(attr.info_).bootstrap_methods_;
    ASSERT_EQ(methods.size(), 2u);
    EXPECT_EQ(methods[0].bootstrap_method_ref_, 5);
    EXPECT_EQ(methods[0].bootstrap_arguments_, std::vector<u16>({6, 7}));
    EXPECT_EQ(methods[1].bootstrap_method_ref_, 8);
    EXPECT_TRUE(methods[1].bootstrap_arguments_.empty());
}

TEST_F(AttributeTest, MethodParameters) {
    ByteBuilder body;
    body.put_u8(2).put_u16(3).put_u16(0x0010).put_u16(0).put_u16(0x8000);
    auto attr = decode("MethodParameters", body);
    auto& parameters = std::get<AttributeMethodParameters>(attr.info_).parameters_;
    ASSERT_EQ(parameters.size(), 2u);
    EXPECT_EQ(parameters[0].name_index_, 3);
    EXPECT_EQ(parameters[0].access_flags_, 0x0010);
    EXPECT_EQ(parameters[1].access_flags_, 0x8000);
}

TEST_F(AttributeTest, Module) {
    ByteBuilder body;
    body.put_u16(1).put_u16(0x0020).put_u16(2);
    body.put_u16(1).put_u16(3).put_u16(0x8000).put_u16(0);
    body.put_u16(1).put_u16(4).put_u16(0).put_u16(2).put_u16(5).put_u16(6);
    body.put_u16(1).put_u16(7).put_u16(0).put_u16(0);
    body.put_u16(2).put_u16(8).put_u16(9);
    body.put_u16(1).put_u16(10).put_u16(1).put_u16(11);

    auto attr = decode("Module", body);
    auto& mod = std::get<AttributeModule>(attr.info_);
    EXPECT_EQ(mod.module_name_index_, 1);
    EXPECT_EQ(mod.module_flags_, 0x0020);
    EXPECT_EQ(mod.module_version_index_, 2);

    ASSERT_EQ(mod.requires_.size(), 1u);
    EXPECT_EQ(mod.requires_[0].requires_index_, 3);
    EXPECT_EQ(mod.requires_[0].requires_flags_, 0x8000);
    EXPECT_EQ(mod.requires_[0].requires_version_index_, 0);

    ASSERT_EQ(mod.exports_.size(), 1u);
    EXPECT_EQ(mod.exports_[0].exports_index_, 4);
    EXPECT_EQ(mod.exports_[0].exports_to_index_, std::vector<u16>({5, 6}));

    ASSERT_EQ(mod.opens_.size(), 1u);
    EXPECT_EQ(mod.opens_[0].opens_index_, 7);
    EXPECT_TRUE(mod.opens_[0].opens_to_index_.empty());

    EXPECT_EQ(mod.uses_index_, std::vector<u16>({8, 9}));

    ASSERT_EQ(mod.provides_.size(), 1u);
    EXPECT_EQ(mod.provides_[0].provides_index_, 10);
    EXPECT_EQ(mod.provides_[0].provides_with_index_, std::vector<u16>({11}));
}

TEST_F(AttributeTest, ModulePackages) {
    ByteBuilder body;
    body.put_u16(3).put_u16(1).put_u16(2).put_u16(3);
    auto attr = decode("ModulePackages", body);
    EXPECT_EQ(std::get<AttributeModulePackages>(attr.info_).package_index_,
              std::vector<u16>({1, 2, 3}));
}

TEST_F(AttributeTest, ModuleMainClass) {
    ByteBuilder body;
    body.put_u16(12);
    auto attr = decode("ModuleMainClass", body);
    EXPECT_EQ(std::get<AttributeModuleMainClass>(attr.info_).main_class_index_, 12);
}

TEST_F(AttributeTest, NestHost) {
    ByteBuilder body;
    body.put_u16(13);
    auto attr = decode("NestHost", body);
    EXPECT_EQ(std::get<AttributeNestHost>(attr.info_).host_class_index_, 13);
}

TEST_F(AttributeTest, NestMembers) {
    ByteBuilder body;
    body.put_u16(2).put_u16(14).put_u16(15);
    auto attr = decode("NestMembers", body);
    EXPECT_EQ(std::get<AttributeNestMembers>(attr.info_).classes_,
              std::vector<u16>({14, 15}));
}

TEST_F(AttributeTest, Record) {
    const u16 signature = pool_.utf8("Signature");

    ByteBuilder signature_body;
    signature_body.put_u16(20);

    ByteBuilder body;
    body.put_u16(2);
    body.put_u16(3).put_u16(4).put_u16(0);
    body.put_u16(5).put_u16(6).put_u16(1).append(attribute(signature, signature_body));

    auto attr = decode("Record", body);
    auto& components = std::get<AttributeRecord>(attr.info_).components_;
    ASSERT_EQ(components.size(), 2u);
    EXPECT_EQ(components[0].name_index_, 3);
    EXPECT_TRUE(components[0].attributes_.empty());
    EXPECT_EQ(components[1].descriptor_index_, 6);
    ASSERT_EQ(components[1].attributes_.size(), 1u);
    auto nested = components[1].attributes_[0].get<AttributeSignature>();
    ASSERT_NE(nested, nullptr);
    EXPECT_EQ(nested->signature_index_, 20);
}

TEST_F(AttributeTest, PermittedSubclasses) {
    ByteBuilder body;
    body.put_u16(1).put_u16(16);
    auto attr = decode("PermittedSubclasses", body);
    EXPECT_EQ(std::get<AttributePermittedSubclasses>(attr.info_).classes_,
              std::vector<u16>({16}));
}

// ============================================================================
// Malformed attributes
// ============================================================================

TEST_F(AttributeTest, UnknownName) {
    const u16 name = pool_.utf8("Frobnicate");
    ByteBuilder body;
    body.put_u16(0);
    auto err = decode_error(attribute(name, body));
    EXPECT_EQ(err.field(), "attribute_name_index");
    EXPECT_NE(std::string(err.what()).find("Frobnicate"), std::string::npos);
}

TEST_F(AttributeTest, NameIsNotUtf8) {
    const u16 name = pool_.class_ref("Code");
    auto err = decode_error(attribute(name, ByteBuilder()));
    EXPECT_EQ(err.field(), "attribute_name_index");
}

TEST_F(AttributeTest, NameIndexOutOfRange) {
    pool_.utf8("Code");
    auto err = decode_error(attribute(40, ByteBuilder()));
    EXPECT_EQ(err.field(), "attribute_name_index");
}

TEST_F(AttributeTest, DeclaredLengthTooLong) {
    const u16 name = pool_.utf8("SourceFile");
    ByteBuilder bytes;
    bytes.put_u16(name).put_u32(4).put_u16(1).put_u16(0);
    auto err = decode_error(bytes);
    EXPECT_EQ(err.field(), "attribute_length of SourceFile");
    EXPECT_NE(std::string(err.what()).find("expected 0x4, got 0x2"),
              std::string::npos);
}

TEST_F(AttributeTest, DeclaredLengthTooShort) {
    const u16 name = pool_.utf8("Exceptions");
    ByteBuilder bytes;
    bytes.put_u16(name).put_u32(2).put_u16(1).put_u16(3);
    auto err = decode_error(bytes);
    EXPECT_EQ(err.field(), "attribute_length of Exceptions");
}

TEST_F(AttributeTest, TruncatedBody) {
    const u16 name = pool_.utf8("Code");
    ByteBuilder bytes;
    bytes.put_u16(name).put_u32(12).put_u16(1).put_u16(1).put_u32(10).put_u8(0);
    auto constants = pool_.parse();
    Reader reader(bytes.slice(), "Test.class");
    EXPECT_THROW(parse_attribute(reader, constants), TruncatedInput);
}

// A Code attribute whose only nested attribute is another Code attribute,
// `levels` deep. Returns the outermost attribute, header included.
static ByteBuilder nested_code(u16 code_name, int levels) {
    ByteBuilder result;
    for (int i = 0; i < levels; ++i) {
        ByteBuilder body;
        body.put_u16(1).put_u16(1);
        body.put_u32(1).put_u8(0xb1);
        body.put_u16(0);
        if (i == 0) {
            body.put_u16(0);
        } else {
            body.put_u16(1).append(result);
        }
        result = attribute(code_name, body);
    }
    return result;
}

TEST_F(AttributeTest, CodeNestingAtTheLimit) {
    const u16 code = pool_.utf8("Code");
    auto constants = pool_.parse();
    auto bytes = nested_code(code, CLASSDEC_MAX_NESTING_DEPTH);
    Reader reader(bytes.slice(), "Test.class");
    auto attr = parse_attribute(reader, constants);
    EXPECT_EQ(reader.remaining(), 0u);
    EXPECT_EQ(reader.depth(), 0);
    ASSERT_NE(attr.get<AttributeCode>(), nullptr);
    EXPECT_EQ(attr.get<AttributeCode>()->attributes_.size(), 1u);
}

TEST_F(AttributeTest, CodeNestedTooDeep) {
    const u16 code = pool_.utf8("Code");
    auto err = decode_error(nested_code(code, CLASSDEC_MAX_NESTING_DEPTH + 1));
    EXPECT_EQ(err.field(), "attributes");
    EXPECT_NE(std::string(err.what()).find("nested deeper than"),
              std::string::npos);
}

TEST_F(AttributeTest, RecordNestedTooDeep) {
    const u16 record = pool_.utf8("Record");

    // Each Record holds one component, which holds the next Record.
    ByteBuilder bytes;
    for (int i = 0; i <= CLASSDEC_MAX_NESTING_DEPTH; ++i) {
        ByteBuilder body;
        body.put_u16(1).put_u16(3).put_u16(4);
        if (i == 0) {
            body.put_u16(0);
        } else {
            body.put_u16(1).append(bytes);
        }
        bytes = attribute(record, body);
    }

    auto err = decode_error(bytes);
    EXPECT_EQ(err.field(), "attributes");
}

TEST_F(AttributeTest, AttributeList) {
    const u16 synthetic = pool_.utf8("Synthetic");
    const u16 deprecated = pool_.utf8("Deprecated");
    auto constants = pool_.parse();

    ByteBuilder bytes;
    bytes.put_u16(2);
    bytes.append(attribute(synthetic, ByteBuilder()));
    bytes.append(attribute(deprecated, ByteBuilder()));

    Reader reader(bytes.slice(), "Test.class");
    auto attributes = parse_attributes(reader, constants);
    EXPECT_EQ(reader.remaining(), 0u);
    ASSERT_EQ(attributes.size(), 2u);
    EXPECT_STREQ(attributes[0].name(), "Synthetic");
    EXPECT_STREQ(attributes[1].name(), "Deprecated");
}

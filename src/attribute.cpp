#include "attribute.hpp"
#include "constantPool.hpp"
#include "defines.hpp"
#include "errors.hpp"
#include "reader.hpp"
#include "slice.hpp"



namespace classdec {



static std::vector<u16> parse_u16_list(Reader& reader)
{
    const u16 count = reader.read_u16();

    std::vector<u16> result;
    result.reserve(count);

    for (int i = 0; i < count; ++i) {
        result.push_back(reader.read_u16());
    }

    return result;
}



static std::vector<u8> copy_bytes(Slice bytes)
{
    return std::vector<u8>(bytes.bytes(), bytes.bytes() + bytes.length_);
}



// NOTE: each overload below reads the body of one attribute, i.e. everything
// after attribute_name_index and attribute_length.



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32,
                       AttributeConstantValue& attr)
{
    attr.constantvalue_index_ = reader.read_u16();
}



static void
parse_body(Reader& reader, const ConstantPool& constants, u32, AttributeCode& attr)
{
    attr.max_stack_ = reader.read_u16();
    attr.max_locals_ = reader.read_u16();

    const u32 code_length = reader.read_u32();
    attr.code_ = copy_bytes(reader.read_bytes(code_length));

    const u16 exception_table_length = reader.read_u16();
    attr.exception_table_.reserve(exception_table_length);
    for (int i = 0; i < exception_table_length; ++i) {
        ExceptionTableEntry entry;
        entry.start_pc_ = reader.read_u16();
        entry.end_pc_ = reader.read_u16();
        entry.handler_pc_ = reader.read_u16();
        entry.catch_type_ = reader.read_u16();
        attr.exception_table_.push_back(entry);
    }

    attr.attributes_ = parse_attributes(reader, constants);
}



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32,
                       AttributeStackMapTable& attr)
{
    const u16 number_of_entries = reader.read_u16();
    attr.entries_.reserve(number_of_entries);
    for (int i = 0; i < number_of_entries; ++i) {
        attr.entries_.push_back(parse_stack_map_frame(reader));
    }
}



static void
parse_body(Reader& reader, const ConstantPool&, u32, AttributeExceptions& attr)
{
    attr.exception_index_table_ = parse_u16_list(reader);
}



static void
parse_body(Reader& reader, const ConstantPool&, u32, AttributeInnerClasses& attr)
{
    const u16 number_of_classes = reader.read_u16();
    attr.classes_.reserve(number_of_classes);
    for (int i = 0; i < number_of_classes; ++i) {
        AttributeInnerClasses::Entry entry;
        entry.inner_class_info_index_ = reader.read_u16();
        entry.outer_class_info_index_ = reader.read_u16();
        entry.inner_name_index_ = reader.read_u16();
        entry.inner_class_access_flags_ = reader.read_u16();
        attr.classes_.push_back(entry);
    }
}



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32,
                       AttributeEnclosingMethod& attr)
{
    attr.class_index_ = reader.read_u16();
    attr.method_index_ = reader.read_u16();
}



static void
parse_body(Reader&, const ConstantPool&, u32, AttributeSynthetic&)
{
}



static void
parse_body(Reader& reader, const ConstantPool&, u32, AttributeSignature& attr)
{
    attr.signature_index_ = reader.read_u16();
}



static void
parse_body(Reader& reader, const ConstantPool&, u32, AttributeSourceFile& attr)
{
    attr.sourcefile_index_ = reader.read_u16();
}



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32 length,
                       AttributeSourceDebugExtension& attr)
{
    // The body is an opaque run of modified utf-8, as long as the attribute.
    attr.debug_extension_ = copy_bytes(reader.read_bytes(length));
}



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32,
                       AttributeLineNumberTable& attr)
{
    const u16 table_length = reader.read_u16();
    attr.line_number_table_.reserve(table_length);
    for (int i = 0; i < table_length; ++i) {
        AttributeLineNumberTable::Row row;
        row.start_pc_ = reader.read_u16();
        row.line_number_ = reader.read_u16();
        attr.line_number_table_.push_back(row);
    }
}



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32,
                       AttributeLocalVariableTable& attr)
{
    const u16 table_length = reader.read_u16();
    attr.local_variable_table_.reserve(table_length);
    for (int i = 0; i < table_length; ++i) {
        AttributeLocalVariableTable::Entry entry;
        entry.start_pc_ = reader.read_u16();
        entry.length_ = reader.read_u16();
        entry.name_index_ = reader.read_u16();
        entry.descriptor_index_ = reader.read_u16();
        entry.index_ = reader.read_u16();
        attr.local_variable_table_.push_back(entry);
    }
}



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32,
                       AttributeLocalVariableTypeTable& attr)
{
    const u16 table_length = reader.read_u16();
    attr.local_variable_type_table_.reserve(table_length);
    for (int i = 0; i < table_length; ++i) {
        AttributeLocalVariableTypeTable::Entry entry;
        entry.start_pc_ = reader.read_u16();
        entry.length_ = reader.read_u16();
        entry.name_index_ = reader.read_u16();
        entry.signature_index_ = reader.read_u16();
        entry.index_ = reader.read_u16();
        attr.local_variable_type_table_.push_back(entry);
    }
}



static void
parse_body(Reader&, const ConstantPool&, u32, AttributeDeprecated&)
{
}



static void
parse_body(Reader& reader, const ConstantPool&, u32, AttributeAnnotations& attr)
{
    attr.annotations_ = parse_annotations(reader);
}



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32,
                       AttributeParameterAnnotations& attr)
{
    attr.parameter_annotations_ = parse_parameter_annotations(reader);
}



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32,
                       AttributeTypeAnnotations& attr)
{
    attr.annotations_ = parse_type_annotations(reader);
}



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32,
                       AttributeAnnotationDefault& attr)
{
    attr.default_value_ = parse_element_value(reader);
}



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32,
                       AttributeBootstrapMethods& attr)
{
    const u16 num_bootstrap_methods = reader.read_u16();
    attr.bootstrap_methods_.reserve(num_bootstrap_methods);
    for (int i = 0; i < num_bootstrap_methods; ++i) {
        AttributeBootstrapMethods::BootstrapMethod method;
        method.bootstrap_method_ref_ = reader.read_u16();
        method.bootstrap_arguments_ = parse_u16_list(reader);
        attr.bootstrap_methods_.push_back(std::move(method));
    }
}



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32,
                       AttributeMethodParameters& attr)
{
    // NOTE: unlike most tables, the count is a single byte.
    const u8 parameters_count = reader.read_u8();
    attr.parameters_.reserve(parameters_count);
    for (int i = 0; i < parameters_count; ++i) {
        AttributeMethodParameters::Parameter parameter;
        parameter.name_index_ = reader.read_u16();
        parameter.access_flags_ = reader.read_u16();
        attr.parameters_.push_back(parameter);
    }
}



static void
parse_body(Reader& reader, const ConstantPool&, u32, AttributeModule& attr)
{
    attr.module_name_index_ = reader.read_u16();
    attr.module_flags_ = reader.read_u16();
    attr.module_version_index_ = reader.read_u16();

    const u16 requires_count = reader.read_u16();
    attr.requires_.reserve(requires_count);
    for (int i = 0; i < requires_count; ++i) {
        AttributeModule::Requires entry;
        entry.requires_index_ = reader.read_u16();
        entry.requires_flags_ = reader.read_u16();
        entry.requires_version_index_ = reader.read_u16();
        attr.requires_.push_back(entry);
    }

    const u16 exports_count = reader.read_u16();
    attr.exports_.reserve(exports_count);
    for (int i = 0; i < exports_count; ++i) {
        AttributeModule::Exports entry;
        entry.exports_index_ = reader.read_u16();
        entry.exports_flags_ = reader.read_u16();
        entry.exports_to_index_ = parse_u16_list(reader);
        attr.exports_.push_back(std::move(entry));
    }

    const u16 opens_count = reader.read_u16();
    attr.opens_.reserve(opens_count);
    for (int i = 0; i < opens_count; ++i) {
        AttributeModule::Opens entry;
        entry.opens_index_ = reader.read_u16();
        entry.opens_flags_ = reader.read_u16();
        entry.opens_to_index_ = parse_u16_list(reader);
        attr.opens_.push_back(std::move(entry));
    }

    attr.uses_index_ = parse_u16_list(reader);

    const u16 provides_count = reader.read_u16();
    attr.provides_.reserve(provides_count);
    for (int i = 0; i < provides_count; ++i) {
        AttributeModule::Provides entry;
        entry.provides_index_ = reader.read_u16();
        entry.provides_with_index_ = parse_u16_list(reader);
        attr.provides_.push_back(std::move(entry));
    }
}



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32,
                       AttributeModulePackages& attr)
{
    attr.package_index_ = parse_u16_list(reader);
}



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32,
                       AttributeModuleMainClass& attr)
{
    attr.main_class_index_ = reader.read_u16();
}



static void
parse_body(Reader& reader, const ConstantPool&, u32, AttributeNestHost& attr)
{
    attr.host_class_index_ = reader.read_u16();
}



static void
parse_body(Reader& reader, const ConstantPool&, u32, AttributeNestMembers& attr)
{
    attr.classes_ = parse_u16_list(reader);
}



static void parse_body(Reader& reader,
                       const ConstantPool& constants,
                       u32,
                       AttributeRecord& attr)
{
    const u16 components_count = reader.read_u16();
    attr.components_.reserve(components_count);
    for (int i = 0; i < components_count; ++i) {
        AttributeRecord::Component component;
        component.name_index_ = reader.read_u16();
        component.descriptor_index_ = reader.read_u16();
        component.attributes_ = parse_attributes(reader, constants);
        attr.components_.push_back(std::move(component));
    }
}



static void parse_body(Reader& reader,
                       const ConstantPool&,
                       u32,
                       AttributePermittedSubclasses& attr)
{
    attr.classes_ = parse_u16_list(reader);
}



template <typename T>
static Attribute::Info
decode(Reader& reader, const ConstantPool& constants, u32 length)
{
    T attr{};
    parse_body(reader, constants, length, attr);
    return attr;
}



struct AttributeDecoder {
    const char* name_;
    Attribute::Info (*decode_)(Reader&, const ConstantPool&, u32);
};



template <typename T> static constexpr AttributeDecoder decoder()
{
    return {T::name, decode<T>};
}



static const AttributeDecoder attribute_decoders[] = {
    decoder<AttributeConstantValue>(),
    decoder<AttributeCode>(),
    decoder<AttributeStackMapTable>(),
    decoder<AttributeExceptions>(),
    decoder<AttributeInnerClasses>(),
    decoder<AttributeEnclosingMethod>(),
    decoder<AttributeSynthetic>(),
    decoder<AttributeSignature>(),
    decoder<AttributeSourceFile>(),
    decoder<AttributeSourceDebugExtension>(),
    decoder<AttributeLineNumberTable>(),
    decoder<AttributeLocalVariableTable>(),
    decoder<AttributeLocalVariableTypeTable>(),
    decoder<AttributeDeprecated>(),
    decoder<AttributeRuntimeVisibleAnnotations>(),
    decoder<AttributeRuntimeInvisibleAnnotations>(),
    decoder<AttributeRuntimeVisibleParameterAnnotations>(),
    decoder<AttributeRuntimeInvisibleParameterAnnotations>(),
    decoder<AttributeRuntimeVisibleTypeAnnotations>(),
    decoder<AttributeRuntimeInvisibleTypeAnnotations>(),
    decoder<AttributeAnnotationDefault>(),
    decoder<AttributeBootstrapMethods>(),
    decoder<AttributeMethodParameters>(),
    decoder<AttributeModule>(),
    decoder<AttributeModulePackages>(),
    decoder<AttributeModuleMainClass>(),
    decoder<AttributeNestHost>(),
    decoder<AttributeNestMembers>(),
    decoder<AttributeRecord>(),
    decoder<AttributePermittedSubclasses>(),
};



static const AttributeDecoder* find_decoder(const std::string& name)
{
    for (auto& entry : attribute_decoders) {
        if (Slice(name) == Slice::from_c_str(entry.name_)) {
            return &entry;
        }
    }
    return nullptr;
}



Attribute parse_attribute(Reader& reader, const ConstantPool& constants)
{
    Attribute result;
    result.attribute_name_index_ = reader.read_u16();
    result.attribute_length_ = reader.read_u32();

    auto& name =
        constants.load_string(result.attribute_name_index_, "attribute_name_index");

    auto found = find_decoder(name);
    if (not found) {
        throw MalformedClassFile(reader.source(),
                                 "attribute_name_index",
                                 "unknown attribute name \"" + name + "\"");
    }

    const size_t start = reader.offset();

    result.info_ = found->decode_(reader, constants, result.attribute_length_);

#if CLASSDEC_CHECK_ATTRIBUTE_LENGTH
    const size_t consumed = reader.offset() - start;
    if (consumed not_eq result.attribute_length_) {
        throw MalformedClassFile::wrong_value(
            reader.source(),
            std::string("attribute_length of ") + found->name_,
            static_cast<u32>(consumed),
            result.attribute_length_);
    }
#else
    (void)start;
#endif

    return result;
}



Attributes parse_attributes(Reader& reader, const ConstantPool& constants)
{
    // Code and Record carry attribute tables of their own.
    NestingScope scope(reader, "attributes");

    const u16 attributes_count = reader.read_u16();

    Attributes result;
    result.reserve(attributes_count);

    for (int i = 0; i < attributes_count; ++i) {
        result.push_back(parse_attribute(reader, constants));
    }

    return result;
}



} // namespace classdec

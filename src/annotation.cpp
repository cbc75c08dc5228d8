#include "annotation.hpp"
#include "errors.hpp"
#include "reader.hpp"



namespace classdec {



ElementValue parse_element_value(Reader& reader)
{
    NestingScope scope(reader, "element_value");

    ElementValue result;
    result.tag_ = reader.read_u8();

    switch (result.tag_) {
    case 'B':
    case 'C':
    case 'D':
    case 'F':
    case 'I':
    case 'J':
    case 'S':
    case 'Z':
    case 's':
        result.value_ = ElementValue::ConstValue{reader.read_u16()};
        break;

    case 'e': {
        ElementValue::EnumConstValue value;
        value.type_name_index_ = reader.read_u16();
        value.const_name_index_ = reader.read_u16();
        result.value_ = value;
        break;
    }

    case 'c':
        result.value_ = ElementValue::ClassValue{reader.read_u16()};
        break;

    case '@':
        result.value_ = parse_annotation(reader);
        break;

    case '[': {
        ElementValue::ArrayValue array;
        const u16 num_values = reader.read_u16();
        array.values_.reserve(num_values);
        for (int i = 0; i < num_values; ++i) {
            array.values_.push_back(parse_element_value(reader));
        }
        result.value_ = std::move(array);
        break;
    }

    default:
        throw MalformedClassFile::not_one_of(
            reader.source(),
            "element_value tag",
            result.tag_,
            {'B', 'C', 'D', 'F', 'I', 'J', 'S', 'Z', 's', 'e', 'c', '@', '['});
    }

    return result;
}



Annotation parse_annotation(Reader& reader)
{
    Annotation result;
    result.type_index_ = reader.read_u16();

    const u16 num_pairs = reader.read_u16();
    result.element_value_pairs_.reserve(num_pairs);

    for (int i = 0; i < num_pairs; ++i) {
        ElementValuePair pair;
        pair.element_name_index_ = reader.read_u16();
        pair.value_ = parse_element_value(reader);
        result.element_value_pairs_.push_back(std::move(pair));
    }

    return result;
}



std::vector<Annotation> parse_annotations(Reader& reader)
{
    const u16 count = reader.read_u16();

    std::vector<Annotation> result;
    result.reserve(count);

    for (int i = 0; i < count; ++i) {
        result.push_back(parse_annotation(reader));
    }

    return result;
}



std::vector<std::vector<Annotation>> parse_parameter_annotations(Reader& reader)
{
    const u8 num_parameters = reader.read_u8();

    std::vector<std::vector<Annotation>> result;
    result.reserve(num_parameters);

    for (int i = 0; i < num_parameters; ++i) {
        result.push_back(parse_annotations(reader));
    }

    return result;
}



} // namespace classdec

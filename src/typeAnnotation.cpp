#include "typeAnnotation.hpp"
#include "errors.hpp"
#include "reader.hpp"



namespace classdec {



static const std::vector<u32> valid_target_types = {
    0x00, 0x01, 0x10, 0x11, 0x12, 0x13, 0x14, 0x15, 0x16, 0x17, 0x40,
    0x41, 0x42, 0x43, 0x44, 0x45, 0x46, 0x47, 0x48, 0x49, 0x4a, 0x4b};



TargetInfo parse_target_info(Reader& reader, u8 target_type)
{
    switch (target_type) {
    case 0x00:
    case 0x01:
        return TypeParameterTarget{reader.read_u8()};

    case 0x10:
        return SupertypeTarget{reader.read_u16()};

    case 0x11:
    case 0x12: {
        TypeParameterBoundTarget target;
        target.type_parameter_index_ = reader.read_u8();
        target.bound_index_ = reader.read_u8();
        return target;
    }

    case 0x13:
    case 0x14:
    case 0x15:
        return EmptyTarget{};

    case 0x16:
        return FormalParameterTarget{reader.read_u8()};

    case 0x17:
        return ThrowsTarget{reader.read_u16()};

    case 0x40:
    case 0x41: {
        LocalvarTarget target;
        const u16 table_length = reader.read_u16();
        target.table_.reserve(table_length);
        for (int i = 0; i < table_length; ++i) {
            LocalvarTarget::Entry entry;
            entry.start_pc_ = reader.read_u16();
            entry.length_ = reader.read_u16();
            entry.index_ = reader.read_u16();
            target.table_.push_back(entry);
        }
        return target;
    }

    case 0x42:
        return CatchTarget{reader.read_u16()};

    case 0x43:
    case 0x44:
    case 0x45:
    case 0x46:
        return OffsetTarget{reader.read_u16()};

    case 0x47:
    case 0x48:
    case 0x49:
    case 0x4a:
    case 0x4b: {
        TypeArgumentTarget target;
        target.offset_ = reader.read_u16();
        target.type_argument_index_ = reader.read_u8();
        return target;
    }

    default:
        throw MalformedClassFile::not_one_of(
            reader.source(), "target_type", target_type, valid_target_types);
    }
}



TypeAnnotation parse_type_annotation(Reader& reader)
{
    TypeAnnotation result;
    result.target_type_ = reader.read_u8();
    result.target_info_ = parse_target_info(reader, result.target_type_);

    const u8 path_length = reader.read_u8();
    result.target_path_.reserve(path_length);
    for (int i = 0; i < path_length; ++i) {
        TypePathEntry entry;
        entry.type_path_kind_ = reader.read_u8();
        entry.type_argument_index_ = reader.read_u8();
        result.target_path_.push_back(entry);
    }

    result.annotation_ = parse_annotation(reader);

    return result;
}



std::vector<TypeAnnotation> parse_type_annotations(Reader& reader)
{
    const u16 count = reader.read_u16();

    std::vector<TypeAnnotation> result;
    result.reserve(count);

    for (int i = 0; i < count; ++i) {
        result.push_back(parse_type_annotation(reader));
    }

    return result;
}



} // namespace classdec

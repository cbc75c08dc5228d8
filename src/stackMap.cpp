#include "stackMap.hpp"
#include "reader.hpp"
#include <type_traits>



namespace classdec {



const char* verification_type_name(VerificationType::Tag tag)
{
    switch (tag) {
    case VerificationType::t_top:
        return "top";
    case VerificationType::t_integer:
        return "int";
    case VerificationType::t_float:
        return "float";
    case VerificationType::t_double:
        return "double";
    case VerificationType::t_long:
        return "long";
    case VerificationType::t_null:
        return "null";
    case VerificationType::t_uninitialized_this:
        return "uninitializedThis";
    case VerificationType::t_object:
        return "object";
    case VerificationType::t_uninitialized:
        return "uninitialized";
    }
    return "?";
}



u16 offset_delta(const StackMapFrame& frame)
{
    return std::visit(
        [](const auto& f) -> u16 {
            using T = std::decay_t<decltype(f)>;
            if constexpr (std::is_same_v<T, SameFrame>) {
                return f.frame_type_;
            } else if constexpr (std::is_same_v<T, SameLocals1StackItemFrame>) {
                return f.frame_type_ - 64;
            } else {
                return f.offset_delta_;
            }
        },
        frame);
}



u8 frame_type(const StackMapFrame& frame)
{
    return std::visit([](const auto& f) { return f.frame_type_; }, frame);
}



VerificationType parse_verification_type(Reader& reader)
{
    const u8 tag = reader.read_u8();

    VerificationType result;

    switch (tag) {
    case VerificationType::t_top:
    case VerificationType::t_integer:
    case VerificationType::t_float:
    case VerificationType::t_double:
    case VerificationType::t_long:
    case VerificationType::t_null:
    case VerificationType::t_uninitialized_this:
        result.tag_ = static_cast<VerificationType::Tag>(tag);
        break;

    case VerificationType::t_object:
        result.tag_ = VerificationType::t_object;
        result.cpool_index_ = reader.read_u16();
        break;

    case VerificationType::t_uninitialized:
        result.tag_ = VerificationType::t_uninitialized;
        result.offset_ = reader.read_u16();
        break;

    default:
        throw MalformedClassFile::not_one_of(reader.source(),
                                             "verification_type_info tag",
                                             tag,
                                             {0, 1, 2, 3, 4, 5, 6, 7, 8});
    }

    return result;
}



static std::vector<VerificationType> parse_verification_types(Reader& reader,
                                                              u16 count)
{
    std::vector<VerificationType> result;
    result.reserve(count);

    for (int i = 0; i < count; ++i) {
        result.push_back(parse_verification_type(reader));
    }

    return result;
}



StackMapFrame parse_stack_map_frame(Reader& reader)
{
    const u8 frame_type = reader.read_u8();

    if (frame_type <= 63) {
        return SameFrame{frame_type};
    }

    if (frame_type <= 127) {
        SameLocals1StackItemFrame frame;
        frame.frame_type_ = frame_type;
        frame.stack_ = parse_verification_type(reader);
        return frame;
    }

    if (frame_type < 247) {
        // 128-246 are reserved for future use.
        throw MalformedClassFile(reader.source(),
                                 "frame_type",
                                 "invalid value, expected one of [0x0-0x7f, "
                                 "0xf7-0xff], got " +
                                     hex(frame_type));
    }

    if (frame_type == 247) {
        SameLocals1StackItemFrameExtended frame;
        frame.frame_type_ = frame_type;
        frame.offset_delta_ = reader.read_u16();
        frame.stack_ = parse_verification_type(reader);
        return frame;
    }

    if (frame_type <= 250) {
        ChopFrame frame;
        frame.frame_type_ = frame_type;
        frame.offset_delta_ = reader.read_u16();
        return frame;
    }

    if (frame_type == 251) {
        SameFrameExtended frame;
        frame.frame_type_ = frame_type;
        frame.offset_delta_ = reader.read_u16();
        return frame;
    }

    if (frame_type <= 254) {
        AppendFrame frame;
        frame.frame_type_ = frame_type;
        frame.offset_delta_ = reader.read_u16();
        frame.locals_ = parse_verification_types(reader, frame_type - 251);
        return frame;
    }

    FullFrame frame;
    frame.frame_type_ = frame_type;
    frame.offset_delta_ = reader.read_u16();
    frame.locals_ = parse_verification_types(reader, reader.read_u16());
    frame.stack_ = parse_verification_types(reader, reader.read_u16());
    return frame;
}



} // namespace classdec

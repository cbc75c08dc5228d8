#include "classfile.hpp"
#include "defines.hpp"
#include "errors.hpp"
#include "reader.hpp"
#include <fstream>
#include <iterator>
#include <string>



namespace classdec {



template <typename T> static T parse_member(Reader& reader,
                                            const ConstantPool& constants)
{
    T member;
    member.access_flags_ = reader.read_u16();
    member.name_index_ = reader.read_u16();
    member.descriptor_index_ = reader.read_u16();
    member.attributes_ = parse_attributes(reader, constants);
    return member;
}



template <typename T>
static std::vector<T> parse_members(Reader& reader,
                                    const ConstantPool& constants)
{
    const u16 count = reader.read_u16();

    std::vector<T> result;
    result.reserve(count);

    for (int i = 0; i < count; ++i) {
        result.push_back(parse_member<T>(reader, constants));
    }

    return result;
}



ClassFile parse_classfile(Slice data, const char* source_name)
{
    Reader reader(data, source_name);

    ClassFile result;

    result.magic_ = reader.read_u32();
    if (result.magic_ not_eq classfile_magic) {
        throw MalformedClassFile::wrong_value(
            reader.source(), "magic", result.magic_, classfile_magic);
    }

    result.minor_version_ = reader.read_u16();
    result.major_version_ = reader.read_u16();

    const u16 constant_pool_count = reader.read_u16();
    result.constants_.parse(reader, constant_pool_count);

    result.access_flags_ = reader.read_u16();
    result.this_class_ = reader.read_u16();
    result.super_class_ = reader.read_u16();

    const u16 interfaces_count = reader.read_u16();
    result.interfaces_.reserve(interfaces_count);
    for (int i = 0; i < interfaces_count; ++i) {
        result.interfaces_.push_back(reader.read_u16());
    }

    result.fields_ = parse_members<FieldInfo>(reader, result.constants_);
    result.methods_ = parse_members<MethodInfo>(reader, result.constants_);
    result.attributes_ = parse_attributes(reader, result.constants_);

#if CLASSDEC_REJECT_TRAILING_BYTES
    if (reader.remaining()) {
        throw MalformedClassFile(reader.source(),
                                 "trailing bytes",
                                 hex(static_cast<u32>(reader.remaining())) +
                                     " bytes left after the last attribute");
    }
#endif

    return result;
}



ClassFile parse_classfile(const char* path)
{
    std::string contents;

    {
        std::ifstream file(path, std::ios::in | std::ios::binary);
        if (not file) {
            throw IoError(path, "failed to open file");
        }

        contents.assign(std::istreambuf_iterator<char>(file),
                        std::istreambuf_iterator<char>());

        if (file.bad()) {
            throw IoError(path, "failed to read file");
        }
    }

    return parse_classfile(Slice(contents), path);
}



} // namespace classdec

#include "constantPool.hpp"
#include "modifiedUtf8.hpp"
#include "reader.hpp"
#include <algorithm>



namespace classdec {



const char* constant_type_name(ConstantType tag)
{
    switch (tag) {
    case t_unusable:
        return "Unusable";
    case t_utf8:
        return "Utf8";
    case t_integer:
        return "Integer";
    case t_float:
        return "Float";
    case t_long:
        return "Long";
    case t_double:
        return "Double";
    case t_class:
        return "Class";
    case t_string:
        return "String";
    case t_field_ref:
        return "Fieldref";
    case t_method_ref:
        return "Methodref";
    case t_interface_method_ref:
        return "InterfaceMethodref";
    case t_name_and_type:
        return "NameAndType";
    case t_method_handle:
        return "MethodHandle";
    case t_method_type:
        return "MethodType";
    case t_dynamic:
        return "Dynamic";
    case t_invoke_dynamic:
        return "InvokeDynamic";
    case t_module:
        return "Module";
    case t_package:
        return "Package";
    }
    return "?";
}



static const std::vector<u32> valid_tags = {t_utf8,
                                            t_integer,
                                            t_float,
                                            t_long,
                                            t_double,
                                            t_class,
                                            t_string,
                                            t_field_ref,
                                            t_method_ref,
                                            t_interface_method_ref,
                                            t_name_and_type,
                                            t_method_handle,
                                            t_method_type,
                                            t_dynamic,
                                            t_invoke_dynamic,
                                            t_module,
                                            t_package};



static const std::vector<u32> valid_reference_kinds = {REF_getField,
                                                       REF_getStatic,
                                                       REF_putField,
                                                       REF_putStatic,
                                                       REF_invokeVirtual,
                                                       REF_invokeStatic,
                                                       REF_invokeSpecial,
                                                       REF_newInvokeSpecial,
                                                       REF_invokeInterface};



template <typename T> static T parse_ref(Reader& reader)
{
    T ref;
    ref.class_index_ = reader.read_u16();
    ref.name_and_type_index_ = reader.read_u16();
    return ref;
}



static Constant parse_constant(Reader& reader, u16 index)
{
    const u8 tag = reader.read_u8();

    switch (tag) {
    case t_utf8: {
        const u16 length = reader.read_u16();
        auto raw = reader.read_bytes(length);

        ConstantUtf8 utf8;
        utf8.bytes_.assign(raw.bytes(), raw.bytes() + raw.length_);
        utf8.text_ =
            mutf8::decode(raw, Utf8Origin{reader.source(), index});
        return utf8;
    }

    case t_integer: {
        ConstantInteger integer;
        auto raw = reader.read_bytes(4);
        std::copy(raw.bytes(), raw.bytes() + 4, integer.bytes_.begin());
        return integer;
    }

    case t_float: {
        ConstantFloat flt;
        auto raw = reader.read_bytes(4);
        std::copy(raw.bytes(), raw.bytes() + 4, flt.bytes_.begin());
        return flt;
    }

    case t_long: {
        ConstantLong lng;
        lng.high_bytes_ = reader.read_u32();
        lng.low_bytes_ = reader.read_u32();
        return lng;
    }

    case t_double: {
        ConstantDouble dbl;
        dbl.high_bytes_ = reader.read_u32();
        dbl.low_bytes_ = reader.read_u32();
        return dbl;
    }

    case t_class:
        return ConstantClass{reader.read_u16()};

    case t_string:
        return ConstantString{reader.read_u16()};

    case t_field_ref:
        return parse_ref<ConstantFieldRef>(reader);

    case t_method_ref:
        return parse_ref<ConstantMethodRef>(reader);

    case t_interface_method_ref:
        return parse_ref<ConstantInterfaceMethodRef>(reader);

    case t_name_and_type: {
        ConstantNameAndType nt;
        nt.name_index_ = reader.read_u16();
        nt.descriptor_index_ = reader.read_u16();
        return nt;
    }

    case t_method_handle: {
        const u8 kind = reader.read_u8();
        if (kind < REF_getField or kind > REF_invokeInterface) {
            throw MalformedClassFile::not_one_of(reader.source(),
                                                 "CONSTANT_MethodHandle "
                                                 "reference_kind",
                                                 kind,
                                                 valid_reference_kinds);
        }

        ConstantMethodHandle handle;
        handle.reference_kind_ = static_cast<ReferenceKind>(kind);
        handle.reference_index_ = reader.read_u16();
        return handle;
    }

    case t_method_type:
        return ConstantMethodType{reader.read_u16()};

    case t_dynamic: {
        ConstantDynamic dynamic;
        dynamic.bootstrap_method_attr_index_ = reader.read_u16();
        dynamic.name_and_type_index_ = reader.read_u16();
        return dynamic;
    }

    case t_invoke_dynamic: {
        ConstantInvokeDynamic dynamic;
        dynamic.bootstrap_method_attr_index_ = reader.read_u16();
        dynamic.name_and_type_index_ = reader.read_u16();
        return dynamic;
    }

    case t_module:
        return ConstantModule{reader.read_u16()};

    case t_package:
        return ConstantPackage{reader.read_u16()};

    default:
        throw MalformedClassFile::not_one_of(
            reader.source(), "constant_pool tag", tag, valid_tags);
    }
}



void ConstantPool::parse(Reader& reader, u16 count)
{
    source_ = reader.source();

    if (count == 0) {
        throw MalformedClassFile(source_,
                                 "constant_pool_count",
                                 "must be at least 0x1, got 0x0");
    }

    entries_.clear();
    entries_.reserve(count);
    entries_.emplace_back(ConstantUnusable{});

    while (entries_.size() < count) {
        entries_.push_back(
            parse_constant(reader, static_cast<u16>(entries_.size())));

        const auto tag = constant_tag(entries_.back());

        // Longs and doubles take up two slots in the constant pool, the
        // second of which may never be referenced.
        if (tag == t_long or tag == t_double) {
            if (entries_.size() == count) {
                throw MalformedClassFile(
                    source_,
                    "constant_pool",
                    std::string(constant_type_name(tag)) + " at index " +
                        hex(count - 1) + " has no room for its second slot");
            }
            entries_.emplace_back(ConstantUnusable{});
        }
    }
}



void ConstantPool::check_index(u16 index, const char* field) const
{
    if (index == 0 or index >= entries_.size()) {
        throw MalformedClassFile(source_,
                                 field,
                                 "constant pool index " + hex(index) +
                                     " out of range [0x1, " +
                                     hex(static_cast<u32>(entries_.size() - 1)) + "]");
    }
}



MalformedClassFile ConstantPool::wrong_entry(u16 index,
                                             const char* field,
                                             ConstantType expected) const
{
    const auto actual = tag(index);

    return MalformedClassFile(source_,
                              field,
                              "constant pool entry " + hex(index) +
                                  " has tag " + hex(actual) + " (" +
                                  constant_type_name(actual) +
                                  "), expected " + hex(expected) + " (" +
                                  constant_type_name(expected) + ")");
}



} // namespace classdec

#pragma once

#include "errors.hpp"
#include "int.h"
#include <array>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>



namespace classdec {



class Reader;



enum ConstantType : u8 {
    // Not a real tag. Used for slot zero, and for the slot following a long
    // or double.
    t_unusable = 0,
    t_utf8 = 1,
    t_integer = 3,
    t_float = 4,
    t_long = 5,
    t_double = 6,
    t_class = 7,
    t_string = 8,
    t_field_ref = 9,
    t_method_ref = 10,
    t_interface_method_ref = 11,
    t_name_and_type = 12,
    t_method_handle = 15,
    t_method_type = 16,
    t_dynamic = 17,
    t_invoke_dynamic = 18,
    t_module = 19,
    t_package = 20,
};



enum ReferenceKind : u8 {
    REF_getField = 1,
    REF_getStatic,
    REF_putField,
    REF_putStatic,
    REF_invokeVirtual,
    REF_invokeStatic,
    REF_invokeSpecial,
    REF_newInvokeSpecial,
    REF_invokeInterface,
};



struct ConstantUnusable {
    static constexpr ConstantType tag = t_unusable;
};



struct ConstantUtf8 {
    static constexpr ConstantType tag = t_utf8;

    // The bytes as they appear in the classfile (modified utf-8), and the
    // same text re-encoded as standard utf-8.
    std::vector<u8> bytes_;
    std::string text_;
};



// Four raw bytes in classfile order. Turning them into a number is left to
// whoever needs the number.
struct ConstantInteger {
    static constexpr ConstantType tag = t_integer;
    std::array<u8, 4> bytes_;
};



struct ConstantFloat {
    static constexpr ConstantType tag = t_float;
    std::array<u8, 4> bytes_;
};



struct ConstantLong {
    static constexpr ConstantType tag = t_long;
    u32 high_bytes_;
    u32 low_bytes_;
};



struct ConstantDouble {
    static constexpr ConstantType tag = t_double;
    u32 high_bytes_;
    u32 low_bytes_;
};



struct ConstantClass {
    static constexpr ConstantType tag = t_class;
    u16 name_index_;
};



struct ConstantString {
    static constexpr ConstantType tag = t_string;
    u16 string_index_;
};



// NOTE: shared layout of FieldRef, MethodRef, and InterfaceMethodRef.
struct ConstantRef {
    u16 class_index_;
    u16 name_and_type_index_;
};



struct ConstantFieldRef : ConstantRef {
    static constexpr ConstantType tag = t_field_ref;
};



struct ConstantMethodRef : ConstantRef {
    static constexpr ConstantType tag = t_method_ref;
};



struct ConstantInterfaceMethodRef : ConstantRef {
    static constexpr ConstantType tag = t_interface_method_ref;
};



struct ConstantNameAndType {
    static constexpr ConstantType tag = t_name_and_type;
    u16 name_index_;
    u16 descriptor_index_;
};



struct ConstantMethodHandle {
    static constexpr ConstantType tag = t_method_handle;
    ReferenceKind reference_kind_;
    u16 reference_index_;
};



struct ConstantMethodType {
    static constexpr ConstantType tag = t_method_type;
    u16 descriptor_index_;
};



struct ConstantDynamic {
    static constexpr ConstantType tag = t_dynamic;
    u16 bootstrap_method_attr_index_;
    u16 name_and_type_index_;
};



struct ConstantInvokeDynamic {
    static constexpr ConstantType tag = t_invoke_dynamic;
    u16 bootstrap_method_attr_index_;
    u16 name_and_type_index_;
};



struct ConstantModule {
    static constexpr ConstantType tag = t_module;
    u16 name_index_;
};



struct ConstantPackage {
    static constexpr ConstantType tag = t_package;
    u16 name_index_;
};



using Constant = std::variant<ConstantUnusable,
                              ConstantUtf8,
                              ConstantInteger,
                              ConstantFloat,
                              ConstantLong,
                              ConstantDouble,
                              ConstantClass,
                              ConstantString,
                              ConstantFieldRef,
                              ConstantMethodRef,
                              ConstantInterfaceMethodRef,
                              ConstantNameAndType,
                              ConstantMethodHandle,
                              ConstantMethodType,
                              ConstantDynamic,
                              ConstantInvokeDynamic,
                              ConstantModule,
                              ConstantPackage>;



inline ConstantType constant_tag(const Constant& constant)
{
    return std::visit(
        [](const auto& c) {
            return std::decay_t<decltype(c)>::tag;
        },
        constant);
}



// Returns e.g. "Utf8", "MethodHandle". "Unusable" for placeholder slots.
const char* constant_type_name(ConstantType tag);



// The constant pool of a single classfile. Slot zero, and the slot after each
// long or double, holds a ConstantUnusable, so a pool declared with count N
// always holds exactly N entries and classfile indices can be used directly.
//
// Nothing gets resolved while parsing. Indices are only checked when somebody
// follows them, through load().
class ConstantPool {
public:
    // Reads count - 1 slots worth of entries. The count itself belongs to the
    // classfile header, and has already been read by the caller.
    void parse(Reader& reader, u16 count);


    u16 size() const
    {
        return static_cast<u16>(entries_.size());
    }


    const Constant& operator[](u16 index) const
    {
        return entries_[index];
    }


    const std::vector<Constant>& entries() const
    {
        return entries_;
    }


    // The tag of the entry at index, or t_unusable if index is out of range.
    ConstantType tag(u16 index) const
    {
        if (index >= entries_.size()) {
            return t_unusable;
        }
        return constant_tag(entries_[index]);
    }


    // Follows a classfile index, which must point at an entry of type T.
    // Field names the classfile field that held the index, and shows up in
    // the error message when the index is bad.
    template <typename T> const T& load(u16 index, const char* field) const
    {
        check_index(index, field);

        if (auto found = std::get_if<T>(&entries_[index])) {
            return *found;
        }

        throw wrong_entry(index, field, T::tag);
    }


    // Like load(), but returns nullptr instead of throwing.
    template <typename T> const T* find(u16 index) const noexcept
    {
        if (index == 0 or index >= entries_.size()) {
            return nullptr;
        }
        return std::get_if<T>(&entries_[index]);
    }


    const std::string& load_string(u16 index, const char* field) const
    {
        return load<ConstantUtf8>(index, field).text_;
    }


    // The name behind a CONSTANT_Class, e.g. "java/lang/Object".
    const std::string& load_class_name(u16 index, const char* field) const
    {
        return load_string(load<ConstantClass>(index, field).name_index_,
                           field);
    }


    const std::string& source() const
    {
        return source_;
    }


private:
    void check_index(u16 index, const char* field) const;


    MalformedClassFile
    wrong_entry(u16 index, const char* field, ConstantType expected) const;


    std::string source_;
    std::vector<Constant> entries_;
};



} // namespace classdec

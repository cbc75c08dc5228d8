#pragma once

#include "attribute.hpp"
#include "constantPool.hpp"
#include "int.h"
#include "slice.hpp"
#include <vector>



namespace classdec {



static constexpr u32 classfile_magic = 0xcafebabe;



struct FieldInfo {
    u16 access_flags_ = 0;
    u16 name_index_ = 0;
    u16 descriptor_index_ = 0;
    Attributes attributes_;
};



struct MethodInfo {
    u16 access_flags_ = 0;
    u16 name_index_ = 0;
    u16 descriptor_index_ = 0;
    Attributes attributes_;
};



struct ClassFile {
    u32 magic_ = 0;
    u16 minor_version_ = 0;
    u16 major_version_ = 0;
    ConstantPool constants_;
    u16 access_flags_ = 0;
    u16 this_class_ = 0;

    // Zero for java/lang/Object, the only class without a superclass.
    u16 super_class_ = 0;

    std::vector<u16> interfaces_;
    std::vector<FieldInfo> fields_;
    std::vector<MethodInfo> methods_;
    Attributes attributes_;
};



// Decodes a complete classfile held in memory. The source name only shows up
// in error messages. Throws one of the exceptions in errors.hpp on the first
// problem encountered; there is no partial result.
ClassFile parse_classfile(Slice data, const char* source_name);



// Reads the whole file at path, then decodes it as above.
ClassFile parse_classfile(const char* path);



} // namespace classdec

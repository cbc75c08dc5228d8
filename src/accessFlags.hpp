#pragma once

#include "int.h"
#include <string>



namespace classdec {



// Access flag bits, as they appear in the classfile. The decoder stores the
// raw u16 and never checks these; they are here for consumers.



enum ClassAccessFlags : u16 {
    ACC_CLASS_PUBLIC = 0x0001,
    ACC_CLASS_FINAL = 0x0010,
    ACC_CLASS_SUPER = 0x0020,
    ACC_CLASS_INTERFACE = 0x0200,
    ACC_CLASS_ABSTRACT = 0x0400,
    ACC_CLASS_SYNTHETIC = 0x1000,
    ACC_CLASS_ANNOTATION = 0x2000,
    ACC_CLASS_ENUM = 0x4000,
    ACC_CLASS_MODULE = 0x8000,
};



enum FieldAccessFlags : u16 {
    ACC_FIELD_PUBLIC = 0x0001,
    ACC_FIELD_PRIVATE = 0x0002,
    ACC_FIELD_PROTECTED = 0x0004,
    ACC_FIELD_STATIC = 0x0008,
    ACC_FIELD_FINAL = 0x0010,
    ACC_FIELD_VOLATILE = 0x0040,
    ACC_FIELD_TRANSIENT = 0x0080,
    ACC_FIELD_SYNTHETIC = 0x1000,
    ACC_FIELD_ENUM = 0x4000,
};



enum MethodAccessFlags : u16 {
    ACC_METHOD_PUBLIC = 0x0001,
    ACC_METHOD_PRIVATE = 0x0002,
    ACC_METHOD_PROTECTED = 0x0004,
    ACC_METHOD_STATIC = 0x0008,
    ACC_METHOD_FINAL = 0x0010,
    ACC_METHOD_SYNCHRONIZED = 0x0020,
    ACC_METHOD_BRIDGE = 0x0040,
    ACC_METHOD_VARARGS = 0x0080,
    ACC_METHOD_NATIVE = 0x0100,
    ACC_METHOD_ABSTRACT = 0x0400,
    ACC_METHOD_STRICT = 0x0800,
    ACC_METHOD_SYNTHETIC = 0x1000,
};



enum InnerClassAccessFlags : u16 {
    ACC_INNER_PUBLIC = 0x0001,
    ACC_INNER_PRIVATE = 0x0002,
    ACC_INNER_PROTECTED = 0x0004,
    ACC_INNER_STATIC = 0x0008,
    ACC_INNER_FINAL = 0x0010,
    ACC_INNER_INTERFACE = 0x0200,
    ACC_INNER_ABSTRACT = 0x0400,
    ACC_INNER_SYNTHETIC = 0x1000,
    ACC_INNER_ANNOTATION = 0x2000,
    ACC_INNER_ENUM = 0x4000,
};



// MethodParameters access_flags.
enum ParameterAccessFlags : u16 {
    ACC_PARAMETER_FINAL = 0x0010,
    ACC_PARAMETER_SYNTHETIC = 0x1000,
    ACC_PARAMETER_MANDATED = 0x8000,
};



// Module attribute flags. module_flags uses OPEN, requires entries use
// TRANSITIVE and STATIC_PHASE, exports and opens entries only carry the last
// two.
enum ModuleAccessFlags : u16 {
    ACC_MODULE_OPEN = 0x0020,
    ACC_MODULE_TRANSITIVE = 0x0020,
    ACC_MODULE_STATIC_PHASE = 0x0040,
    ACC_MODULE_SYNTHETIC = 0x1000,
    ACC_MODULE_MANDATED = 0x8000,
};



enum class FlagsOwner {
    class_,
    field,
    method,
    inner_class,
    parameter,
    module,
    module_requires,
    module_package
};



// Names of the flags set in a bitmask, e.g. "public final", for the kind of
// structure that the flags belong to. Unknown bits are ignored.
std::string access_flags_string(u16 flags, FlagsOwner owner);



} // namespace classdec

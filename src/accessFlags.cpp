#include "accessFlags.hpp"
#include <vector>



namespace classdec {



struct AccessFlagName {
    u16 flag_;
    const char* name_;
};



static const std::vector<AccessFlagName> class_flags = {
    {ACC_CLASS_PUBLIC, "public"},
    {ACC_CLASS_FINAL, "final"},
    {ACC_CLASS_SUPER, "super"},
    {ACC_CLASS_INTERFACE, "interface"},
    {ACC_CLASS_ABSTRACT, "abstract"},
    {ACC_CLASS_SYNTHETIC, "synthetic"},
    {ACC_CLASS_ANNOTATION, "annotation"},
    {ACC_CLASS_ENUM, "enum"},
    {ACC_CLASS_MODULE, "module"},
};



static const std::vector<AccessFlagName> field_flags = {
    {ACC_FIELD_PUBLIC, "public"},
    {ACC_FIELD_PRIVATE, "private"},
    {ACC_FIELD_PROTECTED, "protected"},
    {ACC_FIELD_STATIC, "static"},
    {ACC_FIELD_FINAL, "final"},
    {ACC_FIELD_VOLATILE, "volatile"},
    {ACC_FIELD_TRANSIENT, "transient"},
    {ACC_FIELD_SYNTHETIC, "synthetic"},
    {ACC_FIELD_ENUM, "enum"},
};



static const std::vector<AccessFlagName> method_flags = {
    {ACC_METHOD_PUBLIC, "public"},
    {ACC_METHOD_PRIVATE, "private"},
    {ACC_METHOD_PROTECTED, "protected"},
    {ACC_METHOD_STATIC, "static"},
    {ACC_METHOD_FINAL, "final"},
    {ACC_METHOD_SYNCHRONIZED, "synchronized"},
    {ACC_METHOD_BRIDGE, "bridge"},
    {ACC_METHOD_VARARGS, "varargs"},
    {ACC_METHOD_NATIVE, "native"},
    {ACC_METHOD_ABSTRACT, "abstract"},
    {ACC_METHOD_STRICT, "strict"},
    {ACC_METHOD_SYNTHETIC, "synthetic"},
};



static const std::vector<AccessFlagName> inner_class_flags = {
    {ACC_INNER_PUBLIC, "public"},
    {ACC_INNER_PRIVATE, "private"},
    {ACC_INNER_PROTECTED, "protected"},
    {ACC_INNER_STATIC, "static"},
    {ACC_INNER_FINAL, "final"},
    {ACC_INNER_INTERFACE, "interface"},
    {ACC_INNER_ABSTRACT, "abstract"},
    {ACC_INNER_SYNTHETIC, "synthetic"},
    {ACC_INNER_ANNOTATION, "annotation"},
    {ACC_INNER_ENUM, "enum"},
};



static const std::vector<AccessFlagName> parameter_flags = {
    {ACC_PARAMETER_FINAL, "final"},
    {ACC_PARAMETER_SYNTHETIC, "synthetic"},
    {ACC_PARAMETER_MANDATED, "mandated"},
};



static const std::vector<AccessFlagName> module_flags = {
    {ACC_MODULE_OPEN, "open"},
    {ACC_MODULE_SYNTHETIC, "synthetic"},
    {ACC_MODULE_MANDATED, "mandated"},
};



static const std::vector<AccessFlagName> module_requires_flags = {
    {ACC_MODULE_TRANSITIVE, "transitive"},
    {ACC_MODULE_STATIC_PHASE, "static_phase"},
    {ACC_MODULE_SYNTHETIC, "synthetic"},
    {ACC_MODULE_MANDATED, "mandated"},
};



static const std::vector<AccessFlagName> module_package_flags = {
    {ACC_MODULE_SYNTHETIC, "synthetic"},
    {ACC_MODULE_MANDATED, "mandated"},
};



static const std::vector<AccessFlagName>& flag_names(FlagsOwner owner)
{
    switch (owner) {
    case FlagsOwner::class_:
        return class_flags;

    case FlagsOwner::field:
        return field_flags;

    case FlagsOwner::method:
        return method_flags;

    case FlagsOwner::inner_class:
        return inner_class_flags;

    case FlagsOwner::module:
        return module_flags;

    case FlagsOwner::module_requires:
        return module_requires_flags;

    case FlagsOwner::module_package:
        return module_package_flags;

    case FlagsOwner::parameter:
        break;
    }
    return parameter_flags;
}



std::string access_flags_string(u16 flags, FlagsOwner owner)
{
    std::string result;

    for (auto& flag : flag_names(owner)) {
        if (flags & flag.flag_) {
            if (not result.empty()) {
                result += ' ';
            }
            result += flag.name_;
        }
    }

    return result;
}



} // namespace classdec

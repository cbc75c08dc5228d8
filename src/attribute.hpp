#pragma once

#include "annotation.hpp"
#include "int.h"
#include "stackMap.hpp"
#include "typeAnnotation.hpp"
#include <type_traits>
#include <variant>
#include <vector>



namespace classdec {



class ConstantPool;
class Reader;



struct Attribute;



using Attributes = std::vector<Attribute>;



// Every attribute body type carries the name that selects it in the
// classfile.



struct AttributeConstantValue {
    static constexpr const char* name = "ConstantValue";
    u16 constantvalue_index_;
};



struct ExceptionTableEntry {
    u16 start_pc_;
    u16 end_pc_;
    u16 handler_pc_;

    // Zero for a handler that catches everything (i.e. finally).
    u16 catch_type_;
};



struct AttributeCode {
    static constexpr const char* name = "Code";
    u16 max_stack_;
    u16 max_locals_;
    std::vector<u8> code_;
    std::vector<ExceptionTableEntry> exception_table_;
    Attributes attributes_;
};



struct AttributeStackMapTable {
    static constexpr const char* name = "StackMapTable";
    std::vector<StackMapFrame> entries_;
};



struct AttributeExceptions {
    static constexpr const char* name = "Exceptions";
    std::vector<u16> exception_index_table_;
};



struct AttributeInnerClasses {
    static constexpr const char* name = "InnerClasses";

    struct Entry {
        u16 inner_class_info_index_;
        u16 outer_class_info_index_;
        u16 inner_name_index_;
        u16 inner_class_access_flags_;
    };

    std::vector<Entry> classes_;
};



struct AttributeEnclosingMethod {
    static constexpr const char* name = "EnclosingMethod";
    u16 class_index_;

    // Zero when the class is not enclosed by a method (e.g. an initializer).
    u16 method_index_;
};



struct AttributeSynthetic {
    static constexpr const char* name = "Synthetic";
};



struct AttributeSignature {
    static constexpr const char* name = "Signature";
    u16 signature_index_;
};



struct AttributeSourceFile {
    static constexpr const char* name = "SourceFile";
    u16 sourcefile_index_;
};



struct AttributeSourceDebugExtension {
    static constexpr const char* name = "SourceDebugExtension";
    std::vector<u8> debug_extension_;
};



struct AttributeLineNumberTable {
    static constexpr const char* name = "LineNumberTable";

    struct Row {
        u16 start_pc_;
        u16 line_number_;
    };

    std::vector<Row> line_number_table_;
};



struct AttributeLocalVariableTable {
    static constexpr const char* name = "LocalVariableTable";

    struct Entry {
        u16 start_pc_;
        u16 length_;
        u16 name_index_;
        u16 descriptor_index_;
        u16 index_;
    };

    std::vector<Entry> local_variable_table_;
};



struct AttributeLocalVariableTypeTable {
    static constexpr const char* name = "LocalVariableTypeTable";

    struct Entry {
        u16 start_pc_;
        u16 length_;
        u16 name_index_;
        u16 signature_index_;
        u16 index_;
    };

    std::vector<Entry> local_variable_type_table_;
};



struct AttributeDeprecated {
    static constexpr const char* name = "Deprecated";
};



// NOTE: shared layout of the visible and invisible annotation attributes.
struct AttributeAnnotations {
    std::vector<Annotation> annotations_;
};



struct AttributeRuntimeVisibleAnnotations : AttributeAnnotations {
    static constexpr const char* name = "RuntimeVisibleAnnotations";
};



struct AttributeRuntimeInvisibleAnnotations : AttributeAnnotations {
    static constexpr const char* name = "RuntimeInvisibleAnnotations";
};



struct AttributeParameterAnnotations {
    // One annotation list per formal parameter.
    std::vector<std::vector<Annotation>> parameter_annotations_;
};



struct AttributeRuntimeVisibleParameterAnnotations
    : AttributeParameterAnnotations {
    static constexpr const char* name = "RuntimeVisibleParameterAnnotations";
};



struct AttributeRuntimeInvisibleParameterAnnotations
    : AttributeParameterAnnotations {
    static constexpr const char* name = "RuntimeInvisibleParameterAnnotations";
};



struct AttributeTypeAnnotations {
    std::vector<TypeAnnotation> annotations_;
};



struct AttributeRuntimeVisibleTypeAnnotations : AttributeTypeAnnotations {
    static constexpr const char* name = "RuntimeVisibleTypeAnnotations";
};



struct AttributeRuntimeInvisibleTypeAnnotations : AttributeTypeAnnotations {
    static constexpr const char* name = "RuntimeInvisibleTypeAnnotations";
};



struct AttributeAnnotationDefault {
    static constexpr const char* name = "AnnotationDefault";
    ElementValue default_value_;
};



struct AttributeBootstrapMethods {
    static constexpr const char* name = "BootstrapMethods";

    struct BootstrapMethod {
        // A CONSTANT_MethodHandle.
        u16 bootstrap_method_ref_;
        std::vector<u16> bootstrap_arguments_;
    };

    std::vector<BootstrapMethod> bootstrap_methods_;
};



struct AttributeMethodParameters {
    static constexpr const char* name = "MethodParameters";

    struct Parameter {
        u16 name_index_;
        u16 access_flags_;
    };

    std::vector<Parameter> parameters_;
};



struct AttributeModule {
    static constexpr const char* name = "Module";

    struct Requires {
        u16 requires_index_;
        u16 requires_flags_;
        u16 requires_version_index_;
    };

    struct Exports {
        u16 exports_index_;
        u16 exports_flags_;
        std::vector<u16> exports_to_index_;
    };

    struct Opens {
        u16 opens_index_;
        u16 opens_flags_;
        std::vector<u16> opens_to_index_;
    };

    struct Provides {
        u16 provides_index_;
        std::vector<u16> provides_with_index_;
    };

    u16 module_name_index_;
    u16 module_flags_;
    u16 module_version_index_;
    std::vector<Requires> requires_;
    std::vector<Exports> exports_;
    std::vector<Opens> opens_;
    std::vector<u16> uses_index_;
    std::vector<Provides> provides_;
};



struct AttributeModulePackages {
    static constexpr const char* name = "ModulePackages";
    std::vector<u16> package_index_;
};



struct AttributeModuleMainClass {
    static constexpr const char* name = "ModuleMainClass";
    u16 main_class_index_;
};



struct AttributeNestHost {
    static constexpr const char* name = "NestHost";
    u16 host_class_index_;
};



struct AttributeNestMembers {
    static constexpr const char* name = "NestMembers";
    std::vector<u16> classes_;
};



struct AttributeRecord {
    static constexpr const char* name = "Record";

    struct Component {
        u16 name_index_;
        u16 descriptor_index_;
        Attributes attributes_;
    };

    std::vector<Component> components_;
};



struct AttributePermittedSubclasses {
    static constexpr const char* name = "PermittedSubclasses";
    std::vector<u16> classes_;
};



struct Attribute {
    using Info = std::variant<AttributeConstantValue,
                              AttributeCode,
                              AttributeStackMapTable,
                              AttributeExceptions,
                              AttributeInnerClasses,
                              AttributeEnclosingMethod,
                              AttributeSynthetic,
                              AttributeSignature,
                              AttributeSourceFile,
                              AttributeSourceDebugExtension,
                              AttributeLineNumberTable,
                              AttributeLocalVariableTable,
                              AttributeLocalVariableTypeTable,
                              AttributeDeprecated,
                              AttributeRuntimeVisibleAnnotations,
                              AttributeRuntimeInvisibleAnnotations,
                              AttributeRuntimeVisibleParameterAnnotations,
                              AttributeRuntimeInvisibleParameterAnnotations,
                              AttributeRuntimeVisibleTypeAnnotations,
                              AttributeRuntimeInvisibleTypeAnnotations,
                              AttributeAnnotationDefault,
                              AttributeBootstrapMethods,
                              AttributeMethodParameters,
                              AttributeModule,
                              AttributeModulePackages,
                              AttributeModuleMainClass,
                              AttributeNestHost,
                              AttributeNestMembers,
                              AttributeRecord,
                              AttributePermittedSubclasses>;

    u16 attribute_name_index_ = 0;
    u32 attribute_length_ = 0;
    Info info_;


    // The attribute name, e.g. "Code". Same text as the constant pool entry
    // at attribute_name_index_.
    const char* name() const
    {
        return std::visit(
            [](const auto& info) {
                return std::decay_t<decltype(info)>::name;
            },
            info_);
    }


    template <typename T> const T* get() const
    {
        return std::get_if<T>(&info_);
    }
};



Attribute parse_attribute(Reader& reader, const ConstantPool& constants);



// u16 attributes_count, followed by the attributes.
Attributes parse_attributes(Reader& reader, const ConstantPool& constants);



// Finds the first attribute of type T in a list, or nullptr.
template <typename T> const T* find_attribute(const Attributes& attributes)
{
    for (auto& attribute : attributes) {
        if (auto found = attribute.get<T>()) {
            return found;
        }
    }
    return nullptr;
}



} // namespace classdec

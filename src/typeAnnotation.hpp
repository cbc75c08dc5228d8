#pragma once

#include "annotation.hpp"
#include "int.h"
#include <variant>
#include <vector>



namespace classdec {



class Reader;



// target_type 0x00-0x01
struct TypeParameterTarget {
    u8 type_parameter_index_;
};



// target_type 0x10. 65535 means the superclass, anything else indexes the
// interfaces array.
struct SupertypeTarget {
    u16 supertype_index_;
};



// target_type 0x11-0x12
struct TypeParameterBoundTarget {
    u8 type_parameter_index_;
    u8 bound_index_;
};



// target_type 0x13-0x15
struct EmptyTarget {
};



// target_type 0x16
struct FormalParameterTarget {
    u8 formal_parameter_index_;
};



// target_type 0x17
struct ThrowsTarget {
    u16 throws_type_index_;
};



// target_type 0x40-0x41
struct LocalvarTarget {
    struct Entry {
        u16 start_pc_;
        u16 length_;
        u16 index_;
    };

    std::vector<Entry> table_;
};



// target_type 0x42
struct CatchTarget {
    u16 exception_table_index_;
};



// target_type 0x43-0x46
struct OffsetTarget {
    u16 offset_;
};



// target_type 0x47-0x4b
struct TypeArgumentTarget {
    u16 offset_;
    u8 type_argument_index_;
};



using TargetInfo = std::variant<TypeParameterTarget,
                                SupertypeTarget,
                                TypeParameterBoundTarget,
                                EmptyTarget,
                                FormalParameterTarget,
                                ThrowsTarget,
                                LocalvarTarget,
                                CatchTarget,
                                OffsetTarget,
                                TypeArgumentTarget>;



struct TypePathEntry {
    u8 type_path_kind_;
    u8 type_argument_index_;
};



struct TypeAnnotation {
    u8 target_type_ = 0;
    TargetInfo target_info_;
    std::vector<TypePathEntry> target_path_;

    // type_index and element_value_pairs, laid out exactly as in a plain
    // annotation.
    Annotation annotation_;
};



TargetInfo parse_target_info(Reader& reader, u8 target_type);



TypeAnnotation parse_type_annotation(Reader& reader);



std::vector<TypeAnnotation> parse_type_annotations(Reader& reader);



} // namespace classdec

#pragma once

#include "int.h"
#include <variant>
#include <vector>



namespace classdec {



class Reader;



struct ElementValuePair;



struct Annotation {
    u16 type_index_ = 0;
    std::vector<ElementValuePair> element_value_pairs_;
};



struct ElementValue {
    // Tags B C D F I J S Z and s. Points at a CONSTANT_Integer, Long, Float,
    // Double or Utf8 depending on the tag.
    struct ConstValue {
        u16 const_value_index_;
    };

    // Tag e
    struct EnumConstValue {
        u16 type_name_index_;
        u16 const_name_index_;
    };

    // Tag c
    struct ClassValue {
        u16 class_info_index_;
    };

    // Tag [
    struct ArrayValue {
        std::vector<ElementValue> values_;
    };

    // The ascii tag character, as it appeared in the classfile.
    u8 tag_ = 0;

    // Tag @ stores a nested Annotation.
    std::variant<ConstValue, EnumConstValue, ClassValue, Annotation, ArrayValue>
        value_;
};



struct ElementValuePair {
    u16 element_name_index_ = 0;
    ElementValue value_;
};



ElementValue parse_element_value(Reader& reader);



Annotation parse_annotation(Reader& reader);



// u16 num_annotations, followed by the annotations.
std::vector<Annotation> parse_annotations(Reader& reader);



// u8 num_parameters, then an annotation list for each parameter.
std::vector<std::vector<Annotation>> parse_parameter_annotations(Reader& reader);



} // namespace classdec

#pragma once

#include "int.h"
#include <variant>
#include <vector>



namespace classdec {



class Reader;



struct VerificationType {
    enum Tag : u8 {
        t_top = 0,
        t_integer = 1,
        t_float = 2,
        t_double = 3,
        t_long = 4,
        t_null = 5,
        t_uninitialized_this = 6,
        t_object = 7,
        t_uninitialized = 8,
    };

    Tag tag_ = t_top;

    // Only t_object carries a constant pool index (of a CONSTANT_Class), and
    // only t_uninitialized carries the code offset of its `new` instruction.
    u16 cpool_index_ = 0;
    u16 offset_ = 0;
};



const char* verification_type_name(VerificationType::Tag tag);



// frame_type 0-63. The offset delta is the frame_type itself.
struct SameFrame {
    u8 frame_type_;
};



// frame_type 64-127. The offset delta is frame_type - 64.
struct SameLocals1StackItemFrame {
    u8 frame_type_;
    VerificationType stack_;
};



// frame_type 247
struct SameLocals1StackItemFrameExtended {
    u8 frame_type_;
    u16 offset_delta_;
    VerificationType stack_;
};



// frame_type 248-250, drops the last 251 - frame_type locals.
struct ChopFrame {
    u8 frame_type_;
    u16 offset_delta_;
};



// frame_type 251
struct SameFrameExtended {
    u8 frame_type_;
    u16 offset_delta_;
};



// frame_type 252-254, adds frame_type - 251 locals.
struct AppendFrame {
    u8 frame_type_;
    u16 offset_delta_;
    std::vector<VerificationType> locals_;
};



// frame_type 255
struct FullFrame {
    u8 frame_type_;
    u16 offset_delta_;
    std::vector<VerificationType> locals_;
    std::vector<VerificationType> stack_;
};



using StackMapFrame = std::variant<SameFrame,
                                   SameLocals1StackItemFrame,
                                   SameLocals1StackItemFrameExtended,
                                   ChopFrame,
                                   SameFrameExtended,
                                   AppendFrame,
                                   FullFrame>;



// The offset delta of any frame, whether it is stored explicitly or encoded
// in the frame_type.
u16 offset_delta(const StackMapFrame& frame);



u8 frame_type(const StackMapFrame& frame);



VerificationType parse_verification_type(Reader& reader);



StackMapFrame parse_stack_map_frame(Reader& reader);



} // namespace classdec

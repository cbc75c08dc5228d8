#pragma once

#include "errors.hpp"
#include "slice.hpp"
#include <string>



namespace classdec {
namespace mutf8 {



// Converts the contents of a CONSTANT_Utf8 entry into regular utf-8. The
// classfile flavor differs from the real thing in two ways: U+0000 is written
// as the two bytes C0 80, and characters outside the basic multilingual plane
// are written as a surrogate pair, each half in its own three byte sequence.
//
// Throws MalformedModifiedUtf8 on anything that does not follow those rules.
// The origin only ends up in the error message.
std::string decode(Slice bytes, const Utf8Origin& origin = {});



// Appends the utf-8 encoding of code_point to out. The caller is responsible
// for passing a valid unicode scalar value.
void append_utf8(std::string& out, u32 code_point);



} // namespace mutf8
} // namespace classdec

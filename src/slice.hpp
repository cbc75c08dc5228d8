#pragma once

#include "int.h"
#include <string>
#include <string.h>



namespace classdec {



// Non-owning [pointer,length] view of raw classfile bytes. Classfile strings
// are not null-terminated, so we compare them as Slices too.



struct Slice {
    const char* ptr_ = nullptr;
    size_t length_ = 0;


    Slice()
    {
    }


    Slice(const char* ptr, size_t length) : ptr_(ptr), length_(length)
    {
    }


    explicit Slice(const std::string& str) : ptr_(str.data()), length_(str.size())
    {
    }


    static Slice from_c_str(const char* c_str)
    {
        return Slice(c_str, strlen(c_str));
    }


    const u8* bytes() const
    {
        return reinterpret_cast<const u8*>(ptr_);
    }


    bool operator==(const Slice& other) const
    {
        return length_ == other.length_ and
               (length_ == 0 or memcmp(other.ptr_, ptr_, length_) == 0);
    }


    bool operator!=(const Slice& other) const
    {
        return not(*this == other);
    }
};



} // namespace classdec

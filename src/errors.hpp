#pragma once

#include "int.h"
#include <stdexcept>
#include <string>
#include <vector>



namespace classdec {



// Formats a value the way all of our diagnostics print numbers, e.g. 0xcafebabe.
std::string hex(u32 value);



// Root of everything the decoder throws. Nothing inside the library catches
// these; the first failure unwinds all the way to the caller.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what)
    {
    }
};



// A structural or value violation: a field holding something the classfile
// format does not allow.
class MalformedClassFile : public Error {
public:
    MalformedClassFile(const std::string& source,
                       const std::string& field,
                       const std::string& message);


    static MalformedClassFile wrong_value(const std::string& source,
                                          const std::string& field,
                                          u32 actual,
                                          u32 expected);


    static MalformedClassFile not_one_of(const std::string& source,
                                         const std::string& field,
                                         u32 actual,
                                         const std::vector<u32>& allowed);


    const std::string& source() const
    {
        return source_;
    }


    const std::string& field() const
    {
        return field_;
    }


private:
    std::string source_;
    std::string field_;
};



// Where a modified utf-8 string was read from. An empty source and a zero
// pool_index mean that the decoder was handed a bare byte run.
struct Utf8Origin {
    std::string source_;
    u16 pool_index_ = 0;
};



// Raised by the modified utf-8 decoder. The offset is relative to the start
// of the byte run handed to the decoder (i.e. the bytes of one CONSTANT_Utf8).
class MalformedModifiedUtf8 : public Error {
public:
    MalformedModifiedUtf8(const Utf8Origin& origin,
                          size_t offset,
                          std::vector<u8> bytes,
                          const std::string& message);


    static MalformedModifiedUtf8
    invalid_leading_byte(const Utf8Origin& origin, size_t offset, u8 byte);


    static MalformedModifiedUtf8 truncated(const Utf8Origin& origin,
                                           size_t offset,
                                           std::vector<u8> bytes,
                                           size_t expected);


    static MalformedModifiedUtf8 invalid_continuation(const Utf8Origin& origin,
                                                      size_t offset,
                                                      std::vector<u8> bytes);


    static MalformedModifiedUtf8 invalid_code_point(const Utf8Origin& origin,
                                                    size_t offset,
                                                    std::vector<u8> bytes,
                                                    u32 code_point);


    const std::string& source() const
    {
        return origin_.source_;
    }


    u16 pool_index() const
    {
        return origin_.pool_index_;
    }


    size_t offset() const
    {
        return offset_;
    }


    const std::vector<u8>& bytes() const
    {
        return bytes_;
    }


private:
    Utf8Origin origin_;
    size_t offset_;
    std::vector<u8> bytes_;
};



class IoError : public Error {
public:
    IoError(const std::string& source, const std::string& message);


    const std::string& source() const
    {
        return source_;
    }


private:
    std::string source_;
};



// The input ended in the middle of something.
class TruncatedInput : public IoError {
public:
    TruncatedInput(const std::string& source,
                   size_t offset,
                   size_t requested,
                   size_t remaining);


    size_t offset() const
    {
        return offset_;
    }


    size_t requested() const
    {
        return requested_;
    }


    size_t remaining() const
    {
        return remaining_;
    }


private:
    size_t offset_;
    size_t requested_;
    size_t remaining_;
};



} // namespace classdec

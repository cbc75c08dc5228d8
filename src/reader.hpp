#pragma once

#include "defines.hpp"
#include "endian.hpp"
#include "errors.hpp"
#include "slice.hpp"
#include <string>



namespace classdec {



// Forward-only cursor over the bytes of one classfile. Every parse function
// takes the Reader by reference and advances it by exactly the number of
// bytes that its structure occupies.
class Reader {
public:
    Reader(Slice data, const std::string& source)
        : data_(data), source_(source)
    {
    }


    u8 read_u8()
    {
        require(1);
        return data_.bytes()[offset_++];
    }


    u16 read_u16()
    {
        return read_network<u16>();
    }


    u32 read_u32()
    {
        return read_network<u32>();
    }


    // The returned Slice points into the underlying classfile buffer.
    Slice read_bytes(size_t count)
    {
        require(count);
        Slice result(data_.ptr_ + offset_, count);
        offset_ += count;
        return result;
    }


    size_t offset() const
    {
        return offset_;
    }


    size_t remaining() const
    {
        return data_.length_ - offset_;
    }


    const std::string& source() const
    {
        return source_;
    }


    // Decoders for structures that may contain themselves call enter() on the
    // way in and leave() on the way out, see NestingScope.
    void enter(const char* field)
    {
        if (depth_ >= CLASSDEC_MAX_NESTING_DEPTH) {
            throw MalformedClassFile(
                source_,
                field,
                "nested deeper than " +
                    std::to_string(CLASSDEC_MAX_NESTING_DEPTH) + " levels");
        }
        ++depth_;
    }


    void leave()
    {
        --depth_;
    }


    int depth() const
    {
        return depth_;
    }


private:
    void require(size_t count) const
    {
        if (remaining() < count) {
            throw TruncatedInput(source_, offset_, count, remaining());
        }
    }


    template <typename T> T read_network()
    {
        require(sizeof(T));

        NetworkOrder<T> value;
        memcpy(value.data_, data_.ptr_ + offset_, sizeof(T));
        offset_ += sizeof(T);

        return value.get();
    }


    Slice data_;
    size_t offset_ = 0;
    int depth_ = 0;
    std::string source_;
};



class NestingScope {
public:
    NestingScope(Reader& reader, const char* field) : reader_(reader)
    {
        reader_.enter(field);
    }


    NestingScope(const NestingScope&) = delete;


    ~NestingScope()
    {
        reader_.leave();
    }


private:
    Reader& reader_;
};



} // namespace classdec

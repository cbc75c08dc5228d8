#pragma once

#include "int.h"



namespace classdec {



// Classfiles store every multi-byte integer in network byte order. The reader
// copies raw bytes into one of these wrappers and calls get(), so the wrapper
// itself never needs to be aligned.
template <typename T> struct NetworkOrder {
    u8 data_[sizeof(T)];


    T get() const
    {
        T result = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            result = static_cast<T>((result << 8) | data_[i]);
        }
        return result;
    }


    void set(T value)
    {
        for (size_t i = 0; i < sizeof(T); ++i) {
            data_[sizeof(T) - 1 - i] = static_cast<u8>(value & 0xff);
            value = static_cast<T>(value >> 8);
        }
    }
};



using network_u16 = NetworkOrder<u16>;
using network_u32 = NetworkOrder<u32>;



} // namespace classdec

#include "modifiedUtf8.hpp"
#include "defines.hpp"
#include "errors.hpp"
#include <vector>



namespace classdec {
namespace mutf8 {



static bool is_continuation(u8 byte)
{
    return (byte & 0xc0) == 0x80;
}



static bool is_surrogate(u32 code_point)
{
    return code_point >= 0xd800 and code_point <= 0xdfff;
}



static std::vector<u8> span(const u8* bytes, size_t begin, size_t end)
{
    return std::vector<u8>(bytes + begin, bytes + end);
}



void append_utf8(std::string& out, u32 code_point)
{
    if (code_point < 0x80) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out.push_back(static_cast<char>(0xc0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
    } else if (code_point < 0x10000) {
        out.push_back(static_cast<char>(0xe0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
    } else {
        out.push_back(static_cast<char>(0xf0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
    }
}



std::string decode(Slice input, const Utf8Origin& origin)
{
    const u8* bytes = input.bytes();
    const size_t length = input.length_;

    std::string result;
    result.reserve(length);

    size_t i = 0;
    while (i < length) {
        const u8 b1 = bytes[i];

        if (b1 == 0 or b1 >= 0xf0 or is_continuation(b1)) {
            throw MalformedModifiedUtf8::invalid_leading_byte(
                origin, i, b1);
        }

        if (b1 <= 0x7f) {
            result.push_back(static_cast<char>(b1));
            ++i;
            continue;
        }

        u32 code_point = 0;
        size_t width = 0;

        if ((b1 & 0xe0) == 0xc0) {
            if (length - i < 2) {
                throw MalformedModifiedUtf8::truncated(
                    origin, i, span(bytes, i, length), 2);
            }

            const u8 b2 = bytes[i + 1];
            if (not is_continuation(b2)) {
                throw MalformedModifiedUtf8::invalid_continuation(
                    origin, i, span(bytes, i, i + 2));
            }

            // NOTE: C0 80 lands here and yields U+0000, which is how the
            // format smuggles nul characters into its strings.
            code_point = ((b1 & 0x1f) << 6) | (b2 & 0x3f);
            width = 2;

        } else {
            // Only 1110xxxx remains at this point.
            if (length - i < 3) {
                throw MalformedModifiedUtf8::truncated(
                    origin, i, span(bytes, i, length), 3);
            }

            const u8 b2 = bytes[i + 1];
            const u8 b3 = bytes[i + 2];
            if (not is_continuation(b2) or not is_continuation(b3)) {
                throw MalformedModifiedUtf8::invalid_continuation(
                    origin, i, span(bytes, i, i + 3));
            }

            code_point = ((b1 & 0x0f) << 12) | ((b2 & 0x3f) << 6) | (b3 & 0x3f);
            width = 3;

            if (code_point >= 0xd800 and code_point <= 0xdbff) {
                // A high surrogate, the first half of the six byte form:
                // 11101101 1010vvvv 10wwwwww 11101101 1011yyyy 10zzzzzz
                if (length - i < 6) {
                    throw MalformedModifiedUtf8::truncated(
                        origin, i, span(bytes, i, length), 6);
                }

                const u8 b4 = bytes[i + 3];
                const u8 b5 = bytes[i + 4];
                const u8 b6 = bytes[i + 5];

#if CLASSDEC_CHECK_SURROGATE_MARKER
                if (b4 not_eq 0xed) {
                    throw MalformedModifiedUtf8::invalid_code_point(
                        origin, i, span(bytes, i, i + 6), code_point);
                }
#endif

                if (not is_continuation(b6) or (b5 & 0xf0) not_eq 0xb0) {
                    throw MalformedModifiedUtf8::invalid_code_point(
                        origin, i, span(bytes, i, i + 6), code_point);
                }

                code_point = 0x10000 + ((b2 & 0x0f) << 16) +
                             ((b3 & 0x3f) << 10) + ((b5 & 0x0f) << 6) +
                             (b6 & 0x3f);
                width = 6;
            }
        }

        if (is_surrogate(code_point) or code_point > 0x10ffff) {
            throw MalformedModifiedUtf8::invalid_code_point(
                origin, i, span(bytes, i, i + width), code_point);
        }

        append_utf8(result, code_point);
        i += width;
    }

    return result;
}



} // namespace mutf8
} // namespace classdec

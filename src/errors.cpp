#include "errors.hpp"
#include <sstream>



namespace classdec {



std::string hex(u32 value)
{
    std::ostringstream out;
    out << "0x" << std::hex << value;
    return out.str();
}



static std::string hex_list(const std::vector<u8>& bytes)
{
    std::string result;
    for (auto byte : bytes) {
        if (not result.empty()) {
            result += ' ';
        }
        result += hex(byte);
    }
    return result;
}



MalformedClassFile::MalformedClassFile(const std::string& source,
                                       const std::string& field,
                                       const std::string& message)
    : Error("malformed class file " + source + ": " + field + ": " +
            message),
      source_(source), field_(field)
{
}



MalformedClassFile MalformedClassFile::wrong_value(const std::string& source,
                                                   const std::string& field,
                                                   u32 actual,
                                                   u32 expected)
{
    return MalformedClassFile(source,
                              field,
                              "invalid value, expected " + hex(expected) +
                                  ", got " + hex(actual));
}



MalformedClassFile
MalformedClassFile::not_one_of(const std::string& source,
                               const std::string& field,
                               u32 actual,
                               const std::vector<u32>& allowed)
{
    std::string formatted = "[";
    for (size_t i = 0; i < allowed.size(); ++i) {
        if (i not_eq 0) {
            formatted += ", ";
        }
        formatted += hex(allowed[i]);
    }
    formatted += "]";

    return MalformedClassFile(source,
                              field,
                              "invalid value, expected one of " + formatted +
                                  ", got " + hex(actual));
}



static std::string describe(const Utf8Origin& origin, size_t offset)
{
    std::string result = "malformed modified utf-8";
    if (not origin.source_.empty()) {
        result += " in " + origin.source_;
    }
    if (origin.pool_index_ not_eq 0) {
        result += " constant #" + std::to_string(origin.pool_index_);
    }
    return result + " at byte " + std::to_string(offset);
}



MalformedModifiedUtf8::MalformedModifiedUtf8(const Utf8Origin& origin,
                                             size_t offset,
                                             std::vector<u8> bytes,
                                             const std::string& message)
    : Error(describe(origin, offset) + ": " + message), origin_(origin),
      offset_(offset), bytes_(std::move(bytes))
{
}



MalformedModifiedUtf8
MalformedModifiedUtf8::invalid_leading_byte(const Utf8Origin& origin,
                                            size_t offset,
                                            u8 byte)
{
    return MalformedModifiedUtf8(
        origin,
        offset,
        {byte},
        "byte " + hex(byte) + " cannot start a character");
}



MalformedModifiedUtf8 MalformedModifiedUtf8::truncated(const Utf8Origin& origin,
                                                       size_t offset,
                                                       std::vector<u8> bytes,
                                                       size_t expected)
{
    auto message = "sequence " + hex_list(bytes) + " is cut short, expected " +
                   std::to_string(expected) + " bytes";

    return MalformedModifiedUtf8(origin, offset, std::move(bytes), message);
}



MalformedModifiedUtf8
MalformedModifiedUtf8::invalid_continuation(const Utf8Origin& origin,
                                            size_t offset,
                                            std::vector<u8> bytes)
{
    auto message = "sequence " + hex_list(bytes) +
                   " contains an invalid continuation byte";

    return MalformedModifiedUtf8(origin, offset, std::move(bytes), message);
}



MalformedModifiedUtf8
MalformedModifiedUtf8::invalid_code_point(const Utf8Origin& origin,
                                          size_t offset,
                                          std::vector<u8> bytes,
                                          u32 code_point)
{
    auto message = "invalid code point " + hex(code_point) + " from bytes " +
                   hex_list(bytes);

    return MalformedModifiedUtf8(origin, offset, std::move(bytes), message);
}



IoError::IoError(const std::string& source, const std::string& message)
    : Error(source + ": " + message), source_(source)
{
}



TruncatedInput::TruncatedInput(const std::string& source,
                               size_t offset,
                               size_t requested,
                               size_t remaining)
    : IoError(source,
              "unexpected end of input at byte " + std::to_string(offset) +
                  ", needed " + std::to_string(requested) + " bytes, " +
                  std::to_string(remaining) + " left"),
      offset_(offset), requested_(requested), remaining_(remaining)
{
}



} // namespace classdec

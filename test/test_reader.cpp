#include <gtest/gtest.h>
#include "errors.hpp"
#include "reader.hpp"
#include "test_helpers.hpp"

using namespace classdec;
using namespace classdec::test;

TEST(Reader, BigEndianIntegers) {
    ByteBuilder bytes;
    bytes.put_bytes({0x01, 0x02, 0x03, 0xca, 0xfe, 0xba, 0xbe});
    Reader reader(bytes.slice(), "Test.class");

    EXPECT_EQ(reader.read_u8(), 0x01);
    EXPECT_EQ(reader.read_u16(), 0x0203);
    EXPECT_EQ(reader.read_u32(), 0xcafebabeu);
    EXPECT_EQ(reader.offset(), 7u);
    EXPECT_EQ(reader.remaining(), 0u);
}

TEST(Reader, ReadBytesPointsIntoInput) {
    ByteBuilder bytes;
    bytes.put_bytes({'a', 'b', 'c', 'd'});
    Reader reader(bytes.slice(), "Test.class");

    reader.read_u8();
    auto run = reader.read_bytes(2);
    EXPECT_EQ(run, Slice::from_c_str("bc"));
    EXPECT_EQ(run.ptr_, bytes.slice().ptr_ + 1);
    EXPECT_EQ(reader.remaining(), 1u);
    EXPECT_EQ(reader.read_bytes(0).length_, 0u);
}

TEST(Reader, ShortRead) {
    ByteBuilder bytes;
    bytes.put_bytes({0x00, 0x01, 0x02});
    Reader reader(bytes.slice(), "Test.class");
    reader.read_u16();

    try {
        reader.read_u32();
        FAIL() << "expected TruncatedInput";
    } catch (const TruncatedInput& err) {
        EXPECT_EQ(err.source(), "Test.class");
        EXPECT_EQ(err.offset(), 2u);
        EXPECT_EQ(err.requested(), 4u);
        EXPECT_EQ(err.remaining(), 1u);
    }

    // A failed read consumes nothing.
    EXPECT_EQ(reader.offset(), 2u);
    EXPECT_EQ(reader.read_u8(), 0x02);
    EXPECT_THROW(reader.read_u8(), TruncatedInput);
    EXPECT_THROW(reader.read_bytes(1), IoError);
}

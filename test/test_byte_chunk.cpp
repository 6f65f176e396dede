#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>

#include "byte_chunk.h"

using namespace poolq::core;

TEST(byte_chunk, reads_full_partial_then_eof) {
    std::istringstream in(std::string("\x01\x02\x03\x04\x05", 5));
    ByteChunk chunk(4);

    EXPECT_EQ(read_chunk(in, chunk), 4u);
    EXPECT_FALSE(chunk.eof());
    EXPECT_EQ(format_hex(chunk), "01 02 03 04");

    EXPECT_EQ(read_chunk(in, chunk), 1u);
    EXPECT_FALSE(chunk.eof());
    EXPECT_EQ(format_hex(chunk), "05");

    EXPECT_EQ(read_chunk(in, chunk), 0u);
    EXPECT_TRUE(chunk.eof());
    EXPECT_EQ(format_hex(chunk), "");
}

TEST(byte_chunk, keeps_storage_across_moves) {
    ByteChunk a(8);
    const std::uint8_t* storage = a.data();
    ByteChunk b(std::move(a));
    EXPECT_EQ(b.data(), storage);
    EXPECT_EQ(b.capacity(), 8u);
}

TEST(byte_chunk, formats_lowercase_hex) {
    ByteChunk chunk(3);
    chunk.data()[0] = 0x0a;
    chunk.data()[1] = 0xff;
    chunk.data()[2] = 0x10;
    chunk.set_size(3);
    EXPECT_EQ(format_hex(chunk), "0a ff 10");
}

TEST(byte_chunk, rejects_invalid_sizes) {
    EXPECT_THROW(ByteChunk(0), std::invalid_argument);
    ByteChunk chunk(2);
    EXPECT_THROW(chunk.set_size(3), std::out_of_range);
}

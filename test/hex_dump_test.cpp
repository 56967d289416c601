#include "posix_term/hex_dump.hpp"

#include <gtest/gtest.h>

#include <vector>

TEST(hex_dump, short_chunk)
{
    const uint8_t b[] = {'h', 'i', 0x00, 0xff};
    EXPECT_EQ(posix_term::hex_head(b, sizeof(b)), "68 69 00 ff");
}

TEST(hex_dump, empty_chunk)
{
    EXPECT_EQ(posix_term::hex_head(nullptr, 0), "");
}

TEST(hex_dump, long_chunk_is_cut)
{
    std::vector<uint8_t> b(20, 0xab);
    EXPECT_EQ(posix_term::hex_head(b.data(), b.size(), 3), "ab ab ab ... (+17)");
}

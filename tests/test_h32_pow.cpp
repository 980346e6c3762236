#include <gtest/gtest.h>
#include "pchheader.hpp"
#include "util/h32.hpp"
#include "chain/block.hpp"

namespace
{
    util::h32 hash_with_first_byte(const uint8_t first)
    {
        std::string bytes(sizeof(util::h32), '\x55');
        bytes[0] = (char)first;
        util::h32 hash;
        hash = bytes;
        return hash;
    }

    TEST(H32Test, AssignCopiesBytesInOrder)
    {
        std::string bytes(sizeof(util::h32), '\0');
        for (size_t i = 0; i < bytes.size(); i++)
            bytes[i] = (char)i;

        util::h32 hash;
        hash = bytes;
        EXPECT_EQ(bytes, std::string(hash.to_string_view()));
        EXPECT_EQ(0, hash.first_byte());
    }

    TEST(H32Test, ShortInputIsZeroPadded)
    {
        util::h32 hash;
        hash = std::string_view("\x01\x02", 2);

        const std::string_view sv = hash.to_string_view();
        EXPECT_EQ(1, sv[0]);
        EXPECT_EQ(2, sv[1]);
        for (size_t i = 2; i < sv.size(); i++)
            EXPECT_EQ(0, sv[i]);
    }

    TEST(H32Test, EqualityAndOrdering)
    {
        const util::h32 a = hash_with_first_byte(0x01);
        const util::h32 b = hash_with_first_byte(0x02);

        EXPECT_TRUE(a == hash_with_first_byte(0x01));
        EXPECT_TRUE(a != b);
        EXPECT_TRUE(a < b);
        EXPECT_FALSE(b < a);
        EXPECT_TRUE(util::h32_empty == util::h32());
    }

    TEST(PowTest, ZeroDifficultyAlwaysPasses)
    {
        EXPECT_TRUE(chain::pow_verified(hash_with_first_byte(0xff), 0));
        EXPECT_TRUE(chain::pow_verified(hash_with_first_byte(0x00), 0));
    }

    TEST(PowTest, LeadingZeroBitsOfFirstByte)
    {
        // 0b00011010 has three leading zero bits.
        const util::h32 hash = hash_with_first_byte(0b00011010);
        EXPECT_TRUE(chain::pow_verified(hash, 1));
        EXPECT_TRUE(chain::pow_verified(hash, 2));
        EXPECT_TRUE(chain::pow_verified(hash, 3));
        EXPECT_FALSE(chain::pow_verified(hash, 4));
        EXPECT_FALSE(chain::pow_verified(hash, 8));
    }

    TEST(PowTest, FullByteDifficulty)
    {
        EXPECT_TRUE(chain::pow_verified(hash_with_first_byte(0x00), 8));
        EXPECT_FALSE(chain::pow_verified(hash_with_first_byte(0x01), 8));
        EXPECT_TRUE(chain::pow_verified(hash_with_first_byte(0x01), 7));
        EXPECT_FALSE(chain::pow_verified(hash_with_first_byte(0x80), 1));
    }

    TEST(PowTest, DifficultyBeyondByteNeverPasses)
    {
        EXPECT_FALSE(chain::pow_verified(util::h32_empty, 9));
        EXPECT_FALSE(chain::pow_verified(util::h32_empty, 64));
    }

} // namespace

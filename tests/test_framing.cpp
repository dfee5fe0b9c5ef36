// test_framing.cpp - capacity, bit expansion and frame layout.

#include <gtest/gtest.h>

#include "framing.hpp"

#include <string>
#include <vector>

TEST(CapacityTest, KnownValues)
{
    EXPECT_EQ(stega::imageCapacity(0), -5);
    EXPECT_EQ(stega::imageCapacity(1), -5);
    EXPECT_EQ(stega::imageCapacity(14), 0);
    EXPECT_EQ(stega::imageCapacity(100), 32);
    EXPECT_EQ(stega::imageCapacity(1920LL * 1080), 777595);

    EXPECT_EQ(stega::clampedCapacity(0), 0);
    EXPECT_EQ(stega::clampedCapacity(100), 32);
}

TEST(CapacityTest, MonotonicInPixelCount)
{
    int64_t prev = stega::imageCapacity(0);
    for (int64_t n = 1; n <= 5000; ++n) {
        int64_t cur = stega::imageCapacity(n);
        EXPECT_GE(cur, prev) << "pixelCount=" << n;
        prev = cur;
    }
}

TEST(BitsTest, MsbFirstExpansion)
{
    std::vector<uint8_t> bits = stega::bytesToBits({0x80, 0x01});
    std::vector<uint8_t> expected = {1, 0, 0, 0, 0, 0, 0, 0,
                                     0, 0, 0, 0, 0, 0, 0, 1};
    EXPECT_EQ(bits, expected);
    EXPECT_EQ(stega::bitsToBytes(bits), (std::vector<uint8_t>{0x80, 0x01}));
}

TEST(BitsTest, TrailingPartialByteDropped)
{
    std::vector<uint8_t> bits = {0, 1, 0, 0, 0, 0, 0, 1, 1, 1};
    EXPECT_EQ(stega::bitsToBytes(bits), (std::vector<uint8_t>{'A'}));
}

TEST(ImageFrameTest, MaskedPayloadThenTerminator)
{
    std::vector<uint8_t> payload = {'h', 'i'};

    std::vector<uint8_t> plain = stega::buildImageFrame(payload, "");
    EXPECT_EQ(plain, (std::vector<uint8_t>{'h', 'i', 0, 0, 0, 0, 0}));

    std::vector<uint8_t> masked = stega::buildImageFrame(payload, "k");
    EXPECT_EQ(masked, (std::vector<uint8_t>{'h' ^ 'k', 'i' ^ 'k', 0, 0, 0, 0, 0}));
}

TEST(ImageFrameTest, ParseUnmasksAndRequiresUtf8)
{
    stega::Result<std::string> ok = stega::parseImageFrame({'h' ^ 'k', 'i' ^ 'k'}, "k");
    ASSERT_TRUE(ok.ok);
    EXPECT_EQ(ok.value, "hi");

    stega::Result<std::string> bad = stega::parseImageFrame({0xFF, 0xFE}, "");
    EXPECT_FALSE(bad.ok);
    EXPECT_EQ(bad.kind, stega::ErrorKind::Decode);
}

TEST(TextFrameTest, ChecksumStoredUnmasked)
{
    stega::Result<std::vector<uint8_t>> plain = stega::buildTextFrame({'h', 'i'}, "");
    ASSERT_TRUE(plain.ok);
    EXPECT_EQ(plain.value, (std::vector<uint8_t>{0x49, 0xF6, 'h', 'i'}));

    stega::Result<std::vector<uint8_t>> masked = stega::buildTextFrame({'h', 'i'}, "k");
    ASSERT_TRUE(masked.ok);
    EXPECT_EQ(masked.value, (std::vector<uint8_t>{0x49, 0xF6, 'h' ^ 'k', 'i' ^ 'k'}));
}

TEST(TextFrameTest, ParseDetectsWrongPassword)
{
    stega::Result<std::vector<uint8_t>> frame = stega::buildTextFrame({'h', 'i'}, "secret");
    ASSERT_TRUE(frame.ok);

    stega::Result<std::string> good = stega::parseTextFrame(frame.value, "secret");
    ASSERT_TRUE(good.ok);
    EXPECT_EQ(good.value, "hi");

    stega::Result<std::string> wrong = stega::parseTextFrame(frame.value, "wrong");
    EXPECT_FALSE(wrong.ok);
    EXPECT_EQ(wrong.kind, stega::ErrorKind::Integrity);
}

TEST(TextFrameTest, ShortFrameIsCorrupted)
{
    stega::Result<std::string> r = stega::parseTextFrame({0x49, 0xF6}, "");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.kind, stega::ErrorKind::Decode);
}

TEST(SecretValidationTest, RejectsEmptyAndMalformed)
{
    size_t n = 0;
    EXPECT_TRUE(stega::validateSecret("h\xC3\xA9llo", &n).ok);
    EXPECT_EQ(n, 5u);

    stega::Status empty = stega::validateSecret("");
    EXPECT_FALSE(empty.ok);
    EXPECT_EQ(empty.kind, stega::ErrorKind::Validation);

    stega::Status bad = stega::validateSecret("\xFF");
    EXPECT_FALSE(bad.ok);
    EXPECT_EQ(bad.kind, stega::ErrorKind::Validation);
}

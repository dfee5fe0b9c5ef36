// test_metrics.cpp - distortion of an LSB embed.

#include <gtest/gtest.h>

#include "metrics.hpp"
#include "image_stego.hpp"

#include <cmath>
#include <vector>

TEST(MetricsTest, IdenticalBuffers)
{
    std::vector<uint8_t> a(300, 77);
    EXPECT_DOUBLE_EQ(metrics::computePSNR(a, a), 100.0);
    EXPECT_EQ(metrics::maxChannelDelta(a, a), 0);
}

TEST(MetricsTest, SizeMismatch)
{
    std::vector<uint8_t> a(3, 0), b(6, 0);
    EXPECT_LT(metrics::computePSNR(a, b), 0.0);
    EXPECT_EQ(metrics::maxChannelDelta(a, b), -1);
}

TEST(MetricsTest, SingleChannelOffByOne)
{
    std::vector<uint8_t> a = {10, 20, 30};
    std::vector<uint8_t> b = {10, 21, 30};
    EXPECT_NEAR(metrics::computePSNR(a, b), 10.0 * std::log10(255.0 * 255.0 * 3.0), 1e-4);
    EXPECT_EQ(metrics::maxChannelDelta(a, b), 1);
}

TEST(MetricsTest, LsbEmbedChangesEachChannelByAtMostOne)
{
    std::vector<uint8_t> cover;
    for (int i = 0; i < 16 * 16 * 3; ++i) {
        cover.push_back(static_cast<uint8_t>(i % 256));
    }

    stega::Result<std::vector<uint8_t>> enc =
        imgstego::imageEncode(cover, 16, 16, "a short secret", "key");
    ASSERT_TRUE(enc.ok);

    EXPECT_LE(metrics::maxChannelDelta(cover, enc.value), 1);
    EXPECT_GT(metrics::computePSNR(cover, enc.value), 50.0);
}

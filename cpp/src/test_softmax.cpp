#include "Softmax.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>

/**
 * Test numerical stability of softmax
 *
 * Critical: log-posteriors of real documents are large negative numbers,
 * softmax must not underflow to 0/0
 */
TEST(SoftmaxTest, NumericalStability) {
    std::vector<float> scores{-1000.0f, -999.0f, -1001.0f};

    auto probs = Softmax::compute(scores);

    ASSERT_EQ(probs.size(), 3u);

    float sum = probs[0] + probs[1] + probs[2];
    EXPECT_NEAR(sum, 1.0f, 1e-5f);

    EXPECT_EQ(Softmax::argMax(probs), 1);  // -999 is largest

    for (float p : probs) {
        EXPECT_FALSE(std::isnan(p));
        EXPECT_FALSE(std::isinf(p));
    }
}

TEST(SoftmaxTest, LargePositiveScores) {
    std::vector<float> scores{1000.0f, 1001.0f, 999.0f};

    auto probs = Softmax::compute(scores);

    ASSERT_EQ(probs.size(), 3u);
    EXPECT_NEAR(probs[0] + probs[1] + probs[2], 1.0f, 1e-5f);
    EXPECT_EQ(Softmax::argMax(probs), 1);
}

/**
 * Test softmax properties
 */
TEST(SoftmaxTest, MathematicalProperties) {
    std::vector<float> scores{1.0f, 2.0f, 3.0f};

    auto probs = Softmax::compute(scores);

    for (float p : probs) {
        EXPECT_GE(p, 0.0f);
        EXPECT_LE(p, 1.0f);
    }

    // Monotonic: higher score → higher prob
    EXPECT_GT(probs[2], probs[1]);
    EXPECT_GT(probs[1], probs[0]);

    // exp(1) / (exp(1) + exp(2) + exp(3))
    EXPECT_NEAR(probs[0], 0.0900306f, 1e-5f);
}

TEST(SoftmaxTest, EqualScoresGiveUniformDistribution) {
    auto probs = Softmax::compute({-5.0f, -5.0f, -5.0f, -5.0f});

    ASSERT_EQ(probs.size(), 4u);
    for (float p : probs) {
        EXPECT_NEAR(p, 0.25f, 1e-6f);
    }
}

TEST(SoftmaxTest, NegativeInfinityGetsZeroProbability) {
    const float negInf = -std::numeric_limits<float>::infinity();
    auto probs = Softmax::compute({negInf, 0.0f});

    EXPECT_FLOAT_EQ(probs[0], 0.0f);
    EXPECT_FLOAT_EQ(probs[1], 1.0f);
}

TEST(SoftmaxTest, EmptyInput) {
    EXPECT_TRUE(Softmax::compute({}).empty());
    EXPECT_EQ(Softmax::argMax({}), -1);
}

/**
 * Ties go to the first index
 */
TEST(ArgMaxTest, FirstMaximumWins) {
    EXPECT_EQ(Softmax::argMax({0.3f, 0.7f, 0.7f}), 1);
    EXPECT_EQ(Softmax::argMax({2.0f, 2.0f}), 0);
    EXPECT_EQ(Softmax::argMax({-3.0f, -1.0f, -2.0f}), 1);
}

TEST(ArgMaxTest, FirstNanWins) {
    const float nan = std::numeric_limits<float>::quiet_NaN();

    EXPECT_EQ(Softmax::argMax({-2.0f, nan, 5.0f}), 1);
    EXPECT_EQ(Softmax::argMax({3.0f, 1.0f, nan}), 2);
    EXPECT_EQ(Softmax::argMax({nan, 7.0f, nan}), 0);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

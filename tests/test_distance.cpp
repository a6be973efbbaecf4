#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "vectorwise/distance.h"

TEST(DistanceTest, SquaredEuclideanMatchesScalarSum)
{
    // 19 floats: exercises the 8-wide kernel and the scalar tail
    std::vector<float> a(19), b(19);
    float expected = 0.0f;
    for (size_t i = 0; i < a.size(); i++)
    {
        a[i] = 0.5f * i;
        b[i] = 1.0f - 0.25f * i;
        expected += (a[i] - b[i]) * (a[i] - b[i]);
    }
    EXPECT_NEAR(squaredEuclideanDistance(a, b), expected, 1e-3f * expected);
    EXPECT_FLOAT_EQ(squaredEuclideanDistance(a, a), 0.0f);
}

TEST(DistanceTest, SizeMismatchThrows)
{
    std::vector<float> a(4, 1.0f), b(5, 1.0f);
    EXPECT_THROW(squaredEuclideanDistance(a, b), std::invalid_argument);
}

TEST(DistanceTest, NormalizeL2GivesUnitLength)
{
    std::vector<float> v{3.0f, 4.0f};
    normalizeL2(v);
    EXPECT_FLOAT_EQ(v[0], 0.6f);
    EXPECT_FLOAT_EQ(v[1], 0.8f);
}

TEST(DistanceTest, NormalizeL2LeavesZeroVector)
{
    std::vector<float> v(8, 0.0f);
    normalizeL2(v);
    for (float x : v)
        EXPECT_EQ(x, 0.0f);
}

TEST(DistanceTest, ProfilingCountsCalls)
{
    std::vector<float> a(8, 1.0f), b(8, 2.0f);
    enableProfiling();
    resetProfilingCounter();
    squaredEuclideanDistance(a, b);
    squaredEuclideanDistance(a, b);
    EXPECT_EQ(getCountDistCalc(), 2u);
    disableProfiling();
    squaredEuclideanDistance(a, b);
    EXPECT_EQ(getCountDistCalc(), 2u);
}

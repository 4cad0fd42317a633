#include <AT_gtest.h>

#include <AT_Math/AT_Math.h>

TEST(MathTest, IsPositive)
{
    EXPECT_TRUE(is_positive(0.01f));
    EXPECT_FALSE(is_positive(1e-9f));
    EXPECT_FALSE(is_positive(0.0f));
    EXPECT_FALSE(is_positive(-0.01f));
}

TEST(MathTest, Constrain)
{
    EXPECT_EQ(5.0f, constrain_float(10, 0, 5));
    EXPECT_EQ(0.0f, constrain_float(-3, 0, 5));
    EXPECT_EQ(2.5f, constrain_float(2.5f, 0, 5));
    EXPECT_EQ(2.5f, constrain_float(NAN, 0, 5));

    EXPECT_EQ(80, constrain_int32(500, 20, 80));
    EXPECT_EQ(20, constrain_int16(-4, 20, 80));
}

TEST(MathTest, WrapPI)
{
    EXPECT_NEAR(0.0f, wrap_PI(M_2PI), 1e-5);
    EXPECT_NEAR(M_PI, wrap_PI(M_PI), 1e-5);
    EXPECT_NEAR(M_PI, wrap_PI(-M_PI), 1e-5);
    EXPECT_NEAR(-M_PI_2, wrap_PI(3 * M_PI_2), 1e-5);
    EXPECT_NEAR(0.5f, wrap_PI(0.5f + 4 * M_PI), 1e-4);
    EXPECT_EQ(0.0f, wrap_PI(INFINITY));
}

TEST(MathTest, RoundInt32)
{
    EXPECT_EQ(3, round_int32(2.5f));
    EXPECT_EQ(-3, round_int32(-2.5f));
    EXPECT_EQ(126, round_int32(125.78f));
    EXPECT_EQ(0, round_int32(NAN));
    EXPECT_EQ(INT32_MAX, round_int32(1e20f));
}

TEST(MathTest, PowerOfTwo)
{
    EXPECT_TRUE(is_power_of_2(16));
    EXPECT_TRUE(is_power_of_2(1024));
    EXPECT_FALSE(is_power_of_2(0));
    EXPECT_FALSE(is_power_of_2(1000));
}

TEST(MathTest, SeriesStatistics)
{
    const std::vector<float> v { 2, 4, 4, 4, 5, 5, 7, 9 };
    EXPECT_FLOAT_EQ(5.0f, series_mean(v));
    EXPECT_FLOAT_EQ(4.0f, series_variance(v));
    EXPECT_FLOAT_EQ(2.0f, series_std_dev(v));
    EXPECT_FLOAT_EQ(7.0f, series_range(v));

    const std::vector<float> empty;
    EXPECT_EQ(0.0f, series_mean(empty));
    EXPECT_EQ(0.0f, series_std_dev(empty));
    EXPECT_EQ(0.0f, series_range(empty));

    const std::vector<float> gaps { NAN, 3, INFINITY, -1 };
    EXPECT_FLOAT_EQ(4.0f, series_range(gaps));
    EXPECT_EQ(0.0f, series_range(std::vector<float>(3, NAN)));
}

TEST(MathTest, RMSEUsesOverlap)
{
    const std::vector<float> a { 1, 2, 3, 100 };
    const std::vector<float> b { 4, 6, 3 };
    // (9 + 16 + 0) / 3
    EXPECT_NEAR(sqrtf(25.0f / 3), series_rmse(a, b), 1e-5);
    EXPECT_EQ(0.0f, series_rmse(a, std::vector<float>()));
}

AT_GTEST_MAIN()

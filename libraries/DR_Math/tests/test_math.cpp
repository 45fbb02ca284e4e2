#include <DR_gtest.h>

#include <math.h>

#include <DR_HAL/DR_HAL.h>
#include <DR_Math/DR_Math.h>

const DR_HAL::HAL& hal = DR_HAL::get_HAL();

TEST(DR_Math, ConstrainInt16)
{
    EXPECT_EQ(constrain_int16(5, 10, 1000), 10);
    EXPECT_EQ(constrain_int16(250, 10, 1000), 250);
    EXPECT_EQ(constrain_int16(5000, 10, 1000), 1000);
    EXPECT_EQ(constrain_int16(-300, -250, 250), -250);
}

TEST(DR_Math, ConstrainInt32)
{
    EXPECT_EQ(constrain_int32(-100000, -50000, 50000), -50000);
    EXPECT_EQ(constrain_int32(123456, 0, 100000), 100000);
    EXPECT_EQ(constrain_int32(42, 0, 100000), 42);
}

TEST(DR_Math, ConstrainFloat)
{
    EXPECT_FLOAT_EQ(constrain_float(45.5f, -30, 30), 30.0f);
    EXPECT_FLOAT_EQ(constrain_float(-45.5f, -30, 30), -30.0f);
    EXPECT_FLOAT_EQ(constrain_float(2.5f, -30, 30), 2.5f);

    // NaN gives the middle of the range
    EXPECT_FLOAT_EQ(constrain_float(NAN, -10, 30), 10.0f);
}

TEST(DR_Math, WrapAngles)
{
    EXPECT_FLOAT_EQ(wrap_360(-90), 270);
    EXPECT_FLOAT_EQ(wrap_360(405), 45);
    EXPECT_FLOAT_EQ(wrap_180(270), -90);
    EXPECT_FLOAT_EQ(wrap_180(-45.5f), -45.5f);
    EXPECT_FLOAT_EQ(wrap_180(180), 180);
}

TEST(DR_Math, Conversions)
{
    EXPECT_NEAR(radians(180), M_PI, 1e-6);
    EXPECT_NEAR(degrees(M_PI_2), 90, 1e-4);
    EXPECT_FLOAT_EQ(norm(3, 4), 5);
    EXPECT_TRUE(is_zero(0.0f));
    EXPECT_FALSE(is_zero(0.01f));
}

DR_GTEST_MAIN()

#include <DR_gtest.h>

#include <DR_HAL/DR_HAL.h>
#include <DR_Failsafe/DR_Failsafe_Command.h>

const DR_HAL::HAL& hal = DR_HAL::get_HAL();

static DR_AttitudeSample make_sample(float roll, float pitch, float yaw)
{
    DR_AttitudeSample sample;
    sample.roll = roll;
    sample.pitch = pitch;
    sample.yaw = yaw;
    return sample;
}

static DR_AttitudeTarget make_target(float roll, float pitch, float yaw, float climb_rate)
{
    DR_AttitudeTarget target;
    target.roll_deg = roll;
    target.pitch_deg = pitch;
    target.yaw_deg = yaw;
    target.climb_rate_ms = climb_rate;
    return target;
}

TEST(DR_Failsafe_Command, ClimbRateProfile)
{
    EXPECT_FLOAT_EQ(DR_Failsafe_Command::climb_rate(-5, 200, 500, 1.0f, 0.1f), 1.0f);
    EXPECT_FLOAT_EQ(DR_Failsafe_Command::climb_rate(0, 200, 500, 1.0f, 0.1f), 1.0f);
    EXPECT_FLOAT_EQ(DR_Failsafe_Command::climb_rate(200, 200, 500, 1.0f, 0.1f), 1.0f);
    EXPECT_FLOAT_EQ(DR_Failsafe_Command::climb_rate(200.5f, 200, 500, 1.0f, 0.1f), 0.1f);
    EXPECT_FLOAT_EQ(DR_Failsafe_Command::climb_rate(499.5f, 200, 500, 1.0f, 0.1f), 0.1f);
    EXPECT_FLOAT_EQ(DR_Failsafe_Command::climb_rate(500, 200, 500, 1.0f, 0.1f), 0.0f);
    EXPECT_FLOAT_EQ(DR_Failsafe_Command::climb_rate(1200, 200, 500, 1.0f, 0.1f), 0.0f);
}

TEST(DR_Failsafe_Command, LevelTarget)
{
    const DR_AttitudeTarget target = DR_Failsafe_Command::level_target(-135.0f);
    EXPECT_FLOAT_EQ(target.roll_deg, 0.0f);
    EXPECT_FLOAT_EQ(target.pitch_deg, 0.0f);
    EXPECT_FLOAT_EQ(target.yaw_deg, -135.0f);
    EXPECT_FLOAT_EQ(target.climb_rate_ms, 0.0f);
}

TEST(DR_Failsafe_Command, ReplaysNewestSampleWithPitchInverted)
{
    DR_AttitudeHistory history;
    ASSERT_TRUE(history.push(make_sample(1, -5, 10)));
    ASSERT_TRUE(history.push(make_sample(3, -12, 20)));

    float target_yaw = 20.0f;
    DR_AttitudeTarget target;
    ASSERT_TRUE(DR_Failsafe_Command::fly_home_target(history, target_yaw, 0, target));
    EXPECT_FLOAT_EQ(target.roll_deg, 3);
    EXPECT_FLOAT_EQ(target.pitch_deg, 12);
    EXPECT_FLOAT_EQ(target.yaw_deg, 20);
    EXPECT_FLOAT_EQ(target_yaw, 20);
    EXPECT_EQ(history.size(), 1U);
}

TEST(DR_Failsafe_Command, HoldsLevelOnceOneSampleLeft)
{
    DR_AttitudeHistory history;
    ASSERT_TRUE(history.push(make_sample(1, -5, 10)));
    ASSERT_TRUE(history.push(make_sample(2, -6, 30)));
    ASSERT_TRUE(history.push(make_sample(4, -8, 50)));

    float target_yaw = 90.0f;
    DR_AttitudeTarget target;
    ASSERT_TRUE(DR_Failsafe_Command::fly_home_target(history, target_yaw, 0, target));
    EXPECT_FLOAT_EQ(target_yaw, 50);
    ASSERT_TRUE(DR_Failsafe_Command::fly_home_target(history, target_yaw, 0, target));
    EXPECT_FLOAT_EQ(target_yaw, 30);

    // the oldest sample is kept, the vehicle holds level at the last yaw
    for (uint8_t i=0; i<3; i++) {
        EXPECT_FALSE(DR_Failsafe_Command::fly_home_target(history, target_yaw, 0, target));
        EXPECT_FLOAT_EQ(target.roll_deg, 0);
        EXPECT_FLOAT_EQ(target.pitch_deg, 0);
        EXPECT_FLOAT_EQ(target.yaw_deg, 30);
        EXPECT_EQ(history.size(), 1U);
    }
}

TEST(DR_Failsafe_Command, EmptyHistoryHoldsLevel)
{
    DR_AttitudeHistory history;
    float target_yaw = -45.0f;
    DR_AttitudeTarget target;
    EXPECT_FALSE(DR_Failsafe_Command::fly_home_target(history, target_yaw, 30, target));
    EXPECT_FLOAT_EQ(target.roll_deg, 0);
    EXPECT_FLOAT_EQ(target.pitch_deg, 0);
    EXPECT_FLOAT_EQ(target.yaw_deg, -45);
}

TEST(DR_Failsafe_Command, LeanLimit)
{
    DR_AttitudeHistory history;
    ASSERT_TRUE(history.push(make_sample(0, 0, 0)));
    ASSERT_TRUE(history.push(make_sample(-40, 35, 5)));
    ASSERT_TRUE(history.push(make_sample(40, -50, 10)));

    float target_yaw = 0;
    DR_AttitudeTarget target;
    ASSERT_TRUE(DR_Failsafe_Command::fly_home_target(history, target_yaw, 30, target));
    EXPECT_FLOAT_EQ(target.roll_deg, 30);
    EXPECT_FLOAT_EQ(target.pitch_deg, 30);
    EXPECT_FLOAT_EQ(target.yaw_deg, 10);

    // zero disables the limit
    ASSERT_TRUE(DR_Failsafe_Command::fly_home_target(history, target_yaw, 0, target));
    EXPECT_FLOAT_EQ(target.roll_deg, -40);
    EXPECT_FLOAT_EQ(target.pitch_deg, -35);
}

TEST(DR_Failsafe_Command, FlyHomeStatus)
{
    char buf[64];

    DR_Failsafe_Command::format_fly_home_status(buf, sizeof(buf), make_target(10, -5, 90, 1.0f), false, 0);
    EXPECT_STREQ(buf, "DR: fly home roll:10 pit:-5 yaw:90 cr:1.0");

    DR_Failsafe_Command::format_fly_home_status(buf, sizeof(buf), make_target(-2.5f, 7.9f, -170.2f, 0.1f), true, 42999);
    EXPECT_STREQ(buf, "DR: fly home roll:-3 pit:7 yaw:-171 cr:0.1 t:42");

    DR_Failsafe_Command::format_fly_home_status(buf, sizeof(buf), make_target(0, 0, 0, 0), true, 0);
    EXPECT_STREQ(buf, "DR: fly home roll:0 pit:0 yaw:0 cr:0.0 t:0");
}

TEST(DR_Failsafe_Command, FlyHomeStatusTruncates)
{
    char buf[20];
    DR_Failsafe_Command::format_fly_home_status(buf, sizeof(buf), make_target(10, -5, 90, 1.0f), true, 5000);
    EXPECT_STREQ(buf, "DR: fly home roll:1");
}

DR_GTEST_MAIN()

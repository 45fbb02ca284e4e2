#include <DR_gtest.h>

#include <DR_HAL/DR_HAL.h>
#include <DR_Failsafe/DR_Mode.h>

const DR_HAL::HAL& hal = DR_HAL::get_HAL();

TEST(DR_Mode, ProtectedModes)
{
    EXPECT_TRUE(DR_Mode::is_protected(DR_Mode::Number::STABILIZE));
    EXPECT_TRUE(DR_Mode::is_protected(DR_Mode::Number::ALT_HOLD));
    EXPECT_TRUE(DR_Mode::is_protected(DR_Mode::Number::AUTO));
    EXPECT_TRUE(DR_Mode::is_protected(DR_Mode::Number::GUIDED));
    EXPECT_TRUE(DR_Mode::is_protected(DR_Mode::Number::LOITER));
    EXPECT_TRUE(DR_Mode::is_protected(DR_Mode::Number::RTL));
    EXPECT_TRUE(DR_Mode::is_protected(DR_Mode::Number::CIRCLE));
    EXPECT_TRUE(DR_Mode::is_protected(DR_Mode::Number::LAND));
    EXPECT_TRUE(DR_Mode::is_protected(DR_Mode::Number::POSHOLD));
    EXPECT_TRUE(DR_Mode::is_protected(DR_Mode::Number::BRAKE));
    EXPECT_TRUE(DR_Mode::is_protected(DR_Mode::Number::SMART_RTL));
    EXPECT_TRUE(DR_Mode::is_protected(DR_Mode::Number::AUTO_RTL));

    EXPECT_FALSE(DR_Mode::is_protected(DR_Mode::Number::ACRO));
    EXPECT_FALSE(DR_Mode::is_protected(DR_Mode::Number::DRIFT));
    EXPECT_FALSE(DR_Mode::is_protected(DR_Mode::Number::SPORT));
    EXPECT_FALSE(DR_Mode::is_protected(DR_Mode::Number::FLIP));
    EXPECT_FALSE(DR_Mode::is_protected(DR_Mode::Number::AUTOTUNE));
    EXPECT_FALSE(DR_Mode::is_protected(DR_Mode::Number::THROW));
    EXPECT_FALSE(DR_Mode::is_protected(DR_Mode::Number::TURTLE));
    // never re-engage from the failsafe's own mode
    EXPECT_FALSE(DR_Mode::is_protected(DR_Mode::BLIND_GUIDED_MODE));
}

TEST(DR_Mode, FromInt)
{
    DR_Mode::Number mode = DR_Mode::Number::STABILIZE;
    EXPECT_TRUE(DR_Mode::from_int(6, mode));
    EXPECT_EQ(mode, DR_Mode::Number::RTL);
    EXPECT_TRUE(DR_Mode::from_int(20, mode));
    EXPECT_EQ(mode, DR_Mode::Number::GUIDED_NOGPS);

    // gaps in the numbering and out of range values
    EXPECT_FALSE(DR_Mode::from_int(8, mode));
    EXPECT_FALSE(DR_Mode::from_int(10, mode));
    EXPECT_FALSE(DR_Mode::from_int(-1, mode));
    EXPECT_FALSE(DR_Mode::from_int(29, mode));
    EXPECT_EQ(mode, DR_Mode::Number::GUIDED_NOGPS);
}

TEST(DR_Mode, Names)
{
    EXPECT_STREQ(DR_Mode::name(DR_Mode::Number::ALT_HOLD), "ALT_HOLD");
    EXPECT_STREQ(DR_Mode::name(DR_Mode::Number::GUIDED_NOGPS), "GUIDED_NOGPS");
}

TEST(DR_Mode, RecoveryUsesConfiguredMode)
{
    bool forced = true;
    EXPECT_EQ(DR_Mode::select_recovery_mode(2, true, DR_Mode::Number::LOITER, false, forced),
              DR_Mode::Number::ALT_HOLD);
    EXPECT_FALSE(forced);

    EXPECT_EQ(DR_Mode::select_recovery_mode(9, false, DR_Mode::Number::STABILIZE, false, forced),
              DR_Mode::Number::LAND);
    EXPECT_FALSE(forced);
}

TEST(DR_Mode, RecoveryUsesSavedMode)
{
    bool forced = true;
    EXPECT_EQ(DR_Mode::select_recovery_mode(-1, true, DR_Mode::Number::AUTO, false, forced),
              DR_Mode::Number::AUTO);
    EXPECT_FALSE(forced);
}

TEST(DR_Mode, RecoveryFallsBack)
{
    bool forced = false;

    // no saved mode
    EXPECT_EQ(DR_Mode::select_recovery_mode(-1, false, DR_Mode::Number::AUTO, false, forced),
              DR_Mode::FALLBACK_MODE);
    EXPECT_TRUE(forced);

    // unknown mode number
    forced = false;
    EXPECT_EQ(DR_Mode::select_recovery_mode(12, true, DR_Mode::Number::AUTO, false, forced),
              DR_Mode::Number::RTL);
    EXPECT_TRUE(forced);

    // timed out while still degraded
    forced = false;
    EXPECT_EQ(DR_Mode::select_recovery_mode(2, true, DR_Mode::Number::AUTO, true, forced),
              DR_Mode::Number::RTL);
    EXPECT_TRUE(forced);
    forced = false;
    EXPECT_EQ(DR_Mode::select_recovery_mode(-1, true, DR_Mode::Number::AUTO, true, forced),
              DR_Mode::Number::RTL);
    EXPECT_TRUE(forced);
}

DR_GTEST_MAIN()

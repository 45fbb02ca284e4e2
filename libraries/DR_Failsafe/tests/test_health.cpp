#include <DR_gtest.h>

#include <string.h>

#include <DR_HAL/DR_HAL.h>
#include <DR_Failsafe/DR_Failsafe_Health.h>
#include <GCS/GCS.h>

const DR_HAL::HAL& hal = DR_HAL::get_HAL();

class GCS_Test : public GCS
{
public:
    char last_text[GCS_STATUSTEXT_LEN+1];
    DR_Severity last_severity;

protected:
    void send_statustext(DR_Severity severity, const char *text) override {
        last_severity = severity;
        strncpy(last_text, text, sizeof(last_text)-1);
        last_text[sizeof(last_text)-1] = 0;
    }
};

static GCS_Test _gcs;

TEST(DR_Failsafe_Health, StartsDegraded)
{
    DR_Failsafe_Health health;
    EXPECT_TRUE(health.degraded());
    EXPECT_FALSE(health.rc_bad());
    EXPECT_FALSE(health.aux_bad());
    EXPECT_FALSE(health.recovery_pending());
}

TEST(DR_Failsafe_Health, RecoversAfterDelay)
{
    DR_Failsafe_Health health;
    const uint32_t sent = _gcs.num_statustext_sent();

    EXPECT_EQ(health.update(true, false, 1000), DR_Failsafe_Health::Transition::NONE);
    EXPECT_TRUE(health.recovery_pending());
    EXPECT_EQ(health.update(true, false, 3999), DR_Failsafe_Health::Transition::NONE);
    EXPECT_TRUE(health.degraded());
    EXPECT_EQ(health.update(true, false, 4000), DR_Failsafe_Health::Transition::RECOVERED);
    EXPECT_FALSE(health.degraded());
    EXPECT_FALSE(health.recovery_pending());

    EXPECT_EQ(_gcs.num_statustext_sent(), sent + 1);
    EXPECT_STREQ(_gcs.last_text, "DR: RC and/or something recovered");
    EXPECT_EQ(_gcs.last_severity, DR_SEVERITY_EMERGENCY);

    // no further messages while healthy
    EXPECT_EQ(health.update(true, false, 5000), DR_Failsafe_Health::Transition::NONE);
    EXPECT_EQ(_gcs.num_statustext_sent(), sent + 1);
}

TEST(DR_Failsafe_Health, RCLossDegradesImmediately)
{
    DR_Failsafe_Health health;
    health.update(true, false, 0);
    health.update(true, false, 3000);
    ASSERT_FALSE(health.degraded());

    const uint32_t sent = _gcs.num_statustext_sent();
    EXPECT_EQ(health.update(false, false, 3100), DR_Failsafe_Health::Transition::DEGRADED);
    EXPECT_TRUE(health.degraded());
    EXPECT_TRUE(health.rc_bad());
    EXPECT_FALSE(health.aux_bad());
    EXPECT_STREQ(_gcs.last_text, "DR: RC and/or something bad");

    // only notified once
    EXPECT_EQ(health.update(false, false, 3200), DR_Failsafe_Health::Transition::NONE);
    EXPECT_EQ(_gcs.num_statustext_sent(), sent + 1);
}

TEST(DR_Failsafe_Health, AuxDistressDegrades)
{
    DR_Failsafe_Health health;
    health.update(true, false, 0);
    health.update(true, false, 3000);
    ASSERT_FALSE(health.degraded());

    EXPECT_EQ(health.update(true, true, 3100), DR_Failsafe_Health::Transition::DEGRADED);
    EXPECT_TRUE(health.aux_bad());
    EXPECT_FALSE(health.rc_bad());
}

TEST(DR_Failsafe_Health, BadSampleRestartsRecoveryWindow)
{
    DR_Failsafe_Health health;
    health.update(false, false, 0);
    health.update(true, false, 100);
    health.update(true, false, 2000);
    EXPECT_TRUE(health.recovery_pending());

    // a single bad tick cancels the window
    health.update(false, false, 2100);
    EXPECT_FALSE(health.recovery_pending());
    EXPECT_TRUE(health.degraded());

    health.update(true, false, 2200);
    EXPECT_EQ(health.update(true, false, 3100), DR_Failsafe_Health::Transition::NONE);
    EXPECT_EQ(health.update(true, false, 5100), DR_Failsafe_Health::Transition::NONE);
    EXPECT_TRUE(health.degraded());
    EXPECT_EQ(health.update(true, false, 5200), DR_Failsafe_Health::Transition::RECOVERED);
}

TEST(DR_Failsafe_Health, AuxDistressHoldsOffRecovery)
{
    DR_Failsafe_Health health;
    health.update(true, true, 0);
    health.update(true, true, 10000);
    EXPECT_TRUE(health.degraded());
    EXPECT_FALSE(health.recovery_pending());
}

TEST(DR_Failsafe_Health, RecoveryWindowAcrossClockWrap)
{
    DR_Failsafe_Health health;
    const uint32_t start_ms = 0xFFFFFFFFU - 1000U;
    health.update(true, false, start_ms);
    EXPECT_EQ(health.update(true, false, start_ms + 2999U), DR_Failsafe_Health::Transition::NONE);
    EXPECT_EQ(health.update(true, false, start_ms + 3000U), DR_Failsafe_Health::Transition::RECOVERED);
}

TEST(DR_Failsafe_Health, ResetReturnsToBootState)
{
    DR_Failsafe_Health health;
    health.update(true, false, 0);
    health.update(true, false, 3000);
    ASSERT_FALSE(health.degraded());
    health.update(false, true, 3100);

    health.reset();
    EXPECT_TRUE(health.degraded());
    EXPECT_FALSE(health.rc_bad());
    EXPECT_FALSE(health.aux_bad());
    EXPECT_FALSE(health.recovery_pending());
}

DR_GTEST_MAIN()

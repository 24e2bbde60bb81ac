/**
 * Test Suite: FoxConfig
 *
 * Built-in defaults and the clamp applied to provisioned overrides.
 * Framework: Unity (host build)
 */

#include <unity.h>
#include <math.h>
#include "config/FoxConfig.hpp"

void setUp(void) {}

void tearDown(void) {}

void test_defaults(void) {
    FoxConfig c;
    TEST_ASSERT_EQUAL_UINT32(60, c.messageIntervalS);
    TEST_ASSERT_EQUAL_UINT32(480, c.scheduleStartMins);
    TEST_ASSERT_EQUAL_UINT32(1200, c.scheduleStopMins);
    TEST_ASSERT_EQUAL_UINT32(1000, c.modeHoldMs);
    TEST_ASSERT_EQUAL_UINT32(1000, c.settleMs);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 1.5f, c.rxDetectMinT);
}

void test_defaults_survive_clamp(void) {
    FoxConfig c;
    TEST_ASSERT_FALSE(c.clamp());
}

void test_out_of_range_values_are_clamped(void) {
    FoxConfig c;
    c.messageIntervalS = 5;
    c.powerUpHour = 30;
    c.scheduleStopMins = 2000;
    c.rxDetectMinV = 10.0f;
    c.onDemandRunMins = 0;

    TEST_ASSERT_TRUE(c.clamp());
    TEST_ASSERT_EQUAL_UINT32(FoxConfig::INTERVAL_MIN_S, c.messageIntervalS);
    TEST_ASSERT_EQUAL_UINT32(23, c.powerUpHour);
    TEST_ASSERT_EQUAL_UINT32(1439, c.scheduleStopMins);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, ADC_REF_VOLTS, c.rxDetectMinV);
    TEST_ASSERT_EQUAL_UINT32(1, c.onDemandRunMins);
}

void test_run_duration_leaves_time_outside_the_session(void) {
    FoxConfig c;
    c.onDemandRunMins = 1439;
    TEST_ASSERT_TRUE(c.clamp());
    TEST_ASSERT_EQUAL_UINT32(FoxConfig::RUN_MAX_MINS, c.onDemandRunMins);
    TEST_ASSERT_TRUE(c.onDemandRunMins < 1439);
}

void test_nan_float_falls_back_to_default(void) {
    FoxConfig c;
    c.batteryFactor = NAN;
    c.minBatteryV = NAN;
    TEST_ASSERT_TRUE(c.clamp());
    TEST_ASSERT_FLOAT_WITHIN(0.001f, FoxConfig().batteryFactor, c.batteryFactor);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, FoxConfig().minBatteryV, c.minBatteryV);
}

void test_sample_spacing_follows_detect_time(void) {
    FoxConfig c;
    c.rxDetectMinT = 2.0f;
    TEST_ASSERT_EQUAL_INT(400, c.rxSampleSpacingMs());
}

int main(int argc, char* argv[]) {
    UNITY_BEGIN();

    RUN_TEST(test_defaults);
    RUN_TEST(test_defaults_survive_clamp);
    RUN_TEST(test_out_of_range_values_are_clamped);
    RUN_TEST(test_run_duration_leaves_time_outside_the_session);
    RUN_TEST(test_nan_float_falls_back_to_default);
    RUN_TEST(test_sample_spacing_follows_detect_time);

    return UNITY_END();
}

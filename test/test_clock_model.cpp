/**
 * Test Suite: ClockModel
 *
 * Virtual time arithmetic, the one-time correction offset, and the two
 * time-of-day entry points.
 * Framework: Unity (host build)
 */

#include <unity.h>
#include "test_helpers.h"
#include "clock/ClockModel.hpp"

static FakeRig rig;

void setUp(void) {
    rig = FakeRig();
}

void tearDown(void) {}

// ============================================================================
// TIME OF DAY
// ============================================================================

void test_instant_and_pair_agree_for_every_minute(void) {
    for (int h = 0; h < 24; ++h) {
        for (int m = 0; m < 60; ++m) {
            time_t t = ClockModel::powerUpTime(h, m) + 37;   // mid-minute
            int expected = h * 60 + m;
            TEST_ASSERT_EQUAL_INT(expected, ClockModel::toTimeOfDayMinutes(h, m));
            TEST_ASSERT_EQUAL_INT(expected, ClockModel::toTimeOfDayMinutes(t));
        }
    }
}

void test_instant_on_a_later_day_decomposes_the_same(void) {
    time_t t = ClockModel::powerUpTime(0, 0) + 86400 * 400 + 17 * 3600 + 45 * 60 + 59;
    TEST_ASSERT_EQUAL_INT(17 * 60 + 45, ClockModel::toTimeOfDayMinutes(t));
}

void test_pair_wraps_at_1440(void) {
    TEST_ASSERT_EQUAL_INT(0, ClockModel::toTimeOfDayMinutes(24, 0));
    TEST_ASSERT_EQUAL_INT(1, ClockModel::toTimeOfDayMinutes(23, 61));
    TEST_ASSERT_EQUAL_INT(5, ClockModel::toTimeOfDayMinutes(0, 1445));
    TEST_ASSERT_EQUAL_INT(1439, ClockModel::toTimeOfDayMinutes(0, -1));
}

void test_seconds_within_minute(void) {
    time_t t = ClockModel::powerUpTime(8, 0);
    TEST_ASSERT_EQUAL_INT(0, ClockModel::secondsWithinMinute(t));
    TEST_ASSERT_EQUAL_INT(59, ClockModel::secondsWithinMinute(t + 59));
    TEST_ASSERT_EQUAL_INT(0, ClockModel::secondsWithinMinute(t + 60));
}

// ============================================================================
// VIRTUAL CLOCK
// ============================================================================

void test_now_is_monotonic_plus_offset(void) {
    ClockModel clock(rig.io().millis);
    rig.nowMs = 5000;
    TEST_ASSERT_FALSE(clock.isFixed());
    TEST_ASSERT_TRUE(clock.now() == 5);

    time_t working = ClockModel::powerUpTime(9, 30);
    clock.fixOffset(working);
    TEST_ASSERT_TRUE(clock.isFixed());
    TEST_ASSERT_TRUE(clock.now() == working);
    TEST_ASSERT_TRUE(clock.offset() == working - 5);

    rig.nowMs += 61000;
    TEST_ASSERT_TRUE(clock.now() == working + 61);
    TEST_ASSERT_EQUAL_INT(9 * 60 + 31, ClockModel::toTimeOfDayMinutes(clock.now()));
}

void test_sub_second_tick_truncates(void) {
    ClockModel clock(rig.io().millis);
    rig.nowMs = 5999;
    time_t working = ClockModel::powerUpTime(12, 0);
    clock.fixOffset(working);
    TEST_ASSERT_TRUE(clock.now() == working);
    rig.nowMs = 6000;
    TEST_ASSERT_TRUE(clock.now() == working + 1);
}

void test_power_up_time_is_minute_aligned(void) {
    time_t t = ClockModel::powerUpTime(7, 0);
    TEST_ASSERT_EQUAL_INT(0, ClockModel::secondsWithinMinute(t));
    TEST_ASSERT_EQUAL_INT(420, ClockModel::toTimeOfDayMinutes(t));
}

int main(int argc, char* argv[]) {
    UNITY_BEGIN();

    RUN_TEST(test_instant_and_pair_agree_for_every_minute);
    RUN_TEST(test_instant_on_a_later_day_decomposes_the_same);
    RUN_TEST(test_pair_wraps_at_1440);
    RUN_TEST(test_seconds_within_minute);
    RUN_TEST(test_now_is_monotonic_plus_offset);
    RUN_TEST(test_sub_second_tick_truncates);
    RUN_TEST(test_power_up_time_is_minute_aligned);

    return UNITY_END();
}

/**
 * Test Suite: SignalDetector
 *
 * The On-Demand request protocol: 5 samples spread over the detect time,
 * at least 4 over threshold to confirm, then release and settle.
 * Framework: Unity (host build)
 */

#include <unity.h>
#include "test_helpers.h"
#include "rx/SignalDetector.hpp"

static FakeRig rig;
static FoxConfig cfg;   // 0.5 V, 1.5 s -> 300 ms spacing, 1 s settle

static const float kCarrier = 1.2f;

void setUp(void) {
    rig = FakeRig();
    cfg = FoxConfig();
}

void tearDown(void) {}

static std::function<float(uint32_t)> carrier_between(uint32_t lo, uint32_t hi) {
    return [lo, hi](uint32_t t) { return (t >= lo && t <= hi) ? kCarrier : 0.05f; };
}

// ============================================================================
// CONFIRMING
// ============================================================================

void test_sample_spacing_from_config(void) {
    TEST_ASSERT_EQUAL_INT(300, cfg.rxSampleSpacingMs());
}

void test_carrier_held_two_seconds_confirms(void) {
    rig.rxPinVolts = carrier_between(0, 2000);
    SignalDetector det;
    det.begin(rig.io(), cfg);

    TEST_ASSERT_TRUE(det.confirm());
    TEST_ASSERT_EQUAL_INT(5, det.lastOverCount());
    TEST_ASSERT_EQUAL_UINT32(1500, rig.nowMs);
}

void test_short_spike_rejects(void) {
    // Only the first sample (at 300 ms) still sees the carrier
    rig.rxPinVolts = carrier_between(0, 300);
    SignalDetector det;
    det.begin(rig.io(), cfg);

    TEST_ASSERT_FALSE(det.confirm());
    TEST_ASSERT_EQUAL_INT(1, det.lastOverCount());
}

void test_four_of_five_confirms(void) {
    rig.rxPinVolts = carrier_between(0, 1200);
    SignalDetector det;
    det.begin(rig.io(), cfg);

    TEST_ASSERT_TRUE(det.confirm());
    TEST_ASSERT_EQUAL_INT(4, det.lastOverCount());
}

void test_three_of_five_rejects(void) {
    rig.rxPinVolts = carrier_between(0, 900);
    SignalDetector det;
    det.begin(rig.io(), cfg);

    TEST_ASSERT_FALSE(det.confirm());
    TEST_ASSERT_EQUAL_INT(3, det.lastOverCount());
}

void test_level_just_under_threshold_is_not_over(void) {
    rig.rxPinVolts = [](uint32_t) { return 0.4999f; };
    SignalDetector det;
    det.begin(rig.io(), cfg);
    TEST_ASSERT_FALSE(det.overThreshold());
}

// ============================================================================
// FULL PROTOCOL
// ============================================================================

void test_spike_then_real_request(void) {
    auto spike = carrier_between(100, 300);
    auto request = carrier_between(5000, 7000);
    rig.rxPinVolts = [spike, request](uint32_t t) {
        return (spike(t) > 1.0f || request(t) > 1.0f) ? kCarrier : 0.05f;
    };

    int rejected = 0, confirmed = 0;
    SignalDetector::Callbacks cb;
    cb.onRejected  = [&rejected](int, int) { rejected++; };
    cb.onConfirmed = [&confirmed](int over, int taken) {
        confirmed++;
        TEST_ASSERT_EQUAL_INT(5, over);
        TEST_ASSERT_EQUAL_INT(5, taken);
    };

    SignalDetector det;
    det.begin(rig.io(), cfg, cb);
    det.waitForRequest();

    TEST_ASSERT_EQUAL_INT(1, rejected);
    TEST_ASSERT_EQUAL_INT(1, confirmed);
    // Returned only after the carrier dropped and the settle delay ran
    TEST_ASSERT_TRUE(rig.nowMs >= 7000 + 1000);
    TEST_ASSERT_TRUE(rig.nowMs < 7000 + 1000 + 100);
    TEST_ASSERT_TRUE(det.state() == SignalDetector::State::Idle);
}

void test_request_waits_for_release(void) {
    // Carrier keyed for a long over; the detector must not return while it is up
    rig.rxPinVolts = carrier_between(0, 20000);
    SignalDetector det;
    det.begin(rig.io(), cfg);
    det.waitForRequest();
    TEST_ASSERT_TRUE(rig.nowMs > 20000 + 1000);
}

int main(int argc, char* argv[]) {
    UNITY_BEGIN();

    RUN_TEST(test_sample_spacing_from_config);
    RUN_TEST(test_carrier_held_two_seconds_confirms);
    RUN_TEST(test_short_spike_rejects);
    RUN_TEST(test_four_of_five_confirms);
    RUN_TEST(test_three_of_five_rejects);
    RUN_TEST(test_level_just_under_threshold_is_not_over);
    RUN_TEST(test_spike_then_real_request);
    RUN_TEST(test_request_waits_for_release);

    return UNITY_END();
}

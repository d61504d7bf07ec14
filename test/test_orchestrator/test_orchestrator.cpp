// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file test_orchestrator.cpp
 * @brief Integration tests for AdaptationOrchestrator, SessionDriver and performance ceilings
 */

#ifdef NATIVE_BUILD

#include <unity.h>
#include <cstring>
#include <thread>
#include <vector>

#include "../../src/core/AdaptationOrchestrator.h"
#include "../../src/core/ContentCategory.h"
#include "../../src/core/PerformanceCeiling.h"
#include "../../src/core/SafetyLimits.h"
#include "../../src/core/SessionDriver.h"
#include "../../src/profiles/DefaultProfiles.h"

using namespace caninesense;
using namespace caninesense::core;
using namespace caninesense::profiles;
using namespace caninesense::session;

static ProfileRegistry g_registry;

// ============================================================================
// Helper Functions
// ============================================================================

static StressMetrics makeStress(StressLevel level) {
    StressMetrics s;
    s.stressLevel = level;
    s.movementRate = 0.4f;
    return s;
}

/**
 * @brief Feedback source replaying a scripted list of samples
 */
class ScriptedFeedbackSource : public IBehaviorFeedbackSource {
public:
    void push(const StressMetrics& sample) { m_samples.push_back(sample); }

    bool poll(StressMetrics& out) override {
        if (m_next >= m_samples.size()) {
            return false;
        }
        out = m_samples[m_next++];
        return true;
    }

private:
    std::vector<StressMetrics> m_samples;
    size_t m_next = 0;
};

/**
 * @brief Sink recording every snapshot it receives
 */
class RecordingSink : public IAdaptationSink {
public:
    explicit RecordingSink(const char* name) : m_name(name) {}

    void apply(const AdaptationParameters& params) override {
        m_received.push_back(params);
    }
    const char* name() const override { return m_name; }

    const std::vector<AdaptationParameters>& received() const { return m_received; }

private:
    const char* m_name;
    std::vector<AdaptationParameters> m_received;
};

// ============================================================================
// Test: Scenarios
// ============================================================================

void test_unknown_breed_puppy_first_tick() {
    AdaptationOrchestrator orch(g_registry);
    AdaptationParameters p = orch.evaluate("Xoloitzcuintli", AgeProfile::PUPPY, makeStress(StressLevel::LOW), 0.0f);

    TEST_ASSERT_EQUAL_INT16(65, p.audioBPM);
    TEST_ASSERT_EQUAL(static_cast<int>(PhaseKind::INITIAL), static_cast<int>(p.phase));
    TEST_ASSERT_EQUAL_STRING(CONTENT_MENTAL_STIMULATION, p.contentCategory);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.0f, p.phaseProgress);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 1.0f, p.intensity);
    // Default profile: 60 * (1 - 0.3 * 0.7)
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 47.4f, p.volumeCeilingDb);
}

void test_bulldog_senior_high_stress() {
    AdaptationOrchestrator orch(g_registry);
    AdaptationParameters p = orch.evaluate("Bulldog", AgeProfile::SENIOR, makeStress(StressLevel::HIGH), 0.0f);

    TEST_ASSERT_EQUAL_INT16(50, p.audioBPM);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 39.42f, p.volumeCeilingDb);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 26.93f, p.frameRateCap);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.18f, p.visualSpeed);
    TEST_ASSERT_EQUAL_STRING(CONTENT_CALM_RELAX, p.contentCategory);
    // Side-focused breed
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 1.0f, p.spatialBias.x);

    AdaptationOrchestrator calm(g_registry);
    AdaptationParameters baseline = calm.evaluate("Bulldog", AgeProfile::ADULT, makeStress(StressLevel::LOW), 0.0f);
    TEST_ASSERT_TRUE(p.visualSpeed < baseline.visualSpeed);
    TEST_ASSERT_TRUE(p.frameRateCap < baseline.frameRateCap);
    TEST_ASSERT_TRUE(p.volumeCeilingDb < baseline.volumeCeilingDb);
    TEST_ASSERT_TRUE(p.audioBPM < baseline.audioBPM);
}

void test_session_walks_through_all_phases() {
    AdaptationOrchestrator orch(g_registry);
    StressMetrics s = makeStress(StressLevel::MODERATE);

    TEST_ASSERT_EQUAL(static_cast<int>(PhaseKind::INITIAL),
                      static_cast<int>(orch.evaluate("pug", AgeProfile::ADULT, s, 100.0f).phase));
    TEST_ASSERT_EQUAL(static_cast<int>(PhaseKind::DEEPENING),
                      static_cast<int>(orch.evaluate("pug", AgeProfile::ADULT, s, 300.0f).phase));
    TEST_ASSERT_EQUAL(static_cast<int>(PhaseKind::MAINTENANCE),
                      static_cast<int>(orch.evaluate("pug", AgeProfile::ADULT, s, 600.0f).phase));
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 1000.0f, orch.session().elapsedSeconds);
    TEST_ASSERT_EQUAL(3, orch.session().evaluationCount);
}

void test_stress_change_keeps_phase() {
    AdaptationOrchestrator orch(g_registry);
    AdaptationParameters calm = orch.evaluate("labrador", AgeProfile::ADULT, makeStress(StressLevel::LOW), 200.0f);
    AdaptationParameters stressed = orch.evaluate("labrador", AgeProfile::ADULT, makeStress(StressLevel::HIGH), 0.0f);

    TEST_ASSERT_EQUAL(static_cast<int>(calm.phase), static_cast<int>(stressed.phase));
    TEST_ASSERT_EQUAL_FLOAT(calm.phaseProgress, stressed.phaseProgress);
    TEST_ASSERT_TRUE(stressed.intensity < calm.intensity);
    TEST_ASSERT_TRUE(orch.phaseController().stressChanged());
    TEST_ASSERT_EQUAL_STRING(CONTENT_CALM_RELAX, stressed.contentCategory);
}

// ============================================================================
// Test: Determinism and Ranges
// ============================================================================

void test_copies_evolve_identically() {
    AdaptationOrchestrator a(g_registry);
    a.evaluate("border collie", AgeProfile::PUPPY, makeStress(StressLevel::MODERATE), 42.0f);

    AdaptationOrchestrator b = a;
    const StressLevel script[] = { StressLevel::HIGH, StressLevel::LOW, StressLevel::MODERATE, StressLevel::HIGH };
    for (int i = 0; i < 50; i++) {
        StressMetrics s = makeStress(script[i % 4]);
        AdaptationParameters pa = a.evaluate("border collie", AgeProfile::PUPPY, s, 17.5f);
        AdaptationParameters pb = b.evaluate("border collie", AgeProfile::PUPPY, s, 17.5f);
        TEST_ASSERT_TRUE(pa == pb);
    }
}

void test_all_combinations_within_safety_limits() {
    const char* breeds[] = { "labrador", "golden retriever", "border collie", "german shepherd",
                             "bulldog", "pug", "siberian husky", "mystery mutt" };
    const AgeProfile ages[] = { AgeProfile::PUPPY, AgeProfile::ADULT, AgeProfile::SENIOR };
    const StressLevel levels[] = { StressLevel::LOW, StressLevel::MODERATE, StressLevel::HIGH };
    const float deltas[] = { 0.0f, 1.0f, 250.0f, 700.0f, 5000.0f };

    for (const char* breed : breeds) {
        for (AgeProfile age : ages) {
            for (StressLevel level : levels) {
                AdaptationOrchestrator orch(g_registry);
                for (float delta : deltas) {
                    StressMetrics s = makeStress(level);
                    s.movementRate = 1.0f;
                    AdaptationParameters p = orch.evaluate(breed, age, s, delta);
                    RangeCheckResult check = validateAdaptationParameters(p);
                    TEST_ASSERT_TRUE_MESSAGE(check.ok, check.field);
                    TEST_ASSERT_TRUE(p.volumeCeilingDb <= MAX_VOLUME_DB);
                }
            }
        }
    }
}

void test_clamp_repairs_out_of_range_snapshot() {
    AdaptationParameters p;
    p.volumeCeilingDb = 90.0f;
    p.frameRateCap = 500.0f;
    p.motionDamping = 0.0f;
    p.audioBPM = 300;
    p.frequencyBands[3].gainDb = 20.0f;
    p.dichromatic.redWeight = 0.8f;
    p.dichromatic.greenWeight = 0.8f;

    TEST_ASSERT_FALSE(validateAdaptationParameters(p).ok);
    AdaptationParameters c = clampAdaptationParameters(p);
    TEST_ASSERT_TRUE(validateAdaptationParameters(c).ok);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, MAX_VOLUME_DB, c.volumeCeilingDb);
    TEST_ASSERT_EQUAL_INT16(MAX_BPM, c.audioBPM);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, MAX_BAND_GAIN_DB, c.frequencyBands[3].gainDb);
}

// ============================================================================
// Test: History and Reset
// ============================================================================

void test_history_bounded_and_evicts_oldest() {
    AdaptationOrchestrator orch(g_registry);
    for (int i = 1; i <= 40; i++) {
        orch.evaluate("labrador", AgeProfile::ADULT, makeStress(StressLevel::LOW), 1.0f);
    }

    const SessionState& state = orch.session();
    TEST_ASSERT_EQUAL(HISTORY_CAPACITY, state.history.size());
    TEST_ASSERT_TRUE(state.history.isFull());
    TEST_ASSERT_EQUAL(40, state.evaluationCount);

    // Evaluations 1-8 were evicted
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 9.0f / 300.0f, state.history.at(0).phaseProgress);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 40.0f / 300.0f, state.history.newest().phaseProgress);
    TEST_ASSERT_TRUE(state.history.newest() == orch.current());
}

void test_reset_starts_new_session() {
    AdaptationOrchestrator orch(g_registry);
    StressMetrics s = makeStress(StressLevel::HIGH);
    s.hasSubjectLocation = true;
    s.subjectLocation.x = 3.0f;
    orch.evaluate("german shepherd", AgeProfile::ADULT, s, 1200.0f);

    orch.reset();
    const SessionState& state = orch.session();
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.0f, state.elapsedSeconds);
    TEST_ASSERT_EQUAL(0, state.evaluationCount);
    TEST_ASSERT_TRUE(state.history.isEmpty());
    TEST_ASSERT_FALSE(state.hasSubjectLocation);
    TEST_ASSERT_EQUAL(static_cast<int>(PhaseKind::INITIAL), static_cast<int>(state.currentPhase.kind()));
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.0f, orch.current().volumeCeilingDb);

    AdaptationParameters p = orch.evaluate("german shepherd", AgeProfile::ADULT, makeStress(StressLevel::LOW), 0.0f);
    TEST_ASSERT_EQUAL(static_cast<int>(PhaseKind::INITIAL), static_cast<int>(p.phase));
}

void test_adaptive_breed_keeps_last_location() {
    AdaptationOrchestrator orch(g_registry);
    AdaptationParameters p = orch.evaluate("border collie", AgeProfile::ADULT, makeStress(StressLevel::LOW), 1.0f);
    TEST_ASSERT_TRUE(p.spatialBias == Vec3());

    StressMetrics located = makeStress(StressLevel::LOW);
    located.hasSubjectLocation = true;
    located.subjectLocation.x = -2.0f;
    located.subjectLocation.z = 1.5f;
    p = orch.evaluate("border collie", AgeProfile::ADULT, located, 1.0f);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, -2.0f, p.spatialBias.x);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 1.5f, p.spatialBias.z);

    p = orch.evaluate("border collie", AgeProfile::ADULT, makeStress(StressLevel::LOW), 1.0f);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, -2.0f, p.spatialBias.x);
}

void test_custom_tuning_shortens_phases() {
    config::EngineTuning tuning;
    tuning.phaseDurations.initialSec = 10.0f;
    tuning.phaseDurations.deepeningSec = 10.0f;
    tuning.phaseDurations.maintenanceSec = 10.0f;

    AdaptationOrchestrator orch(g_registry, tuning);
    AdaptationParameters p = orch.evaluate("pug", AgeProfile::ADULT, makeStress(StressLevel::LOW), 15.0f);
    TEST_ASSERT_EQUAL(static_cast<int>(PhaseKind::DEEPENING), static_cast<int>(p.phase));
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.5f, p.phaseProgress);
}

void test_merge_copies_both_subsets() {
    AudioParameters audio;
    audio.audioBPM = 42;
    audio.volumeCeilingDb = 33.0f;
    audio.toneCount = 1;
    audio.toneGenerators[0].frequencyHz = 440.0f;
    VisualParameters visual;
    visual.visualSpeed = 0.7f;
    visual.frameRateCap = 24.0f;

    AdaptationParameters p = AdaptationOrchestrator::merge(audio, visual);
    TEST_ASSERT_EQUAL_INT16(42, p.audioBPM);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 33.0f, p.volumeCeilingDb);
    TEST_ASSERT_EQUAL_UINT8(1, p.toneCount);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 440.0f, p.toneGenerators[0].frequencyHz);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.7f, p.visualSpeed);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 24.0f, p.frameRateCap);
}

// ============================================================================
// Test: Shared Registry Across Threads
// ============================================================================

static const char* const THREAD_BREEDS[] = { "labrador", "Pug", "border collie", "unknown mutt" };
static const AgeProfile THREAD_AGES[] = { AgeProfile::PUPPY, AgeProfile::ADULT, AgeProfile::SENIOR, AgeProfile::ADULT };
static constexpr int THREAD_COUNT = 4;
static constexpr int THREAD_STEPS = 400;

static AdaptationParameters runScriptedSession(const ProfileRegistry& registry, int idx) {
    AdaptationOrchestrator orch(registry);
    AdaptationParameters last;
    for (int step = 0; step < THREAD_STEPS; step++) {
        StressLevel level = static_cast<StressLevel>((step / 50 + idx) % 3);
        last = orch.evaluate(THREAD_BREEDS[idx], THREAD_AGES[idx], makeStress(level), 3.0f);
        // Concurrent read-only queries on the same registry
        if (registry.lookup(THREAD_BREEDS[idx]).name.empty()) {
            return AdaptationParameters();
        }
    }
    return last;
}

void test_concurrent_sessions_share_registry() {
    AdaptationParameters expected[THREAD_COUNT];
    for (int i = 0; i < THREAD_COUNT; i++) {
        expected[i] = runScriptedSession(g_registry, i);
    }

    AdaptationParameters actual[THREAD_COUNT];
    std::vector<std::thread> workers;
    const ProfileRegistry& shared = g_registry;
    for (int i = 0; i < THREAD_COUNT; i++) {
        workers.emplace_back([&shared, &actual, i]() {
            actual[i] = runScriptedSession(shared, i);
        });
    }
    for (std::thread& t : workers) {
        t.join();
    }

    for (int i = 0; i < THREAD_COUNT; i++) {
        TEST_ASSERT_TRUE_MESSAGE(actual[i] == expected[i], THREAD_BREEDS[i]);
        TEST_ASSERT_EQUAL(static_cast<int>(PhaseKind::MAINTENANCE), static_cast<int>(actual[i].phase));
    }
    // Unknown breed resolved to the default profile in its own thread
    TEST_ASSERT_EQUAL_STRING("default", g_registry.lookup(THREAD_BREEDS[3]).name.c_str());
}

// ============================================================================
// Test: Session Driver
// ============================================================================

void test_driver_publishes_to_every_sink() {
    AdaptationOrchestrator orch(g_registry);
    ScriptedFeedbackSource source;
    source.push(makeStress(StressLevel::HIGH));

    SessionDriver driver(orch, &source);
    driver.setSubject("Pug", AgeProfile::SENIOR);

    RecordingSink audioSink("audio");
    RecordingSink videoSink("video");
    TEST_ASSERT_TRUE(driver.addSink(&audioSink));
    TEST_ASSERT_TRUE(driver.addSink(&videoSink));

    AdaptationParameters p = driver.tick(2.0f);
    TEST_ASSERT_EQUAL(1, audioSink.received().size());
    TEST_ASSERT_EQUAL(1, videoSink.received().size());
    TEST_ASSERT_TRUE(audioSink.received()[0] == p);
    TEST_ASSERT_TRUE(videoSink.received()[0] == p);
    TEST_ASSERT_EQUAL(static_cast<int>(StressLevel::HIGH), static_cast<int>(p.stressLevel));
    TEST_ASSERT_TRUE(driver.lastSampleFresh());
}

void test_driver_reuses_last_sample_when_stale() {
    AdaptationOrchestrator orch(g_registry);
    ScriptedFeedbackSource source;
    StressMetrics located = makeStress(StressLevel::LOW);
    located.hasSubjectLocation = true;
    located.subjectLocation.y = 1.0f;
    source.push(located);

    SessionDriver driver(orch, &source);
    driver.tick(1.0f);
    AdaptationParameters p = driver.tick(1.0f);

    TEST_ASSERT_FALSE(driver.lastSampleFresh());
    TEST_ASSERT_EQUAL(1, driver.staleTicks());
    TEST_ASSERT_EQUAL(static_cast<int>(StressLevel::LOW), static_cast<int>(p.stressLevel));
    TEST_ASSERT_FALSE(driver.lastMetrics().hasSubjectLocation);
}

void test_driver_without_source_assumes_moderate() {
    AdaptationOrchestrator orch(g_registry);
    SessionDriver driver(orch, nullptr);
    AdaptationParameters p = driver.tick(1.0f);

    TEST_ASSERT_EQUAL_STRING("default", driver.breedName().c_str());
    TEST_ASSERT_EQUAL(static_cast<int>(StressLevel::MODERATE), static_cast<int>(p.stressLevel));
}

void test_driver_sink_registration() {
    AdaptationOrchestrator orch(g_registry);
    SessionDriver driver(orch, nullptr);
    RecordingSink sinks[5] = { RecordingSink("a"), RecordingSink("b"), RecordingSink("c"),
                               RecordingSink("d"), RecordingSink("e") };

    TEST_ASSERT_FALSE(driver.addSink(nullptr));
    for (int i = 0; i < 4; i++) {
        TEST_ASSERT_TRUE(driver.addSink(&sinks[i]));
    }
    TEST_ASSERT_FALSE(driver.addSink(&sinks[0]));
    TEST_ASSERT_FALSE(driver.addSink(&sinks[4]));
    TEST_ASSERT_EQUAL_UINT8(SessionDriver::MAX_SINKS, driver.sinkCount());

    TEST_ASSERT_TRUE(driver.removeSink(&sinks[1]));
    TEST_ASSERT_FALSE(driver.removeSink(&sinks[1]));
    TEST_ASSERT_EQUAL_UINT8(3, driver.sinkCount());

    driver.tick(1.0f);
    TEST_ASSERT_EQUAL(1, sinks[0].received().size());
    TEST_ASSERT_EQUAL(0, sinks[1].received().size());
    TEST_ASSERT_EQUAL(1, sinks[3].received().size());
}

void test_driver_reset() {
    AdaptationOrchestrator orch(g_registry);
    SessionDriver driver(orch, nullptr);
    driver.tick(500.0f);
    driver.reset();
    TEST_ASSERT_EQUAL(0, orch.session().evaluationCount);
    TEST_ASSERT_EQUAL(0, driver.staleTicks());
}

// ============================================================================
// Test: Performance Ceiling
// ============================================================================

void test_performance_ceiling_only_lowers() {
    AdaptationParameters p;
    p.frameRateCap = 100.0f;

    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 100.0f, applyPerformanceCeiling(p, ThermalTier::NOMINAL).frameRateCap);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 90.0f, applyPerformanceCeiling(p, ThermalTier::FAIR).frameRateCap);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 30.0f, applyPerformanceCeiling(p, ThermalTier::CRITICAL).frameRateCap);

    p.frameRateCap = 20.0f;
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 20.0f, applyPerformanceCeiling(p, ThermalTier::SERIOUS).frameRateCap);
}

void test_thermal_tier_names() {
    ThermalTier tier = ThermalTier::NOMINAL;
    TEST_ASSERT_TRUE(parseThermalTier("serious", tier));
    TEST_ASSERT_EQUAL(static_cast<int>(ThermalTier::SERIOUS), static_cast<int>(tier));
    TEST_ASSERT_FALSE(parseThermalTier("melting", tier));
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 0.3f, limitsFor(ThermalTier::CRITICAL).shaderComplexity);
}

// ============================================================================
// Test Runner
// ============================================================================

void setUp(void) {
    g_registry = ProfileRegistry();
    TEST_ASSERT_EQUAL(static_cast<int>(RegistryResult::OK), static_cast<int>(buildBuiltInRegistry(g_registry)));
}

void tearDown(void) {
}

int main() {
    UNITY_BEGIN();

    // Scenarios
    RUN_TEST(test_unknown_breed_puppy_first_tick);
    RUN_TEST(test_bulldog_senior_high_stress);
    RUN_TEST(test_session_walks_through_all_phases);
    RUN_TEST(test_stress_change_keeps_phase);

    // Determinism and ranges
    RUN_TEST(test_copies_evolve_identically);
    RUN_TEST(test_all_combinations_within_safety_limits);
    RUN_TEST(test_clamp_repairs_out_of_range_snapshot);

    // History and reset
    RUN_TEST(test_history_bounded_and_evicts_oldest);
    RUN_TEST(test_reset_starts_new_session);
    RUN_TEST(test_adaptive_breed_keeps_last_location);
    RUN_TEST(test_custom_tuning_shortens_phases);
    RUN_TEST(test_merge_copies_both_subsets);

    // Session driver
    RUN_TEST(test_concurrent_sessions_share_registry);

    RUN_TEST(test_driver_publishes_to_every_sink);
    RUN_TEST(test_driver_reuses_last_sample_when_stale);
    RUN_TEST(test_driver_without_source_assumes_moderate);
    RUN_TEST(test_driver_sink_registration);
    RUN_TEST(test_driver_reset);

    // Performance ceiling
    RUN_TEST(test_performance_ceiling_only_lowers);
    RUN_TEST(test_thermal_tier_names);

    UNITY_END();
    return 0;
}

#endif // NATIVE_BUILD

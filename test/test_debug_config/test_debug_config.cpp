// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file test_debug_config.cpp
 * @brief Unit tests for per-domain log level configuration
 */

#ifdef NATIVE_BUILD

#include <unity.h>
#include <cstdio>
#include <cstring>

#include "../../src/config/DebugConfig.h"
#include "../../src/utils/Log.h"

using namespace caninesense::config;

// ============================================================================
// Test: Effective Levels
// ============================================================================

void test_defaults_use_global_warn() {
    DebugConfig& cfg = getDebugConfig();
    TEST_ASSERT_EQUAL(static_cast<uint8_t>(DebugLevel::WARN), cfg.globalLevel);
    TEST_ASSERT_TRUE(cfg.shouldLog(DebugDomain::AUDIO, DebugLevel::ERROR));
    TEST_ASSERT_TRUE(cfg.shouldLog(DebugDomain::AUDIO, DebugLevel::WARN));
    TEST_ASSERT_FALSE(cfg.shouldLog(DebugDomain::AUDIO, DebugLevel::INFO));
    TEST_ASSERT_EQUAL(-1, cfg.getDomainLevel(DebugDomain::SESSION));
}

void test_domain_override_beats_global() {
    DebugConfig& cfg = getDebugConfig();
    cfg.setDomainLevel(DebugDomain::SESSION, static_cast<int8_t>(DebugLevel::TRACE));
    cfg.setDomainLevel(DebugDomain::VISION, static_cast<int8_t>(DebugLevel::OFF));

    TEST_ASSERT_TRUE(cfg.shouldLog(DebugDomain::SESSION, DebugLevel::TRACE));
    TEST_ASSERT_FALSE(cfg.shouldLog(DebugDomain::VISION, DebugLevel::ERROR));
    TEST_ASSERT_FALSE(cfg.shouldLog(DebugDomain::PROFILE, DebugLevel::INFO));

    cfg.clearOverrides();
    TEST_ASSERT_FALSE(cfg.shouldLog(DebugDomain::SESSION, DebugLevel::INFO));
    TEST_ASSERT_TRUE(cfg.shouldLog(DebugDomain::VISION, DebugLevel::ERROR));
}

void test_reset_restores_defaults() {
    DebugConfig& cfg = getDebugConfig();
    cfg.globalLevel = static_cast<uint8_t>(DebugLevel::OFF);
    cfg.setDomainLevel(DebugDomain::PROFILE, static_cast<int8_t>(DebugLevel::INFO));

    resetDebugConfig();
    TEST_ASSERT_EQUAL(static_cast<uint8_t>(DebugLevel::WARN), getDebugConfig().globalLevel);
    TEST_ASSERT_EQUAL(-1, getDebugConfig().getDomainLevel(DebugDomain::PROFILE));
}

// ============================================================================
// Test: Names and Parsing
// ============================================================================

void test_names() {
    TEST_ASSERT_EQUAL_STRING("VISION", DebugConfig::domainName(DebugDomain::VISION));
    TEST_ASSERT_EQUAL_STRING("VERBOSE", DebugConfig::levelName(DebugLevel::VERBOSE));
    TEST_ASSERT_EQUAL_STRING("INVALID", DebugConfig::levelName(static_cast<uint8_t>(9)));
}

void test_parse_domain() {
    DebugDomain domain = DebugDomain::SYSTEM;
    TEST_ASSERT_TRUE(DebugConfig::parseDomain("audio", domain));
    TEST_ASSERT_EQUAL(static_cast<int>(DebugDomain::AUDIO), static_cast<int>(domain));
    TEST_ASSERT_TRUE(DebugConfig::parseDomain("Profile", domain));
    TEST_ASSERT_EQUAL(static_cast<int>(DebugDomain::PROFILE), static_cast<int>(domain));
    TEST_ASSERT_FALSE(DebugConfig::parseDomain("network", domain));
    TEST_ASSERT_FALSE(DebugConfig::parseDomain(nullptr, domain));
}

void test_parse_level() {
    DebugLevel level = DebugLevel::OFF;
    TEST_ASSERT_TRUE(DebugConfig::parseLevel("warn", level));
    TEST_ASSERT_EQUAL(static_cast<int>(DebugLevel::WARN), static_cast<int>(level));
    TEST_ASSERT_TRUE(DebugConfig::parseLevel("5", level));
    TEST_ASSERT_EQUAL(static_cast<int>(DebugLevel::TRACE), static_cast<int>(level));
    TEST_ASSERT_FALSE(DebugConfig::parseLevel("6", level));
    TEST_ASSERT_FALSE(DebugConfig::parseLevel("loud", level));
    TEST_ASSERT_FALSE(DebugConfig::parseLevel("", level));
}

// ============================================================================
// Test: Printing
// ============================================================================

static size_t readAll(FILE* f, char* buf, size_t cap) {
    rewind(f);
    size_t n = fread(buf, 1, cap - 1, f);
    buf[n] = '\0';
    return n;
}

void test_print_lists_effective_levels() {
    FILE* capture = tmpfile();
    TEST_ASSERT_NOT_NULL(capture);
    caninesense::utils::setLogStream(capture);

    getDebugConfig().setDomainLevel(DebugDomain::AUDIO, static_cast<int8_t>(DebugLevel::TRACE));
    printDebugConfig();
    caninesense::utils::setLogStream(nullptr);

    char buf[512];
    TEST_ASSERT_TRUE(readAll(capture, buf, sizeof(buf)) > 0);
    fclose(capture);

    TEST_ASSERT_NOT_NULL(strstr(buf, "global   WARN"));
    TEST_ASSERT_NOT_NULL(strstr(buf, "audio    TRACE (override)"));
    TEST_ASSERT_NOT_NULL(strstr(buf, "vision   WARN\n"));
    TEST_ASSERT_TRUE(caninesense::utils::logStream() == stdout);
}

void test_domain_log_respects_runtime_level() {
    FILE* capture = tmpfile();
    TEST_ASSERT_NOT_NULL(capture);
    caninesense::utils::setLogStream(capture);

    CS_SESSION_LOGI("hidden at WARN");
    getDebugConfig().setDomainLevel(DebugDomain::SESSION, static_cast<int8_t>(DebugLevel::INFO));
    CS_SESSION_LOGI("phase %s", "deepening");
    caninesense::utils::setLogStream(nullptr);

    char buf[512];
    TEST_ASSERT_TRUE(readAll(capture, buf, sizeof(buf)) > 0);
    fclose(capture);

    TEST_ASSERT_NULL(strstr(buf, "hidden"));
    TEST_ASSERT_NOT_NULL(strstr(buf, "phase deepening"));
    TEST_ASSERT_NOT_NULL(strstr(buf, "[INFO]"));
}

// ============================================================================
// Test Runner
// ============================================================================

void setUp(void) {
    resetDebugConfig();
}

void tearDown(void) {
}

int main() {
    UNITY_BEGIN();

    RUN_TEST(test_defaults_use_global_warn);
    RUN_TEST(test_domain_override_beats_global);
    RUN_TEST(test_reset_restores_defaults);
    RUN_TEST(test_names);
    RUN_TEST(test_parse_domain);
    RUN_TEST(test_parse_level);
    RUN_TEST(test_print_lists_effective_levels);
    RUN_TEST(test_domain_log_respects_runtime_level);

    UNITY_END();
    return 0;
}

#endif // NATIVE_BUILD

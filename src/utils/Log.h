// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Log.h
 * @brief Tagged printf logging for the engine
 *
 * Each .cpp defines CS_LOG_TAG before including this header. Lines look like
 *   [812][WARN][Registry] No profile for 'corgi', using default
 *
 * CS_LOGx is filtered at compile time by CS_LOG_LEVEL. The CS_<DOMAIN>_LOGx
 * family is filtered at runtime by config::DebugConfig.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>

#define CS_ANSI_RESET      "\033[0m"

#define CS_CLR_ERROR       "\033[1;31m"
#define CS_CLR_WARN        "\033[1;35m"
#define CS_CLR_INFO        "\033[1;32m"
#define CS_CLR_DEBUG       "\033[0;37m"
#define CS_CLR_VERBOSE     CS_CLR_DEBUG
#define CS_CLR_TRACE       CS_CLR_DEBUG

// 0 none, 1 error, 2 warn, 3 info, 4 debug
#ifndef CS_LOG_LEVEL
    #ifdef NDEBUG
        #define CS_LOG_LEVEL 2
    #else
        #define CS_LOG_LEVEL 3
    #endif
#endif

#define CS_LOG_LEVEL_NONE  0
#define CS_LOG_LEVEL_ERROR 1
#define CS_LOG_LEVEL_WARN  2
#define CS_LOG_LEVEL_INFO  3
#define CS_LOG_LEVEL_DEBUG 4

namespace caninesense {
namespace utils {

inline FILE*& logStreamSlot() {
    static FILE* stream = stdout;
    return stream;
}

/// Destination for every log line and config dump; nullptr restores stdout.
inline void setLogStream(FILE* stream) {
    logStreamSlot() = (stream != nullptr) ? stream : stdout;
}

inline FILE* logStream() {
    return logStreamSlot();
}

inline uint32_t logMillis() {
    static const auto start = std::chrono::steady_clock::now();
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

} // namespace utils
} // namespace caninesense

#define CS_LOG_MILLIS()    caninesense::utils::logMillis()
#define CS_LOG_PRINTF(...) fprintf(caninesense::utils::logStream(), __VA_ARGS__)

#ifndef CS_LOG_TAG
    #define CS_LOG_TAG "CS"
#endif

#define CS_LOG_FORMAT(level_str, level_color, fmt) \
    "[%lu]" level_color "[" level_str "]" CS_ANSI_RESET "[" CS_LOG_TAG "] " fmt "\n"

#if CS_LOG_LEVEL >= CS_LOG_LEVEL_ERROR
    #define CS_LOGE(fmt, ...) \
        CS_LOG_PRINTF(CS_LOG_FORMAT("ERROR", CS_CLR_ERROR, fmt), \
                      (unsigned long)CS_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define CS_LOGE(fmt, ...) ((void)0)
#endif

#if CS_LOG_LEVEL >= CS_LOG_LEVEL_WARN
    #define CS_LOGW(fmt, ...) \
        CS_LOG_PRINTF(CS_LOG_FORMAT("WARN", CS_CLR_WARN, fmt), \
                      (unsigned long)CS_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define CS_LOGW(fmt, ...) ((void)0)
#endif

#if CS_LOG_LEVEL >= CS_LOG_LEVEL_INFO
    #define CS_LOGI(fmt, ...) \
        CS_LOG_PRINTF(CS_LOG_FORMAT("INFO", CS_CLR_INFO, fmt), \
                      (unsigned long)CS_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define CS_LOGI(fmt, ...) ((void)0)
#endif

#if CS_LOG_LEVEL >= CS_LOG_LEVEL_DEBUG
    #define CS_LOGD(fmt, ...) \
        CS_LOG_PRINTF(CS_LOG_FORMAT("DEBUG", CS_CLR_DEBUG, fmt), \
                      (unsigned long)CS_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define CS_LOGD(fmt, ...) ((void)0)
#endif

// Runtime-gated per domain. D maps to DebugLevel::VERBOSE.

#include "../config/DebugConfig.h"

#define CS_DOMAIN_LOG(domain, level, fmt, ...) \
    do { \
        if (caninesense::config::getDebugConfig().shouldLog( \
                caninesense::config::DebugDomain::domain, \
                caninesense::config::DebugLevel::level)) { \
            CS_LOG_PRINTF(CS_LOG_FORMAT(#level, CS_CLR_##level, fmt), \
                          (unsigned long)CS_LOG_MILLIS(), ##__VA_ARGS__); \
        } \
    } while(0)

// Profile domain: registry build, lookups, configuration decoding
#define CS_PROFILE_LOGE(fmt, ...) CS_DOMAIN_LOG(PROFILE, ERROR, fmt, ##__VA_ARGS__)
#define CS_PROFILE_LOGW(fmt, ...) CS_DOMAIN_LOG(PROFILE, WARN, fmt, ##__VA_ARGS__)
#define CS_PROFILE_LOGI(fmt, ...) CS_DOMAIN_LOG(PROFILE, INFO, fmt, ##__VA_ARGS__)
#define CS_PROFILE_LOGD(fmt, ...) CS_DOMAIN_LOG(PROFILE, VERBOSE, fmt, ##__VA_ARGS__)
#define CS_PROFILE_LOGT(fmt, ...) CS_DOMAIN_LOG(PROFILE, TRACE, fmt, ##__VA_ARGS__)

// Session domain: phase transitions, stress changes, evaluation
#define CS_SESSION_LOGE(fmt, ...) CS_DOMAIN_LOG(SESSION, ERROR, fmt, ##__VA_ARGS__)
#define CS_SESSION_LOGW(fmt, ...) CS_DOMAIN_LOG(SESSION, WARN, fmt, ##__VA_ARGS__)
#define CS_SESSION_LOGI(fmt, ...) CS_DOMAIN_LOG(SESSION, INFO, fmt, ##__VA_ARGS__)
#define CS_SESSION_LOGD(fmt, ...) CS_DOMAIN_LOG(SESSION, VERBOSE, fmt, ##__VA_ARGS__)
#define CS_SESSION_LOGT(fmt, ...) CS_DOMAIN_LOG(SESSION, TRACE, fmt, ##__VA_ARGS__)

// Audio domain: band shaping, tone generators, volume ceiling
#define CS_AUDIO_LOGE(fmt, ...) CS_DOMAIN_LOG(AUDIO, ERROR, fmt, ##__VA_ARGS__)
#define CS_AUDIO_LOGW(fmt, ...) CS_DOMAIN_LOG(AUDIO, WARN, fmt, ##__VA_ARGS__)
#define CS_AUDIO_LOGI(fmt, ...) CS_DOMAIN_LOG(AUDIO, INFO, fmt, ##__VA_ARGS__)
#define CS_AUDIO_LOGD(fmt, ...) CS_DOMAIN_LOG(AUDIO, VERBOSE, fmt, ##__VA_ARGS__)
#define CS_AUDIO_LOGT(fmt, ...) CS_DOMAIN_LOG(AUDIO, TRACE, fmt, ##__VA_ARGS__)

// Vision domain: dichromatic weights, contrast, motion damping, frame rate
#define CS_VISION_LOGE(fmt, ...) CS_DOMAIN_LOG(VISION, ERROR, fmt, ##__VA_ARGS__)
#define CS_VISION_LOGW(fmt, ...) CS_DOMAIN_LOG(VISION, WARN, fmt, ##__VA_ARGS__)
#define CS_VISION_LOGI(fmt, ...) CS_DOMAIN_LOG(VISION, INFO, fmt, ##__VA_ARGS__)
#define CS_VISION_LOGD(fmt, ...) CS_DOMAIN_LOG(VISION, VERBOSE, fmt, ##__VA_ARGS__)
#define CS_VISION_LOGT(fmt, ...) CS_DOMAIN_LOG(VISION, TRACE, fmt, ##__VA_ARGS__)

// System domain: sinks, feedback sources, governor, general diagnostics
#define CS_SYS_LOGE(fmt, ...) CS_DOMAIN_LOG(SYSTEM, ERROR, fmt, ##__VA_ARGS__)
#define CS_SYS_LOGW(fmt, ...) CS_DOMAIN_LOG(SYSTEM, WARN, fmt, ##__VA_ARGS__)
#define CS_SYS_LOGI(fmt, ...) CS_DOMAIN_LOG(SYSTEM, INFO, fmt, ##__VA_ARGS__)
#define CS_SYS_LOGD(fmt, ...) CS_DOMAIN_LOG(SYSTEM, VERBOSE, fmt, ##__VA_ARGS__)
#define CS_SYS_LOGT(fmt, ...) CS_DOMAIN_LOG(SYSTEM, TRACE, fmt, ##__VA_ARGS__)

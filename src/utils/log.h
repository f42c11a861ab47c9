/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace espnvs::log {
void set_debug(bool enabled);
bool debug_enabled();

void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);
void debug(const char* fmt, ...);
}  // namespace espnvs::log

#define ESPNVS_LOG_INFO(fmt, ...) ::espnvs::log::info(fmt, ##__VA_ARGS__)
#define ESPNVS_LOG_WARN(fmt, ...) ::espnvs::log::warn(fmt, ##__VA_ARGS__)
#define ESPNVS_LOG_ERROR(fmt, ...) ::espnvs::log::error(fmt, ##__VA_ARGS__)
#define ESPNVS_LOG_DEBUG(fmt, ...)                  \
    do {                                            \
        if (::espnvs::log::debug_enabled()) {       \
            ::espnvs::log::debug(fmt, ##__VA_ARGS__); \
        }                                           \
    } while (0)

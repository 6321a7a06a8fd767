/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include <cstdarg>

namespace sjson::log {
void info(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace sjson::log

#define SJSON_LOG_INFO(fmt, ...) ::sjson::log::info(fmt, ##__VA_ARGS__)
#define SJSON_LOG_ERROR(fmt, ...) ::sjson::log::error(fmt, ##__VA_ARGS__)

/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "log.h"
#include <cstdio>

namespace {
void write_line(FILE* f, const char* prefix, const char* fmt, va_list args) {
    std::fputs(prefix, f);
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}
}  // namespace

namespace sjson::log {
void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stdout, "", fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "[ERROR] ", fmt, args);
    va_end(args);
}
}  // namespace sjson::log

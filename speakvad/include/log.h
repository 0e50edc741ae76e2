#pragma once

#include "ggml.h"

#include <cstdio>

namespace speakvad {

enum log_level {
    LOG_LEVEL_DEBUG = 0,
    LOG_LEVEL_INFO  = 1,
    LOG_LEVEL_WARN  = 2,
    LOG_LEVEL_ERROR = 3,
    LOG_LEVEL_NONE  = 4,
};

// Logging sink shared by one session. Passed explicitly to every component
// that prints; nullptr means "stderr at LOG_LEVEL_INFO".
struct LogContext {
    log_level min_level = LOG_LEVEL_INFO;
    FILE* sink = nullptr;  // nullptr = stderr
};

bool log_enabled(const LogContext* ctx, log_level level);

void log_printf(const LogContext* ctx, log_level level, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

// Silence whisper.cpp / ggml console output for the whole process.
void log_silence_backend();

// Send whisper.cpp / ggml output through ctx for the whole process. Backend
// errors and warnings keep their level, everything else is debug. ctx must
// outlive any later backend call.
void log_route_backend(const LogContext* ctx);

// One backend message at its ggml level. Trailing newlines are dropped.
void log_backend_message(const LogContext* ctx, enum ggml_log_level level, const char* text);

}  // namespace speakvad

#define SPEAKVAD_LOG_DEBUG(ctx, ...) ::speakvad::log_printf((ctx), ::speakvad::LOG_LEVEL_DEBUG, __VA_ARGS__)
#define SPEAKVAD_LOG_INFO(ctx, ...)  ::speakvad::log_printf((ctx), ::speakvad::LOG_LEVEL_INFO, __VA_ARGS__)
#define SPEAKVAD_LOG_WARN(ctx, ...)  ::speakvad::log_printf((ctx), ::speakvad::LOG_LEVEL_WARN, __VA_ARGS__)
#define SPEAKVAD_LOG_ERROR(ctx, ...) ::speakvad::log_printf((ctx), ::speakvad::LOG_LEVEL_ERROR, __VA_ARGS__)

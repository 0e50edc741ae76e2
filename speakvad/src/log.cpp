#include "log.h"

#include "whisper.h"

#include <cstdarg>
#include <cstring>

namespace speakvad {

static const char* level_prefix(log_level level) {
    switch (level) {
        case LOG_LEVEL_DEBUG: return "DEBUG: ";
        case LOG_LEVEL_INFO:  return "";
        case LOG_LEVEL_WARN:  return "WARNING: ";
        case LOG_LEVEL_ERROR: return "ERROR: ";
        default:              return "";
    }
}

bool log_enabled(const LogContext* ctx, log_level level) {
    const log_level min_level = ctx ? ctx->min_level : LOG_LEVEL_INFO;
    return level >= min_level && level < LOG_LEVEL_NONE;
}

void log_printf(const LogContext* ctx, log_level level, const char* fmt, ...) {
    if (!log_enabled(ctx, level)) {
        return;
    }

    FILE* out = (ctx && ctx->sink) ? ctx->sink : stderr;

    fputs(level_prefix(level), out);
    va_list args;
    va_start(args, fmt);
    vfprintf(out, fmt, args);
    va_end(args);
    fputc('\n', out);
}

void log_silence_backend() {
    whisper_log_set([](enum ggml_log_level, const char*, void*){}, nullptr);
}

void log_backend_message(const LogContext* ctx, enum ggml_log_level level, const char* text) {
    if (!text) return;

    log_level mapped = LOG_LEVEL_DEBUG;
    if (level == GGML_LOG_LEVEL_ERROR) {
        mapped = LOG_LEVEL_ERROR;
    } else if (level == GGML_LOG_LEVEL_WARN) {
        mapped = LOG_LEVEL_WARN;
    }

    size_t len = strlen(text);
    while (len > 0 && (text[len - 1] == '\n' || text[len - 1] == '\r')) {
        len--;
    }
    if (len == 0) return;

    log_printf(ctx, mapped, "%.*s", static_cast<int>(len), text);
}

void log_route_backend(const LogContext* ctx) {
    whisper_log_set([](enum ggml_log_level level, const char* text, void* user_data) {
        log_backend_message(static_cast<const LogContext*>(user_data), level, text);
    }, const_cast<LogContext*>(ctx));
}

}  // namespace speakvad

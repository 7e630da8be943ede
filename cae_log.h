#pragma once

// Levelled stderr logging for the cae toolchain.

typedef enum cae_log_level_e {
  CAE_LOG_ERROR = 0,
  CAE_LOG_WARN  = 1,
  CAE_LOG_INFO  = 2,
  CAE_LOG_DEBUG = 3
} cae_log_level_t;

void cae_set_log_level(cae_log_level_t lvl);

// Parses "error" | "warn" | "info" | "debug". Returns 0 on unknown input.
int cae_parse_log_level(const char* s, cae_log_level_t* out);

#if defined(__GNUC__) || defined(__clang__)
void cae_log_ex(cae_log_level_t lvl, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
#else
void cae_log_ex(cae_log_level_t lvl, const char* fmt, ...);
#endif

#include "cae_log.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

static cae_log_level_t g_cae_log_level = CAE_LOG_WARN;

void cae_set_log_level(cae_log_level_t lvl) { g_cae_log_level = lvl; }

int cae_parse_log_level(const char* s, cae_log_level_t* out) {
  if (!s || !out) return 0;
  if (strcmp(s, "error") == 0) { *out = CAE_LOG_ERROR; return 1; }
  if (strcmp(s, "warn") == 0)  { *out = CAE_LOG_WARN;  return 1; }
  if (strcmp(s, "info") == 0)  { *out = CAE_LOG_INFO;  return 1; }
  if (strcmp(s, "debug") == 0) { *out = CAE_LOG_DEBUG; return 1; }
  return 0;
}

void cae_log_ex(cae_log_level_t lvl, const char* fmt, ...) {
  if (lvl > g_cae_log_level) return;
  static const char* lvlstr[] = { "ERROR", "WARN", "INFO", "DEBUG" };
  fprintf(stderr, "[%s] ", lvlstr[lvl]);
  va_list ap;
  va_start(ap, fmt);
  vfprintf(stderr, fmt, ap);
  va_end(ap);
}

#include "cae_file.h"

#include <cstddef>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <errno.h>

static thread_local char g_cae_file_last_err[512] = {0};

static void cae_file_set_last_error(const char* msg) {
  if (!msg) msg = "unknown error";
  strncpy(g_cae_file_last_err, msg, sizeof(g_cae_file_last_err) - 1);
  g_cae_file_last_err[sizeof(g_cae_file_last_err) - 1] = 0;
}

static void cae_file_set_last_error_errno(const char* prefix, int err) {
  const char* em = strerror(err);
  if (!em) em = "unknown errno";
  char buf[512];
  if (prefix) {
    snprintf(buf, sizeof(buf), "%s: %s", prefix, em);
  } else {
    snprintf(buf, sizeof(buf), "%s", em);
  }
  cae_file_set_last_error(buf);
}

const char* cae_file_last_error() {
  return g_cae_file_last_err;
}

int cae_file_read_stream(FILE* f, char** out_data, size_t* out_len) {
  if (out_data) *out_data = NULL;
  if (out_len) *out_len = 0;
  if (!f || !out_data || !out_len) {
    cae_file_set_last_error("invalid arg");
    return 0;
  }

  size_t cap = 4096;
  size_t len = 0;
  char* buf = (char*)malloc(cap);
  if (!buf) {
    cae_file_set_last_error("out of memory");
    return 0;
  }

  for (;;) {
    if (len + 1 >= cap) {
      size_t next = cap * 2u;
      if (next < cap) {
        free(buf);
        cae_file_set_last_error("file too large");
        return 0;
      }
      char* grown = (char*)realloc(buf, next);
      if (!grown) {
        free(buf);
        cae_file_set_last_error("out of memory");
        return 0;
      }
      buf = grown;
      cap = next;
    }

    size_t n = fread(buf + len, 1, cap - len - 1, f);
    len += n;
    if (n == 0) {
      if (ferror(f)) {
        cae_file_set_last_error_errno("fread", errno);
        free(buf);
        return 0;
      }
      break;
    }
  }

  buf[len] = 0;
  *out_data = buf;
  *out_len = len;
  return 1;
}

int cae_file_read_all(const char* path, char** out_data, size_t* out_len) {
  if (out_data) *out_data = NULL;
  if (out_len) *out_len = 0;
  if (!path || !out_data || !out_len) {
    cae_file_set_last_error("invalid arg");
    return 0;
  }

  FILE* fp = fopen(path, "rb");
  if (!fp) {
    cae_file_set_last_error_errno("fopen", errno);
    return 0;
  }

  int ok = cae_file_read_stream(fp, out_data, out_len);
  fclose(fp);
  return ok;
}

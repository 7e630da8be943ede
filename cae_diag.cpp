#include "cae_diag.h"

#include <stdio.h>
#include <string.h>

static void cae_strcpy_trunc(char* dst, const char* src, size_t cap) {
  if (!dst || cap == 0) return;
  if (!src) {
    dst[0] = 0;
    return;
  }
  strncpy(dst, src, cap - 1);
  dst[cap - 1] = 0;
}

const char* cae_error_str(cae_error_t err) {
  switch (err) {
    case CAE_OK: return "ok";
    case CAE_E_INVALID_ARG: return "invalid argument";
    case CAE_E_OUT_OF_MEMORY: return "out of memory";
    case CAE_E_IO: return "i/o error";
    case CAE_E_LEX: return "lex error";
    case CAE_E_PARSE: return "parse error";
    case CAE_E_VALIDATE: return "validation error";
    case CAE_E_INPUT_EXHAUSTED: return "input exhausted";
    case CAE_E_OUTPUT_FAILED: return "output failed";
    case CAE_E_STEP_LIMIT: return "step limit reached";
    case CAE_E_DEPTH_LIMIT: return "call depth limit reached";
    case CAE_E_INTERNAL: return "internal error";
    default: return "unknown error";
  }
}

void cae_diag_clear(cae_diag_t* d) {
  if (!d) return;
  d->code = CAE_DIAG_OK;
  d->span = cae_span_from_token(0, 0, 0);
  d->message[0] = 0;
  d->symbol[0] = 0;
}

void cae_diag_set(cae_diag_t* d, cae_diag_code_t code, cae_span_t span, const char* msg) {
  cae_diag_set_symbol(d, code, span, msg, NULL);
}

void cae_diag_set_symbol(cae_diag_t* d, cae_diag_code_t code, cae_span_t span, const char* msg, const char* symbol) {
  if (!d) return;
  // First error wins.
  if (d->code != CAE_DIAG_OK) return;
  d->code = code;
  d->span = span;
  cae_strcpy_trunc(d->message, msg ? msg : "", sizeof(d->message));
  cae_strcpy_trunc(d->symbol, symbol ? symbol : "", sizeof(d->symbol));
}

const char* cae_diag_code_str(cae_diag_code_t code) {
  switch (code) {
    case CAE_DIAG_OK: return "OK";
    case CAE_DIAG_LEX_ERROR: return "LEX_ERROR";
    case CAE_DIAG_BAD_HEX_LITERAL: return "BAD_HEX_LITERAL";
    case CAE_DIAG_PARSE_ERROR: return "PARSE_ERROR";
    case CAE_DIAG_BRACKET_SCOPE: return "BRACKET_SCOPE";
    case CAE_DIAG_MALFORMED_DECL: return "MALFORMED_DECL";
    case CAE_DIAG_DUPLICATE_NAME: return "DUPLICATE_NAME";
    case CAE_DIAG_UNDEFINED_NAME: return "UNDEFINED_NAME";
    case CAE_DIAG_MISSING_ENTRY_POINT: return "MISSING_ENTRY_POINT";
    case CAE_DIAG_INPUT_EXHAUSTED: return "INPUT_EXHAUSTED";
    case CAE_DIAG_OUTPUT_FAILED: return "OUTPUT_FAILED";
    case CAE_DIAG_STEP_LIMIT: return "STEP_LIMIT";
    case CAE_DIAG_DEPTH_LIMIT: return "DEPTH_LIMIT";
    case CAE_DIAG_INTERNAL_ERROR: return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

const char* cae_diag_stage_str(cae_diag_code_t code) {
  switch (code) {
    case CAE_DIAG_LEX_ERROR:
    case CAE_DIAG_BAD_HEX_LITERAL:
      return "lex";
    case CAE_DIAG_PARSE_ERROR:
    case CAE_DIAG_BRACKET_SCOPE:
    case CAE_DIAG_MALFORMED_DECL:
      return "parse";
    case CAE_DIAG_DUPLICATE_NAME:
    case CAE_DIAG_UNDEFINED_NAME:
    case CAE_DIAG_MISSING_ENTRY_POINT:
      return "validate";
    case CAE_DIAG_INPUT_EXHAUSTED:
    case CAE_DIAG_OUTPUT_FAILED:
    case CAE_DIAG_STEP_LIMIT:
    case CAE_DIAG_DEPTH_LIMIT:
      return "runtime";
    default:
      return "internal";
  }
}

size_t cae_diag_format(const cae_diag_t* d, const char* path, char* out, size_t out_cap) {
  if (!d || !out || out_cap == 0) return 0;
  if (!path || !path[0]) path = "<source>";

  int n;
  if (d->span.line != 0) {
    n = snprintf(out, out_cap, "%s:%u:%u: %s error: %s",
                 path, (unsigned)d->span.line, (unsigned)d->span.col,
                 cae_diag_stage_str(d->code), d->message);
  } else {
    n = snprintf(out, out_cap, "%s: %s error: %s", path, cae_diag_stage_str(d->code), d->message);
  }
  if (n < 0) {
    out[0] = 0;
    return 0;
  }

  size_t w = (size_t)n < out_cap ? (size_t)n : out_cap - 1;
  if (d->symbol[0] && w + 1 < out_cap) {
    int m = snprintf(out + w, out_cap - w, " [%s]", d->symbol);
    if (m > 0) w += ((size_t)m < out_cap - w) ? (size_t)m : out_cap - w - 1;
  }
  return w;
}

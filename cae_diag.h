#pragma once

#include <stddef.h>
#include <stdint.h>

#include "cae_common.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef enum cae_diag_code_e {
  CAE_DIAG_OK = 0,

  // Lex
  CAE_DIAG_LEX_ERROR,
  CAE_DIAG_BAD_HEX_LITERAL,

  // Parse
  CAE_DIAG_PARSE_ERROR,
  CAE_DIAG_BRACKET_SCOPE,
  CAE_DIAG_MALFORMED_DECL,

  // Validation
  CAE_DIAG_DUPLICATE_NAME,
  CAE_DIAG_UNDEFINED_NAME,
  CAE_DIAG_MISSING_ENTRY_POINT,

  // Run time (host limits / collaborators)
  CAE_DIAG_INPUT_EXHAUSTED,
  CAE_DIAG_OUTPUT_FAILED,
  CAE_DIAG_STEP_LIMIT,
  CAE_DIAG_DEPTH_LIMIT,

  // Misc
  CAE_DIAG_INTERNAL_ERROR
} cae_diag_code_t;

typedef struct cae_span_s {
  uint32_t line;
  uint32_t col;
  uint32_t length;
} cae_span_t;

typedef struct cae_diag_s {
  cae_diag_code_t code;
  cae_span_t span;
  char message[256];
  char symbol[64]; // offending name, if any
} cae_diag_t;

static inline cae_span_t cae_span_from_token(uint32_t line, uint32_t col, uint32_t len) {
  cae_span_t s;
  s.line = line;
  s.col = col;
  s.length = len;
  return s;
}

void cae_diag_clear(cae_diag_t* d);
void cae_diag_set(cae_diag_t* d, cae_diag_code_t code, cae_span_t span, const char* msg);
void cae_diag_set_symbol(cae_diag_t* d, cae_diag_code_t code, cae_span_t span, const char* msg, const char* symbol);

const char* cae_diag_code_str(cae_diag_code_t code);

// Coarse taxonomy: "lex", "parse", "validate", "runtime" or "internal".
const char* cae_diag_stage_str(cae_diag_code_t code);

// Renders "<path>:<line>:<col>: <stage> error: <message> [<symbol>]" into `out`.
// Returns the number of characters written (excluding NUL).
size_t cae_diag_format(const cae_diag_t* d, const char* path, char* out, size_t out_cap);

#ifdef __cplusplus
} // extern "C"
#endif

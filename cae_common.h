#pragma once

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

#define CAE_VERSION_MAJOR 0
#define CAE_VERSION_MINOR 3
#define CAE_VERSION_STRING "0.3"

// Sentinel for unresolved region / procedure indices.
#define CAE_INVALID_ID 0xFFFFFFFFu

// ---------------------------
// Error codes (stable + parseable)
// ---------------------------

typedef enum {
  CAE_OK = 0,
  CAE_E_INVALID_ARG,
  CAE_E_OUT_OF_MEMORY,
  CAE_E_IO,

  // Load-time (fatal to loading)
  CAE_E_LEX,
  CAE_E_PARSE,
  CAE_E_VALIDATE,

  // Run-time stops originating from the host
  CAE_E_INPUT_EXHAUSTED,
  CAE_E_OUTPUT_FAILED,
  CAE_E_STEP_LIMIT,
  CAE_E_DEPTH_LIMIT,

  CAE_E_INTERNAL,
  CAE_E_UNKNOWN = 0x7FFFFFFF
} cae_error_t;

const char* cae_error_str(cae_error_t err);

#ifdef __cplusplus
} // extern "C"
#endif

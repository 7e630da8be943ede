#pragma once

#include <stdint.h>
#include <stdio.h>

#include "cae_common.h"
#include "cae_ast.h"
#include "cae_diag.h"
#include "cae_io.h"
#include "cae_region.h"

// Execution engine for validated cae programs.
//
// Each call frame carries two region bindings:
//   here   - region that un-targeted instructions act on
//   origin - region `$` resolves to
// A call clause derives the callee frame from the caller frame F:
//   (none)  here' = F.here    origin' = F.origin
//   @R      here' = R         origin' = F.here
//   @$      here' = F.origin  origin' = F.origin
// Execution starts with `main` on region `main` (here == origin == main).

// What `,` does once the input collaborator is exhausted.
typedef enum cae_eof_policy_e {
  CAE_EOF_ZERO = 0, // store 0 at the head
  CAE_EOF_KEEP,     // leave the cell unchanged
  CAE_EOF_ERROR     // stop with CAE_E_INPUT_EXHAUSTED
} cae_eof_policy_t;

typedef struct cae_vm_options_s {
  cae_eof_policy_t eof_policy;
  uint64_t step_limit;     // 0 = unlimited
  uint32_t max_call_depth; // 0 = unlimited
  FILE* trace;             // call trace sink; NULL disables
} cae_vm_options_t;

typedef struct cae_vm_stats_s {
  uint64_t steps;          // instructions dispatched, including loop re-tests
  uint64_t calls;          // frames pushed, including the initial main frame
  uint32_t max_depth;      // deepest call stack observed
} cae_vm_stats_t;

void cae_vm_options_init(cae_vm_options_t* opts);

// Parses "zero" | "keep" | "error". Returns 0 on unknown input.
int cae_parse_eof_policy(const char* s, cae_eof_policy_t* out);
const char* cae_eof_policy_str(cae_eof_policy_t p);

// Runs procedure `main` of `prog` against `store` until it returns.
// `store` must have been built from `prog`. `opts`, `out_stats` and
// `out_diag` may be NULL.
cae_error_t cae_vm_run(const cae_program_t* prog,
                       cae_region_store_t* store,
                       const cae_io_t* io,
                       const cae_vm_options_t* opts,
                       cae_vm_stats_t* out_stats,
                       cae_diag_t* out_diag);

// Engine selftest; returns the number of failed checks.
int cae_vm_run_selftest();

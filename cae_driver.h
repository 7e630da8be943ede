#pragma once

#include "cae_common.h"
#include "cae_ast.h"
#include "cae_diag.h"
#include "cae_io.h"
#include "cae_region.h"
#include "cae_vm.h"

// Load pipeline: source -> parse -> validate -> region store.
// A module is only produced when every stage succeeds; callers never run a
// program that failed to load.

typedef struct cae_module_s {
  cae_program_t* prog;
  cae_region_store_t store;
} cae_module_t;

typedef struct cae_load_times_s {
  double parse_ms;
  double validate_ms;
  double alloc_ms;
} cae_load_times_t;

cae_error_t cae_load_source(const char* source, size_t len, cae_module_t* out_mod, cae_diag_t* out_diag);
cae_error_t cae_load_source_timed(const char* source, size_t len, cae_module_t* out_mod, cae_diag_t* out_diag,
                                  cae_load_times_t* out_times);

// Reads the source from `path` ("-" reads stdin). Returns CAE_E_IO when it
// cannot be read (see cae_file_last_error()).
cae_error_t cae_load_file(const char* path, cae_module_t* out_mod, cae_diag_t* out_diag);
cae_error_t cae_load_file_timed(const char* path, cae_module_t* out_mod, cae_diag_t* out_diag,
                                cae_load_times_t* out_times);

// Reads a whole source file ("-" reads stdin) into a NUL-terminated buffer the
// caller frees.
cae_error_t cae_read_source(const char* path, char** out_data, size_t* out_len);

void cae_module_destroy(cae_module_t* mod);

// Convenience: load `source` and run it to completion with `io`.
cae_error_t cae_run_source(const char* source, size_t len,
                           const cae_io_t* io,
                           const cae_vm_options_t* opts,
                           cae_vm_stats_t* out_stats,
                           cae_diag_t* out_diag);

#include "cae_driver.h"
#include "cae_file.h"
#include "cae_log.h"
#include "cae_parser.h"
#include "cae_validate.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

static double cae_now_ms() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return (double)ts.tv_sec * 1000.0 + (double)ts.tv_nsec / 1e6;
}

void cae_module_destroy(cae_module_t* mod) {
  if (!mod) return;
  cae_region_store_destroy(&mod->store);
  cae_program_free(mod->prog);
  mod->prog = NULL;
}

cae_error_t cae_load_source_timed(const char* source, size_t len, cae_module_t* out_mod, cae_diag_t* out_diag,
                                  cae_load_times_t* out_times) {
  if (out_times) memset(out_times, 0, sizeof(*out_times));
  if (!source || !out_mod) return CAE_E_INVALID_ARG;
  memset(out_mod, 0, sizeof(*out_mod));

  cae_diag_t local = {};
  cae_diag_t* diag = out_diag ? out_diag : &local;

  double t0 = cae_now_ms();
  cae_program_t* prog = NULL;
  cae_error_t err = cae_parse_source_len_ex(source, len, &prog, diag);
  double t1 = cae_now_ms();
  if (out_times) out_times->parse_ms = t1 - t0;
  if (err != CAE_OK) {
    cae_log_ex(CAE_LOG_DEBUG, "cae: parse failed: %s (%u:%u)\n", diag->message,
               (unsigned)diag->span.line, (unsigned)diag->span.col);
    return err;
  }

  err = cae_validate_program_ex(prog, diag);
  double t2 = cae_now_ms();
  if (out_times) out_times->validate_ms = t2 - t1;
  if (err != CAE_OK) {
    cae_log_ex(CAE_LOG_DEBUG, "cae: validate failed: %s\n", diag->message);
    cae_program_free(prog);
    return err;
  }

  err = cae_region_store_init(&out_mod->store, prog);
  if (out_times) out_times->alloc_ms = cae_now_ms() - t2;
  if (err != CAE_OK) {
    cae_log_ex(CAE_LOG_ERROR, "cae: region allocation failed: %s\n", cae_error_str(err));
    cae_program_free(prog);
    return err;
  }

  cae_log_ex(CAE_LOG_DEBUG, "cae: loaded %u regions, %u procedures (%u named)\n",
             (unsigned)prog->regions.size(), (unsigned)prog->procs.size(),
             (unsigned)cae_program_named_proc_count(prog));
  out_mod->prog = prog;
  return CAE_OK;
}

cae_error_t cae_load_source(const char* source, size_t len, cae_module_t* out_mod, cae_diag_t* out_diag) {
  return cae_load_source_timed(source, len, out_mod, out_diag, NULL);
}

cae_error_t cae_read_source(const char* path, char** out_data, size_t* out_len) {
  if (!path || !out_data || !out_len) return CAE_E_INVALID_ARG;
  int ok = strcmp(path, "-") == 0 ? cae_file_read_stream(stdin, out_data, out_len)
                                  : cae_file_read_all(path, out_data, out_len);
  if (!ok) {
    cae_log_ex(CAE_LOG_DEBUG, "cae: %s: %s\n", path, cae_file_last_error());
    return CAE_E_IO;
  }
  return CAE_OK;
}

cae_error_t cae_load_file_timed(const char* path, cae_module_t* out_mod, cae_diag_t* out_diag,
                                cae_load_times_t* out_times) {
  if (out_times) memset(out_times, 0, sizeof(*out_times));
  if (!path || !out_mod) return CAE_E_INVALID_ARG;
  memset(out_mod, 0, sizeof(*out_mod));

  char* buf = NULL;
  size_t len = 0;
  cae_error_t err = cae_read_source(path, &buf, &len);
  if (err != CAE_OK) return err;

  err = cae_load_source_timed(buf, len, out_mod, out_diag, out_times);
  free(buf);
  return err;
}

cae_error_t cae_load_file(const char* path, cae_module_t* out_mod, cae_diag_t* out_diag) {
  return cae_load_file_timed(path, out_mod, out_diag, NULL);
}

cae_error_t cae_run_source(const char* source, size_t len,
                           const cae_io_t* io,
                           const cae_vm_options_t* opts,
                           cae_vm_stats_t* out_stats,
                           cae_diag_t* out_diag) {
  cae_module_t mod;
  cae_error_t err = cae_load_source(source, len, &mod, out_diag);
  if (err != CAE_OK) return err;

  err = cae_vm_run(mod.prog, &mod.store, io, opts, out_stats, out_diag);
  cae_module_destroy(&mod);
  return err;
}

#include "cae_driver.h"

#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include "cae_ast.h"
#include "cae_diag.h"
#include "cae_file.h"
#include "cae_io.h"
#include "cae_lexer.h"
#include "cae_log.h"
#include "cae_parser.h"
#include "cae_region.h"
#include "cae_validate.h"
#include "cae_vm.h"

typedef enum cae_cli_exit_e : int {
  CAE_EXIT_OK = 0,
  CAE_EXIT_USAGE = 2,
  CAE_EXIT_TOOL_FAIL = 3,
  CAE_EXIT_LOAD_FAIL = 4,
  CAE_EXIT_RUNTIME = 5,
} cae_cli_exit_t;

typedef enum cae_selftest_kind_e : uint32_t {
  CAE_SELFTEST_NONE     = 0,
  CAE_SELFTEST_ALL      = 1,
  CAE_SELFTEST_LEXER    = 2,
  CAE_SELFTEST_PARSER   = 3,
  CAE_SELFTEST_VALIDATE = 4,
  CAE_SELFTEST_REGION   = 5,
  CAE_SELFTEST_VM       = 6,
} cae_selftest_kind_t;

typedef struct cae_cli_options_s {
  const char* input_path;
  const char* stdin_path;   // --input: program input instead of stdin

  int run_selftest;
  cae_selftest_kind_t selftest_kind;

  int lex_only;
  int parse_only;
  int check_only;
  int dump_ast;

  cae_vm_options_t vm;
  int trace;
  int print_stats;
  int time_stages;
  int structured;

  int show_help;
  int show_version;
} cae_cli_options_t;

typedef struct cae_timer_s {
  struct timespec t0;
} cae_timer_t;

static void cae_timer_start(cae_timer_t* t) {
  clock_gettime(CLOCK_MONOTONIC, &t->t0);
}

static double cae_timer_elapsed_ms(const cae_timer_t* t) {
  struct timespec t1;
  clock_gettime(CLOCK_MONOTONIC, &t1);
  double dt = (double)(t1.tv_sec - t->t0.tv_sec) * 1000.0;
  dt += (double)(t1.tv_nsec - t->t0.tv_nsec) / 1e6;
  return dt;
}

static void cae_print_version() {
  printf("cae %s\n", CAE_VERSION_STRING);
}

static void cae_print_help() {
  cae_print_version();
  printf("\n");
  printf("Usage:\n");
  printf("  cae <program.cae|-> [options]\n");
  printf("\n");
  printf("Run options:\n");
  printf("  --input <path>           Read program input from a file instead of stdin\n");
  printf("  --eof zero|keep|error    What ',' does once input is exhausted (default: zero)\n");
  printf("  --steps <n>              Stop after n steps (0 = unlimited)\n");
  printf("  --max-depth <n>          Stop when the call stack exceeds n frames (0 = unlimited)\n");
  printf("  --trace                  Trace every call on stderr\n");
  printf("  --stats                  Print step/call counters on stderr\n");
  printf("\n");
  printf("Analysis modes:\n");
  printf("  --lex                    Tokenize and print tokens\n");
  printf("  --parse-only             Parse only\n");
  printf("  --check                  Parse + validate, do not run\n");
  printf("  --dump-ast               Parse + print the instruction tree\n");
  printf("\n");
  printf("Selftests:\n");
  printf("  --selftest all|lexer|parser|validate|region|vm\n");
  printf("  --structured             Print structured results (selftest/errors/stats/timing)\n");
  printf("\n");
  printf("Other:\n");
  printf("  --time                   Print stage timings\n");
  printf("  --log-level <level>      error|warn|info|debug (default: warn)\n");
  printf("  --help                   Show this help\n");
  printf("  --version                Show version\n");
  printf("\n");
  printf("Exit codes: 0 ok, 2 usage, 3 i/o or selftest failure, 4 load error, 5 runtime stop\n");
}

static int cae_streq(const char* a, const char* b) {
  if (!a || !b) return 0;
  return strcmp(a, b) == 0;
}

static int cae_parse_u64(const char* s, uint64_t* out) {
  if (!s || !out || !s[0]) return 0;
  uint64_t v = 0;
  for (const char* p = s; *p; p++) {
    if (*p < '0' || *p > '9') return 0;
    uint64_t d = (uint64_t)(*p - '0');
    if (v > (UINT64_MAX - d) / 10u) return 0;
    v = v * 10u + d;
  }
  *out = v;
  return 1;
}

static cae_selftest_kind_t cae_parse_selftest_kind(const char* s) {
  if (!s) return CAE_SELFTEST_NONE;
  if (cae_streq(s, "all")) return CAE_SELFTEST_ALL;
  if (cae_streq(s, "lexer")) return CAE_SELFTEST_LEXER;
  if (cae_streq(s, "parser")) return CAE_SELFTEST_PARSER;
  if (cae_streq(s, "validate")) return CAE_SELFTEST_VALIDATE;
  if (cae_streq(s, "region")) return CAE_SELFTEST_REGION;
  if (cae_streq(s, "vm")) return CAE_SELFTEST_VM;
  return CAE_SELFTEST_NONE;
}

static int cae_cli_parse(int argc, char** argv, cae_cli_options_t* out) {
  if (!out) return 0;
  memset(out, 0, sizeof(*out));
  cae_vm_options_init(&out->vm);
  out->selftest_kind = CAE_SELFTEST_NONE;

  for (int i = 1; i < argc; i++) {
    const char* a = argv[i];

    if (cae_streq(a, "--help") || cae_streq(a, "-h")) {
      out->show_help = 1;
      return 1;
    }

    if (cae_streq(a, "--version")) {
      out->show_version = 1;
      return 1;
    }

    if (cae_streq(a, "--structured")) { out->structured = 1; continue; }

    if (cae_streq(a, "--selftest")) {
      if (i + 1 >= argc) return 0;
      out->run_selftest = 1;
      out->selftest_kind = cae_parse_selftest_kind(argv[++i]);
      if (out->selftest_kind == CAE_SELFTEST_NONE) return 0;
      continue;
    }

    if (cae_streq(a, "--lex")) { out->lex_only = 1; continue; }
    if (cae_streq(a, "--parse-only")) { out->parse_only = 1; continue; }
    if (cae_streq(a, "--check")) { out->check_only = 1; continue; }
    if (cae_streq(a, "--dump-ast")) { out->dump_ast = 1; continue; }

    if (cae_streq(a, "--time")) { out->time_stages = 1; continue; }
    if (cae_streq(a, "--trace")) { out->trace = 1; continue; }
    if (cae_streq(a, "--stats")) { out->print_stats = 1; continue; }

    if (cae_streq(a, "--input")) {
      if (i + 1 >= argc) return 0;
      out->stdin_path = argv[++i];
      continue;
    }

    if (cae_streq(a, "--eof")) {
      if (i + 1 >= argc) return 0;
      if (!cae_parse_eof_policy(argv[++i], &out->vm.eof_policy)) return 0;
      continue;
    }

    if (cae_streq(a, "--steps")) {
      if (i + 1 >= argc) return 0;
      if (!cae_parse_u64(argv[++i], &out->vm.step_limit)) return 0;
      continue;
    }

    if (cae_streq(a, "--max-depth")) {
      if (i + 1 >= argc) return 0;
      uint64_t depth = 0;
      if (!cae_parse_u64(argv[++i], &depth) || depth > 0xFFFFFFFFull) return 0;
      out->vm.max_call_depth = (uint32_t)depth;
      continue;
    }

    if (cae_streq(a, "--log-level")) {
      if (i + 1 >= argc) return 0;
      cae_log_level_t lvl;
      if (!cae_parse_log_level(argv[++i], &lvl)) return 0;
      cae_set_log_level(lvl);
      continue;
    }

    // A lone "-" names stdin; any other dash argument is unknown.
    if (a[0] == '-' && a[1] != 0) return 0;

    if (!out->input_path) {
      out->input_path = a;
      continue;
    }

    return 0;
  }

  return 1;
}

static void cae_print_error(const char* stage, cae_error_t err, const char* msg) {
  if (stage && stage[0]) fprintf(stderr, "cae: %s: ", stage);
  if (msg && msg[0]) fprintf(stderr, "%s", msg);
  if (err != CAE_OK) fprintf(stderr, " (%s)", cae_error_str(err));
  fprintf(stderr, "\n");
}

static void cae_print_error2(const char* stage, const char* path, cae_error_t err, const char* msg) {
  if (path && path[0]) fprintf(stderr, "cae: %s: %s: ", stage ? stage : "error", path);
  else fprintf(stderr, "cae: %s: ", stage ? stage : "error");
  if (msg && msg[0]) fprintf(stderr, "%s", msg);
  if (err != CAE_OK) fprintf(stderr, " (%s)", cae_error_str(err));
  fprintf(stderr, "\n");
}


static void cae_print_structured_kv(FILE* out, const char* k, const char* v) {
  if (!k) return;
  if (!v) v = "";
  fprintf(out, "%s=%s\n", k, v);
}

static void cae_print_structured_kv_u64(FILE* out, const char* k, unsigned long long v) {
  if (!k) return;
  fprintf(out, "%s=%llu\n", k, v);
}

static void cae_print_structured_kv_f64(FILE* out, const char* k, double v) {
  if (!k) return;
  fprintf(out, "%s=%.3f\n", k, v);
}

static void cae_print_diag(const cae_cli_options_t* cli, const cae_diag_t* d, const char* path) {
  if (cli->structured) {
    cae_print_structured_kv(stderr, "event", "error");
    cae_print_structured_kv(stderr, "input", path);
    cae_print_structured_kv(stderr, "stage", cae_diag_stage_str(d->code));
    cae_print_structured_kv(stderr, "code", cae_diag_code_str(d->code));
    cae_print_structured_kv_u64(stderr, "line", (unsigned long long)d->span.line);
    cae_print_structured_kv_u64(stderr, "col", (unsigned long long)d->span.col);
    cae_print_structured_kv(stderr, "message", d->message);
    if (d->symbol[0]) cae_print_structured_kv(stderr, "symbol", d->symbol);
    fprintf(stderr, "\n");
    return;
  }
  char line[512];
  cae_diag_format(d, path, line, sizeof(line));
  fprintf(stderr, "%s\n", line);
}

// Reads the program source, reporting failures. Returns an exit code.
static int cae_cli_read_source(const char* path, char** out_buf, size_t* out_len) {
  cae_error_t err = cae_read_source(path, out_buf, out_len);
  if (err != CAE_OK) {
    cae_print_error2("load", path, err, cae_file_last_error());
    return CAE_EXIT_TOOL_FAIL;
  }
  return CAE_EXIT_OK;
}

static int cae_lex_file(const char* path) {
  char* buf = NULL;
  size_t len = 0;
  int rc = cae_cli_read_source(path, &buf, &len);
  if (rc != CAE_EXIT_OK) return rc;

  cae_lexer_t lex;
  cae_lexer_init(&lex, buf, len);

  for (;;) {
    cae_token_t t = cae_lexer_next(&lex);
    printf("%5u:%-4u  %-18s  len=%u  ",
           (unsigned)t.line,
           (unsigned)t.col,
           cae_token_type_str(t.type),
           (unsigned)t.length);

    // Print a truncated token preview for deterministic debug output.
    const uint32_t max_preview = 48;
    uint32_t n = (uint32_t)t.length;
    if (n > max_preview) n = max_preview;

    printf("\"");
    for (uint32_t i = 0; i < n; i++) {
      char c = t.start ? t.start[i] : 0;
      if (c == '\r') { printf("\\r"); continue; }
      if (c == '\n') { printf("\\n"); continue; }
      if (c == '\t') { printf("\\t"); continue; }
      if ((unsigned char)c < 32 || (unsigned char)c >= 127) { printf("?"); continue; }
      printf("%c", c);
    }
    if (t.length > max_preview) printf("...");
    printf("\"\n");

    if (t.type == TOK_ERROR) {
      free(buf);
      return CAE_EXIT_LOAD_FAIL;
    }
    if (t.type == TOK_EOF) break;
  }

  free(buf);
  return CAE_EXIT_OK;
}

// --parse-only and --dump-ast: names are not resolved.
static int cae_parse_file(const cae_cli_options_t* cli) {
  char* buf = NULL;
  size_t len = 0;
  int rc = cae_cli_read_source(cli->input_path, &buf, &len);
  if (rc != CAE_EXIT_OK) return rc;

  cae_timer_t timer;
  cae_timer_start(&timer);
  cae_diag_t diag = {};
  cae_program_t* prog = NULL;
  cae_error_t err = cae_parse_source_len_ex(buf, len, &prog, &diag);
  double parse_ms = cae_timer_elapsed_ms(&timer);
  free(buf);

  if (err != CAE_OK) {
    cae_print_diag(cli, &diag, cli->input_path);
    return CAE_EXIT_LOAD_FAIL;
  }

  if (cli->dump_ast) {
    cae_program_dump(prog, stdout);
  } else {
    printf("parse: ok (%u regions, %u procedures)\n",
           (unsigned)prog->regions.size(), (unsigned)cae_program_named_proc_count(prog));
  }
  if (cli->time_stages) fprintf(stderr, "cae: time: parse=%.3fms\n", parse_ms);

  cae_program_free(prog);
  return CAE_EXIT_OK;
}

static void cae_print_times(const cae_cli_options_t* cli, const cae_load_times_t* lt, double run_ms) {
  if (cli->structured) {
    cae_print_structured_kv(stderr, "event", "timing");
    cae_print_structured_kv_f64(stderr, "parse_ms", lt->parse_ms);
    cae_print_structured_kv_f64(stderr, "validate_ms", lt->validate_ms);
    cae_print_structured_kv_f64(stderr, "alloc_ms", lt->alloc_ms);
    cae_print_structured_kv_f64(stderr, "run_ms", run_ms);
    fprintf(stderr, "\n");
    return;
  }
  fprintf(stderr, "cae: time: parse=%.3fms validate=%.3fms alloc=%.3fms run=%.3fms\n",
          lt->parse_ms, lt->validate_ms, lt->alloc_ms, run_ms);
}

static void cae_print_stats(const cae_cli_options_t* cli, const cae_vm_stats_t* s, cae_error_t status) {
  if (cli->structured) {
    cae_print_structured_kv(stderr, "event", "run");
    cae_print_structured_kv(stderr, "input", cli->input_path);
    cae_print_structured_kv(stderr, "status", cae_error_str(status));
    cae_print_structured_kv_u64(stderr, "steps", (unsigned long long)s->steps);
    cae_print_structured_kv_u64(stderr, "calls", (unsigned long long)s->calls);
    cae_print_structured_kv_u64(stderr, "max_depth", (unsigned long long)s->max_depth);
    fprintf(stderr, "\n");
    return;
  }
  fprintf(stderr, "cae: stats: steps=%llu calls=%llu max_depth=%u\n",
          (unsigned long long)s->steps, (unsigned long long)s->calls, (unsigned)s->max_depth);
}

static int cae_run_file(const cae_cli_options_t* cli) {
  cae_load_times_t lt;
  cae_diag_t diag = {};
  cae_module_t mod;
  cae_error_t err = cae_load_file_timed(cli->input_path, &mod, &diag, &lt);
  if (err == CAE_E_IO) {
    cae_print_error2("load", cli->input_path, err, cae_file_last_error());
    return CAE_EXIT_TOOL_FAIL;
  }
  if (err != CAE_OK) {
    if (diag.code != CAE_DIAG_OK) cae_print_diag(cli, &diag, cli->input_path);
    else cae_print_error2("load", cli->input_path, err, NULL);
    return CAE_EXIT_LOAD_FAIL;
  }

  if (cli->check_only) {
    printf("check: ok (%u regions, %u procedures)\n",
           (unsigned)mod.store.count, (unsigned)cae_program_named_proc_count(mod.prog));
    if (cli->time_stages) cae_print_times(cli, &lt, 0.0);
    cae_module_destroy(&mod);
    return CAE_EXIT_OK;
  }

  // Program input: --input file (fully buffered) or stdin.
  char* in_buf = NULL;
  size_t in_len = 0;
  cae_membuf_t mb;
  cae_membuf_init(&mb, NULL, 0);
  cae_io_t io = cae_io_from_files(stdin, stdout);
  if (cli->stdin_path) {
    if (!cae_file_read_all(cli->stdin_path, &in_buf, &in_len)) {
      cae_print_error2("input", cli->stdin_path, CAE_E_IO, cae_file_last_error());
      cae_module_destroy(&mod);
      return CAE_EXIT_TOOL_FAIL;
    }
    cae_membuf_init(&mb, in_buf, in_len);
    io = cae_io_membuf_to_file(&mb, stdout);
  }

  cae_vm_options_t opts = cli->vm;
  if (cli->trace) opts.trace = stderr;

  cae_log_ex(CAE_LOG_INFO, "cae: running %s (eof=%s steps=%llu max-depth=%u)\n",
             cli->input_path, cae_eof_policy_str(opts.eof_policy),
             (unsigned long long)opts.step_limit, (unsigned)opts.max_call_depth);

  cae_timer_t timer;
  cae_timer_start(&timer);
  cae_vm_stats_t stats;
  err = cae_vm_run(mod.prog, &mod.store, &io, &opts, &stats, &diag);
  double run_ms = cae_timer_elapsed_ms(&timer);
  fflush(stdout);

  int rc = CAE_EXIT_OK;
  if (err != CAE_OK) {
    if (diag.code != CAE_DIAG_OK) cae_print_diag(cli, &diag, cli->input_path);
    else cae_print_error("run", err, "engine stopped");
    rc = CAE_EXIT_RUNTIME;
  }

  if (cli->print_stats) cae_print_stats(cli, &stats, err);
  if (cli->time_stages) cae_print_times(cli, &lt, run_ms);

  cae_membuf_destroy(&mb);
  free(in_buf);
  cae_module_destroy(&mod);
  return rc;
}

typedef struct cae_selftest_entry_s {
  cae_selftest_kind_t kind;
  const char* name;
  int (*run)();
} cae_selftest_entry_t;

static const cae_selftest_entry_t k_selftests[] = {
  { CAE_SELFTEST_LEXER,    "lexer",    cae_lexer_run_selftest },
  { CAE_SELFTEST_PARSER,   "parser",   cae_parser_run_selftest },
  { CAE_SELFTEST_VALIDATE, "validate", cae_validate_run_selftest },
  { CAE_SELFTEST_REGION,   "region",   cae_region_run_selftest },
  { CAE_SELFTEST_VM,       "vm",       cae_vm_run_selftest },
};

static int cae_run_selftest(const cae_cli_options_t* cli) {
  if (!cli) return CAE_EXIT_USAGE;

  if (cli->structured) {
    cae_print_structured_kv(stdout, "event", "selftest-begin");
    cae_print_structured_kv_u64(stdout, "kind", (unsigned long long)cli->selftest_kind);
    printf("\n");
  }

  int total = 0;
  for (const cae_selftest_entry_t& e : k_selftests) {
    if (cli->selftest_kind != CAE_SELFTEST_ALL && cli->selftest_kind != e.kind) continue;
    int fails = e.run();
    total += fails;
    if (cli->structured) {
      cae_print_structured_kv(stdout, "component", e.name);
      cae_print_structured_kv_u64(stdout, "fails", (unsigned long long)fails);
      printf("\n");
    } else {
      printf("selftest: %s: %s\n", e.name, fails == 0 ? "ok" : "FAILED");
    }
  }

  if (cli->structured) {
    cae_print_structured_kv(stdout, "event", "selftest-end");
    cae_print_structured_kv_u64(stdout, "status", (unsigned long long)total);
    printf("\n");
  } else if (total == 0) {
    printf("selftest: ok\n");
  } else {
    printf("selftest: %d check(s) failed\n", total);
  }

  return total == 0 ? CAE_EXIT_OK : CAE_EXIT_TOOL_FAIL;
}

int main(int argc, char** argv) {
  cae_cli_options_t cli;
  if (!cae_cli_parse(argc, argv, &cli)) {
    cae_print_error("usage", CAE_E_INVALID_ARG, "invalid arguments (try --help)");
    return CAE_EXIT_USAGE;
  }

  if (cli.show_help) {
    cae_print_help();
    return CAE_EXIT_OK;
  }
  if (cli.show_version) {
    cae_print_version();
    return CAE_EXIT_OK;
  }

  if (cli.run_selftest) return cae_run_selftest(&cli);

  if (!cli.input_path) {
    cae_print_error("usage", CAE_E_INVALID_ARG, "no input file");
    return CAE_EXIT_USAGE;
  }

  if (cli.lex_only) return cae_lex_file(cli.input_path);
  if (cli.parse_only || cli.dump_ast) return cae_parse_file(&cli);
  return cae_run_file(&cli);
}

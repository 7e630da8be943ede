#include "cae_validate.h"
#include "cae_parser.h"
#include "cae_selftest.h"

// Parses and validates `src`. The parse is expected to succeed.
static cae_error_t check_source(const char* src, cae_diag_t* d, cae_program_t** out_prog = NULL) {
  cae_program_t* prog = NULL;
  cae_error_t err = cae_parse_source_ex(src, &prog, d);
  if (err != CAE_OK) return CAE_E_PARSE;
  err = cae_validate_program_ex(prog, d);
  if (out_prog) *out_prog = prog;
  else cae_program_free(prog);
  return err;
}

static void test_resolves_ids(int* fails) {
  cae_diag_t d = {};
  cae_program_t* prog = NULL;
  const char* src =
    "region other[2];\n"
    "region main[4];\n"
    "proc helper: ^other &$;\n"
    "proc main: helper@other [helper] (helper@$)@main;\n";
  CAE_TEST_CHECK(fails, check_source(src, &d, &prog) == CAE_OK);
  if (!prog) return;

  CAE_TEST_CHECK(fails, prog->validated);
  CAE_TEST_CHECK(fails, prog->main_region == 1);
  CAE_TEST_CHECK(fails, prog->main_proc == 1);

  const std::vector<cae::instruction>& helper = prog->procs[0].body;
  CAE_TEST_CHECK(fails, helper[0].target.id == 0);
  // `$` stays unresolved until run time.
  CAE_TEST_CHECK(fails, helper[1].target.id == CAE_INVALID_ID);

  const std::vector<cae::instruction>& m = prog->procs[1].body;
  CAE_TEST_CHECK(fails, m[0].callee_id == 0 && m[0].target.id == 0);
  CAE_TEST_CHECK(fails, m[1].body[0].callee_id == 0);
  CAE_TEST_CHECK(fails, m[2].callee_id == 2 && m[2].target.id == 1);
  // References inside anonymous bodies are resolved too.
  CAE_TEST_CHECK(fails, prog->procs[2].body[0].callee_id == 0);
  cae_program_free(prog);
}

static void test_undefined_names(int* fails) {
  cae_diag_t d = {};
  CAE_TEST_CHECK(fails, check_source("region main[1]; proc main: nope;", &d) == CAE_E_VALIDATE);
  CAE_TEST_CHECK(fails, d.code == CAE_DIAG_UNDEFINED_NAME);
  CAE_TEST_CHECK(fails, cae_test_streq(d.symbol, "nope"));
  CAE_TEST_CHECK(fails, cae_test_streq(d.message, "Undefined procedure 'nope'"));

  CAE_TEST_CHECK(fails, check_source("region main[1]; proc main: ^ghost;", &d) == CAE_E_VALIDATE);
  CAE_TEST_CHECK(fails, d.code == CAE_DIAG_UNDEFINED_NAME && cae_test_streq(d.symbol, "ghost"));

  CAE_TEST_CHECK(fails, check_source("region main[1]; proc main: main@ghost;", &d) == CAE_E_VALIDATE);
  CAE_TEST_CHECK(fails, d.code == CAE_DIAG_UNDEFINED_NAME && cae_test_streq(d.symbol, "ghost"));

  // Undefined reference nested in a loop inside an anonymous body.
  CAE_TEST_CHECK(fails, check_source("region main[1]; proc main: ([&ghost]);", &d) == CAE_E_VALIDATE);
  CAE_TEST_CHECK(fails, d.code == CAE_DIAG_UNDEFINED_NAME);

  // Region and procedure names live in separate namespaces.
  CAE_TEST_CHECK(fails, check_source("region main[1]; proc main: ^x; proc x:;", &d) == CAE_E_VALIDATE);
  CAE_TEST_CHECK(fails, check_source("region main[1]; region x[1]; proc main: x;", &d) == CAE_E_VALIDATE);
  CAE_TEST_CHECK(fails, check_source("region main[1]; region x[1]; proc main: x@x; proc x:;", &d) == CAE_OK);
}

static void test_duplicates(int* fails) {
  cae_diag_t d = {};
  CAE_TEST_CHECK(fails, check_source("region main[1]; region main[2]; proc main:;", &d) == CAE_E_VALIDATE);
  CAE_TEST_CHECK(fails, d.code == CAE_DIAG_DUPLICATE_NAME && cae_test_streq(d.symbol, "main"));

  CAE_TEST_CHECK(fails, check_source("region main[1]; proc main:; proc main: +;", &d) == CAE_E_VALIDATE);
  CAE_TEST_CHECK(fails, d.code == CAE_DIAG_DUPLICATE_NAME);

  // Duplicates are reported before undefined references.
  CAE_TEST_CHECK(fails, check_source("region main[1]; proc main: ghost; proc p:; proc p:;", &d) == CAE_E_VALIDATE);
  CAE_TEST_CHECK(fails, d.code == CAE_DIAG_DUPLICATE_NAME && cae_test_streq(d.symbol, "p"));
}

static void test_entry_points(int* fails) {
  cae_diag_t d = {};
  CAE_TEST_CHECK(fails, check_source("proc main:;", &d) == CAE_E_VALIDATE);
  CAE_TEST_CHECK(fails, d.code == CAE_DIAG_MISSING_ENTRY_POINT);
  CAE_TEST_CHECK(fails, cae_test_streq(d.message, "Program has no region named 'main'"));

  CAE_TEST_CHECK(fails, check_source("region main[1]; proc start:;", &d) == CAE_E_VALIDATE);
  CAE_TEST_CHECK(fails, d.code == CAE_DIAG_MISSING_ENTRY_POINT);
  CAE_TEST_CHECK(fails, cae_test_streq(d.message, "Program has no procedure named 'main'"));

  CAE_TEST_CHECK(fails, check_source("", &d) == CAE_E_VALIDATE);
  CAE_TEST_CHECK(fails, d.code == CAE_DIAG_MISSING_ENTRY_POINT);

  // An undefined reference is reported before a missing entry point.
  CAE_TEST_CHECK(fails, check_source("region r[1]; proc p: ghost;", &d) == CAE_E_VALIDATE);
  CAE_TEST_CHECK(fails, d.code == CAE_DIAG_UNDEFINED_NAME);
}

static void test_revalidate(int* fails) {
  cae_diag_t d = {};
  cae_program_t* prog = NULL;
  CAE_TEST_CHECK(fails, check_source("region main[1]; proc main: +;", &d, &prog) == CAE_OK);
  if (!prog) return;
  CAE_TEST_CHECK(fails, cae_validate_program(prog) == CAE_OK);
  CAE_TEST_CHECK(fails, prog->validated);
  cae_program_free(prog);

  CAE_TEST_CHECK(fails, cae_validate_program(NULL) == CAE_E_INVALID_ARG);
}

int cae_validate_run_selftest() {
  int fails = 0;
  test_resolves_ids(&fails);
  test_undefined_names(&fails);
  test_duplicates(&fails);
  test_entry_points(&fails);
  test_revalidate(&fails);
  return fails;
}

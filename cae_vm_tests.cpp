#include "cae_vm.h"
#include "cae_driver.h"
#include "cae_file.h"
#include "cae_parser.h"
#include "cae_selftest.h"

#include <string>

// One loaded program plus its captured I/O.
struct vm_fixture {
  cae_module_t mod;
  cae_membuf_t mb;
  cae_vm_stats_t stats;
  cae_diag_t diag;
  bool loaded;

  vm_fixture(const char* src, const char* input = "") : stats(), diag(), loaded(false) {
    cae_membuf_init(&mb, input, strlen(input));
    loaded = cae_load_source(src, strlen(src), &mod, &diag) == CAE_OK;
  }

  ~vm_fixture() {
    if (loaded) cae_module_destroy(&mod);
    cae_membuf_destroy(&mb);
  }

  cae_error_t run(const cae_vm_options_t* opts = NULL) {
    if (!loaded) return CAE_E_INVALID_ARG;
    cae_io_t io = cae_io_from_membuf(&mb);
    return cae_vm_run(mod.prog, &mod.store, &io, opts, &stats, &diag);
  }

  std::string output() const {
    if (!mb.out) return std::string();
    return std::string((const char*)mb.out, mb.out_len);
  }

  // Cell `index` of region `name`, or -1 when the region does not exist.
  int cell(const char* name, uint32_t index) {
    cae_region_t* r = loaded ? cae_region_store_find(&mod.store, name) : NULL;
    return r ? (int)cae_region_peek(r, index) : -1;
  }

  int head(const char* name) {
    cae_region_t* r = loaded ? cae_region_store_find(&mod.store, name) : NULL;
    return r ? (int)r->head : -1;
  }
};

static void test_back_reference(int* fails) {
  // blah runs on `foreign`; its `@$` call goes back to where blah was sent from.
  vm_fixture f(
    "region main[4]; region foreign[4];\n"
    "proc very_happy: \"2A;\n"
    "proc blah: very_happy@$;\n"
    "proc main: blah@foreign;\n");
  CAE_TEST_CHECK(fails, f.loaded);
  CAE_TEST_CHECK(fails, f.run() == CAE_OK);
  CAE_TEST_CHECK(fails, f.cell("main", 0) == 0x2A);
  CAE_TEST_CHECK(fails, f.cell("foreign", 0) == 0);

  vm_fixture anon(
    "region main[4]; region foreign[4];\n"
    "proc very_happy: \"2A;\n"
    "proc main: (very_happy@$)@foreign;\n");
  CAE_TEST_CHECK(fails, anon.run() == CAE_OK);
  CAE_TEST_CHECK(fails, anon.cell("main", 0) == 0x2A);
  CAE_TEST_CHECK(fails, anon.cell("foreign", 0) == 0);
}

static void test_call_clauses(int* fails) {
  // @R: origin becomes the caller's here.
  vm_fixture named(
    "region main[1]; region a[1]; region b[1];\n"
    "proc q: \"05 ^$;\n"
    "proc p: q@b;\n"
    "proc main: p@a;\n");
  CAE_TEST_CHECK(fails, named.run() == CAE_OK);
  CAE_TEST_CHECK(fails, named.cell("b", 0) == 5);
  CAE_TEST_CHECK(fails, named.cell("a", 0) == 5);
  CAE_TEST_CHECK(fails, named.cell("main", 0) == 0);

  // No clause: both bindings are inherited.
  vm_fixture inherit(
    "region main[1]; region a[1];\n"
    "proc q: \"07 ^$;\n"
    "proc p: q;\n"
    "proc main: p@a;\n");
  CAE_TEST_CHECK(fails, inherit.run() == CAE_OK);
  CAE_TEST_CHECK(fails, inherit.cell("a", 0) == 7);
  CAE_TEST_CHECK(fails, inherit.cell("main", 0) == 7);

  // At the entry point `$` is `main` itself.
  vm_fixture entry(
    "region main[2];\n"
    "proc p: +;\n"
    "proc main: p@$ p$ ^$ >&$;\n");
  CAE_TEST_CHECK(fails, entry.run() == CAE_OK);
  CAE_TEST_CHECK(fails, entry.cell("main", 0) == 2);
  CAE_TEST_CHECK(fails, entry.cell("main", 1) == 0);

  // A frame keeps its bindings after a callee returns.
  vm_fixture restore(
    "region main[1]; region a[1]; region b[1];\n"
    "proc inner: +;\n"
    "proc outer: inner@b \"09 ^$;\n"
    "proc main: outer@a;\n");
  CAE_TEST_CHECK(fails, restore.run() == CAE_OK);
  CAE_TEST_CHECK(fails, restore.cell("b", 0) == 1);
  CAE_TEST_CHECK(fails, restore.cell("a", 0) == 9);
  CAE_TEST_CHECK(fails, restore.cell("main", 0) == 9);
}

static void test_back_reference_in_loops(int* fails) {
  // An anonymous body inside a loop inherits both bindings, so `$` still
  // reaches the region `body` was sent from.
  vm_fixture f(
    "region main[1]; region f[1];\n"
    "proc put: +;\n"
    "proc body: \"03[- (put$)];\n"
    "proc main: body@f;\n");
  CAE_TEST_CHECK(fails, f.run() == CAE_OK);
  CAE_TEST_CHECK(fails, f.cell("main", 0) == 3);
  CAE_TEST_CHECK(fails, f.cell("f", 0) == 0);

  // A clause on the anonymous body rebinds `$` to the loop's region: the
  // send clears the counter in `f`, so the loop runs once.
  vm_fixture g(
    "region main[1]; region f[1]; region g[1];\n"
    "proc put: +;\n"
    "proc body: \"03[- put$ (\"00^$)@g];\n"
    "proc main: body@f;\n");
  CAE_TEST_CHECK(fails, g.run() == CAE_OK);
  CAE_TEST_CHECK(fails, g.cell("main", 0) == 1);
  CAE_TEST_CHECK(fails, g.cell("f", 0) == 0);
  CAE_TEST_CHECK(fails, g.cell("g", 0) == 0);
}

static void test_send_receive(int* fails) {
  vm_fixture f(
    "region main[4]; region other[4];\n"
    "proc bump: >>+++;\n"
    "proc main: \"11 ^other bump@other &other > &other;\n");
  CAE_TEST_CHECK(fails, f.run() == CAE_OK);
  // Only the head cells are touched and no head moves.
  CAE_TEST_CHECK(fails, f.cell("other", 0) == 0x11);
  CAE_TEST_CHECK(fails, f.cell("other", 2) == 3);
  CAE_TEST_CHECK(fails, f.head("other") == 2);
  CAE_TEST_CHECK(fails, f.cell("main", 0) == 3);
  CAE_TEST_CHECK(fails, f.cell("main", 1) == 3);
  CAE_TEST_CHECK(fails, f.head("main") == 1);

  // Receiving from yourself is a no-op.
  vm_fixture self("region main[1]; proc main: \"42 &main ^$;");
  CAE_TEST_CHECK(fails, self.run() == CAE_OK);
  CAE_TEST_CHECK(fails, self.cell("main", 0) == 0x42);
}

static void test_regions_are_independent(int* fails) {
  vm_fixture f(
    "region main[3]; region other[3];\n"
    "proc main: > (>>+)@other +;\n");
  CAE_TEST_CHECK(fails, f.run() == CAE_OK);
  CAE_TEST_CHECK(fails, f.head("main") == 1);
  CAE_TEST_CHECK(fails, f.cell("main", 1) == 1);
  CAE_TEST_CHECK(fails, f.head("other") == 2);
  CAE_TEST_CHECK(fails, f.cell("other", 2) == 1);

  // Heads wrap; `~` resets.
  vm_fixture wrap("region main[3]; proc main: <+ >>>+ ~+;");
  CAE_TEST_CHECK(fails, wrap.run() == CAE_OK);
  CAE_TEST_CHECK(fails, wrap.cell("main", 2) == 2);
  CAE_TEST_CHECK(fails, wrap.cell("main", 0) == 1);
  CAE_TEST_CHECK(fails, wrap.head("main") == 0);

  vm_fixture bytes("region main[1]; proc main: - .;");
  CAE_TEST_CHECK(fails, bytes.run() == CAE_OK);
  CAE_TEST_CHECK(fails, bytes.output() == std::string("\xff"));
}

static void test_loops(int* fails) {
  vm_fixture move("region main[2]; proc main: \"05[->+<];");
  CAE_TEST_CHECK(fails, move.run() == CAE_OK);
  CAE_TEST_CHECK(fails, move.cell("main", 0) == 0);
  CAE_TEST_CHECK(fails, move.cell("main", 1) == 5);

  // A loop whose entry byte is zero is skipped: one step for the test.
  vm_fixture skip("region main[1]; proc main: [+];");
  CAE_TEST_CHECK(fails, skip.run() == CAE_OK);
  CAE_TEST_CHECK(fails, skip.cell("main", 0) == 0);
  CAE_TEST_CHECK(fails, skip.stats.steps == 1);

  // + , loop test, - , re-test
  vm_fixture once("region main[1]; proc main: +[-];");
  CAE_TEST_CHECK(fails, once.run() == CAE_OK);
  CAE_TEST_CHECK(fails, once.stats.steps == 4);

  // The loop tests the frame's own region even when the body calls elsewhere.
  vm_fixture nested(
    "region main[1]; region acc[1];\n"
    "proc main: \"03[- (+)@acc];\n");
  CAE_TEST_CHECK(fails, nested.run() == CAE_OK);
  CAE_TEST_CHECK(fails, nested.cell("acc", 0) == 3);
  CAE_TEST_CHECK(fails, nested.stats.calls == 4);
}

static void test_adder(int* fails) {
  const char* src =
    "region main[3]; region ascii[2];\n"
    "proc read_digit: , >&ascii[-<->]<;\n"
    "proc add: >[-<+>]<;\n"
    "proc print_byte: >&ascii[-<+>]<.;\n"
    "proc main: (~\"30)@ascii read_digit > read_digit < add print_byte;\n";
  vm_fixture f(src, "34");
  CAE_TEST_CHECK(fails, f.run() == CAE_OK);
  CAE_TEST_CHECK(fails, f.output() == "7");
  CAE_TEST_CHECK(fails, f.cell("ascii", 0) == 0x30);

  vm_fixture g(src, "52");
  CAE_TEST_CHECK(fails, g.run() == CAE_OK);
  CAE_TEST_CHECK(fails, g.output() == "7");
}

static void test_output_collaborator(int* fails) {
  vm_fixture hello("region main[1]; proc main: \"48. \"69. \"0A.;");
  CAE_TEST_CHECK(fails, hello.run() == CAE_OK);
  CAE_TEST_CHECK(fails, hello.output() == "Hi\n");

  struct failing_writer {
    static int write(void*, uint8_t) { return 0; }
  };
  vm_fixture f("region main[1]; proc main: + . +;");
  cae_io_t io = cae_io_from_membuf(&f.mb);
  io.write = failing_writer::write;
  CAE_TEST_CHECK(fails, cae_vm_run(f.mod.prog, &f.mod.store, &io, NULL, &f.stats, &f.diag) == CAE_E_OUTPUT_FAILED);
  CAE_TEST_CHECK(fails, f.diag.code == CAE_DIAG_OUTPUT_FAILED);
  // Execution stops at the failing instruction.
  CAE_TEST_CHECK(fails, f.cell("main", 0) == 1);
}

static void test_eof_policies(int* fails) {
  const char* src = "region main[2]; proc main: \"09 , > ,;";
  cae_vm_options_t opts;

  cae_vm_options_init(&opts);
  CAE_TEST_CHECK(fails, opts.eof_policy == CAE_EOF_ZERO);
  vm_fixture zero(src, "A");
  CAE_TEST_CHECK(fails, zero.run(&opts) == CAE_OK);
  CAE_TEST_CHECK(fails, zero.cell("main", 0) == 'A');
  CAE_TEST_CHECK(fails, zero.cell("main", 1) == 0);

  // KEEP leaves the cell alone.
  vm_fixture keep("region main[1]; proc main: \"09 ,;");
  opts.eof_policy = CAE_EOF_KEEP;
  CAE_TEST_CHECK(fails, keep.run(&opts) == CAE_OK);
  CAE_TEST_CHECK(fails, keep.cell("main", 0) == 9);

  vm_fixture zero_empty("region main[1]; proc main: \"09 ,;");
  opts.eof_policy = CAE_EOF_ZERO;
  CAE_TEST_CHECK(fails, zero_empty.run(&opts) == CAE_OK);
  CAE_TEST_CHECK(fails, zero_empty.cell("main", 0) == 0);

  vm_fixture error(src, "A");
  opts.eof_policy = CAE_EOF_ERROR;
  CAE_TEST_CHECK(fails, error.run(&opts) == CAE_E_INPUT_EXHAUSTED);
  CAE_TEST_CHECK(fails, error.diag.code == CAE_DIAG_INPUT_EXHAUSTED);
  CAE_TEST_CHECK(fails, error.diag.span.line == 1 && error.diag.span.col == 36);
  CAE_TEST_CHECK(fails, error.cell("main", 0) == 'A');

  cae_eof_policy_t p = CAE_EOF_ZERO;
  CAE_TEST_CHECK(fails, cae_parse_eof_policy("keep", &p) && p == CAE_EOF_KEEP);
  CAE_TEST_CHECK(fails, cae_parse_eof_policy("error", &p) && p == CAE_EOF_ERROR);
  CAE_TEST_CHECK(fails, !cae_parse_eof_policy("eof", &p));
  CAE_TEST_CHECK(fails, cae_test_streq(cae_eof_policy_str(CAE_EOF_ZERO), "zero"));
}

static void test_limits(int* fails) {
  cae_vm_options_t opts;
  cae_vm_options_init(&opts);

  opts.step_limit = 1000;
  vm_fixture spin("region main[1]; proc main: +[];");
  CAE_TEST_CHECK(fails, spin.run(&opts) == CAE_E_STEP_LIMIT);
  CAE_TEST_CHECK(fails, spin.diag.code == CAE_DIAG_STEP_LIMIT);
  CAE_TEST_CHECK(fails, spin.stats.steps == 1000);
  // The stop lands on a loop re-test, reported at the `[`.
  CAE_TEST_CHECK(fails, spin.diag.span.line == 1 && spin.diag.span.col == 29);

  // A program that finishes within the limit is unaffected.
  opts.step_limit = 4;
  vm_fixture fits("region main[1]; proc main: +[-];");
  CAE_TEST_CHECK(fails, fits.run(&opts) == CAE_OK);

  cae_vm_options_init(&opts);
  opts.max_call_depth = 64;
  vm_fixture deep("region main[1]; proc main: + main;");
  CAE_TEST_CHECK(fails, deep.run(&opts) == CAE_E_DEPTH_LIMIT);
  CAE_TEST_CHECK(fails, deep.diag.code == CAE_DIAG_DEPTH_LIMIT);
  CAE_TEST_CHECK(fails, cae_test_streq(deep.diag.symbol, "main"));
  CAE_TEST_CHECK(fails, deep.stats.max_depth == 64);
  CAE_TEST_CHECK(fails, deep.cell("main", 0) == 64);

  // Bounded recursion through a loop: count down from 5.
  vm_fixture countdown(
    "region main[2];\n"
    "proc down: [- >+< down];\n"
    "proc main: \"05 down;\n");
  CAE_TEST_CHECK(fails, countdown.run(&opts) == CAE_OK);
  CAE_TEST_CHECK(fails, countdown.cell("main", 1) == 5);
  CAE_TEST_CHECK(fails, countdown.stats.max_depth == 7);
}

static void test_trace_and_rerun(int* fails) {
  FILE* tf = tmpfile();
  CAE_TEST_CHECK(fails, tf != NULL);
  if (!tf) return;

  cae_vm_options_t opts;
  cae_vm_options_init(&opts);
  opts.trace = tf;
  vm_fixture f("region main[1]; region a[1]; proc p: +; proc main: p@a;");
  CAE_TEST_CHECK(fails, f.run(&opts) == CAE_OK);

  char buf[256] = {};
  rewind(tf);
  size_t n = fread(buf, 1, sizeof(buf) - 1, tf);
  fclose(tf);
  buf[n] = 0;
  CAE_TEST_CHECK(fails, strstr(buf, "cae: call main here=main origin=main depth=1") != NULL);
  CAE_TEST_CHECK(fails, strstr(buf, "cae: call p here=a origin=main depth=2") != NULL);

  // Same store, reset between runs: identical results.
  CAE_TEST_CHECK(fails, f.cell("a", 0) == 1);
  cae_region_store_reset(&f.mod.store);
  CAE_TEST_CHECK(fails, f.run() == CAE_OK);
  CAE_TEST_CHECK(fails, f.cell("a", 0) == 1);
  CAE_TEST_CHECK(fails, f.stats.calls == 2);
}

static void test_rejects_unloaded_program(int* fails) {
  cae_program_t* prog = NULL;
  CAE_TEST_CHECK(fails, cae_parse_source("region main[1]; proc main:;", &prog) == CAE_OK);
  cae_region_store_t store = {};
  cae_membuf_t mb;
  cae_membuf_init(&mb, NULL, 0);
  cae_io_t io = cae_io_from_membuf(&mb);
  CAE_TEST_CHECK(fails, cae_vm_run(prog, &store, &io, NULL, NULL, NULL) == CAE_E_INVALID_ARG);
  CAE_TEST_CHECK(fails, cae_vm_run(NULL, &store, &io, NULL, NULL, NULL) == CAE_E_INVALID_ARG);
  cae_program_free(prog);
  cae_membuf_destroy(&mb);

  // Load failures never produce a runnable module.
  cae_diag_t d = {};
  cae_module_t mod;
  const char* undefined_call = "region main[1]; proc main: nope;";
  CAE_TEST_CHECK(fails, cae_load_source(undefined_call, strlen(undefined_call), &mod, &d) == CAE_E_VALIDATE);
  CAE_TEST_CHECK(fails, mod.prog == NULL);
  const char* bad_scope = "proc main: ([)];";
  CAE_TEST_CHECK(fails, cae_run_source(bad_scope, strlen(bad_scope), &io, NULL, NULL, &d) == CAE_E_PARSE);
  CAE_TEST_CHECK(fails, d.code == CAE_DIAG_BRACKET_SCOPE);

  CAE_TEST_CHECK(fails, cae_load_file("no/such/dir/program.cae", &mod, &d) == CAE_E_IO);
  CAE_TEST_CHECK(fails, mod.prog == NULL);
  CAE_TEST_CHECK(fails, cae_file_last_error()[0] != 0);
}

int cae_vm_run_selftest() {
  int fails = 0;
  test_back_reference(&fails);
  test_call_clauses(&fails);
  test_back_reference_in_loops(&fails);
  test_send_receive(&fails);
  test_regions_are_independent(&fails);
  test_loops(&fails);
  test_adder(&fails);
  test_output_collaborator(&fails);
  test_eof_policies(&fails);
  test_limits(&fails);
  test_trace_and_rerun(&fails);
  test_rejects_unloaded_program(&fails);
  return fails;
}

#include "cae_region.h"
#include "cae_ast.h"
#include "cae_parser.h"
#include "cae_symtab.h"
#include "cae_validate.h"
#include "cae_selftest.h"

static cae_program_t* load_program(const char* src) {
  cae_program_t* prog = NULL;
  if (cae_parse_source(src, &prog) != CAE_OK) return NULL;
  if (cae_validate_program(prog) != CAE_OK) {
    cae_program_free(prog);
    return NULL;
  }
  return prog;
}

static void test_symtab(int* fails) {
  cae_symtab_t st;
  CAE_TEST_CHECK(fails, cae_symtab_init(&st, 2));
  CAE_TEST_CHECK(fails, cae_symtab_insert(&st, "alpha", 1) == 1);
  CAE_TEST_CHECK(fails, cae_symtab_insert(&st, "beta", 2) == 1);
  CAE_TEST_CHECK(fails, cae_symtab_insert(&st, "gamma", 3) == 1);
  CAE_TEST_CHECK(fails, cae_symtab_insert(&st, "alpha", 9) == 0);

  uint32_t v = 0;
  CAE_TEST_CHECK(fails, cae_symtab_get(&st, "alpha", &v) && v == 1);
  CAE_TEST_CHECK(fails, cae_symtab_get(&st, "gamma", &v) && v == 3);
  CAE_TEST_CHECK(fails, !cae_symtab_get(&st, "delta", &v));
  CAE_TEST_CHECK(fails, st.size == 3);

  cae_symtab_destroy(&st);
  CAE_TEST_CHECK(fails, !cae_symtab_get(&st, "alpha", &v));
}

static void test_store_layout(int* fails) {
  cae_program_t* prog = load_program("region main[3]; region big[1000]; region one[1]; proc main:;");
  CAE_TEST_CHECK(fails, prog != NULL);
  if (!prog) return;

  cae_region_store_t store;
  CAE_TEST_CHECK(fails, cae_region_store_init(&store, prog) == CAE_OK);
  CAE_TEST_CHECK(fails, store.count == 3);

  cae_region_t* big = cae_region_store_find(&store, "big");
  CAE_TEST_CHECK(fails, big != NULL && big == cae_region_store_get(&store, 1));
  if (big) {
    CAE_TEST_CHECK(fails, big->capacity == 1000 && big->head == 0);
    int all_zero = 1;
    for (uint32_t i = 0; i < big->capacity; i++) all_zero &= big->cells[i] == 0;
    CAE_TEST_CHECK(fails, all_zero);
  }
  CAE_TEST_CHECK(fails, cae_region_store_find(&store, "missing") == NULL);
  CAE_TEST_CHECK(fails, cae_region_store_get(&store, 3) == NULL);

  cae_region_store_destroy(&store);
  CAE_TEST_CHECK(fails, store.count == 0 && store.regions == NULL);
  cae_program_free(prog);
}

static void test_unvalidated_program_rejected(int* fails) {
  cae_program_t* prog = NULL;
  CAE_TEST_CHECK(fails, cae_parse_source("region main[3]; proc main:;", &prog) == CAE_OK);
  cae_region_store_t store;
  CAE_TEST_CHECK(fails, cae_region_store_init(&store, prog) == CAE_E_INVALID_ARG);
  cae_region_store_destroy(&store);
  cae_program_free(prog);
}

static void test_byte_and_head_wrap(int* fails) {
  cae_program_t* prog = load_program("region main[4]; region one[1]; proc main:;");
  if (!prog) {
    CAE_TEST_CHECK(fails, prog != NULL);
    return;
  }
  cae_region_store_t store;
  CAE_TEST_CHECK(fails, cae_region_store_init(&store, prog) == CAE_OK);
  cae_region_t* r = cae_region_store_find(&store, "main");
  cae_region_t* one = cae_region_store_find(&store, "one");
  if (!r || !one) {
    CAE_TEST_CHECK(fails, r && one);
    cae_region_store_destroy(&store);
    cae_program_free(prog);
    return;
  }

  // 0 - 1 wraps to 255 and back.
  cae_region_add(r, -1);
  CAE_TEST_CHECK(fails, cae_region_read(r) == 255);
  cae_region_add(r, 1);
  CAE_TEST_CHECK(fails, cae_region_read(r) == 0);
  cae_region_write(r, 255);
  cae_region_add(r, 1);
  CAE_TEST_CHECK(fails, cae_region_read(r) == 0);

  // Head wraps in both directions.
  cae_region_move(r, -1);
  CAE_TEST_CHECK(fails, r->head == 3);
  cae_region_move(r, 1);
  CAE_TEST_CHECK(fails, r->head == 0);
  cae_region_move(r, 4 * 1000 + 2);
  CAE_TEST_CHECK(fails, r->head == 2);
  cae_region_move(r, -7);
  CAE_TEST_CHECK(fails, r->head == 3);

  cae_region_write(r, 0x2A);
  CAE_TEST_CHECK(fails, cae_region_peek(r, 3) == 0x2A);
  CAE_TEST_CHECK(fails, cae_region_peek(r, 7) == 0x2A);
  cae_region_reset_head(r);
  CAE_TEST_CHECK(fails, r->head == 0);
  cae_region_poke(r, 5, 9);
  CAE_TEST_CHECK(fails, r->cells[1] == 9);

  // A one-cell region never moves.
  cae_region_move(one, 1);
  CAE_TEST_CHECK(fails, one->head == 0);
  cae_region_move(one, -1);
  CAE_TEST_CHECK(fails, one->head == 0);

  cae_region_store_reset(&store);
  CAE_TEST_CHECK(fails, r->cells[1] == 0 && r->cells[3] == 0 && r->head == 0);

  cae_region_store_destroy(&store);
  cae_program_free(prog);
}

int cae_region_run_selftest() {
  int fails = 0;
  test_symtab(&fails);
  test_store_layout(&fails);
  test_unvalidated_program_rejected(&fails);
  test_byte_and_head_wrap(&fails);
  return fails;
}

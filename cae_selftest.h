#pragma once

#include <stdio.h>
#include <string.h>

// Selftest helpers shared by the cae_*_tests.cpp files.
//
// Each test function takes an `int* fails` counter; CAE_TEST_CHECK reports a
// failed expectation on stderr and bumps the counter instead of aborting, so a
// single --selftest run lists every broken check.

#define CAE_TEST_CHECK(fails, expr) \
  do { \
    if (!(expr)) { \
      fprintf(stderr, "[SELFTEST] %s:%d: check failed: %s\n", __FILE__, __LINE__, #expr); \
      (*(fails))++; \
    } \
  } while (0)

#define CAE_TEST_CHECK_MSG(fails, expr, msg) \
  do { \
    if (!(expr)) { \
      fprintf(stderr, "[SELFTEST] %s:%d: check failed: %s (%s)\n", __FILE__, __LINE__, #expr, (msg)); \
      (*(fails))++; \
    } \
  } while (0)

static inline int cae_test_streq(const char* a, const char* b) {
  if (!a || !b) return 0;
  return strcmp(a, b) == 0;
}

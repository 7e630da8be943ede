#pragma once

#include <stddef.h>
#include <stdint.h>

#include "cae_common.h"
#include "cae_symtab.h"

struct cae_program_s;

// Fixed-size wrapping byte buffer with a head.
// Byte arithmetic wraps in [0,256); head moves wrap in [0, capacity).
typedef struct cae_region_s {
  char* name;
  uint8_t* cells;
  uint32_t capacity; // >= 1
  uint32_t head;     // < capacity
} cae_region_t;

// Every region of a program, allocated once at load time and indexed by the
// ids the validator assigned.
typedef struct cae_region_store_s {
  cae_region_t* regions;
  uint32_t count;
  cae_symtab_t by_name;
} cae_region_store_t;

// Allocates one zeroed region per declaration of a validated program.
cae_error_t cae_region_store_init(cae_region_store_t* store, const struct cae_program_s* prog);
void cae_region_store_destroy(cae_region_store_t* store);

// Zeroes every cell and head without reallocating.
void cae_region_store_reset(cae_region_store_t* store);

cae_region_t* cae_region_store_get(cae_region_store_t* store, uint32_t id);
cae_region_t* cae_region_store_find(cae_region_store_t* store, const char* name);

// Head operations
uint8_t cae_region_read(const cae_region_t* r);
void cae_region_write(cae_region_t* r, uint8_t value);
void cae_region_add(cae_region_t* r, int delta);
void cae_region_move(cae_region_t* r, int64_t delta);
void cae_region_reset_head(cae_region_t* r);

// Raw indexed access; index is taken modulo capacity.
uint8_t cae_region_peek(const cae_region_t* r, uint64_t index);
void cae_region_poke(cae_region_t* r, uint64_t index, uint8_t value);

// Region store selftest; returns the number of failed checks.
int cae_region_run_selftest();

#pragma once

#include <stddef.h>
#include <stdint.h>

// Name -> index table used for region and procedure lookup.
// Keys are copied on insert.

typedef struct cae_symtab_entry_s {
  char* key;
  uint32_t value;
  struct cae_symtab_entry_s* next;
} cae_symtab_entry_t;

typedef struct cae_symtab_s {
  cae_symtab_entry_t** buckets;
  size_t bucket_count;
  size_t size;
} cae_symtab_t;

// Returns 0 on allocation failure.
int cae_symtab_init(cae_symtab_t* st, size_t initial_capacity);

// Returns 1 if inserted, 0 if the key already exists (value untouched), -1 on OOM.
int cae_symtab_insert(cae_symtab_t* st, const char* key, uint32_t value);

// Returns 1 and stores the value when found.
int cae_symtab_get(const cae_symtab_t* st, const char* key, uint32_t* out_value);

void cae_symtab_destroy(cae_symtab_t* st);

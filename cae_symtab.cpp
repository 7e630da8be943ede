#include "cae_symtab.h"
#include <stdlib.h>
#include <string.h>

#define HASH_SEED 5381

static size_t hash_str(const char* key) {
  // djb2
  size_t h = HASH_SEED;
  for (const unsigned char* p = (const unsigned char*)key; *p; p++) {
    h = ((h << 5) + h) + *p;
  }
  return h;
}

int cae_symtab_init(cae_symtab_t* st, size_t initial_capacity) {
  if (!st) return 0;
  if (initial_capacity == 0) initial_capacity = 16;
  st->bucket_count = initial_capacity;
  st->buckets = (cae_symtab_entry_t**)calloc(initial_capacity, sizeof(cae_symtab_entry_t*));
  st->size = 0;
  return st->buckets != NULL;
}

static cae_symtab_entry_t* find_entry(const cae_symtab_t* st, const char* key) {
  size_t idx = hash_str(key) % st->bucket_count;
  cae_symtab_entry_t* entry = st->buckets[idx];
  while (entry) {
    if (strcmp(entry->key, key) == 0) return entry;
    entry = entry->next;
  }
  return NULL;
}

int cae_symtab_insert(cae_symtab_t* st, const char* key, uint32_t value) {
  if (!st || !st->buckets || !key) return -1;
  if (find_entry(st, key)) return 0;

  size_t len = strlen(key);
  cae_symtab_entry_t* entry = (cae_symtab_entry_t*)malloc(sizeof(cae_symtab_entry_t));
  if (!entry) return -1;
  entry->key = (char*)malloc(len + 1);
  if (!entry->key) {
    free(entry);
    return -1;
  }
  memcpy(entry->key, key, len + 1);
  entry->value = value;

  size_t idx = hash_str(key) % st->bucket_count;
  entry->next = st->buckets[idx];
  st->buckets[idx] = entry;
  st->size++;
  return 1;
}

int cae_symtab_get(const cae_symtab_t* st, const char* key, uint32_t* out_value) {
  if (!st || !st->buckets || !key) return 0;
  cae_symtab_entry_t* entry = find_entry(st, key);
  if (!entry) return 0;
  if (out_value) *out_value = entry->value;
  return 1;
}

void cae_symtab_destroy(cae_symtab_t* st) {
  if (!st || !st->buckets) return;
  for (size_t i = 0; i < st->bucket_count; i++) {
    cae_symtab_entry_t* entry = st->buckets[i];
    while (entry) {
      cae_symtab_entry_t* next = entry->next;
      free(entry->key);
      free(entry);
      entry = next;
    }
  }
  free(st->buckets);
  st->buckets = NULL;
  st->bucket_count = 0;
  st->size = 0;
}

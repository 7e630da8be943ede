#include "cae_region.h"
#include "cae_ast.h"

#include <stdlib.h>
#include <string.h>

// -----------------------------------------------------------------------------
// cae_region.cpp
//
// Region memory. Buffers are allocated zeroed at load time and never resized;
// all index and value arithmetic is modular so no head operation can fault.
// -----------------------------------------------------------------------------

static char* dup_name(const std::string& s) {
  char* p = (char*)malloc(s.size() + 1);
  if (!p) return NULL;
  memcpy(p, s.c_str(), s.size() + 1);
  return p;
}

cae_error_t cae_region_store_init(cae_region_store_t* store, const struct cae_program_s* prog) {
  if (!store || !prog) return CAE_E_INVALID_ARG;
  memset(store, 0, sizeof(*store));
  if (!prog->validated) return CAE_E_INVALID_ARG;

  uint32_t n = (uint32_t)prog->regions.size();
  if (!cae_symtab_init(&store->by_name, (size_t)n * 2 + 1)) return CAE_E_OUT_OF_MEMORY;

  store->regions = (cae_region_t*)calloc(n ? n : 1, sizeof(cae_region_t));
  if (!store->regions) {
    cae_region_store_destroy(store);
    return CAE_E_OUT_OF_MEMORY;
  }

  for (uint32_t i = 0; i < n; i++) {
    const cae::region_decl& decl = prog->regions[i];
    cae_region_t* r = &store->regions[i];
    store->count = i + 1;

    r->name = dup_name(decl.name);
    r->cells = (uint8_t*)calloc(decl.capacity, 1);
    r->capacity = decl.capacity;
    r->head = 0;
    if (!r->name || !r->cells || cae_symtab_insert(&store->by_name, decl.name.c_str(), i) < 0) {
      cae_region_store_destroy(store);
      return CAE_E_OUT_OF_MEMORY;
    }
  }
  return CAE_OK;
}

void cae_region_store_destroy(cae_region_store_t* store) {
  if (!store) return;
  for (uint32_t i = 0; i < store->count; i++) {
    free(store->regions[i].name);
    free(store->regions[i].cells);
  }
  free(store->regions);
  cae_symtab_destroy(&store->by_name);
  memset(store, 0, sizeof(*store));
}

void cae_region_store_reset(cae_region_store_t* store) {
  if (!store) return;
  for (uint32_t i = 0; i < store->count; i++) {
    cae_region_t* r = &store->regions[i];
    memset(r->cells, 0, r->capacity);
    r->head = 0;
  }
}

cae_region_t* cae_region_store_get(cae_region_store_t* store, uint32_t id) {
  if (!store || id >= store->count) return NULL;
  return &store->regions[id];
}

cae_region_t* cae_region_store_find(cae_region_store_t* store, const char* name) {
  uint32_t id = CAE_INVALID_ID;
  if (!store || !cae_symtab_get(&store->by_name, name, &id)) return NULL;
  return cae_region_store_get(store, id);
}

uint8_t cae_region_read(const cae_region_t* r) {
  return r->cells[r->head];
}

void cae_region_write(cae_region_t* r, uint8_t value) {
  r->cells[r->head] = value;
}

void cae_region_add(cae_region_t* r, int delta) {
  r->cells[r->head] = (uint8_t)(r->cells[r->head] + delta);
}

void cae_region_move(cae_region_t* r, int64_t delta) {
  int64_t cap = (int64_t)r->capacity;
  int64_t h = ((int64_t)r->head + delta % cap) % cap;
  if (h < 0) h += cap;
  r->head = (uint32_t)h;
}

void cae_region_reset_head(cae_region_t* r) {
  r->head = 0;
}

uint8_t cae_region_peek(const cae_region_t* r, uint64_t index) {
  return r->cells[index % r->capacity];
}

void cae_region_poke(cae_region_t* r, uint64_t index, uint8_t value) {
  r->cells[index % r->capacity] = value;
}

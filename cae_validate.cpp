#include "cae_validate.h"
#include "cae_symtab.h"
#include "cae_diag.h"
#include <stdio.h>
#include <string.h>

typedef struct cae_names_s {
  cae_symtab_t regions;
  cae_symtab_t procs;
} cae_names_t;

static void names_destroy(cae_names_t* n) {
  cae_symtab_destroy(&n->regions);
  cae_symtab_destroy(&n->procs);
}

static void undefined(cae_diag_t* d, const char* what, const std::string& name, cae_span_t span) {
  char msg[160];
  snprintf(msg, sizeof(msg), "Undefined %s '%s'", what, name.c_str());
  cae_diag_set_symbol(d, CAE_DIAG_UNDEFINED_NAME, span, msg, name.c_str());
}

static int resolve_ref(const cae_names_t* n, cae::region_ref* r, cae_diag_t* d) {
  if (r->kind != cae::ref_kind::named) return 1;
  uint32_t id = CAE_INVALID_ID;
  if (!cae_symtab_get(&n->regions, r->name.c_str(), &id)) {
    undefined(d, "region", r->name, r->span);
    return 0;
  }
  r->id = id;
  return 1;
}

static int resolve_body(const cae_names_t* n, std::vector<cae::instruction>& body, cae_diag_t* d) {
  for (cae::instruction& in : body) {
    switch (in.kind) {
      case cae::op_kind::send:
      case cae::op_kind::receive:
        if (!resolve_ref(n, &in.target, d)) return 0;
        break;

      case cae::op_kind::call:
        if (!in.anonymous_callee) {
          uint32_t id = CAE_INVALID_ID;
          if (!cae_symtab_get(&n->procs, in.callee.c_str(), &id)) {
            undefined(d, "procedure", in.callee, in.span);
            return 0;
          }
          in.callee_id = id;
        }
        if (!resolve_ref(n, &in.target, d)) return 0;
        break;

      case cae::op_kind::loop:
        if (!resolve_body(n, in.body, d)) return 0;
        break;

      default:
        break;
    }
  }
  return 1;
}

static int declare_names(cae_program_t* prog, cae_names_t* n, cae_diag_t* d) {
  for (size_t i = 0; i < prog->regions.size(); i++) {
    const cae::region_decl& r = prog->regions[i];
    int rc = cae_symtab_insert(&n->regions, r.name.c_str(), (uint32_t)i);
    if (rc < 0) return -1;
    if (rc == 0) {
      char msg[160];
      snprintf(msg, sizeof(msg), "Region '%s' is declared more than once", r.name.c_str());
      cae_diag_set_symbol(d, CAE_DIAG_DUPLICATE_NAME, r.span, msg, r.name.c_str());
      return 0;
    }
  }

  for (size_t i = 0; i < prog->procs.size(); i++) {
    const cae::procedure& p = prog->procs[i];
    if (p.anonymous) continue;
    int rc = cae_symtab_insert(&n->procs, p.name.c_str(), (uint32_t)i);
    if (rc < 0) return -1;
    if (rc == 0) {
      char msg[160];
      snprintf(msg, sizeof(msg), "Procedure '%s' is declared more than once", p.name.c_str());
      cae_diag_set_symbol(d, CAE_DIAG_DUPLICATE_NAME, p.span, msg, p.name.c_str());
      return 0;
    }
  }
  return 1;
}

cae_error_t cae_validate_program_ex(cae_program_t* prog, cae_diag_t* out_diag) {
  if (!prog) return CAE_E_INVALID_ARG;

  cae_diag_t local = {};
  cae_diag_t* d = out_diag ? out_diag : &local;
  cae_diag_clear(d);
  prog->validated = false;

  cae_names_t n;
  memset(&n, 0, sizeof(n));
  size_t region_buckets = prog->regions.size() * 2 + 1;
  size_t proc_buckets = prog->procs.size() * 2 + 1;
  if (!cae_symtab_init(&n.regions, region_buckets) || !cae_symtab_init(&n.procs, proc_buckets)) {
    names_destroy(&n);
    return CAE_E_OUT_OF_MEMORY;
  }

  int rc = declare_names(prog, &n, d);
  if (rc <= 0) {
    names_destroy(&n);
    return rc < 0 ? CAE_E_OUT_OF_MEMORY : CAE_E_VALIDATE;
  }

  for (cae::procedure& p : prog->procs) {
    if (!resolve_body(&n, p.body, d)) {
      names_destroy(&n);
      return CAE_E_VALIDATE;
    }
  }

  uint32_t main_region = CAE_INVALID_ID;
  uint32_t main_proc = CAE_INVALID_ID;
  int has_region = cae_symtab_get(&n.regions, "main", &main_region);
  int has_proc = cae_symtab_get(&n.procs, "main", &main_proc);
  names_destroy(&n);

  if (!has_region) {
    cae_diag_set_symbol(d, CAE_DIAG_MISSING_ENTRY_POINT, cae_span_from_token(0, 0, 0),
                        "Program has no region named 'main'", "main");
    return CAE_E_VALIDATE;
  }
  if (!has_proc) {
    cae_diag_set_symbol(d, CAE_DIAG_MISSING_ENTRY_POINT, cae_span_from_token(0, 0, 0),
                        "Program has no procedure named 'main'", "main");
    return CAE_E_VALIDATE;
  }

  prog->main_region = main_region;
  prog->main_proc = main_proc;
  prog->validated = true;
  return CAE_OK;
}

cae_error_t cae_validate_program(cae_program_t* prog) {
  return cae_validate_program_ex(prog, NULL);
}

#pragma once

#include "cae_common.h"
#include "cae_ast.h"
#include "cae_diag.h"

// Name resolution for a parsed cae program.
// Rejects duplicate region/procedure names, undefined references and a
// missing `main` region or procedure. On success every named reference in
// the tree carries its resolved id and prog->validated is set.

cae_error_t cae_validate_program(cae_program_t* prog);
cae_error_t cae_validate_program_ex(cae_program_t* prog, cae_diag_t* out_diag);

// Validator selftest; returns the number of failed checks.
int cae_validate_run_selftest();

#pragma once

#include "cae_common.h"
#include "cae_ast.h"
#include "cae_diag.h"

// Parser for cae source code
// Parses a string into a program (regions + procedures). Names are not
// resolved here; run cae_validate_program on the result before executing it.
//
// Returns CAE_E_LEX or CAE_E_PARSE on failure; *out_prog is left NULL.

// Loops and anonymous bodies nested deeper than this are a parse error.
#define CAE_PARSER_MAX_NESTING 1024u

cae_error_t cae_parse_source(const char* source, cae_program_t** out_prog);
cae_error_t cae_parse_source_ex(const char* source, cae_program_t** out_prog, cae_diag_t* out_diag);

// Length-aware variant (recommended for file input)
cae_error_t cae_parse_source_len_ex(const char* source, size_t len, cae_program_t** out_prog, cae_diag_t* out_diag);

// Parser selftest; returns the number of failed checks.
int cae_parser_run_selftest();

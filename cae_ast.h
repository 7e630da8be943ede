// cae_ast.h
// Program model for cae: region declarations, procedures (named and
// anonymous) and the instruction tree.
//
// Notes:
//   - Procedures live in one table indexed by proc_id. Anonymous bodies are
//     entries with `anonymous = true`; the call instruction at their
//     definition site already holds their proc_id after parsing.
//   - Named references (call targets, region clauses, send/receive targets)
//     carry the source name until the validator fills in the id.
//   - The tree is immutable once validated; the engine only reads it.

#pragma once
#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

#include "cae_common.h"
#include "cae_diag.h"

namespace cae {

    using region_id = uint32_t;
    using proc_id = uint32_t;

    enum class op_kind : uint8_t {
        increment,   // +
        decrement,   // -
        move_right,  // >
        move_left,   // <
        reset_head,  // ~
        write_byte,  // "XX
        output,      // .
        input,       // ,
        loop,        // [ ... ]
        send,        // ^ref
        receive,     // &ref
        call         // name[@ref] | ( ... )[@ref]
    };

    enum class ref_kind : uint8_t {
        none,   // no clause: stay in `here`
        named,  // @name
        back    // @$ or $
    };

    struct region_ref {
        ref_kind kind = ref_kind::none;
        std::string name;               // named only
        region_id id = CAE_INVALID_ID;  // named only, set by the validator
        cae_span_t span = {};
    };

    struct instruction {
        op_kind kind = op_kind::increment;
        cae_span_t span = {};

        uint8_t byte = 0;                  // write_byte
        std::vector<instruction> body;     // loop
        region_ref target;                 // send / receive / call clause

        std::string callee;                // call to a named procedure
        proc_id callee_id = CAE_INVALID_ID;
        bool anonymous_callee = false;
    };

    struct procedure {
        std::string name;          // display name; "<parent>/anon#N" when anonymous
        bool anonymous = false;
        proc_id parent = CAE_INVALID_ID;
        cae_span_t span = {};
        std::vector<instruction> body;
    };

    struct region_decl {
        std::string name;
        uint32_t capacity = 0;
        cae_span_t span = {};
    };

    const char* op_kind_str(op_kind k);

} // namespace cae

struct cae_program_s {
    std::vector<cae::region_decl> regions;   // declaration order
    std::vector<cae::procedure> procs;       // named and anonymous
    cae::region_id main_region = CAE_INVALID_ID;
    cae::proc_id main_proc = CAE_INVALID_ID;
    bool validated = false;
};

typedef struct cae_program_s cae_program_t;

void cae_program_free(cae_program_t* prog);

// Number of named (non-anonymous) procedures.
size_t cae_program_named_proc_count(const cae_program_t* prog);

// Writes an indented instruction tree for every procedure.
void cae_program_dump(const cae_program_t* prog, FILE* out);

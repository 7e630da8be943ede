#include "cae_ast.h"

namespace cae {

const char* op_kind_str(op_kind k) {
    switch (k) {
        case op_kind::increment: return "increment";
        case op_kind::decrement: return "decrement";
        case op_kind::move_right: return "move-right";
        case op_kind::move_left: return "move-left";
        case op_kind::reset_head: return "reset-head";
        case op_kind::write_byte: return "write-byte";
        case op_kind::output: return "output";
        case op_kind::input: return "input";
        case op_kind::loop: return "loop";
        case op_kind::send: return "send";
        case op_kind::receive: return "receive";
        case op_kind::call: return "call";
    }
    return "?";
}

} // namespace cae

void cae_program_free(cae_program_t* prog) {
    delete prog;
}

size_t cae_program_named_proc_count(const cae_program_t* prog) {
    if (!prog) return 0;
    size_t n = 0;
    for (const cae::procedure& p : prog->procs) {
        if (!p.anonymous) n++;
    }
    return n;
}

static void dump_ref(const cae::region_ref& r, FILE* out) {
    switch (r.kind) {
        case cae::ref_kind::none: break;
        case cae::ref_kind::named: fprintf(out, " @%s", r.name.c_str()); break;
        case cae::ref_kind::back: fprintf(out, " @$"); break;
    }
}

static void dump_body(const cae_program_t* prog, const std::vector<cae::instruction>& body, int depth, FILE* out) {
    for (const cae::instruction& in : body) {
        fprintf(out, "%*s%s", depth * 2, "", cae::op_kind_str(in.kind));
        switch (in.kind) {
            case cae::op_kind::write_byte:
                fprintf(out, " 0x%02X", (unsigned)in.byte);
                break;
            case cae::op_kind::send:
            case cae::op_kind::receive:
                if (in.target.kind == cae::ref_kind::back) fprintf(out, " $");
                else fprintf(out, " %s", in.target.name.c_str());
                break;
            case cae::op_kind::call:
                if (in.anonymous_callee && in.callee_id < prog->procs.size()) {
                    fprintf(out, " %s", prog->procs[in.callee_id].name.c_str());
                } else {
                    fprintf(out, " %s", in.callee.c_str());
                }
                dump_ref(in.target, out);
                break;
            default:
                break;
        }
        fprintf(out, "\n");
        if (in.kind == cae::op_kind::loop) dump_body(prog, in.body, depth + 1, out);
    }
}

void cae_program_dump(const cae_program_t* prog, FILE* out) {
    if (!prog || !out) return;
    for (const cae::region_decl& r : prog->regions) {
        fprintf(out, "region %s[%u]\n", r.name.c_str(), (unsigned)r.capacity);
    }
    for (const cae::procedure& p : prog->procs) {
        fprintf(out, "proc %s%s (%u:%u)\n", p.name.c_str(), p.anonymous ? " (anonymous)" : "",
                (unsigned)p.span.line, (unsigned)p.span.col);
        dump_body(prog, p.body, 1, out);
    }
}

#include "cae_vm.h"

#include <string.h>
#include <vector>

namespace {

// Position inside one instruction sequence: a procedure body (root of a
// frame) or the body of a loop currently iterating.
struct cursor {
  const std::vector<cae::instruction>* seq;
  size_t pc;
  bool loop;
  cae_span_t span; // the `[` for loop cursors
};

struct frame {
  cae::proc_id proc;
  uint32_t here;
  uint32_t origin;
  size_t cursor_base; // first cursor owned by this frame
};

struct vm_state {
  const cae_program_t* prog;
  cae_region_store_t* store;
  const cae_io_t* io;
  cae_vm_options_t opts;
  cae_vm_stats_t stats;
  cae_diag_t* diag;

  std::vector<frame> frames;
  std::vector<cursor> cursors;
};

cae_region_t* region_at(vm_state& vm, uint32_t id) {
  return &vm.store->regions[id];
}

// `$` resolves to the frame's origin, a name to its validated id.
uint32_t resolve(const frame& f, const cae::region_ref& ref) {
  return ref.kind == cae::ref_kind::back ? f.origin : ref.id;
}

void trace_call(vm_state& vm, const frame& f) {
  if (!vm.opts.trace) return;
  fprintf(vm.opts.trace, "cae: call %s here=%s origin=%s depth=%u\n",
          vm.prog->procs[f.proc].name.c_str(),
          region_at(vm, f.here)->name,
          region_at(vm, f.origin)->name,
          (unsigned)vm.frames.size());
}

cae_error_t push_frame(vm_state& vm, cae::proc_id proc, uint32_t here, uint32_t origin, cae_span_t at) {
  if (vm.opts.max_call_depth != 0 && vm.frames.size() >= vm.opts.max_call_depth) {
    cae_diag_set_symbol(vm.diag, CAE_DIAG_DEPTH_LIMIT, at, "Call depth limit reached",
                        vm.prog->procs[proc].name.c_str());
    return CAE_E_DEPTH_LIMIT;
  }

  frame f;
  f.proc = proc;
  f.here = here;
  f.origin = origin;
  f.cursor_base = vm.cursors.size();
  vm.frames.push_back(f);
  vm.cursors.push_back(cursor{&vm.prog->procs[proc].body, 0, false, at});

  vm.stats.calls++;
  if (vm.frames.size() > vm.stats.max_depth) vm.stats.max_depth = (uint32_t)vm.frames.size();
  trace_call(vm, f);
  return CAE_OK;
}

cae_error_t count_step(vm_state& vm, cae_span_t at) {
  if (vm.opts.step_limit != 0 && vm.stats.steps >= vm.opts.step_limit) {
    cae_diag_set(vm.diag, CAE_DIAG_STEP_LIMIT, at, "Step limit reached");
    return CAE_E_STEP_LIMIT;
  }
  vm.stats.steps++;
  return CAE_OK;
}

cae_error_t do_input(vm_state& vm, cae_region_t* here, cae_span_t at) {
  uint8_t b = 0;
  if (vm.io->read(vm.io->read_user, &b)) {
    cae_region_write(here, b);
    return CAE_OK;
  }
  switch (vm.opts.eof_policy) {
    case CAE_EOF_ZERO:
      cae_region_write(here, 0);
      return CAE_OK;
    case CAE_EOF_KEEP:
      return CAE_OK;
    case CAE_EOF_ERROR:
      cae_diag_set(vm.diag, CAE_DIAG_INPUT_EXHAUSTED, at, "Input exhausted");
      return CAE_E_INPUT_EXHAUSTED;
  }
  return CAE_E_INTERNAL;
}

cae_error_t do_call(vm_state& vm, const frame& f, const cae::instruction& in) {
  uint32_t here = f.here;
  uint32_t origin = f.origin;
  switch (in.target.kind) {
    case cae::ref_kind::none:
      break;
    case cae::ref_kind::named:
      here = in.target.id;
      origin = f.here;
      break;
    case cae::ref_kind::back:
      here = f.origin;
      origin = f.origin;
      break;
  }
  return push_frame(vm, in.callee_id, here, origin, in.span);
}

// Executes one instruction of the top frame. The cursor has already been
// advanced past `in`.
cae_error_t dispatch(vm_state& vm, const cae::instruction& in) {
  const frame f = vm.frames.back();
  cae_region_t* here = region_at(vm, f.here);

  switch (in.kind) {
    case cae::op_kind::increment: cae_region_add(here, 1); break;
    case cae::op_kind::decrement: cae_region_add(here, -1); break;
    case cae::op_kind::move_right: cae_region_move(here, 1); break;
    case cae::op_kind::move_left: cae_region_move(here, -1); break;
    case cae::op_kind::reset_head: cae_region_reset_head(here); break;
    case cae::op_kind::write_byte: cae_region_write(here, in.byte); break;

    case cae::op_kind::output:
      if (!vm.io->write(vm.io->write_user, cae_region_read(here))) {
        cae_diag_set(vm.diag, CAE_DIAG_OUTPUT_FAILED, in.span, "Output collaborator failed");
        return CAE_E_OUTPUT_FAILED;
      }
      break;

    case cae::op_kind::input:
      return do_input(vm, here, in.span);

    case cae::op_kind::send:
      cae_region_write(region_at(vm, resolve(f, in.target)), cae_region_read(here));
      break;

    case cae::op_kind::receive:
      cae_region_write(here, cae_region_read(region_at(vm, resolve(f, in.target))));
      break;

    case cae::op_kind::loop:
      if (cae_region_read(here) != 0) vm.cursors.push_back(cursor{&in.body, 0, true, in.span});
      break;

    case cae::op_kind::call:
      return do_call(vm, f, in);
  }
  return CAE_OK;
}

cae_error_t run_loop(vm_state& vm) {
  while (!vm.frames.empty()) {
    cursor& cur = vm.cursors.back();

    if (cur.pc < cur.seq->size()) {
      const cae::instruction& in = (*cur.seq)[cur.pc];
      cur.pc++;
      cae_error_t err = count_step(vm, in.span);
      if (err != CAE_OK) return err;
      err = dispatch(vm, in);
      if (err != CAE_OK) return err;
      continue;
    }

    if (cur.loop) {
      // End of a loop body: re-test the head byte of the frame's `here`.
      cae_error_t err = count_step(vm, cur.span);
      if (err != CAE_OK) return err;
      if (cae_region_read(region_at(vm, vm.frames.back().here)) != 0) cur.pc = 0;
      else vm.cursors.pop_back();
      continue;
    }

    // Procedure body exhausted: return to the caller.
    vm.cursors.resize(vm.frames.back().cursor_base);
    vm.frames.pop_back();
  }
  return CAE_OK;
}

} // namespace

void cae_vm_options_init(cae_vm_options_t* opts) {
  if (!opts) return;
  memset(opts, 0, sizeof(*opts));
  opts->eof_policy = CAE_EOF_ZERO;
}

int cae_parse_eof_policy(const char* s, cae_eof_policy_t* out) {
  if (!s || !out) return 0;
  if (strcmp(s, "zero") == 0) { *out = CAE_EOF_ZERO; return 1; }
  if (strcmp(s, "keep") == 0) { *out = CAE_EOF_KEEP; return 1; }
  if (strcmp(s, "error") == 0) { *out = CAE_EOF_ERROR; return 1; }
  return 0;
}

const char* cae_eof_policy_str(cae_eof_policy_t p) {
  switch (p) {
    case CAE_EOF_ZERO: return "zero";
    case CAE_EOF_KEEP: return "keep";
    case CAE_EOF_ERROR: return "error";
  }
  return "?";
}

cae_error_t cae_vm_run(const cae_program_t* prog,
                       cae_region_store_t* store,
                       const cae_io_t* io,
                       const cae_vm_options_t* opts,
                       cae_vm_stats_t* out_stats,
                       cae_diag_t* out_diag) {
  if (out_stats) memset(out_stats, 0, sizeof(*out_stats));
  if (!prog || !store || !io || !io->read || !io->write) return CAE_E_INVALID_ARG;
  if (!prog->validated || store->count != prog->regions.size()) return CAE_E_INVALID_ARG;

  cae_diag_t local = {};
  vm_state vm;
  vm.prog = prog;
  vm.store = store;
  vm.io = io;
  if (opts) vm.opts = *opts;
  else cae_vm_options_init(&vm.opts);
  memset(&vm.stats, 0, sizeof(vm.stats));
  vm.diag = out_diag ? out_diag : &local;
  cae_diag_clear(vm.diag);

  cae_error_t err = push_frame(vm, prog->main_proc, prog->main_region, prog->main_region,
                               prog->procs[prog->main_proc].span);
  if (err == CAE_OK) err = run_loop(vm);

  if (out_stats) *out_stats = vm.stats;
  return err;
}

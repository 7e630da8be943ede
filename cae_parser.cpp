#include "cae_parser.h"
#include "cae_lexer.h"
#include "cae_ast.h"
#include "cae_diag.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <new>
#include <string>
#include <utility>

// Which construct the current instruction sequence belongs to.
typedef enum cae_scope_kind_e {
  SCOPE_PROC = 0, // terminated by ';'
  SCOPE_ANON,     // terminated by ')'
  SCOPE_LOOP      // terminated by ']'
} cae_scope_kind_t;

// Parser state
typedef struct cae_parser_s {
  cae_lexer_t lexer;
  cae_token_t current;
  cae_token_t previous;
  cae_diag_t* diag;
  int had_error;
  int lex_error;

  cae_program_t* prog;
  cae::proc_id owner;  // procedure whose body is being parsed
  cae::proc_id top;    // named procedure enclosing `owner`
  uint32_t anon_count; // per top-level procedure
  uint32_t depth;      // open loops and anonymous bodies
} cae_parser_t;

static cae_span_t span_from_tok(const cae_token_t* t) {
  if (!t) return cae_span_from_token(0, 0, 0);
  return cae_span_from_token((uint32_t)t->line, (uint32_t)t->col, (uint32_t)t->length);
}

static void set_diag(cae_parser_t* p, cae_diag_code_t code, cae_span_t span, const char* msg) {
  if (!p) return;
  p->had_error = 1;
  cae_diag_set(p->diag, code, span, msg);
}

static void advance(cae_parser_t* p) {
  p->previous = p->current;
  p->current = cae_lexer_next(&p->lexer);
  if (p->current.type == TOK_ERROR && !p->had_error) {
    p->lex_error = 1;
    set_diag(p, p->current.error_code, cae_span_from_token((uint32_t)p->current.line, (uint32_t)p->current.col, 1),
             p->current.start);
  }
}

static void parser_init(cae_parser_t* p, const char* source, size_t len, cae_diag_t* diag, cae_program_t* prog) {
  cae_lexer_init(&p->lexer, source, len);
  p->diag = diag;
  p->had_error = 0;
  p->lex_error = 0;
  p->prog = prog;
  p->owner = CAE_INVALID_ID;
  p->top = CAE_INVALID_ID;
  p->anon_count = 0;
  p->depth = 0;
  cae_diag_clear(p->diag);
  p->previous = cae_token_t{TOK_EOF, NULL, 0, 0, 0, 0, CAE_DIAG_OK};
  p->current = p->previous;
  advance(p);
}

static int check(cae_parser_t* p, cae_token_type_t type) {
  return p->current.type == type;
}

static int match(cae_parser_t* p, cae_token_type_t type) {
  if (check(p, type)) {
    advance(p);
    return 1;
  }
  return 0;
}

static int consume(cae_parser_t* p, cae_token_type_t type, cae_diag_code_t code, const char* msg) {
  if (check(p, type)) {
    advance(p);
    return 1;
  }
  if (!p->had_error) set_diag(p, code, span_from_tok(&p->current), msg);
  return 0;
}

static std::string tok_text(const cae_token_t& t) {
  return std::string(t.start, t.length);
}

static std::vector<cae::instruction> parse_sequence(cae_parser_t* p, cae_scope_kind_t scope, const cae_token_t& opener);

// Parses a region reference after '^', '&' or '@': a region name or '$'.
static int parse_region_ref(cae_parser_t* p, cae::region_ref* out, const char* after) {
  out->span = span_from_tok(&p->current);
  if (match(p, TOK_KW_DOLLAR)) {
    out->kind = cae::ref_kind::back;
    return 1;
  }
  if (check(p, TOK_IDENTIFIER)) {
    out->kind = cae::ref_kind::named;
    out->name = tok_text(p->current);
    advance(p);
    return 1;
  }
  if (!p->had_error) {
    char msg[96];
    snprintf(msg, sizeof(msg), "Expected region name or '$' after '%s'", after);
    set_diag(p, CAE_DIAG_PARSE_ERROR, span_from_tok(&p->current), msg);
  }
  return 0;
}

// Optional call clause: '@' <ref> or a bare '$'.
static int parse_call_clause(cae_parser_t* p, cae::region_ref* out) {
  if (match(p, TOK_KW_AT)) return parse_region_ref(p, out, "@");
  if (check(p, TOK_KW_DOLLAR)) {
    out->span = span_from_tok(&p->current);
    out->kind = cae::ref_kind::back;
    advance(p);
  }
  return 1;
}

static int parse_anonymous_call(cae_parser_t* p, cae::instruction* in) {
  cae_token_t lparen = p->previous;
  cae::proc_id parent_id = p->owner;

  char suffix[32];
  snprintf(suffix, sizeof(suffix), "/anon#%u", (unsigned)++p->anon_count);

  cae::procedure anon;
  anon.anonymous = true;
  anon.parent = parent_id;
  anon.span = span_from_tok(&lparen);
  anon.name = p->prog->procs[p->top].name + suffix;
  p->prog->procs.push_back(std::move(anon));
  cae::proc_id id = (cae::proc_id)(p->prog->procs.size() - 1);

  p->owner = id;
  std::vector<cae::instruction> body = parse_sequence(p, SCOPE_ANON, lparen);
  p->owner = parent_id;
  if (p->had_error) return 0;
  p->prog->procs[id].body = std::move(body);

  if (!consume(p, TOK_KW_RPAREN, CAE_DIAG_PARSE_ERROR, "Expect ) to close anonymous procedure")) return 0;

  in->kind = cae::op_kind::call;
  in->callee_id = id;
  in->anonymous_callee = true;
  return parse_call_clause(p, &in->target);
}

static int parse_instruction(cae_parser_t* p, cae::instruction* in) {
  cae_token_t t = p->current;
  in->span = span_from_tok(&t);
  advance(p);
  if (p->had_error) return 0;

  switch (t.type) {
    case TOK_KW_PLUS: in->kind = cae::op_kind::increment; return 1;
    case TOK_KW_MINUS: in->kind = cae::op_kind::decrement; return 1;
    case TOK_KW_GREATER: in->kind = cae::op_kind::move_right; return 1;
    case TOK_KW_LESS: in->kind = cae::op_kind::move_left; return 1;
    case TOK_KW_TILDE: in->kind = cae::op_kind::reset_head; return 1;
    case TOK_KW_DOT: in->kind = cae::op_kind::output; return 1;
    case TOK_KW_COMMA: in->kind = cae::op_kind::input; return 1;

    case TOK_BYTE_LITERAL:
      in->kind = cae::op_kind::write_byte;
      in->byte = t.byte_value;
      return 1;

    case TOK_KW_CARET:
      in->kind = cae::op_kind::send;
      return parse_region_ref(p, &in->target, "^");

    case TOK_KW_AMP:
      in->kind = cae::op_kind::receive;
      return parse_region_ref(p, &in->target, "&");

    case TOK_KW_LBRACKET:
      in->kind = cae::op_kind::loop;
      in->body = parse_sequence(p, SCOPE_LOOP, t);
      return !p->had_error;

    case TOK_KW_LPAREN:
      return parse_anonymous_call(p, in);

    case TOK_IDENTIFIER:
      in->kind = cae::op_kind::call;
      in->callee = tok_text(t);
      return parse_call_clause(p, &in->target);

    default:
      break;
  }

  set_diag(p, CAE_DIAG_PARSE_ERROR, span_from_tok(&t), "Unexpected token in procedure body");
  return 0;
}

static int is_instruction_start(cae_token_type_t t) {
  switch (t) {
    case TOK_KW_PLUS:
    case TOK_KW_MINUS:
    case TOK_KW_GREATER:
    case TOK_KW_LESS:
    case TOK_KW_TILDE:
    case TOK_KW_DOT:
    case TOK_KW_COMMA:
    case TOK_BYTE_LITERAL:
    case TOK_KW_CARET:
    case TOK_KW_AMP:
    case TOK_KW_LBRACKET:
    case TOK_KW_LPAREN:
    case TOK_IDENTIFIER:
      return 1;
    default:
      return 0;
  }
}

// Reports a loop or anonymous body that is still open when its enclosing
// scope terminates.
static void unclosed_scope(cae_parser_t* p, cae_scope_kind_t scope, const cae_token_t& opener, const char* closer) {
  char msg[160];
  if (scope == SCOPE_LOOP) {
    snprintf(msg, sizeof(msg), "'[' at %d:%d is not closed before %s at %d:%d",
             opener.line, opener.col, closer, p->current.line, p->current.col);
    set_diag(p, CAE_DIAG_BRACKET_SCOPE, span_from_tok(&opener), msg);
  } else {
    snprintf(msg, sizeof(msg), "'(' at %d:%d is not closed before %s at %d:%d",
             opener.line, opener.col, closer, p->current.line, p->current.col);
    set_diag(p, CAE_DIAG_PARSE_ERROR, span_from_tok(&opener), msg);
  }
}

static std::vector<cae::instruction> parse_sequence(cae_parser_t* p, cae_scope_kind_t scope, const cae_token_t& opener) {
  std::vector<cae::instruction> seq;

  if (scope != SCOPE_PROC && ++p->depth > CAE_PARSER_MAX_NESTING) {
    char msg[96];
    snprintf(msg, sizeof(msg), "Nesting too deep (more than %u open loops or anonymous procedures)",
             (unsigned)CAE_PARSER_MAX_NESTING);
    set_diag(p, CAE_DIAG_PARSE_ERROR, span_from_tok(&opener), msg);
    p->depth--;
    return seq;
  }

  while (!p->had_error) {
    cae_token_type_t t = p->current.type;

    if (is_instruction_start(t)) {
      cae::instruction in;
      if (!parse_instruction(p, &in)) break;
      seq.push_back(std::move(in));
      continue;
    }

    if (t == TOK_KW_RBRACKET) {
      if (scope == SCOPE_LOOP) {
        advance(p);
        break;
      }
      set_diag(p, CAE_DIAG_BRACKET_SCOPE, span_from_tok(&p->current),
               scope == SCOPE_ANON ? "']' has no matching '[' inside this anonymous procedure"
                                   : "']' has no matching '[' inside this procedure");
      break;
    }

    if (t == TOK_KW_RPAREN) {
      if (scope == SCOPE_ANON) break; // caller consumes ')'
      if (scope == SCOPE_LOOP) unclosed_scope(p, scope, opener, "')'");
      else set_diag(p, CAE_DIAG_PARSE_ERROR, span_from_tok(&p->current), "')' has no matching '('");
      break;
    }

    if (t == TOK_KW_SEMICOLON) {
      if (scope == SCOPE_PROC) break; // caller consumes ';'
      unclosed_scope(p, scope, opener, "';'");
      break;
    }

    if (t == TOK_EOF) {
      if (scope == SCOPE_PROC) set_diag(p, CAE_DIAG_PARSE_ERROR, span_from_tok(&p->current), "Expect ; to end procedure");
      else unclosed_scope(p, scope, opener, "end of input");
      break;
    }

    if (t == TOK_ERROR) break; // already reported by advance()

    set_diag(p, CAE_DIAG_PARSE_ERROR, span_from_tok(&p->current), "Unexpected token in procedure body");
    break;
  }

  if (scope != SCOPE_PROC) p->depth--;
  return seq;
}

static int parse_u32_literal(const cae_token_t& t, uint32_t* out) {
  uint64_t v = 0;
  for (size_t i = 0; i < t.length; i++) {
    v = v * 10u + (uint64_t)(t.start[i] - '0');
    if (v > 0xFFFFFFFFull) return 0;
  }
  *out = (uint32_t)v;
  return 1;
}

static void parse_region_decl(cae_parser_t* p) {
  cae_token_t kw = p->previous;

  if (!check(p, TOK_IDENTIFIER)) {
    set_diag(p, CAE_DIAG_MALFORMED_DECL, span_from_tok(&p->current), "Expected region name after 'region'");
    return;
  }
  cae::region_decl r;
  r.name = tok_text(p->current);
  r.span = span_from_tok(&kw);
  advance(p);

  if (!consume(p, TOK_KW_LBRACKET, CAE_DIAG_MALFORMED_DECL, "Expect [ after region name")) return;

  if (!check(p, TOK_INT_LITERAL)) {
    if (!p->had_error) set_diag(p, CAE_DIAG_MALFORMED_DECL, span_from_tok(&p->current), "Expected region size");
    return;
  }
  if (!parse_u32_literal(p->current, &r.capacity)) {
    set_diag(p, CAE_DIAG_MALFORMED_DECL, span_from_tok(&p->current), "Region size out of range");
    return;
  }
  if (r.capacity == 0) {
    set_diag(p, CAE_DIAG_MALFORMED_DECL, span_from_tok(&p->current), "Region size must be positive");
    return;
  }
  advance(p);

  if (!consume(p, TOK_KW_RBRACKET, CAE_DIAG_MALFORMED_DECL, "Expect ] after region size")) return;
  if (!consume(p, TOK_KW_SEMICOLON, CAE_DIAG_MALFORMED_DECL, "Expect ; after region declaration")) return;

  p->prog->regions.push_back(std::move(r));
}

static void parse_proc_decl(cae_parser_t* p) {
  cae_token_t kw = p->previous;

  if (!check(p, TOK_IDENTIFIER)) {
    set_diag(p, CAE_DIAG_MALFORMED_DECL, span_from_tok(&p->current), "Expected procedure name after 'proc'");
    return;
  }

  cae::procedure proc;
  proc.name = tok_text(p->current);
  proc.span = span_from_tok(&kw);
  advance(p);

  if (!consume(p, TOK_KW_COLON, CAE_DIAG_MALFORMED_DECL, "Expect : after procedure name")) return;

  // Reserve the slot first so anonymous bodies can name their parent.
  p->prog->procs.push_back(std::move(proc));
  cae::proc_id id = (cae::proc_id)(p->prog->procs.size() - 1);
  p->owner = id;
  p->top = id;
  p->anon_count = 0;

  std::vector<cae::instruction> body = parse_sequence(p, SCOPE_PROC, kw);
  if (p->had_error) return;
  p->prog->procs[id].body = std::move(body);

  consume(p, TOK_KW_SEMICOLON, CAE_DIAG_PARSE_ERROR, "Expect ; to end procedure");
}

static void parse_program(cae_parser_t* p) {
  while (!check(p, TOK_EOF) && !p->had_error) {
    if (match(p, TOK_KW_REGION)) {
      parse_region_decl(p);
      continue;
    }
    if (match(p, TOK_KW_PROC)) {
      parse_proc_decl(p);
      continue;
    }
    if (!p->had_error) {
      set_diag(p, CAE_DIAG_PARSE_ERROR, span_from_tok(&p->current), "Expected 'region' or 'proc' declaration");
    }
  }
}

cae_error_t cae_parse_source_len_ex(const char* source, size_t len, cae_program_t** out_prog, cae_diag_t* out_diag) {
  if (out_prog) *out_prog = NULL;
  if (!source || !out_prog) return CAE_E_INVALID_ARG;

  cae_program_t* prog = new (std::nothrow) cae_program_t();
  if (!prog) return CAE_E_OUT_OF_MEMORY;

  cae_diag_t local = {};
  cae_parser_t p;
  parser_init(&p, source, len, out_diag ? out_diag : &local, prog);
  parse_program(&p);

  if (p.had_error) {
    cae_program_free(prog);
    return p.lex_error ? CAE_E_LEX : CAE_E_PARSE;
  }

  *out_prog = prog;
  return CAE_OK;
}

cae_error_t cae_parse_source_ex(const char* source, cae_program_t** out_prog, cae_diag_t* out_diag) {
  if (!source) return CAE_E_INVALID_ARG;
  return cae_parse_source_len_ex(source, strlen(source), out_prog, out_diag);
}

cae_error_t cae_parse_source(const char* source, cae_program_t** out_prog) {
  return cae_parse_source_ex(source, out_prog, NULL);
}

#include "cae_lexer.h"
#include <ctype.h>
#include <string.h>

void cae_lexer_init(cae_lexer_t* lex, const char* src, size_t len) {
  lex->source = src;
  lex->source_len = len;
  lex->pos = 0;
  lex->line = 1;
  lex->col = 1;
}

static int is_at_end(cae_lexer_t* lex) {
  return lex->pos >= lex->source_len;
}

static char peek(cae_lexer_t* lex) {
  if (is_at_end(lex)) return '\0';
  return lex->source[lex->pos];
}

static char advance(cae_lexer_t* lex) {
  char c = peek(lex);
  lex->pos++;
  if (c == '\n') {
    lex->line++;
    lex->col = 1;
  } else {
    lex->col++;
  }
  return c;
}

static cae_token_t make_token(cae_token_type_t type, size_t start, size_t len, int line, int col, cae_lexer_t* lex) {
  cae_token_t tok;
  tok.type = type;
  tok.start = lex->source + start;
  tok.length = len;
  tok.line = line;
  tok.col = col;
  tok.byte_value = 0;
  tok.error_code = CAE_DIAG_OK;
  return tok;
}

static cae_token_t error_token(cae_diag_code_t code, const char* msg, int line, int col) {
  cae_token_t tok;
  tok.type = TOK_ERROR;
  tok.start = msg;
  tok.length = strlen(msg);
  tok.line = line;
  tok.col = col;
  tok.byte_value = 0;
  tok.error_code = code;
  return tok;
}

static void skip_line_comment(cae_lexer_t* lex) {
  while (!is_at_end(lex) && peek(lex) != '\n') {
    advance(lex);
  }
}

static void skip_whitespace_and_comments(cae_lexer_t* lex) {
  for (;;) {
    while (!is_at_end(lex)) {
      char c = peek(lex);
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v') {
        advance(lex);
        continue;
      }
      break;
    }

    if (is_at_end(lex)) return;

    if (peek(lex) == '#') {
      skip_line_comment(lex);
      continue;
    }

    return;
  }
}

static int is_ident_start(char c) {
  return isalpha((unsigned char)c) || c == '_';
}

static int is_ident_continue(char c) {
  return isalnum((unsigned char)c) || c == '_';
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static cae_token_type_t identifier_type(const char* s, size_t len) {
  if (len == 6 && memcmp(s, "region", 6) == 0) return TOK_KW_REGION;
  if (len == 4 && memcmp(s, "proc", 4) == 0) return TOK_KW_PROC;
  return TOK_IDENTIFIER;
}

static cae_token_t identifier(cae_lexer_t* lex, int line, int col) {
  // Caller has already consumed the first identifier character.
  size_t start = lex->pos - 1;
  while (!is_at_end(lex) && is_ident_continue(peek(lex))) {
    advance(lex);
  }
  size_t len = lex->pos - start;
  return make_token(identifier_type(lex->source + start, len), start, len, line, col, lex);
}

static cae_token_t number(cae_lexer_t* lex, int line, int col) {
  // Decimal only; region sizes are the sole consumer.
  size_t start = lex->pos - 1;
  while (!is_at_end(lex) && isdigit((unsigned char)peek(lex))) {
    advance(lex);
  }
  if (!is_at_end(lex) && is_ident_continue(peek(lex))) {
    return error_token(CAE_DIAG_LEX_ERROR, "Identifier character directly after integer", lex->line, lex->col);
  }
  return make_token(TOK_INT_LITERAL, start, lex->pos - start, line, col, lex);
}

static cae_token_t byte_literal(cae_lexer_t* lex, int line, int col) {
  // Opening quote already consumed; exactly two hex digits must follow.
  size_t start = lex->pos - 1;
  int hi = hex_value(peek(lex));
  if (hi < 0) return error_token(CAE_DIAG_BAD_HEX_LITERAL, "Expected two hex digits after '\"'", line, col);
  advance(lex);
  int lo = hex_value(peek(lex));
  if (lo < 0) return error_token(CAE_DIAG_BAD_HEX_LITERAL, "Expected two hex digits after '\"'", line, col);
  advance(lex);

  cae_token_t tok = make_token(TOK_BYTE_LITERAL, start, 3, line, col, lex);
  tok.byte_value = (uint8_t)((hi << 4) | lo);
  return tok;
}

cae_token_t cae_lexer_next(cae_lexer_t* lex) {
  skip_whitespace_and_comments(lex);
  int line = lex->line;
  int col = lex->col;
  if (is_at_end(lex)) return make_token(TOK_EOF, lex->pos, 0, line, col, lex);

  char c = advance(lex);
  if (is_ident_start(c)) return identifier(lex, line, col);
  if (isdigit((unsigned char)c)) return number(lex, line, col);
  if (c == '"') return byte_literal(lex, line, col);

  size_t at = lex->pos - 1;
  switch (c) {
    case '+': return make_token(TOK_KW_PLUS, at, 1, line, col, lex);
    case '-': return make_token(TOK_KW_MINUS, at, 1, line, col, lex);
    case '>': return make_token(TOK_KW_GREATER, at, 1, line, col, lex);
    case '<': return make_token(TOK_KW_LESS, at, 1, line, col, lex);
    case '.': return make_token(TOK_KW_DOT, at, 1, line, col, lex);
    case ',': return make_token(TOK_KW_COMMA, at, 1, line, col, lex);
    case '~': return make_token(TOK_KW_TILDE, at, 1, line, col, lex);
    case '^': return make_token(TOK_KW_CARET, at, 1, line, col, lex);
    case '&': return make_token(TOK_KW_AMP, at, 1, line, col, lex);
    case '[': return make_token(TOK_KW_LBRACKET, at, 1, line, col, lex);
    case ']': return make_token(TOK_KW_RBRACKET, at, 1, line, col, lex);
    case '(': return make_token(TOK_KW_LPAREN, at, 1, line, col, lex);
    case ')': return make_token(TOK_KW_RPAREN, at, 1, line, col, lex);
    case '@': return make_token(TOK_KW_AT, at, 1, line, col, lex);
    case '$': return make_token(TOK_KW_DOLLAR, at, 1, line, col, lex);
    case ':': return make_token(TOK_KW_COLON, at, 1, line, col, lex);
    case ';': return make_token(TOK_KW_SEMICOLON, at, 1, line, col, lex);
  }

  return error_token(CAE_DIAG_LEX_ERROR, "Unexpected character", line, col);
}

const char* cae_token_type_str(cae_token_type_t type) {
  switch (type) {
    case TOK_EOF: return "EOF";
    case TOK_IDENTIFIER: return "IDENTIFIER";
    case TOK_INT_LITERAL: return "INT_LITERAL";
    case TOK_BYTE_LITERAL: return "BYTE_LITERAL";
    case TOK_KW_REGION: return "KW_REGION";
    case TOK_KW_PROC: return "KW_PROC";
    case TOK_KW_PLUS: return "PLUS";
    case TOK_KW_MINUS: return "MINUS";
    case TOK_KW_GREATER: return "GREATER";
    case TOK_KW_LESS: return "LESS";
    case TOK_KW_DOT: return "DOT";
    case TOK_KW_COMMA: return "COMMA";
    case TOK_KW_TILDE: return "TILDE";
    case TOK_KW_CARET: return "CARET";
    case TOK_KW_AMP: return "AMP";
    case TOK_KW_LBRACKET: return "LBRACKET";
    case TOK_KW_RBRACKET: return "RBRACKET";
    case TOK_KW_LPAREN: return "LPAREN";
    case TOK_KW_RPAREN: return "RPAREN";
    case TOK_KW_AT: return "AT";
    case TOK_KW_DOLLAR: return "DOLLAR";
    case TOK_KW_COLON: return "COLON";
    case TOK_KW_SEMICOLON: return "SEMICOLON";
    case TOK_ERROR: return "ERROR";
  }
  return "UNKNOWN";
}

#pragma once

#include <cstdint>
#include <cstddef>
#include <stdint.h>

#include "cae_diag.h"

// cae Lexer Tokens

typedef enum cae_token_type_e {
  TOK_EOF = 0,
  TOK_IDENTIFIER,
  TOK_INT_LITERAL,
  TOK_BYTE_LITERAL,   // "XX

  // Declarations
  TOK_KW_REGION,
  TOK_KW_PROC,

  // Instructions
  TOK_KW_PLUS,        // +
  TOK_KW_MINUS,       // -
  TOK_KW_GREATER,     // >
  TOK_KW_LESS,        // <
  TOK_KW_DOT,         // .
  TOK_KW_COMMA,       // ,
  TOK_KW_TILDE,       // ~
  TOK_KW_CARET,       // ^
  TOK_KW_AMP,         // &
  TOK_KW_LBRACKET,    // [
  TOK_KW_RBRACKET,    // ]
  TOK_KW_LPAREN,      // (
  TOK_KW_RPAREN,      // )
  TOK_KW_AT,          // @
  TOK_KW_DOLLAR,      // $

  // Punctuation
  TOK_KW_COLON,
  TOK_KW_SEMICOLON,

  TOK_ERROR
} cae_token_type_t;

typedef struct cae_token_s {
  cae_token_type_t type;
  const char* start;   // for TOK_ERROR: the message
  size_t length;
  int line;
  int col;
  uint8_t byte_value;  // TOK_BYTE_LITERAL only
  cae_diag_code_t error_code; // TOK_ERROR only
} cae_token_t;

typedef struct cae_lexer_s {
  const char* source;
  size_t source_len;
  size_t pos;
  int line;
  int col;
} cae_lexer_t;

// Initialize lexer
void cae_lexer_init(cae_lexer_t* lex, const char* src, size_t len);

// Get next token. After TOK_EOF or TOK_ERROR the caller should stop.
cae_token_t cae_lexer_next(cae_lexer_t* lex);

// Token to string (for debugging)
const char* cae_token_type_str(cae_token_type_t type);

// Lexer selftest; returns the number of failed checks.
int cae_lexer_run_selftest();

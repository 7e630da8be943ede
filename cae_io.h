#pragma once

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

#ifdef __cplusplus
extern "C" {
#endif

// Byte I/O collaborators for the execution engine.
//
// read:  returns 1 and stores a byte, or 0 when the source is exhausted.
// write: returns 1 on success, 0 on failure.
typedef int (*cae_read_byte_fn)(void* user, uint8_t* out);
typedef int (*cae_write_byte_fn)(void* user, uint8_t value);

typedef struct cae_io_s {
  cae_read_byte_fn read;
  cae_write_byte_fn write;
  void* read_user;
  void* write_user;
} cae_io_t;

// FILE-backed collaborators (e.g. stdin / stdout). Output is flushed on newline.
cae_io_t cae_io_from_files(FILE* in, FILE* out);

// Memory-backed collaborators. Output grows on demand; free with cae_membuf_destroy.
typedef struct cae_membuf_s {
  const uint8_t* in;
  size_t in_len;
  size_t in_pos;

  uint8_t* out;
  size_t out_len;
  size_t out_cap;
} cae_membuf_t;

void cae_membuf_init(cae_membuf_t* mb, const void* input, size_t input_len);
void cae_membuf_destroy(cae_membuf_t* mb);

// Reads from `mb` and writes into `mb`.
cae_io_t cae_io_from_membuf(cae_membuf_t* mb);

// Reads from `mb`, writes to `out`.
cae_io_t cae_io_membuf_to_file(cae_membuf_t* mb, FILE* out);

#ifdef __cplusplus
} // extern "C"
#endif

#include "cae_io.h"

#include <stdlib.h>
#include <string.h>

static int file_read(void* user, uint8_t* out) {
  FILE* f = (FILE*)user;
  if (!f) return 0;
  int c = fgetc(f);
  if (c == EOF) return 0;
  *out = (uint8_t)c;
  return 1;
}

static int file_write(void* user, uint8_t value) {
  FILE* f = (FILE*)user;
  if (!f) return 0;
  if (fputc((int)value, f) == EOF) return 0;
  if (value == '\n' && fflush(f) != 0) return 0;
  return 1;
}

cae_io_t cae_io_from_files(FILE* in, FILE* out) {
  cae_io_t io;
  io.read = file_read;
  io.write = file_write;
  io.read_user = in;
  io.write_user = out;
  return io;
}

void cae_membuf_init(cae_membuf_t* mb, const void* input, size_t input_len) {
  if (!mb) return;
  memset(mb, 0, sizeof(*mb));
  mb->in = (const uint8_t*)input;
  mb->in_len = input ? input_len : 0;
}

void cae_membuf_destroy(cae_membuf_t* mb) {
  if (!mb) return;
  free(mb->out);
  mb->out = NULL;
  mb->out_len = 0;
  mb->out_cap = 0;
}

static int membuf_read(void* user, uint8_t* out) {
  cae_membuf_t* mb = (cae_membuf_t*)user;
  if (!mb || mb->in_pos >= mb->in_len) return 0;
  *out = mb->in[mb->in_pos++];
  return 1;
}

static int membuf_write(void* user, uint8_t value) {
  cae_membuf_t* mb = (cae_membuf_t*)user;
  if (!mb) return 0;
  if (mb->out_len == mb->out_cap) {
    size_t new_cap = mb->out_cap ? mb->out_cap * 2u : 64u;
    if (new_cap < mb->out_cap) return 0;
    uint8_t* grown = (uint8_t*)realloc(mb->out, new_cap);
    if (!grown) return 0;
    mb->out = grown;
    mb->out_cap = new_cap;
  }
  mb->out[mb->out_len++] = value;
  return 1;
}

cae_io_t cae_io_from_membuf(cae_membuf_t* mb) {
  cae_io_t io;
  io.read = membuf_read;
  io.write = membuf_write;
  io.read_user = mb;
  io.write_user = mb;
  return io;
}

cae_io_t cae_io_membuf_to_file(cae_membuf_t* mb, FILE* out) {
  cae_io_t io;
  io.read = membuf_read;
  io.write = file_write;
  io.read_user = mb;
  io.write_user = out;
  return io;
}

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>

#ifdef __cplusplus
extern "C" {
#endif

// Source loading for cae

// Reads entire file into a newly allocated, NUL-terminated buffer. Caller must free().
// Returns 0 on failure; the reason is available from cae_file_last_error().
int cae_file_read_all(const char* path, char** out_data, size_t* out_len);

// Reads a stream (e.g. stdin) to EOF into a newly allocated, NUL-terminated buffer.
int cae_file_read_stream(FILE* f, char** out_data, size_t* out_len);

// Returns a pointer to a thread-local, null-terminated error string for the last cae_file operation.
const char* cae_file_last_error();

#ifdef __cplusplus
} // extern "C"
#endif

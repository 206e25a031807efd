#pragma once

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Runs the benchmark and writes the report into out with snprintf semantics.
   Returns the full report length, excluding the terminator. data may be null. */
size_t run_heavy_sim(const char* data, char* out, size_t out_size);

#ifdef __cplusplus
}
#endif

#ifndef DOTMASK_H
#define DOTMASK_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct {
  const char* data;
  size_t len;
} dm_view;

typedef struct {
  char* data;
  size_t len;
} dm_buf;

typedef struct {
  char mask_char;      // 0 selects '*'
  size_t mask_length;  // full mode only; 0 keeps the value length
  int mode;            // 0 full, 1 partial
  int show_start;
  int show_end;
  int min_mask;
} dm_mask_options;

// Return codes: 0 ok, 1 null output, 2 allocation failure, 3 internal error,
// 4 null input data, 5 invalid options.

// |opts| may be NULL for full masking with '*'.
int dm_mask_value(dm_view in, const dm_mask_options* opts, dm_buf* out);
int dm_mask_full(dm_view in, char mask_char, dm_buf* out);
// Falls back to full masking when the value is too short to show both ends.
int dm_mask_partial(dm_view in, char mask_char, int show_start, int show_end, int min_mask, dm_buf* out);
// Lengths and show counts above 65536 return 5.
int dm_mask_fixed(size_t length, char mask_char, dm_buf* out);

// Frees buffer allocated by dm_mask_*
void dm_free(dm_buf* buf);

// Returns a static version string like "0.1.0"
const char* dm_version(void);

#ifdef __cplusplus
}
#endif

#endif

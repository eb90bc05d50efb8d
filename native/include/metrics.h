#ifndef DOTMASK_METRICS_H
#define DOTMASK_METRICS_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct {
  uint64_t documents_parsed;
  uint64_t cache_hits;
  uint64_t cache_misses;
  uint64_t entries_masked;
  uint64_t strategy_fallbacks;
} dm_metrics_snapshot;

void dm_metrics_reset(void);
void dm_metrics_add_parsed(uint64_t n);
void dm_metrics_add_cache_hits(uint64_t n);
void dm_metrics_add_cache_misses(uint64_t n);
void dm_metrics_add_masked(uint64_t n);
void dm_metrics_add_fallbacks(uint64_t n);
dm_metrics_snapshot dm_metrics_get(void);

#ifdef __cplusplus
}
#endif

#endif

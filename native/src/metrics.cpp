#include "metrics.h"

namespace {
dm_metrics_snapshot g_metrics = {0, 0, 0, 0, 0};
}

extern "C" void dm_metrics_reset(void) { g_metrics = {0, 0, 0, 0, 0}; }
extern "C" void dm_metrics_add_parsed(uint64_t n) { g_metrics.documents_parsed += n; }
extern "C" void dm_metrics_add_cache_hits(uint64_t n) { g_metrics.cache_hits += n; }
extern "C" void dm_metrics_add_cache_misses(uint64_t n) { g_metrics.cache_misses += n; }
extern "C" void dm_metrics_add_masked(uint64_t n) { g_metrics.entries_masked += n; }
extern "C" void dm_metrics_add_fallbacks(uint64_t n) { g_metrics.strategy_fallbacks += n; }
extern "C" dm_metrics_snapshot dm_metrics_get(void) { return g_metrics; }

#ifndef DOTMASK_MASK_ENGINE_H
#define DOTMASK_MASK_ENGINE_H

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dotmask/config.h"
#include "dotmask/content_cache.h"
#include "dotmask/pattern_resolver.h"
#include "dotmask/strategy_registry.h"
#include "dotmask/types.h"

namespace dotmask {

// Turns raw document bytes into entries and line offsets. Implementations must be pure:
// the same content always yields the same document. Throws ParseError.
class DocumentParser {
 public:
  virtual ~DocumentParser() = default;
  virtual ParsedDocument Parse(std::string_view content) const = 0;
};

struct MaskOptions {
  // Strategy to use; resolved from the context key and source when unset.
  std::optional<std::string> mode;
  // Applied to a private clone of the strategy for this call only.
  Options options;
};

struct MaskResult {
  std::vector<MaskedLineDescriptor> masks;
  LineOffsetTable line_offsets;
};

class MaskEngine {
 public:
  MaskEngine(std::unique_ptr<DocumentParser> parser, Config config);
  MaskEngine(const MaskEngine&) = delete;
  MaskEngine& operator=(const MaskEngine&) = delete;

  // Cache-checked. Parse errors propagate and leave the cache untouched.
  std::shared_ptr<const ParsedDocument> Parse(std::string_view content);

  MaskResult GenerateMasks(std::string_view content, std::optional<std::string_view> source_path = std::nullopt);

  std::string MaskValue(std::string_view value, const MaskOptions& options = {}, const MaskContext& ctx = {});

  // Recompiles patterns, rebuilds the registry from |config| and resizes the cache.
  // Throws OptionValidationError or StrategyDefinitionError and keeps the current
  // configuration when |config| is rejected.
  void Reconfigure(Config config);
  void ClearCaches();

  const Config& config() const { return config_; }
  const PatternResolver& resolver() const { return resolver_; }
  StrategyRegistry& registry() { return registry_; }
  size_t cache_size() const { return cache_.size(); }

 private:
  std::unique_ptr<DocumentParser> parser_;
  Config config_;
  PatternResolver resolver_;
  StrategyRegistry registry_;
  ContentCache<std::shared_ptr<const ParsedDocument>> cache_;
};

}  // namespace dotmask

#endif

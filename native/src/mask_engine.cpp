#include "dotmask/mask_engine.h"

#include <unordered_map>

#include "dotmask/fingerprint.h"
#include "dotmask/log.h"
#include "metrics.h"

namespace dotmask {

MaskEngine::MaskEngine(std::unique_ptr<DocumentParser> parser, Config config)
    : parser_(std::move(parser)), config_(std::move(config)), cache_(config_.cache_capacity) {
  if (!parser_) throw Error("mask engine requires a document parser");
  resolver_.Compile(config_.key_patterns, config_.source_patterns, config_.default_strategy);
  registry_.Setup(config_);
}

std::shared_ptr<const ParsedDocument> MaskEngine::Parse(std::string_view content) {
  const std::string key = Fingerprint(content);
  if (auto hit = cache_.Get(key)) {
    dm_metrics_add_cache_hits(1);
    return *hit;
  }
  dm_metrics_add_cache_misses(1);

  auto doc = std::make_shared<const ParsedDocument>(parser_->Parse(content));
  dm_metrics_add_parsed(1);
  cache_.Put(key, doc);
  return doc;
}

MaskResult MaskEngine::GenerateMasks(std::string_view content, std::optional<std::string_view> source_path) {
  std::shared_ptr<const ParsedDocument> doc = Parse(content);

  std::optional<std::string_view> basename;
  std::string source;
  if (source_path) {
    basename = Basename(*source_path);
    source = std::string(*source_path);
  }

  MaskResult result;
  result.line_offsets = doc->line_offsets;
  result.masks.reserve(doc->entries.size());

  std::unordered_map<std::string, std::string> memo;
  for (const Entry& e : doc->entries) {
    if (e.is_comment && config_.skip_comments) continue;

    auto it = memo.find(e.key);
    if (it == memo.end()) it = memo.emplace(e.key, resolver_.DetermineStrategy(e.key, basename)).first;

    MaskContext ctx;
    ctx.key = e.key;
    ctx.source = source;
    ctx.line_number = e.line_number;
    ctx.quote = e.quote;
    ctx.is_comment = e.is_comment;

    MaskedLineDescriptor d;
    d.line_number = e.line_number;
    d.value_end_line = e.value_end_line;
    d.mask = registry_.Apply(it->second, e.value, ctx);
    d.key = e.key;
    d.value = e.value;
    d.value_span = e.value_span;
    d.quote = e.quote;
    d.is_comment = e.is_comment;
    result.masks.push_back(std::move(d));
  }

  dm_metrics_add_masked(result.masks.size());
  return result;
}

std::string MaskEngine::MaskValue(std::string_view value, const MaskOptions& options, const MaskContext& ctx) {
  std::string mode;
  if (options.mode) {
    mode = *options.mode;
  } else {
    std::optional<std::string_view> basename;
    if (!ctx.source.empty()) basename = Basename(ctx.source);
    mode = resolver_.DetermineStrategy(ctx.key, basename);
  }

  if (options.options.empty() || !registry_.Exists(mode)) return registry_.Apply(mode, value, ctx);
  return registry_.Clone(registry_.Get(mode), options.options)->Apply(value, ctx);
}

void MaskEngine::Reconfigure(Config config) {
  PatternResolver resolver;
  resolver.Compile(config.key_patterns, config.source_patterns, config.default_strategy);
  StrategyRegistry registry;
  registry.Setup(config);

  const bool resize = config.cache_capacity != config_.cache_capacity;
  config_ = std::move(config);
  resolver_ = std::move(resolver);
  registry_ = std::move(registry);
  if (resize) {
    cache_ = ContentCache<std::shared_ptr<const ParsedDocument>>(config_.cache_capacity);
    LogDebug("parse cache resized to " + std::to_string(config_.cache_capacity));
  }
}

void MaskEngine::ClearCaches() { cache_.Clear(); }

}  // namespace dotmask

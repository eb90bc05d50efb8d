#include "dotmask/strategy.h"

#include "dotmask/log.h"
#include "metrics.h"

namespace dotmask {

namespace {

std::optional<OptionViolation> check_mask_char(const Options& options) {
  auto it = options.find("mask_char");
  if (it != options.end() && it->second.is_string() && it->second.as_string().size() != 1) {
    return OptionViolation{"mask_char", "must be a single character"};
  }
  return std::nullopt;
}

}  // namespace

Strategy::Strategy(std::string name, std::string description, OptionSchema schema, Options defaults)
    : name_(std::move(name)),
      description_(std::move(description)),
      schema_(std::move(schema)),
      options_(std::move(defaults)) {}

std::optional<OptionViolation> Strategy::Check(const Options& options) const {
  if (auto v = Validate(options)) return v;
  return ValidateOptions(schema_, options);
}

Strategy& Strategy::Configure(const Options& options) {
  if (auto v = Check(options)) throw OptionValidationError(name_, std::move(*v));

  for (const auto& kv : schema_) {
    if (kv.second.default_value && options_.find(kv.first) == options_.end()) {
      options_.emplace(kv.first, *kv.second.default_value);
    }
  }
  for (const auto& kv : options) options_[kv.first] = kv.second;

  OnConfigure(options);
  return *this;
}

std::unique_ptr<Strategy> Strategy::Clone() const { return Copy(); }

std::unique_ptr<Strategy> Strategy::Clone(const Options& options) const {
  auto copy = Copy();
  copy->Configure(options);
  return copy;
}

const OptionValue* Strategy::FindOption(const std::string& key) const {
  auto it = options_.find(key);
  if (it != options_.end()) return &it->second;
  auto sit = schema_.find(key);
  if (sit != schema_.end() && sit->second.default_value) return &*sit->second.default_value;
  return nullptr;
}

int64_t Strategy::GetNumber(const std::string& key, int64_t fallback) const {
  const OptionValue* v = FindOption(key);
  return v != nullptr && v->is_number() ? v->as_number() : fallback;
}

std::optional<int64_t> Strategy::GetOptionalNumber(const std::string& key) const {
  const OptionValue* v = FindOption(key);
  if (v == nullptr || !v->is_number()) return std::nullopt;
  return v->as_number();
}

std::string Strategy::GetString(const std::string& key, const std::string& fallback) const {
  const OptionValue* v = FindOption(key);
  return v != nullptr && v->is_string() ? v->as_string() : fallback;
}

char Strategy::GetChar(const std::string& key, char fallback) const {
  const OptionValue* v = FindOption(key);
  if (v == nullptr || !v->is_string() || v->as_string().empty()) return fallback;
  return v->as_string()[0];
}

bool Strategy::GetBool(const std::string& key, bool fallback) const {
  const OptionValue* v = FindOption(key);
  return v != nullptr && v->is_bool() ? v->as_bool() : fallback;
}

const TransformFn* Strategy::GetCallable(const std::string& key) const {
  const OptionValue* v = FindOption(key);
  if (v == nullptr || !v->is_callable() || !v->as_callable()) return nullptr;
  return &v->as_callable();
}

std::optional<OptionViolation> Strategy::Validate(const Options&) const { return std::nullopt; }

void Strategy::OnConfigure(const Options&) {}

// DefinedStrategy

DefinedStrategy::DefinedStrategy(std::string name, std::shared_ptr<const StrategyDefinition> definition)
    : Strategy(std::move(name), definition->description, definition->schema, definition->default_options),
      definition_(std::move(definition)) {
  if (definition_->on_register) definition_->on_register(*this);
}

std::string DefinedStrategy::Apply(std::string_view value, const MaskContext& ctx) const {
  return definition_->apply(*this, value, ctx);
}

std::optional<OptionViolation> DefinedStrategy::Validate(const Options& options) const {
  if (definition_->validate) return definition_->validate(options);
  return std::nullopt;
}

void DefinedStrategy::OnConfigure(const Options& options) {
  if (definition_->on_configure) definition_->on_configure(*this, options);
}

std::unique_ptr<Strategy> DefinedStrategy::Copy() const { return std::make_unique<DefinedStrategy>(*this); }

// Built-ins

std::string MaskFull(std::string_view value, char mask_char) { return std::string(value.size(), mask_char); }

std::string MaskFixed(size_t length, char mask_char) { return std::string(length, mask_char); }

std::string MaskPartial(std::string_view value, char mask_char, size_t show_start, size_t show_end) {
  std::string out;
  out.reserve(value.size());
  out.append(value.data(), show_start);
  out.append(value.size() - show_start - show_end, mask_char);
  out.append(value.data() + value.size() - show_end, show_end);
  return out;
}

FullStrategy::FullStrategy()
    : Strategy(kName, "Replace all characters with mask character",
               {{"mask_char", StringOption(std::string("*"), "Character used for masking")},
                {"fixed_length", NumberOption(std::nullopt, 1, kMaxMaskWidth,
                                              "Fixed output length regardless of value length")}},
               {{"mask_char", "*"}}) {}

std::string FullStrategy::Apply(std::string_view value, const MaskContext&) const {
  char c = GetChar("mask_char", '*');
  if (auto fixed = GetOptionalNumber("fixed_length")) return MaskFixed(static_cast<size_t>(*fixed), c);
  return MaskFull(value, c);
}

std::optional<OptionViolation> FullStrategy::Validate(const Options& options) const {
  return check_mask_char(options);
}

std::unique_ptr<Strategy> FullStrategy::Copy() const { return std::make_unique<FullStrategy>(*this); }

PartialStrategy::PartialStrategy()
    : Strategy(kName, "Show start and end characters, mask the middle",
               {{"mask_char", StringOption(std::string("*"), "Character used for masking")},
                {"show_start", NumberOption(3, 0, kMaxMaskWidth, "Number of characters to show at start")},
                {"show_end", NumberOption(3, 0, kMaxMaskWidth, "Number of characters to show at end")},
                {"min_mask", NumberOption(3, 1, kMaxMaskWidth, "Minimum number of mask characters")},
                {"fallback_mode", EnumOption("full", {"full", "none"},
                                             "Strategy used when the value is too short for partial masking")}},
               {{"mask_char", "*"}, {"show_start", 3}, {"show_end", 3}, {"min_mask", 3}, {"fallback_mode", "full"}}) {}

std::string PartialStrategy::Apply(std::string_view value, const MaskContext& ctx) const {
  char c = GetChar("mask_char", '*');
  size_t show_start = static_cast<size_t>(GetNumber("show_start", 3));
  size_t show_end = static_cast<size_t>(GetNumber("show_end", 3));
  size_t min_mask = static_cast<size_t>(GetNumber("min_mask", 3));

  const size_t n = value.size();
  if (show_start > n || show_end > n - show_start || min_mask > n - show_start - show_end) {
    dm_metrics_add_fallbacks(1);
    std::string fallback = GetString("fallback_mode", "full");
    LogDebug("partial: value for '" + ctx.key + "' too short, using '" + fallback + "'");
    if (fallback == "none") return std::string(value);
    return MaskFull(value, c);
  }
  return MaskPartial(value, c, show_start, show_end);
}

std::optional<OptionViolation> PartialStrategy::Validate(const Options& options) const {
  if (auto v = check_mask_char(options)) return v;
  for (const char* key : {"show_start", "show_end"}) {
    auto it = options.find(key);
    if (it != options.end() && it->second.is_number() && it->second.as_number() < 0) {
      return OptionViolation{key, "must be >= 0"};
    }
  }
  return std::nullopt;
}

std::unique_ptr<Strategy> PartialStrategy::Copy() const { return std::make_unique<PartialStrategy>(*this); }

NoneStrategy::NoneStrategy()
    : Strategy(kName, "No masking - show value as-is",
               {{"transform", CallableOption("Optional transform applied to the value")}}, {}) {}

std::string NoneStrategy::Apply(std::string_view value, const MaskContext& ctx) const {
  if (const TransformFn* transform = GetCallable("transform")) return (*transform)(value, ctx);
  return std::string(value);
}

std::unique_ptr<Strategy> NoneStrategy::Copy() const { return std::make_unique<NoneStrategy>(*this); }

}  // namespace dotmask

#include "dotmask/strategy_registry.h"

#include "dotmask/log.h"
#include "metrics.h"

namespace dotmask {

namespace {

const char* const kBuiltins[] = {FullStrategy::kName, PartialStrategy::kName, NoneStrategy::kName};

std::string join_names(const std::vector<std::string>& names) {
  std::string out;
  for (size_t i = 0; i < names.size(); ++i) {
    if (i > 0) out += ", ";
    out += names[i];
  }
  return out;
}

}  // namespace

StrategyNotFoundError::StrategyNotFoundError(std::string name, std::vector<std::string> known)
    : Error("unknown strategy '" + name + "'. Available strategies: " + join_names(known)),
      name_(std::move(name)),
      known_(std::move(known)) {}

StrategyRegistry::StrategyRegistry() { RegisterBuiltins(); }

void StrategyRegistry::RegisterBuiltins() {
  factories_[FullStrategy::kName] = [] { return std::make_unique<FullStrategy>(); };
  factories_[PartialStrategy::kName] = [] { return std::make_unique<PartialStrategy>(); };
  factories_[NoneStrategy::kName] = [] { return std::make_unique<NoneStrategy>(); };
}

void StrategyRegistry::Define(const std::string& name, StrategyDefinition definition) {
  if (!definition.apply) throw StrategyDefinitionError("strategy '" + name + "' must have an apply function");
  if (definition.description.empty()) definition.description = "Custom mode: " + name;

  auto shared = std::make_shared<const StrategyDefinition>(std::move(definition));
  Define(name, [name, shared] { return std::make_unique<DefinedStrategy>(name, shared); });
}

void StrategyRegistry::Define(const std::string& name, StrategyFactory factory) {
  if (!factory) throw StrategyDefinitionError("strategy '" + name + "' must have a factory");
  if (IsBuiltin(name)) LogInfo("overriding built-in strategy '" + name + "' with custom definition");
  factories_[name] = std::move(factory);
  instances_.erase(name);
}

bool StrategyRegistry::Undefine(const std::string& name) {
  if (IsBuiltin(name)) {
    LogWarn("cannot undefine built-in strategy '" + name + "'");
    return false;
  }
  instances_.erase(name);
  return factories_.erase(name) > 0;
}

std::unique_ptr<Strategy> StrategyRegistry::Create(const std::string& name) const {
  auto it = factories_.find(name);
  if (it == factories_.end()) throw StrategyNotFoundError(name, List());
  std::unique_ptr<Strategy> s = it->second();
  if (!s) throw StrategyDefinitionError("factory for strategy '" + name + "' returned nothing");
  return s;
}

std::unique_ptr<Strategy> StrategyRegistry::Create(const std::string& name, const Options& options) const {
  std::unique_ptr<Strategy> s = Create(name);
  s->Configure(options);
  return s;
}

Strategy& StrategyRegistry::Get(const std::string& name) {
  auto it = instances_.find(name);
  if (it != instances_.end()) return *it->second;
  std::unique_ptr<Strategy> s = Create(name);
  Strategy& ref = *s;
  instances_.emplace(name, std::move(s));
  return ref;
}

Strategy& StrategyRegistry::Configure(const std::string& name, const Options& options) {
  return Get(name).Configure(options);
}

std::string StrategyRegistry::Apply(const std::string& name, std::string_view value, const MaskContext& ctx) {
  if (!Exists(name)) {
    LogWarn("unknown strategy '" + name + "', falling back to 'full'");
    dm_metrics_add_fallbacks(1);
    return Get(FullStrategy::kName).Apply(value, ctx);
  }
  return Get(name).Apply(value, ctx);
}

std::unique_ptr<Strategy> StrategyRegistry::Clone(const Strategy& strategy) const { return strategy.Clone(); }

std::unique_ptr<Strategy> StrategyRegistry::Clone(const Strategy& strategy, const Options& options) const {
  return strategy.Clone(options);
}

bool StrategyRegistry::Exists(const std::string& name) const { return factories_.find(name) != factories_.end(); }

bool StrategyRegistry::IsBuiltin(const std::string& name) {
  for (const char* b : kBuiltins) {
    if (name == b) return true;
  }
  return false;
}

std::vector<std::string> StrategyRegistry::List() const {
  std::vector<std::string> names;
  names.reserve(factories_.size());
  for (const auto& kv : factories_) names.push_back(kv.first);
  return names;
}

std::optional<StrategyInfo> StrategyRegistry::Info(const std::string& name) {
  if (!Exists(name)) return std::nullopt;
  const Strategy& s = Get(name);
  return StrategyInfo{s.name(), s.description(), s.options(), s.schema(), IsBuiltin(name)};
}

std::map<std::string, StrategyInfo> StrategyRegistry::InfoAll() {
  std::map<std::string, StrategyInfo> all;
  for (const std::string& name : List()) {
    if (auto info = Info(name)) all.emplace(name, std::move(*info));
  }
  return all;
}

void StrategyRegistry::Setup(const Config& config) {
  for (const auto& kv : config.custom_strategies) Define(kv.first, kv.second);

  const Options mask_char{{"mask_char", std::string(1, config.mask_char)}};
  for (const char* name : {FullStrategy::kName, PartialStrategy::kName}) {
    Strategy& s = Get(name);
    if (s.FindOption("mask_char") != nullptr) s.Configure(mask_char);
  }

  for (const auto& kv : config.strategy_options) {
    if (!Exists(kv.first)) {
      LogWarn("cannot configure unknown strategy '" + kv.first + "'");
      continue;
    }
    Configure(kv.first, kv.second);
  }
}

void StrategyRegistry::Reset() {
  instances_.clear();
  factories_.clear();
  RegisterBuiltins();
}

}  // namespace dotmask

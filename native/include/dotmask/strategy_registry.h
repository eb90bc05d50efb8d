#ifndef DOTMASK_STRATEGY_REGISTRY_H
#define DOTMASK_STRATEGY_REGISTRY_H

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "dotmask/config.h"
#include "dotmask/strategy.h"

namespace dotmask {

using StrategyFactory = std::function<std::unique_ptr<Strategy>()>;

struct StrategyInfo {
  std::string name;
  std::string description;
  Options options;
  OptionSchema schema;
  bool is_builtin{false};
};

class StrategyNotFoundError : public Error {
 public:
  StrategyNotFoundError(std::string name, std::vector<std::string> known);

  const std::string& name() const { return name_; }
  const std::vector<std::string>& known() const { return known_; }

 private:
  std::string name_;
  std::vector<std::string> known_;
};

class StrategyDefinitionError : public Error {
 public:
  using Error::Error;
};

// Named strategies and their cached default instances.
//
// The registry owns every instance it hands out through Get()/Configure(); Create() and
// Clone() return independent instances owned by the caller. Built-ins (full, partial,
// none) can be overridden but never removed.
class StrategyRegistry {
 public:
  StrategyRegistry();
  StrategyRegistry(const StrategyRegistry&) = delete;
  StrategyRegistry& operator=(const StrategyRegistry&) = delete;
  StrategyRegistry(StrategyRegistry&&) = default;
  StrategyRegistry& operator=(StrategyRegistry&&) = default;

  // Throws StrategyDefinitionError when |definition.apply| is empty.
  void Define(const std::string& name, StrategyDefinition definition);
  void Define(const std::string& name, StrategyFactory factory);
  bool Undefine(const std::string& name);

  // Throws StrategyNotFoundError listing the registered names.
  std::unique_ptr<Strategy> Create(const std::string& name) const;
  std::unique_ptr<Strategy> Create(const std::string& name, const Options& options) const;

  Strategy& Get(const std::string& name);
  // Throws OptionValidationError; the cached instance is left unchanged on failure.
  Strategy& Configure(const std::string& name, const Options& options);

  // Never throws for an unknown name: logs a warning and masks with "full".
  std::string Apply(const std::string& name, std::string_view value, const MaskContext& ctx);

  std::unique_ptr<Strategy> Clone(const Strategy& strategy) const;
  std::unique_ptr<Strategy> Clone(const Strategy& strategy, const Options& options) const;

  bool Exists(const std::string& name) const;
  static bool IsBuiltin(const std::string& name);
  std::vector<std::string> List() const;
  std::optional<StrategyInfo> Info(const std::string& name);
  std::map<std::string, StrategyInfo> InfoAll();

  // Registers config.custom_strategies, applies the global mask char to full and partial,
  // then the per-strategy option tables.
  void Setup(const Config& config);
  // Back to built-ins only, no cached instances.
  void Reset();

 private:
  void RegisterBuiltins();

  std::map<std::string, StrategyFactory> factories_;
  std::unordered_map<std::string, std::unique_ptr<Strategy>> instances_;
};

}  // namespace dotmask

#endif

#ifndef DOTMASK_STRATEGY_H
#define DOTMASK_STRATEGY_H

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "dotmask/option.h"
#include "dotmask/types.h"

namespace dotmask {

// A named, configurable transform from a raw value to its masked display text.
//
// Subclasses implement Apply() and Copy(); Validate() and OnConfigure() are optional
// hooks. Option lookups fall back from the configured value to the schema default.
class Strategy {
 public:
  Strategy(std::string name, std::string description, OptionSchema schema, Options defaults);
  virtual ~Strategy() = default;

  Strategy& operator=(const Strategy&) = delete;

  virtual std::string Apply(std::string_view value, const MaskContext& ctx) const = 0;

  // Runs the strategy's own validator, then the schema.
  std::optional<OptionViolation> Check(const Options& options) const;

  // Throws OptionValidationError. On success schema defaults fill unset options, then
  // |options| is merged over the current set and OnConfigure() runs.
  Strategy& Configure(const Options& options);

  // Independent copy sharing the transform logic, optionally reconfigured.
  std::unique_ptr<Strategy> Clone() const;
  std::unique_ptr<Strategy> Clone(const Options& options) const;

  const OptionValue* FindOption(const std::string& key) const;
  int64_t GetNumber(const std::string& key, int64_t fallback) const;
  std::optional<int64_t> GetOptionalNumber(const std::string& key) const;
  std::string GetString(const std::string& key, const std::string& fallback) const;
  char GetChar(const std::string& key, char fallback) const;
  bool GetBool(const std::string& key, bool fallback) const;
  const TransformFn* GetCallable(const std::string& key) const;

  const std::string& name() const { return name_; }
  const std::string& description() const { return description_; }
  const OptionSchema& schema() const { return schema_; }
  const Options& options() const { return options_; }

 protected:
  Strategy(const Strategy&) = default;

  virtual std::optional<OptionViolation> Validate(const Options& options) const;
  virtual void OnConfigure(const Options& options);
  virtual std::unique_ptr<Strategy> Copy() const = 0;

 private:
  std::string name_;
  std::string description_;
  OptionSchema schema_;
  Options options_;
};

using ApplyFn = std::function<std::string(const Strategy& self, std::string_view value, const MaskContext& ctx)>;
using ValidateFn = std::function<std::optional<OptionViolation>(const Options& options)>;
using ConfigureFn = std::function<void(Strategy& self, const Options& options)>;
using RegisterFn = std::function<void(Strategy& self)>;

// Table form of a user strategy. Only |apply| is required.
struct StrategyDefinition {
  std::string description;
  OptionSchema schema;
  Options default_options;
  ApplyFn apply;
  ValidateFn validate;
  ConfigureFn on_configure;
  RegisterFn on_register;
};

class DefinedStrategy : public Strategy {
 public:
  DefinedStrategy(std::string name, std::shared_ptr<const StrategyDefinition> definition);

  std::string Apply(std::string_view value, const MaskContext& ctx) const override;

 protected:
  std::optional<OptionViolation> Validate(const Options& options) const override;
  void OnConfigure(const Options& options) override;
  std::unique_ptr<Strategy> Copy() const override;

 private:
  std::shared_ptr<const StrategyDefinition> definition_;
};

// Built-in maskers, shared by the strategies and the C ABI.
std::string MaskFull(std::string_view value, char mask_char);
std::string MaskFixed(size_t length, char mask_char);
// Caller guarantees show_start + show_end <= value.size().
std::string MaskPartial(std::string_view value, char mask_char, size_t show_start, size_t show_end);

// Upper bound for fixed_length, show_start, show_end and min_mask.
constexpr int64_t kMaxMaskWidth = 65536;

class FullStrategy : public Strategy {
 public:
  static constexpr const char* kName = "full";
  FullStrategy();

  std::string Apply(std::string_view value, const MaskContext& ctx) const override;

 protected:
  std::optional<OptionViolation> Validate(const Options& options) const override;
  std::unique_ptr<Strategy> Copy() const override;
};

class PartialStrategy : public Strategy {
 public:
  static constexpr const char* kName = "partial";
  PartialStrategy();

  std::string Apply(std::string_view value, const MaskContext& ctx) const override;

 protected:
  std::optional<OptionViolation> Validate(const Options& options) const override;
  std::unique_ptr<Strategy> Copy() const override;
};

class NoneStrategy : public Strategy {
 public:
  static constexpr const char* kName = "none";
  NoneStrategy();

  std::string Apply(std::string_view value, const MaskContext& ctx) const override;

 protected:
  std::unique_ptr<Strategy> Copy() const override;
};

}  // namespace dotmask

#endif

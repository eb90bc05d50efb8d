#ifndef DOTMASK_OPTION_H
#define DOTMASK_OPTION_H

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "dotmask/types.h"

namespace dotmask {

using TransformFn = std::function<std::string(std::string_view value, const MaskContext& ctx)>;

enum class OptionKind { kBoolean, kNumber, kString, kEnumeration, kCallable };

const char* OptionKindName(OptionKind kind);

// A single option value. Numbers are integral; enumerations are carried as strings.
class OptionValue {
 public:
  OptionValue() : data_(false) {}
  OptionValue(bool v) : data_(v) {}
  OptionValue(int v) : data_(static_cast<int64_t>(v)) {}
  OptionValue(long v) : data_(static_cast<int64_t>(v)) {}
  OptionValue(long long v) : data_(static_cast<int64_t>(v)) {}
  OptionValue(const char* v) : data_(std::string(v)) {}
  OptionValue(std::string v) : data_(std::move(v)) {}
  OptionValue(TransformFn v) : data_(std::move(v)) {}

  OptionKind kind() const;

  bool is_bool() const { return std::holds_alternative<bool>(data_); }
  bool is_number() const { return std::holds_alternative<int64_t>(data_); }
  bool is_string() const { return std::holds_alternative<std::string>(data_); }
  bool is_callable() const { return std::holds_alternative<TransformFn>(data_); }

  bool as_bool() const { return std::get<bool>(data_); }
  int64_t as_number() const { return std::get<int64_t>(data_); }
  const std::string& as_string() const { return std::get<std::string>(data_); }
  const TransformFn& as_callable() const { return std::get<TransformFn>(data_); }

  // Callables render as "<function>".
  std::string ToString() const;

 private:
  std::variant<bool, int64_t, std::string, TransformFn> data_;
};

using Options = std::map<std::string, OptionValue>;

struct OptionSpec {
  OptionKind kind{OptionKind::kString};
  std::optional<OptionValue> default_value;
  std::optional<int64_t> min;
  std::optional<int64_t> max;
  std::vector<std::string> choices;
  std::string description;
};

using OptionSchema = std::map<std::string, OptionSpec>;

OptionSpec BooleanOption(std::optional<bool> def, std::string description);
OptionSpec NumberOption(std::optional<int64_t> def, std::optional<int64_t> min, std::optional<int64_t> max,
                        std::string description);
OptionSpec StringOption(std::optional<std::string> def, std::string description);
OptionSpec EnumOption(std::string def, std::vector<std::string> choices, std::string description);
OptionSpec CallableOption(std::string description);

struct OptionViolation {
  std::string option;
  std::string constraint;
};

// Checks every option present in |options| that the schema knows about. Options the
// schema does not name are accepted as-is.
std::optional<OptionViolation> ValidateOptions(const OptionSchema& schema, const Options& options);

class OptionValidationError : public Error {
 public:
  OptionValidationError(std::string strategy, OptionViolation violation);

  const std::string& strategy() const { return strategy_; }
  const std::string& option() const { return option_; }
  const std::string& constraint() const { return constraint_; }

 private:
  std::string strategy_;
  std::string option_;
  std::string constraint_;
};

}  // namespace dotmask

#endif

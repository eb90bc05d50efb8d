#include "dotmask/option.h"

#include <algorithm>

namespace dotmask {

namespace {

std::string join(const std::vector<std::string>& v, const char* sep) {
  std::string out;
  for (size_t i = 0; i < v.size(); ++i) {
    if (i > 0) out += sep;
    out += v[i];
  }
  return out;
}

bool kind_matches(OptionKind expected, const OptionValue& value) {
  if (expected == OptionKind::kEnumeration) return value.is_string();
  return expected == value.kind();
}

}  // namespace

const char* OptionKindName(OptionKind kind) {
  switch (kind) {
    case OptionKind::kBoolean:
      return "boolean";
    case OptionKind::kNumber:
      return "number";
    case OptionKind::kString:
      return "string";
    case OptionKind::kEnumeration:
      return "enumeration";
    case OptionKind::kCallable:
      return "function";
  }
  return "unknown";
}

OptionKind OptionValue::kind() const {
  if (is_bool()) return OptionKind::kBoolean;
  if (is_number()) return OptionKind::kNumber;
  if (is_string()) return OptionKind::kString;
  return OptionKind::kCallable;
}

std::string OptionValue::ToString() const {
  if (is_bool()) return as_bool() ? "true" : "false";
  if (is_number()) return std::to_string(as_number());
  if (is_string()) return as_string();
  return "<function>";
}

OptionSpec BooleanOption(std::optional<bool> def, std::string description) {
  OptionSpec s;
  s.kind = OptionKind::kBoolean;
  if (def) s.default_value = OptionValue(*def);
  s.description = std::move(description);
  return s;
}

OptionSpec NumberOption(std::optional<int64_t> def, std::optional<int64_t> min, std::optional<int64_t> max,
                        std::string description) {
  OptionSpec s;
  s.kind = OptionKind::kNumber;
  if (def) s.default_value = OptionValue(static_cast<long long>(*def));
  s.min = min;
  s.max = max;
  s.description = std::move(description);
  return s;
}

OptionSpec StringOption(std::optional<std::string> def, std::string description) {
  OptionSpec s;
  s.kind = OptionKind::kString;
  if (def) s.default_value = OptionValue(std::move(*def));
  s.description = std::move(description);
  return s;
}

OptionSpec EnumOption(std::string def, std::vector<std::string> choices, std::string description) {
  OptionSpec s;
  s.kind = OptionKind::kEnumeration;
  s.default_value = OptionValue(std::move(def));
  s.choices = std::move(choices);
  s.description = std::move(description);
  return s;
}

OptionSpec CallableOption(std::string description) {
  OptionSpec s;
  s.kind = OptionKind::kCallable;
  s.description = std::move(description);
  return s;
}

std::optional<OptionViolation> ValidateOptions(const OptionSchema& schema, const Options& options) {
  for (const auto& kv : schema) {
    const std::string& name = kv.first;
    const OptionSpec& spec = kv.second;
    auto it = options.find(name);
    if (it == options.end()) continue;
    const OptionValue& value = it->second;

    if (!kind_matches(spec.kind, value)) {
      const char* want = spec.kind == OptionKind::kEnumeration ? "string" : OptionKindName(spec.kind);
      return OptionViolation{name, std::string("must be ") + want + ", got " + OptionKindName(value.kind())};
    }

    if (spec.kind == OptionKind::kNumber) {
      if (spec.min && value.as_number() < *spec.min) {
        return OptionViolation{name, "must be >= " + std::to_string(*spec.min)};
      }
      if (spec.max && value.as_number() > *spec.max) {
        return OptionViolation{name, "must be <= " + std::to_string(*spec.max)};
      }
    }

    if (!spec.choices.empty() && value.is_string()) {
      if (std::find(spec.choices.begin(), spec.choices.end(), value.as_string()) == spec.choices.end()) {
        return OptionViolation{name, "must be one of: " + join(spec.choices, ", ")};
      }
    }
  }
  return std::nullopt;
}

OptionValidationError::OptionValidationError(std::string strategy, OptionViolation violation)
    : Error("invalid options for strategy '" + strategy + "': option '" + violation.option + "' " +
            violation.constraint),
      strategy_(std::move(strategy)),
      option_(std::move(violation.option)),
      constraint_(std::move(violation.constraint)) {}

}  // namespace dotmask

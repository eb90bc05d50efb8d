#include "dotmask/config.h"

#include <yaml-cpp/yaml.h>

#include <set>

namespace dotmask {

namespace {

const std::set<std::string> kTopLevelKeys = {"mask_char",         "default_mode",   "skip_comments",
                                             "patterns",          "sources",        "modes",
                                             "env_file_patterns", "cache_capacity", "debounce_ms",
                                             "peek_duration_ms"};

[[noreturn]] void fail(const YAML::Node& node, const std::string& message) {
  const YAML::Mark mark = node.Mark();
  throw ConfigError(message, mark.line, mark.column);
}

std::string scalar_string(const YAML::Node& node, const std::string& key) {
  if (!node.IsScalar()) fail(node, "'" + key + "' must be a string");
  return node.Scalar();
}

bool scalar_bool(const YAML::Node& node, const std::string& key) {
  bool v = false;
  if (!node.IsScalar() || !YAML::convert<bool>::decode(node, v)) fail(node, "'" + key + "' must be a boolean");
  return v;
}

long long scalar_int(const YAML::Node& node, const std::string& key, long long min) {
  long long v = 0;
  if (!node.IsScalar() || !YAML::convert<long long>::decode(node, v)) fail(node, "'" + key + "' must be an integer");
  if (v < min) fail(node, "'" + key + "' must be >= " + std::to_string(min));
  return v;
}

PatternMap pattern_map(const YAML::Node& node, const std::string& key) {
  if (node.IsNull()) return {};
  if (!node.IsMap()) fail(node, "'" + key + "' must be a mapping of glob to mode");
  PatternMap out;
  for (const auto& kv : node) {
    std::string glob = scalar_string(kv.first, key);
    out[glob] = scalar_string(kv.second, key + "." + glob);
  }
  return out;
}

// Unquoted booleans and integers are recognised; anything else stays a string.
OptionValue option_value(const YAML::Node& node, const std::string& key) {
  if (!node.IsScalar()) fail(node, "'" + key + "' must be a scalar");
  if (node.Tag() == "!") return OptionValue(node.Scalar());
  bool b = false;
  if (YAML::convert<bool>::decode(node, b)) return OptionValue(b);
  long long n = 0;
  if (YAML::convert<long long>::decode(node, n)) return OptionValue(n);
  return OptionValue(node.Scalar());
}

std::map<std::string, Options> mode_tables(const YAML::Node& node) {
  if (node.IsNull()) return {};
  if (!node.IsMap()) fail(node, "'modes' must be a mapping of mode name to options");
  std::map<std::string, Options> out;
  for (const auto& mode : node) {
    std::string name = scalar_string(mode.first, "modes");
    if (mode.second.IsNull()) {
      out[name];
      continue;
    }
    if (!mode.second.IsMap()) fail(mode.second, "'modes." + name + "' must be a mapping");
    Options& opts = out[name];
    for (const auto& opt : mode.second) {
      std::string opt_name = scalar_string(opt.first, "modes." + name);
      opts[opt_name] = option_value(opt.second, "modes." + name + "." + opt_name);
    }
  }
  return out;
}

Config from_node(const YAML::Node& root) {
  Config cfg;
  if (root.IsNull()) return cfg;
  if (!root.IsMap()) fail(root, "configuration root must be a mapping");

  for (const auto& kv : root) {
    std::string key = scalar_string(kv.first, "key");
    if (kTopLevelKeys.find(key) == kTopLevelKeys.end()) fail(kv.first, "unknown configuration key '" + key + "'");
  }

  if (auto n = root["mask_char"]) {
    std::string s = scalar_string(n, "mask_char");
    if (s.size() != 1) fail(n, "'mask_char' must be a single character");
    cfg.mask_char = s[0];
  }
  if (auto n = root["default_mode"]) cfg.default_strategy = scalar_string(n, "default_mode");
  if (auto n = root["skip_comments"]) cfg.skip_comments = scalar_bool(n, "skip_comments");
  if (auto n = root["patterns"]) cfg.key_patterns = pattern_map(n, "patterns");
  if (auto n = root["sources"]) cfg.source_patterns = pattern_map(n, "sources");
  if (auto n = root["modes"]) cfg.strategy_options = mode_tables(n);
  if (auto n = root["env_file_patterns"]) {
    if (!n.IsSequence()) fail(n, "'env_file_patterns' must be a list");
    cfg.env_file_patterns.clear();
    for (const auto& p : n) cfg.env_file_patterns.push_back(scalar_string(p, "env_file_patterns"));
  }
  if (auto n = root["cache_capacity"]) cfg.cache_capacity = static_cast<size_t>(scalar_int(n, "cache_capacity", 1));
  if (auto n = root["debounce_ms"]) cfg.debounce_ms = static_cast<int>(scalar_int(n, "debounce_ms", 0));
  if (auto n = root["peek_duration_ms"]) cfg.peek_duration_ms = static_cast<int>(scalar_int(n, "peek_duration_ms", 0));
  return cfg;
}

}  // namespace

ConfigError::ConfigError(const std::string& message, int line, int column)
    : Error(line >= 0 ? message + " (line " + std::to_string(line + 1) + ", column " + std::to_string(column + 1) + ")"
                      : message),
      line_(line),
      column_(column) {}

Config ParseConfig(std::string_view yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml));
  } catch (const YAML::ParserException& e) {
    throw ConfigError(e.msg, e.mark.line, e.mark.column);
  }
  return from_node(root);
}

Config LoadConfigFile(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::BadFile&) {
    throw ConfigError("cannot read configuration file '" + path + "'");
  } catch (const YAML::ParserException& e) {
    throw ConfigError(path + ": " + e.msg, e.mark.line, e.mark.column);
  }
  return from_node(root);
}

}  // namespace dotmask

#ifndef DOTMASK_CONFIG_H
#define DOTMASK_CONFIG_H

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "dotmask/option.h"
#include "dotmask/strategy.h"
#include "dotmask/types.h"

namespace dotmask {

using PatternMap = std::map<std::string, std::string>;

struct Config {
  char mask_char{'*'};
  std::string default_strategy{"full"};
  bool skip_comments{true};
  // glob -> strategy name
  PatternMap key_patterns;
  PatternMap source_patterns;
  // strategy name -> option overrides
  std::map<std::string, Options> strategy_options;
  // Registered on every (re)configuration; not loadable from YAML.
  std::map<std::string, StrategyDefinition> custom_strategies;
  std::vector<std::string> env_file_patterns{".env", ".env.*", "*.env"};
  size_t cache_capacity{200};
  int debounce_ms{150};
  int peek_duration_ms{3000};
};

class ConfigError : public Error {
 public:
  explicit ConfigError(const std::string& message, int line = -1, int column = -1);

  // Zero-based position in the YAML source, -1 when unknown.
  int line() const { return line_; }
  int column() const { return column_; }

 private:
  int line_;
  int column_;
};

// Starts from the defaults above and overlays what the document sets.
Config ParseConfig(std::string_view yaml);
Config LoadConfigFile(const std::string& path);

}  // namespace dotmask

#endif

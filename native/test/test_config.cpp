#include "dotmask/config.h"
#include "dotmask/strategy_registry.h"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

namespace {

using dotmask::Config;
using dotmask::ConfigError;
using dotmask::ParseConfig;

int test_defaults() {
  Config cfg = ParseConfig("");
  if (cfg.mask_char != '*' || cfg.default_strategy != "full" || !cfg.skip_comments) return 1;
  if (cfg.cache_capacity != 200 || cfg.debounce_ms != 150 || cfg.peek_duration_ms != 3000) return 1;
  if (cfg.env_file_patterns.size() != 3) return 1;
  return 0;
}

int test_full_document() {
  const char* yaml =
      "mask_char: '#'\n"
      "default_mode: partial\n"
      "skip_comments: false\n"
      "patterns:\n"
      "  '*_KEY': full\n"
      "  DEBUG: none\n"
      "sources:\n"
      "  .env.local: none\n"
      "modes:\n"
      "  partial:\n"
      "    show_start: 2\n"
      "    show_end: 0\n"
      "    fallback_mode: none\n"
      "  full:\n"
      "    fixed_length: 6\n"
      "env_file_patterns: ['.env', '*.secrets']\n"
      "cache_capacity: 16\n"
      "debounce_ms: 50\n"
      "peek_duration_ms: 1000\n";
  Config cfg = ParseConfig(yaml);
  if (cfg.mask_char != '#' || cfg.default_strategy != "partial" || cfg.skip_comments) return 1;
  if (cfg.key_patterns.at("*_KEY") != "full" || cfg.key_patterns.at("DEBUG") != "none") return 1;
  if (cfg.source_patterns.at(".env.local") != "none") return 1;
  const dotmask::Options& partial = cfg.strategy_options.at("partial");
  if (partial.at("show_start").as_number() != 2 || partial.at("show_end").as_number() != 0) return 1;
  if (partial.at("fallback_mode").as_string() != "none") return 1;
  if (cfg.strategy_options.at("full").at("fixed_length").as_number() != 6) return 1;
  if (cfg.env_file_patterns != std::vector<std::string>{".env", "*.secrets"}) return 1;
  if (cfg.cache_capacity != 16 || cfg.debounce_ms != 50 || cfg.peek_duration_ms != 1000) return 1;
  return 0;
}

int test_option_scalar_typing() {
  Config cfg = ParseConfig(
      "modes:\n"
      "  custom:\n"
      "    flag: true\n"
      "    count: 12\n"
      "    word: yes-ish\n"
      "    quoted: 'true'\n"
      "    char: '7'\n");
  const dotmask::Options& o = cfg.strategy_options.at("custom");
  if (!o.at("flag").is_bool() || !o.at("flag").as_bool()) return 1;
  if (!o.at("count").is_number() || o.at("count").as_number() != 12) return 1;
  if (!o.at("word").is_string()) return 1;
  if (!o.at("quoted").is_string() || o.at("quoted").as_string() != "true") return 1;
  if (!o.at("char").is_string() || o.at("char").as_string() != "7") return 1;
  return 0;
}

bool rejects(const std::string& yaml, const std::string& needle) {
  try {
    ParseConfig(yaml);
  } catch (const ConfigError& e) {
    if (std::string(e.what()).find(needle) != std::string::npos) return true;
    std::cerr << "  unexpected message: " << e.what() << "\n";
    return false;
  }
  std::cerr << "  accepted: " << yaml << "\n";
  return false;
}

int test_rejections() {
  if (!rejects("mask_char: '**'\n", "single character")) return 1;
  if (!rejects("skip_comments: maybe\n", "boolean")) return 1;
  if (!rejects("cache_capacity: 0\n", ">= 1")) return 1;
  if (!rejects("debounce_ms: soon\n", "integer")) return 1;
  if (!rejects("patterns: [a, b]\n", "mapping")) return 1;
  if (!rejects("colour: blue\n", "unknown configuration key 'colour'")) return 1;
  if (!rejects("modes:\n  partial: 3\n", "modes.partial")) return 1;
  if (!rejects("- just\n- a list\n", "mapping")) return 1;
  return 0;
}

int test_error_position() {
  try {
    ParseConfig("mask_char: '*'\nskip_comments: nope\n");
  } catch (const ConfigError& e) {
    if (e.line() != 1 || e.column() != 15) return 1;
    return std::string(e.what()).find("(line 2, column 16)") != std::string::npos ? 0 : 1;
  }
  return 1;
}

int test_syntax_error() {
  try {
    ParseConfig("patterns: {unclosed\n");
  } catch (const ConfigError&) {
    return 0;
  }
  return 1;
}

int test_load_file() {
  const std::string path = "dotmask_test_config.yaml";
  {
    std::ofstream out(path);
    out << "default_mode: none\npatterns:\n  '*_TOKEN': partial\n";
  }
  Config cfg = dotmask::LoadConfigFile(path);
  std::remove(path.c_str());
  if (cfg.default_strategy != "none" || cfg.key_patterns.at("*_TOKEN") != "partial") return 1;

  try {
    dotmask::LoadConfigFile("does/not/exist.yaml");
  } catch (const ConfigError& e) {
    return std::string(e.what()).find("does/not/exist.yaml") != std::string::npos ? 0 : 1;
  }
  return 1;
}

int test_invalid_mode_options_surface_at_setup() {
  Config cfg = ParseConfig("modes:\n  partial:\n    show_start: many\n");
  dotmask::StrategyRegistry reg;
  try {
    reg.Setup(cfg);
  } catch (const dotmask::OptionValidationError& e) {
    return e.option() == "show_start" ? 0 : 1;
  }
  return 1;
}

}  // namespace

int main() {
  int rc = 0;
  auto run = [&](const char* name, int (*fn)()) {
    int r = fn();
    if (r != 0) std::cerr << "failed: " << name << "\n";
    rc |= r;
  };
  run("defaults", test_defaults);
  run("full_document", test_full_document);
  run("scalar_typing", test_option_scalar_typing);
  run("rejections", test_rejections);
  run("error_position", test_error_position);
  run("syntax_error", test_syntax_error);
  run("load_file", test_load_file);
  run("setup_validation", test_invalid_mode_options_surface_at_setup);
  if (rc != 0) std::cerr << "config tests failed\n";
  return rc;
}

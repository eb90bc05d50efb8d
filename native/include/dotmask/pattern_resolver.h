#ifndef DOTMASK_PATTERN_RESOLVER_H
#define DOTMASK_PATTERN_RESOLVER_H

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dotmask/config.h"

namespace re2 {
class RE2;
}

namespace dotmask {

// A glob ('*' matches any run, everything else literal) compiled to an anchored RE2.
class GlobMatcher {
 public:
  explicit GlobMatcher(std::string glob);
  ~GlobMatcher();
  GlobMatcher(GlobMatcher&&) noexcept;
  GlobMatcher& operator=(GlobMatcher&&) noexcept;

  bool Matches(std::string_view text) const;

  const std::string& glob() const { return glob_; }
  int specificity() const { return specificity_; }

  static std::string ToRegex(std::string_view glob);
  // Pattern length minus ten per wildcard.
  static int Specificity(std::string_view glob);

 private:
  std::string glob_;
  int specificity_;
  std::unique_ptr<re2::RE2> re_;
};

struct PatternRule {
  GlobMatcher matcher;
  std::string strategy;
};

// Resolves the strategy for a key. Key rules win over source rules, which win over the
// default. Among matching rules the highest specificity wins; equal specificity goes to
// the lexically smallest glob.
class PatternResolver {
 public:
  PatternResolver() = default;

  // Replaces all rules.
  void Compile(const PatternMap& by_key, const PatternMap& by_source, std::string default_strategy);
  void Clear();

  std::optional<std::string> ResolveForKey(std::string_view key) const;
  std::optional<std::string> ResolveForSource(std::string_view basename) const;
  std::string DetermineStrategy(std::string_view key, std::optional<std::string_view> source_basename) const;

  bool compiled() const { return compiled_; }
  const std::string& default_strategy() const { return default_strategy_; }
  size_t rule_count() const { return key_rules_.size() + source_rules_.size(); }

 private:
  static std::vector<PatternRule> compile_rules(const PatternMap& patterns);
  static const PatternRule* best_match(const std::vector<PatternRule>& rules, std::string_view text);

  std::vector<PatternRule> key_rules_;
  std::vector<PatternRule> source_rules_;
  std::string default_strategy_{"full"};
  bool compiled_{false};
};

// Final path component; accepts '/' and '\\' separators.
std::string_view Basename(std::string_view path);

class EnvFileMatcher {
 public:
  explicit EnvFileMatcher(const std::vector<std::string>& patterns);

  bool IsEnvFile(std::string_view path) const;

 private:
  std::vector<GlobMatcher> matchers_;
};

}  // namespace dotmask

#endif

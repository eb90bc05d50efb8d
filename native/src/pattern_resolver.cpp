#include "dotmask/pattern_resolver.h"

#include <re2/re2.h>

#include "dotmask/log.h"

namespace dotmask {

GlobMatcher::GlobMatcher(std::string glob)
    : glob_(std::move(glob)), specificity_(Specificity(glob_)) {
  RE2::Options options;
  options.set_log_errors(false);
  re_ = std::make_unique<RE2>(ToRegex(glob_), options);
  if (!re_->ok()) LogWarn("pattern '" + glob_ + "' does not compile: " + re_->error());
}

GlobMatcher::~GlobMatcher() = default;
GlobMatcher::GlobMatcher(GlobMatcher&&) noexcept = default;
GlobMatcher& GlobMatcher::operator=(GlobMatcher&&) noexcept = default;

bool GlobMatcher::Matches(std::string_view text) const {
  if (!re_ || !re_->ok()) return false;
  return RE2::FullMatch(re2::StringPiece(text.data(), text.size()), *re_);
}

std::string GlobMatcher::ToRegex(std::string_view glob) {
  std::string out;
  size_t start = 0;
  for (size_t i = 0; i <= glob.size(); ++i) {
    if (i == glob.size() || glob[i] == '*') {
      if (i > start) out += RE2::QuoteMeta(re2::StringPiece(glob.data() + start, i - start));
      if (i < glob.size()) out += ".*";
      start = i + 1;
    }
  }
  return out;
}

int GlobMatcher::Specificity(std::string_view glob) {
  int wildcards = 0;
  for (char c : glob) {
    if (c == '*') ++wildcards;
  }
  return static_cast<int>(glob.size()) - wildcards * 10;
}

std::vector<PatternRule> PatternResolver::compile_rules(const PatternMap& patterns) {
  std::vector<PatternRule> rules;
  rules.reserve(patterns.size());
  for (const auto& kv : patterns) rules.push_back(PatternRule{GlobMatcher(kv.first), kv.second});
  return rules;
}

const PatternRule* PatternResolver::best_match(const std::vector<PatternRule>& rules, std::string_view text) {
  const PatternRule* best = nullptr;
  for (const PatternRule& rule : rules) {
    if (best != nullptr && rule.matcher.specificity() <= best->matcher.specificity()) continue;
    if (rule.matcher.Matches(text)) best = &rule;
  }
  return best;
}

void PatternResolver::Compile(const PatternMap& by_key, const PatternMap& by_source, std::string default_strategy) {
  key_rules_ = compile_rules(by_key);
  source_rules_ = compile_rules(by_source);
  default_strategy_ = std::move(default_strategy);
  compiled_ = true;
}

void PatternResolver::Clear() {
  key_rules_.clear();
  source_rules_.clear();
  compiled_ = false;
}

std::optional<std::string> PatternResolver::ResolveForKey(std::string_view key) const {
  const PatternRule* rule = best_match(key_rules_, key);
  if (rule == nullptr) return std::nullopt;
  return rule->strategy;
}

std::optional<std::string> PatternResolver::ResolveForSource(std::string_view basename) const {
  const PatternRule* rule = best_match(source_rules_, basename);
  if (rule == nullptr) return std::nullopt;
  return rule->strategy;
}

std::string PatternResolver::DetermineStrategy(std::string_view key,
                                               std::optional<std::string_view> source_basename) const {
  if (auto s = ResolveForKey(key)) return *s;
  if (source_basename) {
    if (auto s = ResolveForSource(*source_basename)) return *s;
  }
  return default_strategy_;
}

std::string_view Basename(std::string_view path) {
  size_t pos = path.find_last_of("/\\");
  if (pos == std::string_view::npos) return path;
  return path.substr(pos + 1);
}

EnvFileMatcher::EnvFileMatcher(const std::vector<std::string>& patterns) {
  matchers_.reserve(patterns.size());
  for (const std::string& p : patterns) matchers_.emplace_back(p);
}

bool EnvFileMatcher::IsEnvFile(std::string_view path) const {
  std::string_view name = Basename(path);
  for (const GlobMatcher& m : matchers_) {
    if (m.Matches(name)) return true;
  }
  return false;
}

}  // namespace dotmask

#include "dotmask/pattern_resolver.h"

#include <iostream>
#include <string>

namespace {

using dotmask::GlobMatcher;
using dotmask::PatternResolver;

int test_glob_star_and_literals() {
  GlobMatcher m("*_KEY");
  if (!m.Matches("API_KEY") || !m.Matches("_KEY")) return 1;
  if (m.Matches("API_KEYS") || m.Matches("api_key")) return 1;

  GlobMatcher dotted("db.host");
  if (!dotted.Matches("db.host") || dotted.Matches("dbxhost")) return 1;

  GlobMatcher meta("a+b(c)?[d]");
  if (!meta.Matches("a+b(c)?[d]") || meta.Matches("aab(c)d")) return 1;

  GlobMatcher middle("DB_*_URL");
  if (!middle.Matches("DB_PRIMARY_URL") || !middle.Matches("DB__URL") || middle.Matches("DB_URL")) return 1;
  return 0;
}

int test_specificity() {
  if (GlobMatcher::Specificity("API_KEY") != 7) return 1;
  if (GlobMatcher::Specificity("*_KEY") != -5) return 1;
  if (GlobMatcher::Specificity("*") != -9) return 1;
  if (GlobMatcher::Specificity("*_*") != -17) return 1;
  return 0;
}

int test_most_specific_key_rule_wins() {
  PatternResolver r;
  r.Compile({{"*", "none"}, {"*_KEY", "partial"}, {"STRIPE_KEY", "full"}}, {}, "none");
  if (r.ResolveForKey("STRIPE_KEY").value_or("") != "full") return 1;
  if (r.ResolveForKey("API_KEY").value_or("") != "partial") return 1;
  if (r.ResolveForKey("HOME").value_or("") != "none") return 1;
  return 0;
}

int test_equal_specificity_prefers_lexically_smallest() {
  PatternResolver r;
  // "*B" sorts before "A*"; both score -8.
  r.Compile({{"A*", "partial"}, {"*B", "none"}}, {}, "full");
  if (r.ResolveForKey("AB").value_or("") != "none") return 1;
  if (r.ResolveForKey("AC").value_or("") != "partial") return 1;
  return 0;
}

int test_precedence_key_source_default() {
  PatternResolver r;
  r.Compile({{"*_SECRET", "full"}}, {{".env.local", "none"}}, "partial");
  if (r.DetermineStrategy("DB_SECRET", std::string_view(".env.local")) != "full") return 1;
  if (r.DetermineStrategy("DB_HOST", std::string_view(".env.local")) != "none") return 1;
  if (r.DetermineStrategy("DB_HOST", std::string_view(".env")) != "partial") return 1;
  if (r.DetermineStrategy("DB_HOST", std::nullopt) != "partial") return 1;
  return 0;
}

int test_source_rules_use_specificity() {
  PatternResolver r;
  r.Compile({}, {{".env.*", "partial"}, {".env.production", "full"}}, "none");
  if (r.ResolveForSource(".env.production").value_or("") != "full") return 1;
  if (r.ResolveForSource(".env.staging").value_or("") != "partial") return 1;
  if (r.ResolveForSource("config.yaml")) return 1;
  return 0;
}

int test_recompile_replaces_rules() {
  PatternResolver r;
  if (r.compiled()) return 1;
  r.Compile({{"*_TOKEN", "partial"}}, {}, "full");
  if (!r.compiled() || r.rule_count() != 1) return 1;
  r.Compile({}, {}, "none");
  if (r.ResolveForKey("GH_TOKEN")) return 1;
  if (r.DetermineStrategy("GH_TOKEN", std::nullopt) != "none") return 1;
  r.Clear();
  return r.compiled() ? 1 : 0;
}

int test_basename() {
  if (dotmask::Basename("/srv/app/.env.local") != ".env.local") return 1;
  if (dotmask::Basename("C:\\app\\prod.env") != "prod.env") return 1;
  if (dotmask::Basename(".env") != ".env") return 1;
  if (dotmask::Basename("dir/") != "") return 1;
  return 0;
}

int test_env_file_matcher() {
  dotmask::EnvFileMatcher m({".env", ".env.*", "*.env"});
  if (!m.IsEnvFile("/home/u/project/.env")) return 1;
  if (!m.IsEnvFile(".env.production")) return 1;
  if (!m.IsEnvFile("config/staging.env")) return 1;
  if (m.IsEnvFile("environment.yaml")) return 1;
  if (m.IsEnvFile("/tmp/.envrc")) return 1;
  return 0;
}

}  // namespace

int main() {
  int rc = 0;
  auto run = [&](const char* name, int (*fn)()) {
    int r = fn();
    if (r != 0) std::cerr << "failed: " << name << "\n";
    rc |= r;
  };
  run("glob", test_glob_star_and_literals);
  run("specificity", test_specificity);
  run("most_specific", test_most_specific_key_rule_wins);
  run("tie_break", test_equal_specificity_prefers_lexically_smallest);
  run("precedence", test_precedence_key_source_default);
  run("source_specificity", test_source_rules_use_specificity);
  run("recompile", test_recompile_replaces_rules);
  run("basename", test_basename);
  run("env_files", test_env_file_matcher);
  if (rc != 0) std::cerr << "pattern tests failed\n";
  return rc;
}

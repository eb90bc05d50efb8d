#include "dotmask/content_cache.h"
#include "dotmask/fingerprint.h"

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

namespace {

using Cache = dotmask::ContentCache<int>;

std::vector<std::string> keys_mru_first(const Cache& c) {
  std::vector<std::string> out;
  c.ForEach([&out](const std::string& k, const int&) { out.push_back(k); });
  return out;
}

int test_lru_get_refreshes_recency() {
  Cache c(3);
  c.Put("a", 1);
  c.Put("b", 2);
  c.Put("c", 3);
  if (c.Get("a").value_or(0) != 1) return 1;
  c.Put("d", 4);
  if (c.size() != 3) return 1;
  if (c.Get("b")) return 1;
  if (c.Get("a").value_or(0) != 1 || c.Get("c").value_or(0) != 3 || c.Get("d").value_or(0) != 4) return 1;
  return 0;
}

int test_insertion_order_eviction_without_gets() {
  Cache c(2);
  c.Put("x", 1);
  c.Put("y", 2);
  c.Put("z", 3);
  if (c.Contains("x") || !c.Contains("y") || !c.Contains("z")) return 1;
  return 0;
}

int test_put_existing_updates_without_growth() {
  Cache c(2);
  c.Put("a", 1);
  c.Put("b", 2);
  c.Put("a", 10);
  if (c.size() != 2) return 1;
  if (keys_mru_first(c) != std::vector<std::string>{"a", "b"}) return 1;
  c.Put("c", 3);
  if (c.Contains("b")) return 1;
  return c.Get("a").value_or(0) == 10 ? 0 : 1;
}

int test_remove_and_reuse_slots() {
  Cache c(3);
  c.Put("a", 1);
  c.Put("b", 2);
  if (!c.Remove("a") || c.Remove("a")) return 1;
  if (c.size() != 1 || c.Contains("a")) return 1;
  c.Put("c", 3);
  c.Put("d", 4);
  if (keys_mru_first(c) != std::vector<std::string>{"d", "c", "b"}) return 1;
  c.Put("e", 5);
  if (c.Contains("b") || c.size() != 3) return 1;
  return 0;
}

int test_clear() {
  Cache c(2);
  c.Put("a", 1);
  c.Put("b", 2);
  c.Clear();
  if (c.size() != 0 || c.Get("a")) return 1;
  if (!keys_mru_first(c).empty()) return 1;
  c.Put("c", 3);
  return c.Get("c").value_or(0) == 3 ? 0 : 1;
}

int test_size_never_exceeds_capacity() {
  Cache c(5);
  for (int i = 0; i < 200; ++i) {
    c.Put("k" + std::to_string(i % 37), i);
    if (i % 3 == 0) c.Get("k" + std::to_string((i * 7) % 37));
    if (i % 11 == 0) c.Remove("k" + std::to_string((i * 5) % 37));
    if (c.size() > c.capacity()) return 1;
    if (keys_mru_first(c).size() != c.size()) return 1;
  }
  return 0;
}

int test_zero_capacity_holds_one() {
  Cache c(0);
  c.Put("a", 1);
  c.Put("b", 2);
  return (c.capacity() == 1 && c.size() == 1 && c.Contains("b")) ? 0 : 1;
}

int test_fingerprint_small_content() {
  if (dotmask::Fingerprint("") != "0:") return 1;
  if (dotmask::Fingerprint("A=1\n") != "4:A=1\n") return 1;
  std::string hundred(100, 'x');
  if (dotmask::Fingerprint(hundred) != "100:" + std::string(64, 'x')) return 1;
  return 0;
}

int test_fingerprint_large_content() {
  std::string big(512, 'a');
  // 32 samples of 'a' (97) starting from hash = 512
  uint32_t h = 512;
  for (int i = 0; i < 32; ++i) h = h * 31u + 97u;
  char hex[9];
  std::snprintf(hex, sizeof(hex), "%x", static_cast<unsigned>(h));
  if (dotmask::Fingerprint(big) != std::string("512:") + hex) return 1;

  std::string other = big;
  other[16] = 'b';
  if (dotmask::Fingerprint(other) == dotmask::Fingerprint(big)) return 1;
  other = big;
  other[17] = 'b';
  // unsampled byte: same fingerprint by construction
  if (dotmask::Fingerprint(other) != dotmask::Fingerprint(big)) return 1;
  return 0;
}

int test_fingerprint_sample_cap() {
  std::string huge(16 * 600, 'q');
  std::string tail_changed = huge;
  tail_changed[16 * 550] = 'r';
  return dotmask::Fingerprint(huge) == dotmask::Fingerprint(tail_changed) ? 0 : 1;
}

}  // namespace

int main() {
  int rc = 0;
  auto run = [&](const char* name, int (*fn)()) {
    int r = fn();
    if (r != 0) std::cerr << "failed: " << name << "\n";
    rc |= r;
  };
  run("lru_get", test_lru_get_refreshes_recency);
  run("lru_order", test_insertion_order_eviction_without_gets);
  run("put_existing", test_put_existing_updates_without_growth);
  run("remove", test_remove_and_reuse_slots);
  run("clear", test_clear);
  run("bounded", test_size_never_exceeds_capacity);
  run("zero_capacity", test_zero_capacity_holds_one);
  run("fingerprint_small", test_fingerprint_small_content);
  run("fingerprint_large", test_fingerprint_large_content);
  run("fingerprint_cap", test_fingerprint_sample_cap);
  if (rc != 0) std::cerr << "cache tests failed\n";
  return rc;
}

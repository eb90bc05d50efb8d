#include "dotmask.h"

#include <cstdlib>
#include <cstring>
#include <new>
#include <string>
#include <string_view>

#include "dotmask/option.h"
#include "dotmask/strategy.h"

namespace {

constexpr const char* kVersion = "0.1.0";

int copy_to_cbuf(const std::string& s, dm_buf* out) {
  out->data = nullptr;
  out->len = 0;
  if (s.empty()) return 0;
  void* raw = std::malloc(s.size());
  if (raw == nullptr) return 2;
  std::memcpy(raw, s.data(), s.size());
  out->data = static_cast<char*>(raw);
  out->len = s.size();
  return 0;
}

std::string mask_char_option(char c) { return std::string(1, c == '\0' ? '*' : c); }

std::string mask_impl(std::string_view value, const dm_mask_options& opts) {
  const dotmask::MaskContext ctx;
  if (opts.mode == 0) {
    dotmask::FullStrategy full;
    dotmask::Options o{{"mask_char", mask_char_option(opts.mask_char)}};
    if (opts.mask_length > 0) o["fixed_length"] = static_cast<int64_t>(opts.mask_length);
    full.Configure(o);
    return full.Apply(value, ctx);
  }
  if (opts.mode == 1) {
    dotmask::PartialStrategy partial;
    partial.Configure({{"mask_char", mask_char_option(opts.mask_char)},
                       {"show_start", opts.show_start},
                       {"show_end", opts.show_end},
                       {"min_mask", opts.min_mask}});
    return partial.Apply(value, ctx);
  }
  throw dotmask::OptionValidationError("c-api", dotmask::OptionViolation{"mode", "must be 0 (full) or 1 (partial)"});
}

int run_mask(dm_view in, const dm_mask_options& opts, dm_buf* out) {
  if (out == nullptr) return 1;
  out->data = nullptr;
  out->len = 0;
  if (in.data == nullptr && in.len > 0) return 4;

  try {
    std::string_view value(in.len == 0 ? "" : in.data, in.len);
    return copy_to_cbuf(mask_impl(value, opts), out);
  } catch (const dotmask::OptionValidationError&) {
    return 5;
  } catch (const std::bad_alloc&) {
    return 2;
  } catch (const std::exception&) {
    return 3;
  }
}

dm_mask_options default_options() {
  dm_mask_options o;
  o.mask_char = '*';
  o.mask_length = 0;
  o.mode = 0;
  o.show_start = 3;
  o.show_end = 3;
  o.min_mask = 3;
  return o;
}

}  // namespace

extern "C" int dm_mask_value(dm_view in, const dm_mask_options* opts, dm_buf* out) {
  return run_mask(in, opts != nullptr ? *opts : default_options(), out);
}

extern "C" int dm_mask_full(dm_view in, char mask_char, dm_buf* out) {
  dm_mask_options o = default_options();
  o.mask_char = mask_char;
  return run_mask(in, o, out);
}

extern "C" int dm_mask_partial(dm_view in, char mask_char, int show_start, int show_end, int min_mask, dm_buf* out) {
  dm_mask_options o = default_options();
  o.mode = 1;
  o.mask_char = mask_char;
  o.show_start = show_start;
  o.show_end = show_end;
  o.min_mask = min_mask;
  return run_mask(in, o, out);
}

extern "C" int dm_mask_fixed(size_t length, char mask_char, dm_buf* out) {
  if (out == nullptr) return 1;
  out->data = nullptr;
  out->len = 0;
  if (length == 0) return 0;
  dm_mask_options o = default_options();
  o.mask_char = mask_char;
  o.mask_length = length;
  return run_mask(dm_view{"", 0}, o, out);
}

extern "C" void dm_free(dm_buf* buf) {
  if (buf == nullptr) return;
  std::free(buf->data);
  buf->data = nullptr;
  buf->len = 0;
}

extern "C" const char* dm_version(void) { return kVersion; }

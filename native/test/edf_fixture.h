#ifndef DOTMASK_TEST_EDF_FIXTURE_H
#define DOTMASK_TEST_EDF_FIXTURE_H

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "dotmask/mask_engine.h"
#include "dotmask/types.h"

namespace dotmask {
namespace test {

// Minimal dotenv reader for tests. Handles KEY=value, export, single and double quotes,
// double-quoted values spanning lines, inline comments and "# KEY=value" commented
// entries. Unterminated quotes and lines without '=' throw ParseError.
class EdfFixtureParser : public DocumentParser {
 public:
  ParsedDocument Parse(std::string_view content) const override {
    ++calls_;
    ParsedDocument doc;
    doc.line_offsets = LineOffsetTable::Build(content);
    size_t pos = 0;
    size_t line = 1;
    while (pos < content.size()) {
      size_t end = parse_record(content, pos, line, &doc.entries);
      line += static_cast<size_t>(std::count(content.begin() + pos, content.begin() + end, '\n')) + 1;
      pos = end + 1;
    }
    return doc;
  }

  int calls() const { return calls_; }

 private:
  static bool is_blank(char c) { return c == ' ' || c == '\t'; }
  static bool is_key_start(char c) { return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_'; }
  static bool is_key_char(char c) { return is_key_start(c) || (c >= '0' && c <= '9') || c == '.'; }

  static size_t line_end(std::string_view s, size_t from) {
    size_t e = s.find('\n', from);
    return e == std::string_view::npos ? s.size() : e;
  }

  // Returns the offset of the '\n' ending the record, or the content size.
  static size_t parse_record(std::string_view s, size_t pos, size_t line, std::vector<Entry>* out) {
    const size_t eol = line_end(s, pos);
    size_t i = pos;
    while (i < eol && is_blank(s[i])) ++i;
    if (i == eol || s[i] == '\r') return eol;

    bool comment = false;
    if (s[i] == '#') {
      comment = true;
      ++i;
      while (i < eol && is_blank(s[i])) ++i;
    }

    Entry e;
    e.line_number = line;
    e.is_comment = comment;
    if (s.compare(i, 7, "export ") == 0) {
      e.exported = true;
      i += 7;
      while (i < eol && is_blank(s[i])) ++i;
    }

    size_t key_start = i;
    if (i < eol && is_key_start(s[i])) {
      while (i < eol && is_key_char(s[i])) ++i;
    }
    size_t key_end = i;
    while (i < eol && is_blank(s[i])) ++i;
    if (key_end == key_start || i >= eol || s[i] != '=') {
      if (comment) return eol;
      throw ParseError("line " + std::to_string(line) + ": expected KEY=value");
    }
    e.key = std::string(s.substr(key_start, key_end - key_start));
    e.key_span = Span{key_start, key_end};
    ++i;
    while (i < eol && is_blank(s[i])) ++i;

    if (i < eol && (s[i] == '"' || s[i] == '\'')) {
      const char q = s[i];
      size_t close = i + 1;
      const size_t limit = (q == '"' && !comment) ? s.size() : eol;
      while (close < limit && s[close] != q) {
        if (q == '"' && s[close] == '\\' && close + 1 < limit) ++close;
        ++close;
      }
      if (close >= limit) {
        if (comment) return eol;
        throw ParseError("line " + std::to_string(line) + ": unterminated quote");
      }
      e.quote = q == '"' ? QuoteKind::kDouble : QuoteKind::kSingle;
      e.value = std::string(s.substr(i + 1, close - i - 1));
      e.value_span = Span{i, close + 1};
      e.value_end_line = line + static_cast<size_t>(std::count(s.begin() + i, s.begin() + close, '\n'));
      out->push_back(std::move(e));
      return line_end(s, close);
    }

    size_t vend = eol;
    for (size_t k = i; k < eol; ++k) {
      if (s[k] == '#' && k > i && is_blank(s[k - 1])) {
        vend = k;
        break;
      }
    }
    while (vend > i && (is_blank(s[vend - 1]) || s[vend - 1] == '\r')) --vend;
    e.value = std::string(s.substr(i, vend - i));
    e.value_span = Span{i, vend};
    e.value_end_line = line;
    out->push_back(std::move(e));
    return eol;
  }

  mutable int calls_{0};
};

}  // namespace test
}  // namespace dotmask

#endif

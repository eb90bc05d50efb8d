#ifndef DOTMASK_TYPES_H
#define DOTMASK_TYPES_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dotmask {

enum class QuoteKind : uint8_t { kNone = 0, kSingle = 1, kDouble = 2 };

struct Span {
  size_t start;
  size_t end;
};

// One parsed key/value record. Spans are byte offsets into the raw content; the value
// span covers the surrounding quotes when the value is quoted. Lines are 1-based.
struct Entry {
  std::string key;
  std::string value;
  Span key_span{0, 0};
  Span value_span{0, 0};
  size_t line_number{0};
  size_t value_end_line{0};
  QuoteKind quote{QuoteKind::kNone};
  bool exported{false};
  bool is_comment{false};
};

// Byte offset of the first byte of every line. Index 0 holds line 1.
class LineOffsetTable {
 public:
  LineOffsetTable() = default;
  explicit LineOffsetTable(std::vector<size_t> starts) : starts_(std::move(starts)) {}

  static LineOffsetTable Build(std::string_view content);

  // Returns 0 for lines outside the table.
  size_t LineStart(size_t line) const;
  size_t LineForOffset(size_t offset) const;
  // Length of |line| in |content| without its line terminator.
  size_t LineLength(size_t line, std::string_view content) const;

  size_t line_count() const { return starts_.size(); }
  const std::vector<size_t>& starts() const { return starts_; }

 private:
  std::vector<size_t> starts_;
};

struct ParsedDocument {
  std::vector<Entry> entries;
  LineOffsetTable line_offsets;
};

// What a strategy sees besides the value itself.
struct MaskContext {
  std::string key;
  std::string source;
  size_t line_number{0};
  QuoteKind quote{QuoteKind::kNone};
  bool is_comment{false};
};

struct MaskedLineDescriptor {
  size_t line_number{0};
  size_t value_end_line{0};
  std::string mask;
  std::string key;
  std::string value;
  Span value_span{0, 0};
  QuoteKind quote{QuoteKind::kNone};
  bool is_comment{false};
};

struct OverlaySpan {
  size_t line;  // 1-based
  size_t start_col;
  size_t end_col;
  std::string text;
};

class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ParseError : public Error {
 public:
  using Error::Error;
};

}  // namespace dotmask

#endif

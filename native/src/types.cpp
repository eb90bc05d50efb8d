#include "dotmask/types.h"

#include <algorithm>

namespace dotmask {

LineOffsetTable LineOffsetTable::Build(std::string_view content) {
  std::vector<size_t> starts;
  starts.reserve(content.size() / 30 + 1);
  starts.push_back(0);
  for (size_t i = 0; i < content.size(); ++i) {
    if (content[i] == '\n') starts.push_back(i + 1);
  }
  return LineOffsetTable(std::move(starts));
}

size_t LineOffsetTable::LineStart(size_t line) const {
  if (line == 0 || line > starts_.size()) return 0;
  return starts_[line - 1];
}

size_t LineOffsetTable::LineForOffset(size_t offset) const {
  if (starts_.empty()) return 0;
  auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
  return static_cast<size_t>(it - starts_.begin());
}

size_t LineOffsetTable::LineLength(size_t line, std::string_view content) const {
  if (line == 0 || line > starts_.size()) return 0;
  size_t b = starts_[line - 1];
  if (b >= content.size()) return 0;
  size_t e = line < starts_.size() ? starts_[line] : content.size();
  if (e > content.size()) e = content.size();
  if (e > b && content[e - 1] == '\n') --e;
  if (e > b && content[e - 1] == '\r') --e;
  return e - b;
}

}  // namespace dotmask

#ifndef DOTMASK_OVERLAY_MAPPER_H
#define DOTMASK_OVERLAY_MAPPER_H

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "dotmask/types.h"

namespace dotmask {

// 1-based lines the user has temporarily unmasked.
class RevealedLines {
 public:
  void Reveal(size_t line) { lines_.insert(line); }
  bool Hide(size_t line) { return lines_.erase(line) > 0; }
  bool IsRevealed(size_t line) const { return lines_.count(line) > 0; }
  bool AnyInRange(size_t first, size_t last) const;
  void Reset() { lines_.clear(); }
  std::vector<size_t> List() const { return std::vector<size_t>(lines_.begin(), lines_.end()); }
  bool empty() const { return lines_.empty(); }

 private:
  std::set<size_t> lines_;
};

// Converts value byte spans into per-line overlay spans for one document.
//
// Quoted values keep their quote characters visible. Multi-line values get one span per
// physical line, each carrying the matching slice of the masked text; slices shorter than
// the covered range are padded with |pad|. Entries touching a revealed line produce
// nothing. |content| and |offsets| must outlive the mapper.
class OverlaySpanMapper {
 public:
  OverlaySpanMapper(std::string_view content, const LineOffsetTable& offsets, char pad = '*');

  std::vector<OverlaySpan> Map(const MaskedLineDescriptor& mask, const RevealedLines& revealed) const;
  std::vector<OverlaySpan> Map(const Entry& entry, std::string_view masked, const RevealedLines& revealed) const;
  std::vector<OverlaySpan> MapAll(const std::vector<MaskedLineDescriptor>& masks, const RevealedLines& revealed) const;

 private:
  void map_span(size_t first_line, size_t last_line, Span value, QuoteKind quote, std::string_view masked,
                const RevealedLines& revealed, std::vector<OverlaySpan>* out) const;

  std::string_view content_;
  const LineOffsetTable* offsets_;
  char pad_;
};

}  // namespace dotmask

#endif

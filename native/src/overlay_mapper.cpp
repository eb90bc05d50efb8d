#include "dotmask/overlay_mapper.h"

#include <algorithm>
#include <cstdint>

namespace dotmask {

namespace {

std::string slice_padded(std::string_view masked, int64_t from, int64_t len, char pad) {
  std::string out;
  if (len <= 0) return out;
  out.reserve(static_cast<size_t>(len));
  for (int64_t i = 0; i < len; ++i) {
    int64_t at = from + i;
    if (at >= 0 && at < static_cast<int64_t>(masked.size())) {
      out.push_back(masked[static_cast<size_t>(at)]);
    } else {
      out.push_back(pad);
    }
  }
  return out;
}

}  // namespace

bool RevealedLines::AnyInRange(size_t first, size_t last) const {
  auto it = lines_.lower_bound(first);
  return it != lines_.end() && *it <= last;
}

OverlaySpanMapper::OverlaySpanMapper(std::string_view content, const LineOffsetTable& offsets, char pad)
    : content_(content), offsets_(&offsets), pad_(pad) {}

std::vector<OverlaySpan> OverlaySpanMapper::Map(const MaskedLineDescriptor& mask,
                                                const RevealedLines& revealed) const {
  std::vector<OverlaySpan> out;
  map_span(mask.line_number, mask.value_end_line, mask.value_span, mask.quote, mask.mask, revealed, &out);
  return out;
}

std::vector<OverlaySpan> OverlaySpanMapper::Map(const Entry& entry, std::string_view masked,
                                                const RevealedLines& revealed) const {
  std::vector<OverlaySpan> out;
  map_span(entry.line_number, entry.value_end_line, entry.value_span, entry.quote, masked, revealed, &out);
  return out;
}

std::vector<OverlaySpan> OverlaySpanMapper::MapAll(const std::vector<MaskedLineDescriptor>& masks,
                                                   const RevealedLines& revealed) const {
  std::vector<OverlaySpan> out;
  out.reserve(masks.size());
  for (const MaskedLineDescriptor& m : masks) {
    map_span(m.line_number, m.value_end_line, m.value_span, m.quote, m.mask, revealed, &out);
  }
  return out;
}

void OverlaySpanMapper::map_span(size_t first_line, size_t last_line, Span value, QuoteKind quote,
                                 std::string_view masked, const RevealedLines& revealed,
                                 std::vector<OverlaySpan>* out) const {
  if (last_line < first_line) last_line = first_line;
  if (revealed.AnyInRange(first_line, last_line)) return;
  if (first_line == 0 || first_line > offsets_->line_count()) return;

  const int64_t q = quote != QuoteKind::kNone ? 1 : 0;
  const int64_t first_offset = static_cast<int64_t>(offsets_->LineStart(first_line));
  const int64_t value_col = static_cast<int64_t>(value.start) - first_offset;

  if (last_line == first_line) {
    const int64_t line_len = static_cast<int64_t>(offsets_->LineLength(first_line, content_));
    int64_t start = std::max<int64_t>(0, value_col + q);
    int64_t end = static_cast<int64_t>(value.end) - first_offset - q;
    end = std::min(end, line_len);
    start = std::min(start, line_len);
    end = std::max(start, end);
    if (end == start && masked.empty()) return;
    out->push_back(OverlaySpan{first_line, static_cast<size_t>(start), static_cast<size_t>(end), std::string(masked)});
    return;
  }

  // Absolute offset of the first masked byte; masked[i] covers content[text_origin + i].
  const int64_t text_origin = static_cast<int64_t>(value.start) + q;
  for (size_t line = first_line; line <= last_line; ++line) {
    if (line > offsets_->line_count()) break;
    const int64_t line_offset = static_cast<int64_t>(offsets_->LineStart(line));
    const int64_t line_len = static_cast<int64_t>(offsets_->LineLength(line, content_));
    int64_t start;
    int64_t end;
    if (line == first_line) {
      start = value_col + q;
      end = line_len;
    } else if (line == last_line) {
      start = 0;
      end = std::max<int64_t>(0, static_cast<int64_t>(value.end) - line_offset) - q;
    } else {
      start = 0;
      end = line_len;
    }
    start = std::max<int64_t>(0, start);
    end = std::max(start, std::min(end, line_len));
    if (end == start) continue;

    std::string text = slice_padded(masked, line_offset + start - text_origin, end - start, pad_);
    out->push_back(OverlaySpan{line, static_cast<size_t>(start), static_cast<size_t>(end), std::move(text)});
  }
}

}  // namespace dotmask

#include "dotmask/overlay_applier.h"

#include <utility>

#include "dotmask/log.h"

namespace dotmask {

OverlayApplier::OverlayApplier(OverlayRenderer& renderer, TaskScheduler& scheduler)
    : renderer_(renderer), scheduler_(scheduler) {}

void OverlayApplier::Apply(BufferId buffer, std::vector<OverlaySpan> spans, bool sync) {
  const uint64_t seq = ++sequence_[buffer];
  if (sync) {
    install(buffer, spans);
    return;
  }
  std::weak_ptr<bool> alive = alive_;
  scheduler_.Defer([this, alive, buffer, seq, spans = std::move(spans)] {
    if (alive.expired()) return;
    if (sequence(buffer) != seq) {
      ++dropped_;
      return;
    }
    install(buffer, spans);
  });
}

void OverlayApplier::Clear(BufferId buffer) {
  ++sequence_[buffer];
  if (renderer_.IsValid(buffer)) renderer_.Clear(buffer);
}

uint64_t OverlayApplier::sequence(BufferId buffer) const {
  auto it = sequence_.find(buffer);
  return it == sequence_.end() ? 0 : it->second;
}

void OverlayApplier::install(BufferId buffer, const std::vector<OverlaySpan>& spans) {
  if (!renderer_.IsValid(buffer)) {
    LogDebug("skipping overlays for invalid buffer " + std::to_string(buffer));
    return;
  }
  renderer_.Clear(buffer);
  renderer_.Install(buffer, spans);
}

}  // namespace dotmask

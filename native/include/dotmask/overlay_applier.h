#ifndef DOTMASK_OVERLAY_APPLIER_H
#define DOTMASK_OVERLAY_APPLIER_H

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

#include "dotmask/scheduler.h"
#include "dotmask/types.h"

namespace dotmask {

using BufferId = int;

// Host display surface. Install() adds overlays on top of whatever is present.
class OverlayRenderer {
 public:
  virtual ~OverlayRenderer() = default;

  virtual bool IsValid(BufferId buffer) const { return buffer >= 0; }
  virtual void Clear(BufferId buffer) = 0;
  virtual void Install(BufferId buffer, const std::vector<OverlaySpan>& spans) = 0;
};

// Clear-then-install, now or on the next scheduler tick. Each Apply() or Clear() bumps the
// buffer's sequence number, and a deferred install whose number is stale is dropped.
// Deferred installs still queued when the applier is destroyed become no-ops.
class OverlayApplier {
 public:
  OverlayApplier(OverlayRenderer& renderer, TaskScheduler& scheduler);

  void Apply(BufferId buffer, std::vector<OverlaySpan> spans, bool sync);
  void Clear(BufferId buffer);

  uint64_t sequence(BufferId buffer) const;
  uint64_t dropped() const { return dropped_; }

 private:
  void install(BufferId buffer, const std::vector<OverlaySpan>& spans);

  OverlayRenderer& renderer_;
  TaskScheduler& scheduler_;
  std::unordered_map<BufferId, uint64_t> sequence_;
  uint64_t dropped_{0};
  std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

}  // namespace dotmask

#endif

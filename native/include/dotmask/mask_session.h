#ifndef DOTMASK_MASK_SESSION_H
#define DOTMASK_MASK_SESSION_H

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "dotmask/mask_engine.h"
#include "dotmask/overlay_applier.h"
#include "dotmask/overlay_mapper.h"
#include "dotmask/pattern_resolver.h"
#include "dotmask/scheduler.h"

namespace dotmask {

// Keeps the buffers of one host masked: computes overlays through the engine, installs
// them through the renderer, debounces edits and drives timed peeks.
class MaskSession {
 public:
  MaskSession(MaskEngine& engine, OverlayRenderer& renderer, TaskScheduler& scheduler);
  ~MaskSession();
  MaskSession(const MaskSession&) = delete;
  MaskSession& operator=(const MaskSession&) = delete;

  // Masks |buffer| now (sync) or on the next tick. A path that is not an env file leaves
  // the buffer alone and returns false. Parse errors propagate.
  bool Shelter(BufferId buffer, std::string content, std::optional<std::string> path, bool sync);
  // Stores the new content and re-masks after the debounce delay.
  void OnTextChanged(BufferId buffer, std::string content, Clock::time_point now);
  void Unshelter(BufferId buffer);

  // Reveals |line| for the configured peek duration. Only one line is peeked at a time.
  bool Peek(BufferId buffer, size_t line, Clock::time_point now);
  void HideLine(BufferId buffer, size_t line);
  bool TogglePeek(BufferId buffer, size_t line, Clock::time_point now);

  // Reconfigures the engine and re-masks every sheltered buffer. A rejected config throws
  // and leaves the session as it was. A buffer that fails to parse is logged and skipped.
  void Reconfigure(Config config);

  bool IsSheltered(BufferId buffer) const { return buffers_.count(buffer) > 0; }
  const RevealedLines& revealed() const { return revealed_; }

  static std::string DebounceKey(BufferId buffer);
  static constexpr const char* kPeekKey = "peek";

 private:
  struct BufferState {
    std::string content;
    std::optional<std::string> path;
  };
  struct PeekState {
    BufferId buffer;
    size_t line;
  };

  size_t refresh(BufferId buffer, bool sync);

  MaskEngine& engine_;
  TaskScheduler& scheduler_;
  OverlayApplier applier_;
  EnvFileMatcher env_files_;
  RevealedLines revealed_;
  std::map<BufferId, BufferState> buffers_;
  std::optional<PeekState> peek_;
};

}  // namespace dotmask

#endif

#include "dotmask/mask_session.h"

#include <utility>

#include "dotmask/log.h"

namespace dotmask {

MaskSession::MaskSession(MaskEngine& engine, OverlayRenderer& renderer, TaskScheduler& scheduler)
    : engine_(engine),
      scheduler_(scheduler),
      applier_(renderer, scheduler),
      env_files_(engine.config().env_file_patterns) {}

MaskSession::~MaskSession() {
  for (const auto& kv : buffers_) scheduler_.Cancel(DebounceKey(kv.first));
  if (peek_) scheduler_.Cancel(kPeekKey);
}

std::string MaskSession::DebounceKey(BufferId buffer) { return "text:" + std::to_string(buffer); }

bool MaskSession::Shelter(BufferId buffer, std::string content, std::optional<std::string> path, bool sync) {
  if (path && !env_files_.IsEnvFile(*path)) {
    LogDebug("not an env file: " + *path);
    return false;
  }
  buffers_[buffer] = BufferState{std::move(content), std::move(path)};
  refresh(buffer, sync);
  return true;
}

void MaskSession::OnTextChanged(BufferId buffer, std::string content, Clock::time_point now) {
  auto it = buffers_.find(buffer);
  if (it == buffers_.end()) return;
  it->second.content = std::move(content);
  scheduler_.Schedule(DebounceKey(buffer), std::chrono::milliseconds(engine_.config().debounce_ms), now,
                      [this, buffer] {
                        try {
                          refresh(buffer, true);
                        } catch (const Error& e) {
                          LogWarn("re-masking buffer " + std::to_string(buffer) + " failed: " + e.what());
                        }
                      });
}

void MaskSession::Unshelter(BufferId buffer) {
  scheduler_.Cancel(DebounceKey(buffer));
  if (peek_ && peek_->buffer == buffer) {
    scheduler_.Cancel(kPeekKey);
    revealed_.Hide(peek_->line);
    peek_.reset();
  }
  buffers_.erase(buffer);
  applier_.Clear(buffer);
}

bool MaskSession::Peek(BufferId buffer, size_t line, Clock::time_point now) {
  if (!IsSheltered(buffer)) return false;
  if (peek_) {
    scheduler_.Cancel(kPeekKey);
    revealed_.Hide(peek_->line);
    if (peek_->buffer != buffer && IsSheltered(peek_->buffer)) refresh(peek_->buffer, true);
  }
  revealed_.Reveal(line);
  peek_ = PeekState{buffer, line};
  refresh(buffer, true);
  scheduler_.Schedule(kPeekKey, std::chrono::milliseconds(engine_.config().peek_duration_ms), now,
                      [this, buffer, line] {
                        try {
                          HideLine(buffer, line);
                        } catch (const Error& e) {
                          LogWarn("re-masking buffer " + std::to_string(buffer) + " after peek failed: " + e.what());
                        }
                      });
  return true;
}

void MaskSession::HideLine(BufferId buffer, size_t line) {
  revealed_.Hide(line);
  if (peek_ && peek_->buffer == buffer && peek_->line == line) {
    scheduler_.Cancel(kPeekKey);
    peek_.reset();
  }
  if (IsSheltered(buffer)) refresh(buffer, true);
}

bool MaskSession::TogglePeek(BufferId buffer, size_t line, Clock::time_point now) {
  if (revealed_.IsRevealed(line)) {
    HideLine(buffer, line);
    return false;
  }
  return Peek(buffer, line, now);
}

void MaskSession::Reconfigure(Config config) {
  EnvFileMatcher env_files(config.env_file_patterns);
  engine_.Reconfigure(std::move(config));
  env_files_ = std::move(env_files);
  for (const auto& kv : buffers_) {
    try {
      refresh(kv.first, false);
    } catch (const Error& e) {
      LogWarn("re-masking buffer " + std::to_string(kv.first) + " after reconfigure failed: " + e.what());
    }
  }
}

size_t MaskSession::refresh(BufferId buffer, bool sync) {
  auto it = buffers_.find(buffer);
  if (it == buffers_.end()) return 0;
  const BufferState& state = it->second;

  MaskResult result = engine_.GenerateMasks(state.content, state.path);
  OverlaySpanMapper mapper(state.content, result.line_offsets, engine_.config().mask_char);
  std::vector<OverlaySpan> spans = mapper.MapAll(result.masks, revealed_);
  const size_t n = spans.size();
  applier_.Apply(buffer, std::move(spans), sync);
  return n;
}

}  // namespace dotmask

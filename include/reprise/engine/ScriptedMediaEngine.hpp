// Repository: Reprise
// Component: Scripted Media Engine
// Purpose: Replays a timed list of engine events for the replay harness.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_ENGINE_SCRIPTED_MEDIA_ENGINE_HPP_
#define REPRISE_ENGINE_SCRIPTED_MEDIA_ENGINE_HPP_

#include <cstdint>
#include <istream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "reprise/engine/IMediaEngine.h"
#include "reprise/runtime/SerialExecutor.hpp"

namespace reprise::engine {

struct ScriptStep {
  enum class Type {
    kProgress,   // Position/duration update, no event
    kBuffering,
    kReady,
    kEnded,
    kError,
    kTracks,
  };

  int64_t at_ms = 0;  // Offset from Open()
  Type type = Type::kProgress;
  std::optional<int64_t> position_ms;
  std::optional<int64_t> duration_ms;
  EngineErrorCode error_code = EngineErrorCode::kUnspecified;
  std::string message;
  // kTracks only.
  std::string track_type;
  std::string sample_mime;
};

// One JSON object per line:
//   {"at_ms":0,"type":"progress","position_ms":0,"duration_ms":3600000}
//   {"at_ms":900,"type":"error","code":"network_timeout","message":"read timed out"}
// Blank lines and lines starting with '#' are skipped. Throws
// std::runtime_error naming the line on a malformed entry.
std::vector<ScriptStep> ParseEngineScript(std::istream& in);

// Steps fire on `timeline` relative to Open(). SeekTo moves the reported
// position; later steps that carry a position override it again.
class ScriptedMediaEngine : public IMediaEngine {
 public:
  ScriptedMediaEngine(runtime::ISerialExecutor& timeline, std::vector<ScriptStep> steps);
  ~ScriptedMediaEngine() override;

  ScriptedMediaEngine(const ScriptedMediaEngine&) = delete;
  ScriptedMediaEngine& operator=(const ScriptedMediaEngine&) = delete;

  void SetEventCallback(EventCallback callback) override;
  bool Open(const std::string& content_ref, int64_t start_ms) override;
  void Play() override;
  void Pause() override;
  bool SeekTo(int64_t position_ms) override;
  bool Prepare() override;
  void Release() override;

  [[nodiscard]] session::PlaybackSnapshot Snapshot() const override;
  [[nodiscard]] EngineDiagnostics Diagnostics() const override;

  [[nodiscard]] size_t fired_steps() const;

 private:
  void Fire(size_t index);

  runtime::ISerialExecutor& timeline_;
  const std::vector<ScriptStep> steps_;

  mutable std::mutex mutex_;
  EventCallback callback_;
  std::vector<runtime::TaskId> pending_;
  std::vector<EngineDiagnostics::TrackGroup> groups_;
  std::string content_ref_;
  int64_t position_ms_ = 0;
  int64_t duration_ms_ = 0;
  bool playing_ = false;
  bool released_ = false;
  size_t fired_ = 0;
};

}  // namespace reprise::engine

#endif  // REPRISE_ENGINE_SCRIPTED_MEDIA_ENGINE_HPP_

// Repository: Reprise
// Component: Scripted Media Engine
// Purpose: Replays a timed list of engine events for the replay harness.
// Copyright (c) 2026 Reprise

#include "reprise/engine/ScriptedMediaEngine.hpp"

#include <algorithm>
#include <stdexcept>

#include "reprise/util/JsonText.hpp"
#include "reprise/util/Logger.hpp"

namespace reprise::engine {

namespace {

std::optional<ScriptStep::Type> ParseStepType(const std::string& name) {
  if (name == "progress") return ScriptStep::Type::kProgress;
  if (name == "buffering") return ScriptStep::Type::kBuffering;
  if (name == "ready") return ScriptStep::Type::kReady;
  if (name == "ended") return ScriptStep::Type::kEnded;
  if (name == "error") return ScriptStep::Type::kError;
  if (name == "tracks") return ScriptStep::Type::kTracks;
  return std::nullopt;
}

std::runtime_error ScriptError(size_t line_no, const std::string& what) {
  return std::runtime_error("script line " + std::to_string(line_no) + ": " + what);
}

}  // namespace

std::vector<ScriptStep> ParseEngineScript(std::istream& in) {
  std::vector<ScriptStep> steps;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') continue;

    ScriptStep step;
    std::string type;
    if (!util::ExtractString(line, "type", &type)) throw ScriptError(line_no, "missing \"type\"");
    auto parsed = ParseStepType(type);
    if (!parsed) throw ScriptError(line_no, "unknown type \"" + type + "\"");
    step.type = *parsed;
    if (!util::ExtractInt64(line, "at_ms", &step.at_ms) || step.at_ms < 0) {
      throw ScriptError(line_no, "missing or negative \"at_ms\"");
    }
    int64_t value = 0;
    if (util::ExtractInt64(line, "position_ms", &value)) step.position_ms = value;
    if (util::ExtractInt64(line, "duration_ms", &value)) step.duration_ms = value;
    util::ExtractString(line, "message", &step.message);
    if (step.type == ScriptStep::Type::kError) {
      std::string code = "unspecified";
      util::ExtractString(line, "code", &code);
      auto error_code = ParseEngineErrorCode(code);
      if (!error_code) throw ScriptError(line_no, "unknown error code \"" + code + "\"");
      step.error_code = *error_code;
    }
    if (step.type == ScriptStep::Type::kTracks) {
      util::ExtractString(line, "track_type", &step.track_type);
      util::ExtractString(line, "sample_mime", &step.sample_mime);
    }
    steps.push_back(std::move(step));
  }
  std::stable_sort(steps.begin(), steps.end(),
                   [](const ScriptStep& a, const ScriptStep& b) { return a.at_ms < b.at_ms; });
  return steps;
}

ScriptedMediaEngine::ScriptedMediaEngine(runtime::ISerialExecutor& timeline,
                                         std::vector<ScriptStep> steps)
    : timeline_(timeline), steps_(std::move(steps)) {}

ScriptedMediaEngine::~ScriptedMediaEngine() {
  Release();
}

void ScriptedMediaEngine::SetEventCallback(EventCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callback_ = std::move(callback);
}

bool ScriptedMediaEngine::Open(const std::string& content_ref, int64_t start_ms) {
  if (content_ref.empty()) return false;
  std::lock_guard<std::mutex> lock(mutex_);
  if (released_ || !pending_.empty()) return false;
  content_ref_ = content_ref;
  position_ms_ = std::max<int64_t>(0, start_ms);
  for (size_t i = 0; i < steps_.size(); ++i) {
    pending_.push_back(timeline_.PostDelayed(steps_[i].at_ms, [this, i] { Fire(i); }));
  }
  util::Logger::Info("[ScriptedEngine] opened " + content_ref + " with " +
                     std::to_string(steps_.size()) + " step(s)");
  return true;
}

void ScriptedMediaEngine::Play() {
  std::lock_guard<std::mutex> lock(mutex_);
  playing_ = true;
}

void ScriptedMediaEngine::Pause() {
  std::lock_guard<std::mutex> lock(mutex_);
  playing_ = false;
}

bool ScriptedMediaEngine::SeekTo(int64_t position_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (released_ || position_ms < 0) return false;
  position_ms_ = duration_ms_ > 0 ? std::min(position_ms, duration_ms_) : position_ms;
  return true;
}

bool ScriptedMediaEngine::Prepare() {
  std::lock_guard<std::mutex> lock(mutex_);
  return !released_;
}

void ScriptedMediaEngine::Release() {
  std::vector<runtime::TaskId> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (released_) return;
    released_ = true;
    playing_ = false;
    callback_ = nullptr;
    pending.swap(pending_);
  }
  for (runtime::TaskId id : pending) timeline_.Cancel(id);
}

session::PlaybackSnapshot ScriptedMediaEngine::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  session::PlaybackSnapshot snapshot;
  snapshot.position_ms = position_ms_;
  snapshot.duration_ms = duration_ms_;
  snapshot.is_playing = playing_;
  return snapshot;
}

EngineDiagnostics ScriptedMediaEngine::Diagnostics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  EngineDiagnostics diagnostics;
  diagnostics.engine_name = "scripted";
  diagnostics.renderers = {"video", "audio", "text"};
  diagnostics.track_groups = groups_;
  return diagnostics;
}

size_t ScriptedMediaEngine::fired_steps() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fired_;
}

void ScriptedMediaEngine::Fire(size_t index) {
  const ScriptStep& step = steps_[index];
  EventCallback callback;
  EngineEvent event;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (released_) return;
    ++fired_;
    if (step.duration_ms) duration_ms_ = *step.duration_ms;
    if (step.position_ms) position_ms_ = *step.position_ms;

    switch (step.type) {
      case ScriptStep::Type::kProgress:
        return;
      case ScriptStep::Type::kBuffering:
        event = EngineEvent::StateChanged(PlaybackState::kBuffering);
        break;
      case ScriptStep::Type::kReady:
        event = EngineEvent::StateChanged(PlaybackState::kReady);
        break;
      case ScriptStep::Type::kEnded:
        if (!step.position_ms) position_ms_ = duration_ms_;
        playing_ = false;
        event = EngineEvent::StateChanged(PlaybackState::kEnded);
        break;
      case ScriptStep::Type::kError: {
        EngineError error;
        error.code = step.error_code;
        error.message = step.message.empty() ? EngineErrorCodeName(step.error_code) : step.message;
        event = EngineEvent::Error(std::move(error));
        break;
      }
      case ScriptStep::Type::kTracks: {
        EngineDiagnostics::TrackGroup group;
        group.type = step.track_type.empty() ? "video" : step.track_type;
        EngineDiagnostics::TrackFormat format;
        format.sample_mime = step.sample_mime;
        group.formats.push_back(format);
        groups_.push_back(std::move(group));
        event = EngineEvent::TracksChanged();
        break;
      }
    }
    session::PlaybackSnapshot snapshot;
    snapshot.position_ms = position_ms_;
    snapshot.duration_ms = duration_ms_;
    snapshot.is_playing = playing_;
    event.snapshot = snapshot;
    callback = callback_;
  }
  if (callback) callback(event);
}

}  // namespace reprise::engine

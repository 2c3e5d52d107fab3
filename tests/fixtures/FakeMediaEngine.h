// Repository: Reprise
// Component: Test Fixtures
// Purpose: Scriptable media engine that records controller calls.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_TESTS_FIXTURES_FAKE_MEDIA_ENGINE_H_
#define REPRISE_TESTS_FIXTURES_FAKE_MEDIA_ENGINE_H_

#include <cstdint>
#include <string>
#include <vector>

#include "reprise/engine/IMediaEngine.h"

namespace reprise::tests::fixtures {

// Calls are recorded into a shared log so tests can inspect them after the
// controller has released and destroyed the engine.
struct FakeEngineLog {
  std::vector<std::string> calls;
  std::vector<int64_t> seeks;
  int64_t opened_at_ms = -1;
  int release_count = 0;
};

class FakeMediaEngine : public engine::IMediaEngine {
 public:
  explicit FakeMediaEngine(FakeEngineLog* log) : log_(log) {}

  void SetEventCallback(EventCallback callback) override { callback_ = std::move(callback); }

  bool Open(const std::string& content_ref, int64_t start_ms) override {
    log_->calls.push_back("open");
    log_->opened_at_ms = start_ms;
    snapshot_.position_ms = start_ms;
    return open_ok && !content_ref.empty();
  }
  void Play() override {
    log_->calls.push_back("play");
    snapshot_.is_playing = true;
  }
  void Pause() override {
    log_->calls.push_back("pause");
    snapshot_.is_playing = false;
  }
  bool SeekTo(int64_t position_ms) override {
    log_->calls.push_back("seek");
    log_->seeks.push_back(position_ms);
    if (!seek_ok) return false;
    snapshot_.position_ms = position_ms;
    return true;
  }
  bool Prepare() override {
    log_->calls.push_back("prepare");
    return prepare_ok;
  }
  void Release() override {
    log_->calls.push_back("release");
    ++log_->release_count;
  }

  session::PlaybackSnapshot Snapshot() const override { return snapshot_; }

  engine::EngineDiagnostics Diagnostics() const override {
    engine::EngineDiagnostics d;
    d.engine_name = "fake";
    d.renderers = {"video", "audio"};
    return d;
  }

  // Test controls.
  void SetPosition(int64_t position_ms, int64_t duration_ms) {
    snapshot_.position_ms = position_ms;
    snapshot_.duration_ms = duration_ms;
  }
  void Emit(const engine::EngineEvent& event) {
    if (callback_) callback_(event);
  }
  void EmitError(engine::EngineErrorCode code, const std::string& message = "failure") {
    engine::EngineError error;
    error.code = code;
    error.message = message;
    Emit(engine::EngineEvent::Error(error));
  }
  void EmitEnded() { Emit(engine::EngineEvent::StateChanged(engine::PlaybackState::kEnded)); }

  bool open_ok = true;
  bool seek_ok = true;
  bool prepare_ok = true;

 private:
  FakeEngineLog* log_;
  EventCallback callback_;
  session::PlaybackSnapshot snapshot_;
};

}  // namespace reprise::tests::fixtures

#endif  // REPRISE_TESTS_FIXTURES_FAKE_MEDIA_ENGINE_H_

// Repository: Reprise
// Component: Media Engine Interface
// Purpose: Abstract player consumed by the session recovery controller.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_ENGINE_IMEDIA_ENGINE_H_
#define REPRISE_ENGINE_IMEDIA_ENGINE_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "reprise/session/Session.hpp"

namespace reprise::engine {

// Engine-reported failure cause. Codes are grouped by origin so the
// classifier can tell parse, network and decoder failures apart.
enum class EngineErrorCode {
  kUnspecified,
  // I/O and network
  kIoUnspecified,
  kNetworkConnectionFailed,
  kNetworkTimeout,
  kConnectionReset,
  kDnsFailure,
  kBadHttpStatus,
  // Container and subtitle parsing
  kContainerMalformed,
  kContainerUnsupported,
  kSubtitleMalformed,
  // Decode and render
  kDecoderInitFailed,
  kDecodingFailed,
  kRendererFailed,
};

const char* EngineErrorCodeName(EngineErrorCode code);
// Inverse of EngineErrorCodeName.
std::optional<EngineErrorCode> ParseEngineErrorCode(const std::string& name);

struct EngineError {
  EngineErrorCode code = EngineErrorCode::kUnspecified;
  std::string message;
  // Text of the underlying cause, when the engine has one.
  std::string cause;
};

enum class PlaybackState {
  kIdle,
  kBuffering,
  kReady,
  kEnded,  // Content fully rendered.
};

const char* PlaybackStateName(PlaybackState state);

struct EngineEvent {
  enum class Type {
    kStateChanged,
    kError,
    kTracksChanged,
  };

  Type type = Type::kStateChanged;
  PlaybackState state = PlaybackState::kIdle;
  EngineError error;
  // Snapshot captured by the engine when the event was raised. When absent
  // the controller reads the engine on delivery.
  std::optional<session::PlaybackSnapshot> snapshot;

  static EngineEvent StateChanged(PlaybackState state);
  static EngineEvent Error(EngineError error);
  static EngineEvent TracksChanged();
};

// Explicit diagnostics surface; callers never introspect engine internals.
struct EngineDiagnostics {
  struct TrackFormat {
    std::string container_mime;
    std::string sample_mime;
    std::string codecs;
    std::string language;
    int channels = 0;
    int sample_rate = 0;
  };
  struct TrackGroup {
    std::string type;  // "video", "audio", "text"
    std::vector<TrackFormat> formats;
  };

  std::string engine_name;
  std::vector<std::string> renderers;
  std::vector<TrackGroup> track_groups;
};

// Multi-line report for debug logs.
std::string FormatDiagnostics(const EngineDiagnostics& diagnostics);

class IMediaEngine {
 public:
  using EventCallback = std::function<void(const EngineEvent&)>;

  virtual ~IMediaEngine() = default;

  // Callback may be invoked from any thread; the controller marshals it.
  virtual void SetEventCallback(EventCallback callback) = 0;

  // Prepares content_ref positioned at start_ms. Returns false on failure.
  virtual bool Open(const std::string& content_ref, int64_t start_ms) = 0;
  virtual void Play() = 0;
  virtual void Pause() = 0;
  // Returns false if the engine cannot seek in its current state.
  virtual bool SeekTo(int64_t position_ms) = 0;
  // Re-prepares after an error so playback can continue from the last seek.
  virtual bool Prepare() = 0;
  virtual void Release() = 0;

  [[nodiscard]] virtual session::PlaybackSnapshot Snapshot() const = 0;
  [[nodiscard]] virtual EngineDiagnostics Diagnostics() const = 0;
};

// Yields a fresh engine, or nullptr when none can be acquired.
using EngineFactory = std::function<std::unique_ptr<IMediaEngine>()>;

}  // namespace reprise::engine

#endif  // REPRISE_ENGINE_IMEDIA_ENGINE_H_

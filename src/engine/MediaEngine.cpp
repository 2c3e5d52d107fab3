// Repository: Reprise
// Component: Media Engine Interface
// Purpose: Event constructors, names and diagnostics formatting.
// Copyright (c) 2026 Reprise

#include "reprise/engine/IMediaEngine.h"

#include <sstream>

namespace reprise::engine {

const char* EngineErrorCodeName(EngineErrorCode code) {
  switch (code) {
    case EngineErrorCode::kUnspecified: return "unspecified";
    case EngineErrorCode::kIoUnspecified: return "io_unspecified";
    case EngineErrorCode::kNetworkConnectionFailed: return "network_connection_failed";
    case EngineErrorCode::kNetworkTimeout: return "network_timeout";
    case EngineErrorCode::kConnectionReset: return "connection_reset";
    case EngineErrorCode::kDnsFailure: return "dns_failure";
    case EngineErrorCode::kBadHttpStatus: return "bad_http_status";
    case EngineErrorCode::kContainerMalformed: return "container_malformed";
    case EngineErrorCode::kContainerUnsupported: return "container_unsupported";
    case EngineErrorCode::kSubtitleMalformed: return "subtitle_malformed";
    case EngineErrorCode::kDecoderInitFailed: return "decoder_init_failed";
    case EngineErrorCode::kDecodingFailed: return "decoding_failed";
    case EngineErrorCode::kRendererFailed: return "renderer_failed";
  }
  return "unknown";
}

std::optional<EngineErrorCode> ParseEngineErrorCode(const std::string& name) {
  static const EngineErrorCode kAll[] = {
      EngineErrorCode::kUnspecified,        EngineErrorCode::kIoUnspecified,
      EngineErrorCode::kNetworkConnectionFailed, EngineErrorCode::kNetworkTimeout,
      EngineErrorCode::kConnectionReset,    EngineErrorCode::kDnsFailure,
      EngineErrorCode::kBadHttpStatus,      EngineErrorCode::kContainerMalformed,
      EngineErrorCode::kContainerUnsupported, EngineErrorCode::kSubtitleMalformed,
      EngineErrorCode::kDecoderInitFailed,  EngineErrorCode::kDecodingFailed,
      EngineErrorCode::kRendererFailed,
  };
  for (EngineErrorCode code : kAll) {
    if (name == EngineErrorCodeName(code)) return code;
  }
  return std::nullopt;
}

const char* PlaybackStateName(PlaybackState state) {
  switch (state) {
    case PlaybackState::kIdle: return "idle";
    case PlaybackState::kBuffering: return "buffering";
    case PlaybackState::kReady: return "ready";
    case PlaybackState::kEnded: return "ended";
  }
  return "unknown";
}

EngineEvent EngineEvent::StateChanged(PlaybackState state) {
  EngineEvent ev;
  ev.type = Type::kStateChanged;
  ev.state = state;
  return ev;
}

EngineEvent EngineEvent::Error(EngineError error) {
  EngineEvent ev;
  ev.type = Type::kError;
  ev.error = std::move(error);
  return ev;
}

EngineEvent EngineEvent::TracksChanged() {
  EngineEvent ev;
  ev.type = Type::kTracksChanged;
  return ev;
}

std::string FormatDiagnostics(const EngineDiagnostics& diagnostics) {
  std::ostringstream o;
  o << "engine=" << (diagnostics.engine_name.empty() ? "<unnamed>" : diagnostics.engine_name)
    << " renderers=" << diagnostics.renderers.size() << "\n";
  for (size_t i = 0; i < diagnostics.renderers.size(); ++i) {
    o << "  Renderer[" << i << "]: " << diagnostics.renderers[i] << "\n";
  }
  o << "groups=" << diagnostics.track_groups.size() << "\n";
  for (size_t g = 0; g < diagnostics.track_groups.size(); ++g) {
    const auto& group = diagnostics.track_groups[g];
    o << "  Group[" << g << "]: type=" << group.type
      << " length=" << group.formats.size() << "\n";
    for (size_t f = 0; f < group.formats.size(); ++f) {
      const auto& fmt = group.formats[f];
      o << "    Format[" << f << "]: containerMime=" << fmt.container_mime
        << " sampleMime=" << fmt.sample_mime
        << " codecs=" << fmt.codecs
        << " sampleRate=" << fmt.sample_rate
        << " channels=" << fmt.channels
        << " language=" << fmt.language << "\n";
    }
  }
  return o.str();
}

}  // namespace reprise::engine

// Repository: Reprise
// Component: Advance Notifier
// Purpose: Session-lifecycle messages to the external orchestrator.
// Copyright (c) 2026 Reprise

#ifndef REPRISE_NOTIFY_ADVANCE_NOTIFIER_HPP_
#define REPRISE_NOTIFY_ADVANCE_NOTIFIER_HPP_

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "reprise/notify/HttpTransport.hpp"
#include "reprise/session/Session.hpp"

namespace reprise::notify {

// All Send* calls enqueue and return immediately; delivery happens off the
// caller's thread. A false return means the message was not accepted
// (no callback channel, or the notifier is shut down). Delivery failures
// are logged and never reported back into session state.
class IAdvanceNotifier {
 public:
  virtual ~IAdvanceNotifier() = default;

  [[nodiscard]] virtual bool HasCallback() const = 0;

  virtual bool SendHeartbeat(const session::PlaybackSnapshot& snapshot) = 0;
  virtual bool SendStopped(const session::PlaybackSnapshot& snapshot) = 0;
  virtual bool SendNextEpisode(int season, int episode, const std::string& show_id,
                               const std::string& content_ref) = 0;
};

// Callback URL from an explicit value, else the decoded "callback" query
// parameter of content_ref. Empty when neither is present.
std::string ResolveCallbackUrl(const std::string& explicit_url,
                               const std::string& content_ref);

// JsonRpcNotifier posts JSON-RPC envelopes to an http:// callback from one
// sender thread, in order. When the queue is full the oldest heartbeat is
// dropped; stop and advance messages are never dropped. Destruction drains
// stop and advance messages still queued, each bounded by the timeout.
class JsonRpcNotifier : public IAdvanceNotifier {
 public:
  struct Stats {
    uint64_t delivered = 0;
    uint64_t failed = 0;
    uint64_t dropped = 0;
  };

  JsonRpcNotifier(std::string callback_url,
                  std::shared_ptr<IHttpTransport> transport,
                  int timeout_ms,
                  size_t max_pending);
  ~JsonRpcNotifier() override;

  JsonRpcNotifier(const JsonRpcNotifier&) = delete;
  JsonRpcNotifier& operator=(const JsonRpcNotifier&) = delete;

  [[nodiscard]] bool HasCallback() const override { return configured_; }

  bool SendHeartbeat(const session::PlaybackSnapshot& snapshot) override;
  bool SendStopped(const session::PlaybackSnapshot& snapshot) override;
  bool SendNextEpisode(int season, int episode, const std::string& show_id,
                       const std::string& content_ref) override;

  // Blocks until the queue is empty and no request is in flight.
  void WaitIdle();

  [[nodiscard]] Stats GetStats() const;

 private:
  struct Message {
    std::string label;
    std::string body;
    bool droppable = false;
  };

  bool Enqueue(Message message);
  void SenderLoop();

  const std::string callback_url_;
  const std::shared_ptr<IHttpTransport> transport_;
  const int timeout_ms_;
  const size_t max_pending_;
  bool configured_ = false;

  mutable std::mutex mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  std::deque<Message> queue_;
  bool in_flight_ = false;
  bool shutdown_ = false;
  Stats stats_;
  std::thread sender_thread_;
};

}  // namespace reprise::notify

#endif  // REPRISE_NOTIFY_ADVANCE_NOTIFIER_HPP_

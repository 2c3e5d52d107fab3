// Repository: Reprise
// Component: Advance Notifier
// Purpose: Session-lifecycle messages to the external orchestrator.
// Copyright (c) 2026 Reprise

#include "reprise/notify/AdvanceNotifier.hpp"

#include "reprise/notify/RpcMessages.hpp"
#include "reprise/util/Logger.hpp"
#include "reprise/util/UrlText.hpp"

namespace reprise::notify {

std::string ResolveCallbackUrl(const std::string& explicit_url,
                               const std::string& content_ref) {
  if (!explicit_url.empty()) return explicit_url;
  auto from_query = util::QueryParam(content_ref, "callback");
  return from_query ? *from_query : std::string();
}

JsonRpcNotifier::JsonRpcNotifier(std::string callback_url,
                                 std::shared_ptr<IHttpTransport> transport,
                                 int timeout_ms,
                                 size_t max_pending)
    : callback_url_(std::move(callback_url)),
      transport_(std::move(transport)),
      timeout_ms_(timeout_ms),
      max_pending_(max_pending == 0 ? 1 : max_pending) {
  if (callback_url_.empty()) {
    util::Logger::Info("[AdvanceNotifier] no callback channel configured");
    return;
  }
  if (!transport_ || !IsSupportedHttpUrl(callback_url_)) {
    util::Logger::Warn("[AdvanceNotifier] unsupported callback url, notifier disabled: " +
                       callback_url_);
    return;
  }
  configured_ = true;
  util::Logger::Info("[AdvanceNotifier] callback=" + callback_url_);
  sender_thread_ = std::thread(&JsonRpcNotifier::SenderLoop, this);
}

JsonRpcNotifier::~JsonRpcNotifier() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  queue_cv_.notify_all();
  if (sender_thread_.joinable()) sender_thread_.join();
}

bool JsonRpcNotifier::SendHeartbeat(const session::PlaybackSnapshot& snapshot) {
  return Enqueue(Message{kEventTime,
                         BuildPlayerEvent(kEventTime, snapshot.position_ms,
                                          snapshot.duration_ms, !snapshot.is_playing),
                         true});
}

bool JsonRpcNotifier::SendStopped(const session::PlaybackSnapshot& snapshot) {
  return Enqueue(Message{kEventStopped,
                         BuildPlayerEvent(kEventStopped, snapshot.position_ms,
                                          snapshot.duration_ms, !snapshot.is_playing),
                         false});
}

bool JsonRpcNotifier::SendNextEpisode(int season, int episode, const std::string& show_id,
                                      const std::string& content_ref) {
  return Enqueue(Message{"nextEpisode",
                         BuildNextEpisode(season, episode, show_id, content_ref),
                         false});
}

bool JsonRpcNotifier::Enqueue(Message message) {
  if (!configured_) return false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) return false;
    if (queue_.size() >= max_pending_) {
      bool dropped = false;
      for (auto it = queue_.begin(); it != queue_.end(); ++it) {
        if (it->droppable) {
          queue_.erase(it);
          dropped = true;
          break;
        }
      }
      if (dropped) {
        ++stats_.dropped;
      } else if (message.droppable) {
        ++stats_.dropped;
        return false;
      }
    }
    queue_.push_back(std::move(message));
  }
  queue_cv_.notify_one();
  return true;
}

void JsonRpcNotifier::WaitIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return (queue_.empty() && !in_flight_) || !sender_thread_.joinable(); });
}

JsonRpcNotifier::Stats JsonRpcNotifier::GetStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void JsonRpcNotifier::SenderLoop() {
  while (true) {
    Message message;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      queue_cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
      if (shutdown_) {
        // Drain only what matters for the orchestrator.
        while (!queue_.empty() && queue_.front().droppable) queue_.pop_front();
      }
      if (queue_.empty()) {
        idle_cv_.notify_all();
        if (shutdown_) break;
        continue;
      }
      message = std::move(queue_.front());
      queue_.pop_front();
      in_flight_ = true;
    }

    const HttpResponse response = transport_->PostJson(callback_url_, message.body, timeout_ms_);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      in_flight_ = false;
      if (response.ok) {
        ++stats_.delivered;
      } else {
        ++stats_.failed;
      }
    }
    if (response.ok) {
      util::Logger::Debug("[AdvanceNotifier] delivered " + message.label +
                          " status=" + std::to_string(response.status));
    } else if (response.status != 0) {
      util::Logger::Warn("[AdvanceNotifier] " + message.label + " rejected status=" +
                         std::to_string(response.status));
    } else {
      util::Logger::Warn("[AdvanceNotifier] " + message.label + " failed: " + response.error);
    }
    idle_cv_.notify_all();
  }
}

}  // namespace reprise::notify

#include "session/session_channel.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace incsh {

llvm::StringRef eventKindName(EventKind kind) noexcept {
  switch (kind) {
  case EventKind::TreeUpdated:
    return "tree_updated";
  case EventKind::AppendRejected:
    return "append_rejected";
  case EventKind::AppendFailed:
    return "append_failed";
  case EventKind::StatementReady:
    return "statement_ready";
  }
  return "unknown";
}

// ============== Subscription ==============

void Subscription::push(const SessionEvent& event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(event);
  }
  cv_.notify_one();
}

std::optional<SessionEvent> Subscription::poll() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  SessionEvent event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

std::optional<SessionEvent>
Subscription::waitNext(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
    return std::nullopt;
  }
  SessionEvent event = std::move(queue_.front());
  queue_.pop_front();
  return event;
}

std::vector<SessionEvent> Subscription::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SessionEvent> events(std::make_move_iterator(queue_.begin()),
                                   std::make_move_iterator(queue_.end()));
  queue_.clear();
  return events;
}

std::size_t Subscription::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

// ============== SessionChannel ==============

SessionChannel::SessionChannel(std::string sessionId)
    : sessionId_(std::move(sessionId)) {}

std::shared_ptr<Subscription> SessionChannel::subscribe(Topic topic) {
  auto mailbox = std::make_shared<Subscription>(topic);
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.push_back({nextId_++, topic, nullptr, mailbox});
  return mailbox;
}

SessionChannel::SubscriberId SessionChannel::subscribe(Topic topic,
                                                       Callback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  const SubscriberId id = nextId_++;
  subscribers_.push_back({id, topic, std::move(callback), {}});
  return id;
}

void SessionChannel::unsubscribe(SubscriberId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                    [id](const Subscriber& subscriber) {
                                      return subscriber.id == id;
                                    }),
                     subscribers_.end());
}

void SessionChannel::publish(const SessionEvent& event) {
  const Topic topic = event.topic();
  std::vector<Callback> callbacks;
  std::vector<std::shared_ptr<Subscription>> mailboxes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pruneLocked();
    for (const auto& subscriber : subscribers_) {
      if (subscriber.topic != topic) {
        continue;
      }
      if (subscriber.callback) {
        callbacks.push_back(subscriber.callback);
      } else if (auto mailbox = subscriber.mailbox.lock()) {
        mailboxes.push_back(std::move(mailbox));
      }
    }
  }

  for (const auto& mailbox : mailboxes) {
    mailbox->push(event);
  }
  for (const auto& callback : callbacks) {
    callback(event);
  }
}

std::size_t SessionChannel::subscriberCount() {
  std::lock_guard<std::mutex> lock(mutex_);
  pruneLocked();
  return subscribers_.size();
}

void SessionChannel::pruneLocked() {
  subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                    [](const Subscriber& subscriber) {
                                      return !subscriber.callback &&
                                             subscriber.mailbox.expired();
                                    }),
                     subscribers_.end());
}

} // namespace incsh

#ifndef INCSH_SESSION_CHANNEL_HPP
#define INCSH_SESSION_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <llvm/ADT/StringRef.h>

#include "session/append_outcome.hpp"

namespace incsh {

enum class Topic { Parse, Executable };

enum class EventKind {
  TreeUpdated,    ///< Parse topic: a re-parse finished
  AppendRejected, ///< Parse topic: buffer limit exceeded
  AppendFailed,   ///< Parse topic: engine or conversion fault
  StatementReady  ///< Executable topic: a statement became executable
};

struct SessionEvent {
  EventKind kind = EventKind::TreeUpdated;
  std::string sessionId;
  // Parse topic events
  std::shared_ptr<const AppendOutcome> outcome;
  // StatementReady
  ExecutableStatement statement;

  [[nodiscard]] Topic topic() const noexcept {
    return kind == EventKind::StatementReady ? Topic::Executable
                                             : Topic::Parse;
  }
};

[[nodiscard]] llvm::StringRef eventKindName(EventKind kind) noexcept;

/// Mailbox side of a subscription. Events queue up until taken; the
/// publisher stops delivering once the last shared_ptr is dropped.
class Subscription {
public:
  explicit Subscription(Topic topic) : topic_(topic) {}

  [[nodiscard]] Topic topic() const noexcept { return topic_; }

  /// Take the oldest event without waiting.
  std::optional<SessionEvent> poll();

  /// Take the oldest event, waiting up to timeout for one to arrive.
  std::optional<SessionEvent> waitNext(std::chrono::milliseconds timeout);

  /// Take every queued event.
  std::vector<SessionEvent> drain();

  [[nodiscard]] std::size_t pending() const;

private:
  friend class SessionChannel;
  void push(const SessionEvent& event);

  Topic topic_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<SessionEvent> queue_;
};

/// Publish/subscribe fan-out for one session.
///
/// Subscribers see events published after they subscribed, in publication
/// order; nothing is replayed. Callbacks run synchronously on the publishing
/// thread, outside the channel's lock, so a callback may subscribe or
/// unsubscribe.
class SessionChannel {
public:
  using Callback = std::function<void(const SessionEvent&)>;
  using SubscriberId = std::uint64_t;

  explicit SessionChannel(std::string sessionId);

  [[nodiscard]] const std::string& sessionId() const { return sessionId_; }

  /// Attach a mailbox for topic.
  [[nodiscard]] std::shared_ptr<Subscription> subscribe(Topic topic);

  /// Attach a callback for topic.
  /// @return Id for unsubscribe()
  SubscriberId subscribe(Topic topic, Callback callback);

  void unsubscribe(SubscriberId id);

  /// Deliver event to every live subscriber of its topic.
  void publish(const SessionEvent& event);

  /// Live subscribers, after pruning dropped mailboxes.
  [[nodiscard]] std::size_t subscriberCount();

private:
  struct Subscriber {
    SubscriberId id;
    Topic topic;
    Callback callback;
    std::weak_ptr<Subscription> mailbox;
  };

  void pruneLocked();

  std::string sessionId_;
  std::mutex mutex_;
  std::vector<Subscriber> subscribers_;
  SubscriberId nextId_ = 1;
};

} // namespace incsh

#endif // INCSH_SESSION_CHANNEL_HPP

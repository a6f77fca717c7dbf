#ifndef INCSH_SESSION_HOST_HPP
#define INCSH_SESSION_HOST_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "session/incremental_session.hpp"

namespace incsh {

/// Runs one IncrementalSession on a dedicated worker thread.
///
/// Every call is queued and executed in submission order, one at a time;
/// the calling thread blocks until its own job has run. The destructor runs
/// whatever is still queued, then joins the worker.
class SessionHost {
public:
  explicit SessionHost(SessionConfig config = {});
  explicit SessionHost(std::unique_ptr<IncrementalSession> session);
  ~SessionHost();

  SessionHost(const SessionHost&) = delete;
  SessionHost& operator=(const SessionHost&) = delete;

  /// @return The session's outcome, or a Failed outcome once stopped
  AppendOutcome append(std::string fragment);
  AppendOutcome finish();

  void reset();
  [[nodiscard]] std::shared_ptr<const ParseTree> currentTree();
  [[nodiscard]] std::string accumulatedInput();

  /// The session's channel. Safe to use from any thread.
  [[nodiscard]] SessionChannel& channel() { return session_->channel(); }

  /// Stop accepting jobs, finish the queued ones and join the worker.
  /// Called from a job on the worker, it only stops accepting jobs.
  void shutdown();

  [[nodiscard]] bool isRunning();

private:
  template <typename Result>
  std::future<Result> post(std::function<Result(IncrementalSession&)> job);
  void workerLoop();

  std::unique_ptr<IncrementalSession> session_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> jobs_;
  bool stopping_ = false;
  std::thread worker_;
  std::thread::id workerId_;
  // Serialises joins of worker_ between concurrent shutdown() calls.
  std::mutex joinMutex_;
};

} // namespace incsh

#endif // INCSH_SESSION_HOST_HPP

#include "session/session_host.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace incsh {

SessionHost::SessionHost(SessionConfig config)
    : SessionHost(std::make_unique<IncrementalSession>(std::move(config))) {}

SessionHost::SessionHost(std::unique_ptr<IncrementalSession> session)
    : session_(std::move(session)) {
  worker_ = std::thread([this]() { workerLoop(); });
  workerId_ = worker_.get_id();
}

SessionHost::~SessionHost() { shutdown(); }

void SessionHost::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  // From a job on the worker itself: the loop ends once the queue is empty.
  if (std::this_thread::get_id() == workerId_) {
    return;
  }
  std::lock_guard<std::mutex> lock(joinMutex_);
  if (worker_.joinable()) {
    worker_.join();
  }
}

bool SessionHost::isRunning() {
  std::lock_guard<std::mutex> lock(mutex_);
  return !stopping_;
}

template <typename Result>
std::future<Result>
SessionHost::post(std::function<Result(IncrementalSession&)> job) {
  auto task = std::make_shared<std::packaged_task<Result()>>(
      [this, job = std::move(job)]() { return job(*session_); });
  std::future<Result> future = task->get_future();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      throw std::logic_error("session host '" +
                             session_->config().sessionId + "' is stopped");
    }
    jobs_.emplace_back([task]() { (*task)(); });
  }
  cv_.notify_one();
  return future;
}

void SessionHost::workerLoop() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty()) {
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    // packaged_task stores any exception in its future.
    job();
  }
}

AppendOutcome SessionHost::append(std::string fragment) {
  try {
    return post<AppendOutcome>(
               [fragment = std::move(fragment)](IncrementalSession& session) {
                 return session.append(fragment);
               })
        .get();
  } catch (const std::exception& e) {
    return AppendOutcome::failed(e.what());
  }
}

AppendOutcome SessionHost::finish() {
  try {
    return post<AppendOutcome>(
               [](IncrementalSession& session) { return session.finish(); })
        .get();
  } catch (const std::exception& e) {
    return AppendOutcome::failed(e.what());
  }
}

void SessionHost::reset() {
  post<void>([](IncrementalSession& session) { session.reset(); }).get();
}

std::shared_ptr<const ParseTree> SessionHost::currentTree() {
  return post<std::shared_ptr<const ParseTree>>(
             [](IncrementalSession& session) { return session.currentTree(); })
      .get();
}

std::string SessionHost::accumulatedInput() {
  return post<std::string>([](IncrementalSession& session) {
           return session.accumulatedInput();
         })
      .get();
}

} // namespace incsh

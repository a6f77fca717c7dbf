#include <gtest/gtest.h>

#include "session/session_host.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace incsh;

// ============== Forwarding Tests ==============

TEST(SessionHostTest, AppendRunsOnTheSession) {
  SessionHost host;
  EXPECT_TRUE(host.isRunning());
  const auto outcome = host.append("echo one\n");
  ASSERT_TRUE(outcome.isUpdated());
  ASSERT_EQ(outcome.emitted.size(), 1u);
  EXPECT_EQ(outcome.emitted[0].text, "echo one");
  EXPECT_EQ(host.accumulatedInput(), "echo one\n");
  ASSERT_NE(host.currentTree(), nullptr);
  EXPECT_EQ(host.currentTree()->source, "echo one\n");
}

TEST(SessionHostTest, FinishAndReset) {
  SessionHost host;
  ASSERT_TRUE(host.append("ls").isUpdated());
  const auto finished = host.finish();
  ASSERT_TRUE(finished.isUpdated());
  ASSERT_EQ(finished.emitted.size(), 1u);
  EXPECT_EQ(finished.emitted[0].text, "ls");

  host.reset();
  EXPECT_EQ(host.accumulatedInput(), "");
  EXPECT_EQ(host.currentTree(), nullptr);
}

TEST(SessionHostTest, WrapsAnExistingSession) {
  SessionConfig config;
  config.sessionId = "wrapped";
  config.maxBufferSize = 4;
  SessionHost host(std::make_unique<IncrementalSession>(config));
  const auto outcome = host.append("echo one\n");
  EXPECT_TRUE(outcome.isRejected());
  EXPECT_EQ(host.channel().sessionId(), "wrapped");
}

// ============== Event Tests ==============

TEST(SessionHostTest, ChannelDeliversStatements) {
  SessionHost host;
  auto executable = host.channel().subscribe(Topic::Executable);
  host.append("a\nb\n");
  host.append("c\n");

  const auto events = executable->drain();
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0].statement.text, "a");
  EXPECT_EQ(events[1].statement.text, "b");
  EXPECT_EQ(events[2].statement.text, "c");
  EXPECT_EQ(events[2].statement.sequence, 3u);
}

TEST(SessionHostTest, CallbacksRunOnTheWorker) {
  SessionHost host;
  std::thread::id seen;
  host.channel().subscribe(Topic::Parse, [&seen](const SessionEvent&) {
    seen = std::this_thread::get_id();
  });
  host.append("true\n");
  EXPECT_NE(seen, std::thread::id());
  EXPECT_NE(seen, std::this_thread::get_id());
}

// ============== Concurrency Tests ==============

TEST(SessionHostTest, ConcurrentAppendsAreSerialized) {
  SessionHost host;
  auto executable = host.channel().subscribe(Topic::Executable);

  constexpr int kThreads = 4;
  constexpr int kLines = 25;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&host, t]() {
      for (int i = 0; i < kLines; ++i) {
        const auto outcome = host.append("echo " + std::to_string(t) + "_" +
                                         std::to_string(i) + "\n");
        EXPECT_TRUE(outcome.isUpdated());
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  const auto events = executable->drain();
  ASSERT_EQ(events.size(), static_cast<std::size_t>(kThreads * kLines));
  for (std::size_t i = 0; i < events.size(); ++i) {
    EXPECT_EQ(events[i].statement.sequence, i + 1);
  }

  // Every line arrived whole; no fragment interleaved with another.
  const std::string input = host.accumulatedInput();
  EXPECT_EQ(std::count(input.begin(), input.end(), '\n'), kThreads * kLines);
  EXPECT_EQ(host.currentTree()->statements().size(),
            static_cast<std::size_t>(kThreads * kLines));
  EXPECT_FALSE(host.currentTree()->hasError);
}

// ============== Shutdown Tests ==============

TEST(SessionHostTest, CallsAfterShutdownFail) {
  SessionConfig config;
  config.sessionId = "done";
  SessionHost host(config);
  ASSERT_TRUE(host.append("echo one\n").isUpdated());
  host.shutdown();
  EXPECT_FALSE(host.isRunning());

  const auto outcome = host.append("echo two\n");
  ASSERT_TRUE(outcome.isFailed());
  EXPECT_EQ(outcome.message, "session host 'done' is stopped");
  EXPECT_TRUE(host.finish().isFailed());
  EXPECT_THROW(host.reset(), std::logic_error);
  EXPECT_THROW((void)host.accumulatedInput(), std::logic_error);
  EXPECT_THROW((void)host.currentTree(), std::logic_error);
}

TEST(SessionHostTest, ShutdownIsIdempotent) {
  SessionHost host;
  host.shutdown();
  host.shutdown();
  EXPECT_FALSE(host.isRunning());
}

TEST(SessionHostTest, DestructorRunsQueuedWork) {
  std::vector<std::string> texts;
  std::mutex mutex;
  {
    SessionHost host;
    host.channel().subscribe(Topic::Executable,
                             [&](const SessionEvent& event) {
                               std::lock_guard<std::mutex> lock(mutex);
                               texts.push_back(event.statement.text);
                             });
    std::thread writer([&host]() { host.append("echo late\n"); });
    writer.join();
  }
  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_EQ(texts, (std::vector<std::string>{"echo late"}));
}

TEST(SessionHostTest, ShutdownFromCallbackOnTheWorker) {
  SessionHost host;
  host.channel().subscribe(Topic::Executable,
                           [&host](const SessionEvent&) { host.shutdown(); });

  const auto outcome = host.append("echo one\n");
  ASSERT_TRUE(outcome.isUpdated());
  EXPECT_EQ(outcome.emitted.size(), 1u);
  EXPECT_FALSE(host.isRunning());

  const auto after = host.append("echo two\n");
  ASSERT_TRUE(after.isFailed());
  EXPECT_NE(after.message.find("is stopped"), std::string::npos)
      << after.message;
}

TEST(SessionHostTest, ConcurrentShutdowns) {
  SessionHost host;
  ASSERT_TRUE(host.append("echo one\n").isUpdated());

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&host]() { host.shutdown(); });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_FALSE(host.isRunning());
  EXPECT_TRUE(host.append("ls\n").isFailed());
}

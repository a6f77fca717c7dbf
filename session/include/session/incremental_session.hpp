#ifndef INCSH_INCREMENTAL_SESSION_HPP
#define INCSH_INCREMENTAL_SESSION_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <llvm/Support/raw_ostream.h>

#include "parser/node.hpp"
#include "parser/parse_engine.hpp"
#include "parser/raw_tree.hpp"
#include "parser/tree_converter.hpp"
#include "session/append_outcome.hpp"
#include "session/session_channel.hpp"

namespace incsh {

struct SessionConfig {
  std::string sessionId = "default";
  std::size_t maxBufferSize = 10 * 1024 * 1024;
  // False gives tree updates only, never StatementReady events.
  bool emitStatements = true;
  // One line per session event when set.
  llvm::raw_ostream* trace = nullptr;
};

/// One independent parsing context: the accumulated input of a stream, its
/// current tree and the emission bookkeeping.
///
/// Not thread-safe. Run it on a single thread, or behind a SessionHost.
class IncrementalSession {
public:
  explicit IncrementalSession(SessionConfig config = {});

  /// Build a session around a specific engine and converter.
  IncrementalSession(SessionConfig config, std::unique_ptr<ParseEngine> engine,
                     std::unique_ptr<TreeConverter> converter);

  /// Append a fragment, re-parse and classify. Publishes TreeUpdated (or
  /// AppendRejected / AppendFailed) and, when the buffer is complete, one
  /// StatementReady per newly executable statement.
  /// @param fragment Raw input, any size down to a single character
  /// @return The outcome; never throws for engine or conversion faults
  AppendOutcome append(const std::string& fragment);

  /// Mark end of stream. The last statement is emitted even when no newline
  /// follows it.
  AppendOutcome finish();

  /// Drop the buffer, the trees and the emission counters.
  void reset();

  [[nodiscard]] std::shared_ptr<const ParseTree> currentTree() const {
    return tree_;
  }
  [[nodiscard]] const std::string& accumulatedInput() const { return buffer_; }
  [[nodiscard]] std::size_t bufferSize() const { return buffer_.size(); }
  [[nodiscard]] bool hasErrors() const { return tree_ && tree_->hasError; }
  [[nodiscard]] std::uint64_t emittedCount() const { return emittedCount_; }
  [[nodiscard]] int lastEmittedRow() const { return lastEmittedRow_; }
  [[nodiscard]] const SessionConfig& config() const { return config_; }

  [[nodiscard]] SessionChannel& channel() { return channel_; }

private:
  SessionConfig config_;
  std::unique_ptr<ParseEngine> engine_;
  std::unique_ptr<TreeConverter> converter_;
  SessionChannel channel_;

  std::string buffer_;
  std::unique_ptr<RawTree> rawTree_;
  std::shared_ptr<const ParseTree> tree_;
  std::uint64_t emittedCount_ = 0;
  int lastEmittedRow_ = -1;
  std::size_t lastEmittedEnd_ = 0;

  AppendOutcome reparse(std::size_t rollbackSize, bool endOfInput);
  AppendOutcome fail(std::size_t rollbackSize, const std::string& message);
  [[nodiscard]] std::vector<NodePtr>
  readyStatements(const ParseTree& tree, bool endOfInput) const;
  void publishOutcome(EventKind kind, const AppendOutcome& outcome);
};

} // namespace incsh

#endif // INCSH_INCREMENTAL_SESSION_HPP

#include "session/incremental_session.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

#include <llvm/Support/Error.h>

#include "parser/node_types.hpp"

namespace incsh {

IncrementalSession::IncrementalSession(SessionConfig config)
    : IncrementalSession(std::move(config),
                         std::make_unique<ShellParseEngine>(),
                         std::make_unique<TreeConverter>()) {}

IncrementalSession::IncrementalSession(SessionConfig config,
                                       std::unique_ptr<ParseEngine> engine,
                                       std::unique_ptr<TreeConverter> converter)
    : config_(std::move(config)), engine_(std::move(engine)),
      converter_(std::move(converter)), channel_(config_.sessionId) {}

AppendOutcome IncrementalSession::append(const std::string& fragment) {
  if (buffer_.size() + fragment.size() > config_.maxBufferSize) {
    AppendOutcome outcome = AppendOutcome::rejected(
        buffer_.size(), fragment.size(), config_.maxBufferSize);
    if (config_.trace != nullptr) {
      *config_.trace << "incsh[" << config_.sessionId
                     << "]: rejected: " << outcome.message << "\n";
    }
    publishOutcome(EventKind::AppendRejected, outcome);
    return outcome;
  }

  const std::size_t previousSize = buffer_.size();
  buffer_ += fragment;
  return reparse(previousSize, false);
}

AppendOutcome IncrementalSession::finish() {
  return reparse(buffer_.size(), true);
}

void IncrementalSession::reset() {
  buffer_.clear();
  rawTree_.reset();
  tree_.reset();
  converter_->clearCache();
  emittedCount_ = 0;
  lastEmittedRow_ = -1;
  lastEmittedEnd_ = 0;
  if (config_.trace != nullptr) {
    *config_.trace << "incsh[" << config_.sessionId << "]: reset\n";
  }
}

AppendOutcome IncrementalSession::reparse(std::size_t rollbackSize,
                                          bool endOfInput) {
  std::unique_ptr<RawTree> raw;
  try {
    raw = std::make_unique<RawTree>(engine_->reparse(rawTree_.get(), buffer_));
  } catch (const std::exception& e) {
    return fail(rollbackSize, std::string("parse engine failure: ") + e.what());
  }

  std::shared_ptr<const ParseTree> tree;
  try {
    llvm::Expected<ParseTree> converted = converter_->convert(*raw);
    if (!converted) {
      return fail(rollbackSize, "tree conversion failure: " +
                                    llvm::toString(converted.takeError()));
    }
    tree = std::make_shared<const ParseTree>(std::move(*converted));
  } catch (const std::exception& e) {
    return fail(rollbackSize,
                std::string("tree conversion failure: ") + e.what());
  }

  Classification classification = CompletenessClassifier::classify(*tree);
  AppendOutcome outcome = AppendOutcome::updated(
      tree, classification, raw->changedNodes(), raw->changedRanges());

  rawTree_ = std::move(raw);
  tree_ = tree;

  if (config_.trace != nullptr) {
    *config_.trace << "incsh[" << config_.sessionId << "]: "
                   << (endOfInput ? "finish" : "append") << " "
                   << buffer_.size() - rollbackSize << " bytes, "
                   << rawTree_->reusedCount() << " reused, "
                   << outcome.changedNodes.size() << " changed -> "
                   << CompletenessClassifier::statusName(classification.status);
    if (classification.isIncomplete()) {
      *config_.trace << " (expecting '" << classification.expectedCloser
                     << "')";
    }
    *config_.trace << "\n";
  }

  publishOutcome(EventKind::TreeUpdated, outcome);

  if (classification.isComplete() && config_.emitStatements) {
    // Counters advance one statement at a time, just before it is published.
    for (const NodePtr& node : readyStatements(*tree, endOfInput)) {
      const ExecutableStatement statement{node, node->text, ++emittedCount_};
      lastEmittedRow_ = std::max(lastEmittedRow_, node->range.end.row);
      lastEmittedEnd_ = node->range.endByte;
      outcome.emitted.push_back(statement);
      if (config_.trace != nullptr) {
        *config_.trace << "incsh[" << config_.sessionId << "]: emit #"
                       << statement.sequence << " "
                       << nodeTypeName(node->type) << "\n";
      }
      SessionEvent event;
      event.kind = EventKind::StatementReady;
      event.sessionId = config_.sessionId;
      event.statement = statement;
      channel_.publish(event);
    }
  }
  return outcome;
}

AppendOutcome IncrementalSession::fail(std::size_t rollbackSize,
                                       const std::string& message) {
  buffer_.resize(rollbackSize);
  AppendOutcome outcome = AppendOutcome::failed(message);
  if (config_.trace != nullptr) {
    *config_.trace << "incsh[" << config_.sessionId << "]: failed: " << message
                   << "\n";
  }
  publishOutcome(EventKind::AppendFailed, outcome);
  return outcome;
}

namespace {

// True when a newline ends the line that continues at offset. A
// backslash-newline pair joins two lines; a comment runs to the newline.
bool lineEndsAfter(const std::string& source, std::size_t offset) {
  for (std::size_t i = offset; i < source.size(); ++i) {
    const char c = source[i];
    if (c == '\\' && i + 1 < source.size() && source[i + 1] == '\n') {
      ++i;
    } else if (c == '\n') {
      return true;
    } else if (c == '#') {
      return source.find('\n', i) != std::string::npos;
    }
  }
  return false;
}

} // namespace

// Root children are the top-level statements in source order and never
// overlap, so a statement is new exactly when it ends on a row past the last
// one emitted, or on that row but after the last emitted statement. A
// statement ending on the buffer's last line waits for the newline that
// terminates it, unless the stream has ended.
std::vector<NodePtr>
IncrementalSession::readyStatements(const ParseTree& tree,
                                    bool endOfInput) const {
  std::vector<NodePtr> ready;
  for (const auto& child : tree.statements()) {
    if (!isExecutableStatement(child->type)) {
      continue;
    }
    const int endRow = child->range.end.row;
    if (endRow < lastEmittedRow_ ||
        (endRow == lastEmittedRow_ &&
         child->range.startByte < lastEmittedEnd_)) {
      continue;
    }
    if (!endOfInput && !lineEndsAfter(tree.source, child->range.endByte)) {
      continue;
    }
    ready.push_back(child);
  }
  return ready;
}

void IncrementalSession::publishOutcome(EventKind kind,
                                        const AppendOutcome& outcome) {
  SessionEvent event;
  event.kind = kind;
  event.sessionId = config_.sessionId;
  event.outcome = std::make_shared<const AppendOutcome>(outcome);
  channel_.publish(event);
}

} // namespace incsh

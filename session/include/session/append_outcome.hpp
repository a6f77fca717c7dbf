#ifndef INCSH_APPEND_OUTCOME_HPP
#define INCSH_APPEND_OUTCOME_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "parser/node.hpp"
#include "parser/source_range.hpp"
#include "session/completeness_classifier.hpp"

namespace incsh {

/// A top-level statement handed to the executor.
struct ExecutableStatement {
  NodePtr node;
  std::string text;
  std::uint64_t sequence = 0; // 1-based, per session since the last reset
};

enum class OutcomeStatus { Updated, Rejected, Failed };

// Result of one append (or finish) call
struct AppendOutcome {
  OutcomeStatus status = OutcomeStatus::Failed;

  // Updated
  std::shared_ptr<const ParseTree> tree;
  Classification classification;
  std::vector<std::uint64_t> changedNodes;
  std::vector<SourceRange> changedRanges;
  std::vector<ExecutableStatement> emitted;

  // Rejected
  std::size_t currentSize = 0;
  std::size_t fragmentSize = 0;
  std::size_t maxSize = 0;

  // Rejected and Failed
  std::string message;

  static AppendOutcome updated(std::shared_ptr<const ParseTree> tree,
                               Classification classification,
                               std::vector<std::uint64_t> changedNodes,
                               std::vector<SourceRange> changedRanges) {
    AppendOutcome outcome;
    outcome.status = OutcomeStatus::Updated;
    outcome.tree = std::move(tree);
    outcome.classification = std::move(classification);
    outcome.changedNodes = std::move(changedNodes);
    outcome.changedRanges = std::move(changedRanges);
    return outcome;
  }

  static AppendOutcome rejected(std::size_t currentSize,
                                std::size_t fragmentSize,
                                std::size_t maxSize) {
    AppendOutcome outcome;
    outcome.status = OutcomeStatus::Rejected;
    outcome.currentSize = currentSize;
    outcome.fragmentSize = fragmentSize;
    outcome.maxSize = maxSize;
    outcome.message = "buffer limit exceeded: " + std::to_string(currentSize) +
                      " + " + std::to_string(fragmentSize) + " > " +
                      std::to_string(maxSize) + " bytes";
    return outcome;
  }

  static AppendOutcome failed(const std::string& message) {
    AppendOutcome outcome;
    outcome.status = OutcomeStatus::Failed;
    outcome.message = message;
    return outcome;
  }

  [[nodiscard]] bool isUpdated() const noexcept {
    return status == OutcomeStatus::Updated;
  }
  [[nodiscard]] bool isRejected() const noexcept {
    return status == OutcomeStatus::Rejected;
  }
  [[nodiscard]] bool isFailed() const noexcept {
    return status == OutcomeStatus::Failed;
  }
};

} // namespace incsh

#endif // INCSH_APPEND_OUTCOME_HPP

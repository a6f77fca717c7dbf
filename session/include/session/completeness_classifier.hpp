#ifndef INCSH_COMPLETENESS_CLASSIFIER_HPP
#define INCSH_COMPLETENESS_CLASSIFIER_HPP

#include <string>
#include <utility>

#include <llvm/ADT/StringRef.h>

#include "parser/node.hpp"

namespace incsh {

enum class Completeness { Complete, Incomplete, SyntaxError };

// Verdict on one Parse Tree
struct Classification {
  Completeness status = Completeness::Complete;
  // Set when incomplete: the compound keyword left open and the keyword that
  // would close it, or "unknown" for both when no compound can be blamed.
  std::string opener;
  std::string expectedCloser;
  // Set on a syntax error: the smallest error node.
  NodePtr errorNode;

  static Classification complete() { return {}; }

  static Classification incomplete(const std::string& opener,
                                   const std::string& closer) {
    return {Completeness::Incomplete, opener, closer, nullptr};
  }

  static Classification syntaxError(NodePtr node) {
    return {Completeness::SyntaxError, "", "", std::move(node)};
  }

  [[nodiscard]] bool isComplete() const noexcept {
    return status == Completeness::Complete;
  }
  [[nodiscard]] bool isIncomplete() const noexcept {
    return status == Completeness::Incomplete;
  }
  [[nodiscard]] bool isSyntaxError() const noexcept {
    return status == Completeness::SyntaxError;
  }
};

/// Tells an unfinished tree from a broken one.
///
/// The grammar raises one whole-tree error flag for both causes. What tells
/// them apart is the shape it leaves behind: a prefix that some continuation
/// could still complete keeps its typed compound node, while a prefix no
/// continuation can fix is wrapped in an ERROR node. Any ERROR node wins.
class CompletenessClassifier {
public:
  /// Classify a tree together with its source. An open quote, heredoc or
  /// trailing backslash in the source makes the tree incomplete whatever the
  /// grammar recovered; the closer is the awaited quote or terminator word.
  [[nodiscard]] static Classification classify(const ParseTree& tree);

  /// @param root The program node
  /// @param hasError The whole-tree error flag
  [[nodiscard]] static Classification classify(const NodePtr& root,
                                               bool hasError);

  /// The deepest ERROR node on the first path that reaches one, or nullptr.
  [[nodiscard]] static NodePtr findSmallestError(const NodePtr& node);

  /// "complete", "incomplete" or "syntax_error".
  [[nodiscard]] static llvm::StringRef statusName(Completeness status) noexcept;
};

} // namespace incsh

#endif // INCSH_COMPLETENESS_CLASSIFIER_HPP

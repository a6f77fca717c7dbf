#include "session/completeness_classifier.hpp"

#include "parser/node_types.hpp"
#include "session/continuation_detector.hpp"

namespace incsh {

Classification CompletenessClassifier::classify(const ParseTree& tree) {
  const Continuation open = ContinuationDetector::detect(tree.source);
  switch (open.kind) {
  case ContinuationKind::LineContinuation:
  case ContinuationKind::QuoteContinuation:
  case ContinuationKind::HeredocContinuation:
    return Classification::incomplete(
        "unknown", open.awaiting.empty() ? "unknown" : open.awaiting);
  case ContinuationKind::StructureContinuation:
  case ContinuationKind::Complete:
    break;
  }
  return classify(tree.root, tree.hasError);
}

Classification CompletenessClassifier::classify(const NodePtr& root,
                                                bool hasError) {
  if (!root) {
    return Classification::complete();
  }

  if (NodePtr error = findSmallestError(root)) {
    return Classification::syntaxError(std::move(error));
  }

  if (!hasError) {
    return Classification::complete();
  }

  const auto& children = root->children;
  for (auto it = children.rbegin(); it != children.rend(); ++it) {
    const NodeType type = (*it)->type;
    if (isCompoundStatement(type)) {
      return Classification::incomplete(compoundOpener(type).str(),
                                        compoundCloser(type).str());
    }
  }
  return Classification::incomplete("unknown", "unknown");
}

NodePtr CompletenessClassifier::findSmallestError(const NodePtr& node) {
  if (!node) {
    return nullptr;
  }
  for (const auto& child : node->children) {
    if (NodePtr found = findSmallestError(child)) {
      return found;
    }
  }
  return node->isError() ? node : nullptr;
}

llvm::StringRef CompletenessClassifier::statusName(Completeness status) noexcept {
  switch (status) {
  case Completeness::Complete:
    return "complete";
  case Completeness::Incomplete:
    return "incomplete";
  case Completeness::SyntaxError:
    return "syntax_error";
  }
  return "unknown";
}

} // namespace incsh

#include "parser/raw_tree.hpp"

#include <algorithm>
#include <utility>

namespace incsh {

RawTree::RawTree(RawNodePtr root, std::string text,
                 std::vector<Diagnostic> diagnostics, std::size_t reusedCount,
                 std::shared_ptr<const TSTree> syntaxTree)
    : root_(std::move(root)), text_(std::move(text)),
      diagnostics_(std::move(diagnostics)), reusedCount_(reusedCount),
      syntaxTree_(std::move(syntaxTree)) {}

std::vector<std::uint64_t> RawTree::changedNodes() const {
  std::vector<std::uint64_t> ids;
  const auto& children = root_->children;
  for (std::size_t i = reusedCount_; i < children.size(); ++i) {
    ids.push_back(children[i]->id);
  }
  return ids;
}

std::vector<SourceRange> RawTree::changedRanges() const {
  std::vector<SourceRange> ranges;
  const auto& children = root_->children;
  for (std::size_t i = reusedCount_; i < children.size(); ++i) {
    ranges.push_back(children[i]->range);
  }
  return ranges;
}

std::string RawTree::textOf(const RawNode& node) const {
  const std::size_t start = std::min(node.range.startByte, text_.size());
  const std::size_t stop = std::min(node.range.endByte, text_.size());
  return text_.substr(start, stop - start);
}

} // namespace incsh

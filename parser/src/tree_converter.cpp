#include "parser/tree_converter.hpp"

#include <memory>
#include <system_error>
#include <utility>

#include "parser/node_types.hpp"

namespace incsh {

llvm::Expected<ParseTree> TreeConverter::convert(const RawTree& raw) {
  const RawNode& rawRoot = *raw.root();
  auto root = std::make_shared<Node>();
  root->type = nodeTypeFromKind(rawRoot.kind);
  root->id = rawRoot.id;
  root->range = rawRoot.range;
  root->text = raw.text();
  root->isMissing = rawRoot.isMissing;
  root->hasError = rawRoot.hasError;

  llvm::DenseMap<std::uint64_t, NodePtr> nextCache;
  for (const auto& child : rawRoot.children) {
    NodePtr converted;
    const auto cached = cache_.find(child->id);
    if (cached != cache_.end()) {
      converted = cached->second;
    } else {
      auto result = convertNode(raw, *child);
      if (!result) {
        return result.takeError();
      }
      converted = std::move(*result);
    }
    nextCache[child->id] = converted;
    root->children.push_back(std::move(converted));
  }
  cache_ = std::move(nextCache);

  ParseTree tree;
  tree.root = std::move(root);
  tree.source = raw.text();
  tree.hasError = raw.hasError();
  tree.diagnostics = raw.diagnostics();
  return std::move(tree);
}

llvm::Expected<NodePtr> TreeConverter::convertNode(const RawTree& raw,
                                                   const RawNode& node) {
  const std::size_t size = raw.text().size();
  if (node.range.startByte > node.range.endByte || node.range.endByte > size) {
    return llvm::createStringError(
        std::make_error_code(std::errc::invalid_argument),
        "node '%s' (id %llu) spans bytes %zu..%zu outside a %zu-byte buffer",
        node.kind.c_str(), static_cast<unsigned long long>(node.id),
        node.range.startByte, node.range.endByte, size);
  }

  auto converted = std::make_shared<Node>();
  converted->type = nodeTypeFromKind(node.kind);
  converted->id = node.id;
  converted->range = node.range;
  converted->text = raw.textOf(node);
  converted->field = node.field;
  converted->isMissing = node.isMissing;
  converted->hasError = node.hasError;
  converted->children.reserve(node.children.size());
  for (const auto& child : node.children) {
    auto result = convertNode(raw, *child);
    if (!result) {
      return result.takeError();
    }
    converted->children.push_back(std::move(*result));
  }
  return NodePtr(std::move(converted));
}

} // namespace incsh

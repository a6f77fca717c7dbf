#include "parser/tree_walker.hpp"

namespace incsh {

namespace {

bool walkFrom(const Node& node, int depth, WalkCallback callback) {
  switch (callback(node, depth)) {
  case WalkAction::Halt:
    return false;
  case WalkAction::SkipChildren:
    return true;
  case WalkAction::Continue:
    break;
  }
  for (const auto& child : node.children) {
    if (!walkFrom(*child, depth + 1, callback)) {
      return false;
    }
  }
  return true;
}

} // namespace

bool walkTree(const Node& root, WalkCallback callback) {
  return walkFrom(root, 0, callback);
}

std::size_t countNodes(const Node& root,
                       llvm::function_ref<bool(const Node&)> predicate) {
  std::size_t count = 0;
  walkTree(root, [&](const Node& node, int) {
    if (predicate(node)) {
      ++count;
    }
    return WalkAction::Continue;
  });
  return count;
}

const Node* findFirst(const Node& root,
                      llvm::function_ref<bool(const Node&)> predicate) {
  const Node* found = nullptr;
  walkTree(root, [&](const Node& node, int) {
    if (predicate(node)) {
      found = &node;
      return WalkAction::Halt;
    }
    return WalkAction::Continue;
  });
  return found;
}

std::vector<const Node*> collectNodes(const Node& root, NodeType type) {
  std::vector<const Node*> nodes;
  walkTree(root, [&](const Node& node, int) {
    if (node.type == type) {
      nodes.push_back(&node);
    }
    return WalkAction::Continue;
  });
  return nodes;
}

} // namespace incsh

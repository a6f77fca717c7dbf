#ifndef INCSH_TREE_WALKER_HPP
#define INCSH_TREE_WALKER_HPP

#include <cstddef>
#include <vector>

#include <llvm/ADT/STLFunctionalExtras.h>

#include "parser/node.hpp"

namespace incsh {

/// What a walk callback wants to happen next.
enum class WalkAction {
  Continue,     ///< Descend into the children of this node
  SkipChildren, ///< Move on to the next sibling
  Halt          ///< Stop the walk
};

/// Pre-order traversal over a Parse Tree.
///
/// The Parse Tree is a plain data tree with a closed set of node types, so
/// operations on it are written as callbacks that switch on `Node::type`
/// instead of a visitor class per type. This is used for:
/// - **Classification** (CompletenessClassifier): finds error nodes
/// - **Printing** (TreePrinter): walks children with depth information
/// - **Tests**: counting and locating nodes of a given type
///
/// ## Example
///
/// ```cpp
/// std::size_t words = 0;
/// walkTree(*tree.root, [&](const Node& node, int depth) {
///   if (node.type == NodeType::CommandSubstitution) {
///     return WalkAction::SkipChildren; // ignore nested scripts
///   }
///   if (node.type == NodeType::Word) {
///     ++words;
///   }
///   return WalkAction::Continue;
/// });
/// ```
///
/// The callback receives the depth of the node relative to the walk root
/// (the root itself is depth 0).
using WalkCallback = llvm::function_ref<WalkAction(const Node&, int)>;

/// Walk root and its descendants in pre-order.
/// @return false if the callback halted the walk
bool walkTree(const Node& root, WalkCallback callback);

/// Count the nodes (root included) matching predicate.
[[nodiscard]] std::size_t
countNodes(const Node& root, llvm::function_ref<bool(const Node&)> predicate);

/// First node in pre-order matching predicate, or nullptr.
[[nodiscard]] const Node*
findFirst(const Node& root, llvm::function_ref<bool(const Node&)> predicate);

/// Every node of the given type, in pre-order.
[[nodiscard]] std::vector<const Node*> collectNodes(const Node& root,
                                                    NodeType type);

} // namespace incsh

#endif // INCSH_TREE_WALKER_HPP

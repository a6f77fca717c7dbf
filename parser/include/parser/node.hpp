#ifndef INCSH_NODE_HPP
#define INCSH_NODE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "parser/error_reporter.hpp"
#include "parser/node_types.hpp"
#include "parser/source_range.hpp"

namespace incsh {

class Node;
using NodePtr = std::shared_ptr<const Node>;

/// Parse Tree node. Children keep source order; a child hung under a named
/// field carries that name in `field`, positional children leave it empty.
class Node {
public:
  NodeType type = NodeType::Unknown;
  std::uint64_t id = 0;
  SourceRange range;
  std::string text;
  std::string field;
  bool isMissing = false;
  bool hasError = false;
  std::vector<NodePtr> children;

  [[nodiscard]] bool isError() const { return type == NodeType::Error; }

  /// First child hung under field, or nullptr.
  [[nodiscard]] const Node* childByField(const std::string& name) const;

  /// Every child hung under field, in source order.
  [[nodiscard]] std::vector<const Node*>
  childrenByField(const std::string& name) const;

  /// Children without a field name.
  [[nodiscard]] std::vector<const Node*> positionalChildren() const;
};

/// Converted tree for one version of a session's buffer.
struct ParseTree {
  NodePtr root;
  std::string source;
  bool hasError = false;
  std::vector<Diagnostic> diagnostics;

  /// Top-level statements (and comments) in textual order.
  [[nodiscard]] const std::vector<NodePtr>& statements() const {
    return root->children;
  }
};

} // namespace incsh

#endif // INCSH_NODE_HPP

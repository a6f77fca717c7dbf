#include "parser/node.hpp"

namespace incsh {

const Node* Node::childByField(const std::string& name) const {
  for (const auto& child : children) {
    if (child->field == name) {
      return child.get();
    }
  }
  return nullptr;
}

std::vector<const Node*>
Node::childrenByField(const std::string& name) const {
  std::vector<const Node*> matches;
  for (const auto& child : children) {
    if (child->field == name) {
      matches.push_back(child.get());
    }
  }
  return matches;
}

std::vector<const Node*> Node::positionalChildren() const {
  return childrenByField("");
}

} // namespace incsh

#include "parser/tree_printer.hpp"

#include <sstream>

#include "parser/node_types.hpp"

namespace incsh {

TreePrinter::TreePrinter(std::ostream& out) noexcept : out_(out) {}

void TreePrinter::print(const Node& root) {
  depthHasMore_.clear();
  printNode(root);
}

std::string TreePrinter::render(const Node& root) {
  std::ostringstream oss;
  TreePrinter printer(oss);
  printer.print(root);
  return oss.str();
}

void TreePrinter::printPrefix() const {
  for (size_t i = 0; i + 1 < depthHasMore_.size(); ++i) {
    out_ << (depthHasMore_[i] ? "| " : "  ");
  }
  if (!depthHasMore_.empty()) {
    out_ << (depthHasMore_.back() ? "|-" : "`-");
  }
}

std::string TreePrinter::escape(const std::string& text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (const char c : text) {
    switch (c) {
    case '\n':
      escaped += "\\n";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\'':
      escaped += "\\'";
      break;
    default:
      escaped += c;
    }
  }
  return escaped;
}

TreePrinter::DepthScope::DepthScope(TreePrinter& printer, bool hasMore) noexcept
    : printer_(printer) {
  printer_.depthHasMore_.push_back(hasMore);
}

TreePrinter::DepthScope::~DepthScope() noexcept {
  printer_.depthHasMore_.pop_back();
}

void TreePrinter::printNode(const Node& node) {
  printPrefix();
  if (!node.field.empty()) {
    out_ << node.field << ": ";
  }
  out_ << nodeTypeName(node.type).str() << " [" << node.range.start.row << ":"
       << node.range.start.column << "-" << node.range.end.row << ":"
       << node.range.end.column << "]";
  if (node.children.empty() && node.type != NodeType::Program) {
    out_ << " '" << escape(node.text) << "'";
  }
  if (node.isMissing) {
    out_ << " (missing)";
  }
  out_ << "\n";

  const auto& children = node.children;
  for (size_t i = 0; i < children.size(); ++i) {
    const bool isLast = (i == children.size() - 1);
    DepthScope scope(*this, !isLast);
    printNode(*children[i]);
  }
}

} // namespace incsh

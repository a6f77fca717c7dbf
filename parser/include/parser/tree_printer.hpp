#ifndef INCSH_TREE_PRINTER_HPP
#define INCSH_TREE_PRINTER_HPP

#include <ostream>
#include <string>
#include <vector>

#include "parser/node.hpp"

namespace incsh {

/// Renders a Parse Tree one node per line:
///
///   program [0:0-1:0]
///   `-command [0:0-0:8]
///     |-name: command_name [0:0-0:4]
///     | `-word [0:0-0:4] 'echo'
///     `-argument: word [0:5-0:8] 'one'
///
/// Positions are zero-based row:column. Leaves show their quoted text.
class TreePrinter {
public:
  explicit TreePrinter(std::ostream& out) noexcept;

  void print(const Node& root);

  /// Convenience wrapper returning the rendering as a string.
  [[nodiscard]] static std::string render(const Node& root);

private:
  std::ostream& out_;
  std::vector<bool> depthHasMore_;

  void printNode(const Node& node);
  void printPrefix() const;
  static std::string escape(const std::string& text);

  class DepthScope {
  public:
    DepthScope(TreePrinter& printer, bool hasMore) noexcept;
    ~DepthScope() noexcept;

  private:
    TreePrinter& printer_;
  };
};

} // namespace incsh

#endif // INCSH_TREE_PRINTER_HPP

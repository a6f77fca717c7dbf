#ifndef INCSH_RAW_TREE_HPP
#define INCSH_RAW_TREE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "parser/error_reporter.hpp"
#include "parser/source_range.hpp"

struct TSTree;

namespace incsh {

/// Grammar kind reserved for regions the grammar could not parse.
inline constexpr const char* kErrorKind = "ERROR";

struct RawNode;
using RawNodePtr = std::shared_ptr<const RawNode>;

/// Engine-level syntax node. Immutable once built; a subtree reused by an
/// incremental parse is the very same object in both trees.
struct RawNode {
  std::string kind;
  std::uint64_t id = 0;
  SourceRange range;
  std::string field; // empty for positional children
  bool isMissing = false;
  bool hasError = false;
  std::vector<RawNodePtr> children;

  [[nodiscard]] bool isError() const { return kind == kErrorKind; }
};

/// Hands out node ids. One allocator per engine keeps ids unique across
/// every tree the engine produces.
class NodeIdAllocator {
public:
  std::uint64_t take() noexcept { return next_++; }

private:
  std::uint64_t next_ = 1;
};

/// Result of one engine run: the program node, the text it covers and the
/// grammar's diagnostics. syntaxTree is the tree-sitter tree the nodes were
/// built from; the engine edits a copy of it on the next run.
class RawTree {
public:
  RawTree(RawNodePtr root, std::string text,
          std::vector<Diagnostic> diagnostics, std::size_t reusedCount,
          std::shared_ptr<const TSTree> syntaxTree = nullptr);

  [[nodiscard]] const RawNodePtr& root() const { return root_; }
  [[nodiscard]] const std::string& text() const { return text_; }
  [[nodiscard]] bool hasError() const { return root_->hasError; }
  [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const {
    return diagnostics_;
  }

  /// Number of leading root children carried over from the previous tree.
  [[nodiscard]] std::size_t reusedCount() const { return reusedCount_; }

  /// Ids and ranges of the root children built by this run.
  [[nodiscard]] std::vector<std::uint64_t> changedNodes() const;
  [[nodiscard]] std::vector<SourceRange> changedRanges() const;

  [[nodiscard]] std::string textOf(const RawNode& node) const;

  [[nodiscard]] const std::shared_ptr<const TSTree>& syntaxTree() const {
    return syntaxTree_;
  }

private:
  RawNodePtr root_;
  std::string text_;
  std::vector<Diagnostic> diagnostics_;
  std::size_t reusedCount_;
  std::shared_ptr<const TSTree> syntaxTree_;
};

} // namespace incsh

#endif // INCSH_RAW_TREE_HPP

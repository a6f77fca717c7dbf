#ifndef INCSH_TREE_CONVERTER_HPP
#define INCSH_TREE_CONVERTER_HPP

#include <cstdint>

#include <llvm/ADT/DenseMap.h>
#include <llvm/Support/Error.h>

#include "parser/node.hpp"
#include "parser/raw_tree.hpp"

namespace incsh {

/// Converts engine trees into Parse Trees.
///
/// Converted top-level statements are cached by raw node id, so statements
/// the engine reused are not converted again. Any inconsistency in the raw
/// tree (a range outside the text) is reported as an llvm::Error.
class TreeConverter {
public:
  virtual ~TreeConverter() = default;

  virtual llvm::Expected<ParseTree> convert(const RawTree& raw);

  /// Forget every cached statement.
  void clearCache() { cache_.clear(); }

  [[nodiscard]] unsigned cachedCount() const { return cache_.size(); }

protected:
  llvm::Expected<NodePtr> convertNode(const RawTree& raw, const RawNode& node);

private:
  llvm::DenseMap<std::uint64_t, NodePtr> cache_;
};

} // namespace incsh

#endif // INCSH_TREE_CONVERTER_HPP

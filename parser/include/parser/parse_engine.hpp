#ifndef INCSH_PARSE_ENGINE_HPP
#define INCSH_PARSE_ENGINE_HPP

#include <cstddef>
#include <memory>
#include <string>

#include "parser/raw_tree.hpp"

struct TSParser;

namespace incsh {

/// Parsing engine seam. An engine turns the whole buffered text into a raw
/// tree, reusing what it can from the previous tree.
class ParseEngine {
public:
  virtual ~ParseEngine() = default;

  /// Parse text. previous, when given, is the tree this engine produced for
  /// an earlier version of the text.
  virtual RawTree reparse(const RawTree* previous, const std::string& text) = 0;
};

/// Engine backed by tree-sitter and the tree-sitter-bash grammar.
///
/// With a previous tree, a copy of its syntax tree is edited to describe the
/// change (everything after the common prefix of the old and new text) and
/// handed to the parser, which reuses the unaffected subtrees. Leading
/// top-level statements that kept their kind and range, lie inside the
/// common prefix, are error free and do not intersect a changed range are
/// carried over as the very same raw nodes (same ids). The last statement
/// of the previous tree is never carried over.
class ShellParseEngine : public ParseEngine {
public:
  /// @throws std::runtime_error when the grammar does not match the
  /// tree-sitter runtime
  ShellParseEngine();
  ~ShellParseEngine() override;

  ShellParseEngine(const ShellParseEngine&) = delete;
  ShellParseEngine& operator=(const ShellParseEngine&) = delete;

  /// @throws std::runtime_error when tree-sitter returns no tree
  RawTree reparse(const RawTree* previous, const std::string& text) override;

  /// Length of the longest common prefix of two texts.
  [[nodiscard]] static std::size_t commonPrefix(const std::string& a,
                                                const std::string& b);

private:
  struct ParserDeleter {
    void operator()(TSParser* parser) const;
  };

  std::unique_ptr<TSParser, ParserDeleter> parser_;
  NodeIdAllocator ids_;
};

} // namespace incsh

#endif // INCSH_PARSE_ENGINE_HPP

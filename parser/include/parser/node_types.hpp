#ifndef INCSH_NODE_TYPES_HPP
#define INCSH_NODE_TYPES_HPP

#include <llvm/ADT/StringRef.h>

namespace incsh {

/// Closed set of Parse Tree node types.
enum class NodeType {
  Program,
  Comment,
  Command,
  CommandName,
  Word,
  String,
  StringContent,
  RawString,
  AnsiCString,
  TranslatedString,
  SimpleExpansion,
  Expansion,
  CommandSubstitution,
  ArithmeticExpansion,
  ProcessSubstitution,
  Concatenation,
  VariableAssignment,
  VariableAssignments,
  VariableName,
  Number,
  Array,
  FileRedirect,
  HeredocRedirect,
  HeredocStart,
  HeredocBody,
  HeredocEnd,
  HerestringRedirect,
  FileDescriptor,
  Pipeline,
  List,
  NegatedCommand,
  RedirectedStatement,
  Subshell,
  CompoundStatement,
  IfStatement,
  ElifClause,
  ElseClause,
  ForStatement,
  CStyleForStatement,
  WhileStatement,
  UntilStatement,
  CaseStatement,
  CaseItem,
  DoGroup,
  FunctionDefinition,
  TestCommand,
  DeclarationCommand,
  UnsetCommand,
  Error,
  Unknown
};

/// Coarse grouping of node types.
enum class NodeCategory {
  Statement, ///< Directly executable top-level unit
  Compound,  ///< if, for, while, until, case
  Clause,    ///< Part of a compound statement (do_group, elif_clause, ...)
  Word,      ///< Words, strings and expansions
  Redirect,  ///< Redirections and their pieces
  Other      ///< program, comment, error, unknown
};

/// Map a grammar kind string (e.g. "if_statement") to its node type.
/// @param kind The raw node kind
/// @return The node type, or NodeType::Unknown for unrecognized kinds
[[nodiscard]] NodeType nodeTypeFromKind(llvm::StringRef kind) noexcept;

/// Convert a node type to its grammar kind string.
/// @param type The node type
/// @return The kind string (e.g. "command"), "ERROR" for NodeType::Error
[[nodiscard]] llvm::StringRef nodeTypeName(NodeType type) noexcept;

/// Get the category of a node type.
[[nodiscard]] NodeCategory getNodeCategory(NodeType type) noexcept;

/// Check if the node type is one of the five compound statements that open
/// with a keyword and close with another: if, for, while, until, case.
[[nodiscard]] bool isCompoundStatement(NodeType type) noexcept;

/// Check if a node of this type can be handed to an executor as a
/// statement. Comments, errors and unknown kinds are not executable.
[[nodiscard]] bool isExecutableStatement(NodeType type) noexcept;

/// Opening keyword of a compound statement ("if", "for", ...).
/// @return The keyword, or "unknown" for other types
[[nodiscard]] llvm::StringRef compoundOpener(NodeType type) noexcept;

/// Closing keyword implied by a compound statement: if -> fi,
/// for/while/until -> done, case -> esac.
/// @return The keyword, or "unknown" for other types
[[nodiscard]] llvm::StringRef compoundCloser(NodeType type) noexcept;

} // namespace incsh

#endif // INCSH_NODE_TYPES_HPP

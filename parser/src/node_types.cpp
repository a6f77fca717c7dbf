#include "parser/node_types.hpp"

#include <llvm/ADT/StringSwitch.h>

namespace incsh {

NodeType nodeTypeFromKind(llvm::StringRef kind) noexcept {
  return llvm::StringSwitch<NodeType>(kind)
      .Case("program", NodeType::Program)
      .Case("comment", NodeType::Comment)
      .Case("command", NodeType::Command)
      .Case("command_name", NodeType::CommandName)
      .Case("word", NodeType::Word)
      .Case("string", NodeType::String)
      .Case("string_content", NodeType::StringContent)
      .Case("raw_string", NodeType::RawString)
      .Case("ansi_c_string", NodeType::AnsiCString)
      .Case("translated_string", NodeType::TranslatedString)
      .Case("simple_expansion", NodeType::SimpleExpansion)
      .Case("expansion", NodeType::Expansion)
      .Case("command_substitution", NodeType::CommandSubstitution)
      .Case("arithmetic_expansion", NodeType::ArithmeticExpansion)
      .Case("process_substitution", NodeType::ProcessSubstitution)
      .Case("concatenation", NodeType::Concatenation)
      .Case("variable_assignment", NodeType::VariableAssignment)
      .Case("variable_assignments", NodeType::VariableAssignments)
      .Case("variable_name", NodeType::VariableName)
      .Case("number", NodeType::Number)
      .Case("array", NodeType::Array)
      .Case("file_redirect", NodeType::FileRedirect)
      .Case("heredoc_redirect", NodeType::HeredocRedirect)
      .Case("heredoc_start", NodeType::HeredocStart)
      .Case("heredoc_body", NodeType::HeredocBody)
      .Case("heredoc_end", NodeType::HeredocEnd)
      .Case("herestring_redirect", NodeType::HerestringRedirect)
      .Case("file_descriptor", NodeType::FileDescriptor)
      .Case("pipeline", NodeType::Pipeline)
      .Case("list", NodeType::List)
      .Case("negated_command", NodeType::NegatedCommand)
      .Case("redirected_statement", NodeType::RedirectedStatement)
      .Case("subshell", NodeType::Subshell)
      .Case("compound_statement", NodeType::CompoundStatement)
      .Case("if_statement", NodeType::IfStatement)
      .Case("elif_clause", NodeType::ElifClause)
      .Case("else_clause", NodeType::ElseClause)
      .Case("for_statement", NodeType::ForStatement)
      .Case("c_style_for_statement", NodeType::CStyleForStatement)
      .Case("while_statement", NodeType::WhileStatement)
      .Case("until_statement", NodeType::UntilStatement)
      .Case("case_statement", NodeType::CaseStatement)
      .Case("case_item", NodeType::CaseItem)
      .Case("do_group", NodeType::DoGroup)
      .Case("function_definition", NodeType::FunctionDefinition)
      .Case("test_command", NodeType::TestCommand)
      .Case("declaration_command", NodeType::DeclarationCommand)
      .Case("unset_command", NodeType::UnsetCommand)
      .Case("ERROR", NodeType::Error)
      .Default(NodeType::Unknown);
}

llvm::StringRef nodeTypeName(NodeType type) noexcept {
  switch (type) {
  case NodeType::Program:
    return "program";
  case NodeType::Comment:
    return "comment";
  case NodeType::Command:
    return "command";
  case NodeType::CommandName:
    return "command_name";
  case NodeType::Word:
    return "word";
  case NodeType::String:
    return "string";
  case NodeType::StringContent:
    return "string_content";
  case NodeType::RawString:
    return "raw_string";
  case NodeType::AnsiCString:
    return "ansi_c_string";
  case NodeType::TranslatedString:
    return "translated_string";
  case NodeType::SimpleExpansion:
    return "simple_expansion";
  case NodeType::Expansion:
    return "expansion";
  case NodeType::CommandSubstitution:
    return "command_substitution";
  case NodeType::ArithmeticExpansion:
    return "arithmetic_expansion";
  case NodeType::ProcessSubstitution:
    return "process_substitution";
  case NodeType::Concatenation:
    return "concatenation";
  case NodeType::VariableAssignment:
    return "variable_assignment";
  case NodeType::VariableAssignments:
    return "variable_assignments";
  case NodeType::VariableName:
    return "variable_name";
  case NodeType::Number:
    return "number";
  case NodeType::Array:
    return "array";
  case NodeType::FileRedirect:
    return "file_redirect";
  case NodeType::HeredocRedirect:
    return "heredoc_redirect";
  case NodeType::HeredocStart:
    return "heredoc_start";
  case NodeType::HeredocBody:
    return "heredoc_body";
  case NodeType::HeredocEnd:
    return "heredoc_end";
  case NodeType::HerestringRedirect:
    return "herestring_redirect";
  case NodeType::FileDescriptor:
    return "file_descriptor";
  case NodeType::Pipeline:
    return "pipeline";
  case NodeType::List:
    return "list";
  case NodeType::NegatedCommand:
    return "negated_command";
  case NodeType::RedirectedStatement:
    return "redirected_statement";
  case NodeType::Subshell:
    return "subshell";
  case NodeType::CompoundStatement:
    return "compound_statement";
  case NodeType::IfStatement:
    return "if_statement";
  case NodeType::ElifClause:
    return "elif_clause";
  case NodeType::ElseClause:
    return "else_clause";
  case NodeType::ForStatement:
    return "for_statement";
  case NodeType::CStyleForStatement:
    return "c_style_for_statement";
  case NodeType::WhileStatement:
    return "while_statement";
  case NodeType::UntilStatement:
    return "until_statement";
  case NodeType::CaseStatement:
    return "case_statement";
  case NodeType::CaseItem:
    return "case_item";
  case NodeType::DoGroup:
    return "do_group";
  case NodeType::FunctionDefinition:
    return "function_definition";
  case NodeType::TestCommand:
    return "test_command";
  case NodeType::DeclarationCommand:
    return "declaration_command";
  case NodeType::UnsetCommand:
    return "unset_command";
  case NodeType::Error:
    return "ERROR";
  case NodeType::Unknown:
    return "unknown";
  }
  return "unknown";
}

NodeCategory getNodeCategory(NodeType type) noexcept {
  switch (type) {
  case NodeType::IfStatement:
  case NodeType::ForStatement:
  case NodeType::WhileStatement:
  case NodeType::UntilStatement:
  case NodeType::CaseStatement:
    return NodeCategory::Compound;
  case NodeType::Command:
  case NodeType::VariableAssignment:
  case NodeType::VariableAssignments:
  case NodeType::Pipeline:
  case NodeType::List:
  case NodeType::NegatedCommand:
  case NodeType::RedirectedStatement:
  case NodeType::Subshell:
  case NodeType::CompoundStatement:
  case NodeType::CStyleForStatement:
  case NodeType::FunctionDefinition:
  case NodeType::TestCommand:
  case NodeType::DeclarationCommand:
  case NodeType::UnsetCommand:
    return NodeCategory::Statement;
  case NodeType::ElifClause:
  case NodeType::ElseClause:
  case NodeType::CaseItem:
  case NodeType::DoGroup:
    return NodeCategory::Clause;
  case NodeType::CommandName:
  case NodeType::Word:
  case NodeType::String:
  case NodeType::StringContent:
  case NodeType::RawString:
  case NodeType::AnsiCString:
  case NodeType::TranslatedString:
  case NodeType::SimpleExpansion:
  case NodeType::Expansion:
  case NodeType::CommandSubstitution:
  case NodeType::ArithmeticExpansion:
  case NodeType::ProcessSubstitution:
  case NodeType::Concatenation:
  case NodeType::VariableName:
  case NodeType::Number:
  case NodeType::Array:
    return NodeCategory::Word;
  case NodeType::FileRedirect:
  case NodeType::HeredocRedirect:
  case NodeType::HeredocStart:
  case NodeType::HeredocBody:
  case NodeType::HeredocEnd:
  case NodeType::HerestringRedirect:
  case NodeType::FileDescriptor:
    return NodeCategory::Redirect;
  default:
    return NodeCategory::Other;
  }
}

bool isCompoundStatement(NodeType type) noexcept {
  return getNodeCategory(type) == NodeCategory::Compound;
}

bool isExecutableStatement(NodeType type) noexcept {
  const NodeCategory category = getNodeCategory(type);
  return category == NodeCategory::Statement ||
         category == NodeCategory::Compound;
}

llvm::StringRef compoundOpener(NodeType type) noexcept {
  switch (type) {
  case NodeType::IfStatement:
    return "if";
  case NodeType::ForStatement:
    return "for";
  case NodeType::WhileStatement:
    return "while";
  case NodeType::UntilStatement:
    return "until";
  case NodeType::CaseStatement:
    return "case";
  default:
    return "unknown";
  }
}

llvm::StringRef compoundCloser(NodeType type) noexcept {
  switch (type) {
  case NodeType::IfStatement:
    return "fi";
  case NodeType::ForStatement:
  case NodeType::WhileStatement:
  case NodeType::UntilStatement:
    return "done";
  case NodeType::CaseStatement:
    return "esac";
  default:
    return "unknown";
  }
}

} // namespace incsh

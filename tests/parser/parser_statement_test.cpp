#include "parser_test_helper.hpp"

using namespace incsh;

// ============== Simple Command Tests ==============

TEST(ParserTest, SimpleCommand) {
  auto tree = parseOrFail("echo hello world");
  ASSERT_NE(tree, nullptr);
  EXPECT_FALSE(tree->hasError);
  const Node* command = firstStatement(*tree, NodeType::Command);
  ASSERT_NE(command, nullptr);

  const Node* name = command->childByField("name");
  ASSERT_NE(name, nullptr);
  EXPECT_EQ(name->type, NodeType::CommandName);
  EXPECT_EQ(name->text, "echo");

  const auto arguments = command->childrenByField("argument");
  ASSERT_EQ(arguments.size(), 2u);
  EXPECT_EQ(arguments[0]->text, "hello");
  EXPECT_EQ(arguments[1]->text, "world");
  EXPECT_EQ(arguments[1]->type, NodeType::Word);
}

TEST(ParserTest, StatementRangesExcludeTerminators) {
  auto tree = parseOrFail("echo one;\necho two\n");
  ASSERT_NE(tree, nullptr);
  ASSERT_EQ(tree->statements().size(), 2u);
  const Node& first = *tree->statements()[0];
  const Node& second = *tree->statements()[1];
  EXPECT_EQ(first.text, "echo one");
  EXPECT_EQ(first.range.start, (Point{0, 0}));
  EXPECT_EQ(first.range.end, (Point{0, 8}));
  EXPECT_EQ(second.text, "echo two");
  EXPECT_EQ(second.range.start.row, 1);
  EXPECT_EQ(second.range.end.row, 1);
}

TEST(ParserTest, SeveralStatementsOnOneLine) {
  auto tree = parseOrFail("cd /tmp; ls -l & wait");
  ASSERT_NE(tree, nullptr);
  ASSERT_EQ(tree->statements().size(), 3u);
  EXPECT_EQ(tree->statements()[1]->text, "ls -l");
  EXPECT_EQ(tree->statements()[2]->text, "wait");
}

// ============== Pipeline and List Tests ==============

TEST(ParserTest, Pipeline) {
  auto tree = parseOrFail("ls | grep x");
  ASSERT_NE(tree, nullptr);
  const Node* pipeline = firstStatement(*tree, NodeType::Pipeline);
  ASSERT_NE(pipeline, nullptr);
  ASSERT_EQ(pipeline->children.size(), 2u);
  for (const auto& stage : pipeline->children) {
    EXPECT_EQ(stage->type, NodeType::Command);
  }
}

TEST(ParserTest, LongPipelineIsOneStatement) {
  auto tree = parseOrFail("ls | grep x | wc -l\n");
  ASSERT_NE(tree, nullptr);
  ASSERT_EQ(tree->statements().size(), 1u);
  EXPECT_EQ(tree->statements()[0]->type, NodeType::Pipeline);
  EXPECT_EQ(tree->statements()[0]->text, "ls | grep x | wc -l");
}

TEST(ParserTest, AndOrListIsLeftAssociative) {
  auto tree = parseOrFail("a && b || c");
  ASSERT_NE(tree, nullptr);
  const Node* list = firstStatement(*tree, NodeType::List);
  ASSERT_NE(list, nullptr);
  ASSERT_EQ(list->children.size(), 2u);
  EXPECT_EQ(list->children[0]->type, NodeType::List);
  EXPECT_EQ(list->children[0]->text, "a && b");
  EXPECT_EQ(list->children[1]->text, "c");
}

TEST(ParserTest, ListContinuesAfterNewline) {
  auto tree = parseOrFail("true &&\n  echo ok\n");
  ASSERT_NE(tree, nullptr);
  EXPECT_FALSE(tree->hasError);
  ASSERT_EQ(tree->statements().size(), 1u);
  EXPECT_EQ(tree->statements()[0]->range.end.row, 1);
}

TEST(ParserTest, NegatedCommand) {
  auto tree = parseOrFail("! grep -q x file");
  ASSERT_NE(tree, nullptr);
  const Node* negated = firstStatement(*tree, NodeType::NegatedCommand);
  ASSERT_NE(negated, nullptr);
  ASSERT_EQ(negated->children.size(), 1u);
  EXPECT_EQ(negated->children[0]->type, NodeType::Command);
}

// ============== Assignment Tests ==============

TEST(ParserTest, SingleAssignment) {
  auto tree = parseOrFail("NAME=value");
  ASSERT_NE(tree, nullptr);
  const Node* assignment = firstStatement(*tree, NodeType::VariableAssignment);
  ASSERT_NE(assignment, nullptr);
  EXPECT_EQ(assignment->childByField("name")->text, "NAME");
  EXPECT_EQ(assignment->childByField("value")->text, "value");
}

TEST(ParserTest, AssignmentPrefixOnCommand) {
  auto tree = parseOrFail("LANG=C sort file");
  ASSERT_NE(tree, nullptr);
  const Node* command = firstStatement(*tree, NodeType::Command);
  ASSERT_NE(command, nullptr);
  EXPECT_EQ(command->children[0]->type, NodeType::VariableAssignment);
  EXPECT_EQ(command->childByField("name")->text, "sort");
}

TEST(ParserTest, EmptyAssignment) {
  auto tree = parseOrFail("EMPTY=");
  ASSERT_NE(tree, nullptr);
  const Node* assignment = firstStatement(*tree, NodeType::VariableAssignment);
  ASSERT_NE(assignment, nullptr);
  EXPECT_EQ(assignment->childByField("value"), nullptr);
}

TEST(ParserTest, ArrayAssignment) {
  auto tree = parseOrFail("arr=(one two three)");
  ASSERT_NE(tree, nullptr);
  const Node* assignment = firstStatement(*tree, NodeType::VariableAssignment);
  ASSERT_NE(assignment, nullptr);
  const Node* value = assignment->childByField("value");
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(value->type, NodeType::Array);
  EXPECT_EQ(value->children.size(), 3u);
}

TEST(ParserTest, DeclarationCommand) {
  auto tree = parseOrFail("export -n PATH=/bin HOME");
  ASSERT_NE(tree, nullptr);
  const Node* declaration =
      firstStatement(*tree, NodeType::DeclarationCommand);
  ASSERT_NE(declaration, nullptr);
  ASSERT_EQ(declaration->children.size(), 3u);
  EXPECT_EQ(declaration->children[0]->type, NodeType::Word);
  EXPECT_EQ(declaration->children[1]->type, NodeType::VariableAssignment);
  EXPECT_EQ(declaration->children[2]->type, NodeType::VariableName);
}

TEST(ParserTest, UnsetCommand) {
  auto tree = parseOrFail("unset A B");
  ASSERT_NE(tree, nullptr);
  const Node* unset = firstStatement(*tree, NodeType::UnsetCommand);
  ASSERT_NE(unset, nullptr);
  EXPECT_EQ(unset->children.size(), 2u);
}

// ============== Word Tests ==============

TEST(ParserTest, StringWithExpansion) {
  auto tree = parseOrFail("echo \"hi $USER\"");
  ASSERT_NE(tree, nullptr);
  const Node* argument =
      firstStatement(*tree, NodeType::Command)->childByField("argument");
  ASSERT_NE(argument, nullptr);
  EXPECT_EQ(argument->type, NodeType::String);
  const Node* expansion = findFirst(*argument, [](const Node& node) {
    return node.type == NodeType::SimpleExpansion;
  });
  ASSERT_NE(expansion, nullptr);
  ASSERT_EQ(expansion->children.size(), 1u);
  EXPECT_EQ(expansion->children[0]->type, NodeType::VariableName);
  EXPECT_EQ(expansion->children[0]->text, "USER");
}

TEST(ParserTest, RawAndAnsiCStrings) {
  auto tree = parseOrFail("printf '%s' $'a\\tb'");
  ASSERT_NE(tree, nullptr);
  const auto arguments =
      firstStatement(*tree, NodeType::Command)->childrenByField("argument");
  ASSERT_EQ(arguments.size(), 2u);
  EXPECT_EQ(arguments[0]->type, NodeType::RawString);
  EXPECT_EQ(arguments[1]->type, NodeType::AnsiCString);
}

TEST(ParserTest, Concatenation) {
  auto tree = parseOrFail("echo pre${name}post");
  ASSERT_NE(tree, nullptr);
  const Node* argument =
      firstStatement(*tree, NodeType::Command)->childByField("argument");
  ASSERT_NE(argument, nullptr);
  EXPECT_EQ(argument->type, NodeType::Concatenation);
  ASSERT_EQ(argument->children.size(), 3u);
  EXPECT_EQ(argument->children[1]->type, NodeType::Expansion);
}

TEST(ParserTest, CommandSubstitutionIsParsed) {
  auto tree = parseOrFail("echo $(ls | wc -l)");
  ASSERT_NE(tree, nullptr);
  const Node* argument =
      firstStatement(*tree, NodeType::Command)->childByField("argument");
  ASSERT_NE(argument, nullptr);
  EXPECT_EQ(argument->type, NodeType::CommandSubstitution);
  ASSERT_EQ(argument->children.size(), 1u);
  EXPECT_EQ(argument->children[0]->type, NodeType::Pipeline);
}

TEST(ParserTest, BacktickSubstitution) {
  auto tree = parseOrFail("echo `date`");
  ASSERT_NE(tree, nullptr);
  EXPECT_TRUE(containsType(*tree->root, NodeType::CommandSubstitution));
}

TEST(ParserTest, ArithmeticAndProcessSubstitution) {
  auto tree = parseOrFail("diff <(echo $((1 + 2))) file");
  ASSERT_NE(tree, nullptr);
  EXPECT_TRUE(containsType(*tree->root, NodeType::ProcessSubstitution));
  EXPECT_TRUE(containsType(*tree->root, NodeType::ArithmeticExpansion));
}

// ============== Redirect Tests ==============

TEST(ParserTest, FileRedirects) {
  auto tree = parseOrFail("make > build.log 2>&1");
  ASSERT_NE(tree, nullptr);
  const Node* redirected =
      firstStatement(*tree, NodeType::RedirectedStatement);
  ASSERT_NE(redirected, nullptr);
  EXPECT_EQ(redirected->childByField("body")->type, NodeType::Command);
  const auto redirects = redirected->childrenByField("redirect");
  ASSERT_EQ(redirects.size(), 2u);
  EXPECT_EQ(redirects[0]->type, NodeType::FileRedirect);
  EXPECT_EQ(redirects[0]->childByField("destination")->text, "build.log");
  EXPECT_EQ(redirects[1]->childByField("descriptor")->text, "2");
  EXPECT_EQ(redirects[1]->childByField("destination")->text, "1");
}

TEST(ParserTest, Heredoc) {
  auto tree = parseOrFail("cat <<EOF\nbody line\nEOF\necho next\n");
  ASSERT_NE(tree, nullptr);
  EXPECT_FALSE(tree->hasError);
  ASSERT_EQ(tree->statements().size(), 2u);

  const Node& statement = *tree->statements()[0];
  EXPECT_EQ(statement.type, NodeType::RedirectedStatement);
  EXPECT_EQ(statement.range.end.row, 2);

  const Node* redirect = statement.childByField("redirect");
  ASSERT_NE(redirect, nullptr);
  EXPECT_EQ(redirect->type, NodeType::HeredocRedirect);
  EXPECT_TRUE(containsType(*redirect, NodeType::HeredocStart));
  EXPECT_TRUE(containsType(*redirect, NodeType::HeredocBody));
  EXPECT_TRUE(containsType(*redirect, NodeType::HeredocEnd));

  EXPECT_EQ(tree->statements()[1]->text, "echo next");
  EXPECT_EQ(tree->statements()[1]->range.start.row, 3);
}

TEST(ParserTest, Herestring) {
  auto tree = parseOrFail("tr a-z A-Z <<< hello");
  ASSERT_NE(tree, nullptr);
  const Node* redirect =
      firstStatement(*tree, NodeType::RedirectedStatement)
          ->childByField("redirect");
  ASSERT_NE(redirect, nullptr);
  EXPECT_EQ(redirect->type, NodeType::HerestringRedirect);
}

TEST(ParserTest, RedirectedCompoundStatement) {
  auto tree = parseOrFail("(cd /tmp; ls) > listing");
  ASSERT_NE(tree, nullptr);
  const Node* redirected =
      firstStatement(*tree, NodeType::RedirectedStatement);
  ASSERT_NE(redirected, nullptr);
  EXPECT_EQ(redirected->childByField("body")->type, NodeType::Subshell);
  EXPECT_EQ(redirected->childByField("redirect")->type, NodeType::FileRedirect);
}

TEST(ParserTest, ShiftInsideArithmeticIsNotAHeredoc) {
  auto tree = parseOrFail("((x<<2))\necho a\n");
  ASSERT_NE(tree, nullptr);
  EXPECT_FALSE(tree->hasError);
  EXPECT_FALSE(containsType(*tree->root, NodeType::HeredocRedirect));
  ASSERT_EQ(tree->statements().size(), 2u);
  EXPECT_EQ(tree->statements()[0]->text, "((x<<2))");
  EXPECT_EQ(tree->statements()[1]->text, "echo a");
}

// ============== Grouping and Function Tests ==============

TEST(ParserTest, BraceGroup) {
  auto tree = parseOrFail("{ echo a; echo b; }");
  ASSERT_NE(tree, nullptr);
  const Node* group = firstStatement(*tree, NodeType::CompoundStatement);
  ASSERT_NE(group, nullptr);
  EXPECT_EQ(group->children.size(), 2u);
}

TEST(ParserTest, FunctionDefinition) {
  auto tree = parseOrFail("greet() {\n  echo hi\n}");
  ASSERT_NE(tree, nullptr);
  const Node* function = firstStatement(*tree, NodeType::FunctionDefinition);
  ASSERT_NE(function, nullptr);
  EXPECT_EQ(function->childByField("name")->text, "greet");
  EXPECT_EQ(function->childByField("body")->type, NodeType::CompoundStatement);
}

TEST(ParserTest, FunctionKeyword) {
  auto tree = parseOrFail("function cleanup { rm -f tmp; }");
  ASSERT_NE(tree, nullptr);
  const Node* function = firstStatement(*tree, NodeType::FunctionDefinition);
  ASSERT_NE(function, nullptr);
  EXPECT_EQ(function->childByField("name")->text, "cleanup");
}

TEST(ParserTest, TestCommands) {
  auto tree = parseOrFail("[[ -f a && -d b ]]\n[ -z \"$x\" ]");
  ASSERT_NE(tree, nullptr);
  ASSERT_EQ(tree->statements().size(), 2u);
  EXPECT_EQ(tree->statements()[0]->type, NodeType::TestCommand);
  EXPECT_EQ(tree->statements()[1]->type, NodeType::TestCommand);
}

// ============== Comment Tests ==============

TEST(ParserTest, CommentsBetweenStatements) {
  auto tree = parseOrFail("# header\necho a # trailing\n");
  ASSERT_NE(tree, nullptr);
  ASSERT_EQ(tree->statements().size(), 3u);
  EXPECT_EQ(tree->statements()[0]->type, NodeType::Comment);
  EXPECT_EQ(tree->statements()[0]->text, "# header");
  EXPECT_EQ(tree->statements()[1]->type, NodeType::Command);
  EXPECT_EQ(tree->statements()[2]->type, NodeType::Comment);
  EXPECT_EQ(tree->statements()[2]->text, "# trailing");
}

TEST(ParserTest, CommentInsideCompoundIsNotTopLevel) {
  auto tree = parseOrFail("if true; then\n  # inside\n  echo\nfi\n");
  ASSERT_NE(tree, nullptr);
  ASSERT_EQ(tree->statements().size(), 1u);
  EXPECT_EQ(tree->statements()[0]->type, NodeType::IfStatement);
}

// ============== Edge Cases ==============

TEST(ParserTest, EmptyInput) {
  auto tree = parseOrFail("");
  ASSERT_NE(tree, nullptr);
  EXPECT_TRUE(tree->statements().empty());
  EXPECT_FALSE(tree->hasError);
  EXPECT_EQ(tree->root->type, NodeType::Program);
}

TEST(ParserTest, WhitespaceOnlyInput) {
  auto tree = parseOrFail("   \n\t  \n");
  ASSERT_NE(tree, nullptr);
  EXPECT_TRUE(tree->statements().empty());
  EXPECT_FALSE(tree->hasError);
}

TEST(ParserTest, ProgramSpansWholeText) {
  const std::string source = "echo a\n\n";
  auto tree = parseOrFail(source);
  ASSERT_NE(tree, nullptr);
  EXPECT_EQ(tree->root->range.startByte, 0u);
  EXPECT_EQ(tree->root->range.endByte, source.size());
  EXPECT_EQ(tree->root->range.end.row, 2);
}

#include <gtest/gtest.h>

#include "parser/node_types.hpp"

#include <string>

using namespace incsh;

// ============== Kind Mapping Tests ==============

TEST(NodeTypesTest, KindRoundTripsThroughName) {
  for (int i = static_cast<int>(NodeType::Program);
       i < static_cast<int>(NodeType::Unknown); ++i) {
    const auto type = static_cast<NodeType>(i);
    const llvm::StringRef name = nodeTypeName(type);
    EXPECT_EQ(nodeTypeFromKind(name), type) << name.str();
  }
}

TEST(NodeTypesTest, UnrecognizedKindIsUnknown) {
  EXPECT_EQ(nodeTypeFromKind("select_statement"), NodeType::Unknown);
  EXPECT_EQ(nodeTypeFromKind(""), NodeType::Unknown);
  EXPECT_EQ(nodeTypeFromKind("Command"), NodeType::Unknown);
  EXPECT_EQ(nodeTypeName(NodeType::Unknown), "unknown");
}

TEST(NodeTypesTest, ErrorKindIsUpperCase) {
  EXPECT_EQ(nodeTypeFromKind("ERROR"), NodeType::Error);
  EXPECT_EQ(nodeTypeName(NodeType::Error), "ERROR");
  EXPECT_EQ(nodeTypeFromKind("error"), NodeType::Unknown);
}

// ============== Category Tests ==============

TEST(NodeTypesTest, Categories) {
  EXPECT_EQ(getNodeCategory(NodeType::CaseStatement), NodeCategory::Compound);
  EXPECT_EQ(getNodeCategory(NodeType::Pipeline), NodeCategory::Statement);
  EXPECT_EQ(getNodeCategory(NodeType::CStyleForStatement),
            NodeCategory::Statement);
  EXPECT_EQ(getNodeCategory(NodeType::DoGroup), NodeCategory::Clause);
  EXPECT_EQ(getNodeCategory(NodeType::Concatenation), NodeCategory::Word);
  EXPECT_EQ(getNodeCategory(NodeType::HeredocBody), NodeCategory::Redirect);
  EXPECT_EQ(getNodeCategory(NodeType::Comment), NodeCategory::Other);
  EXPECT_EQ(getNodeCategory(NodeType::Program), NodeCategory::Other);
}

TEST(NodeTypesTest, CompoundStatements) {
  EXPECT_TRUE(isCompoundStatement(NodeType::IfStatement));
  EXPECT_TRUE(isCompoundStatement(NodeType::ForStatement));
  EXPECT_TRUE(isCompoundStatement(NodeType::WhileStatement));
  EXPECT_TRUE(isCompoundStatement(NodeType::UntilStatement));
  EXPECT_TRUE(isCompoundStatement(NodeType::CaseStatement));
  EXPECT_FALSE(isCompoundStatement(NodeType::CompoundStatement));
  EXPECT_FALSE(isCompoundStatement(NodeType::Subshell));
  EXPECT_FALSE(isCompoundStatement(NodeType::Command));
}

TEST(NodeTypesTest, ExecutableStatements) {
  EXPECT_TRUE(isExecutableStatement(NodeType::Command));
  EXPECT_TRUE(isExecutableStatement(NodeType::VariableAssignment));
  EXPECT_TRUE(isExecutableStatement(NodeType::FunctionDefinition));
  EXPECT_TRUE(isExecutableStatement(NodeType::IfStatement));
  EXPECT_FALSE(isExecutableStatement(NodeType::Comment));
  EXPECT_FALSE(isExecutableStatement(NodeType::Error));
  EXPECT_FALSE(isExecutableStatement(NodeType::Unknown));
  EXPECT_FALSE(isExecutableStatement(NodeType::Word));
}

// ============== Opener and Closer Tests ==============

TEST(NodeTypesTest, OpenersAndClosers) {
  EXPECT_EQ(compoundOpener(NodeType::IfStatement), "if");
  EXPECT_EQ(compoundCloser(NodeType::IfStatement), "fi");
  EXPECT_EQ(compoundOpener(NodeType::ForStatement), "for");
  EXPECT_EQ(compoundCloser(NodeType::ForStatement), "done");
  EXPECT_EQ(compoundOpener(NodeType::WhileStatement), "while");
  EXPECT_EQ(compoundCloser(NodeType::WhileStatement), "done");
  EXPECT_EQ(compoundOpener(NodeType::UntilStatement), "until");
  EXPECT_EQ(compoundCloser(NodeType::UntilStatement), "done");
  EXPECT_EQ(compoundOpener(NodeType::CaseStatement), "case");
  EXPECT_EQ(compoundCloser(NodeType::CaseStatement), "esac");
}

TEST(NodeTypesTest, NonCompoundHasUnknownKeywords) {
  EXPECT_EQ(compoundOpener(NodeType::Pipeline), "unknown");
  EXPECT_EQ(compoundCloser(NodeType::Pipeline), "unknown");
  EXPECT_EQ(compoundCloser(NodeType::CompoundStatement), "unknown");
}

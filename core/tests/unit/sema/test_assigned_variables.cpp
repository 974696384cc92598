// tests/sema/test_assigned_variables.cpp - Pre-pass assignment index
//
#include <gtest/gtest.h>

#include "flowan/sema/flow/assigned_variables.hpp"
#include "flowan/test_support/flow_harness.hpp"

using namespace flowan;

namespace
{

class AssignedVariablesTest : public ::testing::Test
{
protected:
  FlowHarness h;
  AstBuilder & b = h.b;

  VariableDecl * x = b.var("x", "int");
  VariableDecl * y = b.var("y", "int");
};

}  // namespace

TEST_F(AssignedVariablesTest, WritesAreAttributedToEnclosingStatements)
{
  auto * inner = b.expr(b.assign(x, b.int_lit(1)));
  auto * loop = b.while_(b.boolean(true), b.block({inner}));
  auto * other = b.expr(b.assign(y, b.int_lit(2)));
  auto * fn = b.function("f", {}, "void", b.block({b.decl({x, y}), loop, other}));

  const AssignedVariables index = AssignedVariables::compute(*fn);

  EXPECT_TRUE(index.is_assigned(loop, x));
  EXPECT_FALSE(index.is_assigned(loop, y));
  EXPECT_TRUE(index.is_assigned(inner, x));
  EXPECT_TRUE(index.is_assigned(other, y));
  EXPECT_TRUE(index.is_assigned(fn, x));
  EXPECT_TRUE(index.is_assigned(fn, y));
  EXPECT_EQ(index.written_anywhere().size(), 2u);
  EXPECT_TRUE(index.captured_anywhere().empty());
}

TEST_F(AssignedVariablesTest, DeclarationInitializerIsNotAWrite)
{
  auto * z = b.var_init("z", "int", b.int_lit(0));
  auto * fn = b.function("f", {}, "void", b.block({b.decl({z})}));

  const AssignedVariables index = AssignedVariables::compute(*fn);
  EXPECT_TRUE(index.written_anywhere().empty());
}

TEST_F(AssignedVariablesTest, ClosureWritesToOuterVariablesAreCaptured)
{
  auto * local = b.var("local", "int");
  auto * closure = b.closure(
    {}, b.block({b.decl({local}), b.expr(b.assign(local, b.int_lit(1))),
                 b.expr(b.assign(x, b.int_lit(2)))}));
  auto * holder = b.expr(closure);
  auto * fn = b.function("f", {x}, "void", b.block({holder}));

  const AssignedVariables index = AssignedVariables::compute(*fn);

  EXPECT_TRUE(index.is_captured(closure, x));
  EXPECT_TRUE(index.is_captured(holder, x));
  EXPECT_TRUE(index.is_captured(fn, x));
  EXPECT_FALSE(index.is_captured(closure, local));
  EXPECT_TRUE(index.is_assigned(closure, local));
  EXPECT_EQ(index.captured_anywhere().count(x), 1u);
  EXPECT_EQ(index.captured_anywhere().count(local), 0u);
  EXPECT_EQ(index.written_anywhere().size(), 2u);
}

TEST_F(AssignedVariablesTest, CatchAndSwitchCaseAreIndexed)
{
  auto * clause = b.catch_(b.block({b.expr(b.assign(x, b.int_lit(0)))}));
  auto * t = b.try_(b.block({b.expr(b.assign(y, b.int_lit(1)))}));
  b.set_catches(t, {clause});

  auto * group = b.case_({b.int_lit(1)}, {b.expr(b.assign(y, b.int_lit(3)))});
  auto * sw = b.switch_(b.int_lit(1));
  b.set_cases(sw, {group});

  auto * fn = b.function("f", {}, "void", b.block({b.decl({x, y}), t, sw}));
  const AssignedVariables index = AssignedVariables::compute(*fn);

  EXPECT_TRUE(index.is_assigned(clause, x));
  EXPECT_FALSE(index.is_assigned(clause, y));
  EXPECT_TRUE(index.is_assigned(t->body, y));
  EXPECT_FALSE(index.is_assigned(t->body, x));
  EXPECT_TRUE(index.is_assigned(group, y));
  EXPECT_TRUE(index.is_assigned(sw, y));
}

TEST_F(AssignedVariablesTest, UnknownNodeHasEmptySets)
{
  auto * fn = b.function("f", {}, "void", b.block({}));
  const AssignedVariables index = AssignedVariables::compute(*fn);
  auto * stray = b.expr(b.int_lit(0));

  EXPECT_TRUE(index.written(stray).empty());
  EXPECT_TRUE(index.captured(stray).empty());
  EXPECT_TRUE(index.written(nullptr).empty());
}

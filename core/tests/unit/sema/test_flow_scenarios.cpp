// tests/sema/test_flow_scenarios.cpp - End-to-end flow analysis of small functions
//
#include <gtest/gtest.h>

#include <cstdlib>
#include <iostream>

#include "flowan/sema/flow/flow_json.hpp"
#include "flowan/test_support/flow_harness.hpp"

using namespace flowan;

namespace
{

void dump_if_debug(const FlowResults & r, const FunctionDecl & fn)
{
  if (std::getenv("FLOWAN_TEST_DEBUG") != nullptr) {
    std::cerr << to_json(r, fn).dump(2) << "\n";
  }
}

}  // namespace

// ============================================================================
// Null Checks
// ============================================================================

// int stringLength(String? s) { if (s != null) return s.length; return 0; }
TEST(FlowScenarios, NullCheckPromotesInsideThenBranch)
{
  FlowHarness h;
  auto & b = h.b;
  auto * s = b.var("s", "String?");
  auto * cond_ref = b.ref(s);
  auto * use_ref = b.ref(s);
  auto * fn = b.function(
    "stringLength", {s}, "int",
    b.block({
      b.if_(b.ne(cond_ref, b.null()), b.ret(b.prop(use_ref, "length"))),
      b.ret(b.int_lit(0)),
    }));

  const FlowResults r = h.run(fn);
  dump_if_debug(r, *fn);

  EXPECT_TRUE(h.diags.empty());
  EXPECT_EQ(FlowHarness::read_type(r, cond_ref), b.type("String?"));
  EXPECT_EQ(FlowHarness::read_type(r, use_ref), b.type("String"));
  ASSERT_NE(r.read(use_ref), nullptr);
  EXPECT_EQ(r.read(use_ref)->promoted_type, b.type("String"));
  EXPECT_FALSE(r.exit_reachable);
  ASSERT_EQ(r.exits.size(), 2u);
  EXPECT_EQ(r.exits[1].type, b.type("int"));
}

TEST(FlowScenarios, FallingOffNonNullableReturnIsReported)
{
  FlowHarness h;
  auto & b = h.b;
  auto * s = b.var("s", "String?");
  auto * fn = b.function(
    "stringLength", {s}, "int",
    b.block({
      b.if_(b.ne(b.ref(s), b.null()), b.ret(b.prop(b.ref(s), "length"))),
    }));

  const FlowResults r = h.run(fn);

  EXPECT_EQ(h.count(DiagCode::MissingReturn), 1u);
  EXPECT_EQ(h.diags.size(), 1u);
  EXPECT_TRUE(r.exit_reachable);
  const FunctionFlow * summary = r.function(fn);
  ASSERT_NE(summary, nullptr);
  EXPECT_TRUE(summary->missing_return);
  EXPECT_EQ(h.diags.with_code(DiagCode::MissingReturn)[0].primary_range(), fn->get_range());
}

// ============================================================================
// Definite Assignment
// ============================================================================

// int f(bool flag) { String s; if (flag) { s = "x"; } return s.length; }
TEST(FlowScenarios, AssignmentOnOneBranchIsNotDefinite)
{
  FlowHarness h;
  auto & b = h.b;
  auto * flag = b.var("flag", "bool");
  auto * s = b.var("s", "String");
  auto * read = b.ref(s);
  auto * fn = b.function(
    "f", {flag}, "int",
    b.block({
      b.decl({s}),
      b.if_(b.ref(flag), b.block({b.expr(b.assign(s, b.str("x")))})),
      b.ret(b.prop(read, "length")),
    }));

  const FlowResults r = h.run(fn);

  ASSERT_EQ(h.count(DiagCode::PossiblyUnassigned), 1u);
  EXPECT_EQ(h.diags.with_code(DiagCode::PossiblyUnassigned)[0].primary_range(), read->get_range());
  const VariableReadInfo * info = r.read(read);
  ASSERT_NE(info, nullptr);
  EXPECT_FALSE(info->assigned);
  EXPECT_FALSE(info->unassigned);
  EXPECT_TRUE(info->reachable);
}

TEST(FlowScenarios, AssignmentOnBothBranchesIsDefinite)
{
  FlowHarness h;
  auto & b = h.b;
  auto * flag = b.var("flag", "bool");
  auto * s = b.var("s", "String");
  auto * read = b.ref(s);
  auto * fn = b.function(
    "f", {flag}, "int",
    b.block({
      b.decl({s}),
      b.if_(
        b.ref(flag), b.block({b.expr(b.assign(s, b.str("x")))}),
        b.block({b.expr(b.assign(s, b.str("y")))})),
      b.ret(b.prop(read, "length")),
    }));

  const FlowResults r = h.run(fn);

  EXPECT_TRUE(h.diags.empty());
  ASSERT_NE(r.read(read), nullptr);
  EXPECT_TRUE(r.read(read)->assigned);
  EXPECT_FALSE(r.read(read)->unassigned);
}

// ============================================================================
// Unreachable Branches
// ============================================================================

// void f() { int? a = null; if (false && a != null) { a; } }
TEST(FlowScenarios, PromotionInsideUnreachableBranchIsStillComputed)
{
  FlowHarness h;
  auto & b = h.b;
  auto * a = b.var_init("a", "int?", b.null());
  auto * guarded = b.ref(a);
  auto * inner = b.ref(a);
  auto * body_stmt = b.expr(inner);
  auto * fn = b.function(
    "f", {}, "void",
    b.block({
      b.decl({a}),
      b.if_(b.and_(b.boolean(false), b.ne(guarded, b.null())), b.block({body_stmt})),
    }));

  const FlowResults r = h.run(fn);
  dump_if_debug(r, *fn);

  EXPECT_EQ(h.count(DiagCode::PossiblyUnassigned), 0u);
  ASSERT_EQ(h.count(DiagCode::DeadCode), 1u);
  EXPECT_EQ(h.diags.with_code(DiagCode::DeadCode)[0].primary_range(), body_stmt->get_range());

  const VariableReadInfo * info = r.read(inner);
  ASSERT_NE(info, nullptr);
  EXPECT_FALSE(info->reachable);
  EXPECT_EQ(info->current_type, b.type("int"));
  ASSERT_NE(r.read(guarded), nullptr);
  EXPECT_FALSE(r.read(guarded)->reachable);

  EXPECT_TRUE(r.exit_reachable);
}

// ============================================================================
// Determinism and Independence
// ============================================================================

TEST(FlowScenarios, RepeatedRunsProduceIdenticalDumps)
{
  FlowHarness h;
  auto & b = h.b;
  auto * x = b.var("x", "Object?");
  auto * y = b.var("y", "int");
  auto * loop = b.while_(
    b.is(b.ref(x), "int"),
    b.block({b.expr(b.assign(y, b.int_lit(1))), b.expr(b.assign(x, b.null()))}));
  auto * fn = b.function(
    "f", {x}, "int",
    b.block({
      b.decl({y}),
      loop,
      b.if_(b.eq(b.ref(x), b.null()), b.ret(b.int_lit(0))),
      b.ret(b.ref(y)),
    }));

  const FlowResults first = h.run(fn);
  const FlowResults second = h.run(fn);

  EXPECT_EQ(to_json(first, *fn), to_json(second, *fn));
  EXPECT_EQ(to_json(first, *fn).dump(), to_json(second, *fn).dump());
}

TEST(FlowScenarios, AnalyzerRunsAreIndependent)
{
  FlowHarness h;
  auto & b = h.b;
  auto * p = b.var("p", "int?");
  auto * read = b.ref(p);
  auto * guarded = b.function(
    "guarded", {p}, "int",
    b.block({b.if_(b.eq(b.ref(p), b.null()), b.ret(b.int_lit(0))), b.ret(read)}));

  auto * q = b.var("q", "int");
  auto * other = b.function("other", {}, "void", b.block({b.decl({q}), b.expr(b.ref(q))}));

  FlowAnalyzer shared(h.oracle, FlowOptions{}, &h.diags);
  const FlowResults alone = shared.analyze(*guarded);
  (void)shared.analyze(*other);
  const FlowResults again = shared.analyze(*guarded);

  EXPECT_EQ(to_json(alone, *guarded), to_json(again, *guarded));
  EXPECT_EQ(FlowHarness::read_type(again, read), b.type("int"));
  EXPECT_EQ(h.count(DiagCode::PossiblyUnassigned), 1u);
}

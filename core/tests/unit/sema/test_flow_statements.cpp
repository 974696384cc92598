// tests/sema/test_flow_statements.cpp - Loops, jumps, switch and exception handling
//
#include <gtest/gtest.h>

#include "flowan/test_support/flow_harness.hpp"

using namespace flowan;

namespace
{

class FlowStatementTest : public ::testing::Test
{
protected:
  FlowHarness h;
  AstBuilder & b = h.b;

  VariableDecl * c = b.var("c", "bool");

  FlowResults run(
    BlockStmt * body, std::string_view return_type = "void", FlowOptions options = {})
  {
    return h.run(b.function("f", {c}, return_type, body), options);
  }

  bool assigned_at(const FlowResults & r, const Expr * ref)
  {
    const VariableReadInfo * info = r.read(ref);
    return info != nullptr && info->assigned;
  }
};

}  // namespace

// ============================================================================
// While Loops
// ============================================================================

TEST_F(FlowStatementTest, LoopHeadDiscardsPromotionOfWrittenVariable)
{
  auto * x = b.var("x", "Object");
  auto * in_loop = b.ref(x);
  auto * f = b.function(
    "f", {c, x}, "void",
    b.block({b.if_(
      b.is(b.ref(x), "int"),
      b.while_(b.ref(c), b.block({b.expr(in_loop), b.expr(b.assign(x, b.str("s")))})))}));
  const FlowResults r = h.run(f);

  EXPECT_EQ(FlowHarness::read_type(r, in_loop), b.type("Object"));
}

TEST_F(FlowStatementTest, LoopHeadKeepsPromotionOfUnwrittenVariable)
{
  auto * x = b.var("x", "Object");
  auto * in_loop = b.ref(x);
  auto * f = b.function(
    "f", {c, x}, "void",
    b.block({b.if_(b.is(b.ref(x), "int"), b.while_(b.ref(c), b.block({b.expr(in_loop)})))}));
  const FlowResults r = h.run(f);

  EXPECT_EQ(FlowHarness::read_type(r, in_loop), b.type("int"));
}

TEST_F(FlowStatementTest, LoopConditionPromotesBody)
{
  auto * x = b.var("x", "int?");
  auto * in_body = b.ref(x);
  auto * after = b.ref(x);
  auto * f = b.function(
    "f", {x}, "void",
    b.block({
      b.while_(b.ne(b.ref(x), b.null()), b.block({b.expr(in_body)})),
      b.expr(after),
    }));
  const FlowResults r = h.run(f);

  EXPECT_EQ(FlowHarness::read_type(r, in_body), b.type("int"));
  EXPECT_EQ(FlowHarness::read_type(r, after), b.type("int?"));
}

TEST_F(FlowStatementTest, InfiniteLoopWithoutBreakNeverCompletes)
{
  auto * next = b.expr(b.int_lit(0));
  const FlowResults r = run(b.block({b.while_(b.boolean(true), b.block({})), next}), "int");

  EXPECT_FALSE(r.exit_reachable);
  EXPECT_EQ(h.count(DiagCode::MissingReturn), 0u);
  EXPECT_EQ(h.count(DiagCode::DeadCode), 1u);
}

TEST_F(FlowStatementTest, BreakMakesInfiniteLoopComplete)
{
  auto * x = b.var("x", "int");
  auto * read = b.ref(x);
  auto * loop = b.while_(b.boolean(true));
  loop->body = b.block({b.expr(b.assign(x, b.int_lit(1))), b.brk(loop)});
  const FlowResults r = run(b.block({b.decl({x}), loop, b.expr(read)}));

  EXPECT_TRUE(h.diags.empty());
  EXPECT_TRUE(assigned_at(r, read));
  EXPECT_TRUE(r.exit_reachable);

  const StatementFlow * flow = r.statement(loop);
  ASSERT_NE(flow, nullptr);
  ASSERT_TRUE(flow->break_model.has_value());
  EXPECT_TRUE(flow->break_model->lookup(x)->assigned);
}

TEST_F(FlowStatementTest, BreakJoinsWithLoopExit)
{
  auto * x = b.var("x", "int");
  auto * read = b.ref(x);
  auto * loop = b.while_(b.ref(c));
  loop->body = b.block({b.expr(b.assign(x, b.int_lit(1))), b.brk(loop)});
  const FlowResults r = run(b.block({b.decl({x}), loop, b.expr(read)}));

  EXPECT_EQ(h.count(DiagCode::PossiblyUnassigned), 1u);
  EXPECT_FALSE(assigned_at(r, read));
}

TEST_F(FlowStatementTest, StatementAfterBreakIsDead)
{
  auto * loop = b.while_(b.ref(c));
  auto * dead = b.expr(b.int_lit(1));
  loop->body = b.block({b.brk(loop), dead});
  (void)run(b.block({loop}));

  ASSERT_EQ(h.count(DiagCode::DeadCode), 1u);
  EXPECT_EQ(h.diags.with_code(DiagCode::DeadCode)[0].primary_range(), dead->get_range());
}

// ============================================================================
// Do and For Loops
// ============================================================================

TEST_F(FlowStatementTest, DoBodyRunsAtLeastOnce)
{
  auto * x = b.var("x", "int");
  auto * read = b.ref(x);
  const FlowResults r = run(b.block({
    b.decl({x}),
    b.do_while(b.block({b.expr(b.assign(x, b.int_lit(1)))}), b.ref(c)),
    b.expr(read),
  }));

  EXPECT_TRUE(h.diags.empty());
  EXPECT_TRUE(assigned_at(r, read));
}

TEST_F(FlowStatementTest, ContinueSkipsRestOfDoBody)
{
  auto * x = b.var("x", "int");
  auto * read = b.ref(x);
  auto * loop = b.do_while(nullptr, b.ref(c));
  loop->body = b.block({b.if_(b.ref(c), b.cont(loop)), b.expr(b.assign(x, b.int_lit(1)))});
  const FlowResults r = run(b.block({b.decl({x}), loop, b.expr(read)}));

  EXPECT_EQ(h.count(DiagCode::PossiblyUnassigned), 1u);
  const StatementFlow * flow = r.statement(loop);
  ASSERT_NE(flow, nullptr);
  ASSERT_TRUE(flow->continue_model.has_value());
  EXPECT_FALSE(flow->continue_model->lookup(x)->assigned);
}

TEST_F(FlowStatementTest, ForLoopVariableIsScopedToLoop)
{
  auto * i = b.var_init("i", "int", b.int_lit(0));
  auto * cond_read = b.ref(i);
  auto * loop = b.for_(
    b.decl({i}), b.binary(cond_read, BinaryOp::Lt, b.int_lit(3)),
    {b.assign(i, b.binary(b.ref(i), BinaryOp::Add, b.int_lit(1)))}, b.block({}));
  const FlowResults r = run(b.block({loop}));

  EXPECT_TRUE(h.diags.empty());
  EXPECT_TRUE(assigned_at(r, cond_read));
  const StatementFlow * flow = r.statement(loop);
  ASSERT_NE(flow, nullptr);
  EXPECT_EQ(flow->after.lookup(i), nullptr);
  EXPECT_TRUE(r.exit_reachable);
}

TEST_F(FlowStatementTest, ForWithoutConditionLeavesOnlyThroughBreak)
{
  auto * forever = b.for_(nullptr, nullptr, {}, b.block({}));
  const FlowResults r = run(b.block({forever}), "int");
  EXPECT_FALSE(r.exit_reachable);
  EXPECT_TRUE(h.diags.empty());

  FlowHarness h2;
  auto * flag = h2.b.var("flag", "bool");
  auto * loop = h2.b.for_(nullptr, nullptr, {});
  loop->body = h2.b.block({h2.b.if_(h2.b.ref(flag), h2.b.brk(loop))});
  const FlowResults r2 = h2.run(h2.b.function("g", {flag}, "int", h2.b.block({loop})));
  EXPECT_TRUE(r2.exit_reachable);
  EXPECT_EQ(h2.count(DiagCode::MissingReturn), 1u);
}

TEST_F(FlowStatementTest, ContinueInForReachesUpdaters)
{
  auto * i = b.var_init("i", "int", b.int_lit(0));
  auto * in_update = b.ref(i);
  auto * loop = b.for_(
    b.decl({i}), b.ref(c), {b.assign(i, b.binary(in_update, BinaryOp::Add, b.int_lit(1)))});
  loop->body = b.block({b.cont(loop)});
  const FlowResults r = run(b.block({loop}));

  ASSERT_NE(r.read(in_update), nullptr);
  EXPECT_TRUE(r.read(in_update)->reachable);
  EXPECT_EQ(h.count(DiagCode::DeadCode), 0u);
}

// ============================================================================
// Labels
// ============================================================================

TEST_F(FlowStatementTest, LabeledBreakLeavesOuterLoop)
{
  auto * x = b.var("x", "int");
  auto * read = b.ref(x);
  auto * outer_label = b.labeled("outer");
  auto * inner = b.while_(b.boolean(true));
  inner->body = b.block({b.expr(b.assign(x, b.int_lit(1))), b.brk(outer_label)});
  outer_label->body = b.while_(b.boolean(true), b.block({inner}));
  const FlowResults r = run(b.block({b.decl({x}), outer_label, b.expr(read)}));

  EXPECT_TRUE(h.diags.empty());
  EXPECT_TRUE(assigned_at(r, read));
  EXPECT_TRUE(r.exit_reachable);
  const StatementFlow * flow = r.statement(outer_label);
  ASSERT_NE(flow, nullptr);
  EXPECT_TRUE(flow->break_model.has_value());
}

TEST_F(FlowStatementTest, LabeledContinueTargetsOuterLoop)
{
  auto * x = b.var("x", "int");
  auto * read = b.ref(x);
  auto * outer = b.do_while(nullptr, b.ref(c));
  auto * label = b.labeled("outer");
  label->body = outer;
  outer->body = b.block({
    b.while_(b.ref(c), b.block({b.cont(outer)})),
    b.expr(b.assign(x, b.int_lit(1))),
  });
  const FlowResults r = run(b.block({b.decl({x}), label, b.expr(read)}));

  EXPECT_EQ(h.count(DiagCode::PossiblyUnassigned), 1u);
  EXPECT_FALSE(assigned_at(r, read));
}

// ============================================================================
// Switch
// ============================================================================

TEST_F(FlowStatementTest, SwitchWithoutDefaultMayFallThrough)
{
  auto * v = b.var("v", "int");
  auto * x = b.var("x", "int");
  auto * read = b.ref(x);
  auto * sw = b.switch_(b.ref(v));
  b.set_cases(
    sw, {
          b.case_({b.int_lit(1)}, {b.expr(b.assign(x, b.int_lit(1)))}),
          b.case_({b.int_lit(2)}, {b.expr(b.assign(x, b.int_lit(2))), b.brk(sw)}),
        });
  const FlowResults r = h.run(b.function("f", {v}, "void", b.block({b.decl({x}), sw, b.expr(read)})));

  EXPECT_EQ(h.count(DiagCode::PossiblyUnassigned), 1u);
  EXPECT_FALSE(assigned_at(r, read));
}

TEST_F(FlowStatementTest, SwitchWithDefaultCoversAllPaths)
{
  auto * v = b.var("v", "int");
  auto * x = b.var("x", "int");
  auto * read = b.ref(x);
  auto * sw = b.switch_(b.ref(v));
  b.set_cases(
    sw, {
          b.case_({b.int_lit(1)}, {b.expr(b.assign(x, b.int_lit(1)))}),
          b.case_({}, {b.expr(b.assign(x, b.int_lit(0)))}, /*is_default=*/true),
        });
  const FlowResults r = h.run(b.function("f", {v}, "void", b.block({b.decl({x}), sw, b.expr(read)})));

  EXPECT_TRUE(h.diags.empty());
  EXPECT_TRUE(assigned_at(r, read));
}

TEST_F(FlowStatementTest, ExhaustiveSwitchCoversAllPaths)
{
  auto * v = b.var("v", "bool");
  auto * x = b.var("x", "int");
  auto * read = b.ref(x);
  auto * sw = b.switch_(b.ref(v), /*exhaustive=*/true);
  b.set_cases(
    sw, {
          b.case_({b.boolean(true)}, {b.expr(b.assign(x, b.int_lit(1)))}),
          b.case_({b.boolean(false)}, {b.expr(b.assign(x, b.int_lit(0)))}),
        });
  const FlowResults r = h.run(b.function("f", {v}, "void", b.block({b.decl({x}), sw, b.expr(read)})));

  EXPECT_TRUE(h.diags.empty());
  EXPECT_TRUE(assigned_at(r, read));
}

TEST_F(FlowStatementTest, SwitchWhoseCasesAllReturnDoesNotComplete)
{
  auto * v = b.var("v", "int");
  auto * sw = b.switch_(b.ref(v));
  b.set_cases(
    sw, {
          b.case_({b.int_lit(1)}, {b.ret(b.int_lit(1))}),
          b.case_({}, {b.ret(b.int_lit(0))}, /*is_default=*/true),
        });
  const FlowResults r = h.run(b.function("f", {v}, "int", b.block({sw})));

  EXPECT_FALSE(r.exit_reachable);
  EXPECT_TRUE(h.diags.empty());
}

TEST_F(FlowStatementTest, SwitchCaseVariablesStayInCase)
{
  auto * v = b.var("v", "int");
  auto * local = b.var_init("local", "int", b.int_lit(1));
  auto * sw = b.switch_(b.ref(v));
  b.set_cases(sw, {b.case_({b.int_lit(1)}, {b.decl({local})})});
  const FlowResults r = h.run(b.function("f", {v}, "void", b.block({sw})));

  const StatementFlow * flow = r.statement(sw);
  ASSERT_NE(flow, nullptr);
  EXPECT_EQ(flow->after.lookup(local), nullptr);
}

// ============================================================================
// Try / Catch / Finally
// ============================================================================

TEST_F(FlowStatementTest, CatchAssignsOnFailurePath)
{
  auto * x = b.var("x", "int");
  auto * read = b.ref(x);
  auto * t = b.try_(b.block({b.expr(b.assign(x, b.typed(b.call("compute"), "int")))}));
  b.set_catches(t, {b.catch_(b.block({b.expr(b.assign(x, b.int_lit(0)))}), b.var("e"))});
  const FlowResults r = run(b.block({b.decl({x}), t, b.expr(read)}));

  EXPECT_TRUE(h.diags.empty());
  EXPECT_TRUE(assigned_at(r, read));
}

TEST_F(FlowStatementTest, EmptyCatchLeavesVariableUnassigned)
{
  auto * x = b.var("x", "int");
  auto * read = b.ref(x);
  auto * t = b.try_(b.block({b.expr(b.assign(x, b.typed(b.call("compute"), "int")))}));
  b.set_catches(t, {b.catch_(b.block({}))});
  (void)run(b.block({b.decl({x}), t, b.expr(read)}));

  EXPECT_EQ(h.count(DiagCode::PossiblyUnassigned), 1u);
}

TEST_F(FlowStatementTest, CatchSeesWritesOfTryAsPossiblyHappened)
{
  auto * x = b.var("x", "int?");
  auto * in_catch = b.ref(x);
  auto * t = b.try_(b.block({
    b.expr(b.assign(x, b.null())),
    b.expr(b.assign(x, b.int_lit(1))),
  }));
  b.set_catches(t, {b.catch_(b.block({b.expr(in_catch)}))});
  const FlowResults r = h.run(b.function(
    "f", {x}, "void", b.block({b.if_(b.eq(b.ref(x), b.null()), b.ret()), t})));

  EXPECT_EQ(FlowHarness::read_type(r, in_catch), b.type("int?"));
}

TEST_F(FlowStatementTest, CatchVariablesAreAssigned)
{
  auto * e = b.var("e");
  auto * st = b.var("st", "StackTrace");
  auto * read_e = b.ref(e);
  auto * read_st = b.ref(st);
  auto * t = b.try_(b.block({b.expr(b.call("work"))}));
  CatchClause * clause = b.catch_(b.block({b.expr(read_e), b.expr(read_st)}), e);
  clause->stackTrace = st;
  b.set_catches(t, {clause});
  const FlowResults r = run(b.block({t}));

  EXPECT_TRUE(h.diags.empty());
  EXPECT_EQ(FlowHarness::read_type(r, read_e), b.type("Object"));
  EXPECT_TRUE(assigned_at(r, read_st));
  EXPECT_EQ(r.statement(t)->after.lookup(e), nullptr);
}

TEST_F(FlowStatementTest, FinallyAssignmentIsDefinite)
{
  auto * x = b.var("x", "int");
  auto * read = b.ref(x);
  auto * t = b.try_(b.block({b.expr(b.call("work"))}), b.block({b.expr(b.assign(x, b.int_lit(1)))}));
  const FlowResults r = run(b.block({b.decl({x}), t, b.expr(read)}));

  EXPECT_TRUE(h.diags.empty());
  EXPECT_TRUE(assigned_at(r, read));
}

TEST_F(FlowStatementTest, FinallyKeepsPromotionsOfTryBody)
{
  auto * x = b.var("x", "Object");
  auto * read = b.ref(x);
  auto * t = b.try_(
    b.block({b.expr(b.as(b.ref(x), "int"))}), b.block({b.expr(b.call("cleanup"))}));
  const FlowResults r = h.run(b.function("f", {x}, "void", b.block({t, b.expr(read)})));

  EXPECT_EQ(FlowHarness::read_type(r, read), b.type("int"));
}

TEST_F(FlowStatementTest, ReturningFinallyMakesRestDead)
{
  auto * next = b.expr(b.int_lit(0));
  auto * t = b.try_(b.block({b.expr(b.call("work"))}), b.block({b.ret()}));
  const FlowResults r = run(b.block({t, next}));

  EXPECT_FALSE(r.exit_reachable);
  ASSERT_EQ(h.count(DiagCode::DeadCode), 1u);
  EXPECT_EQ(h.diags.with_code(DiagCode::DeadCode)[0].primary_range(), next->get_range());
}

TEST_F(FlowStatementTest, ReturningTryBodyStillRunsFinallyFromStart)
{
  auto * x = b.var("x", "int?");
  auto * in_finally = b.ref(x);
  auto * t = b.try_(
    b.block({b.expr(b.bang(b.ref(x))), b.ret(b.int_lit(1))}), b.block({b.expr(in_finally)}));
  const FlowResults r = h.run(b.function("f", {x}, "int", b.block({t})));

  const VariableReadInfo * info = r.read(in_finally);
  ASSERT_NE(info, nullptr);
  EXPECT_TRUE(info->reachable);
  EXPECT_EQ(info->current_type, b.type("int?"));
  EXPECT_FALSE(r.exit_reachable);
  EXPECT_EQ(h.count(DiagCode::MissingReturn), 0u);
}

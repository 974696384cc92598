// tests/sema/test_flow_json.cpp - JSON dump of models and results
//
#include <gtest/gtest.h>

#include "flowan/sema/flow/flow_json.hpp"
#include "flowan/test_support/flow_harness.hpp"

using namespace flowan;
using nlohmann::json;

TEST(FlowJson, VariableModelFields)
{
  FlowHarness h;
  VariableModel m = VariableModel::fresh(h.b.type("Object?"), false);
  m = m.with_tested(h.b.type("int")).try_promote(h.oracle, h.b.type("int"));

  const json j = to_json(m);
  EXPECT_EQ(j["declared_type"], "Object?");
  EXPECT_EQ(j["promoted_types"], json::array({"int"}));
  EXPECT_EQ(j["tested_types"], json::array({"int"}));
  EXPECT_EQ(j["assigned"], false);
  EXPECT_EQ(j["unassigned"], true);
  EXPECT_EQ(j["write_captured"], false);
}

TEST(FlowJson, FlowModelListsVariablesInDeclarationOrder)
{
  FlowHarness h;
  auto * first = h.b.var("zeta", "int");
  auto * second = h.b.var("alpha", "String");
  const FlowModel m = FlowModel::entry()
                        .split()
                        .with_variable(second, VariableModel::fresh(h.b.type("String"), true))
                        .with_variable(first, VariableModel::fresh(h.b.type("int"), true))
                        .exit();

  const json j = to_json(m);
  EXPECT_EQ(j["reachable"], json::array({true, false}));
  ASSERT_EQ(j["variables"].size(), 2u);
  EXPECT_EQ(j["variables"][0]["name"], "zeta");
  EXPECT_EQ(j["variables"][1]["name"], "alpha");
}

TEST(FlowJson, ResultsDumpShape)
{
  FlowHarness h;
  auto & b = h.b;
  auto * y = b.var("y", "int?");
  auto * read = b.ref(y);
  auto * fn = b.function(
    "pick", {y}, "int",
    b.block({
      b.if_(b.eq(b.ref(y), b.null()), b.ret(b.int_lit(0))),
      b.expr(b.closure({}, b.block({b.ret()}))),
      b.ret(read),
    }));
  const FlowResults r = h.run(fn);
  const json j = to_json(r, *fn);

  EXPECT_EQ(j["function"], "pick");
  EXPECT_EQ(j["exit_reachable"], false);
  EXPECT_EQ(j["exit"]["reachable"], json::array({false}));

  ASSERT_FALSE(j["statements"].empty());
  EXPECT_EQ(j["statements"][0]["node"], "block_stmt");
  EXPECT_TRUE(j["statements"][0].contains("before"));
  EXPECT_TRUE(j["statements"][0].contains("after"));

  ASSERT_EQ(j["reads"].size(), 2u);
  const json & last_read = j["reads"][1];
  EXPECT_EQ(last_read["variable"], "y");
  EXPECT_EQ(last_read["type"], "int");
  EXPECT_EQ(last_read["promoted"], true);
  EXPECT_EQ(last_read["reachable"], true);
  EXPECT_EQ(last_read["range"], json::array({read->get_range().get_begin().get_offset(),
                                             read->get_range().get_end().get_offset()}));

  ASSERT_EQ(j["exits"].size(), 3u);
  EXPECT_EQ(j["exits"][0]["kind"], "return");
  EXPECT_EQ(j["exits"][0]["type"], "int");
  EXPECT_EQ(j["exits"][0]["in_closure"], false);
  EXPECT_EQ(j["exits"][1]["type"], nullptr);
  EXPECT_EQ(j["exits"][1]["in_closure"], true);
  EXPECT_EQ(j["exits"][2]["type"], "int");
}

TEST(FlowJson, LoopEntriesCarryBreakModel)
{
  FlowHarness h;
  auto & b = h.b;
  auto * loop = b.while_(b.boolean(true));
  loop->body = b.block({b.brk(loop)});
  auto * fn = b.function("f", {}, "void", b.block({loop}));
  const json j = to_json(h.run(fn), *fn);

  bool found = false;
  for (const auto & entry : j["statements"]) {
    if (entry["node"] == "while_stmt") {
      found = true;
      EXPECT_TRUE(entry.contains("break"));
      EXPECT_FALSE(entry.contains("continue"));
    }
  }
  EXPECT_TRUE(found);
}

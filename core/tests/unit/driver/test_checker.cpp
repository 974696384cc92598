// tests/driver/test_checker.cpp - Check pipeline from JSON unit to diagnostics
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "flowan/driver/checker.hpp"

using namespace flowan;
namespace fs = std::filesystem;

namespace
{

// void f(bool c) { int x; if (c) { x = 1; } x; }
const char * k_unassigned_unit = R"({
  "functions": [{
    "name": "f", "return_type": "void",
    "params": [{"name": "c", "type": "bool"}],
    "body": {"kind": "block", "statements": [
      {"kind": "var", "declarations": [{"name": "x", "type": "int"}]},
      {"kind": "if", "condition": {"kind": "var", "name": "c"},
       "then": {"kind": "expr", "expr": {"kind": "assign", "name": "x", "value": {"kind": "int", "value": 1}}}},
      {"kind": "expr", "expr": {"kind": "var", "name": "x", "range": [40, 41]}}]}
  }]
})";

// int g() { return 1; 2; }   void h() {}
const char * k_dead_code_unit = R"({
  "functions": [
    {"name": "g", "return_type": "int", "body": [
      {"kind": "return", "value": {"kind": "int", "value": 1}},
      {"kind": "expr", "expr": {"kind": "int", "value": 2}, "range": [20, 22]}]},
    {"name": "h", "return_type": "void", "body": []}
  ]
})";

}  // namespace

TEST(Checker, CleanUnitSucceeds)
{
  const CheckResult r = Checker::check_text(
    R"({"functions": [{"name": "f", "return_type": "int", "expression_body": {"kind": "int", "value": 3}}]})",
    CheckOptions{});

  EXPECT_TRUE(r.success);
  EXPECT_TRUE(r.diagnostics.empty());
  EXPECT_EQ(r.function_count, 1u);
  EXPECT_TRUE(r.flow_dump.empty());
}

TEST(Checker, UnassignedReadFailsCheck)
{
  const CheckResult r = Checker::check_text(k_unassigned_unit, CheckOptions{});

  EXPECT_FALSE(r.success);
  const auto reported = r.diagnostics.with_code(DiagCode::PossiblyUnassigned);
  ASSERT_EQ(reported.size(), 1u);
  EXPECT_EQ(reported[0].primary_range(), SourceRange(40, 41));
}

TEST(Checker, OptionsReachTheAnalyzer)
{
  CheckOptions options;
  options.flow.report_unassigned_reads = false;
  const CheckResult r = Checker::check_text(k_unassigned_unit, options);

  EXPECT_TRUE(r.success);
  EXPECT_TRUE(r.diagnostics.empty());
}

TEST(Checker, DeadCodeAloneDoesNotFail)
{
  const CheckResult r = Checker::check_text(k_dead_code_unit, CheckOptions{});

  EXPECT_TRUE(r.success);
  EXPECT_EQ(r.function_count, 2u);
  ASSERT_EQ(r.diagnostics.with_code(DiagCode::DeadCode).size(), 1u);
  EXPECT_EQ(r.diagnostics.size(), 1u);
}

TEST(Checker, FlowDumpHasOneEntryPerFunction)
{
  CheckOptions options;
  options.dump_flow = true;
  const CheckResult r = Checker::check_text(k_dead_code_unit, options);

  ASSERT_EQ(r.flow_dump.size(), 2u);
  EXPECT_EQ(r.flow_dump[0]["function"], "g");
  EXPECT_EQ(r.flow_dump[0]["exit_reachable"], false);
  EXPECT_EQ(r.flow_dump[1]["function"], "h");
  EXPECT_EQ(r.flow_dump[1]["exit_reachable"], true);
}

TEST(Checker, InputErrorsFailCheck)
{
  const CheckResult r = Checker::check_text(
    R"({"functions": [{"name": "f", "body": [{"kind": "expr", "expr": {"kind": "var", "name": "nope"}}]}]})",
    CheckOptions{});

  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.diagnostics.with_code(DiagCode::UnresolvedName).size(), 1u);
  EXPECT_EQ(r.function_count, 1u);
}

TEST(Checker, InvalidJsonIsReportedWithName)
{
  const CheckResult r = Checker::check_text("{oops", CheckOptions{}, "broken.json");

  EXPECT_FALSE(r.success);
  ASSERT_EQ(r.diagnostics.size(), 1u);
  const Diagnostic & d = *r.diagnostics.begin();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.message.rfind("broken.json: Invalid JSON", 0), 0u);
  EXPECT_EQ(r.function_count, 0u);
}

TEST(Checker, MissingFileIsReported)
{
  const CheckResult r =
    Checker::check_file(fs::temp_directory_path() / "flowan_no_such_unit.json", CheckOptions{});

  EXPECT_FALSE(r.success);
  ASSERT_EQ(r.diagnostics.size(), 1u);
  EXPECT_NE(r.diagnostics.begin()->message.find("file not found"), std::string::npos);
}

TEST(Checker, FileWithSourceLoadsProgramText)
{
  const fs::path dir = fs::temp_directory_path() / "flowan_checker_test";
  fs::remove_all(dir);
  fs::create_directories(dir);
  {
    std::ofstream unit(dir / "unit.json");
    unit << R"({"source": "prog.dart", "functions": [{"name": "f", "body": []}]})";
    std::ofstream prog(dir / "prog.dart");
    prog << "void f() {}\n";
  }

  const CheckResult r = Checker::check_file(dir / "unit.json", CheckOptions{});
  EXPECT_TRUE(r.success);
  EXPECT_TRUE(r.diagnostics.empty());
  EXPECT_TRUE(r.source.has_source());
  EXPECT_EQ(r.source.get_source(), "void f() {}\n");

  CheckOptions options;
  options.source_path = dir / "missing.dart";
  const CheckResult without = Checker::check_file(dir / "unit.json", options);
  EXPECT_TRUE(without.success);
  ASSERT_EQ(without.diagnostics.size(), 1u);
  EXPECT_EQ(without.diagnostics.begin()->severity, Severity::Warning);
  EXPECT_FALSE(without.source.has_source());

  fs::remove_all(dir);
}

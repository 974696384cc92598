// flowan/test_support/flow_harness.hpp - One-stop setup for flow analysis tests
//
#pragma once

#include "flowan/basic/diagnostic.hpp"
#include "flowan/sema/flow/flow_analyzer.hpp"
#include "flowan/sema/types/subtype_oracle.hpp"
#include "flowan/test_support/ast_builder.hpp"

namespace flowan
{

/**
 * Owns the contexts a test needs and runs FlowAnalyzer over a function.
 *
 *   FlowHarness h;
 *   auto * x = h.b.var("x", "int?");
 *   FlowResults r = h.run(h.b.function("f", {x}, "void", h.b.block({})));
 */
struct FlowHarness
{
  AstContext ast;
  TypeContext types;
  ClassHierarchy classes = ClassHierarchy::with_core_library(types);
  SubtypeOracle oracle{types, classes};
  AstBuilder b{ast, types};
  DiagnosticBag diags;

  FlowResults run(const FunctionDecl * fn, FlowOptions options = {})
  {
    FlowAnalyzer analyzer(oracle, options, &diags);
    return analyzer.analyze(*fn);
  }

  [[nodiscard]] size_t count(DiagCode code) const { return diags.with_code(code).size(); }

  /// Current type of the variable read by @p ref, nullptr if the read was not recorded
  [[nodiscard]] static const Type * read_type(const FlowResults & r, const Expr * ref)
  {
    const VariableReadInfo * info = r.read(ref);
    return info != nullptr ? info->current_type : nullptr;
  }
};

}  // namespace flowan

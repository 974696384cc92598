// flowan/sema/flow/flow_json.hpp - JSON rendering of flow models and results
//
// Output is canonical: variables are ordered by declaration position and
// name, nodes by a pre-order walk of the function. Two runs over the same
// input produce identical documents.
//
#pragma once

#include <nlohmann/json.hpp>

#include "flowan/ast/ast.hpp"
#include "flowan/sema/flow/flow_model.hpp"
#include "flowan/sema/flow/flow_results.hpp"
#include "flowan/sema/flow/variable_model.hpp"

namespace flowan
{

[[nodiscard]] nlohmann::json to_json(const VariableModel & model);

/// `{"reachable": [...], "variables": [{"name": ..., ...}]}`
[[nodiscard]] nlohmann::json to_json(const FlowModel & model);

/**
 * Full dump of one run: statement models, variable reads, exit
 * contributions and per-function exit reachability.
 */
[[nodiscard]] nlohmann::json to_json(const FlowResults & results, const FunctionDecl & fn);

}  // namespace flowan

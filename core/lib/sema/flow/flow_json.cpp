// flowan/sema/flow/flow_json.cpp - JSON rendering of flow models and results
#include "flowan/sema/flow/flow_json.hpp"

#include <algorithm>
#include <string>
#include <tuple>
#include <vector>

#include "flowan/ast/visitor.hpp"
#include "flowan/sema/types/type_utils.hpp"

namespace flowan
{
namespace
{

using nlohmann::json;

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return nullptr;
  }
  return json::array({r.get_begin().get_offset(), r.get_end().get_offset()});
}

json j_types(const std::vector<const Type *> & types)
{
  json out = json::array();
  for (const Type * t : types) {
    out.push_back(to_string(t));
  }
  return out;
}

/// Declaration order key; ties between invalid ranges fall back to the name
bool decl_before(const VariableDecl * a, const VariableDecl * b)
{
  const auto key = [](const VariableDecl * v) {
    return std::make_tuple(v->get_range().get_begin().get_offset(), v->name);
  };
  return key(a) < key(b);
}

json j_node_ref(const AstNode * node)
{
  return json{{"node", std::string(to_string(node->get_kind()))}, {"range", j_range(node->get_range())}};
}

/// Collects statements and reads in pre-order
class NodeOrder : public ConstRecursiveAstVisitor<NodeOrder>
{
  using Base = ConstRecursiveAstVisitor<NodeOrder>;

public:
  std::vector<const Stmt *> stmts;
  std::vector<const Expr *> exprs;

  bool visit(const AstNode * node)
  {
    if (node == nullptr) return true;
    if (const auto * stmt = dyn_cast<Stmt>(node)) {
      stmts.push_back(stmt);
    } else if (const auto * expr = dyn_cast<Expr>(node)) {
      exprs.push_back(expr);
    }
    return Base::visit(node);
  }
};

}  // namespace

json to_json(const VariableModel & model)
{
  return json{
    {"declared_type", to_string(model.declared_type)},
    {"promoted_types", j_types(model.promoted_types)},
    {"tested_types", j_types(model.tested_types)},
    {"assigned", model.assigned},
    {"unassigned", model.unassigned},
    {"write_captured", model.write_captured}};
}

json to_json(const FlowModel & model)
{
  std::vector<const VariableDecl *> vars;
  vars.reserve(model.variables().size());
  for (const auto & entry : model.variables()) {
    vars.push_back(entry.first);
  }
  std::sort(vars.begin(), vars.end(), decl_before);

  json variables = json::array();
  for (const VariableDecl * var : vars) {
    json j = to_json(*model.lookup(var));
    j["name"] = std::string(var->name);
    variables.push_back(std::move(j));
  }

  json reachable = json::array();
  for (const bool r : model.reachability()) {
    reachable.push_back(r);
  }
  return json{{"reachable", reachable}, {"variables", variables}};
}

json to_json(const FlowResults & results, const FunctionDecl & fn)
{
  NodeOrder order;
  order.visit(&fn);

  json statements = json::array();
  for (const Stmt * stmt : order.stmts) {
    const StatementFlow * flow = results.statement(stmt);
    if (flow == nullptr) continue;
    json j = j_node_ref(stmt);
    j["before"] = to_json(flow->before);
    j["after"] = to_json(flow->after);
    if (flow->break_model) j["break"] = to_json(*flow->break_model);
    if (flow->continue_model) j["continue"] = to_json(*flow->continue_model);
    statements.push_back(std::move(j));
  }

  json reads = json::array();
  for (const Expr * expr : order.exprs) {
    const VariableReadInfo * info = results.read(expr);
    if (info == nullptr) continue;
    json j = j_node_ref(expr);
    j["variable"] = std::string(info->variable->name);
    j["type"] = to_string(info->current_type);
    j["promoted"] = info->promoted_type != nullptr;
    j["assigned"] = info->assigned;
    j["unassigned"] = info->unassigned;
    j["write_captured"] = info->write_captured;
    j["reachable"] = info->reachable;
    reads.push_back(std::move(j));
  }

  json exits = json::array();
  for (const auto & exit : results.exits) {
    json j = j_node_ref(exit.node);
    j["kind"] = exit.kind == ExitKind::Return ? "return" : "yield";
    j["type"] = exit.type != nullptr ? json(to_string(exit.type)) : json(nullptr);
    j["in_closure"] = exit.function != &fn;
    j["reachable"] = exit.reachable;
    exits.push_back(std::move(j));
  }

  return json{
    {"function", std::string(fn.name)},
    {"exit_reachable", results.exit_reachable},
    {"exit", to_json(results.exit_model)},
    {"statements", statements},
    {"reads", reads},
    {"exits", exits}};
}

}  // namespace flowan

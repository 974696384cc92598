// flowan/sema/flow/flow_expr.cpp - Expression rules
//
// Short-circuit forms open their split before the left operand so both
// outcomes of the left operand share one stack tail with the right one.
//
#include <string>
#include <utility>

#include "flowan/sema/flow/flow_analyzer.hpp"

namespace flowan
{

namespace
{

/// A form that only defines `after`: every outcome is `after`
ExpressionFlow plain(const FlowModel & before, const FlowModel & after)
{
  return ExpressionFlow{before, after, after, after, after, after};
}

/// A boolean form: `after` is the join of both outcomes and it is never null
ExpressionFlow from_conditions(
  const FlowModel & before, const FlowModel & when_true, const FlowModel & when_false)
{
  FlowModel after = FlowModel::join(when_true, when_false);
  FlowModel when_null = after.exit();
  return ExpressionFlow{before, after, when_true, when_false, std::move(when_null), after};
}

/// Model of @p var when flow may promote it
const VariableModel * promotable_model(const VariableDecl * var, const FlowModel & model)
{
  if (var == nullptr) return nullptr;
  const VariableModel * vm = model.lookup(var);
  return vm != nullptr && !vm->write_captured ? vm : nullptr;
}

}  // namespace

// ============================================================================
// Dispatch
// ============================================================================

ExpressionFlow FlowAnalyzer::visit_expr(const Expr * expr, const FlowModel & before)
{
  if (expr == nullptr) {
    return plain(before, before);
  }

  ExpressionFlow flow;
  switch (expr->get_kind()) {
    case NodeKind::NullLiteral:
      flow = plain(before, before);
      flow.when_not_null = before.exit();
      break;

    case NodeKind::BoolLiteral: {
      const bool value = cast<BoolLiteralExpr>(expr)->value;
      flow = from_conditions(before, value ? before : before.exit(), value ? before.exit() : before);
      break;
    }

    case NodeKind::IntLiteral:
    case NodeKind::StringLiteral:
      flow = plain(before, before);
      flow.when_null = before.exit();
      break;

    case NodeKind::VarRef:
      flow = visit_var_ref(cast<VarRefExpr>(expr), before);
      break;

    case NodeKind::AssignExpr: {
      const auto * assign = cast<AssignExpr>(expr);
      flow = assign->op == AssignOp::IfNullAssign ? visit_if_null_assign(assign, before)
                                                  : visit_assign(assign, before);
      break;
    }

    case NodeKind::BinaryExpr: {
      const auto * bin = cast<BinaryExpr>(expr);
      switch (bin->op) {
        case BinaryOp::And:
        case BinaryOp::Or:
          flow = visit_logical(bin, before);
          break;
        case BinaryOp::IfNull:
          flow = visit_if_null(bin, before);
          break;
        case BinaryOp::Eq:
        case BinaryOp::Ne:
          flow = visit_equality(bin, before);
          break;
        default:
          flow = visit_binary(bin, before);
          break;
      }
      break;
    }

    case NodeKind::UnaryExpr:
      flow = visit_unary(cast<UnaryExpr>(expr), before);
      break;
    case NodeKind::ConditionalExpr:
      flow = visit_conditional(cast<ConditionalExpr>(expr), before);
      break;
    case NodeKind::IsExpr:
      flow = visit_is(cast<IsExpr>(expr), before);
      break;
    case NodeKind::AsExpr:
      flow = visit_as(cast<AsExpr>(expr), before);
      break;
    case NodeKind::NullCheckExpr:
      flow = visit_null_check(cast<NullCheckExpr>(expr), before);
      break;

    case NodeKind::ThrowExpr: {
      const ExpressionFlow value = visit_expr(cast<ThrowExpr>(expr)->expr, before);
      flow = plain(before, value.after.exit());
      break;
    }

    case NodeKind::CallExpr:
      flow = visit_call(cast<CallExpr>(expr), before);
      break;

    case NodeKind::PropertyGetExpr: {
      const ExpressionFlow target = visit_expr(cast<PropertyGetExpr>(expr)->target, before);
      flow = plain(before, target.after);
      break;
    }

    case NodeKind::FunctionExpr:
      flow = visit_function_expr(cast<FunctionExpr>(expr), before);
      break;

    default:
      flow = plain(before, before);
      break;
  }

  return finish(expr, std::move(flow));
}

const ExpressionFlow & FlowAnalyzer::finish(const Expr * expr, ExpressionFlow flow)
{
  if (expr->staticType != nullptr && expr->staticType->is_never()) {
    flow.after = flow.after.exit();
    flow.when_true = flow.when_true.exit();
    flow.when_false = flow.when_false.exit();
    flow.when_null = flow.when_null.exit();
    flow.when_not_null = flow.when_not_null.exit();
  }

  if (options_.null_comparison_reachability) {
    const Type * type = type_of(expr);
    if (type == nullptr) {
      type = ops_.types().dynamic_type();
    }
    if (!type->is_dynamic() && !type->is_invalid() && !ops_.is_nullable(type)) {
      flow.when_null = flow.when_null.exit();
    }
    if (type->is_null()) {
      flow.when_not_null = flow.when_not_null.exit();
    }
  }

  auto & slot = results_->expressions[expr];
  slot = std::move(flow);
  if (observer_ != nullptr) {
    observer_->on_expression(*expr, slot);
  }
  return slot;
}

// ============================================================================
// Variables
// ============================================================================

void FlowAnalyzer::record_read(const Expr * expr, const VariableDecl * var, const FlowModel & model)
{
  if (var == nullptr) return;
  const VariableModel * vm = model.lookup(var);
  if (vm == nullptr) return;

  VariableReadInfo info;
  info.variable = var;
  info.current_type = vm->current_type();
  info.promoted_type = vm->is_promoted() ? vm->current_type() : nullptr;
  info.assigned = vm->assigned;
  info.unassigned = vm->unassigned;
  info.write_captured = vm->write_captured;
  info.reachable = model.is_reachable();

  auto & slot = results_->reads[expr];
  slot = info;
  if (observer_ != nullptr) {
    observer_->on_read(*expr, slot);
  }

  if (!info.assigned && info.reachable && !var->isLate && options_.report_unassigned_reads) {
    report(
      DiagCode::PossiblyUnassigned, expr->get_range(),
      "The variable '" + std::string(var->name) +
        "' is read here, but it might not have been assigned",
      Label{var->get_range(), "declared here", LabelStyle::Secondary},
      "assign '" + std::string(var->name) + "' on every path before this read");
  }
}

const VariableDecl * FlowAnalyzer::promotable_variable(
  const Expr * expr, const FlowModel & model) const
{
  const auto * ref = dyn_cast<VarRefExpr>(expr);
  if (ref == nullptr) return nullptr;
  return promotable_model(ref->variable, model) != nullptr ? ref->variable : nullptr;
}

const Type * FlowAnalyzer::type_of(const Expr * expr) const
{
  TypeContext & types = ops_.types();
  if (expr == nullptr) return types.dynamic_type();
  if (expr->staticType != nullptr) return expr->staticType;

  switch (expr->get_kind()) {
    case NodeKind::NullLiteral:
      return types.null_type();
    case NodeKind::BoolLiteral:
    case NodeKind::IsExpr:
      return types.bool_type();
    case NodeKind::IntLiteral:
      return types.int_type();
    case NodeKind::StringLiteral:
      return types.string_type();
    case NodeKind::ThrowExpr:
      return types.never_type();
    case NodeKind::VarRef: {
      const VariableReadInfo * info = results_->read(expr);
      return info != nullptr ? info->current_type : types.dynamic_type();
    }
    case NodeKind::AssignExpr: {
      const auto * assign = cast<AssignExpr>(expr);
      return assign->op == AssignOp::Assign ? type_of(assign->value) : types.dynamic_type();
    }
    case NodeKind::NullCheckExpr:
      return ops_.promote_to_non_null(type_of(cast<NullCheckExpr>(expr)->expr));
    case NodeKind::AsExpr:
      return cast<AsExpr>(expr)->targetType;
    case NodeKind::UnaryExpr:
      return cast<UnaryExpr>(expr)->op == UnaryOp::Not ? types.bool_type() : types.dynamic_type();
    case NodeKind::BinaryExpr:
      switch (cast<BinaryExpr>(expr)->op) {
        case BinaryOp::Eq:
        case BinaryOp::Ne:
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge:
        case BinaryOp::And:
        case BinaryOp::Or:
          return types.bool_type();
        default:
          return types.dynamic_type();
      }
    default:
      return types.dynamic_type();
  }
}

ExpressionFlow FlowAnalyzer::visit_var_ref(const VarRefExpr * expr, const FlowModel & before)
{
  record_read(expr, expr->variable, before);

  ExpressionFlow flow = plain(before, before);
  if (const VariableModel * vm = promotable_model(expr->variable, before)) {
    // A null test is a type test against NonNull(S) on both outcomes.
    const Type * non_null = ops_.promote_to_non_null(vm->current_type());
    const VariableModel tested = vm->with_tested(non_null);
    flow.when_null = before.with_variable(expr->variable, tested);
    flow.when_not_null = before.with_variable(expr->variable, tested.try_promote(ops_, non_null));
  }
  return flow;
}

// ============================================================================
// Assignment
// ============================================================================

ExpressionFlow FlowAnalyzer::visit_assign(const AssignExpr * expr, const FlowModel & before)
{
  const ExpressionFlow value = visit_expr(expr->value, before);
  if (expr->variable == nullptr) {
    return plain(before, value.after);
  }

  const Type * written = type_of(expr->value);
  auto apply = [&](const FlowModel & m) {
    return m.assign(ops_, options_, expr->variable, written);
  };
  return ExpressionFlow{
    before,
    apply(value.after),
    apply(value.when_true),
    apply(value.when_false),
    apply(value.when_null),
    apply(value.when_not_null)};
}

ExpressionFlow FlowAnalyzer::visit_if_null_assign(
  const AssignExpr * expr, const FlowModel & before)
{
  const VariableDecl * var = expr->variable;
  const FlowModel split = before.split();
  record_read(expr, var, split);

  FlowModel not_null_branch = split;
  FlowModel null_branch = split;
  if (const VariableModel * vm = promotable_model(var, split)) {
    const Type * current = vm->current_type();
    const Type * non_null = ops_.promote_to_non_null(current);
    const VariableModel tested = vm->with_tested(non_null);
    not_null_branch = split.with_variable(var, tested.try_promote(ops_, non_null));
    null_branch = split.with_variable(var, tested);
    if (options_.null_comparison_reachability && !ops_.is_nullable(current)) {
      null_branch = null_branch.exit();
    }
  }

  const ExpressionFlow value = visit_expr(expr->value, null_branch);
  FlowModel assigned = value.after;
  if (var != nullptr) {
    assigned = assigned.assign(ops_, options_, var, type_of(expr->value));
  }
  return plain(before, FlowModel::merge(not_null_branch, assigned));
}

// ============================================================================
// Operators
// ============================================================================

ExpressionFlow FlowAnalyzer::visit_binary(const BinaryExpr * expr, const FlowModel & before)
{
  const ExpressionFlow lhs = visit_expr(expr->lhs, before);
  const ExpressionFlow rhs = visit_expr(expr->rhs, lhs.after);
  return plain(before, rhs.after);
}

ExpressionFlow FlowAnalyzer::visit_logical(const BinaryExpr * expr, const FlowModel & before)
{
  const bool is_and = expr->op == BinaryOp::And;
  const ExpressionFlow lhs = visit_expr(expr->lhs, before.split());
  const ExpressionFlow rhs = visit_expr(expr->rhs, is_and ? lhs.when_true : lhs.when_false);

  if (is_and) {
    return from_conditions(
      before, rhs.when_true.drop(), FlowModel::merge(lhs.when_false, rhs.when_false));
  }
  return from_conditions(
    before, FlowModel::merge(lhs.when_true, rhs.when_true), rhs.when_false.drop());
}

ExpressionFlow FlowAnalyzer::visit_if_null(const BinaryExpr * expr, const FlowModel & before)
{
  const ExpressionFlow lhs = visit_expr(expr->lhs, before.split());
  const ExpressionFlow rhs = visit_expr(expr->rhs, lhs.when_null);

  ExpressionFlow flow = plain(before, FlowModel::merge(lhs.when_not_null, rhs.after));
  flow.when_null = rhs.when_null.drop();
  flow.when_not_null = FlowModel::merge(lhs.when_not_null, rhs.when_not_null);
  return flow;
}

ExpressionFlow FlowAnalyzer::visit_equality(const BinaryExpr * expr, const FlowModel & before)
{
  const ExpressionFlow lhs = visit_expr(expr->lhs, before);
  const ExpressionFlow rhs = visit_expr(expr->rhs, lhs.after);

  const bool lhs_null = isa<NullLiteralExpr>(expr->lhs);
  const bool rhs_null = isa<NullLiteralExpr>(expr->rhs);

  FlowModel is_null;
  FlowModel not_null;
  if (lhs_null && rhs_null) {
    is_null = rhs.after;
    not_null = rhs.after.exit();
  } else if (rhs_null) {
    is_null = lhs.when_null;
    not_null = lhs.when_not_null;
  } else if (lhs_null) {
    is_null = rhs.when_null;
    not_null = rhs.when_not_null;
  } else {
    return from_conditions(before, rhs.after, rhs.after);
  }

  if (expr->op == BinaryOp::Eq) {
    return from_conditions(before, is_null, not_null);
  }
  return from_conditions(before, not_null, is_null);
}

ExpressionFlow FlowAnalyzer::visit_unary(const UnaryExpr * expr, const FlowModel & before)
{
  const ExpressionFlow operand = visit_expr(expr->operand, before);
  if (expr->op != UnaryOp::Not) {
    return plain(before, operand.after);
  }
  // `!e` swaps the boolean outcomes
  return ExpressionFlow{before,           operand.after,        operand.when_false,
                        operand.when_true, operand.after.exit(), operand.after};
}

ExpressionFlow FlowAnalyzer::visit_conditional(
  const ConditionalExpr * expr, const FlowModel & before)
{
  const ExpressionFlow cond = visit_expr(expr->condition, before.split());
  const ExpressionFlow then_flow = visit_expr(expr->thenExpr, cond.when_true);
  const ExpressionFlow else_flow = visit_expr(expr->elseExpr, cond.when_false);

  return ExpressionFlow{
    before,
    FlowModel::merge(then_flow.after, else_flow.after),
    FlowModel::merge(then_flow.when_true, else_flow.when_true),
    FlowModel::merge(then_flow.when_false, else_flow.when_false),
    FlowModel::merge(then_flow.when_null, else_flow.when_null),
    FlowModel::merge(then_flow.when_not_null, else_flow.when_not_null)};
}

// ============================================================================
// Type Tests
// ============================================================================

ExpressionFlow FlowAnalyzer::visit_is(const IsExpr * expr, const FlowModel & before)
{
  const ExpressionFlow operand = visit_expr(expr->expr, before);
  const VariableDecl * var = promotable_variable(expr->expr, operand.after);
  if (var == nullptr || expr->testedType == nullptr) {
    return from_conditions(before, operand.after, operand.after);
  }

  const VariableModel tested = operand.after.lookup(var)->with_tested(expr->testedType);
  const FlowModel matched =
    operand.after.with_variable(var, tested.try_promote(ops_, expr->testedType));
  const FlowModel unmatched = operand.after.with_variable(var, tested);

  return expr->negated ? from_conditions(before, unmatched, matched)
                       : from_conditions(before, matched, unmatched);
}

ExpressionFlow FlowAnalyzer::visit_as(const AsExpr * expr, const FlowModel & before)
{
  const ExpressionFlow operand = visit_expr(expr->expr, before);
  FlowModel after = operand.after;
  if (const VariableDecl * var = promotable_variable(expr->expr, after)) {
    const VariableModel tested = after.lookup(var)->with_tested(expr->targetType);
    after = after.with_variable(var, tested.try_promote(ops_, expr->targetType));
  }
  return plain(before, after);
}

ExpressionFlow FlowAnalyzer::visit_null_check(const NullCheckExpr * expr, const FlowModel & before)
{
  const ExpressionFlow operand = visit_expr(expr->expr, before);
  FlowModel after = operand.after;
  if (const VariableDecl * var = promotable_variable(expr->expr, after)) {
    const VariableModel * vm = after.lookup(var);
    const Type * non_null = ops_.promote_to_non_null(vm->current_type());
    after = after.with_variable(var, vm->with_tested(non_null).try_promote(ops_, non_null));
  }
  if (type_of(expr->expr)->is_null()) {
    // `null!` always throws
    after = after.exit();
  }
  return plain(before, after);
}

// ============================================================================
// Calls and Closures
// ============================================================================

ExpressionFlow FlowAnalyzer::visit_call(const CallExpr * expr, const FlowModel & before)
{
  FlowModel model = before;
  if (expr->target != nullptr) {
    model = visit_expr(expr->target, model).after;
  }
  for (const Expr * arg : expr->args) {
    model = visit_expr(arg, model).after;
  }
  return plain(before, model);
}

ExpressionFlow FlowAnalyzer::visit_function_expr(
  const FunctionExpr * expr, const FlowModel & before)
{
  // Variables the closure may assign can change at any later point.
  const VariableSet none;
  const FlowModel after = before.conservative_join(none, assigned_->written(expr));

  const FlowModel entry =
    after.conservative_join(assigned_->written_anywhere(), assigned_->captured_anywhere());

  const bool outer_dead = in_dead_code_;
  analyze_body(
    expr, expr->params, expr->body, expr->exprBody, expr->returnType, expr->bodyKind, entry);
  in_dead_code_ = outer_dead;

  return plain(before, after);
}

}  // namespace flowan

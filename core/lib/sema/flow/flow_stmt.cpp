// flowan/sema/flow/flow_stmt.cpp - Statement and control-flow rules
//
// Every statement returns its `after` model at the depth of its `before`
// model. Constructs that branch open a split and close it at their merge
// point; break and continue models are brought down to the depth recorded
// for their target before they are joined.
//
#include <optional>
#include <utility>

#include "flowan/sema/flow/flow_analyzer.hpp"

namespace flowan
{

namespace
{

void join_into(std::optional<FlowModel> & acc, const FlowModel & model)
{
  acc = acc ? FlowModel::join(*acc, model) : model;
}

/// Close the split of a breakable statement
FlowModel close_split(const FlowModel & fallthrough, const std::optional<FlowModel> & breaks)
{
  return breaks ? FlowModel::merge(fallthrough, *breaks) : fallthrough.drop();
}

/// Drop the variables a statement list declares at its own level
FlowModel leave_scope(gsl::span<Stmt * const> stmts, FlowModel model)
{
  for (const Stmt * stmt : stmts) {
    if (const auto * decl = dyn_cast<VarDeclStmt>(stmt)) {
      for (const VariableDecl * var : decl->vars) {
        model = model.without_variable(var);
      }
    }
  }
  return model;
}

}  // namespace

// ============================================================================
// Dispatch
// ============================================================================

FlowModel FlowAnalyzer::visit_stmt(const Stmt * stmt, const FlowModel & before)
{
  if (stmt == nullptr) {
    return before;
  }

  const bool outer_dead = in_dead_code_;
  const auto * block = dyn_cast<BlockStmt>(stmt);
  if (!before.is_reachable() && (block == nullptr || block->stmts.empty())) {
    // A non-empty block reports its first dead statement instead of itself.
    if (!in_dead_code_) {
      report_dead_code(stmt);
    }
    in_dead_code_ = true;
  }

  FlowModel after;
  switch (stmt->get_kind()) {
    case NodeKind::BlockStmt:
      after = visit_block(cast<BlockStmt>(stmt), before);
      break;
    case NodeKind::ExprStmt:
      after = visit_expr(cast<ExprStmt>(stmt)->expr, before).after;
      break;
    case NodeKind::VarDeclStmt:
      after = visit_var_decl(cast<VarDeclStmt>(stmt), before);
      break;
    case NodeKind::IfStmt:
      after = visit_if(cast<IfStmt>(stmt), before);
      break;
    case NodeKind::WhileStmt:
      after = visit_while(cast<WhileStmt>(stmt), before);
      break;
    case NodeKind::DoWhileStmt:
      after = visit_do_while(cast<DoWhileStmt>(stmt), before);
      break;
    case NodeKind::ForStmt:
      after = visit_for(cast<ForStmt>(stmt), before);
      break;
    case NodeKind::BreakStmt:
      after = visit_break(cast<BreakStmt>(stmt), before);
      break;
    case NodeKind::ContinueStmt:
      after = visit_continue(cast<ContinueStmt>(stmt), before);
      break;
    case NodeKind::ReturnStmt:
      after = visit_return(cast<ReturnStmt>(stmt), before);
      break;
    case NodeKind::YieldStmt:
      after = visit_yield(cast<YieldStmt>(stmt), before);
      break;
    case NodeKind::SwitchStmt:
      after = visit_switch(cast<SwitchStmt>(stmt), before);
      break;
    case NodeKind::LabeledStmt:
      after = visit_labeled(cast<LabeledStmt>(stmt), before);
      break;
    case NodeKind::TryStmt:
      after = visit_try(cast<TryStmt>(stmt), before);
      break;
    default:
      after = before;
      break;
  }

  in_dead_code_ = outer_dead;

  auto & slot = results_->statements[stmt];
  slot.before = before;
  slot.after = after;
  if (observer_ != nullptr) {
    observer_->on_statement(*stmt, slot);
  }
  return after;
}

// ============================================================================
// Blocks and Declarations
// ============================================================================

FlowModel FlowAnalyzer::visit_statements(gsl::span<Stmt * const> stmts, const FlowModel & before)
{
  const bool outer_dead = in_dead_code_;
  FlowModel model = before;
  for (const Stmt * stmt : stmts) {
    const bool reachable = model.is_reachable();
    model = visit_stmt(stmt, model);
    if (!reachable) {
      // Only the first statement of a dead run is reported.
      in_dead_code_ = true;
    }
  }
  in_dead_code_ = outer_dead;
  return model;
}

FlowModel FlowAnalyzer::visit_block(const BlockStmt * stmt, const FlowModel & before)
{
  return leave_scope(stmt->stmts, visit_statements(stmt->stmts, before));
}

FlowModel FlowAnalyzer::declare(const VariableDecl * var, const FlowModel & before, bool initialized)
{
  const Type * declared =
    var->declaredType != nullptr ? var->declaredType : ops_.types().dynamic_type();
  const bool implicitly_typed = !initialized && var->is_implicitly_typed();
  return before.with_variable(var, VariableModel::fresh(declared, initialized, implicitly_typed));
}

FlowModel FlowAnalyzer::visit_var_decl(const VarDeclStmt * stmt, const FlowModel & before)
{
  FlowModel model = before;
  for (const VariableDecl * var : stmt->vars) {
    if (var->initializer == nullptr) {
      model = declare(var, model, /*initialized=*/false);
      continue;
    }

    model = visit_expr(var->initializer, model).after;
    if (var->declaredType != nullptr) {
      model = declare(var, model, /*initialized=*/true);
      continue;
    }

    // `var x = e;` takes the type of e. An intersection X & T declares X
    // and starts out promoted to X & T; `null` infers dynamic.
    const Type * init_type = type_of(var->initializer);
    VariableModel vm;
    if (init_type->kind == TypeKind::PromotedTypeParameter) {
      vm = VariableModel::fresh(init_type->inner, true);
      vm.promoted_types.push_back(init_type);
    } else if (init_type->is_null()) {
      vm = VariableModel::fresh(ops_.types().dynamic_type(), true);
    } else {
      vm = VariableModel::fresh(init_type, true);
    }
    model = model.with_variable(var, std::move(vm));
  }
  return model;
}

// ============================================================================
// Branches
// ============================================================================

FlowModel FlowAnalyzer::visit_if(const IfStmt * stmt, const FlowModel & before)
{
  const ExpressionFlow cond = visit_expr(stmt->condition, before.split());
  const FlowModel then_after = visit_stmt(stmt->thenBranch, cond.when_true);
  const FlowModel else_after =
    stmt->elseBranch != nullptr ? visit_stmt(stmt->elseBranch, cond.when_false) : cond.when_false;
  return FlowModel::merge(then_after, else_after);
}

FlowModel FlowAnalyzer::visit_switch(const SwitchStmt * stmt, const FlowModel & before)
{
  const ExpressionFlow scrutinee = visit_expr(stmt->scrutinee, before);
  const FlowModel split = scrutinee.after.split();
  push_target(stmt, split);

  std::optional<FlowModel> acc;
  bool has_default = false;
  for (const SwitchCase * group : stmt->cases) {
    has_default = has_default || group->hasDefault;
    for (const Expr * head : group->heads) {
      (void)visit_expr(head, split);
    }
    // Case bodies end with an implicit break.
    join_into(acc, leave_scope(group->body, visit_statements(group->body, split)));
  }

  JumpTarget target = pop_target();
  if (target.breaks) {
    join_into(acc, *target.breaks);
  }
  if (!stmt->isExhaustive && !has_default) {
    join_into(acc, split);
  }
  results_->statements[stmt].break_model = target.breaks;

  return acc ? acc->drop() : split.exit().drop();
}

FlowModel FlowAnalyzer::visit_labeled(const LabeledStmt * stmt, const FlowModel & before)
{
  const FlowModel split = before.split();
  push_target(stmt, split);
  const FlowModel body_after = visit_stmt(stmt->body, split);
  JumpTarget target = pop_target();
  results_->statements[stmt].break_model = target.breaks;
  return close_split(body_after, target.breaks);
}

// ============================================================================
// Loops
// ============================================================================

FlowModel FlowAnalyzer::visit_while(const WhileStmt * stmt, const FlowModel & before)
{
  const FlowModel head =
    before.conservative_join(assigned_->written(stmt), assigned_->captured(stmt)).split();
  push_target(stmt, head);

  const ExpressionFlow cond = visit_expr(stmt->condition, head);
  (void)visit_stmt(stmt->body, cond.when_true);

  JumpTarget target = pop_target();
  auto & slot = results_->statements[stmt];
  slot.break_model = target.breaks;
  slot.continue_model = target.continues;
  return close_split(cond.when_false, target.breaks);
}

FlowModel FlowAnalyzer::visit_do_while(const DoWhileStmt * stmt, const FlowModel & before)
{
  const FlowModel head =
    before.conservative_join(assigned_->written(stmt), assigned_->captured(stmt)).split();
  push_target(stmt, head);

  FlowModel cond_before = visit_stmt(stmt->body, head);
  if (const JumpTarget * target = find_target(stmt); target != nullptr && target->continues) {
    cond_before = FlowModel::join(cond_before, *target->continues);
  }
  const ExpressionFlow cond = visit_expr(stmt->condition, cond_before);

  JumpTarget target = pop_target();
  auto & slot = results_->statements[stmt];
  slot.break_model = target.breaks;
  slot.continue_model = target.continues;
  return close_split(cond.when_false, target.breaks);
}

FlowModel FlowAnalyzer::visit_for(const ForStmt * stmt, const FlowModel & before)
{
  const FlowModel after_init = visit_stmt(stmt->init, before);
  const FlowModel head =
    after_init.conservative_join(assigned_->written(stmt), assigned_->captured(stmt)).split();
  push_target(stmt, head);

  FlowModel when_true = head;
  FlowModel when_false = head.exit();  // `for (;;)` only leaves through break
  if (stmt->condition != nullptr) {
    const ExpressionFlow cond = visit_expr(stmt->condition, head);
    when_true = cond.when_true;
    when_false = cond.when_false;
  }

  FlowModel updaters = visit_stmt(stmt->body, when_true);
  if (const JumpTarget * target = find_target(stmt); target != nullptr && target->continues) {
    updaters = FlowModel::join(updaters, *target->continues);
  }
  for (const Expr * update : stmt->updaters) {
    updaters = visit_expr(update, updaters).after;
  }

  JumpTarget target = pop_target();
  auto & slot = results_->statements[stmt];
  slot.break_model = target.breaks;
  slot.continue_model = target.continues;

  FlowModel after = close_split(when_false, target.breaks);
  if (const auto * decl = dyn_cast<VarDeclStmt>(stmt->init)) {
    for (const VariableDecl * var : decl->vars) {
      after = after.without_variable(var);
    }
  }
  return after;
}

// ============================================================================
// Jumps
// ============================================================================

FlowModel FlowAnalyzer::visit_break(const BreakStmt * stmt, const FlowModel & before)
{
  if (JumpTarget * target = find_target(stmt->target)) {
    join_into(target->breaks, before.unsplit_to(target->depth));
  }
  return before.exit();
}

FlowModel FlowAnalyzer::visit_continue(const ContinueStmt * stmt, const FlowModel & before)
{
  if (JumpTarget * target = find_target(stmt->target)) {
    join_into(target->continues, before.unsplit_to(target->depth));
  }
  return before.exit();
}

FlowModel FlowAnalyzer::visit_return(const ReturnStmt * stmt, const FlowModel & before)
{
  FlowModel model = before;
  const Type * type = nullptr;
  if (stmt->value != nullptr) {
    model = visit_expr(stmt->value, model).after;
    type = type_of(stmt->value);
  }
  results_->exits.push_back(
    ExitContribution{ExitKind::Return, stmt, functions_.back().owner, type, model.is_reachable()});
  return model.exit();
}

FlowModel FlowAnalyzer::visit_yield(const YieldStmt * stmt, const FlowModel & before)
{
  const FlowModel model = visit_expr(stmt->value, before).after;
  results_->exits.push_back(ExitContribution{
    ExitKind::Yield, stmt, functions_.back().owner, type_of(stmt->value), model.is_reachable()});
  return model;
}

// ============================================================================
// Exceptions
// ============================================================================

FlowModel FlowAnalyzer::visit_try(const TryStmt * stmt, const FlowModel & before)
{
  const FlowModel body_after = visit_stmt(stmt->body, before);

  // An exception may leave the body after any of its writes.
  const FlowModel catch_entry = before.conservative_join(
    assigned_->written(stmt->body), assigned_->captured(stmt->body));

  FlowModel after = body_after;
  for (const CatchClause * clause : stmt->catches) {
    FlowModel model = catch_entry;
    if (clause->exception != nullptr) {
      model = declare(clause->exception, model, /*initialized=*/true);
    }
    if (clause->stackTrace != nullptr) {
      model = declare(clause->stackTrace, model, /*initialized=*/true);
    }
    model = visit_stmt(clause->body, model);
    model = model.without_variable(clause->exception).without_variable(clause->stackTrace);
    after = FlowModel::join(after, model);
  }

  if (stmt->finallyBlock == nullptr) {
    return after;
  }

  VariableSet written = assigned_->written(stmt->body);
  VariableSet captured = assigned_->captured(stmt->body);
  for (const CatchClause * clause : stmt->catches) {
    const auto & w = assigned_->written(clause);
    const auto & c = assigned_->captured(clause);
    written.insert(w.begin(), w.end());
    captured.insert(c.begin(), c.end());
  }

  const FlowModel finally_entry =
    FlowModel::join(after, before.conservative_join(written, captured));
  const FlowModel finally_after = visit_stmt(stmt->finallyBlock, finally_entry);
  return FlowModel::attach_finally(
    ops_, after, finally_after, assigned_->written(stmt->finallyBlock));
}

}  // namespace flowan

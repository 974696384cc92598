// flowan/sema/flow/flow_model.cpp - Flow knowledge at one program point
#include "flowan/sema/flow/flow_model.hpp"

#include <algorithm>

namespace flowan
{

FlowModel FlowModel::entry()
{
  FlowModel m;
  m.reachable_.push_back(true);
  return m;
}

bool FlowModel::is_reachable() const noexcept
{
  return std::all_of(reachable_.begin(), reachable_.end(), [](bool r) { return r; });
}

FlowModel FlowModel::split() const
{
  FlowModel m = *this;
  m.reachable_.push_back(true);
  return m;
}

FlowModel FlowModel::drop() const
{
  if (reachable_.size() <= 1) {
    return *this;
  }
  FlowModel m = *this;
  const bool top = m.reachable_.back();
  m.reachable_.pop_back();
  m.reachable_.back() = m.reachable_.back() && top;
  return m;
}

FlowModel FlowModel::unsplit_to(size_t target_depth) const
{
  FlowModel m = *this;
  while (m.reachable_.size() > target_depth && m.reachable_.size() > 1) {
    m = m.drop();
  }
  return m;
}

FlowModel FlowModel::exit() const
{
  FlowModel m = *this;
  if (!m.reachable_.empty()) {
    m.reachable_.back() = false;
  }
  return m;
}

const VariableModel * FlowModel::lookup(const VariableDecl * var) const
{
  auto it = variables_.find(var);
  return it != variables_.end() ? &it->second : nullptr;
}

FlowModel FlowModel::with_variable(const VariableDecl * var, VariableModel model) const
{
  FlowModel m = *this;
  m.variables_[var] = std::move(model);
  return m;
}

FlowModel FlowModel::without_variable(const VariableDecl * var) const
{
  if (variables_.count(var) == 0) {
    return *this;
  }
  FlowModel m = *this;
  m.variables_.erase(var);
  return m;
}

FlowModel FlowModel::assign(
  const TypeOperations & ops, const FlowOptions & options, const VariableDecl * var,
  const Type * written_type) const
{
  const VariableModel * current = lookup(var);
  if (current == nullptr) {
    return *this;
  }
  return with_variable(var, current->write(ops, options, written_type));
}

FlowModel FlowModel::conservative_join(
  const VariableSet & written, const VariableSet & captured) const
{
  FlowModel m = *this;
  for (const VariableDecl * var : written) {
    auto it = m.variables_.find(var);
    if (it != m.variables_.end()) {
      it->second = it->second.discard_promotions_and_mark_not_unassigned();
    }
  }
  for (const VariableDecl * var : captured) {
    auto it = m.variables_.find(var);
    if (it != m.variables_.end()) {
      it->second = it->second.write_capture();
    }
  }
  return m;
}

FlowModel FlowModel::join(const FlowModel & a, const FlowModel & b)
{
  // Both sides are expected at the same depth; tolerate a mismatch by
  // closing the deeper side's extra splits.
  const size_t depth = std::min(a.depth(), b.depth());
  if (a.depth() != b.depth()) {
    return join(a.unsplit_to(depth), b.unsplit_to(depth));
  }

  const bool a_live = a.is_locally_reachable();
  const bool b_live = b.is_locally_reachable();
  if (a_live && !b_live) return a;
  if (b_live && !a_live) return b;

  FlowModel m;
  m.reachable_.resize(depth);
  for (size_t i = 0; i + 1 < depth; ++i) {
    m.reachable_[i] = a.reachable_[i] && b.reachable_[i];
  }
  if (depth > 0) {
    m.reachable_[depth - 1] = a_live || b_live;
  }

  auto it_a = a.variables_.begin();
  auto it_b = b.variables_.begin();
  while (it_a != a.variables_.end() && it_b != b.variables_.end()) {
    if (it_a->first < it_b->first) {
      ++it_a;
    } else if (it_b->first < it_a->first) {
      ++it_b;
    } else {
      m.variables_.emplace_hint(
        m.variables_.end(), it_a->first, VariableModel::join(it_a->second, it_b->second));
      ++it_a;
      ++it_b;
    }
  }
  return m;
}

FlowModel FlowModel::merge(const FlowModel & a, const FlowModel & b)
{
  return join(a, b).drop();
}

FlowModel FlowModel::attach_finally(
  const TypeOperations & ops, const FlowModel & after_try_catch, const FlowModel & after_finally,
  const VariableSet & written_in_finally)
{
  FlowModel m = after_try_catch;
  if (!m.reachable_.empty() && !after_finally.is_locally_reachable()) {
    m.reachable_.back() = false;
  }

  for (auto & [var, model] : m.variables_) {
    const VariableModel * fin = after_finally.lookup(var);
    if (fin == nullptr) {
      continue;
    }
    if (written_in_finally.count(var) != 0) {
      model = *fin;
      continue;
    }
    // Not written in finally: keep the try/catch knowledge and add what the
    // finally block learned through tests.
    model.assigned = model.assigned || fin->assigned;
    model.unassigned = model.unassigned && fin->unassigned;
    if (model.write_captured || fin->write_captured) {
      continue;
    }
    for (const Type * tested : fin->tested_types) {
      model = model.with_tested(tested);
    }
    for (const Type * promoted : fin->promoted_types) {
      if (ops.is_strict_subtype_of(promoted, model.current_type())) {
        model.promoted_types.push_back(promoted);
      }
    }
  }
  return m;
}

}  // namespace flowan

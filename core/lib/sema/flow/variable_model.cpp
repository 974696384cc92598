// flowan/sema/flow/variable_model.cpp - Per-variable flow knowledge
#include "flowan/sema/flow/variable_model.hpp"

#include <algorithm>
#include <iterator>

namespace flowan
{

namespace
{

/// Insert keeping Type::id order without duplicates
void insert_sorted(std::vector<const Type *> & types, const Type * type)
{
  auto it = std::lower_bound(types.begin(), types.end(), type, TypeIdLess{});
  if (it == types.end() || *it != type) {
    types.insert(it, type);
  }
}

std::vector<const Type *> union_sorted(
  const std::vector<const Type *> & a, const std::vector<const Type *> & b)
{
  std::vector<const Type *> out;
  out.reserve(a.size() + b.size());
  std::set_union(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out), TypeIdLess{});
  return out;
}

/// Elements of @p a that also occur in @p b, in a's order
std::vector<const Type *> ordered_intersection(
  const std::vector<const Type *> & a, const std::vector<const Type *> & b)
{
  std::vector<const Type *> out;
  for (const Type * t : a) {
    if (std::find(b.begin(), b.end(), t) != b.end()) {
      out.push_back(t);
    }
  }
  return out;
}

/// Bound of a (possibly promoted) type parameter, nullptr for other types
const Type * type_parameter_bound(const Type * type)
{
  if (type->kind == TypeKind::TypeParameter) return type->inner;
  if (type->kind == TypeKind::PromotedTypeParameter) return type->promoted;
  return nullptr;
}

/// The bare type parameter X of X or X & S
const Type * bare_type_parameter(const Type * type)
{
  return type->kind == TypeKind::PromotedTypeParameter ? type->inner : type;
}

}  // namespace

VariableModel VariableModel::fresh(const Type * declared, bool initialized, bool implicitly_typed)
{
  VariableModel m;
  m.declared_type = declared;
  m.assigned = initialized;
  m.unassigned = !initialized;
  m.implicitly_typed = implicitly_typed;
  return m;
}

bool VariableModel::is_tested(const Type * type) const
{
  return std::binary_search(tested_types.begin(), tested_types.end(), type, TypeIdLess{});
}

VariableModel VariableModel::with_tested(const Type * type) const
{
  if (write_captured || type == nullptr || is_tested(type)) {
    return *this;
  }
  VariableModel m = *this;
  insert_sorted(m.tested_types, type);
  return m;
}

VariableModel VariableModel::try_promote(const TypeOperations & ops, const Type * tested) const
{
  if (write_captured || tested == nullptr) {
    return *this;
  }

  const Type * current = current_type();
  const Type * target = nullptr;
  if (ops.is_subtype_of(tested, current)) {
    target = tested;
  } else if (const Type * bound = type_parameter_bound(current)) {
    if (ops.is_subtype_of(tested, bound)) {
      target = ops.types().promoted_type_parameter(bare_type_parameter(current), tested);
    }
  }

  if (target == nullptr || !ops.is_strict_subtype_of(target, current)) {
    return *this;
  }

  VariableModel m = *this;
  m.promoted_types.push_back(target);
  return m;
}

const Type * VariableModel::choose_type_of_interest(
  const TypeOperations & ops, const Type * written_type, const Type * current) const
{
  std::vector<const Type *> candidates;
  for (const Type * interest : tested_types) {
    if (
      ops.is_subtype_of(written_type, interest) && ops.is_strict_subtype_of(interest, current)) {
      if (interest == written_type) {
        return interest;
      }
      candidates.push_back(interest);
    }
  }

  // The most specific candidate wins; none when two are unrelated.
  for (const Type * candidate : candidates) {
    const bool below_all = std::all_of(candidates.begin(), candidates.end(), [&](const Type * other) {
      return ops.is_subtype_of(candidate, other);
    });
    if (below_all) {
      return candidate;
    }
  }
  return nullptr;
}

VariableModel VariableModel::write(
  const TypeOperations & ops, const FlowOptions & options, const Type * written_type) const
{
  VariableModel m = *this;
  m.assigned = true;
  m.unassigned = false;

  if (write_captured || written_type == nullptr) {
    return m;
  }

  // Demotion: keep the longest prefix that still holds for the new value.
  auto keep = std::find_if(promoted_types.begin(), promoted_types.end(), [&](const Type * p) {
    return !ops.is_subtype_of(written_type, p);
  });
  m.promoted_types.assign(promoted_types.begin(), keep);

  const bool initialization_applies = options.initialization_promotion && unassigned &&
                                      implicitly_typed && promoted_types.empty() &&
                                      tested_types.empty() && !written_type->is_dynamic();
  if (initialization_applies) {
    if (ops.is_strict_subtype_of(written_type, m.current_type())) {
      m.promoted_types.push_back(written_type);
    }
    return m;
  }

  if (!options.assignment_promotion) {
    return m;
  }

  const Type * current = m.current_type();
  if (!ops.is_strict_subtype_of(written_type, current)) {
    return m;
  }
  if (const Type * target = choose_type_of_interest(ops, written_type, current)) {
    m.promoted_types.push_back(target);
  }
  return m;
}

VariableModel VariableModel::discard_promotions_and_mark_not_unassigned() const
{
  VariableModel m = *this;
  m.promoted_types.clear();
  m.unassigned = false;
  return m;
}

VariableModel VariableModel::write_capture() const
{
  VariableModel m = *this;
  m.promoted_types.clear();
  m.tested_types.clear();
  m.unassigned = false;
  m.write_captured = true;
  return m;
}

VariableModel VariableModel::join(const VariableModel & a, const VariableModel & b)
{
  VariableModel m;
  m.declared_type = a.declared_type;
  m.implicitly_typed = a.implicitly_typed && b.implicitly_typed;
  m.write_captured = a.write_captured || b.write_captured;
  m.assigned = a.assigned && b.assigned;
  m.unassigned = a.unassigned && b.unassigned;
  if (!m.write_captured) {
    m.promoted_types = ordered_intersection(a.promoted_types, b.promoted_types);
    m.tested_types = union_sorted(a.tested_types, b.tested_types);
  }
  return m;
}

bool VariableModel::operator==(const VariableModel & other) const
{
  return declared_type == other.declared_type && promoted_types == other.promoted_types &&
         tested_types == other.tested_types && assigned == other.assigned &&
         unassigned == other.unassigned && write_captured == other.write_captured &&
         implicitly_typed == other.implicitly_typed;
}

}  // namespace flowan

// flowan/ast/json_reader.cpp - Build resolved function bodies from JSON
//
#include "flowan/ast/json_reader.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include "flowan/ast/ast_enums.hpp"
#include "flowan/basic/casting.hpp"

namespace flowan
{

using nlohmann::json;

namespace
{

bool parse_binary_op(std::string_view text, BinaryOp & out)
{
  for (auto op :
       {BinaryOp::Add, BinaryOp::Sub, BinaryOp::Mul, BinaryOp::Div, BinaryOp::Mod, BinaryOp::Eq,
        BinaryOp::Ne, BinaryOp::Lt, BinaryOp::Le, BinaryOp::Gt, BinaryOp::Ge, BinaryOp::And,
        BinaryOp::Or, BinaryOp::IfNull}) {
    if (to_string(op) == text) {
      out = op;
      return true;
    }
  }
  return false;
}

bool parse_body_kind(std::string_view text, FunctionBodyKind & out)
{
  for (auto kind :
       {FunctionBodyKind::Sync, FunctionBodyKind::Async, FunctionBodyKind::SyncStar,
        FunctionBodyKind::AsyncStar}) {
    if (to_string(kind) == text) {
      out = kind;
      return true;
    }
  }
  return false;
}

}  // namespace

// ============================================================================
// Construction and Helpers
// ============================================================================

JsonUnitReader::JsonUnitReader(
  AstContext & ast, TypeContext & types, ClassHierarchy & classes, DiagnosticBag & diags)
: ast_(ast), types_(types), classes_(classes), diags_(diags)
{
}

SourceRange JsonUnitReader::range_of(const json & j)
{
  if (!j.is_object()) return {};
  auto it = j.find("range");
  if (it == j.end() || !it->is_array() || it->size() != 2) return {};
  const json & b = (*it)[0];
  const json & e = (*it)[1];
  if (!b.is_number_unsigned() || !e.is_number_unsigned()) return {};
  return {b.get<uint32_t>(), e.get<uint32_t>()};
}

std::string_view JsonUnitReader::str(const json & j, const char * key)
{
  if (!j.is_object()) return {};
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return {};
  return ast_.intern(it->get_ref<const std::string &>());
}

bool JsonUnitReader::flag(const json & j, const char * key)
{
  if (!j.is_object()) return false;
  auto it = j.find(key);
  return it != j.end() && it->is_boolean() && it->get<bool>();
}

void JsonUnitReader::malformed(const json & j, const std::string & message)
{
  diags_.report(DiagCode::MalformedInput, range_of(j), message);
}

const Type * JsonUnitReader::parse_type_text(std::string_view text, SourceRange range)
{
  const Type * type = parse_type(types_, text, &type_params_);
  if (type == nullptr) {
    diags_.report(DiagCode::UnknownType, range, "Cannot parse type '" + std::string(text) + "'");
    return types_.invalid_type();
  }
  return type;
}

const Type * JsonUnitReader::read_type(const json & j, const char * key)
{
  if (!j.is_object()) return nullptr;
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return nullptr;
  if (!it->is_string()) {
    malformed(j, std::string("'") + key + "' must be a type name string");
    return types_.invalid_type();
  }
  return parse_type_text(it->get_ref<const std::string &>(), range_of(j));
}

void JsonUnitReader::define(VariableDecl * var)
{
  if (scopes_.empty()) push_scope();
  scopes_.back()[var->name] = var;
}

VariableDecl * JsonUnitReader::lookup(std::string_view name) const
{
  for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
    auto found = it->find(name);
    if (found != it->end()) return found->second;
  }
  return nullptr;
}

// ============================================================================
// Declarations
// ============================================================================

CompilationUnit * JsonUnitReader::read(const json & doc)
{
  if (!doc.is_object()) {
    malformed(doc, "Unit must be a JSON object");
    return nullptr;
  }

  if (auto it = doc.find("classes"); it != doc.end()) {
    if (it->is_array()) {
      for (const auto & c : *it) read_class(c);
    } else {
      malformed(doc, "'classes' must be an array");
    }
  }

  std::vector<FunctionDecl *> functions;
  if (auto it = doc.find("functions"); it != doc.end() && it->is_array()) {
    for (const auto & f : *it) {
      if (FunctionDecl * fn = read_function(f)) functions.push_back(fn);
    }
  } else {
    malformed(doc, "Unit must have a 'functions' array");
  }

  auto * unit = ast_.create<CompilationUnit>(range_of(doc));
  unit->functions = ast_.copy_to_arena(functions);
  return unit;
}

void JsonUnitReader::read_class(const json & j)
{
  const std::string_view name = str(j, "name");
  if (name.empty()) {
    malformed(j, "Class declaration without a name");
    return;
  }

  std::vector<const Type *> supertypes;
  if (auto it = j.find("supertypes"); it != j.end() && it->is_array()) {
    for (const auto & s : *it) {
      if (!s.is_string()) {
        malformed(j, "Supertypes of '" + std::string(name) + "' must be type names");
        continue;
      }
      supertypes.push_back(parse_type_text(s.get_ref<const std::string &>(), range_of(j)));
    }
  }
  if (supertypes.empty()) {
    supertypes.push_back(types_.object_type());
  }
  classes_.declare(name, std::move(supertypes));
}

void JsonUnitReader::read_type_parameters(const json & j)
{
  auto it = j.find("type_parameters");
  if (it == j.end() || !it->is_array()) return;

  for (const auto & p : *it) {
    const std::string_view name = str(p, "name");
    if (name.empty()) {
      malformed(p, "Type parameter without a name");
      continue;
    }
    const Type * bound = read_type(p, "bound");
    type_params_[std::string(name)] = types_.type_parameter(name, bound);
  }
}

VariableDecl * JsonUnitReader::read_variable(const json & j)
{
  const std::string_view name = str(j, "name");
  if (name.empty()) {
    malformed(j, "Variable declaration without a name");
  }
  auto * var = ast_.create<VariableDecl>(name, range_of(j));
  var->declaredType = read_type(j, "type");
  var->isFinal = flag(j, "final");
  var->isLate = flag(j, "late");
  return var;
}

gsl::span<VariableDecl *> JsonUnitReader::read_params(const json & j)
{
  std::vector<VariableDecl *> params;
  if (auto it = j.find("params"); it != j.end() && it->is_array()) {
    for (const auto & p : *it) {
      VariableDecl * param = read_variable(p);
      define(param);
      params.push_back(param);
    }
  }
  return ast_.copy_to_arena(params);
}

FunctionDecl * JsonUnitReader::read_function(const json & j)
{
  if (!j.is_object()) {
    malformed(j, "Function must be a JSON object");
    return nullptr;
  }

  auto * fn = ast_.create<FunctionDecl>(str(j, "name"), range_of(j));
  type_params_.clear();
  read_type_parameters(j);
  targets_.clear();
  scopes_.clear();
  push_scope();

  fn->params = read_params(j);
  fn->returnType = read_type(j, "return_type");
  if (const std::string_view kind = str(j, "body_kind"); !kind.empty()) {
    if (!parse_body_kind(kind, fn->bodyKind)) {
      malformed(j, "Unknown body kind '" + std::string(kind) + "'");
    }
  }

  if (auto it = j.find("expression_body"); it != j.end()) {
    fn->exprBody = read_expr(*it);
  } else if (auto body = j.find("body"); body != j.end()) {
    fn->body = read_block(*body);
  }

  pop_scope();
  return fn;
}

FunctionExpr * JsonUnitReader::read_closure(const json & j)
{
  auto * fn = ast_.create<FunctionExpr>(range_of(j));

  // Jumps never cross a closure boundary.
  std::vector<JumpEntry> outer_targets;
  outer_targets.swap(targets_);
  push_scope();

  fn->params = read_params(j);
  fn->returnType = read_type(j, "return_type");
  if (const std::string_view kind = str(j, "body_kind"); !kind.empty()) {
    if (!parse_body_kind(kind, fn->bodyKind)) {
      malformed(j, "Unknown body kind '" + std::string(kind) + "'");
    }
  }
  if (auto it = j.find("expression_body"); it != j.end()) {
    fn->exprBody = read_expr(*it);
  } else if (auto body = j.find("body"); body != j.end()) {
    fn->body = read_block(*body);
  } else {
    malformed(j, "Function expression needs 'body' or 'expression_body'");
  }

  pop_scope();
  targets_.swap(outer_targets);
  return fn;
}

// ============================================================================
// Statements
// ============================================================================

BlockStmt * JsonUnitReader::read_block(const json & j)
{
  // A bare array is accepted as shorthand for a block.
  if (j.is_array()) {
    push_scope();
    auto * block = ast_.create<BlockStmt>(read_stmt_list(j));
    pop_scope();
    return block;
  }
  if (!j.is_object() || str(j, "kind") != "block") {
    malformed(j, "Expected a block");
    return ast_.create<BlockStmt>(range_of(j));
  }
  auto it = j.find("statements");
  push_scope();
  auto * block = ast_.create<BlockStmt>(
    it != j.end() ? read_stmt_list(*it) : gsl::span<Stmt *>{}, range_of(j));
  pop_scope();
  return block;
}

gsl::span<Stmt *> JsonUnitReader::read_stmt_list(const json & j)
{
  std::vector<Stmt *> stmts;
  if (!j.is_array()) {
    malformed(j, "Expected a list of statements");
    return {};
  }
  for (const auto & s : j) {
    stmts.push_back(read_stmt(s));
  }
  return ast_.copy_to_arena(stmts);
}

Stmt * JsonUnitReader::read_stmt(const json & j)
{
  const std::string_view kind = str(j, "kind");
  const SourceRange range = range_of(j);

  if (kind == "block") return read_block(j);
  if (kind == "expr") {
    auto it = j.find("expr");
    return ast_.create<ExprStmt>(it != j.end() ? read_expr(*it) : placeholder_expr(range), range);
  }
  if (kind == "var") return read_var_decl(j);
  if (kind == "if") {
    Expr * cond = j.contains("condition") ? read_expr(j["condition"]) : placeholder_expr(range);
    Stmt * then_branch = j.contains("then") ? read_stmt(j["then"]) : nullptr;
    Stmt * else_branch = j.contains("else") ? read_stmt(j["else"]) : nullptr;
    if (then_branch == nullptr) {
      malformed(j, "'if' needs a 'then' statement");
      then_branch = ast_.create<BlockStmt>(range);
    }
    return ast_.create<IfStmt>(cond, then_branch, else_branch, range);
  }
  if (kind == "while" || kind == "do" || kind == "for") return read_loop(j, kind, {});
  if (kind == "break") return read_jump(j, true);
  if (kind == "continue") return read_jump(j, false);
  if (kind == "return") {
    auto it = j.find("value");
    return ast_.create<ReturnStmt>(it != j.end() ? read_expr(*it) : nullptr, range);
  }
  if (kind == "yield") {
    auto it = j.find("value");
    auto * stmt =
      ast_.create<YieldStmt>(it != j.end() ? read_expr(*it) : placeholder_expr(range), range);
    stmt->isStar = flag(j, "star");
    return stmt;
  }
  if (kind == "switch") return read_switch(j);
  if (kind == "labeled") return read_labeled(j);
  if (kind == "try") return read_try(j);

  malformed(j, "Unknown statement kind '" + std::string(kind) + "'");
  return ast_.create<BlockStmt>(range);
}

Stmt * JsonUnitReader::read_var_decl(const json & j)
{
  std::vector<VariableDecl *> vars;
  auto it = j.find("declarations");
  if (it == j.end() || !it->is_array()) {
    malformed(j, "'var' needs a 'declarations' array");
  } else {
    for (const auto & d : *it) {
      VariableDecl * var = read_variable(d);
      // The initializer sees the enclosing scope, not the new variable.
      if (auto init = d.find("init"); init != d.end()) {
        var->initializer = read_expr(*init);
      }
      define(var);
      vars.push_back(var);
    }
  }
  return ast_.create<VarDeclStmt>(ast_.copy_to_arena(vars), range_of(j));
}

Stmt * JsonUnitReader::read_loop(const json & j, std::string_view kind, std::string_view label)
{
  const SourceRange range = range_of(j);
  auto read_body = [&]() -> Stmt * {
    if (!j.contains("body")) {
      malformed(j, "Loop needs a 'body' statement");
      return ast_.create<BlockStmt>(range);
    }
    return read_stmt(j["body"]);
  };
  auto read_cond = [&]() -> Expr * {
    return j.contains("condition") ? read_expr(j["condition"]) : nullptr;
  };

  if (kind == "while") {
    auto * loop = ast_.create<WhileStmt>(range);
    loop->condition = read_cond();
    if (loop->condition == nullptr) {
      malformed(j, "'while' needs a 'condition'");
      loop->condition = placeholder_expr(range);
    }
    targets_.push_back(JumpEntry{loop, {}, label, true, false});
    loop->body = read_body();
    targets_.pop_back();
    return loop;
  }

  if (kind == "do") {
    auto * loop = ast_.create<DoWhileStmt>(range);
    targets_.push_back(JumpEntry{loop, {}, label, true, false});
    loop->body = read_body();
    targets_.pop_back();
    loop->condition = read_cond();
    if (loop->condition == nullptr) {
      malformed(j, "'do' needs a 'condition'");
      loop->condition = placeholder_expr(range);
    }
    return loop;
  }

  auto * loop = ast_.create<ForStmt>(range);
  push_scope();
  if (j.contains("init")) {
    loop->init = read_stmt(j["init"]);
  }
  loop->condition = read_cond();
  if (auto it = j.find("updaters"); it != j.end()) {
    loop->updaters = read_expr_list(*it);
  }
  targets_.push_back(JumpEntry{loop, {}, label, true, false});
  loop->body = read_body();
  targets_.pop_back();
  pop_scope();
  return loop;
}

Stmt * JsonUnitReader::read_jump(const json & j, bool is_break)
{
  const std::string_view label = str(j, "label");
  const SourceRange range = range_of(j);

  Stmt * target = nullptr;
  for (auto it = targets_.rbegin(); it != targets_.rend() && target == nullptr; ++it) {
    if (label.empty()) {
      if (it->is_loop || (is_break && it->is_switch)) target = it->stmt;
    } else if (is_break) {
      if (it->label == label) target = it->stmt;
    } else if (it->is_loop && it->loop_label == label) {
      target = it->stmt;
    }
  }

  if (target == nullptr) {
    std::string message;
    if (!label.empty()) {
      message = std::string(is_break ? "'break'" : "'continue'") + " to unknown label '" +
                std::string(label) + "'";
    } else {
      message = is_break ? "'break' outside of a loop or switch" : "'continue' outside of a loop";
    }
    diags_.report(DiagCode::InvalidJumpTarget, range, message);
  }

  if (is_break) {
    auto * stmt = ast_.create<BreakStmt>(range);
    stmt->label = label;
    stmt->target = target;
    return stmt;
  }
  auto * stmt = ast_.create<ContinueStmt>(range);
  stmt->label = label;
  stmt->target = target;
  return stmt;
}

Stmt * JsonUnitReader::read_switch(const json & j)
{
  const SourceRange range = range_of(j);
  auto * stmt = ast_.create<SwitchStmt>(range);
  stmt->scrutinee = j.contains("scrutinee") ? read_expr(j["scrutinee"]) : placeholder_expr(range);
  stmt->isExhaustive = flag(j, "exhaustive");

  targets_.push_back(JumpEntry{stmt, {}, {}, false, true});
  std::vector<SwitchCase *> cases;
  if (auto it = j.find("cases"); it != j.end() && it->is_array()) {
    for (const auto & c : *it) {
      auto * group = ast_.create<SwitchCase>(range_of(c));
      if (auto heads = c.find("heads"); heads != c.end()) {
        group->heads = read_expr_list(*heads);
      }
      group->hasDefault = flag(c, "default");
      push_scope();
      if (auto body = c.find("body"); body != c.end()) {
        group->body = read_stmt_list(*body);
      }
      pop_scope();
      cases.push_back(group);
    }
  }
  targets_.pop_back();

  stmt->cases = ast_.copy_to_arena(cases);
  return stmt;
}

Stmt * JsonUnitReader::read_labeled(const json & j)
{
  const std::string_view label = str(j, "label");
  auto * stmt = ast_.create<LabeledStmt>(label, range_of(j));
  if (label.empty()) {
    malformed(j, "Labeled statement without a label");
  }

  targets_.push_back(JumpEntry{stmt, label, {}, false, false});
  if (!j.contains("body")) {
    malformed(j, "Labeled statement needs a 'body'");
    stmt->body = ast_.create<BlockStmt>(range_of(j));
  } else {
    const json & body = j["body"];
    const std::string_view kind = str(body, "kind");
    // `continue label` targets the loop the label is written on.
    stmt->body = (kind == "while" || kind == "do" || kind == "for") ? read_loop(body, kind, label)
                                                                    : read_stmt(body);
  }
  targets_.pop_back();
  return stmt;
}

Stmt * JsonUnitReader::read_try(const json & j)
{
  auto * stmt = ast_.create<TryStmt>(range_of(j));
  stmt->body = j.contains("body") ? read_block(j["body"]) : ast_.create<BlockStmt>(range_of(j));

  std::vector<CatchClause *> catches;
  if (auto it = j.find("catches"); it != j.end() && it->is_array()) {
    for (const auto & c : *it) {
      auto * clause = ast_.create<CatchClause>(range_of(c));
      clause->exceptionType = read_type(c, "on");
      push_scope();
      if (const std::string_view name = str(c, "exception"); !name.empty()) {
        clause->exception = ast_.create<VariableDecl>(name, range_of(c));
        clause->exception->declaredType =
          clause->exceptionType != nullptr ? clause->exceptionType : types_.object_type();
        clause->exception->isFinal = true;
        define(clause->exception);
      }
      if (const std::string_view name = str(c, "stack_trace"); !name.empty()) {
        clause->stackTrace = ast_.create<VariableDecl>(name, range_of(c));
        clause->stackTrace->declaredType = types_.interface_type("StackTrace");
        clause->stackTrace->isFinal = true;
        define(clause->stackTrace);
      }
      clause->body =
        c.contains("body") ? read_block(c["body"]) : ast_.create<BlockStmt>(range_of(c));
      pop_scope();
      catches.push_back(clause);
    }
  }
  stmt->catches = ast_.copy_to_arena(catches);

  if (auto it = j.find("finally"); it != j.end()) {
    stmt->finallyBlock = read_block(*it);
  }
  if (stmt->catches.empty() && stmt->finallyBlock == nullptr) {
    malformed(j, "'try' needs at least one catch clause or a finally block");
  }
  return stmt;
}

// ============================================================================
// Expressions
// ============================================================================

Expr * JsonUnitReader::placeholder_expr(SourceRange range)
{
  auto * expr = ast_.create<NullLiteralExpr>(range);
  expr->staticType = types_.invalid_type();
  return expr;
}

gsl::span<Expr *> JsonUnitReader::read_expr_list(const json & j)
{
  std::vector<Expr *> exprs;
  if (!j.is_array()) {
    malformed(j, "Expected a list of expressions");
    return {};
  }
  for (const auto & e : j) {
    exprs.push_back(read_expr(e));
  }
  return ast_.copy_to_arena(exprs);
}

Expr * JsonUnitReader::read_expr(const json & j)
{
  if (!j.is_object()) {
    malformed(j, "Expression must be a JSON object");
    return placeholder_expr({});
  }
  Expr * expr = read_expr_kind(j, str(j, "kind"));
  if (const Type * type = read_type(j, "static_type")) {
    expr->staticType = type;
  }
  return expr;
}

Expr * JsonUnitReader::read_expr_kind(const json & j, std::string_view kind)
{
  const SourceRange range = range_of(j);
  auto sub = [&](const char * key) -> Expr * {
    auto it = j.find(key);
    if (it == j.end()) {
      malformed(j, "'" + std::string(kind) + "' expression needs '" + key + "'");
      return placeholder_expr(range);
    }
    return read_expr(*it);
  };

  if (kind == "null") return ast_.create<NullLiteralExpr>(range);
  if (kind == "bool") return ast_.create<BoolLiteralExpr>(flag(j, "value"), range);
  if (kind == "int") {
    auto it = j.find("value");
    const int64_t value = it != j.end() && it->is_number_integer() ? it->get<int64_t>() : 0;
    return ast_.create<IntLiteralExpr>(value, range);
  }
  if (kind == "string") return ast_.create<StringLiteralExpr>(str(j, "value"), range);

  if (kind == "var") {
    const std::string_view name = str(j, "name");
    auto * ref = ast_.create<VarRefExpr>(name, range);
    ref->variable = lookup(name);
    if (ref->variable == nullptr) {
      diags_.report(
        DiagCode::UnresolvedName, range, "Undefined variable '" + std::string(name) + "'");
    }
    return ref;
  }

  if (kind == "assign") {
    const std::string_view name = str(j, "name");
    const std::string_view op = str(j, "op");
    VariableDecl * var = lookup(name);
    if (var == nullptr) {
      diags_.report(
        DiagCode::UnresolvedName, range, "Undefined variable '" + std::string(name) + "'");
    }
    AssignOp assign_op = AssignOp::Assign;
    if (op == "??=") {
      assign_op = AssignOp::IfNullAssign;
    } else if (!op.empty() && op != "=") {
      malformed(j, "Unknown assignment operator '" + std::string(op) + "'");
    }
    auto * assign = ast_.create<AssignExpr>(var, assign_op, sub("value"), range);
    assign->name = name;
    return assign;
  }

  if (kind == "binary") {
    BinaryOp op = BinaryOp::Add;
    const std::string_view text = str(j, "op");
    if (!parse_binary_op(text, op)) {
      malformed(j, "Unknown binary operator '" + std::string(text) + "'");
    }
    Expr * lhs = sub("lhs");
    Expr * rhs = sub("rhs");
    return ast_.create<BinaryExpr>(lhs, op, rhs, range);
  }

  if (kind == "unary") {
    const std::string_view text = str(j, "op");
    UnaryOp op = UnaryOp::Not;
    if (text == "-") {
      op = UnaryOp::Neg;
    } else if (text != "!") {
      malformed(j, "Unknown unary operator '" + std::string(text) + "'");
    }
    return ast_.create<UnaryExpr>(op, sub("operand"), range);
  }

  if (kind == "conditional") {
    Expr * cond = sub("condition");
    Expr * then_expr = sub("then");
    Expr * else_expr = sub("else");
    return ast_.create<ConditionalExpr>(cond, then_expr, else_expr, range);
  }

  if (kind == "is") {
    Expr * operand = sub("expr");
    const Type * tested = read_type(j, "type");
    if (tested == nullptr) {
      malformed(j, "'is' expression needs a 'type'");
      tested = types_.invalid_type();
    }
    return ast_.create<IsExpr>(operand, tested, flag(j, "negated"), range);
  }

  if (kind == "as") {
    Expr * operand = sub("expr");
    const Type * target = read_type(j, "type");
    if (target == nullptr) {
      malformed(j, "'as' expression needs a 'type'");
      target = types_.invalid_type();
    }
    return ast_.create<AsExpr>(operand, target, range);
  }

  if (kind == "null_check") return ast_.create<NullCheckExpr>(sub("expr"), range);
  if (kind == "throw") return ast_.create<ThrowExpr>(sub("expr"), range);

  if (kind == "call") {
    auto * call = ast_.create<CallExpr>(str(j, "name"), range);
    if (auto it = j.find("target"); it != j.end()) {
      call->target = read_expr(*it);
    }
    if (auto it = j.find("args"); it != j.end()) {
      call->args = read_expr_list(*it);
    }
    return call;
  }

  if (kind == "property") {
    Expr * target = sub("target");
    return ast_.create<PropertyGetExpr>(target, str(j, "name"), range);
  }

  if (kind == "function") return read_closure(j);

  malformed(j, "Unknown expression kind '" + std::string(kind) + "'");
  return placeholder_expr(range);
}

// ============================================================================
// Loading API
// ============================================================================

UnitLoadResult load_unit_text(
  std::string_view text, AstContext & ast, TypeContext & types, ClassHierarchy & classes,
  DiagnosticBag & diags)
{
  json doc;
  try {
    doc = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    return UnitLoadResult::fail(std::string("Invalid JSON: ") + e.what());
  }

  try {
    JsonUnitReader reader(ast, types, classes, diags);
    CompilationUnit * unit = reader.read(doc);
    if (unit == nullptr) {
      return UnitLoadResult::fail("Unit must be a JSON object");
    }
    std::string source;
    if (auto it = doc.find("source"); it != doc.end() && it->is_string()) {
      source = it->get<std::string>();
    }
    return UnitLoadResult::ok(unit, std::move(source));
  } catch (const json::exception & e) {
    return UnitLoadResult::fail(std::string("Malformed unit: ") + e.what());
  }
}

UnitLoadResult load_unit_file(
  const std::filesystem::path & path, AstContext & ast, TypeContext & types,
  ClassHierarchy & classes, DiagnosticBag & diags)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return UnitLoadResult::fail("Cannot open file: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  UnitLoadResult result = load_unit_text(buffer.str(), ast, types, classes, diags);
  if (result.success && !result.source_path.empty()) {
    std::filesystem::path source(result.source_path);
    if (source.is_relative()) {
      source = path.parent_path() / source;
    }
    result.source_path = source.lexically_normal().string();
  }
  return result;
}

}  // namespace flowan

// flowan/test_support/ast_builder.hpp - Compact AST construction for tests
//
// Builds resolved function bodies directly, without going through the JSON
// reader. Jump targets are passed explicitly.
//
//   AstContext ast;
//   TypeContext types;
//   AstBuilder b(ast, types);
//   auto * x = b.var("x", "int?");
//   auto * fn = b.function("f", {x}, "int", b.block({
//     b.if_(b.eq(b.ref(x), b.null()), b.ret(b.int_lit(0))),
//     b.ret(b.ref(x)),
//   }));
//
#pragma once

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "flowan/ast/ast.hpp"
#include "flowan/ast/ast_context.hpp"
#include "flowan/sema/types/type.hpp"
#include "flowan/sema/types/type_utils.hpp"

namespace flowan
{

class AstBuilder
{
public:
  AstBuilder(AstContext & ast, TypeContext & types) : ast_(ast), types_(types) {}

  AstContext & ast() { return ast_; }
  TypeContext & types() { return types_; }

  /// Parse a type name; throws on a typo so the test fails loudly
  const Type * type(std::string_view text)
  {
    const Type * t = parse_type(types_, text, &type_params_);
    if (t == nullptr) {
      throw std::invalid_argument("bad type in test: " + std::string(text));
    }
    return t;
  }

  /// Declare a type parameter usable in later type() calls
  const Type * type_param(std::string_view name, std::string_view bound = {})
  {
    const Type * t = types_.type_parameter(name, bound.empty() ? nullptr : type(bound));
    type_params_[std::string(name)] = t;
    return t;
  }

  // ===========================================================================
  // Variables
  // ===========================================================================

  /// `T x` (no type text: `var x`)
  VariableDecl * var(std::string_view name, std::string_view type_text = {})
  {
    auto * v = ast_.create<VariableDecl>(ast_.intern(name), next_range());
    if (!type_text.empty()) v->declaredType = type(type_text);
    return v;
  }

  VariableDecl * var_init(std::string_view name, std::string_view type_text, Expr * init)
  {
    VariableDecl * v = var(name, type_text);
    v->initializer = init;
    return v;
  }

  VariableDecl * late_var(std::string_view name, std::string_view type_text)
  {
    VariableDecl * v = var(name, type_text);
    v->isLate = true;
    return v;
  }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  Expr * null() { return ast_.create<NullLiteralExpr>(next_range()); }
  Expr * boolean(bool v) { return ast_.create<BoolLiteralExpr>(v, next_range()); }
  Expr * int_lit(int64_t v) { return ast_.create<IntLiteralExpr>(v, next_range()); }
  Expr * str(std::string_view v)
  {
    return ast_.create<StringLiteralExpr>(ast_.intern(v), next_range());
  }

  VarRefExpr * ref(const VariableDecl * v) { return ast_.create<VarRefExpr>(v, next_range()); }

  AssignExpr * assign(const VariableDecl * v, Expr * value)
  {
    return ast_.create<AssignExpr>(v, AssignOp::Assign, value, next_range());
  }

  AssignExpr * if_null_assign(const VariableDecl * v, Expr * value)
  {
    return ast_.create<AssignExpr>(v, AssignOp::IfNullAssign, value, next_range());
  }

  Expr * binary(Expr * l, BinaryOp op, Expr * r)
  {
    return ast_.create<BinaryExpr>(l, op, r, next_range());
  }
  Expr * eq(Expr * l, Expr * r) { return binary(l, BinaryOp::Eq, r); }
  Expr * ne(Expr * l, Expr * r) { return binary(l, BinaryOp::Ne, r); }
  Expr * and_(Expr * l, Expr * r) { return binary(l, BinaryOp::And, r); }
  Expr * or_(Expr * l, Expr * r) { return binary(l, BinaryOp::Or, r); }
  Expr * if_null(Expr * l, Expr * r) { return binary(l, BinaryOp::IfNull, r); }
  Expr * not_(Expr * e) { return ast_.create<UnaryExpr>(UnaryOp::Not, e, next_range()); }

  Expr * conditional(Expr * c, Expr * t, Expr * e)
  {
    return ast_.create<ConditionalExpr>(c, t, e, next_range());
  }

  Expr * is(Expr * e, std::string_view t) { return ast_.create<IsExpr>(e, type(t), false, next_range()); }
  Expr * is_not(Expr * e, std::string_view t)
  {
    return ast_.create<IsExpr>(e, type(t), true, next_range());
  }
  Expr * as(Expr * e, std::string_view t) { return ast_.create<AsExpr>(e, type(t), next_range()); }
  Expr * bang(Expr * e) { return ast_.create<NullCheckExpr>(e, next_range()); }
  Expr * throw_(Expr * e) { return ast_.create<ThrowExpr>(e, next_range()); }

  Expr * call(std::string_view name, std::initializer_list<Expr *> args = {})
  {
    auto * c = ast_.create<CallExpr>(ast_.intern(name), next_range());
    c->args = ast_.copy_to_arena(std::vector<Expr *>(args));
    return c;
  }

  Expr * prop(Expr * target, std::string_view name)
  {
    return ast_.create<PropertyGetExpr>(target, ast_.intern(name), next_range());
  }

  /// Expression with an explicit static type (e.g. a call returning Never)
  template <typename T>
  T * typed(T * e, std::string_view t)
  {
    e->staticType = type(t);
    return e;
  }

  FunctionExpr * closure(
    std::initializer_list<VariableDecl *> params, BlockStmt * body,
    std::string_view return_type = {})
  {
    auto * f = ast_.create<FunctionExpr>(next_range());
    f->params = ast_.copy_to_arena(std::vector<VariableDecl *>(params));
    f->body = body;
    if (!return_type.empty()) f->returnType = type(return_type);
    return f;
  }

  // ===========================================================================
  // Statements
  // ===========================================================================

  BlockStmt * block(std::initializer_list<Stmt *> stmts)
  {
    return ast_.create<BlockStmt>(ast_.copy_to_arena(std::vector<Stmt *>(stmts)), next_range());
  }

  Stmt * expr(Expr * e) { return ast_.create<ExprStmt>(e, next_range()); }

  Stmt * decl(std::initializer_list<VariableDecl *> vars)
  {
    return ast_.create<VarDeclStmt>(
      ast_.copy_to_arena(std::vector<VariableDecl *>(vars)), next_range());
  }

  IfStmt * if_(Expr * c, Stmt * t, Stmt * e = nullptr)
  {
    return ast_.create<IfStmt>(c, t, e, next_range());
  }

  WhileStmt * while_(Expr * c, Stmt * body = nullptr)
  {
    auto * s = ast_.create<WhileStmt>(next_range());
    s->condition = c;
    s->body = body;
    return s;
  }

  DoWhileStmt * do_while(Stmt * body, Expr * c)
  {
    auto * s = ast_.create<DoWhileStmt>(next_range());
    s->body = body;
    s->condition = c;
    return s;
  }

  ForStmt * for_(
    Stmt * init, Expr * c, std::initializer_list<Expr *> updaters, Stmt * body = nullptr)
  {
    auto * s = ast_.create<ForStmt>(next_range());
    s->init = init;
    s->condition = c;
    s->updaters = ast_.copy_to_arena(std::vector<Expr *>(updaters));
    s->body = body;
    return s;
  }

  Stmt * brk(const Stmt * target)
  {
    auto * s = ast_.create<BreakStmt>(next_range());
    s->target = target;
    return s;
  }

  Stmt * cont(const Stmt * target)
  {
    auto * s = ast_.create<ContinueStmt>(next_range());
    s->target = target;
    return s;
  }

  Stmt * ret(Expr * value = nullptr) { return ast_.create<ReturnStmt>(value, next_range()); }
  Stmt * yield(Expr * value) { return ast_.create<YieldStmt>(value, next_range()); }

  SwitchStmt * switch_(Expr * scrutinee, bool exhaustive = false)
  {
    auto * s = ast_.create<SwitchStmt>(next_range());
    s->scrutinee = scrutinee;
    s->isExhaustive = exhaustive;
    return s;
  }

  SwitchCase * case_(
    std::initializer_list<Expr *> heads, std::initializer_list<Stmt *> body,
    bool is_default = false)
  {
    auto * c = ast_.create<SwitchCase>(next_range());
    c->heads = ast_.copy_to_arena(std::vector<Expr *>(heads));
    c->body = ast_.copy_to_arena(std::vector<Stmt *>(body));
    c->hasDefault = is_default;
    return c;
  }

  void set_cases(SwitchStmt * s, std::initializer_list<SwitchCase *> cases)
  {
    s->cases = ast_.copy_to_arena(std::vector<SwitchCase *>(cases));
  }

  LabeledStmt * labeled(std::string_view label)
  {
    return ast_.create<LabeledStmt>(ast_.intern(label), next_range());
  }

  TryStmt * try_(BlockStmt * body, BlockStmt * finally_block = nullptr)
  {
    auto * s = ast_.create<TryStmt>(next_range());
    s->body = body;
    s->finallyBlock = finally_block;
    return s;
  }

  CatchClause * catch_(BlockStmt * body, VariableDecl * exception = nullptr)
  {
    auto * c = ast_.create<CatchClause>(next_range());
    c->body = body;
    c->exception = exception;
    if (exception != nullptr && exception->declaredType == nullptr) {
      exception->declaredType = types_.object_type();
    }
    return c;
  }

  void set_catches(TryStmt * s, std::initializer_list<CatchClause *> catches)
  {
    s->catches = ast_.copy_to_arena(std::vector<CatchClause *>(catches));
  }

  // ===========================================================================
  // Functions
  // ===========================================================================

  FunctionDecl * function(
    std::string_view name, std::initializer_list<VariableDecl *> params,
    std::string_view return_type, BlockStmt * body,
    FunctionBodyKind kind = FunctionBodyKind::Sync)
  {
    auto * f = ast_.create<FunctionDecl>(ast_.intern(name), next_range());
    f->params = ast_.copy_to_arena(std::vector<VariableDecl *>(params));
    if (!return_type.empty()) f->returnType = type(return_type);
    f->body = body;
    f->bodyKind = kind;
    return f;
  }

private:
  /// Distinct, increasing ranges so nodes are told apart in dumps
  SourceRange next_range()
  {
    const uint32_t begin = offset_;
    offset_ += 2;
    return {begin, begin + 1};
  }

  AstContext & ast_;
  TypeContext & types_;
  TypeParameterScope type_params_;
  uint32_t offset_ = 0;
};

}  // namespace flowan

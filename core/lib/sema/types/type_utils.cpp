// flowan/sema/types/type_utils.cpp - Type printing and parsing
//
#include "flowan/sema/types/type_utils.hpp"

#include <cctype>
#include <vector>

namespace flowan
{

std::string to_string(const Type * type)
{
  if (type == nullptr) return "<null>";

  switch (type->kind) {
    case TypeKind::Interface: {
      std::string s(type->name);
      if (!type->args.empty()) {
        s += "<";
        for (size_t i = 0; i < type->args.size(); ++i) {
          if (i > 0) s += ", ";
          s += to_string(type->args[i]);
        }
        s += ">";
      }
      return s;
    }
    case TypeKind::Function: {
      std::string s = to_string(type->inner) + " Function(";
      for (size_t i = 0; i < type->args.size(); ++i) {
        if (i > 0) s += ", ";
        s += to_string(type->args[i]);
      }
      return s + ")";
    }
    case TypeKind::TypeParameter:
      return std::string(type->name);
    case TypeKind::PromotedTypeParameter:
      return std::string(type->name) + " & " + to_string(type->promoted);
    case TypeKind::Nullable:
      if (type->inner->kind == TypeKind::Function) {
        return "(" + to_string(type->inner) + ")?";
      }
      return to_string(type->inner) + "?";
    case TypeKind::Legacy:
      return to_string(type->inner) + "*";
    case TypeKind::FutureOr:
      return "FutureOr<" + to_string(type->inner) + ">";
    case TypeKind::Never:
      return "Never";
    case TypeKind::Null:
      return "Null";
    case TypeKind::Dynamic:
      return "dynamic";
    case TypeKind::Void:
      return "void";
    case TypeKind::Object:
      return "Object";
    case TypeKind::Invalid:
      return "<invalid>";
  }
  return "<unknown>";
}

// ============================================================================
// Parsing
// ============================================================================

namespace
{

class TypeParser
{
public:
  TypeParser(TypeContext & types, std::string_view text, const TypeParameterScope * params)
  : types_(types), text_(text), params_(params)
  {
  }

  const Type * parse()
  {
    const Type * t = parse_type();
    skip_space();
    if (t == nullptr || pos_ != text_.size()) return nullptr;
    return t;
  }

private:
  void skip_space()
  {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
      ++pos_;
    }
  }

  bool accept(char c)
  {
    skip_space();
    if (pos_ < text_.size() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  std::string_view identifier()
  {
    skip_space();
    const size_t start = pos_;
    while (pos_ < text_.size()) {
      const auto c = static_cast<unsigned char>(text_[pos_]);
      if (!std::isalnum(c) && c != '_' && c != '$') break;
      ++pos_;
    }
    return text_.substr(start, pos_ - start);
  }

  bool peek_keyword(std::string_view word)
  {
    skip_space();
    if (text_.substr(pos_, word.size()) != word) return false;
    const size_t after = pos_ + word.size();
    return after >= text_.size() ||
           (!std::isalnum(static_cast<unsigned char>(text_[after])) && text_[after] != '_');
  }

  bool parse_list(char close, std::vector<const Type *> & out)
  {
    if (accept(close)) return true;
    do {
      const Type * t = parse_type();
      if (t == nullptr) return false;
      out.push_back(t);
    } while (accept(','));
    return accept(close);
  }

  const Type * parse_type()
  {
    const Type * t = parse_primary();
    if (t == nullptr) return nullptr;

    while (peek_keyword("Function")) {
      pos_ += 8;
      if (!accept('(')) return nullptr;
      std::vector<const Type *> params;
      if (!parse_list(')', params)) return nullptr;
      t = types_.function_type(t, params);
    }

    while (true) {
      if (accept('?')) {
        t = types_.nullable_type(t);
      } else if (accept('*')) {
        t = types_.legacy_type(t);
      } else {
        return t;
      }
    }
  }

  const Type * parse_primary()
  {
    if (accept('(')) {
      const Type * inner = parse_type();
      return (inner != nullptr && accept(')')) ? inner : nullptr;
    }

    const std::string_view name = identifier();
    if (name.empty()) return nullptr;

    std::vector<const Type *> args;
    if (accept('<')) {
      if (!parse_list('>', args) || args.empty()) return nullptr;
    }

    if (name == "FutureOr") {
      return args.size() == 1 ? types_.future_or_type(args.front()) : nullptr;
    }
    if (!args.empty()) {
      return types_.interface_type(name, args);
    }

    if (name == "Never") return types_.never_type();
    if (name == "Null") return types_.null_type();
    if (name == "dynamic") return types_.dynamic_type();
    if (name == "void") return types_.void_type();
    if (name == "Object") return types_.object_type();

    if (params_ != nullptr) {
      const auto it = params_->find(std::string(name));
      if (it != params_->end()) return it->second;
    }
    return types_.interface_type(name);
  }

  TypeContext & types_;
  std::string_view text_;
  const TypeParameterScope * params_;
  size_t pos_ = 0;
};

}  // namespace

const Type * parse_type(
  TypeContext & types, std::string_view text, const TypeParameterScope * type_params)
{
  return TypeParser(types, text, type_params).parse();
}

}  // namespace flowan

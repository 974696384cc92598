// flowan/sema/types/type_utils.hpp - Type printing and parsing helpers
//
#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include "flowan/sema/types/type.hpp"

namespace flowan
{

/// Type parameters visible while parsing a type name
using TypeParameterScope = std::unordered_map<std::string, const Type *>;

/**
 * Render a type the way it is written in source (`FutureOr<int?>`,
 * `X & num`, `void Function(int)`).
 */
[[nodiscard]] std::string to_string(const Type * type);

/**
 * Parse a written type.
 *
 * Grammar:
 *   type     := primary ('Function' '(' [type (',' type)*] ')')* suffix*
 *   primary  := name ['<' type (',' type)* '>']
 *   suffix   := '?' | '*'
 *
 * `Never`, `Null`, `dynamic`, `void`, `Object` and `FutureOr<T>` map to
 * their dedicated kinds; names found in @p type_params map to the
 * declared type parameter; every other name is an interface type.
 *
 * @return The interned type, or nullptr when @p text is malformed
 */
[[nodiscard]] const Type * parse_type(
  TypeContext & types, std::string_view text, const TypeParameterScope * type_params = nullptr);

}  // namespace flowan

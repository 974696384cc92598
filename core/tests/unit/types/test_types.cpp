// tests/types/test_types.cpp - Type interning, printing, parsing and subtyping
//
#include <gtest/gtest.h>

#include "flowan/sema/types/subtype_oracle.hpp"
#include "flowan/sema/types/type.hpp"
#include "flowan/sema/types/type_utils.hpp"

using namespace flowan;

namespace
{

struct TypesFixture : ::testing::Test
{
  TypeContext types;
  ClassHierarchy classes = ClassHierarchy::with_core_library(types);
  SubtypeOracle oracle{types, classes};

  const Type * t(std::string_view text, const TypeParameterScope * params = nullptr)
  {
    const Type * type = parse_type(types, text, params);
    EXPECT_NE(type, nullptr) << text;
    return type;
  }

  bool sub(std::string_view a, std::string_view b) { return oracle.is_subtype_of(t(a), t(b)); }
};

}  // namespace

// ============================================================================
// Interning and Parsing
// ============================================================================

TEST_F(TypesFixture, InterningGivesStableIdentity)
{
  EXPECT_EQ(t("int"), types.int_type());
  EXPECT_EQ(t("List<int?>"), t("List<int?>"));
  EXPECT_NE(t("List<int>"), t("List<int?>"));
  EXPECT_EQ(types.nullable_type(t("int?")), t("int?"));
  EXPECT_EQ(types.nullable_type(types.never_type()), types.null_type());
}

TEST_F(TypesFixture, PrintsTheWayTypesAreWritten)
{
  for (const char * text :
       {"int", "int?", "FutureOr<int?>", "Map<String, List<int>>", "void Function(int, String)",
        "Never", "Null", "dynamic", "Object", "int*"}) {
    EXPECT_EQ(to_string(t(text)), text);
  }
  EXPECT_EQ(to_string(t("(void Function())?")), "(void Function())?");
  EXPECT_EQ(to_string(nullptr), "<null>");
}

TEST_F(TypesFixture, MalformedTextIsRejected)
{
  EXPECT_EQ(parse_type(types, "List<"), nullptr);
  EXPECT_EQ(parse_type(types, ""), nullptr);
  EXPECT_EQ(parse_type(types, "int int"), nullptr);
  EXPECT_EQ(parse_type(types, "FutureOr<int, String>"), nullptr);
}

TEST_F(TypesFixture, TypeParametersResolveThroughScope)
{
  TypeParameterScope scope;
  const Type * x = types.type_parameter("X", t("num?"));
  scope["X"] = x;
  EXPECT_EQ(t("X", &scope), x);
  EXPECT_EQ(t("X?", &scope), types.nullable_type(x));
  // Outside the scope X is an ordinary interface name
  EXPECT_EQ(t("X")->kind, TypeKind::Interface);
}

// ============================================================================
// Subtyping
// ============================================================================

TEST_F(TypesFixture, InterfaceHierarchy)
{
  EXPECT_TRUE(sub("int", "num"));
  EXPECT_TRUE(sub("int", "Object"));
  EXPECT_FALSE(sub("num", "int"));
  EXPECT_FALSE(sub("String", "num"));

  classes.declare("B", {t("A")});
  classes.declare("C", {t("B")});
  EXPECT_TRUE(sub("C", "A"));
  EXPECT_FALSE(sub("A", "C"));
}

TEST_F(TypesFixture, NullabilityRules)
{
  EXPECT_TRUE(sub("Null", "int?"));
  EXPECT_FALSE(sub("Null", "int"));
  EXPECT_TRUE(sub("int", "int?"));
  EXPECT_FALSE(sub("int?", "int"));
  EXPECT_TRUE(sub("int?", "num?"));
  EXPECT_FALSE(sub("int?", "Object"));
  EXPECT_TRUE(sub("int?", "Object?"));
  EXPECT_TRUE(sub("Never", "int"));
  EXPECT_TRUE(sub("int", "dynamic"));
  EXPECT_FALSE(sub("dynamic", "int"));

  EXPECT_TRUE(oracle.is_nullable(t("dynamic")));
  EXPECT_TRUE(oracle.is_nullable(t("FutureOr<int?>")));
  EXPECT_FALSE(oracle.is_nullable(t("FutureOr<int>")));
}

TEST_F(TypesFixture, FutureOrRules)
{
  EXPECT_TRUE(sub("int", "FutureOr<int>"));
  EXPECT_TRUE(sub("Future<int>", "FutureOr<num>"));
  EXPECT_TRUE(sub("FutureOr<int>", "FutureOr<num>"));
  EXPECT_FALSE(sub("FutureOr<int>", "int"));
  EXPECT_TRUE(sub("FutureOr<int>", "Object"));
}

TEST_F(TypesFixture, FunctionTypesAreContravariantInParameters)
{
  EXPECT_TRUE(sub("int Function(num)", "num Function(int)"));
  EXPECT_FALSE(sub("int Function(int)", "int Function(num)"));
  EXPECT_TRUE(sub("void Function()", "Function"));
}

TEST_F(TypesFixture, TypeParameterAndIntersection)
{
  const Type * x = types.type_parameter("X", t("Object?"));
  const Type * x_int = types.promoted_type_parameter(x, t("int"));

  EXPECT_TRUE(oracle.is_subtype_of(x_int, x));
  EXPECT_TRUE(oracle.is_subtype_of(x_int, t("num")));
  EXPECT_FALSE(oracle.is_subtype_of(x, x_int));
  EXPECT_FALSE(oracle.is_subtype_of(x, t("Object")));
  EXPECT_TRUE(oracle.is_strict_subtype_of(x_int, x));
  EXPECT_EQ(to_string(x_int), "X & int");
}

TEST_F(TypesFixture, InvalidIsCompatibleWithEverything)
{
  EXPECT_TRUE(oracle.is_subtype_of(types.invalid_type(), t("int")));
  EXPECT_TRUE(oracle.is_subtype_of(t("int"), types.invalid_type()));
}

// ============================================================================
// NonNull and Future value types
// ============================================================================

TEST_F(TypesFixture, PromoteToNonNull)
{
  EXPECT_EQ(oracle.promote_to_non_null(t("int?")), t("int"));
  EXPECT_EQ(oracle.promote_to_non_null(t("Null")), types.never_type());
  EXPECT_EQ(oracle.promote_to_non_null(t("int")), t("int"));
  EXPECT_EQ(oracle.promote_to_non_null(t("dynamic")), t("dynamic"));
  EXPECT_EQ(oracle.promote_to_non_null(t("FutureOr<int?>")), t("FutureOr<int>"));

  const Type * x = types.type_parameter("X", t("num?"));
  const Type * promoted = oracle.promote_to_non_null(x);
  ASSERT_EQ(promoted->kind, TypeKind::PromotedTypeParameter);
  EXPECT_EQ(promoted->promoted, t("num"));
}

TEST_F(TypesFixture, FutureValueType)
{
  EXPECT_EQ(types.future_value_type(t("Future<int>")), t("int"));
  EXPECT_EQ(types.future_value_type(t("FutureOr<String>")), t("String"));
  EXPECT_EQ(types.future_value_type(t("Future<int>?")), t("int"));
  EXPECT_EQ(types.future_value_type(t("void")), t("void"));
  EXPECT_EQ(types.future_value_type(nullptr), t("dynamic"));
}

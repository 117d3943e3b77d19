#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>

#include "routepat/invalid-operation.hpp"
#include "routepat/parameter-policy-value.hpp"
#include "routepat/regex-route-constraint.hpp"
#include "routepat/route-pattern-exception.hpp"
#include "routepat/route-pattern-factory.hpp"
#include "routepat/route-pattern.hpp"
#include "routepat/route-value.hpp"

namespace routepat {

class RoutePatternCombineTest : public ::testing::Test {
 protected:
  RouteValueDictionary noDefaults;
  ParameterPolicyValues noPolicies;

  RoutePattern users = Pattern("users/{id}", {Segment({LiteralPart("users")}), Segment({ParameterPart("id")})});
  RoutePattern action = Pattern("/{action}", RouteValueDictionary{{"action", RouteValue{"index"}}}, noPolicies,
                                {Segment({ParameterPart("action")})});
};

TEST_F(RoutePatternCombineTest, Concatenation) {
  auto combined = Combine(users, action);

  ASSERT_TRUE(combined.rawText().has_value());
  EXPECT_EQ(*combined.rawText(), "users/{id}/{action}");

  ASSERT_EQ(combined.pathSegments().size(), 3U);
  EXPECT_EQ(combined.pathSegments()[0], users.pathSegments()[0]);
  EXPECT_EQ(combined.pathSegments()[1], users.pathSegments()[1]);
  EXPECT_EQ(combined.pathSegments()[2], action.pathSegments()[0]);

  ASSERT_EQ(combined.parameters().size(), 2U);
  EXPECT_EQ(combined.parameters()[0]->name(), "id");
  EXPECT_EQ(combined.parameters()[1]->name(), "action");

  ASSERT_EQ(combined.defaults().size(), 1U);
  EXPECT_EQ(combined.defaults().find("action")->second, RouteValue{"index"});
  EXPECT_EQ(combined.debugString(), "users/{id}/{action=index}");
}

TEST_F(RoutePatternCombineTest, SlashesAreTrimmedAtTheJunction) {
  auto left = Pattern("api//", {Segment({LiteralPart("api")})});
  auto right = Pattern("//v1", {Segment({LiteralPart("v1")})});
  EXPECT_EQ(*Combine(left, right).rawText(), "api/v1");
}

TEST_F(RoutePatternCombineTest, InputsAreNotModified) {
  (void)Combine(users, action);
  EXPECT_EQ(*users.rawText(), "users/{id}");
  EXPECT_EQ(users.parameters().size(), 1U);
  EXPECT_TRUE(users.defaults().empty());
  EXPECT_EQ(action.parameters().size(), 1U);
}

TEST_F(RoutePatternCombineTest, DuplicateParameterName) {
  auto other = Pattern("{ID}", {Segment({ParameterPart("ID")})});
  try {
    (void)Combine(users, other);
    FAIL() << "expected route_pattern_exception";
  } catch (const route_pattern_exception& ex) {
    EXPECT_EQ(ex.pattern(), "users/{id}/{ID}");
    EXPECT_STREQ(ex.what(), "The route parameter name 'ID' appears more than one time in the route template");
  }
}

TEST_F(RoutePatternCombineTest, SameDefaultOnBothSides) {
  RouteValueDictionary lang{{"lang", RouteValue{"en"}}};
  auto left = Pattern("{id}", lang, noPolicies, {Segment({ParameterPart("id")})});
  auto right = Pattern("{action}", lang, noPolicies, {Segment({ParameterPart("action")})});

  auto combined = Combine(left, right);
  ASSERT_EQ(combined.defaults().size(), 1U);
  EXPECT_EQ(combined.defaults().find("LANG")->second, RouteValue{"en"});
}

TEST_F(RoutePatternCombineTest, ConflictingDefaults) {
  auto left = Pattern("{id}", RouteValueDictionary{{"lang", RouteValue{"en"}}}, noPolicies,
                      {Segment({ParameterPart("id")})});
  auto right = Pattern("{action}", RouteValueDictionary{{"lang", RouteValue{"fr"}}}, noPolicies,
                       {Segment({ParameterPart("action")})});
  try {
    (void)Combine(left, right);
    FAIL() << "expected invalid_operation";
  } catch (const invalid_operation& ex) {
    EXPECT_STREQ(ex.what(),
                 "Cannot combine route pattern '{id}/{action}': the RoutePattern.Defaults dictionary key 'lang' has "
                 "multiple values 'en' and 'fr'");
  }
}

TEST_F(RoutePatternCombineTest, DefaultsCompareStructurally) {
  auto left = Pattern("{id}", RouteValueDictionary{{"page", RouteValue{int64_t{1}}}}, noPolicies,
                      {Segment({ParameterPart("id")})});
  auto right = Pattern("{action}", RouteValueDictionary{{"page", RouteValue{"1"}}}, noPolicies,
                       {Segment({ParameterPart("action")})});
  EXPECT_THROW((void)Combine(left, right), invalid_operation);
}

TEST_F(RoutePatternCombineTest, ConflictingRequiredValues) {
  RouteValueDictionary admin{{"area", RouteValue{"admin"}}};
  RouteValueDictionary shop{{"area", RouteValue{"shop"}}};
  auto left = Pattern("{area}", noDefaults, noPolicies, admin, {Segment({ParameterPart("area")})});
  // required values without parameter are satisfied by a default of the same value
  auto right = Pattern("{controller}", shop, noPolicies, shop, {Segment({ParameterPart("controller")})});
  try {
    (void)Combine(left, right);
    FAIL() << "expected invalid_operation";
  } catch (const invalid_operation& ex) {
    EXPECT_STREQ(ex.what(),
                 "Cannot combine route pattern '{area}/{controller}': the RoutePattern.RequiredValues dictionary key "
                 "'area' has multiple values 'admin' and 'shop'");
  }

  auto sameArea = Pattern("{controller}", admin, noPolicies, admin, {Segment({ParameterPart("controller")})});
  auto combined = Combine(left, sameArea);
  ASSERT_EQ(combined.requiredValues().size(), 1U);
  EXPECT_EQ(combined.requiredValues().find("AREA")->second, RouteValue{"admin"});
  EXPECT_EQ(combined.defaults().find("area")->second, RouteValue{"admin"});
}

TEST_F(RoutePatternCombineTest, ParameterPolicies) {
  auto left = Pattern("{id}", noDefaults, ParameterPolicyValues{{"tenant", ParameterPolicyValue("[a-z]+")}},
                      {Segment({ParameterPart("id")})});
  auto right = Pattern("{action}", noDefaults, ParameterPolicyValues{{"tenant", ParameterPolicyValue("[a-z]+")}},
                       {Segment({ParameterPart("action")})});
  // each side compiled its own constraint instance
  EXPECT_THROW((void)Combine(left, right), invalid_operation);

  auto constraint = std::make_shared<const RegexRouteConstraint>("^[a-z]+$");
  auto sharedLeft = Pattern("{id}", noDefaults, ParameterPolicyValues{{"tenant", ParameterPolicyValue(constraint)}},
                            {Segment({ParameterPart("id")})});
  auto sharedRight =
      Pattern("{action}", noDefaults, ParameterPolicyValues{{"tenant", ParameterPolicyValue(constraint)}},
              {Segment({ParameterPart("action")})});
  auto combined = Combine(sharedLeft, sharedRight);
  ASSERT_EQ(combined.parameterPolicies().size(), 1U);
  EXPECT_EQ(combined.parameterPolicies().find("tenant")->second[0].parameterPolicy(), constraint);
}

TEST_F(RoutePatternCombineTest, EmptySideIsShared) {
  auto empty = Pattern("/", std::span<const RoutePatternPathSegmentPtr>());
  auto combined = Combine(empty, users);

  EXPECT_EQ(*combined.rawText(), "/users/{id}");
  EXPECT_EQ(combined.pathSegmentsPtr(), users.pathSegmentsPtr());
  EXPECT_EQ(combined.parametersPtr(), users.parametersPtr());
  EXPECT_EQ(combined.defaultsPtr(), RoutePattern::EmptyValues());

  auto withDefaults = Combine(users, action);
  EXPECT_EQ(withDefaults.defaultsPtr(), action.defaultsPtr());
  EXPECT_EQ(withDefaults.requiredValuesPtr(), RoutePattern::EmptyValues());
}

TEST_F(RoutePatternCombineTest, MissingRawText) {
  auto left = Pattern({Segment({LiteralPart("api")})});
  auto combined = Combine(left, users);
  EXPECT_EQ(*combined.rawText(), "/users/{id}");
}

}  // namespace routepat

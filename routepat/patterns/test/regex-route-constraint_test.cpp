#include "routepat/regex-route-constraint.hpp"

#include <gtest/gtest.h>

#include <cstdint>

#include "routepat/exception.hpp"
#include "routepat/invalid-argument.hpp"
#include "routepat/regex-constraint-config.hpp"
#include "routepat/route-value.hpp"

namespace routepat {

TEST(RegexConstraintConfigTest, ValidDefault) {
  RegexConstraintConfig cfg;
  EXPECT_NO_THROW(cfg.validate());
  EXPECT_TRUE(cfg.caseInsensitive);
}

TEST(RegexConstraintConfigTest, InvalidMaxProgramMemory) {
  RegexConstraintConfig cfg;
  cfg.withMaxProgramMemory(1024);
  EXPECT_THROW(cfg.validate(), invalid_argument);

  cfg.withMaxProgramMemory(RegexConstraintConfig::kMinProgramMemory);
  EXPECT_NO_THROW(cfg.validate());
}

TEST(RegexRouteConstraintTest, MatchesWholeAnchoredValue) {
  const RegexRouteConstraint constraint("^(\\d+)$");
  EXPECT_TRUE(constraint.matches(RouteValue{"123"}));
  EXPECT_TRUE(constraint.matches(RouteValue{int64_t{42}}));
  EXPECT_FALSE(constraint.matches(RouteValue{"12a"}));
  EXPECT_FALSE(constraint.matches(RouteValue{}));
  EXPECT_EQ(constraint.pattern(), "^(\\d+)$");
  EXPECT_EQ(constraint.describe(), "regex(^(\\d+)$)");
}

TEST(RegexRouteConstraintTest, CaseInsensitiveByDefault) {
  const RegexRouteConstraint insensitive("^(en|fr)$");
  EXPECT_TRUE(insensitive.matches(RouteValue{"EN"}));

  const RegexRouteConstraint sensitive("^(en|fr)$", RegexConstraintConfig{}.withCaseInsensitive(false));
  EXPECT_FALSE(sensitive.matches(RouteValue{"EN"}));
  EXPECT_TRUE(sensitive.matches(RouteValue{"fr"}));
}

TEST(RegexRouteConstraintTest, InvalidExpression) {
  EXPECT_THROW(RegexRouteConstraint("^(\\d+$"), invalid_argument);
  EXPECT_THROW(RegexRouteConstraint(""), invalid_argument);
  EXPECT_THROW(RegexRouteConstraint("a", RegexConstraintConfig{}.withMaxProgramMemory(10)), exception);
}

}  // namespace routepat

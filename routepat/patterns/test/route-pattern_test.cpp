#include "routepat/route-pattern.hpp"

#include <gtest/gtest.h>

#include <cstdint>

#include "routepat/parameter-policy-value.hpp"
#include "routepat/route-pattern-factory.hpp"
#include "routepat/route-value.hpp"
#include "routepat/vector.hpp"

namespace routepat {

TEST(RoutePatternTest, DefaultConstructed) {
  RoutePattern pattern;
  EXPECT_FALSE(pattern.rawText().has_value());
  EXPECT_TRUE(pattern.defaults().empty());
  EXPECT_TRUE(pattern.parameterPolicies().empty());
  EXPECT_TRUE(pattern.requiredValues().empty());
  EXPECT_TRUE(pattern.parameters().empty());
  EXPECT_TRUE(pattern.pathSegments().empty());
  EXPECT_EQ(pattern.defaultsPtr(), RoutePattern::EmptyValues());
  EXPECT_EQ(pattern.parameterPoliciesPtr(), RoutePattern::EmptyPolicies());
  EXPECT_EQ(pattern.parametersPtr(), RoutePattern::EmptyParameters());
  EXPECT_EQ(pattern.pathSegmentsPtr(), RoutePattern::EmptyPathSegments());
  EXPECT_EQ(pattern.getParameter("id"), nullptr);
  EXPECT_EQ(pattern.debugString(), "");
}

TEST(RoutePatternTest, GetParameterIgnoresCase) {
  auto pattern = Pattern({Segment({LiteralPart("files")}), Segment({ParameterPart("fileName")})});
  const auto* pParameter = pattern.getParameter("FILENAME");
  ASSERT_NE(pParameter, nullptr);
  EXPECT_EQ(pParameter, pattern.parameters()[0].get());
  EXPECT_EQ(pattern.getParameter("file"), nullptr);
}

TEST(RoutePatternTest, DebugString) {
  vector<RoutePatternParameterPolicyReference> noPolicies;
  auto pattern = Pattern(
      {Segment({LiteralPart("blog")}), Segment({ParameterPart("year", int64_t{2024})}),
       Segment({ParameterPart("slug", RouteValue{}, RoutePatternParameterKind::Optional)}),
       Segment({ParameterPart("name"), SeparatorPart("."), ParameterPart("ext")}),
       Segment({ParameterPart("rest", RouteValue{}, RoutePatternParameterKind::CatchAll, noPolicies, false)})});
  EXPECT_EQ(pattern.debugString(), "blog/{year=2024}/{slug?}/{name}.{ext}/{**rest}");
}

TEST(RoutePatternTest, CopiesShareStorage) {
  ParameterPolicyValues policies{{"id", ParameterPolicyValue("\\d+")}};
  RouteValueDictionary defaults{{"id", RouteValue{int64_t{1}}}};
  auto pattern = Pattern("{id}", defaults, policies, {Segment({ParameterPart("id")})});

  RoutePattern copy = pattern;
  EXPECT_EQ(copy.defaultsPtr(), pattern.defaultsPtr());
  EXPECT_EQ(copy.parameterPoliciesPtr(), pattern.parameterPoliciesPtr());
  EXPECT_EQ(copy.parametersPtr(), pattern.parametersPtr());
  EXPECT_EQ(copy.pathSegmentsPtr(), pattern.pathSegmentsPtr());
  EXPECT_EQ(copy.rawText(), pattern.rawText());
}

}  // namespace routepat

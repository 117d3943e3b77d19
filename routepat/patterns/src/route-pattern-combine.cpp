#include <fmt/format.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "routepat/flat-set.hpp"
#include "routepat/invalid-operation.hpp"
#include "routepat/log.hpp"
#include "routepat/route-pattern-exception.hpp"
#include "routepat/route-pattern-factory.hpp"
#include "routepat/route-pattern.hpp"
#include "routepat/route-value.hpp"
#include "routepat/string-equal-ignore-case.hpp"
#include "routepat/string-trim.hpp"

namespace routepat {

namespace {

bool SameValue(const RouteValue& lhs, const RouteValue& rhs) { return lhs == rhs; }

bool SameValue(const ParameterPolicyReferences& lhs, const ParameterPolicyReferences& rhs) {
  return std::ranges::equal(lhs, rhs);
}

std::string DebugString(const RouteValue& value) { return RouteValueDebugString(value); }

std::string DebugString(const ParameterPolicyReferences& policies) {
  std::string ret(1, '[');
  for (const RoutePatternParameterPolicyReference& policy : policies) {
    if (ret.size() > 1U) {
      ret.append(", ");
    }
    ret.append(policy.debugString());
  }
  ret.push_back(']');
  return ret;
}

// Concatenates two lists, calling check on each element. An empty side is not copied.
template <class List, class Check>
std::shared_ptr<const List> CombineLists(const std::shared_ptr<const List>& leftList,
                                         const std::shared_ptr<const List>& rightList, Check check) {
  if (leftList->empty()) {
    return rightList;
  }
  if (rightList->empty()) {
    return leftList;
  }

  auto combinedList = std::make_shared<List>();
  combinedList->reserve(leftList->size() + rightList->size());
  for (const auto& item : *leftList) {
    check(item);
    combinedList->push_back(item);
  }
  for (const auto& item : *rightList) {
    check(item);
    combinedList->push_back(item);
  }
  return combinedList;
}

// Union of two dictionaries. A key may be present on both sides only with the same value.
// Policy lists are not merged either: a policy for the same parameter on both sides of a group makes little sense.
template <class Dictionary>
std::shared_ptr<const Dictionary> CombineDictionaries(const std::shared_ptr<const Dictionary>& leftDictionary,
                                                      const std::shared_ptr<const Dictionary>& rightDictionary,
                                                      std::string_view rawText, std::string_view dictionaryName) {
  if (leftDictionary->empty()) {
    return rightDictionary;
  }
  if (rightDictionary->empty()) {
    return leftDictionary;
  }

  auto combinedDictionary = std::make_shared<Dictionary>(*leftDictionary);
  for (const auto& [key, value] : *rightDictionary) {
    const auto it = combinedDictionary->find(key);
    if (it == combinedDictionary->end()) {
      combinedDictionary->emplace(key, value);
    } else if (!SameValue(it->second, value)) {
      log::warn("Cannot combine route pattern '{}': conflicting {} entries for key '{}'", rawText, dictionaryName,
                key);
      throw invalid_operation(
          "Cannot combine route pattern '{}': the RoutePattern.{} dictionary key '{}' has multiple values '{}' and "
          "'{}'",
          rawText, dictionaryName, key, DebugString(it->second), DebugString(value));
    }
  }
  return combinedDictionary;
}

}  // namespace

RoutePattern Combine(const RoutePattern& left, const RoutePattern& right) {
  const std::string_view leftRawText = left.rawText() ? std::string_view(*left.rawText()) : std::string_view{};
  const std::string_view rightRawText = right.rawText() ? std::string_view(*right.rawText()) : std::string_view{};

  std::string rawText = fmt::format("{}/{}", TrimTrailing(leftRawText, '/'), TrimLeading(rightRawText, '/'));

  FlatSet<std::string, CaseInsensitiveLessFunc> parameterNames;
  auto parameters = CombineLists(left.parametersPtr(), right.parametersPtr(),
                                 [&parameterNames, &rawText](const RoutePatternParameterPartPtr& parameter) {
                                   if (!parameterNames.insert(std::string(parameter->name())).second) {
                                     throw route_pattern_exception(
                                         rawText, fmt::format("The route parameter name '{}' appears more than one "
                                                              "time in the route template",
                                                              parameter->name()));
                                   }
                                 });
  auto pathSegments = CombineLists(left.pathSegmentsPtr(), right.pathSegmentsPtr(),
                                   []([[maybe_unused]] const RoutePatternPathSegmentPtr& segment) {});

  auto defaults = CombineDictionaries(left.defaultsPtr(), right.defaultsPtr(), rawText, "Defaults");
  auto requiredValues =
      CombineDictionaries(left.requiredValuesPtr(), right.requiredValuesPtr(), rawText, "RequiredValues");
  auto parameterPolicies =
      CombineDictionaries(left.parameterPoliciesPtr(), right.parameterPoliciesPtr(), rawText, "ParameterPolicies");

  log::debug("Combined route patterns into '{}' with {} parameter(s)", rawText, parameters->size());

  return {std::move(rawText),      std::move(defaults),   std::move(parameterPolicies),
          std::move(requiredValues), std::move(parameters), std::move(pathSegments)};
}

}  // namespace routepat

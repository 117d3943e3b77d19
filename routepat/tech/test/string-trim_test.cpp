#include "routepat/string-trim.hpp"

#include <gtest/gtest.h>

#include <string_view>

namespace routepat {

TEST(StringTrimTest, TrimLeadingSlashes) {
  EXPECT_EQ(TrimLeading("/{action}", '/'), std::string_view("{action}"));
  EXPECT_EQ(TrimLeading("//{action}", '/'), std::string_view("{action}"));
  EXPECT_EQ(TrimLeading("{action}/", '/'), std::string_view("{action}/"));
}

TEST(StringTrimTest, TrimTrailingSlashes) {
  EXPECT_EQ(TrimTrailing("users/{id}/", '/'), std::string_view("users/{id}"));
  EXPECT_EQ(TrimTrailing("users/{id}//", '/'), std::string_view("users/{id}"));
  EXPECT_EQ(TrimTrailing("/users", '/'), std::string_view("/users"));
}

TEST(StringTrimTest, EmptyAndAllSlashes) {
  EXPECT_EQ(TrimLeading("", '/'), std::string_view(""));
  EXPECT_EQ(TrimTrailing("", '/'), std::string_view(""));
  EXPECT_EQ(TrimLeading("///", '/'), std::string_view(""));
  EXPECT_EQ(TrimTrailing("///", '/'), std::string_view(""));
}

}  // namespace routepat

/**
 * @file query_spec_test.cpp
 * @brief Tests for query-string parameter parsing
 */

#include "query/query_spec.h"

#include <gtest/gtest.h>

using namespace monitorgate::query;

TEST(QuerySpecTest, ParseSimplePairs) {
  auto spec = QuerySpec::Parse("severity=critical&sort=-duration");
  EXPECT_EQ(spec.GetFirst("severity"), "critical");
  EXPECT_EQ(spec.GetFirst("sort"), "-duration");
  EXPECT_FALSE(spec.GetFirst("limit").has_value());
}

TEST(QuerySpecTest, ParseStripsLeadingQuestionMark) {
  auto spec = QuerySpec::Parse("?page=2");
  EXPECT_EQ(spec.GetFirst("page"), "2");
  EXPECT_FALSE(spec.Contains("?page"));
}

TEST(QuerySpecTest, ParseEmptyString) {
  EXPECT_TRUE(QuerySpec::Parse("").empty());
  EXPECT_TRUE(QuerySpec::Parse("?").empty());
}

TEST(QuerySpecTest, ParseDecodesKeysAndValues) {
  auto spec = QuerySpec::Parse("name=CPU%20Usage&instance=node%3A9100&q=a+b");
  EXPECT_EQ(spec.GetFirst("name"), "CPU Usage");
  EXPECT_EQ(spec.GetFirst("instance"), "node:9100");
  EXPECT_EQ(spec.GetFirst("q"), "a b");
}

TEST(QuerySpecTest, ParseKeyWithoutValue) {
  auto spec = QuerySpec::Parse("flag&x=1&&");
  ASSERT_TRUE(spec.Contains("flag"));
  EXPECT_EQ(spec.GetFirst("flag"), "");
  EXPECT_EQ(spec.GetFirst("x"), "1");
  EXPECT_EQ(spec.entries().size(), 2U);
}

TEST(QuerySpecTest, RepeatedKeysKeepAllValuesInOrder) {
  auto spec = QuerySpec::Parse("duration=gte:5&severity=critical&duration=lte:10");
  auto values = spec.GetAll("duration");
  ASSERT_EQ(values.size(), 2U);
  EXPECT_EQ(values[0], "gte:5");
  EXPECT_EQ(values[1], "lte:10");
  EXPECT_EQ(spec.GetFirst("duration"), "gte:5");

  ASSERT_EQ(spec.entries().size(), 2U);
  EXPECT_EQ(spec.entries()[0].first, "duration");
  EXPECT_EQ(spec.entries()[1].first, "severity");
}

TEST(QuerySpecTest, ParseMatchesServerSideParams) {
  auto parsed = QuerySpec::Parse("match%5B%5D=up&severity=critical&match%5B%5D=node_load1&q=a%26b%3Dc");

  std::multimap<std::string, std::string> params = {
      {"match[]", "up"}, {"match[]", "node_load1"}, {"q", "a&b=c"}, {"severity", "critical"}};
  auto from_params = QuerySpec::FromParams(params);

  EXPECT_EQ(parsed.entries(), from_params.entries());
  EXPECT_EQ(parsed.GetAll("match[]"), (std::vector<std::string>{"up", "node_load1"}));
  EXPECT_EQ(parsed.GetFirst("q"), "a&b=c");
}

TEST(QuerySpecTest, GetAllOfAbsentKeyIsEmpty) { EXPECT_TRUE(QuerySpec::Parse("a=1").GetAll("b").empty()); }

TEST(QuerySpecTest, ReservedKeys) {
  QuerySpec spec;
  EXPECT_TRUE(spec.IsReserved("page"));
  EXPECT_TRUE(spec.IsReserved("sort"));
  EXPECT_TRUE(spec.IsReserved("limit"));
  EXPECT_TRUE(spec.IsReserved("fields"));
  EXPECT_FALSE(spec.IsReserved("filter"));
  EXPECT_FALSE(spec.IsReserved("Page"));

  spec.Reserve("filter");
  EXPECT_TRUE(spec.IsReserved("filter"));
}

TEST(QuerySpecTest, FilterEntriesSkipReservedKeys) {
  auto spec = QuerySpec::Parse("page=1&severity=critical&limit=5&filter=x&fields=name&sort=name&name=cpu");
  spec.Reserve("filter");

  auto entries = spec.FilterEntries();
  ASSERT_EQ(entries.size(), 2U);
  EXPECT_EQ(entries[0].first, "name");
  EXPECT_EQ(entries[1].first, "severity");
}

TEST(QuerySpecTest, FromParamsGroupsMultimapValues) {
  std::multimap<std::string, std::string> params = {
      {"duration", "gte:5"}, {"duration", "lte:10"}, {"severity", "critical"}};
  auto spec = QuerySpec::FromParams(params);

  auto values = spec.GetAll("duration");
  ASSERT_EQ(values.size(), 2U);
  EXPECT_EQ(values[0], "gte:5");
  EXPECT_EQ(values[1], "lte:10");
  EXPECT_EQ(spec.GetFirst("severity"), "critical");
}

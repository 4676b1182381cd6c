// Tests for figured_bass/rules.h -- defaults and JSON configuration.

#include "figured_bass/rules.h"

#include <gtest/gtest.h>

#include <string>

namespace figbass {
namespace {

TEST(RulesTest, Defaults) {
  Rules rules;
  EXPECT_TRUE(rules.forbid_incomplete_possibilities);
  ASSERT_TRUE(rules.upper_parts_max_semitone_separation.has_value());
  EXPECT_EQ(*rules.upper_parts_max_semitone_separation, 12);
  EXPECT_FALSE(rules.forbid_unisons);
  EXPECT_TRUE(rules.dim7_doubling_from_context);
  EXPECT_FALSE(rules.apply_consecutive_rules_to_resolution);
  EXPECT_EQ(rules.maxLeapFor("S"), -1);
  EXPECT_FALSE(rules.isOmittable(5));
}

TEST(RulesJsonTest, ReadsOptions) {
  Rules rules;
  std::string error;
  ASSERT_TRUE(rulesFromJson(R"({
      "forbid_hidden_fifths": false,
      "upper_parts_max_semitone_separation": null,
      "omittable_figures": "5",
      "max_leap_S": 0,
      "max_realizations_per_slot": 500
  })", rules, &error)) << error;
  EXPECT_FALSE(rules.forbid_hidden_fifths);
  EXPECT_FALSE(rules.upper_parts_max_semitone_separation.has_value());
  EXPECT_TRUE(rules.isOmittable(5));
  EXPECT_FALSE(rules.isOmittable(3));
  EXPECT_EQ(rules.maxLeapFor("S"), 0);
  EXPECT_EQ(rules.maxLeapFor("A"), -1);
  EXPECT_EQ(rules.max_realizations_per_slot, 500u);
  // Unnamed options keep their defaults.
  EXPECT_TRUE(rules.forbid_parallel_fifths);
}

TEST(RulesJsonTest, RejectsUnknownKeysAndTypes) {
  Rules rules;
  rules.forbid_unisons = true;
  std::string error;
  EXPECT_FALSE(rulesFromJson(R"({"forbid_everything": true})", rules, &error));
  EXPECT_NE(error.find("forbid_everything"), std::string::npos);
  EXPECT_FALSE(rulesFromJson(R"({"forbid_unisons": 1})", rules, &error));
  EXPECT_FALSE(rulesFromJson(R"({"max_leap_S": -2})", rules, &error));
  EXPECT_FALSE(rulesFromJson(R"({"omittable_figures": "5,x"})", rules, &error));
  EXPECT_FALSE(rulesFromJson(R"({"max_realizations_per_slot": 0})", rules, &error));
  EXPECT_FALSE(rulesFromJson("not json", rules, &error));
  // Failures leave the output untouched.
  EXPECT_TRUE(rules.forbid_unisons);
}

TEST(RulesJsonTest, SnapshotRoundTrips) {
  Rules rules;
  rules.forbid_voice_crossing = false;
  rules.upper_parts_max_semitone_separation.reset();
  rules.omittable_figures = {5, 3};
  rules.part_movement_limits.push_back({"B", 7});

  std::string json = rulesToJson(rules);
  EXPECT_NE(json.find(R"("upper_parts_max_semitone_separation":null)"), std::string::npos);
  EXPECT_NE(json.find(R"("max_leap_B":7)"), std::string::npos);

  Rules parsed;
  std::string error;
  ASSERT_TRUE(rulesFromJson(json, parsed, &error)) << error;
  EXPECT_FALSE(parsed.forbid_voice_crossing);
  EXPECT_FALSE(parsed.upper_parts_max_semitone_separation.has_value());
  EXPECT_TRUE(parsed.isOmittable(3));
  EXPECT_EQ(parsed.maxLeapFor("B"), 7);
  EXPECT_EQ(rulesToJson(parsed), json);
}

}  // namespace
}  // namespace figbass

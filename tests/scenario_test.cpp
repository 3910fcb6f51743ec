#include <gtest/gtest.h>

#include "test_support.hpp"
#include "vigil/scenario.hpp"

using namespace vigil;
using vigil::testing::make_def;

TEST(AlertLevelTest, ParsesCaseInsensitively) {
    EXPECT_EQ(parse_alert_level("HIGH"), AlertLevel::HIGH);
    EXPECT_EQ(parse_alert_level("Medium"), AlertLevel::MEDIUM);
    EXPECT_EQ(parse_alert_level("low"), AlertLevel::LOW);
    EXPECT_FALSE(parse_alert_level("critical").has_value());
    EXPECT_FALSE(parse_alert_level("").has_value());
}

TEST(AlertLevelTest, PriorityOrdersHighOverMediumOverLow) {
    EXPECT_GT(alert_priority(AlertLevel::HIGH), alert_priority(AlertLevel::MEDIUM));
    EXPECT_GT(alert_priority(AlertLevel::MEDIUM), alert_priority(AlertLevel::LOW));
    EXPECT_EQ(alert_level_to_string(AlertLevel::HIGH), "high");
}

TEST(ScenarioValidationTest, AcceptsWellFormedDefinition) {
    EXPECT_EQ(validation_error(make_def("fall", 0.5)), "");
    EXPECT_EQ(validation_error(make_def("edge_low", 0.0)), "");
    EXPECT_EQ(validation_error(make_def("edge_high", 1.0)), "");
}

TEST(ScenarioValidationTest, RejectsMissingPrompt) {
    auto def = make_def("fall", 0.5);
    def.prompt = "   ";
    EXPECT_NE(validation_error(def).find("prompt"), std::string::npos);
}

TEST(ScenarioValidationTest, RejectsThresholdOutsideUnitInterval) {
    EXPECT_NE(validation_error(make_def("fall", 1.01)).find("threshold"), std::string::npos);
    EXPECT_NE(validation_error(make_def("fall", -0.1)).find("threshold"), std::string::npos);
    EXPECT_NE(validation_error(make_def("fall", std::nan(""))).find("threshold"), std::string::npos);
}

TEST(ScenarioValidationTest, RejectsBadCooldownAndFrameCount) {
    EXPECT_NE(validation_error(make_def("fall", 0.5, 1, -1.0)).find("cooldown"), std::string::npos);
    EXPECT_NE(validation_error(make_def("fall", 0.5, 0)).find("consecutive_frames"), std::string::npos);
}

TEST(ScenarioValidationTest, RejectsEmptyId) {
    EXPECT_NE(validation_error(make_def("", 0.5)), "");
}

TEST(ScenarioTest, ObserveCountsOnlyStrictlyAboveThreshold) {
    Scenario s(make_def("fall", 0.5, 2), 10);
    EXPECT_FALSE(s.observe(0.5));
    EXPECT_EQ(s.runtime().consecutive_count, 0);
    EXPECT_FALSE(s.observe(0.51));
    EXPECT_EQ(s.runtime().consecutive_count, 1);
    EXPECT_TRUE(s.observe(0.9));
    EXPECT_EQ(s.runtime().consecutive_count, 2);
}

TEST(ScenarioTest, SingleMissCancelsStreak) {
    Scenario s(make_def("fall", 0.5, 3), 10);
    s.observe(0.8);
    s.observe(0.8);
    EXPECT_FALSE(s.observe(0.2));
    EXPECT_EQ(s.runtime().consecutive_count, 0);
}

TEST(ScenarioTest, HistoryIsBoundedByCapacity) {
    Scenario s(make_def("fall", 0.5), 3);
    for (double v : {0.1, 0.2, 0.3, 0.4, 0.5}) s.observe(v);
    ASSERT_EQ(s.runtime().history.size(), 3u);
    EXPECT_DOUBLE_EQ(s.runtime().history.front(), 0.3);
    EXPECT_DOUBLE_EQ(s.runtime().history.back(), 0.5);

    s.set_history_capacity(1);
    ASSERT_EQ(s.runtime().history.size(), 1u);
    EXPECT_DOUBLE_EQ(s.runtime().history.front(), 0.5);
}

TEST(ScenarioTest, NeverTriggeredScenarioIsNotInCooldown) {
    Scenario s(make_def("fall", 0.5, 1, 30.0), 10);
    EXPECT_FALSE(s.in_cooldown(0.0));
    EXPECT_FALSE(s.in_cooldown(5.0));
    EXPECT_TRUE(s.eligible(0.0));
}

TEST(ScenarioTest, TriggerStartsCooldownAndClearsStreak) {
    Scenario s(make_def("fall", 0.5, 1, 30.0), 10);
    s.observe(0.9);
    s.trigger(100.0);
    EXPECT_EQ(s.runtime().consecutive_count, 0);
    EXPECT_TRUE(s.in_cooldown(100.0));
    EXPECT_TRUE(s.in_cooldown(129.999));
    EXPECT_FALSE(s.in_cooldown(130.0));
    EXPECT_FALSE(s.eligible(110.0));
    EXPECT_TRUE(s.eligible(130.0));
}

TEST(ScenarioTest, DisabledScenarioIsNotEligible) {
    auto def = make_def("fall", 0.5);
    def.enabled = false;
    Scenario s(def, 10);
    EXPECT_FALSE(s.eligible(0.0));
}

TEST(ScenarioTest, RedefineKeepsRuntimeAndResetClearsIt) {
    Scenario s(make_def("fall", 0.5, 3), 10);
    s.observe(0.9);
    s.redefine(make_def("fall", 0.7, 3));
    EXPECT_DOUBLE_EQ(s.definition().threshold, 0.7);
    EXPECT_EQ(s.runtime().consecutive_count, 1);
    EXPECT_EQ(s.runtime().history.size(), 1u);

    s.trigger(5.0);
    s.reset();
    EXPECT_EQ(s.runtime().consecutive_count, 0);
    EXPECT_TRUE(s.runtime().history.empty());
    EXPECT_FALSE(s.runtime().triggered);
    EXPECT_FALSE(s.in_cooldown(5.0));
}

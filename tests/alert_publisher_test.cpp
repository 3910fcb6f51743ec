#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "vigil/alert_publisher.hpp"

using namespace vigil;
using vigil::testing::TempDir;
using vigil::testing::read_text;

namespace {

DetectionResult detection(const std::string& id, const std::string& name, AlertLevel level, double conf) {
    DetectionResult r;
    r.detected = true;
    r.scenario_id = id;
    r.scenario_name = name;
    r.alert_level = level;
    r.confidence = conf;
    r.timestamp_sec = 12.5;
    r.all_scores = {{id, conf}, {"other", 1.0 - conf}};
    return r;
}

std::vector<std::string> lines(const std::string& path) {
    std::ifstream f(path);
    std::vector<std::string> out;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

}  // namespace

TEST(AlertPublisherTest, WritesOneJsonLinePerAlert) {
    TempDir dir;
    const std::string path = dir.file("logs/alerts.jsonl");
    AlertPublisher publisher(path, false);

    EXPECT_TRUE(publisher.publish(detection("fall", "Person falling", AlertLevel::HIGH, 0.82)));
    EXPECT_TRUE(publisher.publish(detection("fire", "Fire", AlertLevel::MEDIUM, 0.6)));

    auto written = lines(path);
    ASSERT_EQ(written.size(), 2u);
    const std::string& first = written[0];
    EXPECT_EQ(first.front(), '{');
    EXPECT_NE(first.find("\"type\":\"scenario_alert\""), std::string::npos);
    EXPECT_NE(first.find("\"scenario_id\":\"fall\""), std::string::npos);
    EXPECT_NE(first.find("\"scenario_name\":\"Person falling\""), std::string::npos);
    EXPECT_NE(first.find("\"confidence\":0.8200"), std::string::npos);
    EXPECT_NE(first.find("\"alert_level\":\"high\""), std::string::npos);
    EXPECT_NE(first.find("\"timestamp\":12.500"), std::string::npos);
    EXPECT_NE(first.find("\"all_scores\":{\"fall\":0.8200,\"other\":0.1800}"), std::string::npos);
}

TEST(AlertPublisherTest, IgnoresResultsWithoutDetection) {
    TempDir dir;
    const std::string path = dir.file("alerts.jsonl");
    AlertPublisher publisher(path, false);

    DetectionResult quiet;
    quiet.all_scores = {{"fall", 0.2}};
    EXPECT_FALSE(publisher.publish(quiet));
    DetectionResult failed;
    failed.error = "backend offline";
    EXPECT_FALSE(publisher.publish(failed));

    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_EQ(publisher.statistics().total_alerts, 0u);
}

TEST(AlertPublisherTest, BaselineScenariosNeverAlert) {
    EXPECT_TRUE(AlertPublisher::is_baseline("normal"));
    EXPECT_TRUE(AlertPublisher::is_baseline("Normal"));
    EXPECT_TRUE(AlertPublisher::is_baseline("正常"));
    EXPECT_TRUE(AlertPublisher::is_baseline("普通"));
    EXPECT_FALSE(AlertPublisher::is_baseline("abnormal"));

    TempDir dir;
    AlertPublisher publisher(dir.file("alerts.jsonl"), false);
    EXPECT_FALSE(publisher.publish(detection("normal", "NORMAL", AlertLevel::LOW, 0.9)));
    EXPECT_TRUE(publisher.history().empty());
}

TEST(AlertPublisherTest, StatisticsCountPerScenario) {
    TempDir dir;
    AlertPublisher publisher(dir.file("alerts.jsonl"), false);
    publisher.publish(detection("fall", "Person falling", AlertLevel::HIGH, 0.8));
    publisher.publish(detection("fire", "Fire", AlertLevel::HIGH, 0.7));
    publisher.publish(detection("fall", "Person falling", AlertLevel::HIGH, 0.9));

    AlertStatistics st = publisher.statistics();
    EXPECT_EQ(st.total_alerts, 3u);
    EXPECT_EQ(st.by_scenario.at("Person falling"), 2u);
    EXPECT_EQ(st.by_scenario.at("Fire"), 1u);
    EXPECT_FALSE(st.first_alert.empty());
    EXPECT_LE(st.first_alert, st.last_alert);
    ASSERT_EQ(publisher.history().size(), 3u);
    EXPECT_EQ(publisher.history()[1].scenario_id, "fire");
}

TEST(AlertPublisherTest, ReadAlertsJsonReturnsArray) {
    TempDir dir;
    const std::string path = dir.file("alerts.jsonl");
    EXPECT_EQ(read_alerts_json(path), "[]");

    AlertPublisher publisher(path, false);
    publisher.publish(detection("fall", "Person falling", AlertLevel::HIGH, 0.8));
    publisher.publish(detection("fire", "Fire", AlertLevel::HIGH, 0.7));

    const std::string arr = read_alerts_json(path);
    EXPECT_EQ(arr.front(), '[');
    EXPECT_EQ(arr.back(), ']');
    EXPECT_NE(arr.find("},{"), std::string::npos);
    EXPECT_EQ(arr.size(), read_text(path).size() + 1);
}

TEST(AlertPublisherTest, UnwritableFileStillCountsAlert) {
    TempDir dir;
    // A directory where the file should be makes the open fail.
    const std::string path = dir.file("taken");
    std::filesystem::create_directories(path);
    AlertPublisher publisher(path, false);
    EXPECT_TRUE(publisher.publish(detection("fall", "Person falling", AlertLevel::HIGH, 0.8)));
    EXPECT_EQ(publisher.statistics().total_alerts, 1u);
}

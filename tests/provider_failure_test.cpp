#include <gtest/gtest.h>

#include <memory>

#include "test_support.hpp"
#include "vigil/detection_engine.hpp"

using namespace vigil;
using vigil::testing::FakeFrame;
using vigil::testing::ScriptedProvider;
using vigil::testing::make_def;
using vigil::testing::prompt_for;

namespace {

class ProviderFailureTest : public ::testing::Test {
protected:
    ProviderFailureTest() : provider_(std::make_shared<ScriptedProvider>()), engine_(store_, provider_) {
        engine_.reload({make_def("fall", 0.5, 2, 0.0), make_def("fire", 0.5, 2, 0.0)});
        provider_->scores[prompt_for("fall")] = 2.0f;
    }

    void expect_failed(const DetectionResult& r) {
        EXPECT_FALSE(r.ok());
        ASSERT_TRUE(r.error.has_value());
        EXPECT_FALSE(r.error->empty());
        EXPECT_FALSE(r.detected);
        EXPECT_TRUE(r.all_scores.empty());
    }

    ScenarioStore store_;
    std::shared_ptr<ScriptedProvider> provider_;
    DetectionEngine<FakeFrame> engine_;
};

}  // namespace

TEST_F(ProviderFailureTest, ThrowingProviderFailsFrameWithoutTouchingState) {
    ASSERT_FALSE(engine_.detect(FakeFrame{}, 1.0).detected);
    const auto before = engine_.scenario_statistics("fall");

    provider_->throw_on_predict = true;
    DetectionResult r = engine_.detect(FakeFrame{}, 2.0);
    expect_failed(r);
    EXPECT_NE(r.error->find("backend offline"), std::string::npos);

    const auto after = engine_.scenario_statistics("fall");
    EXPECT_EQ(after->consecutive_count, before->consecutive_count);
    EXPECT_EQ(after->history_size, before->history_size);
}

TEST_F(ProviderFailureTest, StreakResumesAfterFailedFrame) {
    engine_.detect(FakeFrame{}, 1.0);
    provider_->throw_on_predict = true;
    engine_.detect(FakeFrame{}, 2.0);
    provider_->throw_on_predict = false;

    DetectionResult r = engine_.detect(FakeFrame{}, 3.0);
    EXPECT_TRUE(r.ok());
    ASSERT_TRUE(r.detected);
    EXPECT_EQ(r.scenario_id, "fall");
}

TEST_F(ProviderFailureTest, WrongNumberOfScoresIsRejected) {
    provider_->drop_last_score = true;
    DetectionResult r = engine_.detect(FakeFrame{}, 1.0);
    expect_failed(r);
    EXPECT_NE(r.error->find("1 scores for 2 prompts"), std::string::npos);
    EXPECT_EQ(engine_.scenario_statistics("fall")->history_size, 0u);
}

TEST_F(ProviderFailureTest, NonFiniteScoreIsRejected) {
    provider_->return_nan = true;
    DetectionResult r = engine_.detect(FakeFrame{}, 1.0);
    expect_failed(r);
    EXPECT_EQ(engine_.scenario_statistics("fire")->history_size, 0u);
}

TEST_F(ProviderFailureTest, ProviderThatIsNotReadyIsNeverCalled) {
    provider_->is_ready = false;
    expect_failed(engine_.detect(FakeFrame{}, 1.0));
    EXPECT_EQ(provider_->calls, 0);
}

TEST_F(ProviderFailureTest, MissingProviderFailsEveryFrame) {
    ScenarioStore store;
    DetectionEngine<FakeFrame> engine(store, nullptr);
    engine.reload({make_def("fall", 0.5)});
    expect_failed(engine.detect(FakeFrame{}, 1.0));
}

TEST_F(ProviderFailureTest, FailureNeverProducesADetection) {
    // A single eligible scenario would otherwise fire on every frame.
    engine_.reload({make_def("fall", 0.1, 1, 0.0)});
    provider_->throw_on_predict = true;
    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(engine_.detect(FakeFrame{}, i).detected);
    }
    EXPECT_FALSE(engine_.scenario_statistics("fall")->in_cooldown);
}

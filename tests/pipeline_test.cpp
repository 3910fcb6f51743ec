#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "test_support.hpp"
#include "vision_support.hpp"
#include "vigil/pipeline.hpp"

using namespace vigil;
using vigil::testing::FlatProvider;
using vigil::testing::TempDir;
using vigil::testing::make_def;
using vigil::testing::write_clip;

namespace {

class PipelineTest : public ::testing::Test {
protected:
    PipelineTest()
        : engine_(store_, std::make_shared<FlatProvider>()),
          publisher_(dir_.file("alerts.jsonl"), false) {}

    void SetUp() override {
        ASSERT_TRUE(engine_.reload({make_def("fall", 0.9), make_def("fire", 0.9)}).ok);
        clip_ = dir_.file("clip.avi");
        have_clip_ = write_clip(clip_, 10);
    }

    PipelineOptions options() const {
        PipelineOptions opts;
        opts.source = clip_;
        opts.extract_interval = 0.0;
        opts.save_snapshots = false;
        opts.buffer_size = 4;
        return opts;
    }

    static void wait_until_stopped(const Pipeline& p) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (p.running() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    TempDir dir_;
    ScenarioStore store_;
    VideoEngine engine_;
    AlertPublisher publisher_;
    std::string clip_;
    bool have_clip_{false};
};

}  // namespace

TEST_F(PipelineTest, UptimeIsMeasuredFromStart) {
    if (!have_clip_) GTEST_SKIP() << "MJPEG encoding unavailable";
    Pipeline pipeline(engine_, publisher_, options());

    const auto before = std::chrono::steady_clock::now();
    pipeline.start();
    const double uptime = pipeline.uptime_sec();
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - before).count();
    EXPECT_GE(uptime, 0.0);
    EXPECT_LE(uptime, elapsed);

    wait_until_stopped(pipeline);
    pipeline.stop();
    EXPECT_DOUBLE_EQ(pipeline.uptime_sec(), 0.0);
}

TEST_F(PipelineTest, FileRunScoresEveryQueuedFrame) {
    if (!have_clip_) GTEST_SKIP() << "MJPEG encoding unavailable";
    Pipeline pipeline(engine_, publisher_, options());
    pipeline.run();

    const PipelineMetrics& m = pipeline.metrics();
    EXPECT_FALSE(pipeline.running());
    EXPECT_EQ(m.captured.load(), 10u);
    EXPECT_EQ(m.queued.load(), 10u);
    EXPECT_EQ(m.frames.load(), 10u);
    EXPECT_EQ(m.drops.load(), 0u);
    EXPECT_EQ(m.failures.load(), 0u);
    EXPECT_EQ(m.detections.load(), 0u);
}

TEST(PipelineReadinessTest, RefusesToStartWithoutReadyProvider) {
    class OfflineProvider : public FlatProvider {
    public:
        bool ready() const override { return false; }
    };
    TempDir dir;
    ScenarioStore store;
    VideoEngine engine(store, std::make_shared<OfflineProvider>());
    AlertPublisher publisher(dir.file("alerts.jsonl"), false);
    Pipeline pipeline(engine, publisher, PipelineOptions{});
    EXPECT_THROW(pipeline.start(), std::runtime_error);
    EXPECT_THROW(pipeline.run(), std::runtime_error);
    EXPECT_FALSE(pipeline.running());
}

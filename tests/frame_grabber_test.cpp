#include <gtest/gtest.h>

#include "test_support.hpp"
#include "vision_support.hpp"
#include "vigil/frame_grabber.hpp"

using namespace vigil;
using vigil::testing::TempDir;
using vigil::testing::write_clip;

namespace {

std::size_t drain(FrameBuffer<FrameResult>& buffer) {
    std::size_t n = 0;
    FrameResult item;
    while (buffer.pop(item)) n++;
    return n;
}

}  // namespace

TEST(FrameGrabberTest, ClassifiesSources) {
    EXPECT_EQ(classify_source("0"), SourceKind::CAMERA);
    EXPECT_EQ(classify_source("12"), SourceKind::CAMERA);
    EXPECT_EQ(classify_source("rtsp://10.0.0.2/stream"), SourceKind::STREAM);
    EXPECT_EQ(classify_source("http://cam/mjpg"), SourceKind::STREAM);
    EXPECT_EQ(classify_source("videos/fall.mp4"), SourceKind::FILE);
    EXPECT_EQ(classify_source(""), SourceKind::FILE);
}

TEST(FrameGrabberTest, ReadsWholeFileAndCountsFrames) {
    TempDir dir;
    const std::string clip = dir.file("clip.avi");
    if (!write_clip(clip, 10)) GTEST_SKIP() << "MJPEG encoding unavailable";

    FrameBuffer<FrameResult> buffer(16);
    FrameGrabber grabber(clip, buffer, 0.0, 30);
    grabber.start();
    const std::size_t popped = drain(buffer);
    grabber.stop();

    EXPECT_EQ(grabber.frames_read(), 10u);
    EXPECT_EQ(grabber.frames_queued(), 10u);
    EXPECT_EQ(popped, 10u);
    EXPECT_EQ(grabber.frames_dropped(), 0u);
    EXPECT_FALSE(grabber.running());
}

TEST(FrameGrabberTest, SamplingIntervalSkipsFrames) {
    TempDir dir;
    const std::string clip = dir.file("clip.avi");
    if (!write_clip(clip, 10)) GTEST_SKIP() << "MJPEG encoding unavailable";

    FrameBuffer<FrameResult> buffer(16);
    FrameGrabber grabber(clip, buffer, 0.25, 30);
    grabber.start();
    const std::size_t popped = drain(buffer);
    grabber.stop();

    EXPECT_EQ(grabber.frames_read(), 10u);
    EXPECT_EQ(grabber.frames_queued(), popped);
    EXPECT_GE(popped, 3u);
    EXPECT_LE(popped, 5u);
}

TEST(FrameGrabberTest, MissingFileStopsBuffer) {
    TempDir dir;
    FrameBuffer<FrameResult> buffer(4);
    FrameGrabber grabber(dir.file("absent.avi"), buffer, 0.0, 30);
    grabber.start();
    EXPECT_EQ(drain(buffer), 0u);
    grabber.stop();
    EXPECT_EQ(grabber.frames_read(), 0u);
}

#include <gtest/gtest.h>

#include <cstdlib>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

#include "vigil/config.hpp"

using namespace vigil;

namespace {

// Owns argv storage for parse_args.
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "vigil");
        for (auto& s : storage_) ptrs_.push_back(&s[0]);
    }
    int argc() { return static_cast<int>(ptrs_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        for (const char* name : {"VIGIL_SOURCE", "VIGIL_SCENARIOS", "VIGIL_IMAGE_ENCODER", "VIGIL_TEXT_ENCODER",
                                 "VIGIL_VOCAB", "VIGIL_ALERTS", "VIGIL_TEMPERATURE", "VIGIL_FPS", "VIGIL_PORT"}) {
            ::unsetenv(name);
        }
    }

    static AppConfig parse(std::initializer_list<std::string> args) {
        Args a(args);
        return parse_args(a.argc(), a.argv());
    }
};

}  // namespace

TEST_F(ConfigTest, DefaultsWithoutArguments) {
    AppConfig cfg = parse({});
    EXPECT_EQ(cfg.source, "0");
    EXPECT_EQ(cfg.scenarios_path, "config/scenarios.yaml");
    EXPECT_FLOAT_EQ(cfg.temperature, 1.0f);
    EXPECT_DOUBLE_EQ(cfg.extract_interval, 0.5);
    EXPECT_EQ(cfg.history_size, 10);
    EXPECT_TRUE(cfg.watch_scenarios);
    EXPECT_TRUE(cfg.save_snapshots);
    EXPECT_EQ(cfg.http_port, 8000);
    EXPECT_FALSE(cfg.help);
}

TEST_F(ConfigTest, FlagsOverrideDefaults) {
    AppConfig cfg = parse({"--source", "rtsp://cam/1", "--scenarios", "s.yaml", "--temperature", "0.07",
                           "--interval", "0", "--history", "25", "--alerts", "out/a.jsonl",
                           "--no-snapshots", "--no-watch", "--no-ort", "--show-window", "--fps", "15",
                           "--port", "9090", "--img", "336"});
    EXPECT_EQ(cfg.source, "rtsp://cam/1");
    EXPECT_EQ(cfg.scenarios_path, "s.yaml");
    EXPECT_FLOAT_EQ(cfg.temperature, 0.07f);
    EXPECT_DOUBLE_EQ(cfg.extract_interval, 0.0);
    EXPECT_EQ(cfg.history_size, 25);
    EXPECT_EQ(cfg.alerts_jsonl, "out/a.jsonl");
    EXPECT_FALSE(cfg.save_snapshots);
    EXPECT_FALSE(cfg.watch_scenarios);
    EXPECT_FALSE(cfg.use_ort);
    EXPECT_TRUE(cfg.show_window);
    EXPECT_EQ(cfg.target_fps, 15);
    EXPECT_EQ(cfg.http_port, 9090);
    EXPECT_EQ(cfg.image_size, 336);
}

TEST_F(ConfigTest, EnvironmentIsReadBeforeFlags) {
    ::setenv("VIGIL_SOURCE", "video.mp4", 1);
    ::setenv("VIGIL_PORT", "7000", 1);
    AppConfig env_only = parse({});
    EXPECT_EQ(env_only.source, "video.mp4");
    EXPECT_EQ(env_only.http_port, 7000);

    AppConfig flag_wins = parse({"--source", "1"});
    EXPECT_EQ(flag_wins.source, "1");
    EXPECT_EQ(flag_wins.http_port, 7000);
}

TEST_F(ConfigTest, RejectsUnknownAndIncompleteOptions) {
    EXPECT_THROW(parse({"--bogus"}), std::invalid_argument);
    EXPECT_THROW(parse({"--source"}), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsMalformedNumbers) {
    EXPECT_THROW(parse({"--fps", "ten"}), std::invalid_argument);
    EXPECT_THROW(parse({"--fps", "10x"}), std::invalid_argument);
    EXPECT_THROW(parse({"--temperature", "warm"}), std::invalid_argument);
    ::setenv("VIGIL_TEMPERATURE", "hot", 1);
    EXPECT_THROW(parse({}), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(parse({"--temperature", "0"}), std::invalid_argument);
    EXPECT_THROW(parse({"--interval", "-1"}), std::invalid_argument);
    EXPECT_THROW(parse({"--history", "0"}), std::invalid_argument);
    EXPECT_THROW(parse({"--port", "70000"}), std::invalid_argument);
    EXPECT_THROW(parse({"--watch-interval", "0"}), std::invalid_argument);
}

TEST_F(ConfigTest, HelpFlagIsRecognized) {
    EXPECT_TRUE(parse({"--help"}).help);
    EXPECT_TRUE(parse({"-h"}).help);
    EXPECT_NE(usage().find("--scenarios"), std::string::npos);
}

#include <gtest/gtest.h>
#include "core/Config.hpp"

#include <filesystem>
#include <fstream>

using namespace trellis;

TEST(ConfigTest, LoadFromValidString) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"name": "test", "value": 42})"));
    EXPECT_EQ(cfg.getString("name"), "test");
    EXPECT_EQ(cfg.getInt("value"), 42);
}

TEST(ConfigTest, LoadFromInvalidString) {
    Config cfg;
    EXPECT_FALSE(cfg.loadFromString("{invalid json}"));
}

TEST(ConfigTest, NonObjectDocumentIsRejected) {
    Config cfg;
    EXPECT_FALSE(cfg.loadFromString("[1, 2, 3]"));
    EXPECT_FALSE(cfg.loadFromString("17"));
}

TEST(ConfigTest, InvalidStringKeepsPreviousContents) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"a": 1})"));
    EXPECT_FALSE(cfg.loadFromString("not json"));
    EXPECT_EQ(cfg.getInt("a"), 1);
}

TEST(ConfigTest, LoadFromMissingFile) {
    Config cfg;
    EXPECT_FALSE(cfg.loadFromFile("nonexistent_file.json"));
}

TEST(ConfigTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "trellis_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"scroll": {"wheel_step": 5}})";
    }
    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(path.string()));
    EXPECT_EQ(cfg.settings().wheelStep, 5);
    std::filesystem::remove(path);
}

TEST(ConfigTest, DotNotation) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "render": { "repaint_threads": 4 },
        "log": { "level": "debug" }
    })"));

    EXPECT_EQ(cfg.getInt("render.repaint_threads"), 4);
    EXPECT_EQ(cfg.getString("log.level"), "debug");
}

TEST(ConfigTest, DefaultValues) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({})"));
    EXPECT_EQ(cfg.getString("missing", "fallback"), "fallback");
    EXPECT_EQ(cfg.getInt("missing", 99), 99);
}

TEST(ConfigTest, HasKey) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"a": {"b": 1}})"));
    EXPECT_TRUE(cfg.hasKey("a"));
    EXPECT_TRUE(cfg.hasKey("a.b"));
    EXPECT_FALSE(cfg.hasKey("a.c"));
    EXPECT_FALSE(cfg.hasKey("x"));
}

TEST(ConfigTest, TypeMismatchReturnsDefault) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"n": "text", "s": 5})"));
    EXPECT_EQ(cfg.getInt("n", 7), 7);
    EXPECT_EQ(cfg.getString("s", "d"), "d");
}

// =============================================================================
// Canvas settings
// =============================================================================

TEST(ConfigTest, SettingsDefaults) {
    Config cfg;
    CanvasSettings s = cfg.settings();
    EXPECT_EQ(s.repaintThreads, 2);
    EXPECT_EQ(s.maxFrameRate, 40);
    EXPECT_EQ(s.splitterSnapTolerance, 12);
    EXPECT_EQ(s.splitterHitTolerance, 6);
    EXPECT_EQ(s.wheelStep, 1);
    EXPECT_EQ(s.logLevel, "info");
    EXPECT_TRUE(s.logFile.empty());
}

TEST(ConfigTest, SettingsFromJson) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "render": { "repaint_threads": 3, "max_frame_rate": 60 },
        "splitter": { "snap_tolerance": 8, "hit_tolerance": 4 },
        "scroll": { "wheel_step": 3 },
        "log": { "level": "debug", "file": "trellis.log" }
    })"));
    CanvasSettings s = cfg.settings();
    EXPECT_EQ(s.repaintThreads, 3);
    EXPECT_EQ(s.maxFrameRate, 60);
    EXPECT_EQ(s.splitterSnapTolerance, 8);
    EXPECT_EQ(s.splitterHitTolerance, 4);
    EXPECT_EQ(s.wheelStep, 3);
    EXPECT_EQ(s.logLevel, "debug");
    EXPECT_EQ(s.logFile, "trellis.log");
}

TEST(ConfigTest, OutOfRangeSettingsFallBackToDefaults) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"render": {"repaint_threads": 0, "max_frame_rate": -5}})"));
    CanvasSettings s = cfg.settings();
    EXPECT_EQ(s.repaintThreads, 2);
    EXPECT_EQ(s.maxFrameRate, 40);
}

TEST(ConfigTest, MistypedSettingsFallBackToDefaults) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"splitter": {"snap_tolerance": "wide"}, "scroll": {"wheel_step": 2.5}})"));
    CanvasSettings s = cfg.settings();
    EXPECT_EQ(s.splitterSnapTolerance, 12);
    EXPECT_EQ(s.wheelStep, 1);
}

TEST(ConfigTest, UnknownLogLevelFallsBack) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"log": {"level": "loud"}})"));
    EXPECT_EQ(cfg.settings().logLevel, "info");

    ASSERT_TRUE(cfg.loadFromString(R"({"log": {"level": "warn"}})"));
    EXPECT_EQ(cfg.settings().logLevel, "warn");
}

#include <gtest/gtest.h>
#include "ConfigStore.hpp"
#include <cstdio>
#include <fstream>
#include <string>

using namespace morpho;

TEST(ConfigStoreTest, SerializeRoundTrip) {
    EngineConfig config;
    config.sample_rate = 48000;
    config.block_size = 256;
    config.alsa_device = "hw:1,0";
    config.max_width = 2.0f;
    config.safety.cooldown_ticks = 30;
    config.safety.width_floor = 0.75f;

    const std::string text = ConfigStore::serialize(config);
    EngineConfig loaded;
    ASSERT_TRUE(ConfigStore::deserialize(loaded, text));
    EXPECT_EQ(loaded.sample_rate, 48000);
    EXPECT_EQ(loaded.block_size, 256u);
    EXPECT_EQ(loaded.alsa_device, "hw:1,0");
    EXPECT_FLOAT_EQ(loaded.max_width, 2.0f);
    EXPECT_EQ(loaded.safety.cooldown_ticks, 30);
    EXPECT_FLOAT_EQ(loaded.safety.width_floor, 0.75f);
    EXPECT_FLOAT_EQ(loaded.safety.width_decay, 0.95f);
}

TEST(ConfigStoreTest, MissingKeysKeepDefaults) {
    EngineConfig config;
    ASSERT_TRUE(ConfigStore::deserialize(config, R"({"sample_rate": 96000, "safety": {"indicator_ms": 500}})"));
    EXPECT_EQ(config.sample_rate, 96000);
    EXPECT_EQ(config.block_size, 512u);
    EXPECT_EQ(config.alsa_device, "default");
    EXPECT_FLOAT_EQ(config.haas_delay_seconds, 0.015f);
    EXPECT_EQ(config.monitor_tick_hz, 60);
    EXPECT_EQ(config.safety.indicator_ms, 500);
    EXPECT_EQ(config.safety.cooldown_ticks, 60);
}

TEST(ConfigStoreTest, ValuesAreClamped) {
    EngineConfig config;
    ASSERT_TRUE(ConfigStore::deserialize(config, R"({
        "sample_rate": 100,
        "block_size": 1,
        "max_width": 10.0,
        "haas_delay_seconds": 1.0,
        "correlation_smoothing": 2.0,
        "alsa_device": "",
        "safety": {"width_floor": 9.0, "cooldown_ticks": -5}
    })"));
    EXPECT_EQ(config.sample_rate, 3000);
    EXPECT_EQ(config.block_size, 16u);
    EXPECT_FLOAT_EQ(config.max_width, 4.0f);
    EXPECT_FLOAT_EQ(config.haas_delay_seconds, 0.05f);
    EXPECT_FLOAT_EQ(config.correlation_smoothing, 0.999f);
    EXPECT_EQ(config.alsa_device, "default");
    EXPECT_FLOAT_EQ(config.safety.width_floor, 4.0f);
    EXPECT_EQ(config.safety.cooldown_ticks, 1);
}

TEST(ConfigStoreTest, RejectsInvalidDocuments) {
    EngineConfig config;
    config.sample_rate = 22050;

    EXPECT_FALSE(ConfigStore::deserialize(config, "{ not json"));
    EXPECT_FALSE(ConfigStore::deserialize(config, "[1, 2, 3]"));
    EXPECT_FALSE(ConfigStore::deserialize(config, R"({"sample_rate": "fast"})"));
    EXPECT_EQ(config.sample_rate, 22050);
}

TEST(ConfigStoreTest, FileRoundTrip) {
    const std::string path = ::testing::TempDir() + "morpho_config_test.json";
    EngineConfig config;
    config.monitor_tick_hz = 30;
    ASSERT_TRUE(ConfigStore::save_to_file(config, path));

    EngineConfig loaded;
    ASSERT_TRUE(ConfigStore::load_from_file(loaded, path));
    EXPECT_EQ(loaded.monitor_tick_hz, 30);
    std::remove(path.c_str());
}

TEST(ConfigStoreTest, MissingFileFails) {
    EngineConfig config;
    EXPECT_FALSE(ConfigStore::load_from_file(config, ::testing::TempDir() + "does_not_exist_morpho.json"));
    EXPECT_EQ(config.sample_rate, 44100);
}

#include <gtest/gtest.h>
#include "pairlink/core/config.hpp"
#include "pairlink/transfer/transfer_options.hpp"
#include <fstream>
#include <filesystem>

using namespace pairlink::core;
using pairlink::transfer::TransferOptions;
using namespace std::chrono_literals;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_pairlink_config.txt";
    }

    void TearDown() override {
        Config::instance().clear();
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }

    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();

    config.set("test.key", "test_value");

    auto value = config.get("test.key");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "test_value");
}

TEST_F(ConfigTest, GetNonExistent) {
    auto& config = Config::instance();

    auto value = config.get("nonexistent.key");
    EXPECT_FALSE(value.has_value());
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();

    config.set("bool.true", "true");
    config.set("bool.yes", "YES");
    config.set("bool.false", "false");
    config.set("int.value", "42");
    config.set("double.value", "0.25");
    config.set("string.value", "hello world");

    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_TRUE(config.get_bool("bool.yes"));
    EXPECT_FALSE(config.get_bool("bool.false"));
    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_DOUBLE_EQ(config.get_double("double.value"), 0.25);
    EXPECT_EQ(config.get_string("string.value"), "hello world");
}

TEST_F(ConfigTest, MalformedNumbersFallBackToDefault) {
    auto& config = Config::instance();

    config.set("int.bad", "12ms");
    config.set("double.bad", "fast");

    EXPECT_EQ(config.get_int("int.bad", 7), 7);
    EXPECT_DOUBLE_EQ(config.get_double("double.bad", 1.5), 1.5);
    EXPECT_FALSE(config.get_as<int>("int.bad").has_value());
}

TEST_F(ConfigTest, DefaultValues) {
    auto& config = Config::instance();

    EXPECT_FALSE(config.get_bool("nonexistent", false));
    EXPECT_TRUE(config.get_bool("nonexistent", true));
    EXPECT_EQ(config.get_int("nonexistent", 123), 123);
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "key1=value1\n";
    file << "key2 = value2 \n";
    file << "   \n";
    file << "no equals sign here\n";
    file << "transfer.auto_show=false\n";
    file << "transfer.dismiss_delay_ms=2500\n";
    file.close();

    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_string("key1"), "value1");
    EXPECT_EQ(config.get_string("key2"), "value2");
    EXPECT_FALSE(config.get_bool("transfer.auto_show", true));
    EXPECT_EQ(config.get_int("transfer.dismiss_delay_ms"), 2500);
}

TEST_F(ConfigTest, LoadSectionsAndInlineComments) {
    std::ofstream file(test_file);
    file << "top = 1\n";
    file << "[transfer]\n";
    file << "dismiss_delay_ms = 4000   # four seconds\n";
    file << "smoothing_alpha=0.5\n";
    file << "[ log ]\n";
    file << "file = logs/run#1.log\n";
    file.close();

    auto& config = Config::instance();
    ASSERT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_int("top"), 1);
    EXPECT_EQ(config.get_int("transfer.dismiss_delay_ms"), 4000);
    EXPECT_DOUBLE_EQ(config.get_double("transfer.smoothing_alpha"), 0.5);
    EXPECT_EQ(config.get_string("log.file"), "logs/run#1.log");
    EXPECT_EQ(config.size(), 4u);
}

TEST_F(ConfigTest, UnrecognizedBooleanFallsBack) {
    auto& config = Config::instance();
    config.set("flag.on", "on");
    config.set("flag.off", "OFF");
    config.set("flag.odd", "sometimes");

    EXPECT_TRUE(config.get_bool("flag.on"));
    EXPECT_FALSE(config.get_bool("flag.off", true));
    EXPECT_TRUE(config.get_bool("flag.odd", true));
    EXPECT_FALSE(config.get_bool("flag.odd", false));
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(Config::instance().load_from_file("does_not_exist.conf"));
}

TEST_F(ConfigTest, SaveToFile) {
    auto& config = Config::instance();
    config.set("test.key1", "value1");
    config.set("test.key2", "value2");

    EXPECT_TRUE(config.save_to_file(test_file));
    EXPECT_TRUE(std::filesystem::exists(test_file));

    Config new_config;
    EXPECT_TRUE(new_config.load_from_file(test_file));
    EXPECT_EQ(new_config.get_string("test.key1"), "value1");
    EXPECT_EQ(new_config.get_string("test.key2"), "value2");
}

TEST_F(ConfigTest, SetDefaults) {
    auto& config = Config::instance();
    config.set_defaults();

    EXPECT_TRUE(config.get_bool("transfer.auto_show"));
    EXPECT_EQ(config.get_int("transfer.dismiss_delay_ms"), 10000);
    EXPECT_EQ(config.get_int("transfer.estimator_interval_ms"), 1000);
    EXPECT_DOUBLE_EQ(config.get_double("transfer.smoothing_alpha"), 0.4);
    EXPECT_EQ(config.get_string("log.level"), "info");
}

class TransferOptionsTest : public ::testing::Test {
protected:
    Config config_;
};

TEST_F(TransferOptionsTest, EmptyConfigGivesDefaults) {
    auto options = TransferOptions::from_config(config_);

    EXPECT_TRUE(options.auto_show_active);
    EXPECT_EQ(options.dismiss_delay, 10000ms);
    EXPECT_EQ(options.estimator_interval, 1000ms);
    EXPECT_DOUBLE_EQ(options.smoothing_alpha, 0.4);
}

TEST_F(TransferOptionsTest, ReadsTransferKeys) {
    config_.set("transfer.auto_show", "false");
    config_.set("transfer.dismiss_delay_ms", "3000");
    config_.set("transfer.estimator_interval_ms", "500");
    config_.set("transfer.smoothing_alpha", "0.25");

    auto options = TransferOptions::from_config(config_);

    EXPECT_FALSE(options.auto_show_active);
    EXPECT_EQ(options.dismiss_delay, 3000ms);
    EXPECT_EQ(options.estimator_interval, 500ms);
    EXPECT_DOUBLE_EQ(options.smoothing_alpha, 0.25);
}

TEST_F(TransferOptionsTest, OutOfRangeValuesKeepDefaults) {
    config_.set("transfer.dismiss_delay_ms", "0");
    config_.set("transfer.estimator_interval_ms", "-10");
    config_.set("transfer.smoothing_alpha", "1.5");

    auto options = TransferOptions::from_config(config_);

    EXPECT_EQ(options.dismiss_delay, 10000ms);
    EXPECT_EQ(options.estimator_interval, 1000ms);
    EXPECT_DOUBLE_EQ(options.smoothing_alpha, 0.4);
}

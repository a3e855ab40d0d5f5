#include <gtest/gtest.h>
#include "parley/config_loader.hpp"
#include <cstdio>
#include <fstream>

using namespace parley;
using json = nlohmann::json;

// ============================================================================
// parse_config
// ============================================================================

TEST(ConfigLoaderTest, EmptyObjectGivesDefaults) {
    auto config = parse_config(json::object());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(*config, Config{});
}

TEST(ConfigLoaderTest, ReadsAllFields) {
    json j = {
        {"api_key", "sk-test"},
        {"organization", "org-1"},
        {"default_model", "gpt-4"},
        {"message_limit", 20},
        {"message_expiration_seconds", 120},
        {"throw_on_error", false},
        {"worker_threads", 2},
        {"request_queue_capacity", 16},
        {"log_level", "debug"},
        {"default_parameters", {{"temperature", 0.2}, {"max_tokens", 512}, {"stop", {"###"}}}}
    };

    auto config = parse_config(j);
    ASSERT_TRUE(config.has_value()) << config.error().to_string();
    EXPECT_EQ(config->api_key, "sk-test");
    EXPECT_EQ(config->organization, std::optional<std::string>("org-1"));
    EXPECT_EQ(config->default_model, "gpt-4");
    EXPECT_EQ(config->message_limit, 20);
    EXPECT_EQ(config->message_expiration, std::chrono::seconds(120));
    EXPECT_FALSE(config->throw_on_error);
    EXPECT_EQ(config->worker_threads, 2);
    EXPECT_EQ(config->request_queue_capacity, 16u);
    EXPECT_EQ(config->log_level, LogLevel::Debug);
    EXPECT_EQ(config->default_parameters.temperature, 0.2);
    EXPECT_EQ(config->default_parameters.max_tokens, 512);
    ASSERT_TRUE(config->default_parameters.stop.has_value());
    EXPECT_EQ(config->default_parameters.stop->front(), "###");
    EXPECT_FALSE(config->default_parameters.top_p.has_value());
}

TEST(ConfigLoaderTest, UnknownKeysAreIgnored) {
    auto config = parse_config(json{{"something_else", 1}});
    ASSERT_TRUE(config.has_value());
}

TEST(ConfigLoaderTest, NullValuesKeepDefaults) {
    auto config = parse_config(json{{"default_model", nullptr}, {"organization", nullptr}});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->default_model, "gpt-3.5-turbo");
    EXPECT_FALSE(config->organization.has_value());
}

TEST(ConfigLoaderTest, RejectsNonObject) {
    auto config = parse_config(json::array({1, 2}));
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
}

TEST(ConfigLoaderTest, RejectsWrongType) {
    auto config = parse_config(json{{"message_limit", "ten"}});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
}

TEST(ConfigLoaderTest, RejectsUnknownLogLevel) {
    auto config = parse_config(json{{"log_level", "verbose"}});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
    EXPECT_EQ(config.error().context, std::optional<std::string>("verbose"));
}

TEST(ConfigLoaderTest, RejectsNonObjectParameters) {
    auto config = parse_config(json{{"default_parameters", 0.5}});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
}

TEST(ConfigLoaderTest, ValidatesResult) {
    for (const json& j : {json{{"message_limit", 0}},
                          json{{"worker_threads", 0}},
                          json{{"default_model", ""}},
                          json{{"message_expiration_seconds", 0}}}) {
        auto config = parse_config(j);
        ASSERT_FALSE(config.has_value()) << j.dump();
        EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
    }
}

TEST(ConfigLoaderTest, RejectsOutOfRangeIntegers) {
    for (const json& j : {json{{"request_queue_capacity", -1}},
                          json{{"message_limit", 4294967297LL}},
                          json{{"worker_threads", -3000000000LL}},
                          json{{"message_expiration_seconds", 18446744073709551615ULL}},
                          json{{"default_parameters", {{"max_tokens", 4294967296LL}}}}}) {
        auto config = parse_config(j);
        ASSERT_FALSE(config.has_value()) << j.dump();
        EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
    }
}

TEST(ConfigLoaderTest, RejectsFractionalIntegers) {
    auto config = parse_config(json{{"message_limit", 2.5}});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
}

TEST(ConfigLoaderTest, RejectsExpirationBeyondClockRange) {
    auto config = parse_config(json{{"message_expiration_seconds", 10000000000LL}});
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
}

// ============================================================================
// load_config_file
// ============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = ::testing::TempDir() + "parley_config_test.json";
    }

    void TearDown() override {
        std::remove(path.c_str());
    }

    void write(const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

    std::string path;
};

TEST_F(ConfigFileTest, LoadsFile) {
    write(R"({"default_model": "gpt-4", "message_limit": 5, "log_level": "off"})");

    auto config = load_config_file(path);
    ASSERT_TRUE(config.has_value()) << config.error().to_string();
    EXPECT_EQ(config->default_model, "gpt-4");
    EXPECT_EQ(config->message_limit, 5);
    EXPECT_EQ(config->log_level, LogLevel::Off);
}

TEST_F(ConfigFileTest, MissingFile) {
    auto config = load_config_file(path + ".missing");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
}

TEST_F(ConfigFileTest, InvalidJson) {
    write("{ not json");

    auto config = load_config_file(path);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
}

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "api/ServerConfig.h"
#include "core/Errors.h"

namespace {

using Args = std::vector<std::string>;

const std::string SAMPLE_CONFIG = std::string(ARENA_SOURCE_DIR) + "/config/server.json";

TEST(ServerConfig, DefaultsAreValid) {
    ServerConfig cfg;
    EXPECT_NO_THROW(cfg.validate());
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_EQ(cfg.generator.pool_size, 10);
    EXPECT_EQ(cfg.generator.min_distance, 50);
    EXPECT_EQ(cfg.generator.max_distance, 100);
    EXPECT_EQ(cfg.evaluator.random_search_budget, 1000);
    EXPECT_EQ(cfg.evaluator.max_selected, 8);
    EXPECT_FALSE(cfg.seed.has_value());
}

TEST(ServerConfig, JsonOverridesKnownKeys) {
    ServerConfig cfg;
    ConfigLoader::apply_json(cfg, json::parse(R"({
        "port": 9000, "seed": 17, "pool_size": 6, "min_distance": 10,
        "max_distance": 20, "random_search_budget": 50, "max_sessions": 3, "comment": "ignored"
    })"));
    EXPECT_EQ(cfg.port, 9000);
    ASSERT_TRUE(cfg.seed.has_value());
    EXPECT_EQ(*cfg.seed, 17u);
    EXPECT_EQ(cfg.generator.pool_size, 6);
    EXPECT_EQ(cfg.generator.min_distance, 10);
    EXPECT_EQ(cfg.generator.max_distance, 20);
    EXPECT_EQ(cfg.evaluator.random_search_budget, 50);
    EXPECT_EQ(cfg.max_sessions, 3u);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(ServerConfig, WrongJsonTypeIsAConfigurationError) {
    ServerConfig cfg;
    EXPECT_THROW(ConfigLoader::apply_json(cfg, json::parse(R"({"port": "eighty"})")), ConfigurationError);
    EXPECT_THROW(ConfigLoader::apply_json(cfg, json::array()), ConfigurationError);
}

TEST(ServerConfig, FlagsOverrideTheFileInAnyOrder) {
    ServerConfig cfg;
    ASSERT_TRUE(ConfigLoader::parse_args(cfg, Args{"--threads", "2", "--config", SAMPLE_CONFIG, "--port", "9100"}));
    EXPECT_EQ(cfg.threads, 2);      // file says 4
    EXPECT_EQ(cfg.port, 9100);
    EXPECT_EQ(cfg.max_sessions, 10000u);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(ServerConfig, HelpStopsParsing) {
    ServerConfig cfg;
    EXPECT_FALSE(ConfigLoader::parse_args(cfg, Args{"--help"}));
    EXPECT_NE(ConfigLoader::usage("arena_server").find("--config"), std::string::npos);
}

TEST(ServerConfig, SeedFlagTakesTheFullUnsignedRange) {
    ServerConfig cfg;
    ASSERT_TRUE(ConfigLoader::parse_args(cfg, Args{"--seed", "4294967295"}));
    ASSERT_TRUE(cfg.seed.has_value());
    EXPECT_EQ(*cfg.seed, 4294967295u);

    ServerConfig from_file;
    ConfigLoader::apply_json(from_file, json{{"seed", 4294967295u}});
    EXPECT_EQ(from_file.seed, cfg.seed);

    EXPECT_THROW(ConfigLoader::parse_args(cfg, Args{"--seed", "4294967296"}), ConfigurationError);
    EXPECT_THROW(ConfigLoader::parse_args(cfg, Args{"--seed", "-1"}), ConfigurationError);
    EXPECT_THROW(ConfigLoader::parse_args(cfg, Args{"--seed", "12ab"}), ConfigurationError);
}

TEST(ServerConfig, BadCommandLinesAreRejected) {
    ServerConfig cfg;
    EXPECT_THROW(ConfigLoader::parse_args(cfg, Args{"--verbose", "1"}), ConfigurationError);
    EXPECT_THROW(ConfigLoader::parse_args(cfg, Args{"--port"}), ConfigurationError);
    EXPECT_THROW(ConfigLoader::parse_args(cfg, Args{"--port", "80x"}), ConfigurationError);
    EXPECT_THROW(ConfigLoader::parse_args(cfg, Args{"--max-sessions", "-1"}), ConfigurationError);
    EXPECT_THROW(ConfigLoader::parse_args(cfg, Args{"--config", "/nonexistent/arena.json"}), ConfigurationError);
}

TEST(ServerConfig, ValidateCatchesBadCombinations) {
    ServerConfig cfg;
    cfg.port = 0;
    EXPECT_THROW(cfg.validate(), ConfigurationError);

    cfg = ServerConfig();
    cfg.log_level = "loud";
    EXPECT_THROW(cfg.validate(), ConfigurationError);

    cfg = ServerConfig();
    cfg.generator.pool_size = 1;
    EXPECT_THROW(cfg.validate(), ConfigurationError);

    cfg = ServerConfig();
    cfg.generator.min_distance = 200;
    EXPECT_THROW(cfg.validate(), ConfigurationError);

    cfg = ServerConfig();
    cfg.evaluator.max_selected = 9;
    EXPECT_THROW(cfg.validate(), ConfigurationError);

    cfg = ServerConfig();
    cfg.generator.pool_size = 5;  // only 4 cities besides home
    EXPECT_THROW(cfg.validate(), ConfigurationError);

    cfg = ServerConfig();
    cfg.evaluator.random_search_budget = 0;
    EXPECT_THROW(cfg.validate(), SearchBudgetError);
}

}  // namespace

#include "unit-tests.hpp"

#include <cstdlib>
#include <fstream>

using namespace chainsink;
using namespace chainsink::tests;

namespace
{
    std::filesystem::path writeConfigFile(const std::string & name, const std::string & content)
    {
        const auto path = std::filesystem::temp_directory_path() / std::format("chainsink-test-{}.json", name);
        std::ofstream output(path, std::ios::trunc);
        output << content;
        return path;
    }
}

TEST_F(UnitTest, Config_FromJson_KeepsDefaultsForMissingKeys)
{
    const auto cfg = config::configFromJson(json::parse(R"({
        "rpc_url": "http://node:9933",
        "decode_workers": 16,
        "start_height": 1200,
        "storage_indexing": false
    })"));
    ASSERT_TRUE(cfg.has_value());

    EXPECT_EQ(cfg->rpc_url, "http://node:9933");
    EXPECT_EQ(cfg->decode_workers, 16u);
    EXPECT_EQ(cfg->start_height, 1200u);
    EXPECT_FALSE(cfg->storage_indexing);

    EXPECT_EQ(cfg->pool_size, 8u);
    EXPECT_EQ(cfg->max_statement_params, 65535u);
    EXPECT_EQ(cfg->max_task_attempts, 5u);
    EXPECT_EQ(cfg->backoff_base_ms, 1000u);
    EXPECT_EQ(cfg->backoff_max_ms, 300000u);
    EXPECT_EQ(cfg->notify_channel, "table_update");
}

TEST_F(UnitTest, Config_FromJson_RejectsInvalidValues)
{
    const auto wrong_type = config::configFromJson(json::parse(R"({"pool_size": "eight"})"));
    ASSERT_FALSE(wrong_type.has_value());
    EXPECT_EQ(wrong_type.error().kind, config::ConfigError::Kind::INVALID_VALUE);

    const auto negative = config::configFromJson(json::parse(R"({"decode_workers": -1})"));
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().kind, config::ConfigError::Kind::INVALID_VALUE);

    const auto zero_pool = config::configFromJson(json::parse(R"({"pool_size": 0})"));
    ASSERT_FALSE(zero_pool.has_value());
    EXPECT_EQ(zero_pool.error().kind, config::ConfigError::Kind::INVALID_VALUE);

    const auto zero_bound = config::configFromJson(json::parse(R"({"max_statement_params": 0})"));
    EXPECT_FALSE(zero_bound.has_value());

    const auto not_object = config::configFromJson(json::parse("[1, 2]"));
    ASSERT_FALSE(not_object.has_value());
    EXPECT_EQ(not_object.error().kind, config::ConfigError::Kind::PARSE_ERROR);
}

TEST_F(UnitTest, Config_FromJson_RejectsValuesBeyondFieldWidth)
{
    // 2^32 + 1 would wrap to 1 in a 32 bit field
    const auto wrapped = config::configFromJson(json::parse(R"({"max_task_attempts": 4294967297})"));
    ASSERT_FALSE(wrapped.has_value());
    EXPECT_EQ(wrapped.error().kind, config::ConfigError::Kind::INVALID_VALUE);

    const auto widest = config::configFromJson(json::parse(R"({"max_task_attempts": 4294967295})"));
    ASSERT_TRUE(widest.has_value());
    EXPECT_EQ(widest->max_task_attempts, 4294967295u);

    const auto wide_height = config::configFromJson(json::parse(R"({"start_height": 4294967297})"));
    ASSERT_TRUE(wide_height.has_value());
    EXPECT_EQ(wide_height->start_height, 4294967297u);
}

TEST_F(UnitTest, Config_Validate_StatementBoundFitsWidestRow)
{
    const auto too_small = config::configFromJson(json::parse(R"({"max_statement_params": 6})"));
    ASSERT_FALSE(too_small.has_value());
    EXPECT_EQ(too_small.error().kind, config::ConfigError::Kind::INVALID_VALUE);

    const auto one_row = config::configFromJson(json::parse(R"({"max_statement_params": 7})"));
    ASSERT_TRUE(one_row.has_value());
    EXPECT_EQ(store::rowsPerStatement(store::MAX_ROW_WIDTH, one_row->max_statement_params), 1u);
}

TEST_F(UnitTest, Config_Load_ReadsFileAndEnvironmentOverride)
{
    const auto path = writeConfigFile("load", R"({"database_url": "postgres://file/db", "pool_size": 3})");

    ::unsetenv("DATABASE_URL");
    const auto from_file = config::loadConfig(path);
    ASSERT_TRUE(from_file.has_value());
    EXPECT_EQ(from_file->database_url, "postgres://file/db");
    EXPECT_EQ(from_file->pool_size, 3u);

    ::setenv("DATABASE_URL", "postgres://env/db", 1);
    const auto from_env = config::loadConfig(path);
    ::unsetenv("DATABASE_URL");
    ASSERT_TRUE(from_env.has_value());
    EXPECT_EQ(from_env->database_url, "postgres://env/db");

    std::filesystem::remove(path);
}

TEST_F(UnitTest, Config_Load_ReportsMissingAndBrokenFiles)
{
    const auto missing = config::loadConfig(std::filesystem::temp_directory_path() / "chainsink-test-does-not-exist.json");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, config::ConfigError::Kind::FILE_NOT_FOUND);

    const auto path = writeConfigFile("broken", "{ not json");
    const auto broken = config::loadConfig(path);
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error().kind, config::ConfigError::Kind::PARSE_ERROR);
    std::filesystem::remove(path);
}

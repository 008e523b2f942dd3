#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "app_config.hpp"
#include "safeprint/errors.hpp"
#include "sp_log.hpp"

namespace fs = std::filesystem;

TEST(AppConfig, DefaultsMatchPrintOptions)
{
    AppConfig cfg;
    EXPECT_EQ(cfg.print().label_color, "RED");
    EXPECT_EQ(cfg.print().prefix_color, "GREEN");
    EXPECT_TRUE(cfg.print().show_time);
    EXPECT_EQ(cfg.print().file_lines_limit, safeprint::kDefaultFileLinesLimit);
    EXPECT_EQ(cfg.logging().level, "warn");
    EXPECT_NO_THROW(cfg.validate());
}

TEST(AppConfig, ApplyOverridesOnlyGivenKeys)
{
    AppConfig cfg;
    cfg.apply(nlohmann::json::parse(R"({
        "print": {"prefix": "JOB", "prefix_color": "blue", "show_time": false, "file_lines_limit": 50},
        "logging": {"level": "debug", "file_output": true}
    })"));
    EXPECT_EQ(cfg.print().prefix, "JOB");
    EXPECT_EQ(cfg.print().prefix_color, "blue");
    EXPECT_FALSE(cfg.print().show_time);
    EXPECT_EQ(cfg.print().file_lines_limit, 50u);
    EXPECT_EQ(cfg.print().label_color, "RED");
    EXPECT_EQ(cfg.logging().level, "debug");
    EXPECT_TRUE(cfg.logging().file_output);
    EXPECT_EQ(cfg.logging().log_dir, "logs");
    EXPECT_NO_THROW(cfg.validate());
}

TEST(AppConfig, ValidateRejectsUnknownColor)
{
    AppConfig cfg;
    cfg.print().text_color = "PURPLE";
    EXPECT_THROW(cfg.validate(), safeprint::ConfigError);
}

TEST(AppConfig, ValidateRejectsNegativeLimits)
{
    AppConfig cfg;
    cfg.logging().max_backup_files = -1;
    EXPECT_THROW(cfg.validate(), safeprint::ConfigError);
}

TEST(AppConfig, LoadMissingOrBrokenFile)
{
    AppConfig cfg;
    const fs::path dir = fs::temp_directory_path() / "safeprint_app_config";
    fs::create_directories(dir);

    EXPECT_FALSE(cfg.load((dir / "missing.json").string()));

    {
        std::ofstream out(dir / "broken.json");
        out << "{ not json";
    }
    EXPECT_FALSE(cfg.load((dir / "broken.json").string()));

    {
        std::ofstream out(dir / "ok.json");
        out << R"({"print": {"error": true}})";
    }
    EXPECT_TRUE(cfg.load((dir / "ok.json").string()));
    EXPECT_TRUE(cfg.print().error);

    fs::remove_all(dir);
}

TEST(DiagLog, LevelFromString)
{
    EXPECT_EQ(safeprint::level_from_string("debug"), safeprint::Lvl::Debug);
    EXPECT_EQ(safeprint::level_from_string("error"), safeprint::Lvl::Error);
    EXPECT_EQ(safeprint::level_from_string("bogus"), safeprint::Lvl::Warn);
    EXPECT_EQ(safeprint::level_from_string("bogus", safeprint::Lvl::Info), safeprint::Lvl::Info);
}

TEST(AppConfig, ValidateRejectsNegativeLinesLimit)
{
    AppConfig cfg;
    cfg.apply(nlohmann::json::parse(R"({"print": {"file_lines_limit": -5}})"));
    EXPECT_EQ(cfg.print().file_lines_limit, safeprint::kDefaultFileLinesLimit);
    EXPECT_THROW(cfg.validate(), safeprint::ConfigError);

    cfg.apply(nlohmann::json::parse(R"({"print": {"file_lines_limit": 0}})"));
    EXPECT_EQ(cfg.print().file_lines_limit, 0u);
    EXPECT_NO_THROW(cfg.validate());
}

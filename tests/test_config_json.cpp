#include <gtest/gtest.h>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include "test_helpers.hpp"

using namespace widepath;
using widepath::test::TempDir;

TEST(ConfigJson, PartialDocumentOverlaysDefaults) {
    PipelineConfig config;
    config.input_dir = "from/flags";

    auto j = nlohmann::json::parse(R"({
        "output": "out",
        "dataset": "london",
        "projection": "approximate",
        "widths": { "clearway_percentage": 10 },
        "base_speed": 90.0,
        "seeds": { "cost": 7 },
        "rush_windows": [ { "start_minute": 420, "end_minute": 540 } ]
    })");
    from_json(j, config);

    EXPECT_EQ(config.input_dir, "from/flags");
    EXPECT_EQ(config.output_dir, "out");
    EXPECT_EQ(config.dataset, DatasetKind::London);
    EXPECT_EQ(config.projection, ProjectionMode::Approximate);
    EXPECT_EQ(config.widths.clearway_percentage, 10);
    EXPECT_DOUBLE_EQ(config.widths.base_width, 3.5);
    ASSERT_TRUE(config.base_speed.has_value());
    EXPECT_DOUBLE_EQ(*config.base_speed, 90.0);
    EXPECT_EQ(config.seeds.cost, 7u);
    EXPECT_EQ(config.seeds.score, 42u);
    ASSERT_EQ(config.rush_windows.size(), 1u);
    EXPECT_EQ(config.rush_windows[0], (RushWindow{.start_minute = 420, .end_minute = 540}));
    EXPECT_TRUE(config.remove_legacy_files);
}

TEST(ConfigJson, WrittenConfigReadsBack) {
    PipelineConfig config;
    config.input_dir = "in";
    config.output_dir = "out";
    config.density_percentage = 35;
    config.seeds.seeded_costs = false;

    nlohmann::json j = config;
    PipelineConfig loaded;
    from_json(j, loaded);

    EXPECT_EQ(loaded.input_dir, "in");
    EXPECT_EQ(loaded.density_percentage, 35);
    EXPECT_FALSE(loaded.seeds.seeded_costs);
    EXPECT_EQ(loaded.rush_windows, default_rush_windows());
    EXPECT_FALSE(loaded.base_speed.has_value());
}

TEST(ConfigJson, BadValuesAreConfigErrors) {
    PipelineConfig config;
    EXPECT_THROW(from_json(nlohmann::json::parse(R"({"dataset": "paris"})"), config), ConfigError);
    EXPECT_THROW(from_json(nlohmann::json::parse(R"({"density_percentage": "many"})"), config),
                 ConfigError);
    EXPECT_THROW(from_json(nlohmann::json::parse(R"({"rush_windows": 5})"), config), ConfigError);
}

TEST(ConfigJson, SeedsMustFitUnsigned32Bits) {
    SynthesisSeeds seeds;
    from_json(nlohmann::json::parse(R"({"score": 4294967295, "clearway": 0})"), seeds);
    EXPECT_EQ(seeds.score, 4294967295u);
    EXPECT_EQ(seeds.clearway, 0u);
    EXPECT_EQ(seeds.cost, 20240601u);

    EXPECT_THROW(from_json(nlohmann::json::parse(R"({"score": -1})"), seeds), ConfigError);
    EXPECT_THROW(from_json(nlohmann::json::parse(R"({"cost": 4294967296})"), seeds), ConfigError);
    EXPECT_THROW(from_json(nlohmann::json::parse(R"({"clearway": 1.5})"), seeds), ConfigError);
    EXPECT_THROW(from_json(nlohmann::json::parse(R"({"cost": "7"})"), seeds), ConfigError);

    PipelineConfig config;
    EXPECT_THROW(from_json(nlohmann::json::parse(R"({"seeds": {"cost": -20}})"), config),
                 ConfigError);
}

TEST(ConfigJson, ReadJsonFile) {
    TempDir dir;
    auto good = dir.write("config.json", R"({"dataset": "california"})");
    EXPECT_EQ(json::read_json_file(good.string())["dataset"], "california");

    auto bad = dir.write("broken.json", "{ not json");
    EXPECT_THROW(json::read_json_file(bad.string()), ConfigError);

    EXPECT_THROW(json::read_json_file((dir.path() / "missing.json").string()), InputNotFoundError);
}

#include "tile_develop/config/configuration.hpp"
#include "tile_develop/core/errors.hpp"

#include <filesystem>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace tile_develop;
using tile_develop::config::Config;

TEST_CASE("default_config_is_valid") {
    Config cfg;
    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE(cfg.backend.name == "cpu");
    REQUIRE(cfg.tiles.tile_size == 1024);
    REQUIRE(cfg.tiles.reserve_margin == 32);
    REQUIRE(cfg.history.coalesce_window_ms == 400);
    REQUIRE(cfg.numeric.hdr_sample_max == Catch::Approx(65504.0f));
}

TEST_CASE("config_from_yaml_overrides_given_fields_only") {
    const YAML::Node node = YAML::Load(R"(
backend:
  name: opencv
  worker_threads: 8
tiles:
  tile_size: 256
cache:
  memory_budget_mb: 64
preview:
  max_edge: 512
)");
    const Config cfg = Config::from_yaml(node);
    REQUIRE(cfg.backend.name == "opencv");
    REQUIRE(cfg.backend.worker_threads == 8);
    REQUIRE(cfg.tiles.tile_size == 256);
    REQUIRE(cfg.tiles.min_tile_size == 128);
    REQUIRE(cfg.cache.memory_budget_mb == 64);
    REQUIRE(cfg.cache.enabled);
    REQUIRE(cfg.preview.max_edge == 512);
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_from_yaml_rejects_mistyped_values") {
    const YAML::Node node = YAML::Load("tiles:\n  tile_size: large\n");
    REQUIRE_THROWS_AS(Config::from_yaml(node), ConfigError);
}

TEST_CASE("config_validate_rejects_bad_values") {
    Config cfg;
    cfg.backend.name = "vulkan";
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);

    cfg = Config{};
    cfg.tiles.tile_size = 64;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);

    cfg = Config{};
    cfg.cache.memory_budget_mb = 4096;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);

    cfg = Config{};
    cfg.backend.worker_threads = 0;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);

    cfg = Config{};
    cfg.tiles.reserve_margin = -1;
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
}

TEST_CASE("config_yaml_round_trip") {
    Config cfg;
    cfg.backend.name = "opencl";
    cfg.tiles.tile_size = 512;
    cfg.history.max_entries = 0;
    cfg.cache.enabled = false;
    cfg.tiles.reserve_margin = 12;

    const Config back = Config::from_yaml(cfg.to_yaml());
    REQUIRE(back.backend.name == "opencl");
    REQUIRE(back.tiles.tile_size == 512);
    REQUIRE(back.tiles.reserve_margin == 12);
    REQUIRE(back.history.max_entries == 0);
    REQUIRE_FALSE(back.cache.enabled);
}

TEST_CASE("config_save_and_load") {
    const auto path = std::filesystem::temp_directory_path() / "tile_develop_test_config.yaml";
    Config cfg;
    cfg.device.memory_budget_mb = 2048;
    cfg.save(path);
    const Config back = Config::load(path);
    REQUIRE(back.device.memory_budget_mb == 2048);
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(Config::load(path), ConfigError);
}

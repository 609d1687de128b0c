#include "tile_develop/config/configuration.hpp"
#include "tile_develop/core/errors.hpp"

#include <fstream>

namespace tile_develop::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["backend"]) {
            auto b = node["backend"];
            if (b["name"]) cfg.backend.name = b["name"].as<std::string>();
            if (b["worker_threads"]) cfg.backend.worker_threads = b["worker_threads"].as<int>();
        }

        if (node["tiles"]) {
            auto t = node["tiles"];
            if (t["tile_size"]) cfg.tiles.tile_size = t["tile_size"].as<int>();
            if (t["min_tile_size"]) cfg.tiles.min_tile_size = t["min_tile_size"].as<int>();
            if (t["reserve_margin"]) cfg.tiles.reserve_margin = t["reserve_margin"].as<int>();
        }

        if (node["cache"]) {
            auto c = node["cache"];
            if (c["enabled"]) cfg.cache.enabled = c["enabled"].as<bool>();
            if (c["memory_budget_mb"]) cfg.cache.memory_budget_mb = c["memory_budget_mb"].as<int>();
        }

        if (node["device"]) {
            auto d = node["device"];
            if (d["memory_budget_mb"]) cfg.device.memory_budget_mb = d["memory_budget_mb"].as<int>();
        }

        if (node["history"]) {
            auto h = node["history"];
            if (h["coalesce_window_ms"]) cfg.history.coalesce_window_ms = h["coalesce_window_ms"].as<int>();
            if (h["max_entries"]) cfg.history.max_entries = h["max_entries"].as<int>();
        }

        if (node["preview"]) {
            auto p = node["preview"];
            if (p["enabled"]) cfg.preview.enabled = p["enabled"].as<bool>();
            if (p["max_edge"]) cfg.preview.max_edge = p["max_edge"].as<int>();
        }

        if (node["numeric"]) {
            auto n = node["numeric"];
            if (n["hdr_sample_max"]) cfg.numeric.hdr_sample_max = n["hdr_sample_max"].as<float>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["backend"]["name"] = backend.name;
    node["backend"]["worker_threads"] = backend.worker_threads;

    node["tiles"]["tile_size"] = tiles.tile_size;
    node["tiles"]["min_tile_size"] = tiles.min_tile_size;
    node["tiles"]["reserve_margin"] = tiles.reserve_margin;

    node["cache"]["enabled"] = cache.enabled;
    node["cache"]["memory_budget_mb"] = cache.memory_budget_mb;

    node["device"]["memory_budget_mb"] = device.memory_budget_mb;

    node["history"]["coalesce_window_ms"] = history.coalesce_window_ms;
    node["history"]["max_entries"] = history.max_entries;

    node["preview"]["enabled"] = preview.enabled;
    node["preview"]["max_edge"] = preview.max_edge;

    node["numeric"]["hdr_sample_max"] = numeric.hdr_sample_max;

    return node;
}

void Config::validate() const {
    if (backend.name != "cpu" && backend.name != "opencv" && backend.name != "opencl") {
        throw ConfigError("backend.name must be 'cpu', 'opencv' or 'opencl'");
    }
    if (backend.worker_threads < 1) {
        throw ConfigError("backend.worker_threads must be >= 1");
    }

    if (tiles.min_tile_size < 16) {
        throw ConfigError("tiles.min_tile_size must be >= 16");
    }
    if (tiles.tile_size < tiles.min_tile_size) {
        throw ConfigError("tiles.tile_size must be >= tiles.min_tile_size");
    }
    if (tiles.reserve_margin < 0) {
        throw ConfigError("tiles.reserve_margin must be >= 0");
    }

    if (cache.memory_budget_mb < 0) {
        throw ConfigError("cache.memory_budget_mb must be >= 0");
    }
    if (device.memory_budget_mb < 1) {
        throw ConfigError("device.memory_budget_mb must be >= 1");
    }
    if (cache.memory_budget_mb > device.memory_budget_mb) {
        throw ConfigError("cache.memory_budget_mb must not exceed device.memory_budget_mb");
    }

    if (history.coalesce_window_ms < 0) {
        throw ConfigError("history.coalesce_window_ms must be >= 0");
    }
    if (history.max_entries < 0) {
        throw ConfigError("history.max_entries must be >= 0");
    }

    if (preview.max_edge < 16) {
        throw ConfigError("preview.max_edge must be >= 16");
    }

    if (!(numeric.hdr_sample_max > 1.0f)) {
        throw ConfigError("numeric.hdr_sample_max must be > 1");
    }
}

} // namespace tile_develop::config

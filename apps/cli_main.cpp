#include "tile_develop/config/configuration.hpp"
#include "tile_develop/core/errors.hpp"
#include "tile_develop/core/utils.hpp"
#include "tile_develop/edit/serialization.hpp"
#include "tile_develop/image/analysis.hpp"
#include "tile_develop/io/opencv_codec.hpp"
#include "tile_develop/pipeline/renderer.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace tile_develop;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static edit::EditState load_edit(const fs::path& path, edit::DeserializeReport* report) {
    return edit::from_string(core::read_text(path), report);
}

static int render_command(const std::string& input, const std::string& edit_path,
                          const std::string& output, const std::string& config_path,
                          int max_edge, bool events) {
    config::Config cfg = config_path.empty() ? config::Config{}
                                             : config::Config::load(config_path);
    cfg.validate();

    io::OpenCvDecoder decoder;
    const auto img = std::make_shared<const image::Image>(io::decode_file(input, decoder));
    std::cerr << "[RENDER] Loaded " << img->id << " " << img->width << "x" << img->height << "x"
              << img->channels << " (" << pixel_format_to_string(img->format) << ")" << std::endl;

    edit::DeserializeReport report;
    const edit::EditState state =
        edit_path.empty() ? edit::EditState{} : load_edit(edit_path, &report);

    pipeline::Renderer renderer(cfg, events ? &std::cout : nullptr);
    const image::PixelBuffer out = renderer.render(state, img, max_edge);
    io::write_image(output, out);

    const pipeline::RunStats stats = renderer.last_stats();
    std::cerr << "[RENDER] " << stats.tiles << " tiles, " << stats.passes_computed
              << " passes computed, " << stats.passes_from_cache << " from cache" << std::endl;
    return 0;
}

static int validate_edit_command(const std::string& edit_path) {
    edit::DeserializeReport report;
    const edit::EditState state = load_edit(edit_path, &report);

    json groups = json::array();
    for (const auto& g : state.groups()) {
        groups.push_back({{"id", g.id},
                          {"name", g.name},
                          {"enabled", g.enabled},
                          {"adjustments", g.adjustments.size()},
                          {"masks", g.masks.size()}});
    }
    print_json({{"valid", report.clean()},
                {"warnings", report.warnings},
                {"groups", groups},
                {"content_hash", state.content_hash()}});
    return report.clean() ? 0 : 2;
}

static int default_config_command() {
    YAML::Emitter out;
    out << config::Config{}.to_yaml();
    std::cout << out.c_str() << std::endl;
    return 0;
}

static int export_lut_command(const std::string& edit_path, size_t group_index, int resolution,
                              const std::string& output) {
    const edit::EditState state = load_edit(edit_path, nullptr);
    if (group_index >= state.size()) {
        throw ValidationError("group index " + std::to_string(group_index) + " out of range (" +
                              std::to_string(state.size()) + " groups)");
    }
    const edit::AdjustmentGroup& group = state.groups()[group_index];
    const std::string title = group.name.empty() ? fs::path(output).stem().string() : group.name;
    core::write_text(output, image::export_cube_lut(group, resolution, title));
    std::cerr << "[EDIT] Wrote " << resolution << "^3 LUT to " << output << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"tile_develop - tiled non-destructive photo renderer"};
    app.require_subcommand(1);

    std::string input, edit_path, output, config_path;
    int max_edge = 0;
    bool events = false;
    size_t group_index = 0;
    int resolution = 33;

    auto render_cmd = app.add_subcommand("render", "Render an image with an edit document");
    render_cmd->add_option("--input", input, "Source image")->required();
    render_cmd->add_option("--edit", edit_path, "Edit document (JSON)");
    render_cmd->add_option("--output", output, "Output image")->required();
    render_cmd->add_option("--config", config_path, "Path to config.yaml");
    render_cmd->add_option("--max-edge", max_edge, "Longest output edge (0 = native)");
    render_cmd->add_flag("--events", events, "Write JSON-lines progress events to stdout");

    auto validate_cmd = app.add_subcommand("validate-edit", "Check an edit document");
    validate_cmd->add_option("--edit", edit_path, "Edit document (JSON)")->required();

    auto config_cmd = app.add_subcommand("default-config", "Print the default configuration");

    auto lut_cmd = app.add_subcommand("export-lut", "Bake a group's color adjustments into a .cube LUT");
    lut_cmd->add_option("--edit", edit_path, "Edit document (JSON)")->required();
    lut_cmd->add_option("--group", group_index, "Group index");
    lut_cmd->add_option("--resolution", resolution, "17, 33 or 65")->default_val(33);
    lut_cmd->add_option("--output", output, "Output .cube file")->required();

    CLI11_PARSE(app, argc, argv);

    return core::run_guarded(
        [&]() {
            if (render_cmd->parsed()) {
                return render_command(input, edit_path, output, config_path, max_edge, events);
            }
            if (validate_cmd->parsed()) {
                return validate_edit_command(edit_path);
            }
            if (config_cmd->parsed()) {
                return default_config_command();
            }
            if (lut_cmd->parsed()) {
                return export_lut_command(edit_path, group_index, resolution, output);
            }
            return 1;
        },
        std::cerr);
}

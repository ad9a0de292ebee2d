#include "monodither/config/configuration.hpp"
#include "monodither/core/errors.hpp"
#include "monodither/core/utils.hpp"
#include "monodither/image/bayer_matrix.hpp"

#include <algorithm>
#include <fstream>

namespace monodither::config {

static const std::vector<std::string> kLosslessFormats = {"png", "bmp", "tiff"};

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }
    
    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["dither"]) {
        auto d = node["dither"];
        if (d["max_image_side"]) cfg.dither.max_image_side = d["max_image_side"].as<int>();
        if (d["bayer_order"]) cfg.dither.bayer_order = d["bayer_order"].as<int>();
    }

    if (node["discovery"]) {
        auto d = node["discovery"];
        if (d["extensions"] && d["extensions"].IsSequence()) {
            cfg.discovery.extensions.clear();
            for (const auto& e : d["extensions"]) {
                std::string ext = core::to_lower(e.as<std::string>());
                if (!ext.empty() && ext.front() == '.') {
                    ext.erase(0, 1);
                }
                cfg.discovery.extensions.push_back(ext);
            }
        }
        if (d["exclude_output_dir"]) cfg.discovery.exclude_output_dir = d["exclude_output_dir"].as<bool>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["dir_name"]) cfg.output.dir_name = o["dir_name"].as<std::string>();
        if (o["format"]) cfg.output.format = core::to_lower(o["format"].as<std::string>());
    }

    if (node["runtime"]) {
        auto r = node["runtime"];
        if (r["workers"]) cfg.runtime.workers = r["workers"].as<int>();
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

    node["dither"]["max_image_side"] = dither.max_image_side;
    node["dither"]["bayer_order"] = dither.bayer_order;

    for (const auto& ext : discovery.extensions) {
        node["discovery"]["extensions"].push_back(ext);
    }
    node["discovery"]["exclude_output_dir"] = discovery.exclude_output_dir;

    node["output"]["dir_name"] = output.dir_name;
    node["output"]["format"] = output.format;

    node["runtime"]["workers"] = runtime.workers;

    return node;
}

void Config::validate() const {
    if (dither.max_image_side < 1) {
        throw ValidationError("dither.max_image_side must be >= 1");
    }
    if (!core::is_power_of_two(dither.bayer_order)) {
        throw ValidationError("dither.bayer_order must be a power of 2 (got " +
                              std::to_string(dither.bayer_order) + ")");
    }
    // Orders above 16 are valid; their threshold step 256 / order^2 is 0
    if (dither.bayer_order < 2 || dither.bayer_order > image::kMaxBayerOrder) {
        throw ValidationError("dither.bayer_order must be in [2," +
                              std::to_string(image::kMaxBayerOrder) + "] (got " +
                              std::to_string(dither.bayer_order) + ")");
    }

    if (discovery.extensions.empty()) {
        throw ValidationError("discovery.extensions must not be empty");
    }
    for (const auto& ext : discovery.extensions) {
        if (ext.empty()) {
            throw ValidationError("discovery.extensions must not contain empty entries");
        }
    }

    if (output.dir_name.empty() || output.dir_name == "." || output.dir_name == ".." ||
        output.dir_name.find('/') != std::string::npos) {
        throw ValidationError("output.dir_name must be a single directory name");
    }
    if (std::find(kLosslessFormats.begin(), kLosslessFormats.end(), output.format) ==
        kLosslessFormats.end()) {
        throw ValidationError("output.format must be one of " +
                              core::join(kLosslessFormats, ", "));
    }

    if (runtime.workers < 0) {
        throw ValidationError("runtime.workers must be >= 0");
    }
}

} // namespace monodither::config

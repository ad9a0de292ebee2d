#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace monodither::config {

namespace fs = std::filesystem;

struct DitherConfig {
  int max_image_side = 800; // largest side after resize, never upscaled
  int bayer_order = 8;      // power of two >= 2
};

struct DiscoveryConfig {
  std::vector<std::string> extensions{"jpg", "jpeg", "png", "gif",
                                      "webp", "tiff", "bmp"};
  // skip directories named like output.dir_name (earlier results)
  bool exclude_output_dir = false;
};

struct OutputConfig {
  std::string dir_name = "dithers";
  std::string format = "png"; // png | bmp | tiff
};

struct RuntimeConfig {
  int workers = 0; // 0 = hardware concurrency
};

struct Config {
  DitherConfig dither;
  DiscoveryConfig discovery;
  OutputConfig output;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace monodither::config

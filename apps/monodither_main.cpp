#include "monodither/config/configuration.hpp"
#include "monodither/core/errors.hpp"
#include "monodither/core/events.hpp"
#include "monodither/core/types.hpp"
#include "monodither/core/utils.hpp"
#include "monodither/io/discovery.hpp"
#include "monodither/pipeline/batch.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <streambuf>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

protected:
  int overflow(int c) override {
    if (c == EOF)
      return EOF;
    const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
    const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
    return (ra == EOF || rb == EOF) ? EOF : c;
  }

  int sync() override {
    int ra = a_ ? a_->pubsync() : 0;
    int rb = b_ ? b_->pubsync() : 0;
    return (ra == 0 && rb == 0) ? 0 : -1;
  }

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

struct RunOptions {
  std::string input_dir;
  std::string max_image_side; // positional, may be unparseable
  std::string bayer_order;    // positional, may be unparseable
  std::string config_path;
  std::string events_path;
  std::string format;
  std::optional<int> workers;
  bool exclude_output_dir = false;
};

// Unparseable or negative positional numbers keep the configured value
void apply_positional(const std::string &text, const char *name, int &target,
                      std::vector<std::string> &warnings) {
  if (text.empty())
    return;
  if (auto v = monodither::core::parse_unsigned_int(text)) {
    target = *v;
  } else {
    warnings.push_back(std::string("Ignoring unparseable ") + name + " '" +
                       text + "', using " + std::to_string(target));
  }
}

int run_command(const RunOptions &opts) {
  using namespace monodither;

  fs::path in_dir(opts.input_dir);
  std::error_code ec;
  if (!fs::is_directory(in_dir, ec)) {
    std::cerr << "Error: Directory does not exist: " << opts.input_dir
              << std::endl;
    return 1;
  }

  config::Config cfg;
  std::vector<std::string> warnings;
  try {
    if (!opts.config_path.empty()) {
      cfg = config::Config::load(opts.config_path);
    }
    apply_positional(opts.max_image_side, "max_image_side",
                     cfg.dither.max_image_side, warnings);
    apply_positional(opts.bayer_order, "bayer_order", cfg.dither.bayer_order,
                     warnings);
    if (opts.workers)
      cfg.runtime.workers = *opts.workers;
    if (opts.exclude_output_dir)
      cfg.discovery.exclude_output_dir = true;
    if (!opts.format.empty())
      cfg.output.format = core::to_lower(opts.format);
    cfg.validate();
  } catch (const MonoditherError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::ofstream event_log_file;
  if (!opts.events_path.empty()) {
    event_log_file.open(opts.events_path, std::ios::out | std::ios::trunc);
    if (!event_log_file) {
      std::cerr << "Error: Cannot open event log: " << opts.events_path
                << std::endl;
      return 1;
    }
  }
  TeeBuf tee_buf(std::cout.rdbuf(),
                 event_log_file.is_open() ? event_log_file.rdbuf() : nullptr);
  std::ostream log_file(&tee_buf);

  const std::string run_id = core::get_run_id();
  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"input_dir", opts.input_dir},
                     {"config_path", opts.config_path},
                     {"max_image_side", cfg.dither.max_image_side},
                     {"bayer_order", cfg.dither.bayer_order},
                     {"output_dir_name", cfg.output.dir_name},
                     {"output_format", cfg.output.format},
                     {"exclude_output_dir", cfg.discovery.exclude_output_dir},
                     {"workers", cfg.runtime.workers}},
                    log_file);
  for (const auto &w : warnings) {
    std::cerr << "Warning: " << w << std::endl;
    emitter.warning(run_id, w, log_file);
  }

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Input: " << in_dir.string() << std::endl;

  // Phase 0: SCAN_INPUT
  emitter.phase_start(run_id, Phase::SCAN_INPUT, log_file);
  const auto files = io::discover_images(
      in_dir, cfg.discovery.extensions,
      cfg.discovery.exclude_output_dir ? cfg.output.dir_name : std::string());
  emitter.phase_end(run_id, Phase::SCAN_INPUT, "ok",
                    {{"files_discovered", files.size()}}, log_file);
  std::cout << "[SCAN_INPUT] Found " << files.size() << " images" << std::endl;

  if (files.empty()) {
    const std::string msg = "No image files found in " + in_dir.string();
    std::cerr << "Warning: " << msg << std::endl;
    emitter.warning(run_id, msg, log_file);
    emitter.run_end(run_id, true,
                    batch_status_to_string(BatchStatus::NOTHING_TO_DO),
                    {{"discovered", 0}}, log_file);
    return 0;
  }

  BatchSummary summary;
  try {
    summary = pipeline::run_batch(files, cfg, emitter, run_id, log_file);
  } catch (const std::exception &e) {
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", core::json::object(), log_file);
    std::cerr << "Error during DITHER: " << e.what() << std::endl;
    return 1;
  }

  std::cout << std::endl;
  std::cout << "=== Summary ===" << std::endl;
  std::cout << "Discovered: " << summary.discovered << std::endl;
  std::cout << "Succeeded:  " << summary.succeeded << std::endl;
  std::cout << "Failed:     " << summary.failed << std::endl;

  emitter.run_end(run_id, true, batch_status_to_string(summary.status),
                  {{"discovered", summary.discovered},
                   {"succeeded", summary.succeeded},
                   {"failed", summary.failed}},
                  log_file);
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"monodither - ordered (Bayer) dithering of image directories"};

  RunOptions opts;
  int workers = 0;

  app.add_option("dir", opts.input_dir, "Directory to scan recursively")
      ->required();
  app.add_option("max_image_side", opts.max_image_side,
                 "Largest output side in pixels (default 800); "
                 "non-numeric or negative values keep the default");
  app.add_option("bayer_order", opts.bayer_order,
                 "Bayer matrix order, power of 2 >= 2 (default 8); "
                 "non-numeric or negative values keep the default");
  app.add_option("--config", opts.config_path, "Path to config.yaml");
  auto *workers_opt = app.add_option(
      "--workers", workers, "Worker threads (0 = hardware concurrency)");
  app.add_option("--events", opts.events_path,
                 "Also write JSON-lines events to this file");
  app.add_option("--format", opts.format, "Output format: png | bmp | tiff");
  app.add_flag("--exclude-output-dir", opts.exclude_output_dir,
               "Do not descend into directories named like the output dir");

  CLI11_PARSE(app, argc, argv);

  if (workers_opt->count() > 0)
    opts.workers = workers;

  return run_command(opts);
}

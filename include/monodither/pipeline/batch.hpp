#pragma once

#include "monodither/config/configuration.hpp"
#include "monodither/core/events.hpp"
#include "monodither/core/types.hpp"
#include "monodither/image/bayer_matrix.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace monodither::pipeline {

// parent(source) / dir_name / filename(source)
fs::path output_path_for(const fs::path& source, const std::string& dir_name);

// Creates dir if missing. An existing directory, including one created
// concurrently by another worker, is not an error. Throws OutputDirectoryError.
void ensure_output_dir(const fs::path& dir);

/**
 * Read, decode, dither and write one file.
 * Never throws for per-file problems: the failure is classified and
 * returned in the FileResult.
 */
FileResult process_file(const fs::path& source, const image::BayerMatrix& matrix,
                        const config::Config& cfg);

// configured > 0 wins, otherwise hardware concurrency; capped at n_files, >= 1
int resolve_worker_count(int configured, size_t n_files);

/**
 * Process all files on a worker pool. The Bayer matrix is generated once
 * and shared read-only. Emits DITHER phase and per-file events to log.
 * An empty list returns NOTHING_TO_DO without touching the filesystem.
 */
BatchSummary run_batch(const std::vector<fs::path>& files, const config::Config& cfg,
                       core::EventEmitter& emitter, const std::string& run_id,
                       std::ostream& log);

} // namespace monodither::pipeline

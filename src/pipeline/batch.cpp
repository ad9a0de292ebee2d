#include "monodither/pipeline/batch.hpp"
#include "monodither/core/errors.hpp"
#include "monodither/image/processing.hpp"
#include "monodither/io/image_io.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

namespace monodither::pipeline {

fs::path output_path_for(const fs::path& source, const std::string& dir_name) {
    return source.parent_path() / dir_name / source.filename();
}

void ensure_output_dir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw OutputDirectoryError("Cannot create " + dir.string() + ": " + ec.message());
    }
    // create_directories reports success when the path already exists, even as a file
    if (!fs::is_directory(dir, ec)) {
        throw OutputDirectoryError(dir.string() + " exists and is not a directory");
    }
}

static FileResult failed(const fs::path& source, ErrorKind kind, const std::string& message) {
    FileResult r;
    r.source = source;
    r.status = FileStatus::FAILED;
    r.error_kind = kind;
    r.message = message;
    return r;
}

FileResult process_file(const fs::path& source, const image::BayerMatrix& matrix,
                        const config::Config& cfg) {
    cv::Mat src;
    try {
        src = io::read_image(source);
    } catch (const DecodeError& e) {
        return failed(source, ErrorKind::DECODE, e.what());
    } catch (const std::exception& e) {
        return failed(source, ErrorKind::IO, e.what());
    }

    cv::Mat dithered;
    try {
        dithered = image::dither_image(src, matrix, cfg.dither);
    } catch (const std::exception& e) {
        return failed(source, ErrorKind::PROCESSING, e.what());
    }
    src.release();

    const fs::path out_path = output_path_for(source, cfg.output.dir_name);
    try {
        ensure_output_dir(out_path.parent_path());
    } catch (const std::exception& e) {
        return failed(source, ErrorKind::OUTPUT_DIRECTORY, e.what());
    }

    try {
        io::write_image(out_path, dithered, cfg.output.format);
    } catch (const std::exception& e) {
        return failed(source, ErrorKind::ENCODE_OR_WRITE, e.what());
    }

    FileResult r;
    r.source = source;
    r.output = out_path;
    r.status = FileStatus::OK;
    r.width = dithered.cols;
    r.height = dithered.rows;
    return r;
}

namespace {

// Restores the OpenCV thread count on scope exit
class CvThreadsGuard {
public:
    explicit CvThreadsGuard(int n) : prev_(cv::getNumThreads()) { cv::setNumThreads(n); }
    ~CvThreadsGuard() { cv::setNumThreads(prev_); }

    CvThreadsGuard(const CvThreadsGuard&) = delete;
    CvThreadsGuard& operator=(const CvThreadsGuard&) = delete;

private:
    int prev_;
};

// Joins every started worker on scope exit, including during unwinding
class ThreadJoiner {
public:
    explicit ThreadJoiner(std::vector<std::thread>& threads) : threads_(threads) {}
    ~ThreadJoiner() {
        for (auto& t : threads_) {
            if (t.joinable())
                t.join();
        }
    }

    ThreadJoiner(const ThreadJoiner&) = delete;
    ThreadJoiner& operator=(const ThreadJoiner&) = delete;

private:
    std::vector<std::thread>& threads_;
};

} // namespace

int resolve_worker_count(int configured, size_t n_files) {
    int workers = configured;
    if (workers <= 0) {
        workers = static_cast<int>(std::thread::hardware_concurrency());
        if (workers <= 0)
            workers = 1;
    }
    if (n_files < static_cast<size_t>(workers)) {
        workers = static_cast<int>(n_files);
    }
    return std::max(1, workers);
}

BatchSummary run_batch(const std::vector<fs::path>& files, const config::Config& cfg,
                       core::EventEmitter& emitter, const std::string& run_id,
                       std::ostream& log) {
    BatchSummary summary;
    summary.discovered = files.size();
    if (files.empty()) {
        summary.status = BatchStatus::NOTHING_TO_DO;
        return summary;
    }

    const image::BayerMatrix matrix = image::generate_bayer_matrix(cfg.dither.bayer_order);
    const int workers = resolve_worker_count(cfg.runtime.workers, files.size());

    emitter.phase_start(run_id, Phase::DITHER, log);
    std::cout << "[DITHER] " << files.size() << " images, order " << matrix.order()
              << ", max side " << cfg.dither.max_image_side << ", " << workers
              << " workers" << std::endl;

    summary.results.resize(files.size());

    // File-level parallelism; keep OpenCV from spawning its own pool per worker
    std::optional<CvThreadsGuard> cv_threads;
    if (workers > 1) {
        cv_threads.emplace(1);
    }

    std::mutex log_mutex;
    std::atomic<size_t> next_file{0};
    std::atomic<size_t> files_done{0};

    auto process_files = [&]() {
        while (true) {
            const size_t fi = next_file.fetch_add(1);
            if (fi >= files.size())
                break;

            FileResult r = process_file(files[fi], matrix, cfg);
            const size_t done = ++files_done;
            {
                std::lock_guard<std::mutex> lock(log_mutex);
                emitter.file_processed(run_id, r, log);
                if (r.ok()) {
                    std::cout << "  OK     " << r.source.string() << " -> "
                              << r.output.string() << " (" << r.width << "x"
                              << r.height << ")" << std::endl;
                } else {
                    std::cerr << "  FAILED " << r.source.string() << ": "
                              << r.message << std::endl;
                }
                if (done % 20 == 0 || done == files.size()) {
                    emitter.phase_progress(run_id, Phase::DITHER, static_cast<int>(done),
                                           static_cast<int>(files.size()), log);
                }
            }
            summary.results[fi] = std::move(r);
        }
    };

    if (workers > 1) {
        std::vector<std::thread> pool;
        pool.reserve(static_cast<size_t>(workers));
        ThreadJoiner joiner(pool);
        for (int w = 0; w < workers; ++w) {
            pool.emplace_back(process_files);
        }
    } else {
        process_files();
    }
    cv_threads.reset();

    for (const auto& r : summary.results) {
        if (r.ok())
            ++summary.succeeded;
        else
            ++summary.failed;
    }
    summary.status = BatchStatus::COMPLETED;

    emitter.phase_end(run_id, Phase::DITHER, summary.failed == 0 ? "ok" : "partial",
                      {{"succeeded", summary.succeeded}, {"failed", summary.failed}},
                      log);
    return summary;
}

} // namespace monodither::pipeline

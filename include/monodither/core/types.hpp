#pragma once

#include <Eigen/Dense>
#include <filesystem>
#include <string>
#include <vector>

namespace monodither {

namespace fs = std::filesystem;

// Integer matrix, row-major so rows are contiguous in memory
using Matrix2Di = Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Run phases
enum class Phase {
    SCAN_INPUT = 0,
    DITHER = 1
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCAN_INPUT: return "SCAN_INPUT";
        case Phase::DITHER: return "DITHER";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

// Per-file failure classification
enum class ErrorKind {
    NONE,
    IO,                // source file unreadable
    DECODE,            // bytes are not a decodable image
    PROCESSING,        // resize or dither rejected the decoded image
    OUTPUT_DIRECTORY,  // output directory cannot be created
    ENCODE_OR_WRITE    // encoding or writing the result failed
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::IO: return "io";
        case ErrorKind::DECODE: return "decode";
        case ErrorKind::PROCESSING: return "processing";
        case ErrorKind::OUTPUT_DIRECTORY: return "output_directory";
        case ErrorKind::ENCODE_OR_WRITE: return "encode_or_write";
        default: return "unknown";
    }
}

enum class FileStatus {
    OK,
    FAILED
};

// Outcome of processing one source file
struct FileResult {
    fs::path source;
    fs::path output;     // empty on failure
    FileStatus status = FileStatus::FAILED;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string message;
    int width = 0;       // dimensions of the written image
    int height = 0;

    bool ok() const { return status == FileStatus::OK; }
};

enum class BatchStatus {
    NOTHING_TO_DO,  // discovery found no images
    COMPLETED       // every file was attempted, see counts
};

inline std::string batch_status_to_string(BatchStatus status) {
    switch (status) {
        case BatchStatus::NOTHING_TO_DO: return "nothing_to_do";
        case BatchStatus::COMPLETED: return "completed";
        default: return "unknown";
    }
}

struct BatchSummary {
    BatchStatus status = BatchStatus::NOTHING_TO_DO;
    size_t discovered = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    std::vector<FileResult> results;  // same order as the input list
};

} // namespace monodither

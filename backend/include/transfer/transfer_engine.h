#pragma once

#include "protocol/frame.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

/// A transfer that cannot continue at all (missing path, lost connection).
class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Destination of outbound frames. A file unit (begin_file, payload
 * writes, end_file) is never interleaved with other frames.
 */
class FrameSink {
public:
    virtual ~FrameSink() = default;

    /// Send a frame without payload (text or folder marker).
    virtual void send_control(const Frame& frame) = 0;

    virtual void begin_file(const FileHeader& header) = 0;
    virtual void write_payload(const char* data, std::size_t len) = 0;
    virtual void end_file() = 0;
};

struct TransferProgress {
    uint64_t bytes_sent = 0;
    uint64_t total_bytes = 0;
    uint32_t files_sent = 0;
    uint32_t total_files = 0;
};

/**
 * Sends a file or a directory tree as frames.
 *
 * A directory becomes FOLDER_HEADER, one file unit per regular file
 * (path relative to the directory, '/'-separated, top-down order), then
 * FOLDER_END. Payload goes out in chunks of `chunk_size` bytes without
 * waiting for acknowledgement.
 */
class TransferEngine {
public:
    using ProgressCallback = std::function<void(const TransferProgress&)>;
    using ErrorCallback    = std::function<void(const std::string& message)>;

    TransferEngine(FrameSink& sink, std::size_t chunk_size);

    void set_on_progress(ProgressCallback cb);

    /// Per-file problems; the file is skipped and the transfer continues.
    void set_on_error(ErrorCallback cb);

    /// Throws TransferError if `path` is neither a file nor a directory,
    /// or if the sink fails.
    TransferProgress send_path(const std::filesystem::path& path);

private:
    struct Entry {
        std::filesystem::path source;
        std::string relative_path;
    };

    void collect(const std::filesystem::path& dir,
                 const std::filesystem::path& root,
                 std::vector<Entry>& out);
    void send_file(const Entry& entry, TransferProgress& progress);
    void report(const std::string& message);

    FrameSink& sink_;
    std::size_t chunk_size_;
    ProgressCallback on_progress_;
    ErrorCallback on_error_;
};

/// Final path component of a file or folder, ignoring a trailing separator.
std::string display_name(const std::filesystem::path& path);

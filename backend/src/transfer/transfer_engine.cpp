/**
 * TransferEngine — walks a file or directory and streams it as frames.
 *
 * Totals are computed up front so progress can be reported as a
 * fraction. A file's size is fixed when its header is written; if the
 * file shrinks while being read the payload is zero-padded to keep the
 * receiver in sync, and the problem is reported.
 */

#include "transfer/transfer_engine.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

std::string display_name(const fs::path& path) {
    fs::path normal = path.lexically_normal();
    if (normal.has_filename()) {
        return normal.filename().string();
    }
    return normal.parent_path().filename().string();
}

TransferEngine::TransferEngine(FrameSink& sink, std::size_t chunk_size)
    : sink_(sink), chunk_size_(std::max<std::size_t>(chunk_size, 1)) {}

void TransferEngine::set_on_progress(ProgressCallback cb) {
    on_progress_ = std::move(cb);
}

void TransferEngine::set_on_error(ErrorCallback cb) {
    on_error_ = std::move(cb);
}

TransferProgress TransferEngine::send_path(const fs::path& path) {
    std::error_code ec;
    TransferProgress progress;

    if (fs::is_regular_file(path, ec)) {
        Entry entry{path, display_name(path)};
        progress.total_files = 1;
        progress.total_bytes = fs::file_size(path, ec);
        if (ec) progress.total_bytes = 0;
        spdlog::info("Sending file '{}'", entry.relative_path);
        if (on_progress_) on_progress_(progress);
        send_file(entry, progress);
        return progress;
    }

    if (!fs::is_directory(path, ec)) {
        throw TransferError("Path not found: " + path.string());
    }

    const std::string folder = display_name(path);
    std::vector<Entry> entries;
    collect(path, path, entries);
    for (const auto& entry : entries) {
        auto size = fs::file_size(entry.source, ec);
        if (!ec) progress.total_bytes += size;
    }
    progress.total_files = static_cast<uint32_t>(entries.size());
    spdlog::info("Sending folder '{}': {} file(s), {} byte(s)",
                 folder, progress.total_files, progress.total_bytes);

    sink_.send_control(FolderHeaderFrame{std::nullopt, folder});
    if (on_progress_) on_progress_(progress);
    for (const auto& entry : entries) {
        send_file(entry, progress);
    }
    sink_.send_control(FolderEndFrame{std::nullopt, folder});
    spdlog::info("Finished sending folder '{}'", folder);
    return progress;
}

void TransferEngine::collect(const fs::path& dir, const fs::path& root, std::vector<Entry>& out) {
    std::error_code ec;
    std::vector<fs::path> files;
    std::vector<fs::path> subdirs;
    for (fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_symlink(type_ec) && it->is_directory(type_ec)) {
            spdlog::debug("Skipping linked directory '{}'", it->path().string());
        } else if (it->is_directory(type_ec)) {
            subdirs.push_back(it->path());
        } else if (it->is_regular_file(type_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        report("Could not list '" + dir.string() + "': " + ec.message());
    }

    std::sort(files.begin(), files.end());
    std::sort(subdirs.begin(), subdirs.end());
    for (const auto& file : files) {
        out.push_back({file, file.lexically_relative(root).generic_string()});
    }
    for (const auto& sub : subdirs) {
        collect(sub, root, out);
    }
}

void TransferEngine::send_file(const Entry& entry, TransferProgress& progress) {
    std::ifstream in(entry.source, std::ios::binary);
    std::error_code ec;
    uint64_t size = fs::file_size(entry.source, ec);
    if (!in || ec) {
        report("Could not read file '" + entry.relative_path + "'. Skipping.");
        return;
    }

    bool short_read = false;
    {
        sink_.begin_file(FileHeader{std::nullopt, entry.relative_path, size});
        // Releases the sink's unit even if a payload write throws.
        struct UnitGuard {
            FrameSink& sink;
            ~UnitGuard() { sink.end_file(); }
        } guard{sink_};

        std::vector<char> chunk(chunk_size_);
        uint64_t remaining = size;
        while (remaining > 0) {
            auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining, chunk.size()));
            std::size_t got = 0;
            if (!short_read) {
                in.read(chunk.data(), static_cast<std::streamsize>(want));
                got = static_cast<std::size_t>(in.gcount());
            }
            if (got < want) {
                short_read = true;
                std::fill(chunk.begin() + static_cast<std::ptrdiff_t>(got),
                          chunk.begin() + static_cast<std::ptrdiff_t>(want), '\0');
            }
            sink_.write_payload(chunk.data(), want);
            remaining -= want;
            progress.bytes_sent += want;
            if (on_progress_) on_progress_(progress);
        }
    }

    ++progress.files_sent;
    if (on_progress_) on_progress_(progress);
    if (short_read) {
        report("File '" + entry.relative_path + "' changed while being sent; padded to " +
               std::to_string(size) + " bytes.");
    }
}

void TransferEngine::report(const std::string& message) {
    spdlog::warn("{}", message);
    if (on_error_) on_error_(message);
}

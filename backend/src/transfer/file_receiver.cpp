#include "transfer/file_receiver.h"

#include "transfer/transfer_engine.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

// Relative path that stays inside its root once normalised.
bool is_contained(const fs::path& relative) {
    if (relative.empty() || relative.is_absolute() || relative.has_root_name()) {
        return false;
    }
    for (const auto& part : relative) {
        if (part == "..") return false;
    }
    return true;
}

void create_parents(const fs::path& target) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw TransferError("Cannot create '" + target.parent_path().string() + "': " + ec.message());
    }
}

} // namespace

FileReceiver::FileReceiver(fs::path downloads_dir)
    : downloads_dir_(std::move(downloads_dir)) {}

fs::path FileReceiver::begin_folder(const FolderHeaderFrame& frame) {
    std::string name = display_name(frame.name);
    if (name.empty() || name == "." || name == "..") {
        throw TransferError("Refusing folder name '" + frame.name + "'");
    }
    fs::path root = downloads_dir_ / name;
    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw TransferError("Cannot create '" + root.string() + "': " + ec.message());
    }
    download_root_ = root;
    return root;
}

void FileReceiver::end_folder(const FolderEndFrame& frame) {
    if (!download_root_) {
        spdlog::warn("FOLDER_END '{}' without a folder in progress", frame.name);
    }
    download_root_.reset();
}

fs::path FileReceiver::target_for(const std::string& relative_path) const {
    if (download_root_) {
        fs::path relative = fs::path(relative_path).lexically_normal();
        if (!is_contained(relative) || !relative.has_filename()) {
            throw TransferError("Refusing path '" + relative_path + "' outside the folder");
        }
        return *download_root_ / relative;
    }
    std::string name = display_name(relative_path);
    if (name.empty() || name == "." || name == "..") {
        throw TransferError("Refusing file name '" + relative_path + "'");
    }
    return downloads_dir_ / name;
}

fs::path FileReceiver::write_file(const FileFrame& frame) {
    fs::path target = target_for(frame.header.relative_path);
    create_parents(target);

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw TransferError("Cannot open '" + target.string() + "' for writing");
    }
    out.write(frame.payload.data(), static_cast<std::streamsize>(frame.payload.size()));
    out.close();
    if (!out) {
        throw TransferError("Failed writing '" + target.string() + "'");
    }
    return target;
}

#pragma once

#include "protocol/frame.h"

#include <filesystem>
#include <optional>

/**
 * Writes received files under the downloads directory.
 *
 * Between FOLDER_HEADER and FOLDER_END files keep their relative path
 * below <downloads>/<folder>; outside a folder they land directly in
 * <downloads>. Parent directories are created as needed. Filesystem
 * failures throw TransferError and only affect the file at hand.
 */
class FileReceiver {
public:
    explicit FileReceiver(std::filesystem::path downloads_dir);

    /// Returns the folder created for the transfer.
    std::filesystem::path begin_folder(const FolderHeaderFrame& frame);
    void end_folder(const FolderEndFrame& frame);

    /// Returns the path the payload was written to.
    std::filesystem::path write_file(const FileFrame& frame);

    [[nodiscard]] const std::optional<std::filesystem::path>& download_root() const { return download_root_; }
    [[nodiscard]] const std::filesystem::path& downloads_dir() const { return downloads_dir_; }

private:
    std::filesystem::path target_for(const std::string& relative_path) const;

    std::filesystem::path downloads_dir_;
    std::optional<std::filesystem::path> download_root_;
};

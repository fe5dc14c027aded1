#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

/// One chat line, without its trailing '\n'.
struct TextFrame {
    std::string line;
};

/// Header of a file frame. `sender` is only present on relayed frames.
struct FileHeader {
    std::optional<std::string> sender;
    std::string relative_path;
    uint64_t size = 0;
};

/// A file header together with exactly `header.size` payload bytes.
struct FileFrame {
    FileHeader header;
    std::string payload;
};

struct FolderHeaderFrame {
    std::optional<std::string> sender;
    std::string name;
};

struct FolderEndFrame {
    std::optional<std::string> sender;
    std::string name;
};

/**
 * One self-delimited unit of the wire protocol.
 */
using Frame = std::variant<TextFrame, FileFrame, FolderHeaderFrame, FolderEndFrame>;

bool operator==(const TextFrame& a, const TextFrame& b);
bool operator==(const FileHeader& a, const FileHeader& b);
bool operator==(const FileFrame& a, const FileFrame& b);
bool operator==(const FolderHeaderFrame& a, const FolderHeaderFrame& b);
bool operator==(const FolderEndFrame& a, const FolderEndFrame& b);

/// Human-readable one-line description, used in logs.
std::string describe(const Frame& frame);

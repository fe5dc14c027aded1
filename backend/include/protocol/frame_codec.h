#pragma once

#include "protocol/frame.h"

#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

/// Raised for a header line or text line that cannot be decoded.
class FrameError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A decoded header line. File payload is not part of it.
using HeaderLine = std::variant<TextFrame, FileHeader, FolderHeaderFrame, FolderEndFrame>;

/**
 * Wire grammar for the framed protocol.
 *
 *   TEXT          := <bytes without '\n'> '\n'
 *   FILE_HEADER   := "FILE_HEADER::" [sender "::"] path "::" size '\n' <size bytes>
 *   FOLDER_HEADER := "FOLDER_HEADER::" [sender "::"] name '\n'
 *   FOLDER_END    := "FOLDER_END::" [sender "::"] name '\n'
 *
 * Fields are not escaped: a '::' or '\n' inside a username, path or
 * folder name cannot be represented.
 */
class FrameCodec {
public:
    static constexpr char kDelimiter = '\n';
    static constexpr std::string_view kSeparator = "::";
    static constexpr std::string_view kFileTag = "FILE_HEADER";
    static constexpr std::string_view kFolderTag = "FOLDER_HEADER";
    static constexpr std::string_view kFolderEndTag = "FOLDER_END";

    /// Full wire bytes for a frame, including file payload.
    static std::string encode(const Frame& frame);

    /// Only the header line (with '\n') of a file frame.
    static std::string encode_file_header(const FileHeader& header);

    /// Decode one line without its delimiter. Throws FrameError.
    static HeaderLine decode_header_line(std::string_view line);

    /// True when `line` begins with FILE_HEADER::, i.e. a payload follows it.
    static bool is_file_header(std::string_view line);

    static bool is_valid_utf8(std::string_view bytes);
};

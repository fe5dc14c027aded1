/**
 * FrameCodec — encodes and decodes the line-oriented wire grammar.
 *
 * Pure functions over byte strings; no I/O. The demultiplexer decides
 * where a line ends and how many payload bytes follow a file header.
 */

#include "protocol/frame_codec.h"

#include <charconv>
#include <initializer_list>
#include <vector>

namespace {

constexpr std::string_view kSeparator = FrameCodec::kSeparator;

std::string tagged(std::string_view tag,
                   const std::optional<std::string>& sender,
                   std::initializer_list<std::string_view> fields) {
    std::string out(tag);
    out += kSeparator;
    if (sender) {
        out += *sender;
        out += kSeparator;
    }
    bool first = true;
    for (auto field : fields) {
        if (!first) out += kSeparator;
        out += field;
        first = false;
    }
    out += FrameCodec::kDelimiter;
    return out;
}

std::vector<std::string_view> split_fields(std::string_view rest) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        size_t pos = rest.find(kSeparator, start);
        if (pos == std::string_view::npos) {
            fields.push_back(rest.substr(start));
            return fields;
        }
        fields.push_back(rest.substr(start, pos - start));
        start = pos + kSeparator.size();
    }
}

bool starts_with_tag(std::string_view line, std::string_view tag) {
    return line.size() >= tag.size() + kSeparator.size() &&
           line.substr(0, tag.size()) == tag &&
           line.substr(tag.size(), kSeparator.size()) == kSeparator;
}

uint64_t parse_size(std::string_view text) {
    if (text.empty()) {
        throw FrameError("file header without a size");
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw FrameError("file size is not a decimal number: " + std::string(text));
        }
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw FrameError("file size out of range: " + std::string(text));
    }
    return value;
}

} // namespace

std::string FrameCodec::encode_file_header(const FileHeader& header) {
    return tagged(kFileTag, header.sender,
                  {header.relative_path, std::to_string(header.size)});
}

std::string FrameCodec::encode(const Frame& frame) {
    struct Encoder {
        std::string operator()(const TextFrame& f) const {
            std::string out = f.line;
            out += kDelimiter;
            return out;
        }
        std::string operator()(const FileFrame& f) const {
            return encode_file_header(f.header) + f.payload;
        }
        std::string operator()(const FolderHeaderFrame& f) const {
            return tagged(kFolderTag, f.sender, {f.name});
        }
        std::string operator()(const FolderEndFrame& f) const {
            return tagged(kFolderEndTag, f.sender, {f.name});
        }
    };
    return std::visit(Encoder{}, frame);
}

bool FrameCodec::is_file_header(std::string_view line) {
    return starts_with_tag(line, kFileTag);
}

HeaderLine FrameCodec::decode_header_line(std::string_view line) {
    if (!is_valid_utf8(line)) {
        throw FrameError("line is not valid UTF-8");
    }

    if (starts_with_tag(line, kFileTag)) {
        auto fields = split_fields(line.substr(kFileTag.size() + kSeparator.size()));
        FileHeader header;
        if (fields.size() == 2) {
            header.relative_path = std::string(fields[0]);
            header.size = parse_size(fields[1]);
        } else if (fields.size() == 3) {
            header.sender = std::string(fields[0]);
            header.relative_path = std::string(fields[1]);
            header.size = parse_size(fields[2]);
        } else {
            throw FrameError("malformed file header: " + std::string(line));
        }
        if (header.relative_path.empty()) {
            throw FrameError("file header without a path");
        }
        return header;
    }

    bool folder_start = starts_with_tag(line, kFolderTag);
    if (folder_start || starts_with_tag(line, kFolderEndTag)) {
        auto tag = folder_start ? kFolderTag : kFolderEndTag;
        auto fields = split_fields(line.substr(tag.size() + kSeparator.size()));
        std::optional<std::string> sender;
        std::string name;
        if (fields.size() == 1) {
            name = std::string(fields[0]);
        } else if (fields.size() == 2) {
            sender = std::string(fields[0]);
            name = std::string(fields[1]);
        } else {
            throw FrameError("malformed folder frame: " + std::string(line));
        }
        if (name.empty()) {
            throw FrameError("folder frame without a name");
        }
        if (folder_start) return FolderHeaderFrame{sender, name};
        return FolderEndFrame{sender, name};
    }

    return TextFrame{std::string(line)};
}

bool FrameCodec::is_valid_utf8(std::string_view bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        auto c = static_cast<unsigned char>(bytes[i]);
        size_t extra;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + extra >= bytes.size()) return false;
        for (size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF.
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000) || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}


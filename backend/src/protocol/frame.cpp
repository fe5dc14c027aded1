#include "protocol/frame.h"

bool operator==(const TextFrame& a, const TextFrame& b) {
    return a.line == b.line;
}

bool operator==(const FileHeader& a, const FileHeader& b) {
    return a.sender == b.sender && a.relative_path == b.relative_path && a.size == b.size;
}

bool operator==(const FileFrame& a, const FileFrame& b) {
    return a.header == b.header && a.payload == b.payload;
}

bool operator==(const FolderHeaderFrame& a, const FolderHeaderFrame& b) {
    return a.sender == b.sender && a.name == b.name;
}

bool operator==(const FolderEndFrame& a, const FolderEndFrame& b) {
    return a.sender == b.sender && a.name == b.name;
}

std::string describe(const Frame& frame) {
    struct Describer {
        std::string operator()(const TextFrame& f) const {
            return "text '" + f.line + "'";
        }
        std::string operator()(const FileFrame& f) const {
            return "file '" + f.header.relative_path + "' (" +
                   std::to_string(f.header.size) + " bytes)";
        }
        std::string operator()(const FolderHeaderFrame& f) const {
            return "folder start '" + f.name + "'";
        }
        std::string operator()(const FolderEndFrame& f) const {
            return "folder end '" + f.name + "'";
        }
    };
    return std::visit(Describer{}, frame);
}

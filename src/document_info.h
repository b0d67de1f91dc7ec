#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace Quire {

// What the viewer shows about an opened file. Contents are never parsed.
struct DocumentInfo {
    std::string path;
    std::string name;
    uintmax_t sizeBytes = 0;
};

// Last path component, split on '/' or '\'. "file.pdf" if nothing is left.
std::string displayNameForPath(const std::string& path);

// Stat the file; nothing if it does not exist or is not a regular file
std::optional<DocumentInfo> describeDocument(const std::string& path);

// "12.3 KB" style size for the status line
std::string formatFileSize(uintmax_t bytes);

} // namespace Quire

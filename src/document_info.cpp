#include "document_info.h"

#include <cstdio>
#include <filesystem>
#include <system_error>

namespace Quire {

std::string displayNameForPath(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    std::string name = (pos == std::string::npos) ? path : path.substr(pos + 1);
    if (name.empty()) return "file.pdf";
    return name;
}

std::optional<DocumentInfo> describeDocument(const std::string& path) {
    std::error_code ec;
    auto p = std::filesystem::u8path(path);
    if (!std::filesystem::is_regular_file(p, ec) || ec) return std::nullopt;

    uintmax_t size = std::filesystem::file_size(p, ec);
    if (ec) return std::nullopt;

    DocumentInfo info;
    info.path = path;
    info.name = displayNameForPath(path);
    info.sizeBytes = size;
    return info;
}

std::string formatFileSize(uintmax_t bytes) {
    char buf[64];
    if (bytes < 1024) {
        snprintf(buf, sizeof(buf), "%llu B", (unsigned long long)bytes);
    } else if (bytes < 1024ull * 1024ull) {
        snprintf(buf, sizeof(buf), "%.1f KB", bytes / 1024.0);
    } else if (bytes < 1024ull * 1024ull * 1024ull) {
        snprintf(buf, sizeof(buf), "%.1f MB", bytes / (1024.0 * 1024.0));
    } else {
        snprintf(buf, sizeof(buf), "%.2f GB", bytes / (1024.0 * 1024.0 * 1024.0));
    }
    return std::string(buf);
}

} // namespace Quire

#include "candidate_path.h"

#include <cctype>
#include <filesystem>
#include <system_error>

namespace Quire {

const char* sourceName(CandidateSource source) {
    switch (source) {
    case CandidateSource::LaunchArgument: return "launch-argument";
    case CandidateSource::NativeBridge: return "native-bridge";
    case CandidateSource::DragDrop: return "drag-drop";
    }
    return "unknown";
}

bool FileTypeRule::defaultCaseInsensitive() {
#if defined(_WIN32) || defined(__APPLE__)
    return true;
#else
    return false;
#endif
}

bool FileTypeRule::matches(const std::string& path) const {
    if (extension.empty()) return false;
    // The file name needs at least one character before the dot
    size_t sep = path.find_last_of("/\\");
    size_t nameStart = (sep == std::string::npos) ? 0 : sep + 1;
    if (path.size() - nameStart < extension.size() + 2) return false;

    size_t dot = path.size() - extension.size() - 1;
    if (path[dot] != '.') return false;

    for (size_t i = 0; i < extension.size(); ++i) {
        char a = path[dot + 1 + i];
        char b = extension[i];
        if (caseInsensitive) {
            a = (char)std::tolower((unsigned char)a);
            b = (char)std::tolower((unsigned char)b);
        }
        if (a != b) return false;
    }
    return true;
}

bool isFlagToken(const std::string& token) {
    return !token.empty() && token[0] == '-';
}

bool pathExists(const std::string& path) {
    if (path.empty()) return false;
    std::error_code ec;
    bool exists = std::filesystem::exists(std::filesystem::u8path(path), ec);
    return !ec && exists;
}

bool isValidCandidate(const CandidatePath& candidate, const FileTypeRule& rule) {
    if (candidate.path.empty()) return false;
    if (isFlagToken(candidate.path)) return false;
    return rule.matches(candidate.path) || pathExists(candidate.path);
}

} // namespace Quire

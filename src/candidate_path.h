#pragma once

#include <string>

namespace Quire {

// Where a candidate path came from
enum class CandidateSource {
    LaunchArgument,
    NativeBridge,
    DragDrop
};

const char* sourceName(CandidateSource source);

// A path proposed by one of the input sources, not yet accepted by the dispatcher
struct CandidatePath {
    std::string path;
    CandidateSource source = CandidateSource::LaunchArgument;
};

// Supported file type. One instance is shared by every candidate source so they
// all apply the same extension rule.
struct FileTypeRule {
    std::string extension = "pdf";  // without the leading dot
    bool caseInsensitive = defaultCaseInsensitive();

    // True if the path ends with ".<extension>"
    bool matches(const std::string& path) const;

    // Host convention: case-insensitive filesystems on Windows and macOS
    static bool defaultCaseInsensitive();
};

// Tokens starting with '-' are flags, never paths
bool isFlagToken(const std::string& token);

// Non-throwing existence check, safe to call from event-loop callbacks
bool pathExists(const std::string& path);

// Non-empty, not a flag, and either has the supported extension or exists on disk
bool isValidCandidate(const CandidatePath& candidate, const FileTypeRule& rule);

} // namespace Quire

#pragma once

#include "candidate_producer.h"
#include <optional>
#include <string>
#include <vector>

namespace Quire {

// Extract the file to open from the process arguments.
// args[0] is the program path. Leading flags are skipped; only the first
// non-flag token is considered, accepted if it has the supported extension or
// exists on disk.
std::optional<CandidatePath> scanLaunchArguments(const std::vector<std::string>& args,
                                                 const FileTypeRule& rule);

// Producer wrapper: emits the scanned candidate once, when started
class LaunchArgumentScanner : public CandidateProducer {
public:
    LaunchArgumentScanner(std::vector<std::string> args, FileTypeRule rule);
    LaunchArgumentScanner(int argc, char** argv, FileTypeRule rule);

    const char* name() const override { return "launch"; }
    bool start(Sink sink) override;

private:
    std::vector<std::string> m_args;
    FileTypeRule m_rule;
    bool m_emitted = false;
};

} // namespace Quire

#include "launch_args.h"

#include <cstdio>

namespace Quire {

std::optional<CandidatePath> scanLaunchArguments(const std::vector<std::string>& args,
                                                 const FileTypeRule& rule) {
    // Skip leading flags; only the first non-flag token is a path candidate
    size_t i = 1;
    while (i < args.size() && isFlagToken(args[i])) ++i;
    if (i >= args.size()) return std::nullopt;

    const std::string& token = args[i];
    if (token.empty()) return std::nullopt;

    if (rule.matches(token) || pathExists(token)) {
        return CandidatePath{token, CandidateSource::LaunchArgument};
    }

    fprintf(stderr, "[launch] ignoring argument '%s' (not a .%s file on disk)\n",
            token.c_str(), rule.extension.c_str());
    return std::nullopt;
}

LaunchArgumentScanner::LaunchArgumentScanner(std::vector<std::string> args, FileTypeRule rule)
    : m_args(std::move(args)), m_rule(std::move(rule)) {}

LaunchArgumentScanner::LaunchArgumentScanner(int argc, char** argv, FileTypeRule rule)
    : m_rule(std::move(rule)) {
    for (int i = 0; i < argc; ++i) {
        m_args.emplace_back(argv[i] ? argv[i] : "");
    }
}

bool LaunchArgumentScanner::start(Sink sink) {
    // Launch arguments describe the initial intent only
    if (m_emitted) return true;
    m_emitted = true;

    auto candidate = scanLaunchArguments(m_args, m_rule);
    if (candidate && sink) {
        sink(*candidate);
    }
    return true;
}

} // namespace Quire

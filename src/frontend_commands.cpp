#include "frontend_commands.h"

#include <nlohmann/json.hpp>
#include <cstdio>
#include <optional>

namespace Quire {

using json = nlohmann::json;

CommandResult FrontendCommands::openFilePath(const std::string& filePath) {
    ++m_invocations;
    fprintf(stderr, "[commands] open_file_path('%s') acknowledged\n", filePath.c_str());
    return CommandResult::ok();
}

static std::optional<json> parseArgs(const std::string& argsJson) {
    if (argsJson.empty()) return json::object();
    try {
        return json::parse(argsJson);
    } catch (const json::exception& e) {
        fprintf(stderr, "[commands] malformed arguments: %s\n", e.what());
        return std::nullopt;
    }
}

CommandResult FrontendCommands::invoke(const std::string& command, const std::string& argsJson) {
    auto args = parseArgs(argsJson);

    if (command == "open_file_path") {
        // The contract never errors, whatever the UI sent
        std::string path;
        if (args && args->is_object()) {
            auto it = args->find("filePath");
            if (it != args->end() && it->is_string()) path = it->get<std::string>();
        }
        return openFilePath(path);
    }

    fprintf(stderr, "[commands] unknown command '%s'\n", command.c_str());
    return CommandResult::fail("unknown command: " + command);
}

} // namespace Quire

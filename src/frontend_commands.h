#pragma once

#include <string>
#include <utility>

namespace Quire {

// Outcome of a command invoked by the UI layer
struct CommandResult {
    bool success = true;
    std::string error;

    explicit operator bool() const { return success; }

    static CommandResult ok() { return {}; }
    static CommandResult fail(std::string message) { return {false, std::move(message)}; }
};

// Commands the UI layer can call into the host
class FrontendCommands {
public:
    // Reserved for a future "UI asked to open this path" flow. Acknowledges
    // every input and does nothing.
    CommandResult openFilePath(const std::string& filePath);

    // Route a command by name. argsJson is a JSON object of named arguments.
    CommandResult invoke(const std::string& command, const std::string& argsJson);

    size_t invocationCount() const { return m_invocations; }

private:
    size_t m_invocations = 0;
};

} // namespace Quire

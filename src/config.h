#pragma once

#include "candidate_path.h"
#include <filesystem>
#include <string>

namespace Quire {

struct AppConfig {
    // The supported type is fixed to PDF; only the case rule is configurable
    bool caseInsensitiveExtension = FileTypeRule::defaultCaseInsensitive();
    // How long the shell waits for the display surface before giving up on a held request
    int readinessTimeoutMs = 10000;
    int windowWidth = 1280;
    int windowHeight = 860;

    FileTypeRule fileTypeRule() const;
};

// $XDG_CONFIG_HOME/quire/config.json, else $HOME/.config/quire/config.json.
// Empty if neither variable is set.
std::filesystem::path configFilePath();

// Overlay values from a JSON file onto config. Keys with the wrong type keep
// their current value. Returns false (config untouched) if the file is
// missing or not a JSON object.
bool loadConfigFromFile(const std::filesystem::path& file, AppConfig& config);

// Defaults plus whatever the user config file provides
AppConfig loadConfig();

} // namespace Quire

#include "config.h"

#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>

namespace Quire {

using json = nlohmann::json;

FileTypeRule AppConfig::fileTypeRule() const {
    FileTypeRule rule;
    rule.extension = "pdf";
    rule.caseInsensitive = caseInsensitiveExtension;
    return rule;
}

std::filesystem::path configFilePath() {
    std::filesystem::path configDir;
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && std::strlen(xdg) > 0) configDir = xdg;
    else {
        const char* home = std::getenv("HOME");
        if (!home || std::strlen(home) == 0) return {};
        configDir = std::filesystem::path(home) / ".config";
    }
    return configDir / "quire" / "config.json";
}

template <typename T>
static void readKey(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception&) {
        fprintf(stderr, "[config] '%s' has the wrong type, keeping default\n", key);
    }
}

bool loadConfigFromFile(const std::filesystem::path& file, AppConfig& config) {
    std::error_code ec;
    if (file.empty() || !std::filesystem::exists(file, ec)) return false;

    try {
        std::ifstream ifs(file);
        if (!ifs.is_open()) return false;
        json j;
        ifs >> j;
        if (!j.is_object()) {
            fprintf(stderr, "[config] %s is not a JSON object, using defaults\n", file.string().c_str());
            return false;
        }

        AppConfig loaded = config;
        readKey(j, "caseInsensitiveExtension", loaded.caseInsensitiveExtension);
        readKey(j, "readinessTimeoutMs", loaded.readinessTimeoutMs);
        readKey(j, "windowWidth", loaded.windowWidth);
        readKey(j, "windowHeight", loaded.windowHeight);

        if (loaded.readinessTimeoutMs <= 0) loaded.readinessTimeoutMs = config.readinessTimeoutMs;
        if (loaded.windowWidth <= 0) loaded.windowWidth = config.windowWidth;
        if (loaded.windowHeight <= 0) loaded.windowHeight = config.windowHeight;

        config = loaded;
        return true;
    } catch (const std::exception& e) {
        fprintf(stderr, "[config] failed to read %s: %s\n", file.string().c_str(), e.what());
        return false;
    }
}

AppConfig loadConfig() {
    AppConfig config;
    auto file = configFilePath();
    if (loadConfigFromFile(file, config)) {
        fprintf(stderr, "[config] loaded %s\n", file.string().c_str());
    }
    return config;
}

} // namespace Quire

#pragma once

#include <string>

// GUI settings file (key = value, # or ; comments), kept in the user's
// pref directory and created with defaults on first run.
struct Settings {
    int tileSize = 40;  // 16..96
    int hudHeight = 0;  // 0..240, strip under the board for coins and boss health
    bool startFullscreen = false;
    bool vsync = true;

    // Campaign file. A relative path is looked up next to the settings file
    // first, then against the working directory.
    std::string levelsFile = "data/levels.ini";
};

// Parses settings text into `out`, starting from defaults. Bad values and
// unknown keys keep the default and are reported as "Line N: ..." warnings;
// out-of-range numbers are clamped with a warning.
void parseSettings(const std::string& text, Settings& out, std::string* outWarnings = nullptr);

// Loads settings from disk. A missing file silently gives defaults.
Settings loadSettings(const std::string& path, std::string* outWarnings = nullptr);

// Renders `s` as a commented settings file.
std::string formatSettings(const Settings& s);

// Writes formatSettings(Settings{}) to `path`. Returns true on success.
bool writeDefaultSettings(const std::string& path);

// Campaign path to open for `s` when its settings came from `settingsPath`.
std::string resolveLevelsPath(const Settings& s, const std::string& settingsPath);

#include "settings.hpp"
#include "ini_text.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace {

// Reads an int into `field`, clamping it to [lo, hi].
void readClampedInt(const std::string& key, const std::string& val, int lo, int hi, int& field,
                    std::string& warnings, int lineNo, int& warnCount) {
    int v = 0;
    if (!parseInt(val, v)) {
        appendWarning(warnings, lineNo, key + " should be an int, got '" + val + "'", warnCount);
        return;
    }
    const int clamped = std::clamp(v, lo, hi);
    if (clamped != v) {
        appendWarning(warnings, lineNo,
                      key + " " + std::to_string(v) + " clamped to " + std::to_string(clamped), warnCount);
    }
    field = clamped;
}

void readBool(const std::string& key, const std::string& val, bool& field,
              std::string& warnings, int lineNo, int& warnCount) {
    if (!parseBool(val, field)) {
        appendWarning(warnings, lineNo, key + " should be true or false, got '" + val + "'", warnCount);
    }
}

} // namespace

void parseSettings(const std::string& text, Settings& out, std::string* outWarnings) {
    out = Settings{};

    std::string warnings;
    int warnCount = 0;

    std::istringstream iss(text);
    std::string line;
    for (int lineNo = 1; std::getline(iss, line); ++lineNo) {
        stripUtf8Bom(line);
        line = trim(stripComment(line));
        if (line.empty()) continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            appendWarning(warnings, lineNo, "Expected key=value", warnCount);
            continue;
        }

        const std::string key = toLower(trim(line.substr(0, eq)));
        const std::string val = trim(line.substr(eq + 1));

        if (key == "tile_size") {
            readClampedInt(key, val, 16, 96, out.tileSize, warnings, lineNo, warnCount);
        } else if (key == "hud_height") {
            readClampedInt(key, val, 0, 240, out.hudHeight, warnings, lineNo, warnCount);
        } else if (key == "start_fullscreen") {
            readBool(key, val, out.startFullscreen, warnings, lineNo, warnCount);
        } else if (key == "vsync") {
            readBool(key, val, out.vsync, warnings, lineNo, warnCount);
        } else if (key == "levels_file") {
            if (val.empty()) {
                appendWarning(warnings, lineNo, "levels_file is empty", warnCount);
            } else {
                out.levelsFile = val;
            }
        } else {
            appendWarning(warnings, lineNo, "Unknown key: " + key, warnCount);
        }
    }

    if (outWarnings) *outWarnings = warnings;
}

Settings loadSettings(const std::string& path, std::string* outWarnings) {
    Settings s;
    if (outWarnings) outWarnings->clear();

    std::ifstream f(path, std::ios::binary);
    if (!f) return s;

    std::ostringstream oss;
    oss << f.rdbuf();
    parseSettings(oss.str(), s, outWarnings);
    return s;
}

std::string formatSettings(const Settings& s) {
    std::ostringstream out;
    out << "# PipeQuest settings (key = value; # or ; start a comment)\n"
        << "# Edit and restart the game to apply.\n"
        << "\n"
        << "# Board cell size in pixels (16..96)\n"
        << "tile_size = " << s.tileSize << "\n"
        << "# Height of the coin/boss strip under the board (0..240, 0 hides it)\n"
        << "hud_height = " << s.hudHeight << "\n"
        << "start_fullscreen = " << (s.startFullscreen ? "true" : "false") << "\n"
        << "vsync = " << (s.vsync ? "true" : "false") << "\n"
        << "\n"
        << "# Campaign file, relative to this file or the working directory\n"
        << "levels_file = " << s.levelsFile << "\n";
    return out.str();
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path, std::ios::binary);
    if (!f) return false;
    f << formatSettings(Settings{});
    return static_cast<bool>(f);
}

std::string resolveLevelsPath(const Settings& s, const std::string& settingsPath) {
    namespace fs = std::filesystem;
    const fs::path levels(s.levelsFile);
    if (levels.is_absolute()) return s.levelsFile;

    const fs::path beside = fs::path(settingsPath).parent_path() / levels;
    std::error_code ec;
    if (fs::is_regular_file(beside, ec)) return beside.string();
    return s.levelsFile;
}

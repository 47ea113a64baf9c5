#include "level_file.hpp"
#include "ini_text.hpp"

#include <fstream>
#include <map>
#include <sstream>

namespace {

bool parseCoord(const std::vector<std::string>& toks, size_t at, Vec2i& out) {
    if (toks.size() < at + 2) return false;
    Vec2i p;
    if (!parseInt(toks[at], p.x) || !parseInt(toks[at + 1], p.y)) return false;
    if (!Board::inBounds(p)) return false;
    out = p;
    return true;
}

// Partially parsed level; entrance/exit become mandatory at the end.
struct PendingLevel {
    LevelDef def;
    bool hasEntrance = false;
    bool hasExit = false;
};

} // namespace

bool parseOrientation(const std::string& raw, Orientation& out) {
    const std::string v = toLower(trim(raw));
    if (v == "left" || v == "l") { out = Orientation::Left; return true; }
    if (v == "right" || v == "r") { out = Orientation::Right; return true; }
    if (v == "up" || v == "u") { out = Orientation::Up; return true; }
    if (v == "down" || v == "d") { out = Orientation::Down; return true; }
    return false;
}

bool parsePipeColor(const std::string& raw, PipeColor& out) {
    const std::string v = toLower(trim(raw));
    if (v == "green") { out = PipeColor::Green; return true; }
    if (v == "red") { out = PipeColor::Red; return true; }
    if (v == "gold" || v == "yellow") { out = PipeColor::Gold; return true; }
    if (v == "blue") { out = PipeColor::Blue; return true; }
    if (v == "black") { out = PipeColor::Black; return true; }
    return false;
}

bool parseLevelFile(const std::string& text, LevelFile& out, std::string* outWarnings) {
    out = LevelFile{};

    std::map<int, PendingLevel> pending;
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
        const std::vector<std::string> keyToks = split(key, '.');
        const std::vector<std::string> toks = split(val, ',');

        if (key == "item_seed") {
            int v = 0;
            if (!parseInt(val, v)) {
                appendWarning(warnings, lineNo, "Invalid int for item_seed", warnCount);
                continue;
            }
            out.itemSeed = static_cast<uint32_t>(v);
            continue;
        }

        if (key == "boss.start") {
            Vec2i p;
            if (!parseCoord(toks, 0, p)) {
                appendWarning(warnings, lineNo, "boss.start should be x, y on the board", warnCount);
                continue;
            }
            out.boss.start = p;
            continue;
        }

        if (key == "boss.health") {
            int v = 0;
            if (!parseInt(val, v) || v < 0) {
                appendWarning(warnings, lineNo, "boss.health should be a non-negative int", warnCount);
                continue;
            }
            out.boss.health = v;
            continue;
        }

        if (keyToks.size() != 3 || keyToks[0] != "level") {
            appendWarning(warnings, lineNo, "Unknown key: " + key, warnCount);
            continue;
        }

        int id = 0;
        if (!parseInt(keyToks[1], id) || id < 0) {
            appendWarning(warnings, lineNo, "Invalid level id: " + keyToks[1], warnCount);
            continue;
        }

        PendingLevel& lv = pending[id];
        lv.def.id = id;
        const std::string& field = keyToks[2];

        if (field == "entrance" || field == "exit") {
            Vec2i p;
            Orientation o;
            if (toks.size() != 3 || !parseCoord(toks, 0, p) || !parseOrientation(toks[2], o)) {
                appendWarning(warnings, lineNo, field + " should be x, y, orientation", warnCount);
                continue;
            }
            if (field == "entrance") {
                lv.def.entrance = makeTile(EntranceTile{o}, p);
                lv.hasEntrance = true;
            } else {
                lv.def.exit = makeTile(ExitTile{o}, p);
                lv.hasExit = true;
            }
        } else if (field == "room") {
            Vec2i a;
            Vec2i b;
            if (toks.size() != 4 || !parseCoord(toks, 0, a) || !parseCoord(toks, 2, b) || a.x > b.x || a.y > b.y) {
                appendWarning(warnings, lineNo, "room should be x1, y1, x2, y2 (bottom-left, top-right)", warnCount);
                continue;
            }
            lv.def.rooms.push_back(Room{a, b});
        } else if (field == "pipe") {
            Vec2i p;
            PipeColor c;
            Orientation o;
            if (toks.size() != 4 || !parseCoord(toks, 0, p) || !parsePipeColor(toks[2], c) ||
                !parseOrientation(toks[3], o)) {
                appendWarning(warnings, lineNo, "pipe should be x, y, color, orientation", warnCount);
                continue;
            }
            if (!Board::inBounds(pipeDestination(p, c, o))) {
                appendWarning(warnings, lineNo, "pipe exit falls off the board", warnCount);
                continue;
            }
            lv.def.pipes.push_back(makePipeTile(p, c, o));
        } else if (field == "coin") {
            Vec2i p;
            if (toks.size() != 2 || !parseCoord(toks, 0, p)) {
                appendWarning(warnings, lineNo, "coin should be x, y", warnCount);
                continue;
            }
            lv.def.coins.push_back(p);
        } else if (field == "items") {
            int v = 0;
            if (!parseInt(val, v) || v < 0) {
                appendWarning(warnings, lineNo, "items should be a non-negative int", warnCount);
                continue;
            }
            lv.def.items = v;
        } else {
            appendWarning(warnings, lineNo, "Unknown level field: " + field, warnCount);
        }
    }

    bool ok = !pending.empty();
    if (!ok) warnings += "No levels defined\n";

    for (auto& [id, lv] : pending) {
        if (!lv.hasEntrance || !lv.hasExit) {
            warnings += "Level " + std::to_string(id) + " is missing its " + (lv.hasEntrance ? "exit" : "entrance") + "\n";
            ok = false;
            continue;
        }
        out.levels.push_back(std::move(lv.def));
    }

    if (outWarnings) *outWarnings = warnings;
    return ok;
}

bool loadLevelFile(const std::string& path, LevelFile& out, std::string* outWarnings) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        out = LevelFile{};
        if (outWarnings) *outWarnings = "Could not open level file: " + path;
        return false;
    }

    std::ostringstream oss;
    oss << f.rdbuf();
    return parseLevelFile(oss.str(), out, outWarnings);
}

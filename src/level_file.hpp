#pragma once

#include "levels.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Level campaign file (INI-ish: key = value, # or ; comments).
//
//   level.<id>.entrance = x, y, orientation
//   level.<id>.exit     = x, y, orientation
//   level.<id>.room     = x1, y1, x2, y2          (repeatable)
//   level.<id>.pipe     = x, y, color, orientation (repeatable)
//   level.<id>.coin     = x, y                     (repeatable)
//   level.<id>.items    = n
//   boss.start          = x, y
//   boss.health         = n
//   item_seed           = n
//
// Orientations: left|right|up|down. Colors: green|red|gold|blue|black.

struct BossDef {
    std::optional<Vec2i> start; // default: in front of the final level's exit
    int health = 100;
};

struct LevelFile {
    std::vector<LevelDef> levels; // sorted by id
    BossDef boss;
    uint32_t itemSeed = 0x12345678u;
};

// Parses level file text. Malformed lines are skipped and reported in
// outWarnings. Returns false if no usable campaign came out of it (no
// levels, or a level without an entrance or exit).
bool parseLevelFile(const std::string& text, LevelFile& out, std::string* outWarnings = nullptr);

// Reads and parses a file. Returns false if it can't be read or parsed.
bool loadLevelFile(const std::string& path, LevelFile& out, std::string* outWarnings = nullptr);

// Helper parsers exposed for tooling/tests.
bool parseOrientation(const std::string& raw, Orientation& out);
bool parsePipeColor(const std::string& raw, PipeColor& out);

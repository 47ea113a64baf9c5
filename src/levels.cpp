#include "levels.hpp"

#include <algorithm>
#include <string>

namespace {

void requireDirectional(const Tile& t, bool entrance, int id) {
    const char* what = entrance ? "entrance" : "exit";
    const bool ok = entrance ? t.is<EntranceTile>() : t.is<ExitTile>();
    if (!ok) {
        throw std::invalid_argument("Level " + std::to_string(id) + ": " + what + " tile is a " + tileKindName(t.kind));
    }
    const Vec2i front = stepToward(t.pos, tileOrientation(t));
    if (!Board::inBounds(t.pos) || !Board::inBounds(front)) {
        throw std::invalid_argument("Level " + std::to_string(id) + ": " + what + " at " + coordString(t.pos) +
                                    " faces off the board");
    }
}

Level buildLevel(const LevelDef& def, RNG& rng) {
    requireDirectional(def.entrance, true, def.id);
    requireDirectional(def.exit, false, def.id);

    Level lv;
    lv.id = def.id;
    lv.entrance = def.entrance;
    lv.exit = def.exit;
    lv.board = Board::make(def.entrance, def.exit, def.rooms);

    lv.board.addTiles(def.pipes);

    std::vector<Tile> coins;
    coins.reserve(def.coins.size());
    for (const Vec2i& c : def.coins) coins.push_back(makeTile(CoinTile{}, c));
    lv.board.addTiles(coins);

    for (int i = 0; i < def.items; ++i) {
        if (!lv.board.placeRandomItem(rng)) break;
    }

    // A pipe must drop the player on a cell they can stand on. Entrances and
    // exits only work when walked into, so they are not valid landings either.
    for (const Tile& p : def.pipes) {
        const Vec2i end = pipeEnd(p);
        const Tile& landing = lv.board.tile(end);
        if (landing.is<WallTile>() || landing.is<EntranceTile>() || landing.is<ExitTile>()) {
            throw std::invalid_argument("Level " + std::to_string(def.id) + ": pipe at " + coordString(p.pos) +
                                        " ends in a " + tileKindName(landing.kind) + " at " + coordString(end));
        }
    }

    lv.coinCount = lv.board.countCoins();
    return lv;
}

} // namespace

UnknownLevel::UnknownLevel(int id)
    : std::runtime_error("Unknown level: " + std::to_string(id)), levelId(id) {}

Levels Levels::fromDefinition(const std::vector<LevelDef>& defs) {
    RNG rng;
    return fromDefinition(defs, rng);
}

Levels Levels::fromDefinition(const std::vector<LevelDef>& defs, RNG& rng) {
    if (defs.empty()) {
        throw std::invalid_argument("Level definition has no levels");
    }

    std::vector<const LevelDef*> ordered;
    ordered.reserve(defs.size());
    for (const LevelDef& d : defs) ordered.push_back(&d);
    std::sort(ordered.begin(), ordered.end(), [](const LevelDef* a, const LevelDef* b) { return a->id < b->id; });

    Levels out;
    out.levels.reserve(ordered.size());
    for (size_t i = 0; i < ordered.size(); ++i) {
        if (ordered[i]->id != static_cast<int>(i)) {
            throw std::invalid_argument("Level ids must run 0.." + std::to_string(ordered.size() - 1) +
                                        " without gaps; found " + std::to_string(ordered[i]->id) +
                                        " at position " + std::to_string(i));
        }
        out.levels.push_back(buildLevel(*ordered[i], rng));
    }
    out.levels.back().finalLevel = true;
    return out;
}

const Level& Levels::level(int id) const {
    if (!hasLevel(id)) throw UnknownLevel(id);
    return levels[static_cast<size_t>(id)];
}

int Levels::nextLevel(int id) const {
    const int target = id + 1;
    if (!hasLevel(target)) throw UnknownLevel(target);
    return target;
}

int Levels::prevLevel(int id) const {
    const int target = id - 1;
    if (!hasLevel(target)) throw UnknownLevel(target);
    return target;
}

const Tile& Levels::entrancePipe(int id) const {
    return level(id).entrance;
}

const Tile& Levels::exitPipe(int id) const {
    return level(id).exit;
}

Vec2i Levels::entranceFront(int id) const {
    const Tile& t = level(id).entrance;
    return stepToward(t.pos, tileOrientation(t));
}

Vec2i Levels::exitFront(int id) const {
    const Tile& t = level(id).exit;
    return stepToward(t.pos, tileOrientation(t));
}

int Levels::coinCount(int id) const {
    return level(id).coinCount;
}

bool Levels::isFinalLevel(int id) const {
    return level(id).finalLevel;
}

const Board& Levels::board(int id) const {
    return level(id).board;
}

#pragma once
#include "board.hpp"
#include "rng.hpp"

#include <stdexcept>
#include <vector>

// Raised when level traversal or a lookup names an id outside the campaign.
// id() is the offending id itself (for traversal: the would-be target).
class UnknownLevel : public std::runtime_error {
public:
    explicit UnknownLevel(int id);

    int id() const { return levelId; }

private:
    int levelId = 0;
};

// Raw level description as produced by a level source (see level_file.hpp).
struct LevelDef {
    int id = 0;
    Tile entrance;
    Tile exit;
    std::vector<Room> rooms;
    std::vector<Tile> pipes;
    std::vector<Vec2i> coins;
    int items = 0; // random Item tiles dropped on Empty cells
};

struct Level {
    int id = 0;
    Board board;
    Tile entrance;
    Tile exit;
    int coinCount = 0;
    bool finalLevel = false;
};

class Levels {
public:
    Levels() = default;

    // Builds every board. Throws std::invalid_argument on a malformed
    // definition (no levels, ids not 0..n-1, pipes ending in walls, ...).
    static Levels fromDefinition(const std::vector<LevelDef>& defs, RNG& rng);
    static Levels fromDefinition(const std::vector<LevelDef>& defs);

    int size() const { return static_cast<int>(levels.size()); }
    bool hasLevel(int id) const { return id >= 0 && id < size(); }
    int finalLevel() const { return size() - 1; }

    int nextLevel(int id) const;
    int prevLevel(int id) const;

    const Tile& entrancePipe(int id) const;
    const Tile& exitPipe(int id) const;

    // Cells a player lands on when arriving through the entrance or exit.
    Vec2i entranceFront(int id) const;
    Vec2i exitFront(int id) const;

    int coinCount(int id) const;
    bool isFinalLevel(int id) const;
    const Board& board(int id) const;

private:
    const Level& level(int id) const;

    std::vector<Level> levels;
};

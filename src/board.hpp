#pragma once
#include "common.hpp"
#include "rng.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

enum class Orientation : uint8_t {
    Left = 0,
    Right,
    Up,
    Down,
};

// Selects which exit transform a pipe applies.
enum class PipeColor : uint8_t {
    Green = 0,
    Red,
    Gold,
    Blue,
    Black,
};

struct WallTile {};
struct EmptyTile {};
struct CoinTile {};
struct ItemTile {};

struct PipeTile {
    PipeColor color = PipeColor::Green;
    Orientation orientation = Orientation::Right;
    Vec2i end;
};

struct EntranceTile {
    Orientation orientation = Orientation::Right;
};

struct ExitTile {
    Orientation orientation = Orientation::Right;
};

// Payload-free kinds are all alike.
inline bool operator==(const WallTile&, const WallTile&) { return true; }
inline bool operator==(const EmptyTile&, const EmptyTile&) { return true; }
inline bool operator==(const CoinTile&, const CoinTile&) { return true; }
inline bool operator==(const ItemTile&, const ItemTile&) { return true; }

inline bool operator==(const PipeTile& a, const PipeTile& b) {
    return a.color == b.color && a.orientation == b.orientation && a.end == b.end;
}
inline bool operator==(const EntranceTile& a, const EntranceTile& b) { return a.orientation == b.orientation; }
inline bool operator==(const ExitTile& a, const ExitTile& b) { return a.orientation == b.orientation; }

// std::variant's own comparison operators apply.
using TileKind = std::variant<WallTile, PipeTile, EntranceTile, ExitTile, EmptyTile, CoinTile, ItemTile>;

struct Tile {
    Vec2i pos;
    TileKind kind = WallTile{};

    template <typename T>
    bool is() const { return std::holds_alternative<T>(kind); }
};

inline bool operator==(const Tile& a, const Tile& b) {
    return a.pos == b.pos && a.kind == b.kind;
}
inline bool operator!=(const Tile& a, const Tile& b) { return !(a == b); }

// Axis-aligned rectangle, both corners inclusive.
struct Room {
    Vec2i bottomLeft;
    Vec2i topRight;
};

inline Tile makeTile(TileKind kind, Vec2i pos) {
    return Tile{pos, std::move(kind)};
}

// One cell from `p` in direction `o` (Up is +y). No bounds check.
Vec2i stepToward(const Vec2i& p, Orientation o);

// Cell in front of the exit of a pipe at `start`. Pure arithmetic: the
// result may fall outside the grid for pipes placed too close to an edge.
Vec2i pipeDestination(const Vec2i& start, PipeColor color, Orientation o);

// Throws std::out_of_range if `start` or the computed end is off the grid.
Tile makePipeTile(const Vec2i& start, PipeColor color, Orientation o);

// Payload queries. Asking a tile for data it doesn't carry is a construction
// bug and throws std::logic_error.
Orientation tileOrientation(const Tile& t);
Vec2i pipeEnd(const Tile& t);
PipeColor pipeColor(const Tile& t);

const char* orientationName(Orientation o);
const char* pipeColorName(PipeColor c);
const char* tileKindName(const TileKind& k);
char tileGlyph(const Tile& t);

class Board {
public:
    static constexpr int DIM_X = 16;
    static constexpr int DIM_Y = 16;
    static constexpr int SIZE = DIM_X * DIM_Y;

    // All walls.
    Board();

    // Carves `rooms` out of a solid board, then places entrance and exit.
    static Board make(const Tile& entrance, const Tile& exit, const std::vector<Room>& rooms);

    static bool inBounds(int x, int y) {
        return x >= 0 && y >= 0 && x < DIM_X && y < DIM_Y;
    }
    static bool inBounds(const Vec2i& p) { return inBounds(p.x, p.y); }

    static int indexOf(const Vec2i& p) { return p.x + DIM_X * p.y; }
    static Vec2i coordOf(int index) { return Vec2i{index % DIM_X, index / DIM_X}; }

    int size() const { return SIZE; }

    const Tile& tile(int index) const;
    const Tile& tile(const Vec2i& p) const;

    void setTile(const Tile& t);
    void carveRoom(const Room& room);

    // Only Pipe, Coin and Item tiles may be added this way.
    void addTiles(const std::vector<Tile>& extra);

    // Drops an Item on a random Empty cell. Returns the cell, or nothing
    // when no Empty cell is left.
    std::optional<Vec2i> placeRandomItem(RNG& rng);

    int countCoins() const;

    // Text dump, top row first.
    std::string toString() const;

private:
    std::array<Tile, SIZE> tiles;
};

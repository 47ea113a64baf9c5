#include "board.hpp"

#include <stdexcept>
#include <type_traits>

namespace {

constexpr int D_X = Board::DIM_X;
constexpr int D_Y = Board::DIM_Y;

Vec2i reflectGreen(Orientation o, const Vec2i& s) {
    switch (o) {
        case Orientation::Right: return {D_X - s.x - 2, s.y};
        case Orientation::Left:  return {D_X - s.x, s.y};
        case Orientation::Up:    return {s.x, D_Y - s.y - 2};
        case Orientation::Down:  return {s.x, D_Y - s.y};
    }
    return s;
}

Vec2i reflectRed(Orientation o, const Vec2i& s) {
    switch (o) {
        case Orientation::Right: return {s.x + 1, D_Y - s.y - 1};
        case Orientation::Left:  return {s.x - 1, D_Y - s.y - 1};
        case Orientation::Up:    return {D_X - s.x - 1, s.y + 1};
        case Orientation::Down:  return {D_X - s.x - 1, s.y - 1};
    }
    return s;
}

Vec2i reflectGold(Orientation o, const Vec2i& s) {
    switch (o) {
        case Orientation::Right: return {D_X - s.x - 2, D_Y - s.y - 1};
        case Orientation::Left:  return {D_X - s.x, D_Y - s.y - 1};
        case Orientation::Up:    return {D_X - s.x - 1, D_Y - s.y - 2};
        case Orientation::Down:  return {D_X - s.x - 1, D_Y - s.y};
    }
    return s;
}

// Blue pipes swap the axes, so the x size feeds the new y.
Vec2i rotateBlue(Orientation o, const Vec2i& s) {
    switch (o) {
        case Orientation::Right: return {s.y, D_X - s.x - 2};
        case Orientation::Left:  return {s.y, D_X - s.x};
        case Orientation::Up:    return {s.y + 1, D_X - s.x - 1};
        case Orientation::Down:  return {s.y - 1, D_X - s.x - 1};
    }
    return s;
}

void requireInBounds(const Vec2i& p, const char* what) {
    if (!Board::inBounds(p)) {
        throw std::out_of_range(std::string(what) + " out of bounds: " + coordString(p));
    }
}

} // namespace

Vec2i stepToward(const Vec2i& p, Orientation o) {
    switch (o) {
        case Orientation::Right: return {p.x + 1, p.y};
        case Orientation::Left:  return {p.x - 1, p.y};
        case Orientation::Up:    return {p.x, p.y + 1};
        case Orientation::Down:  return {p.x, p.y - 1};
    }
    return p;
}

Vec2i pipeDestination(const Vec2i& start, PipeColor color, Orientation o) {
    switch (color) {
        case PipeColor::Green: return reflectGreen(o, start);
        case PipeColor::Red:   return reflectRed(o, start);
        case PipeColor::Gold:  return reflectGold(o, start);
        case PipeColor::Blue:  return rotateBlue(o, start);
        case PipeColor::Black: return stepToward(start, o);
    }
    return start;
}

Tile makePipeTile(const Vec2i& start, PipeColor color, Orientation o) {
    requireInBounds(start, "Pipe start");
    PipeTile pipe;
    pipe.color = color;
    pipe.orientation = o;
    pipe.end = pipeDestination(start, color, o);
    requireInBounds(pipe.end, "Pipe end");
    return makeTile(pipe, start);
}

Orientation tileOrientation(const Tile& t) {
    if (const auto* p = std::get_if<PipeTile>(&t.kind)) return p->orientation;
    if (const auto* e = std::get_if<EntranceTile>(&t.kind)) return e->orientation;
    if (const auto* x = std::get_if<ExitTile>(&t.kind)) return x->orientation;
    throw std::logic_error(std::string("Tile has no orientation: ") + tileKindName(t.kind) + " @ " + coordString(t.pos));
}

Vec2i pipeEnd(const Tile& t) {
    if (const auto* p = std::get_if<PipeTile>(&t.kind)) return p->end;
    throw std::logic_error("Not a pipe: " + coordString(t.pos));
}

PipeColor pipeColor(const Tile& t) {
    if (const auto* p = std::get_if<PipeTile>(&t.kind)) return p->color;
    throw std::logic_error("Not a pipe: " + coordString(t.pos));
}

const char* orientationName(Orientation o) {
    switch (o) {
        case Orientation::Left:  return "left";
        case Orientation::Right: return "right";
        case Orientation::Up:    return "up";
        case Orientation::Down:  return "down";
    }
    return "?";
}

const char* pipeColorName(PipeColor c) {
    switch (c) {
        case PipeColor::Green: return "green";
        case PipeColor::Red:   return "red";
        case PipeColor::Gold:  return "gold";
        case PipeColor::Blue:  return "blue";
        case PipeColor::Black: return "black";
    }
    return "?";
}

const char* tileKindName(const TileKind& k) {
    return std::visit([](const auto& v) -> const char* {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, WallTile>) return "Wall";
        else if constexpr (std::is_same_v<T, PipeTile>) return "Pipe";
        else if constexpr (std::is_same_v<T, EntranceTile>) return "Entrance";
        else if constexpr (std::is_same_v<T, ExitTile>) return "Exit";
        else if constexpr (std::is_same_v<T, EmptyTile>) return "Empty";
        else if constexpr (std::is_same_v<T, CoinTile>) return "Coin";
        else return "Item";
    }, k);
}

char tileGlyph(const Tile& t) {
    if (const auto* p = std::get_if<PipeTile>(&t.kind)) {
        switch (p->orientation) {
            case Orientation::Right: return '>';
            case Orientation::Left:  return '<';
            case Orientation::Up:    return '^';
            case Orientation::Down:  return 'v';
        }
    }
    if (t.is<WallTile>()) return 'W';
    if (t.is<EntranceTile>()) return 'I';
    if (t.is<ExitTile>()) return 'O';
    if (t.is<CoinTile>()) return 'c';
    if (t.is<ItemTile>()) return '*';
    return ' ';
}

Board::Board() {
    for (int i = 0; i < SIZE; ++i) {
        tiles[static_cast<size_t>(i)] = makeTile(WallTile{}, coordOf(i));
    }
}

Board Board::make(const Tile& entrance, const Tile& exit, const std::vector<Room>& rooms) {
    Board b;
    for (const Room& r : rooms) b.carveRoom(r);
    b.setTile(entrance);
    b.setTile(exit);
    return b;
}

const Tile& Board::tile(int index) const {
    if (index < 0 || index >= SIZE) {
        throw std::out_of_range("Tile index out of range: " + std::to_string(index));
    }
    return tiles[static_cast<size_t>(index)];
}

const Tile& Board::tile(const Vec2i& p) const {
    requireInBounds(p, "Tile");
    return tiles[static_cast<size_t>(indexOf(p))];
}

void Board::setTile(const Tile& t) {
    requireInBounds(t.pos, "Tile");
    tiles[static_cast<size_t>(indexOf(t.pos))] = t;
}

void Board::carveRoom(const Room& room) {
    requireInBounds(room.bottomLeft, "Room corner");
    requireInBounds(room.topRight, "Room corner");
    for (int x = room.bottomLeft.x; x <= room.topRight.x; ++x) {
        for (int y = room.bottomLeft.y; y <= room.topRight.y; ++y) {
            setTile(makeTile(EmptyTile{}, Vec2i{x, y}));
        }
    }
}

void Board::addTiles(const std::vector<Tile>& extra) {
    for (const Tile& t : extra) {
        if (!t.is<PipeTile>() && !t.is<CoinTile>() && !t.is<ItemTile>()) {
            throw std::invalid_argument(std::string("Cannot add ") + tileKindName(t.kind) + " tile @ " + coordString(t.pos));
        }
        setTile(t);
    }
}

std::optional<Vec2i> Board::placeRandomItem(RNG& rng) {
    std::vector<int> empties;
    for (int i = 0; i < SIZE; ++i) {
        if (tiles[static_cast<size_t>(i)].is<EmptyTile>()) empties.push_back(i);
    }
    if (empties.empty()) return std::nullopt;

    const int pick = empties[static_cast<size_t>(rng.range(0, static_cast<int>(empties.size()) - 1))];
    const Vec2i p = coordOf(pick);
    setTile(makeTile(ItemTile{}, p));
    return p;
}

int Board::countCoins() const {
    int n = 0;
    for (const Tile& t : tiles) {
        if (t.is<CoinTile>()) ++n;
    }
    return n;
}

std::string Board::toString() const {
    std::string out = "\n";
    out.reserve(static_cast<size_t>((DIM_X * 2 + 2) * DIM_Y + 1));
    for (int row = 0; row < DIM_Y; ++row) {
        const int y = DIM_Y - 1 - row;
        for (int x = 0; x < DIM_X; ++x) {
            out.push_back('|');
            out.push_back(tileGlyph(tile(Vec2i{x, y})));
        }
        out += "|\n";
    }
    return out;
}

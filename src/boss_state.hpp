#pragma once
#include "board.hpp"

// Immutable snapshot of the final-level boss. Health never drops below zero;
// what zero health means is up to the caller.
class BossState {
public:
    BossState(const Tile& tile, int health);

    const Tile& tile() const { return current; }
    const Vec2i& pos() const { return current.pos; }
    int health() const { return hp; }

private:
    Tile current;
    int hp = 0;
};

inline bool operator==(const BossState& a, const BossState& b) {
    return a.tile() == b.tile() && a.health() == b.health();
}
inline bool operator!=(const BossState& a, const BossState& b) { return !(a == b); }

BossState makeBossState(int x, int y, const TileKind& kind, int health);

// health' = max(0, health - amount). Throws std::invalid_argument if amount < 0.
BossState decreaseHealth(const BossState& boss, int amount);

// One greedy chase step toward `playerPos`: along the axis with the larger
// gap, x on a tie. A wall in the way cancels the step; the other axis is not
// tried.
BossState moveBoss(const Vec2i& playerPos, const BossState& boss, const Board& board);

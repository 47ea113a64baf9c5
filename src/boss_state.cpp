#include "boss_state.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>

BossState::BossState(const Tile& tile, int health) : current(tile), hp(health) {
    if (!Board::inBounds(tile.pos)) {
        throw std::out_of_range("Boss position out of bounds: " + coordString(tile.pos));
    }
    if (health < 0) {
        throw std::invalid_argument("Boss health must be non-negative, got " + std::to_string(health));
    }
}

BossState makeBossState(int x, int y, const TileKind& kind, int health) {
    return BossState(makeTile(kind, Vec2i{x, y}), health);
}

BossState decreaseHealth(const BossState& boss, int amount) {
    if (amount < 0) {
        throw std::invalid_argument("Damage must be non-negative, got " + std::to_string(amount));
    }
    return BossState(boss.tile(), std::max(0, boss.health() - amount));
}

BossState moveBoss(const Vec2i& playerPos, const BossState& boss, const Board& board) {
    const Vec2i from = boss.pos();
    const int dx = playerPos.x - from.x;
    const int dy = playerPos.y - from.y;
    if (dx == 0 && dy == 0) return boss;

    Vec2i to = from;
    if (std::abs(dx) >= std::abs(dy)) {
        to.x += sign(dx);
    } else {
        to.y += sign(dy);
    }

    if (!Board::inBounds(to)) return boss;
    const Tile& dest = board.tile(to);
    if (dest.is<WallTile>()) return boss;

    return BossState(dest, boss.health());
}

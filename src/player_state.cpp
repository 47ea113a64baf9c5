#include "player_state.hpp"

#include <algorithm>

namespace {

int coinKey(int level, const Vec2i& p) {
    return level * Board::SIZE + Board::indexOf(p);
}

Vec2i moveDelta(Move m) {
    switch (m) {
        case Move::Up:    return {0, 1};
        case Move::Left:  return {-1, 0};
        case Move::Down:  return {0, -1};
        case Move::Right: return {1, 0};
        case Move::None:  break;
    }
    return {0, 0};
}

// What the player sees at `p`: the board tile, except that coins they already
// took read as empty floor.
Tile visibleTile(const PlayerState& s, int level, const Board& board, const Vec2i& p) {
    const Tile& t = board.tile(p);
    if (t.is<CoinTile>() && s.hasCollected(level, p)) return makeTile(EmptyTile{}, p);
    return t;
}

// Stand on `p` of `level`, picking up a coin if one is there.
PlayerState arrive(const PlayerState& s, int level, const Board& board, const Vec2i& p, int steps) {
    const Tile t = visibleTile(s, level, board, p);
    std::vector<int> collected = s.collectedCoins();
    int coins = s.coins();
    if (t.is<CoinTile>()) {
        const int key = coinKey(level, p);
        collected.insert(std::lower_bound(collected.begin(), collected.end(), key), key);
        ++coins;
        return PlayerState(makeTile(EmptyTile{}, p), level, coins, steps, std::move(collected));
    }
    return PlayerState(t, level, coins, steps, std::move(collected));
}

PlayerState stayPut(const PlayerState& s, int steps) {
    return PlayerState(s.tile(), s.level(), s.coins(), steps, s.collectedCoins());
}

} // namespace

Move moveFromKey(char key) {
    switch (key) {
        case 'w': case 'W': return Move::Up;
        case 'a': case 'A': return Move::Left;
        case 's': case 'S': return Move::Down;
        case 'd': case 'D': return Move::Right;
        default: return Move::None;
    }
}

const char* moveName(Move m) {
    switch (m) {
        case Move::Up:    return "up";
        case Move::Left:  return "left";
        case Move::Down:  return "down";
        case Move::Right: return "right";
        case Move::None:  break;
    }
    return "none";
}

PlayerState::PlayerState(const Tile& tile, int level, int coins, int steps, std::vector<int> collected_)
    : current(tile), levelId(level), coinCount(coins), stepCount(steps), collected(std::move(collected_)) {
    if (!Board::inBounds(tile.pos)) {
        throw std::out_of_range("Player position out of bounds: " + coordString(tile.pos));
    }
    if (coins < 0 || steps < 0) {
        throw std::invalid_argument("Player coin and step counts must be non-negative");
    }
    std::sort(collected.begin(), collected.end());
}

bool PlayerState::hasCollected(int level, const Vec2i& p) const {
    return std::binary_search(collected.begin(), collected.end(), coinKey(level, p));
}

bool operator==(const PlayerState& a, const PlayerState& b) {
    return a.current == b.current && a.levelId == b.levelId && a.coinCount == b.coinCount &&
           a.stepCount == b.stepCount && a.collected == b.collected;
}

PlayerState makePlayerState(int x, int y, const TileKind& kind, int level, int coins, int steps) {
    return PlayerState(makeTile(kind, Vec2i{x, y}), level, coins, steps);
}

PlayerState initState(const Levels& levels, const Board& board) {
    const Vec2i start = levels.entranceFront(0);
    return PlayerState(board.tile(start), 0, 0, 0);
}

PlayerState finalState(const Levels& levels, const Board& board, int steps) {
    const int id = levels.finalLevel();
    const Vec2i start = levels.entranceFront(id);
    return PlayerState(board.tile(start), id, 0, steps);
}

PlayerState update(Move move, const PlayerState& state, const Levels& levels, const Board& board) {
    const int steps = state.steps() + 1;
    if (move == Move::None) return stayPut(state, steps);

    const Vec2i delta = moveDelta(move);
    const Vec2i dest{state.pos().x + delta.x, state.pos().y + delta.y};
    if (!Board::inBounds(dest)) return stayPut(state, steps);

    const int level = state.level();
    const Tile target = visibleTile(state, level, board, dest);

    if (target.is<WallTile>()) return stayPut(state, steps);

    if (const auto* pipe = std::get_if<PipeTile>(&target.kind)) {
        return arrive(state, level, board, pipe->end, steps);
    }

    if (target.is<ExitTile>()) {
        // The last exit leads nowhere.
        if (levels.isFinalLevel(level)) return stayPut(state, steps);
        const int next = levels.nextLevel(level);
        return arrive(state, next, levels.board(next), levels.entranceFront(next), steps);
    }

    if (target.is<EntranceTile>()) {
        if (level == 0) return stayPut(state, steps);
        const int prev = levels.prevLevel(level);
        return arrive(state, prev, levels.board(prev), levels.exitFront(prev), steps);
    }

    return arrive(state, level, board, dest, steps);
}

std::pair<PlayerState, BossState> finalLevelUpdate(Move move, const PlayerState& state, const Levels& levels,
                                                   const Board& board, const BossState& boss) {
    PlayerState next = update(move, state, levels, board);
    // The boss stays behind when the player leaves its level.
    if (next.level() != state.level()) return {std::move(next), boss};
    BossState nextBoss = moveBoss(next.pos(), boss, board);
    return {std::move(next), std::move(nextBoss)};
}

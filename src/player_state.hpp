#pragma once
#include "board.hpp"
#include "boss_state.hpp"
#include "levels.hpp"

#include <cstdint>
#include <utility>
#include <vector>

enum class Move : uint8_t {
    None = 0,
    Up,
    Left,
    Down,
    Right,
};

// w/a/s/d in either case; anything else is Move::None.
Move moveFromKey(char key);
const char* moveName(Move m);

// Immutable snapshot of the player. Transitions return a new value.
class PlayerState {
public:
    PlayerState(const Tile& tile, int level, int coins, int steps, std::vector<int> collected = {});

    int level() const { return levelId; }
    const Tile& tile() const { return current; }
    const Vec2i& pos() const { return current.pos; }
    int coins() const { return coinCount; }
    int steps() const { return stepCount; }

    // True if this player already picked up the coin at `p` on `level`.
    bool hasCollected(int level, const Vec2i& p) const;
    const std::vector<int>& collectedCoins() const { return collected; }

private:
    friend bool operator==(const PlayerState& a, const PlayerState& b);

    Tile current;
    int levelId = 0;
    int coinCount = 0;
    int stepCount = 0;

    // Sorted keys (level * Board::SIZE + cell index) of picked-up coins.
    // Boards stay read-only during play, so consumption lives here.
    std::vector<int> collected;
};

bool operator==(const PlayerState& a, const PlayerState& b);
inline bool operator!=(const PlayerState& a, const PlayerState& b) { return !(a == b); }

PlayerState makePlayerState(int x, int y, const TileKind& kind, int level, int coins, int steps);

// Level 0, in front of its entrance, no coins, no steps.
PlayerState initState(const Levels& levels, const Board& board);

// Final level, in front of its entrance, with `steps` already taken.
PlayerState finalState(const Levels& levels, const Board& board, int steps);

// One input event. `board` is the board of state.level(). Every call costs a
// step, including rejected moves. Crossing an entrance or exit switches to the
// neighbouring level; UnknownLevel from that traversal propagates.
PlayerState update(Move move, const PlayerState& state, const Levels& levels, const Board& board);

// update() followed by one boss chase step toward the player's new cell. If
// the move takes the player off the boss's level the boss is returned as is.
std::pair<PlayerState, BossState> finalLevelUpdate(Move move, const PlayerState& state, const Levels& levels,
                                                   const Board& board, const BossState& boss);

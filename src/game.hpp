#pragma once

#include "boss_state.hpp"
#include "level_file.hpp"
#include "levels.hpp"
#include "player_state.hpp"

#include <cstdint>
#include <optional>
#include <string>

enum class GameStatus : uint8_t {
    Playing = 0,
    Caught,       // boss stands on the player's cell
    BossDefeated, // boss health reached zero
};

const char* gameStatusName(GameStatus s);

class Game;

// One-line progress readout, e.g.
// "level 2  coins 5 total, 1/6 here  steps 40  boss 80  [caught]".
std::string statusLine(const Game& game);

// One play session: the campaign plus the current snapshots. The boss only
// exists while the player is on the final level; it spawns the first time the
// player arrives there and keeps its state if the player steps back out.
class Game {
public:
    Game(Levels levels, BossDef boss);

    // Builds the campaign from a parsed level file.
    static Game fromLevelFile(const LevelFile& file);

    const Levels& levels() const { return campaign; }
    const Board& board() const { return campaign.board(player_.level()); }
    const PlayerState& player() const { return player_; }
    const std::optional<BossState>& boss() const { return boss_; }
    bool bossActive() const { return boss_.has_value() && campaign.isFinalLevel(player_.level()); }

    // Applies one input event. Returns true if the player changed level.
    bool handleMove(Move move);

    // Front ends call this when the player lands a hit.
    void damageBoss(int amount);

    GameStatus status() const;

private:
    void spawnBossIfNeeded();

    Levels campaign;
    BossDef bossDef;
    PlayerState player_;
    std::optional<BossState> boss_;
};

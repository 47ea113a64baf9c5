#include "game.hpp"

#include <sstream>
#include <utility>

const char* gameStatusName(GameStatus s) {
    switch (s) {
        case GameStatus::Playing:      return "playing";
        case GameStatus::Caught:       return "caught";
        case GameStatus::BossDefeated: return "boss defeated";
    }
    return "?";
}

Game::Game(Levels levels, BossDef boss)
    : campaign(std::move(levels)), bossDef(std::move(boss)), player_(initState(campaign, campaign.board(0))) {
    spawnBossIfNeeded();
}

Game Game::fromLevelFile(const LevelFile& file) {
    RNG rng(file.itemSeed);
    return Game(Levels::fromDefinition(file.levels, rng), file.boss);
}

bool Game::handleMove(Move move) {
    const int before = player_.level();
    const Board& b = campaign.board(before);

    if (bossActive()) {
        auto [p, bs] = finalLevelUpdate(move, player_, campaign, b, *boss_);
        player_ = std::move(p);
        boss_ = std::move(bs);
    } else {
        player_ = update(move, player_, campaign, b);
    }

    spawnBossIfNeeded();
    return player_.level() != before;
}

void Game::damageBoss(int amount) {
    if (!boss_) return;
    boss_ = decreaseHealth(*boss_, amount);
}

GameStatus Game::status() const {
    if (!boss_) return GameStatus::Playing;
    if (boss_->health() == 0) return GameStatus::BossDefeated;
    if (bossActive() && boss_->pos() == player_.pos()) return GameStatus::Caught;
    return GameStatus::Playing;
}

void Game::spawnBossIfNeeded() {
    if (boss_ || !campaign.isFinalLevel(player_.level())) return;

    const int id = campaign.finalLevel();
    const Vec2i start = bossDef.start ? *bossDef.start : campaign.exitFront(id);
    boss_ = BossState(campaign.board(id).tile(start), bossDef.health);
}

std::string statusLine(const Game& game) {
    const PlayerState& p = game.player();
    const int level = p.level();
    const Board& board = game.board();

    int taken = 0;
    for (int i = 0; i < board.size(); ++i) {
        const Tile& t = board.tile(i);
        if (t.is<CoinTile>() && p.hasCollected(level, t.pos)) ++taken;
    }

    std::ostringstream ss;
    ss << "level " << level << "  coins " << p.coins() << " total, " << taken << "/"
       << game.levels().coinCount(level) << " here  steps " << p.steps();
    if (game.bossActive()) ss << "  boss " << game.boss()->health();
    if (game.status() != GameStatus::Playing) ss << "  [" << gameStatusName(game.status()) << "]";
    return ss.str();
}

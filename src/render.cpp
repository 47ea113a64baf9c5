#include "render.hpp"
#include "version.hpp"

#include <algorithm>
#include <iostream>

namespace {

Color pipeFill(PipeColor c) {
    switch (c) {
        case PipeColor::Green: return {40, 170, 60, 255};
        case PipeColor::Red:   return {200, 50, 45, 255};
        case PipeColor::Gold:  return {230, 185, 40, 255};
        case PipeColor::Blue:  return {50, 100, 220, 255};
        case PipeColor::Black: return {20, 20, 24, 255};
    }
    return {255, 0, 255, 255};
}

const Color WALL{70, 62, 58, 255};
const Color FLOOR{200, 196, 180, 255};
const Color ENTRANCE{120, 200, 230, 255};
const Color EXIT{150, 90, 200, 255};
const Color COIN{250, 210, 30, 255};
const Color ITEM{240, 120, 200, 255};
const Color PLAYER{30, 90, 240, 255};
const Color BOSS{180, 20, 20, 255};
const Color HUD_BG{16, 16, 20, 255};

} // namespace

Renderer::Renderer(int tileSize, int hudHeight, bool vsync)
    : tile(tileSize), hudH(hudHeight), vsyncEnabled(vsync) {}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init() {
    if (initialized) return true;

    const std::string title = std::string(PIPEQUEST_APPNAME) + " v" + PIPEQUEST_VERSION;
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              windowWidth(), windowHeight(),
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    Uint32 rFlags = SDL_RENDERER_ACCELERATED;
    if (vsyncEnabled) rFlags |= SDL_RENDERER_PRESENTVSYNC;
    renderer = SDL_CreateRenderer(window, -1, rFlags);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window); window = nullptr;
        return false;
    }

    // Fixed virtual resolution; SDL scales to whatever size the window gets.
    SDL_RenderSetLogicalSize(renderer, windowWidth(), windowHeight());

    initialized = true;
    return true;
}

void Renderer::shutdown() {
    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }
    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }
    initialized = false;
}

void Renderer::toggleFullscreen() {
    if (!window) return;
    fullscreen = !fullscreen;
    SDL_SetWindowFullscreen(window, fullscreen ? SDL_WINDOW_FULLSCREEN_DESKTOP : 0);
}

void Renderer::fillCell(const Vec2i& p, const Color& c, int inset) {
    SDL_Rect r;
    r.x = p.x * tile + inset;
    r.y = (Board::DIM_Y - 1 - p.y) * tile + inset;
    r.w = std::max(1, tile - inset * 2);
    r.h = std::max(1, tile - inset * 2);
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
    SDL_RenderFillRect(renderer, &r);
}

void Renderer::drawTile(const Tile& t) {
    if (t.is<WallTile>()) {
        fillCell(t.pos, WALL);
        return;
    }

    fillCell(t.pos, FLOOR);

    if (const auto* pipe = std::get_if<PipeTile>(&t.kind)) {
        fillCell(t.pos, pipeFill(pipe->color), tile / 8);
        // Mark the mouth: a notch on the side the pipe faces.
        const int notch = std::max(2, tile / 5);
        SDL_Rect r{0, 0, 0, 0};
        const int px = t.pos.x * tile;
        const int py = (Board::DIM_Y - 1 - t.pos.y) * tile;
        switch (pipe->orientation) {
            case Orientation::Right: r = {px + tile - notch, py + tile / 3, notch, tile / 3}; break;
            case Orientation::Left:  r = {px, py + tile / 3, notch, tile / 3}; break;
            case Orientation::Up:    r = {px + tile / 3, py, tile / 3, notch}; break;
            case Orientation::Down:  r = {px + tile / 3, py + tile - notch, tile / 3, notch}; break;
        }
        SDL_SetRenderDrawColor(renderer, FLOOR.r, FLOOR.g, FLOOR.b, 255);
        SDL_RenderFillRect(renderer, &r);
    } else if (t.is<EntranceTile>()) {
        fillCell(t.pos, ENTRANCE, tile / 10);
    } else if (t.is<ExitTile>()) {
        fillCell(t.pos, EXIT, tile / 10);
    } else if (t.is<CoinTile>()) {
        fillCell(t.pos, COIN, tile / 3);
    } else if (t.is<ItemTile>()) {
        fillCell(t.pos, ITEM, tile / 4);
    }
}

void Renderer::drawHud(const Game& game) {
    if (hudH <= 0) return;

    SDL_Rect bg{0, Board::DIM_Y * tile, windowWidth(), hudH};
    SDL_SetRenderDrawColor(renderer, HUD_BG.r, HUD_BG.g, HUD_BG.b, HUD_BG.a);
    SDL_RenderFillRect(renderer, &bg);

    // Coin pips, then a boss health bar.
    const PlayerState& p = game.player();
    const int pip = std::max(4, tile / 3);
    for (int i = 0; i < std::min(p.coins(), 32); ++i) {
        SDL_Rect r{8 + i * (pip + 4), Board::DIM_Y * tile + 8, pip, pip};
        SDL_SetRenderDrawColor(renderer, COIN.r, COIN.g, COIN.b, COIN.a);
        SDL_RenderFillRect(renderer, &r);
    }

    if (game.bossActive()) {
        const int maxW = windowWidth() - 16;
        const int w = std::clamp(game.boss()->health(), 0, 100) * maxW / 100;
        SDL_Rect r{8, Board::DIM_Y * tile + 16 + pip, w, std::max(4, hudH / 6)};
        SDL_SetRenderDrawColor(renderer, BOSS.r, BOSS.g, BOSS.b, BOSS.a);
        SDL_RenderFillRect(renderer, &r);
    }
}

void Renderer::updateTitle(const Game& game) {
    const std::string title = std::string(PIPEQUEST_APPNAME) + " - " + statusLine(game);
    if (title != lastTitle) {
        SDL_SetWindowTitle(window, title.c_str());
        lastTitle = title;
    }
}

void Renderer::render(const Game& game) {
    if (!initialized) return;

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);

    const Board& b = game.board();
    const PlayerState& p = game.player();
    for (int i = 0; i < b.size(); ++i) {
        const Tile& t = b.tile(i);
        // Coins the player already took are drawn as floor.
        if (t.is<CoinTile>() && p.hasCollected(p.level(), t.pos)) {
            drawTile(makeTile(EmptyTile{}, t.pos));
        } else {
            drawTile(t);
        }
    }

    if (game.bossActive()) fillCell(game.boss()->pos(), BOSS, tile / 8);
    fillCell(p.pos(), PLAYER, tile / 5);

    drawHud(game);
    updateTitle(game);

    SDL_RenderPresent(renderer);
}

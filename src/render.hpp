#pragma once
#include "sdl.hpp"

#include "game.hpp"

#include <string>

// Draws a Game as flat colored cells. Board y grows upward, so rows are
// flipped on the way to window coordinates.
class Renderer {
public:
    Renderer(int tileSize, int hudHeight, bool vsync);
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    bool init();
    void shutdown();

    void render(const Game& game);

    void toggleFullscreen();

    int windowWidth() const { return Board::DIM_X * tile; }
    int windowHeight() const { return Board::DIM_Y * tile + hudH; }

private:
    void fillCell(const Vec2i& p, const Color& c, int inset = 0);
    void drawTile(const Tile& t);
    void drawHud(const Game& game);
    void updateTitle(const Game& game);

    int tile = 40;
    int hudH = 0;
    bool vsyncEnabled = false;
    bool initialized = false;
    bool fullscreen = false;

    std::string lastTitle;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
};

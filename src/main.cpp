#include "sdl.hpp"

#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include "game.hpp"
#include "level_file.hpp"
#include "render.hpp"
#include "settings.hpp"
#include "version.hpp"

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static void printUsage(const char* exe) {
    std::cout
        << PIPEQUEST_APPNAME << " " << PIPEQUEST_VERSION << "\n"
        << "Usage: " << (exe ? exe : "pipequest") << " [options]\n\n"
        << "Options:\n"
        << "  --levels <file>      Campaign file (overrides levels_file in settings)\n"
        << "  --data-dir <path>    Override the settings directory\n"
        << "  --reset-settings     Overwrite settings with fresh defaults\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n"
        << "\n"
        << "Keys: WASD / arrows move, F11 toggles fullscreen, Esc quits.\n";
}

static Move moveFromKeycode(SDL_Keycode key) {
    switch (key) {
        case SDLK_UP:    return Move::Up;
        case SDLK_LEFT:  return Move::Left;
        case SDLK_DOWN:  return Move::Down;
        case SDLK_RIGHT: return Move::Right;
        default: break;
    }
    if (key >= 0 && key < 128) return moveFromKey(static_cast<char>(key));
    return Move::None;
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "pipequest");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << PIPEQUEST_APPNAME << " " << PIPEQUEST_VERSION << "\n";
        return 0;
    }

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    std::filesystem::path baseDir;
    if (const auto dataDirArg = parseStringArg(argc, argv, "--data-dir"); dataDirArg && !dataDirArg->empty()) {
        baseDir = std::filesystem::path(*dataDirArg);
    } else if (char* p = SDL_GetPrefPath("pipequest", PIPEQUEST_APPNAME)) {
        baseDir = std::filesystem::path(p);
        SDL_free(p);
    } else {
        baseDir = std::filesystem::current_path();
    }

    {
        std::error_code ec;
        std::filesystem::create_directories(baseDir, ec);
    }

    const std::filesystem::path settingsPathFs = baseDir / "pipequest_settings.ini";
    const std::string settingsPath = settingsPathFs.string();
    if (hasFlag(argc, argv, "--reset-settings") || !std::filesystem::exists(settingsPathFs)) {
        if (!writeDefaultSettings(settingsPath)) {
            std::cerr << "Could not write settings: " << settingsPath << "\n";
        }
    }
    std::string settingsWarns;
    const Settings settings = loadSettings(settingsPath, &settingsWarns);
    if (!settingsWarns.empty()) std::cerr << "Settings " << settingsPath << ":\n" << settingsWarns;

    const std::string levelsPath =
        parseStringArg(argc, argv, "--levels").value_or(resolveLevelsPath(settings, settingsPath));
    LevelFile levelFile;
    std::string warns;
    if (!loadLevelFile(levelsPath, levelFile, &warns)) {
        std::cerr << "Failed to load levels: " << levelsPath << "\n";
        if (!warns.empty()) std::cerr << warns;
        SDL_Quit();
        return 1;
    }
    if (!warns.empty()) std::cout << warns;

    std::optional<Game> game;
    try {
        game.emplace(Game::fromLevelFile(levelFile));
    } catch (const std::exception& e) {
        std::cerr << "Invalid campaign " << levelsPath << ": " << e.what() << "\n";
        SDL_Quit();
        return 1;
    }
    std::cout << "Loaded " << game->levels().size() << " levels from " << levelsPath << "\n";

    Renderer renderer(settings.tileSize, settings.hudHeight, settings.vsync);
    if (!renderer.init()) {
        SDL_Quit();
        return 1;
    }
    if (settings.startFullscreen) renderer.toggleFullscreen();

    int exitCode = 0;
    bool running = true;
    try {
        while (running) {
            SDL_Event ev;
            while (SDL_PollEvent(&ev)) {
                if (ev.type == SDL_QUIT) {
                    running = false;
                } else if (ev.type == SDL_KEYDOWN && ev.key.repeat == 0) {
                    const SDL_Keycode key = ev.key.keysym.sym;
                    if (key == SDLK_ESCAPE) {
                        running = false;
                    } else if (key == SDLK_F11) {
                        renderer.toggleFullscreen();
                    } else if (game->status() == GameStatus::Playing) {
                        if (game->handleMove(moveFromKeycode(key))) {
                            std::cout << "Entered level " << game->player().level() << "\n";
                        }
                        if (game->status() != GameStatus::Playing) {
                            std::cout << "Game over: " << gameStatusName(game->status())
                                      << " after " << game->player().steps() << " steps, "
                                      << game->player().coins() << " coins\n";
                        }
                    }
                }
            }

            renderer.render(*game);
            if (!settings.vsync) SDL_Delay(16);
        }
    } catch (const UnknownLevel& e) {
        std::cerr << "Broken level link (level " << e.id() << "): " << e.what() << "\n";
        exitCode = 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        exitCode = 1;
    }

    renderer.shutdown();
    SDL_Quit();
    return exitCode;
}

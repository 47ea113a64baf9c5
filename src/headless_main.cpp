#include "game.hpp"
#include "level_file.hpp"
#include "version.hpp"

#include <exception>
#include <iostream>
#include <set>
#include <string>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " --levels <file.ini> --moves <wasd...> [options]\n\n"
        << "Options:\n"
        << "  --levels <path>   Campaign file to load.\n"
        << "  --moves <keys>    Move script: w/a/s/d, anything else is a no-op step.\n"
        << "  --dump            Print each level's board the first time it is visited.\n"
        << "  --quiet           Only print the final summary.\n"
        << "  --version         Print version.\n"
        << "  --help            Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static void printTrace(int step, char key, const Game& game) {
    const PlayerState& p = game.player();
    std::cout << "step " << step << " [" << key << "]: level " << p.level() << " " << coordString(p.pos())
              << " " << tileKindName(p.tile().kind) << " coins " << p.coins();
    if (game.bossActive()) {
        std::cout << " | boss " << coordString(game.boss()->pos()) << " hp " << game.boss()->health();
    }
    std::cout << "\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string levelsPath;
    std::string moves;
    bool dump = false;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << PIPEQUEST_APPNAME << " " << PIPEQUEST_VERSION << "\n";
            return 0;
        } else if (a == "--levels") {
            if (!argValue(i, argc, argv, levelsPath)) {
                std::cerr << "--levels requires a path\n";
                return 2;
            }
        } else if (a == "--moves") {
            if (!argValue(i, argc, argv, moves)) {
                std::cerr << "--moves requires a value\n";
                return 2;
            }
        } else if (a == "--dump") {
            dump = true;
        } else if (a == "--quiet") {
            quiet = true;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (levelsPath.empty()) {
        std::cerr << "Missing --levels <file>\n";
        return 2;
    }

    LevelFile file;
    std::string warns;
    if (!loadLevelFile(levelsPath, file, &warns)) {
        std::cerr << "Failed to load levels: " << levelsPath << "\n";
        if (!warns.empty()) std::cerr << warns;
        return 1;
    }
    if (!warns.empty()) std::cerr << warns;

    try {
        Game game = Game::fromLevelFile(file);

        std::set<int> dumped;
        auto maybeDump = [&]() {
            const int id = game.player().level();
            if (dump && dumped.insert(id).second) {
                std::cout << "level " << id << " (" << game.levels().coinCount(id) << " coins):"
                          << game.board().toString();
            }
        };

        maybeDump();
        if (!quiet) printTrace(0, '-', game);

        int step = 0;
        for (char key : moves) {
            if (game.status() != GameStatus::Playing) break;
            ++step;
            game.handleMove(moveFromKey(key));
            maybeDump();
            if (!quiet) printTrace(step, key, game);
        }

        const PlayerState& p = game.player();
        std::cout << "Summary: level=" << p.level() << " pos=" << coordString(p.pos())
                  << " coins=" << p.coins() << " steps=" << p.steps()
                  << " status=" << gameStatusName(game.status()) << "\n";
    } catch (const UnknownLevel& e) {
        std::cerr << "Level traversal failed (level " << e.id() << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

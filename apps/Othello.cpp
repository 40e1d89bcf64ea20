#include "othello/game_controller.hpp"
#include "othello/game_utils.hpp"
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>

using namespace othello;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-n SIZE] [--no-pass] [-v]\n"
              << "  -n SIZE     even board size between " << Board::MIN_SIZE
              << " and " << GameUtils::MAX_BOARD_SIZE << " (default 8)\n"
              << "  --no-pass   never skip a player; play until quit or a full board\n"
              << "  -v          log every move\n";
}

} // namespace

// How to run: ./othello
//             ./othello -n 6 -v
// Moves are typed as row then column letter, e.g. "4c". "q" quits.
int main(int argc, char* argv[]) {
    GameController::Config config = GameController::Config::standard();

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            config.board_size = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--no-pass") == 0) {
            config.auto_pass = false;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            config.verbose = true;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    if (GameUtils::check_board_size(config.board_size) != MoveError::None) {
        std::cerr << "Error: " << to_string(MoveError::InvalidSize) << " " << config.board_size
                  << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        GameController game(config);
        std::cout << "Playing Othello on " << config.board_size << "x" << config.board_size
                  << "..." << std::endl;

        while (!game.is_terminated()) {
            GameUtils::print_game_state(game.snapshot(), std::cout);
            std::cout << to_string(game.active_player()) << "> " << std::flush;

            std::string line;
            if (!std::getline(std::cin, line)) {
                // End of input counts as quitting
                game.quit();
                break;
            }

            std::optional<InputCommand> command = GameUtils::parse_move(line);
            if (!command) {
                std::cout << "Invalid input: " << line << std::endl;
                continue;
            }

            TurnResult result = game.submit(*command);
            if (!result.ok()) {
                std::cout << "Invalid move (" << to_string(result.error) << "), try again."
                          << std::endl;
                continue;
            }

            for (Player skipped : result.passed) {
                std::cout << to_string(skipped) << " has no legal move and passes." << std::endl;
            }
        }

        Snapshot final_state = game.snapshot();
        GameUtils::print_board(final_state, std::cout);
        GameUtils::print_result(final_state, std::cout);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

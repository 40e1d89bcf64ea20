#include "othello/game_controller.hpp"
#include "othello/game_utils.hpp"
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace othello;

// How to run: ./othello_replay "3d 5c 6d 3e 3f 2e 5f"
//             ./othello_replay -n 6 "2c 2b"
int main(int argc, char* argv[]) {
    const char* hardCodedGame = "3d 5c 6d 3e 3f 2e 5f";

    // Parse optional flags, collect positional args
    GameController::Config config = GameController::Config::standard();
    std::vector<const char*> positional;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            config.board_size = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-v") == 0) {
            config.verbose = true;
        } else {
            positional.push_back(argv[i]);
        }
    }

    if (GameUtils::check_board_size(config.board_size) != MoveError::None) {
        std::cerr << "Error: " << to_string(MoveError::InvalidSize) << " " << config.board_size
                  << std::endl;
        return 1;
    }

    const char* gameDataStr = positional.size() >= 1 ? positional[0] : hardCodedGame;
    std::vector<std::string> moves = GameUtils::parse_game_string(gameDataStr);

    std::cout << "Parsed moves: ";
    for (const auto& moveStr : moves) {
        std::cout << moveStr << " ";
    }
    std::cout << std::endl;

    try {
        GameController game(config);

        for (const auto& moveStr : moves) {
            std::optional<InputCommand> command = GameUtils::parse_move(moveStr);
            if (!command || command->kind != InputCommand::Kind::Place) {
                std::cerr << "Cannot parse move: " << moveStr << std::endl;
                return 1;
            }

            TurnResult result = game.submit(*command);
            if (!result.ok()) {
                std::cerr << "Move " << moveStr << " rejected for "
                          << to_string(game.active_player()) << ": "
                          << to_string(result.error) << std::endl;
                GameUtils::print_game_state(game.snapshot(), std::cout);
                return 1;
            }
        }

        Snapshot final_state = game.snapshot();
        GameUtils::print_game_state(final_state, std::cout);
        if (game.is_terminated()) {
            GameUtils::print_result(final_state, std::cout);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

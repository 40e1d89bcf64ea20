#pragma once

#include "game_state.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace othello {

class GameUtils {
public:
    // Columns are written as single letters
    static constexpr int MAX_BOARD_SIZE = 26;

    // InvalidSize when the board cannot be created or written in coordinate text
    static MoveError check_board_size(int size) noexcept;

    // Move parsing/display. Accepts "4c", "4 c", "c4" (any letter case) and
    // "q"/"quit". Only the shape is checked here; the controller rejects
    // rows and columns that fall outside the board.
    static std::optional<InputCommand> parse_move(const std::string& text);
    static std::string display_move(int row, int col);

    // Splits a recorded game into move tokens, dropping "12." style numbering
    static std::vector<std::string> parse_game_string(const std::string& game);

    // Board printing
    static void print_board(const Snapshot& snapshot, std::ostream& out);
    static void print_game_state(const Snapshot& snapshot, std::ostream& out);
    static void print_result(const Snapshot& snapshot, std::ostream& out);
};

} // namespace othello

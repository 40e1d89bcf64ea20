#pragma once

#include "board.hpp"
#include "capture_resolver.hpp"
#include "types.hpp"
#include <optional>
#include <vector>

namespace othello {

enum class GameStatus : uint8_t {
    InProgress,
    Terminated
};

enum class TerminationReason : uint8_t {
    None,
    Quit,
    NoLegalMoves,
    BoardFull
};

const char* to_string(TerminationReason reason) noexcept;

struct GameState {
    Board board;
    Player active_player = Player::Black;
    int turn_number = 0;
    GameStatus status = GameStatus::InProgress;
    TerminationReason reason = TerminationReason::None;
    int consecutive_passes = 0;

    GameState() = default;
    explicit GameState(int size) : board(size) {}

    bool is_terminated() const noexcept { return status == GameStatus::Terminated; }
};

// One turn's worth of operator input, already split into row and column.
// row is 1-based, col is 0-based.
struct InputCommand {
    enum class Kind : uint8_t { Place, Quit };

    Kind kind = Kind::Place;
    int row = 0;
    int col = 0;

    static InputCommand place(int r, int c) { return InputCommand{Kind::Place, r, c}; }
    static InputCommand quit() { return InputCommand{Kind::Quit, 0, 0}; }
};

// Everything a renderer needs; a copy, so drawing can't touch the live board
struct Snapshot {
    Board board;
    int size = 0;
    Player active_player = Player::Black;
    int black_count = 0;
    int white_count = 0;
    GameStatus status = GameStatus::InProgress;
    TerminationReason reason = TerminationReason::None;
};

struct Score {
    int black = 0;
    int white = 0;

    // nullopt on a draw
    std::optional<Player> winner() const noexcept {
        if (black > white) return Player::Black;
        if (white > black) return Player::White;
        return std::nullopt;
    }
};

struct TurnResult {
    MoveError error = MoveError::None;
    Move move;
    // Players whose turn was skipped after this move, in order
    std::vector<Player> passed;

    bool ok() const noexcept { return error == MoveError::None; }
};

} // namespace othello

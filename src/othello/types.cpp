#include "othello/types.hpp"

namespace othello {

const char* to_string(MoveError error) noexcept {
    switch (error) {
        case MoveError::None: return "ok";
        case MoveError::InvalidSize: return "invalid board size";
        case MoveError::OutOfRange: return "square is off the board";
        case MoveError::OccupiedSquare: return "square is already occupied";
        case MoveError::NoCaptures: return "move captures nothing";
        case MoveError::InvalidInput: return "invalid input";
        case MoveError::GameOver: return "game is over";
    }
    return "unknown error";
}

} // namespace othello

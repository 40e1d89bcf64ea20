#pragma once

#include <cstdint>
#include <string>

namespace othello {

enum class Player : uint8_t {
    Black,
    White
};

enum class SquareStatus : uint8_t {
    Empty,
    Black,
    White
};

// Why a move or a board operation was refused
enum class MoveError : uint8_t {
    None,
    InvalidSize,
    OutOfRange,
    OccupiedSquare,
    NoCaptures,
    InvalidInput,
    GameOver
};

inline Player opponent(Player player) noexcept {
    return player == Player::Black ? Player::White : Player::Black;
}

inline SquareStatus to_status(Player player) noexcept {
    return player == Player::Black ? SquareStatus::Black : SquareStatus::White;
}

inline const char* to_string(Player player) noexcept {
    return player == Player::Black ? "Black" : "White";
}

const char* to_string(MoveError error) noexcept;

struct Square {
    SquareStatus status = SquareStatus::Empty;
    int index = 0;

    Square() = default;
    Square(SquareStatus s, int i) : status(s), index(i) {}

    bool is_empty() const noexcept { return status == SquareStatus::Empty; }

    bool operator==(const Square& other) const noexcept {
        return status == other.status && index == other.index;
    }

    bool operator!=(const Square& other) const noexcept {
        return !(*this == other);
    }
};

// Zero-based board coordinate
struct Position {
    int row = 0;
    int col = 0;

    Position() = default;
    Position(int r, int c) : row(r), col(c) {}

    // accessors
    char get_col_label() const noexcept { return static_cast<char>('a' + col); }
    int get_row_label() const noexcept { return row + 1; }
    std::string to_string() const {
        return std::to_string(get_row_label()) + std::string(1, get_col_label());
    }

    bool operator==(const Position& other) const noexcept {
        return row == other.row && col == other.col;
    }

    bool operator!=(const Position& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace othello

#include "othello/board.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace othello {

MoveError Board::check_size(int size) noexcept {
    if (size % 2 != 0 || size < MIN_SIZE) {
        return MoveError::InvalidSize;
    }
    return MoveError::None;
}

std::array<int, 4> Board::starting_places(int size) noexcept {
    int start = center_index(size);
    return {start, start + 1, start + size, start + size + 1};
}

Board::Board(int size) : size_(size) {
    if (check_size(size) != MoveError::None) {
        throw std::invalid_argument(std::string(to_string(MoveError::InvalidSize)) +
                                    ": must be even and at least " +
                                    std::to_string(MIN_SIZE) + ", got " +
                                    std::to_string(size));
    }

    squares_.reserve(square_count());
    for (int i = 0; i < square_count(); ++i) {
        squares_.emplace_back(SquareStatus::Empty, i);
    }

    // Colors come from the fixed order: 1st and 4th white, 2nd and 3rd black
    const auto places = starting_places(size);
    squares_[places[0]].status = SquareStatus::White;
    squares_[places[1]].status = SquareStatus::Black;
    squares_[places[2]].status = SquareStatus::Black;
    squares_[places[3]].status = SquareStatus::White;
}

const Square& Board::at(int index) const {
    if (!in_range(index)) {
        throw std::out_of_range("square index " + std::to_string(index) +
                                " outside board of " + std::to_string(square_count()));
    }
    return squares_[index];
}

SquareStatus Board::status_at(int row, int col) const {
    if (!in_bounds(row, col)) {
        throw std::out_of_range("square (" + std::to_string(row) + ", " +
                                std::to_string(col) + ") outside board");
    }
    return squares_[index_of(row, col)].status;
}

void Board::replace(const std::map<int, SquareStatus>& changes) {
    // Validate everything first so a bad entry never leaves a half-applied board
    for (const auto& change : changes) {
        if (!in_range(change.first)) {
            throw std::out_of_range("cannot replace square " + std::to_string(change.first));
        }
        if (change.second == SquareStatus::Empty) {
            throw std::invalid_argument("a square can never be emptied");
        }
    }

    for (const auto& change : changes) {
        squares_[change.first].status = change.second;
    }
}

int Board::count(SquareStatus status) const noexcept {
    return static_cast<int>(std::count_if(squares_.begin(), squares_.end(),
        [status](const Square& square) { return square.status == status; }));
}

} // namespace othello

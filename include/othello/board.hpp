#pragma once

#include "types.hpp"
#include <array>
#include <map>
#include <vector>

namespace othello {

class Board {
public:
    static constexpr int MIN_SIZE = 4;

    Board() : Board(8) {}
    // Throws std::invalid_argument unless size is even and at least MIN_SIZE
    explicit Board(int size);
    ~Board() = default;

    static Board create(int size) { return Board(size); }
    // MoveError::InvalidSize for an odd or too small size, MoveError::None otherwise
    static MoveError check_size(int size) noexcept;

    // Top-left of the central 2x2 block
    static int center_index(int size) noexcept { return (size / 2 - 1) * (size + 1); }

    // The four starting squares in placement order: center, right, down, down-right
    static std::array<int, 4> starting_places(int size) noexcept;

    // Board access
    const Square& at(int index) const;
    SquareStatus status_at(int row, int col) const;

    // Applies every change or none of them. Throws std::out_of_range for a bad
    // index and std::invalid_argument for an Empty target status.
    void replace(const std::map<int, SquareStatus>& changes);

    inline int size() const noexcept { return size_; }
    inline int square_count() const noexcept { return size_ * size_; }
    inline const std::vector<Square>& squares() const noexcept { return squares_; }

    inline bool in_bounds(int row, int col) const noexcept {
        return row >= 0 && row < size_ && col >= 0 && col < size_;
    }

    inline bool in_range(int index) const noexcept {
        return index >= 0 && index < square_count();
    }

    inline int index_of(int row, int col) const noexcept { return row * size_ + col; }
    inline Position position_of(int index) const noexcept {
        return Position{index / size_, index % size_};
    }

    int count(SquareStatus status) const noexcept;

    bool operator==(const Board& other) const noexcept {
        return size_ == other.size_ && squares_ == other.squares_;
    }

    bool operator!=(const Board& other) const noexcept {
        return !(*this == other);
    }

private:
    int size_;
    std::vector<Square> squares_;
};

} // namespace othello

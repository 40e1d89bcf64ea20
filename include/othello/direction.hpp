#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace othello {

enum class Direction : uint8_t {
    Up,
    Down,
    Left,
    Right,
    UpLeft,
    UpRight,
    DownLeft,
    DownRight
};

// Evaluation order used everywhere a direction loop is needed
inline constexpr std::array<Direction, 8> all_directions = {
    Direction::Up, Direction::Down, Direction::Left, Direction::Right,
    Direction::UpLeft, Direction::UpRight, Direction::DownLeft, Direction::DownRight
};

struct StepDelta {
    int d_row;
    int d_col;
};

StepDelta delta_of(Direction direction) noexcept;

// Equivalent linear-index offset on a board of the given edge length
int linear_delta(Direction direction, int size) noexcept;

Direction opposite(Direction direction) noexcept;
const char* to_string(Direction direction) noexcept;

// Neighbor of index one step in direction, or nullopt when the step leaves
// the board. Row and column are checked separately so Left/Right and the
// diagonals never wrap into the neighboring row.
std::optional<int> step(int index, int size, Direction direction) noexcept;

// Every on-board neighbor of index, in all_directions order
std::vector<std::pair<Direction, int>> neighbors(int index, int size);

} // namespace othello

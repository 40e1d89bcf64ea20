#include "othello/direction.hpp"

namespace othello {

StepDelta delta_of(Direction direction) noexcept {
    switch (direction) {
        case Direction::Up:        return {-1,  0};
        case Direction::Down:      return { 1,  0};
        case Direction::Left:      return { 0, -1};
        case Direction::Right:     return { 0,  1};
        case Direction::UpLeft:    return {-1, -1};
        case Direction::UpRight:   return {-1,  1};
        case Direction::DownLeft:  return { 1, -1};
        case Direction::DownRight: return { 1,  1};
    }
    return {0, 0};
}

int linear_delta(Direction direction, int size) noexcept {
    StepDelta delta = delta_of(direction);
    return delta.d_row * size + delta.d_col;
}

Direction opposite(Direction direction) noexcept {
    switch (direction) {
        case Direction::Up:        return Direction::Down;
        case Direction::Down:      return Direction::Up;
        case Direction::Left:      return Direction::Right;
        case Direction::Right:     return Direction::Left;
        case Direction::UpLeft:    return Direction::DownRight;
        case Direction::UpRight:   return Direction::DownLeft;
        case Direction::DownLeft:  return Direction::UpRight;
        case Direction::DownRight: return Direction::UpLeft;
    }
    return direction;
}

const char* to_string(Direction direction) noexcept {
    switch (direction) {
        case Direction::Up:        return "up";
        case Direction::Down:      return "down";
        case Direction::Left:      return "left";
        case Direction::Right:     return "right";
        case Direction::UpLeft:    return "up-left";
        case Direction::UpRight:   return "up-right";
        case Direction::DownLeft:  return "down-left";
        case Direction::DownRight: return "down-right";
    }
    return "?";
}

std::optional<int> step(int index, int size, Direction direction) noexcept {
    if (size <= 0 || index < 0 || index >= size * size) {
        return std::nullopt;
    }

    StepDelta delta = delta_of(direction);
    int row = index / size + delta.d_row;
    int col = index % size + delta.d_col;

    if (row < 0 || row >= size || col < 0 || col >= size) {
        return std::nullopt;
    }
    return row * size + col;
}

std::vector<std::pair<Direction, int>> neighbors(int index, int size) {
    std::vector<std::pair<Direction, int>> result;
    result.reserve(all_directions.size());

    for (Direction direction : all_directions) {
        if (auto next = step(index, size, direction)) {
            result.emplace_back(direction, *next);
        }
    }
    return result;
}

} // namespace othello

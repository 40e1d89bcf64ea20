#include "othello/capture_resolver.hpp"
#include <utility>

namespace othello {

int Move::flip_count() const noexcept {
    int count = 0;
    for (const auto& line : captures) {
        count += static_cast<int>(line.second.size());
    }
    return count;
}

std::vector<int> Move::flipped() const {
    std::vector<int> result;
    result.reserve(flip_count());
    for (const auto& line : captures) {
        result.insert(result.end(), line.second.begin(), line.second.end());
    }
    return result;
}

std::map<int, SquareStatus> Move::changes() const {
    const SquareStatus colour = to_status(player);
    std::map<int, SquareStatus> result;
    result[target_index] = colour;
    for (int index : flipped()) {
        result[index] = colour;
    }
    return result;
}

std::vector<int> CaptureResolver::capture_line(const Board& board, Player player,
                                               int target_index, Direction direction) {
    const SquareStatus mine = to_status(player);
    const SquareStatus theirs = to_status(opponent(player));
    const int size = board.size();

    std::vector<int> line;
    auto next = step(target_index, size, direction);

    while (next && board.at(*next).status == theirs) {
        line.push_back(*next);
        next = step(*next, size, direction);
    }

    // Off the board or stopped on an empty square: nothing is bracketed
    if (!next || board.at(*next).status != mine) {
        line.clear();
    }
    return line;
}

ResolveResult CaptureResolver::resolve(const Board& board, Player player, int target_index) {
    ResolveResult result;
    result.move = Move(target_index, player);

    if (!board.in_range(target_index)) {
        result.error = MoveError::OutOfRange;
        return result;
    }
    if (!board.at(target_index).is_empty()) {
        result.error = MoveError::OccupiedSquare;
        return result;
    }

    // Lines radiate away from the target so they never share a square
    for (Direction direction : all_directions) {
        std::vector<int> line = capture_line(board, player, target_index, direction);
        if (!line.empty()) {
            result.move.captures.emplace(direction, std::move(line));
        }
    }

    if (result.move.captures.empty()) {
        result.error = MoveError::NoCaptures;
    }
    return result;
}

bool CaptureResolver::is_legal(const Board& board, Player player, int target_index) {
    return resolve(board, player, target_index).ok();
}

bool CaptureResolver::has_legal_move(const Board& board, Player player) {
    for (const Square& square : board.squares()) {
        if (square.is_empty() && is_legal(board, player, square.index)) {
            return true;
        }
    }
    return false;
}

std::vector<int> CaptureResolver::legal_moves(const Board& board, Player player) {
    std::vector<int> moves;
    for (const Square& square : board.squares()) {
        if (square.is_empty() && is_legal(board, player, square.index)) {
            moves.push_back(square.index);
        }
    }
    return moves;
}

} // namespace othello

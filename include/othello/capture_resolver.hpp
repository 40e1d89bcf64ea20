#pragma once

#include "board.hpp"
#include "direction.hpp"
#include "types.hpp"
#include <map>
#include <vector>

namespace othello {

// A candidate placement together with the lines it captures
struct Move {
    int target_index = -1;
    Player player = Player::Black;
    // direction -> opponent squares to flip, closest first
    std::map<Direction, std::vector<int>> captures;

    Move() = default;
    Move(int target, Player p) : target_index(target), player(p) {}

    int flip_count() const noexcept;
    std::vector<int> flipped() const;

    // Placement plus every flip, ready for Board::replace
    std::map<int, SquareStatus> changes() const;
};

struct ResolveResult {
    MoveError error = MoveError::None;
    Move move;

    bool ok() const noexcept { return error == MoveError::None; }
};

class CaptureResolver {
public:
    // Legality check and capture computation for player placing at target_index.
    // Never touches the board.
    static ResolveResult resolve(const Board& board, Player player, int target_index);

    // Opponent run in a single direction; empty unless it ends on player's color
    static std::vector<int> capture_line(const Board& board, Player player,
                                         int target_index, Direction direction);

    static bool is_legal(const Board& board, Player player, int target_index);
    static bool has_legal_move(const Board& board, Player player);
    static std::vector<int> legal_moves(const Board& board, Player player);
};

} // namespace othello

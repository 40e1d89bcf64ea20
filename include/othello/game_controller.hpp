#pragma once

#include "game_state.hpp"
#include <iosfwd>
#include <optional>
#include <vector>

namespace othello {

class GameController {
public:
    struct Config {
        int board_size = 8;
        bool auto_pass = true;  // skip a player with no legal move and end when nobody can move
        bool verbose = false;   // log accepted moves and passes

        static Config standard() { return Config(); }
        static Config small() {
            Config config;
            config.board_size = 6;
            return config;
        }
    };

    GameController();
    explicit GameController(const Config& config);
    // Start from an arranged position; board_size is taken from the board
    GameController(const Config& config, const Board& board, Player to_move);
    ~GameController() = default;

    // One writer per game
    GameController(const GameController&) = delete;
    GameController& operator=(const GameController&) = delete;

    // Move system
    TurnResult submit(const InputCommand& command);
    TurnResult place(int row, int col);  // row 1-based, col 0-based
    TurnResult apply_move(int index);
    void quit() noexcept;

    // Game state queries
    inline const GameState& state() const noexcept { return state_; }
    inline const Board& board() const noexcept { return state_.board; }
    inline Player active_player() const noexcept { return state_.active_player; }
    inline int turn_number() const noexcept { return state_.turn_number; }
    inline bool is_terminated() const noexcept { return state_.is_terminated(); }
    inline TerminationReason termination_reason() const noexcept { return state_.reason; }
    inline const Config& config() const noexcept { return config_; }
    inline const std::vector<Position>& moves_played() const noexcept { return moves_played_; }

    Snapshot snapshot() const;
    Score score() const noexcept;
    std::optional<Player> winner() const noexcept;

    void set_log_stream(std::ostream& out) noexcept { log_ = &out; }

private:
    Config config_;
    GameState state_;
    std::vector<Position> moves_played_;
    std::ostream* log_;

    // Terminates with BoardFull once no square is empty
    bool end_if_full();
    // Hands the turn to candidate, or past it, or ends the game
    void settle_turn(Player candidate, TurnResult* result);
    void terminate(TerminationReason reason);
};

} // namespace othello

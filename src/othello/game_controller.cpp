#include "othello/game_controller.hpp"
#include <iostream>

namespace othello {

const char* to_string(TerminationReason reason) noexcept {
    switch (reason) {
        case TerminationReason::None: return "in progress";
        case TerminationReason::Quit: return "quit";
        case TerminationReason::NoLegalMoves: return "no legal moves";
        case TerminationReason::BoardFull: return "board full";
    }
    return "unknown";
}

GameController::GameController() : GameController(Config::standard()) {}

GameController::GameController(const Config& config)
    : config_(config), state_(config.board_size), log_(&std::cout) {
    // Black opens, unless the position leaves Black nothing to play
    if (!end_if_full() && config_.auto_pass) {
        settle_turn(Player::Black, nullptr);
    }
}

GameController::GameController(const Config& config, const Board& board, Player to_move)
    : config_(config), state_(board.size()), log_(&std::cout) {
    config_.board_size = board.size();
    state_.board = board;
    state_.active_player = to_move;
    if (!end_if_full() && config_.auto_pass) {
        settle_turn(to_move, nullptr);
    }
}

TurnResult GameController::submit(const InputCommand& command) {
    if (command.kind == InputCommand::Kind::Quit) {
        quit();
        TurnResult result;
        result.move = Move(-1, state_.active_player);
        return result;
    }
    return place(command.row, command.col);
}

TurnResult GameController::place(int row, int col) {
    const int size = state_.board.size();
    if (row < 1 || row > size || col < 0 || col >= size) {
        TurnResult result;
        result.error = MoveError::InvalidInput;
        result.move = Move(-1, state_.active_player);
        return result;
    }
    return apply_move(state_.board.index_of(row - 1, col));
}

TurnResult GameController::apply_move(int index) {
    TurnResult result;
    const Player mover = state_.active_player;

    if (state_.is_terminated()) {
        result.error = MoveError::GameOver;
        result.move = Move(index, mover);
        return result;
    }

    ResolveResult resolved = CaptureResolver::resolve(state_.board, mover, index);
    result.move = resolved.move;
    if (!resolved.ok()) {
        result.error = resolved.error;
        return result;
    }

    // Placement and flips land together
    state_.board.replace(resolved.move.changes());
    state_.turn_number++;
    state_.consecutive_passes = 0;
    moves_played_.push_back(state_.board.position_of(index));

    if (config_.verbose) {
        *log_ << "Turn " << state_.turn_number << ": " << to_string(mover) << " plays "
              << state_.board.position_of(index).to_string() << ", flips "
              << resolved.move.flip_count() << std::endl;
    }

    if (end_if_full()) {
        return result;
    }

    if (config_.auto_pass) {
        settle_turn(opponent(mover), &result);
    } else {
        state_.active_player = opponent(mover);
    }
    return result;
}

void GameController::quit() noexcept {
    if (state_.is_terminated()) {
        return;
    }
    state_.status = GameStatus::Terminated;
    state_.reason = TerminationReason::Quit;
}

bool GameController::end_if_full() {
    if (state_.board.count(SquareStatus::Empty) != 0) {
        return false;
    }
    terminate(TerminationReason::BoardFull);
    return true;
}

void GameController::settle_turn(Player candidate, TurnResult* result) {
    if (CaptureResolver::has_legal_move(state_.board, candidate)) {
        state_.active_player = candidate;
        return;
    }

    const Player other = opponent(candidate);
    if (CaptureResolver::has_legal_move(state_.board, other)) {
        state_.active_player = other;
        state_.consecutive_passes++;
        if (result) {
            result->passed.push_back(candidate);
        }
        if (config_.verbose) {
            *log_ << to_string(candidate) << " has no legal move and passes" << std::endl;
        }
        return;
    }

    state_.active_player = candidate;
    terminate(TerminationReason::NoLegalMoves);
}

void GameController::terminate(TerminationReason reason) {
    state_.status = GameStatus::Terminated;
    state_.reason = reason;

    if (config_.verbose) {
        Score final_score = score();
        *log_ << "Game over (" << to_string(reason) << "): Black " << final_score.black
              << ", White " << final_score.white << std::endl;
    }
}

Snapshot GameController::snapshot() const {
    Snapshot snap;
    snap.board = state_.board;
    snap.size = state_.board.size();
    snap.active_player = state_.active_player;
    snap.black_count = state_.board.count(SquareStatus::Black);
    snap.white_count = state_.board.count(SquareStatus::White);
    snap.status = state_.status;
    snap.reason = state_.reason;
    return snap;
}

Score GameController::score() const noexcept {
    Score result;
    result.black = state_.board.count(SquareStatus::Black);
    result.white = state_.board.count(SquareStatus::White);
    return result;
}

std::optional<Player> GameController::winner() const noexcept {
    return score().winner();
}

} // namespace othello

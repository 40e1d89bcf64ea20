#include "othello/game_utils.hpp"
#include <cctype>
#include <iostream>
#include <sstream>

namespace othello {

namespace {

constexpr int MAX_ROW_DIGITS = 3;

std::string normalise(const std::string& text) {
    std::string result;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return result;
}

bool all_digits(const std::string& text) {
    if (text.empty() || text.size() > MAX_ROW_DIGITS) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

const char* status_label(SquareStatus status) {
    switch (status) {
        case SquareStatus::Black: return "B";
        case SquareStatus::White: return "W";
        case SquareStatus::Empty: break;
    }
    return " ";
}

} // namespace

MoveError GameUtils::check_board_size(int size) noexcept {
    if (size > MAX_BOARD_SIZE) {
        return MoveError::InvalidSize;
    }
    return Board::check_size(size);
}

std::optional<InputCommand> GameUtils::parse_move(const std::string& text) {
    const std::string input = normalise(text);
    if (input.empty()) {
        return std::nullopt;
    }

    if (input == "q" || input == "quit") {
        return InputCommand::quit();
    }

    // "<row><letter>" or "<letter><row>"
    std::string digits;
    char letter = '\0';
    if (std::isalpha(static_cast<unsigned char>(input.back()))) {
        letter = input.back();
        digits = input.substr(0, input.size() - 1);
    } else if (std::isalpha(static_cast<unsigned char>(input.front()))) {
        letter = input.front();
        digits = input.substr(1);
    } else {
        return std::nullopt;
    }

    if (!all_digits(digits) || letter < 'a' || letter > 'z') {
        return std::nullopt;
    }

    return InputCommand::place(std::stoi(digits), letter - 'a');
}

std::string GameUtils::display_move(int row, int col) {
    return Position{row, col}.to_string();
}

std::vector<std::string> GameUtils::parse_game_string(const std::string& game) {
    std::vector<std::string> moves;
    std::istringstream in(game);
    std::string token;

    while (in >> token) {
        // Skip move numbers ("1.", "2.", ...)
        if (token.back() == '.') {
            continue;
        }
        moves.push_back(token);
    }
    return moves;
}

void GameUtils::print_board(const Snapshot& snapshot, std::ostream& out) {
    const int size = snapshot.size;

    out << "    ";
    for (int col = 0; col < size; ++col) {
        if (col > 0) out << "   ";
        out << static_cast<char>('A' + col);
    }
    out << "\n";

    for (int row = 0; row < size; ++row) {
        out << (row + 1 < 10 ? " " : "") << (row + 1) << "| ";
        for (int col = 0; col < size; ++col) {
            out << status_label(snapshot.board.status_at(row, col)) << " | ";
        }
        out << "\n";
    }
}

void GameUtils::print_game_state(const Snapshot& snapshot, std::ostream& out) {
    print_board(snapshot, out);
    out << "Black (B): " << snapshot.black_count << ", White (W): " << snapshot.white_count << "\n";
    if (snapshot.status == GameStatus::InProgress) {
        out << "Current player: " << to_string(snapshot.active_player) << "\n";
    }
}

void GameUtils::print_result(const Snapshot& snapshot, std::ostream& out) {
    out << "Game over: " << to_string(snapshot.reason) << "\n";
    out << "Final score - Black: " << snapshot.black_count
        << ", White: " << snapshot.white_count << "\n";

    if (snapshot.black_count > snapshot.white_count) {
        out << "Winner: Black\n";
    } else if (snapshot.white_count > snapshot.black_count) {
        out << "Winner: White\n";
    } else {
        out << "Draw\n";
    }
}

} // namespace othello

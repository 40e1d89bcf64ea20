#include <gtest/gtest.h>
#include "othello/game_controller.hpp"
#include "othello/game_utils.hpp"
#include <sstream>

using namespace othello;

TEST(GameUtilsTest, ParseRowThenColumn) {
    auto command = GameUtils::parse_move("4c");
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(command->kind, InputCommand::Kind::Place);
    EXPECT_EQ(command->row, 4);
    EXPECT_EQ(command->col, 2);
}

TEST(GameUtilsTest, ParseAcceptsSpacingCaseAndOrder) {
    for (const char* text : {"4 c", " 4C ", "c4", "C 4"}) {
        auto command = GameUtils::parse_move(text);
        ASSERT_TRUE(command.has_value()) << text;
        EXPECT_EQ(command->row, 4) << text;
        EXPECT_EQ(command->col, 2) << text;
    }

    auto wide = GameUtils::parse_move("12j");
    ASSERT_TRUE(wide.has_value());
    EXPECT_EQ(wide->row, 12);
    EXPECT_EQ(wide->col, 9);
}

TEST(GameUtilsTest, ParseQuit) {
    for (const char* text : {"q", "Q", "quit", " QUIT "}) {
        auto command = GameUtils::parse_move(text);
        ASSERT_TRUE(command.has_value()) << text;
        EXPECT_EQ(command->kind, InputCommand::Kind::Quit) << text;
    }
}

TEST(GameUtilsTest, ParseRejectsMalformedText) {
    for (const char* text : {"", "   ", "4", "cc", "4c4", "c4c", "-4c", "4$", "12345a"}) {
        EXPECT_FALSE(GameUtils::parse_move(text).has_value()) << "'" << text << "'";
    }
}

TEST(GameUtilsTest, OffBoardCoordinatesReachTheController) {
    // Shape is fine, range is the controller's call
    GameController game;
    auto command = GameUtils::parse_move("9a");
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(game.submit(*command).error, MoveError::InvalidInput);

    command = GameUtils::parse_move("1z");
    ASSERT_TRUE(command.has_value());
    EXPECT_EQ(game.submit(*command).error, MoveError::InvalidInput);
}

TEST(GameUtilsTest, DisplayMove) {
    EXPECT_EQ(GameUtils::display_move(0, 0), "1a");
    EXPECT_EQ(GameUtils::display_move(3, 2), "4c");
    EXPECT_EQ(GameUtils::display_move(11, 9), "12j");
}

TEST(GameUtilsTest, ParseGameString) {
    auto moves = GameUtils::parse_game_string("1. 3d 5c 2. 6d\t3e\n3f");
    EXPECT_EQ(moves, (std::vector<std::string>{"3d", "5c", "6d", "3e", "3f"}));
    EXPECT_TRUE(GameUtils::parse_game_string("   ").empty());
}

TEST(GameUtilsTest, PrintBoardLayout) {
    GameController game(GameController::Config::small());
    std::ostringstream out;
    GameUtils::print_board(game.snapshot(), out);

    std::istringstream lines(out.str());
    std::string line;

    std::getline(lines, line);
    EXPECT_EQ(line, "    A   B   C   D   E   F");
    std::getline(lines, line);
    EXPECT_EQ(line, " 1|   |   |   |   |   |   | ");
    std::getline(lines, line);
    std::getline(lines, line);
    EXPECT_EQ(line, " 3|   |   | W | B |   |   | ");
    std::getline(lines, line);
    EXPECT_EQ(line, " 4|   |   | B | W |   |   | ");
}

TEST(GameUtilsTest, BoardSizeMustFitColumnLetters) {
    EXPECT_EQ(GameUtils::check_board_size(8), MoveError::None);
    EXPECT_EQ(GameUtils::check_board_size(GameUtils::MAX_BOARD_SIZE), MoveError::None);
    EXPECT_EQ(GameUtils::check_board_size(GameUtils::MAX_BOARD_SIZE + 2), MoveError::InvalidSize);
    EXPECT_EQ(GameUtils::check_board_size(9), MoveError::InvalidSize);
    EXPECT_EQ(GameUtils::check_board_size(2), MoveError::InvalidSize);
    EXPECT_STREQ(to_string(MoveError::InvalidSize), "invalid board size");
}

TEST(GameUtilsTest, PrintRowIdsPastNine) {
    GameController::Config config;
    config.board_size = 10;
    GameController game(config);
    std::ostringstream out;
    GameUtils::print_board(game.snapshot(), out);

    EXPECT_NE(out.str().find("\n 9| "), std::string::npos);
    EXPECT_NE(out.str().find("\n10| "), std::string::npos);
}

TEST(GameUtilsTest, PrintGameStateAndResult) {
    GameController game;
    ASSERT_TRUE(game.place(4, 2).ok());

    std::ostringstream out;
    GameUtils::print_game_state(game.snapshot(), out);
    EXPECT_NE(out.str().find("Black (B): 4, White (W): 1"), std::string::npos);
    EXPECT_NE(out.str().find("Current player: White"), std::string::npos);

    game.quit();
    std::ostringstream result;
    GameUtils::print_result(game.snapshot(), result);
    EXPECT_NE(result.str().find("Game over: quit"), std::string::npos);
    EXPECT_NE(result.str().find("Winner: Black"), std::string::npos);
}

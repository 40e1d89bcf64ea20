#include <gtest/gtest.h>
#include "othello/direction.hpp"

using namespace othello;

TEST(DirectionTest, LinearDeltas) {
    EXPECT_EQ(linear_delta(Direction::Up, 8), -8);
    EXPECT_EQ(linear_delta(Direction::Down, 8), 8);
    EXPECT_EQ(linear_delta(Direction::Left, 8), -1);
    EXPECT_EQ(linear_delta(Direction::Right, 8), 1);
    EXPECT_EQ(linear_delta(Direction::UpLeft, 8), -9);
    EXPECT_EQ(linear_delta(Direction::UpRight, 8), -7);
    EXPECT_EQ(linear_delta(Direction::DownLeft, 8), 7);
    EXPECT_EQ(linear_delta(Direction::DownRight, 8), 9);
}

TEST(DirectionTest, InteriorStepsMatchDeltas) {
    const int size = 8;
    const int origin = 27;
    for (Direction direction : all_directions) {
        auto next = step(origin, size, direction);
        ASSERT_TRUE(next.has_value()) << to_string(direction);
        EXPECT_EQ(*next, origin + linear_delta(direction, size)) << to_string(direction);
    }
}

TEST(DirectionTest, CornerHasThreeNeighbors) {
    auto result = neighbors(0, 8);
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0].first, Direction::Down);
    EXPECT_EQ(result[0].second, 8);
    EXPECT_EQ(result[1].first, Direction::Right);
    EXPECT_EQ(result[1].second, 1);
    EXPECT_EQ(result[2].first, Direction::DownRight);
    EXPECT_EQ(result[2].second, 9);

    EXPECT_EQ(neighbors(63, 8).size(), 3u);
    EXPECT_EQ(neighbors(27, 8).size(), 8u);
    EXPECT_EQ(neighbors(3, 8).size(), 5u);
}

TEST(DirectionTest, NoWrapAcrossRows) {
    // Left from column 0 would land on the last column of the row above
    EXPECT_FALSE(step(8, 8, Direction::Left).has_value());
    EXPECT_FALSE(step(8, 8, Direction::UpLeft).has_value());
    EXPECT_FALSE(step(8, 8, Direction::DownLeft).has_value());

    // Right from the last column would land on column 0 of the next row
    EXPECT_FALSE(step(7, 8, Direction::Right).has_value());
    EXPECT_FALSE(step(15, 8, Direction::UpRight).has_value());
    EXPECT_FALSE(step(15, 8, Direction::DownRight).has_value());

    // Vertical moves off the board
    EXPECT_FALSE(step(3, 8, Direction::Up).has_value());
    EXPECT_FALSE(step(60, 8, Direction::Down).has_value());
}

TEST(DirectionTest, OffBoardOrigin) {
    EXPECT_FALSE(step(-1, 8, Direction::Right).has_value());
    EXPECT_FALSE(step(64, 8, Direction::Left).has_value());
}

TEST(DirectionTest, OppositeIsAnInvolution) {
    for (Direction direction : all_directions) {
        EXPECT_NE(opposite(direction), direction);
        EXPECT_EQ(opposite(opposite(direction)), direction);
        EXPECT_EQ(linear_delta(opposite(direction), 8), -linear_delta(direction, 8));
    }
}

TEST(DirectionTest, StepThenInverseReturnsToOrigin) {
    for (int size = 4; size <= 10; size += 2) {
        for (int index = 0; index < size * size; ++index) {
            for (Direction direction : all_directions) {
                auto next = step(index, size, direction);
                if (!next) continue;
                auto back = step(*next, size, opposite(direction));
                ASSERT_TRUE(back.has_value());
                EXPECT_EQ(*back, index) << "size " << size << " index " << index
                                        << " " << to_string(direction);
            }
        }
    }
}

TEST(DirectionTest, StepsMoveOneSquareInBothAxes) {
    const int size = 6;
    for (int index = 0; index < size * size; ++index) {
        for (const auto& neighbor : neighbors(index, size)) {
            int d_row = neighbor.second / size - index / size;
            int d_col = neighbor.second % size - index % size;
            StepDelta expected = delta_of(neighbor.first);
            EXPECT_EQ(d_row, expected.d_row);
            EXPECT_EQ(d_col, expected.d_col);
        }
    }
}

#include <gtest/gtest.h>
#include "leaguesim/matchup.hpp"
#include "leaguesim/standings.hpp"

using namespace leaguesim;

TEST(Matchup, EvenTeamsFavourHome) {
    EXPECT_NEAR(frame_win_probability(0.0, 0.0), 0.5498, 1e-4);
}

TEST(Matchup, EqualStrengthsGiveHomeAdvantageOnly) {
    for (double s : {-2.5, -0.7, 0.0, 0.3, 1.0, 3.7}) {
        EXPECT_EQ(frame_win_probability(s, s), logistic(0.2)) << "strength " << s;
    }
}

TEST(Matchup, DependsOnlyOnStrengthDifference) {
    EXPECT_NEAR(frame_win_probability(1.0, 0.5), frame_win_probability(0.5, 0.0), 1e-12);
    EXPECT_NEAR(frame_win_probability(-2.0, -1.0), frame_win_probability(0.0, 1.0), 1e-12);
}

TEST(Matchup, ZeroHomeAdvantageIsSymmetric) {
    EXPECT_DOUBLE_EQ(frame_win_probability(0.3, 0.3, 0.0), 0.5);
    EXPECT_NEAR(frame_win_probability(0.4, 0.1, 0.0) + frame_win_probability(0.1, 0.4, 0.0),
                1.0, 1e-12);
}

TEST(Matchup, StrongerHomeSideMoreLikely) {
    EXPECT_GT(frame_win_probability(1.0, 0.0), frame_win_probability(0.5, 0.0));
    EXPECT_LT(frame_win_probability(0.0, 1.0), 0.5);
}

TEST(Matchup, Logistic) {
    EXPECT_DOUBLE_EQ(logistic(0.0), 0.5);
    EXPECT_GT(logistic(10.0), 0.99);
    EXPECT_LT(logistic(-10.0), 0.01);
}

TEST(Points, HomeWinAwayWinDraw) {
    EXPECT_EQ(points_for(6, 4), std::make_pair(2, 0));
    EXPECT_EQ(points_for(3, 7), std::make_pair(0, 3));
    EXPECT_EQ(points_for(5, 5), std::make_pair(1, 1));
}

#include <gtest/gtest.h>
#include "leaguesim/adjusted_rating.hpp"
#include "leaguesim/strength.hpp"

using namespace leaguesim;

namespace {

PlayerTeamStats context(const std::string& team, const std::string& division, int played,
                        int won, bool cup = false) {
    return {
        .team = team,
        .division = division,
        .played = played,
        .won = won,
        .pct = played > 0 ? 100.0 * won / played : 0.0,
        .cup = cup,
    };
}

LeagueSnapshot make_league() {
    LeagueSnapshot s;
    s.league_id = "north";
    s.divisions["D1"] = {.name = "Division 1", .teams = {"Lions", "Tigers"}};
    s.divisions["D2"] = {.name = "Division 2", .teams = {"Owls"}};

    auto add = [&](const std::string& name, PlayerTeamStats stats) {
        auto& p = s.players[name];
        p.teams.push_back(stats);
        p.total.played += stats.played;
        p.total.won += stats.won;
    };
    add("Ann", context("Lions", "D1", 10, 8));
    add("Bob", context("Lions", "D1", 10, 5));
    add("Cat", context("Tigers", "D1", 10, 2));
    add("Dan", context("Owls", "D2", 10, 6));
    add("Ann", context("Cup", "D2", 4, 4, true));
    return s;
}

std::vector<LeagueStrength> make_strengths() {
    return {{
        .league_id = "north",
        .offset = 2.0,
        .confidence = 0.8,
        .divisions = {
            {.division = "D1", .league_id = "north", .offset = 3.0, .confidence = 0.6},
            {.division = "D2", .league_id = "north", .offset = -3.0, .confidence = 0.6},
        },
    }};
}

} // namespace

TEST(AdjustedRating, PlayerRatingBreakdown) {
    auto rating = adjusted_player_rating("Ann", "north", "D1", make_league(), make_strengths());
    ASSERT_TRUE(rating.has_value());

    double bayes = bayesian_pct(8, 10);
    EXPECT_DOUBLE_EQ(rating->raw_pct, 80.0);
    EXPECT_DOUBLE_EQ(rating->bayesian_pct, bayes);
    EXPECT_DOUBLE_EQ(rating->breakdown.division_offset, 3.0);
    EXPECT_DOUBLE_EQ(rating->breakdown.league_offset, 2.0);
    EXPECT_DOUBLE_EQ(rating->breakdown.total, 5.0);
    EXPECT_DOUBLE_EQ(rating->adjusted_pct, bayes + 5.0);
    EXPECT_DOUBLE_EQ(rating->confidence, 0.6);
    EXPECT_GT(rating->z_score, 0.0);
    // Strictly above Bob and Cat in D1.
    EXPECT_NEAR(rating->division_percentile, 200.0 / 3.0, 1e-9);
}

TEST(AdjustedRating, NullWithoutDivisionGames) {
    auto league = make_league();
    auto strengths = make_strengths();
    EXPECT_FALSE(adjusted_player_rating("Ann", "north", "D2", league, strengths).has_value());
    EXPECT_FALSE(adjusted_player_rating("Nobody", "north", "D1", league, strengths).has_value());

    league.players["Eve"].teams.push_back(context("Lions", "D1", 0, 0));
    EXPECT_FALSE(adjusted_player_rating("Eve", "north", "D1", league, strengths).has_value());
}

TEST(AdjustedRating, MissingCalibrationMeansNoOffsetAndNoConfidence) {
    auto rating = adjusted_player_rating("Dan", "south", "D2", make_league(), {});
    ASSERT_TRUE(rating.has_value());
    EXPECT_DOUBLE_EQ(rating->breakdown.total, 0.0);
    EXPECT_DOUBLE_EQ(rating->adjusted_pct, rating->bayesian_pct);
    EXPECT_DOUBLE_EQ(rating->confidence, 0.0);
    // Alone in D2: pool of one, nothing strictly below.
    EXPECT_DOUBLE_EQ(rating->division_percentile, 0.0);
    EXPECT_DOUBLE_EQ(rating->z_score, 0.0);
}

TEST(AdjustedRating, TeamRatingAggregatesPlayers) {
    auto league = make_league();
    auto rating = adjusted_team_rating("Lions", "north", "D1", league, make_strengths());
    ASSERT_TRUE(rating.has_value());
    EXPECT_DOUBLE_EQ(rating->raw_pct, 65.0);
    EXPECT_DOUBLE_EQ(rating->bayesian_pct, bayesian_pct(13, 20));
    EXPECT_DOUBLE_EQ(rating->adjusted_pct, bayesian_pct(13, 20) + 5.0);
    EXPECT_DOUBLE_EQ(rating->division_percentile, 50.0); // above Tigers only
    EXPECT_NEAR(rating->league_percentile, 200.0 / 3.0, 1e-9);
    EXPECT_GT(rating->z_score, 0.0);

    EXPECT_FALSE(adjusted_team_rating("Nomads", "north", "D1", league, make_strengths()).has_value());
}

TEST(AdjustedRating, GlobalPercentilesByRank) {
    std::vector<KeyedRating> ratings(3);
    ratings[0] = {"north:Ann", {.adjusted_pct = 70.0}};
    ratings[1] = {"south:Bob", {.adjusted_pct = 40.0}};
    ratings[2] = {"north:Cat", {.adjusted_pct = 55.0}};

    auto pct = global_percentiles(ratings);
    EXPECT_NEAR(pct["south:Bob"], 100.0 / 3.0, 1e-9);
    EXPECT_NEAR(pct["north:Cat"], 200.0 / 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(pct["north:Ann"], 100.0);
    EXPECT_TRUE(global_percentiles({}).empty());
}

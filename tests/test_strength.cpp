#include <gtest/gtest.h>
#include "leaguesim/strength.hpp"
#include <cmath>

using namespace leaguesim;

namespace {

PlayerTeamStats team_stats(const std::string& team, int played, int won) {
    return {
        .team = team,
        .division = "D1",
        .played = played,
        .won = won,
        .pct = played > 0 ? 100.0 * won / played : 0.0,
    };
}

LeagueSnapshot make_snapshot() {
    LeagueSnapshot s;
    s.divisions["D1"] = {.name = "Division 1", .teams = {"Lions", "Tigers"}};
    s.results = {{"01-10-2025", "Lions", "Tigers", 6, 4, "D1"}};
    s.rosters["D1:Lions"] = {"Ann", "Bob"};
    s.prior_players["Ann"] = {.rating = 0.0, .win_rate = 0.6, .played = 20};
    return s;
}

} // namespace

TEST(Strength, BayesianPriorWithoutGames) {
    EXPECT_DOUBLE_EQ(bayesian_pct(0, 0), 50.0);
}

TEST(Strength, BayesianShrinksTowardPrior) {
    EXPECT_DOUBLE_EQ(bayesian_pct(10, 10), 81.25);
    for (int games = 1; games <= 30; ++games) {
        for (int wins = 0; wins <= games; ++wins) {
            double raw = 100.0 * wins / games;
            double adj = bayesian_pct(wins, games);
            EXPECT_LE(std::abs(adj - 50.0), std::abs(raw - 50.0) + 1e-9);
        }
    }
}

TEST(Strength, CurrentFormOnceBlendComplete) {
    StrengthConfig cfg{.prior_blend_games = 0};
    auto strengths = calc_team_strength("D1", make_snapshot(), cfg);
    EXPECT_NEAR(strengths["Lions"], 0.4, 1e-12);
    EXPECT_NEAR(strengths["Tigers"], -0.4, 1e-12);
}

TEST(Strength, PriorTeamStrengthWeightsKnownAndUnknownPlayers) {
    // Ann 0.6 over 20 games, Bob unknown at 0.45 over 6 pseudo-games.
    double expected = ((0.6 * 20 + 0.45 * 6) / 26.0 - 0.5) * 4.0;
    EXPECT_NEAR(prior_team_strength("Lions", "D1", make_snapshot()), expected, 1e-9);
}

TEST(Strength, EmptySquadHasNeutralPrior) {
    EXPECT_DOUBLE_EQ(prior_team_strength("Tigers", "D1", make_snapshot()), 0.0);
}

TEST(Strength, EarlySeasonBlendsPrior) {
    auto s = make_snapshot();
    double prior = prior_team_strength("Lions", "D1", s);
    auto strengths = calc_team_strength("D1", s);
    EXPECT_NEAR(strengths["Lions"], 0.9 * prior + 0.1 * 0.4, 1e-9);
    EXPECT_NEAR(strengths["Tigers"], 0.1 * -0.4, 1e-9);
}

TEST(Strength, TeamStrengthOutsideAnyDivisionIsZero) {
    auto s = make_snapshot();
    EXPECT_DOUBLE_EQ(team_strength("Nobody", s), 0.0);
    EXPECT_DOUBLE_EQ(team_strength("Lions", s), calc_team_strength("D1", s)["Lions"]);
}

TEST(Strength, EffectivePctPrefersCurrentSeason) {
    SquadMember m{.name = "Ann"};
    m.prior = PriorPlayerStats{.win_rate = 0.6, .played = 20};
    m.current = team_stats("Lions", 4, 1);

    auto eff = effective_pct(m);
    ASSERT_TRUE(eff.has_value());
    EXPECT_DOUBLE_EQ(eff->pct, 0.25);
    EXPECT_EQ(eff->weight, 4);

    m.current = team_stats("Lions", 2, 2);
    eff = effective_pct(m);
    ASSERT_TRUE(eff.has_value());
    EXPECT_DOUBLE_EQ(eff->pct, 0.6);
    EXPECT_EQ(eff->weight, 20);

    m.prior.reset();
    EXPECT_FALSE(effective_pct(m).has_value());
}

TEST(Strength, TeamSquadMergesRosterAndPlayers) {
    auto s = make_snapshot();
    s.players["Cat"].teams.push_back(team_stats("Lions", 5, 4));

    auto squad = team_squad("Lions", s);
    ASSERT_EQ(squad.size(), 3u);
    EXPECT_EQ(squad[0].name, "Cat"); // strongest first
    EXPECT_FALSE(squad[0].rostered);
    EXPECT_TRUE(team_squad("Tigers", s).empty());
}

TEST(Strength, SquadStrengthTopN) {
    std::vector<SquadMember> squad(3);
    squad[0] = {.name = "A", .current = team_stats("T", 10, 9)};
    squad[1] = {.name = "B", .current = team_stats("T", 10, 1)};
    squad[2] = {.name = "C"};

    auto all = squad_strength(squad);
    auto top = squad_strength(squad, 1);
    ASSERT_TRUE(all.has_value());
    ASSERT_TRUE(top.has_value());
    EXPECT_NEAR(*top, bayesian_pct(9, 10) / 100.0, 1e-12);
    EXPECT_LT(*all, *top);
    EXPECT_FALSE(squad_strength({}).has_value());
}

TEST(Strength, RemovingStrongestPlayerLowersStrength) {
    auto s = make_snapshot();
    s.players["Ann"].teams.push_back(team_stats("Lions", 10, 9));
    s.players["Bob"].teams.push_back(team_stats("Lions", 10, 3));

    SquadOverrides overrides;
    overrides["Lions"].removed.push_back("Ann");
    auto adj = squad_adjustments("D1", overrides, s);
    ASSERT_TRUE(adj.contains("Lions"));
    EXPECT_LT(adj["Lions"], 0.0);
    EXPECT_FALSE(adj.contains("Tigers"));
}

TEST(Strength, AddedPlayerUsesBusiestContext) {
    auto s = make_snapshot();
    s.players["Dee"].teams = {team_stats("Owls", 3, 1), team_stats("Hawks", 12, 10)};

    auto squad = apply_override({}, {.added = {"Dee"}}, s);
    ASSERT_EQ(squad.size(), 1u);
    ASSERT_TRUE(squad[0].current.has_value());
    EXPECT_EQ(squad[0].current->team, "Hawks");
}

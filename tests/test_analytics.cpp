#include <gtest/gtest.h>
#include "leaguesim/analytics.hpp"

using namespace leaguesim;

namespace {

struct FrameSpec {
    std::string home_player;
    std::string away_player;
    bool home_won;
};

MatchFrames make_match(const std::string& id, const std::string& date,
                       const std::string& home, const std::string& away,
                       const std::vector<FrameSpec>& specs) {
    MatchFrames m{.match_id = id, .date = date, .home = home, .away = away, .division = "D1"};
    int n = 1;
    for (auto& s : specs) {
        m.frames.push_back({
            .frame_number = n++,
            .home_player = s.home_player,
            .away_player = s.away_player,
            .winner = s.home_won ? Side::Home : Side::Away,
        });
    }
    return m;
}

// Ann plays one frame per match for Lions at home; results listed oldest first.
std::vector<MatchFrames> ann_history(const std::vector<bool>& wins) {
    std::vector<MatchFrames> frames;
    for (size_t i = 0; i < wins.size(); ++i) {
        auto date = (i + 1 < 10 ? "0" : "") + std::to_string(i + 1) + "-09-2025";
        frames.push_back(make_match("m" + std::to_string(i), date, "Lions", "Tigers",
                                    {{"Ann", "Opp" + std::to_string(i % 3), wins[i]}}));
    }
    return frames;
}

PlayerTeamStats stats(const std::string& team, int played, int won, int bd_for = 0,
                      int bd_against = 0, int forfeits = 0) {
    return {
        .team = team,
        .division = "D1",
        .played = played,
        .won = won,
        .pct = played > 0 ? 100.0 * won / played : 0.0,
        .bd_for = bd_for,
        .bd_against = bd_against,
        .forfeits = forfeits,
    };
}

} // namespace

TEST(Analytics, PlayerGamesMostRecentFirst) {
    auto games = player_games("Ann", ann_history({true, false, false}));
    ASSERT_EQ(games.size(), 3u);
    EXPECT_EQ(games[0].date, "03-09-2025");
    EXPECT_FALSE(games[0].won);
    EXPECT_TRUE(games[2].won);
    EXPECT_EQ(games[2].opponent, "Opp0");
}

TEST(Analytics, PlayerGamesLaterFramesFirstWithinMatch) {
    std::vector<MatchFrames> frames = {
        make_match("m1", "01-09-2025", "Lions", "Tigers",
                   {{"Ann", "Opp0", true}, {"Bob", "Opp1", true}, {"Ann", "Opp1", true},
                    {"Ann", "Opp2", false}}),
        make_match("m2", "08-09-2025", "Lions", "Tigers", {{"Ann", "Opp3", true}}),
    };

    auto games = player_games("Ann", frames);
    ASSERT_EQ(games.size(), 4u);
    EXPECT_EQ(games[0].opponent, "Opp3");
    EXPECT_EQ(games[1].opponent, "Opp2");
    EXPECT_FALSE(games[1].won);
    EXPECT_EQ(games[2].opponent, "Opp1");
    EXPECT_EQ(games[3].opponent, "Opp0");
}

TEST(Analytics, FormWindows) {
    // Oldest to newest: 4 losses then 6 wins.
    auto form = player_form("Ann", ann_history({false, false, false, false, true, true, true, true, true, true}), 55.0);
    EXPECT_EQ(form.last5.played, 5);
    EXPECT_EQ(form.last5.won, 5);
    EXPECT_EQ(form.last8.won, 6);
    EXPECT_DOUBLE_EQ(form.last8.pct, 75.0);
    EXPECT_EQ(form.last10.played, 10);
    EXPECT_DOUBLE_EQ(form.last10.pct, 60.0);
    EXPECT_TRUE(form.uses_last8());
    EXPECT_DOUBLE_EQ(form.form_pct(), 75.0);
    EXPECT_DOUBLE_EQ(form.season_pct, 55.0);
    EXPECT_EQ(form.recent.size(), 10u);
}

TEST(Analytics, HotAndColdTrends) {
    auto hot = player_form("Ann", ann_history({true, true, true, false, true}));
    EXPECT_EQ(hot.trend, FormTrend::Hot);

    auto cold = player_form("Ann", ann_history({false, false, true, false, false}));
    EXPECT_EQ(cold.trend, FormTrend::Cold);

    auto steady = player_form("Ann", ann_history({true, false, true, false, true, false}));
    EXPECT_EQ(steady.trend, FormTrend::Steady);
}

TEST(Analytics, TrendNeedsFiveGames) {
    auto form = player_form("Ann", ann_history({true, true, true, true}));
    EXPECT_EQ(form.trend, FormTrend::Steady);
    EXPECT_FALSE(form.uses_last8());
    EXPECT_DOUBLE_EQ(form.form_pct(), 100.0);
}

TEST(Analytics, StreakAndMomentum) {
    auto form = player_form("Ann", ann_history({false, true, true, true}));
    EXPECT_EQ(form.streak.kind, Streak::Kind::Win);
    EXPECT_EQ(form.streak.count, 3);
    EXPECT_GT(form.momentum, 0.0);

    auto all_lost = player_form("Ann", ann_history({false, false}));
    EXPECT_EQ(all_lost.streak.kind, Streak::Kind::Loss);
    EXPECT_DOUBLE_EQ(all_lost.momentum, -1.0);

    auto none = player_form("Nobody", ann_history({true}));
    EXPECT_EQ(none.streak.kind, Streak::Kind::None);
    EXPECT_DOUBLE_EQ(none.momentum, 0.0);
    EXPECT_EQ(none.last5.played, 0);
}

TEST(Analytics, HeadToHeadCountsBothVenues) {
    std::vector<MatchFrames> frames = {
        make_match("a", "01-09-2025", "Lions", "Tigers", {{"Ann", "Bob", true}, {"Ann", "Cat", false}}),
        make_match("b", "08-09-2025", "Tigers", "Lions", {{"Bob", "Ann", false}, {"Bob", "Ann", true}}),
        make_match("c", "15-09-2025", "Lions", "Tigers", {{"Ann", "Bob", true}}),
    };
    auto h2h = head_to_head("Ann", "Bob", frames);
    ASSERT_TRUE(h2h.has_value());
    EXPECT_EQ(h2h->wins, 3);
    EXPECT_EQ(h2h->losses, 1);
    EXPECT_EQ(h2h->net(), 2);
    EXPECT_EQ(h2h->edge, MatchupEdge::Strong);
    EXPECT_DOUBLE_EQ(h2h->confidence, 0.4);
    ASSERT_EQ(h2h->details.size(), 4u);
    EXPECT_EQ(h2h->details[0].first, "15-09-2025");

    auto reverse = head_to_head("Bob", "Ann", frames);
    ASSERT_TRUE(reverse.has_value());
    EXPECT_EQ(reverse->edge, MatchupEdge::Disadvantage);

    EXPECT_FALSE(head_to_head("Ann", "Dan", frames).has_value());
}

TEST(Analytics, PlayerHomeAway) {
    std::vector<MatchFrames> frames = {
        make_match("a", "01-09-2025", "Lions", "Tigers", {{"Ann", "Bob", true}, {"Ann", "Cat", false}}),
        make_match("b", "08-09-2025", "Tigers", "Lions", {{"Bob", "Ann", false}}),
    };
    auto split = player_home_away("Ann", frames);
    EXPECT_EQ(split.home.played, 2);
    EXPECT_DOUBLE_EQ(split.home.pct, 50.0);
    EXPECT_EQ(split.away.played, 1);
    EXPECT_DOUBLE_EQ(split.away.pct, 100.0);
}

TEST(Analytics, TeamHomeAway) {
    std::vector<MatchResult> results = {
        {"01-09-2025", "Lions", "Tigers", 6, 4, "D1"},
        {"08-09-2025", "Lions", "Bears", 5, 5, "D1"},
        {"15-09-2025", "Bears", "Lions", 2, 8, "D1"},
    };
    auto split = team_home_away("Lions", results);
    EXPECT_EQ(split.home.played, 2);
    EXPECT_EQ(split.home.won, 1);
    EXPECT_EQ(split.home.drawn, 1);
    EXPECT_DOUBLE_EQ(split.home.win_pct, 50.0);
    EXPECT_EQ(split.away.frames_for, 8);
    EXPECT_DOUBLE_EQ(split.away.win_pct, 100.0);
}

TEST(Analytics, SetPerformanceSplitsAtFrameFive) {
    std::vector<FrameSpec> specs;
    for (int i = 0; i < 10; ++i) specs.push_back({"H" + std::to_string(i), "A", i < 4});
    std::vector<MatchFrames> frames = {make_match("a", "01-09-2025", "Lions", "Tigers", specs)};

    auto home = set_performance("Lions", frames);
    ASSERT_TRUE(home.has_value());
    EXPECT_DOUBLE_EQ(home->set1.pct, 80.0);
    EXPECT_DOUBLE_EQ(home->set2.pct, 0.0);
    EXPECT_DOUBLE_EQ(home->bias, 80.0);

    auto away = set_performance("Tigers", frames);
    ASSERT_TRUE(away.has_value());
    EXPECT_DOUBLE_EQ(away->bias, -80.0);

    EXPECT_FALSE(set_performance("Bears", frames).has_value());
}

TEST(Analytics, AppearanceCategories) {
    std::vector<MatchFrames> frames;
    for (int i = 0; i < 4; ++i) {
        std::vector<FrameSpec> specs = {{"Ann", "X", true}};
        if (i < 2) specs.push_back({"Bob", "Y", true});
        if (i == 0) specs.push_back({"Cat", "Z", true});
        frames.push_back(make_match("m" + std::to_string(i), "0" + std::to_string(i + 1) + "-09-2025",
                                    "Lions", "Tigers", specs));
    }

    auto rates = appearance_rates("Lions", frames);
    ASSERT_EQ(rates.size(), 3u);
    EXPECT_EQ(rates[0].name, "Ann");
    EXPECT_EQ(rates[0].category, AppearanceCategory::Core);
    EXPECT_EQ(rates[0].total_matches, 4);
    EXPECT_EQ(rates[1].name, "Bob");
    EXPECT_EQ(rates[1].category, AppearanceCategory::Rotation);
    EXPECT_EQ(rates[2].category, AppearanceCategory::Fringe);
    EXPECT_DOUBLE_EQ(rates[2].rate, 0.25);

    EXPECT_TRUE(appearance_rates("Bears", frames).empty());
}

TEST(Analytics, MatchesWithoutIdKeyedByDate) {
    std::vector<MatchFrames> frames = {
        make_match("", "01-09-2025", "Lions", "Tigers", {{"Ann", "X", true}}),
        make_match("", "01-09-2025", "Lions", "Tigers", {{"Bob", "X", true}}),
    };
    auto rates = appearance_rates("Lions", frames);
    ASSERT_EQ(rates.size(), 2u);
    EXPECT_EQ(rates[0].total_matches, 1);
}

TEST(Analytics, PredictLineupFromRecentMatches) {
    std::vector<MatchFrames> frames = {
        make_match("a", "01-09-2025", "Lions", "Tigers", {{"Old", "X", true}}),
        make_match("b", "08-09-2025", "Tigers", "Lions", {{"X", "Ann", true}}),
        make_match("c", "15-09-2025", "Lions", "Tigers", {{"Bob", "X", true}, {"Ann", "Y", true}}),
    };
    auto lineup = predict_lineup("Lions", frames, 2);
    EXPECT_EQ(lineup.recent_players, (std::vector<std::string>{"Bob", "Ann"}));
    EXPECT_EQ(lineup.players.size(), 3u);
}

TEST(Analytics, BreakAndDish) {
    PlayersMap players;
    players["Ann"].teams = {stats("Lions", 10, 6, 3, 1, 1)};
    players["Bob"].teams = {stats("Lions", 10, 4, 1, 3, 0), stats("Owls", 5, 2, 4, 0, 0)};
    players["Bob"].teams[1].division = "D2";

    auto ann = player_break_and_dish("Ann", players);
    EXPECT_EQ(ann.net, 2);
    EXPECT_DOUBLE_EQ(ann.efficiency, 0.75);
    EXPECT_DOUBLE_EQ(ann.bd_for_per_game, 0.3);
    EXPECT_DOUBLE_EQ(ann.forfeit_rate, 0.1);

    auto bob_d1 = player_break_and_dish("Bob", players, "D1");
    EXPECT_EQ(bob_d1.games, 10);
    EXPECT_EQ(player_break_and_dish("Bob", players).games, 15);

    auto team = team_break_and_dish("Lions", players);
    EXPECT_EQ(team.games, 20);
    EXPECT_EQ(team.bd_for, 4);
    EXPECT_EQ(team.bd_against, 4);
    EXPECT_DOUBLE_EQ(team.efficiency, 0.5);

    auto nobody = player_break_and_dish("Nobody", players);
    EXPECT_EQ(nobody.games, 0);
    EXPECT_DOUBLE_EQ(nobody.efficiency, 0.5);
}

TEST(Analytics, TeamFormMostRecentFirst) {
    std::vector<MatchResult> results = {
        {"01-09-2025", "Lions", "Tigers", 6, 4, "D1"},
        {"08-09-2025", "Lions", "Bears", 5, 5, "D1"},
        {"15-09-2025", "Bears", "Lions", 8, 2, "D1"},
    };
    auto form = team_form("Lions", results, 2);
    ASSERT_EQ(form.size(), 2u);
    EXPECT_EQ(form[0], Outcome::Loss);
    EXPECT_EQ(form[1], Outcome::Draw);
    EXPECT_EQ(to_char(form[0]), 'L');
}

TEST(Analytics, ScoutingReportRanksPlayers) {
    LeagueSnapshot s;
    s.divisions["D1"] = {.name = "Division 1", .teams = {"Lions", "Tigers"}};
    for (int i = 0; i < 5; ++i) {
        s.players["P" + std::to_string(i)].teams = {stats("Lions", 10, 2 * i, 0, 0, i == 0 ? 2 : 0)};
    }
    s.players["Other"].teams = {stats("Tigers", 10, 10)};
    s.results = {{"01-09-2025", "Lions", "Tigers", 6, 4, "D1"}};

    auto report = scouting_report("Lions", "D1", s);
    EXPECT_EQ(report.team, "Lions");
    ASSERT_EQ(report.strongest.size(), 3u);
    EXPECT_EQ(report.strongest[0].name, "P4");
    ASSERT_EQ(report.weakest.size(), 3u);
    EXPECT_EQ(report.weakest[0].name, "P0");
    EXPECT_DOUBLE_EQ(report.forfeit_rate, 2.0 / 50.0);
    ASSERT_EQ(report.form.size(), 1u);
    EXPECT_EQ(report.form[0], Outcome::Win);
    EXPECT_EQ(report.break_and_dish.games, 50);
}

TEST(Analytics, LabelStrings) {
    EXPECT_EQ(to_string(FormTrend::Hot), "hot");
    EXPECT_EQ(to_string(MatchupEdge::Moderate), "moderate");
    EXPECT_EQ(to_string(AppearanceCategory::Rotation), "rotation");
}

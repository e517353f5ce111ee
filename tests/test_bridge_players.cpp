#include <gtest/gtest.h>
#include "leaguesim/bridge_players.hpp"

using namespace leaguesim;

namespace {

PlayerTeamStats context(const std::string& team, const std::string& division, int played,
                        double pct, bool cup = false) {
    return {
        .team = team,
        .division = division,
        .played = played,
        .won = static_cast<int>(played * pct / 100.0),
        .pct = pct,
        .cup = cup,
    };
}

LeagueSnapshot league(const std::string& id) {
    LeagueSnapshot s;
    s.league_id = id;
    s.divisions["D1"] = {.name = "Division 1"};
    s.divisions["D2"] = {.name = "Division 2"};
    return s;
}

} // namespace

TEST(BridgePlayers, NormalizesNames) {
    EXPECT_EQ(normalize_player_name("  John   SMITH "), "john smith");
    EXPECT_EQ(normalize_player_name("Ann\tLee"), "ann lee");
    EXPECT_EQ(normalize_player_name(""), "");
}

TEST(BridgePlayers, LevenshteinDistance) {
    EXPECT_EQ(levenshtein_distance("kitten", "sitting"), 3);
    EXPECT_EQ(levenshtein_distance("", "abc"), 3);
    EXPECT_EQ(levenshtein_distance("same", "same"), 0);
}

TEST(BridgePlayers, NameSimilarity) {
    EXPECT_DOUBLE_EQ(name_similarity("abc", "abc"), 1.0);
    EXPECT_DOUBLE_EQ(name_similarity("", "abc"), 0.0);
    EXPECT_NEAR(name_similarity("jon smith", "john smith"), 0.9, 1e-12);
}

TEST(BridgePlayers, IntraLeagueNeedsTwoDivisions) {
    auto s = league("north");
    s.players["Ann"].teams = {context("Lions", "D1", 10, 60), context("Owls", "D2", 8, 70)};
    s.players["Bob"].teams = {context("Lions", "D1", 10, 60), context("Tigers", "D1", 4, 50)};
    s.players["Cat"].teams = {context("Lions", "D1", 10, 60), context("Cup", "D2", 3, 100, true)};

    auto bridges = find_intra_league_bridge_players(s);
    ASSERT_EQ(bridges.size(), 1u);
    EXPECT_EQ(bridges[0].name, "Ann");
    EXPECT_EQ(bridges[0].canonical_name, "ann");
    ASSERT_EQ(bridges[0].contexts.size(), 2u);
    EXPECT_EQ(bridges[0].contexts[0].league_id, "north");
    EXPECT_DOUBLE_EQ(bridges[0].match_confidence, 1.0);
}

TEST(BridgePlayers, CrossLeagueExactMatch) {
    LeagueSet leagues;
    leagues["north"] = league("north");
    leagues["south"] = league("south");
    leagues["north"].players["John Smith"].teams = {context("Lions", "D1", 10, 60)};
    leagues["south"].players["john  smith"].teams = {context("Eagles", "D2", 12, 50)};
    leagues["south"].players["Zed"].teams = {context("Eagles", "D2", 12, 50)};

    auto bridges = find_cross_league_bridge_players(leagues);
    ASSERT_EQ(bridges.size(), 1u);
    EXPECT_EQ(bridges[0].canonical_name, "john smith");
    EXPECT_DOUBLE_EQ(bridges[0].match_confidence, 1.0);
    ASSERT_EQ(bridges[0].contexts.size(), 2u);
    EXPECT_NE(bridges[0].contexts[0].league_id, bridges[0].contexts[1].league_id);
}

TEST(BridgePlayers, CrossLeagueFuzzyMatch) {
    LeagueSet leagues;
    leagues["north"] = league("north");
    leagues["south"] = league("south");
    leagues["north"].players["Jon Smith"].teams = {context("Lions", "D1", 10, 60)};
    leagues["south"].players["John Smith"].teams = {context("Eagles", "D2", 12, 50)};
    leagues["south"].players["Jan Smyth"].teams = {context("Eagles", "D2", 12, 50)};

    auto bridges = find_cross_league_bridge_players(leagues, 0.85);
    ASSERT_EQ(bridges.size(), 1u);
    EXPECT_NEAR(bridges[0].match_confidence, 0.9, 1e-12);
    EXPECT_EQ(bridges[0].contexts.size(), 2u);

    EXPECT_TRUE(find_cross_league_bridge_players(leagues, 0.95).empty());
}

TEST(BridgePlayers, SingleLeagueHasNoCrossBridges) {
    LeagueSet leagues;
    leagues["north"] = league("north");
    leagues["north"].players["Ann"].teams = {context("Lions", "D1", 10, 60)};
    EXPECT_TRUE(find_cross_league_bridge_players(leagues).empty());
}

TEST(BridgePlayers, CupOnlyPlayersIgnored) {
    LeagueSet leagues;
    leagues["north"] = league("north");
    leagues["south"] = league("south");
    leagues["north"].players["Ann"].teams = {context("Cup", "D1", 3, 60, true)};
    leagues["south"].players["Ann"].teams = {context("Eagles", "D2", 12, 50)};
    EXPECT_TRUE(find_cross_league_bridge_players(leagues).empty());
}

TEST(BridgePlayers, AllCombinesIntraAndCross) {
    LeagueSet leagues;
    leagues["north"] = league("north");
    leagues["south"] = league("south");
    leagues["north"].players["Ann"].teams = {context("Lions", "D1", 10, 60), context("Owls", "D2", 8, 70)};
    leagues["south"].players["Ann"].teams = {context("Eagles", "D2", 12, 50)};

    auto bridges = find_all_bridge_players(leagues);
    ASSERT_EQ(bridges.size(), 2u);
    EXPECT_EQ(bridges[0].contexts.size(), 2u);
    EXPECT_EQ(bridges[1].contexts.size(), 3u);
}

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace leaguesim {

using Rng = std::mt19937_64;
using MatchDate = std::chrono::year_month_day;

// Source records

struct MatchResult {
    std::string date;
    std::string home;
    std::string away;
    int home_score = 0;
    int away_score = 0;
    std::string division;
};

struct Fixture {
    std::string date;
    std::string home;
    std::string away;
    std::string division;
};

enum class Side { Home, Away };

struct FrameRecord {
    int frame_number = 0;
    std::string home_player;
    std::string away_player;
    Side winner = Side::Home;
    bool break_and_dish = false;
    bool forfeit = false;
};

struct MatchFrames {
    std::string match_id;
    std::string date;
    std::string home;
    std::string away;
    std::string division;
    std::vector<FrameRecord> frames;
};

struct PriorPlayerStats {
    double rating = 0.0;
    double win_rate = 0.0; // 0-1
    int played = 0;
};

struct PlayerTeamStats {
    std::string team;
    std::string division;
    int played = 0;
    int won = 0;
    double pct = 0.0; // 0-100
    double lag = 0.0;
    int bd_for = 0;
    int bd_against = 0;
    int forfeits = 0;
    bool cup = false;
};

struct SeasonTotal {
    int played = 0;
    int won = 0;
    double pct = 0.0;
};

struct PlayerSeasonStats {
    std::vector<PlayerTeamStats> teams;
    SeasonTotal total;

    const PlayerTeamStats* for_team(const std::string& team) const {
        for (auto& t : teams) {
            if (t.team == team) return &t;
        }
        return nullptr;
    }
};

struct Division {
    std::string name;
    std::vector<std::string> teams;
};

using DivisionMap = std::map<std::string, Division>;
using PriorPlayersMap = std::map<std::string, PriorPlayerStats>;
using PlayersMap = std::map<std::string, PlayerSeasonStats>;
using RostersMap = std::map<std::string, std::vector<std::string>>; // "division:team"

struct LeagueSnapshot {
    std::string league_id;
    DivisionMap divisions;
    std::vector<MatchResult> results;
    std::vector<Fixture> fixtures;
    std::vector<MatchFrames> frames;
    PriorPlayersMap prior_players;
    PlayersMap players;
    RostersMap rosters;
};

using LeagueSet = std::map<std::string, LeagueSnapshot>;

// User inputs

struct WhatIfResult {
    std::string home;
    std::string away;
    int home_score = 0;
    int away_score = 0;
};

struct SquadOverride {
    std::vector<std::string> added;
    std::vector<std::string> removed;
};

using SquadOverrides = std::map<std::string, SquadOverride>;

struct PlayerAvailability {
    std::string name;
    bool available = true;
};

struct LineupLock {
    std::string player;
    int set = 1;
    int position = 1; // 1-5
};

// Standings and schedule

enum class Outcome { Win, Draw, Loss };

struct StandingEntry {
    std::string team;
    int played = 0;
    int won = 0;
    int drawn = 0;
    int lost = 0;
    int frames_for = 0;
    int frames_against = 0;
    int points = 0;

    int diff() const { return frames_for - frames_against; }
};

struct TeamResult {
    std::string date;
    std::string opponent;
    bool is_home = false;
    int team_score = 0;
    int opponent_score = 0;
    Outcome outcome = Outcome::Draw;
};

struct ScheduleStrength {
    std::string team;
    double completed = 0.0;
    double remaining = 0.0;
    double combined = 0.0;
    int rank = 0;
};

// Simulation output

struct SimulationResult {
    std::string team;
    int current_points = 0;
    double avg_points = 0.0;
    double p_title = 0.0;
    double p_top2 = 0.0;
    double p_bottom2 = 0.0;
    std::vector<double> position_probabilities;
};

struct Scoreline {
    int home = 0;
    int away = 0;
    double probability = 0.0;
};

struct MatchPrediction {
    double p_home_win = 0.0;
    double p_draw = 0.0;
    double p_away_win = 0.0;
    double expected_home = 0.0;
    double expected_away = 0.0;
    std::vector<Scoreline> top_scores;
};

struct FixtureImportance {
    Fixture fixture;
    double importance = 0.0;
    double p_top2_if_win = 0.0;
    double p_top2_if_loss = 0.0;
};

// Player and team analytics

struct WindowRecord {
    int played = 0;
    int won = 0;
    double pct = 0.0;
};

enum class FormTrend { Hot, Cold, Steady };

struct PlayerGame {
    std::string date;
    std::string opponent;
    bool won = false;
};

struct Streak {
    enum class Kind { Win, Loss, None } kind = Kind::None;
    int count = 0;
};

struct PlayerForm {
    WindowRecord last5;
    WindowRecord last8;
    WindowRecord last10;
    double season_pct = 0.0;
    FormTrend trend = FormTrend::Steady;
    Streak streak;
    double momentum = 0.0; // -1..1
    std::vector<PlayerGame> recent;

    bool uses_last8() const { return last8.played >= 6; }
    double form_pct() const { return uses_last8() ? last8.pct : last5.pct; }
};

enum class MatchupEdge { Strong, Moderate, Even, Disadvantage };

struct HeadToHead {
    std::string player_a;
    std::string player_b;
    int wins = 0;
    int losses = 0;
    std::vector<std::pair<std::string, std::string>> details; // (date, winner)
    MatchupEdge edge = MatchupEdge::Even;
    double confidence = 0.0;

    int net() const { return wins - losses; }
};

struct HomeAwaySplit {
    WindowRecord home;
    WindowRecord away;
};

struct VenueRecord {
    int played = 0;
    int won = 0;
    int drawn = 0;
    int lost = 0;
    int frames_for = 0;
    int frames_against = 0;
    double win_pct = 0.0;
};

struct TeamHomeAwaySplit {
    VenueRecord home;
    VenueRecord away;
};

struct SetPerformance {
    WindowRecord set1;
    WindowRecord set2;
    double bias = 0.0; // set1 pct - set2 pct
};

enum class AppearanceCategory { Core, Rotation, Fringe };

struct PlayerAppearance {
    std::string name;
    int appearances = 0;
    int total_matches = 0;
    double rate = 0.0;
    AppearanceCategory category = AppearanceCategory::Fringe;
};

struct PredictedLineup {
    std::vector<PlayerAppearance> players;
    std::vector<std::string> recent_players;
};

struct BreakAndDishStats {
    int games = 0;
    int bd_for = 0;
    int bd_against = 0;
    double bd_for_per_game = 0.0;
    double bd_against_per_game = 0.0;
    int net = 0;
    double efficiency = 0.5;
    double forfeit_rate = 0.0;
};

struct RankedPlayer {
    std::string name;
    double pct = 0.0;
    double adj_pct = 0.0;
    int played = 0;
};

struct ScoutingReport {
    std::string team;
    std::vector<Outcome> form;
    TeamHomeAwaySplit home_away;
    std::optional<SetPerformance> set_performance;
    BreakAndDishStats break_and_dish;
    PredictedLineup predicted_lineup;
    std::vector<RankedPlayer> strongest;
    std::vector<RankedPlayer> weakest;
    double forfeit_rate = 0.0;
};

// Lineup optimisation

struct ScoredPlayer {
    std::string name;
    double score = 0.0;
    double adj_pct = 0.0;
    std::optional<double> form_pct;
    int h2h_advantage = 0;
    std::optional<double> venue_pct;
};

struct LineupWinProbability {
    double p_win = 0.0;
    double p_draw = 0.0;
    double p_loss = 0.0;
    double expected_for = 0.0;
    double expected_against = 0.0;
    double confidence = 0.0;
    bool team_fallback = false;
};

struct Lineup {
    std::vector<std::string> set1;
    std::vector<std::string> set2;
    LineupWinProbability win_probability;
};

struct LineupAlternative {
    Lineup lineup;
    int rank = 0;
    double probability_deficit = 0.0;
};

struct OptimizedLineup {
    Lineup lineup;
    std::vector<ScoredPlayer> scores;
    std::vector<LineupAlternative> alternatives;
    std::vector<std::string> insights;
    bool best_in_set2 = false;
};

// Calibration

struct BridgeContext {
    std::string league_id;
    std::string player; // name as listed in that league
    std::string division;
    PlayerTeamStats stats;
};

struct BridgePlayer {
    std::string name;
    std::string canonical_name;
    std::vector<BridgeContext> contexts;
    double match_confidence = 1.0;
};

struct DivisionStrength {
    std::string division;
    std::string league_id;
    double offset = 0.0;
    double data_offset = 0.0;
    double confidence = 0.0;
    int bridge_player_count = 0;
    int sample_size = 0;
};

struct LeagueStrength {
    std::string league_id;
    double offset = 0.0;
    double confidence = 0.0;
    int bridge_player_count = 0;
    std::vector<DivisionStrength> divisions;
};

struct AdjustmentBreakdown {
    double division_offset = 0.0;
    double league_offset = 0.0;
    double total = 0.0;
};

struct AdjustedRating {
    double raw_pct = 0.0;
    double bayesian_pct = 0.0;
    double adjusted_pct = 0.0;
    double z_score = 0.0;
    double division_percentile = 50.0;
    double league_percentile = 50.0;
    double confidence = 0.0;
    AdjustmentBreakdown breakdown;
};

struct LoadError {
    std::string path;
    std::string message;
};

} // namespace leaguesim

#include "leaguesim/adjusted_rating.hpp"
#include "leaguesim/strength.hpp"
#include <algorithm>
#include <cmath>

namespace leaguesim {

namespace {

struct Distribution {
    double mean = 50.0;
    double stddev = 1.0;
};

Distribution distribution_of(const std::vector<double>& values) {
    if (values.empty()) return {};

    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= values.size();

    double variance = 0.0;
    for (double v : values) variance += (v - mean) * (v - mean);
    double stddev = std::sqrt(variance / values.size());
    return {mean, stddev > 0.0 ? stddev : 1.0};
}

// Share of the pool strictly below `value`, 0-100.
double percentile_in(double value, const std::vector<double>& pool) {
    if (pool.empty()) return 50.0;
    auto below = std::ranges::count_if(pool, [&](double v) { return v < value; });
    return static_cast<double>(below) / pool.size() * 100.0;
}

std::vector<double> division_player_pool(const std::string& division, const PlayersMap& players,
                                         const EngineConfig& config) {
    std::vector<double> pool;
    for (auto& [name, data] : players) {
        for (auto& t : data.teams) {
            if (t.division != division || t.cup) continue;
            if (t.played < config.calibration.min_context_games) continue;
            pool.push_back(bayesian_pct(t.won, t.played, config.strength));
        }
    }
    return pool;
}

std::vector<double> league_player_pool(const PlayersMap& players, const EngineConfig& config) {
    std::vector<double> pool;
    for (auto& [name, data] : players) {
        if (data.total.played < config.calibration.min_context_games) continue;
        pool.push_back(bayesian_pct(data.total.won, data.total.played, config.strength));
    }
    return pool;
}

std::pair<int, int> team_record(const std::string& team, const PlayersMap& players) {
    int won = 0;
    int played = 0;
    for (auto& [name, data] : players) {
        for (auto& t : data.teams) {
            if (t.team != team || t.cup) continue;
            won += t.won;
            played += t.played;
        }
    }
    return {won, played};
}

std::vector<double> team_pool(const std::vector<std::string>& teams, const PlayersMap& players,
                              const EngineConfig& config) {
    std::vector<double> pool;
    for (auto& team : teams) {
        auto [won, played] = team_record(team, players);
        if (played >= config.calibration.min_context_games) {
            pool.push_back(bayesian_pct(won, played, config.strength));
        }
    }
    return pool;
}

AdjustedRating build_rating(double raw_pct, double bayesian, const std::string& league_id,
                            const std::string& division,
                            const std::vector<LeagueStrength>& strengths) {
    auto league = std::ranges::find(strengths, league_id, &LeagueStrength::league_id);
    const DivisionStrength* div = nullptr;
    if (league != strengths.end()) {
        auto it = std::ranges::find(league->divisions, division, &DivisionStrength::division);
        if (it != league->divisions.end()) div = &*it;
    }

    double division_offset = div ? div->offset : 0.0;
    double league_offset = league != strengths.end() ? league->offset : 0.0;
    double division_confidence = div ? div->confidence : 0.0;
    double league_confidence = league != strengths.end() ? league->confidence : 0.0;

    return {
        .raw_pct = raw_pct,
        .bayesian_pct = bayesian,
        .adjusted_pct = bayesian + division_offset + league_offset,
        .confidence = std::min(division_confidence, league_confidence),
        .breakdown = {
            .division_offset = division_offset,
            .league_offset = league_offset,
            .total = division_offset + league_offset,
        },
    };
}

} // namespace

std::optional<AdjustedRating> adjusted_player_rating(const std::string& player,
                                                     const std::string& league_id,
                                                     const std::string& division,
                                                     const LeagueSnapshot& league,
                                                     const std::vector<LeagueStrength>& strengths,
                                                     const EngineConfig& config) {
    auto it = league.players.find(player);
    if (it == league.players.end()) return std::nullopt;

    auto entry = std::ranges::find_if(it->second.teams, [&](const PlayerTeamStats& t) {
        return t.division == division && !t.cup;
    });
    if (entry == it->second.teams.end() || entry->played == 0) return std::nullopt;

    double bayesian = bayesian_pct(entry->won, entry->played, config.strength);
    auto rating = build_rating(entry->pct, bayesian, league_id, division, strengths);

    auto pool = division_player_pool(division, league.players, config);
    auto dist = distribution_of(pool);
    rating.z_score = (bayesian - dist.mean) / dist.stddev;
    rating.division_percentile = percentile_in(bayesian, pool);
    rating.league_percentile = percentile_in(bayesian, league_player_pool(league.players, config));
    return rating;
}

std::optional<AdjustedRating> adjusted_team_rating(const std::string& team,
                                                   const std::string& league_id,
                                                   const std::string& division,
                                                   const LeagueSnapshot& league,
                                                   const std::vector<LeagueStrength>& strengths,
                                                   const EngineConfig& config) {
    auto [won, played] = team_record(team, league.players);
    if (played == 0) return std::nullopt;

    double raw = static_cast<double>(won) / played * 100.0;
    double bayesian = bayesian_pct(won, played, config.strength);
    auto rating = build_rating(raw, bayesian, league_id, division, strengths);

    std::vector<std::string> division_teams;
    std::vector<std::string> league_teams;
    for (auto& [code, div] : league.divisions) {
        if (code == division) division_teams = div.teams;
        league_teams.insert(league_teams.end(), div.teams.begin(), div.teams.end());
    }

    auto pool = team_pool(division_teams, league.players, config);
    auto dist = distribution_of(pool);
    rating.z_score = (bayesian - dist.mean) / dist.stddev;
    rating.division_percentile = percentile_in(bayesian, pool);
    rating.league_percentile = percentile_in(bayesian, team_pool(league_teams, league.players, config));
    return rating;
}

std::map<std::string, double> global_percentiles(const std::vector<KeyedRating>& ratings) {
    std::vector<const KeyedRating*> sorted;
    for (auto& r : ratings) sorted.push_back(&r);
    std::ranges::stable_sort(sorted, {}, [](const KeyedRating* r) { return r->rating.adjusted_pct; });

    std::map<std::string, double> out;
    for (size_t i = 0; i < sorted.size(); ++i) {
        out[sorted[i]->key] = static_cast<double>(i + 1) / sorted.size() * 100.0;
    }
    return out;
}

} // namespace leaguesim

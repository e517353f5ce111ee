#include "leaguesim/simulation.hpp"
#include "leaguesim/matchup.hpp"
#include "leaguesim/schedule.hpp"
#include "leaguesim/standings.hpp"
#include "leaguesim/strength.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_map>
#include <unordered_set>

namespace leaguesim {

namespace {

std::string pairing_key(const std::string& home, const std::string& away) {
    return home + ":" + away;
}

double strength_of(const std::map<std::string, double>& strengths, const std::string& team) {
    auto it = strengths.find(team);
    return it == strengths.end() ? 0.0 : it->second;
}

struct SimRow {
    int points = 0;
    int diff = 0;
};

struct ScheduledMatch {
    size_t home = 0;
    size_t away = 0;
    double probability = 0.5;
};

void apply_score(SimRow& home, SimRow& away, int home_score, int away_score) {
    auto [home_pts, away_pts] = points_for(home_score, away_score);
    home.points += home_pts;
    away.points += away_pts;
    home.diff += home_score - away_score;
    away.diff += away_score - home_score;
}

} // namespace

std::pair<int, int> simulate_match(double frame_probability, Rng& rng, int frames) {
    std::bernoulli_distribution frame(std::clamp(frame_probability, 0.0, 1.0));
    int home = 0;
    for (int i = 0; i < frames; ++i) {
        if (frame(rng)) home++;
    }
    return {home, frames - home};
}

std::vector<SimulationResult> run_season_simulation(const SeasonInput& input, Rng& rng,
                                                    const SimulationConfig& config) {
    const size_t n = input.teams.size();
    if (n == 0) return {};

    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < n; ++i) index.emplace(input.teams[i], i);

    std::vector<SimRow> start(n);
    std::vector<int> current_points(n, 0);
    for (auto& s : input.standings) {
        auto it = index.find(s.team);
        if (it == index.end()) continue;
        start[it->second] = {s.points, s.diff()};
        current_points[it->second] = s.points;
    }

    // What-ifs are fixed outcomes: apply once, skip their fixtures.
    std::unordered_set<std::string> fixed;
    for (auto& wi : input.what_ifs) {
        auto h = index.find(wi.home);
        auto a = index.find(wi.away);
        if (h == index.end() || a == index.end()) continue;
        apply_score(start[h->second], start[a->second], wi.home_score, wi.away_score);
        fixed.insert(pairing_key(wi.home, wi.away));
    }

    std::vector<ScheduledMatch> schedule;
    for (auto& f : input.fixtures) {
        auto h = index.find(f.home);
        auto a = index.find(f.away);
        if (h == index.end() || a == index.end()) continue;
        if (fixed.contains(pairing_key(f.home, f.away))) continue;
        schedule.push_back({
            .home = h->second,
            .away = a->second,
            .probability = frame_win_probability(strength_of(input.strengths, f.home),
                                                 strength_of(input.strengths, f.away),
                                                 config.home_advantage),
        });
    }

    const int runs = std::max(1, config.season_runs);
    std::vector<long long> total_points(n, 0);
    std::vector<std::vector<int>> positions(n, std::vector<int>(n, 0));
    std::vector<size_t> order(n);

    for (int run = 0; run < runs; ++run) {
        auto table = start;
        for (auto& m : schedule) {
            auto [hs, as] = simulate_match(m.probability, rng, config.frames_per_match);
            apply_score(table[m.home], table[m.away], hs, as);
        }

        std::iota(order.begin(), order.end(), size_t{0});
        std::ranges::stable_sort(order, [&](size_t a, size_t b) {
            if (table[a].points != table[b].points) return table[a].points > table[b].points;
            return table[a].diff > table[b].diff;
        });

        for (size_t pos = 0; pos < n; ++pos) {
            positions[order[pos]][pos]++;
            total_points[order[pos]] += table[order[pos]].points;
        }
    }

    const double r = static_cast<double>(runs);
    const size_t band = std::min<size_t>(2, n);
    std::vector<SimulationResult> results;
    for (size_t i = 0; i < n; ++i) {
        SimulationResult sr{
            .team = input.teams[i],
            .current_points = current_points[i],
            .avg_points = total_points[i] / r,
        };
        for (int count : positions[i]) sr.position_probabilities.push_back(count / r);

        sr.p_title = sr.position_probabilities[0];
        for (size_t p = 0; p < band; ++p) {
            sr.p_top2 += sr.position_probabilities[p];
            sr.p_bottom2 += sr.position_probabilities[n - 1 - p];
        }
        results.push_back(std::move(sr));
    }

    std::ranges::stable_sort(results, std::greater{}, &SimulationResult::avg_points);
    return results;
}

SeasonInput build_season_input(const std::string& division, const LeagueSnapshot& snapshot,
                               const std::vector<WhatIfResult>& what_ifs,
                               const SquadOverrides& overrides,
                               const EngineConfig& config) {
    SeasonInput input;
    auto it = snapshot.divisions.find(division);
    if (it == snapshot.divisions.end()) return input;

    input.teams = it->second.teams;
    input.standings = calc_standings(division, snapshot);
    input.strengths = calc_team_strength(division, snapshot, config.strength);
    for (auto& [team, adj] : squad_adjustments(division, overrides, snapshot,
                                               config.lineup.squad_top_n, config.strength)) {
        if (input.strengths.contains(team)) input.strengths[team] += adj;
    }
    input.fixtures = remaining_fixtures(division, snapshot);
    input.what_ifs = what_ifs;
    return input;
}

std::vector<SimulationResult> simulate_division(const std::string& division,
                                                const LeagueSnapshot& snapshot,
                                                const std::vector<WhatIfResult>& what_ifs,
                                                const SquadOverrides& overrides,
                                                Rng& rng,
                                                const EngineConfig& config) {
    auto input = build_season_input(division, snapshot, what_ifs, overrides, config);
    return run_season_simulation(input, rng, config.simulation);
}

MatchPrediction predict_match(double frame_probability, Rng& rng,
                              const SimulationConfig& config) {
    const int runs = std::max(1, config.prediction_runs);
    const int frames = config.frames_per_match;

    int home_wins = 0;
    int draws = 0;
    int away_wins = 0;
    std::vector<int> by_home_frames(frames + 1, 0);

    for (int i = 0; i < runs; ++i) {
        auto [hf, af] = simulate_match(frame_probability, rng, frames);
        if (hf > af) home_wins++;
        else if (hf < af) away_wins++;
        else draws++;
        by_home_frames[hf]++;
    }

    const double r = static_cast<double>(runs);
    MatchPrediction prediction{
        .p_home_win = home_wins / r,
        .p_draw = draws / r,
        .p_away_win = away_wins / r,
        .expected_home = frame_probability * frames,
        .expected_away = (1.0 - frame_probability) * frames,
    };

    for (int hf = 0; hf <= frames; ++hf) {
        if (by_home_frames[hf] == 0) continue;
        prediction.top_scores.push_back({hf, frames - hf, by_home_frames[hf] / r});
    }
    std::ranges::stable_sort(prediction.top_scores, std::greater{}, &Scoreline::probability);
    if (static_cast<int>(prediction.top_scores.size()) > config.top_scorelines) {
        prediction.top_scores.resize(config.top_scorelines);
    }
    return prediction;
}

MatchPrediction predict_fixture(const std::string& home, const std::string& away,
                                const LeagueSnapshot& snapshot, Rng& rng,
                                const EngineConfig& config) {
    double p = frame_win_probability(team_strength(home, snapshot, config.strength),
                                     team_strength(away, snapshot, config.strength),
                                     config.simulation.home_advantage);
    return predict_match(p, rng, config.simulation);
}

std::vector<FixtureImportance> fixture_importance(const std::string& division,
                                                  const std::string& team,
                                                  const LeagueSnapshot& snapshot,
                                                  const std::vector<WhatIfResult>& what_ifs,
                                                  const SquadOverrides& overrides,
                                                  Rng& rng,
                                                  const EngineConfig& config) {
    auto base = build_season_input(division, snapshot, what_ifs, overrides, config);

    std::unordered_set<std::string> fixed;
    for (auto& wi : what_ifs) fixed.insert(pairing_key(wi.home, wi.away));

    const int win = config.simulation.importance_win_frames;
    const int loss = config.simulation.frames_per_match - win;

    auto top2_with = [&](const WhatIfResult& extra) -> std::optional<double> {
        auto input = base;
        input.what_ifs.push_back(extra);
        for (auto& sr : run_season_simulation(input, rng, config.simulation)) {
            if (sr.team == team) return sr.p_top2;
        }
        return std::nullopt;
    };

    std::vector<FixtureImportance> out;
    for (auto& f : base.fixtures) {
        if (f.home != team && f.away != team) continue;
        if (fixed.contains(pairing_key(f.home, f.away))) continue;

        bool home = f.home == team;
        auto if_win = top2_with({f.home, f.away, home ? win : loss, home ? loss : win});
        auto if_loss = top2_with({f.home, f.away, home ? loss : win, home ? win : loss});
        if (!if_win || !if_loss) continue;

        out.push_back({
            .fixture = f,
            .importance = std::abs(*if_win - *if_loss),
            .p_top2_if_win = *if_win,
            .p_top2_if_loss = *if_loss,
        });
    }

    std::ranges::stable_sort(out, std::greater{}, &FixtureImportance::importance);
    return out;
}

ScheduleStrength schedule_strength(const std::string& team, const std::string& division,
                                   const LeagueSnapshot& snapshot,
                                   const StrengthConfig& config) {
    auto strengths = calc_team_strength(division, snapshot, config);

    double completed_total = 0.0;
    int completed_count = 0;
    for (auto& r : team_results(team, snapshot.results)) {
        auto it = strengths.find(r.opponent);
        if (it == strengths.end()) continue;
        completed_total += it->second;
        completed_count++;
    }

    double remaining_total = 0.0;
    int remaining_count = 0;
    for (auto& f : remaining_fixtures(division, snapshot)) {
        if (f.home != team && f.away != team) continue;
        auto it = strengths.find(f.home == team ? f.away : f.home);
        if (it == strengths.end()) continue;
        remaining_total += it->second;
        remaining_count++;
    }

    int total = completed_count + remaining_count;
    return {
        .team = team,
        .completed = completed_count > 0 ? completed_total / completed_count : 0.0,
        .remaining = remaining_count > 0 ? remaining_total / remaining_count : 0.0,
        .combined = total > 0 ? (completed_total + remaining_total) / total : 0.0,
    };
}

std::vector<ScheduleStrength> division_schedule_strength(const std::string& division,
                                                         const LeagueSnapshot& snapshot,
                                                         const StrengthConfig& config) {
    auto it = snapshot.divisions.find(division);
    if (it == snapshot.divisions.end()) return {};

    std::vector<ScheduleStrength> entries;
    for (auto& team : it->second.teams) {
        entries.push_back(schedule_strength(team, division, snapshot, config));
    }

    std::ranges::stable_sort(entries, std::greater{}, &ScheduleStrength::remaining);
    for (size_t i = 0; i < entries.size(); ++i) entries[i].rank = static_cast<int>(i) + 1;
    return entries;
}

} // namespace leaguesim

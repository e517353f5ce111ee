#include "leaguesim/lineup.hpp"
#include "leaguesim/analytics.hpp"
#include "leaguesim/matchup.hpp"
#include "leaguesim/schedule.hpp"
#include "leaguesim/simulation.hpp"
#include "leaguesim/strength.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace leaguesim {

namespace {

constexpr size_t kInsightPlayers = 3;
constexpr int kH2HStarNet = 2;

struct Slot {
    std::string player;
    bool locked = false;
};

using SetSlots = std::vector<Slot>;

std::vector<std::string> names_of(const SetSlots& set) {
    std::vector<std::string> names;
    for (auto& slot : set) names.push_back(slot.player);
    return names;
}

std::string lineup_key(const SetSlots& set1, const SetSlots& set2) {
    auto names = names_of(set1);
    for (auto& slot : set2) names.push_back(slot.player);
    std::ranges::sort(names);

    std::string key;
    for (auto& n : names) key += n + ",";
    return key;
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += ", ";
        out += parts[i];
    }
    return out;
}

std::string rounded(double pct) {
    return std::to_string(std::lround(pct)) + "%";
}

LineupWinProbability from_team_view(const MatchPrediction& prediction, bool is_home,
                                    bool team_fallback) {
    LineupWinProbability wp{
        .p_win = is_home ? prediction.p_home_win : prediction.p_away_win,
        .p_draw = prediction.p_draw,
        .p_loss = is_home ? prediction.p_away_win : prediction.p_home_win,
        .expected_for = is_home ? prediction.expected_home : prediction.expected_away,
        .expected_against = is_home ? prediction.expected_away : prediction.expected_home,
        .team_fallback = team_fallback,
    };
    wp.confidence = std::max({wp.p_win, wp.p_draw, wp.p_loss});
    return wp;
}

std::string form_context(const std::string& name, const PlayerForm& form) {
    std::string label = form.uses_last8() ? "L8" : "L5";
    return name + " (" + label + ": " + rounded(form.form_pct()) + " vs " +
           rounded(form.season_pct) + " season)";
}

std::vector<std::string> lineup_insights(const std::vector<ScoredPlayer>& scored,
                                         const std::vector<std::string>& available,
                                         bool best_in_set2,
                                         const LeagueSnapshot& snapshot,
                                         const LineupConfig& config) {
    std::vector<std::string> insights;

    if (!snapshot.frames.empty()) {
        std::vector<std::string> hot;
        std::vector<std::string> cold;
        for (auto& sp : scored) {
            auto& total = snapshot.players.at(sp.name).total;
            auto form = player_form(sp.name, snapshot.frames, total.pct);
            if (form.trend == FormTrend::Hot && hot.size() < kInsightPlayers) {
                hot.push_back(form_context(sp.name, form));
            } else if (form.trend == FormTrend::Cold && cold.size() < kInsightPlayers) {
                cold.push_back(form_context(sp.name, form));
            }
        }
        if (!hot.empty()) insights.push_back("In form: " + join(hot));
        if (!cold.empty()) insights.push_back("Out of form: " + join(cold));
    }

    if (best_in_set2) {
        insights.push_back("Opponent is stronger in set 1, best players held back for set 2");
    }

    std::vector<std::string> stars;
    for (auto& sp : scored) {
        if (sp.h2h_advantage < kH2HStarNet) continue;
        stars.push_back(sp.name + " (+" + std::to_string(sp.h2h_advantage) + ")");
        if (stars.size() >= kInsightPlayers) break;
    }
    if (!stars.empty()) insights.push_back("H2H advantage: " + join(stars));

    std::vector<std::string> excluded;
    for (auto& name : available) {
        auto it = snapshot.players.find(name);
        if (it == snapshot.players.end()) continue;
        int played = it->second.total.played;
        if (played >= 1 && played < config.min_games) excluded.push_back(name);
    }
    if (!excluded.empty()) {
        insights.push_back("Excluded (<" + std::to_string(config.min_games) + " games): " +
                           join(excluded));
    }
    return insights;
}

} // namespace

std::vector<std::string> available_players(const std::vector<std::string>& roster,
                                           const std::vector<PlayerAvailability>& availability) {
    std::set<std::string> marked;
    for (auto& a : availability) {
        if (a.available) marked.insert(a.name);
    }

    // Roster order kept, each name once.
    std::set<std::string> seen;
    std::vector<std::string> out;
    for (auto& name : roster) {
        if (!availability.empty() && !marked.contains(name)) continue;
        if (seen.insert(name).second) out.push_back(name);
    }
    return out;
}

std::vector<ScoredPlayer> score_players(const std::vector<std::string>& players,
                                        const std::string& opponent, bool is_home,
                                        const LeagueSnapshot& snapshot,
                                        const EngineConfig& config) {
    const auto& lc = config.lineup;
    const auto& frames = snapshot.frames;

    std::vector<std::string> likely_opponents;
    if (!frames.empty()) {
        likely_opponents = predict_lineup(opponent, frames, lc.recent_matches).recent_players;
    }

    std::vector<ScoredPlayer> scored;
    for (auto& name : players) {
        auto it = snapshot.players.find(name);
        if (it == snapshot.players.end() || it->second.total.played < lc.min_games) continue;

        auto& total = it->second.total;
        double adj = bayesian_pct(total.won, total.played, config.strength);
        ScoredPlayer sp{.name = name, .score = adj, .adj_pct = adj};

        if (!frames.empty()) {
            auto form = player_form(name, frames, total.pct);
            if (form.last5.played > 0) sp.form_pct = form.form_pct();

            for (auto& opp : likely_opponents) {
                if (auto h2h = head_to_head(name, opp, frames)) sp.h2h_advantage += h2h->net();
            }

            auto split = player_home_away(name, frames);
            auto& venue = is_home ? split.home : split.away;
            if (venue.played >= lc.min_venue_games) sp.venue_pct = venue.pct;
        }

        if (sp.form_pct) sp.score += (*sp.form_pct - adj) * lc.form_weight;
        sp.score += sp.h2h_advantage * lc.h2h_weight;
        if (sp.venue_pct) sp.score += (*sp.venue_pct - adj) * lc.venue_weight;

        scored.push_back(std::move(sp));
    }

    std::ranges::stable_sort(scored, std::greater{}, &ScoredPlayer::score);
    return scored;
}

LineupWinProbability lineup_win_probability(const std::vector<std::string>& set1,
                                            const std::vector<std::string>& set2,
                                            const std::string& team,
                                            const std::string& opponent, bool is_home,
                                            const LeagueSnapshot& snapshot, Rng& rng,
                                            const EngineConfig& config) {
    double total_adj = 0.0;
    int rated = 0;
    for (auto* set : {&set1, &set2}) {
        for (auto& name : *set) {
            auto it = snapshot.players.find(name);
            if (it == snapshot.players.end() || it->second.total.played <= 0) continue;
            total_adj += bayesian_pct(it->second.total.won, it->second.total.played,
                                      config.strength);
            rated++;
        }
    }

    const double ha = config.simulation.home_advantage;
    double opponent_strength = team_strength(opponent, snapshot, config.strength);

    if (rated < config.lineup.min_rated_players) {
        if (!division_of(team, snapshot)) {
            return {
                .p_loss = 1.0,
                .expected_against = static_cast<double>(config.simulation.frames_per_match),
                .confidence = 1.0,
                .team_fallback = true,
            };
        }
        double own = team_strength(team, snapshot, config.strength);
        double p = is_home ? frame_win_probability(own, opponent_strength, ha)
                           : frame_win_probability(opponent_strength, own, ha);
        return from_team_view(predict_match(p, rng, config.simulation), is_home, true);
    }

    double lineup_strength = (total_adj / rated / 100.0 - 0.5) * config.strength.strength_scale;
    double p = is_home ? frame_win_probability(lineup_strength, opponent_strength, ha)
                       : frame_win_probability(opponent_strength, lineup_strength, ha);
    return from_team_view(predict_match(p, rng, config.simulation), is_home, false);
}

std::optional<OptimizedLineup> optimize_lineup(const LineupRequest& request,
                                               const LeagueSnapshot& snapshot, Rng& rng,
                                               const EngineConfig& config) {
    const auto& lc = config.lineup;
    auto available = available_players(request.roster, request.availability);
    if (static_cast<int>(available.size()) < lc.min_available) return std::nullopt;

    auto scored = score_players(available, request.opponent, request.is_home, snapshot, config);

    SetSlots set1(lc.set_size);
    SetSlots set2(lc.set_size);
    std::set<std::string> locked;
    for (auto& lock : request.locks) {
        if (lock.position < 1 || lock.position > lc.set_size) continue;
        if (lock.set != 1 && lock.set != 2) continue;
        if (lock.player.empty() || locked.contains(lock.player)) continue;

        auto& slot = (lock.set == 1 ? set1 : set2)[lock.position - 1];
        if (slot.locked) continue;
        slot = {.player = lock.player, .locked = true};
        locked.insert(lock.player);
    }

    std::optional<SetPerformance> opponent_sets;
    if (!snapshot.frames.empty()) opponent_sets = set_performance(request.opponent, snapshot.frames);
    bool best_in_set2 = opponent_sets && opponent_sets->bias > lc.set_bias_threshold;

    std::vector<const ScoredPlayer*> pool;
    for (auto& sp : scored) {
        if (!locked.contains(sp.name)) pool.push_back(&sp);
    }

    size_t next = 0;
    auto fill = [&](SetSlots& set) {
        for (auto& slot : set) {
            if (slot.locked || next >= pool.size()) continue;
            slot.player = pool[next++]->name;
        }
    };
    if (best_in_set2) {
        fill(set2);
        fill(set1);
    } else {
        fill(set1);
        fill(set2);
    }

    auto incomplete = [](const SetSlots& set) {
        return std::ranges::any_of(set, [](const Slot& s) { return s.player.empty(); });
    };
    if (incomplete(set1) || incomplete(set2)) return std::nullopt;

    auto evaluate = [&](const SetSlots& a, const SetSlots& b) {
        return lineup_win_probability(names_of(a), names_of(b), request.team, request.opponent,
                                      request.is_home, snapshot, rng, config);
    };

    OptimizedLineup result{
        .lineup = {names_of(set1), names_of(set2), evaluate(set1, set2)},
        .scores = scored,
        .best_in_set2 = best_in_set2,
    };

    // Single swaps of a bench player into an unlocked slot.
    std::set<std::string> seen{lineup_key(set1, set2)};
    for (size_t b = next; b < pool.size(); ++b) {
        for (int set_no = 1; set_no <= 2; ++set_no) {
            for (int pos = 0; pos < lc.set_size; ++pos) {
                auto alt1 = set1;
                auto alt2 = set2;
                auto& slot = (set_no == 1 ? alt1 : alt2)[pos];
                if (slot.locked) continue;
                slot.player = pool[b]->name;

                if (!seen.insert(lineup_key(alt1, alt2)).second) continue;
                result.alternatives.push_back({
                    .lineup = {names_of(alt1), names_of(alt2), evaluate(alt1, alt2)},
                });
            }
        }
    }

    std::ranges::stable_sort(result.alternatives, std::greater{}, [](const LineupAlternative& a) {
        return a.lineup.win_probability.p_win;
    });
    if (static_cast<int>(result.alternatives.size()) > request.alternatives) {
        result.alternatives.resize(std::max(0, request.alternatives));
    }
    for (size_t i = 0; i < result.alternatives.size(); ++i) {
        auto& alt = result.alternatives[i];
        alt.rank = static_cast<int>(i) + 1;
        alt.probability_deficit =
            result.lineup.win_probability.p_win - alt.lineup.win_probability.p_win;
    }

    result.insights = lineup_insights(scored, available, best_in_set2, snapshot, lc);
    return result;
}

} // namespace leaguesim

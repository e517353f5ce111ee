#include "leaguesim/analytics.hpp"
#include "leaguesim/schedule.hpp"
#include "leaguesim/strength.hpp"
#include <algorithm>
#include <set>

namespace leaguesim {

namespace {

constexpr int kShortWindow = 5;
constexpr int kMediumWindow = 8;
constexpr int kLongWindow = 10;
constexpr double kHotPct = 65.0;
constexpr double kColdPct = 40.0;
constexpr int kMinGamesForTrend = 5;
constexpr double kCoreRate = 0.75;
constexpr double kRotationRate = 0.4;
constexpr int kScoutedPlayers = 3;

std::vector<const MatchFrames*> most_recent_first(const std::vector<MatchFrames>& frames) {
    std::vector<const MatchFrames*> sorted;
    for (auto& m : frames) sorted.push_back(&m);
    std::ranges::stable_sort(sorted, std::greater{},
                             [](const MatchFrames* m) { return date_sort_key(m->date); });
    return sorted;
}

bool won_by(const FrameRecord& frame, bool home) {
    return home ? frame.winner == Side::Home : frame.winner == Side::Away;
}

WindowRecord window(const std::vector<PlayerGame>& games, int size) {
    WindowRecord w;
    for (int i = 0; i < size && i < static_cast<int>(games.size()); ++i) {
        w.played++;
        if (games[i].won) w.won++;
    }
    w.pct = w.played > 0 ? static_cast<double>(w.won) / w.played * 100.0 : 0.0;
    return w;
}

Streak current_streak(const std::vector<PlayerGame>& games) {
    if (games.empty()) return {};
    bool first = games.front().won;
    Streak s{.kind = first ? Streak::Kind::Win : Streak::Kind::Loss};
    for (auto& g : games) {
        if (g.won != first) break;
        s.count++;
    }
    return s;
}

double momentum(const std::vector<PlayerGame>& games) {
    double weighted = 0.0;
    double total = 0.0;
    for (int i = 0; i < kShortWindow && i < static_cast<int>(games.size()); ++i) {
        double weight = kShortWindow - i;
        if (games[i].won) weighted += weight;
        total += weight;
    }
    if (total == 0.0) return 0.0;
    return (weighted / total - 0.5) * 2.0;
}

std::string match_key(const MatchFrames& m) {
    return m.match_id.empty() ? m.date : m.match_id;
}

void add_record(VenueRecord& v, int team_score, int opponent_score) {
    v.played++;
    v.frames_for += team_score;
    v.frames_against += opponent_score;
    if (team_score > opponent_score) v.won++;
    else if (team_score < opponent_score) v.lost++;
    else v.drawn++;
}

BreakAndDishStats finish_bd(int games, int bd_for, int bd_against, int forfeits) {
    BreakAndDishStats s{
        .games = games,
        .bd_for = bd_for,
        .bd_against = bd_against,
        .net = bd_for - bd_against,
    };
    if (games > 0) {
        s.bd_for_per_game = static_cast<double>(bd_for) / games;
        s.bd_against_per_game = static_cast<double>(bd_against) / games;
        s.forfeit_rate = static_cast<double>(forfeits) / games;
    }
    if (bd_for + bd_against > 0) {
        s.efficiency = static_cast<double>(bd_for) / (bd_for + bd_against);
    }
    return s;
}

} // namespace

std::vector<PlayerGame> player_games(const std::string& player,
                                     const std::vector<MatchFrames>& frames) {
    std::vector<PlayerGame> games;
    for (auto* match : most_recent_first(frames)) {
        // Later frames of the same night come first too.
        for (auto it = match->frames.rbegin(); it != match->frames.rend(); ++it) {
            auto& f = *it;
            bool home = f.home_player == player;
            if (!home && f.away_player != player) continue;
            games.push_back({
                .date = match->date,
                .opponent = home ? f.away_player : f.home_player,
                .won = won_by(f, home),
            });
        }
    }
    return games;
}

PlayerForm player_form(const std::string& player, const std::vector<MatchFrames>& frames,
                       double season_pct) {
    auto games = player_games(player, frames);

    PlayerForm form{
        .last5 = window(games, kShortWindow),
        .last8 = window(games, kMediumWindow),
        .last10 = window(games, kLongWindow),
        .season_pct = season_pct,
        .streak = current_streak(games),
        .momentum = momentum(games),
    };

    if (form.last5.played >= kMinGamesForTrend) {
        if (form.last5.pct >= kHotPct) form.trend = FormTrend::Hot;
        else if (form.last5.pct < kColdPct) form.trend = FormTrend::Cold;
    }

    if (games.size() > static_cast<size_t>(kLongWindow)) games.resize(kLongWindow);
    form.recent = std::move(games);
    return form;
}

std::optional<HeadToHead> head_to_head(const std::string& player_a, const std::string& player_b,
                                       const std::vector<MatchFrames>& frames) {
    HeadToHead h2h{.player_a = player_a, .player_b = player_b};

    for (auto* match : most_recent_first(frames)) {
        for (auto& f : match->frames) {
            bool a_home = f.home_player == player_a && f.away_player == player_b;
            bool a_away = f.home_player == player_b && f.away_player == player_a;
            if (!a_home && !a_away) continue;

            bool a_won = won_by(f, a_home);
            if (a_won) h2h.wins++;
            else h2h.losses++;
            h2h.details.emplace_back(match->date, a_won ? player_a : player_b);
        }
    }

    int total = h2h.wins + h2h.losses;
    if (total == 0) return std::nullopt;

    double pct = static_cast<double>(h2h.wins) / total * 100.0;
    h2h.edge = pct >= 70.0 ? MatchupEdge::Strong
             : pct >= 60.0 ? MatchupEdge::Moderate
             : pct >= 40.0 ? MatchupEdge::Even
             : MatchupEdge::Disadvantage;
    h2h.confidence = std::min(1.0, total / 10.0);
    return h2h;
}

HomeAwaySplit player_home_away(const std::string& player,
                               const std::vector<MatchFrames>& frames) {
    HomeAwaySplit split;
    for (auto& match : frames) {
        for (auto& f : match.frames) {
            if (f.home_player == player) {
                split.home.played++;
                if (f.winner == Side::Home) split.home.won++;
            } else if (f.away_player == player) {
                split.away.played++;
                if (f.winner == Side::Away) split.away.won++;
            }
        }
    }
    for (auto* w : {&split.home, &split.away}) {
        w->pct = w->played > 0 ? static_cast<double>(w->won) / w->played * 100.0 : 0.0;
    }
    return split;
}

TeamHomeAwaySplit team_home_away(const std::string& team,
                                 const std::vector<MatchResult>& results) {
    TeamHomeAwaySplit split;
    for (auto& r : results) {
        if (r.home == team) add_record(split.home, r.home_score, r.away_score);
        else if (r.away == team) add_record(split.away, r.away_score, r.home_score);
    }
    for (auto* v : {&split.home, &split.away}) {
        v->win_pct = v->played > 0 ? static_cast<double>(v->won) / v->played * 100.0 : 0.0;
    }
    return split;
}

std::optional<SetPerformance> set_performance(const std::string& team,
                                              const std::vector<MatchFrames>& frames) {
    SetPerformance perf;
    for (auto& match : frames) {
        bool home = match.home == team;
        if (!home && match.away != team) continue;

        for (auto& f : match.frames) {
            auto& set = f.frame_number <= kFramesPerSet ? perf.set1 : perf.set2;
            set.played++;
            if (won_by(f, home)) set.won++;
        }
    }

    if (perf.set1.played == 0 && perf.set2.played == 0) return std::nullopt;

    for (auto* w : {&perf.set1, &perf.set2}) {
        w->pct = w->played > 0 ? static_cast<double>(w->won) / w->played * 100.0 : 0.0;
    }
    perf.bias = perf.set1.pct - perf.set2.pct;
    return perf;
}

std::vector<PlayerAppearance> appearance_rates(const std::string& team,
                                               const std::vector<MatchFrames>& frames) {
    std::set<std::string> matches;
    std::map<std::string, std::set<std::string>> seen;

    for (auto& match : frames) {
        bool home = match.home == team;
        if (!home && match.away != team) continue;

        auto key = match_key(match);
        matches.insert(key);
        for (auto& f : match.frames) {
            seen[home ? f.home_player : f.away_player].insert(key);
        }
    }

    const int total = static_cast<int>(matches.size());
    if (total == 0) return {};

    std::vector<PlayerAppearance> rates;
    for (auto& [name, played_in] : seen) {
        double rate = static_cast<double>(played_in.size()) / total;
        rates.push_back({
            .name = name,
            .appearances = static_cast<int>(played_in.size()),
            .total_matches = total,
            .rate = rate,
            .category = rate >= kCoreRate     ? AppearanceCategory::Core
                      : rate >= kRotationRate ? AppearanceCategory::Rotation
                      : AppearanceCategory::Fringe,
        });
    }

    std::ranges::stable_sort(rates, std::greater{}, &PlayerAppearance::rate);
    return rates;
}

PredictedLineup predict_lineup(const std::string& team, const std::vector<MatchFrames>& frames,
                               int recent) {
    PredictedLineup lineup{.players = appearance_rates(team, frames)};

    std::set<std::string> seen;
    int taken = 0;
    for (auto* match : most_recent_first(frames)) {
        if (taken >= recent) break;
        bool home = match->home == team;
        if (!home && match->away != team) continue;

        taken++;
        for (auto& f : match->frames) {
            auto& name = home ? f.home_player : f.away_player;
            if (seen.insert(name).second) lineup.recent_players.push_back(name);
        }
    }
    return lineup;
}

BreakAndDishStats player_break_and_dish(const std::string& player, const PlayersMap& players,
                                        const std::optional<std::string>& division) {
    int games = 0, bd_for = 0, bd_against = 0, forfeits = 0;
    if (auto it = players.find(player); it != players.end()) {
        for (auto& t : it->second.teams) {
            if (division && t.division != *division) continue;
            games += t.played;
            bd_for += t.bd_for;
            bd_against += t.bd_against;
            forfeits += t.forfeits;
        }
    }
    return finish_bd(games, bd_for, bd_against, forfeits);
}

BreakAndDishStats team_break_and_dish(const std::string& team, const PlayersMap& players,
                                      const std::optional<std::string>& division) {
    int games = 0, bd_for = 0, bd_against = 0, forfeits = 0;
    for (auto& [name, stats] : players) {
        for (auto& t : stats.teams) {
            if (t.team != team) continue;
            if (division && t.division != *division) continue;
            games += t.played;
            bd_for += t.bd_for;
            bd_against += t.bd_against;
            forfeits += t.forfeits;
        }
    }
    return finish_bd(games, bd_for, bd_against, forfeits);
}

std::vector<Outcome> team_form(const std::string& team, const std::vector<MatchResult>& results,
                               int count) {
    std::vector<Outcome> form;
    for (auto& r : team_results(team, results)) {
        if (static_cast<int>(form.size()) >= count) break;
        form.push_back(r.outcome);
    }
    return form;
}

ScoutingReport scouting_report(const std::string& team, const std::string& division,
                               const LeagueSnapshot& snapshot,
                               const StrengthConfig& config) {
    ScoutingReport report{
        .team = team,
        .form = team_form(team, snapshot.results),
        .home_away = team_home_away(team, snapshot.results),
        .set_performance = set_performance(team, snapshot.frames),
        .break_and_dish = team_break_and_dish(team, snapshot.players, division),
        .predicted_lineup = predict_lineup(team, snapshot.frames),
    };

    std::vector<RankedPlayer> ranked;
    int games = 0;
    int forfeits = 0;
    for (auto& [name, stats] : snapshot.players) {
        auto* entry = stats.for_team(team);
        if (!entry || entry->played <= 0) continue;
        ranked.push_back({
            .name = name,
            .pct = entry->pct,
            .adj_pct = bayesian_pct(entry->won, entry->played, config),
            .played = entry->played,
        });
        games += entry->played;
        forfeits += entry->forfeits;
    }
    std::ranges::stable_sort(ranked, std::greater{}, &RankedPlayer::adj_pct);

    auto n = std::min<size_t>(kScoutedPlayers, ranked.size());
    report.strongest.assign(ranked.begin(), ranked.begin() + n);
    report.weakest.assign(ranked.rbegin(), ranked.rbegin() + n);
    report.forfeit_rate = games > 0 ? static_cast<double>(forfeits) / games : 0.0;
    return report;
}

std::string to_string(FormTrend trend) {
    switch (trend) {
        case FormTrend::Hot: return "hot";
        case FormTrend::Cold: return "cold";
        case FormTrend::Steady: return "steady";
    }
    return "steady";
}

std::string to_string(MatchupEdge edge) {
    switch (edge) {
        case MatchupEdge::Strong: return "strong";
        case MatchupEdge::Moderate: return "moderate";
        case MatchupEdge::Even: return "even";
        case MatchupEdge::Disadvantage: return "disadvantage";
    }
    return "even";
}

std::string to_string(AppearanceCategory category) {
    switch (category) {
        case AppearanceCategory::Core: return "core";
        case AppearanceCategory::Rotation: return "rotation";
        case AppearanceCategory::Fringe: return "fringe";
    }
    return "fringe";
}

char to_char(Outcome outcome) {
    switch (outcome) {
        case Outcome::Win: return 'W';
        case Outcome::Draw: return 'D';
        case Outcome::Loss: return 'L';
    }
    return '?';
}

} // namespace leaguesim

#include "leaguesim/standings.hpp"
#include <algorithm>
#include <unordered_map>

namespace leaguesim {

std::pair<int, int> points_for(int home_score, int away_score) {
    if (home_score > away_score) return {kHomeWinPoints, 0};
    if (home_score < away_score) return {0, kAwayWinPoints};
    return {kDrawPoints, kDrawPoints};
}

void apply_result(StandingEntry& home, StandingEntry& away, int home_score, int away_score) {
    home.played++;
    away.played++;
    home.frames_for += home_score;
    home.frames_against += away_score;
    away.frames_for += away_score;
    away.frames_against += home_score;

    auto [home_pts, away_pts] = points_for(home_score, away_score);
    home.points += home_pts;
    away.points += away_pts;

    if (home_score > away_score) {
        home.won++;
        away.lost++;
    } else if (home_score < away_score) {
        away.won++;
        home.lost++;
    } else {
        home.drawn++;
        away.drawn++;
    }
}

void sort_standings(std::vector<StandingEntry>& standings) {
    std::ranges::stable_sort(standings, [](const StandingEntry& a, const StandingEntry& b) {
        if (a.points != b.points) return a.points > b.points;
        return a.diff() > b.diff();
    });
}

std::vector<StandingEntry> calc_standings(const std::string& division,
                                          const LeagueSnapshot& snapshot) {
    auto it = snapshot.divisions.find(division);
    if (it == snapshot.divisions.end()) return {};

    std::vector<StandingEntry> standings;
    std::unordered_map<std::string, size_t> index;
    for (auto& team : it->second.teams) {
        if (index.contains(team)) continue;
        index[team] = standings.size();
        standings.push_back({.team = team});
    }

    for (auto& r : snapshot.results) {
        auto h = index.find(r.home);
        auto a = index.find(r.away);
        if (h == index.end() || a == index.end()) continue;
        apply_result(standings[h->second], standings[a->second], r.home_score, r.away_score);
    }

    sort_standings(standings);
    return standings;
}

} // namespace leaguesim

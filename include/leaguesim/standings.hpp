#pragma once

#include "leaguesim/types.hpp"
#include <string>
#include <utility>
#include <vector>

namespace leaguesim {

inline constexpr int kHomeWinPoints = 2;
inline constexpr int kAwayWinPoints = 3;
inline constexpr int kDrawPoints = 1;

// (home points, away points) for a final score.
std::pair<int, int> points_for(int home_score, int away_score);

void apply_result(StandingEntry& home, StandingEntry& away, int home_score, int away_score);

std::vector<StandingEntry> calc_standings(const std::string& division,
                                          const LeagueSnapshot& snapshot);

void sort_standings(std::vector<StandingEntry>& standings);

} // namespace leaguesim

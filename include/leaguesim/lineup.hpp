#pragma once

#include "leaguesim/config.hpp"
#include "leaguesim/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace leaguesim {

struct LineupRequest {
    std::string team;
    std::string opponent;
    bool is_home = true;
    std::vector<std::string> roster;
    std::vector<PlayerAvailability> availability; // empty = whole roster
    std::vector<LineupLock> locks;
    int alternatives = 3;
};

// Roster members marked available, without repeats. An empty availability list
// keeps everyone.
std::vector<std::string> available_players(const std::vector<std::string>& roster,
                                           const std::vector<PlayerAvailability>& availability);

// Eligible players (enough games) with their composite score, best first.
std::vector<ScoredPlayer> score_players(const std::vector<std::string>& players,
                                        const std::string& opponent, bool is_home,
                                        const LeagueSnapshot& snapshot,
                                        const EngineConfig& config = {});

// Probabilities are from the perspective of `team`.
LineupWinProbability lineup_win_probability(const std::vector<std::string>& set1,
                                            const std::vector<std::string>& set2,
                                            const std::string& team,
                                            const std::string& opponent, bool is_home,
                                            const LeagueSnapshot& snapshot, Rng& rng,
                                            const EngineConfig& config = {});

std::optional<OptimizedLineup> optimize_lineup(const LineupRequest& request,
                                               const LeagueSnapshot& snapshot, Rng& rng,
                                               const EngineConfig& config = {});

} // namespace leaguesim

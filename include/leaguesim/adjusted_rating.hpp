#pragma once

#include "leaguesim/config.hpp"
#include "leaguesim/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace leaguesim {

// Null when the player has no non-cup games in that division.
std::optional<AdjustedRating> adjusted_player_rating(const std::string& player,
                                                     const std::string& league_id,
                                                     const std::string& division,
                                                     const LeagueSnapshot& league,
                                                     const std::vector<LeagueStrength>& strengths,
                                                     const EngineConfig& config = {});

std::optional<AdjustedRating> adjusted_team_rating(const std::string& team,
                                                   const std::string& league_id,
                                                   const std::string& division,
                                                   const LeagueSnapshot& league,
                                                   const std::vector<LeagueStrength>& strengths,
                                                   const EngineConfig& config = {});

struct KeyedRating {
    std::string key;
    AdjustedRating rating;
};

// Rank-based percentile of adjusted pct across every supplied rating.
std::map<std::string, double> global_percentiles(const std::vector<KeyedRating>& ratings);

} // namespace leaguesim

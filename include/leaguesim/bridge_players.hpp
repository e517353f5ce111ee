#pragma once

#include "leaguesim/config.hpp"
#include "leaguesim/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace leaguesim {

// Lowercased with whitespace runs collapsed and trimmed.
std::string normalize_player_name(std::string_view name);

int levenshtein_distance(std::string_view a, std::string_view b);

// 1 - distance / longer length; 1 for equal strings, 0 when either is empty.
double name_similarity(std::string_view a, std::string_view b);

// Players with non-cup stats in two or more divisions of one league.
std::vector<BridgePlayer> find_intra_league_bridge_players(const LeagueSnapshot& league);

std::vector<BridgePlayer> find_cross_league_bridge_players(const LeagueSet& leagues,
                                                           double min_confidence = 0.85);

std::vector<BridgePlayer> find_all_bridge_players(const LeagueSet& leagues,
                                                  const CalibrationConfig& config = {});

} // namespace leaguesim

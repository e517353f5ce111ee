#pragma once

#include "leaguesim/config.hpp"
#include "leaguesim/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace leaguesim {

// Keyed by (first, second) with first < second; each entry is
// confidence-weighted (rating in first - rating in second).
using PairDifferences = std::map<std::pair<std::string, std::string>, std::vector<double>>;

void add_pair_difference(PairDifferences& pairs, const std::string& a, const std::string& b,
                         double rating_a, double rating_b, double weight);

// Damped iterative averaging. Positive offset = stronger context.
// Offsets are re-centred to zero mean after every pass.
std::map<std::string, double> solve_offsets(const std::vector<std::string>& ids,
                                            const PairDifferences& pairs,
                                            const CalibrationConfig& config = {});

// Fallback offset from conventional division naming; null when the division
// matches no tier.
std::optional<double> tier_offset(const std::string& code, const std::string& name,
                                  const CalibrationConfig& config = {});

std::vector<DivisionStrength> calculate_division_strengths(
    const LeagueSnapshot& league, const std::vector<BridgePlayer>& bridge_players,
    const CalibrationConfig& config = {});

std::vector<LeagueStrength> calculate_league_strengths(
    const LeagueSet& leagues, const std::vector<BridgePlayer>& bridge_players,
    const CalibrationConfig& config = {});

} // namespace leaguesim

#pragma once

#include "leaguesim/config.hpp"
#include "leaguesim/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace leaguesim {

// Win percentage (0-100) shrunk toward the prior by K pseudo-games.
double bayesian_pct(int wins, int games, const StrengthConfig& config = {});

// Prior-season estimate on the strength scale.
double prior_team_strength(const std::string& team, const std::string& division,
                           const LeagueSnapshot& snapshot,
                           const StrengthConfig& config = {});

std::map<std::string, double> calc_team_strength(const std::string& division,
                                                 const LeagueSnapshot& snapshot,
                                                 const StrengthConfig& config = {});

// Strength of a single team within its own division; 0 when it has none.
double team_strength(const std::string& team, const LeagueSnapshot& snapshot,
                     const StrengthConfig& config = {});

// Squad builder: a roster member with whatever stats the snapshot holds.
struct SquadMember {
    std::string name;
    std::optional<PriorPlayerStats> prior;
    std::optional<PlayerTeamStats> current;
    bool rostered = false;
};

struct EffectivePct {
    double pct = 0.0;     // 0-1
    double adj_pct = 0.0; // 0-1
    int weight = 0;
};

std::vector<SquadMember> team_squad(const std::string& team, const LeagueSnapshot& snapshot);

// Current season preferred (>= 3 games), prior season fallback.
std::optional<EffectivePct> effective_pct(const SquadMember& member,
                                          const StrengthConfig& config = {});

std::optional<double> squad_strength(const std::vector<SquadMember>& squad, int top_n = 0,
                                     const StrengthConfig& config = {});

std::vector<SquadMember> apply_override(const std::vector<SquadMember>& squad,
                                        const SquadOverride& override_,
                                        const LeagueSnapshot& snapshot);

// Strength deltas for teams whose squads are overridden.
std::map<std::string, double> squad_adjustments(const std::string& division,
                                                const SquadOverrides& overrides,
                                                const LeagueSnapshot& snapshot,
                                                int top_n = 0,
                                                const StrengthConfig& config = {});

} // namespace leaguesim

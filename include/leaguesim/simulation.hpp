#pragma once

#include "leaguesim/config.hpp"
#include "leaguesim/types.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace leaguesim {

struct SeasonInput {
    std::vector<std::string> teams;
    std::vector<StandingEntry> standings;
    std::map<std::string, double> strengths;
    std::vector<Fixture> fixtures;
    std::vector<WhatIfResult> what_ifs;
};

// (home frames, away frames)
std::pair<int, int> simulate_match(double frame_probability, Rng& rng, int frames = 10);

std::vector<SimulationResult> run_season_simulation(const SeasonInput& input, Rng& rng,
                                                    const SimulationConfig& config = {});

SeasonInput build_season_input(const std::string& division, const LeagueSnapshot& snapshot,
                               const std::vector<WhatIfResult>& what_ifs = {},
                               const SquadOverrides& overrides = {},
                               const EngineConfig& config = {});

std::vector<SimulationResult> simulate_division(const std::string& division,
                                                const LeagueSnapshot& snapshot,
                                                const std::vector<WhatIfResult>& what_ifs,
                                                const SquadOverrides& overrides,
                                                Rng& rng,
                                                const EngineConfig& config = {});

MatchPrediction predict_match(double frame_probability, Rng& rng,
                              const SimulationConfig& config = {});

// Home-side prediction for a fixture from current team strengths.
MatchPrediction predict_fixture(const std::string& home, const std::string& away,
                                const LeagueSnapshot& snapshot, Rng& rng,
                                const EngineConfig& config = {});

std::vector<FixtureImportance> fixture_importance(const std::string& division,
                                                  const std::string& team,
                                                  const LeagueSnapshot& snapshot,
                                                  const std::vector<WhatIfResult>& what_ifs,
                                                  const SquadOverrides& overrides,
                                                  Rng& rng,
                                                  const EngineConfig& config = {});

ScheduleStrength schedule_strength(const std::string& team, const std::string& division,
                                   const LeagueSnapshot& snapshot,
                                   const StrengthConfig& config = {});

// Hardest remaining schedule first.
std::vector<ScheduleStrength> division_schedule_strength(const std::string& division,
                                                         const LeagueSnapshot& snapshot,
                                                         const StrengthConfig& config = {});

} // namespace leaguesim

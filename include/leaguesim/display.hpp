#pragma once

#include "leaguesim/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace leaguesim {

enum class OutputFormat { Table, Csv };

void display_header(const std::string& league_id, const std::string& division,
                    const std::string& team);

void display_standings(const std::vector<StandingEntry>& standings, OutputFormat format);

void display_simulation(const std::vector<SimulationResult>& results, OutputFormat format);

void display_prediction(const std::string& home, const std::string& away,
                        const MatchPrediction& prediction, OutputFormat format);

void display_importance(const std::string& team, const std::vector<FixtureImportance>& fixtures,
                        OutputFormat format);

void display_schedule(const std::vector<ScheduleStrength>& schedule, OutputFormat format);

void display_lineup(const std::string& team, const std::string& opponent,
                    const std::optional<OptimizedLineup>& lineup, OutputFormat format);

void display_scouting(const ScoutingReport& report, OutputFormat format);

void display_calibration(const std::vector<LeagueStrength>& leagues, OutputFormat format);

} // namespace leaguesim

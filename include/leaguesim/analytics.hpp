#pragma once

#include "leaguesim/config.hpp"
#include "leaguesim/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace leaguesim {

inline constexpr int kFramesPerSet = 5;

// All frames a player took part in, most recent match first.
std::vector<PlayerGame> player_games(const std::string& player,
                                     const std::vector<MatchFrames>& frames);

PlayerForm player_form(const std::string& player, const std::vector<MatchFrames>& frames,
                       double season_pct = 0.0);

// Null when the two players never met.
std::optional<HeadToHead> head_to_head(const std::string& player_a, const std::string& player_b,
                                       const std::vector<MatchFrames>& frames);

HomeAwaySplit player_home_away(const std::string& player,
                               const std::vector<MatchFrames>& frames);

TeamHomeAwaySplit team_home_away(const std::string& team,
                                 const std::vector<MatchResult>& results);

std::optional<SetPerformance> set_performance(const std::string& team,
                                              const std::vector<MatchFrames>& frames);

std::vector<PlayerAppearance> appearance_rates(const std::string& team,
                                               const std::vector<MatchFrames>& frames);

PredictedLineup predict_lineup(const std::string& team, const std::vector<MatchFrames>& frames,
                               int recent = 3);

BreakAndDishStats player_break_and_dish(const std::string& player, const PlayersMap& players,
                                        const std::optional<std::string>& division = std::nullopt);

BreakAndDishStats team_break_and_dish(const std::string& team, const PlayersMap& players,
                                      const std::optional<std::string>& division = std::nullopt);

std::vector<Outcome> team_form(const std::string& team, const std::vector<MatchResult>& results,
                               int count = 5);

ScoutingReport scouting_report(const std::string& team, const std::string& division,
                               const LeagueSnapshot& snapshot,
                               const StrengthConfig& config = {});

std::string to_string(FormTrend trend);
std::string to_string(MatchupEdge edge);
std::string to_string(AppearanceCategory category);
char to_char(Outcome outcome);

} // namespace leaguesim

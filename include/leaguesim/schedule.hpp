#pragma once

#include "leaguesim/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace leaguesim {

// Dates arrive as DD-MM-YYYY.
std::optional<MatchDate> parse_match_date(std::string_view text);

// Unparseable dates sort before every valid date.
MatchDate date_sort_key(const std::string& text);

std::optional<std::string> division_of(const std::string& team,
                                       const LeagueSnapshot& snapshot);

std::optional<MatchDate> latest_result_date(const std::vector<MatchResult>& results,
                                            const LeagueSnapshot& snapshot,
                                            const std::string& division);

std::vector<Fixture> remaining_fixtures(const std::string& division,
                                        const LeagueSnapshot& snapshot);

std::vector<TeamResult> team_results(const std::string& team,
                                     const std::vector<MatchResult>& results);

} // namespace leaguesim

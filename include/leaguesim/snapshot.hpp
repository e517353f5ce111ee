#pragma once

#include "leaguesim/types.hpp"
#include <nlohmann/json.hpp>
#include <expected>
#include <filesystem>
#include <string>

namespace leaguesim {

// Tolerant: missing or mistyped fields fall back to defaults.
LeagueSnapshot parse_snapshot(const nlohmann::json& j, const std::string& league_id = "");

std::expected<LeagueSnapshot, LoadError> load_snapshot(const std::filesystem::path& path);

// Either {"leagues": {id: snapshot, ...}} or a single snapshot document.
std::expected<LeagueSet, LoadError> load_leagues(const std::filesystem::path& path);

} // namespace leaguesim

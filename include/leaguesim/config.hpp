#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace leaguesim {

struct StrengthConfig {
    double bayesian_k = 6.0;
    double bayesian_prior = 0.5;
    int prior_blend_games = 10;
    double unknown_player_prior = 0.45;
    double strength_scale = 4.0; // win-rate delta from 0.5 -> strength
    double squad_scale = 4.0;
};

struct SimulationConfig {
    int season_runs = 1000;
    int prediction_runs = 5000;
    int frames_per_match = 10;
    double home_advantage = 0.2;
    int top_scorelines = 5;
    int importance_win_frames = 7;
};

struct LineupConfig {
    int min_games = 3;
    int set_size = 5;
    int min_available = 10;
    int min_rated_players = 5;
    int recent_matches = 3;
    int min_venue_games = 3;
    double form_weight = 0.3;
    double h2h_weight = 5.0;
    double venue_weight = 0.2;
    double set_bias_threshold = 5.0;
    int alternatives = 3;
    int squad_top_n = 0; // 0 = whole squad
};

struct CalibrationConfig {
    int min_context_games = 3;
    int solver_iterations = 20;
    double damping = 0.5;
    int bridge_target = 10;
    double confidence_floor = 0.3;
    double fuzzy_threshold = 0.85;
    double tier_scale = 50.0;
    std::map<std::string, double> tier_multipliers = {
        {"PREM", 1.0}, {"SD1", 0.92}, {"D1", 0.85}, {"WD1", 0.88},
        {"SD2", 0.78}, {"D2", 0.72}, {"WD2", 0.75}, {"D3", 0.62},
        {"D4", 0.55}, {"D5", 0.48}, {"D6", 0.42}, {"D7", 0.38},
    };
};

struct EngineConfig {
    StrengthConfig strength;
    SimulationConfig simulation;
    LineupConfig lineup;
    CalibrationConfig calibration;
    std::optional<std::uint64_t> seed;
};

std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path = ".env");

std::optional<std::string> get_env(const std::string& key);

// Defaults overridden by LEAGUESIM_* environment variables.
EngineConfig load_engine_config();

} // namespace leaguesim

#include "leaguesim/config.hpp"
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string>
#include <string_view>

namespace leaguesim {

namespace {

constexpr std::string_view kBlank = " \t\r\n";

std::string_view trim(std::string_view sv) {
    auto start = sv.find_first_not_of(kBlank);
    if (start == std::string_view::npos) return {};
    return sv.substr(start, sv.find_last_not_of(kBlank) - start + 1);
}

std::string_view unquote(std::string_view sv) {
    if (sv.size() < 2 || sv.front() != sv.back()) return sv;
    if (sv.front() != '"' && sv.front() != '\'') return sv;
    return sv.substr(1, sv.size() - 2);
}

struct EnvEntry {
    std::string key;
    std::string value;
};

// KEY=value, optionally prefixed with `export`. Comments and malformed lines give nullopt.
std::optional<EnvEntry> parse_env_line(std::string_view line) {
    line = trim(line);
    if (line.empty() || line.front() == '#') return std::nullopt;
    if (line.starts_with("export ")) line = trim(line.substr(7));

    auto eq = line.find('=');
    if (eq == std::string_view::npos) return std::nullopt;

    auto key = trim(line.substr(0, eq));
    if (key.empty()) return std::nullopt;
    return EnvEntry{std::string(key), std::string(unquote(trim(line.substr(eq + 1))))};
}

template <typename T>
std::optional<T> env_number(const std::string& key) {
    auto raw = get_env(key);
    if (!raw) return std::nullopt;

    auto value = trim(*raw);
    T parsed{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || ptr != value.data() + value.size()) return std::nullopt;
    return parsed;
}

template <typename T>
void override_from_env(const std::string& key, T& target) {
    if (auto parsed = env_number<T>(key)) target = *parsed;
}

} // namespace

std::unordered_map<std::string, std::string> load_env(
    const std::filesystem::path& path) {

    std::unordered_map<std::string, std::string> vars;
    std::ifstream file(path);
    if (!file.is_open()) return vars;

    for (std::string line; std::getline(file, line);) {
        auto entry = parse_env_line(line);
        if (!entry) continue;
        ::setenv(entry->key.c_str(), entry->value.c_str(), 0); // existing values win
        vars.insert_or_assign(std::move(entry->key), std::move(entry->value));
    }

    return vars;
}

std::optional<std::string> get_env(const std::string& key) {
    const char* val = std::getenv(key.c_str());
    if (val == nullptr) return std::nullopt;
    return std::string(val);
}

EngineConfig load_engine_config() {
    EngineConfig config;

    override_from_env("LEAGUESIM_PRIOR_BLEND_GAMES", config.strength.prior_blend_games);
    override_from_env("LEAGUESIM_UNKNOWN_PLAYER_PRIOR", config.strength.unknown_player_prior);

    override_from_env("LEAGUESIM_SEASON_RUNS", config.simulation.season_runs);
    override_from_env("LEAGUESIM_PREDICTION_RUNS", config.simulation.prediction_runs);
    override_from_env("LEAGUESIM_HOME_ADVANTAGE", config.simulation.home_advantage);

    override_from_env("LEAGUESIM_LINEUP_ALTERNATIVES", config.lineup.alternatives);
    override_from_env("LEAGUESIM_SQUAD_TOP_N", config.lineup.squad_top_n);

    override_from_env("LEAGUESIM_FUZZY_THRESHOLD", config.calibration.fuzzy_threshold);
    override_from_env("LEAGUESIM_BRIDGE_TARGET", config.calibration.bridge_target);
    override_from_env("LEAGUESIM_CONFIDENCE_FLOOR", config.calibration.confidence_floor);
    override_from_env("LEAGUESIM_SOLVER_ITERATIONS", config.calibration.solver_iterations);

    config.seed = env_number<std::uint64_t>("LEAGUESIM_SEED");

    if (config.simulation.season_runs <= 0) config.simulation.season_runs = SimulationConfig{}.season_runs;
    if (config.simulation.prediction_runs <= 0) config.simulation.prediction_runs = SimulationConfig{}.prediction_runs;
    if (config.calibration.bridge_target <= 0) config.calibration.bridge_target = CalibrationConfig{}.bridge_target;

    return config;
}

} // namespace leaguesim

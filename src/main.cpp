#include "leaguesim/adjusted_rating.hpp"
#include "leaguesim/analytics.hpp"
#include "leaguesim/bridge_players.hpp"
#include "leaguesim/calibration.hpp"
#include "leaguesim/config.hpp"
#include "leaguesim/display.hpp"
#include "leaguesim/lineup.hpp"
#include "leaguesim/schedule.hpp"
#include "leaguesim/simulation.hpp"
#include "leaguesim/snapshot.hpp"
#include "leaguesim/standings.hpp"
#include "leaguesim/strength.hpp"
#include <algorithm>
#include <charconv>
#include <cstdint>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <unordered_set>

namespace {

struct CliArgs {
    std::string snapshot_path;
    std::string league;
    std::string division;
    std::string team;
    std::string opponent;
    bool away = false;
    leaguesim::OutputFormat format = leaguesim::OutputFormat::Table;
    std::optional<std::uint64_t> seed;
    std::optional<int> alternatives;
    std::string env_path = ".env";
    std::vector<leaguesim::WhatIfResult> what_ifs;
    std::vector<std::string> unavailable;
    std::vector<leaguesim::LineupLock> locks;
    leaguesim::SquadOverrides overrides;
    std::unordered_set<std::string> reports;
};

void print_usage() {
    std::cerr << R"(Usage: leaguesim <snapshot.json> [options]
  --league <id>                 League to report on (default: first in file)
  --division <code>             Division (default: the team's division)
  --team <name>                 Team to analyse
  --opponent <name>             Opponent for predict/lineup/scout
  --away                        Team plays away (default: home)
  --report <type>               standings|simulate|predict|importance|schedule|
                                lineup|scout|calibrate|all (repeatable)
  --format <table|csv>          Output format (default: table)
  --seed <n>                    Random seed (or LEAGUESIM_SEED)
  --what-if <HOME:AWAY:HS-AS>   Fixed hypothetical result (repeatable)
  --add <TEAM:PLAYER>           Add a player to a team's squad (repeatable)
  --drop <TEAM:PLAYER>          Remove a player from a team's squad (repeatable)
  --unavailable <name>          Player unavailable for the lineup (repeatable)
  --lock <SET:POS:NAME>         Lock a player into a lineup slot (repeatable)
  --alternatives <n>            Alternative lineups to show (default: 3)
  --env <path>                  .env file to load (default: .env)
)";
}

template <typename T>
std::optional<T> parse_number(std::string_view s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

std::optional<leaguesim::WhatIfResult> parse_what_if(const std::string& val) {
    auto score_sep = val.rfind(':');
    if (score_sep == std::string::npos) return std::nullopt;
    auto teams = val.substr(0, score_sep);
    auto score = val.substr(score_sep + 1);

    auto team_sep = teams.find(':');
    auto dash = score.find('-');
    if (team_sep == std::string::npos || dash == std::string::npos) return std::nullopt;

    auto hs = parse_number<int>(std::string_view(score).substr(0, dash));
    auto as = parse_number<int>(std::string_view(score).substr(dash + 1));
    if (!hs || !as) return std::nullopt;

    return leaguesim::WhatIfResult{teams.substr(0, team_sep), teams.substr(team_sep + 1), *hs, *as};
}

std::optional<leaguesim::LineupLock> parse_lock(const std::string& val) {
    auto first = val.find(':');
    if (first == std::string::npos) return std::nullopt;
    auto second = val.find(':', first + 1);
    if (second == std::string::npos) return std::nullopt;

    auto set = parse_number<int>(std::string_view(val).substr(0, first));
    auto pos = parse_number<int>(std::string_view(val).substr(first + 1, second - first - 1));
    if (!set || !pos) return std::nullopt;
    return leaguesim::LineupLock{val.substr(second + 1), *set, *pos};
}

std::optional<std::pair<std::string, std::string>> parse_team_player(const std::string& val) {
    auto sep = val.find(':');
    if (sep == std::string::npos || sep == 0 || sep + 1 == val.size()) return std::nullopt;
    return std::pair{val.substr(0, sep), val.substr(sep + 1)};
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    if (argc < 2) return std::nullopt;

    CliArgs args;
    args.snapshot_path = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--away") {
            args.away = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        std::string val = argv[++i];

        if (flag == "--league") args.league = val;
        else if (flag == "--division") args.division = val;
        else if (flag == "--team") args.team = val;
        else if (flag == "--opponent") args.opponent = val;
        else if (flag == "--format") {
            args.format = (val == "csv") ? leaguesim::OutputFormat::Csv
                                         : leaguesim::OutputFormat::Table;
        }
        else if (flag == "--report") args.reports.insert(val);
        else if (flag == "--env") args.env_path = val;
        else if (flag == "--unavailable") args.unavailable.push_back(val);
        else if (flag == "--seed") {
            args.seed = parse_number<std::uint64_t>(val);
            if (!args.seed) {
                std::cerr << "Invalid seed: " << val << "\n";
                return std::nullopt;
            }
        }
        else if (flag == "--alternatives") {
            args.alternatives = parse_number<int>(val);
            if (!args.alternatives) {
                std::cerr << "Invalid count: " << val << "\n";
                return std::nullopt;
            }
        }
        else if (flag == "--what-if") {
            auto wi = parse_what_if(val);
            if (!wi) {
                std::cerr << "Invalid what-if (expected HOME:AWAY:HS-AS): " << val << "\n";
                return std::nullopt;
            }
            args.what_ifs.push_back(*wi);
        }
        else if (flag == "--lock") {
            auto lock = parse_lock(val);
            if (!lock) {
                std::cerr << "Invalid lock (expected SET:POS:NAME): " << val << "\n";
                return std::nullopt;
            }
            args.locks.push_back(*lock);
        }
        else if (flag == "--add" || flag == "--drop") {
            auto tp = parse_team_player(val);
            if (!tp) {
                std::cerr << "Invalid squad change (expected TEAM:PLAYER): " << val << "\n";
                return std::nullopt;
            }
            auto& ov = args.overrides[tp->first];
            (flag == "--add" ? ov.added : ov.removed).push_back(tp->second);
        }
        else {
            std::cerr << "Unknown option: " << flag << "\n";
            return std::nullopt;
        }
    }

    if (args.reports.empty()) args.reports.insert("all");

    return args;
}

bool should_report(const std::unordered_set<std::string>& reports, const std::string& name) {
    return reports.contains("all") || reports.contains(name);
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    leaguesim::load_env(args->env_path);
    auto config = leaguesim::load_engine_config();
    if (args->seed) config.seed = args->seed;
    if (args->alternatives) config.lineup.alternatives = *args->alternatives;

    std::cerr << "Loading " << args->snapshot_path << "...\n";
    auto leagues = leaguesim::load_leagues(args->snapshot_path);
    if (!leagues) {
        std::cerr << "Error loading " << leagues.error().path << ": "
                  << leagues.error().message << "\n";
        return 1;
    }
    if (leagues->empty()) {
        std::cerr << "No league data in snapshot.\n";
        return 1;
    }

    auto league_it = args->league.empty() ? leagues->begin() : leagues->find(args->league);
    if (league_it == leagues->end()) {
        std::cerr << "Unknown league: " << args->league << "\n";
        return 1;
    }
    const auto& snapshot = league_it->second;

    std::string division = args->division;
    if (division.empty() && !args->team.empty()) {
        division = leaguesim::division_of(args->team, snapshot).value_or("");
    }
    if (division.empty() && !snapshot.divisions.empty()) {
        division = snapshot.divisions.begin()->first;
    }
    if (!snapshot.divisions.contains(division)) {
        std::cerr << "Unknown division: " << division << "\n";
        return 1;
    }

    auto seed = config.seed ? *config.seed : std::random_device{}();
    leaguesim::Rng rng(seed);
    std::cerr << "Seed: " << seed << "\n";

    const auto format = args->format;
    const bool home = !args->away;
    if (format == leaguesim::OutputFormat::Table) {
        leaguesim::display_header(league_it->first, division, args->team);
    }

    if (should_report(args->reports, "standings")) {
        leaguesim::display_standings(leaguesim::calc_standings(division, snapshot), format);
    }

    if (should_report(args->reports, "simulate")) {
        leaguesim::display_simulation(
            leaguesim::simulate_division(division, snapshot, args->what_ifs, args->overrides,
                                         rng, config),
            format);
    }

    if (should_report(args->reports, "schedule")) {
        leaguesim::display_schedule(
            leaguesim::division_schedule_strength(division, snapshot, config.strength), format);
    }

    if (should_report(args->reports, "importance")) {
        if (args->team.empty()) {
            std::cerr << "Skipping importance: --team is required.\n";
        } else {
            leaguesim::display_importance(
                args->team,
                leaguesim::fixture_importance(division, args->team, snapshot, args->what_ifs,
                                              args->overrides, rng, config),
                format);
        }
    }

    bool have_pair = !args->team.empty() && !args->opponent.empty();

    if (should_report(args->reports, "predict")) {
        if (!have_pair) {
            std::cerr << "Skipping predict: --team and --opponent are required.\n";
        } else {
            const auto& h = home ? args->team : args->opponent;
            const auto& a = home ? args->opponent : args->team;
            leaguesim::display_prediction(h, a, leaguesim::predict_fixture(h, a, snapshot, rng, config),
                                          format);
        }
    }

    if (should_report(args->reports, "lineup")) {
        if (!have_pair) {
            std::cerr << "Skipping lineup: --team and --opponent are required.\n";
        } else {
            leaguesim::LineupRequest request{
                .team = args->team,
                .opponent = args->opponent,
                .is_home = home,
                .locks = args->locks,
                .alternatives = config.lineup.alternatives,
            };
            for (auto& member : leaguesim::team_squad(args->team, snapshot)) {
                request.roster.push_back(member.name);
                bool out = std::ranges::find(args->unavailable, member.name) != args->unavailable.end();
                request.availability.push_back({member.name, !out});
            }
            if (request.roster.empty()) {
                std::cerr << "Warning: no roster found for " << args->team << "\n";
            }
            leaguesim::display_lineup(args->team, args->opponent,
                                      leaguesim::optimize_lineup(request, snapshot, rng, config),
                                      format);
        }
    }

    if (should_report(args->reports, "scout")) {
        const auto& target = args->opponent.empty() ? args->team : args->opponent;
        if (target.empty()) {
            std::cerr << "Skipping scout: --team or --opponent is required.\n";
        } else {
            auto target_division = leaguesim::division_of(target, snapshot).value_or(division);
            leaguesim::display_scouting(
                leaguesim::scouting_report(target, target_division, snapshot, config.strength),
                format);
        }
    }

    if (should_report(args->reports, "calibrate")) {
        auto bridges = leaguesim::find_all_bridge_players(*leagues, config.calibration);
        std::cerr << "Bridge players: " << bridges.size() << "\n";
        auto strengths = leaguesim::calculate_league_strengths(*leagues, bridges, config.calibration);
        leaguesim::display_calibration(strengths, format);

        if (!args->team.empty()) {
            if (auto rating = leaguesim::adjusted_team_rating(args->team, league_it->first, division,
                                                              snapshot, strengths, config)) {
                std::cerr << args->team << " adjusted rating: " << rating->adjusted_pct
                          << " (z " << rating->z_score << ", confidence "
                          << rating->confidence << ")\n";
            }
        }
    }

    return 0;
}

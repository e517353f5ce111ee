#include "leaguesim/strength.hpp"
#include "leaguesim/schedule.hpp"
#include "leaguesim/standings.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace leaguesim {

namespace {

std::string roster_key(const std::string& division, const std::string& team) {
    return division + ":" + team;
}

const std::vector<std::string>* find_roster(const std::string& division, const std::string& team,
                                            const LeagueSnapshot& snapshot) {
    auto it = snapshot.rosters.find(roster_key(division, team));
    return it == snapshot.rosters.end() ? nullptr : &it->second;
}

std::optional<double> weighted_squad_pct(const std::vector<SquadMember>& pool,
                                         const StrengthConfig& config) {
    double total_weight = 0.0;
    double weighted = 0.0;
    for (auto& member : pool) {
        if (auto eff = effective_pct(member, config)) {
            weighted += eff->adj_pct * eff->weight;
            total_weight += eff->weight;
        }
    }
    if (total_weight == 0.0) return std::nullopt;
    return weighted / total_weight;
}

} // namespace

double bayesian_pct(int wins, int games, const StrengthConfig& config) {
    if (games <= 0) return config.bayesian_prior * 100.0;
    return (wins + config.bayesian_k * config.bayesian_prior) /
           (games + config.bayesian_k) * 100.0;
}

double prior_team_strength(const std::string& team, const std::string& division,
                           const LeagueSnapshot& snapshot,
                           const StrengthConfig& config) {
    std::set<std::string> names;
    if (auto* roster = find_roster(division, team, snapshot)) {
        names.insert(roster->begin(), roster->end());
    }
    for (auto& [name, stats] : snapshot.players) {
        if (stats.for_team(team)) names.insert(name);
    }

    double total_weight = 0.0;
    double weighted = 0.0;
    for (auto& name : names) {
        auto it = snapshot.prior_players.find(name);
        if (it != snapshot.prior_players.end() && it->second.played > 0) {
            total_weight += it->second.played;
            weighted += it->second.win_rate * it->second.played;
        } else {
            total_weight += config.bayesian_k;
            weighted += config.unknown_player_prior * config.bayesian_k;
        }
    }

    if (total_weight == 0.0) return 0.0;
    return (weighted / total_weight - 0.5) * config.strength_scale;
}

std::map<std::string, double> calc_team_strength(const std::string& division,
                                                 const LeagueSnapshot& snapshot,
                                                 const StrengthConfig& config) {
    std::map<std::string, double> strengths;
    for (auto& s : calc_standings(division, snapshot)) {
        double current = s.played > 0
            ? (static_cast<double>(s.diff()) / s.played / 10.0) * 2.0
            : 0.0;
        double blend = config.prior_blend_games > 0
            ? std::min(1.0, static_cast<double>(s.played) / config.prior_blend_games)
            : 1.0;

        if (blend < 1.0) {
            double prior = prior_team_strength(s.team, division, snapshot, config);
            strengths[s.team] = (1.0 - blend) * prior + blend * current;
        } else {
            strengths[s.team] = current;
        }
    }
    return strengths;
}

double team_strength(const std::string& team, const LeagueSnapshot& snapshot,
                     const StrengthConfig& config) {
    auto division = division_of(team, snapshot);
    if (!division) return 0.0;
    auto strengths = calc_team_strength(*division, snapshot, config);
    auto it = strengths.find(team);
    return it == strengths.end() ? 0.0 : it->second;
}

std::vector<SquadMember> team_squad(const std::string& team, const LeagueSnapshot& snapshot) {
    auto division = division_of(team, snapshot);
    if (!division) return {};
    auto* roster = find_roster(*division, team, snapshot);
    if (!roster) return {};

    std::set<std::string> names(roster->begin(), roster->end());
    for (auto& [name, stats] : snapshot.players) {
        if (stats.for_team(team)) names.insert(name);
    }

    std::vector<SquadMember> squad;
    for (auto& name : names) {
        SquadMember member{.name = name};
        if (auto it = snapshot.prior_players.find(name); it != snapshot.prior_players.end()) {
            member.prior = it->second;
        }
        if (auto it = snapshot.players.find(name); it != snapshot.players.end()) {
            if (auto* entry = it->second.for_team(team)) member.current = *entry;
        }
        member.rostered = std::ranges::find(*roster, name) != roster->end();
        squad.push_back(std::move(member));
    }

    std::ranges::stable_sort(squad, std::greater{}, [](const SquadMember& m) {
        auto eff = effective_pct(m);
        return eff ? eff->adj_pct : -1.0;
    });
    return squad;
}

std::optional<EffectivePct> effective_pct(const SquadMember& member,
                                          const StrengthConfig& config) {
    if (member.current && member.current->played >= 3) {
        return EffectivePct{
            .pct = member.current->pct / 100.0,
            .adj_pct = bayesian_pct(member.current->won, member.current->played, config) / 100.0,
            .weight = member.current->played,
        };
    }
    if (member.prior && member.prior->played > 0) {
        int wins = static_cast<int>(std::lround(member.prior->win_rate * member.prior->played));
        return EffectivePct{
            .pct = member.prior->win_rate,
            .adj_pct = bayesian_pct(wins, member.prior->played, config) / 100.0,
            .weight = member.prior->played,
        };
    }
    return std::nullopt;
}

std::optional<double> squad_strength(const std::vector<SquadMember>& squad, int top_n,
                                     const StrengthConfig& config) {
    if (squad.empty()) return std::nullopt;
    if (top_n <= 0) return weighted_squad_pct(squad, config);

    std::vector<SquadMember> rated;
    for (auto& member : squad) {
        if (effective_pct(member, config)) rated.push_back(member);
    }
    std::ranges::stable_sort(rated, std::greater{}, [&](const SquadMember& m) {
        return effective_pct(m, config)->adj_pct;
    });
    if (static_cast<int>(rated.size()) > top_n) rated.resize(top_n);
    return weighted_squad_pct(rated, config);
}

std::vector<SquadMember> apply_override(const std::vector<SquadMember>& squad,
                                        const SquadOverride& override_,
                                        const LeagueSnapshot& snapshot) {
    std::vector<SquadMember> modified;
    for (auto& member : squad) {
        if (std::ranges::find(override_.removed, member.name) == override_.removed.end()) {
            modified.push_back(member);
        }
    }

    for (auto& name : override_.added) {
        SquadMember member{.name = name};
        if (auto it = snapshot.prior_players.find(name); it != snapshot.prior_players.end()) {
            member.prior = it->second;
        }
        if (auto it = snapshot.players.find(name);
            it != snapshot.players.end() && !it->second.teams.empty()) {
            // The player's busiest team context stands in for their form.
            member.current = *std::ranges::max_element(it->second.teams, {}, &PlayerTeamStats::played);
        }
        modified.push_back(std::move(member));
    }
    return modified;
}

std::map<std::string, double> squad_adjustments(const std::string& division,
                                                const SquadOverrides& overrides,
                                                const LeagueSnapshot& snapshot,
                                                int top_n,
                                                const StrengthConfig& config) {
    std::map<std::string, double> adjustments;
    auto it = snapshot.divisions.find(division);
    if (it == snapshot.divisions.end()) return adjustments;

    for (auto& team : it->second.teams) {
        auto ov = overrides.find(team);
        if (ov == overrides.end()) continue;

        auto squad = team_squad(team, snapshot);
        auto original = squad_strength(squad, top_n, config);
        auto modified = squad_strength(apply_override(squad, ov->second, snapshot), top_n, config);
        if (original && modified) {
            adjustments[team] = (*modified - *original) * config.squad_scale;
        }
    }
    return adjustments;
}

} // namespace leaguesim

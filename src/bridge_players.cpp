#include "leaguesim/bridge_players.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace leaguesim {

namespace {

struct LeaguePlayer {
    std::string name;
    std::string normalized;
    std::string league_id;
    std::vector<PlayerTeamStats> stats;
};

std::vector<PlayerTeamStats> league_contexts(const PlayerSeasonStats& player) {
    std::vector<PlayerTeamStats> out;
    for (auto& t : player.teams) {
        if (!t.cup) out.push_back(t);
    }
    return out;
}

std::string matched_key(const LeaguePlayer& p) {
    return p.league_id + ":" + p.name;
}

void append_contexts(BridgePlayer& bridge, const LeaguePlayer& p) {
    for (auto& s : p.stats) {
        bridge.contexts.push_back({
            .league_id = p.league_id, .player = p.name, .division = s.division, .stats = s});
    }
}

} // namespace

std::string normalize_player_name(std::string_view name) {
    std::string out;
    bool pending_space = false;
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out += ' ';
        pending_space = false;
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

int levenshtein_distance(std::string_view a, std::string_view b) {
    std::vector<int> prev(b.size() + 1);
    std::vector<int> curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = static_cast<int>(i);
        for (size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1]) {
                curr[j] = prev[j - 1];
            } else {
                curr[j] = 1 + std::min({prev[j], curr[j - 1], prev[j - 1]});
            }
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

double name_similarity(std::string_view a, std::string_view b) {
    if (a == b) return 1.0;
    if (a.empty() || b.empty()) return 0.0;
    auto longest = std::max(a.size(), b.size());
    return 1.0 - static_cast<double>(levenshtein_distance(a, b)) / longest;
}

std::vector<BridgePlayer> find_intra_league_bridge_players(const LeagueSnapshot& league) {
    std::vector<BridgePlayer> bridges;
    for (auto& [name, data] : league.players) {
        auto stats = league_contexts(data);
        if (stats.size() < 2) continue;

        std::set<std::string> divisions;
        for (auto& s : stats) divisions.insert(s.division);
        if (divisions.size() < 2) continue;

        BridgePlayer bridge{.name = name, .canonical_name = normalize_player_name(name)};
        append_contexts(bridge, {name, bridge.canonical_name, league.league_id, stats});
        bridges.push_back(std::move(bridge));
    }
    return bridges;
}

std::vector<BridgePlayer> find_cross_league_bridge_players(const LeagueSet& leagues,
                                                           double min_confidence) {
    if (leagues.size() < 2) return {};

    std::vector<LeaguePlayer> all;
    for (auto& [league_id, league] : leagues) {
        for (auto& [name, data] : league.players) {
            auto stats = league_contexts(data);
            if (stats.empty()) continue;
            all.push_back({name, normalize_player_name(name), league_id, std::move(stats)});
        }
    }

    std::vector<BridgePlayer> bridges;
    std::set<std::string> matched;

    // Exact normalized-name groups spanning two or more leagues.
    std::map<std::string, std::vector<const LeaguePlayer*>> groups;
    for (auto& p : all) groups[p.normalized].push_back(&p);

    for (auto& [normalized, group] : groups) {
        std::set<std::string> league_ids;
        for (auto* p : group) league_ids.insert(p->league_id);
        if (league_ids.size() < 2) continue;

        BridgePlayer bridge{.name = group.front()->name, .canonical_name = normalized};
        for (auto* p : group) {
            append_contexts(bridge, *p);
            matched.insert(matched_key(*p));
        }
        bridges.push_back(std::move(bridge));
    }

    // Fuzzy pass over whatever is left, one partner per player.
    std::map<std::string, std::vector<const LeaguePlayer*>> by_league;
    for (auto& p : all) {
        if (!matched.contains(matched_key(p))) by_league[p.league_id].push_back(&p);
    }

    for (auto a = by_league.begin(); a != by_league.end(); ++a) {
        for (auto b = std::next(a); b != by_league.end(); ++b) {
            for (auto* pa : a->second) {
                if (matched.contains(matched_key(*pa))) continue;
                for (auto* pb : b->second) {
                    if (matched.contains(matched_key(*pb))) continue;

                    double similarity = name_similarity(pa->normalized, pb->normalized);
                    if (similarity < min_confidence) continue;

                    BridgePlayer bridge{
                        .name = pa->name,
                        .canonical_name = pa->normalized,
                        .match_confidence = similarity,
                    };
                    append_contexts(bridge, *pa);
                    append_contexts(bridge, *pb);
                    bridges.push_back(std::move(bridge));

                    matched.insert(matched_key(*pa));
                    matched.insert(matched_key(*pb));
                    break;
                }
            }
        }
    }

    return bridges;
}

std::vector<BridgePlayer> find_all_bridge_players(const LeagueSet& leagues,
                                                  const CalibrationConfig& config) {
    std::vector<BridgePlayer> bridges;
    for (auto& [league_id, league] : leagues) {
        auto intra = find_intra_league_bridge_players(league);
        bridges.insert(bridges.end(), intra.begin(), intra.end());
    }
    auto cross = find_cross_league_bridge_players(leagues, config.fuzzy_threshold);
    bridges.insert(bridges.end(), cross.begin(), cross.end());
    return bridges;
}

} // namespace leaguesim

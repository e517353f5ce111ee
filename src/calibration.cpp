#include "leaguesim/calibration.hpp"
#include <algorithm>
#include <cctype>
#include <numeric>
#include <set>

namespace leaguesim {

namespace {

std::string lowercase(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string uppercase(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

// "Premier" -> PREM, "Super Division 1" -> SD1, "Women's Division 2" -> WD2,
// "Division 3" -> D3.
std::optional<std::string> tier_code_from_name(const std::string& name) {
    auto lower = lowercase(name);
    if (lower.find("premier") != std::string::npos) return "PREM";

    auto pos = lower.find("division");
    if (pos == std::string::npos) return std::nullopt;
    auto digits = lower.find_first_of("0123456789", pos);
    if (digits == std::string::npos) return std::nullopt;
    auto end = lower.find_first_not_of("0123456789", digits);
    auto number = lower.substr(digits, end == std::string::npos ? end : end - digits);

    auto prefix = lower.substr(0, pos);
    if (prefix.find("super") != std::string::npos) return "SD" + number;
    if (prefix.find("women") != std::string::npos || prefix.find("ladies") != std::string::npos) {
        return "WD" + number;
    }
    return "D" + number;
}

void recentre(std::map<std::string, double>& offsets) {
    if (offsets.empty()) return;
    double sum = 0.0;
    for (auto& [id, offset] : offsets) sum += offset;
    double mean = sum / offsets.size();
    for (auto& [id, offset] : offsets) offset -= mean;
}

double bridge_confidence(int usable, const CalibrationConfig& config) {
    if (config.bridge_target <= 0) return 1.0;
    return std::min(1.0, static_cast<double>(usable) / config.bridge_target);
}

std::vector<DivisionStrength> division_strengths_for(const std::string& league_id,
                                                     const LeagueSnapshot& league,
                                                     const std::vector<BridgePlayer>& bridges,
                                                     const CalibrationConfig& config) {
    std::vector<std::string> codes;
    for (auto& [code, division] : league.divisions) codes.push_back(code);
    if (codes.empty()) return {};

    PairDifferences pairs;
    int usable = 0;
    int samples = 0;
    // Intra and cross-league lists can both carry the same league player.
    std::set<std::string> counted;

    for (auto& bp : bridges) {
        std::vector<const BridgeContext*> contexts;
        for (auto& ctx : bp.contexts) {
            if (ctx.league_id == league_id && league.divisions.contains(ctx.division)) {
                contexts.push_back(&ctx);
            }
        }
        if (contexts.empty() || counted.contains(contexts.front()->player)) continue;

        bool contributed = false;
        for (size_t i = 0; i < contexts.size(); ++i) {
            for (size_t j = i + 1; j < contexts.size(); ++j) {
                auto& a = *contexts[i];
                auto& b = *contexts[j];
                if (a.division == b.division) continue;
                if (a.stats.played < config.min_context_games ||
                    b.stats.played < config.min_context_games) {
                    continue;
                }
                add_pair_difference(pairs, a.division, b.division, a.stats.pct, b.stats.pct,
                                    bp.match_confidence);
                samples += a.stats.played + b.stats.played;
                contributed = true;
            }
        }
        if (contributed) {
            usable++;
            counted.insert(contexts.front()->player);
        }
    }

    auto data = solve_offsets(codes, pairs, config);
    double confidence = bridge_confidence(usable, config);

    std::map<std::string, double> blended;
    for (auto& code : codes) {
        double fallback = tier_offset(code, league.divisions.at(code).name, config)
                              .value_or(data[code]);
        if (confidence < config.confidence_floor) {
            blended[code] = fallback;
        } else if (confidence < 1.0) {
            blended[code] = confidence * data[code] + (1.0 - confidence) * fallback;
        } else {
            blended[code] = data[code];
        }
    }
    recentre(blended);

    std::vector<DivisionStrength> out;
    for (auto& code : codes) {
        out.push_back({
            .division = code,
            .league_id = league_id,
            .offset = blended[code],
            .data_offset = data[code],
            .confidence = confidence,
            .bridge_player_count = usable,
            .sample_size = samples,
        });
    }
    return out;
}

// Games-weighted, division-normalised pct over contexts with enough games.
std::optional<double> normalised_rating(const std::vector<const BridgeContext*>& contexts,
                                        const std::vector<DivisionStrength>& divisions,
                                        const CalibrationConfig& config) {
    double weighted = 0.0;
    int games = 0;
    for (auto* ctx : contexts) {
        if (ctx->stats.played < config.min_context_games) continue;
        auto div = std::ranges::find(divisions, ctx->division, &DivisionStrength::division);
        double offset = div != divisions.end() ? div->offset : 0.0;
        weighted += (ctx->stats.pct + offset) * ctx->stats.played;
        games += ctx->stats.played;
    }
    if (games == 0) return std::nullopt;
    return weighted / games;
}

} // namespace

void add_pair_difference(PairDifferences& pairs, const std::string& a, const std::string& b,
                         double rating_a, double rating_b, double weight) {
    if (a < b) {
        pairs[{a, b}].push_back((rating_a - rating_b) * weight);
    } else {
        pairs[{b, a}].push_back((rating_b - rating_a) * weight);
    }
}

std::map<std::string, double> solve_offsets(const std::vector<std::string>& ids,
                                            const PairDifferences& pairs,
                                            const CalibrationConfig& config) {
    std::map<std::string, double> offsets;
    for (auto& id : ids) offsets[id] = 0.0;
    if (pairs.empty()) return offsets;

    for (int iter = 0; iter < config.solver_iterations; ++iter) {
        std::map<std::string, double> next;
        std::map<std::string, int> counts;

        for (auto& [key, diffs] : pairs) {
            auto& [first, second] = key;
            if (diffs.empty() || !offsets.contains(first) || !offsets.contains(second)) continue;

            double avg = std::accumulate(diffs.begin(), diffs.end(), 0.0) / diffs.size();
            // Doing better in `first` means `first` is the weaker context.
            next[first] -= avg / 2.0;
            next[second] += avg / 2.0;
            counts[first]++;
            counts[second]++;
        }

        for (auto& [id, offset] : offsets) {
            auto c = counts.find(id);
            if (c == counts.end()) continue;
            offset = offset * config.damping + (next[id] / c->second) * (1.0 - config.damping);
        }
        recentre(offsets);
    }
    return offsets;
}

std::optional<double> tier_offset(const std::string& code, const std::string& name,
                                  const CalibrationConfig& config) {
    auto lookup = [&](const std::string& key) -> std::optional<double> {
        auto it = config.tier_multipliers.find(key);
        if (it == config.tier_multipliers.end()) return std::nullopt;
        return (it->second - 1.0) * config.tier_scale;
    };

    if (auto by_code = lookup(uppercase(code))) return by_code;
    if (auto derived = tier_code_from_name(name)) return lookup(*derived);
    return std::nullopt;
}

std::vector<DivisionStrength> calculate_division_strengths(
    const LeagueSnapshot& league, const std::vector<BridgePlayer>& bridge_players,
    const CalibrationConfig& config) {
    return division_strengths_for(league.league_id, league, bridge_players, config);
}

std::vector<LeagueStrength> calculate_league_strengths(
    const LeagueSet& leagues, const std::vector<BridgePlayer>& bridge_players,
    const CalibrationConfig& config) {
    if (leagues.empty()) return {};

    std::vector<std::string> ids;
    std::map<std::string, std::vector<DivisionStrength>> divisions;
    for (auto& [id, league] : leagues) {
        ids.push_back(id);
        divisions[id] = division_strengths_for(id, league, bridge_players, config);
    }

    PairDifferences pairs;
    int usable = 0;

    for (auto& bp : bridge_players) {
        std::map<std::string, std::vector<const BridgeContext*>> by_league;
        for (auto& ctx : bp.contexts) {
            if (leagues.contains(ctx.league_id)) by_league[ctx.league_id].push_back(&ctx);
        }
        if (by_league.size() < 2) continue;

        bool contributed = false;
        for (auto a = by_league.begin(); a != by_league.end(); ++a) {
            auto rating_a = normalised_rating(a->second, divisions[a->first], config);
            if (!rating_a) continue;
            for (auto b = std::next(a); b != by_league.end(); ++b) {
                auto rating_b = normalised_rating(b->second, divisions[b->first], config);
                if (!rating_b) continue;
                add_pair_difference(pairs, a->first, b->first, *rating_a, *rating_b,
                                    bp.match_confidence);
                contributed = true;
            }
        }
        if (contributed) usable++;
    }

    auto offsets = solve_offsets(ids, pairs, config);
    // A lone league is its own reference point.
    double confidence = ids.size() == 1 ? 1.0 : bridge_confidence(usable, config);

    std::vector<LeagueStrength> out;
    for (auto& id : ids) {
        out.push_back({
            .league_id = id,
            .offset = offsets[id],
            .confidence = confidence,
            .bridge_player_count = usable,
            .divisions = divisions[id],
        });
    }
    return out;
}

} // namespace leaguesim

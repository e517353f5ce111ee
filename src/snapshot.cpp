#include "leaguesim/snapshot.hpp"
#include <fstream>

namespace leaguesim {

namespace {

constexpr const char* kDefaultLeagueId = "default";

int safe_int(const nlohmann::json& j, const std::string& key, int fallback = 0) {
    if (j.contains(key) && !j[key].is_null() && j[key].is_number())
        return j[key].get<int>();
    return fallback;
}

double safe_double(const nlohmann::json& j, const std::string& key, double fallback = 0.0) {
    if (j.contains(key) && !j[key].is_null() && j[key].is_number())
        return j[key].get<double>();
    return fallback;
}

bool safe_bool(const nlohmann::json& j, const std::string& key, bool fallback = false) {
    if (j.contains(key) && j[key].is_boolean())
        return j[key].get<bool>();
    return fallback;
}

std::string safe_str(const nlohmann::json& j, const std::string& key,
                     const std::string& fallback = "") {
    if (j.contains(key) && !j[key].is_null() && j[key].is_string())
        return j[key].get<std::string>();
    return fallback;
}

std::vector<std::string> safe_strings(const nlohmann::json& j) {
    std::vector<std::string> out;
    if (!j.is_array()) return out;
    for (auto& item : j) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

const nlohmann::json& member(const nlohmann::json& j, const std::string& key) {
    static const nlohmann::json empty;
    if (j.is_object() && j.contains(key)) return j[key];
    return empty;
}

double pct_of(int won, int played) {
    return played > 0 ? static_cast<double>(won) / played * 100.0 : 0.0;
}

MatchResult parse_result(const nlohmann::json& j) {
    return {
        .date = safe_str(j, "date"),
        .home = safe_str(j, "home"),
        .away = safe_str(j, "away"),
        .home_score = safe_int(j, "home_score"),
        .away_score = safe_int(j, "away_score"),
        .division = safe_str(j, "division"),
    };
}

Fixture parse_fixture(const nlohmann::json& j) {
    return {
        .date = safe_str(j, "date"),
        .home = safe_str(j, "home"),
        .away = safe_str(j, "away"),
        .division = safe_str(j, "division"),
    };
}

FrameRecord parse_frame(const nlohmann::json& j, int index) {
    return {
        .frame_number = safe_int(j, "frame", index + 1),
        .home_player = safe_str(j, "home_player"),
        .away_player = safe_str(j, "away_player"),
        .winner = safe_str(j, "winner") == "away" ? Side::Away : Side::Home,
        .break_and_dish = safe_bool(j, "break_and_dish"),
        .forfeit = safe_bool(j, "forfeit"),
    };
}

MatchFrames parse_match_frames(const nlohmann::json& j) {
    MatchFrames m{
        .match_id = safe_str(j, "match_id"),
        .date = safe_str(j, "date"),
        .home = safe_str(j, "home"),
        .away = safe_str(j, "away"),
        .division = safe_str(j, "division"),
    };
    auto& frames = member(j, "frames");
    if (frames.is_array()) {
        for (size_t i = 0; i < frames.size(); ++i) {
            if (frames[i].is_object()) {
                m.frames.push_back(parse_frame(frames[i], static_cast<int>(i)));
            }
        }
    }
    return m;
}

PlayerTeamStats parse_team_stats(const nlohmann::json& j) {
    PlayerTeamStats s{
        .team = safe_str(j, "team"),
        .division = safe_str(j, "division"),
        .played = safe_int(j, "played"),
        .won = safe_int(j, "won"),
        .lag = safe_double(j, "lag"),
        .bd_for = safe_int(j, "bd_for"),
        .bd_against = safe_int(j, "bd_against"),
        .forfeits = safe_int(j, "forfeits"),
        .cup = safe_bool(j, "cup"),
    };
    s.pct = safe_double(j, "pct", pct_of(s.won, s.played));
    return s;
}

PlayerSeasonStats parse_player(const nlohmann::json& j) {
    PlayerSeasonStats p;
    auto& teams = member(j, "teams");
    if (teams.is_array()) {
        for (auto& t : teams) {
            if (t.is_object()) p.teams.push_back(parse_team_stats(t));
        }
    }

    auto& total = member(j, "total");
    if (total.is_object()) {
        p.total.played = safe_int(total, "played");
        p.total.won = safe_int(total, "won");
        p.total.pct = safe_double(total, "pct", pct_of(p.total.won, p.total.played));
    } else {
        for (auto& t : p.teams) {
            p.total.played += t.played;
            p.total.won += t.won;
        }
        p.total.pct = pct_of(p.total.won, p.total.played);
    }
    return p;
}

std::expected<nlohmann::json, LoadError> read_json(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(LoadError{path.string(), "cannot open file"});
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(LoadError{path.string(), std::string("JSON parse error: ") + e.what()});
    }
}

} // namespace

LeagueSnapshot parse_snapshot(const nlohmann::json& j, const std::string& league_id) {
    LeagueSnapshot snap;
    snap.league_id = league_id.empty() ? safe_str(j, "league_id", kDefaultLeagueId) : league_id;

    auto& divisions = member(j, "divisions");
    if (divisions.is_object()) {
        for (auto& [code, d] : divisions.items()) {
            snap.divisions[code] = {
                .name = safe_str(d, "name", code),
                .teams = safe_strings(member(d, "teams")),
            };
        }
    }

    for (auto& r : member(j, "results")) {
        if (r.is_object()) snap.results.push_back(parse_result(r));
    }
    for (auto& f : member(j, "fixtures")) {
        if (f.is_object()) snap.fixtures.push_back(parse_fixture(f));
    }
    for (auto& m : member(j, "frames")) {
        if (m.is_object()) snap.frames.push_back(parse_match_frames(m));
    }

    auto& prior = member(j, "prior_players");
    if (prior.is_object()) {
        for (auto& [name, p] : prior.items()) {
            snap.prior_players[name] = {
                .rating = safe_double(p, "rating"),
                .win_rate = safe_double(p, "win_rate"),
                .played = safe_int(p, "played"),
            };
        }
    }

    auto& players = member(j, "players");
    if (players.is_object()) {
        for (auto& [name, p] : players.items()) snap.players[name] = parse_player(p);
    }

    auto& rosters = member(j, "rosters");
    if (rosters.is_object()) {
        for (auto& [key, names] : rosters.items()) snap.rosters[key] = safe_strings(names);
    }

    return snap;
}

std::expected<LeagueSnapshot, LoadError> load_snapshot(const std::filesystem::path& path) {
    auto doc = read_json(path);
    if (!doc) return std::unexpected(doc.error());
    if (!doc->is_object()) {
        return std::unexpected(LoadError{path.string(), "snapshot must be a JSON object"});
    }
    return parse_snapshot(*doc);
}

std::expected<LeagueSet, LoadError> load_leagues(const std::filesystem::path& path) {
    auto doc = read_json(path);
    if (!doc) return std::unexpected(doc.error());
    if (!doc->is_object()) {
        return std::unexpected(LoadError{path.string(), "snapshot must be a JSON object"});
    }

    LeagueSet leagues;
    auto& nested = member(*doc, "leagues");
    if (nested.is_object()) {
        for (auto& [id, league] : nested.items()) {
            if (league.is_object()) leagues[id] = parse_snapshot(league, id);
        }
        if (leagues.empty()) {
            return std::unexpected(LoadError{path.string(), "no leagues in document"});
        }
        return leagues;
    }

    auto single = parse_snapshot(*doc);
    leagues[single.league_id] = std::move(single);
    return leagues;
}

} // namespace leaguesim

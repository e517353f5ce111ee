#include "leaguesim/schedule.hpp"
#include <algorithm>
#include <charconv>

namespace leaguesim {

namespace {

std::optional<int> parse_field(std::string_view field) {
    if (field.empty()) return std::nullopt;
    int value = 0;
    auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
    if (ec != std::errc{} || ptr != field.data() + field.size()) return std::nullopt;
    return value;
}

bool in_division(const MatchResult& r, const Division& division) {
    auto has = [&](const std::string& team) {
        return std::ranges::find(division.teams, team) != division.teams.end();
    };
    return has(r.home) && has(r.away);
}

} // namespace

std::optional<MatchDate> parse_match_date(std::string_view text) {
    auto first = text.find('-');
    if (first == std::string_view::npos) return std::nullopt;
    auto second = text.find('-', first + 1);
    if (second == std::string_view::npos) return std::nullopt;

    auto d = parse_field(text.substr(0, first));
    auto m = parse_field(text.substr(first + 1, second - first - 1));
    auto y = parse_field(text.substr(second + 1));
    if (!d || !m || !y) return std::nullopt;

    MatchDate date{std::chrono::year{*y},
                   std::chrono::month{static_cast<unsigned>(*m)},
                   std::chrono::day{static_cast<unsigned>(*d)}};
    if (!date.ok()) return std::nullopt;
    return date;
}

MatchDate date_sort_key(const std::string& text) {
    if (auto date = parse_match_date(text)) return *date;
    return MatchDate{std::chrono::year::min(), std::chrono::January, std::chrono::day{1}};
}

std::optional<std::string> division_of(const std::string& team,
                                       const LeagueSnapshot& snapshot) {
    for (auto& [code, division] : snapshot.divisions) {
        if (std::ranges::find(division.teams, team) != division.teams.end()) {
            return code;
        }
    }
    return std::nullopt;
}

std::optional<MatchDate> latest_result_date(const std::vector<MatchResult>& results,
                                            const LeagueSnapshot& snapshot,
                                            const std::string& division) {
    auto it = snapshot.divisions.find(division);
    if (it == snapshot.divisions.end()) return std::nullopt;

    std::optional<MatchDate> latest;
    for (auto& r : results) {
        if (!in_division(r, it->second)) continue;
        auto date = parse_match_date(r.date);
        if (!date) continue;
        if (!latest || *date > *latest) latest = date;
    }
    return latest;
}

std::vector<Fixture> remaining_fixtures(const std::string& division,
                                        const LeagueSnapshot& snapshot) {
    auto latest = latest_result_date(snapshot.results, snapshot, division);

    std::vector<Fixture> remaining;
    for (auto& f : snapshot.fixtures) {
        if (f.division != division) continue;
        if (latest && date_sort_key(f.date) <= *latest) continue;
        remaining.push_back(f);
    }

    std::ranges::stable_sort(remaining, {}, [](const Fixture& f) { return date_sort_key(f.date); });
    return remaining;
}

std::vector<TeamResult> team_results(const std::string& team,
                                     const std::vector<MatchResult>& results) {
    std::vector<TeamResult> out;
    for (auto& r : results) {
        bool home = r.home == team;
        if (!home && r.away != team) continue;

        TeamResult tr{
            .date = r.date,
            .opponent = home ? r.away : r.home,
            .is_home = home,
            .team_score = home ? r.home_score : r.away_score,
            .opponent_score = home ? r.away_score : r.home_score,
        };
        tr.outcome = tr.team_score > tr.opponent_score ? Outcome::Win
                   : tr.team_score < tr.opponent_score ? Outcome::Loss
                   : Outcome::Draw;
        out.push_back(std::move(tr));
    }

    std::ranges::stable_sort(out, std::greater{},
                             [](const TeamResult& r) { return date_sort_key(r.date); });
    return out;
}

} // namespace leaguesim

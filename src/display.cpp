#include "leaguesim/display.hpp"
#include "leaguesim/analytics.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace leaguesim {

namespace {

using namespace ftxui;
using Rows = std::vector<std::vector<std::string>>;

// -- Formatting helpers --

std::string f2(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << v;
    return oss.str();
}

std::string f1(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << v;
    return oss.str();
}

std::string fpct(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (v * 100.0) << "%";
    return oss.str();
}

std::string fsigned(double v) {
    return (v > 0 ? "+" : "") + f1(v);
}

std::string fdiff(int v) {
    if (v > 0) return "+" + std::to_string(v);
    return std::to_string(v);
}

std::string form_str(const std::vector<Outcome>& form) {
    std::string s;
    for (auto o : form) s += to_char(o);
    return s.empty() ? "-" : s;
}

Color prob_color(double p) {
    if (p >= 0.5) return Color::Green;
    if (p >= 0.2) return Color::Yellow;
    return Color::Red;
}

Color pct_color(double pct) {
    if (pct >= 55.0) return Color::Green;
    if (pct >= 45.0) return Color::Yellow;
    return Color::Red;
}

Color offset_color(double offset) {
    if (offset > 0.5) return Color::Green;
    if (offset < -0.5) return Color::Red;
    return Color::Yellow;
}

// -- Output helpers --

std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

void print_csv(const Rows& rows) {
    for (auto& row : rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) std::cout << ",";
            std::cout << csv_field(row[i]);
        }
        std::cout << "\n";
    }
}

void print_element(Element doc) {
    auto screen = Screen::Create(Dimension::Fit(doc));
    Render(screen, doc);
    screen.Print();
    std::cout << "\n";
}

Table make_table(const Rows& rows) {
    auto table = Table(rows);
    table.SelectRow(0).Decorate(bold);
    table.SelectRow(0).SeparatorVertical(LIGHT);
    table.SelectAll().Border(LIGHT);
    return table;
}

Element section(const std::string& title, Element body) {
    return vbox({
        text(title) | bold | color(Color::Cyan),
        separator(),
        std::move(body),
    });
}

Element make_bar_chart(const std::vector<std::pair<std::string, double>>& bars,
                       Color bar_color = Color::Cyan) {
    if (bars.empty()) return text("No data") | dim;

    size_t label_width = 8;
    for (auto& [label, _] : bars) label_width = std::max(label_width, label.size() + 1);

    Elements rows;
    for (auto& [label, p] : bars) {
        rows.push_back(hbox({
            text(label) | size(WIDTH, EQUAL, static_cast<int>(label_width)),
            gauge(static_cast<float>(std::clamp(p, 0.0, 1.0))) | size(WIDTH, EQUAL, 25) |
                color(bar_color),
            text(" " + fpct(p)) | dim,
        }));
    }
    return vbox(rows);
}

std::string lineup_cell(const std::vector<std::string>& set, size_t i) {
    return i < set.size() ? set[i] : "-";
}

} // namespace

void display_header(const std::string& league_id, const std::string& division,
                    const std::string& team) {
    Elements parts{text(" League: " + league_id) | bold};
    if (!division.empty()) {
        parts.push_back(text("  |  "));
        parts.push_back(text("Division: " + division));
    }
    if (!team.empty()) {
        parts.push_back(text("  |  "));
        parts.push_back(text("Team: " + team));
    }
    print_element(hbox(std::move(parts)) | borderLight | color(Color::Cyan));
}

void display_standings(const std::vector<StandingEntry>& standings, OutputFormat format) {
    Rows rows;
    rows.push_back({"Pos", "Team", "P", "W", "D", "L", "F", "A", "Diff", "Pts"});
    for (size_t i = 0; i < standings.size(); ++i) {
        auto& s = standings[i];
        rows.push_back({
            std::to_string(i + 1), s.team, std::to_string(s.played),
            std::to_string(s.won), std::to_string(s.drawn), std::to_string(s.lost),
            std::to_string(s.frames_for), std::to_string(s.frames_against),
            fdiff(s.diff()), std::to_string(s.points),
        });
    }

    if (format == OutputFormat::Csv) {
        print_csv(rows);
        return;
    }
    if (standings.empty()) {
        print_element(text("No standings for this division.") | dim);
        return;
    }

    auto table = make_table(rows);
    table.SelectColumn(9).Decorate(bold);
    print_element(section("Standings", table.Render()));
}

void display_simulation(const std::vector<SimulationResult>& results, OutputFormat format) {
    Rows rows;
    rows.push_back({"Team", "Pts", "Avg Pts", "Title", "Top 2", "Bottom 2"});
    for (auto& r : results) {
        rows.push_back({
            r.team, std::to_string(r.current_points), f1(r.avg_points),
            fpct(r.p_title), fpct(r.p_top2), fpct(r.p_bottom2),
        });
    }

    if (format == OutputFormat::Csv) {
        print_csv(rows);
        return;
    }
    if (results.empty()) {
        print_element(text("Nothing to simulate.") | dim);
        return;
    }

    auto table = make_table(rows);
    for (size_t i = 1; i < rows.size(); ++i) {
        auto& r = results[i - 1];
        table.SelectCell(3, i).Decorate(color(prob_color(r.p_title)));
        table.SelectCell(4, i).Decorate(color(prob_color(r.p_top2)));
        table.SelectCell(5, i).Decorate(color(prob_color(1.0 - r.p_bottom2)));
    }

    std::vector<std::pair<std::string, double>> title_bars;
    for (auto& r : results) title_bars.emplace_back(r.team, r.p_title);

    print_element(vbox({
        section("Season Projection", table.Render()),
        text(""),
        text("  Title Probability") | bold,
        make_bar_chart(title_bars, Color::Green),
    }));
}

void display_prediction(const std::string& home, const std::string& away,
                        const MatchPrediction& prediction, OutputFormat format) {
    if (format == OutputFormat::Csv) {
        Rows rows{{"Home", "Away", "Home Win", "Draw", "Away Win", "Exp Home", "Exp Away"}};
        rows.push_back({
            home, away, fpct(prediction.p_home_win), fpct(prediction.p_draw),
            fpct(prediction.p_away_win), f1(prediction.expected_home),
            f1(prediction.expected_away),
        });
        rows.push_back({"Score", "Probability"});
        for (auto& s : prediction.top_scores) {
            rows.push_back({std::to_string(s.home) + "-" + std::to_string(s.away),
                            fpct(s.probability)});
        }
        print_csv(rows);
        return;
    }

    Rows scores{{"Score", "Probability"}};
    for (auto& s : prediction.top_scores) {
        scores.push_back({std::to_string(s.home) + "-" + std::to_string(s.away),
                          fpct(s.probability)});
    }

    print_element(section(home + " vs " + away, vbox({
        make_bar_chart({
            {home, prediction.p_home_win},
            {"Draw", prediction.p_draw},
            {away, prediction.p_away_win},
        }),
        text(""),
        text("  Expected frames: " + f1(prediction.expected_home) + " - " +
             f1(prediction.expected_away)) | dim,
        text(""),
        make_table(scores).Render(),
    })));
}

void display_importance(const std::string& team, const std::vector<FixtureImportance>& fixtures,
                        OutputFormat format) {
    Rows rows;
    rows.push_back({"Date", "Home", "Away", "Top 2 if Win", "Top 2 if Loss", "Swing"});
    for (auto& f : fixtures) {
        rows.push_back({
            f.fixture.date, f.fixture.home, f.fixture.away,
            fpct(f.p_top2_if_win), fpct(f.p_top2_if_loss), fpct(f.importance),
        });
    }

    if (format == OutputFormat::Csv) {
        print_csv(rows);
        return;
    }
    if (fixtures.empty()) {
        print_element(text("No remaining fixtures for " + team + ".") | dim);
        return;
    }

    auto table = make_table(rows);
    table.SelectColumn(5).Decorate(bold);
    print_element(section("Key Fixtures: " + team, table.Render()));
}

void display_schedule(const std::vector<ScheduleStrength>& schedule, OutputFormat format) {
    Rows rows;
    rows.push_back({"Rank", "Team", "Played Opp", "Remaining Opp", "Overall"});
    for (auto& s : schedule) {
        rows.push_back({
            std::to_string(s.rank), s.team, f2(s.completed), f2(s.remaining), f2(s.combined),
        });
    }

    if (format == OutputFormat::Csv) {
        print_csv(rows);
        return;
    }
    print_element(section("Strength of Schedule", make_table(rows).Render()));
}

void display_lineup(const std::string& team, const std::string& opponent,
                    const std::optional<OptimizedLineup>& lineup, OutputFormat format) {
    if (!lineup) {
        if (format == OutputFormat::Csv) {
            print_csv({{"Set", "Position", "Player"}});
        } else {
            print_element(text("Not enough available players for a full lineup.") |
                          color(Color::Red));
        }
        return;
    }

    auto& best = lineup->lineup;
    auto& wp = best.win_probability;

    if (format == OutputFormat::Csv) {
        Rows rows{{"Set", "Position", "Player"}};
        for (size_t i = 0; i < best.set1.size(); ++i) {
            rows.push_back({"1", std::to_string(i + 1), best.set1[i]});
        }
        for (size_t i = 0; i < best.set2.size(); ++i) {
            rows.push_back({"2", std::to_string(i + 1), best.set2[i]});
        }
        rows.push_back({"Win", "Draw", "Loss"});
        rows.push_back({fpct(wp.p_win), fpct(wp.p_draw), fpct(wp.p_loss)});
        print_csv(rows);
        return;
    }

    Rows sets{{"Pos", "Set 1", "Set 2"}};
    size_t n = std::max(best.set1.size(), best.set2.size());
    for (size_t i = 0; i < n; ++i) {
        sets.push_back({std::to_string(i + 1), lineup_cell(best.set1, i),
                        lineup_cell(best.set2, i)});
    }

    Rows scores{{"Player", "Score", "Adj %", "Form %", "H2H", "Venue %"}};
    for (auto& sp : lineup->scores) {
        scores.push_back({
            sp.name, f1(sp.score), f1(sp.adj_pct),
            sp.form_pct ? f1(*sp.form_pct) : "-",
            fdiff(sp.h2h_advantage),
            sp.venue_pct ? f1(*sp.venue_pct) : "-",
        });
    }
    auto score_table = make_table(scores);
    for (size_t i = 1; i < scores.size(); ++i) {
        score_table.SelectCell(2, i).Decorate(color(pct_color(lineup->scores[i - 1].adj_pct)));
    }

    Elements alternatives;
    for (auto& alt : lineup->alternatives) {
        std::string names;
        for (auto& p : alt.lineup.set1) names += p + " ";
        names += "| ";
        for (auto& p : alt.lineup.set2) names += p + " ";
        alternatives.push_back(hbox({
            text("  #" + std::to_string(alt.rank) + " ") | bold,
            text(fpct(alt.lineup.win_probability.p_win)) |
                color(prob_color(alt.lineup.win_probability.p_win)),
            text(" (-" + fpct(alt.probability_deficit) + ")  ") | dim,
            text(names),
        }));
    }

    Elements insights;
    for (auto& s : lineup->insights) insights.push_back(text("  * " + s));

    print_element(section("Lineup: " + team + " vs " + opponent, vbox({
        make_table(sets).Render(),
        text(""),
        make_bar_chart({{"Win", wp.p_win}, {"Draw", wp.p_draw}, {"Loss", wp.p_loss}}),
        text("  Expected frames: " + f1(wp.expected_for) + " - " + f1(wp.expected_against) +
             (wp.team_fallback ? "  (team strength estimate)" : "")) | dim,
        text(""),
        text("  Player Scores") | bold,
        score_table.Render(),
        text(""),
        text("  Alternatives") | bold,
        alternatives.empty() ? text("  none") | dim : vbox(alternatives),
        text(""),
        text("  Insights") | bold,
        insights.empty() ? text("  none") | dim : vbox(insights),
    })));
}

void display_scouting(const ScoutingReport& report, OutputFormat format) {
    auto& ha = report.home_away;
    auto& bd = report.break_and_dish;

    if (format == OutputFormat::Csv) {
        Rows rows{{"Metric", "Value"}};
        rows.push_back({"Form", form_str(report.form)});
        rows.push_back({"Home W-D-L", std::to_string(ha.home.won) + "-" +
                        std::to_string(ha.home.drawn) + "-" + std::to_string(ha.home.lost)});
        rows.push_back({"Away W-D-L", std::to_string(ha.away.won) + "-" +
                        std::to_string(ha.away.drawn) + "-" + std::to_string(ha.away.lost)});
        if (report.set_performance) {
            rows.push_back({"Set 1 %", f1(report.set_performance->set1.pct)});
            rows.push_back({"Set 2 %", f1(report.set_performance->set2.pct)});
        }
        rows.push_back({"BD for/game", f2(bd.bd_for_per_game)});
        rows.push_back({"BD against/game", f2(bd.bd_against_per_game)});
        rows.push_back({"Forfeit rate", fpct(report.forfeit_rate)});
        for (auto& p : report.strongest) rows.push_back({"Strongest", p.name});
        for (auto& p : report.weakest) rows.push_back({"Weakest", p.name});
        for (auto& p : report.predicted_lineup.recent_players) rows.push_back({"Recent", p});
        print_csv(rows);
        return;
    }

    Rows venue{{"Venue", "P", "W", "D", "L", "F", "A", "Win %"}};
    for (auto [label, v] : {std::pair{"Home", &ha.home}, std::pair{"Away", &ha.away}}) {
        venue.push_back({
            label, std::to_string(v->played), std::to_string(v->won),
            std::to_string(v->drawn), std::to_string(v->lost),
            std::to_string(v->frames_for), std::to_string(v->frames_against), f1(v->win_pct),
        });
    }

    Rows players{{"Player", "Apps", "Rate", "Role"}};
    for (auto& p : report.predicted_lineup.players) {
        players.push_back({p.name, std::to_string(p.appearances), fpct(p.rate),
                           to_string(p.category)});
    }

    auto ranked = [](const std::vector<RankedPlayer>& list) {
        Rows rows{{"Player", "P", "Win %", "Adj %"}};
        for (auto& p : list) {
            rows.push_back({p.name, std::to_string(p.played), f1(p.pct), f1(p.adj_pct)});
        }
        return make_table(rows).Render();
    };

    Element sets = text("No frame data.") | dim;
    if (report.set_performance) {
        auto& sp = *report.set_performance;
        sets = hbox({
            text("  Set 1: " + f1(sp.set1.pct) + "%") | color(pct_color(sp.set1.pct)),
            text("  Set 2: " + f1(sp.set2.pct) + "%") | color(pct_color(sp.set2.pct)),
            text("  Bias: " + fsigned(sp.bias)) | dim,
        });
    }

    print_element(section("Scouting: " + report.team, vbox({
        text("  Form: " + form_str(report.form)) | bold,
        make_table(venue).Render(),
        sets,
        text("  Break & dish: " + f2(bd.bd_for_per_game) + " for / " +
             f2(bd.bd_against_per_game) + " against per game, efficiency " +
             fpct(bd.efficiency)),
        text("  Forfeit rate: " + fpct(report.forfeit_rate)) | dim,
        text(""),
        hbox({
            vbox({text("  Strongest") | bold, ranked(report.strongest)}),
            text("  "),
            vbox({text("  Weakest") | bold, ranked(report.weakest)}),
        }),
        text(""),
        text("  Appearances") | bold,
        make_table(players).Render(),
    })));
}

void display_calibration(const std::vector<LeagueStrength>& leagues, OutputFormat format) {
    Rows rows;
    rows.push_back({"League", "Division", "Offset", "Data Offset", "Confidence", "Bridges",
                    "Sample"});
    for (auto& league : leagues) {
        rows.push_back({league.league_id, "*", fsigned(league.offset), "-",
                        fpct(league.confidence), std::to_string(league.bridge_player_count),
                        "-"});
        for (auto& d : league.divisions) {
            rows.push_back({
                league.league_id, d.division, fsigned(d.offset), fsigned(d.data_offset),
                fpct(d.confidence), std::to_string(d.bridge_player_count),
                std::to_string(d.sample_size),
            });
        }
    }

    if (format == OutputFormat::Csv) {
        print_csv(rows);
        return;
    }
    if (leagues.empty()) {
        print_element(text("No leagues to calibrate.") | dim);
        return;
    }

    auto table = make_table(rows);
    size_t row = 1;
    for (auto& league : leagues) {
        table.SelectRow(row).Decorate(bold);
        table.SelectCell(2, row++).Decorate(color(offset_color(league.offset)));
        for (auto& d : league.divisions) {
            table.SelectCell(2, row++).Decorate(color(offset_color(d.offset)));
        }
    }
    print_element(section("Strength Calibration", table.Render()));
}

} // namespace leaguesim

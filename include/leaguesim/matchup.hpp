#pragma once

namespace leaguesim {

inline constexpr double kHomeAdvantage = 0.2;

// Probability that the home side wins a single frame.
double frame_win_probability(double home_strength, double away_strength,
                             double home_advantage = kHomeAdvantage);

double logistic(double x);

} // namespace leaguesim

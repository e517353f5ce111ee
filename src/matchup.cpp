#include "leaguesim/matchup.hpp"
#include <cmath>

namespace leaguesim {

double logistic(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

double frame_win_probability(double home_strength, double away_strength,
                             double home_advantage) {
    return logistic((home_strength - away_strength) + home_advantage);
}

} // namespace leaguesim

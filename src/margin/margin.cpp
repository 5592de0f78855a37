#include <sc/margin/margin.hpp>

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace sc {
namespace margin {

namespace {

std::string line_label(const char* side, double line) {
  std::ostringstream oss;
  oss << side << ' ' << line; // 2.5 -> "2.5", 3 -> "3"
  return oss.str();
}

} // unnamed namespace

const char* to_string(MarketCategory c) noexcept {
  switch (c) {
    case MarketCategory::MatchResults:  return "Match Results";
    case MarketCategory::AsianHandicap: return "Asian Handicap";
    case MarketCategory::OverUnder:     return "Over/Under";
    case MarketCategory::ExactGoals:    return "Exact Goals";
    case MarketCategory::CorrectScore:  return "Correct Score";
    case MarketCategory::HtFt:          return "HT/FT";
  }
  return "?";
}

std::vector<MarketCategory> all_categories() {
  return {MarketCategory::MatchResults, MarketCategory::AsianHandicap,
          MarketCategory::OverUnder,    MarketCategory::ExactGoals,
          MarketCategory::CorrectScore, MarketCategory::HtFt};
}

double MarginTargets::get(MarketCategory c) const noexcept {
  switch (c) {
    case MarketCategory::MatchResults:  return match_results;
    case MarketCategory::AsianHandicap: return asian_handicap;
    case MarketCategory::OverUnder:     return over_under;
    case MarketCategory::ExactGoals:    return exact_goals;
    case MarketCategory::CorrectScore:  return correct_score;
    case MarketCategory::HtFt:          return ht_ft;
  }
  return 0.0;
}

void MarginTargets::set(MarketCategory c, double value) noexcept {
  switch (c) {
    case MarketCategory::MatchResults:  match_results  = value; break;
    case MarketCategory::AsianHandicap: asian_handicap = value; break;
    case MarketCategory::OverUnder:     over_under     = value; break;
    case MarketCategory::ExactGoals:    exact_goals    = value; break;
    case MarketCategory::CorrectScore:  correct_score  = value; break;
    case MarketCategory::HtFt:          ht_ft          = value; break;
  }
}

double difference(double target, double quoted) {
  if (!std::isfinite(target) || !std::isfinite(quoted)) {
    throw std::invalid_argument("margin difference: inputs must be finite");
  }
  // arrondi au centième sur la valeur binaire exacte, égalités au pair
  const double x = target - quoted;
  const double y = x * 100.0;
  if (!std::isfinite(y)) return x;
  const double err = std::fma(x, 100.0, -y); // x*100 exact = y + err
  double r = std::nearbyint(y);
  if (std::abs(y - std::trunc(y)) == 0.5 && err != 0.0) {
    r = (err > 0.0) ? std::ceil(y) : std::floor(y);
  }
  return r / 100.0;
}

std::vector<MarginRow> margin_report(const odds::MarketOdds& quoted,
                                     const MarginTargets& targets,
                                     double goal_line)
{
  const double mr = targets.get(MarketCategory::MatchResults);
  const double ou = targets.get(MarketCategory::OverUnder);

  std::vector<MarginRow> rows;
  rows.reserve(5);
  rows.push_back({"Home Win", MarketCategory::MatchResults, mr, quoted.home, difference(mr, quoted.home)});
  rows.push_back({"Draw",     MarketCategory::MatchResults, mr, quoted.draw, difference(mr, quoted.draw)});
  rows.push_back({"Away Win", MarketCategory::MatchResults, mr, quoted.away, difference(mr, quoted.away)});
  rows.push_back({line_label("Over", goal_line),  MarketCategory::OverUnder, ou, quoted.over,
                  difference(ou, quoted.over)});
  rows.push_back({line_label("Under", goal_line), MarketCategory::OverUnder, ou, quoted.under,
                  difference(ou, quoted.under)});
  return rows;
}

} // namespace margin
} // namespace sc

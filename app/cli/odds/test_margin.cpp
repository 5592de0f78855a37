#include "sc/margin/margin.hpp"
#include <cmath>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

int main() {
  using namespace sc::margin;
  constexpr double EPS = 1e-12;

  // 1) Écart arrondi au centième
  assert(std::abs(difference(4.95, 2.50) - 2.45) < EPS);
  assert(std::abs(difference(6.18, 1.55) - 4.63) < EPS);
  assert(std::abs(difference(2.0, 3.0) - (-1.0)) < EPS);
  assert(std::abs(difference(1.0, 0.123) - 0.88) < EPS);
  assert(std::abs(difference(57.97, 9.0) - 48.97) < EPS);

  // cotes à 3 décimales : arrondi exact, égalités au pair
  assert(difference(1.0, 0.875) == 0.12);   // 0.125 exact
  assert(difference(0.0, 1.125) == -1.12);  // -1.125 exact
  assert(difference(1.0, 0.625) == 0.38);   // 0.375 exact
  assert(difference(2.675, 0.0) == 2.67);   // 2.67499999... en binaire
  assert(difference(3.0, 0.985) == 2.02);   // 2.01500000...01 en binaire
  assert(difference(0.0, 0.285) == -0.28);
  assert(difference(4.95, 2.675) == 2.28);

  bool threw = false;
  try { difference(std::nan(""), 2.5); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  // 2) Cibles par défaut
  const MarginTargets t;
  assert(t.get(MarketCategory::MatchResults) == 4.95);
  assert(t.get(MarketCategory::AsianHandicap) == 5.90);
  assert(t.get(MarketCategory::OverUnder) == 6.18);
  assert(t.get(MarketCategory::ExactGoals) == 20.0);
  assert(t.get(MarketCategory::CorrectScore) == 57.97);
  assert(t.get(MarketCategory::HtFt) == 20.0);
  assert(all_categories().size() == 6);
  assert(std::string(to_string(MarketCategory::OverUnder)) == "Over/Under");

  MarginTargets t2;
  t2.set(MarketCategory::OverUnder, 5.0);
  assert(t2.over_under == 5.0 && t2.match_results == 4.95);

  // 3) Rapport de référence
  const sc::odds::MarketOdds q; // 2.50 / 3.20 / 3.10 / 2.40 / 1.55
  const auto rows = margin_report(q, t);
  assert(rows.size() == 5);
  assert(rows[0].label == "Home Win" && std::abs(rows[0].difference - 2.45) < EPS);
  assert(rows[1].label == "Draw"     && std::abs(rows[1].difference - 1.75) < EPS);
  assert(rows[2].label == "Away Win" && std::abs(rows[2].difference - 1.85) < EPS);
  assert(rows[3].label == "Over 2.5" && std::abs(rows[3].difference - 3.78) < EPS);
  assert(rows[4].label == "Under 2.5" && std::abs(rows[4].difference - 4.63) < EPS);
  assert(rows[0].category == MarketCategory::MatchResults);
  assert(rows[3].category == MarketCategory::OverUnder);
  assert(rows[4].quoted == 1.55 && rows[4].target == 6.18);

  // ligne personnalisée et cible modifiée
  const auto rows3 = margin_report(q, t2, 3.0);
  assert(rows3[3].label == "Over 3" && std::abs(rows3[3].difference - 2.60) < EPS);

  std::cout << "Margin OK. Home Win diff=" << rows[0].difference << "\n";
  return 0;
}

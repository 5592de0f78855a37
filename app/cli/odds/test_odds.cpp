#include "sc/odds/odds.hpp"
#include <cmath>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

template <class F>
static bool throws_invalid(F f) {
  try { f(); } catch (const std::invalid_argument&) { return true; }
  return false;
}

int main() {
  using namespace sc::odds;

  // 1) Probabilités implicites brutes (non renormalisées)
  const double ph = implied_probability(2.50);
  const double pd = implied_probability(3.20);
  const double pa = implied_probability(3.10);
  assert(std::abs(ph - 0.4) < 1e-15);
  assert(std::abs(pd - 0.3125) < 1e-15);
  assert(std::abs(pa - 0.322581) < 1e-6);
  assert(std::abs(ph + pd + pa - 1.035081) < 1e-6);

  // 2) Triplet normalisé (overround retiré)
  const auto n = normalize_triplet(ph, pd, pa);
  assert(std::abs(n[0] - 0.386443) < 1e-6);
  assert(std::abs(n[1] - 0.301909) < 1e-6);
  assert(std::abs(n[2] - 0.311648) < 1e-6);
  assert(std::abs(n[0] - 0.386445) < 2e-5 && std::abs(n[1] - 0.301923) < 2e-5
         && std::abs(n[2] - 0.311632) < 2e-5); // valeurs arrondies publiées
  assert(std::abs(n[0] + n[1] + n[2] - 1.0) < 1e-9);
  assert(n[0] > n[2] && n[2] > n[1]);

  // 3) Somme à 1 quelle que soit l'échelle
  const std::vector<std::vector<double>> sets {
    {1e-9, 3e-9, 2e-9}, {1e6, 5e5, 1.0}, {0.0, 0.0, 0.7}, {0.2, 0.2, 0.2, 0.2, 0.2, 0.2}
  };
  for (const auto& s : sets) {
    const auto q = normalize(s);
    double tot = 0.0;
    for (double v : q) tot += v;
    assert(std::abs(tot - 1.0) < 1e-9);
  }

  // 4) Paire Over/Under
  const auto ou = normalize_pair(implied_probability(2.40), implied_probability(1.55));
  assert(std::abs(ou[0] + ou[1] - 1.0) < 1e-12);
  assert(std::abs(ou[0] - (1/2.40) / (1/2.40 + 1/1.55)) < 1e-12);

  // 5) Overround et cote juste
  assert(std::abs(overround({2.50, 3.20, 3.10}) - 0.035081) < 1e-6);
  assert(std::abs(overround({2.0, 2.0})) < 1e-15);
  assert(std::abs(fair_odds(0.25) - 4.0) < 1e-15);
  assert(fair_odds(1.0) == 1.0);

  // 6) Domaine
  assert(throws_invalid([]{ implied_probability(0.0); }));
  assert(throws_invalid([]{ implied_probability(-2.5); }));
  assert(throws_invalid([]{ implied_probability(std::nan("")); }));
  assert(throws_invalid([]{ normalize_triplet(0.0, 0.0, 0.0); }));
  assert(throws_invalid([]{ normalize({}); }));
  assert(throws_invalid([]{ normalize({-0.1, 0.5}); }));
  assert(throws_invalid([]{ overround({}); }));
  assert(throws_invalid([]{ fair_odds(0.0); }));
  assert(throws_invalid([]{ fair_odds(1.5); }));

  std::cout << "Odds OK. normalized=" << n[0] << "," << n[1] << "," << n[2] << "\n";
  return 0;
}

#include "sc/model/poisson.hpp"
#include <algorithm>
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
  using sc::model::factorial;
  using sc::model::poisson_pmf;
  using sc::model::poisson_cdf;

  // 1) Factorielle exacte
  assert(factorial(0) == 1);
  assert(factorial(1) == 1);
  assert(factorial(5) == 120);
  assert(factorial(10) == 3628800ULL);
  assert(factorial(20) == 2432902008176640000ULL);
  assert(throws_invalid([]{ factorial(21); }));
  assert(throws_invalid([]{ factorial(-1); }));

  const std::vector<double> means {0.1, 0.5, 1.1, 1.2, 2.5, 4.0};

  // 2) Bord k = 0 : exactement exp(-mean)
  for (double m : means) {
    assert(poisson_pmf(m, 0) == std::exp(-m));
  }

  // 3) Σ_{k=0}^{30} pmf ≈ 1
  double worst = 0.0;
  for (double m : means) {
    double s = 0.0;
    for (int k = 0; k <= 30; ++k) s += poisson_pmf(m, k);
    worst = std::max(worst, std::abs(s - 1.0));
    assert(std::abs(poisson_cdf(m, 30) - s) < 1e-15);
  }
  assert(worst < 1e-9);

  // 4) Valeur de référence
  assert(std::abs(poisson_pmf(1.2, 0) - 0.301194) < 1e-6);
  assert(std::abs(poisson_pmf(1.2, 1) - 1.2 * std::exp(-1.2)) < 1e-15);

  // 5) Continuité entre k! exact (k <= 20) et produit (k > 20)
  const double ratio = poisson_pmf(3.0, 21) / poisson_pmf(3.0, 20);
  assert(std::abs(ratio - 3.0 / 21.0) < 1e-12);
  assert(poisson_pmf(3.0, 60) > 0.0 && std::isfinite(poisson_pmf(3.0, 60)));

  // 6) Grande moyenne : mean^k non représentable, pmf nulle et non NaN
  assert(poisson_pmf(1e70, 5) == 0.0);
  assert(poisson_pmf(1e16, 20) == 0.0);
  assert(poisson_cdf(1e70, 20) == 0.0);
  assert(std::abs(poisson_pmf(700.0, 20) - std::exp(-700.0) * std::pow(700.0, 20)
                  / static_cast<double>(factorial(20))) < 1e-300);

  // 7) Domaine
  assert(throws_invalid([]{ poisson_pmf(0.0, 1); }));
  assert(throws_invalid([]{ poisson_pmf(-1.2, 1); }));
  assert(throws_invalid([]{ poisson_pmf(std::nan(""), 1); }));
  assert(throws_invalid([]{ poisson_pmf(INFINITY, 1); }));
  assert(throws_invalid([]{ poisson_pmf(1.2, -1); }));
  assert(throws_invalid([]{ poisson_cdf(1.2, -1); }));

  std::cout << "Poisson OK. Max |sum-1|=" << worst << "\n";
  return 0;
}

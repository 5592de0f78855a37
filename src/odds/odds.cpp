#include <sc/odds/odds.hpp>

#include <cmath>
#include <stdexcept>

namespace sc::odds {

double implied_probability(double odds) {
  if (!std::isfinite(odds) || odds <= 0.0) {
    throw std::invalid_argument("implied_probability: odds must be finite and > 0");
  }
  return 1.0 / odds;
}

std::vector<double> normalize(const std::vector<double>& probs) {
  if (probs.empty()) {
    throw std::invalid_argument("normalize: empty outcome set");
  }
  double total = 0.0;
  for (double p : probs) {
    if (!std::isfinite(p) || p < 0.0) {
      throw std::invalid_argument("normalize: probabilities must be finite and >= 0");
    }
    total += p;
  }
  if (total == 0.0) {
    throw std::invalid_argument("normalize: probabilities sum to zero");
  }

  std::vector<double> out;
  out.reserve(probs.size());
  for (double p : probs) out.push_back(p / total);
  return out;
}

std::array<double, 3> normalize_triplet(double p1, double p2, double p3) {
  const auto n = normalize({p1, p2, p3});
  return {n[0], n[1], n[2]};
}

std::array<double, 2> normalize_pair(double p1, double p2) {
  const auto n = normalize({p1, p2});
  return {n[0], n[1]};
}

double overround(const std::vector<double>& odds) {
  if (odds.empty()) {
    throw std::invalid_argument("overround: empty outcome set");
  }
  double book = 0.0;
  for (double o : odds) book += implied_probability(o);
  return book - 1.0;
}

double fair_odds(double probability) {
  if (!std::isfinite(probability) || probability <= 0.0 || probability > 1.0) {
    throw std::invalid_argument("fair_odds: probability must be in (0,1]");
  }
  return 1.0 / probability;
}

} // namespace sc::odds

#include <sc/model/poisson.hpp>

#include <cmath>     // exp, pow, isfinite
#include <stdexcept> // std::invalid_argument
#include <string>

namespace sc {
namespace model {

namespace {

void check_mean(double mean, const char* who) {
  if (!std::isfinite(mean) || mean <= 0.0) {
    throw std::invalid_argument(std::string(who) + ": mean must be finite and > 0");
  }
}

} // unnamed namespace

std::uint64_t factorial(int n) {
  if (n < 0 || n > kMaxExactFactorial) {
    throw std::invalid_argument("factorial: n must be in [0, 20]");
  }
  std::uint64_t f = 1;
  for (int i = 2; i <= n; ++i) {
    f *= static_cast<std::uint64_t>(i);
  }
  return f;
}

double poisson_pmf(double mean, int k) {
  check_mean(mean, "poisson_pmf");
  if (k < 0) {
    throw std::invalid_argument("poisson_pmf: k must be >= 0");
  }

  // Cas usuel (k petit) : k! exact, tant que mean^k reste fini
  if (k <= kMaxExactFactorial) {
    const double mk = std::pow(mean, k);
    if (std::isfinite(mk)) {
      return std::exp(-mean) * mk / static_cast<double>(factorial(k));
    }
  }

  // Queue ou grande moyenne : produit Π mean/i, jamais d'overflow sur mean^k ni k!
  double term = std::exp(-mean);
  for (int i = 1; i <= k; ++i) {
    term *= mean / static_cast<double>(i);
  }
  return term;
}

double poisson_cdf(double mean, int k) {
  check_mean(mean, "poisson_cdf");
  if (k < 0) {
    throw std::invalid_argument("poisson_cdf: k must be >= 0");
  }
  double acc = 0.0;
  for (int i = 0; i <= k; ++i) {
    acc += poisson_pmf(mean, i);
  }
  return acc;
}

} // namespace model
} // namespace sc

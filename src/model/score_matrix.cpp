#include <sc/model/score_matrix.hpp>
#include <sc/model/poisson.hpp>

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace sc {
namespace model {

namespace {

inline std::size_t side(int max_goals) noexcept {
  return static_cast<std::size_t>(max_goals) + 1;
}

inline void check_line(double line, const char* who) {
  if (!std::isfinite(line)) {
    throw std::invalid_argument(std::string(who) + ": line must be finite");
  }
}

} // unnamed namespace

// --- ScoreMatrix ------------------------------------------------------------

ScoreMatrix::ScoreMatrix(int max_goals, std::vector<double> probs)
    : max_goals_(max_goals), p_(std::move(probs)) {
  if (max_goals_ < 0) {
    throw std::invalid_argument("ScoreMatrix: max_goals must be >= 0");
  }
  const std::size_t n = side(max_goals_);
  if (p_.size() != n * n) {
    throw std::invalid_argument("ScoreMatrix: expected (max_goals+1)^2 probabilities");
  }
  for (double v : p_) {
    if (!(v >= 0.0 && v <= 1.0)) {
      throw std::invalid_argument("ScoreMatrix: probabilities must lie in [0,1]");
    }
  }
}

double ScoreMatrix::at(int home, int away) const {
  if (home < 0 || away < 0 || home > max_goals_ || away > max_goals_) {
    throw std::out_of_range("ScoreMatrix::at: score outside the grid");
  }
  return p_[static_cast<std::size_t>(home) * side(max_goals_) + static_cast<std::size_t>(away)];
}

std::vector<ScoreCell> ScoreMatrix::cells() const {
  std::vector<ScoreCell> out;
  out.reserve(p_.size());
  if (p_.empty()) return out;
  const std::size_t n = side(max_goals_);
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = 0; j < n; ++j) {
      out.push_back({static_cast<int>(i), static_cast<int>(j), p_[i * n + j]});
    }
  }
  return out;
}

double ScoreMatrix::mass() const noexcept {
  double s = 0.0;
  for (double v : p_) s += v;
  return s;
}

ScoreMatrix ScoreMatrix::renormalized() const {
  const double total = mass();
  if (!(total > 0.0)) {
    throw std::invalid_argument("ScoreMatrix::renormalized: matrix has zero mass");
  }
  std::vector<double> q(p_);
  for (double& v : q) v /= total;
  return ScoreMatrix(max_goals_, std::move(q));
}

// --- Construction -----------------------------------------------------------

ScoreMatrix build_matrix(double home_mean, double away_mean, int max_goals) {
  if (max_goals < 0) {
    throw std::invalid_argument("build_matrix: max_goals must be >= 0");
  }
  const std::size_t n = side(max_goals);

  // Passe 1 : marginales
  std::vector<double> p_home(n), p_away(n);
  for (std::size_t k = 0; k < n; ++k) {
    p_home[k] = poisson_pmf(home_mean, static_cast<int>(k));
    p_away[k] = poisson_pmf(away_mean, static_cast<int>(k));
  }

  // Passe 2 : produit extérieur (indépendance)
  std::vector<double> joint(n * n);
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = 0; j < n; ++j) {
      joint[i * n + j] = p_home[i] * p_away[j];
    }
  }
  return ScoreMatrix(max_goals, std::move(joint));
}

// --- Agrégats ---------------------------------------------------------------

OutcomeProbs match_outcome(const ScoreMatrix& m) {
  OutcomeProbs o;
  for (const auto& c : m.cells()) {
    if (c.home_goals > c.away_goals)      o.home_win += c.probability;
    else if (c.home_goals == c.away_goals) o.draw     += c.probability;
    else                                   o.away_win += c.probability;
  }
  return o;
}

double over_probability(const ScoreMatrix& m, double line) {
  check_line(line, "over_probability");
  double s = 0.0;
  for (const auto& c : m.cells()) {
    if (static_cast<double>(c.home_goals + c.away_goals) > line) s += c.probability;
  }
  return s;
}

double under_probability(const ScoreMatrix& m, double line) {
  check_line(line, "under_probability");
  double s = 0.0;
  for (const auto& c : m.cells()) {
    if (static_cast<double>(c.home_goals + c.away_goals) < line) s += c.probability;
  }
  return s;
}

double btts_probability(const ScoreMatrix& m) {
  double s = 0.0;
  for (const auto& c : m.cells()) {
    if (c.home_goals > 0 && c.away_goals > 0) s += c.probability;
  }
  return s;
}

std::vector<double> total_goals_distribution(const ScoreMatrix& m) {
  if (m.size() == 0) return {};
  std::vector<double> out(2 * static_cast<std::size_t>(m.max_goals()) + 1, 0.0);
  for (const auto& c : m.cells()) {
    out[static_cast<std::size_t>(c.home_goals + c.away_goals)] += c.probability;
  }
  return out;
}

} // namespace model
} // namespace sc

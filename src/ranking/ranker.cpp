#include <sc/ranking/ranker.hpp>

#include <algorithm>
#include <stdexcept>

namespace sc::ranking {

std::vector<model::ScoreCell> top_k(const model::ScoreMatrix& m, int k) {
  if (k < 0) {
    throw std::invalid_argument("top_k: k must be >= 0");
  }

  // cells() est déjà dans l'ordre canonique : stable_sort le conserve sur les égalités
  auto cells = m.cells();
  std::stable_sort(cells.begin(), cells.end(),
                   [](const model::ScoreCell& a, const model::ScoreCell& b) {
                     return a.probability > b.probability;
                   });

  const std::size_t n = std::min(cells.size(), static_cast<std::size_t>(k));
  cells.resize(n);
  return cells;
}

} // namespace sc::ranking

#include "sc/ranking/ranker.hpp"
#include <cmath>
#include <cassert>
#include <iostream>
#include <stdexcept>

int main() {
  using sc::model::build_matrix;
  using sc::ranking::top_k;

  // 1) Top 5 sur 6x6, probabilité non croissante
  const auto m = build_matrix(1.2, 1.1, 5);
  const auto top = top_k(m, 5);
  assert(top.size() == 5);
  for (std::size_t i = 1; i < top.size(); ++i) {
    assert(top[i - 1].probability >= top[i].probability);
  }
  const int expected[5][2] = {{1, 1}, {1, 0}, {0, 1}, {0, 0}, {2, 1}};
  for (int i = 0; i < 5; ++i) {
    assert(top[i].home_goals == expected[i][0]);
    assert(top[i].away_goals == expected[i][1]);
    assert(top[i].probability == m.at(expected[i][0], expected[i][1]));
  }
  assert(std::abs(top[0].probability - 0.132342) < 1e-6);

  // 2) Égalités exactes : mean = 1 ⇒ pmf(0) == pmf(1) ⇒ 4 cases égales
  const auto eq = build_matrix(1.0, 1.0, 5);
  const auto top4 = top_k(eq, 6);
  assert(top4[0].probability == top4[3].probability);
  assert(top4[0].home_goals == 0 && top4[0].away_goals == 0);
  assert(top4[1].home_goals == 0 && top4[1].away_goals == 1);
  assert(top4[2].home_goals == 1 && top4[2].away_goals == 0);
  assert(top4[3].home_goals == 1 && top4[3].away_goals == 1);
  // puis (0,2) avant (2,0), etc.
  assert(top4[4].home_goals == 0 && top4[4].away_goals == 2);
  assert(top4[5].home_goals == 1 && top4[5].away_goals == 2);

  // 3) Reproductible
  const auto again = top_k(build_matrix(1.0, 1.0, 5), 6);
  for (std::size_t i = 0; i < again.size(); ++i) {
    assert(again[i].home_goals == top4[i].home_goals && again[i].away_goals == top4[i].away_goals);
  }

  // 4) Politique sur k
  assert(top_k(m, 0).empty());
  assert(top_k(m, 36).size() == 36);
  assert(top_k(m, 100).size() == 36); // plafonné
  assert(top_k(sc::model::ScoreMatrix(), 5).empty());
  bool threw = false;
  try { top_k(m, -1); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  std::cout << "Ranker OK. Top score " << top[0].home_goals << "-" << top[0].away_goals << "\n";
  return 0;
}

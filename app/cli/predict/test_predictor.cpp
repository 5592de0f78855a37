#include "sc/engine/predictor.hpp"
#include <cmath>
#include <cassert>
#include <functional>
#include <iostream>
#include <limits>
#include <stdexcept>

using sc::engine::PredictionRequest;
using sc::engine::Selection;

static bool rejects(const std::function<void(PredictionRequest&)>& mutate) {
  PredictionRequest req;
  mutate(req);
  try { sc::engine::predict(req); } catch (const std::invalid_argument&) { return true; }
  return false;
}

int main() {
  constexpr double EPS = 1e-12;

  // 1) Requête par défaut, toutes sorties
  PredictionRequest req;
  req.selection = sc::engine::all_selections();
  const auto res = sc::engine::predict(req);

  assert(res.matrix.size() == 36);
  assert(std::abs(res.matrix.at(0, 0) - std::exp(-2.3)) < EPS);
  assert(std::abs(res.raw_mass - res.matrix.mass()) < EPS);
  assert(std::abs(res.model_1x2.home_win + res.model_1x2.draw + res.model_1x2.away_win
                  - res.raw_mass) < EPS);
  assert(std::abs(res.model_over + res.model_under - res.raw_mass) < EPS);
  assert(res.model_btts > 0.0 && res.model_btts < 1.0);

  assert(std::abs(res.market_1x2[0] - 0.386443) < 1e-6);
  assert(std::abs(res.market_1x2[0] + res.market_1x2[1] + res.market_1x2[2] - 1.0) < 1e-9);
  assert(res.market_over_under.has_value());
  assert(std::abs((*res.market_over_under)[0] + (*res.market_over_under)[1] - 1.0) < 1e-9);

  assert(res.top_scores.size() == 5);
  assert(res.top_scores[0].home_goals == 1 && res.top_scores[0].away_goals == 1);
  assert(res.total_goals.size() == 11);
  assert(res.margins.size() == 5);
  assert(std::abs(res.margins[0].difference - 2.45) < EPS);

  // 2) Sélection partielle : pas de sortie non demandée
  PredictionRequest only_home;
  only_home.selection = {Selection::HomeWin};
  const auto r1 = sc::engine::predict(only_home);
  assert(r1.selected(Selection::HomeWin) && !r1.selected(Selection::Draw));
  assert(!r1.market_over_under.has_value());
  assert(r1.top_scores.empty());
  assert(r1.total_goals.empty());
  assert(r1.margins.size() == 5); // le rapport de marges est toujours produit

  PredictionRequest under_only;
  under_only.selection = {Selection::Under};
  assert(sc::engine::predict(under_only).market_over_under.has_value());

  // 3) Idempotence : deux appels identiques ⇒ sorties identiques
  const auto res2 = sc::engine::predict(req);
  const auto c1 = res.matrix.cells(), c2 = res2.matrix.cells();
  for (std::size_t i = 0; i < c1.size(); ++i) assert(c1[i].probability == c2[i].probability);
  assert(res.model_1x2.draw == res2.model_1x2.draw);
  assert(res.market_1x2 == res2.market_1x2);
  for (std::size_t i = 0; i < res.top_scores.size(); ++i) {
    assert(res.top_scores[i].probability == res2.top_scores[i].probability);
  }

  // 4) Politique de troncature
  PredictionRequest renorm = req;
  renorm.config.truncation = sc::config::TruncationPolicy::Renormalize;
  const auto rr = sc::engine::predict(renorm);
  assert(std::abs(rr.matrix.mass() - 1.0) < EPS);
  assert(rr.raw_mass < 1.0);
  assert(std::abs(rr.model_1x2.home_win + rr.model_1x2.draw + rr.model_1x2.away_win - 1.0) < EPS);
  assert(rr.matrix.at(0, 0) > res.matrix.at(0, 0));

  // Moyenne très grande : grille entièrement nulle, pas de NaN
  PredictionRequest huge = req;
  huge.home_mean = 1e70;
  const auto rh = sc::engine::predict(huge);
  assert(rh.raw_mass == 0.0);
  assert(rh.model_1x2.home_win == 0.0 && rh.model_over == 0.0);
  assert(rejects([](PredictionRequest& r){
    r.home_mean = 1e70;
    r.config.truncation = sc::config::TruncationPolicy::Renormalize;
  }));

  // 5) Configuration : grille et top-K
  PredictionRequest wide = req;
  wide.config.max_goals = 8;
  wide.config.top_k = 100;
  const auto rw8 = sc::engine::predict(wide);
  assert(rw8.matrix.size() == 81);
  assert(rw8.top_scores.size() == 81);
  assert(rw8.total_goals.size() == 17);

  // 6) Validation fail-fast
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  assert(rejects([](PredictionRequest& r){ r.home_mean = 0.0; }));
  assert(rejects([&](PredictionRequest& r){ r.away_mean = nan; }));
  assert(rejects([](PredictionRequest& r){ r.config.max_goals = -1; }));
  assert(rejects([](PredictionRequest& r){ r.config.max_goals = sc::config::kMaxGoalsLimit + 1; }));
  assert(rejects([](PredictionRequest& r){ r.config.max_goals = 2000000000; }));
  assert(!rejects([](PredictionRequest& r){ r.config.max_goals = sc::config::kMaxGoalsLimit; }));
  assert(rejects([](PredictionRequest& r){ r.config.top_k = -1; }));
  assert(rejects([&](PredictionRequest& r){ r.config.goal_line = nan; }));
  assert(rejects([](PredictionRequest& r){ r.odds.draw = 0.0; }));
  assert(rejects([&](PredictionRequest& r){ r.odds.under = inf; }));
  assert(rejects([&](PredictionRequest& r){ r.targets.exact_goals = inf; }));
  assert(!rejects([](PredictionRequest&){}));

  // 7) Libellés de sélection
  assert(sc::engine::selection_from_string("Correct Score") == Selection::CorrectScore);
  assert(sc::engine::selection_from_string("cs") == Selection::CorrectScore);
  assert(sc::engine::selection_from_string("BTTS") == Selection::Btts);
  assert(sc::engine::selection_from_string("away") == Selection::AwayWin);
  assert(!sc::engine::selection_from_string("bogus").has_value());

  std::cout << "Predictor OK. P(1)=" << res.market_1x2[0] << " top=" << res.top_scores[0].home_goals
            << "-" << res.top_scores[0].away_goals << "\n";
  return 0;
}

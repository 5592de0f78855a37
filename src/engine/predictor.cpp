#include <sc/engine/predictor.hpp>
#include <sc/ranking/ranker.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace {

bool fin(double x){ return std::isfinite(x); }

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

void require_positive(double v, const char* what) {
  if (!fin(v) || v <= 0.0) {
    throw std::invalid_argument(std::string("predict: ") + what + " must be finite and > 0");
  }
}

} // namespace

namespace sc {
namespace engine {

const char* to_string(Selection s) noexcept {
  switch (s) {
    case Selection::HomeWin:      return "Home Win";
    case Selection::Draw:         return "Draw";
    case Selection::AwayWin:      return "Away Win";
    case Selection::Over:         return "Over";
    case Selection::Under:        return "Under";
    case Selection::CorrectScore: return "Correct Score";
    case Selection::Btts:         return "BTTS";
    case Selection::ExactGoals:   return "Exact Goals";
  }
  return "?";
}

std::vector<Selection> all_selections() {
  return {Selection::HomeWin, Selection::Draw, Selection::AwayWin,
          Selection::Over, Selection::Under, Selection::CorrectScore,
          Selection::Btts, Selection::ExactGoals};
}

std::optional<Selection> selection_from_string(const std::string& s) {
  const std::string k = lower(s);
  for (Selection sel : all_selections()) {
    if (k == lower(to_string(sel))) return sel;
  }
  if (k == "home" || k == "1")  return Selection::HomeWin;
  if (k == "x")                 return Selection::Draw;
  if (k == "away" || k == "2")  return Selection::AwayWin;
  if (k == "cs")                return Selection::CorrectScore;
  if (k == "exact")             return Selection::ExactGoals;
  return std::nullopt;
}

bool PredictionResult::selected(Selection s) const noexcept {
  return std::find(selection.begin(), selection.end(), s) != selection.end();
}

void validate(const PredictionRequest& req) {
  require_positive(req.home_mean, "home_mean");
  require_positive(req.away_mean, "away_mean");

  if (req.config.max_goals < 0 || req.config.max_goals > config::kMaxGoalsLimit) {
    throw std::invalid_argument("predict: max_goals must be in [0, " +
                                std::to_string(config::kMaxGoalsLimit) + "]");
  }
  if (req.config.top_k < 0) {
    throw std::invalid_argument("predict: top_k must be >= 0");
  }
  if (!fin(req.config.goal_line) || req.config.goal_line < 0.0) {
    throw std::invalid_argument("predict: goal_line must be finite and >= 0");
  }

  require_positive(req.odds.home,  "odds.home");
  require_positive(req.odds.draw,  "odds.draw");
  require_positive(req.odds.away,  "odds.away");
  require_positive(req.odds.over,  "odds.over");
  require_positive(req.odds.under, "odds.under");

  for (auto c : margin::all_categories()) {
    if (!fin(req.targets.get(c))) {
      throw std::invalid_argument(std::string("predict: margin target '") +
                                  margin::to_string(c) + "' must be finite");
    }
  }
}

PredictionResult predict(const PredictionRequest& req) {
  validate(req);
  const auto& cfg = req.config;

  PredictionResult res;
  res.selection = req.selection;

  // Modèle
  model::ScoreMatrix raw = model::build_matrix(req.home_mean, req.away_mean, cfg.max_goals);
  res.raw_mass = raw.mass();
  res.matrix = (cfg.truncation == config::TruncationPolicy::Renormalize) ? raw.renormalized()
                                                                         : std::move(raw);

  res.model_1x2   = model::match_outcome(res.matrix);
  res.model_over  = model::over_probability(res.matrix, cfg.goal_line);
  res.model_under = model::under_probability(res.matrix, cfg.goal_line);
  res.model_btts  = model::btts_probability(res.matrix);

  // Marché (indépendant du modèle)
  res.market_1x2 = odds::normalize_triplet(odds::implied_probability(req.odds.home),
                                           odds::implied_probability(req.odds.draw),
                                           odds::implied_probability(req.odds.away));
  if (res.selected(Selection::Over) || res.selected(Selection::Under)) {
    res.market_over_under = odds::normalize_pair(odds::implied_probability(req.odds.over),
                                                 odds::implied_probability(req.odds.under));
  }

  if (res.selected(Selection::CorrectScore)) {
    res.top_scores = ranking::top_k(res.matrix, cfg.top_k);
  }
  if (res.selected(Selection::ExactGoals)) {
    res.total_goals = model::total_goals_distribution(res.matrix);
  }

  res.margins = margin::margin_report(req.odds, req.targets, cfg.goal_line);
  return res;
}

} // namespace engine
} // namespace sc

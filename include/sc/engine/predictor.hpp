#pragma once
/**
 * @file predictor.hpp
 * @brief Point d’entrée requête/réponse du moteur de prédiction.
 *
 * Le shell (CLI, GUI) rassemble une PredictionRequest complète et appelle predict()
 * une fois par action "Submit". Aucun état global : deux appels identiques donnent
 * des résultats identiques, et des appels concurrents ne partagent rien.
 *
 * # Contenu du résultat
 * - Toujours : matrice, 1X2 / Over-Under / BTTS du modèle, 1X2 marché normalisé,
 *   rapport de marges.
 * - Si Over ou Under sélectionné : paire Over/Under marché normalisée.
 * - Si CorrectScore sélectionné : top-K des scores exacts.
 * - Si ExactGoals sélectionné : distribution du total de buts.
 *
 * # Erreurs
 * std::invalid_argument levée avant tout calcul (validate) ou par le composant fautif.
 * Pas de résultat partiel.
 */

#include <sc/config/predict_config.hpp>
#include <sc/margin/margin.hpp>
#include <sc/model/score_matrix.hpp>
#include <sc/odds/odds.hpp>

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace sc {
namespace engine {

/// @brief Sorties demandées par le shell.
enum class Selection {
  HomeWin,
  Draw,
  AwayWin,
  Over,
  Under,
  CorrectScore,
  Btts,
  ExactGoals
};

/// @brief Libellé d’affichage ("Home Win", "Correct Score", ...).
const char* to_string(Selection s) noexcept;

/// @brief Accepte le libellé d’affichage ou un identifiant court
///        ("home", "draw", "away", "over", "under", "cs", "btts", "exact").
std::optional<Selection> selection_from_string(const std::string& s);

/// @brief Toutes les sélections, dans l’ordre d’affichage.
std::vector<Selection> all_selections();

/// @brief Entrées complètes d’une prédiction.
struct PredictionRequest {
  std::string home_team = "Team A";
  std::string away_team = "Team B";
  double      home_mean = 1.2; ///< xG domicile (> 0).
  double      away_mean = 1.1; ///< xG extérieur (> 0).

  odds::MarketOdds       odds;
  margin::MarginTargets  targets;
  std::vector<Selection> selection;
  config::PredictConfig  config;
};

/// @brief Résultat complet d’une prédiction.
struct PredictionResult {
  model::ScoreMatrix  matrix;  ///< Matrice utilisée pour les agrégats (cf. truncation).
  double              raw_mass{0.0}; ///< Masse de la matrice brute avant éventuelle renormalisation.

  model::OutcomeProbs model_1x2;
  double              model_over{0.0};
  double              model_under{0.0};
  double              model_btts{0.0};

  std::array<double, 3>                market_1x2{};        ///< home, draw, away normalisés.
  std::optional<std::array<double, 2>> market_over_under;   ///< over, under normalisés.

  std::vector<model::ScoreCell>  top_scores;   ///< vide sauf CorrectScore.
  std::vector<double>            total_goals;  ///< vide sauf ExactGoals.
  std::vector<margin::MarginRow> margins;

  std::vector<Selection> selection;

  bool selected(Selection s) const noexcept;
};

/// @brief Vérifie le domaine de toutes les entrées numériques.
/// @throws std::invalid_argument au premier champ invalide.
void validate(const PredictionRequest& req);

/// @brief Calcule une prédiction complète (validate() inclus).
PredictionResult predict(const PredictionRequest& req);

} // namespace engine
} // namespace sc

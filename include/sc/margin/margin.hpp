#pragma once
/**
 * @file margin.hpp
 * @brief Écarts de marge : cible configurée vs valeur cotée, par catégorie de marché.
 *
 * # Définition
 * difference(target, quoted) = round(target - quoted, 2)
 *
 * Diagnostic purement présentationnel : `quoted` n’est pas validé comme probabilité
 * ou cote (le rapport de référence passe les cotes brutes).
 *
 * # Catégories et cibles par défaut (points de %)
 * - Match Results  : 4.95
 * - Asian Handicap : 5.90
 * - Over/Under     : 6.18
 * - Exact Goals    : 20.0
 * - Correct Score  : 57.97
 * - HT/FT          : 20.0
 */

#include <sc/odds/odds.hpp>

#include <string>
#include <vector>

namespace sc {
namespace margin {

/// @brief Catégories de marché disposant d’une marge cible.
enum class MarketCategory {
  MatchResults,
  AsianHandicap,
  OverUnder,
  ExactGoals,
  CorrectScore,
  HtFt
};

/// @brief Libellé d’affichage ("Match Results", "Over/Under", ...).
const char* to_string(MarketCategory c) noexcept;

/// @brief Toutes les catégories, dans l’ordre d’affichage.
std::vector<MarketCategory> all_categories();

/// @brief Marges cibles par catégorie (points de pourcentage).
struct MarginTargets {
  double match_results  = 4.95;
  double asian_handicap = 5.90;
  double over_under     = 6.18;
  double exact_goals    = 20.0;
  double correct_score  = 57.97;
  double ht_ft          = 20.0;

  double get(MarketCategory c) const noexcept;
  void   set(MarketCategory c, double value) noexcept;
};

/// @brief round(target - quoted, 2).
/// @throws std::invalid_argument si une des entrées n’est pas finie.
double difference(double target, double quoted);

/// @brief Une ligne du rapport de marges.
struct MarginRow {
  std::string    label;       ///< "Home Win", "Over 2.5", ...
  MarketCategory category;    ///< Catégorie dont la cible est utilisée.
  double         target;      ///< Cible (points de %).
  double         quoted;      ///< Cote brute.
  double         difference;  ///< round(target - quoted, 2).
};

/// @brief Rapport de référence : 1X2 vs Match Results, Over/Under vs Over/Under.
/// @param goal_line Ligne de buts utilisée dans les libellés ("Over 2.5").
std::vector<MarginRow> margin_report(const odds::MarketOdds& quoted,
                                     const MarginTargets& targets,
                                     double goal_line = 2.5);

} // namespace margin
} // namespace sc

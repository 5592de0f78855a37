#pragma once
/**
 * @file predict_config.hpp
 * @brief Paramètres de calcul d’une prédiction (hors entrées de match).
 *
 * # Contenu
 * - max_goals  : borne de la grille de scores [0, max_goals] (défaut 5 ⇒ 36 cases),
 *                au plus kMaxGoalsLimit.
 * - goal_line  : ligne Over/Under (défaut 2.5). Ligne entière : i+j == ligne ⇒ ni Over ni Under.
 * - top_k      : nombre de scores exacts classés (défaut 5, plafonné à la taille de la grille).
 * - truncation : traitement de la masse perdue au-delà de max_goals.
 *
 * # Troncature
 * - Preserve    : agrégats sur la matrice brute (somme < 1). Comportement de référence.
 * - Renormalize : agrégats sur la matrice renormalisée (somme = 1).
 */

namespace sc {
namespace config {

inline constexpr int kMaxGoalsLimit = 200;

enum class TruncationPolicy { Preserve, Renormalize };

/// @brief Configuration d’une prédiction.
struct PredictConfig {
  int              max_goals  = 5;
  double           goal_line  = 2.5;
  int              top_k      = 5;
  TruncationPolicy truncation = TruncationPolicy::Preserve;
};

} // namespace config
} // namespace sc

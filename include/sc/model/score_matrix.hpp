#pragma once
/**
 * @file score_matrix.hpp
 * @brief Matrice des scores exacts (buts domicile × buts extérieur), Poisson indépendants.
 *
 * # Modèle
 * P(i, j) = pmf(λ_home, i) * pmf(λ_away, j),  i, j ∈ [0, max_goals].
 * Hypothèse d’indépendance (pas de correction bivariée / Dixon–Coles).
 *
 * # Construction en deux passes
 * - Passe 1 : pHome[i], pAway[j] (O(max_goals) pmf par équipe).
 * - Passe 2 : produit extérieur (O(max_goals²)), sans recalcul de pmf.
 *
 * # Troncature
 * - La masse au-delà de max_goals est perdue : mass() <= 1.
 * - Les agrégats travaillent sur la matrice NON renormalisée.
 * - renormalized() fournit explicitement une copie de masse 1 (heatmap, politique
 *   TruncationPolicy::Renormalize).
 *
 * # Agrégats
 * - 1X2 : i > j, i == j, i < j  (somme = mass()).
 * - Over/Under ligne L : i+j > L, i+j < L. Pour L entier, la ligne i+j == L
 *   (push) n’appartient à aucun des deux côtés.
 * - BTTS : i > 0 et j > 0.
 * - Exact Goals : P(i+j == n), n ∈ [0, 2*max_goals].
 */

#include <cstddef> // std::size_t
#include <vector>

namespace sc {
namespace model {

/// @brief Une case de la matrice : score exact et probabilité associée.
struct ScoreCell {
  int    home_goals{0};
  int    away_goals{0};
  double probability{0.0};
};

/// @brief Matrice (max_goals+1)² stockée ligne par ligne (buts domicile majeurs).
class ScoreMatrix {
public:
  /// @brief Matrice vide (size() == 0).
  ScoreMatrix() = default;

  /// @brief Construit à partir de probabilités déjà calculées (ordre canonique).
  /// @throws std::invalid_argument si max_goals < 0, taille incohérente,
  ///         ou valeur hors [0,1].
  ScoreMatrix(int max_goals, std::vector<double> probs);

  int max_goals() const noexcept { return max_goals_; }

  /// @return Nombre de cases ((max_goals+1)², 0 si vide).
  std::size_t size() const noexcept { return p_.size(); }

  /// @throws std::out_of_range si (home, away) hors de la grille.
  double at(int home, int away) const;

  /// @return Toutes les cases, home croissant puis away croissant.
  std::vector<ScoreCell> cells() const;

  /// @return Somme des cases (< 1 en général, à cause de la troncature).
  double mass() const noexcept;

  /// @brief Copie renormalisée (somme = 1).
  /// @throws std::invalid_argument si la masse est nulle.
  ScoreMatrix renormalized() const;

private:
  int max_goals_{-1};
  std::vector<double> p_;
};

/// @brief Construit la matrice des scores à partir des deux moyennes de buts.
/// @throws std::invalid_argument si max_goals < 0 ou moyenne invalide.
ScoreMatrix build_matrix(double home_mean, double away_mean, int max_goals);

/// @brief Probabilités 1X2 issues du modèle (non renormalisées).
struct OutcomeProbs {
  double home_win{0.0};
  double draw{0.0};
  double away_win{0.0};
};

OutcomeProbs match_outcome(const ScoreMatrix& m);

/// @brief P(i+j > line). @throws std::invalid_argument si line non fini.
double over_probability(const ScoreMatrix& m, double line);

/// @brief P(i+j < line). @throws std::invalid_argument si line non fini.
double under_probability(const ScoreMatrix& m, double line);

/// @brief Both Teams To Score : P(i > 0 et j > 0).
double btts_probability(const ScoreMatrix& m);

/// @brief Distribution du total de buts : out[n] = P(i+j == n), taille 2*max_goals+1.
std::vector<double> total_goals_distribution(const ScoreMatrix& m);

} // namespace model
} // namespace sc

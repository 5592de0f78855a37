#pragma once
/**
 * @file odds.hpp
 * @brief Cotes décimales -> probabilités implicites, normalisation de l’overround.
 *
 * # Conventions
 * - Cote décimale o : multiple de paiement (mise incluse). Probabilité implicite 1/o.
 * - Un ensemble d’issues mutuellement exclusives (1X2, Over/Under) a une somme
 *   de probabilités implicites > 1 : l’excédent est l’overround (marge bookmaker).
 * - normalize() redistribue proportionnellement : p_i' = p_i / Σ p_k.
 */

#include <array>
#include <vector>

namespace sc::odds {

/// @brief Cotes cotées pour les marchés de référence (valeurs par défaut de démo).
struct MarketOdds {
  double home  = 2.50; ///< Victoire domicile.
  double draw  = 3.20; ///< Match nul.
  double away  = 3.10; ///< Victoire extérieur.
  double over  = 2.40; ///< Plus de L buts (L = ligne configurée, 2.5 par défaut).
  double under = 1.55; ///< Moins de L buts.
};

// 1/odds. Lève std::invalid_argument si odds <= 0 ou non fini.
double implied_probability(double odds);

// p_i / Σp. Lève std::invalid_argument si vide, terme négatif/non fini, ou somme nulle.
std::vector<double> normalize(const std::vector<double>& probs);

// Spécialisations à taille fixe (1X2 et Over/Under).
std::array<double, 3> normalize_triplet(double p1, double p2, double p3);
std::array<double, 2> normalize_pair(double p1, double p2);

// Σ 1/o_i - 1 (ex: 0.035 = 3.5 % de marge).
double overround(const std::vector<double>& odds);

// Cote "juste" 1/p pour une probabilité modèle p ∈ (0,1].
double fair_odds(double probability);

} // namespace sc::odds

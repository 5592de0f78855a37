#pragma once
/**
 * @file poisson.hpp
 * @brief Loi de Poisson du nombre de buts d’une équipe sur un match.
 *
 * # Modèle
 * P(X = k) = e^{-λ} λ^k / k!,  λ = nombre moyen de buts attendus (xG).
 *
 * # Domaine valide
 * - λ > 0 et fini.
 * - k >= 0 (entier).
 *
 * # Précision
 * - k! est calculé exactement en entier 64 bits jusqu’à 20! (pas de Stirling/lgamma).
 * - Au-delà de 20, λ^k / k! est accumulé en produit Π λ/i (pas d’overflow).
 * - poisson_pmf(λ, 0) == exp(-λ) exactement.
 *
 * # Tests
 * - Σ_{k=0}^{30} pmf(λ,k) ≈ 1 à 1e-9 près pour les λ usuels (λ <= 5).
 */

#include <cstdint> // std::uint64_t

namespace sc {
namespace model {

/// @brief Plus grand n tel que n! tienne exactement dans un std::uint64_t.
inline constexpr int kMaxExactFactorial = 20;

/// @brief Factorielle entière exacte.
/// @param n  0 <= n <= kMaxExactFactorial
/// @throws std::invalid_argument si n hors domaine.
std::uint64_t factorial(int n);

/// @brief Masse de probabilité de Poisson P(X = k).
/// @param mean Nombre moyen de buts (> 0, fini).
/// @param k    Nombre de buts (>= 0).
/// @throws std::invalid_argument si mean <= 0, mean non fini ou k < 0.
double poisson_pmf(double mean, int k);

/// @brief Fonction de répartition P(X <= k) = Σ_{i<=k} pmf(mean, i).
/// @throws std::invalid_argument mêmes conditions que poisson_pmf.
double poisson_cdf(double mean, int k);

} // namespace model
} // namespace sc

#pragma once
#include <sc/model/score_matrix.hpp>

#include <vector>

namespace sc::ranking {

// Les k scores exacts les plus probables, probabilité décroissante.
// Égalités : ordre canonique (buts domicile croissants, puis extérieur croissants),
// comparaison exacte (pmf déterministe, pas d'epsilon).
// k < 0 -> std::invalid_argument ; k > nombre de cases -> plafonné silencieusement.
std::vector<model::ScoreCell> top_k(const model::ScoreMatrix& m, int k);

} // namespace sc::ranking

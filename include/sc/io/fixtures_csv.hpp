#pragma once
#include <string>
#include <vector>
#include <limits>
#include <cstddef>

namespace sc::io {

struct FixtureRow {
  std::string home_team;
  std::string away_team;

  // xG attendus
  double home_mean = std::numeric_limits<double>::quiet_NaN();
  double away_mean = std::numeric_limits<double>::quiet_NaN();

  // cotes décimales
  double odds_home  = std::numeric_limits<double>::quiet_NaN();
  double odds_draw  = std::numeric_limits<double>::quiet_NaN();
  double odds_away  = std::numeric_limits<double>::quiet_NaN();
  double odds_over  = std::numeric_limits<double>::quiet_NaN();
  double odds_under = std::numeric_limits<double>::quiet_NaN();
};

// Lit un CSV de matchs (une ligne par match, en-tête obligatoire, synonymes acceptés :
// home/home_team, away/away_team, home_xg/home_mean/lambda_home, away_xg/away_mean/lambda_away,
// odds_home/home_odds/1, odds_draw/draw_odds/x, odds_away/away_odds/2,
// odds_over/over_odds/over, odds_under/under_odds/under).
// Lignes vides et commentaires '#' ignorés, champs "..." gérés.
// Filtre les lignes invalides (xG <= 0, cote <= 1 ou absente, équipe vide).
// Retourne uniquement les lignes **valides** ; num_ignored/warnings optionnels.
std::vector<FixtureRow>
read_fixtures_csv(const std::string& path,
                  std::size_t* num_ignored = nullptr,
                  std::vector<std::string>* warnings = nullptr);

} // namespace sc::io

#include "sc/io/fixtures_csv.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " fixtures.csv\n";
    return 1;
  }
  const std::string path = argv[1];

  std::size_t ignored = 0;
  std::vector<std::string> warnings;
  const auto rows = sc::io::read_fixtures_csv(path, &ignored, &warnings);

  std::cout << "File: " << path << "\n";
  std::cout << "Valid fixtures: " << rows.size() << "\n";
  std::cout << "Ignored rows:   " << ignored << "\n\n";

  std::cout.setf(std::ios::fixed);
  std::cout << std::setprecision(2);
  for (const auto& r : rows) {
    std::cout << std::left << std::setw(14) << r.home_team << std::setw(14) << r.away_team << std::right
              << " xG " << r.home_mean << "-" << r.away_mean
              << "  1X2 " << r.odds_home << "/" << r.odds_draw << "/" << r.odds_away
              << "  O/U " << r.odds_over << "/" << r.odds_under << "\n";
  }

  for (const auto& w : warnings) std::cerr << "[warn] " << w << "\n";
  return 0;
}

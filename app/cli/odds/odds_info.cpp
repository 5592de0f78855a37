// app/cli/odds/odds_info.cpp
#include "sc/odds/odds.hpp"
#include "sc/margin/margin.hpp"
#include <iostream>
#include <iomanip>
#include <vector>
#include <string>
#include <stdexcept>

static void usage(const char* argv0){
  std::cerr <<
    "Usage: " << argv0 << " ODDS1 ODDS2 [ODDS3 ...] [--target T]\n"
    "  Affiche probabilites implicites, normalisees, overround.\n"
    "  --target   marge cible (points de %) pour l'ecart de marge de chaque cote\n";
}

int main(int argc, char** argv){
  std::vector<double> odds;
  double target = 0.0;
  bool has_target = false;

  try {
    for (int i=1;i<argc;++i){
      const std::string a = argv[i];
      if (a=="--target" && i+1<argc) { target = std::stod(argv[++i]); has_target = true; }
      else odds.push_back(std::stod(a));
    }
  } catch (const std::exception&) {
    usage(argv[0]);
    return 1;
  }
  if (odds.size() < 2) { usage(argv[0]); return 1; }

  std::cout.setf(std::ios::fixed);
  std::cout << std::setprecision(6);

  try {
    std::vector<double> implied;
    for (double o : odds) implied.push_back(sc::odds::implied_probability(o));
    const auto norm = sc::odds::normalize(implied);

    std::cout << "    odds     implied  normalized";
    if (has_target) std::cout << "   margin_diff";
    std::cout << "\n";
    for (std::size_t i=0;i<odds.size();++i){
      std::cout << std::setw(8) << odds[i] << ' '
                << std::setw(11) << implied[i] << ' '
                << std::setw(11) << norm[i];
      if (has_target) std::cout << ' ' << std::setw(13) << sc::margin::difference(target, odds[i]);
      std::cout << "\n";
    }
    std::cout << "overround: " << sc::odds::overround(odds) * 100.0 << " %\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

#include <sc/model/poisson.hpp>

#include <iostream>
#include <iomanip>
#include <vector>
#include <string>
#include <stdexcept>

static void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " [--kmax N] [mean ...]\n"
            << "If no mean is provided, prints the reference means 0.5 1.1 1.2 2.0 3.0.\n";
}

int main(int argc, char** argv) {
  std::cout.setf(std::ios::fixed);
  std::cout << std::setprecision(6);

  int kmax = 8;
  std::vector<double> means;
  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--kmax" && i + 1 < argc) kmax = std::stoi(argv[++i]);
      else means.push_back(std::stod(arg));
    }
  } catch (const std::exception&) {
    print_usage(argv[0]);
    return 1;
  }
  if (kmax < 0) {
    print_usage(argv[0]);
    return 1;
  }
  if (means.empty()) means = {0.5, 1.1, 1.2, 2.0, 3.0};

  for (double m : means) {
    std::cout << "mean = " << m << "\n";
    std::cout << "   k          pmf          cdf\n";
    std::cout << "--------------------------------\n";
    try {
      for (int k = 0; k <= kmax; ++k) {
        std::cout << std::setw(4)  << k << ' '
                  << std::setw(12) << sc::model::poisson_pmf(m, k) << ' '
                  << std::setw(12) << sc::model::poisson_cdf(m, k) << '\n';
      }
    } catch (const std::invalid_argument& e) {
      std::cerr << "error: " << e.what() << "\n";
      return 1;
    }
    std::cout << "\n";
  }
  return 0;
}

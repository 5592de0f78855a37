#include <sc/engine/predictor.hpp>
#include <sc/io/fixtures_csv.hpp>
#include <sc/odds/odds.hpp>

#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <stdexcept>

static void print_usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " home_mean away_mean"
            << " [--odds H D A] [--ou OVER UNDER] [--max-goals N] [--line L] [--top K]"
            << " [--renormalize] [--select a,b,...] [--margin CATEGORY=VALUE] [--matrix]\n  "
            << prog << " --csv FILE [same options]\n"
            << "Selections: home, draw, away, over, under, cs, btts, exact, all\n"
            << "Margin categories: match, asian, ou, exact, cs, htft\n";
}

static std::vector<std::string> split(const std::string& s, char sep) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string tok;
  while (std::getline(ss, tok, sep)) if (!tok.empty()) out.push_back(tok);
  return out;
}

static bool parse_margin(const std::string& arg, sc::margin::MarginTargets& t) {
  using sc::margin::MarketCategory;
  const auto eq = arg.find('=');
  if (eq == std::string::npos) return false;
  const std::string key = arg.substr(0, eq);
  const double v = std::stod(arg.substr(eq + 1));
  if      (key == "match") t.set(MarketCategory::MatchResults, v);
  else if (key == "asian") t.set(MarketCategory::AsianHandicap, v);
  else if (key == "ou")    t.set(MarketCategory::OverUnder, v);
  else if (key == "exact") t.set(MarketCategory::ExactGoals, v);
  else if (key == "cs")    t.set(MarketCategory::CorrectScore, v);
  else if (key == "htft")  t.set(MarketCategory::HtFt, v);
  else return false;
  return true;
}

static void print_prediction(const sc::engine::PredictionRequest& req,
                             const sc::engine::PredictionResult& res,
                             bool show_matrix)
{
  using sc::engine::Selection;

  std::cout << "== " << req.home_team << " vs " << req.away_team
            << "  (xG " << req.home_mean << " - " << req.away_mean << ")\n";
  std::cout << "Matrix mass (0.." << req.config.max_goals << " goals): " << res.raw_mass << "\n\n";

  // Métriques : marché normalisé (%) + modèle (%) + cote juste du modèle
  struct Metric { Selection sel; double market; double model; };
  std::vector<Metric> metrics{
    {Selection::HomeWin, res.market_1x2[0], res.model_1x2.home_win},
    {Selection::Draw,    res.market_1x2[1], res.model_1x2.draw},
    {Selection::AwayWin, res.market_1x2[2], res.model_1x2.away_win},
  };
  if (res.market_over_under) {
    metrics.push_back({Selection::Over,  (*res.market_over_under)[0], res.model_over});
    metrics.push_back({Selection::Under, (*res.market_over_under)[1], res.model_under});
  }

  std::cout << "Outcome              Market(%)   Model(%)   FairOdds\n";
  std::cout << "----------------------------------------------------\n";
  for (const auto& m : metrics) {
    if (!res.selected(m.sel)) continue;
    std::string label = sc::engine::to_string(m.sel);
    if (m.sel == Selection::Over || m.sel == Selection::Under) {
      std::ostringstream oss; oss << label << ' ' << req.config.goal_line; label = oss.str();
    }
    std::cout << std::left << std::setw(18) << label << std::right
              << std::setw(11) << m.market * 100.0
              << std::setw(11) << m.model * 100.0;
    if (m.model > 0.0) std::cout << std::setw(11) << sc::odds::fair_odds(m.model);
    else               std::cout << std::setw(11) << "-";
    std::cout << '\n';
  }
  if (res.selected(Selection::Btts)) {
    std::cout << std::left << std::setw(18) << "BTTS" << std::right
              << std::setw(11) << "-" << std::setw(11) << res.model_btts * 100.0 << '\n';
  }
  std::cout << '\n';

  if (res.selected(Selection::CorrectScore)) {
    std::cout << "Top correct scores\n";
    std::cout << " Home  Away   Probability(%)\n";
    for (const auto& c : res.top_scores) {
      std::cout << std::setw(5) << c.home_goals << ' '
                << std::setw(5) << c.away_goals << ' '
                << std::setw(16) << c.probability * 100.0 << '\n';
    }
    std::cout << '\n';
  }

  if (res.selected(Selection::ExactGoals)) {
    std::cout << "Exact total goals\n";
    for (std::size_t n = 0; n < res.total_goals.size(); ++n) {
      std::cout << std::setw(5) << n << std::setw(16) << res.total_goals[n] * 100.0 << '\n';
    }
    std::cout << '\n';
  }

  std::cout << "Margin differences\n";
  std::cout << "Market            Category          Target     Quoted       Diff\n";
  for (const auto& r : res.margins) {
    std::cout << std::left << std::setw(18) << r.label
              << std::setw(16) << sc::margin::to_string(r.category) << std::right
              << std::setw(8)  << std::setprecision(2) << r.target
              << std::setw(11) << r.quoted
              << std::setw(11) << r.difference << '\n';
  }
  std::cout << std::setprecision(6) << '\n';

  if (show_matrix) {
    const int n = res.matrix.max_goals();
    std::cout << "Score matrix (rows: home goals, cols: away goals)\n     ";
    for (int j = 0; j <= n; ++j) std::cout << std::setw(10) << j;
    std::cout << '\n';
    for (int i = 0; i <= n; ++i) {
      std::cout << std::setw(5) << i;
      for (int j = 0; j <= n; ++j) std::cout << std::setw(10) << res.matrix.at(i, j);
      std::cout << '\n';
    }
    std::cout << '\n';
  }
}

int main(int argc, char** argv) {
  std::cout.setf(std::ios::fixed);
  std::cout << std::setprecision(6);

  sc::engine::PredictionRequest req;
  std::string csv_file;
  bool show_matrix = false;
  int first_flag = 1;

  try {
    if (argc >= 3 && std::string(argv[1]).rfind("--", 0) != 0) {
      req.home_mean = std::stod(argv[1]);
      req.away_mean = std::stod(argv[2]);
      first_flag = 3;
    }

    for (int i = first_flag; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--odds" && i + 3 < argc) {
        req.odds.home = std::stod(argv[++i]);
        req.odds.draw = std::stod(argv[++i]);
        req.odds.away = std::stod(argv[++i]);
      } else if (arg == "--ou" && i + 2 < argc) {
        req.odds.over  = std::stod(argv[++i]);
        req.odds.under = std::stod(argv[++i]);
      } else if (arg == "--max-goals" && i + 1 < argc) {
        req.config.max_goals = std::stoi(argv[++i]);
      } else if (arg == "--line" && i + 1 < argc) {
        req.config.goal_line = std::stod(argv[++i]);
      } else if (arg == "--top" && i + 1 < argc) {
        req.config.top_k = std::stoi(argv[++i]);
      } else if (arg == "--renormalize") {
        req.config.truncation = sc::config::TruncationPolicy::Renormalize;
      } else if (arg == "--select" && i + 1 < argc) {
        for (const auto& tok : split(argv[++i], ',')) {
          if (tok == "all") { req.selection = sc::engine::all_selections(); continue; }
          auto sel = sc::engine::selection_from_string(tok);
          if (!sel) { std::cerr << "Unknown selection: " << tok << "\n"; print_usage(argv[0]); return 1; }
          req.selection.push_back(*sel);
        }
      } else if (arg == "--margin" && i + 1 < argc) {
        if (!parse_margin(argv[++i], req.targets)) {
          std::cerr << "Bad margin target: " << argv[i] << "\n";
          print_usage(argv[0]);
          return 1;
        }
      } else if (arg == "--csv" && i + 1 < argc) {
        csv_file = argv[++i];
      } else if (arg == "--matrix") {
        show_matrix = true;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        print_usage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception&) {
    print_usage(argv[0]);
    return 1;
  }

  if (first_flag == 1 && csv_file.empty()) {
    print_usage(argv[0]);
    return 1;
  }
  if (req.selection.empty()) req.selection = sc::engine::all_selections();

  // Requêtes : une seule (positionnels) ou une par ligne CSV
  std::vector<sc::engine::PredictionRequest> requests;
  if (!csv_file.empty()) {
    std::size_t ignored = 0;
    std::vector<std::string> warnings;
    const auto rows = sc::io::read_fixtures_csv(csv_file, &ignored, &warnings);
    for (const auto& w : warnings) std::cerr << "[warn] " << w << "\n";
    if (rows.empty()) {
      std::cerr << "error: no valid fixture in " << csv_file << "\n";
      return 1;
    }
    for (const auto& r : rows) {
      sc::engine::PredictionRequest q = req;
      q.home_team = r.home_team;   q.away_team = r.away_team;
      q.home_mean = r.home_mean;   q.away_mean = r.away_mean;
      q.odds = {r.odds_home, r.odds_draw, r.odds_away, r.odds_over, r.odds_under};
      requests.push_back(q);
    }
  } else {
    requests.push_back(req);
  }

  for (const auto& q : requests) {
    try {
      const auto res = sc::engine::predict(q);
      print_prediction(q, res, show_matrix);
    } catch (const std::exception& e) {
      std::cerr << "error: " << e.what() << "\n";
      return 1;
    }
  }
  return 0;
}

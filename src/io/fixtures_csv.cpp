#include "sc/io/fixtures_csv.hpp"
#include <fstream>
#include <unordered_map>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace {

// --- helpers texte ---
std::string trim(std::string s) {
  auto notsp = [](unsigned char ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}
std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

// Découpe une ligne CSV, guillemets doublés "" => "
std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (size_t i=0;i<line.size();++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i+1<line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

// "" ou texte non numérique -> NaN
double parse_double(const std::string& s) {
  if (s.empty()) return std::numeric_limits<double>::quiet_NaN();
  char* end=nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end==s.c_str()) return std::numeric_limits<double>::quiet_NaN();
  return v;
}

int col(const std::unordered_map<std::string,int>& idx, std::initializer_list<const char*> names) {
  for (auto* n: names) {
    auto it = idx.find(lower(n));
    if (it != idx.end()) return it->second;
  }
  return -1;
}

bool valid_mean(double x){ return std::isfinite(x) && x > 0.0; }
bool valid_odds(double x){ return std::isfinite(x) && x > 1.0; }

} // namespace

namespace sc::io {

std::vector<FixtureRow>
read_fixtures_csv(const std::string& path,
                  std::size_t* num_ignored,
                  std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  std::vector<FixtureRow> out;

  std::ifstream f(path);
  if (!f) {
    if (warnings) warnings->push_back("Cannot open file: " + path);
    return out;
  }

  std::string line;
  bool header_seen = false;
  int iHome=-1, iAway=-1, iHxg=-1, iAxg=-1, iOH=-1, iOD=-1, iOA=-1, iOO=-1, iOU=-1;
  std::size_t lineno = 0;

  while (std::getline(f, line)) {
    ++lineno;
    if (!line.empty() && line.back()=='\r') line.pop_back();
    auto l = trim(line);
    if (l.empty() || l.rfind("#",0)==0) continue;

    auto cells = split_csv_line(l);

    if (!header_seen) {
      std::unordered_map<std::string,int> idx;
      for (int i=0;i<(int)cells.size();++i) idx[lower(cells[i])] = i;
      iHome = col(idx, {"home","home_team"});
      iAway = col(idx, {"away","away_team"});
      iHxg  = col(idx, {"home_xg","home_mean","lambda_home"});
      iAxg  = col(idx, {"away_xg","away_mean","lambda_away"});
      iOH   = col(idx, {"odds_home","home_odds","1"});
      iOD   = col(idx, {"odds_draw","draw_odds","x"});
      iOA   = col(idx, {"odds_away","away_odds","2"});
      iOO   = col(idx, {"odds_over","over_odds","over"});
      iOU   = col(idx, {"odds_under","under_odds","under"});
      header_seen = true;
      continue;
    }

    auto get = [&](int i)->std::string {
      return (i>=0 && i<(int)cells.size()) ? cells[i] : std::string();
    };

    FixtureRow row;
    row.home_team  = get(iHome);
    row.away_team  = get(iAway);
    row.home_mean  = parse_double(get(iHxg));
    row.away_mean  = parse_double(get(iAxg));
    row.odds_home  = parse_double(get(iOH));
    row.odds_draw  = parse_double(get(iOD));
    row.odds_away  = parse_double(get(iOA));
    row.odds_over  = parse_double(get(iOO));
    row.odds_under = parse_double(get(iOU));

    // ---- Filtres ----
    std::string why;
    if (row.home_team.empty() || row.away_team.empty()) why = "missing team name";
    else if (!valid_mean(row.home_mean) || !valid_mean(row.away_mean)) why = "xG <= 0 or invalid";
    else if (!valid_odds(row.odds_home) || !valid_odds(row.odds_draw) || !valid_odds(row.odds_away))
      why = "1X2 odds <= 1 or missing";
    else if (!valid_odds(row.odds_over) || !valid_odds(row.odds_under))
      why = "over/under odds <= 1 or missing";

    if (!why.empty()) {
      if (num_ignored) (*num_ignored)++;
      if (warnings) warnings->push_back("Line " + std::to_string(lineno) + " ignored: " + why);
      continue;
    }

    out.push_back(row);
  }

  return out;
}

} // namespace sc::io

#include "MainWindow.hpp"

#include <QMessageBox>
#include <QTableWidgetItem>
#include <QStatusBar>
#include <QDebug>

#include <QtCharts/QChartView>
#include <QtCharts/QChart>
#include <QtCharts/QValueAxis>
#include <QtCharts/QBarSeries>
#include <QtCharts/QBarSet>
#include <QtCharts/QBarCategoryAxis>

#include <QCheckBox>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QPainter>
#include <QPushButton>
#include <QScrollArea>
#include <QSpinBox>
#include <QTabWidget>
#include <QTableWidget>
#include <QVBoxLayout>

#include <sc/margin/margin.hpp>
#include <sc/odds/odds.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

QDoubleSpinBox* makeSpin(QWidget* parent, double lo, double hi, double step, double value, int decimals = 2) {
  auto* s = new QDoubleSpinBox(parent);
  s->setRange(lo, hi);
  s->setSingleStep(step);
  s->setDecimals(decimals);
  s->setValue(value);
  return s;
}

QTableWidgetItem* cell(const QString& text) {
  auto* it = new QTableWidgetItem(text);
  it->setFlags(it->flags() & ~Qt::ItemIsEditable);
  it->setTextAlignment(Qt::AlignRight | Qt::AlignVCenter);
  return it;
}

inline QString pct(double p) { return QString::number(p * 100.0, 'f', 2); }

} // namespace

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
  setWindowTitle("scorecast - Football Outcome Predictor");

  auto* central = new QWidget(this);
  auto* lay = new QHBoxLayout(central);

  auto* side = new QScrollArea(central);
  side->setWidgetResizable(true);
  side->setWidget(buildSidebar_());
  side->setMinimumWidth(300);
  side->setMaximumWidth(360);

  lay->addWidget(side);
  lay->addWidget(buildResults_(), 1);
  setCentralWidget(central);

  setupScoresChart_();
  clearResults_();

  connect(submit_, &QPushButton::clicked, this, &MainWindow::onSubmit);
  statusBar()->showMessage("Ready");
  resize(1280, 860);
}

// ============================================================================
// Construction UI
// ============================================================================

QWidget* MainWindow::buildSidebar_() {
  auto* w = new QWidget(this);
  auto* v = new QVBoxLayout(w);

  // --- Match ---
  auto* gbMatch = new QGroupBox("Match", w);
  auto* fMatch = new QFormLayout(gbMatch);
  homeTeam_ = new QLineEdit("Team A", gbMatch);
  awayTeam_ = new QLineEdit("Team B", gbMatch);
  homeMean_ = makeSpin(gbMatch, 0.1, 10.0, 0.1, 1.2);
  awayMean_ = makeSpin(gbMatch, 0.1, 10.0, 0.1, 1.1);
  fMatch->addRow("Home Team", homeTeam_);
  fMatch->addRow("Away Team", awayTeam_);
  fMatch->addRow("Expected Goals (Home)", homeMean_);
  fMatch->addRow("Expected Goals (Away)", awayMean_);
  v->addWidget(gbMatch);

  // --- Cotes ---
  const sc::odds::MarketOdds defOdds;
  auto* gbOdds = new QGroupBox("Odds", w);
  auto* fOdds = new QFormLayout(gbOdds);
  oddsHome_  = makeSpin(gbOdds, 1.01, 1000.0, 0.01, defOdds.home);
  oddsDraw_  = makeSpin(gbOdds, 1.01, 1000.0, 0.01, defOdds.draw);
  oddsAway_  = makeSpin(gbOdds, 1.01, 1000.0, 0.01, defOdds.away);
  oddsOver_  = makeSpin(gbOdds, 1.01, 1000.0, 0.01, defOdds.over);
  oddsUnder_ = makeSpin(gbOdds, 1.01, 1000.0, 0.01, defOdds.under);
  fOdds->addRow("Home Win", oddsHome_);
  fOdds->addRow("Draw", oddsDraw_);
  fOdds->addRow("Away Win", oddsAway_);
  fOdds->addRow("Over", oddsOver_);
  fOdds->addRow("Under", oddsUnder_);
  v->addWidget(gbOdds);

  // --- Marges cibles ---
  const sc::margin::MarginTargets defTargets;
  auto* gbMargins = new QGroupBox("Margin Targets", w);
  auto* fMargins = new QFormLayout(gbMargins);
  for (auto c : sc::margin::all_categories()) {
    auto* s = makeSpin(gbMargins, 0.0, 100.0, 0.01, defTargets.get(c));
    marginTargets_.push_back(s);
    fMargins->addRow(QString("%1 Margin").arg(sc::margin::to_string(c)), s);
  }
  v->addWidget(gbMargins);

  // --- Modèle ---
  const sc::config::PredictConfig defCfg;
  auto* gbModel = new QGroupBox("Model", w);
  auto* fModel = new QFormLayout(gbModel);
  maxGoals_ = new QSpinBox(gbModel);
  maxGoals_->setRange(0, 15);
  maxGoals_->setValue(defCfg.max_goals);
  goalLine_ = makeSpin(gbModel, 0.0, 15.0, 0.5, defCfg.goal_line, 1);
  topK_ = new QSpinBox(gbModel);
  topK_->setRange(1, 50);
  topK_->setValue(defCfg.top_k);
  renormalize_ = new QCheckBox("Renormalize truncated matrix", gbModel);
  fModel->addRow("Max goals", maxGoals_);
  fModel->addRow("Goal line", goalLine_);
  fModel->addRow("Top correct scores", topK_);
  fModel->addRow(renormalize_);
  v->addWidget(gbModel);

  // --- Sélection ---
  auto* gbSel = new QGroupBox("Select Points for Probabilities and Odds", w);
  auto* vSel = new QVBoxLayout(gbSel);
  selection_ = new QListWidget(gbSel);
  for (auto s : sc::engine::all_selections()) {
    auto* it = new QListWidgetItem(sc::engine::to_string(s), selection_);
    it->setFlags(it->flags() | Qt::ItemIsUserCheckable);
    it->setCheckState(Qt::Unchecked);
    it->setData(Qt::UserRole, static_cast<int>(s));
  }
  vSel->addWidget(selection_);
  v->addWidget(gbSel);

  // --- Boutons ---
  auto* btnDefaults = new QPushButton("Load defaults", w);
  connect(btnDefaults, &QPushButton::clicked, this, &MainWindow::onLoadDefaults);
  submit_ = new QPushButton("Submit Prediction", w);
  submit_->setDefault(true);
  v->addWidget(btnDefaults);
  v->addWidget(submit_);
  v->addStretch(1);
  return w;
}

QWidget* MainWindow::buildResults_() {
  auto* w = new QWidget(this);
  auto* v = new QVBoxLayout(w);

  title_ = new QLabel(w);
  title_->setStyleSheet("font-size: 16pt; font-weight: bold;");
  metrics_ = new QLabel(w);
  metrics_->setTextFormat(Qt::RichText);
  v->addWidget(title_);
  v->addWidget(metrics_);

  auto* tabs = new QTabWidget(w);

  // Onglet scores exacts : tableau + graphe
  auto* tabScores = new QWidget(tabs);
  auto* hScores = new QHBoxLayout(tabScores);
  topScoresTable_ = new QTableWidget(0, 3, tabScores);
  topScoresTable_->setHorizontalHeaderLabels({"Home Goals", "Away Goals", "Probability (%)"});
  topScoresTable_->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
  topScoresTable_->verticalHeader()->setVisible(false);
  hScores->addWidget(topScoresTable_, 1);
  auto* chartHost = new QWidget(tabScores);
  chartHost->setObjectName("scoresChartContainer");
  hScores->addWidget(chartHost, 2);
  tabs->addTab(tabScores, "Top Correct Scores");

  // Onglet marges
  marginTable_ = new QTableWidget(0, 4, tabs);
  marginTable_->setHorizontalHeaderLabels({"Category", "Target", "Quoted", "Margin Difference"});
  marginTable_->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
  tabs->addTab(marginTable_, "Margin Differences");

  // Onglet total de buts
  exactGoalsTable_ = new QTableWidget(0, 2, tabs);
  exactGoalsTable_->setHorizontalHeaderLabels({"Total Goals", "Probability (%)"});
  exactGoalsTable_->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
  exactGoalsTable_->verticalHeader()->setVisible(false);
  tabs->addTab(exactGoalsTable_, "Exact Goals");

  // Onglet heatmap (matrice renormalisée)
  heatmap_ = new QTableWidget(0, 0, tabs);
  heatmap_->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
  heatmap_->verticalHeader()->setSectionResizeMode(QHeaderView::Stretch);
  tabs->addTab(heatmap_, "Poisson Probability Heatmap");

  v->addWidget(tabs, 1);
  return w;
}

void MainWindow::setupScoresChart_() {
  if (scoresChartView_) return;
  auto* host = findChild<QWidget*>("scoresChartContainer");
  if (!host) return;

  using namespace QtCharts;

  scoresChart_ = new QChart();
  scoresChart_->setTitle("Top Correct Scores");
  scoresChart_->legend()->setVisible(false);

  scoresAxisX_ = new QBarCategoryAxis(scoresChart_);
  scoresAxisY_ = new QValueAxis(scoresChart_);
  scoresAxisY_->setTitleText("Probability (%)");
  scoresAxisY_->setLabelFormat("%.1f");

  scoresSeries_ = new QBarSeries(scoresChart_);
  scoresSet_    = new QBarSet("Probability (%)", scoresSeries_);
  scoresSet_->setColor(QColor(135, 206, 235)); // skyblue
  scoresSet_->setBorderColor(Qt::transparent);
  scoresSeries_->append(scoresSet_);
  scoresSeries_->setBarWidth(0.6);

  scoresChart_->addSeries(scoresSeries_);
  scoresChart_->addAxis(scoresAxisX_, Qt::AlignBottom);
  scoresChart_->addAxis(scoresAxisY_, Qt::AlignLeft);
  scoresSeries_->attachAxis(scoresAxisX_);
  scoresSeries_->attachAxis(scoresAxisY_);

  scoresChartView_ = new QChartView(scoresChart_, host);
  scoresChartView_->setRenderHint(QPainter::Antialiasing);

  auto* lay = new QVBoxLayout(host);
  lay->setContentsMargins(0,0,0,0);
  lay->addWidget(scoresChartView_);
}

// ============================================================================
// Actions
// ============================================================================

void MainWindow::onLoadDefaults() {
  const sc::odds::MarketOdds o;
  const sc::margin::MarginTargets t;
  const sc::config::PredictConfig c;

  homeTeam_->setText("Team A");
  awayTeam_->setText("Team B");
  homeMean_->setValue(1.2);
  awayMean_->setValue(1.1);
  oddsHome_->setValue(o.home);
  oddsDraw_->setValue(o.draw);
  oddsAway_->setValue(o.away);
  oddsOver_->setValue(o.over);
  oddsUnder_->setValue(o.under);

  const auto cats = sc::margin::all_categories();
  for (int i = 0; i < marginTargets_.size(); ++i) {
    marginTargets_[i]->setValue(t.get(cats[static_cast<std::size_t>(i)]));
  }

  maxGoals_->setValue(c.max_goals);
  goalLine_->setValue(c.goal_line);
  topK_->setValue(c.top_k);
  renormalize_->setChecked(c.truncation == sc::config::TruncationPolicy::Renormalize);

  clearResults_();
  statusBar()->showMessage("Defaults loaded", 3000);
}

sc::engine::PredictionRequest MainWindow::collectRequest_() const {
  sc::engine::PredictionRequest req;
  req.home_team = homeTeam_->text().toStdString();
  req.away_team = awayTeam_->text().toStdString();
  req.home_mean = homeMean_->value();
  req.away_mean = awayMean_->value();

  req.odds.home  = oddsHome_->value();
  req.odds.draw  = oddsDraw_->value();
  req.odds.away  = oddsAway_->value();
  req.odds.over  = oddsOver_->value();
  req.odds.under = oddsUnder_->value();

  const auto cats = sc::margin::all_categories();
  for (int i = 0; i < marginTargets_.size(); ++i) {
    req.targets.set(cats[static_cast<std::size_t>(i)], marginTargets_[i]->value());
  }

  req.config.max_goals  = maxGoals_->value();
  req.config.goal_line  = goalLine_->value();
  req.config.top_k      = topK_->value();
  req.config.truncation = renormalize_->isChecked() ? sc::config::TruncationPolicy::Renormalize
                                                    : sc::config::TruncationPolicy::Preserve;

  for (int i = 0; i < selection_->count(); ++i) {
    const auto* it = selection_->item(i);
    if (it->checkState() == Qt::Checked) {
      req.selection.push_back(static_cast<sc::engine::Selection>(it->data(Qt::UserRole).toInt()));
    }
  }
  return req;
}

void MainWindow::onSubmit() {
  const auto req = collectRequest_();

  qDebug() << "[onSubmit]"
           << "home=" << QString::fromStdString(req.home_team) << req.home_mean
           << "away=" << QString::fromStdString(req.away_team) << req.away_mean
           << "maxGoals=" << req.config.max_goals
           << "selected=" << static_cast<int>(req.selection.size());

  // Tout ou rien : en cas d'erreur, on n'affiche aucun résultat partiel
  sc::engine::PredictionResult res;
  try {
    res = sc::engine::predict(req);
  } catch (const std::invalid_argument& e) {
    clearResults_();
    statusBar()->showMessage(QString("Prediction failed: %1").arg(e.what()));
    QMessageBox::warning(this, "Invalid input", e.what());
    return;
  }

  title_->setText(QString("%1 vs %2")
                    .arg(QString::fromStdString(req.home_team),
                         QString::fromStdString(req.away_team)));
  renderMetrics_(req, res);
  renderTopScores_(res);
  renderMargins_(res);
  renderExactGoals_(res);
  renderHeatmap_(res);

  statusBar()->showMessage(QString("Prediction done (matrix mass %1)")
                             .arg(res.raw_mass, 0, 'f', 6), 5000);
}

// ============================================================================
// Rendu
// ============================================================================

void MainWindow::clearResults_() {
  title_->setText("Match Outcome Probabilities");
  metrics_->setText("<i>Fill in the parameters and press Submit Prediction.</i>");
  topScoresTable_->setRowCount(0);
  marginTable_->setRowCount(0);
  exactGoalsTable_->setRowCount(0);
  heatmap_->setRowCount(0);
  heatmap_->setColumnCount(0);
  if (scoresSet_) {
    const int n = scoresSet_->count();
    if (n > 0) scoresSet_->remove(0, n);
  }
  if (scoresAxisX_) scoresAxisX_->clear();
}

void MainWindow::renderMetrics_(const sc::engine::PredictionRequest& req,
                                const sc::engine::PredictionResult& res) {
  using sc::engine::Selection;

  QString html = "<table cellspacing='12'><tr>";
  auto add = [&](const QString& label, double market, double model) {
    html += QString("<td><b>%1 (%)</b><br><span style='font-size:18pt'>%2</span>"
                    "<br><small>model %3</small></td>")
              .arg(label, pct(market), pct(model));
  };

  if (res.selected(Selection::HomeWin)) add("Home Win", res.market_1x2[0], res.model_1x2.home_win);
  if (res.selected(Selection::Draw))    add("Draw",     res.market_1x2[1], res.model_1x2.draw);
  if (res.selected(Selection::AwayWin)) add("Away Win", res.market_1x2[2], res.model_1x2.away_win);
  if (res.market_over_under) {
    const QString line = QString::number(req.config.goal_line);
    if (res.selected(Selection::Over))  add("Over " + line,  (*res.market_over_under)[0], res.model_over);
    if (res.selected(Selection::Under)) add("Under " + line, (*res.market_over_under)[1], res.model_under);
  }
  if (res.selected(Selection::Btts)) {
    html += QString("<td><b>BTTS (%)</b><br><span style='font-size:18pt'>%1</span>"
                    "<br><small>model</small></td>").arg(pct(res.model_btts));
  }
  html += "</tr></table>";
  metrics_->setText(html);
}

void MainWindow::renderTopScores_(const sc::engine::PredictionResult& res) {
  topScoresTable_->setRowCount(static_cast<int>(res.top_scores.size()));
  QStringList cats;
  QList<qreal> values;
  double ymax = 0.0;

  int row = 0;
  for (const auto& c : res.top_scores) {
    topScoresTable_->setItem(row, 0, cell(QString::number(c.home_goals)));
    topScoresTable_->setItem(row, 1, cell(QString::number(c.away_goals)));
    topScoresTable_->setItem(row, 2, cell(pct(c.probability)));
    cats << QString("%1-%2").arg(c.home_goals).arg(c.away_goals);
    values << c.probability * 100.0;
    ymax = std::max(ymax, c.probability * 100.0);
    ++row;
  }

  if (!scoresSet_) return;
  const int n = scoresSet_->count();
  if (n > 0) scoresSet_->remove(0, n);
  scoresSet_->append(values);
  scoresAxisX_->clear();
  scoresAxisX_->append(cats);
  scoresAxisY_->setRange(0.0, ymax > 0.0 ? ymax * 1.15 : 1.0);
}

void MainWindow::renderMargins_(const sc::engine::PredictionResult& res) {
  marginTable_->setRowCount(static_cast<int>(res.margins.size()));
  QStringList labels;
  int row = 0;
  for (const auto& m : res.margins) {
    labels << QString::fromStdString(m.label);
    marginTable_->setItem(row, 0, cell(sc::margin::to_string(m.category)));
    marginTable_->setItem(row, 1, cell(QString::number(m.target, 'f', 2)));
    marginTable_->setItem(row, 2, cell(QString::number(m.quoted, 'f', 2)));
    auto* diff = cell(QString::number(m.difference, 'f', 2));
    diff->setForeground(m.difference >= 0.0 ? QColor(0, 128, 0) : QColor(192, 0, 0));
    marginTable_->setItem(row, 3, diff);
    ++row;
  }
  marginTable_->setVerticalHeaderLabels(labels);
}

void MainWindow::renderExactGoals_(const sc::engine::PredictionResult& res) {
  exactGoalsTable_->setRowCount(static_cast<int>(res.total_goals.size()));
  for (std::size_t n = 0; n < res.total_goals.size(); ++n) {
    const int row = static_cast<int>(n);
    exactGoalsTable_->setItem(row, 0, cell(QString::number(row)));
    exactGoalsTable_->setItem(row, 1, cell(pct(res.total_goals[n])));
  }
}

void MainWindow::renderHeatmap_(const sc::engine::PredictionResult& res) {
  // la heatmap montre toujours la matrice renormalisée (somme = 1)
  const sc::model::ScoreMatrix m = res.matrix.renormalized();
  const int n = m.max_goals() + 1;

  heatmap_->setRowCount(n);
  heatmap_->setColumnCount(n);
  QStringList hdr;
  for (int k = 0; k < n; ++k) hdr << QString::number(k);
  heatmap_->setHorizontalHeaderLabels(hdr);
  heatmap_->setVerticalHeaderLabels(hdr);
  heatmap_->setToolTip("Rows: home goals, columns: away goals");

  double pmax = 0.0;
  for (const auto& c : m.cells()) pmax = std::max(pmax, c.probability);

  for (const auto& c : m.cells()) {
    auto* it = cell(QString::number(c.probability, 'f', 3));
    it->setTextAlignment(Qt::AlignCenter);
    const double t = (pmax > 0.0) ? c.probability / pmax : 0.0;
    it->setBackground(coolwarm_(t));
    heatmap_->setItem(c.home_goals, c.away_goals, it);
  }
}

// Palette divergente bleu -> gris clair -> rouge, t ∈ [0,1]
QColor MainWindow::coolwarm_(double t) {
  t = std::clamp(t, 0.0, 1.0);
  struct Rgb { double r, g, b; };
  const Rgb lo{59, 76, 192}, mid{221, 221, 221}, hi{180, 4, 38};
  const Rgb& a = (t < 0.5) ? lo : mid;
  const Rgb& b = (t < 0.5) ? mid : hi;
  const double u = (t < 0.5) ? t * 2.0 : (t - 0.5) * 2.0;
  return QColor(static_cast<int>(a.r + (b.r - a.r) * u),
                static_cast<int>(a.g + (b.g - a.g) * u),
                static_cast<int>(a.b + (b.b - a.b) * u));
}

#pragma once
#include <QMainWindow>
#include <QColor>
#include <QString>
#include <QVector>

#include <sc/engine/predictor.hpp>

namespace QtCharts {
  class QChartView;
  class QChart;
  class QBarSeries;
  class QBarSet;
  class QBarCategoryAxis;
  class QValueAxis;
}

class QCheckBox;
class QDoubleSpinBox;
class QLabel;
class QLineEdit;
class QListWidget;
class QPushButton;
class QSpinBox;
class QTableWidget;

class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow() override = default;

private slots:
  void onSubmit();
  void onLoadDefaults();

private:
  // Construction de l'UI (pas de .ui : tout est créé ici)
  QWidget* buildSidebar_();
  QWidget* buildResults_();
  void     setupScoresChart_();

  // Rassemble les widgets en une requête complète (validée ensuite par le moteur)
  sc::engine::PredictionRequest collectRequest_() const;

  // Rendu d'un résultat complet (jamais partiel)
  void clearResults_();
  void renderMetrics_(const sc::engine::PredictionRequest& req,
                      const sc::engine::PredictionResult& res);
  void renderTopScores_(const sc::engine::PredictionResult& res);
  void renderMargins_(const sc::engine::PredictionResult& res);
  void renderExactGoals_(const sc::engine::PredictionResult& res);
  void renderHeatmap_(const sc::engine::PredictionResult& res);

  static QColor coolwarm_(double t);

  // --- Entrées ---
  QLineEdit*      homeTeam_{nullptr};
  QLineEdit*      awayTeam_{nullptr};
  QDoubleSpinBox* homeMean_{nullptr};
  QDoubleSpinBox* awayMean_{nullptr};

  QDoubleSpinBox* oddsHome_{nullptr};
  QDoubleSpinBox* oddsDraw_{nullptr};
  QDoubleSpinBox* oddsAway_{nullptr};
  QDoubleSpinBox* oddsOver_{nullptr};
  QDoubleSpinBox* oddsUnder_{nullptr};

  // une spinbox par catégorie, ordre de sc::margin::all_categories()
  QVector<QDoubleSpinBox*> marginTargets_;

  QSpinBox*       maxGoals_{nullptr};
  QDoubleSpinBox* goalLine_{nullptr};
  QSpinBox*       topK_{nullptr};
  QCheckBox*      renormalize_{nullptr};
  QListWidget*    selection_{nullptr};
  QPushButton*    submit_{nullptr};

  // --- Sorties ---
  QLabel*       title_{nullptr};
  QLabel*       metrics_{nullptr};
  QTableWidget* topScoresTable_{nullptr};
  QTableWidget* marginTable_{nullptr};
  QTableWidget* exactGoalsTable_{nullptr};
  QTableWidget* heatmap_{nullptr};

  // ===== Top scores bar chart =====
  QtCharts::QChartView*       scoresChartView_{nullptr};
  QtCharts::QChart*           scoresChart_{nullptr};
  QtCharts::QBarSeries*       scoresSeries_{nullptr};
  QtCharts::QBarSet*          scoresSet_{nullptr};
  QtCharts::QBarCategoryAxis* scoresAxisX_{nullptr};
  QtCharts::QValueAxis*       scoresAxisY_{nullptr};
};

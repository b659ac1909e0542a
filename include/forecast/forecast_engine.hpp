// EN: End-of-month balance forecast, multi-horizon cash-flow projections and forecast warnings.
// FR: Prévision du solde de fin de mois, projections de trésorerie multi-horizons et alertes.

#pragma once

#include "infrastructure/config/analysis_settings.hpp"
#include "model/analytics_types.hpp"

#include <vector>

namespace FIN {
namespace Forecast {

struct DailyAverages {
    double income{0.0};
    double expense{0.0};
};

class ForecastEngine {
public:
    explicit ForecastEngine(ForecastSettings settings = ForecastSettings());

    // EN: Predicted balance at the end of the month containing as_of. The predicted value always
    //     lies inside the confidence interval.
    // FR: Solde prédit à la fin du mois contenant as_of. La valeur prédite est toujours dans
    //     l'intervalle de confiance.
    BalanceForecast forecastEndOfMonth(const std::vector<Transaction>& transactions,
                                       const std::vector<RecurringPayment>& recurring,
                                       const CalendarDate& as_of) const;

    // EN: One projection per configured period not longer than horizon_days, labelled "N days".
    // FR: Une projection par période configurée ne dépassant pas horizon_days, libellée "N days".
    std::vector<CashFlowProjection> projectCashFlow(const std::vector<Transaction>& transactions,
                                                    const std::vector<RecurringPayment>& recurring,
                                                    int horizon_days,
                                                    const CalendarDate& as_of) const;

    // EN: Negative prediction is critical; below the floor is a warning; a negative worst case is a warning.
    // FR: Prédiction négative = critique ; sous le plancher = alerte ; pire cas négatif = alerte.
    std::vector<ForecastWarning> generateWarnings(const std::vector<BalanceForecast>& forecasts) const;

    // EN: Totals of credits and debits divided by max(1, last date - first date) days.
    // FR: Totaux des crédits et débits divisés par max(1, dernière date - première date) jours.
    static DailyAverages dailyAverages(const std::vector<Transaction>& transactions);

    // EN: Population standard deviation of per-day net flow; 0 below two transactions.
    // FR: Écart-type (population) du flux net journalier ; 0 sous deux transactions.
    static double dailyNetFlowStdDev(const std::vector<Transaction>& transactions);

    static double recurringDue(const std::vector<RecurringPayment>& recurring, const DateRange& window);

private:
    ForecastSettings settings_;
};

} // namespace Forecast
} // namespace FIN

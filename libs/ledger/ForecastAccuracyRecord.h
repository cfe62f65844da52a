// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEDGER_FORECAST_ACCURACY_RECORD_H
#define __LEDGER_FORECAST_ACCURACY_RECORD_H 1

#include <string>
#include <optional>
#include "AnalysisDateRange.h"
#include "LineItem.h"

namespace ledger
{
  /**
   * @class ForecastAccuracyRecord
   * @brief A forecast made for a future period, later paired with what actually happened.
   *
   * Records are values. Validation produces a new record carrying the
   * actual figures through withActuals(); the original is never modified.
   */
  class ForecastAccuracyRecord
  {
  public:
    ForecastAccuracyRecord(const std::string& id,
			   const LedgerDate& forecastDate,
			   const AnalysisDateRange& period,
			   const Money& forecastedRevenue,
			   const Money& forecastedExpenses,
			   const Money& forecastedProfit,
			   int forecastedNewCustomers,
			   double confidenceScore,
			   const std::string& forecastMethod)
      : mId(id),
	mForecastDate(forecastDate),
	mPeriod(period),
	mForecastedRevenue(forecastedRevenue),
	mForecastedExpenses(forecastedExpenses),
	mForecastedProfit(forecastedProfit),
	mForecastedNewCustomers(forecastedNewCustomers),
	mConfidenceScore(confidenceScore),
	mForecastMethod(forecastMethod),
	mActualRevenue(),
	mActualExpenses(),
	mActualProfit(),
	mActualNewCustomers(),
	mValidated(false)
    {}

    const std::string& getId() const { return mId; }
    const LedgerDate& getForecastDate() const { return mForecastDate; }
    const AnalysisDateRange& getPeriod() const { return mPeriod; }
    const Money& getForecastedRevenue() const { return mForecastedRevenue; }
    const Money& getForecastedExpenses() const { return mForecastedExpenses; }
    const Money& getForecastedProfit() const { return mForecastedProfit; }
    int getForecastedNewCustomers() const { return mForecastedNewCustomers; }
    double getConfidenceScore() const { return mConfidenceScore; }
    const std::string& getForecastMethod() const { return mForecastMethod; }

    const std::optional<Money>& getActualRevenue() const { return mActualRevenue; }
    const std::optional<Money>& getActualExpenses() const { return mActualExpenses; }
    const std::optional<Money>& getActualProfit() const { return mActualProfit; }
    const std::optional<int>& getActualNewCustomers() const { return mActualNewCustomers; }

    bool isValidated() const
    {
      return mValidated;
    }

    ForecastAccuracyRecord withActuals(const Money& actualRevenue,
				       const Money& actualExpenses,
				       int actualNewCustomers) const
    {
      ForecastAccuracyRecord validated(*this);
      validated.mActualRevenue = actualRevenue;
      validated.mActualExpenses = actualExpenses;
      validated.mActualProfit = actualRevenue - actualExpenses;
      validated.mActualNewCustomers = actualNewCustomers;
      validated.mValidated = true;
      return validated;
    }

    /**
     * @brief A replacement forecast for the same period, keeping id and period.
     */
    ForecastAccuracyRecord withForecast(const LedgerDate& forecastDate,
					const Money& forecastedRevenue,
					const Money& forecastedExpenses,
					const Money& forecastedProfit,
					int forecastedNewCustomers,
					double confidenceScore) const
    {
      ForecastAccuracyRecord updated(*this);
      updated.mForecastDate = forecastDate;
      updated.mForecastedRevenue = forecastedRevenue;
      updated.mForecastedExpenses = forecastedExpenses;
      updated.mForecastedProfit = forecastedProfit;
      updated.mForecastedNewCustomers = forecastedNewCustomers;
      updated.mConfidenceScore = confidenceScore;
      return updated;
    }

    /**
     * @brief max(0, 100 - |forecast - actual| / actual * 100); empty when the actual is missing or zero.
     */
    std::optional<double> getRevenueAccuracyPercent() const
    {
      return accuracyPercent(mForecastedRevenue, mActualRevenue);
    }

    std::optional<double> getExpensesAccuracyPercent() const
    {
      return accuracyPercent(mForecastedExpenses, mActualExpenses);
    }

    /**
     * @brief Absolute percentage error of the revenue forecast; empty when the actual is missing or zero.
     */
    std::optional<double> getRevenueMAPE() const
    {
      if (!mActualRevenue || *mActualRevenue == DecimalConstants<Money>::DecimalZero)
	return std::nullopt;

      Money error = (mForecastedRevenue - *mActualRevenue).abs();
      return num::to_double(error / *mActualRevenue) * 100.0;
    }

  private:
    static std::optional<double> accuracyPercent(const Money& forecast,
						 const std::optional<Money>& actual)
    {
      if (!actual || *actual == DecimalConstants<Money>::DecimalZero)
	return std::nullopt;

      Money error = (forecast - *actual).abs();
      double accuracy = 100.0 - num::to_double(error / *actual) * 100.0;
      return accuracy > 0.0 ? accuracy : 0.0;
    }

  private:
    std::string mId;
    LedgerDate mForecastDate;
    AnalysisDateRange mPeriod;
    Money mForecastedRevenue;
    Money mForecastedExpenses;
    Money mForecastedProfit;
    int mForecastedNewCustomers;
    double mConfidenceScore;
    std::string mForecastMethod;
    std::optional<Money> mActualRevenue;
    std::optional<Money> mActualExpenses;
    std::optional<Money> mActualProfit;
    std::optional<int> mActualNewCustomers;
    bool mValidated;
  };
}

#endif

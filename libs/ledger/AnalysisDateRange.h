// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEDGER_ANALYSIS_DATE_RANGE_H
#define __LEDGER_ANALYSIS_DATE_RANGE_H 1

#include <stdexcept>
#include <boost/date_time.hpp>
#include "BoostDateHelper.h"

namespace ledger
{
  class AnalysisDateRangeException : public std::runtime_error
  {
  public:
  AnalysisDateRangeException(const std::string msg)
    : std::runtime_error(msg)
      {}

    ~AnalysisDateRangeException()
      {}
  };

  /**
   * @class AnalysisDateRange
   * @brief Closed calendar interval [startDate, endDate] that an analysis covers.
   *
   * The previous period is the interval of the same length that ends the day
   * before startDate; period over period comparisons use it.
   */
  class AnalysisDateRange
  {
  public:
    AnalysisDateRange(const LedgerDate& startDate, const LedgerDate& endDate)
      : mStartDate(startDate),
	mEndDate(endDate)
    {
      if (startDate.is_special() || endDate.is_special())
	throw AnalysisDateRangeException ("AnalysisDateRange::AnalysisDateRange - dates must be valid calendar dates");

      if (endDate < startDate)
	throw AnalysisDateRangeException ("AnalysisDateRange::AnalysisDateRange - end date cannot occur before start date");
    }

    const LedgerDate& getStartDate() const
    {
      return mStartDate;
    }

    const LedgerDate& getEndDate() const
    {
      return mEndDate;
    }

    /**
     * @brief Number of calendar days covered, both ends included.
     */
    long dayCount() const
    {
      return (mEndDate - mStartDate).days() + 1;
    }

    bool contains (const LedgerDate& aDate) const
    {
      return (aDate >= mStartDate) && (aDate <= mEndDate);
    }

    AnalysisDateRange previousPeriod() const
    {
      LedgerDate previousEnd = mStartDate - date_duration(1);
      LedgerDate previousStart = previousEnd - date_duration(dayCount() - 1);
      return AnalysisDateRange (previousStart, previousEnd);
    }

    bool operator==(const AnalysisDateRange& rhs) const
    {
      return (mStartDate == rhs.mStartDate) && (mEndDate == rhs.mEndDate);
    }

    bool operator!=(const AnalysisDateRange& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    LedgerDate mStartDate;
    LedgerDate mEndDate;
  };
}

#endif

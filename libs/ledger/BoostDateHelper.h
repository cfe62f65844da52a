// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEDGER_BOOST_DATE_HELPER_H
#define __LEDGER_BOOST_DATE_HELPER_H 1

#include <string>
#include <algorithm>
#include <boost/date_time.hpp>

namespace ledger
{
  typedef boost::gregorian::date LedgerDate;
  using boost::gregorian::date_duration;

  /**
   * @brief   Shift a date by a number of calendar months, keeping the day of month.
   * @param   aDate   Any calendar date.
   * @param   months  Months to add (negative to go back).
   * @returns The shifted date. When the day does not exist in the target
   *          month it is clamped to that month's last day (Mar 31 - 1 month
   *          gives Feb 28/29). Unlike `date + months(n)`, a date that is the
   *          last day of a short month is not snapped to the end of the
   *          target month (Apr 30 - 1 month gives Mar 30).
   */
  inline LedgerDate add_months (const LedgerDate& aDate, int months)
  {
    int totalMonths = static_cast<int>(aDate.year()) * 12 + (aDate.month().as_number() - 1) + months;
    int year = totalMonths / 12;
    int month = (totalMonths % 12) + 1;

    int lastDay = boost::gregorian::gregorian_calendar::end_of_month_day(year, month);
    int day = std::min(static_cast<int>(aDate.day().as_number()), lastDay);

    return LedgerDate(static_cast<unsigned short>(year),
		      static_cast<unsigned short>(month),
		      static_cast<unsigned short>(day));
  }

  inline LedgerDate first_of_month (const LedgerDate& aDate)
  {
    if (aDate.day().as_number() != 1)
      {
	return LedgerDate (aDate.year(), aDate.month(), boost::gregorian::greg_day (1));
      }
    else
      return aDate;
  }

  /**
   * @brief   Inclusive number of calendar months spanned by two dates.
   * @returns `(last.year - first.year) * 12 + last.month - first.month + 1`,
   *          so two dates in the same month span one month.
   */
  inline int inclusive_month_span (const LedgerDate& first, const LedgerDate& last)
  {
    return (static_cast<int>(last.year()) - static_cast<int>(first.year())) * 12
      + static_cast<int>(last.month().as_number())
      - static_cast<int>(first.month().as_number()) + 1;
  }

  /**
   * @brief   Weekly bucket key used by weekly aggregations.
   * @returns `year * 100 + dayOfYear / 7` where dayOfYear is 1 based.
   * @note    Buckets restart every January 1st, so the last bucket of a year
   *          can hold fewer than seven days.
   */
  inline int week_bucket_key (const LedgerDate& aDate)
  {
    return static_cast<int>(aDate.year()) * 100 + aDate.day_of_year() / 7;
  }

  /**
   * @brief   Daily bucket key, `year * 1000 + dayOfYear`.
   */
  inline int day_bucket_key (const LedgerDate& aDate)
  {
    return static_cast<int>(aDate.year()) * 1000 + aDate.day_of_year();
  }

  /**
   * @brief   Monthly bucket key, `year * 100 + month`.
   */
  inline int month_bucket_key (const LedgerDate& aDate)
  {
    return static_cast<int>(aDate.year()) * 100 + aDate.month().as_number();
  }

  inline std::string weekday_name (const LedgerDate& aDate)
  {
    return aDate.day_of_week().as_long_string();
  }

  inline std::string weekday_name (int dayOfWeek)
  {
    return boost::gregorian::greg_weekday(static_cast<unsigned short>(dayOfWeek)).as_long_string();
  }

  /**
   * @brief   Full English month name for a month number in 1..12.
   */
  inline std::string month_name (int month)
  {
    return boost::gregorian::greg_month(static_cast<unsigned short>(month)).as_long_string();
  }

  /**
   * @brief   Number of days from `from` to `to`; negative when `to` precedes `from`.
   */
  inline long days_between (const LedgerDate& from, const LedgerDate& to)
  {
    return (to - from).days();
  }
}

#endif

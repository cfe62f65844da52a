#pragma once

#include <string>
#include <boost/date_time.hpp>
#include "../number.h"
#include "../BoostDateHelper.h"

typedef dec::decimal<7> DecimalType;

inline DecimalType createDecimal(const std::string& valueString)
{
  return num::fromString<DecimalType>(valueString);
}

// Dates are written as YYYYMMDD
inline boost::gregorian::date createDate(const std::string& dateString)
{
  return boost::gregorian::from_undelimited_string(dateString);
}

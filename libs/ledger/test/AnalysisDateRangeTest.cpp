#include <catch2/catch_test_macros.hpp>
#include "../AnalysisDateRange.h"
#include "TestUtils.h"

using namespace ledger;
using namespace boost::gregorian;

TEST_CASE ("AnalysisDateRange operations", "[AnalysisDateRange]")
{
  AnalysisDateRange june (createDate ("20240601"), createDate ("20240630"));

  SECTION ("Day count includes both ends")
    {
      REQUIRE (june.dayCount() == 30);

      AnalysisDateRange oneDay (createDate ("20240601"), createDate ("20240601"));
      REQUIRE (oneDay.dayCount() == 1);
    }

  SECTION ("Previous period has the same length and ends the day before")
    {
      AnalysisDateRange previous = june.previousPeriod();
      REQUIRE (previous.getEndDate() == date (2024, 5, 31));
      REQUIRE (previous.getStartDate() == date (2024, 5, 2));
      REQUIRE (previous.dayCount() == june.dayCount());
    }

  SECTION ("Contains is inclusive")
    {
      REQUIRE (june.contains (createDate ("20240601")));
      REQUIRE (june.contains (createDate ("20240630")));
      REQUIRE_FALSE (june.contains (createDate ("20240531")));
      REQUIRE_FALSE (june.contains (createDate ("20240701")));
    }

  SECTION ("Inverted range throws")
    {
      REQUIRE_THROWS_AS (AnalysisDateRange (createDate ("20240630"), createDate ("20240601")),
			 AnalysisDateRangeException);
    }

  SECTION ("Equality")
    {
      AnalysisDateRange other (createDate ("20240601"), createDate ("20240630"));
      REQUIRE (june == other);
      REQUIRE (june != june.previousPeriod());
    }
}

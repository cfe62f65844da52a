#pragma once

#include <ostream>
#include <string>
#include "AnalysisDateRange.h"
#include "CompanyData.h"
#include "InsightsConfiguration.h"

namespace ledgerinsights
{

struct DataSufficiency
{
    bool hasSufficientData = false;
    std::string message;
    int monthsOfData = 0;
};

/**
 * @brief Gate in front of the full insights run
 *
 * Counts sales and purchases inside the range. Below the minimum the run
 * is refused with a message quoting the count; otherwise the months of data
 * are the inclusive calendar months between the earliest and latest of
 * those transactions.
 */
class DataSufficiencyChecker
{
public:
    explicit DataSufficiencyChecker(const AnalysisThresholds& thresholds);

    DataSufficiency check(const ledger::CompanyData& company,
                          const ledger::AnalysisDateRange& range,
                          std::ostream& os) const;

private:
    AnalysisThresholds mThresholds;
};

} // namespace ledgerinsights

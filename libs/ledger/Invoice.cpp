// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "Invoice.h"
#include <stdexcept>

namespace ledger
{
  std::string invoiceStatusToString(InvoiceStatus status)
  {
    switch (status)
      {
      case InvoiceStatus::Draft:
	return "Draft";
      case InvoiceStatus::Sent:
	return "Sent";
      case InvoiceStatus::Partial:
	return "Partial";
      case InvoiceStatus::Paid:
	return "Paid";
      case InvoiceStatus::Overdue:
	return "Overdue";
      case InvoiceStatus::Cancelled:
	return "Cancelled";
      default:
	throw std::invalid_argument("Unknown InvoiceStatus");
      }
  }

  Invoice::Invoice(const std::string& id,
		   const std::string& customerId,
		   const LedgerDate& issueDate,
		   const LedgerDate& dueDate,
		   InvoiceStatus status,
		   const Money& effectiveTotalUSD,
		   const Money& effectiveBalanceUSD)
    : mId(id),
      mCustomerId(customerId),
      mIssueDate(issueDate),
      mDueDate(dueDate),
      mStatus(status),
      mEffectiveTotalUSD(effectiveTotalUSD),
      mEffectiveBalanceUSD(effectiveBalanceUSD)
  {}

  bool Invoice::isOverdue(const LedgerDate& asOf) const
  {
    if (mStatus == InvoiceStatus::Paid || mStatus == InvoiceStatus::Cancelled)
      return false;

    return asOf > mDueDate;
  }

  long Invoice::daysOverdue(const LedgerDate& asOf) const
  {
    if (asOf <= mDueDate)
      return 0;

    return (asOf - mDueDate).days();
  }
}

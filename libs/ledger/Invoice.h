// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEDGER_INVOICE_H
#define __LEDGER_INVOICE_H 1

#include <string>
#include "BoostDateHelper.h"
#include "LineItem.h"

namespace ledger
{
  enum class InvoiceStatus
  {
    Draft,
    Sent,
    Partial,
    Paid,
    Overdue,
    Cancelled
  };

  std::string invoiceStatusToString(InvoiceStatus status);

  /**
   * @class Invoice
   * @brief Receivable billed to a customer.
   *
   * The balance is the part of the effective USD total not yet collected.
   */
  class Invoice
  {
  public:
    Invoice(const std::string& id,
	    const std::string& customerId,
	    const LedgerDate& issueDate,
	    const LedgerDate& dueDate,
	    InvoiceStatus status,
	    const Money& effectiveTotalUSD,
	    const Money& effectiveBalanceUSD);

    const std::string& getId() const
    {
      return mId;
    }

    const std::string& getCustomerId() const
    {
      return mCustomerId;
    }

    const LedgerDate& getIssueDate() const
    {
      return mIssueDate;
    }

    const LedgerDate& getDueDate() const
    {
      return mDueDate;
    }

    InvoiceStatus getStatus() const
    {
      return mStatus;
    }

    const Money& getEffectiveTotalUSD() const
    {
      return mEffectiveTotalUSD;
    }

    const Money& getEffectiveBalanceUSD() const
    {
      return mEffectiveBalanceUSD;
    }

    /**
     * @brief True when the invoice is neither paid nor cancelled and asOf is past the due date.
     */
    bool isOverdue(const LedgerDate& asOf) const;

    /**
     * @brief Whole days past the due date as of the given date, 0 if not yet due.
     */
    long daysOverdue(const LedgerDate& asOf) const;

  private:
    std::string mId;
    std::string mCustomerId;
    LedgerDate mIssueDate;
    LedgerDate mDueDate;
    InvoiceStatus mStatus;
    Money mEffectiveTotalUSD;
    Money mEffectiveBalanceUSD;
  };
}

#endif

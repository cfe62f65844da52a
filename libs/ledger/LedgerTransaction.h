// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEDGER_TRANSACTION_H
#define __LEDGER_TRANSACTION_H 1

#include <string>
#include <vector>
#include "BoostDateHelper.h"
#include "LineItem.h"

namespace ledger
{
  /**
   * @class LedgerTransaction
   * @brief Common part of sales and purchases.
   *
   * The effective USD total has already been normalized to the reporting
   * currency by the caller; no conversion happens here.
   */
  class LedgerTransaction
  {
  public:
    virtual ~LedgerTransaction()
    {}

    const std::string& getId() const
    {
      return mId;
    }

    const LedgerDate& getDate() const
    {
      return mDate;
    }

    const Money& getEffectiveTotalUSD() const
    {
      return mEffectiveTotalUSD;
    }

    const std::vector<LineItem>& getLineItems() const
    {
      return mLineItems;
    }

    /**
     * @brief Customer id for a sale, supplier id for a purchase. May be empty.
     */
    const std::string& getCounterpartyId() const
    {
      return mCounterpartyId;
    }

    /**
     * @brief Product ids referenced by the line items, in line order.
     */
    std::vector<std::string> getProductRefs() const
    {
      std::vector<std::string> refs;
      refs.reserve(mLineItems.size());

      for (const auto& item : mLineItems)
	refs.push_back(item.getProductId());

      return refs;
    }

  protected:
    LedgerTransaction(const std::string& id,
		      const LedgerDate& date,
		      const Money& effectiveTotalUSD,
		      const std::string& counterpartyId,
		      const std::vector<LineItem>& lineItems)
      : mId(id),
	mDate(date),
	mEffectiveTotalUSD(effectiveTotalUSD),
	mCounterpartyId(counterpartyId),
	mLineItems(lineItems)
    {}

  private:
    std::string mId;
    LedgerDate mDate;
    Money mEffectiveTotalUSD;
    std::string mCounterpartyId;
    std::vector<LineItem> mLineItems;
  };

  class Sale : public LedgerTransaction
  {
  public:
    Sale(const std::string& id,
	 const LedgerDate& date,
	 const Money& effectiveTotalUSD,
	 const std::string& customerId,
	 const std::vector<LineItem>& lineItems = std::vector<LineItem>())
      : LedgerTransaction(id, date, effectiveTotalUSD, customerId, lineItems)
    {}

    const std::string& getCustomerId() const
    {
      return getCounterpartyId();
    }
  };

  /**
   * @class Purchase
   * @brief An expense paid to a supplier.
   */
  class Purchase : public LedgerTransaction
  {
  public:
    Purchase(const std::string& id,
	     const LedgerDate& date,
	     const Money& effectiveTotalUSD,
	     const std::string& supplierId,
	     const std::vector<LineItem>& lineItems = std::vector<LineItem>())
      : LedgerTransaction(id, date, effectiveTotalUSD, supplierId, lineItems)
    {}

    const std::string& getSupplierId() const
    {
      return getCounterpartyId();
    }
  };
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEDGER_LINE_ITEM_H
#define __LEDGER_LINE_ITEM_H 1

#include <string>
#include "number.h"

namespace ledger
{
  using Money = num::DefaultNumber;

  /**
   * @class LineItem
   * @brief One product line on a sale or purchase.
   *
   * Amounts are derived, never stored:
   *   subtotal  = quantity * unitPrice - discount
   *   taxAmount = subtotal * taxRate
   *   amount    = subtotal + taxAmount
   */
  class LineItem
  {
  public:
    LineItem(const std::string& productId,
	     const std::string& description,
	     const Money& quantity,
	     const Money& unitPrice,
	     const Money& taxRate = DecimalConstants<Money>::DecimalZero,
	     const Money& discount = DecimalConstants<Money>::DecimalZero)
      : mProductId(productId),
	mDescription(description),
	mQuantity(quantity),
	mUnitPrice(unitPrice),
	mTaxRate(taxRate),
	mDiscount(discount)
    {}

    const std::string& getProductId() const
    {
      return mProductId;
    }

    const std::string& getDescription() const
    {
      return mDescription;
    }

    const Money& getQuantity() const
    {
      return mQuantity;
    }

    const Money& getUnitPrice() const
    {
      return mUnitPrice;
    }

    const Money& getTaxRate() const
    {
      return mTaxRate;
    }

    const Money& getDiscount() const
    {
      return mDiscount;
    }

    Money getSubtotal() const
    {
      return (mQuantity * mUnitPrice) - mDiscount;
    }

    Money getTaxAmount() const
    {
      return getSubtotal() * mTaxRate;
    }

    Money getAmount() const
    {
      return getSubtotal() + getTaxAmount();
    }

  private:
    std::string mProductId;
    std::string mDescription;
    Money mQuantity;
    Money mUnitPrice;
    Money mTaxRate;
    Money mDiscount;
  };
}

#endif

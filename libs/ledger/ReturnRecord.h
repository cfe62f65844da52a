#ifndef __LEDGER_RETURN_RECORD_H
#define __LEDGER_RETURN_RECORD_H 1

#include <string>
#include <vector>
#include "BoostDateHelper.h"
#include "LineItem.h"

namespace ledger
{
  class ReturnItem
  {
  public:
    ReturnItem(const std::string& productId, const Money& quantity)
      : mProductId(productId),
	mQuantity(quantity)
    {}

    const std::string& getProductId() const
    {
      return mProductId;
    }

    const Money& getQuantity() const
    {
      return mQuantity;
    }

  private:
    std::string mProductId;
    Money mQuantity;
  };

  /**
   * @class ReturnRecord
   * @brief A customer return. Dated by the day the goods came back, not by the original sale.
   */
  class ReturnRecord
  {
  public:
    ReturnRecord(const std::string& id,
		 const LedgerDate& returnDate,
		 const std::string& customerId,
		 const std::vector<ReturnItem>& items,
		 const Money& refundAmount)
      : mId(id),
	mReturnDate(returnDate),
	mCustomerId(customerId),
	mItems(items),
	mRefundAmount(refundAmount)
    {}

    const std::string& getId() const
    {
      return mId;
    }

    const LedgerDate& getReturnDate() const
    {
      return mReturnDate;
    }

    const std::string& getCustomerId() const
    {
      return mCustomerId;
    }

    const std::vector<ReturnItem>& getItems() const
    {
      return mItems;
    }

    const Money& getRefundAmount() const
    {
      return mRefundAmount;
    }

  private:
    std::string mId;
    LedgerDate mReturnDate;
    std::string mCustomerId;
    std::vector<ReturnItem> mItems;
    Money mRefundAmount;
  };
}

#endif

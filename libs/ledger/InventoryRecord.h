#ifndef __LEDGER_INVENTORY_RECORD_H
#define __LEDGER_INVENTORY_RECORD_H 1

#include <string>

namespace ledger
{
  /**
   * @class InventoryRecord
   * @brief Stock on hand for one product.
   */
  class InventoryRecord
  {
  public:
    InventoryRecord(const std::string& productId, int inStock, int reorderPoint = 0)
      : mProductId(productId),
	mInStock(inStock),
	mReorderPoint(reorderPoint)
    {}

    const std::string& getProductId() const
    {
      return mProductId;
    }

    int getInStock() const
    {
      return mInStock;
    }

    int getReorderPoint() const
    {
      return mReorderPoint;
    }

  private:
    std::string mProductId;
    int mInStock;
    int mReorderPoint;
  };
}

#endif

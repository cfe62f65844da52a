#ifndef __LEDGER_ENTITIES_H
#define __LEDGER_ENTITIES_H 1

#include <string>
#include "LineItem.h"

namespace ledger
{
  class Product
  {
  public:
    Product(const std::string& id, const std::string& name,
	    const Money& costPrice = DecimalConstants<Money>::DecimalZero)
      : mId(id),
	mName(name),
	mCostPrice(costPrice)
    {}

    const std::string& getId() const
    {
      return mId;
    }

    const std::string& getName() const
    {
      return mName;
    }

    // Unit cost used for margin analysis; zero when unknown
    const Money& getCostPrice() const
    {
      return mCostPrice;
    }

  private:
    std::string mId;
    std::string mName;
    Money mCostPrice;
  };

  class Customer
  {
  public:
    Customer(const std::string& id, const std::string& name)
      : mId(id),
	mName(name)
    {}

    const std::string& getId() const
    {
      return mId;
    }

    const std::string& getName() const
    {
      return mName;
    }

  private:
    std::string mId;
    std::string mName;
  };

  class Supplier
  {
  public:
    Supplier(const std::string& id, const std::string& name)
      : mId(id),
	mName(name)
    {}

    const std::string& getId() const
    {
      return mId;
    }

    const std::string& getName() const
    {
      return mName;
    }

  private:
    std::string mId;
    std::string mName;
  };
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "CompanyData.h"

namespace ledger
{
  namespace
  {
    template <class Entity>
    void insertUnique(std::map<std::string, Entity>& entities,
		      const Entity& entity,
		      const std::string& kind)
    {
      auto inserted = entities.emplace(entity.getId(), entity);
      if (!inserted.second)
	throw CompanyDataException("CompanyData: duplicate " + kind + " id " + entity.getId());
    }

    template <class Entity>
    std::optional<Entity> lookup(const std::map<std::string, Entity>& entities,
				 const std::string& id)
    {
      if (id.empty())
	return std::nullopt;

      auto it = entities.find(id);
      if (it == entities.end())
	return std::nullopt;

      return it->second;
    }
  }

  void CompanyData::addSale(const Sale& sale)
  {
    mSales.push_back(sale);
  }

  void CompanyData::addPurchase(const Purchase& purchase)
  {
    mPurchases.push_back(purchase);
  }

  void CompanyData::addReturn(const ReturnRecord& returnRecord)
  {
    mReturns.push_back(returnRecord);
  }

  void CompanyData::addInvoice(const Invoice& invoice)
  {
    mInvoices.push_back(invoice);
  }

  void CompanyData::addInventoryRecord(const InventoryRecord& record)
  {
    mInventory.push_back(record);
  }

  void CompanyData::addProduct(const Product& product)
  {
    insertUnique(mProducts, product, "product");
  }

  void CompanyData::addCustomer(const Customer& customer)
  {
    insertUnique(mCustomers, customer, "customer");
  }

  void CompanyData::addSupplier(const Supplier& supplier)
  {
    insertUnique(mSuppliers, supplier, "supplier");
  }

  void CompanyData::addForecastRecord(const ForecastAccuracyRecord& record)
  {
    mForecastRecords.push_back(record);
  }

  void CompanyData::setForecastRecords(const std::vector<ForecastAccuracyRecord>& records)
  {
    mForecastRecords = records;
  }

  std::optional<Product> CompanyData::getProduct(const std::string& id) const
  {
    return lookup(mProducts, id);
  }

  std::optional<Customer> CompanyData::getCustomer(const std::string& id) const
  {
    return lookup(mCustomers, id);
  }

  std::optional<Supplier> CompanyData::getSupplier(const std::string& id) const
  {
    return lookup(mSuppliers, id);
  }

  std::optional<InventoryRecord> CompanyData::getInventoryRecord(const std::string& productId) const
  {
    for (const auto& record : mInventory)
      {
	if (record.getProductId() == productId)
	  return record;
      }

    return std::nullopt;
  }
}

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __LEDGER_COMPANY_DATA_H
#define __LEDGER_COMPANY_DATA_H 1

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>
#include "LedgerTransaction.h"
#include "ReturnRecord.h"
#include "Invoice.h"
#include "InventoryRecord.h"
#include "LedgerEntities.h"
#include "ForecastAccuracyRecord.h"

namespace ledger
{
  class CompanyDataException : public std::runtime_error
  {
  public:
    CompanyDataException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~CompanyDataException()
    {}
  };

  /**
   * @class CompanyData
   * @brief In-memory snapshot of one company's ledger.
   *
   * The snapshot is filled once by the caller through the add methods and
   * is then only read. Analysis code receives it by const reference (or as
   * a shared_ptr to const when work is handed to another thread), so
   * nothing downstream can alter the ledger.
   *
   * Entity lookups return an empty optional for unknown ids; callers must
   * branch on presence.
   */
  class CompanyData
  {
  public:
    CompanyData() = default;

    void addSale(const Sale& sale);
    void addPurchase(const Purchase& purchase);
    void addReturn(const ReturnRecord& returnRecord);
    void addInvoice(const Invoice& invoice);
    void addInventoryRecord(const InventoryRecord& record);

    /**
     * @throws CompanyDataException if an entity with the same id is already present.
     */
    void addProduct(const Product& product);
    void addCustomer(const Customer& customer);
    void addSupplier(const Supplier& supplier);

    void addForecastRecord(const ForecastAccuracyRecord& record);
    void setForecastRecords(const std::vector<ForecastAccuracyRecord>& records);

    const std::vector<Sale>& getSales() const
    {
      return mSales;
    }

    const std::vector<Purchase>& getPurchases() const
    {
      return mPurchases;
    }

    const std::vector<ReturnRecord>& getReturns() const
    {
      return mReturns;
    }

    const std::vector<Invoice>& getInvoices() const
    {
      return mInvoices;
    }

    const std::vector<InventoryRecord>& getInventory() const
    {
      return mInventory;
    }

    const std::vector<ForecastAccuracyRecord>& getForecastRecords() const
    {
      return mForecastRecords;
    }

    std::optional<Product> getProduct(const std::string& id) const;
    std::optional<Customer> getCustomer(const std::string& id) const;
    std::optional<Supplier> getSupplier(const std::string& id) const;

    /**
     * @brief First inventory record for the product, if any.
     */
    std::optional<InventoryRecord> getInventoryRecord(const std::string& productId) const;

  private:
    std::vector<Sale> mSales;
    std::vector<Purchase> mPurchases;
    std::vector<ReturnRecord> mReturns;
    std::vector<Invoice> mInvoices;
    std::vector<InventoryRecord> mInventory;
    std::vector<ForecastAccuracyRecord> mForecastRecords;
    std::map<std::string, Product> mProducts;
    std::map<std::string, Customer> mCustomers;
    std::map<std::string, Supplier> mSuppliers;
  };
}

#endif

#pragma once

#include "payroll_layout.hpp"
#include "payroll_record.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <sqlite3.h>

class StoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// "lohnjournal_Januar_2025"
std::string periodTableName(const std::string& month, int year);

/*
 SQLite persistence: one table per reporting period, keyed by the personnel
 number. Columns follow the layout schema; currency values are stored as
 exact minor units in "<column>_cents" INTEGER columns and the empty
 sentinel as NULL. Saving the same rows again updates them in place.
*/
class PayrollStore {
public:
  // Opens (creates if missing) the database file. Throws StoreError.
  PayrollStore(const std::string& path, const PayrollLayout& layout);

  // Creates the period table if missing and returns its name.
  std::string ensureTable(const std::string& month, int year);

  // Inserts or updates every row, one transaction per period. Returns the
  // number of rows written.
  size_t saveRows(const std::vector<EmployeeRow>& rows);

  size_t countRows(const std::string& table);

private:
  struct Closer {
    void operator()(sqlite3* db) const noexcept { if (db) sqlite3_close(db); }
  };

  void exec(const std::string& sql);
  void upsert(const std::string& table, const std::vector<const EmployeeRow*>& rows);

  std::unique_ptr<sqlite3, Closer> db_;
  std::vector<FieldSpec> schema_;
  std::string identifierField_;
};

#include "payroll_store.hpp"

#include "month_resolver.hpp"

#include <iostream>
#include <map>
#include <tuple>
#include <variant>

namespace {

struct StatementFinalizer {
  void operator()(sqlite3_stmt* st) const noexcept { sqlite3_finalize(st); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

std::string sqlColumn(const FieldSpec& f) {
  return f.kind == FieldKind::Currency ? f.column + "_cents" : f.column;
}

const char* sqlType(FieldKind kind) {
  return kind == FieldKind::Text ? "TEXT" : "INTEGER";
}

std::string joined(const std::vector<std::string>& items, const char* sep) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += sep;
    out += items[i];
  }
  return out;
}

} // namespace

std::string periodTableName(const std::string& month, int year) {
  return "lohnjournal_" + periodSlug(month, year);
}

PayrollStore::PayrollStore(const std::string& path, const PayrollLayout& layout)
  : schema_(layout.schema()), identifierField_(layout.identifierField) {
  sqlite3* raw = nullptr;
  int rc = sqlite3_open(path.c_str(), &raw);
  db_.reset(raw);
  if (rc != SQLITE_OK) {
    std::string msg = raw ? sqlite3_errmsg(raw) : "out of memory";
    throw StoreError("failed to open database " + path + ": " + msg);
  }
}

void PayrollStore::exec(const std::string& sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_.get());
    sqlite3_free(err);
    throw StoreError("SQL error: " + msg);
  }
}

std::string PayrollStore::ensureTable(const std::string& month, int year) {
  std::string table = periodTableName(month, year);
  std::string ddl = "CREATE TABLE IF NOT EXISTS " + table + " (";
  for (const FieldSpec& f : schema_) {
    ddl += sqlColumn(f) + " " + sqlType(f.kind);
    if (f.name == identifierField_) ddl += " PRIMARY KEY NOT NULL";
    ddl += ", ";
  }
  ddl += "page INTEGER, line_codes TEXT, raw_lines TEXT, "
         "imported_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP)";
  exec(ddl);
  return table;
}

void PayrollStore::upsert(const std::string& table, const std::vector<const EmployeeRow*>& rows) {
  std::vector<std::string> columns;
  std::string keyColumn;
  for (const FieldSpec& f : schema_) {
    columns.push_back(sqlColumn(f));
    if (f.name == identifierField_) keyColumn = sqlColumn(f);
  }
  columns.insert(columns.end(), {"page", "line_codes", "raw_lines"});

  std::vector<std::string> placeholders(columns.size(), "?");
  std::vector<std::string> updates;
  for (const std::string& c : columns) {
    if (c != keyColumn) updates.push_back(c + " = excluded." + c);
  }
  updates.push_back("imported_at = CURRENT_TIMESTAMP");

  std::string sql = "INSERT INTO " + table + " (" + joined(columns, ", ") + ") VALUES (" +
                    joined(placeholders, ", ") + ") ON CONFLICT(" + keyColumn + ") DO UPDATE SET " +
                    joined(updates, ", ");

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    throw StoreError("cannot prepare insert into " + table + ": " + sqlite3_errmsg(db_.get()));
  }
  Statement st(raw);

  for (const EmployeeRow* row : rows) {
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());

    int idx = 1;
    int rc = SQLITE_OK;
    for (const FieldSpec& f : schema_) {
      auto it = row->fields.find(f.name);
      const FieldValue empty;
      const FieldValue& value = it == row->fields.end() ? empty : it->second;
      if (auto* s = std::get_if<std::string>(&value)) {
        rc = sqlite3_bind_text(st.get(), idx, s->c_str(), -1, SQLITE_TRANSIENT);
      } else if (auto* i = std::get_if<std::int64_t>(&value)) {
        rc = sqlite3_bind_int64(st.get(), idx, *i);
      } else if (auto* a = std::get_if<Amount>(&value)) {
        rc = sqlite3_bind_int64(st.get(), idx, a->cents);
      } else {
        rc = sqlite3_bind_null(st.get(), idx);
      }
      if (rc != SQLITE_OK) break;
      idx++;
    }
    if (rc == SQLITE_OK) rc = sqlite3_bind_int(st.get(), idx++, row->pageNumber);
    std::string codes = joined(row->lineCodes, ",");
    std::string lines = joined(row->rawLines, "\n");
    if (rc == SQLITE_OK) rc = sqlite3_bind_text(st.get(), idx++, codes.c_str(), -1, SQLITE_TRANSIENT);
    if (rc == SQLITE_OK) rc = sqlite3_bind_text(st.get(), idx++, lines.c_str(), -1, SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
      throw StoreError("cannot bind values for " + table + ": " + sqlite3_errmsg(db_.get()));
    }

    if (sqlite3_step(st.get()) != SQLITE_DONE) {
      throw StoreError("insert into " + table + " failed: " + sqlite3_errmsg(db_.get()));
    }
  }
}

size_t PayrollStore::saveRows(const std::vector<EmployeeRow>& rows) {
  // (year, month number, month) keeps periods in calendar order.
  std::map<std::tuple<int, int, std::string>, std::vector<const EmployeeRow*>> byPeriod;
  for (const EmployeeRow& row : rows) {
    byPeriod[std::make_tuple(row.year, row.monthNumber, row.month)].push_back(&row);
  }

  size_t written = 0;
  for (const auto& kv : byPeriod) {
    const std::string& month = std::get<2>(kv.first);
    int year = std::get<0>(kv.first);
    std::string table = ensureTable(month, year);

    exec("BEGIN");
    try {
      upsert(table, kv.second);
      exec("COMMIT");
    } catch (const StoreError&) {
      char* err = nullptr;
      if (sqlite3_exec(db_.get(), "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "Warning: rollback of " << table << " failed: " << (err ? err : "unknown error") << "\n";
      }
      sqlite3_free(err);
      throw;
    }
    written += kv.second.size();
  }
  return written;
}

size_t PayrollStore::countRows(const std::string& table) {
  std::string sql = "SELECT COUNT(*) FROM " + table;
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    throw StoreError("cannot count rows of " + table + ": " + sqlite3_errmsg(db_.get()));
  }
  Statement st(raw);
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw StoreError("cannot count rows of " + table + ": " + sqlite3_errmsg(db_.get()));
  }
  return static_cast<size_t>(sqlite3_column_int64(st.get(), 0));
}

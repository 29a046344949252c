#pragma once

#include "payroll_layout.hpp"
#include "payroll_record.hpp"

#include <map>
#include <string>
#include <vector>

struct PeriodRows {
  std::string month;
  int monthNumber = 0;
  int year = 0;
  std::vector<EmployeeRow> rows;
};

// Groups rows by period in calendar order; rows keep their document order.
// A period holds one row per identifier: a later row for the same employee
// replaces the earlier one, as saving to the store does.
std::vector<PeriodRows> groupByPeriod(const std::vector<EmployeeRow>& rows, const std::string& identifierField);

// Totals of one employee across all periods. Integer and currency fields
// are summed over non-empty values only; a total stays empty when the
// employee never had a value for that field. monthsCount is the number of
// distinct periods the employee appears in.
struct EmployeeSummary {
  std::string personnelNumber;
  std::string name;
  int monthsCount = 0;
  std::map<std::string, FieldValue> totals;
};

// Sorted by personnel number. The longest name seen is kept.
std::vector<EmployeeSummary> summarizeEmployees(const std::vector<PeriodRows>& periods,
                                                const PayrollLayout& layout);

// One CSV per period: <Month>_<year>.csv with one column per schema field.
void writePeriodCsv(const PeriodRows& period, const std::vector<FieldSpec>& schema, const std::string& path);

// Zusammenfassung.csv: period range header followed by the summary table.
void writeSummaryCsv(const std::vector<PeriodRows>& periods,
                     const std::vector<EmployeeSummary>& summary,
                     const std::vector<FieldSpec>& schema,
                     const std::string& path);

// Writes all period files and the summary into outDir; returns the number
// of files written.
int exportCsv(const std::vector<EmployeeRow>& rows, const PayrollLayout& layout, const std::string& outDir);

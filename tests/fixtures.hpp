#pragma once

#include "payroll_layout.hpp"
#include "payroll_record.hpp"

#include <string>
#include <vector>

inline PositionedFragment frag(const std::string& text, double x0, double x1, double y0) {
  return PositionedFragment{text, x0, x1, y0};
}

// Header of an LOA313 journal page for `month` 2025.
inline std::vector<PositionedFragment> loa313Header(const std::string& month) {
  return {
    frag("Lohnjournal", 300, 360, 30),
    frag(month, 365, 400, 30),
    frag("2025", 405, 430, 30),
    frag("Form.-Nr.LOA313", 700, 790, 30),
    frag("Berater:", 20, 60, 45),
    frag("4711", 62, 85, 45),
  };
}

// One line per employee: identifier, name, two currency and one integer band.
inline PayrollLayout singleLineLayout() {
  PayrollLayout layout;
  layout.version = "single-line";
  layout.headerBottom = 50.0;
  layout.lines.push_back(LineLayout{"main", {}, 0.0, {}, FieldLayout({
    {"Pers.-Nr.", "pers_nr", 0, 60, FieldKind::Text},
    {"Name", "name", 60, 200, FieldKind::Text},
    {"Lohnsteuer", "lohnsteuer", 200, 300, FieldKind::Currency},
    {"Kirchensteuer", "kirchensteuer", 300, 400, FieldKind::Currency},
    {"St.-Tage", "st_tage", 400, 450, FieldKind::Integer},
  })});
  return layout;
}

inline EmployeeRow makeRow(const std::string& persNr, const std::string& name, FieldValue lohnsteuer,
                           const std::string& month, int monthNumber, int year) {
  EmployeeRow row;
  row.fields["Pers.-Nr."] = persNr;
  row.fields["Name"] = name.empty() ? FieldValue{} : FieldValue{name};
  row.fields["Lohnsteuer"] = lohnsteuer;
  row.fields["Kirchensteuer"] = std::monostate{};
  row.fields["St.-Tage"] = std::int64_t{30};
  row.month = month;
  row.monthNumber = monthNumber;
  row.year = year;
  row.pageNumber = 1;
  return row;
}

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

// One word of page text with its bounding box (PDF points, origin top-left).
struct PositionedFragment {
  std::string text;
  double x0;
  double x1;
  double y0;
};

struct Page {
  int pageNumber;
  std::vector<PositionedFragment> fragments;
};

enum class FieldKind { Text, Integer, Currency };

// A payroll field and the horizontal band [xMin, xMax) its values occupy.
// `name` keys the decoded record, `column` names it in storage and export.
struct FieldSpec {
  std::string name;
  std::string column;
  double xMin;
  double xMax;
  FieldKind kind;
};

// Exact money value in minor units (cents).
struct Amount {
  std::int64_t cents = 0;
};

inline bool operator==(Amount a, Amount b) { return a.cents == b.cents; }
inline bool operator!=(Amount a, Amount b) { return a.cents != b.cents; }

// std::monostate marks a field no fragment was mapped to. It is never 0.
using FieldValue = std::variant<std::monostate, std::string, std::int64_t, Amount>;

inline bool isEmpty(const FieldValue& value) {
  return std::holds_alternative<std::monostate>(value);
}

// One employee's record for one reporting period. Every schema field is
// present in `fields`.
struct EmployeeRow {
  std::map<std::string, FieldValue> fields;
  std::string month;
  int monthNumber = 0;
  int year = 0;
  int pageNumber = 0;
  std::vector<std::string> lineCodes;
  std::vector<std::string> rawLines;
};

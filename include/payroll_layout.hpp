#pragma once

#include "field_layout.hpp"
#include "payroll_record.hpp"

#include <limits>
#include <string>
#include <vector>

// One physical line of an employee block. The record line has no codes and
// opens a block; sub-lines are recognised by their leading code.
struct LineLayout {
  std::string name;
  std::vector<std::string> codes;
  // Fragments whose midpoint lies left of this belong to the line code.
  double codeEnd = 0.0;
  // Marker tokens (flags such as "Z" or "E") that never carry a value.
  std::vector<std::string> ignoredTokens;
  FieldLayout fields;
};

// A versioned Lohnjournal layout. Swapping this value is all it takes to
// read another layout revision.
struct PayrollLayout {
  std::string version;
  double rowTolerance = 2.0;
  double headerBottom = 95.0;
  double footerTop = std::numeric_limits<double>::max();
  std::string identifierField = "Pers.-Nr.";
  std::string identifierPattern = "^\\d{5}$";
  std::string nameField = "Name";
  std::vector<std::string> pageMarkers;
  std::vector<LineLayout> lines;

  // Index of the block-opening line, -1 if none.
  int recordLineIndex() const;

  // Index of the sub-line whose codes contain `code`, -1 if none.
  int lineIndexForCode(const std::string& code) const;

  // Every field of every line, first declaration wins, in declaration order.
  std::vector<FieldSpec> schema() const;
};

// DATEV Lohnjournal, Form.-Nr. LOA313.
PayrollLayout loa313Layout();

// Throws LayoutError describing the first problem found.
void validateLayout(const PayrollLayout& layout);

// Parses the line-based layout format (see layouts/loa313.layout).
// Throws LayoutError with the offending line number.
PayrollLayout parseLayout(const std::string& text);

PayrollLayout loadLayoutFile(const std::string& path);

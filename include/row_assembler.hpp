#pragma once

#include "payroll_layout.hpp"
#include "payroll_record.hpp"

#include <regex>
#include <string>
#include <vector>

// Fragments sharing one text line, left to right.
struct TextLine {
  double y;
  std::vector<PositionedFragment> fragments;
};

struct AssembledLine {
  // Index into PayrollLayout::lines; -1 for an unrecognised line kept as text.
  int lineIndex;
  std::string code;
  TextLine line;
};

// One employee block; lines[0] is always the record line.
struct RowGroup {
  std::vector<AssembledLine> lines;
};

// Clusters fragments into lines top to bottom: a fragment joins the current
// line while its y0 stays within `tolerance` of the line's running mean.
std::vector<TextLine> clusterLines(std::vector<PositionedFragment> fragments, double tolerance);

// Space-joined fragment texts.
std::string lineText(const TextLine& line);

// Whole page text, one line per text line.
std::string pageText(const Page& page, double tolerance);

// Text above the layout's header boundary.
std::string pageHeaderText(const Page& page, const PayrollLayout& layout);

class RowAssembler {
public:
  explicit RowAssembler(PayrollLayout layout);

  // Groups one page's fragments into employee blocks in reading order.
  // Lines without an identifier that precede the first block are dropped,
  // except sub-lines: those are collected into `orphans` when given.
  std::vector<RowGroup> group(const std::vector<PositionedFragment>& fragments,
                              std::vector<AssembledLine>* orphans = nullptr) const;

private:
  bool opensRecord(const TextLine& line) const;

  PayrollLayout layout_;
  std::regex identifier_;
};

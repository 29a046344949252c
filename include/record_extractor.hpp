#pragma once

#include "month_resolver.hpp"
#include "payroll_layout.hpp"
#include "payroll_record.hpp"
#include "row_assembler.hpp"

#include <optional>
#include <string>
#include <vector>

// A row that was not emitted and why. rowIndex counts employee blocks on the
// page from 0. A sub-line with no block above it on the page is reported with
// an empty field, its line text and rowIndex 0.
struct RowRejected {
  int pageNumber = 0;
  size_t rowIndex = 0;
  std::string field;
  std::string rawText;
  std::string reason;
};

struct PageExtraction {
  int pageNumber = 0;
  std::vector<EmployeeRow> rows;
  std::vector<RowRejected> rejections;
  // Set when the period could not be resolved; rows is then empty.
  std::optional<HeaderParseError> headerError;
};

struct DocumentExtraction {
  DocumentInfo info;
  std::vector<EmployeeRow> rows;
  std::vector<RowRejected> rejections;
  std::vector<HeaderParseError> headerErrors;
  // Pages without the layout's page markers (cover or totals pages).
  std::vector<int> skippedPages;
};

class RecordExtractor {
public:
  // Throws LayoutError for an invalid layout.
  explicit RecordExtractor(PayrollLayout layout);

  // Resolves the page period, then decodes every employee block on the page.
  PageExtraction extract(const Page& page) const;

  // Processes pages in order, skipping pages that are not journal pages.
  DocumentExtraction extractDocument(const std::vector<Page>& pages) const;

  bool isJournalPage(const Page& page) const;

  const PayrollLayout& layout() const { return layout_; }

private:
  std::optional<RowRejected> fillRow(const RowGroup& group, EmployeeRow& row) const;

  PayrollLayout layout_;
  std::vector<FieldSpec> schema_;
  RowAssembler assembler_;
};

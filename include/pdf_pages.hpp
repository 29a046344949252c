#pragma once

#include "payroll_record.hpp"

#include <stdexcept>
#include <string>
#include <vector>

// The document as a whole cannot be read (missing tool, wrong password,
// corrupt file). Never retried.
class DocumentError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Reads every page's words with their boxes by invoking
// `pdftotext -bbox-layout` (poppler-utils). The password is tried as owner
// and user password. Throws DocumentError on failure.
std::vector<Page> loadPdfPages(const std::string& pdfPath, const std::string& password = "");

// Parses pdftotext's bbox XHTML into pages numbered from 1. Pages without
// words are kept so that numbering follows the document.
std::vector<Page> parseBboxPages(const std::string& bboxXml);

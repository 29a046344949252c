#pragma once

#include <stdexcept>
#include <string>

struct Period {
  std::string month;
  int monthNumber = 0;
  int year = 0;
};

// Raised when a page header names no reporting period.
class HeaderParseError : public std::runtime_error {
public:
  explicit HeaderParseError(const std::string& headerText, int pageNumber = 0);

  const std::string& headerText() const { return headerText_; }
  int pageNumber() const { return pageNumber_; }

private:
  std::string headerText_;
  int pageNumber_;
};

// Finds "<German month> <yyyy>" (e.g. "Januar 2025") in the header text.
// "Maerz" is accepted for "März".
Period resolvePeriod(const std::string& headerText);

// 1-12 for a German month name, 0 otherwise.
int monthNumber(const std::string& monthName);

// ASCII identifier for a period: "Januar_2025", "Maerz_2025".
std::string periodSlug(const std::string& month, int year);

// Document header fields printed on every journal page.
struct DocumentInfo {
  std::string berater;
  std::string mandant;
  std::string datum;
  std::string period;
};

DocumentInfo readDocumentInfo(const std::string& pageText);

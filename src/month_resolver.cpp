#include "month_resolver.hpp"

#include <cctype>
#include <regex>
#include <string>

namespace {

const char* const kMonths[] = {
  "Januar", "Februar", "März", "April", "Mai", "Juni",
  "Juli", "August", "September", "Oktober", "November", "Dezember",
};

std::string firstGroup(const std::string& text, const std::regex& re) {
  std::smatch m;
  if (std::regex_search(text, m, re)) return m[1].str();
  return "";
}

std::string shorten(const std::string& text) {
  std::string flat;
  for (char ch : text) flat.push_back(ch == '\n' ? ' ' : ch);
  if (flat.size() > 80) flat = flat.substr(0, 77) + "...";
  return flat;
}

} // namespace

HeaderParseError::HeaderParseError(const std::string& headerText, int pageNumber)
  : std::runtime_error((pageNumber > 0 ? "page " + std::to_string(pageNumber) + ": " : std::string()) +
                       "no reporting period in header '" + shorten(headerText) + "'"),
    headerText_(headerText), pageNumber_(pageNumber) {}

int monthNumber(const std::string& monthName) {
  if (monthName == "Maerz") return 3;
  for (int i = 0; i < 12; ++i) {
    if (monthName == kMonths[i]) return i + 1;
  }
  return 0;
}

Period resolvePeriod(const std::string& headerText) {
  static const std::regex periodRe(
    "(?:^|[^A-Za-z])(Januar|Februar|März|Maerz|April|Mai|Juni|Juli|August|September|Oktober|November|Dezember)"
    "\\s+(\\d{4})(?!\\d)");

  std::smatch m;
  if (!std::regex_search(headerText, m, periodRe)) {
    throw HeaderParseError(headerText);
  }

  Period period;
  period.monthNumber = monthNumber(m[1].str());
  period.month = kMonths[period.monthNumber - 1];
  period.year = std::stoi(m[2].str());
  return period;
}

std::string periodSlug(const std::string& month, int year) {
  std::string slug;
  for (size_t i = 0; i < month.size(); ++i) {
    unsigned char ch = static_cast<unsigned char>(month[i]);
    // UTF-8 umlauts as two-byte sequences 0xC3 0x..
    if (ch == 0xC3 && i + 1 < month.size()) {
      switch (static_cast<unsigned char>(month[i + 1])) {
        case 0xA4: slug += "ae"; break;
        case 0xB6: slug += "oe"; break;
        case 0xBC: slug += "ue"; break;
        case 0x84: slug += "Ae"; break;
        case 0x96: slug += "Oe"; break;
        case 0x9C: slug += "Ue"; break;
        case 0x9F: slug += "ss"; break;
        default: slug += '_'; break;
      }
      ++i;
      continue;
    }
    slug.push_back(std::isalnum(ch) ? static_cast<char>(ch) : '_');
  }
  return slug + "_" + std::to_string(year);
}

DocumentInfo readDocumentInfo(const std::string& pageText) {
  static const std::regex beraterRe("Berater:\\s*(\\d+)");
  static const std::regex mandantRe("Mandant:\\s*(\\d+)");
  static const std::regex datumRe("Datum:\\s*([\\d.]+)");
  static const std::regex periodRe("Lohnjournal\\s+(\\S+\\s+\\d{4})");

  DocumentInfo info;
  info.berater = firstGroup(pageText, beraterRe);
  info.mandant = firstGroup(pageText, mandantRe);
  info.datum = firstGroup(pageText, datumRe);
  info.period = firstGroup(pageText, periodRe);
  return info;
}

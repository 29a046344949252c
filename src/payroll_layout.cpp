#include "payroll_layout.hpp"

#include "number_decoder.hpp"

#include <fstream>
#include <map>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

// Columns the store adds to every period table.
const std::set<std::string> kReservedColumns = {"page", "line_codes", "raw_lines", "imported_at"};

FieldSpec currency(const char* column, double xMin, double xMax, const char* name) {
  return FieldSpec{name, column, xMin, xMax, FieldKind::Currency};
}

FieldSpec integer(const char* column, double xMin, double xMax, const char* name) {
  return FieldSpec{name, column, xMin, xMax, FieldKind::Integer};
}

FieldSpec text(const char* column, double xMin, double xMax, const char* name) {
  return FieldSpec{name, column, xMin, xMax, FieldKind::Text};
}

std::string layoutErrorAt(int lineNo, const std::string& message) {
  return "layout line " + std::to_string(lineNo) + ": " + message;
}

double parseCoordinate(const std::string& token, int lineNo) {
  try {
    size_t used = 0;
    double value = std::stod(token, &used);
    if (used != token.size()) throw std::invalid_argument(token);
    return value;
  } catch (const std::invalid_argument&) {
    throw LayoutError(layoutErrorAt(lineNo, "not a number: '" + token + "'"));
  } catch (const std::out_of_range&) {
    throw LayoutError(layoutErrorAt(lineNo, "number out of range: '" + token + "'"));
  }
}

FieldKind parseKind(const std::string& token) {
  if (token == "integer") return FieldKind::Integer;
  if (token == "currency") return FieldKind::Currency;
  return FieldKind::Text;
}

std::vector<std::string> splitList(const std::string& s, char sep) {
  std::vector<std::string> out;
  std::string item;
  std::istringstream in(s);
  while (std::getline(in, item, sep)) {
    item = trimText(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

} // namespace

int PayrollLayout::recordLineIndex() const {
  for (size_t i = 0; i < lines.size(); ++i) {
    if (lines[i].codes.empty()) return static_cast<int>(i);
  }
  return -1;
}

int PayrollLayout::lineIndexForCode(const std::string& code) const {
  for (size_t i = 0; i < lines.size(); ++i) {
    for (const std::string& c : lines[i].codes) {
      if (c == code) return static_cast<int>(i);
    }
  }
  return -1;
}

std::vector<FieldSpec> PayrollLayout::schema() const {
  std::vector<FieldSpec> out;
  std::set<std::string> seen;
  for (const LineLayout& line : lines) {
    for (const FieldSpec& f : line.fields.fields()) {
      if (seen.insert(f.name).second) out.push_back(f);
    }
  }
  return out;
}

PayrollLayout loa313Layout() {
  PayrollLayout layout;
  layout.version = "LOA313";
  layout.rowTolerance = 2.0;
  layout.headerBottom = 95.0;
  layout.pageMarkers = {"Lohnjournal", "Form.-Nr.LOA313"};

  layout.lines.push_back(LineLayout{"main", {}, 0.0, {"Z", "E", "NB"}, FieldLayout({
    text("pers_nr", 0, 58, "Pers.-Nr."),
    text("steuerklasse", 58, 79, "StKl"),
    text("faktor", 79, 102, "Faktor"),
    text("ki_freibetrag", 102, 138, "Kinderfreibetrag"),
    text("name", 138, 440, "Name"),
    currency("kv_brutto", 440, 513, "KV-Brutto"),
    currency("rv_brutto", 513, 573, "RV-Brutto"),
    currency("av_brutto", 573, 633, "AV-Brutto"),
    currency("pv_brutto", 633, 695, "PV-Brutto"),
    currency("umlage_1", 695, 755, "Umlage 1"),
    currency("gesamtbrutto", 755, 840, "Gesamtbrutto"),
  })});

  layout.lines.push_back(LineLayout{"tax", {"1", "2", "3", "4", "5", "6"}, 130.0, {"Z", "E"}, FieldLayout({
    integer("st_tage", 130, 160, "St.-Tage"),
    currency("steuerbrutto", 160, 240, "Steuerbrutto"),
    currency("lohnsteuer", 240, 310, "Lohnsteuer"),
    currency("kirchensteuer", 310, 380, "Kirchensteuer"),
    currency("solidaritaetszuschlag", 380, 455, "Solidaritätszuschlag"),
    currency("kv_beitrag_an", 455, 513, "KV-Beitrag AN"),
    currency("rv_beitrag_an", 513, 573, "RV-Beitrag AN"),
    currency("av_beitrag_an", 573, 633, "AV-Beitrag AN"),
    currency("pv_beitrag_an", 633, 695, "PV-Beitrag AN"),
    currency("umlage_2", 695, 755, "Umlage 2"),
    currency("netto_bezuege", 755, 840, "Netto-Bezüge"),
  })});

  layout.lines.push_back(LineLayout{"employer", {"01111", "00110"}, 65.0, {"Z", "E"}, FieldLayout({
    integer("sv_tage", 130, 160, "SV-Tage"),
    currency("pausch_verst_bezuege", 160, 240, "Pauschal versteuerte Bezüge"),
    currency("pausch_lohnsteuer", 240, 310, "Pauschale Lohnsteuer"),
    currency("pausch_kirchensteuer", 310, 380, "Pauschale Kirchensteuer"),
    currency("pausch_solidaritaetszuschlag", 380, 455, "Pauschaler Solidaritätszuschlag"),
    currency("kv_beitrag_ag", 455, 513, "KV-Beitrag AG"),
    currency("rv_beitrag_ag", 513, 573, "RV-Beitrag AG"),
    currency("av_beitrag_ag", 573, 633, "AV-Beitrag AG"),
    currency("pv_beitrag_ag", 633, 695, "PV-Beitrag AG"),
    currency("umlage_insolvenz", 695, 755, "Insolvenzgeldumlage"),
    currency("auszahlungsbetrag", 755, 840, "Auszahlungsbetrag"),
  })});

  layout.lines.push_back(LineLayout{"minijob", {"26500", "26100"}, 65.0, {"Z", "E"}, FieldLayout({
    integer("sv_tage", 130, 160, "SV-Tage"),
    currency("pausch_verst_bezuege", 160, 240, "Pauschal versteuerte Bezüge"),
    currency("pausch_lohnsteuer", 240, 310, "Pauschale Lohnsteuer"),
    currency("kv_beitrag_ag", 455, 513, "KV-Beitrag AG"),
    currency("rv_beitrag_ag", 513, 573, "RV-Beitrag AG"),
    currency("umlage_insolvenz", 695, 755, "Insolvenzgeldumlage"),
    currency("auszahlungsbetrag", 755, 840, "Auszahlungsbetrag"),
  })});

  return layout;
}

void validateLayout(const PayrollLayout& layout) {
  if (layout.lines.empty()) throw LayoutError("layout '" + layout.version + "' has no lines");
  if (!(layout.rowTolerance > 0.0)) throw LayoutError("row tolerance must be positive");
  if (!(layout.headerBottom < layout.footerTop)) throw LayoutError("header zone overlaps footer zone");

  int recordLines = 0;
  std::set<std::string> codes;
  for (const LineLayout& line : layout.lines) {
    if (line.codes.empty()) recordLines++;
    for (const std::string& code : line.codes) {
      if (!codes.insert(code).second) throw LayoutError("line code '" + code + "' used twice");
    }
  }
  if (recordLines != 1) throw LayoutError("layout needs exactly one line without codes");

  const LineLayout& record = layout.lines[layout.recordLineIndex()];
  const FieldSpec* id = record.fields.find(layout.identifierField);
  if (!id || id->kind != FieldKind::Text) {
    throw LayoutError("record line '" + record.name + "' needs text field '" + layout.identifierField + "'");
  }

  try {
    std::regex re(layout.identifierPattern);
  } catch (const std::regex_error& ex) {
    throw LayoutError("bad identifier pattern '" + layout.identifierPattern + "': " + ex.what());
  }

  // The same field may appear on several lines but must agree on column and kind.
  std::regex columnRe("^[a-z][a-z0-9_]*$");
  std::map<std::string, const FieldSpec*> byName;
  std::map<std::string, std::string> nameByColumn;
  for (const LineLayout& line : layout.lines) {
    for (const FieldSpec& f : line.fields.fields()) {
      if (!std::regex_match(f.column, columnRe) || kReservedColumns.count(f.column)) {
        throw LayoutError("field '" + f.name + "' has an unusable column name '" + f.column + "'");
      }
      auto it = byName.find(f.name);
      if (it != byName.end() && (it->second->column != f.column || it->second->kind != f.kind)) {
        throw LayoutError("field '" + f.name + "' declared differently on line '" + line.name + "'");
      }
      byName.emplace(f.name, &f);
      auto col = nameByColumn.emplace(f.column, f.name);
      if (!col.second && col.first->second != f.name) {
        throw LayoutError("column '" + f.column + "' used by '" + col.first->second + "' and '" + f.name + "'");
      }
    }
  }

  if (!layout.nameField.empty()) {
    auto it = byName.find(layout.nameField);
    if (it == byName.end() || it->second->kind != FieldKind::Text) {
      throw LayoutError("name field '" + layout.nameField + "' must be a text field");
    }
  }
}

PayrollLayout parseLayout(const std::string& text) {
  PayrollLayout layout;
  layout.version = "custom";

  std::regex fieldRe(R"(^field\s+(\S+)\s+(text|integer|currency)\s+(\S+)\s+(\S+)\s+(.+)$)");
  std::regex settingRe(R"(^(\S+)\s+(.+)$)");

  LineLayout current;
  std::vector<FieldSpec> pending;
  bool inLine = false;

  auto closeLine = [&]() {
    if (!inLine) return;
    try {
      current.fields = FieldLayout(std::move(pending));
    } catch (const LayoutError& ex) {
      throw LayoutError("line '" + current.name + "': " + ex.what());
    }
    layout.lines.push_back(std::move(current));
    current = LineLayout{};
    pending.clear();
  };

  std::istringstream in(text);
  std::string raw;
  int lineNo = 0;
  while (std::getline(in, raw)) {
    lineNo++;
    std::string line = trimText(raw);
    if (line.empty() || line[0] == '#') continue;

    std::smatch m;
    if (std::regex_match(line, m, fieldRe)) {
      if (!inLine) throw LayoutError(layoutErrorAt(lineNo, "field outside of a line block"));
      pending.push_back(FieldSpec{
        trimText(m[5].str()),
        m[1].str(),
        parseCoordinate(m[3].str(), lineNo),
        parseCoordinate(m[4].str(), lineNo),
        parseKind(m[2].str()),
      });
      continue;
    }

    std::istringstream tokens(line);
    std::string keyword;
    tokens >> keyword;

    if (keyword == "line") {
      closeLine();
      inLine = true;
      if (!(tokens >> current.name)) throw LayoutError(layoutErrorAt(lineNo, "line needs a name"));
      std::string option;
      while (tokens >> option) {
        if (option.rfind("codes=", 0) == 0) {
          current.codes = splitList(option.substr(6), ',');
        } else if (option.rfind("code_end=", 0) == 0) {
          current.codeEnd = parseCoordinate(option.substr(9), lineNo);
        } else {
          throw LayoutError(layoutErrorAt(lineNo, "unknown line option '" + option + "'"));
        }
      }
      continue;
    }

    if (keyword == "ignore") {
      if (!inLine) throw LayoutError(layoutErrorAt(lineNo, "ignore outside of a line block"));
      std::string token;
      while (tokens >> token) current.ignoredTokens.push_back(token);
      continue;
    }

    if (!std::regex_match(line, m, settingRe)) {
      throw LayoutError(layoutErrorAt(lineNo, "expected '<setting> <value>', got '" + line + "'"));
    }
    std::string value = trimText(m[2].str());
    if (keyword == "version") layout.version = value;
    else if (keyword == "row_tolerance") layout.rowTolerance = parseCoordinate(value, lineNo);
    else if (keyword == "header_bottom") layout.headerBottom = parseCoordinate(value, lineNo);
    else if (keyword == "footer_top") layout.footerTop = parseCoordinate(value, lineNo);
    else if (keyword == "identifier_field") layout.identifierField = value;
    else if (keyword == "identifier_pattern") layout.identifierPattern = value;
    else if (keyword == "name_field") layout.nameField = value;
    else if (keyword == "page_marker") layout.pageMarkers.push_back(value);
    else throw LayoutError(layoutErrorAt(lineNo, "unknown setting '" + keyword + "'"));
  }
  closeLine();

  validateLayout(layout);
  return layout;
}

PayrollLayout loadLayoutFile(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) throw LayoutError("cannot open layout file " + path);
  std::stringstream buffer;
  buffer << ifs.rdbuf();
  return parseLayout(buffer.str());
}

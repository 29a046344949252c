#include "payroll_export.hpp"

#include "month_resolver.hpp"
#include "number_decoder.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace {

void writeRow(std::ostream& ofs, const std::vector<std::string>& row) {
  for (size_t i = 0; i < row.size(); ++i) {
    const std::string& cell = row[i];
    bool needQuotes = cell.find_first_of(",\"\n\r") != std::string::npos;
    if (needQuotes) {
      std::string escaped;
      for (char ch : cell) {
        if (ch == '"') escaped += '"';
        escaped += ch;
      }
      ofs << '"' << escaped << '"';
    } else {
      ofs << cell;
    }
    if (i + 1 < row.size()) ofs << ',';
  }
  ofs << "\n";
}

std::ofstream openForWrite(const std::string& path) {
  std::ofstream ofs(path);
  if (!ofs) throw std::runtime_error("cannot write " + path);
  return ofs;
}

void finish(std::ofstream& ofs, const std::string& path) {
  ofs.flush();
  if (!ofs) throw std::runtime_error("write to " + path + " failed");
}

bool isNumeric(const FieldSpec& f) {
  return f.kind != FieldKind::Text;
}

FieldValue add(const FieldValue& total, const FieldValue& value) {
  if (isEmpty(value)) return total;
  if (isEmpty(total)) return value;
  if (auto* a = std::get_if<Amount>(&value)) {
    return Amount{std::get<Amount>(total).cents + a->cents};
  }
  return std::get<std::int64_t>(total) + std::get<std::int64_t>(value);
}

std::string textOf(const EmployeeRow& row, const std::string& field) {
  auto it = row.fields.find(field);
  if (it == row.fields.end()) return "";
  return formatValue(it->second);
}

} // namespace

std::vector<PeriodRows> groupByPeriod(const std::vector<EmployeeRow>& rows, const std::string& identifierField) {
  std::vector<PeriodRows> periods;
  for (const EmployeeRow& row : rows) {
    auto it = std::find_if(periods.begin(), periods.end(), [&](const PeriodRows& p) {
      return p.year == row.year && p.monthNumber == row.monthNumber && p.month == row.month;
    });
    if (it == periods.end()) {
      periods.push_back(PeriodRows{row.month, row.monthNumber, row.year, {}});
      it = periods.end() - 1;
    }

    std::string id = textOf(row, identifierField);
    auto same = std::find_if(it->rows.begin(), it->rows.end(), [&](const EmployeeRow& r) {
      return textOf(r, identifierField) == id;
    });
    if (same != it->rows.end()) *same = row;
    else it->rows.push_back(row);
  }
  std::stable_sort(periods.begin(), periods.end(), [](const PeriodRows& a, const PeriodRows& b) {
    return std::tie(a.year, a.monthNumber) < std::tie(b.year, b.monthNumber);
  });
  return periods;
}

std::vector<EmployeeSummary> summarizeEmployees(const std::vector<PeriodRows>& periods,
                                                const PayrollLayout& layout) {
  std::vector<FieldSpec> schema = layout.schema();
  std::map<std::string, EmployeeSummary> byId;
  std::set<std::pair<std::string, size_t>> counted;

  for (size_t p = 0; p < periods.size(); ++p) {
    for (const EmployeeRow& row : periods[p].rows) {
      std::string id = textOf(row, layout.identifierField);
      auto inserted = byId.emplace(id, EmployeeSummary{});
      EmployeeSummary& s = inserted.first->second;
      if (inserted.second) {
        s.personnelNumber = id;
        for (const FieldSpec& f : schema) {
          if (isNumeric(f)) s.totals[f.name] = std::monostate{};
        }
      }

      std::string name = layout.nameField.empty() ? "" : textOf(row, layout.nameField);
      if (name.size() > s.name.size()) s.name = name;
      if (counted.emplace(id, p).second) s.monthsCount++;

      for (const FieldSpec& f : schema) {
        if (!isNumeric(f)) continue;
        auto it = row.fields.find(f.name);
        if (it == row.fields.end()) continue;
        s.totals[f.name] = add(s.totals[f.name], it->second);
      }
    }
  }

  std::vector<EmployeeSummary> out;
  out.reserve(byId.size());
  for (auto& kv : byId) out.push_back(std::move(kv.second));
  return out;
}

void writePeriodCsv(const PeriodRows& period, const std::vector<FieldSpec>& schema, const std::string& path) {
  std::ofstream ofs = openForWrite(path);
  std::vector<std::string> header;
  for (const FieldSpec& f : schema) header.push_back(f.column);
  writeRow(ofs, header);

  for (const EmployeeRow& row : period.rows) {
    std::vector<std::string> cells;
    cells.reserve(schema.size());
    for (const FieldSpec& f : schema) cells.push_back(textOf(row, f.name));
    writeRow(ofs, cells);
  }
  finish(ofs, path);
}

void writeSummaryCsv(const std::vector<PeriodRows>& periods,
                     const std::vector<EmployeeSummary>& summary,
                     const std::vector<FieldSpec>& schema,
                     const std::string& path) {
  std::ofstream ofs = openForWrite(path);

  std::string range = "N/A";
  if (!periods.empty()) {
    range = periods.front().month + " " + std::to_string(periods.front().year) + " - " +
            periods.back().month + " " + std::to_string(periods.back().year);
  }
  writeRow(ofs, {"ZUSAMMENFASSUNG", ""});
  writeRow(ofs, {"Zeitraum:", range});
  writeRow(ofs, {"Anzahl Monate:", std::to_string(periods.size())});
  writeRow(ofs, {"", ""});

  std::vector<std::string> header = {"pers_nr", "name", "months_count"};
  for (const FieldSpec& f : schema) {
    if (isNumeric(f)) header.push_back(f.column);
  }
  writeRow(ofs, header);

  for (const EmployeeSummary& s : summary) {
    std::vector<std::string> cells = {s.personnelNumber, s.name, std::to_string(s.monthsCount)};
    for (const FieldSpec& f : schema) {
      if (!isNumeric(f)) continue;
      auto it = s.totals.find(f.name);
      cells.push_back(it == s.totals.end() ? "" : formatValue(it->second));
    }
    writeRow(ofs, cells);
  }
  finish(ofs, path);
}

int exportCsv(const std::vector<EmployeeRow>& rows, const PayrollLayout& layout, const std::string& outDir) {
  if (!std::filesystem::exists(outDir)) {
    std::filesystem::create_directories(outDir);
  }
  std::vector<FieldSpec> schema = layout.schema();
  std::vector<PeriodRows> periods = groupByPeriod(rows, layout.identifierField);

  int files = 0;
  for (const PeriodRows& period : periods) {
    writePeriodCsv(period, schema, outDir + "/" + periodSlug(period.month, period.year) + ".csv");
    files++;
  }
  writeSummaryCsv(periods, summarizeEmployees(periods, layout), schema, outDir + "/Zusammenfassung.csv");
  return files + 1;
}

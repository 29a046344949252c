#include "record_extractor.hpp"

#include "number_decoder.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>

namespace {

PayrollLayout checked(PayrollLayout layout) {
  validateLayout(layout);
  return layout;
}

std::string withoutSpaces(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char ch : s) {
    if (!std::isspace(static_cast<unsigned char>(ch))) out.push_back(ch);
  }
  return out;
}

bool contains(const std::vector<std::string>& tokens, const std::string& text) {
  return std::find(tokens.begin(), tokens.end(), text) != tokens.end();
}

} // namespace

RecordExtractor::RecordExtractor(PayrollLayout layout)
  : layout_(checked(std::move(layout))), schema_(layout_.schema()), assembler_(layout_) {}

bool RecordExtractor::isJournalPage(const Page& page) const {
  if (layout_.pageMarkers.empty()) return true;
  std::string text = withoutSpaces(pageText(page, layout_.rowTolerance));
  for (const std::string& marker : layout_.pageMarkers) {
    if (text.find(withoutSpaces(marker)) == std::string::npos) return false;
  }
  return true;
}

std::optional<RowRejected> RecordExtractor::fillRow(const RowGroup& group, EmployeeRow& row) const {
  for (const FieldSpec& spec : schema_) row.fields[spec.name] = std::monostate{};

  auto reject = [&](const std::string& field, const std::string& raw, const std::string& reason) {
    RowRejected r;
    r.pageNumber = row.pageNumber;
    r.field = field;
    r.rawText = raw;
    r.reason = reason;
    return r;
  };

  std::set<std::string> assigned;
  for (const AssembledLine& assembled : group.lines) {
    row.rawLines.push_back(lineText(assembled.line));
    if (assembled.lineIndex < 0) continue;

    const LineLayout& kind = layout_.lines[assembled.lineIndex];
    if (!assembled.code.empty()) row.lineCodes.push_back(assembled.code);

    for (const PositionedFragment& f : assembled.line.fragments) {
      if ((f.x0 + f.x1) * 0.5 < kind.codeEnd) continue;
      if (contains(kind.ignoredTokens, f.text)) continue;

      const FieldSpec* spec = kind.fields.assign(f);
      if (!spec) continue;

      FieldValue& slot = row.fields[spec->name];
      if (spec->kind == FieldKind::Text) {
        FieldValue text = decodeText(f.text);
        if (isEmpty(text)) continue;
        // an amount drifted left into the name band
        if (spec->name == layout_.nameField && isDatevNumber(f.text)) {
          return reject(spec->name, f.text, "numeric value in text field");
        }
        if (isEmpty(slot)) slot = std::move(text);
        else std::get<std::string>(slot) += " " + std::get<std::string>(text);
        continue;
      }

      FieldValue value;
      try {
        value = decodeNumber(f.text, spec->kind);
      } catch (const DecodeError& ex) {
        return reject(spec->name, f.text, ex.what());
      }
      if (isEmpty(value)) continue;
      if (!assigned.insert(spec->name).second) {
        return reject(spec->name, f.text, "second value for the same field (previous " + formatValue(slot) + ")");
      }
      slot = std::move(value);
    }
  }

  auto id = row.fields.find(layout_.identifierField);
  if (id == row.fields.end() || isEmpty(id->second)) {
    return reject(layout_.identifierField, "", "missing personnel number");
  }
  return std::nullopt;
}

PageExtraction RecordExtractor::extract(const Page& page) const {
  PageExtraction result;
  result.pageNumber = page.pageNumber;

  Period period;
  try {
    period = resolvePeriod(pageHeaderText(page, layout_));
  } catch (const HeaderParseError& ex) {
    result.headerError = HeaderParseError(ex.headerText(), page.pageNumber);
    return result;
  }

  std::vector<AssembledLine> orphans;
  std::vector<RowGroup> groups = assembler_.group(page.fragments, &orphans);
  for (const AssembledLine& orphan : orphans) {
    RowRejected r;
    r.pageNumber = page.pageNumber;
    r.rawText = lineText(orphan.line);
    r.reason = "sub-line without employee block";
    result.rejections.push_back(std::move(r));
  }
  for (size_t i = 0; i < groups.size(); ++i) {
    EmployeeRow row;
    row.month = period.month;
    row.monthNumber = period.monthNumber;
    row.year = period.year;
    row.pageNumber = page.pageNumber;

    std::optional<RowRejected> rejection = fillRow(groups[i], row);
    if (rejection) {
      rejection->rowIndex = i;
      result.rejections.push_back(std::move(*rejection));
      continue;
    }
    result.rows.push_back(std::move(row));
  }
  return result;
}

DocumentExtraction RecordExtractor::extractDocument(const std::vector<Page>& pages) const {
  DocumentExtraction doc;
  bool haveInfo = false;
  for (const Page& page : pages) {
    if (!isJournalPage(page)) {
      doc.skippedPages.push_back(page.pageNumber);
      continue;
    }
    if (!haveInfo) {
      doc.info = readDocumentInfo(pageText(page, layout_.rowTolerance));
      haveInfo = true;
    }

    PageExtraction extracted = extract(page);
    if (extracted.headerError) doc.headerErrors.push_back(*extracted.headerError);
    std::move(extracted.rows.begin(), extracted.rows.end(), std::back_inserter(doc.rows));
    std::move(extracted.rejections.begin(), extracted.rejections.end(), std::back_inserter(doc.rejections));
  }
  return doc;
}
